#include "exifdate/build_info.h"
#include "exifdate/console_format.h"
#include "exifdate/date_session.h"
#include "exifdate/jpeg_scan.h"

#include <nanobind/nanobind.h>
#include <nanobind/stl/pair.h>
#include <nanobind/stl/string.h>
#include <nanobind/stl/string_view.h>
#include <nanobind/stl/vector.h>

#include <cstdint>
#include <cstdio>
#include <ctime>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace nb = nanobind;
using namespace nb::literals;

namespace exifdate {
namespace {

    static nb::str sv_to_py(std::string_view s)
    {
        return nb::str(s.data(), s.size());
    }


    static std::span<const std::byte> py_bytes_span(const nb::bytes& data)
    {
        return std::span<const std::byte>(reinterpret_cast<const std::byte*>(
                                              data.data()),
                                          data.size());
    }


    static std::string python_info_line()
    {
        const char* ver = Py_GetVersion();
        size_t n        = 0;
        while (ver && ver[n] && ver[n] != ' ') {
            n += 1;
        }

        std::string out;
        out.append("Python ");
        if (ver && n != 0U) {
            out.append(ver, n);
        } else {
            out.append("unknown");
        }
        out.append(" nanobind ");

        char buf[64];
        std::snprintf(buf, sizeof(buf), "%d.%d.%d", NB_VERSION_MAJOR,
                      NB_VERSION_MINOR, NB_VERSION_PATCH);
        out.append(buf);
        return out;
    }


    static nb::object field_value_to_python(const DateField& f)
    {
        if (const AsciiValue* a = std::get_if<AsciiValue>(&f.value)) {
            if (!is_seven_bit_ascii(a->text)) {
                return nb::bytes(a->text.data(), a->text.size());
            }
            return nb::str(a->text.data(), a->text.size());
        }
        if (const RationalValue* r = std::get_if<RationalValue>(&f.value)) {
            nb::list out;
            for (const URational& part : r->parts) {
                out.append(rational_quotient(part));
            }
            return out;
        }
        return nb::none();
    }


    static nb::dict field_to_python(const DateField& f)
    {
        nb::dict d;
        d["label"]        = sv_to_py(f.label);
        d["name"]         = sv_to_py(f.name);
        d["ifd"]          = sv_to_py(ifd_name(f.ifd));
        d["tag"]          = static_cast<uint32_t>(f.tag);
        d["count"]        = f.count;
        d["value_offset"] = f.value_offset;
        d["value"]        = field_value_to_python(f);
        d["type"]         = sv_to_py(field_kind_name(f.kind));
        return d;
    }


    /// Python-facing wrapper that owns a \ref DateSession.
    struct PySession final {
        DateSession session;
        NormalizeOptions options;
        /// Accepted editor input per field; re-encoded together on each set.
        std::vector<std::string> inputs;

        void load(nb::bytes data)
        {
            const std::span<const std::byte> bytes = py_bytes_span(data);
            if (!has_jpeg_soi(bytes)) {
                throw std::runtime_error("Only JPEG images are supported");
            }
            {
                nb::gil_scoped_release gil_release;
                (void)session.load(bytes);
            }
            inputs.assign(session.fields().size(), std::string());
        }

        void clear()
        {
            session.clear();
            inputs.clear();
        }

        nb::list fields() const
        {
            nb::list out;
            for (const DateField& f : session.fields()) {
                out.append(field_to_python(f));
            }
            return out;
        }

        std::string display_value(size_t index) const
        {
            if (index >= session.fields().size()) {
                throw nb::index_error("field index out of range");
            }
            return session.display_value(index, options);
        }

        std::string set_value(size_t index, std::string_view text)
        {
            if (index >= session.fields().size()) {
                throw nb::index_error("field index out of range");
            }
            const FieldEdit edit = session.encode_input(index, text, options);
            if (std::holds_alternative<std::monostate>(edit) && !text.empty()) {
                throw std::runtime_error("value does not parse for this field");
            }
            inputs[index] = std::string(text);

            std::vector<std::string_view> views(inputs.begin(), inputs.end());
            const std::vector<FieldEdit> edits = session.encode_inputs(views,
                                                                       options);
            session.revert();
            PatchResult r;
            for (size_t i = 0; i < edits.size(); ++i) {
                const PatchResult ri = session.apply(i, edits[i]);
                if (i == index) {
                    r = ri;
                }
            }
            if (r.status == PatchStatus::ShapeMismatch
                || r.status == PatchStatus::OutOfRange) {
                throw std::runtime_error("field could not be written");
            }
            return std::string(patch_status_name(r.status));
        }

        nb::bytes output() const
        {
            const std::span<const std::byte> bytes = session.working();
            return nb::bytes(reinterpret_cast<const char*>(bytes.data()),
                             bytes.size());
        }
    };

}  // namespace
}  // namespace exifdate

NB_MODULE(_exifdate, m)
{
    using namespace exifdate;

    m.doc()               = "exifdate EXIF date/time editing bindings (nanobind).";
    m.attr("__version__") = sv_to_py(build_info().version);

    nb::enum_<DateParseStatus>(m, "ParseStatus")
        .value("Ok", DateParseStatus::Ok)
        .value("FormatError", DateParseStatus::FormatError)
        .value("SegmentError", DateParseStatus::SegmentError)
        .value("HeaderError", DateParseStatus::HeaderError);

    nb::class_<PySession>(m, "Session")
        .def(nb::init<>())
        .def("load", &PySession::load, "data"_a,
             "Loads JPEG bytes and extracts the date/time fields.")
        .def("clear", &PySession::clear)
        .def_prop_ro("loaded",
                     [](const PySession& s) { return s.session.loaded(); })
        .def_prop_ro("status",
                     [](const PySession& s) { return s.session.status(); })
        .def_prop_rw(
            "now",
            [](const PySession& s) {
                return static_cast<int64_t>(s.options.now);
            },
            [](PySession& s, int64_t now) {
                s.options.now = static_cast<std::time_t>(now);
            })
        .def("fields", &PySession::fields)
        .def("display_value", &PySession::display_value, "index"_a)
        .def("set_value", &PySession::set_value, "index"_a, "text"_a,
             "Applies editor input to a field; returns the patch status name.\n"
             "GPS date and time inputs are converted to UTC together.")
        .def("output", &PySession::output);

    m.def("info", []() {
        std::string line;
        format_build_info_line(&line);
        return std::make_pair(std::move(line), python_info_line());
    });

    m.def(
        "console_text",
        [](nb::bytes data, uint32_t max_bytes) {
            const std::string_view s(reinterpret_cast<const char*>(data.data()),
                                     data.size());
            std::string out;
            const bool escaped = append_console_escaped_ascii(s, max_bytes,
                                                              &out);
            return std::make_pair(std::move(out), escaped);
        },
        "data"_a, "max_bytes"_a = 0U);
}
