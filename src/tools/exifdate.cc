#include "exifdate/build_info.h"
#include "exifdate/console_format.h"
#include "exifdate/date_session.h"
#include "exifdate/jpeg_scan.h"

#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace exifdate {
namespace {

    struct SetArg final {
        std::string_view name;
        std::string_view value;
    };

    static bool read_file_bytes(const char* path, uint64_t max_file_bytes,
                                std::vector<std::byte>* out, bool* too_large)
    {
        out->clear();
        *too_large   = false;
        std::FILE* f = std::fopen(path, "rb");
        if (!f) {
            return false;
        }
        if (std::fseek(f, 0, SEEK_END) != 0) {
            std::fclose(f);
            return false;
        }
        const long end = std::ftell(f);
        if (end < 0 || std::fseek(f, 0, SEEK_SET) != 0) {
            std::fclose(f);
            return false;
        }
        const size_t size = static_cast<size_t>(end);
        if (max_file_bytes != 0U && size > max_file_bytes) {
            std::fclose(f);
            *too_large = true;
            return false;
        }
        out->resize(size);
        if (size > 0 && std::fread(out->data(), 1, size, f) != size) {
            std::fclose(f);
            out->clear();
            return false;
        }
        std::fclose(f);
        return true;
    }

    static bool write_file_bytes(const char* path,
                                 std::span<const std::byte> bytes)
    {
        std::FILE* f = std::fopen(path, "wb");
        if (!f) {
            return false;
        }
        const size_t wrote = bytes.empty()
                                 ? 0
                                 : std::fwrite(bytes.data(), 1, bytes.size(),
                                               f);
        const bool closed = std::fclose(f) == 0;
        return closed && wrote == bytes.size();
    }

    static bool has_jpeg_name(std::string_view path) noexcept
    {
        const size_t dot = path.rfind('.');
        if (dot == std::string_view::npos) {
            return false;
        }
        std::string ext;
        for (char c : path.substr(dot + 1)) {
            ext.push_back((c >= 'A' && c <= 'Z') ? static_cast<char>(c + 32)
                                                 : c);
        }
        return ext == "jpg" || ext == "jpeg";
    }

    static bool parse_u64_arg(const char* s, uint64_t* out)
    {
        if (!s || !*s) {
            return false;
        }
        char* end                = nullptr;
        unsigned long long value = std::strtoull(s, &end, 10);
        if (!end || *end != '\0') {
            return false;
        }
        *out = static_cast<uint64_t>(value);
        return true;
    }

    static bool parse_set_arg(const char* s, SetArg* out)
    {
        const std::string_view arg(s);
        const size_t eq = arg.find('=');
        if (eq == std::string_view::npos || eq == 0) {
            return false;
        }
        out->name  = arg.substr(0, eq);
        out->value = arg.substr(eq + 1);
        return true;
    }

    static const char* expected_format(FieldKind kind) noexcept
    {
        switch (kind) {
        case FieldKind::Date: return "YYYY-MM-DD";
        case FieldKind::Time: return "HH:MM[:SS]";
        case FieldKind::DateTime: return "YYYY-MM-DDTHH:MM:SS";
        }
        return "?";
    }

    static std::string raw_value_text(const DateField& f)
    {
        std::string out;
        if (const AsciiValue* a = std::get_if<AsciiValue>(&f.value)) {
            out.push_back('"');
            (void)append_console_escaped_ascii(a->text, 64, &out);
            out.push_back('"');
            return out;
        }
        if (const RationalValue* r = std::get_if<RationalValue>(&f.value)) {
            out.push_back('[');
            const std::vector<double> q = rational_quotients(*r);
            for (size_t i = 0; i < q.size(); ++i) {
                char buf[32];
                std::snprintf(buf, sizeof(buf), "%s%g", (i == 0) ? "" : ",",
                              q[i]);
                out.append(buf);
            }
            out.push_back(']');
            return out;
        }
        return "-";
    }

    static uint32_t raw_size(const DateField& f) noexcept
    {
        if (f.type == static_cast<uint16_t>(TiffType::Rational)) {
            return f.count * 8U;
        }
        return f.count;
    }

    static void print_fields(const DateSession& session,
                             const NormalizeOptions& norm, bool show_raw)
    {
        const std::span<const DateField> fields = session.fields();
        for (size_t i = 0; i < fields.size(); ++i) {
            const DateField& f        = fields[i];
            const std::string raw     = raw_value_text(f);
            const std::string display = session.display_value(i, norm);
            const std::string_view ifd  = ifd_name(f.ifd);
            const std::string_view kind = field_kind_name(f.kind);
            std::printf(
                "field[%zu] name=%.*s ifd=%.*s tag=0x%04X type=%.*s count=%u offset=%u value=%s local=%s\n",
                i, static_cast<int>(f.name.size()), f.name.data(),
                static_cast<int>(ifd.size()), ifd.data(),
                static_cast<unsigned>(f.tag), static_cast<int>(kind.size()),
                kind.data(), f.count, f.value_offset, raw.c_str(),
                display.empty() ? "-" : display.c_str());
            const std::span<const std::byte> working = session.working();
            if (show_raw && f.value_offset <= working.size()) {
                const size_t n = std::min<size_t>(raw_size(f),
                                                  working.size()
                                                      - f.value_offset);
                std::string hex;
                append_hex_bytes(working.subspan(f.value_offset, n), 64, &hex);
                std::printf("  bytes=%s\n", hex.c_str());
            }
        }
    }

    static void usage(const char* argv0)
    {
        std::printf("usage: %s [options] <file.jpg>\n", argv0);
        std::printf("options:\n");
        std::printf(
            "  --set NAME=VALUE     edit a field (datetime YYYY-MM-DDTHH:MM:SS,\n"
            "                       date YYYY-MM-DD, time HH:MM[:SS]; GPS values\n"
            "                       are local time)\n");
        std::printf("  -o, --output PATH    write the modified image to PATH\n");
        std::printf("  --in-place           write the modified image back to the input\n");
        std::printf(
            "  --max-file-bytes N   refuse inputs larger than N bytes (default: 0 = unlimited)\n");
        std::printf(
            "  --now SECONDS        instant used when a GPS time has no date (default: now)\n");
        std::printf("  --raw                print the stored bytes of each field\n");
        std::printf("  --version            print build information\n");
    }

}  // namespace
}  // namespace exifdate

int
main(int argc, char** argv)
{
    using namespace exifdate;

    std::vector<SetArg> sets;
    const char* input_path  = nullptr;
    const char* output_path = nullptr;
    bool in_place           = false;
    bool show_raw           = false;
    uint64_t max_file_bytes = 0;
    NormalizeOptions norm;

    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];
        if (!arg) {
            continue;
        }
        if (std::strcmp(arg, "--help") == 0 || std::strcmp(arg, "-h") == 0) {
            usage(argv[0]);
            return 0;
        }
        if (std::strcmp(arg, "--version") == 0) {
            std::string line;
            format_build_info_line(&line);
            std::printf("%s\n", line.c_str());
            return 0;
        }
        if (std::strcmp(arg, "--set") == 0 && i + 1 < argc) {
            SetArg s;
            if (!parse_set_arg(argv[i + 1], &s)) {
                std::fprintf(stderr, "exifdate: invalid --set value `%s`\n",
                             argv[i + 1]);
                return 2;
            }
            sets.push_back(s);
            i += 1;
            continue;
        }
        if ((std::strcmp(arg, "-o") == 0 || std::strcmp(arg, "--output") == 0)
            && i + 1 < argc) {
            output_path = argv[i + 1];
            i += 1;
            continue;
        }
        if (std::strcmp(arg, "--in-place") == 0) {
            in_place = true;
            continue;
        }
        if (std::strcmp(arg, "--raw") == 0) {
            show_raw = true;
            continue;
        }
        if (std::strcmp(arg, "--max-file-bytes") == 0 && i + 1 < argc) {
            if (!parse_u64_arg(argv[i + 1], &max_file_bytes)) {
                std::fprintf(stderr, "exifdate: invalid --max-file-bytes value\n");
                return 2;
            }
            i += 1;
            continue;
        }
        if (std::strcmp(arg, "--now") == 0 && i + 1 < argc) {
            uint64_t now = 0;
            if (!parse_u64_arg(argv[i + 1], &now)) {
                std::fprintf(stderr, "exifdate: invalid --now value\n");
                return 2;
            }
            norm.now = static_cast<std::time_t>(now);
            i += 1;
            continue;
        }
        if (arg[0] == '-' && arg[1] != '\0') {
            std::fprintf(stderr, "exifdate: unknown option `%s`\n", arg);
            return 2;
        }
        if (input_path) {
            std::fprintf(stderr, "exifdate: only one file can be edited at a time\n");
            return 2;
        }
        input_path = arg;
    }

    if (!input_path) {
        usage(argv[0]);
        return 2;
    }
    if (in_place) {
        output_path = input_path;
    }
    if (!sets.empty() && !output_path) {
        std::fprintf(stderr, "exifdate: --set needs --output or --in-place\n");
        return 2;
    }

    std::vector<std::byte> bytes;
    bool too_large = false;
    if (!read_file_bytes(input_path, max_file_bytes, &bytes, &too_large)) {
        if (too_large) {
            std::fprintf(stderr, "exifdate: `%s` exceeds --max-file-bytes\n",
                         input_path);
        } else {
            std::fprintf(stderr, "exifdate: failed to read `%s`\n", input_path);
        }
        return 1;
    }
    if (!has_jpeg_name(input_path) && !has_jpeg_soi(bytes)) {
        std::fprintf(stderr, "exifdate: Only JPEG images are supported.\n");
        return 1;
    }

    DateSession session;
    const DirectoryReadResult res = session.load(bytes);
    bytes.clear();

    const std::string_view status = parse_status_name(res.status);
    std::printf("== %s\n", input_path);
    std::printf("size=%zu exif=%.*s\n", session.original().size(),
                static_cast<int>(status.size()), status.data());
    if (session.fields().empty()) {
        std::printf("No editable EXIF date/time fields found.\n");
    } else {
        std::printf("Found %zu date/time field(s).\n", session.fields().size());
    }
    print_fields(session, norm, show_raw);

    if (sets.empty() && !output_path) {
        return 0;
    }

    std::vector<std::string_view> inputs(session.fields().size());
    for (const SetArg& s : sets) {
        const size_t idx = session.find_field(s.name);
        if (idx >= inputs.size()) {
            std::fprintf(stderr, "exifdate: no field named `%.*s`\n",
                         static_cast<int>(s.name.size()), s.name.data());
            return 2;
        }
        const FieldEdit edit = session.encode_input(idx, s.value, norm);
        if (std::holds_alternative<std::monostate>(edit)) {
            std::fprintf(stderr,
                         "exifdate: cannot use `%.*s` for %.*s (expected %s)\n",
                         static_cast<int>(s.value.size()), s.value.data(),
                         static_cast<int>(s.name.size()), s.name.data(),
                         expected_format(session.fields()[idx].kind));
            return 2;
        }
        inputs[idx] = s.value;
    }

    const std::vector<FieldEdit> edits = session.encode_inputs(inputs, norm);

    for (size_t i = 0; i < edits.size(); ++i) {
        const DateField& f  = session.fields()[i];
        const PatchResult r = session.apply(i, edits[i]);
        if (r.status == PatchStatus::Truncated) {
            std::fprintf(stderr,
                         "exifdate: warning: %.*s value cut to %u bytes (%u dropped)\n",
                         static_cast<int>(f.name.size()), f.name.data(),
                         f.count - 1U, r.bytes_dropped);
        } else if (r.status == PatchStatus::ShapeMismatch
                   || r.status == PatchStatus::OutOfRange) {
            const std::string_view why = patch_status_name(r.status);
            std::fprintf(stderr, "exifdate: %.*s not written (%.*s)\n",
                         static_cast<int>(f.name.size()), f.name.data(),
                         static_cast<int>(why.size()), why.data());
        }
    }

    if (!write_file_bytes(output_path, session.working())) {
        std::fprintf(stderr, "exifdate: failed to write `%s`\n", output_path);
        return 1;
    }
    std::printf("Wrote %s\n", output_path);
    return 0;
}
