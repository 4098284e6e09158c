#include "exifdate/build_info.h"

#include "exifdate/build_info_generated.h"

namespace exifdate {
namespace {

    static constexpr BuildInfo kBuildInfo = {
        /*version=*/EXIFDATE_BUILDINFO_VERSION,
        /*build_timestamp_utc=*/EXIFDATE_BUILDINFO_BUILD_TIMESTAMP_UTC,
        /*build_type=*/EXIFDATE_BUILDINFO_BUILD_TYPE,
        /*system_name=*/EXIFDATE_BUILDINFO_SYSTEM_NAME,
        /*system_processor=*/EXIFDATE_BUILDINFO_SYSTEM_PROCESSOR,
        /*cxx_compiler_id=*/EXIFDATE_BUILDINFO_CXX_COMPILER_ID,
        /*cxx_compiler_version=*/EXIFDATE_BUILDINFO_CXX_COMPILER_VERSION,
        /*option_python=*/static_cast<bool>(EXIFDATE_BUILDINFO_WITH_PYTHON),
    };

    static void append_sv(std::string* out, std::string_view s)
    {
        out->append(s.data(), s.size());
    }

}  // namespace

const BuildInfo&
build_info() noexcept
{
    return kBuildInfo;
}


void
format_build_info_line(const BuildInfo& bi, std::string* line)
{
    line->clear();
    line->reserve(160);
    line->append("exifdate v");
    append_sv(line, bi.version);
    line->append(" ");
    append_sv(line, bi.build_type.empty() ? "multi-config" : bi.build_type);
    line->append(" built with ");
    append_sv(line, bi.cxx_compiler_id);
    line->append("-");
    append_sv(line, bi.cxx_compiler_version);
    line->append(" for ");
    append_sv(line, bi.system_name);
    line->append("/");
    append_sv(line, bi.system_processor);
    if (!bi.build_timestamp_utc.empty()) {
        line->append(" (");
        append_sv(line, bi.build_timestamp_utc);
        line->append(")");
    }
}


void
format_build_info_line(std::string* line)
{
    format_build_info_line(build_info(), line);
}

}  // namespace exifdate
