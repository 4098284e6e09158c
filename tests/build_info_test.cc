#include "exifdate/build_info.h"

#include <gtest/gtest.h>

#include <string>

namespace exifdate {
namespace {

    TEST(BuildInfo, FormatsLine)
    {
        BuildInfo info;
        info.version              = "1.2.3";
        info.build_type           = "Release";
        info.cxx_compiler_id      = "GNU";
        info.cxx_compiler_version = "13.2.0";
        info.system_name          = "Linux";
        info.system_processor     = "x86_64";

        std::string line;
        format_build_info_line(info, &line);
        EXPECT_EQ(line,
                  "exifdate v1.2.3 Release built with GNU-13.2.0 for Linux/x86_64");

        info.build_timestamp_utc = "2026-01-01T00:00:00Z";
        format_build_info_line(info, &line);
        EXPECT_EQ(line, "exifdate v1.2.3 Release built with GNU-13.2.0 for "
                        "Linux/x86_64 (2026-01-01T00:00:00Z)");

        EXPECT_FALSE(build_info().version.empty());
    }

}  // namespace
}  // namespace exifdate
