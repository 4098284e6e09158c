#pragma once

#include <string>
#include <string_view>

/**
 * \file build_info.h
 * \brief Runtime information about how exifdate was built.
 */

namespace exifdate {

/// Values compiled into the binary at configure time.
struct BuildInfo final {
    /// Library version string (e.g. "0.2.0").
    std::string_view version;

    /// Build timestamp in UTC (ISO-8601), or empty if not recorded.
    std::string_view build_timestamp_utc;

    /// Build type string (e.g. "Release", "Debug").
    std::string_view build_type;

    /// Target platform and CPU (e.g. "Linux", "x86_64").
    std::string_view system_name;
    std::string_view system_processor;

    /// Compiler ID and version (e.g. "GNU", "13.2.0").
    std::string_view cxx_compiler_id;
    std::string_view cxx_compiler_version;

    /// Whether the Python module was enabled at configure time.
    bool option_python = false;
};

/// Returns build information for the linked exifdate library.
const BuildInfo&
build_info() noexcept;

/**
 * \brief Formats a one-line summary of \p info.
 *
 * `exifdate vX.Y.Z <build_type> built with <compiler> for <system>/<arch>`,
 * followed by ` (<timestamp>)` when one was recorded.
 */
void
format_build_info_line(const BuildInfo& info, std::string* line);

/// Convenience overload for the linked library build.
void
format_build_info_line(std::string* line);

}  // namespace exifdate
