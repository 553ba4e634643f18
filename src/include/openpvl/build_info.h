#pragma once

#include <string>
#include <string_view>

/**
 * \file build_info.h
 * \brief Runtime information about how OpenPVL was built.
 */

namespace openpvl {

/**
 * \brief OpenPVL build information, compiled in at configure time.
 */
struct BuildInfo final {
    /// OpenPVL version string (e.g. "0.2.0").
    std::string_view version;
    /// Build timestamp in UTC (ISO-8601), or empty if not recorded.
    std::string_view build_timestamp_utc;
    /// Build type string (e.g. "Release", "Debug").
    std::string_view build_type;
    std::string_view cmake_generator;
    std::string_view system_name;
    std::string_view system_processor;
    std::string_view cxx_compiler_id;
    std::string_view cxx_compiler_version;

    bool linkage_static = false;
    bool linkage_shared = false;
};

/// Returns build information for the linked OpenPVL library.
const BuildInfo&
build_info() noexcept;

/**
 * \brief Formats a stable, human-readable build banner (2 lines).
 *
 * Output format:
 * - `OpenPVL vX.Y.Z <build_type> [<dialects>] <linkage>`
 * - `built with <compiler> for <system>/<arch> (<timestamp>)`
 */
void
format_build_info_lines(const BuildInfo& info, std::string* line1,
                        std::string* line2) noexcept;

/// Convenience overload for the linked OpenPVL library build.
void
format_build_info_lines(std::string* line1, std::string* line2) noexcept;

}  // namespace openpvl
