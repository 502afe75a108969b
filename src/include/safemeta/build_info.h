#pragma once

#include <string>
#include <string_view>

/**
 * \file build_info.h
 * \brief Runtime information about how SafeMeta was built.
 */

namespace safemeta {

/**
 * \brief SafeMeta build information.
 *
 * Values are compiled into the binary at build time.
 */
struct BuildInfo final {
    /// SafeMeta version string (e.g. "0.2.0").
    std::string_view version;

    /// Build type string (e.g. "Release", "Debug").
    std::string_view build_type;

    /// Target platform (e.g. "Linux", "Darwin", "Windows").
    std::string_view system_name;

    /// Target CPU architecture (e.g. "x86_64", "arm64").
    std::string_view system_processor;

    /// Compiler ID (e.g. "Clang", "GNU", "MSVC").
    std::string_view cxx_compiler_id;

    /// Compiler version string.
    std::string_view cxx_compiler_version;

    /// Whether Expat-based XMP parsing was requested at configure time.
    bool option_with_expat = false;
    /// Whether Expat support is compiled in (linked).
    bool has_expat = false;
    /// zlib version the library was compiled against.
    std::string_view zlib_version;
};

/// Returns build information for the linked SafeMeta library.
const BuildInfo&
build_info() noexcept;

/**
 * \brief Formats a stable, human-readable build info header (2 lines).
 *
 * Output format:
 * - `SafeMeta vX.Y.Z <build_type> [features]`
 * - `built with <compiler> for <system>/<arch>`
 */
void
format_build_info_lines(const BuildInfo& info, std::string* line1,
                        std::string* line2) noexcept;

/// Convenience overload for the linked SafeMeta library build.
void
format_build_info_lines(std::string* line1, std::string* line2) noexcept;

}  // namespace safemeta
