#pragma once

#include "pathsafe/export.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace pathsafe {

// ============================================================================
// Platform
// ============================================================================

// Target platform of a name or path. Universal satisfies the union of all
// platform rules and is the default.
enum class Platform {
    POSIX,
    Linux,
    Windows,
    macOS,
    Universal
};

inline const char* platform_to_string(Platform p) {
    switch (p) {
        case Platform::POSIX: return "POSIX";
        case Platform::Linux: return "Linux";
        case Platform::Windows: return "Windows";
        case Platform::macOS: return "macOS";
        case Platform::Universal: return "universal";
    }
    return "universal";
}

// Platform of the running environment (Linux, macOS or Windows)
PATHSAFE_API Platform get_current_platform();

// Parse a platform tag (case-insensitive): posix, linux, windows, macos,
// universal, or auto. "auto" resolves to get_current_platform() at call time.
PATHSAFE_API std::optional<Platform> parse_platform(const std::string& tag);

// Windows rules apply (Windows itself and Universal)
inline bool is_windows_family(Platform p) {
    return p == Platform::Windows || p == Platform::Universal;
}

// POSIX-style roots apply (POSIX, Linux, macOS)
inline bool is_posix_family(Platform p) {
    return p == Platform::POSIX || p == Platform::Linux || p == Platform::macOS;
}

// ============================================================================
// Platform Profile
// ============================================================================

// Longest filename accepted on any supported platform
constexpr std::size_t MAX_FILENAME_LEN = 255;

/**
 * Rule tables derived from a Platform.
 *
 * Computed once when a validator or sanitizer is constructed and never
 * modified afterwards, so a profile can be shared between threads.
 */
struct PlatformProfile {
    Platform platform = Platform::Universal;

    // Length ceilings (code points)
    std::size_t max_path_len = 260;
    std::size_t max_filename_len = MAX_FILENAME_LEN;

    // Characters rejected in a whole path tail and in a single component
    std::string invalid_path_chars;
    std::string invalid_filename_chars;

    // Reserved stems for a single component, stored upper-cased
    std::vector<std::string> reserved_filenames;

    // Reserved root names for a whole path tail
    std::vector<std::string> reserved_path_tokens;

    // NTFS metafile names ($Mft, ...) are reserved at path level
    bool ntfs_reserved = false;

    // Components must not end with a space or a period
    bool forbid_trailing_space_period = false;

    // Drive letters and UNC prefixes are split off before component checks
    bool split_nt_drive = false;

    char path_separator = '/';

    bool is_invalid_path_char(char c) const {
        return invalid_path_chars.find(c) != std::string::npos;
    }

    bool is_invalid_filename_char(char c) const {
        return invalid_filename_chars.find(c) != std::string::npos;
    }

    bool is_reserved_filename(const std::string& upper_stem) const;
    bool is_reserved_path_token(const std::string& token) const;
};

PATHSAFE_API PlatformProfile make_platform_profile(Platform platform);

// ============================================================================
// Shared Character and Name Tables
// ============================================================================

// ASCII characters outside string.printable: 0x00-0x08, 0x0E-0x1F, 0x7F
PATHSAFE_API const std::string& unprintable_ascii_chars();

// Additional characters rejected by Windows in paths
PATHSAFE_API const std::string& windows_invalid_path_chars();

// Windows device names (CON, PRN, AUX, CLOCK$, NUL, COM1-9, LPT1-9)
PATHSAFE_API const std::vector<std::string>& windows_reserved_file_names();

// NTFS metafile names ($Mft, $MftMirr, ...)
PATHSAFE_API const std::vector<std::string>& ntfs_reserved_file_names();

// Exact (case-sensitive) or case-insensitive match against the NTFS metafile names
PATHSAFE_API bool is_ntfs_reserved_file_name(const std::string& name, bool ignore_case);

} // namespace pathsafe
