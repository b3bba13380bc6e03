#include "pathsafe/platform.hpp"

#include <algorithm>
#include <cctype>

namespace pathsafe {

namespace {

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

std::string to_upper(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return result;
}

bool contains(const std::vector<std::string>& names, const std::string& value) {
    return std::find(names.begin(), names.end(), value) != names.end();
}

std::size_t default_max_path_len(Platform platform) {
    switch (platform) {
        case Platform::Linux: return 4096;
        case Platform::Windows: return 260;
        case Platform::POSIX:
        case Platform::macOS: return 1024;
        case Platform::Universal: return 260;
    }
    return 260;
}

} // namespace

// ============================================================================
// Platform Detection
// ============================================================================

Platform get_current_platform() {
#if defined(__APPLE__)
    return Platform::macOS;
#elif defined(_WIN32)
    return Platform::Windows;
#elif defined(__linux__)
    return Platform::Linux;
#else
    return Platform::POSIX;
#endif
}

std::optional<Platform> parse_platform(const std::string& tag) {
    std::string s = to_lower(tag);
    if (s == "posix") return Platform::POSIX;
    if (s == "linux") return Platform::Linux;
    if (s == "windows") return Platform::Windows;
    if (s == "macos") return Platform::macOS;
    if (s == "universal") return Platform::Universal;
    if (s == "auto") return get_current_platform();
    return std::nullopt;
}

// ============================================================================
// Shared Tables
// ============================================================================

const std::string& unprintable_ascii_chars() {
    // Whitespace controls (\t \n \r \x0b \x0c) count as printable here;
    // only the Windows rules reject them.
    static const std::string chars = [] {
        std::string s;
        for (int c = 0; c < 128; ++c) {
            bool printable = (c >= 0x20 && c < 0x7F) || (c >= 0x09 && c <= 0x0D);
            if (!printable) {
                s.push_back(static_cast<char>(c));
            }
        }
        return s;
    }();
    return chars;
}

const std::string& windows_invalid_path_chars() {
    static const std::string chars = ":*?\"<>|\t\n\r\x0b\x0c";
    return chars;
}

const std::vector<std::string>& windows_reserved_file_names() {
    static const std::vector<std::string> names = [] {
        std::vector<std::string> v = {"CON", "PRN", "AUX", "CLOCK$", "NUL"};
        for (const char* prefix : {"COM", "LPT"}) {
            for (int n = 1; n <= 9; ++n) {
                v.push_back(std::string(prefix) + std::to_string(n));
            }
        }
        return v;
    }();
    return names;
}

const std::vector<std::string>& ntfs_reserved_file_names() {
    static const std::vector<std::string> names = {
        "$Mft", "$MftMirr", "$LogFile", "$Volume", "$AttrDef", "$Bitmap", "$Boot",
        "$BadClus", "$Secure", "$Upcase", "$Extend", "$Quota", "$ObjId", "$Reparse",
    };
    return names;
}

bool is_ntfs_reserved_file_name(const std::string& name, bool ignore_case) {
    if (!ignore_case) {
        return contains(ntfs_reserved_file_names(), name);
    }
    std::string upper = to_upper(name);
    for (const auto& reserved : ntfs_reserved_file_names()) {
        if (to_upper(reserved) == upper) {
            return true;
        }
    }
    return false;
}

// ============================================================================
// Platform Profile
// ============================================================================

bool PlatformProfile::is_reserved_filename(const std::string& upper_stem) const {
    return contains(reserved_filenames, upper_stem);
}

bool PlatformProfile::is_reserved_path_token(const std::string& token) const {
    return contains(reserved_path_tokens, token);
}

PlatformProfile make_platform_profile(Platform platform) {
    PlatformProfile profile;
    profile.platform = platform;
    profile.max_path_len = default_max_path_len(platform);
    profile.max_filename_len = MAX_FILENAME_LEN;

    const std::string& base = unprintable_ascii_chars();
    if (is_windows_family(platform)) {
        profile.invalid_path_chars = base + windows_invalid_path_chars();
        profile.invalid_filename_chars = base + "/" + windows_invalid_path_chars() + "\\";
        profile.ntfs_reserved = true;
        profile.forbid_trailing_space_period = true;
    } else {
        profile.invalid_path_chars = base;
        profile.invalid_filename_chars = base + "/";
    }

    switch (platform) {
        case Platform::Windows:
            profile.reserved_filenames = windows_reserved_file_names();
            profile.split_nt_drive = true;
            profile.path_separator = '\\';
            break;
        case Platform::POSIX:
        case Platform::macOS:
            profile.reserved_filenames = {":"};
            profile.reserved_path_tokens = {"/", ":"};
            break;
        case Platform::Linux:
            profile.reserved_path_tokens = {"/"};
            break;
        case Platform::Universal:
            profile.reserved_filenames = windows_reserved_file_names();
            profile.reserved_filenames.push_back(":");
            std::sort(profile.reserved_filenames.begin(), profile.reserved_filenames.end());
            profile.reserved_path_tokens = {"/", ":"};
            break;
    }

    return profile;
}

} // namespace pathsafe
