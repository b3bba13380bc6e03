#include "pathsafe/path_utils.hpp"

#include <algorithm>
#include <cctype>

namespace pathsafe {

namespace {

bool is_continuation_byte(char c) {
    return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
}

std::string join(const std::vector<std::string>& parts, char sep) {
    std::string out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) out += sep;
        out += parts[i];
    }
    return out;
}

} // namespace

DriveSplit split_drive_nt(const std::string& path) {
    if (path.size() < 2) {
        return {"", path};
    }

    std::string normp = path;
    std::replace(normp.begin(), normp.end(), '/', '\\');

    // UNC: \\server\share\rest
    if (normp[0] == '\\' && normp[1] == '\\' && (normp.size() < 3 || normp[2] != '\\')) {
        size_t index = normp.find('\\', 2);
        if (index == std::string::npos) {
            return {"", path};
        }
        size_t index2 = normp.find('\\', index + 1);
        if (index2 == index + 1) {
            return {"", path};
        }
        if (index2 == std::string::npos) {
            index2 = path.size();
        }
        return {path.substr(0, index2), path.substr(index2)};
    }

    if (normp[1] == ':' && std::isalpha(static_cast<unsigned char>(normp[0]))) {
        return {path.substr(0, 2), path.substr(2)};
    }

    return {"", path};
}

DriveSplit split_drive_posix(const std::string& path) {
    return {"", path};
}

bool is_posix_abs(const std::string& path) {
    return !path.empty() && path[0] == '/';
}

bool is_nt_abs(const std::string& path) {
    auto split = split_drive_nt(path);
    if (split.drive.empty()) {
        return false;
    }
    if (split.drive.size() > 2) {
        return true;  // UNC share
    }
    return !split.tail.empty() && is_path_separator(split.tail[0]);
}

std::vector<std::string> split_components(const std::string& path) {
    std::vector<std::string> parts;
    std::string current;
    for (char c : path) {
        if (is_path_separator(c)) {
            parts.push_back(current);
            current.clear();
        } else {
            current += c;
        }
    }
    parts.push_back(current);
    return parts;
}

std::string normalize_path(const std::string& path) {
    if (path.empty()) {
        return ".";
    }

    bool rooted = is_path_separator(path[0]);

    std::vector<std::string> normalized;
    for (const auto& part : split_components(path)) {
        if (part.empty() || part == ".") {
            continue;
        }
        if (part == "..") {
            if (!normalized.empty() && normalized.back() != "..") {
                normalized.pop_back();
            } else if (!rooted) {
                normalized.push_back(part);
            }
            continue;
        }
        normalized.push_back(part);
    }

    std::string out = rooted ? "/" : "";
    out += join(normalized, '/');
    return out.empty() ? "." : out;
}

std::string extract_root_name(const std::string& path) {
    size_t sep = path.rfind('/');
    std::string base = (sep == std::string::npos) ? path : path.substr(sep + 1);

    size_t dot = base.rfind('.');
    if (dot == std::string::npos || dot == 0) {
        return base;
    }
    // Only an extension if a non-dot character precedes the final dot
    for (size_t i = 0; i < dot; ++i) {
        if (base[i] != '.') {
            return base.substr(0, dot);
        }
    }
    return base;
}

bool is_blank(const std::string& s) {
    return std::all_of(s.begin(), s.end(),
                       [](unsigned char c) { return std::isspace(c) != 0; });
}

std::string to_upper_ascii(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return result;
}

std::size_t utf8_length(const std::string& s) {
    return static_cast<std::size_t>(
        std::count_if(s.begin(), s.end(), [](char c) { return !is_continuation_byte(c); }));
}

std::string utf8_truncate(const std::string& s, std::size_t max_code_points) {
    std::size_t count = 0;
    for (size_t i = 0; i < s.size(); ++i) {
        if (!is_continuation_byte(s[i])) {
            if (count == max_code_points) {
                return s.substr(0, i);
            }
            ++count;
        }
    }
    return s;
}

} // namespace pathsafe
