#pragma once

// Checks shared by the filename and file path engines (not installed).

#include "pathsafe/path_utils.hpp"
#include "pathsafe/result.hpp"

#include <cstdio>
#include <string>

namespace pathsafe::detail {

// Quoted single character with escapes: 'a', '\t', '\x00'
inline std::string repr_char(char c) {
    switch (c) {
        case '\t': return "'\\t'";
        case '\n': return "'\\n'";
        case '\r': return "'\\r'";
        case '\'': return "\"'\"";
        case '\\': return "'\\\\'";
        default: break;
    }
    unsigned char uc = static_cast<unsigned char>(c);
    if (uc < 0x20 || uc == 0x7F) {
        char buf[8];
        std::snprintf(buf, sizeof(buf), "'\\x%02x'", uc);
        return buf;
    }
    return std::string("'") + c + "'";
}

// Quoted value with control characters escaped
inline std::string repr_value(const std::string& value) {
    std::string out = "'";
    for (char c : value) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (c == '\'' || c == '\\' || uc < 0x20 || uc == 0x7F) {
            std::string r = repr_char(c);
            out += (c == '\'') ? "\\'" : r.substr(1, r.size() - 2);
        } else {
            out += c;
        }
    }
    return out + "'";
}

// Characters of value found in invalid_set, deduplicated in first-seen order
inline std::string find_invalid_chars(const std::string& value, const std::string& invalid_set) {
    std::string found;
    for (char c : value) {
        if (invalid_set.find(c) != std::string::npos && found.find(c) == std::string::npos) {
            found += c;
        }
    }
    return found;
}

inline Result<void> check_invalid_chars(const std::string& value,
                                        const std::string& invalid_set,
                                        Platform platform) {
    std::string found = find_invalid_chars(value, invalid_set);
    if (found.empty()) {
        return Result<void>::ok();
    }

    std::string list;
    for (size_t i = 0; i < found.size(); ++i) {
        if (i > 0) list += ", ";
        list += repr_char(found[i]);
    }
    return Result<void>::err(
        ValidationError(ErrorReason::INVALID_CHARACTER, platform,
                        "invalids=(" + list + "), value=" + repr_value(value))
            .withValue(value)
            .withInvalidChars(found));
}

// Empty input is a null name. Whitespace-only input is one too unless the
// platform tolerates it (POSIX-family platforms do, Windows rules do not).
inline Result<void> validate_pathtype(const std::string& value, bool allow_whitespaces,
                                      Platform platform) {
    if (value.empty() || (!allow_whitespaces && is_blank(value))) {
        return Result<void>::err(
            ValidationError(ErrorReason::NULL_NAME, platform).withValue(value));
    }
    return Result<void>::ok();
}

inline Result<void> check_length(const std::string& value, std::size_t min_len,
                                 std::size_t max_len, const char* what, Platform platform) {
    std::size_t len = utf8_length(value);
    if (len > max_len) {
        return Result<void>::err(
            ValidationError(ErrorReason::INVALID_LENGTH, platform,
                            std::string(what) + " is too long: expected<=" +
                                std::to_string(max_len) + ", actual=" + std::to_string(len))
                .withValue(value));
    }
    if (len < min_len) {
        return Result<void>::err(
            ValidationError(ErrorReason::INVALID_LENGTH, platform,
                            std::string(what) + " is too short: expected>=" +
                                std::to_string(min_len) + ", actual=" + std::to_string(len))
                .withValue(value));
    }
    return Result<void>::ok();
}

inline Result<void> reserved_name_error(const std::string& name, Platform platform) {
    return Result<void>::err(
        ValidationError(ErrorReason::RESERVED_NAME, platform,
                        "'" + name + "' is a reserved name")
            .withValue(name)
            .withReservedName(name));
}

} // namespace pathsafe::detail
