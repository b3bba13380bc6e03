#include "pathsafe/types.hpp"

#include <algorithm>
#include <cctype>

namespace pathsafe {

const char* error_reason_summary(ErrorReason r) {
    switch (r) {
        case ErrorReason::NULL_NAME: return "the value must not be an empty";
        case ErrorReason::INVALID_CHARACTER: return "invalid characters found";
        case ErrorReason::INVALID_LENGTH: return "found an invalid string length";
        case ErrorReason::RESERVED_NAME: return "found a reserved name by a platform";
        case ErrorReason::MALFORMED_ABS_PATH: return "found invalid absolute path format";
        case ErrorReason::INVALID_INPUT_TYPE: return "the value must be a string or null";
    }
    return "unknown error";
}

std::optional<ErrorReason> parse_error_reason(const std::string& key) {
    std::string k = key;
    std::transform(k.begin(), k.end(), k.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    for (auto r : {ErrorReason::NULL_NAME, ErrorReason::INVALID_CHARACTER,
                   ErrorReason::INVALID_LENGTH, ErrorReason::RESERVED_NAME,
                   ErrorReason::MALFORMED_ABS_PATH, ErrorReason::INVALID_INPUT_TYPE}) {
        if (k == error_reason_to_string(r)) {
            return r;
        }
    }
    return std::nullopt;
}

std::string ValidationError::toString() const {
    std::string out = "[";
    out += error_reason_to_string(reason_);
    out += "] ";
    out += error_reason_summary(reason_);
    if (!description_.empty()) {
        out += ": " + description_;
    }
    out += ", platform=";
    out += platform_to_string(platform_);
    if (!reserved_name_.empty()) {
        out += ", reserved-name=" + reserved_name_;
    }
    return out;
}

} // namespace pathsafe
