#pragma once

#include "pathsafe/export.hpp"
#include "pathsafe/platform.hpp"

#include <optional>
#include <string>
#include <utility>

namespace pathsafe {

// ============================================================================
// Error Reasons
// ============================================================================

// Why a name or path was rejected. Validators report the first violated
// rule; sanitizers use the reason to pick a recovery.
enum class ErrorReason {
    NULL_NAME,
    INVALID_CHARACTER,
    INVALID_LENGTH,
    RESERVED_NAME,
    MALFORMED_ABS_PATH,
    INVALID_INPUT_TYPE,
};

inline const char* error_reason_to_string(ErrorReason r) {
    switch (r) {
        case ErrorReason::NULL_NAME: return "NULL_NAME";
        case ErrorReason::INVALID_CHARACTER: return "INVALID_CHARACTER";
        case ErrorReason::INVALID_LENGTH: return "INVALID_LENGTH";
        case ErrorReason::RESERVED_NAME: return "RESERVED_NAME";
        case ErrorReason::MALFORMED_ABS_PATH: return "MALFORMED_ABS_PATH";
        case ErrorReason::INVALID_INPUT_TYPE: return "INVALID_INPUT_TYPE";
    }
    return "UNKNOWN";
}

// Short human-readable summary of a reason
PATHSAFE_API const char* error_reason_summary(ErrorReason r);

// Parse reason key (case-insensitive)
PATHSAFE_API std::optional<ErrorReason> parse_error_reason(const std::string& key);

// ============================================================================
// Validation Error
// ============================================================================

/**
 * @brief The single error type reported by validators and sanitizers
 *
 * Carries the reason, the platform whose rules were applied, a description,
 * and reason-specific details (offending value, characters, reserved name).
 */
class PATHSAFE_API ValidationError {
public:
    ValidationError(ErrorReason reason, Platform platform, std::string description = "")
        : reason_(reason), platform_(platform), description_(std::move(description)) {}

    ValidationError& withValue(std::string value) {
        value_ = std::move(value);
        return *this;
    }

    // Offending characters, deduplicated, in order of first occurrence
    ValidationError& withInvalidChars(std::string chars) {
        invalid_chars_ = std::move(chars);
        return *this;
    }

    ValidationError& withReservedName(std::string name) {
        reserved_name_ = std::move(name);
        return *this;
    }

    ValidationError& withContext(const std::string& context) {
        description_ = context + ": " + description_;
        return *this;
    }

    ErrorReason reason() const { return reason_; }
    Platform platform() const { return platform_; }
    const std::string& description() const { return description_; }
    const std::string& value() const { return value_; }
    const std::string& invalidChars() const { return invalid_chars_; }
    const std::string& reservedName() const { return reserved_name_; }

    // "[REASON] summary: description, platform=..., reserved-name=..."
    std::string toString() const;

private:
    ErrorReason reason_;
    Platform platform_;
    std::string description_;
    std::string value_;
    std::string invalid_chars_;
    std::string reserved_name_;
};

} // namespace pathsafe
