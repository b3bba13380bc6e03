#pragma once

#include "pathsafe/export.hpp"
#include "pathsafe/types.hpp"

#include <functional>
#include <optional>
#include <string>

namespace pathsafe {

// ============================================================================
// Null Value Handlers
// ============================================================================

/**
 * Called when sanitization produces an empty value.
 *
 * Receives the NULL_NAME error that triggered it and returns the value to use
 * instead, or std::nullopt to propagate the error to the caller.
 */
using NullValueHandler = std::function<std::optional<std::string>(const ValidationError&)>;

enum class NullValueStrategy {
    ReturnEmpty,  ///< Return "" (default)
    Raise,        ///< Propagate the NULL_NAME error
    Timestamp     ///< Return the current Unix time, e.g. "1700000000.123456"
};

inline const char* null_value_strategy_to_string(NullValueStrategy s) {
    switch (s) {
        case NullValueStrategy::ReturnEmpty: return "empty";
        case NullValueStrategy::Raise: return "raise";
        case NullValueStrategy::Timestamp: return "timestamp";
    }
    return "empty";
}

// Parse "empty", "raise" or "timestamp" (case-insensitive)
PATHSAFE_API std::optional<NullValueStrategy> parse_null_value_strategy(const std::string& s);

PATHSAFE_API std::optional<std::string> return_null_string(const ValidationError& e);
PATHSAFE_API std::optional<std::string> raise_error(const ValidationError& e);
PATHSAFE_API std::optional<std::string> return_timestamp(const ValidationError& e);

// Built-in handler for a strategy tag
PATHSAFE_API NullValueHandler get_null_value_handler(NullValueStrategy strategy);

} // namespace pathsafe
