#pragma once

/**
 * @file json.hpp
 * @brief nlohmann::json entry points and conversions
 *
 * The JSON overloads accept values straight from a parsed document:
 * - null is a missing name (NULL_NAME)
 * - a string is checked as usual
 * - any other type fails with INVALID_INPUT_TYPE
 *
 * Sanitizers return a JSON string. ValidationError and PlatformProfile
 * convert with `nlohmann::json j = value;`.
 */

#include "pathsafe/engine_config.hpp"
#include "pathsafe/export.hpp"
#include "pathsafe/platform.hpp"
#include "pathsafe/result.hpp"
#include "pathsafe/types.hpp"

#include <nlohmann/json.hpp>

namespace pathsafe {

// ============================================================================
// Conversions
// ============================================================================

PATHSAFE_API void to_json(nlohmann::json& j, const ValidationError& error);
PATHSAFE_API void to_json(nlohmann::json& j, const PlatformProfile& profile);
PATHSAFE_API void to_json(nlohmann::json& j, const EngineConfig& config);

// Null reads as the empty name; non-string values are INVALID_INPUT_TYPE
PATHSAFE_API Result<std::string> string_from_json(const nlohmann::json& value,
                                                  Platform platform = Platform::Universal);

// ============================================================================
// Validation
// ============================================================================

PATHSAFE_API Result<void> validate_filename(const nlohmann::json& name,
                                            const EngineOptions& options = {});
PATHSAFE_API Result<void> validate_filepath(const nlohmann::json& path,
                                            const EngineOptions& options = {});

// Throws std::invalid_argument when the value is neither null nor a string
PATHSAFE_API bool is_valid_filename(const nlohmann::json& name, const EngineOptions& options = {});
PATHSAFE_API bool is_valid_filepath(const nlohmann::json& path, const EngineOptions& options = {});

// ============================================================================
// Sanitization
// ============================================================================

PATHSAFE_API Result<nlohmann::json> sanitize_filename(const nlohmann::json& name,
                                                      const std::string& replacement = "",
                                                      const SanitizerOptions& options = {});
PATHSAFE_API Result<nlohmann::json> sanitize_filepath(const nlohmann::json& path,
                                                      const std::string& replacement = "",
                                                      const SanitizerOptions& options = {});

} // namespace pathsafe
