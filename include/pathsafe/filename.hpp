#pragma once

/**
 * @file filename.hpp
 * @brief Validation and sanitization of a single path component
 *
 * @example
 * ```cpp
 * pathsafe::EngineOptions opts;
 * opts.platform = pathsafe::Platform::Windows;
 *
 * pathsafe::validate_filename("LPT9.txt", opts);    // RESERVED_NAME
 * pathsafe::sanitize_filename("a:b*c", "_", {});     // "a_b_c"
 * ```
 */

#include "pathsafe/engine_config.hpp"
#include "pathsafe/export.hpp"
#include "pathsafe/result.hpp"

#include <filesystem>
#include <string>

namespace pathsafe {

// ============================================================================
// FileNameValidator
// ============================================================================

/**
 * Validates a single component (no separators) against the platform rules.
 *
 * Checks, first failure wins:
 * 1. empty, or whitespace-only under Windows rules: NULL_NAME
 * 2. length outside [min_len, max_len]: INVALID_LENGTH
 * 3. reserved stem (when check_reserved): RESERVED_NAME
 * 4. invalid characters: INVALID_CHARACTER
 * 5. trailing space or period under Windows rules: INVALID_CHARACTER
 *
 * Throws std::invalid_argument from the constructor on inconsistent lengths.
 */
class PATHSAFE_API FileNameValidator {
public:
    explicit FileNameValidator(const EngineOptions& options = {});

    const EngineConfig& config() const { return config_; }
    Platform platform() const { return config_.platform; }
    std::size_t min_len() const { return config_.min_len; }
    std::size_t max_len() const { return config_.max_len; }

    Result<void> validate(const std::string& value) const;
    Result<void> validate(const std::filesystem::path& value) const;
    Result<void> validate(const char* value) const { return validate(std::string(value)); }

    bool is_valid(const std::string& value) const { return validate(value).isOk(); }
    bool is_valid(const std::filesystem::path& value) const { return validate(value).isOk(); }
    bool is_valid(const char* value) const { return validate(value).isOk(); }

    // Reserved-name check alone; FilePathValidator runs it per component
    Result<void> validate_reserved_keywords(const std::string& value) const;

private:
    EngineConfig config_;
};

// ============================================================================
// FileNameSanitizer
// ============================================================================

/**
 * Rewrites a single component so that FileNameValidator accepts it.
 *
 * Invalid characters are replaced (the replacement text is not re-scanned),
 * the result is truncated to max_len, reserved stems get a trailing '_'
 * ("LPT9.txt" -> "LPT9_.txt"), and under Windows rules trailing spaces and
 * periods are stripped. Empty results go to the null value handler, except
 * for std::filesystem::path input, which cannot hold an empty component.
 */
class PATHSAFE_API FileNameSanitizer {
public:
    explicit FileNameSanitizer(const SanitizerOptions& options = {});

    const EngineConfig& config() const { return config_; }
    Platform platform() const { return config_.platform; }

    Result<std::string> sanitize(const std::string& value,
                                 const std::string& replacement = "") const;
    Result<std::filesystem::path> sanitize(const std::filesystem::path& value,
                                           const std::string& replacement = "") const;
    Result<std::string> sanitize(const char* value, const std::string& replacement = "") const {
        return sanitize(std::string(value), replacement);
    }

private:
    Result<std::string> sanitize_impl(const std::string& value, const std::string& replacement,
                                      bool path_object) const;
    Result<std::string> handle_null(const ValidationError& error, bool path_object) const;

    EngineConfig config_;
    NullValueHandler null_value_handler_;
    bool validate_after_sanitize_;
    FileNameValidator validator_;
};

// ============================================================================
// Convenience Functions
// ============================================================================

PATHSAFE_API Result<void> validate_filename(const std::string& name,
                                            const EngineOptions& options = {});
PATHSAFE_API Result<void> validate_filename(const std::filesystem::path& name,
                                            const EngineOptions& options = {});
inline Result<void> validate_filename(const char* name, const EngineOptions& options = {}) {
    return validate_filename(std::string(name), options);
}

PATHSAFE_API bool is_valid_filename(const std::string& name, const EngineOptions& options = {});
PATHSAFE_API bool is_valid_filename(const std::filesystem::path& name,
                                    const EngineOptions& options = {});
inline bool is_valid_filename(const char* name, const EngineOptions& options = {}) {
    return is_valid_filename(std::string(name), options);
}

PATHSAFE_API Result<std::string> sanitize_filename(const std::string& name,
                                                   const std::string& replacement = "",
                                                   const SanitizerOptions& options = {});
PATHSAFE_API Result<std::filesystem::path> sanitize_filename(const std::filesystem::path& name,
                                                             const std::string& replacement = "",
                                                             const SanitizerOptions& options = {});
inline Result<std::string> sanitize_filename(const char* name,
                                             const std::string& replacement = "",
                                             const SanitizerOptions& options = {}) {
    return sanitize_filename(std::string(name), replacement, options);
}

} // namespace pathsafe
