#pragma once

/**
 * @file filepath.hpp
 * @brief Validation and sanitization of whole file paths
 *
 * A path is split into an optional drive/root prefix and a tail. Path-level
 * rules (absolute-path style, total length, reserved tokens, characters) run
 * on the tail; the reserved-name rules of FileNameValidator run on each
 * component.
 *
 * @example
 * ```cpp
 * pathsafe::EngineOptions linux_opts;
 * linux_opts.platform = pathsafe::Platform::Linux;
 * pathsafe::validate_filepath("C:\\a\\b", linux_opts);   // MALFORMED_ABS_PATH
 *
 * pathsafe::SanitizerOptions win_opts;
 * win_opts.platform = pathsafe::Platform::Windows;
 * pathsafe::sanitize_filepath("C:/a/./b/../c?", "", win_opts);  // "C:\\a\\c"
 * ```
 */

#include "pathsafe/engine_config.hpp"
#include "pathsafe/export.hpp"
#include "pathsafe/filename.hpp"
#include "pathsafe/path_utils.hpp"
#include "pathsafe/result.hpp"

#include <filesystem>
#include <string>

namespace pathsafe {

// ============================================================================
// FilePathValidator
// ============================================================================

class PATHSAFE_API FilePathValidator {
public:
    explicit FilePathValidator(const EngineOptions& options = {});

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

    /**
     * Check that the absolute-path style fits the platform.
     *
     * Windows accepts drive/UNC absolute paths and rejects "/..." paths;
     * POSIX, Linux and macOS accept "/..." and reject drive/UNC absolute
     * paths; Universal rejects both styles since neither is portable.
     */
    Result<void> validate_abspath(const std::string& value) const;

    // Drive/root prefix and tail, using the platform's drive rules
    DriveSplit split_drive(const std::string& value) const;

private:
    Result<void> validate_reserved_keywords(const std::string& tail) const;
    Result<void> validate_characters(const std::string& tail) const;

    EngineConfig config_;
    FileNameValidator fname_validator_;
};

// ============================================================================
// FilePathSanitizer
// ============================================================================

/**
 * Rewrites a path so that FilePathValidator accepts it.
 *
 * Steps: split drive, replace invalid characters in the tail, normalize
 * "."/".."/separators (optional), sanitize each component with a
 * FileNameSanitizer, then join with the platform separator ('\' on Windows,
 * '/' otherwise) and re-attach the drive. MALFORMED_ABS_PATH and residual
 * validation failures are returned as errors.
 */
class PATHSAFE_API FilePathSanitizer {
public:
    explicit FilePathSanitizer(const SanitizerOptions& options = {});

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
    bool normalize_;
    bool validate_after_sanitize_;
    FilePathValidator fpath_validator_;
    FileNameSanitizer fname_sanitizer_;
};

// ============================================================================
// Convenience Functions
// ============================================================================

PATHSAFE_API Result<void> validate_filepath(const std::string& path,
                                            const EngineOptions& options = {});
PATHSAFE_API Result<void> validate_filepath(const std::filesystem::path& path,
                                            const EngineOptions& options = {});
inline Result<void> validate_filepath(const char* path, const EngineOptions& options = {}) {
    return validate_filepath(std::string(path), options);
}

PATHSAFE_API bool is_valid_filepath(const std::string& path, const EngineOptions& options = {});
PATHSAFE_API bool is_valid_filepath(const std::filesystem::path& path,
                                    const EngineOptions& options = {});
inline bool is_valid_filepath(const char* path, const EngineOptions& options = {}) {
    return is_valid_filepath(std::string(path), options);
}

PATHSAFE_API Result<std::string> sanitize_filepath(const std::string& path,
                                                   const std::string& replacement = "",
                                                   const SanitizerOptions& options = {});
PATHSAFE_API Result<std::filesystem::path> sanitize_filepath(const std::filesystem::path& path,
                                                             const std::string& replacement = "",
                                                             const SanitizerOptions& options = {});
inline Result<std::string> sanitize_filepath(const char* path,
                                             const std::string& replacement = "",
                                             const SanitizerOptions& options = {}) {
    return sanitize_filepath(std::string(path), replacement, options);
}

} // namespace pathsafe
