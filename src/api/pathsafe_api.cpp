/**
 * @file pathsafe_api.cpp
 * @brief Convenience functions over the validator and sanitizer engines
 *
 * Each call builds a short-lived engine from the given options. Callers that
 * check many values under the same options should keep an engine instead.
 */

#include "pathsafe/filename.hpp"
#include "pathsafe/filepath.hpp"

namespace pathsafe {

// ============================================================================
// Filename
// ============================================================================

Result<void> validate_filename(const std::string& name, const EngineOptions& options) {
    return FileNameValidator(options).validate(name);
}

Result<void> validate_filename(const std::filesystem::path& name, const EngineOptions& options) {
    return FileNameValidator(options).validate(name);
}

bool is_valid_filename(const std::string& name, const EngineOptions& options) {
    return FileNameValidator(options).is_valid(name);
}

bool is_valid_filename(const std::filesystem::path& name, const EngineOptions& options) {
    return FileNameValidator(options).is_valid(name);
}

Result<std::string> sanitize_filename(const std::string& name, const std::string& replacement,
                                      const SanitizerOptions& options) {
    return FileNameSanitizer(options).sanitize(name, replacement);
}

Result<std::filesystem::path> sanitize_filename(const std::filesystem::path& name,
                                                const std::string& replacement,
                                                const SanitizerOptions& options) {
    return FileNameSanitizer(options).sanitize(name, replacement);
}

// ============================================================================
// File path
// ============================================================================

Result<void> validate_filepath(const std::string& path, const EngineOptions& options) {
    return FilePathValidator(options).validate(path);
}

Result<void> validate_filepath(const std::filesystem::path& path, const EngineOptions& options) {
    return FilePathValidator(options).validate(path);
}

bool is_valid_filepath(const std::string& path, const EngineOptions& options) {
    return FilePathValidator(options).is_valid(path);
}

bool is_valid_filepath(const std::filesystem::path& path, const EngineOptions& options) {
    return FilePathValidator(options).is_valid(path);
}

Result<std::string> sanitize_filepath(const std::string& path, const std::string& replacement,
                                      const SanitizerOptions& options) {
    return FilePathSanitizer(options).sanitize(path, replacement);
}

Result<std::filesystem::path> sanitize_filepath(const std::filesystem::path& path,
                                                const std::string& replacement,
                                                const SanitizerOptions& options) {
    return FilePathSanitizer(options).sanitize(path, replacement);
}

} // namespace pathsafe
