#pragma once

/**
 * @file cli11.hpp
 * @brief CLI11 option validators and transformers
 *
 * @example
 * ```cpp
 * std::string out;
 * app.add_option("--out", out)->check(pathsafe::cli11::FilepathValidator());
 *
 * std::string name;
 * app.add_option("--name", name)->transform(pathsafe::cli11::FilenameSanitizer("_"));
 * ```
 *
 * Empty arguments pass through untouched so that optional values keep
 * CLI11's own handling.
 */

#include "pathsafe/filename.hpp"
#include "pathsafe/filepath.hpp"

#include <CLI/CLI.hpp>

#include <string>

namespace pathsafe {
namespace cli11 {

// Rejects arguments that are not valid filenames
class FilenameValidator : public CLI::Validator {
public:
    explicit FilenameValidator(const EngineOptions& options = {}) : CLI::Validator("FILENAME") {
        FileNameValidator validator(options);
        func_ = [validator](std::string& value) {
            if (value.empty()) {
                return std::string();
            }
            auto result = validator.validate(value);
            return result.isOk() ? std::string() : result.error().description();
        };
    }
};

// Rejects arguments that are not valid file paths
class FilepathValidator : public CLI::Validator {
public:
    explicit FilepathValidator(const EngineOptions& options = {}) : CLI::Validator("PATH") {
        FilePathValidator validator(options);
        func_ = [validator](std::string& value) {
            if (value.empty()) {
                return std::string();
            }
            auto result = validator.validate(value);
            return result.isOk() ? std::string() : result.error().description();
        };
    }
};

// Rewrites the argument into a valid filename
class FilenameSanitizer : public CLI::Validator {
public:
    explicit FilenameSanitizer(const std::string& replacement = "",
                               const SanitizerOptions& options = {})
        : CLI::Validator("FILENAME") {
        FileNameSanitizer sanitizer(options);
        func_ = [sanitizer, replacement](std::string& value) {
            if (value.empty()) {
                return std::string();
            }
            auto result = sanitizer.sanitize(value, replacement);
            if (result.isErr()) {
                return result.error().description();
            }
            value = result.value();
            return std::string();
        };
    }
};

// Rewrites the argument into a valid file path
class FilepathSanitizer : public CLI::Validator {
public:
    explicit FilepathSanitizer(const std::string& replacement = "",
                               const SanitizerOptions& options = {})
        : CLI::Validator("PATH") {
        FilePathSanitizer sanitizer(options);
        func_ = [sanitizer, replacement](std::string& value) {
            if (value.empty()) {
                return std::string();
            }
            auto result = sanitizer.sanitize(value, replacement);
            if (result.isErr()) {
                return result.error().description();
            }
            value = result.value();
            return std::string();
        };
    }
};

} // namespace cli11
} // namespace pathsafe
