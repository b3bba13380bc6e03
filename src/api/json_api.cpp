#include "pathsafe/json.hpp"

#include "pathsafe/filename.hpp"
#include "pathsafe/filepath.hpp"

#include <stdexcept>

namespace pathsafe {

namespace {

Platform resolve_platform(const EngineOptions& options) {
    return options.platform.value_or(Platform::Universal);
}

std::string require_string(const nlohmann::json& value, const EngineOptions& options) {
    auto s = string_from_json(value, resolve_platform(options));
    if (s.isErr()) {
        throw std::invalid_argument(s.error().description());
    }
    return s.value();
}

} // namespace

// ============================================================================
// Conversions
// ============================================================================

void to_json(nlohmann::json& j, const ValidationError& error) {
    j = nlohmann::json{
        {"reason", error_reason_to_string(error.reason())},
        {"platform", platform_to_string(error.platform())},
        {"description", error.description()},
        {"value", error.value()},
        {"message", error.toString()},
    };
    if (!error.invalidChars().empty()) {
        nlohmann::json chars = nlohmann::json::array();
        for (char c : error.invalidChars()) {
            chars.push_back(std::string(1, c));
        }
        j["invalid_chars"] = chars;
    }
    if (!error.reservedName().empty()) {
        j["reserved_name"] = error.reservedName();
    }
}

void to_json(nlohmann::json& j, const PlatformProfile& profile) {
    nlohmann::json path_chars = nlohmann::json::array();
    for (char c : profile.invalid_path_chars) {
        path_chars.push_back(std::string(1, c));
    }
    nlohmann::json filename_chars = nlohmann::json::array();
    for (char c : profile.invalid_filename_chars) {
        filename_chars.push_back(std::string(1, c));
    }

    j = nlohmann::json{
        {"platform", platform_to_string(profile.platform)},
        {"max_path_len", profile.max_path_len},
        {"max_filename_len", profile.max_filename_len},
        {"invalid_path_chars", path_chars},
        {"invalid_filename_chars", filename_chars},
        {"reserved_filenames", profile.reserved_filenames},
        {"reserved_path_tokens", profile.reserved_path_tokens},
        {"ntfs_reserved", profile.ntfs_reserved},
        {"forbid_trailing_space_period", profile.forbid_trailing_space_period},
        {"split_nt_drive", profile.split_nt_drive},
        {"path_separator", std::string(1, profile.path_separator)},
    };
}

void to_json(nlohmann::json& j, const EngineConfig& config) {
    j = nlohmann::json{
        {"kind", config.kind == PathKind::Filename ? "filename" : "filepath"},
        {"platform", platform_to_string(config.platform)},
        {"min_len", config.min_len},
        {"max_len", config.max_len},
        {"check_reserved", config.check_reserved},
    };
}

Result<std::string> string_from_json(const nlohmann::json& value, Platform platform) {
    if (value.is_null()) {
        return Result<std::string>::ok("");
    }
    if (!value.is_string()) {
        return Result<std::string>::err(
            ValidationError(ErrorReason::INVALID_INPUT_TYPE, platform,
                            std::string("expected a string or null, got ") +
                                value.type_name())
                .withValue(value.dump()));
    }
    return Result<std::string>::ok(value.get<std::string>());
}

// ============================================================================
// Validation
// ============================================================================

Result<void> validate_filename(const nlohmann::json& name, const EngineOptions& options) {
    auto s = string_from_json(name, resolve_platform(options));
    if (s.isErr()) {
        return Result<void>::err(s.error());
    }
    return FileNameValidator(options).validate(s.value());
}

Result<void> validate_filepath(const nlohmann::json& path, const EngineOptions& options) {
    auto s = string_from_json(path, resolve_platform(options));
    if (s.isErr()) {
        return Result<void>::err(s.error());
    }
    return FilePathValidator(options).validate(s.value());
}

bool is_valid_filename(const nlohmann::json& name, const EngineOptions& options) {
    return FileNameValidator(options).is_valid(require_string(name, options));
}

bool is_valid_filepath(const nlohmann::json& path, const EngineOptions& options) {
    return FilePathValidator(options).is_valid(require_string(path, options));
}

// ============================================================================
// Sanitization
// ============================================================================

Result<nlohmann::json> sanitize_filename(const nlohmann::json& name,
                                         const std::string& replacement,
                                         const SanitizerOptions& options) {
    auto s = string_from_json(name, resolve_platform(options));
    if (s.isErr()) {
        return Result<nlohmann::json>::err(s.error());
    }
    return FileNameSanitizer(options).sanitize(s.value(), replacement).map([](const std::string& v) {
        return nlohmann::json(v);
    });
}

Result<nlohmann::json> sanitize_filepath(const nlohmann::json& path,
                                         const std::string& replacement,
                                         const SanitizerOptions& options) {
    auto s = string_from_json(path, resolve_platform(options));
    if (s.isErr()) {
        return Result<nlohmann::json>::err(s.error());
    }
    return FilePathSanitizer(options).sanitize(s.value(), replacement).map([](const std::string& v) {
        return nlohmann::json(v);
    });
}

} // namespace pathsafe
