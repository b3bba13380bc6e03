#include "pathsafe/filepath.hpp"

#include "validate/checks.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <vector>

namespace pathsafe {

namespace {

// Components are sanitized with the default handler: an emptied component
// is dropped instead of being replaced. Lengths are clamped to the filename
// ceiling.
SanitizerOptions component_options(const SanitizerOptions& options) {
    SanitizerOptions component;
    component.platform = options.platform;
    component.check_reserved = options.check_reserved;
    component.validate_after_sanitize = options.validate_after_sanitize;

    std::size_t ceiling =
        make_platform_profile(options.platform.value_or(Platform::Universal)).max_filename_len;
    if (options.max_len && *options.max_len > 0) {
        component.max_len = std::min(*options.max_len, ceiling);
    }
    component.min_len = std::min(options.min_len, component.max_len.value_or(ceiling));
    return component;
}

std::string join_components(const std::vector<std::string>& components, char separator) {
    std::string joined;
    for (size_t i = 0; i < components.size(); ++i) {
        if (i > 0) joined += separator;
        joined += components[i];
    }
    return joined;
}

} // namespace

FilePathSanitizer::FilePathSanitizer(const SanitizerOptions& options)
    : config_(make_engine_config(options, PathKind::Filepath)),
      null_value_handler_(options.null_value_handler ? options.null_value_handler
                                                     : NullValueHandler(&return_null_string)),
      normalize_(options.normalize),
      validate_after_sanitize_(options.validate_after_sanitize),
      fpath_validator_(options),
      fname_sanitizer_(component_options(options)) {}

Result<std::string> FilePathSanitizer::sanitize(const std::string& value,
                                                const std::string& replacement) const {
    return sanitize_impl(value, replacement, false);
}

Result<std::filesystem::path> FilePathSanitizer::sanitize(const std::filesystem::path& value,
                                                          const std::string& replacement) const {
    return sanitize_impl(value.string(), replacement, true)
        .map([](const std::string& s) { return std::filesystem::path(s); });
}

Result<std::string> FilePathSanitizer::handle_null(const ValidationError& error,
                                                   bool path_object) const {
    if (path_object) {
        return Result<std::string>::err(error);
    }
    auto fallback = null_value_handler_(error);
    if (!fallback) {
        return Result<std::string>::err(error);
    }
    spdlog::debug("sanitize_filepath: empty result replaced with '{}'", *fallback);
    return Result<std::string>::ok(*fallback);
}

Result<std::string> FilePathSanitizer::sanitize_impl(const std::string& value,
                                                     const std::string& replacement,
                                                     bool path_object) const {
    const auto& profile = config_.profile;

    auto type_check = detail::validate_pathtype(value, !is_windows_family(config_.platform),
                                                config_.platform);
    if (type_check.isErr()) {
        return handle_null(type_check.error(), path_object);
    }

    auto abspath = fpath_validator_.validate_abspath(value);
    if (abspath.isErr()) {
        return Result<std::string>::err(abspath.error());
    }

    DriveSplit split = fpath_validator_.split_drive(value);

    std::string tail;
    tail.reserve(split.tail.size());
    for (char c : split.tail) {
        if (profile.is_invalid_path_char(c)) {
            tail += replacement;
        } else {
            tail += c;
        }
    }

    if (normalize_ && !tail.empty()) {
        tail = normalize_path(tail);
    }

    bool ntfs_suffix = profile.ntfs_reserved && config_.check_reserved;
    std::vector<std::string> components;
    auto parts = tail.empty() ? std::vector<std::string>() : split_components(tail);
    for (size_t i = 0; i < parts.size(); ++i) {
        const std::string& part = parts[i];

        if (part.empty()) {
            // Only a leading empty component survives: it marks the root
            if (i == 0) {
                components.push_back(part);
            }
            continue;
        }

        if (ntfs_suffix && is_ntfs_reserved_file_name(part, true)) {
            spdlog::debug("sanitize_filepath: NTFS reserved name '{}' rewritten as '{}_'", part,
                          part);
            components.push_back(part + "_");
            continue;
        }

        auto component = fname_sanitizer_.sanitize(part, replacement);
        if (component.isErr()) {
            return Result<std::string>::err(component.error());
        }
        if (!component.value().empty()) {
            components.push_back(component.value());
        }
    }

    std::string sanitized;
    if (components.size() == 1 && components.front().empty()) {
        sanitized = std::string(1, profile.path_separator);
    } else {
        sanitized = join_components(components, profile.path_separator);
    }
    sanitized = split.drive + sanitized;

    auto check = fpath_validator_.validate(sanitized);
    if (check.isErr()) {
        if (check.error().reason() != ErrorReason::NULL_NAME) {
            return Result<std::string>::err(check.error());
        }
        auto fallback = handle_null(check.error(), path_object);
        if (fallback.isErr()) {
            return fallback;
        }
        sanitized = fallback.value();
    }

    if (validate_after_sanitize_) {
        auto final_check = fpath_validator_.validate(sanitized);
        if (final_check.isErr()) {
            return Result<std::string>::err(final_check.error());
        }
    }

    if (sanitized != value) {
        spdlog::debug("sanitize_filepath: '{}' -> '{}' ({})", value, sanitized,
                      platform_to_string(config_.platform));
    }
    return Result<std::string>::ok(sanitized);
}

} // namespace pathsafe
