#include "pathsafe/filepath.hpp"

#include "validate/checks.hpp"

namespace pathsafe {

namespace {

// Component rules inherit platform and reserved-name handling but not the
// path-level length bounds.
EngineOptions component_options(const EngineOptions& options) {
    EngineOptions component;
    component.platform = options.platform;
    component.check_reserved = options.check_reserved;
    return component;
}

Result<void> malformed_abspath(Platform platform, const std::string& value,
                               const std::string& description) {
    return Result<void>::err(
        ValidationError(ErrorReason::MALFORMED_ABS_PATH, platform, description).withValue(value));
}

} // namespace

FilePathValidator::FilePathValidator(const EngineOptions& options)
    : config_(make_engine_config(options, PathKind::Filepath)),
      fname_validator_(component_options(options)) {}

DriveSplit FilePathValidator::split_drive(const std::string& value) const {
    return config_.profile.split_nt_drive ? split_drive_nt(value) : split_drive_posix(value);
}

Result<void> FilePathValidator::validate(const std::filesystem::path& value) const {
    return validate(value.string());
}

Result<void> FilePathValidator::validate(const std::string& value) const {
    auto type_check = detail::validate_pathtype(value, !is_windows_family(config_.platform),
                                                config_.platform);
    if (type_check.isErr()) {
        return type_check;
    }

    auto abspath = validate_abspath(value);
    if (abspath.isErr()) {
        return abspath;
    }

    std::string tail = split_drive(value).tail;
    if (tail.empty()) {
        return Result<void>::ok();
    }

    auto length = detail::check_length(tail, config_.min_len, config_.max_len, "file path",
                                       config_.platform);
    if (length.isErr()) {
        return length;
    }

    auto reserved = validate_reserved_keywords(tail);
    if (reserved.isErr()) {
        return reserved;
    }

    return validate_characters(tail);
}

Result<void> FilePathValidator::validate_abspath(const std::string& value) const {
    bool posix_abs = is_posix_abs(value);
    bool nt_abs = is_nt_abs(value);

    switch (config_.platform) {
        case Platform::Windows:
            if (posix_abs && !nt_abs) {
                return malformed_abspath(config_.platform, value,
                                         "POSIX style absolute file path found. expected a "
                                         "platform-independent or a Windows style file path: " +
                                             detail::repr_value(value));
            }
            break;
        case Platform::POSIX:
        case Platform::Linux:
        case Platform::macOS:
            if (nt_abs) {
                return malformed_abspath(config_.platform, value,
                                         "Windows style absolute file path found. expected a "
                                         "platform-independent or a POSIX style file path: " +
                                             detail::repr_value(value));
            }
            break;
        case Platform::Universal:
            if (nt_abs) {
                return malformed_abspath(config_.platform, value,
                                         "Windows style absolute file path found. expected a "
                                         "platform-independent file path: " +
                                             detail::repr_value(value));
            }
            if (posix_abs) {
                return malformed_abspath(config_.platform, value,
                                         "POSIX style absolute file path found. expected a "
                                         "platform-independent file path: " +
                                             detail::repr_value(value));
            }
            break;
    }

    return Result<void>::ok();
}

Result<void> FilePathValidator::validate_reserved_keywords(const std::string& tail) const {
    if (!config_.check_reserved) {
        return Result<void>::ok();
    }

    std::string root_name = extract_root_name(tail);
    if (config_.profile.is_reserved_path_token(to_upper_ascii(root_name))) {
        return detail::reserved_name_error(root_name, config_.platform);
    }

    for (const auto& component : split_components(tail)) {
        if (component.empty() || component == "." || component == "..") {
            continue;
        }
        auto reserved = fname_validator_.validate_reserved_keywords(component);
        if (reserved.isErr()) {
            ValidationError error = reserved.error();
            return Result<void>::err(error.withValue(tail));
        }
    }

    return Result<void>::ok();
}

Result<void> FilePathValidator::validate_characters(const std::string& tail) const {
    const auto& profile = config_.profile;

    auto chars = detail::check_invalid_chars(tail, profile.invalid_path_chars, config_.platform);
    if (chars.isErr()) {
        return chars;
    }

    // NTFS metafiles at the volume root: "$Mft", "/$Mft", "\$MFT"
    if (profile.ntfs_reserved && config_.check_reserved) {
        std::string name = tail;
        if (is_path_separator(name.front())) {
            name.erase(0, 1);
        }
        if (is_ntfs_reserved_file_name(name, true)) {
            return detail::reserved_name_error(name, config_.platform);
        }
    }

    return Result<void>::ok();
}

} // namespace pathsafe
