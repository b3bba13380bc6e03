#include "pathsafe/filename.hpp"

#include "validate/checks.hpp"

namespace pathsafe {

FileNameValidator::FileNameValidator(const EngineOptions& options)
    : config_(make_engine_config(options, PathKind::Filename)) {}

Result<void> FileNameValidator::validate(const std::filesystem::path& value) const {
    return validate(value.string());
}

Result<void> FileNameValidator::validate(const std::string& value) const {
    const auto& profile = config_.profile;

    auto type_check = detail::validate_pathtype(value, !is_windows_family(config_.platform),
                                                config_.platform);
    if (type_check.isErr()) {
        return type_check;
    }

    auto length = detail::check_length(value, config_.min_len, config_.max_len, "filename",
                                       config_.platform);
    if (length.isErr()) {
        return length;
    }

    auto reserved = validate_reserved_keywords(value);
    if (reserved.isErr()) {
        return reserved;
    }

    auto chars = detail::check_invalid_chars(value, profile.invalid_filename_chars,
                                             config_.platform);
    if (chars.isErr()) {
        return chars;
    }

    // Windows: do not end a file or directory name with a space or a period
    if (profile.forbid_trailing_space_period && value != "." && value != "..") {
        char last = value.back();
        if (last == ' ' || last == '.') {
            return Result<void>::err(
                ValidationError(ErrorReason::INVALID_CHARACTER, config_.platform,
                                "Do not end a file or directory name with a space or a period: " +
                                    detail::repr_value(value))
                    .withValue(value)
                    .withInvalidChars(std::string(1, last)));
        }
    }

    return Result<void>::ok();
}

Result<void> FileNameValidator::validate_reserved_keywords(const std::string& value) const {
    if (!config_.check_reserved) {
        return Result<void>::ok();
    }

    std::string root_name = extract_root_name(value);
    if (config_.profile.is_reserved_filename(to_upper_ascii(root_name))) {
        return detail::reserved_name_error(root_name, config_.platform);
    }
    return Result<void>::ok();
}

} // namespace pathsafe
