#include "pathsafe/filename.hpp"

#include "validate/checks.hpp"

#include <spdlog/spdlog.h>

namespace pathsafe {

namespace {

// Reserved-name suffixing and trailing-character stripping can expose each
// other ("CON." -> "CON_." -> "CON_"), so recovery repeats until stable.
constexpr int kMaxRecoveryPasses = 4;

std::string strip_trailing_space_period(std::string s) {
    while (!s.empty() && (s.back() == ' ' || s.back() == '.')) {
        s.pop_back();
    }
    return s;
}

} // namespace

FileNameSanitizer::FileNameSanitizer(const SanitizerOptions& options)
    : config_(make_engine_config(options, PathKind::Filename)),
      null_value_handler_(options.null_value_handler ? options.null_value_handler
                                                     : NullValueHandler(&return_null_string)),
      validate_after_sanitize_(options.validate_after_sanitize),
      validator_(options) {}

Result<std::string> FileNameSanitizer::sanitize(const std::string& value,
                                                const std::string& replacement) const {
    return sanitize_impl(value, replacement, false);
}

Result<std::filesystem::path> FileNameSanitizer::sanitize(const std::filesystem::path& value,
                                                          const std::string& replacement) const {
    return sanitize_impl(value.string(), replacement, true)
        .map([](const std::string& s) { return std::filesystem::path(s); });
}

Result<std::string> FileNameSanitizer::handle_null(const ValidationError& error,
                                                   bool path_object) const {
    if (path_object) {
        return Result<std::string>::err(error);
    }
    auto fallback = null_value_handler_(error);
    if (!fallback) {
        return Result<std::string>::err(error);
    }
    spdlog::debug("sanitize_filename: empty result replaced with '{}'", *fallback);
    return Result<std::string>::ok(*fallback);
}

Result<std::string> FileNameSanitizer::sanitize_impl(const std::string& value,
                                                     const std::string& replacement,
                                                     bool path_object) const {
    const auto& profile = config_.profile;

    auto type_check = detail::validate_pathtype(value, !is_windows_family(config_.platform),
                                                config_.platform);
    if (type_check.isErr()) {
        return handle_null(type_check.error(), path_object);
    }

    std::string sanitized;
    sanitized.reserve(value.size());
    for (char c : value) {
        if (profile.is_invalid_filename_char(c)) {
            sanitized += replacement;
        } else {
            sanitized += c;
        }
    }
    sanitized = utf8_truncate(sanitized, config_.max_len);

    for (int pass = 0; pass < kMaxRecoveryPasses; ++pass) {
        auto check = validator_.validate(sanitized);
        if (check.isOk()) {
            break;
        }

        const auto& error = check.error();
        std::string before = sanitized;

        if (error.reason() == ErrorReason::NULL_NAME) {
            auto fallback = handle_null(error, path_object);
            if (fallback.isErr()) {
                return fallback;
            }
            sanitized = fallback.value();
            break;
        }

        if (error.reason() == ErrorReason::RESERVED_NAME) {
            // The reserved stem starts the last component of the sanitized value
            size_t sep = sanitized.rfind('/');
            size_t start = (sep == std::string::npos) ? 0 : sep + 1;
            sanitized.insert(start + error.reservedName().size(), "_");
            if (utf8_length(sanitized) > config_.max_len) {
                sanitized = utf8_truncate(sanitized, config_.max_len);
                if (sanitized == before) {
                    // No room for the suffix within max_len
                    return Result<std::string>::err(error);
                }
            }
            spdlog::debug("sanitize_filename: reserved name '{}' rewritten as '{}' ({})",
                          error.reservedName(), sanitized, platform_to_string(config_.platform));
        } else if (error.reason() == ErrorReason::INVALID_CHARACTER &&
                   profile.forbid_trailing_space_period) {
            sanitized = strip_trailing_space_period(sanitized);
            if (sanitized.empty()) {
                auto fallback = handle_null(
                    ValidationError(ErrorReason::NULL_NAME, config_.platform).withValue(value),
                    path_object);
                if (fallback.isErr()) {
                    return fallback;
                }
                sanitized = fallback.value();
                break;
            }
        }

        if (sanitized == before) {
            break;  // not recoverable here; surfaced by validate_after_sanitize
        }
    }

    if (validate_after_sanitize_) {
        auto final_check = validator_.validate(sanitized);
        if (final_check.isErr()) {
            return Result<std::string>::err(final_check.error());
        }
    }

    if (path_object && sanitized.empty()) {
        return Result<std::string>::err(
            ValidationError(ErrorReason::NULL_NAME, config_.platform,
                            "a path object cannot hold an empty name")
                .withValue(value));
    }

    return Result<std::string>::ok(sanitized);
}

} // namespace pathsafe
