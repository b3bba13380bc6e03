#include "pathsafe/engine_config.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

#include <nlohmann/json.hpp>

namespace pathsafe {

namespace {

std::string trim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(start, end - start);
}

// Helper to safely get a string from JSON
std::optional<std::string> get_string(const nlohmann::json& j, const std::string& key) {
    if (j.contains(key) && j[key].is_string()) {
        return j[key].get<std::string>();
    }
    return std::nullopt;
}

std::optional<bool> get_bool(const nlohmann::json& j, const std::string& key) {
    if (j.contains(key) && j[key].is_boolean()) {
        return j[key].get<bool>();
    }
    return std::nullopt;
}

std::optional<long long> get_integer(const nlohmann::json& j, const std::string& key) {
    if (j.contains(key) && j[key].is_number_integer()) {
        return j[key].get<long long>();
    }
    return std::nullopt;
}

} // namespace

EngineConfig make_engine_config(const EngineOptions& options, PathKind kind) {
    EngineConfig config;
    config.kind = kind;
    config.platform = options.platform.value_or(Platform::Universal);
    config.check_reserved = options.check_reserved;
    config.profile = make_platform_profile(config.platform);
    config.min_len = std::max<std::size_t>(options.min_len, 1);

    std::size_t ceiling = (kind == PathKind::Filename) ? config.profile.max_filename_len
                                                       : config.profile.max_path_len;
    if (!options.max_len || *options.max_len == 0) {
        config.max_len = ceiling;
    } else {
        config.max_len = std::min(*options.max_len, ceiling);
    }

    if (config.max_len < 1) {
        throw std::invalid_argument("max_len must be greater or equal to one");
    }
    if (config.min_len > config.max_len) {
        throw std::invalid_argument("min_len must be lower than max_len: min_len=" +
                                    std::to_string(config.min_len) +
                                    ", max_len=" + std::to_string(config.max_len));
    }

    return config;
}

EngineConfigParseResult parse_engine_config(const std::string& json_str,
                                            const std::string& source_path) {
    EngineConfigParseResult result;
    result.config.source_path = source_path;

    try {
        auto j = nlohmann::json::parse(json_str);

        if (!j.is_object()) {
            result.error = "JSON must be an object";
            return result;
        }

        // $schema (REQUIRED)
        if (auto schema = get_string(j, "$schema")) {
            result.config.schema = trim(*schema);
        } else {
            result.error = "$schema missing";
            return result;
        }

        if (result.config.schema != PATHSAFE_CONFIG_SCHEMA) {
            result.error = std::string("$schema mismatch: expected ") + PATHSAFE_CONFIG_SCHEMA;
            return result;
        }

        auto& options = result.config.options;

        if (auto tag = get_string(j, "platform")) {
            auto platform = parse_platform(*tag);
            if (platform) {
                options.platform = *platform;
            } else {
                result.warnings.push_back("invalid_configuration:platform");
            }
        }

        // Non-positive lengths mean "use the default"
        if (auto min_len = get_integer(j, "min_len")) {
            options.min_len = *min_len > 0 ? static_cast<std::size_t>(*min_len) : 1;
        }

        if (auto max_len = get_integer(j, "max_len")) {
            if (*max_len > 0) {
                options.max_len = static_cast<std::size_t>(*max_len);
            }
        }

        if (auto check_reserved = get_bool(j, "check_reserved")) {
            options.check_reserved = *check_reserved;
        }

        if (auto replacement = get_string(j, "replacement")) {
            result.config.replacement = *replacement;
        }

        if (auto handler = get_string(j, "null_value_handler")) {
            auto strategy = parse_null_value_strategy(*handler);
            if (strategy) {
                result.config.null_value_strategy = *strategy;
            } else {
                result.warnings.push_back("invalid_configuration:null_value_handler");
            }
        }
        options.null_value_handler = get_null_value_handler(result.config.null_value_strategy);

        if (auto normalize = get_bool(j, "normalize")) {
            options.normalize = *normalize;
        }

        if (auto validate_after = get_bool(j, "validate_after_sanitize")) {
            options.validate_after_sanitize = *validate_after;
        }

        result.ok = true;
        return result;

    } catch (const nlohmann::json::parse_error& e) {
        result.error = std::string("parse error: ") + e.what();
        return result;
    } catch (const nlohmann::json::exception& e) {
        result.error = std::string("JSON error: ") + e.what();
        return result;
    }
}

} // namespace pathsafe
