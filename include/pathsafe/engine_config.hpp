#pragma once

#include "pathsafe/export.hpp"
#include "pathsafe/null_value_handler.hpp"
#include "pathsafe/platform.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace pathsafe {

// ============================================================================
// Engine Options (caller input)
// ============================================================================

struct EngineOptions {
    std::optional<Platform> platform;    // unset: Universal
    std::size_t min_len = 1;             // 0 is treated as 1
    std::optional<std::size_t> max_len;  // unset or 0: platform ceiling
    bool check_reserved = true;
};

struct SanitizerOptions : EngineOptions {
    NullValueHandler null_value_handler;  // unset: return_null_string
    bool normalize = true;                // file paths only
    bool validate_after_sanitize = false;
};

// ============================================================================
// Engine Configuration (resolved, immutable)
// ============================================================================

enum class PathKind {
    Filename,
    Filepath
};

struct EngineConfig {
    PathKind kind = PathKind::Filepath;
    Platform platform = Platform::Universal;
    std::size_t min_len = 1;
    std::size_t max_len = 260;
    bool check_reserved = true;
    PlatformProfile profile;
};

// Resolve options for a filename or file path engine.
// max_len is the platform ceiling when unset and is clamped to it otherwise.
// Throws std::invalid_argument when min_len > max_len.
PATHSAFE_API EngineConfig make_engine_config(const EngineOptions& options, PathKind kind);

// ============================================================================
// Configuration File
// ============================================================================

constexpr const char* PATHSAFE_CONFIG_SCHEMA = "pathsafe.config.v1";

struct EngineConfigFile {
    std::string schema;
    SanitizerOptions options;
    std::string replacement;
    NullValueStrategy null_value_strategy = NullValueStrategy::ReturnEmpty;
    std::string source_path;
};

struct EngineConfigParseResult {
    bool ok = false;
    std::string error;
    EngineConfigFile config;
    std::vector<std::string> warnings;
};

// Parse a configuration file from a JSON string
PATHSAFE_API EngineConfigParseResult parse_engine_config(const std::string& json_str,
                                                         const std::string& source_path = "");

} // namespace pathsafe
