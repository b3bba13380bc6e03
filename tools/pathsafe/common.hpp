/**
 * pathsafe CLI - Common utilities and types
 */

#pragma once

#include <pathsafe/json.hpp>
#include <pathsafe/pathsafe.hpp>

#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace pathsafe::cli {

// Exit status shared by all commands
constexpr int EXIT_ALL_VALID = 0;
constexpr int EXIT_INVALID = 1;
constexpr int EXIT_USAGE = 2;

/**
 * Global options available to all commands.
 */
struct GlobalOptions {
    std::string config;            // --config
    std::string platform;          // --platform
    std::string report;            // --report
    bool json = false;             // --json
    bool verbose = false;          // -v, --verbose
    bool quiet = false;            // -q, --quiet
};

/**
 * Per-command length and reserved-name flags. Unset values fall back to the
 * configuration file, then to the engine defaults.
 */
struct EngineFlags {
    std::optional<std::size_t> min_len;
    std::optional<std::size_t> max_len;
    bool no_check_reserved = false;
};

/**
 * Warning collector for accumulating warnings during command execution.
 * In JSON mode, warnings are collected and output at the end.
 * In text mode, warnings are printed immediately to stderr.
 */
struct WarningCollector {
    std::vector<std::string> warnings;
    bool json_mode = false;
    bool quiet = false;

    void add(const std::string& msg) {
        if (json_mode) {
            warnings.push_back(msg);
        } else if (!quiet) {
            std::cerr << "Warning: " << msg << std::endl;
        }
    }

    void clear() { warnings.clear(); }
    bool empty() const { return warnings.empty(); }

    nlohmann::json to_json() const {
        return nlohmann::json(warnings);
    }
};

inline WarningCollector& get_warning_collector() {
    static thread_local WarningCollector collector;
    return collector;
}

inline void init_warning_collector(bool json_mode, bool quiet) {
    auto& collector = get_warning_collector();
    collector.clear();
    collector.json_mode = json_mode;
    collector.quiet = quiet;
}

/**
 * Route engine debug logs by verbosity: warn by default, debug with
 * --verbose, errors only with --quiet.
 */
inline void configure_logging(const GlobalOptions& opts) {
    if (opts.quiet) {
        spdlog::set_level(spdlog::level::err);
    } else if (opts.verbose) {
        spdlog::set_level(spdlog::level::debug);
    } else {
        spdlog::set_level(spdlog::level::warn);
    }
}

/**
 * Output utilities.
 */
inline void print_error(const std::string& msg, bool json_mode) {
    if (json_mode) {
        nlohmann::json j;
        j["ok"] = false;
        j["error"] = msg;
        auto& collector = get_warning_collector();
        if (!collector.empty()) {
            j["warnings"] = collector.to_json();
        }
        std::cout << j.dump(2) << std::endl;
    } else {
        std::cerr << "Error: " << msg << std::endl;
    }
}

inline void print_warning(const std::string& msg) {
    get_warning_collector().add(msg);
}

inline void output_json(const nlohmann::json& j) {
    auto& collector = get_warning_collector();
    if (!collector.empty() && !j.contains("warnings")) {
        nlohmann::json output = j;
        output["warnings"] = collector.to_json();
        std::cout << output.dump(2) << std::endl;
    } else {
        std::cout << j.dump(2) << std::endl;
    }
}

inline std::optional<std::string> read_file(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return std::nullopt;
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

inline bool write_file(const std::string& path, const std::string& content) {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file) {
        return false;
    }
    file << content;
    return static_cast<bool>(file);
}

/**
 * Write the command result to --report when given.
 */
inline bool write_report(const GlobalOptions& opts, const nlohmann::json& j) {
    if (opts.report.empty()) {
        return true;
    }
    if (!write_file(opts.report, j.dump(2) + "\n")) {
        print_error("Failed to write report: " + opts.report, opts.json);
        return false;
    }
    spdlog::debug("report written to {}", opts.report);
    return true;
}

/**
 * Resolve engine settings.
 * Priority: command flags > --platform > --config file > engine defaults
 */
inline bool load_tool_config(const GlobalOptions& opts, EngineConfigFile& out) {
    out = EngineConfigFile{};

    if (!opts.config.empty()) {
        auto content = read_file(opts.config);
        if (!content) {
            print_error("Failed to read config: " + opts.config, opts.json);
            return false;
        }
        auto parsed = parse_engine_config(*content, opts.config);
        if (!parsed.ok) {
            print_error("Invalid config " + opts.config + ": " + parsed.error, opts.json);
            return false;
        }
        for (const auto& warning : parsed.warnings) {
            print_warning(warning);
        }
        out = parsed.config;
    }

    if (!opts.platform.empty()) {
        auto platform = parse_platform(opts.platform);
        if (!platform) {
            print_error("Unknown platform: " + opts.platform, opts.json);
            return false;
        }
        out.options.platform = *platform;
    }

    return true;
}

inline void apply_engine_flags(const EngineFlags& flags, EngineOptions& options) {
    if (flags.min_len) {
        options.min_len = *flags.min_len;
    }
    if (flags.max_len) {
        options.max_len = *flags.max_len;
    }
    if (flags.no_check_reserved) {
        options.check_reserved = false;
    }
}

inline void add_engine_flags(CLI::App* app, EngineFlags& flags, bool with_min_len) {
    if (with_min_len) {
        app->add_option("--min-len", flags.min_len, "Minimum length");
    }
    app->add_option("--max-len", flags.max_len, "Maximum length (clamped to the platform limit)");
    app->add_flag("--no-check-reserved", flags.no_check_reserved, "Skip reserved-name checks");
}

} // namespace pathsafe::cli
