/**
 * pathsafe CLI - sanitize-filename / sanitize-filepath commands
 *
 * Rewrite each argument into a name or path that passes validation.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

#include <functional>
#include <stdexcept>

namespace pathsafe::cli::commands {

namespace {

struct SanitizeOptions {
    std::vector<std::string> values;
    EngineFlags flags;
    std::optional<std::string> replacement;
    std::string null_handler;
    bool validate_after = false;
    bool no_normalize = false;
};

int cmd_sanitize(const GlobalOptions& opts, const SanitizeOptions& sanitize_opts, PathKind kind) {
    init_warning_collector(opts.json, opts.quiet);
    configure_logging(opts);

    EngineConfigFile config;
    if (!load_tool_config(opts, config)) {
        return EXIT_USAGE;
    }

    SanitizerOptions options = config.options;
    apply_engine_flags(sanitize_opts.flags, options);
    if (!sanitize_opts.null_handler.empty()) {
        auto strategy = parse_null_value_strategy(sanitize_opts.null_handler);
        if (!strategy) {
            print_error("Unknown null value handler: " + sanitize_opts.null_handler, opts.json);
            return EXIT_USAGE;
        }
        options.null_value_handler = get_null_value_handler(*strategy);
    }
    if (sanitize_opts.validate_after) {
        options.validate_after_sanitize = true;
    }
    if (sanitize_opts.no_normalize) {
        options.normalize = false;
    }
    std::string replacement = sanitize_opts.replacement.value_or(config.replacement);

    nlohmann::json results = nlohmann::json::array();
    bool all_sanitized = true;
    Platform platform = Platform::Universal;

    try {
        std::function<Result<std::string>(const std::string&)> sanitize;
        if (kind == PathKind::Filename) {
            FileNameSanitizer sanitizer(options);
            platform = sanitizer.platform();
            sanitize = [sanitizer, replacement](const std::string& v) {
                return sanitizer.sanitize(v, replacement);
            };
        } else {
            FilePathSanitizer sanitizer(options);
            platform = sanitizer.platform();
            sanitize = [sanitizer, replacement](const std::string& v) {
                return sanitizer.sanitize(v, replacement);
            };
        }

        for (const auto& value : sanitize_opts.values) {
            auto result = sanitize(value);
            nlohmann::json entry;
            entry["input"] = value;
            if (result.isErr()) {
                all_sanitized = false;
                entry["error"] = result.error();
                if (!opts.json) {
                    std::cerr << "Error: " << value << ": " << result.error().toString()
                              << std::endl;
                }
            } else {
                entry["output"] = result.value();
                entry["changed"] = result.value() != value;
                if (!opts.json) {
                    std::cout << result.value() << std::endl;
                }
            }
            results.push_back(entry);
        }
    } catch (const std::invalid_argument& e) {
        print_error(e.what(), opts.json);
        return EXIT_USAGE;
    }

    nlohmann::json j;
    j["ok"] = all_sanitized;
    j["platform"] = platform_to_string(platform);
    j["replacement"] = replacement;
    j["results"] = results;

    if (opts.json) {
        output_json(j);
    }
    if (!write_report(opts, j)) {
        return EXIT_USAGE;
    }

    return all_sanitized ? EXIT_ALL_VALID : EXIT_INVALID;
}

void add_sanitize_flags(CLI::App* app, SanitizeOptions& sanitize_opts) {
    add_engine_flags(app, sanitize_opts.flags, false);
    app->add_option("-r,--replacement", sanitize_opts.replacement,
                    "Text that replaces each invalid character");
    app->add_option("--null-handler", sanitize_opts.null_handler,
                    "What an emptied value becomes")
        ->check(CLI::IsMember({"empty", "raise", "timestamp"}, CLI::ignore_case));
    app->add_flag("--validate-after", sanitize_opts.validate_after,
                  "Re-validate the result and report any failure");
}

} // anonymous namespace

void setup_sanitize_filename(CLI::App* app, GlobalOptions& opts) {
    static SanitizeOptions sanitize_opts;

    app->add_option("names", sanitize_opts.values, "Filenames to sanitize")->required();
    add_sanitize_flags(app, sanitize_opts);

    app->callback([&opts]() {
        std::exit(cmd_sanitize(opts, sanitize_opts, PathKind::Filename));
    });
}

void setup_sanitize_filepath(CLI::App* app, GlobalOptions& opts) {
    static SanitizeOptions sanitize_opts;

    app->add_option("paths", sanitize_opts.values, "File paths to sanitize")->required();
    add_sanitize_flags(app, sanitize_opts);
    app->add_flag("--no-normalize", sanitize_opts.no_normalize,
                  "Keep '.', '..' and repeated separators");

    app->callback([&opts]() {
        std::exit(cmd_sanitize(opts, sanitize_opts, PathKind::Filepath));
    });
}

} // namespace pathsafe::cli::commands
