/**
 * pathsafe CLI - validate-filename / validate-filepath commands
 *
 * Check each argument against the platform rules without changing it.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

#include <functional>
#include <stdexcept>

namespace pathsafe::cli::commands {

namespace {

struct ValidateOptions {
    std::vector<std::string> values;
    EngineFlags flags;
};

int cmd_validate(const GlobalOptions& opts, const ValidateOptions& validate_opts, PathKind kind) {
    init_warning_collector(opts.json, opts.quiet);
    configure_logging(opts);

    EngineConfigFile config;
    if (!load_tool_config(opts, config)) {
        return EXIT_USAGE;
    }
    EngineOptions options = config.options;
    apply_engine_flags(validate_opts.flags, options);

    nlohmann::json results = nlohmann::json::array();
    bool all_valid = true;
    Platform platform = Platform::Universal;

    try {
        std::function<Result<void>(const std::string&)> validate;
        if (kind == PathKind::Filename) {
            FileNameValidator validator(options);
            platform = validator.platform();
            validate = [validator](const std::string& v) { return validator.validate(v); };
        } else {
            FilePathValidator validator(options);
            platform = validator.platform();
            validate = [validator](const std::string& v) { return validator.validate(v); };
        }

        for (const auto& value : validate_opts.values) {
            auto result = validate(value);
            nlohmann::json entry;
            entry["input"] = value;
            entry["valid"] = result.isOk();
            if (result.isErr()) {
                all_valid = false;
                entry["error"] = result.error();
                if (!opts.json && !opts.quiet) {
                    std::cout << "invalid  " << value << "  " << result.error().toString()
                              << std::endl;
                }
            } else if (!opts.json && !opts.quiet) {
                std::cout << "valid    " << value << std::endl;
            }
            results.push_back(entry);
        }
    } catch (const std::invalid_argument& e) {
        print_error(e.what(), opts.json);
        return EXIT_USAGE;
    }

    nlohmann::json j;
    j["ok"] = all_valid;
    j["platform"] = platform_to_string(platform);
    j["results"] = results;

    if (opts.json) {
        output_json(j);
    }
    if (!write_report(opts, j)) {
        return EXIT_USAGE;
    }

    return all_valid ? EXIT_ALL_VALID : EXIT_INVALID;
}

} // anonymous namespace

void setup_validate_filename(CLI::App* app, GlobalOptions& opts) {
    static ValidateOptions validate_opts;

    app->add_option("names", validate_opts.values, "Filenames to check")->required();
    add_engine_flags(app, validate_opts.flags, true);

    app->callback([&opts]() {
        std::exit(cmd_validate(opts, validate_opts, PathKind::Filename));
    });
}

void setup_validate_filepath(CLI::App* app, GlobalOptions& opts) {
    static ValidateOptions validate_opts;

    app->add_option("paths", validate_opts.values, "File paths to check")->required();
    add_engine_flags(app, validate_opts.flags, true);

    app->callback([&opts]() {
        std::exit(cmd_validate(opts, validate_opts, PathKind::Filepath));
    });
}

} // namespace pathsafe::cli::commands
