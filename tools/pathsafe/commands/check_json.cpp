/**
 * pathsafe CLI - check-json command
 *
 * Validate every element of a JSON array as a file path. Elements that are
 * not strings are reported as INVALID_INPUT_TYPE, null as NULL_NAME.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

#include <stdexcept>

namespace pathsafe::cli::commands {

namespace {

struct CheckJsonOptions {
    std::string file;
    EngineFlags flags;
};

int cmd_check_json(const GlobalOptions& opts, const CheckJsonOptions& check_opts) {
    init_warning_collector(opts.json, opts.quiet);
    configure_logging(opts);

    EngineConfigFile config;
    if (!load_tool_config(opts, config)) {
        return EXIT_USAGE;
    }
    EngineOptions options = config.options;
    apply_engine_flags(check_opts.flags, options);

    auto content = read_file(check_opts.file);
    if (!content) {
        print_error("Failed to read " + check_opts.file, opts.json);
        return EXIT_USAGE;
    }

    nlohmann::json document;
    try {
        document = nlohmann::json::parse(*content);
    } catch (const nlohmann::json::parse_error& e) {
        print_error("Invalid JSON in " + check_opts.file + ": " + e.what(), opts.json);
        return EXIT_USAGE;
    }

    if (!document.is_array()) {
        print_error(check_opts.file + ": expected a JSON array", opts.json);
        return EXIT_USAGE;
    }

    nlohmann::json results = nlohmann::json::array();
    bool all_valid = true;

    try {
        // Built once so that bad options fail before any element is reported
        FilePathValidator validator(options);

        for (size_t i = 0; i < document.size(); ++i) {
            const auto& element = document[i];
            auto input = string_from_json(element, validator.platform());
            auto result = input.isErr() ? Result<void>::err(input.error())
                                        : validator.validate(input.value());

            nlohmann::json entry;
            entry["index"] = i;
            entry["input"] = element;
            entry["valid"] = result.isOk();
            if (result.isErr()) {
                all_valid = false;
                entry["error"] = result.error();
                if (!opts.json && !opts.quiet) {
                    std::cout << "[" << i << "] invalid  " << element.dump() << "  "
                              << result.error().toString() << std::endl;
                }
            } else if (!opts.json && !opts.quiet) {
                std::cout << "[" << i << "] valid    " << element.dump() << std::endl;
            }
            results.push_back(entry);
        }

        nlohmann::json j;
        j["ok"] = all_valid;
        j["file"] = check_opts.file;
        j["platform"] = platform_to_string(validator.platform());
        j["results"] = results;

        if (opts.json) {
            output_json(j);
        }
        if (!write_report(opts, j)) {
            return EXIT_USAGE;
        }
    } catch (const std::invalid_argument& e) {
        print_error(e.what(), opts.json);
        return EXIT_USAGE;
    }

    return all_valid ? EXIT_ALL_VALID : EXIT_INVALID;
}

} // anonymous namespace

void setup_check_json(CLI::App* app, GlobalOptions& opts) {
    static CheckJsonOptions check_opts;

    app->add_option("file", check_opts.file, "JSON file holding an array of paths")
        ->required()
        ->check(CLI::ExistingFile);
    add_engine_flags(app, check_opts.flags, true);

    app->callback([&opts]() {
        std::exit(cmd_check_json(opts, check_opts));
    });
}

} // namespace pathsafe::cli::commands
