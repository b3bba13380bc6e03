/**
 * pathsafe CLI - profile command
 *
 * Show the rule set applied for a platform.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

#include <cstdio>

namespace pathsafe::cli::commands {

namespace {

std::string describe_chars(const std::string& chars) {
    std::string out;
    for (char c : chars) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (!out.empty()) out += ' ';
        if (uc < 0x20 || uc == 0x7F) {
            char buf[8];
            std::snprintf(buf, sizeof(buf), "\\x%02x", uc);
            out += buf;
        } else {
            out += c;
        }
    }
    return out;
}

std::string join(const std::vector<std::string>& items) {
    std::string out;
    for (const auto& item : items) {
        if (!out.empty()) out += ", ";
        out += item;
    }
    return out.empty() ? "(none)" : out;
}

int cmd_profile(const GlobalOptions& opts) {
    init_warning_collector(opts.json, opts.quiet);
    configure_logging(opts);

    EngineConfigFile config;
    if (!load_tool_config(opts, config)) {
        return EXIT_USAGE;
    }

    auto profile = make_platform_profile(config.options.platform.value_or(Platform::Universal));
    nlohmann::json j = profile;

    if (opts.json) {
        output_json(j);
    } else {
        std::cout << "Platform: " << platform_to_string(profile.platform) << std::endl;
        std::cout << "Max path length: " << profile.max_path_len << std::endl;
        std::cout << "Max filename length: " << profile.max_filename_len << std::endl;
        std::cout << "Invalid path characters: " << describe_chars(profile.invalid_path_chars)
                  << std::endl;
        std::cout << "Invalid filename characters: "
                  << describe_chars(profile.invalid_filename_chars) << std::endl;
        std::cout << "Reserved filenames: " << join(profile.reserved_filenames) << std::endl;
        std::cout << "Reserved path tokens: " << join(profile.reserved_path_tokens) << std::endl;
        std::cout << "NTFS metafiles reserved: " << (profile.ntfs_reserved ? "yes" : "no")
                  << std::endl;
        std::cout << "Trailing space/period forbidden: "
                  << (profile.forbid_trailing_space_period ? "yes" : "no") << std::endl;
        std::cout << "Drive prefixes: " << (profile.split_nt_drive ? "yes" : "no") << std::endl;
        std::cout << "Separator: " << profile.path_separator << std::endl;
    }

    if (!write_report(opts, j)) {
        return EXIT_USAGE;
    }
    return EXIT_ALL_VALID;
}

} // anonymous namespace

void setup_profile(CLI::App* app, GlobalOptions& opts) {
    app->callback([&opts]() {
        std::exit(cmd_profile(opts));
    });
}

} // namespace pathsafe::cli::commands
