/**
 * pathsafe CLI - Entry Point
 *
 * Validate and sanitize filenames and file paths from the command line.
 */

#include <CLI/CLI.hpp>
#include <pathsafe/cli11.hpp>
#include "common.hpp"

#ifndef PATHSAFE_VERSION
#define PATHSAFE_VERSION "0.0.0"
#endif

// Forward declarations for commands
namespace pathsafe::cli::commands {
    void setup_validate_filename(CLI::App* app, GlobalOptions& opts);
    void setup_validate_filepath(CLI::App* app, GlobalOptions& opts);
    void setup_sanitize_filename(CLI::App* app, GlobalOptions& opts);
    void setup_sanitize_filepath(CLI::App* app, GlobalOptions& opts);
    void setup_check_json(CLI::App* app, GlobalOptions& opts);
    void setup_profile(CLI::App* app, GlobalOptions& opts);
}

int main(int argc, char** argv) {
    using namespace pathsafe::cli;

    CLI::App app{"pathsafe - filename and file path validation"};
    app.set_version_flag("-V,--version", PATHSAFE_VERSION);
    app.require_subcommand(1);
    app.fallthrough();

    GlobalOptions opts;

    // Global options
    app.add_option("--config", opts.config, "Engine configuration file (JSON)")
        ->check(CLI::ExistingFile);
    app.add_option("--platform", opts.platform,
                   "Target platform: universal, posix, linux, windows, macos, auto");
    app.add_option("--report", opts.report, "Write the JSON result to FILE")
        ->check(pathsafe::cli11::FilepathValidator(
            [] {
                pathsafe::EngineOptions options;
                options.platform = pathsafe::get_current_platform();
                return options;
            }()));
    app.add_flag("--json", opts.json, "Machine-readable output");
    app.add_flag("-v,--verbose", opts.verbose, "Log rewrites and decisions");
    app.add_flag("-q,--quiet", opts.quiet, "Errors only");

    // Commands
    auto* validate_filename_cmd = app.add_subcommand("validate-filename", "Check filenames");
    commands::setup_validate_filename(validate_filename_cmd, opts);

    auto* validate_filepath_cmd = app.add_subcommand("validate-filepath", "Check file paths");
    commands::setup_validate_filepath(validate_filepath_cmd, opts);

    auto* sanitize_filename_cmd = app.add_subcommand("sanitize-filename", "Rewrite filenames");
    commands::setup_sanitize_filename(sanitize_filename_cmd, opts);

    auto* sanitize_filepath_cmd = app.add_subcommand("sanitize-filepath", "Rewrite file paths");
    commands::setup_sanitize_filepath(sanitize_filepath_cmd, opts);

    auto* check_json_cmd = app.add_subcommand("check-json", "Check a JSON array of paths");
    commands::setup_check_json(check_json_cmd, opts);

    auto* profile_cmd = app.add_subcommand("profile", "Show the rules for a platform");
    commands::setup_profile(profile_cmd, opts);

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        int rc = app.exit(e);
        return rc == 0 ? EXIT_ALL_VALID : EXIT_USAGE;
    }

    return EXIT_ALL_VALID;
}
