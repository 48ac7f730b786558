/**
 * pathguard CLI - Entry Point
 *
 * Command-line access to the pathguard library for scripts and diagnostics.
 */

#include <CLI/CLI.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include "common.hpp"

#ifndef PATHGUARD_VERSION_STRING
#define PATHGUARD_VERSION_STRING "unknown"
#endif

// Forward declarations for commands
namespace pathguard::cli::commands {
    void setup_normalize(CLI::App* app, GlobalOptions& opts);
    void setup_join_normalize(CLI::App* app, GlobalOptions& opts);
    void setup_check(CLI::App* app, GlobalOptions& opts);
    void setup_sanitize(CLI::App* app, GlobalOptions& opts);
    void setup_join(CLI::App* app, GlobalOptions& opts);
}

int main(int argc, char** argv) {
    using namespace pathguard::cli;

    // stdout is reserved for command output
    spdlog::set_default_logger(spdlog::stderr_color_mt("pathguard"));

    CLI::App app{"pathguard - untrusted path sanitization"};
    app.set_version_flag("-V,--version", PATHGUARD_VERSION_STRING);
    app.require_subcommand(0, 1);

    GlobalOptions opts;

    // Global options
    app.add_flag("--json", opts.json, "Machine-readable output");
    app.add_flag("-v,--verbose", opts.verbose, "Debug logging");
    app.add_flag("-q,--quiet", opts.quiet, "Errors only");
    app.add_option("--log-level", opts.log_level,
                   "trace, debug, info, warn, error, critical or off");
    app.add_option("--config", opts.config_path, "JSON config file");

    // Commands
    auto* normalize_cmd = app.add_subcommand("normalize", "Normalize path separators");
    commands::setup_normalize(normalize_cmd, opts);

    auto* join_normalize_cmd = app.add_subcommand("join-normalize", "Join two paths and normalize");
    commands::setup_join_normalize(join_normalize_cmd, opts);

    auto* check_cmd = app.add_subcommand("check", "Validate a path against the safety rules");
    commands::setup_check(check_cmd, opts);

    auto* sanitize_cmd = app.add_subcommand("sanitize", "Sanitize an untrusted path");
    commands::setup_sanitize(sanitize_cmd, opts);

    auto* join_cmd = app.add_subcommand("join", "Join an untrusted path under a trusted root");
    commands::setup_join(join_cmd, opts);

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        // --help and --version surface as Success
        int code = app.exit(e);
        return code == 0 ? kExitOk : kExitUsage;
    }

    // If no subcommand, show help
    if (app.get_subcommands().empty()) {
        std::cout << app.help() << std::endl;
    }

    return kExitOk;
}
