/**
 * pathguard CLI - check command
 *
 * Validate a path without modifying it.
 */

#include "../common.hpp"
#include <pathguard/validate.hpp>
#include <CLI/CLI.hpp>

namespace pathguard::cli::commands {

namespace {

struct CheckOptions {
    std::string path;
};

int cmd_check(GlobalOptions& opts, const CheckOptions& check_opts) {
    if (!init_command(opts)) return kExitUsage;

    auto result = validate_path(check_opts.path);
    if (!result.ok) {
        print_violation(result.error, opts.json);
        return kExitViolation;
    }

    if (opts.json) {
        output_json(result_to_json(result));
    } else if (!opts.quiet) {
        std::cout << "safe: " << check_opts.path << std::endl;
    }
    return kExitOk;
}

} // namespace

void setup_check(CLI::App* app, GlobalOptions& opts) {
    static CheckOptions check_opts;

    app->add_option("path", check_opts.path, "Path to validate")->required();

    app->callback([&opts]() {
        std::exit(cmd_check(opts, check_opts));
    });
}

} // namespace pathguard::cli::commands
