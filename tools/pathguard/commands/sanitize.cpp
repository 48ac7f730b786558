/**
 * pathguard CLI - sanitize command
 *
 * Turn an untrusted path into a safe relative path.
 */

#include "../common.hpp"
#include <pathguard/sanitize.hpp>
#include <CLI/CLI.hpp>

namespace pathguard::cli::commands {

namespace {

struct SanitizeOptions {
    std::string path;
};

int cmd_sanitize(GlobalOptions& opts, const SanitizeOptions& san_opts) {
    if (!init_command(opts)) return kExitUsage;

    auto result = sanitize_directory_file_path(san_opts.path);
    if (!result.ok) {
        print_violation(result.error, opts.json);
        return kExitViolation;
    }

    if (opts.json) {
        output_json(result_to_json(result));
    } else {
        std::cout << result.value << std::endl;
    }
    return kExitOk;
}

} // namespace

void setup_sanitize(CLI::App* app, GlobalOptions& opts) {
    static SanitizeOptions san_opts;

    app->add_option("path", san_opts.path, "Untrusted path")->required();

    app->callback([&opts]() {
        std::exit(cmd_sanitize(opts, san_opts));
    });
}

} // namespace pathguard::cli::commands
