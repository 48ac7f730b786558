/**
 * pathguard CLI - join command
 *
 * Resolve an untrusted path under a trusted root directory.
 */

#include "../common.hpp"
#include <pathguard/sanitize.hpp>
#include <CLI/CLI.hpp>

namespace pathguard::cli::commands {

namespace {

struct JoinOptions {
    std::string root;
    std::string target;
    std::string path;
};

int cmd_join(GlobalOptions& opts, const JoinOptions& join_opts) {
    if (!init_command(opts)) return kExitUsage;

    // --root wins over the config file
    std::string root = join_opts.root;
    if (root.empty() && opts.config.root) {
        root = *opts.config.root;
    }
    if (root.empty()) {
        print_error("--root is required (or set \"root\" in the config file)", opts.json);
        return kExitUsage;
    }

    auto result = safe_repository_join(root, join_opts.target, join_opts.path);
    if (!result.ok) {
        print_violation(result.error, opts.json);
        return kExitViolation;
    }

    if (opts.json) {
        output_json(result_to_json(result));
    } else {
        std::cout << result.value.string() << std::endl;
    }
    return kExitOk;
}

} // namespace

void setup_join(CLI::App* app, GlobalOptions& opts) {
    static JoinOptions join_opts;

    app->add_option("--root", join_opts.root, "Trusted root directory (must exist)");
    app->add_option("--target", join_opts.target, "Trusted sub-directory under root");
    app->add_option("path", join_opts.path, "Untrusted path")->required();

    app->callback([&opts]() {
        std::exit(cmd_join(opts, join_opts));
    });
}

} // namespace pathguard::cli::commands
