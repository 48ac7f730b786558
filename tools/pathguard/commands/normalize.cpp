/**
 * pathguard CLI - normalize and join-normalize commands
 *
 * Pure string transforms; these never fail on input.
 */

#include "../common.hpp"
#include <pathguard/normalize.hpp>
#include <CLI/CLI.hpp>

namespace pathguard::cli::commands {

namespace {

struct NormalizeOptions {
    std::string path;
};

struct JoinNormalizeOptions {
    std::string base;
    std::string path;
};

int cmd_normalize(GlobalOptions& opts, const NormalizeOptions& norm_opts) {
    if (!init_command(opts)) return kExitUsage;

    std::string normalized = normalize_path_str(norm_opts.path);
    spdlog::debug("normalize '{}' -> '{}'", norm_opts.path, normalized);

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = true;
        j["input"] = norm_opts.path;
        j["path"] = normalized;
        output_json(j);
    } else {
        std::cout << normalized << std::endl;
    }
    return kExitOk;
}

int cmd_join_normalize(GlobalOptions& opts, const JoinNormalizeOptions& join_opts) {
    if (!init_command(opts)) return kExitUsage;

    std::string joined = join_and_normalize(join_opts.base, join_opts.path).string();

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = true;
        j["path"] = joined;
        output_json(j);
    } else {
        std::cout << joined << std::endl;
    }
    return kExitOk;
}

} // namespace

void setup_normalize(CLI::App* app, GlobalOptions& opts) {
    static NormalizeOptions norm_opts;

    app->add_option("path", norm_opts.path, "Path to normalize")->required();

    app->callback([&opts]() {
        std::exit(cmd_normalize(opts, norm_opts));
    });
}

void setup_join_normalize(CLI::App* app, GlobalOptions& opts) {
    static JoinNormalizeOptions join_opts;

    app->add_option("base", join_opts.base, "Base path")->required();
    app->add_option("path", join_opts.path, "Path to append")->required();

    app->callback([&opts]() {
        std::exit(cmd_join_normalize(opts, join_opts));
    });
}

} // namespace pathguard::cli::commands
