/**
 * pathguard CLI - Common utilities and types
 */

#pragma once

#include "config.hpp"

#include <pathguard/error.hpp>
#include <pathguard/json.hpp>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <iostream>
#include <string>

namespace pathguard::cli {

// Exit codes
constexpr int kExitOk = 0;
constexpr int kExitViolation = 1;
constexpr int kExitUsage = 2;

// Portable getenv that avoids MSVC warnings
inline std::string safe_getenv(const char* name) {
#ifdef _WIN32
    char* buf = nullptr;
    size_t sz = 0;
    if (_dupenv_s(&buf, &sz, name) == 0 && buf != nullptr) {
        std::string result(buf);
        free(buf);
        return result;
    }
    return "";
#else
    const char* val = std::getenv(name);
    return val ? val : "";
#endif
}

/**
 * Global options available to all commands.
 */
struct GlobalOptions {
    bool json = false;             // --json
    bool verbose = false;          // -v, --verbose
    bool quiet = false;            // -q, --quiet
    std::string log_level;         // --log-level
    std::string config_path;       // --config

    ToolConfig config;             // loaded by init_command
};

/**
 * Output utilities.
 */
inline void output_json(const nlohmann::json& j) {
    // Untrusted input may not be valid UTF-8
    std::cout << j.dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << std::endl;
}

inline void print_error(const std::string& msg, bool json_mode) {
    if (json_mode) {
        nlohmann::json j;
        j["ok"] = false;
        j["error"] = msg;
        output_json(j);
    } else {
        std::cerr << "Error: " << msg << std::endl;
    }
}

inline void print_violation(const Violation& v, bool json_mode) {
    if (json_mode) {
        nlohmann::json j;
        j["ok"] = false;
        j["error"] = violation_to_json(v);
        output_json(j);
    } else {
        std::cerr << "Rejected (" << violation_kind_to_string(v.kind) << "): "
                  << format_violation(v) << std::endl;
    }
}

/**
 * Load configuration and set up logging. Call first in every command.
 * Returns false (after reporting) on a configuration error.
 */
inline bool init_command(GlobalOptions& opts) {
    std::string config_path = opts.config_path;
    if (config_path.empty()) {
        config_path = safe_getenv("PATHGUARD_CONFIG");
    }

    if (!config_path.empty()) {
        auto loaded = load_tool_config(config_path);
        if (!loaded.ok) {
            print_error(loaded.error, opts.json);
            return false;
        }
        opts.config = loaded.value;
        if (!opts.json && opts.config.json) {
            opts.json = *opts.config.json;
        }
    }

    auto level = resolve_log_level(opts.log_level, opts.verbose, opts.quiet, opts.config,
                                   safe_getenv("PATHGUARD_LOG_LEVEL"));
    if (!level) {
        print_error("unknown log level", opts.json);
        return false;
    }
    spdlog::set_level(*level);
    return true;
}

} // namespace pathguard::cli
