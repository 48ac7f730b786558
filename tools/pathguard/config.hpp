/**
 * pathguard CLI - configuration
 *
 * Settings are resolved by priority:
 *   command-line flag > config file (--config or PATHGUARD_CONFIG)
 *   > PATHGUARD_LOG_LEVEL > built-in default
 */

#pragma once

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <optional>
#include <sstream>
#include <string>

namespace pathguard::cli {

/**
 * Contents of a pathguard JSON config file. Absent keys stay unset.
 *
 *   {"log_level": "info", "json": true, "root": "/srv/repo"}
 */
struct ToolConfig {
    std::optional<std::string> log_level;
    std::optional<bool> json;
    std::optional<std::string> root;
};

struct ConfigLoadResult {
    bool ok = false;
    std::string error;
    ToolConfig value;
};

inline std::optional<spdlog::level::level_enum> parse_log_level(const std::string& s) {
    std::string lower = s;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "trace") return spdlog::level::trace;
    if (lower == "debug") return spdlog::level::debug;
    if (lower == "info") return spdlog::level::info;
    if (lower == "warn" || lower == "warning") return spdlog::level::warn;
    if (lower == "error" || lower == "err") return spdlog::level::err;
    if (lower == "critical") return spdlog::level::critical;
    if (lower == "off") return spdlog::level::off;
    return std::nullopt;
}

inline ConfigLoadResult parse_tool_config(const std::string& content, const std::string& source) {
    ConfigLoadResult result;

    nlohmann::json j;
    try {
        j = nlohmann::json::parse(content);
    } catch (const nlohmann::json::parse_error& e) {
        result.error = source + ": " + e.what();
        return result;
    }

    if (!j.is_object()) {
        result.error = source + ": config must be a JSON object";
        return result;
    }

    // Unknown keys are ignored
    if (j.contains("log_level")) {
        if (!j["log_level"].is_string()) {
            result.error = source + ": log_level must be a string";
            return result;
        }
        auto level = j["log_level"].get<std::string>();
        if (!parse_log_level(level)) {
            result.error = source + ": unknown log_level '" + level + "'";
            return result;
        }
        result.value.log_level = level;
    }
    if (j.contains("json")) {
        if (!j["json"].is_boolean()) {
            result.error = source + ": json must be a boolean";
            return result;
        }
        result.value.json = j["json"].get<bool>();
    }
    if (j.contains("root")) {
        if (!j["root"].is_string()) {
            result.error = source + ": root must be a string";
            return result;
        }
        result.value.root = j["root"].get<std::string>();
    }

    result.ok = true;
    return result;
}

inline ConfigLoadResult load_tool_config(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        ConfigLoadResult result;
        result.error = "cannot open config file: " + path;
        return result;
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    return parse_tool_config(buffer.str(), path);
}

/**
 * Pick the effective log level.
 * --verbose and --quiet override everything else.
 */
inline std::optional<spdlog::level::level_enum> resolve_log_level(
    const std::string& flag_level,
    bool verbose,
    bool quiet,
    const ToolConfig& config,
    const std::string& env_level) {
    if (verbose) return spdlog::level::debug;
    if (quiet) return spdlog::level::err;
    if (!flag_level.empty()) return parse_log_level(flag_level);
    if (config.log_level) return parse_log_level(*config.log_level);
    if (!env_level.empty()) return parse_log_level(env_level);
    return spdlog::level::warn;
}

} // namespace pathguard::cli
