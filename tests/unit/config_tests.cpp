#include <doctest/doctest.h>
#include "config.hpp"

#include <cstdio>
#include <filesystem>
#include <fstream>

using namespace pathguard::cli;

// ============================================================================
// Log Level Parsing
// ============================================================================

TEST_CASE("parse_log_level accepts spdlog level names") {
    CHECK(parse_log_level("trace") == spdlog::level::trace);
    CHECK(parse_log_level("DEBUG") == spdlog::level::debug);
    CHECK(parse_log_level("Info") == spdlog::level::info);
    CHECK(parse_log_level("warn") == spdlog::level::warn);
    CHECK(parse_log_level("warning") == spdlog::level::warn);
    CHECK(parse_log_level("error") == spdlog::level::err);
    CHECK(parse_log_level("critical") == spdlog::level::critical);
    CHECK(parse_log_level("off") == spdlog::level::off);
    CHECK_FALSE(parse_log_level("loud").has_value());
    CHECK_FALSE(parse_log_level("").has_value());
}

// ============================================================================
// Config File Parsing
// ============================================================================

TEST_CASE("parse_tool_config reads known keys") {
    auto r = parse_tool_config(R"({"log_level": "info", "json": true, "root": "/srv/repo"})",
                               "test.json");
    REQUIRE(r.ok);
    CHECK(r.value.log_level == std::optional<std::string>("info"));
    CHECK(r.value.json == std::optional<bool>(true));
    CHECK(r.value.root == std::optional<std::string>("/srv/repo"));
}

TEST_CASE("parse_tool_config leaves absent keys unset and ignores unknown ones") {
    auto r = parse_tool_config(R"({"color": "always"})", "test.json");
    REQUIRE(r.ok);
    CHECK_FALSE(r.value.log_level.has_value());
    CHECK_FALSE(r.value.json.has_value());
    CHECK_FALSE(r.value.root.has_value());
}

TEST_CASE("parse_tool_config reports errors with the source") {
    SUBCASE("malformed JSON") {
        auto r = parse_tool_config("{not json", "bad.json");
        CHECK_FALSE(r.ok);
        CHECK(r.error.find("bad.json") == 0);
    }
    SUBCASE("not an object") {
        CHECK_FALSE(parse_tool_config("[1, 2]", "x").ok);
    }
    SUBCASE("wrong types") {
        CHECK_FALSE(parse_tool_config(R"({"json": "yes"})", "x").ok);
        CHECK_FALSE(parse_tool_config(R"({"root": 5})", "x").ok);
        CHECK_FALSE(parse_tool_config(R"({"log_level": 1})", "x").ok);
    }
    SUBCASE("unknown log level") {
        auto r = parse_tool_config(R"({"log_level": "chatty"})", "x");
        CHECK_FALSE(r.ok);
        CHECK(r.error.find("chatty") != std::string::npos);
    }
}

TEST_CASE("load_tool_config reads a file") {
    auto path = std::filesystem::temp_directory_path() / "pathguard_config_test.json";
    {
        std::ofstream out(path);
        out << R"({"json": true})";
    }
    auto r = load_tool_config(path.string());
    std::filesystem::remove(path);

    REQUIRE(r.ok);
    CHECK(r.value.json == std::optional<bool>(true));
}

TEST_CASE("load_tool_config fails for a missing file") {
    auto r = load_tool_config("/no/such/pathguard.json");
    CHECK_FALSE(r.ok);
    CHECK(r.error.find("cannot open config file") == 0);
}

// ============================================================================
// Resolution Priority
// ============================================================================

TEST_CASE("resolve_log_level priority") {
    ToolConfig config;
    config.log_level = "info";

    SUBCASE("default is warn") {
        CHECK(resolve_log_level("", false, false, ToolConfig{}, "") == spdlog::level::warn);
    }
    SUBCASE("env applies when nothing else is set") {
        CHECK(resolve_log_level("", false, false, ToolConfig{}, "debug") == spdlog::level::debug);
    }
    SUBCASE("config beats env") {
        CHECK(resolve_log_level("", false, false, config, "debug") == spdlog::level::info);
    }
    SUBCASE("flag beats config") {
        CHECK(resolve_log_level("error", false, false, config, "debug") == spdlog::level::err);
    }
    SUBCASE("verbose and quiet beat everything") {
        CHECK(resolve_log_level("error", true, false, config, "") == spdlog::level::debug);
        CHECK(resolve_log_level("trace", false, true, config, "") == spdlog::level::err);
    }
    SUBCASE("invalid flag value") {
        CHECK_FALSE(resolve_log_level("nope", false, false, config, "").has_value());
    }
}
