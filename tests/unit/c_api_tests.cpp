/**
 * @file c_api_tests.cpp
 * @brief Tests for the pathguard C API
 *
 * NULL safety, status mapping, thread-local error state and memory
 * ownership of returned strings.
 */

#include <doctest/doctest.h>
#include <pathguard/pathguard.h>

#include <cstring>
#include <filesystem>
#include <string>
#include <thread>

// =============================================================================
// Version Tests
// =============================================================================

TEST_CASE("C API: pathguard_abi_version returns correct version") {
    CHECK(pathguard_abi_version() == PATHGUARD_ABI_VERSION);
}

TEST_CASE("C API: pathguard_version_string returns non-empty string") {
    const char* version = pathguard_version_string();
    REQUIRE(version != nullptr);
    CHECK(strlen(version) > 0);
}

// =============================================================================
// Error Handling Tests
// =============================================================================

TEST_CASE("C API: error handling") {
    SUBCASE("initial state has no error") {
        pathguard_clear_error();
        CHECK(pathguard_get_last_error_code() == PATHGUARD_OK);
        CHECK(strlen(pathguard_get_last_error()) == 0);
    }

    SUBCASE("NULL path sets error") {
        CHECK(pathguard_sanitize(nullptr) == nullptr);
        CHECK(pathguard_get_last_error_code() == PATHGUARD_ERROR_INVALID_ARGUMENT);
        CHECK(strlen(pathguard_get_last_error()) > 0);
    }

    SUBCASE("clear_error resets state") {
        pathguard_sanitize(nullptr);
        pathguard_clear_error();
        CHECK(pathguard_get_last_error_code() == PATHGUARD_OK);
    }

    SUBCASE("successful call clears a previous error") {
        pathguard_sanitize("../x");
        CHECK(pathguard_get_last_error_code() == PATHGUARD_ERROR_TRAVERSAL);
        char* ok = pathguard_sanitize("x");
        CHECK(pathguard_get_last_error_code() == PATHGUARD_OK);
        pathguard_free_string(ok);
    }
}

TEST_CASE("C API: last error is thread-local") {
    pathguard_sanitize("../x");
    REQUIRE(pathguard_get_last_error_code() == PATHGUARD_ERROR_TRAVERSAL);

    PathguardStatus other = PATHGUARD_ERROR_INTERNAL;
    std::thread t([&other]() { other = pathguard_get_last_error_code(); });
    t.join();

    CHECK(other == PATHGUARD_OK);
    CHECK(pathguard_get_last_error_code() == PATHGUARD_ERROR_TRAVERSAL);
}

TEST_CASE("C API: free NULL is safe") {
    pathguard_free_string(nullptr);
}

// =============================================================================
// Normalization
// =============================================================================

TEST_CASE("C API: normalize") {
    char* s = pathguard_normalize("a//b\\c");
    REQUIRE(s != nullptr);
    CHECK(std::string(s) == "a/b/c");
    pathguard_free_string(s);

    char* j = pathguard_join_and_normalize("source/", "/main.rs");
    REQUIRE(j != nullptr);
    CHECK(std::string(j) == "source/main.rs");
    pathguard_free_string(j);

    CHECK(pathguard_join_and_normalize(nullptr, "x") == nullptr);
    CHECK(pathguard_get_last_error_code() == PATHGUARD_ERROR_INVALID_ARGUMENT);
}

// =============================================================================
// Validation
// =============================================================================

TEST_CASE("C API: validation maps each violation kind") {
    CHECK(pathguard_is_safe_path("safe/file.txt") == 1);
    CHECK(pathguard_is_safe_path("../etc") == 0);
    CHECK(pathguard_is_safe_path(nullptr) == 0);

    CHECK(pathguard_validate_path("safe/file.txt") == PATHGUARD_OK);
    CHECK(pathguard_validate_path("  ") == PATHGUARD_ERROR_EMPTY);
    CHECK(pathguard_validate_path("a/../b") == PATHGUARD_ERROR_TRAVERSAL);
    CHECK(pathguard_validate_path("a<b") == PATHGUARD_ERROR_INVALID_CHARACTERS);
    CHECK(pathguard_validate_path("lpt1.txt") == PATHGUARD_ERROR_RESERVED_NAME);
    CHECK(std::string(pathguard_get_last_error_component()) == "lpt1.txt");
    CHECK(pathguard_validate_path(nullptr) == PATHGUARD_ERROR_INVALID_ARGUMENT);
}

// =============================================================================
// Sanitization
// =============================================================================

TEST_CASE("C API: sanitize") {
    char* s = pathguard_sanitize("/args.js");
    REQUIRE(s != nullptr);
    CHECK(std::string(s) == "args.js");
    pathguard_free_string(s);

    CHECK(pathguard_sanitize("CON") == nullptr);
    CHECK(pathguard_get_last_error_code() == PATHGUARD_ERROR_RESERVED_NAME);
    CHECK(std::string(pathguard_get_last_error()).find("CON") != std::string::npos);
}

TEST_CASE("C API: sanitize_n sees embedded NUL bytes") {
    const char data[] = {'f', 'i', 'l', 'e', '\0', 'x'};
    CHECK(pathguard_sanitize_n(data, sizeof(data)) == nullptr);
    CHECK(pathguard_get_last_error_code() == PATHGUARD_ERROR_INVALID_CHARACTERS);

    CHECK(pathguard_sanitize_n(nullptr, 0) == nullptr);
    CHECK(pathguard_get_last_error_code() == PATHGUARD_ERROR_EMPTY);

    CHECK(pathguard_sanitize_n(nullptr, 4) == nullptr);
    CHECK(pathguard_get_last_error_code() == PATHGUARD_ERROR_INVALID_ARGUMENT);
}

TEST_CASE("C API: safe_join") {
    auto root = std::filesystem::temp_directory_path();
    auto expected = std::filesystem::canonical(root) / "testing" / "framework" / "args.js";

    char* p = pathguard_safe_join(root.string().c_str(), "testing/framework", "/args.js");
    REQUIRE(p != nullptr);
    CHECK(std::string(p) == expected.string());
    pathguard_free_string(p);

    char* no_target = pathguard_safe_join(root.string().c_str(), nullptr, "a.txt");
    REQUIRE(no_target != nullptr);
    pathguard_free_string(no_target);

    CHECK(pathguard_safe_join(root.string().c_str(), "t", "../../../etc/passwd") == nullptr);
    CHECK(pathguard_get_last_error_code() == PATHGUARD_ERROR_TRAVERSAL);

    CHECK(pathguard_safe_join("/no/such/root/anywhere", "t", "a.txt") == nullptr);
    CHECK(pathguard_get_last_error_code() == PATHGUARD_ERROR_IO);

    CHECK(pathguard_safe_join(nullptr, "t", "a.txt") == nullptr);
    CHECK(pathguard_get_last_error_code() == PATHGUARD_ERROR_INVALID_ARGUMENT);
}
