/**
 * @file pathguard_c_api.cpp
 * @brief pathguard C API Implementation
 *
 * All C++ exceptions are caught at the boundary and converted to
 * error codes.
 */

#include "pathguard/pathguard.h"
#include "pathguard/normalize.hpp"
#include "pathguard/sanitize.hpp"
#include "pathguard/validate.hpp"

#include <cstdlib>
#include <cstring>
#include <exception>
#include <string>

// Version is passed in by the build
#ifndef PATHGUARD_VERSION_STRING
#define PATHGUARD_VERSION_STRING "unknown"
#endif

// ============================================================================
// Thread-Local Error State
// ============================================================================

namespace {

thread_local std::string g_last_error;
thread_local std::string g_last_error_component;
thread_local PathguardStatus g_last_error_code = PATHGUARD_OK;

void set_error(PathguardStatus code, const std::string& message) {
    g_last_error_code = code;
    g_last_error = message;
    g_last_error_component.clear();
}

void clear_error() {
    g_last_error_code = PATHGUARD_OK;
    g_last_error.clear();
    g_last_error_component.clear();
}

PathguardStatus map_violation_kind(pathguard::ViolationKind kind) {
    switch (kind) {
        case pathguard::ViolationKind::Empty:
            return PATHGUARD_ERROR_EMPTY;
        case pathguard::ViolationKind::Traversal:
            return PATHGUARD_ERROR_TRAVERSAL;
        case pathguard::ViolationKind::InvalidCharacters:
            return PATHGUARD_ERROR_INVALID_CHARACTERS;
        case pathguard::ViolationKind::ReservedName:
            return PATHGUARD_ERROR_RESERVED_NAME;
        case pathguard::ViolationKind::DriveLetter:
            return PATHGUARD_ERROR_DRIVE_LETTER;
        case pathguard::ViolationKind::ConstructionFailed:
            return PATHGUARD_ERROR_CONSTRUCTION_FAILED;
        case pathguard::ViolationKind::Io:
            return PATHGUARD_ERROR_IO;
        default:
            return PATHGUARD_ERROR_INTERNAL;
    }
}

PathguardStatus set_violation(const pathguard::Violation& v) {
    set_error(map_violation_kind(v.kind), pathguard::format_violation(v));
    g_last_error_component = v.component;
    return g_last_error_code;
}

// Duplicate a string for returning to C caller (caller must free)
char* duplicate_string(const std::string& s) {
    char* result = static_cast<char*>(malloc(s.size() + 1));
    if (result) {
        memcpy(result, s.c_str(), s.size() + 1);
    } else {
        set_error(PATHGUARD_ERROR_INTERNAL, "out of memory");
    }
    return result;
}

char* sanitize_to_c(const std::string& path) {
    try {
        auto result = pathguard::sanitize_directory_file_path(path);
        if (!result.ok) {
            set_violation(result.error);
            return nullptr;
        }
        return duplicate_string(result.value);
    } catch (const std::exception& e) {
        set_error(PATHGUARD_ERROR_INTERNAL, e.what());
        return nullptr;
    } catch (...) {
        set_error(PATHGUARD_ERROR_INTERNAL, "unknown error");
        return nullptr;
    }
}

} // namespace

extern "C" {

// ============================================================================
// API Version
// ============================================================================

PATHGUARD_CAPI int32_t pathguard_abi_version(void) {
    return PATHGUARD_ABI_VERSION;
}

PATHGUARD_CAPI const char* pathguard_version_string(void) {
    return PATHGUARD_VERSION_STRING;
}

// ============================================================================
// Error Handling
// ============================================================================

PATHGUARD_CAPI const char* pathguard_get_last_error(void) {
    return g_last_error.c_str();
}

PATHGUARD_CAPI PathguardStatus pathguard_get_last_error_code(void) {
    return g_last_error_code;
}

PATHGUARD_CAPI const char* pathguard_get_last_error_component(void) {
    return g_last_error_component.c_str();
}

PATHGUARD_CAPI void pathguard_clear_error(void) {
    clear_error();
}

// ============================================================================
// Memory Management
// ============================================================================

PATHGUARD_CAPI void pathguard_free_string(char* str) {
    free(str);
}

// ============================================================================
// Normalization
// ============================================================================

PATHGUARD_CAPI char* pathguard_normalize(const char* path) {
    clear_error();

    if (!path) {
        set_error(PATHGUARD_ERROR_INVALID_ARGUMENT, "path is NULL");
        return nullptr;
    }

    try {
        return duplicate_string(pathguard::normalize_path_str(path));
    } catch (const std::exception& e) {
        set_error(PATHGUARD_ERROR_INTERNAL, e.what());
        return nullptr;
    } catch (...) {
        set_error(PATHGUARD_ERROR_INTERNAL, "unknown error");
        return nullptr;
    }
}

PATHGUARD_CAPI char* pathguard_join_and_normalize(const char* base, const char* path) {
    clear_error();

    if (!base || !path) {
        set_error(PATHGUARD_ERROR_INVALID_ARGUMENT, !base ? "base is NULL" : "path is NULL");
        return nullptr;
    }

    try {
        return duplicate_string(pathguard::join_and_normalize(base, path).string());
    } catch (const std::exception& e) {
        set_error(PATHGUARD_ERROR_INTERNAL, e.what());
        return nullptr;
    } catch (...) {
        set_error(PATHGUARD_ERROR_INTERNAL, "unknown error");
        return nullptr;
    }
}

// ============================================================================
// Validation
// ============================================================================

PATHGUARD_CAPI int32_t pathguard_is_safe_path(const char* path) {
    clear_error();

    if (!path) {
        set_error(PATHGUARD_ERROR_INVALID_ARGUMENT, "path is NULL");
        return 0;
    }

    try {
        return pathguard::is_safe_path(path) ? 1 : 0;
    } catch (const std::exception& e) {
        set_error(PATHGUARD_ERROR_INTERNAL, e.what());
        return 0;
    } catch (...) {
        set_error(PATHGUARD_ERROR_INTERNAL, "unknown error");
        return 0;
    }
}

PATHGUARD_CAPI PathguardStatus pathguard_validate_path(const char* path) {
    clear_error();

    if (!path) {
        set_error(PATHGUARD_ERROR_INVALID_ARGUMENT, "path is NULL");
        return PATHGUARD_ERROR_INVALID_ARGUMENT;
    }

    try {
        auto result = pathguard::validate_path(path);
        if (!result.ok) {
            return set_violation(result.error);
        }
        return PATHGUARD_OK;
    } catch (const std::exception& e) {
        set_error(PATHGUARD_ERROR_INTERNAL, e.what());
        return PATHGUARD_ERROR_INTERNAL;
    } catch (...) {
        set_error(PATHGUARD_ERROR_INTERNAL, "unknown error");
        return PATHGUARD_ERROR_INTERNAL;
    }
}

// ============================================================================
// Sanitization
// ============================================================================

PATHGUARD_CAPI char* pathguard_sanitize(const char* path) {
    clear_error();

    if (!path) {
        set_error(PATHGUARD_ERROR_INVALID_ARGUMENT, "path is NULL");
        return nullptr;
    }
    return sanitize_to_c(std::string(path));
}

PATHGUARD_CAPI char* pathguard_sanitize_n(const char* data, size_t len) {
    clear_error();

    if (!data && len > 0) {
        set_error(PATHGUARD_ERROR_INVALID_ARGUMENT, "data is NULL");
        return nullptr;
    }
    return sanitize_to_c(len > 0 ? std::string(data, len) : std::string());
}

PATHGUARD_CAPI char* pathguard_safe_join(const char* root, const char* target, const char* path) {
    clear_error();

    if (!root) {
        set_error(PATHGUARD_ERROR_INVALID_ARGUMENT, "root is NULL");
        return nullptr;
    }
    if (!path) {
        set_error(PATHGUARD_ERROR_INVALID_ARGUMENT, "path is NULL");
        return nullptr;
    }

    try {
        auto result = pathguard::safe_repository_join(root, target ? target : "", path);
        if (!result.ok) {
            set_violation(result.error);
            return nullptr;
        }
        return duplicate_string(result.value.string());
    } catch (const std::exception& e) {
        set_error(PATHGUARD_ERROR_INTERNAL, e.what());
        return nullptr;
    } catch (...) {
        set_error(PATHGUARD_ERROR_INTERNAL, "unknown error");
        return nullptr;
    }
}

} // extern "C"
