/**
 * @file pathguard.h
 * @brief pathguard C API - Stable ABI for path sanitization
 *
 * This header provides a C-compatible API over the pathguard C++ library.
 * It is designed for:
 * - FFI from other languages (Rust, Go, Python, etc.)
 * - Hosts with C-only toolchains
 *
 * ## Design Principles
 *
 * 1. **Ownership**: Functions returning `char*` return newly allocated
 *    strings that the caller must free with `pathguard_free_string()`.
 *
 * 2. **Error handling**: Fallible operations return a status code or NULL.
 *    Use `pathguard_get_last_error()` for details. Errors are thread-local.
 *
 * 3. **No exceptions**: The C++ implementation catches all exceptions
 *    and converts them to error codes.
 *
 * ## Example
 *
 * ```c
 * #include <pathguard/pathguard.h>
 * #include <stdio.h>
 *
 * char* dest = pathguard_safe_join("/srv/repo", "vendor", entry_name);
 * if (!dest) {
 *     fprintf(stderr, "rejected: %s\n", pathguard_get_last_error());
 *     return 1;
 * }
 * write_entry(dest);
 * pathguard_free_string(dest);
 * ```
 */

#ifndef PATHGUARD_H
#define PATHGUARD_H

#include <stddef.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

/* ============================================================================
 * ABI Version
 * ============================================================================
 *
 * PATHGUARD_ABI_VERSION is incremented when breaking changes are made to the
 * C API. It is independent of the library version.
 */

#define PATHGUARD_ABI_VERSION 1

/* ============================================================================
 * Export Macros
 * ============================================================================ */

#if defined(_WIN32) || defined(_WIN64)
    #ifdef PATHGUARD_BUILDING_SHARED
        #define PATHGUARD_CAPI __declspec(dllexport)
    #elif defined(PATHGUARD_SHARED)
        #define PATHGUARD_CAPI __declspec(dllimport)
    #else
        #define PATHGUARD_CAPI
    #endif
#elif defined(__GNUC__) || defined(__clang__)
    #ifdef PATHGUARD_BUILDING_SHARED
        #define PATHGUARD_CAPI __attribute__((visibility("default")))
    #else
        #define PATHGUARD_CAPI
    #endif
#else
    #define PATHGUARD_CAPI
#endif

/* ============================================================================
 * Status Codes
 * ============================================================================
 *
 * Codes 1-7 correspond one-to-one to the violation kinds of the C++ API.
 */

typedef enum PathguardStatus {
    PATHGUARD_OK = 0,
    PATHGUARD_ERROR_EMPTY = 1,
    PATHGUARD_ERROR_TRAVERSAL = 2,
    PATHGUARD_ERROR_INVALID_CHARACTERS = 3,
    PATHGUARD_ERROR_RESERVED_NAME = 4,
    PATHGUARD_ERROR_DRIVE_LETTER = 5,
    PATHGUARD_ERROR_CONSTRUCTION_FAILED = 6,
    PATHGUARD_ERROR_IO = 7,
    PATHGUARD_ERROR_INVALID_ARGUMENT = 90,
    PATHGUARD_ERROR_INTERNAL = 99
} PathguardStatus;

/* ============================================================================
 * API Version
 * ============================================================================ */

/**
 * @brief Get the ABI version of the loaded library
 * @return ABI version number (compare with PATHGUARD_ABI_VERSION)
 */
PATHGUARD_CAPI int32_t pathguard_abi_version(void);

/**
 * @brief Get the library version string
 * @return Version string. Pointer is valid for program lifetime.
 */
PATHGUARD_CAPI const char* pathguard_version_string(void);

/* ============================================================================
 * Error Handling
 * ============================================================================ */

/**
 * @brief Get the last error message (thread-local)
 * @return Error message, or empty string if no error.
 *         Pointer valid until the next pathguard call on this thread.
 */
PATHGUARD_CAPI const char* pathguard_get_last_error(void);

/**
 * @brief Get the last error code (thread-local)
 */
PATHGUARD_CAPI PathguardStatus pathguard_get_last_error_code(void);

/**
 * @brief Get the offending path component of the last error (thread-local)
 * @return Component for PATHGUARD_ERROR_RESERVED_NAME, otherwise empty string.
 */
PATHGUARD_CAPI const char* pathguard_get_last_error_component(void);

/**
 * @brief Clear the last error (thread-local)
 */
PATHGUARD_CAPI void pathguard_clear_error(void);

/* ============================================================================
 * Memory Management
 * ============================================================================ */

/**
 * @brief Free a string returned by pathguard functions
 * @param str String to free (NULL is safe)
 */
PATHGUARD_CAPI void pathguard_free_string(char* str);

/* ============================================================================
 * Normalization
 * ============================================================================ */

/**
 * @brief Normalize separators and collapse empty segments
 * @return Normalized path (caller must free), or NULL if path is NULL
 */
PATHGUARD_CAPI char* pathguard_normalize(const char* path);

/**
 * @brief Join two paths and normalize the result
 * @return Joined path (caller must free), or NULL if an argument is NULL
 */
PATHGUARD_CAPI char* pathguard_join_and_normalize(const char* base, const char* path);

/* ============================================================================
 * Validation
 * ============================================================================ */

/**
 * @brief Check a path against the safety rules
 * @return 1 if safe, 0 if not (or if path is NULL)
 */
PATHGUARD_CAPI int32_t pathguard_is_safe_path(const char* path);

/**
 * @brief Validate a path, reporting the first violated rule
 * @return PATHGUARD_OK or the status for the violation
 */
PATHGUARD_CAPI PathguardStatus pathguard_validate_path(const char* path);

/* ============================================================================
 * Sanitization
 * ============================================================================ */

/**
 * @brief Sanitize an untrusted path into a safe relative path
 * @return Sanitized path (caller must free), or NULL on violation
 */
PATHGUARD_CAPI char* pathguard_sanitize(const char* path);

/**
 * @brief Sanitize an untrusted path given as a byte buffer
 * @param data Path bytes, may contain embedded NUL bytes
 * @param len  Number of bytes
 * @return Sanitized path (caller must free), or NULL on violation
 */
PATHGUARD_CAPI char* pathguard_sanitize_n(const char* data, size_t len);

/**
 * @brief Join root, target and an untrusted path without escaping root
 * @param root   Existing trusted directory
 * @param target Trusted sub-directory of root (NULL or "" for none)
 * @param path   Untrusted path
 * @return Absolute path (caller must free), or NULL on violation
 */
PATHGUARD_CAPI char* pathguard_safe_join(const char* root, const char* target, const char* path);

#ifdef __cplusplus
}
#endif

#endif /* PATHGUARD_H */
