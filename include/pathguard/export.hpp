#ifndef PATHGUARD_EXPORT_HPP
#define PATHGUARD_EXPORT_HPP

/**
 * @file export.hpp
 * @brief Shared library export/import macros.
 *
 * When building pathguard as a shared library:
 * - Define PATHGUARD_SHARED when consuming the library
 * - PATHGUARD_BUILDING_SHARED is defined by the build while compiling it
 */

#if defined(_WIN32) || defined(_WIN64)
    #ifdef PATHGUARD_BUILDING_SHARED
        #define PATHGUARD_API __declspec(dllexport)
    #elif defined(PATHGUARD_SHARED)
        #define PATHGUARD_API __declspec(dllimport)
    #else
        #define PATHGUARD_API
    #endif
#elif defined(__GNUC__) || defined(__clang__)
    #ifdef PATHGUARD_BUILDING_SHARED
        #define PATHGUARD_API __attribute__((visibility("default")))
    #else
        #define PATHGUARD_API
    #endif
#else
    #define PATHGUARD_API
#endif

#endif // PATHGUARD_EXPORT_HPP
