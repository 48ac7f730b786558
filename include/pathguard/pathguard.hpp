#pragma once

/**
 * @file pathguard.hpp
 * @brief Umbrella header for the pathguard C++ API.
 *
 * Typical use, with `entry` taken from an archive:
 *
 *   auto dest = pathguard::safe_repository_join(workdir, "vendor/lib", entry);
 *   if (!dest.ok) {
 *       report(pathguard::format_violation(dest.error));
 *       return;
 *   }
 *   write_file(dest.value, contents);
 */

#include "pathguard/error.hpp"
#include "pathguard/normalize.hpp"
#include "pathguard/sanitize.hpp"
#include "pathguard/validate.hpp"
