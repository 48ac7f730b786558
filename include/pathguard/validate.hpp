#pragma once

#include "pathguard/error.hpp"
#include "pathguard/export.hpp"

#include <filesystem>
#include <string>

namespace pathguard {

// Check a path against the safety rules without modifying it.
// Rules, first match wins:
//   1. empty or whitespace-only             -> Empty
//   2. contains ".." anywhere               -> Traversal
//   3. NUL or control char (not \n, \t)     -> InvalidCharacters
//   4. any of < > | ? * "                   -> InvalidCharacters
//   5. a segment named CON, PRN, AUX, NUL,
//      COM1-9 or LPT1-9 (any case, any ext) -> ReservedName
//
// Input need not be normalized; segments are split on both '/' and '\'.
PATHGUARD_API bool is_safe_path(const std::filesystem::path& path);

// Same rules as is_safe_path, reporting the first violation.
PATHGUARD_API ValidationResult validate_path(const std::filesystem::path& path);

// True when the second character is ':' (e.g. "C:\Windows", "d:file").
PATHGUARD_API bool has_drive_letter_prefix(const std::string& path);

} // namespace pathguard
