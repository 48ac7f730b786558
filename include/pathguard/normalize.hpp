#pragma once

#include "pathguard/export.hpp"

#include <filesystem>
#include <string>

namespace pathguard {

// Normalize a path string for cross-platform consistency:
// - backslashes become forward slashes
// - empty segments are dropped (doubled, leading and trailing separators)
// - "." and ".." are left alone; rejecting them is the validator's job
//
// Total and idempotent: normalize_path_str(normalize_path_str(s)) == normalize_path_str(s).
PATHGUARD_API std::string normalize_path_str(const std::string& path);

// Same transform applied to a path object.
PATHGUARD_API std::filesystem::path normalize_path(const std::filesystem::path& path);

// Join two paths without producing doubled separators.
// Trailing '/' is trimmed from base and leading '/' from path; if either side
// is empty after trimming, the other side is returned normalized.
//
//   join_and_normalize("source/", "/main.cpp") == "source/main.cpp"
PATHGUARD_API std::filesystem::path join_and_normalize(const std::filesystem::path& base,
                                                       const std::filesystem::path& path);

} // namespace pathguard
