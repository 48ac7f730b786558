#pragma once

#include "pathguard/error.hpp"
#include "pathguard/export.hpp"

#include <filesystem>
#include <string>

namespace pathguard {

// Sanitize a file path taken from untrusted directory content (archive or
// patch entries, network payloads).
//
// Absolute-looking input is turned into a relative path: "/args.js" becomes
// "args.js". Traversal and emptiness are checked before the leading '/' is
// stripped, so "/../etc" is reported as traversal. Character and reserved
// name rules run again on the stripped result. On Windows a drive-letter
// prefix is rejected.
//
// Violation payloads carry the original input.
PATHGUARD_API Result<std::string> sanitize_directory_file_path(const std::string& path);

// Build root/target/path where `path` is untrusted.
//
// `root` must exist; it is canonicalized (symlinks resolved) on every call.
// `target` is a trusted sub-directory, normalized before joining.
// `path` is sanitized with sanitize_directory_file_path.
//
// After construction the result is checked structurally: it must sit under
// the canonical root (ConstructionFailed otherwise) and contain no ".."
// component below it (Traversal otherwise).
PATHGUARD_API Result<std::filesystem::path> safe_repository_join(
    const std::filesystem::path& root,
    const std::filesystem::path& target,
    const std::string& path);

} // namespace pathguard
