#include "pathguard/sanitize.hpp"
#include "pathguard/normalize.hpp"
#include "pathguard/validate.hpp"

#include "validate/rules.hpp"

#include <spdlog/spdlog.h>

#include <filesystem>
#include <string>
#include <system_error>

namespace pathguard {

namespace fs = std::filesystem;

namespace {

Result<std::string> reject(const std::string& raw, Violation v) {
    spdlog::debug("Rejected path '{}': {}", raw, violation_kind_to_string(v.kind));
    return Result<std::string>::failure(std::move(v));
}

} // namespace

Result<std::string> sanitize_directory_file_path(const std::string& path) {
    if (detail::is_blank(path)) {
        return reject(path, make_empty());
    }

    std::string normalized = normalize_path_str(path);

    // Checked before the leading separator is stripped, so "/../etc" is
    // traversal rather than "../etc"
    if (normalized.find("..") != std::string::npos) {
        return reject(path, make_traversal(path));
    }

    // Absolute-looking entries from directory content are relative to the
    // destination, never to the filesystem root
    size_t start = normalized.find_first_not_of('/');
    normalized.erase(0, start == std::string::npos ? normalized.size() : start);

#ifdef _WIN32
    if (has_drive_letter_prefix(normalized)) {
        return reject(path, make_drive_letter(path));
    }
#endif

    if (auto violation = detail::check_content_rules(normalized, path)) {
        return reject(path, std::move(*violation));
    }

    return Result<std::string>::success(std::move(normalized));
}

Result<fs::path> safe_repository_join(const fs::path& root,
                                      const fs::path& target,
                                      const std::string& path) {
    auto sanitized = sanitize_directory_file_path(path);
    if (!sanitized.ok) {
        return Result<fs::path>::failure(std::move(sanitized.error));
    }

    std::error_code ec;
    fs::path canonical_root = fs::canonical(root, ec);
    if (ec) {
        spdlog::warn("Cannot canonicalize workdir '{}': {}", root.string(), ec.message());
        return Result<fs::path>::failure(
            violation_from_error_code(ec, "Cannot canonicalize workdir"));
    }

    fs::path final_path = canonical_root;
    fs::path target_normalized = normalize_path(target);
    if (!target_normalized.empty()) {
        final_path /= target_normalized;
    }
    // An empty sanitized path ("///") names the target directory itself
    final_path /= fs::path(sanitized.value);

    // Component-wise prefix match against the canonical root
    auto root_it = canonical_root.begin();
    auto out_it = final_path.begin();
    for (; root_it != canonical_root.end() && out_it != final_path.end(); ++root_it, ++out_it) {
        if (*root_it != *out_it) break;
    }
    if (root_it != canonical_root.end()) {
        spdlog::debug("Constructed path '{}' is outside '{}'",
                      final_path.string(), canonical_root.string());
        return Result<fs::path>::failure(make_construction_failed(
            "Path construction failed - result not within workdir. Final: " +
            final_path.string() + ", Workdir: " + canonical_root.string()));
    }

    for (; out_it != final_path.end(); ++out_it) {
        if (*out_it == "..") {
            spdlog::debug("Constructed path '{}' has a '..' component", final_path.string());
            return Result<fs::path>::failure(make_traversal(".. components not allowed"));
        }
    }

    spdlog::debug("Joined '{}' as '{}'", path, final_path.string());
    return Result<fs::path>::success(std::move(final_path));
}

} // namespace pathguard
