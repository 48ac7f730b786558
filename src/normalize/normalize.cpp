#include "pathguard/normalize.hpp"

#include <string>

namespace pathguard {

std::string normalize_path_str(const std::string& path) {
    std::string out;
    out.reserve(path.size());

    std::string segment;
    auto flush = [&out, &segment]() {
        if (segment.empty()) return;
        if (!out.empty()) out.push_back('/');
        out += segment;
        segment.clear();
    };

    for (char c : path) {
        if (c == '/' || c == '\\') {
            flush();
        } else {
            segment.push_back(c);
        }
    }
    flush();
    return out;
}

std::filesystem::path normalize_path(const std::filesystem::path& path) {
    return std::filesystem::path(normalize_path_str(path.generic_string()));
}

std::filesystem::path join_and_normalize(const std::filesystem::path& base,
                                         const std::filesystem::path& path) {
    std::string base_str = base.generic_string();
    std::string path_str = path.generic_string();

    size_t base_end = base_str.find_last_not_of('/');
    std::string base_trimmed =
        base_end == std::string::npos ? std::string() : base_str.substr(0, base_end + 1);

    size_t path_start = path_str.find_first_not_of('/');
    std::string path_trimmed =
        path_start == std::string::npos ? std::string() : path_str.substr(path_start);

    if (base_trimmed.empty()) {
        return normalize_path(path_trimmed);
    }
    if (path_trimmed.empty()) {
        return normalize_path(base_trimmed);
    }
    return normalize_path(base_trimmed + "/" + path_trimmed);
}

} // namespace pathguard
