#include "pathguard/validate.hpp"

#include "validate/rules.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <string_view>

namespace pathguard {

namespace {

constexpr std::array<std::string_view, 22> kReservedNames = {
    "CON",  "PRN",  "AUX",  "NUL",
    "COM1", "COM2", "COM3", "COM4", "COM5", "COM6", "COM7", "COM8", "COM9",
    "LPT1", "LPT2", "LPT3", "LPT4", "LPT5", "LPT6", "LPT7", "LPT8", "LPT9",
};

constexpr std::string_view kDisallowedChars = "<>|?*\"";

// C0 and DEL, except newline and tab. C1 controls (U+0080-U+009F) are
// matched on their UTF-8 encoding, C2 80 through C2 9F.
bool has_control_characters(const std::string& s) {
    for (size_t i = 0; i < s.size(); ++i) {
        auto c = static_cast<unsigned char>(s[i]);
        if (c == '\n' || c == '\t') continue;
        if (c < 0x20 || c == 0x7F) return true;
        if (c == 0xC2 && i + 1 < s.size()) {
            auto next = static_cast<unsigned char>(s[i + 1]);
            if (next >= 0x80 && next <= 0x9F) return true;
        }
    }
    return false;
}

bool has_disallowed_characters(const std::string& s) {
    return s.find_first_of(kDisallowedChars.data(), 0, kDisallowedChars.size()) !=
           std::string::npos;
}

bool is_reserved_component(std::string_view component) {
    std::string base(component.substr(0, component.find('.')));
    std::transform(base.begin(), base.end(), base.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return std::find(kReservedNames.begin(), kReservedNames.end(), base) !=
           kReservedNames.end();
}

// First segment, split on either separator, that is a reserved device name
std::optional<std::string> find_reserved_component(const std::string& s) {
    std::string_view sv(s);
    while (true) {
        const auto pos = sv.find_first_of("/\\");
        const auto seg = sv.substr(0, pos);
        if (is_reserved_component(seg)) return std::string(seg);
        if (pos == std::string_view::npos) break;
        sv.remove_prefix(pos + 1);
    }
    return std::nullopt;
}

// Byte length of the Unicode White_Space character starting at s[i], or 0.
// Beyond ASCII: U+0085, U+00A0, U+1680, U+2000-U+200A, U+2028, U+2029,
// U+202F, U+205F and U+3000, matched on their UTF-8 encoding.
size_t whitespace_width(const std::string& s, size_t i) {
    auto at = [&s](size_t k) -> unsigned char {
        return k < s.size() ? static_cast<unsigned char>(s[k]) : 0;
    };
    const unsigned char c = at(i);
    if (c < 0x80) return std::isspace(c) != 0 ? 1 : 0;

    const unsigned char b1 = at(i + 1);
    const unsigned char b2 = at(i + 2);
    switch (c) {
        case 0xC2:
            return (b1 == 0x85 || b1 == 0xA0) ? 2 : 0;
        case 0xE1:
            return (b1 == 0x9A && b2 == 0x80) ? 3 : 0;
        case 0xE2:
            if (b1 == 0x80 && b2 >= 0x80 && b2 <= 0x8A) return 3;
            if (b1 == 0x80 && (b2 == 0xA8 || b2 == 0xA9 || b2 == 0xAF)) return 3;
            if (b1 == 0x81 && b2 == 0x9F) return 3;
            return 0;
        case 0xE3:
            return (b1 == 0x80 && b2 == 0x80) ? 3 : 0;
        default:
            return 0;
    }
}

} // namespace

namespace detail {

bool is_blank(const std::string& s) {
    size_t i = 0;
    while (i < s.size()) {
        size_t width = whitespace_width(s, i);
        if (width == 0) return false;
        i += width;
    }
    return true;
}

std::optional<Violation> check_content_rules(const std::string& checked,
                                             const std::string& original) {
    if (has_control_characters(checked) || has_disallowed_characters(checked)) {
        return make_invalid_characters(original);
    }
    if (auto component = find_reserved_component(checked)) {
        return make_reserved_name(*component, original);
    }
    return std::nullopt;
}

std::optional<Violation> check_path_rules(const std::string& s) {
    if (is_blank(s)) {
        return make_empty();
    }
    if (s.find("..") != std::string::npos) {
        return make_traversal(s);
    }
    return check_content_rules(s, s);
}

} // namespace detail

bool is_safe_path(const std::filesystem::path& path) {
    return !detail::check_path_rules(path.string()).has_value();
}

ValidationResult validate_path(const std::filesystem::path& path) {
    ValidationResult result;
    if (auto violation = detail::check_path_rules(path.string())) {
        result.ok = false;
        result.error = std::move(*violation);
    }
    return result;
}

bool has_drive_letter_prefix(const std::string& path) {
    if (path.empty()) return false;
    // Skip the first UTF-8 code point
    auto lead = static_cast<unsigned char>(path[0]);
    size_t width = 1;
    if (lead >= 0xF0) width = 4;
    else if (lead >= 0xE0) width = 3;
    else if (lead >= 0xC0) width = 2;
    return path.size() > width && path[width] == ':';
}

} // namespace pathguard
