#include "pathguard/error.hpp"

#include <algorithm>
#include <cctype>

namespace pathguard {

namespace {

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

} // namespace

std::optional<ViolationKind> parse_violation_kind(const std::string& s) {
    std::string lower = to_lower(s);
    if (lower == "empty") return ViolationKind::Empty;
    if (lower == "traversal") return ViolationKind::Traversal;
    if (lower == "invalid_characters") return ViolationKind::InvalidCharacters;
    if (lower == "reserved_name") return ViolationKind::ReservedName;
    if (lower == "drive_letter") return ViolationKind::DriveLetter;
    if (lower == "construction_failed") return ViolationKind::ConstructionFailed;
    if (lower == "io") return ViolationKind::Io;
    return std::nullopt;
}

Violation make_empty() {
    return Violation{};
}

Violation make_traversal(std::string path) {
    Violation v;
    v.kind = ViolationKind::Traversal;
    v.path = std::move(path);
    return v;
}

Violation make_invalid_characters(std::string path) {
    Violation v;
    v.kind = ViolationKind::InvalidCharacters;
    v.path = std::move(path);
    return v;
}

Violation make_reserved_name(std::string component, std::string path) {
    Violation v;
    v.kind = ViolationKind::ReservedName;
    v.component = std::move(component);
    v.path = std::move(path);
    return v;
}

Violation make_drive_letter(std::string path) {
    Violation v;
    v.kind = ViolationKind::DriveLetter;
    v.path = std::move(path);
    return v;
}

Violation make_construction_failed(std::string message) {
    Violation v;
    v.kind = ViolationKind::ConstructionFailed;
    v.message = std::move(message);
    return v;
}

Violation make_io(std::string message) {
    Violation v;
    v.kind = ViolationKind::Io;
    v.message = std::move(message);
    return v;
}

Violation violation_from_error_code(const std::error_code& ec, const std::string& context) {
    if (context.empty()) {
        return make_io(ec.message());
    }
    return make_io(context + ": " + ec.message());
}

std::string format_violation(const Violation& v) {
    switch (v.kind) {
        case ViolationKind::Empty:
            return "Empty paths are not allowed";
        case ViolationKind::Traversal:
            return "Path traversal detected: " + v.path +
                   " - relative paths with '..' are not allowed";
        case ViolationKind::InvalidCharacters:
            return "Invalid characters detected in path: " + v.path;
        case ViolationKind::ReservedName:
            return "Reserved filename detected: " + v.component + " in path " + v.path;
        case ViolationKind::DriveLetter:
            return "Drive letter paths are not allowed: " + v.path;
        case ViolationKind::ConstructionFailed:
            return "Path construction failed: " + v.message;
        case ViolationKind::Io:
            return "I/O error: " + v.message;
        default:
            return "Unknown path violation";
    }
}

} // namespace pathguard
