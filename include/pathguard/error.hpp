#pragma once

#include "pathguard/export.hpp"

#include <optional>
#include <string>
#include <system_error>
#include <utility>

namespace pathguard {

// ============================================================================
// Violation Kinds
// ============================================================================

enum class ViolationKind {
    Empty,
    Traversal,
    InvalidCharacters,
    ReservedName,
    DriveLetter,
    ConstructionFailed,
    Io,
};

// Convert violation kind to canonical lowercase snake_case string
inline const char* violation_kind_to_string(ViolationKind k) {
    switch (k) {
        case ViolationKind::Empty: return "empty";
        case ViolationKind::Traversal: return "traversal";
        case ViolationKind::InvalidCharacters: return "invalid_characters";
        case ViolationKind::ReservedName: return "reserved_name";
        case ViolationKind::DriveLetter: return "drive_letter";
        case ViolationKind::ConstructionFailed: return "construction_failed";
        case ViolationKind::Io: return "io";
        default: return "unknown";
    }
}

// Parse violation kind string to enum (case-insensitive)
PATHGUARD_API std::optional<ViolationKind> parse_violation_kind(const std::string& s);

// ============================================================================
// Violation
// ============================================================================

// One rejection reason. Which fields carry data depends on the kind:
//   Traversal, InvalidCharacters, DriveLetter: path
//   ReservedName:                              component, path
//   ConstructionFailed, Io:                    message
//   Empty:                                     nothing
struct Violation {
    ViolationKind kind = ViolationKind::Empty;
    std::string path;       // original, pre-transformation input
    std::string component;  // offending segment as written
    std::string message;
};

inline bool operator==(const Violation& a, const Violation& b) {
    return a.kind == b.kind && a.path == b.path && a.component == b.component &&
           a.message == b.message;
}

inline bool operator!=(const Violation& a, const Violation& b) {
    return !(a == b);
}

PATHGUARD_API Violation make_empty();
PATHGUARD_API Violation make_traversal(std::string path);
PATHGUARD_API Violation make_invalid_characters(std::string path);
PATHGUARD_API Violation make_reserved_name(std::string component, std::string path);
PATHGUARD_API Violation make_drive_letter(std::string path);
PATHGUARD_API Violation make_construction_failed(std::string message);
PATHGUARD_API Violation make_io(std::string message);

// Wrap a platform error as an Io violation. A non-empty context is
// prefixed as "<context>: <reason>".
PATHGUARD_API Violation violation_from_error_code(const std::error_code& ec,
                                                  const std::string& context = "");

// Human-readable description, suitable for end-user diagnostics
PATHGUARD_API std::string format_violation(const Violation& v);

// ============================================================================
// Results
// ============================================================================

template<typename T>
struct Result {
    bool ok = false;
    T value{};
    Violation error;

    explicit operator bool() const { return ok; }

    static Result success(T v) {
        Result r;
        r.ok = true;
        r.value = std::move(v);
        return r;
    }

    static Result failure(Violation v) {
        Result r;
        r.ok = false;
        r.error = std::move(v);
        return r;
    }
};

// Result of an operation with nothing to return on success
struct ValidationResult {
    bool ok = true;
    Violation error;

    explicit operator bool() const { return ok; }
};

} // namespace pathguard
