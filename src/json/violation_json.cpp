#include "pathguard/json.hpp"

#include <optional>
#include <string>

namespace pathguard {

namespace {

// Helper to safely get a string from JSON
std::string get_string(const nlohmann::json& j, const std::string& key) {
    if (j.contains(key) && j[key].is_string()) {
        return j[key].get<std::string>();
    }
    return "";
}

} // namespace

nlohmann::json violation_to_json(const Violation& v) {
    nlohmann::json j;
    j["kind"] = violation_kind_to_string(v.kind);
    j["message"] = format_violation(v);

    switch (v.kind) {
        case ViolationKind::Traversal:
        case ViolationKind::InvalidCharacters:
        case ViolationKind::DriveLetter:
            j["path"] = v.path;
            break;
        case ViolationKind::ReservedName:
            j["component"] = v.component;
            j["path"] = v.path;
            break;
        case ViolationKind::ConstructionFailed:
        case ViolationKind::Io:
            j["detail"] = v.message;
            break;
        case ViolationKind::Empty:
            break;
    }
    return j;
}

std::optional<Violation> violation_from_json(const nlohmann::json& j) {
    if (!j.is_object()) return std::nullopt;

    auto kind = parse_violation_kind(get_string(j, "kind"));
    if (!kind) return std::nullopt;

    Violation v;
    v.kind = *kind;
    v.path = get_string(j, "path");
    v.component = get_string(j, "component");
    v.message = get_string(j, "detail");
    return v;
}

nlohmann::json result_to_json(const Result<std::string>& r) {
    nlohmann::json j;
    j["ok"] = r.ok;
    if (r.ok) {
        j["path"] = r.value;
    } else {
        j["error"] = violation_to_json(r.error);
    }
    return j;
}

nlohmann::json result_to_json(const Result<std::filesystem::path>& r) {
    nlohmann::json j;
    j["ok"] = r.ok;
    if (r.ok) {
        j["path"] = r.value.string();
    } else {
        j["error"] = violation_to_json(r.error);
    }
    return j;
}

nlohmann::json result_to_json(const ValidationResult& r) {
    nlohmann::json j;
    j["ok"] = r.ok;
    if (!r.ok) {
        j["error"] = violation_to_json(r.error);
    }
    return j;
}

} // namespace pathguard
