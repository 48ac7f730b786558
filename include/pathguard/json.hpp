#pragma once

#include "pathguard/error.hpp"
#include "pathguard/export.hpp"

#include <filesystem>
#include <string>

#include <nlohmann/json.hpp>

namespace pathguard {

// ============================================================================
// JSON Serialization
// ============================================================================

// {"kind": "reserved_name", "message": "...", "path": "...", "component": "..."}
// Only the payload fields the kind defines are emitted.
PATHGUARD_API nlohmann::json violation_to_json(const Violation& v);

// Parse the object produced by violation_to_json.
// Returns nullopt when "kind" is missing or unknown.
PATHGUARD_API std::optional<Violation> violation_from_json(const nlohmann::json& j);

// {"ok": true, "path": "..."} or {"ok": false, "error": {...}}
PATHGUARD_API nlohmann::json result_to_json(const Result<std::string>& r);
PATHGUARD_API nlohmann::json result_to_json(const Result<std::filesystem::path>& r);

// {"ok": true} or {"ok": false, "error": {...}}
PATHGUARD_API nlohmann::json result_to_json(const ValidationResult& r);

} // namespace pathguard
