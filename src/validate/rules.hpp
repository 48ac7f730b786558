#pragma once

#include "pathguard/error.hpp"

#include <optional>
#include <string>

namespace pathguard::detail {

// Empty or only Unicode whitespace (UTF-8)
bool is_blank(const std::string& s);

// Full ordered rule set: blank, "..", control characters, disallowed
// characters, reserved names. Violations carry `s` as the path.
std::optional<Violation> check_path_rules(const std::string& s);

// Character and reserved-name rules only, evaluated on `checked` and
// reported against `original`.
std::optional<Violation> check_content_rules(const std::string& checked,
                                             const std::string& original);

} // namespace pathguard::detail
