#pragma once

#include <string>

#include "engine/audit.hpp"
#include "engine/rule_set.hpp"
#include "engine/selection_result.hpp"

namespace parlay::engine {

std::string escape_json(const std::string &s);

// Single-line JSON, fixed key order, doubles at 10 significant digits.
std::string to_json(const RuleSet &rules);
std::string to_json(const Diagnostic &diag);
std::string to_json(const SelectionResult &result);
std::string to_json(const AuditRecord &record);
std::string to_json(const ClaimRecord &record);
std::string to_json(const FailEvent &event);

}  // namespace parlay::engine
