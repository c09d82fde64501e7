#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "engine/rule_set.hpp"
#include "engine/scoring.hpp"
#include "engine/types.hpp"

namespace parlay::engine {

struct SelectionRequest {
    int legs{0};
    std::string risk_profile;
    bool allow_same_entity{false};
    std::optional<bool> include_category_x;  // unset: profile default
    uint64_t seed{0};
};

// Request value if set, else the profile default, else false.
bool resolve_include_category_x(const SelectionRequest &request, const RuleSet *profile_rules);

// Inventory snapshot taken before the ladder runs.
struct Diagnostic {
    std::size_t total_candidates{0};
    std::size_t malformed{0};
    std::size_t eligible_total{0};
    TierCounts eligible_by_tier;
    BlockedCounts blocked;
    std::array<std::size_t, kCategoryCount> eligible_by_category{};
    std::size_t correlation_unchecked{0};  // eligible legs with no entity_key
};

enum class SelectionStatus : uint8_t { Accepted, Rejected };

enum class ReasonCode : uint8_t { InsufficientPool, NoValidSelection, InvalidRequest };

enum class AttemptOutcome : uint8_t { Accepted, ConstraintBlocked, WeightTooLow };

std::string to_string(SelectionStatus status);
std::string to_string(ReasonCode reason);
std::string to_string(AttemptOutcome outcome);

struct LadderAttempt {
    int step{0};
    AttemptOutcome outcome{AttemptOutcome::ConstraintBlocked};
    std::size_t assembled{0};
    double aggregate_weight{0.0};
    RuleSet rules;
};

struct TierWarning {
    Tier tier{Tier::Strong};
    int preferred{0};
    std::size_t actual{0};
};

struct AcceptedSelection {
    std::vector<RankedLeg> legs;
    double aggregate_weight{0.0};
    int relaxation_step{0};
    RuleSet rules_applied;
    std::vector<TierWarning> tier_warnings;
};

struct RejectedSelection {
    ReasonCode reason{ReasonCode::NoValidSelection};
    std::string detail;
};

// Terminal outcome of one request. Exactly one of accepted()/rejected() is
// populated; only the two factories can build one.
class SelectionResult {
  public:
    static SelectionResult accept(AcceptedSelection selection, Diagnostic diagnostic,
                                  std::vector<LadderAttempt> trace);
    static SelectionResult reject(ReasonCode reason, std::string detail, Diagnostic diagnostic,
                                  std::vector<LadderAttempt> trace = {});

    SelectionStatus status() const { return status_; }
    bool is_accepted() const { return status_ == SelectionStatus::Accepted; }

    const AcceptedSelection &accepted() const;
    const RejectedSelection &rejected() const;
    const Diagnostic &diagnostic() const { return diagnostic_; }
    const std::vector<LadderAttempt> &ladder_trace() const { return trace_; }

  private:
    SelectionResult() = default;

    SelectionStatus status_{SelectionStatus::Rejected};
    std::optional<AcceptedSelection> accepted_;
    std::optional<RejectedSelection> rejected_;
    Diagnostic diagnostic_;
    std::vector<LadderAttempt> trace_;
};

}  // namespace parlay::engine
