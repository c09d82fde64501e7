#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace parlay::engine {

enum class RiskProfile : uint8_t { Premium, Balanced, Speculative };

std::string to_string(RiskProfile profile);
std::optional<RiskProfile> parse_risk_profile(const std::string &name);

struct RuleSet {
    double min_weight{0.0};
    int min_strong{0};    // soft preference
    int min_moderate{0};  // soft preference
    bool allow_weak{true};
    int max_high_volatility{0};
    bool include_category_x{false};
};

bool operator==(const RuleSet &a, const RuleSet &b);

struct LadderConfig {
    double first_weight_delta{0.15};
    double second_weight_delta{0.30};
};

constexpr int kLadderSteps = 6;

// Upper bound accepted from configuration for max_high_volatility.
constexpr int kMaxHighVolatilityCap = 64;

// Effective rules at `step` (0..kLadderSteps-1). Steps are cumulative:
//   1 lower min weight by first delta
//   2 one more HIGH-volatility leg
//   3 tier preferences down by one each
//   4 WEAK legs permitted
//   5 lower min weight by second delta
RuleSet rules_for_step(const RuleSet &base, int step, const LadderConfig &ladder);

std::string describe_step(int step);

// True when every selection admitted by `stricter` is admitted by `looser`.
bool no_stricter_than(const RuleSet &looser, const RuleSet &stricter);

}  // namespace parlay::engine
