#include "engine/rule_set.hpp"

#include <algorithm>
#include <cctype>
#include <limits>

namespace parlay::engine {

std::string to_string(RiskProfile profile) {
    switch (profile) {
        case RiskProfile::Premium:
            return "premium";
        case RiskProfile::Balanced:
            return "balanced";
        case RiskProfile::Speculative:
            return "speculative";
        default:
            return "unknown";
    }
}

std::optional<RiskProfile> parse_risk_profile(const std::string &name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "premium") {
        return RiskProfile::Premium;
    }
    if (lower == "balanced") {
        return RiskProfile::Balanced;
    }
    if (lower == "speculative") {
        return RiskProfile::Speculative;
    }
    return std::nullopt;
}

bool operator==(const RuleSet &a, const RuleSet &b) {
    return a.min_weight == b.min_weight && a.min_strong == b.min_strong && a.min_moderate == b.min_moderate &&
           a.allow_weak == b.allow_weak && a.max_high_volatility == b.max_high_volatility &&
           a.include_category_x == b.include_category_x;
}

RuleSet rules_for_step(const RuleSet &base, int step, const LadderConfig &ladder) {
    RuleSet rules = base;
    if (step >= 1) {
        rules.min_weight = std::max(0.0, rules.min_weight - ladder.first_weight_delta);
    }
    if (step >= 2) {
        if (rules.max_high_volatility < std::numeric_limits<int>::max()) {
            rules.max_high_volatility += 1;
        }
    }
    if (step >= 3) {
        rules.min_strong = std::max(0, rules.min_strong - 1);
        rules.min_moderate = std::max(0, rules.min_moderate - 1);
    }
    if (step >= 4) {
        rules.allow_weak = true;
    }
    if (step >= 5) {
        rules.min_weight = std::max(0.0, rules.min_weight - ladder.second_weight_delta);
    }
    return rules;
}

std::string describe_step(int step) {
    switch (step) {
        case 0:
            return "base_rules";
        case 1:
            return "lower_min_weight";
        case 2:
            return "extra_high_volatility";
        case 3:
            return "relax_tier_preferences";
        case 4:
            return "permit_weak";
        case 5:
            return "lower_min_weight_further";
        default:
            return "unknown_step";
    }
}

bool no_stricter_than(const RuleSet &looser, const RuleSet &stricter) {
    return looser.min_weight <= stricter.min_weight && looser.max_high_volatility >= stricter.max_high_volatility &&
           (looser.allow_weak || !stricter.allow_weak) && looser.min_strong <= stricter.min_strong &&
           looser.min_moderate <= stricter.min_moderate;
}

}  // namespace parlay::engine
