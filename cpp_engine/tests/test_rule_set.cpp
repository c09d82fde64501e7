#include <cassert>
#include <cmath>
#include <limits>

#include "engine/config.hpp"
#include "engine/rule_set.hpp"

using namespace parlay::engine;

namespace {

bool approx(double a, double b) { return std::abs(a - b) < 1e-12; }

}  // namespace

int main() {
    const LadderConfig ladder;
    const RuleSet premium = EngineConfig::default_rules(RiskProfile::Premium);
    assert(approx(premium.min_weight, 3.10));
    assert(!premium.allow_weak);

    assert(rules_for_step(premium, 0, ladder) == premium);

    const RuleSet s1 = rules_for_step(premium, 1, ladder);
    assert(approx(s1.min_weight, 2.95));
    assert(s1.max_high_volatility == premium.max_high_volatility);

    const RuleSet s2 = rules_for_step(premium, 2, ladder);
    assert(s2.max_high_volatility == premium.max_high_volatility + 1);
    assert(approx(s2.min_weight, 2.95));

    const RuleSet s3 = rules_for_step(premium, 3, ladder);
    assert(s3.min_strong == 1);
    assert(s3.min_moderate == 0);
    assert(!s3.allow_weak);

    const RuleSet s4 = rules_for_step(premium, 4, ladder);
    assert(s4.allow_weak);

    const RuleSet s5 = rules_for_step(premium, 5, ladder);
    assert(approx(s5.min_weight, 3.10 - 0.15 - 0.30));
    assert(s5.max_high_volatility == 2);
    assert(s5.include_category_x == premium.include_category_x);

    // Each step loosens the previous one; never the reverse.
    for (auto p : {RiskProfile::Premium, RiskProfile::Balanced, RiskProfile::Speculative}) {
        const RuleSet base = EngineConfig::default_rules(p);
        for (int k = 1; k < kLadderSteps; ++k) {
            const RuleSet prev = rules_for_step(base, k - 1, ladder);
            const RuleSet cur = rules_for_step(base, k, ladder);
            assert(no_stricter_than(cur, prev));
            // premium starts strict enough that every step changes something.
            assert(!(cur == prev) || p != RiskProfile::Premium);
        }
    }

    // Floors.
    const RuleSet tiny{0.2, 0, 0, true, 0, false};
    const RuleSet floored = rules_for_step(tiny, 5, ladder);
    assert(floored.min_weight == 0.0);
    assert(floored.min_strong == 0 && floored.min_moderate == 0);

    // The extra HIGH-volatility slot saturates instead of wrapping.
    RuleSet wide = premium;
    wide.max_high_volatility = std::numeric_limits<int>::max();
    const RuleSet widened = rules_for_step(wide, 2, ladder);
    assert(widened.max_high_volatility == std::numeric_limits<int>::max());
    assert(no_stricter_than(widened, wide));

    assert(describe_step(0) == "base_rules");
    assert(describe_step(4) == "permit_weak");
    assert(to_string(RiskProfile::Speculative) == "speculative");
    assert(parse_risk_profile("PREMIUM") == RiskProfile::Premium);
    assert(!parse_risk_profile("aggressive"));
    return 0;
}
