#include <cassert>
#include <cmath>
#include <optional>
#include <string>
#include <vector>

#include "engine/parlay_architect.hpp"
#include "engine/serialize.hpp"
#include "leg_fixtures.hpp"

using namespace parlay::engine;
using parlay::testing::default_config;
using parlay::testing::pad_id;
using parlay::testing::strong_leg;
using parlay::testing::weak_leg;

namespace {

SelectionRequest request(int legs, const std::string &profile, bool allow_same_entity = false) {
    SelectionRequest r;
    r.legs = legs;
    r.risk_profile = profile;
    r.allow_same_entity = allow_same_entity;
    r.seed = 7;
    return r;
}

void ten_clean_legs_accept_at_step_zero(const ParlayArchitect &arch) {
    std::vector<Leg> pool;
    for (int i = 0; i < 10; ++i) {
        pool.push_back(strong_leg(pad_id("s", i), "ent" + std::to_string(i)));
    }
    const auto res = arch.select(pool, request(4, "balanced"));
    assert(res.is_accepted());
    assert(res.accepted().legs.size() == 4);
    assert(res.accepted().relaxation_step == 0);
    assert(res.ladder_trace().size() == 1);
    // Equal scores fall back to id order.
    assert(res.accepted().legs[0].leg.id == "s000");
    assert(res.accepted().legs[3].leg.id == "s003");
    assert(std::abs(res.accepted().aggregate_weight - 4 * std::log(2.6725)) < 1e-9);
    assert(res.diagnostic().eligible_total == 10);
}

void two_legs_is_insufficient_pool(const ParlayArchitect &arch) {
    std::vector<Leg> pool{strong_leg("a", "e1"), strong_leg("b", "e2")};
    const auto res = arch.select(pool, request(4, "balanced"));
    assert(!res.is_accepted());
    assert(res.rejected().reason == ReasonCode::InsufficientPool);
    assert(res.diagnostic().eligible_total == 2);
    assert(res.ladder_trace().empty());
}

std::vector<Leg> same_entity_pool() {
    std::vector<Leg> pool;
    for (int i = 0; i < 20; ++i) {
        pool.push_back(strong_leg(pad_id("c", i), std::string("one-entity")));
    }
    return pool;
}

void shared_entity_exhausts_ladder(const ParlayArchitect &arch) {
    const auto res = arch.select(same_entity_pool(), request(3, "balanced"));
    assert(!res.is_accepted());
    assert(res.rejected().reason == ReasonCode::NoValidSelection);
    assert(res.ladder_trace().size() == static_cast<std::size_t>(kLadderSteps));
    for (const auto &att : res.ladder_trace()) {
        assert(att.outcome == AttemptOutcome::ConstraintBlocked);
        assert(att.assembled == 1);
    }
    // Snapshot is pre-ladder: nothing about relaxation leaks in.
    assert(res.diagnostic().eligible_total == 20);
    assert(res.diagnostic().eligible_by_tier[Tier::Strong] == 20);
}

void shared_entity_allowed_accepts(const ParlayArchitect &arch) {
    const auto res = arch.select(same_entity_pool(), request(3, "balanced", true));
    assert(res.is_accepted());
    assert(res.accepted().legs.size() == 3);
    assert(res.accepted().relaxation_step == 0);
}

void all_weak_pool_accepts_once_weak_permitted(const ParlayArchitect &arch) {
    std::vector<Leg> pool;
    for (int i = 0; i < 8; ++i) {
        pool.push_back(weak_leg(pad_id("w", i), "w-ent" + std::to_string(i)));
    }
    const auto res = arch.select(pool, request(6, "premium"));
    assert(res.is_accepted());
    assert(res.accepted().relaxation_step == 4);
    assert(res.accepted().rules_applied.allow_weak);
    assert(res.ladder_trace().size() == 5);
    for (int step = 0; step < 4; ++step) {
        const auto &att = res.ladder_trace()[static_cast<std::size_t>(step)];
        assert(att.step == step);
        assert(att.outcome == AttemptOutcome::ConstraintBlocked);
        assert(att.assembled == 0);
    }
    // premium wants 2 STRONG + 1 MODERATE; relaxed by one each at step 3.
    const auto &warnings = res.accepted().tier_warnings;
    assert(warnings.size() == 1);
    assert(warnings[0].tier == Tier::Strong);
    assert(warnings[0].preferred == 1);
    assert(warnings[0].actual == 0);
}

void invalid_requests(const ParlayArchitect &arch) {
    std::vector<Leg> pool{strong_leg("a", "e1"), strong_leg("b", "e2")};
    const auto bad_profile = arch.select(pool, request(1, "reckless"));
    assert(!bad_profile.is_accepted());
    assert(bad_profile.rejected().reason == ReasonCode::InvalidRequest);
    assert(bad_profile.diagnostic().total_candidates == 2);

    const auto zero = arch.select(pool, request(0, "balanced"));
    assert(zero.rejected().reason == ReasonCode::InvalidRequest);
    const auto negative = arch.select(pool, request(-3, "Balanced"));
    assert(negative.rejected().reason == ReasonCode::InvalidRequest);

    EngineConfig only_premium = EngineConfig::defaults();
    only_premium.profiles.erase(RiskProfile::Speculative);
    const ParlayArchitect partial(std::make_shared<const EngineConfig>(only_premium));
    const auto missing = partial.select(pool, request(1, "speculative"));
    assert(missing.rejected().reason == ReasonCode::InvalidRequest);
}

void category_x_toggle(const ParlayArchitect &arch) {
    std::vector<Leg> pool;
    for (int i = 0; i < 4; ++i) {
        Leg l = strong_leg(pad_id("p", i), "prop" + std::to_string(i));
        l.category = MarketCategory::Prop;
        pool.push_back(l);
    }
    const auto excluded = arch.select(pool, request(3, "balanced"));
    assert(excluded.rejected().reason == ReasonCode::InsufficientPool);
    assert(excluded.diagnostic().blocked.category_excluded == 4);

    SelectionRequest with_x = request(3, "balanced");
    with_x.include_category_x = true;
    const auto included = arch.select(pool, with_x);
    assert(included.is_accepted());
    assert(included.diagnostic().eligible_by_category[static_cast<std::size_t>(MarketCategory::Prop)] == 4);
}

void unkeyed_legs_are_counted_and_may_co_occur(const ParlayArchitect &arch) {
    std::vector<Leg> pool;
    for (int i = 0; i < 3; ++i) {
        pool.push_back(strong_leg(pad_id("n", i), std::nullopt));
        pool.push_back(strong_leg(pad_id("s", i), "keyed" + std::to_string(i)));
    }
    const auto res = arch.select(pool, request(4, "balanced"));
    assert(res.diagnostic().correlation_unchecked == 3);
    assert(res.diagnostic().eligible_total == 6);
    assert(to_json(res).find("\"correlation_unchecked\":3") != std::string::npos);

    // Equal scores rank by id, so all three unkeyed legs come first and none
    // of them blocks another.
    assert(res.is_accepted());
    assert(res.accepted().relaxation_step == 0);
    int unkeyed = 0;
    for (const auto &rl : res.accepted().legs) {
        if (!rl.leg.entity_key) {
            ++unkeyed;
        }
    }
    assert(unkeyed == 3);
    assert(res.accepted().legs[3].leg.id == "s000");
}

}  // namespace

int main() {
    const ParlayArchitect arch(default_config());
    ten_clean_legs_accept_at_step_zero(arch);
    two_legs_is_insufficient_pool(arch);
    shared_entity_exhausts_ladder(arch);
    shared_entity_allowed_accepts(arch);
    all_weak_pool_accepts_once_weak_permitted(arch);
    invalid_requests(arch);
    category_x_toggle(arch);
    unkeyed_legs_are_counted_and_may_co_occur(arch);
    return 0;
}
