#include "engine/fallback_ladder.hpp"

#include <algorithm>
#include <sstream>

#include "engine/correlation_guard.hpp"
#include "utils/logger.hpp"

namespace parlay::engine {
namespace {

TierCounts count_tiers(const std::vector<RankedLeg> &legs) {
    TierCounts counts;
    for (const auto &l : legs) {
        ++counts[l.tier];
    }
    return counts;
}

int count_high_volatility(const std::vector<RankedLeg> &legs) {
    int n = 0;
    for (const auto &l : legs) {
        if (l.leg.volatility == Volatility::High) {
            ++n;
        }
    }
    return n;
}

}  // namespace

bool ranks_before(const RankedLeg &a, const RankedLeg &b) {
    if (a.tier != b.tier) {
        return static_cast<int>(a.tier) < static_cast<int>(b.tier);
    }
    if (a.score != b.score) {
        return a.score > b.score;
    }
    return a.leg.id < b.leg.id;
}

void rank_pool(std::vector<RankedLeg> &pool) { std::stable_sort(pool.begin(), pool.end(), ranks_before); }

LadderAttempt FallbackLadder::attempt(const std::vector<RankedLeg> &ranked_pool, const RuleSet &rules, int step,
                                      std::size_t n, bool allow_same_entity,
                                      std::vector<RankedLeg> &selected) const {
    // Single pass in rank order with no backtracking: a skipped leg is never
    // revisited, so a lower-ranked set that fits these rules can be missed.
    selected.clear();
    CorrelationGuard guard(allow_same_entity);
    int high_vol = 0;

    for (const auto &cand : ranked_pool) {
        if (selected.size() >= n) {
            break;
        }
        if (cand.tier == Tier::Weak && !rules.allow_weak) {
            continue;
        }
        if (guard.violates(cand.leg)) {
            continue;
        }
        const bool is_high = cand.leg.volatility == Volatility::High;
        if (is_high && high_vol >= rules.max_high_volatility) {
            continue;
        }
        selected.push_back(cand);
        guard.admit(cand.leg);
        if (is_high) {
            ++high_vol;
        }
    }

    LadderAttempt att;
    att.step = step;
    att.rules = rules;
    att.assembled = selected.size();
    if (selected.size() < n) {
        att.outcome = AttemptOutcome::ConstraintBlocked;
        return att;
    }
    att.aggregate_weight = scoring_.aggregate(selected);
    att.outcome = att.aggregate_weight >= rules.min_weight ? AttemptOutcome::Accepted : AttemptOutcome::WeightTooLow;
    return att;
}

SelectionResult FallbackLadder::select(const std::vector<RankedLeg> &ranked_pool, const RuleSet &base, std::size_t n,
                                       bool allow_same_entity, const Diagnostic &diagnostic) const {
    std::vector<LadderAttempt> trace;
    trace.reserve(kLadderSteps);
    std::vector<RankedLeg> selected;

    for (int step = 0; step < kLadderSteps; ++step) {
        const RuleSet rules = rules_for_step(base, step, ladder_);
        LadderAttempt att = attempt(ranked_pool, rules, step, n, allow_same_entity, selected);
        trace.push_back(att);
        if (att.outcome == AttemptOutcome::Accepted) {
            AcceptedSelection acc;
            acc.aggregate_weight = att.aggregate_weight;
            acc.relaxation_step = step;
            acc.rules_applied = rules;
            acc.tier_warnings = tier_warnings(rules, selected);
            acc.legs = std::move(selected);
            return SelectionResult::accept(std::move(acc), diagnostic, std::move(trace));
        }
        std::stringstream ss;
        ss << "ladder step " << step << " (" << describe_step(step) << ") " << to_string(att.outcome)
           << " assembled=" << att.assembled << "/" << n << " weight=" << att.aggregate_weight
           << " min=" << rules.min_weight;
        utils::debug(ss.str());
    }

    std::stringstream detail;
    detail << "all " << kLadderSteps << " relaxation steps exhausted; last attempt "
           << to_string(trace.back().outcome) << " with " << trace.back().assembled << "/" << n << " legs";
    return SelectionResult::reject(ReasonCode::NoValidSelection, detail.str(), diagnostic, std::move(trace));
}

bool FallbackLadder::admits(const RuleSet &rules, const std::vector<RankedLeg> &selection,
                            bool allow_same_entity) const {
    CorrelationGuard guard(allow_same_entity);
    for (const auto &l : selection) {
        if (l.tier == Tier::Weak && !rules.allow_weak) {
            return false;
        }
        if (guard.violates(l.leg)) {
            return false;
        }
        guard.admit(l.leg);
    }
    if (count_high_volatility(selection) > rules.max_high_volatility) {
        return false;
    }
    return scoring_.aggregate(selection) >= rules.min_weight;
}

std::vector<TierWarning> FallbackLadder::tier_warnings(const RuleSet &rules,
                                                       const std::vector<RankedLeg> &selection) const {
    std::vector<TierWarning> out;
    const TierCounts counts = count_tiers(selection);
    if (counts[Tier::Strong] < static_cast<std::size_t>(rules.min_strong)) {
        out.push_back(TierWarning{Tier::Strong, rules.min_strong, counts[Tier::Strong]});
    }
    if (counts[Tier::Moderate] < static_cast<std::size_t>(rules.min_moderate)) {
        out.push_back(TierWarning{Tier::Moderate, rules.min_moderate, counts[Tier::Moderate]});
    }
    return out;
}

}  // namespace parlay::engine
