#pragma once

#include <cstddef>
#include <vector>

#include "engine/rule_set.hpp"
#include "engine/scoring.hpp"
#include "engine/selection_result.hpp"

namespace parlay::engine {

// STRONG before MODERATE before WEAK, then score descending, then id ascending.
bool ranks_before(const RankedLeg &a, const RankedLeg &b);
void rank_pool(std::vector<RankedLeg> &pool);

class FallbackLadder {
  public:
    FallbackLadder(LadderConfig ladder, ScoringEngine scoring) : ladder_(ladder), scoring_(scoring) {}

    // Runs steps 0..5 in order over a ranked, gate-eligible pool and stops at
    // the first step whose assembly reaches `n` legs and the step's minimum
    // weight. `diagnostic` is attached unchanged to either outcome.
    SelectionResult select(const std::vector<RankedLeg> &ranked_pool, const RuleSet &base, std::size_t n,
                           bool allow_same_entity, const Diagnostic &diagnostic) const;

    // One greedy assembly under fixed rules. `selected` receives the legs in
    // pick order even when the attempt fails.
    LadderAttempt attempt(const std::vector<RankedLeg> &ranked_pool, const RuleSet &rules, int step, std::size_t n,
                          bool allow_same_entity, std::vector<RankedLeg> &selected) const;

    // Hard constraints of `rules` checked against a finished selection.
    bool admits(const RuleSet &rules, const std::vector<RankedLeg> &selection, bool allow_same_entity) const;

    std::vector<TierWarning> tier_warnings(const RuleSet &rules, const std::vector<RankedLeg> &selection) const;

    const LadderConfig &ladder() const { return ladder_; }
    const ScoringEngine &scoring() const { return scoring_; }

  private:
    LadderConfig ladder_;
    ScoringEngine scoring_;
};

}  // namespace parlay::engine
