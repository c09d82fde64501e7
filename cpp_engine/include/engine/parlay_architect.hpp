#pragma once

#include <memory>
#include <vector>

#include "engine/config.hpp"
#include "engine/fallback_ladder.hpp"
#include "engine/leg_intake.hpp"
#include "engine/selection_result.hpp"

namespace parlay::engine {

struct PreparedPool {
    Diagnostic diagnostic;
    std::vector<RankedLeg> ranked;  // gate-eligible, classified, scored, in rank order
};

// Entry point for one selection request. Holds only an immutable config
// snapshot, so one instance may serve concurrent requests.
class ParlayArchitect {
  public:
    explicit ParlayArchitect(std::shared_ptr<const EngineConfig> config);

    SelectionResult select(const CandidatePool &pool, const SelectionRequest &request) const;
    SelectionResult select(const std::vector<Leg> &legs, const SelectionRequest &request) const;

    // Gate, classify and score the pool. The diagnostic is the pre-ladder
    // snapshot attached to every result.
    PreparedPool prepare(const CandidatePool &pool, bool include_category_x) const;

    const EngineConfig &config() const { return *config_; }
    const FallbackLadder &ladder() const { return ladder_; }

  private:
    std::shared_ptr<const EngineConfig> config_;
    ScoringEngine scoring_;
    FallbackLadder ladder_;
};

}  // namespace parlay::engine
