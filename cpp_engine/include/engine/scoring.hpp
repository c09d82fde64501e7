#pragma once

#include <string>
#include <vector>

#include "engine/types.hpp"

namespace parlay::engine {

enum class Combination : uint8_t { LogSum, Sum };

std::string to_string(Combination c);

struct ScoringConfig {
    Combination combine{Combination::LogSum};
};

// A leg once its tier and score are fixed for the request.
struct RankedLeg {
    Leg leg;
    Tier tier{Tier::Weak};
    double score{0.0};
};

class ScoringEngine {
  public:
    explicit ScoringEngine(ScoringConfig cfg = {}) : cfg_(cfg) {}

    double leg_score(const Leg &leg, Tier tier) const;

    // Aggregate weight, summed in ascending id order so the result does not
    // depend on the order legs were selected in.
    double aggregate(const std::vector<RankedLeg> &legs) const;

    const ScoringConfig &config() const { return cfg_; }

  private:
    ScoringConfig cfg_;
};

}  // namespace parlay::engine
