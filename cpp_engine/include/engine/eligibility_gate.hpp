#pragma once

#include <vector>

#include "engine/types.hpp"

namespace parlay::engine {

enum class GateVerdict : uint8_t { Eligible, GateAFail, GateBFail, BothFail, CategoryExcluded };

struct GateOutcome {
    std::vector<Leg> eligible;
    BlockedCounts blocked;
};

// Hard eligibility filter. Never relaxed by the fallback ladder.
class EligibilityGate {
  public:
    explicit EligibilityGate(bool include_category_x) : include_category_x_(include_category_x) {}

    GateVerdict check(const Leg &leg) const;
    GateOutcome partition(const std::vector<Leg> &legs) const;
    bool include_category_x() const { return include_category_x_; }

  private:
    bool include_category_x_{false};
};

}  // namespace parlay::engine
