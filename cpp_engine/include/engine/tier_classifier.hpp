#pragma once

#include <array>

#include "engine/types.hpp"

namespace parlay::engine {

// Confidence cutoff per market category for promoting an intermediate signal
// to MODERATE. Noisier categories carry higher cutoffs.
struct TierThresholds {
    std::array<double, kCategoryCount> by_category{0.60, 0.60, 0.60, 0.65};

    double &operator[](MarketCategory c) { return by_category[static_cast<std::size_t>(c)]; }
    double operator[](MarketCategory c) const { return by_category[static_cast<std::size_t>(c)]; }
};

bool threshold_in_range(double value);

Tier classify(const Leg &leg, const TierThresholds &thresholds);

}  // namespace parlay::engine
