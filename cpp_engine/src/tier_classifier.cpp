#include "engine/tier_classifier.hpp"

namespace parlay::engine {

bool threshold_in_range(double value) { return value > 0.0 && value <= 1.0; }

Tier classify(const Leg &leg, const TierThresholds &thresholds) {
    switch (leg.quality_state) {
        case QualityState::Strong:
            return Tier::Strong;
        case QualityState::Intermediate:
            return leg.confidence >= thresholds[leg.category] ? Tier::Moderate : Tier::Weak;
        case QualityState::Weak:
        case QualityState::Undecided:
        default:
            return Tier::Weak;
    }
}

}  // namespace parlay::engine
