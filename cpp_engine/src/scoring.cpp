#include "engine/scoring.hpp"

#include <algorithm>
#include <cmath>

namespace parlay::engine {
namespace {

double tier_base(Tier tier) {
    switch (tier) {
        case Tier::Strong:
            return 1.00;
        case Tier::Moderate:
            return 0.70;
        case Tier::Weak:
        default:
            return 0.45;
    }
}

double volatility_penalty(Volatility vol) {
    switch (vol) {
        case Volatility::Low:
            return 0.00;
        case Volatility::Medium:
            return 0.06;
        case Volatility::High:
        default:
            return 0.12;
    }
}

}  // namespace

std::string to_string(Combination c) { return c == Combination::Sum ? "sum" : "log_sum"; }

double ScoringEngine::leg_score(const Leg &leg, Tier tier) const {
    const double conf = std::clamp(leg.confidence, 0.0, 1.0);
    const double clv_boost = std::clamp(leg.clv / 100.0, -0.02, 0.02);
    const double dev_boost = std::min(0.25, std::abs(leg.edge_points) / 20.0);
    const double ev_boost = std::min(0.10, std::max(0.0, leg.ev));
    const double injury_penalty = leg.injury_stable ? 0.0 : 0.08;
    const double locked_penalty = leg.locked ? 0.15 : 0.0;

    const double score = tier_base(tier) + 0.65 * conf + clv_boost + 0.35 * dev_boost + ev_boost -
                         volatility_penalty(leg.volatility) - injury_penalty - locked_penalty;
    return std::max(0.0, score);
}

double ScoringEngine::aggregate(const std::vector<RankedLeg> &legs) const {
    std::vector<const RankedLeg *> ordered;
    ordered.reserve(legs.size());
    for (const auto &l : legs) {
        ordered.push_back(&l);
    }
    std::sort(ordered.begin(), ordered.end(),
              [](const RankedLeg *a, const RankedLeg *b) { return a->leg.id < b->leg.id; });

    double total = 0.0;
    for (const auto *l : ordered) {
        if (cfg_.combine == Combination::Sum) {
            total += l->score;
        } else {
            total += std::log(std::max(1e-6, l->score) + 1.0);
        }
    }
    return total;
}

}  // namespace parlay::engine
