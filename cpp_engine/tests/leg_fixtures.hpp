#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "engine/config.hpp"
#include "engine/types.hpp"

namespace parlay::testing {

// STRONG, confidence 0.9, LOW volatility, edge 5.0 -> score 1.6725.
inline engine::Leg strong_leg(const std::string &id, std::optional<std::string> entity) {
    engine::Leg l;
    l.id = id;
    l.entity_key = std::move(entity);
    l.label = "strong " + id;
    l.quality_state = engine::QualityState::Strong;
    l.confidence = 0.9;
    l.volatility = engine::Volatility::Low;
    l.category = engine::MarketCategory::Spread;
    l.gate_a_pass = true;
    l.gate_b_pass = true;
    l.edge_points = 5.0;
    return l;
}

// WEAK, confidence 0.55, LOW volatility, no boosts -> score 0.8075.
inline engine::Leg weak_leg(const std::string &id, std::optional<std::string> entity) {
    engine::Leg l;
    l.id = id;
    l.entity_key = std::move(entity);
    l.label = "weak " + id;
    l.quality_state = engine::QualityState::Weak;
    l.confidence = 0.55;
    l.volatility = engine::Volatility::Low;
    l.category = engine::MarketCategory::Total;
    l.gate_a_pass = true;
    l.gate_b_pass = true;
    return l;
}

inline std::string pad_id(const std::string &prefix, int i) {
    std::string n = std::to_string(i);
    while (n.size() < 3) {
        n = "0" + n;
    }
    return prefix + n;
}

inline std::shared_ptr<const engine::EngineConfig> default_config() {
    return std::make_shared<const engine::EngineConfig>(engine::EngineConfig::defaults());
}

// Deterministic mixed pool: every tier, volatility and category, a few gate
// failures and some shared entities.
inline std::vector<engine::Leg> mixed_pool(int n) {
    std::vector<engine::Leg> pool;
    for (int i = 0; i < n; ++i) {
        engine::Leg l;
        l.id = pad_id("mx", i);
        if (i % 7 != 0) {
            l.entity_key = "team" + std::to_string(i % 11);
        }
        l.quality_state = static_cast<engine::QualityState>(i % 4);
        l.confidence = 0.40 + 0.05 * static_cast<double>(i % 12);
        l.volatility = static_cast<engine::Volatility>((i / 2) % 3);
        l.category = static_cast<engine::MarketCategory>(i % 4);
        l.gate_a_pass = i % 9 != 4;
        l.gate_b_pass = i % 13 != 6;
        l.clv = static_cast<double>(i % 5) - 2.0;
        l.edge_points = static_cast<double>(i % 6);
        l.ev = 0.01 * static_cast<double>(i % 8);
        l.injury_stable = i % 10 != 3;
        pool.push_back(l);
    }
    return pool;
}

}  // namespace parlay::testing
