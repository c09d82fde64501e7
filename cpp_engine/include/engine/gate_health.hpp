#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

#include "engine/selection_result.hpp"

namespace parlay::engine {

enum class GateHealthStatus : uint8_t { Healthy, Warning, Critical };

std::string to_string(GateHealthStatus status);

struct GateHealth {
    GateHealthStatus status{GateHealthStatus::Healthy};
    double gate_block_ratio{0.0};  // gate-blocked / total candidates
    std::string message;
};

// Separates "upstream data problem" (hard gates starving the pool) from
// "rules too strict" (plenty eligible, still rejected).
GateHealth assess_gate_health(const Diagnostic &diag, std::size_t alert_threshold);

}  // namespace parlay::engine
