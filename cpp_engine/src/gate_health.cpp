#include "engine/gate_health.hpp"

#include <sstream>

namespace parlay::engine {

std::string to_string(GateHealthStatus status) {
    switch (status) {
        case GateHealthStatus::Healthy:
            return "HEALTHY";
        case GateHealthStatus::Warning:
            return "WARNING";
        case GateHealthStatus::Critical:
            return "CRITICAL";
        default:
            return "UNKNOWN";
    }
}

GateHealth assess_gate_health(const Diagnostic &diag, std::size_t alert_threshold) {
    GateHealth h;
    const std::size_t gate_blocked = diag.blocked.gate_total();
    if (diag.total_candidates > 0) {
        h.gate_block_ratio = static_cast<double>(gate_blocked) / static_cast<double>(diag.total_candidates);
    }

    std::stringstream ss;
    ss << "eligible=" << diag.eligible_total << " gate_blocked=" << gate_blocked << " (A=" << diag.blocked.gate_a
       << " B=" << diag.blocked.gate_b << " both=" << diag.blocked.both << ") malformed=" << diag.malformed;

    const bool starved = diag.eligible_total < alert_threshold;
    if (starved && gate_blocked > diag.eligible_total) {
        h.status = GateHealthStatus::Critical;
        h.message = "upstream gates starving the pool: " + ss.str();
    } else if (starved || h.gate_block_ratio > 0.25) {
        h.status = GateHealthStatus::Warning;
        h.message = "pool thin or heavily gated: " + ss.str();
    } else {
        h.status = GateHealthStatus::Healthy;
        h.message = ss.str();
    }
    return h;
}

}  // namespace parlay::engine
