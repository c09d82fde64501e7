#include "engine/eligibility_gate.hpp"

namespace parlay::engine {

GateVerdict EligibilityGate::check(const Leg &leg) const {
    if (!leg.gate_a_pass && !leg.gate_b_pass) {
        return GateVerdict::BothFail;
    }
    if (!leg.gate_a_pass) {
        return GateVerdict::GateAFail;
    }
    if (!leg.gate_b_pass) {
        return GateVerdict::GateBFail;
    }
    if (!include_category_x_ && leg.category == kOptionalCategory) {
        return GateVerdict::CategoryExcluded;
    }
    return GateVerdict::Eligible;
}

GateOutcome EligibilityGate::partition(const std::vector<Leg> &legs) const {
    GateOutcome out;
    out.eligible.reserve(legs.size());
    for (const auto &leg : legs) {
        switch (check(leg)) {
            case GateVerdict::Eligible:
                out.eligible.push_back(leg);
                break;
            case GateVerdict::GateAFail:
                ++out.blocked.gate_a;
                break;
            case GateVerdict::GateBFail:
                ++out.blocked.gate_b;
                break;
            case GateVerdict::BothFail:
                ++out.blocked.both;
                break;
            case GateVerdict::CategoryExcluded:
                ++out.blocked.category_excluded;
                break;
        }
    }
    return out;
}

}  // namespace parlay::engine
