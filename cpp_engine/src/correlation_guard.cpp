#include "engine/correlation_guard.hpp"

namespace parlay::engine {

bool CorrelationGuard::violates(const Leg &candidate) const {
    if (allow_same_entity_ || !candidate.entity_key) {
        return false;
    }
    return used_entities_.count(*candidate.entity_key) > 0;
}

void CorrelationGuard::admit(const Leg &leg) {
    if (leg.entity_key) {
        used_entities_.insert(*leg.entity_key);
    }
}

void CorrelationGuard::reset() {
    used_entities_.clear();
}

}  // namespace parlay::engine
