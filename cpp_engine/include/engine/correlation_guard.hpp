#pragma once

#include <string>
#include <unordered_set>

#include "engine/types.hpp"

namespace parlay::engine {

// Same-entity exclusion for one in-progress selection. Legs without an
// entity_key are treated as unique.
class CorrelationGuard {
  public:
    explicit CorrelationGuard(bool allow_same_entity) : allow_same_entity_(allow_same_entity) {}

    bool violates(const Leg &candidate) const;
    void admit(const Leg &leg);
    void reset();

  private:
    bool allow_same_entity_{false};
    std::unordered_set<std::string> used_entities_;
};

}  // namespace parlay::engine
