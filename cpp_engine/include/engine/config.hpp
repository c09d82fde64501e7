#pragma once

#include <cstddef>
#include <filesystem>
#include <istream>
#include <map>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>

#include "engine/rule_set.hpp"
#include "engine/scoring.hpp"
#include "engine/tier_classifier.hpp"

namespace parlay::engine {

class ConfigError : public std::runtime_error {
  public:
    explicit ConfigError(const std::string &msg) : std::runtime_error(msg) {}
};

// Static engine configuration. Built once, never mutated after validate().
struct EngineConfig {
    TierThresholds thresholds;
    LadderConfig ladder;
    ScoringConfig scoring;
    std::map<RiskProfile, RuleSet> profiles;
    std::size_t gate_health_alert_threshold{5};
    std::string source{"default"};

    static EngineConfig defaults();
    static RuleSet default_rules(RiskProfile profile);

    const RuleSet *rules_for(RiskProfile profile) const;
    void validate() const;
};

// YAML-subset reader: `key: value` pairs, sections by indentation, `#`
// comments. Throws ConfigError on unknown keys, bad numbers or values that
// fail validation.
EngineConfig parse_engine_config(std::istream &in, const std::string &source);
EngineConfig load_engine_config(const std::filesystem::path &path);

// Holds the live configuration. Readers take a snapshot; replace() swaps the
// whole config at once so a request never sees a partial update.
class ConfigStore {
  public:
    explicit ConfigStore(EngineConfig initial);

    std::shared_ptr<const EngineConfig> snapshot() const;
    void replace(EngineConfig next);
    void reload(const std::filesystem::path &path);

  private:
    mutable std::mutex mu_;
    std::shared_ptr<const EngineConfig> current_;
};

}  // namespace parlay::engine
