#include "engine/config.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <sstream>
#include <utility>
#include <vector>

#include "utils/logger.hpp"

namespace parlay::engine {
namespace {

std::string trim(const std::string &s) {
    const std::size_t start = s.find_first_not_of(" \t\r");
    if (start == std::string::npos) {
        return std::string();
    }
    const std::size_t end = s.find_last_not_of(" \t\r");
    return s.substr(start, end - start + 1);
}

std::string strip_quotes(const std::string &s) {
    std::size_t start = 0;
    std::size_t end = s.size();
    while (start < end && (s[start] == '"' || s[start] == '\'')) {
        ++start;
    }
    while (end > start && (s[end - 1] == '"' || s[end - 1] == '\'')) {
        --end;
    }
    return s.substr(start, end - start);
}

std::string strip_comment(const std::string &s) {
    for (std::size_t i = 0; i < s.size(); ++i) {
        if (s[i] == '#' && (i == 0 || s[i - 1] == ' ' || s[i - 1] == '\t')) {
            return s.substr(0, i);
        }
    }
    return s;
}

class LineError {
  public:
    LineError(std::string source, int lineno) : source_(std::move(source)), lineno_(lineno) {}

    [[noreturn]] void fail(const std::string &msg) const {
        throw ConfigError(source_ + ":" + std::to_string(lineno_) + ": " + msg);
    }

  private:
    std::string source_;
    int lineno_;
};

double parse_double(const std::string &raw, const LineError &err) {
    const std::string val = strip_quotes(raw);
    std::size_t used = 0;
    double out = 0.0;
    try {
        out = std::stod(val, &used);
    } catch (const std::exception &) {
        err.fail("expected a number, got '" + val + "'");
    }
    if (used != val.size()) {
        err.fail("trailing characters after number '" + val + "'");
    }
    return out;
}

int parse_int(const std::string &raw, const LineError &err) {
    const std::string val = strip_quotes(raw);
    std::size_t used = 0;
    int out = 0;
    try {
        out = std::stoi(val, &used);
    } catch (const std::exception &) {
        err.fail("expected an integer, got '" + val + "'");
    }
    if (used != val.size()) {
        err.fail("trailing characters after integer '" + val + "'");
    }
    return out;
}

bool parse_bool(const std::string &raw, const LineError &err) {
    std::string val = strip_quotes(raw);
    std::transform(val.begin(), val.end(), val.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (val == "true" || val == "yes" || val == "1") {
        return true;
    }
    if (val == "false" || val == "no" || val == "0") {
        return false;
    }
    err.fail("expected a boolean, got '" + raw + "'");
}

void apply_threshold(EngineConfig &cfg, const std::string &key, const std::string &val, const LineError &err) {
    const double v = parse_double(val, err);
    if (key == "default") {
        for (auto &t : cfg.thresholds.by_category) {
            t = v;
        }
        return;
    }
    const auto category = parse_market_category(key);
    if (!category) {
        err.fail("unknown market category '" + key + "' in tier_thresholds");
    }
    cfg.thresholds[*category] = v;
}

void apply_profile_key(RuleSet &rules, const std::string &key, const std::string &val, const LineError &err) {
    if (key == "min_weight") {
        rules.min_weight = parse_double(val, err);
    } else if (key == "min_strong") {
        rules.min_strong = parse_int(val, err);
    } else if (key == "min_moderate") {
        rules.min_moderate = parse_int(val, err);
    } else if (key == "allow_weak") {
        rules.allow_weak = parse_bool(val, err);
    } else if (key == "max_high_volatility") {
        rules.max_high_volatility = parse_int(val, err);
    } else if (key == "include_category_x") {
        rules.include_category_x = parse_bool(val, err);
    } else {
        err.fail("unknown profile key '" + key + "'");
    }
}

}  // namespace

RuleSet EngineConfig::default_rules(RiskProfile profile) {
    switch (profile) {
        case RiskProfile::Premium:
            return RuleSet{3.10, 2, 1, false, 1, false};
        case RiskProfile::Balanced:
            return RuleSet{2.85, 1, 1, true, 2, false};
        case RiskProfile::Speculative:
        default:
            return RuleSet{2.55, 0, 0, true, 3, false};
    }
}

EngineConfig EngineConfig::defaults() {
    EngineConfig cfg;
    for (auto p : {RiskProfile::Premium, RiskProfile::Balanced, RiskProfile::Speculative}) {
        cfg.profiles[p] = default_rules(p);
    }
    return cfg;
}

const RuleSet *EngineConfig::rules_for(RiskProfile profile) const {
    auto it = profiles.find(profile);
    return it == profiles.end() ? nullptr : &it->second;
}

void EngineConfig::validate() const {
    for (std::size_t i = 0; i < kCategoryCount; ++i) {
        if (!threshold_in_range(thresholds.by_category[i])) {
            throw ConfigError(source + ": tier threshold for " + to_string(static_cast<MarketCategory>(i)) +
                              " must be in (0,1], got " + std::to_string(thresholds.by_category[i]));
        }
    }
    if (!std::isfinite(ladder.first_weight_delta) || !std::isfinite(ladder.second_weight_delta) ||
        ladder.first_weight_delta < 0.0 || ladder.second_weight_delta < 0.0) {
        throw ConfigError(source + ": ladder weight deltas must be >= 0 and finite");
    }
    if (profiles.empty()) {
        throw ConfigError(source + ": no risk profiles configured");
    }
    for (const auto &kv : profiles) {
        const RuleSet &r = kv.second;
        const std::string name = to_string(kv.first);
        if (!std::isfinite(r.min_weight) || r.min_weight < 0.0) {
            throw ConfigError(source + ": profile " + name + " min_weight must be >= 0 and finite");
        }
        if (r.min_strong < 0 || r.min_moderate < 0 || r.max_high_volatility < 0) {
            throw ConfigError(source + ": profile " + name + " counts must be >= 0");
        }
        if (r.max_high_volatility > kMaxHighVolatilityCap) {
            throw ConfigError(source + ": profile " + name + " max_high_volatility must be <= " +
                              std::to_string(kMaxHighVolatilityCap));
        }
    }
}

EngineConfig parse_engine_config(std::istream &in, const std::string &source) {
    EngineConfig cfg = EngineConfig::defaults();
    cfg.source = source;
    bool profiles_seen = false;

    // (indent, section name) from the outermost section inwards.
    std::vector<std::pair<std::size_t, std::string>> path;
    std::string line;
    int lineno = 0;
    while (std::getline(in, line)) {
        ++lineno;
        const LineError err(source, lineno);
        const std::string content = strip_comment(line);
        if (trim(content).empty()) {
            continue;
        }
        const std::size_t indent = content.find_first_not_of(' ');
        if (content[indent] == '\t') {
            err.fail("tabs are not allowed for indentation");
        }
        const std::string body = trim(content);
        const auto colon = body.find(':');
        if (colon == std::string::npos) {
            err.fail("expected 'key: value'");
        }
        const std::string key = trim(body.substr(0, colon));
        const std::string val = trim(body.substr(colon + 1));

        while (!path.empty() && path.back().first >= indent) {
            path.pop_back();
        }

        if (val.empty()) {
            if (path.empty()) {
                if (key != "tier_thresholds" && key != "ladder" && key != "scoring" && key != "profiles" &&
                    key != "gate_health") {
                    err.fail("unknown section '" + key + "'");
                }
                if (key == "profiles" && !profiles_seen) {
                    // A profiles section replaces the built-in table.
                    cfg.profiles.clear();
                    profiles_seen = true;
                }
            } else if (path.size() == 1 && path[0].second == "profiles") {
                const auto profile = parse_risk_profile(key);
                if (!profile) {
                    err.fail("unknown risk profile '" + key + "'");
                }
                cfg.profiles[*profile] = EngineConfig::default_rules(*profile);
            } else {
                err.fail("unexpected nested section '" + key + "'");
            }
            path.emplace_back(indent, key);
            continue;
        }

        if (path.empty()) {
            err.fail("key '" + key + "' outside of any section");
        }
        const std::string &section = path[0].second;
        if (section == "tier_thresholds" && path.size() == 1) {
            apply_threshold(cfg, key, val, err);
        } else if (section == "ladder" && path.size() == 1) {
            if (key == "first_weight_delta") {
                cfg.ladder.first_weight_delta = parse_double(val, err);
            } else if (key == "second_weight_delta") {
                cfg.ladder.second_weight_delta = parse_double(val, err);
            } else {
                err.fail("unknown ladder key '" + key + "'");
            }
        } else if (section == "scoring" && path.size() == 1) {
            if (key != "combine") {
                err.fail("unknown scoring key '" + key + "'");
            }
            const std::string mode = strip_quotes(val);
            if (mode == "log_sum") {
                cfg.scoring.combine = Combination::LogSum;
            } else if (mode == "sum") {
                cfg.scoring.combine = Combination::Sum;
            } else {
                err.fail("scoring.combine must be log_sum or sum");
            }
        } else if (section == "gate_health" && path.size() == 1) {
            if (key != "alert_threshold") {
                err.fail("unknown gate_health key '" + key + "'");
            }
            const int v = parse_int(val, err);
            if (v < 0) {
                err.fail("gate_health.alert_threshold must be >= 0");
            }
            cfg.gate_health_alert_threshold = static_cast<std::size_t>(v);
        } else if (section == "profiles" && path.size() == 2) {
            const auto profile = parse_risk_profile(path[1].second);
            apply_profile_key(cfg.profiles[*profile], key, val, err);
        } else {
            err.fail("key '" + key + "' is not valid here");
        }
    }

    cfg.validate();
    return cfg;
}

EngineConfig load_engine_config(const std::filesystem::path &path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        throw ConfigError("cannot open config file: " + path.string());
    }
    EngineConfig cfg = parse_engine_config(in, "file:" + path.string());
    std::stringstream ss;
    ss << "Loaded engine config from " << path.string() << " profiles=" << cfg.profiles.size()
       << " combine=" << to_string(cfg.scoring.combine);
    utils::info(ss.str());
    return cfg;
}

ConfigStore::ConfigStore(EngineConfig initial) {
    initial.validate();
    current_ = std::make_shared<const EngineConfig>(std::move(initial));
}

std::shared_ptr<const EngineConfig> ConfigStore::snapshot() const {
    std::lock_guard<std::mutex> guard(mu_);
    return current_;
}

void ConfigStore::replace(EngineConfig next) {
    next.validate();
    auto fresh = std::make_shared<const EngineConfig>(std::move(next));
    std::lock_guard<std::mutex> guard(mu_);
    current_ = std::move(fresh);
}

void ConfigStore::reload(const std::filesystem::path &path) { replace(load_engine_config(path)); }

}  // namespace parlay::engine
