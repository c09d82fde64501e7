#include "engine/parlay_architect.hpp"

#include <sstream>
#include <stdexcept>

#include "engine/eligibility_gate.hpp"
#include "engine/gate_health.hpp"
#include "engine/tier_classifier.hpp"
#include "utils/logger.hpp"

namespace parlay::engine {
namespace {

void log_outcome(const SelectionRequest &req, const SelectionResult &result) {
    std::stringstream ss;
    ss << "selection profile=" << req.risk_profile << " legs=" << req.legs << " seed=" << req.seed << " -> "
       << to_string(result.status());
    if (result.is_accepted()) {
        ss << " step=" << result.accepted().relaxation_step << " weight=" << result.accepted().aggregate_weight;
    } else {
        ss << " reason=" << to_string(result.rejected().reason) << " eligible=" << result.diagnostic().eligible_total;
    }
    utils::info(ss.str());
}

}  // namespace

ParlayArchitect::ParlayArchitect(std::shared_ptr<const EngineConfig> config)
    : config_(std::move(config)),
      scoring_(config_ ? config_->scoring : ScoringConfig{}),
      ladder_(config_ ? config_->ladder : LadderConfig{}, scoring_) {
    if (!config_) {
        throw std::invalid_argument("ParlayArchitect requires a configuration snapshot");
    }
}

PreparedPool ParlayArchitect::prepare(const CandidatePool &pool, bool include_category_x) const {
    PreparedPool out;
    Diagnostic &diag = out.diagnostic;
    diag.total_candidates = pool.total_records;
    diag.malformed = pool.malformed();

    const EligibilityGate gate(include_category_x);
    GateOutcome gated = gate.partition(pool.legs);
    diag.blocked = gated.blocked;
    diag.eligible_total = gated.eligible.size();

    out.ranked.reserve(gated.eligible.size());
    for (auto &leg : gated.eligible) {
        const Tier tier = classify(leg, config_->thresholds);
        ++diag.eligible_by_tier[tier];
        ++diag.eligible_by_category[static_cast<std::size_t>(leg.category)];
        if (!leg.entity_key) {
            ++diag.correlation_unchecked;
            utils::warn("leg " + leg.id + " has no entity_key; correlation unchecked");
        }
        const double score = scoring_.leg_score(leg, tier);
        out.ranked.push_back(RankedLeg{std::move(leg), tier, score});
    }
    rank_pool(out.ranked);
    return out;
}

SelectionResult ParlayArchitect::select(const CandidatePool &pool, const SelectionRequest &request) const {
    const auto profile = parse_risk_profile(request.risk_profile);
    const RuleSet *base = profile ? config_->rules_for(*profile) : nullptr;
    const bool include_x = resolve_include_category_x(request, base);

    PreparedPool prepared = prepare(pool, include_x);
    const Diagnostic &diag = prepared.diagnostic;

    const GateHealth health = assess_gate_health(diag, config_->gate_health_alert_threshold);
    if (health.status == GateHealthStatus::Critical) {
        utils::warn("gate health CRITICAL: " + health.message);
    }

    auto finish = [&](SelectionResult r) {
        log_outcome(request, r);
        return r;
    };

    if (!profile) {
        return finish(SelectionResult::reject(ReasonCode::InvalidRequest,
                                              "unknown risk profile '" + request.risk_profile + "'", diag));
    }
    if (!base) {
        return finish(SelectionResult::reject(ReasonCode::InvalidRequest,
                                              "no rules configured for profile " + to_string(*profile), diag));
    }
    if (request.legs <= 0) {
        return finish(SelectionResult::reject(ReasonCode::InvalidRequest,
                                              "requested leg count must be positive, got " +
                                                  std::to_string(request.legs),
                                              diag));
    }
    const auto n = static_cast<std::size_t>(request.legs);
    if (diag.eligible_total < n) {
        return finish(SelectionResult::reject(ReasonCode::InsufficientPool,
                                              "eligible pool " + std::to_string(diag.eligible_total) +
                                                  " smaller than requested " + std::to_string(n),
                                              diag));
    }

    return finish(ladder_.select(prepared.ranked, *base, n, request.allow_same_entity, diag));
}

SelectionResult ParlayArchitect::select(const std::vector<Leg> &legs, const SelectionRequest &request) const {
    return select(CandidatePool::from_legs(legs), request);
}

}  // namespace parlay::engine
