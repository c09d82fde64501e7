#include "engine/audit.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <random>
#include <sstream>

#include "engine/deterministic_hash.hpp"
#include "engine/serialize.hpp"
#include "utils/logger.hpp"

namespace parlay::engine {
namespace {

std::string request_context(const SelectionRequest &request) {
    std::stringstream ss;
    ss << "profile=" << request.risk_profile << ";legs=" << request.legs
       << ";allow_same_entity=" << (request.allow_same_entity ? 1 : 0) << ";include_category_x=";
    if (request.include_category_x) {
        ss << (*request.include_category_x ? 1 : 0);
    } else {
        ss << "default";
    }
    return ss.str();
}

}  // namespace

std::string generate_attempt_id() {
    const auto now = std::chrono::system_clock::now();
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count();
    std::mt19937_64 rng(static_cast<uint64_t>(ms) ^ std::random_device{}());
    const uint64_t salt = rng() % 1000000;
    std::stringstream ss;
    ss << "att_" << ms << "_" << salt;
    return ss.str();
}

std::string utc_timestamp() {
    const auto t = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm_buf{};
#if defined(_MSC_VER)
    gmtime_s(&tm_buf, &t);
#else
    gmtime_r(&t, &tm_buf);
#endif
    std::stringstream ss;
    ss << std::put_time(&tm_buf, "%FT%TZ");
    return ss.str();
}

std::string selection_fingerprint(const SelectionResult &result, const SelectionRequest &request) {
    if (!result.is_accepted()) {
        return std::string();
    }
    std::vector<std::string> ids;
    for (const auto &rl : result.accepted().legs) {
        ids.push_back(rl.leg.id);
    }
    return fingerprint_ids(std::move(ids), request_context(request));
}

AuditRecord build_audit_record(const std::string &attempt_id, const std::string &created_at,
                               const SelectionResult &result, const SelectionRequest &request,
                               const EngineConfig &config) {
    AuditRecord a;
    a.attempt_id = attempt_id;
    a.created_at_utc = created_at;
    a.request = request;
    a.diagnostic = result.diagnostic();
    a.status = result.status();

    const RuleSet *base = nullptr;
    if (const auto profile = parse_risk_profile(request.risk_profile)) {
        base = config.rules_for(*profile);
    }
    if (base) {
        a.base_rules = *base;
    }
    a.include_category_x = resolve_include_category_x(request, base);

    if (result.is_accepted()) {
        const AcceptedSelection &sel = result.accepted();
        a.step_reached = std::to_string(sel.relaxation_step);
        a.effective_rules = sel.rules_applied;
        a.aggregate_weight = sel.aggregate_weight;
        a.selected_count = sel.legs.size();
        a.fingerprint = selection_fingerprint(result, request);
    } else {
        a.reason = result.rejected().reason;
        if (result.ladder_trace().empty()) {
            a.step_reached = "not_run";
        } else {
            a.step_reached = "exhausted";
            a.effective_rules = result.ladder_trace().back().rules;
        }
    }
    a.gate_health = assess_gate_health(a.diagnostic, config.gate_health_alert_threshold);
    return a;
}

ClaimRecord build_claim_record(const AuditRecord &audit, const AcceptedSelection &selection) {
    ClaimRecord c;
    c.attempt_id = audit.attempt_id;
    c.created_at_utc = audit.created_at_utc;
    c.fingerprint = audit.fingerprint;
    c.risk_profile = audit.request.risk_profile;
    c.relaxation_step = selection.relaxation_step;
    c.aggregate_weight = selection.aggregate_weight;
    c.legs.reserve(selection.legs.size());
    for (const auto &rl : selection.legs) {
        c.legs.push_back(ClaimLeg{rl.leg.id, rl.leg.entity_key, rl.leg.label, rl.tier, rl.leg.category,
                                  rl.leg.volatility, rl.leg.confidence, rl.score});
    }
    return c;
}

FailEvent build_fail_event(const AuditRecord &audit, const RejectedSelection &rejection) {
    FailEvent f;
    f.attempt_id = audit.attempt_id;
    f.created_at_utc = audit.created_at_utc;
    f.risk_profile = audit.request.risk_profile;
    f.requested_legs = audit.request.legs;
    f.reason = rejection.reason;
    f.detail = rejection.detail;
    f.diagnostic = audit.diagnostic;
    return f;
}

JsonlAuditSink::JsonlAuditSink(const std::string &path) : path_(path), out_(path, std::ios::app) {
    if (!out_) {
        utils::error("cannot open audit file: " + path);
    }
}

JsonlAuditSink::~JsonlAuditSink() { flush(); }

std::size_t JsonlAuditSink::failed_writes() const {
    std::lock_guard<std::mutex> lock(mu_);
    return failed_writes_;
}

void JsonlAuditSink::write_line(const std::string &json) {
    std::lock_guard<std::mutex> lock(mu_);
    if (out_) {
        out_ << json << '\n';
    }
    if (!out_) {
        ++failed_writes_;
        utils::error("audit line dropped, write to " + path_ + " failed");
    }
}

void JsonlAuditSink::write_audit(const AuditRecord &record) { write_line(to_json(record)); }

void JsonlAuditSink::write_claim(const ClaimRecord &record) { write_line(to_json(record)); }

void JsonlAuditSink::write_fail(const FailEvent &event) { write_line(to_json(event)); }

void JsonlAuditSink::flush() {
    std::lock_guard<std::mutex> lock(mu_);
    if (!out_) {
        return;
    }
    out_.flush();
    if (!out_) {
        ++failed_writes_;
        utils::error("flush of audit file " + path_ + " failed");
    }
}

AuditRecord persist_attempt(AuditSink &sink, const SelectionResult &result, const SelectionRequest &request,
                            const EngineConfig &config) {
    AuditRecord audit = build_audit_record(generate_attempt_id(), utc_timestamp(), result, request, config);
    sink.write_audit(audit);
    if (result.is_accepted()) {
        sink.write_claim(build_claim_record(audit, result.accepted()));
    } else {
        sink.write_fail(build_fail_event(audit, result.rejected()));
    }
    return audit;
}

}  // namespace parlay::engine
