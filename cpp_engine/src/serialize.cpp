#include "engine/serialize.hpp"

#include <cstdio>
#include <iomanip>
#include <optional>
#include <sstream>

namespace parlay::engine {
namespace {

std::string quoted(const std::string &s) { return "\"" + escape_json(s) + "\""; }

std::stringstream json_stream() {
    std::stringstream ss;
    ss << std::setprecision(10) << std::boolalpha;
    return ss;
}

void write_optional_string(std::ostream &out, const std::optional<std::string> &s) {
    if (s) {
        out << quoted(*s);
    } else {
        out << "null";
    }
}

void write_leg(std::ostream &out, const RankedLeg &rl) {
    out << "{\"id\":" << quoted(rl.leg.id) << ",\"entity_key\":";
    write_optional_string(out, rl.leg.entity_key);
    out << ",\"label\":" << quoted(rl.leg.label) << ",\"tier\":" << quoted(to_string(rl.tier))
        << ",\"category\":" << quoted(to_string(rl.leg.category))
        << ",\"volatility\":" << quoted(to_string(rl.leg.volatility)) << ",\"confidence\":" << rl.leg.confidence
        << ",\"score\":" << rl.score << "}";
}

void write_trace(std::ostream &out, const std::vector<LadderAttempt> &trace) {
    out << "[";
    for (std::size_t i = 0; i < trace.size(); ++i) {
        const LadderAttempt &a = trace[i];
        if (i > 0) {
            out << ",";
        }
        out << "{\"step\":" << a.step << ",\"action\":" << quoted(describe_step(a.step))
            << ",\"outcome\":" << quoted(to_string(a.outcome)) << ",\"assembled\":" << a.assembled
            << ",\"aggregate_weight\":" << a.aggregate_weight << ",\"rules\":" << to_json(a.rules) << "}";
    }
    out << "]";
}

}  // namespace

std::string escape_json(const std::string &s) {
    std::string out;
    out.reserve(s.size() + 2);
    for (unsigned char c : s) {
        switch (c) {
            case '"':
                out += "\\\"";
                break;
            case '\\':
                out += "\\\\";
                break;
            case '\n':
                out += "\\n";
                break;
            case '\r':
                out += "\\r";
                break;
            case '\t':
                out += "\\t";
                break;
            default:
                if (c < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", c);
                    out += buf;
                } else {
                    out.push_back(static_cast<char>(c));
                }
        }
    }
    return out;
}

std::string to_json(const RuleSet &rules) {
    auto ss = json_stream();
    ss << "{\"min_weight\":" << rules.min_weight << ",\"min_strong\":" << rules.min_strong
       << ",\"min_moderate\":" << rules.min_moderate << ",\"allow_weak\":" << rules.allow_weak
       << ",\"max_high_volatility\":" << rules.max_high_volatility
       << ",\"include_category_x\":" << rules.include_category_x << "}";
    return ss.str();
}

std::string to_json(const Diagnostic &diag) {
    auto ss = json_stream();
    ss << "{\"total_candidates\":" << diag.total_candidates << ",\"malformed\":" << diag.malformed
       << ",\"eligible_total\":" << diag.eligible_total << ",\"eligible_by_tier\":{";
    for (std::size_t t = 0; t < kTierCount; ++t) {
        const Tier tier = static_cast<Tier>(t);
        ss << (t > 0 ? "," : "") << quoted(to_string(tier)) << ":" << diag.eligible_by_tier[tier];
    }
    ss << "},\"eligible_by_category\":{";
    for (std::size_t c = 0; c < kCategoryCount; ++c) {
        ss << (c > 0 ? "," : "") << quoted(to_string(static_cast<MarketCategory>(c))) << ":"
           << diag.eligible_by_category[c];
    }
    ss << "},\"blocked\":{\"gate_a\":" << diag.blocked.gate_a << ",\"gate_b\":" << diag.blocked.gate_b
       << ",\"both\":" << diag.blocked.both << ",\"category_excluded\":" << diag.blocked.category_excluded
       << "},\"correlation_unchecked\":" << diag.correlation_unchecked << "}";
    return ss.str();
}

std::string to_json(const SelectionResult &result) {
    auto ss = json_stream();
    ss << "{\"status\":" << quoted(to_string(result.status()));
    if (result.is_accepted()) {
        const AcceptedSelection &sel = result.accepted();
        ss << ",\"legs\":[";
        for (std::size_t i = 0; i < sel.legs.size(); ++i) {
            if (i > 0) {
                ss << ",";
            }
            write_leg(ss, sel.legs[i]);
        }
        ss << "],\"aggregate_weight\":" << sel.aggregate_weight << ",\"relaxation_step\":" << sel.relaxation_step
           << ",\"rules_applied\":" << to_json(sel.rules_applied) << ",\"tier_warnings\":[";
        for (std::size_t i = 0; i < sel.tier_warnings.size(); ++i) {
            const TierWarning &w = sel.tier_warnings[i];
            ss << (i > 0 ? "," : "") << "{\"tier\":" << quoted(to_string(w.tier)) << ",\"preferred\":" << w.preferred
               << ",\"actual\":" << w.actual << "}";
        }
        ss << "]";
    } else {
        const RejectedSelection &rej = result.rejected();
        ss << ",\"reason_code\":" << quoted(to_string(rej.reason)) << ",\"detail\":" << quoted(rej.detail)
           << ",\"diagnostic\":" << to_json(result.diagnostic());
    }
    ss << ",\"ladder_trace\":";
    write_trace(ss, result.ladder_trace());
    ss << "}";
    return ss.str();
}

std::string to_json(const AuditRecord &record) {
    auto ss = json_stream();
    ss << "{\"record\":\"audit\",\"attempt_id\":" << quoted(record.attempt_id)
       << ",\"created_at_utc\":" << quoted(record.created_at_utc) << ",\"request\":{\"legs\":" << record.request.legs
       << ",\"risk_profile\":" << quoted(record.request.risk_profile)
       << ",\"allow_same_entity\":" << record.request.allow_same_entity
       << ",\"include_category_x\":" << record.include_category_x << ",\"seed\":" << record.request.seed << "}"
       << ",\"diagnostic\":" << to_json(record.diagnostic) << ",\"base_rules\":";
    ss << (record.base_rules ? to_json(*record.base_rules) : std::string("null"));
    ss << ",\"step_reached\":" << quoted(record.step_reached) << ",\"effective_rules\":";
    ss << (record.effective_rules ? to_json(*record.effective_rules) : std::string("null"));
    ss << ",\"status\":" << quoted(to_string(record.status)) << ",\"reason_code\":";
    ss << (record.reason ? quoted(to_string(*record.reason)) : std::string("null"));
    ss << ",\"aggregate_weight\":" << record.aggregate_weight << ",\"selected_count\":" << record.selected_count
       << ",\"fingerprint\":" << quoted(record.fingerprint) << ",\"gate_health\":{\"status\":"
       << quoted(to_string(record.gate_health.status)) << ",\"gate_block_ratio\":" << record.gate_health.gate_block_ratio
       << ",\"message\":" << quoted(record.gate_health.message) << "}}";
    return ss.str();
}

std::string to_json(const ClaimRecord &record) {
    auto ss = json_stream();
    ss << "{\"record\":\"claim\",\"attempt_id\":" << quoted(record.attempt_id)
       << ",\"created_at_utc\":" << quoted(record.created_at_utc) << ",\"fingerprint\":" << quoted(record.fingerprint)
       << ",\"risk_profile\":" << quoted(record.risk_profile) << ",\"relaxation_step\":" << record.relaxation_step
       << ",\"aggregate_weight\":" << record.aggregate_weight << ",\"legs\":[";
    for (std::size_t i = 0; i < record.legs.size(); ++i) {
        const ClaimLeg &l = record.legs[i];
        ss << (i > 0 ? "," : "") << "{\"id\":" << quoted(l.id) << ",\"entity_key\":";
        write_optional_string(ss, l.entity_key);
        ss << ",\"label\":" << quoted(l.label) << ",\"tier\":" << quoted(to_string(l.tier))
           << ",\"category\":" << quoted(to_string(l.category)) << ",\"volatility\":" << quoted(to_string(l.volatility))
           << ",\"confidence\":" << l.confidence << ",\"score\":" << l.score << "}";
    }
    ss << "]}";
    return ss.str();
}

std::string to_json(const FailEvent &event) {
    auto ss = json_stream();
    ss << "{\"record\":\"fail\",\"attempt_id\":" << quoted(event.attempt_id)
       << ",\"created_at_utc\":" << quoted(event.created_at_utc) << ",\"risk_profile\":" << quoted(event.risk_profile)
       << ",\"requested_legs\":" << event.requested_legs << ",\"reason_code\":" << quoted(to_string(event.reason))
       << ",\"detail\":" << quoted(event.detail) << ",\"diagnostic\":" << to_json(event.diagnostic) << "}";
    return ss.str();
}

}  // namespace parlay::engine
