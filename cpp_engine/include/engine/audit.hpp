#pragma once

#include <cstddef>
#include <fstream>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "engine/config.hpp"
#include "engine/gate_health.hpp"
#include "engine/selection_result.hpp"

namespace parlay::engine {

// One per invocation, accepted or not.
struct AuditRecord {
    std::string attempt_id;
    std::string created_at_utc;
    SelectionRequest request;
    bool include_category_x{false};  // resolved value actually used
    Diagnostic diagnostic;
    std::optional<RuleSet> base_rules;
    std::string step_reached;  // "0".."5", "exhausted" or "not_run"
    std::optional<RuleSet> effective_rules;
    SelectionStatus status{SelectionStatus::Rejected};
    std::optional<ReasonCode> reason;
    double aggregate_weight{0.0};
    std::size_t selected_count{0};
    std::string fingerprint;  // empty on rejection
    GateHealth gate_health;
};

struct ClaimLeg {
    std::string id;
    std::optional<std::string> entity_key;
    std::string label;
    Tier tier{Tier::Weak};
    MarketCategory category{MarketCategory::Spread};
    Volatility volatility{Volatility::Low};
    double confidence{0.0};
    double score{0.0};
};

struct ClaimRecord {
    std::string attempt_id;
    std::string created_at_utc;
    std::string fingerprint;
    std::string risk_profile;
    int relaxation_step{0};
    double aggregate_weight{0.0};
    std::vector<ClaimLeg> legs;
};

struct FailEvent {
    std::string attempt_id;
    std::string created_at_utc;
    std::string risk_profile;
    int requested_legs{0};
    ReasonCode reason{ReasonCode::NoValidSelection};
    std::string detail;
    Diagnostic diagnostic;
};

std::string generate_attempt_id();
std::string utc_timestamp();

// Fingerprint over the selected ids and the request parameters that shape
// a selection. The seed is left out since it never changes which legs are
// picked. Empty for a rejected result.
std::string selection_fingerprint(const SelectionResult &result, const SelectionRequest &request);

AuditRecord build_audit_record(const std::string &attempt_id, const std::string &created_at,
                               const SelectionResult &result, const SelectionRequest &request,
                               const EngineConfig &config);
ClaimRecord build_claim_record(const AuditRecord &audit, const AcceptedSelection &selection);
FailEvent build_fail_event(const AuditRecord &audit, const RejectedSelection &rejection);

class AuditSink {
  public:
    virtual ~AuditSink() = default;
    virtual void write_audit(const AuditRecord &record) = 0;
    virtual void write_claim(const ClaimRecord &record) = 0;
    virtual void write_fail(const FailEvent &event) = 0;
};

// One JSON object per line, appended. Lines that cannot be written are
// logged at ERROR and counted.
class JsonlAuditSink : public AuditSink {
  public:
    explicit JsonlAuditSink(const std::string &path);
    ~JsonlAuditSink() override;

    bool is_open() const { return out_.is_open(); }
    std::size_t failed_writes() const;

    void write_audit(const AuditRecord &record) override;
    void write_claim(const ClaimRecord &record) override;
    void write_fail(const FailEvent &event) override;
    void flush();

  private:
    void write_line(const std::string &json);

    std::string path_;
    mutable std::mutex mu_;
    std::ofstream out_;
    std::size_t failed_writes_{0};
};

// Writes the audit record, then a claim (accepted) or a fail event
// (rejected). Returns the audit record written.
AuditRecord persist_attempt(AuditSink &sink, const SelectionResult &result, const SelectionRequest &request,
                            const EngineConfig &config);

}  // namespace parlay::engine
