#pragma once

#include <cstddef>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

#include "engine/types.hpp"

namespace parlay::engine {

enum class IntakeIssue : uint8_t {
    MissingId,
    DuplicateId,
    MissingQualityState,
    BadConfidence,
    BadVolatility,
    BadCategory,
    BadGateFlag,
    BadNumber,
    BadShape
};

std::string to_string(IntakeIssue issue);

// Loosely-typed upstream record: field name -> raw text.
using RawLegRecord = std::map<std::string, std::string>;

struct LegValidation {
    bool ok{false};
    Leg leg;
    IntakeIssue issue{IntakeIssue::MissingId};
    std::string message;
};

// Candidate legs for one request plus what was quarantined on the way in.
struct CandidatePool {
    std::vector<Leg> legs;
    std::size_t total_records{0};
    std::map<IntakeIssue, std::size_t> issues;

    std::size_t malformed() const;
    static CandidatePool from_legs(std::vector<Leg> legs);
};

class LegIntake {
  public:
    LegIntake() = default;

    // Field-level conversion only; duplicate ids are caught by add().
    static LegValidation validate(const RawLegRecord &record);

    void add(const RawLegRecord &record);
    void add_all(const std::vector<RawLegRecord> &records);
    void quarantine(IntakeIssue issue, const std::string &message);

    const CandidatePool &pool() const { return pool_; }
    CandidatePool take();

  private:
    CandidatePool pool_;
    std::unordered_set<std::string> seen_ids_;
};

// Header-named CSV: one leg per row. Rows whose column count does not match
// the header are quarantined as BadShape.
std::optional<CandidatePool> load_legs_csv(const std::filesystem::path &path);

}  // namespace parlay::engine
