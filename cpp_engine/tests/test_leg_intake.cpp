#include <cassert>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <string>

#include "engine/leg_intake.hpp"
#include "utils/logger.hpp"

using namespace parlay::engine;

namespace {

RawLegRecord good_record(const std::string &id) {
    return RawLegRecord{{"id", id},
                        {"entity_key", "BOS"},
                        {"label", "Celtics -3.5"},
                        {"quality_state", "LEAN"},
                        {"confidence", "0.64"},
                        {"volatility", "medium"},
                        {"category", "spread"},
                        {"gate_a", "pass"},
                        {"gate_b", "1"},
                        {"clv", "1.5"},
                        {"edge_points", "-2"},
                        {"ev", "0.03"},
                        {"injury_stable", "no"}};
}

void field_validation() {
    const LegValidation v = LegIntake::validate(good_record("g1"));
    assert(v.ok);
    assert(v.leg.id == "g1");
    assert(v.leg.entity_key && *v.leg.entity_key == "BOS");
    assert(v.leg.quality_state == QualityState::Intermediate);
    assert(v.leg.volatility == Volatility::Medium);
    assert(v.leg.category == MarketCategory::Spread);
    assert(v.leg.gate_a_pass && v.leg.gate_b_pass);
    assert(v.leg.edge_points == -2.0);
    assert(!v.leg.injury_stable);
    assert(!v.leg.locked);

    RawLegRecord pct = good_record("g2");
    pct["confidence"] = "72";
    pct.erase("entity_key");
    const LegValidation p = LegIntake::validate(pct);
    assert(p.ok);
    assert(std::abs(p.leg.confidence - 0.72) < 1e-12);
    assert(!p.leg.entity_key);

    auto expect_issue = [](RawLegRecord rec, const std::string &key, const std::string &value, IntakeIssue issue) {
        if (value.empty()) {
            rec.erase(key);
        } else {
            rec[key] = value;
        }
        const LegValidation r = LegIntake::validate(rec);
        assert(!r.ok);
        assert(r.issue == issue);
    };
    expect_issue(good_record("x"), "id", "", IntakeIssue::MissingId);
    expect_issue(good_record("x"), "quality_state", "", IntakeIssue::MissingQualityState);
    expect_issue(good_record("x"), "confidence", "0.5x", IntakeIssue::BadConfidence);
    expect_issue(good_record("x"), "confidence", "140", IntakeIssue::BadConfidence);
    expect_issue(good_record("x"), "confidence", "-0.1", IntakeIssue::BadConfidence);
    expect_issue(good_record("x"), "volatility", "extreme", IntakeIssue::BadVolatility);
    expect_issue(good_record("x"), "category", "futures", IntakeIssue::BadCategory);
    expect_issue(good_record("x"), "gate_b", "", IntakeIssue::BadGateFlag);
    expect_issue(good_record("x"), "gate_a", "perhaps", IntakeIssue::BadGateFlag);
    expect_issue(good_record("x"), "ev", "lots", IntakeIssue::BadNumber);
    expect_issue(good_record("x"), "locked", "sometimes", IntakeIssue::BadNumber);
}

void quarantine_counts() {
    LegIntake intake;
    intake.add_all({good_record("a"), good_record("b"), good_record("a"), RawLegRecord{{"label", "orphan"}}});
    const CandidatePool &pool = intake.pool();
    assert(pool.total_records == 4);
    assert(pool.legs.size() == 2);
    assert(pool.malformed() == 2);
    assert(pool.issues.at(IntakeIssue::DuplicateId) == 1);
    assert(pool.issues.at(IntakeIssue::MissingId) == 1);

    CandidatePool taken = intake.take();
    assert(taken.legs.size() == 2);
    assert(intake.pool().total_records == 0);
    // take() resets duplicate tracking too.
    intake.add(good_record("a"));
    assert(intake.pool().legs.size() == 1);
    assert(to_string(IntakeIssue::BadShape) == "BAD_SHAPE");
}

void csv_loading() {
    const auto path = std::filesystem::temp_directory_path() / "parlay_test_legs.csv";
    {
        std::ofstream out(path);
        out << "id,entity_key,label,quality_state,confidence,volatility,category,gate_a,gate_b,clv,edge_points,ev\n"
            << "# comment rows are skipped\n"
            << "l1,NYK,Knicks ML,STRONG,0.81,LOW,moneyline,1,1,0.5,3,0.02\n"
            << "l2,,Over 221.5,EDGE,0.7,high,total,true,false,,,\n"
            << "l3,BOS,short row,LEAN,0.6\n"
            << "\n"
            << "l4,DAL,Mavs +4,weak,55,MEDIUM,spread,yes,yes,0,0,0\n"
            << "l1,NYK,dupe,STRONG,0.9,LOW,spread,1,1,0,0,0\n";
    }
    const auto pool = load_legs_csv(path);
    assert(pool);
    assert(pool->total_records == 5);
    assert(pool->legs.size() == 3);
    assert(pool->issues.at(IntakeIssue::BadShape) == 1);
    assert(pool->issues.at(IntakeIssue::DuplicateId) == 1);

    const Leg &l2 = pool->legs[1];
    assert(l2.id == "l2");
    assert(!l2.entity_key);
    assert(l2.gate_a_pass && !l2.gate_b_pass);
    assert(l2.clv == 0.0);
    const Leg &l4 = pool->legs[2];
    assert(std::abs(l4.confidence - 0.55) < 1e-12);
    std::filesystem::remove(path);

    assert(!load_legs_csv("/nonexistent/legs.csv"));
}

void shipped_sample_pool() {
    const auto pool = load_legs_csv(std::filesystem::path(PARLAY_SOURCE_DIR) / "data" / "sample_legs.csv");
    assert(pool);
    assert(pool->total_records == 14);
    assert(pool->legs.size() == 13);
    assert(pool->malformed() == 1);
    assert(pool->issues.at(IntakeIssue::BadConfidence) == 1);

    std::size_t unkeyed = 0;
    for (const auto &leg : pool->legs) {
        assert(leg.id != "nba-0412-bad");
        if (!leg.entity_key) {
            ++unkeyed;
        }
        if (leg.id == "nba-0412-okc-sp") {
            assert(std::abs(leg.confidence - 0.71) < 1e-12);
        }
        if (leg.id == "nba-0412-sac-sp") {
            assert(leg.quality_state == QualityState::Undecided);
            assert(!leg.gate_a_pass && !leg.gate_b_pass);
        }
    }
    assert(unkeyed == 1);
}

}  // namespace

int main() {
    parlay::utils::set_min_level(parlay::utils::LogLevel::Error);
    field_validation();
    quarantine_counts();
    csv_loading();
    shipped_sample_pool();
    return 0;
}
