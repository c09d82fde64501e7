#include "engine/leg_intake.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <sstream>
#include <utility>

#include "utils/logger.hpp"

namespace parlay::engine {
namespace {

std::string trim(const std::string &s) {
    const std::size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) {
        return std::string();
    }
    const std::size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

std::optional<std::string> field(const RawLegRecord &rec, const std::string &name) {
    auto it = rec.find(name);
    if (it == rec.end()) {
        return std::nullopt;
    }
    std::string v = trim(it->second);
    if (v.empty()) {
        return std::nullopt;
    }
    return v;
}

std::optional<double> to_double(const std::string &s) {
    std::size_t used = 0;
    double v = 0.0;
    try {
        v = std::stod(s, &used);
    } catch (const std::exception &) {
        return std::nullopt;
    }
    if (used != s.size() || !std::isfinite(v)) {
        return std::nullopt;
    }
    return v;
}

std::optional<bool> to_bool(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (s == "1" || s == "true" || s == "yes" || s == "pass") {
        return true;
    }
    if (s == "0" || s == "false" || s == "no" || s == "fail") {
        return false;
    }
    return std::nullopt;
}

LegValidation failed(IntakeIssue issue, std::string message) {
    LegValidation v;
    v.ok = false;
    v.issue = issue;
    v.message = std::move(message);
    return v;
}

bool parse_line_fields(const std::string &line, std::vector<std::string> &out_fields) {
    out_fields.clear();
    std::stringstream ss(line);
    std::string cell;
    while (std::getline(ss, cell, ',')) {
        out_fields.push_back(trim(cell));
    }
    if (!line.empty() && line.back() == ',') {
        out_fields.emplace_back();
    }
    return !out_fields.empty();
}

}  // namespace

std::string to_string(IntakeIssue issue) {
    switch (issue) {
        case IntakeIssue::MissingId:
            return "MISSING_ID";
        case IntakeIssue::DuplicateId:
            return "DUPLICATE_ID";
        case IntakeIssue::MissingQualityState:
            return "MISSING_QUALITY_STATE";
        case IntakeIssue::BadConfidence:
            return "BAD_CONFIDENCE";
        case IntakeIssue::BadVolatility:
            return "BAD_VOLATILITY";
        case IntakeIssue::BadCategory:
            return "BAD_CATEGORY";
        case IntakeIssue::BadGateFlag:
            return "BAD_GATE_FLAG";
        case IntakeIssue::BadNumber:
            return "BAD_NUMBER";
        case IntakeIssue::BadShape:
            return "BAD_SHAPE";
        default:
            return "UNKNOWN";
    }
}

std::size_t CandidatePool::malformed() const {
    std::size_t n = 0;
    for (const auto &kv : issues) {
        n += kv.second;
    }
    return n;
}

CandidatePool CandidatePool::from_legs(std::vector<Leg> legs) {
    CandidatePool pool;
    pool.total_records = legs.size();
    pool.legs = std::move(legs);
    return pool;
}

LegValidation LegIntake::validate(const RawLegRecord &record) {
    LegValidation out;
    Leg &leg = out.leg;

    const auto id = field(record, "id");
    if (!id) {
        return failed(IntakeIssue::MissingId, "record has no id");
    }
    leg.id = *id;
    leg.entity_key = field(record, "entity_key");
    leg.label = field(record, "label").value_or("");

    const auto state = field(record, "quality_state");
    if (!state) {
        return failed(IntakeIssue::MissingQualityState, "leg " + leg.id + " has no quality_state");
    }
    leg.quality_state = parse_quality_state(*state);
    if (leg.quality_state == QualityState::Undecided) {
        utils::debug("leg " + leg.id + " quality_state '" + *state + "' treated as undecided");
    }

    const auto conf_raw = field(record, "confidence");
    const auto conf = conf_raw ? to_double(*conf_raw) : std::nullopt;
    if (!conf || *conf < 0.0 || *conf > 100.0) {
        return failed(IntakeIssue::BadConfidence, "leg " + leg.id + " confidence missing or outside [0,100]");
    }
    // Upstream sometimes reports 0-100; anything above 1 is a percentage.
    leg.confidence = *conf > 1.0 ? *conf / 100.0 : *conf;

    const auto vol_raw = field(record, "volatility");
    const auto vol = vol_raw ? parse_volatility(*vol_raw) : std::nullopt;
    if (!vol) {
        return failed(IntakeIssue::BadVolatility, "leg " + leg.id + " volatility missing or unknown");
    }
    leg.volatility = *vol;

    const auto cat_raw = field(record, "category");
    const auto cat = cat_raw ? parse_market_category(*cat_raw) : std::nullopt;
    if (!cat) {
        return failed(IntakeIssue::BadCategory, "leg " + leg.id + " category missing or unknown");
    }
    leg.category = *cat;

    const auto gate_a_raw = field(record, "gate_a");
    const auto gate_b_raw = field(record, "gate_b");
    const auto gate_a = gate_a_raw ? to_bool(*gate_a_raw) : std::nullopt;
    const auto gate_b = gate_b_raw ? to_bool(*gate_b_raw) : std::nullopt;
    if (!gate_a || !gate_b) {
        return failed(IntakeIssue::BadGateFlag, "leg " + leg.id + " gate flags missing or unreadable");
    }
    leg.gate_a_pass = *gate_a;
    leg.gate_b_pass = *gate_b;

    struct NumericField {
        const char *name;
        double *target;
    };
    for (const NumericField &nf : {NumericField{"clv", &leg.clv}, NumericField{"edge_points", &leg.edge_points},
                                   NumericField{"ev", &leg.ev}}) {
        const auto raw = field(record, nf.name);
        if (!raw) {
            continue;
        }
        const auto v = to_double(*raw);
        if (!v) {
            return failed(IntakeIssue::BadNumber, "leg " + leg.id + " field " + nf.name + " is not a number");
        }
        *nf.target = *v;
    }

    for (auto flag : {std::make_pair("injury_stable", &leg.injury_stable), std::make_pair("locked", &leg.locked)}) {
        const auto raw = field(record, flag.first);
        if (!raw) {
            continue;
        }
        const auto v = to_bool(*raw);
        if (!v) {
            return failed(IntakeIssue::BadNumber, "leg " + leg.id + " field " + flag.first + " is not a boolean");
        }
        *flag.second = *v;
    }

    out.ok = true;
    return out;
}

void LegIntake::add(const RawLegRecord &record) {
    ++pool_.total_records;
    LegValidation v = validate(record);
    if (v.ok && !seen_ids_.insert(v.leg.id).second) {
        v = failed(IntakeIssue::DuplicateId, "duplicate leg id " + v.leg.id);
    }
    if (!v.ok) {
        ++pool_.issues[v.issue];
        utils::warn("quarantined leg record: " + to_string(v.issue) + " (" + v.message + ")");
        return;
    }
    pool_.legs.push_back(std::move(v.leg));
}

void LegIntake::quarantine(IntakeIssue issue, const std::string &message) {
    ++pool_.total_records;
    ++pool_.issues[issue];
    utils::warn("quarantined leg record: " + to_string(issue) + " (" + message + ")");
}

void LegIntake::add_all(const std::vector<RawLegRecord> &records) {
    for (const auto &r : records) {
        add(r);
    }
}

CandidatePool LegIntake::take() {
    CandidatePool out = std::move(pool_);
    pool_ = CandidatePool{};
    seen_ids_.clear();
    return out;
}

std::optional<CandidatePool> load_legs_csv(const std::filesystem::path &path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        utils::error("cannot open legs file: " + path.string());
        return std::nullopt;
    }
    std::string line;
    std::vector<std::string> header;
    while (std::getline(in, line)) {
        if (!trim(line).empty()) {
            parse_line_fields(trim(line), header);
            break;
        }
    }
    if (header.empty()) {
        utils::error("legs file has no header: " + path.string());
        return std::nullopt;
    }

    LegIntake intake;
    std::vector<std::string> fields;
    while (std::getline(in, line)) {
        const std::string row = trim(line);
        if (row.empty() || row[0] == '#') {
            continue;
        }
        parse_line_fields(row, fields);
        if (fields.size() != header.size()) {
            intake.quarantine(IntakeIssue::BadShape, "expected " + std::to_string(header.size()) + " columns, got " +
                                                         std::to_string(fields.size()));
            continue;
        }
        RawLegRecord rec;
        for (std::size_t i = 0; i < header.size(); ++i) {
            rec[header[i]] = fields[i];
        }
        intake.add(rec);
    }
    CandidatePool pool = intake.take();
    utils::info("loaded " + std::to_string(pool.legs.size()) + " legs from " + path.string() + " (" +
                std::to_string(pool.malformed()) + " quarantined of " + std::to_string(pool.total_records) + ")");
    return pool;
}

}  // namespace parlay::engine
