#include "engine/types.hpp"

#include <algorithm>
#include <cctype>

namespace parlay::engine {
namespace {

std::string upper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

}  // namespace

std::string to_string(Tier tier) {
    switch (tier) {
        case Tier::Strong:
            return "STRONG";
        case Tier::Moderate:
            return "MODERATE";
        case Tier::Weak:
            return "WEAK";
        default:
            return "UNKNOWN";
    }
}

std::string to_string(QualityState state) {
    switch (state) {
        case QualityState::Strong:
            return "STRONG";
        case QualityState::Intermediate:
            return "INTERMEDIATE";
        case QualityState::Weak:
            return "WEAK";
        default:
            return "UNDECIDED";
    }
}

std::string to_string(Volatility vol) {
    switch (vol) {
        case Volatility::Low:
            return "LOW";
        case Volatility::Medium:
            return "MEDIUM";
        case Volatility::High:
            return "HIGH";
        default:
            return "UNKNOWN";
    }
}

std::string to_string(MarketCategory category) {
    switch (category) {
        case MarketCategory::Spread:
            return "SPREAD";
        case MarketCategory::Total:
            return "TOTAL";
        case MarketCategory::Moneyline:
            return "MONEYLINE";
        case MarketCategory::Prop:
            return "PROP";
        default:
            return "UNKNOWN";
    }
}

std::optional<Volatility> parse_volatility(const std::string &s) {
    const std::string u = upper(s);
    if (u == "LOW") {
        return Volatility::Low;
    }
    if (u == "MEDIUM") {
        return Volatility::Medium;
    }
    if (u == "HIGH") {
        return Volatility::High;
    }
    return std::nullopt;
}

std::optional<MarketCategory> parse_market_category(const std::string &s) {
    const std::string u = upper(s);
    if (u == "SPREAD") {
        return MarketCategory::Spread;
    }
    if (u == "TOTAL") {
        return MarketCategory::Total;
    }
    if (u == "MONEYLINE") {
        return MarketCategory::Moneyline;
    }
    if (u == "PROP") {
        return MarketCategory::Prop;
    }
    return std::nullopt;
}

QualityState parse_quality_state(const std::string &s) {
    const std::string u = upper(s);
    if (u == "STRONG" || u == "EDGE") {
        return QualityState::Strong;
    }
    if (u == "INTERMEDIATE" || u == "LEAN") {
        return QualityState::Intermediate;
    }
    if (u == "WEAK") {
        return QualityState::Weak;
    }
    return QualityState::Undecided;
}

}  // namespace parlay::engine
