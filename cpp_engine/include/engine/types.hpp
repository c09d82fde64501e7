#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace parlay::engine {

enum class Tier : uint8_t { Strong = 0, Moderate = 1, Weak = 2 };

// Discrete upstream signal state. Undecided covers any fallback/unknown state.
enum class QualityState : uint8_t { Strong, Intermediate, Weak, Undecided };

enum class Volatility : uint8_t { Low, Medium, High };

enum class MarketCategory : uint8_t { Spread, Total, Moneyline, Prop };

constexpr std::size_t kTierCount = 3;
constexpr std::size_t kCategoryCount = 4;

// Category excluded by default and switched on by include_category_x.
constexpr MarketCategory kOptionalCategory = MarketCategory::Prop;

struct Leg {
    std::string id;
    std::optional<std::string> entity_key;
    std::string label;
    QualityState quality_state{QualityState::Undecided};
    double confidence{0.0};  // normalised to [0,1]
    Volatility volatility{Volatility::Medium};
    MarketCategory category{MarketCategory::Spread};
    bool gate_a_pass{false};  // data integrity
    bool gate_b_pass{false};  // market validity

    // Optional upstream score modifiers.
    double clv{0.0};  // percent points
    double edge_points{0.0};
    double ev{0.0};
    bool injury_stable{true};
    bool locked{false};
};

struct TierCounts {
    std::array<std::size_t, kTierCount> by_tier{};

    std::size_t &operator[](Tier t) { return by_tier[static_cast<std::size_t>(t)]; }
    std::size_t operator[](Tier t) const { return by_tier[static_cast<std::size_t>(t)]; }
    std::size_t total() const { return by_tier[0] + by_tier[1] + by_tier[2]; }
};

struct BlockedCounts {
    std::size_t gate_a{0};  // Gate-A failed, Gate-B passed
    std::size_t gate_b{0};  // Gate-B failed, Gate-A passed
    std::size_t both{0};
    std::size_t category_excluded{0};

    std::size_t gate_total() const { return gate_a + gate_b + both; }
    std::size_t total() const { return gate_total() + category_excluded; }
};

std::string to_string(Tier tier);
std::string to_string(QualityState state);
std::string to_string(Volatility vol);
std::string to_string(MarketCategory category);

std::optional<Volatility> parse_volatility(const std::string &s);
std::optional<MarketCategory> parse_market_category(const std::string &s);
QualityState parse_quality_state(const std::string &s);

}  // namespace parlay::engine
