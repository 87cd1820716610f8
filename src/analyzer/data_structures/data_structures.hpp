#ifndef DATA_STRUCTURES_HPP
#define DATA_STRUCTURES_HPP

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace StockAdvisor {
namespace Core {

// ========================================================================
// PRICE HISTORY
// ========================================================================

struct Bar {
    std::int64_t timestamp;     // Epoch seconds (UTC)
    double open_price;
    double high_price;
    double low_price;
    double close_price;
    double volume;

    Bar() : timestamp(0), open_price(0.0), high_price(0.0), low_price(0.0), close_price(0.0), volume(0.0) {}

    Bar(std::int64_t timestamp_value, double open_value, double high_value, double low_value, double close_value, double volume_value)
        : timestamp(timestamp_value), open_price(open_value), high_price(high_value), low_price(low_value),
          close_price(close_value), volume(volume_value) {}
};

// ========================================================================
// INDICATORS
// ========================================================================

// One slot per bar; an empty slot means the indicator has no value at that bar.
using IndicatorValue = std::optional<double>;
using IndicatorSeries = std::vector<IndicatorValue>;

struct OmittedIndicator {
    std::string name;
    int required_bars;
    int available_bars;

    OmittedIndicator() : name(), required_bars(0), available_bars(0) {}
    OmittedIndicator(const std::string& indicator_name, int required, int available)
        : name(indicator_name), required_bars(required), available_bars(available) {}
};

struct IndicatorSet {
    std::map<std::string, IndicatorSeries> series;
    std::vector<OmittedIndicator> omitted;

    bool contains(const std::string& indicator_name) const;
    const IndicatorSeries* find(const std::string& indicator_name) const;

    // Latest defined value, looking only at the final bar.
    IndicatorValue latest(const std::string& indicator_name) const;
    IndicatorValue value_at(const std::string& indicator_name, size_t bar_index) const;
};

// ========================================================================
// PATTERNS AND LEVELS
// ========================================================================

enum class PatternDirection { BULLISH, BEARISH, NEUTRAL };
enum class PatternKind { CANDLESTICK, CHART };
enum class PatternCategory { REVERSAL, CONTINUATION, INDECISION };

struct Pattern {
    std::string name;
    size_t start_index;
    size_t end_index;
    PatternDirection direction;
    double confidence;
    PatternKind kind;
    PatternCategory category;

    Pattern()
        : name(), start_index(0), end_index(0), direction(PatternDirection::NEUTRAL), confidence(0.0),
          kind(PatternKind::CANDLESTICK), category(PatternCategory::INDECISION) {}
};

enum class LevelKind { SUPPORT, RESISTANCE };

struct PriceLevel {
    double price;
    LevelKind kind;
    int strength;                 // Number of extrema merged into the level
    size_t first_touch_index;
    size_t last_touch_index;

    PriceLevel() : price(0.0), kind(LevelKind::SUPPORT), strength(0), first_touch_index(0), last_touch_index(0) {}
};

// ========================================================================
// TECHNICAL SIGNALS
// ========================================================================

enum class SignalDirection { BUY, SELL, NEUTRAL };

struct TechnicalSignal {
    std::string name;             // Rule family
    SignalDirection direction;
    double strength;
    std::string rationale;

    TechnicalSignal() : name(), direction(SignalDirection::NEUTRAL), strength(0.0), rationale() {}
    TechnicalSignal(const std::string& family_name, SignalDirection signal_direction, double signal_strength, const std::string& reason)
        : name(family_name), direction(signal_direction), strength(signal_strength), rationale(reason) {}

    bool is_firing() const { return direction != SignalDirection::NEUTRAL; }
};

// ========================================================================
// FUNDAMENTALS
// ========================================================================

enum class FundamentalCategory { VALUATION, PROFITABILITY, GROWTH, FINANCIAL_HEALTH };

struct MetricScore {
    std::string name;
    double value;
    double sub_score;

    MetricScore() : name(), value(0.0), sub_score(0.0) {}
    MetricScore(const std::string& metric_name, double metric_value, double metric_sub_score)
        : name(metric_name), value(metric_value), sub_score(metric_sub_score) {}
};

struct CategoryScore {
    FundamentalCategory category;
    std::optional<double> score;                 // Undefined when no metric of the category is present
    std::vector<MetricScore> metrics;
    std::vector<std::string> missing_metrics;
    std::string grade;                           // Letter grade, empty when the score is undefined

    CategoryScore() : category(FundamentalCategory::VALUATION), score(), metrics(), missing_metrics(), grade() {}
};

struct FundamentalScores {
    std::vector<CategoryScore> categories;
    std::optional<double> composite;

    const CategoryScore* find(FundamentalCategory category) const;
};

struct FundamentalReport {
    std::string overall_grade;
    std::string rating;
    std::vector<std::string> strengths;
    std::vector<std::string> weaknesses;
    std::vector<std::string> risks;
    std::vector<std::string> opportunities;
    std::vector<std::string> insights;
};

struct PeerMetricComparison {
    std::string metric;
    double stock_value;
    double peer_average;
    double difference;
    std::optional<double> percent_difference;
    int rank;                  // 1 = best among stock and peers
    int compared_count;        // Stock plus peers with the metric
    double percentile;         // Share of compared companies ranked at or below the stock
    bool lower_is_better;

    PeerMetricComparison()
        : metric(), stock_value(0.0), peer_average(0.0), difference(0.0), percent_difference(), rank(0),
          compared_count(0), percentile(0.0), lower_is_better(false) {}
};

struct PeerComparison {
    std::vector<std::string> peer_symbols;
    std::vector<PeerMetricComparison> metrics;
};

// ========================================================================
// VALUATION
// ========================================================================

enum class ValuationModel { DCF, DDM };

struct ValuationEstimate {
    ValuationModel model;
    bool applicable;
    std::optional<double> fair_value;
    std::optional<double> upside;                    // fair_value / current price - 1
    std::map<std::string, double> assumptions;
    std::string inapplicable_reason;

    ValuationEstimate() : model(ValuationModel::DCF), applicable(false), fair_value(), upside(), assumptions(), inapplicable_reason() {}
};

// ========================================================================
// RECOMMENDATION
// ========================================================================

enum class RecommendationOutcome { BUY, SELL, HOLD, INSUFFICIENT_DATA };
enum class RecommendationBasis { COMBINED, TECHNICAL_ONLY, FUNDAMENTAL_ONLY, NONE };

struct Recommendation {
    RecommendationOutcome outcome;
    double strength;
    double final_score;
    std::string rationale;
    std::optional<double> technical_contribution;
    std::optional<double> fundamental_contribution;
    RecommendationBasis basis;

    Recommendation()
        : outcome(RecommendationOutcome::INSUFFICIENT_DATA), strength(0.0), final_score(0.0), rationale(),
          technical_contribution(), fundamental_contribution(), basis(RecommendationBasis::NONE) {}
};

// ========================================================================
// ANALYSIS RESULT
// ========================================================================

struct PriceSummary {
    double last_close;
    std::optional<double> change;
    std::optional<double> change_percent;
    double last_volume;
    size_t bar_count;
    std::int64_t first_timestamp;
    std::int64_t last_timestamp;

    PriceSummary()
        : last_close(0.0), change(), change_percent(), last_volume(0.0), bar_count(0), first_timestamp(0), last_timestamp(0) {}
};

// Enum display names shared by logging and serialization
std::string to_string(PatternDirection direction);
std::string to_string(PatternKind kind);
std::string to_string(PatternCategory category);
std::string to_string(LevelKind kind);
std::string to_string(SignalDirection direction);
std::string to_string(FundamentalCategory category);
std::string to_string(ValuationModel model);
std::string to_string(RecommendationOutcome outcome);
std::string to_string(RecommendationBasis basis);

} // namespace Core
} // namespace StockAdvisor

#endif // DATA_STRUCTURES_HPP
