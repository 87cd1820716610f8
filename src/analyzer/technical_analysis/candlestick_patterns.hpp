#ifndef CANDLESTICK_PATTERNS_HPP
#define CANDLESTICK_PATTERNS_HPP

#include <optional>
#include <vector>
#include "configs/pattern_config.hpp"
#include "analyzer/data_structures/data_structures.hpp"
#include "analyzer/market_data/series.hpp"

using StockAdvisor::Config::PatternConfig;

namespace StockAdvisor {
namespace Core {

enum class TrendDirection { UP, DOWN, FLAT };

/**
 * Window handed to every candlestick predicate.
 * bar(0) is the oldest bar of the window, bar(window_length - 1) the newest.
 */
struct CandleContext {
    const Series& series;
    const PatternConfig& config;
    size_t start_index;
    int window_length;
    double average_body;            // Mean body of the bars preceding the window
    TrendDirection prior_trend;     // Trend of the closes preceding the window

    CandleContext(const Series& source_series, const PatternConfig& pattern_config, size_t window_start, int length,
                  double reference_body, TrendDirection trend)
        : series(source_series), config(pattern_config), start_index(window_start), window_length(length),
          average_body(reference_body), prior_trend(trend) {}

    const Bar& bar(int offset) const { return series.at(start_index + offset); }
};

struct CandleMatch {
    PatternDirection direction;
    double confidence;
};

using CandlestickPredicate = std::optional<CandleMatch> (*)(const CandleContext&);

struct CandlestickRule {
    const char* name;
    int window_length;
    PatternCategory category;
    int priority;                     // Lower wins among rules of one category matching the same window
    CandlestickPredicate predicate;
};

// Every supported candlestick shape, in catalog order.
const std::vector<CandlestickRule>& get_candlestick_catalog();

// Context values for a window starting at start_index.
double compute_average_body(const Series& series, size_t start_index, int window_length, int lookback);
TrendDirection compute_prior_trend(const Series& series, size_t start_index, int lookback);

/**
 * Scans the configured tail of the series. At most one candlestick is reported per
 * (start, end) window: reversal beats indecision beats continuation, then catalog priority.
 */
std::vector<Pattern> detect_candlestick_patterns(const Series& series, const PatternConfig& config);

} // namespace Core
} // namespace StockAdvisor

#endif // CANDLESTICK_PATTERNS_HPP
