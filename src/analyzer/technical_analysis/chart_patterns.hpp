#ifndef CHART_PATTERNS_HPP
#define CHART_PATTERNS_HPP

#include <vector>
#include "configs/pattern_config.hpp"
#include "analyzer/data_structures/data_structures.hpp"
#include "analyzer/market_data/series.hpp"
#include "extrema.hpp"

using StockAdvisor::Config::PatternConfig;

namespace StockAdvisor {
namespace Core {

// Least-squares line through (bar index, price) points.
struct TrendLine {
    double slope;
    double intercept;

    TrendLine() : slope(0.0), intercept(0.0) {}
    double value_at(size_t bar_index) const { return intercept + slope * static_cast<double>(bar_index); }
};

TrendLine fit_trend_line(const std::vector<PriceExtremum>& points);

// Multi-swing formations confirmed by a breakout close. end_index of each pattern is the breakout bar.
std::vector<Pattern> detect_head_and_shoulders(const Series& series, const std::vector<PriceExtremum>& swings, const PatternConfig& config);
std::vector<Pattern> detect_double_extremes(const Series& series, const std::vector<PriceExtremum>& swings, const PatternConfig& config);
std::vector<Pattern> detect_triangles(const Series& series, const std::vector<PriceExtremum>& swings, const PatternConfig& config);

std::vector<Pattern> detect_chart_patterns(const Series& series, const PatternConfig& config);

} // namespace Core
} // namespace StockAdvisor

#endif // CHART_PATTERNS_HPP
