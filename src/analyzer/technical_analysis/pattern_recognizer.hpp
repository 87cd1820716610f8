#ifndef PATTERN_RECOGNIZER_HPP
#define PATTERN_RECOGNIZER_HPP

#include <vector>
#include "configs/pattern_config.hpp"
#include "analyzer/data_structures/data_structures.hpp"
#include "analyzer/market_data/series.hpp"

using StockAdvisor::Config::PatternConfig;

namespace StockAdvisor {
namespace Core {

/**
 * Candlestick and chart patterns of the series, most recent first:
 * end index descending, then start index descending, then confidence descending, then name.
 */
std::vector<Pattern> recognize_patterns(const Series& series, const PatternConfig& config);

// Ordering used by recognize_patterns
bool is_more_recent_pattern(const Pattern& first_pattern, const Pattern& second_pattern);

} // namespace Core
} // namespace StockAdvisor

#endif // PATTERN_RECOGNIZER_HPP
