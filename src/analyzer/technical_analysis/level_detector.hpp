#ifndef LEVEL_DETECTOR_HPP
#define LEVEL_DETECTOR_HPP

#include <vector>
#include "configs/level_config.hpp"
#include "analyzer/data_structures/data_structures.hpp"
#include "analyzer/market_data/series.hpp"

using StockAdvisor::Config::LevelConfig;

namespace StockAdvisor {
namespace Core {

// Price distance within which two extrema belong to the same level.
double compute_cluster_radius(const Series& series, const IndicatorSet& indicators, const LevelConfig& config);

/**
 * Support and resistance levels from clustered swing highs and lows.
 * One-dimensional clustering: extrema prices are sorted and neighbours closer than the
 * cluster radius are merged. Clusters with fewer than min_cluster_points are dropped.
 * Ordered by strength descending, then price ascending.
 */
std::vector<PriceLevel> detect_levels(const Series& series, const IndicatorSet& indicators, const LevelConfig& config);

} // namespace Core
} // namespace StockAdvisor

#endif // LEVEL_DETECTOR_HPP
