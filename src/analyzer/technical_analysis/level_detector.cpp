#include "level_detector.hpp"
#include "extrema.hpp"
#include <algorithm>

namespace StockAdvisor {
namespace Core {

namespace {

PriceLevel build_level(const std::vector<PriceExtremum>& cluster_points, double last_close) {
    PriceLevel price_level;
    double price_sum = 0.0;
    price_level.first_touch_index = cluster_points.front().index;
    price_level.last_touch_index = cluster_points.front().index;
    for (const PriceExtremum& cluster_point : cluster_points) {
        price_sum += cluster_point.price;
        price_level.first_touch_index = std::min(price_level.first_touch_index, cluster_point.index);
        price_level.last_touch_index = std::max(price_level.last_touch_index, cluster_point.index);
    }
    price_level.price = price_sum / static_cast<double>(cluster_points.size());
    price_level.strength = static_cast<int>(cluster_points.size());
    price_level.kind = price_level.price > last_close ? LevelKind::RESISTANCE : LevelKind::SUPPORT;
    return price_level;
}

} // anonymous namespace

double compute_cluster_radius(const Series& series, const IndicatorSet& indicators, const LevelConfig& config) {
    IndicatorValue latest_atr = indicators.latest("ATR");
    if (latest_atr && *latest_atr > 0.0) {
        return config.atr_radius_multiple * *latest_atr;
    }
    return config.fallback_radius_pct * series.back().close_price;
}

std::vector<PriceLevel> detect_levels(const Series& series, const IndicatorSet& indicators, const LevelConfig& config) {
    std::vector<PriceLevel> price_levels;
    if (series.empty()) {
        return price_levels;
    }

    size_t first_index = 0;
    if (config.lookback_bars > 0 && series.size() > static_cast<size_t>(config.lookback_bars)) {
        first_index = series.size() - config.lookback_bars;
    }

    std::vector<PriceExtremum> extrema = find_local_extrema(series, first_index, config.extrema_window, 0.0);
    if (extrema.empty()) {
        return price_levels;
    }

    std::stable_sort(extrema.begin(), extrema.end(), [](const PriceExtremum& first_point, const PriceExtremum& second_point) {
        return first_point.price < second_point.price;
    });

    double cluster_radius = compute_cluster_radius(series, indicators, config);
    double last_close = series.back().close_price;

    std::vector<PriceExtremum> current_cluster;
    for (const PriceExtremum& extremum : extrema) {
        if (!current_cluster.empty() && extremum.price - current_cluster.back().price > cluster_radius) {
            if (static_cast<int>(current_cluster.size()) >= config.min_cluster_points) {
                price_levels.push_back(build_level(current_cluster, last_close));
            }
            current_cluster.clear();
        }
        current_cluster.push_back(extremum);
    }
    if (static_cast<int>(current_cluster.size()) >= config.min_cluster_points) {
        price_levels.push_back(build_level(current_cluster, last_close));
    }

    std::stable_sort(price_levels.begin(), price_levels.end(), [](const PriceLevel& first_level, const PriceLevel& second_level) {
        if (first_level.strength != second_level.strength) {
            return first_level.strength > second_level.strength;
        }
        return first_level.price < second_level.price;
    });
    return price_levels;
}

} // namespace Core
} // namespace StockAdvisor
