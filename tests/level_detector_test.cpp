#include "analyzer/technical_analysis/level_detector.hpp"
#include "test_helpers.hpp"
#include <gtest/gtest.h>

using namespace StockAdvisor::Core;
using StockAdvisor::Config::LevelConfig;
using StockAdvisor::Testing::make_flat_series;
using StockAdvisor::Testing::make_series_from_closes;

namespace {

// Triangle wave between 100 and 110 with a ten bar period
std::vector<double> make_oscillating_closes(size_t bar_count) {
    std::vector<double> closes;
    for (size_t bar_index = 0; bar_index < bar_count; ++bar_index) {
        int wave_phase = static_cast<int>(bar_index % 10);
        closes.push_back(wave_phase <= 5 ? 100.0 + 2.0 * wave_phase : 110.0 - 2.0 * (wave_phase - 5));
    }
    return closes;
}

} // anonymous namespace

TEST(LevelDetectorTest, ClustersRepeatedSwingHighsAndLows) {
    Series series = make_series_from_closes(make_oscillating_closes(60));
    std::vector<PriceLevel> levels = detect_levels(series, IndicatorSet(), LevelConfig());

    ASSERT_EQ(levels.size(), 2u);

    EXPECT_EQ(levels[0].kind, LevelKind::RESISTANCE);
    EXPECT_NEAR(levels[0].price, 110.1, 1e-9);
    EXPECT_EQ(levels[0].strength, 6);
    EXPECT_EQ(levels[0].first_touch_index, 5u);
    EXPECT_EQ(levels[0].last_touch_index, 55u);

    EXPECT_EQ(levels[1].kind, LevelKind::SUPPORT);
    EXPECT_NEAR(levels[1].price, 99.9, 1e-9);
    EXPECT_EQ(levels[1].strength, 5);
    EXPECT_EQ(levels[1].first_touch_index, 10u);
    EXPECT_EQ(levels[1].last_touch_index, 50u);
}

TEST(LevelDetectorTest, MinimumClusterPointsFiltersWeakLevels) {
    Series series = make_series_from_closes(make_oscillating_closes(60));
    LevelConfig config;
    config.min_cluster_points = 6;

    std::vector<PriceLevel> levels = detect_levels(series, IndicatorSet(), config);
    ASSERT_EQ(levels.size(), 1u);
    EXPECT_EQ(levels[0].kind, LevelKind::RESISTANCE);
}

TEST(LevelDetectorTest, LookbackRestrictsTheSearch) {
    Series series = make_series_from_closes(make_oscillating_closes(60));
    LevelConfig config;
    config.lookback_bars = 30;
    config.min_cluster_points = 1;

    std::vector<PriceLevel> levels = detect_levels(series, IndicatorSet(), config);
    for (const PriceLevel& price_level : levels) {
        EXPECT_GE(price_level.first_touch_index, 30u);
    }
}

TEST(LevelDetectorTest, ClusterRadiusPrefersAtr) {
    Series series = make_series_from_closes(make_oscillating_closes(20));
    LevelConfig config;
    IndicatorSet indicator_set;
    EXPECT_DOUBLE_EQ(compute_cluster_radius(series, indicator_set, config), 0.01 * series.back().close_price);

    indicator_set.series["ATR"] = IndicatorSeries(series.size());
    indicator_set.series["ATR"].back() = 4.0;
    EXPECT_DOUBLE_EQ(compute_cluster_radius(series, indicator_set, config), 2.0);
}

TEST(LevelDetectorTest, FlatSeriesHasNoLevels) {
    EXPECT_TRUE(detect_levels(make_flat_series(40, 25.0), IndicatorSet(), LevelConfig()).empty());
}
