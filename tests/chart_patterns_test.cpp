#include "analyzer/technical_analysis/chart_patterns.hpp"
#include "analyzer/technical_analysis/extrema.hpp"
#include "test_helpers.hpp"
#include <gtest/gtest.h>
#include <algorithm>

using namespace StockAdvisor::Core;
using StockAdvisor::Config::PatternConfig;
using StockAdvisor::Testing::make_close_path;
using StockAdvisor::Testing::make_flat_series;
using StockAdvisor::Testing::make_series_from_closes;

namespace {

const Pattern* find_pattern(const std::vector<Pattern>& patterns, const std::string& pattern_name) {
    std::vector<Pattern>::const_iterator pattern_iterator = std::find_if(patterns.begin(), patterns.end(),
        [&](const Pattern& pattern) { return pattern.name == pattern_name; });
    return pattern_iterator == patterns.end() ? nullptr : &*pattern_iterator;
}

// Constant closes with an optional single breakout close
Series make_channel_series(size_t bar_count, double resting_close, size_t breakout_index = 0, double breakout_close = 0.0) {
    std::vector<double> closes(bar_count, resting_close);
    if (breakout_index > 0) {
        closes[breakout_index] = breakout_close;
    }
    return make_series_from_closes(closes);
}

std::vector<PriceExtremum> make_swings(const std::vector<std::pair<size_t, double>>& peak_points,
                                       const std::vector<std::pair<size_t, double>>& trough_points) {
    std::vector<PriceExtremum> swings;
    for (const auto& peak_point : peak_points) swings.emplace_back(peak_point.first, peak_point.second, ExtremumKind::PEAK);
    for (const auto& trough_point : trough_points) swings.emplace_back(trough_point.first, trough_point.second, ExtremumKind::TROUGH);
    std::sort(swings.begin(), swings.end(),
              [](const PriceExtremum& left, const PriceExtremum& right) { return left.index < right.index; });
    return swings;
}

} // anonymous namespace

// ========================================================================
// EXTREMA
// ========================================================================

TEST(ExtremaTest, FindsAlternatingSwingsOfDoubleTop) {
    Series series = make_series_from_closes(make_close_path({100.0, 110.0, 104.0, 110.0, 97.0}));
    std::vector<PriceExtremum> swings = alternate_extrema(find_local_extrema(series, 0, 3, 0.02));

    ASSERT_EQ(swings.size(), 3u);
    EXPECT_EQ(swings[0].index, 10u);
    EXPECT_EQ(swings[0].kind, ExtremumKind::PEAK);
    EXPECT_DOUBLE_EQ(swings[0].price, 110.1);
    EXPECT_EQ(swings[1].index, 16u);
    EXPECT_EQ(swings[1].kind, ExtremumKind::TROUGH);
    EXPECT_DOUBLE_EQ(swings[1].price, 103.9);
    EXPECT_EQ(swings[2].index, 22u);
}

TEST(ExtremaTest, FlatSeriesHasNoExtrema) {
    EXPECT_TRUE(find_local_extrema(make_flat_series(20, 10.0), 0, 3, 0.0).empty());
}

TEST(ExtremaTest, AlternateKeepsMostExtremeOfARun) {
    std::vector<PriceExtremum> extrema = {
        PriceExtremum(3, 10.0, ExtremumKind::PEAK),
        PriceExtremum(6, 12.0, ExtremumKind::PEAK),
        PriceExtremum(9, 8.0, ExtremumKind::TROUGH),
        PriceExtremum(12, 9.0, ExtremumKind::TROUGH),
    };
    std::vector<PriceExtremum> alternating_extrema = alternate_extrema(extrema);
    ASSERT_EQ(alternating_extrema.size(), 2u);
    EXPECT_EQ(alternating_extrema[0].index, 6u);
    EXPECT_EQ(alternating_extrema[1].index, 9u);
}

// ========================================================================
// TREND LINES
// ========================================================================

TEST(ChartPatternsTest, TrendLineFitsCollinearPointsExactly) {
    std::vector<PriceExtremum> points = {
        PriceExtremum(0, 10.0, ExtremumKind::PEAK),
        PriceExtremum(5, 20.0, ExtremumKind::PEAK),
        PriceExtremum(10, 30.0, ExtremumKind::PEAK),
    };
    TrendLine trend_line = fit_trend_line(points);
    EXPECT_NEAR(trend_line.slope, 2.0, 1e-12);
    EXPECT_NEAR(trend_line.intercept, 10.0, 1e-12);
    EXPECT_NEAR(trend_line.value_at(15), 40.0, 1e-12);
}

TEST(ChartPatternsTest, TrendLineOfSinglePointIsFlat) {
    TrendLine trend_line = fit_trend_line({PriceExtremum(4, 12.5, ExtremumKind::TROUGH)});
    EXPECT_DOUBLE_EQ(trend_line.slope, 0.0);
    EXPECT_DOUBLE_EQ(trend_line.value_at(100), 12.5);
}

// ========================================================================
// FORMATIONS
// ========================================================================

TEST(ChartPatternsTest, DetectsDoubleTopOnNecklineBreak) {
    Series series = make_series_from_closes(make_close_path({100.0, 110.0, 104.0, 110.0, 97.0}));
    std::vector<Pattern> patterns = detect_chart_patterns(series, PatternConfig());

    ASSERT_EQ(patterns.size(), 1u);
    const Pattern& double_top = patterns.front();
    EXPECT_EQ(double_top.name, "Double Top");
    EXPECT_EQ(double_top.start_index, 10u);
    EXPECT_EQ(double_top.end_index, 29u);
    EXPECT_EQ(double_top.direction, PatternDirection::BEARISH);
    EXPECT_EQ(double_top.kind, PatternKind::CHART);
    EXPECT_DOUBLE_EQ(double_top.confidence, 1.0);
}

TEST(ChartPatternsTest, DoubleTopWithoutBreakoutIsNotReported) {
    // Second decline stops above the middle trough
    Series series = make_series_from_closes(make_close_path({100.0, 110.0, 104.0, 110.0, 105.0}));
    EXPECT_EQ(find_pattern(detect_chart_patterns(series, PatternConfig()), "Double Top"), nullptr);
}

TEST(ChartPatternsTest, DetectsHeadAndShouldersOnNecklineBreak) {
    Series series = make_series_from_closes(make_close_path({100.0, 106.0, 100.0, 112.0, 100.0, 106.0, 95.0}));
    std::vector<Pattern> patterns = detect_chart_patterns(series, PatternConfig());

    const Pattern* head_and_shoulders = find_pattern(patterns, "Head and Shoulders");
    ASSERT_NE(head_and_shoulders, nullptr);
    EXPECT_EQ(head_and_shoulders->start_index, 6u);
    EXPECT_EQ(head_and_shoulders->end_index, 49u);
    EXPECT_EQ(head_and_shoulders->direction, PatternDirection::BEARISH);
    EXPECT_EQ(head_and_shoulders->category, PatternCategory::REVERSAL);
    EXPECT_DOUBLE_EQ(head_and_shoulders->confidence, 1.0);
}

TEST(ChartPatternsTest, InverseHeadAndShouldersFromSuppliedSwings) {
    Series series = make_series_from_closes(make_close_path({110.0, 104.0, 110.0, 98.0, 110.0, 104.0, 115.0}));
    std::vector<PriceExtremum> swings = {
        PriceExtremum(6, 103.9, ExtremumKind::TROUGH),
        PriceExtremum(12, 110.1, ExtremumKind::PEAK),
        PriceExtremum(24, 97.9, ExtremumKind::TROUGH),
        PriceExtremum(36, 110.1, ExtremumKind::PEAK),
        PriceExtremum(42, 103.9, ExtremumKind::TROUGH),
    };
    std::vector<Pattern> patterns = detect_head_and_shoulders(series, swings, PatternConfig());

    ASSERT_EQ(patterns.size(), 1u);
    EXPECT_EQ(patterns.front().name, "Inverse Head and Shoulders");
    EXPECT_EQ(patterns.front().direction, PatternDirection::BULLISH);
    EXPECT_EQ(patterns.front().end_index, 49u);
}

TEST(ChartPatternsTest, UnevenShouldersAreRejected) {
    Series series = make_series_from_closes(make_close_path({100.0, 106.0, 100.0, 130.0, 100.0, 120.0, 90.0}));
    std::vector<PriceExtremum> swings = {
        PriceExtremum(6, 106.1, ExtremumKind::PEAK),
        PriceExtremum(12, 99.9, ExtremumKind::TROUGH),
        PriceExtremum(42, 130.1, ExtremumKind::PEAK),
        PriceExtremum(72, 99.9, ExtremumKind::TROUGH),
        PriceExtremum(92, 120.1, ExtremumKind::PEAK),
    };
    EXPECT_TRUE(detect_head_and_shoulders(series, swings, PatternConfig()).empty());
}

TEST(ChartPatternsTest, ShortSeriesHasNoChartPatterns) {
    EXPECT_TRUE(detect_chart_patterns(make_series_from_closes({10.0, 11.0, 12.0}), PatternConfig()).empty());
}

// Triangles: peaks at bars 2, 10, 18 and troughs at 6, 14; the breakout close is at bar 20.

TEST(ChartPatternsTest, AscendingTriangleBreaksOutUpward) {
    std::vector<PriceExtremum> swings = make_swings({{2, 110.0}, {10, 110.0}, {18, 110.0}}, {{6, 100.0}, {14, 104.0}});
    std::vector<Pattern> patterns = detect_triangles(make_channel_series(22, 108.0, 20, 111.0), swings, PatternConfig());

    ASSERT_EQ(patterns.size(), 1u);
    EXPECT_EQ(patterns.front().name, "Ascending Triangle");
    EXPECT_EQ(patterns.front().start_index, 2u);
    EXPECT_EQ(patterns.front().end_index, 20u);
    EXPECT_EQ(patterns.front().direction, PatternDirection::BULLISH);
    EXPECT_EQ(patterns.front().category, PatternCategory::CONTINUATION);
    EXPECT_NEAR(patterns.front().confidence, 0.85, 1e-12);
}

TEST(ChartPatternsTest, DescendingTriangleBreaksOutDownward) {
    std::vector<PriceExtremum> swings = make_swings({{2, 110.0}, {10, 106.0}, {18, 102.0}}, {{6, 100.0}, {14, 100.0}});
    std::vector<Pattern> patterns = detect_triangles(make_channel_series(22, 101.0, 20, 98.0), swings, PatternConfig());

    ASSERT_EQ(patterns.size(), 1u);
    EXPECT_EQ(patterns.front().name, "Descending Triangle");
    EXPECT_EQ(patterns.front().end_index, 20u);
    EXPECT_EQ(patterns.front().direction, PatternDirection::BEARISH);
    EXPECT_NEAR(patterns.front().confidence, 0.85, 1e-12);
}

TEST(ChartPatternsTest, SymmetricalTriangleTakesTheBreakoutDirection) {
    std::vector<PriceExtremum> swings = make_swings({{2, 112.0}, {10, 110.0}, {18, 108.0}}, {{6, 100.0}, {14, 102.0}});
    std::vector<Pattern> patterns = detect_triangles(make_channel_series(22, 105.0, 20, 109.0), swings, PatternConfig());

    ASSERT_EQ(patterns.size(), 1u);
    EXPECT_EQ(patterns.front().name, "Symmetrical Triangle");
    EXPECT_EQ(patterns.front().end_index, 20u);
    EXPECT_EQ(patterns.front().direction, PatternDirection::BULLISH);
    EXPECT_NEAR(patterns.front().confidence, 0.7, 1e-12);
}

TEST(ChartPatternsTest, RectangleBreaksOutDownward) {
    std::vector<PriceExtremum> swings = make_swings({{2, 110.0}, {10, 110.0}, {18, 110.0}}, {{6, 100.0}, {14, 100.0}});
    std::vector<Pattern> patterns = detect_triangles(make_channel_series(30, 105.0, 20, 99.0), swings, PatternConfig());

    ASSERT_EQ(patterns.size(), 1u);
    EXPECT_EQ(patterns.front().name, "Rectangle");
    EXPECT_EQ(patterns.front().start_index, 2u);
    EXPECT_EQ(patterns.front().end_index, 20u);
    EXPECT_EQ(patterns.front().direction, PatternDirection::BEARISH);
    EXPECT_EQ(patterns.front().category, PatternCategory::CONTINUATION);
    EXPECT_NEAR(patterns.front().confidence, 0.7, 1e-12);
}

TEST(ChartPatternsTest, ChannelsWithoutBreakoutCloseAreNotReported) {
    std::vector<PriceExtremum> rectangle_swings = make_swings({{2, 110.0}, {10, 110.0}, {18, 110.0}}, {{6, 100.0}, {14, 100.0}});
    EXPECT_TRUE(detect_triangles(make_channel_series(30, 105.0), rectangle_swings, PatternConfig()).empty());

    // Closes stay between the lines up to the last bar
    std::vector<PriceExtremum> ascending_swings = make_swings({{2, 110.0}, {10, 110.0}, {18, 110.0}}, {{6, 100.0}, {14, 104.0}});
    EXPECT_TRUE(detect_triangles(make_channel_series(22, 108.0), ascending_swings, PatternConfig()).empty());
}

TEST(ChartPatternsTest, ParallelSlopedChannelIsNotATriangle) {
    std::vector<PriceExtremum> swings = make_swings({{2, 110.0}, {10, 114.0}, {18, 118.0}}, {{6, 102.0}, {14, 106.0}});
    EXPECT_TRUE(detect_triangles(make_channel_series(22, 112.0, 20, 130.0), swings, PatternConfig()).empty());
}
