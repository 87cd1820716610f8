#include "analyzer/technical_analysis/candlestick_patterns.hpp"
#include "analyzer/technical_analysis/pattern_recognizer.hpp"
#include "test_helpers.hpp"
#include <gtest/gtest.h>
#include <algorithm>
#include <set>

using namespace StockAdvisor::Core;
using StockAdvisor::Config::PatternConfig;
using StockAdvisor::Testing::make_bar;
using StockAdvisor::Testing::make_flat_series;

namespace {

// Ten black candles falling one point per bar: closes 109 down to 100
std::vector<Bar> make_downtrend_bars() {
    std::vector<Bar> bars;
    for (size_t bar_index = 0; bar_index < 10; ++bar_index) {
        double open_price = 110.0 - static_cast<double>(bar_index);
        double close_price = open_price - 1.0;
        bars.push_back(make_bar(bar_index, open_price, open_price + 0.2, close_price - 0.2, close_price));
    }
    return bars;
}

const Pattern* find_pattern(const std::vector<Pattern>& patterns, const std::string& pattern_name, size_t start_index, size_t end_index) {
    std::vector<Pattern>::const_iterator pattern_iterator = std::find_if(patterns.begin(), patterns.end(), [&](const Pattern& pattern) {
        return pattern.name == pattern_name && pattern.start_index == start_index && pattern.end_index == end_index;
    });
    return pattern_iterator == patterns.end() ? nullptr : &*pattern_iterator;
}

} // anonymous namespace

TEST(CandlestickPatternsTest, CatalogNamesAreUnique) {
    const std::vector<CandlestickRule>& candlestick_catalog = get_candlestick_catalog();
    std::set<std::string> rule_names;
    for (const CandlestickRule& candlestick_rule : candlestick_catalog) {
        EXPECT_TRUE(rule_names.insert(candlestick_rule.name).second) << candlestick_rule.name;
        EXPECT_GE(candlestick_rule.window_length, 1);
        EXPECT_LE(candlestick_rule.window_length, 5);
    }
    EXPECT_GE(candlestick_catalog.size(), 60u);
}

TEST(CandlestickPatternsTest, PriorTrendComparesLastCloseWithAverage) {
    Series series = Series::from_bars(make_downtrend_bars());
    EXPECT_EQ(compute_prior_trend(series, 9, 5), TrendDirection::DOWN);
    EXPECT_EQ(compute_prior_trend(series, 3, 5), TrendDirection::FLAT);
    EXPECT_EQ(compute_prior_trend(make_flat_series(10, 20.0), 8, 5), TrendDirection::FLAT);
}

TEST(CandlestickPatternsTest, AverageBodyUsesBarsBeforeWindow) {
    Series series = Series::from_bars(make_downtrend_bars());
    EXPECT_DOUBLE_EQ(compute_average_body(series, 9, 1, 10), 1.0);
    EXPECT_DOUBLE_EQ(compute_average_body(series, 0, 1, 10), 1.0);
}

TEST(CandlestickPatternsTest, DetectsHammerAfterDecline) {
    std::vector<Bar> bars = make_downtrend_bars();
    bars.push_back(make_bar(10, 100.0, 100.55, 98.5, 100.5));
    Series series = Series::from_bars(bars);

    std::vector<Pattern> patterns = detect_candlestick_patterns(series, PatternConfig());
    const Pattern* hammer = find_pattern(patterns, "Hammer", 10, 10);
    ASSERT_NE(hammer, nullptr);
    EXPECT_EQ(hammer->direction, PatternDirection::BULLISH);
    EXPECT_EQ(hammer->category, PatternCategory::REVERSAL);
    EXPECT_EQ(hammer->kind, PatternKind::CANDLESTICK);
    EXPECT_GT(hammer->confidence, 0.5);
    EXPECT_LE(hammer->confidence, 1.0);
}

TEST(CandlestickPatternsTest, DetectsBullishEngulfingAfterDecline) {
    std::vector<Bar> bars = make_downtrend_bars();
    bars.push_back(make_bar(10, 99.5, 101.7, 99.3, 101.5));
    Series series = Series::from_bars(bars);

    std::vector<Pattern> patterns = detect_candlestick_patterns(series, PatternConfig());
    const Pattern* engulfing = find_pattern(patterns, "Engulfing", 9, 10);
    ASSERT_NE(engulfing, nullptr);
    EXPECT_EQ(engulfing->direction, PatternDirection::BULLISH);
    EXPECT_DOUBLE_EQ(engulfing->confidence, 1.0);
}

TEST(CandlestickPatternsTest, OneCandlestickPerWindow) {
    std::vector<Bar> bars = make_downtrend_bars();
    bars.push_back(make_bar(10, 100.0, 100.55, 98.5, 100.5));
    std::vector<Pattern> patterns = detect_candlestick_patterns(Series::from_bars(bars), PatternConfig());

    std::set<std::pair<size_t, size_t>> windows;
    for (const Pattern& pattern : patterns) {
        EXPECT_TRUE(windows.insert(std::make_pair(pattern.start_index, pattern.end_index)).second)
            << pattern.name << " duplicates window " << pattern.start_index << "-" << pattern.end_index;
    }
}

TEST(CandlestickPatternsTest, ZeroRangeBarsFormNoCandlesticks) {
    EXPECT_TRUE(detect_candlestick_patterns(make_flat_series(30, 50.0), PatternConfig()).empty());
}

TEST(CandlestickPatternsTest, ScanBarsLimitsTheSearchToTheTail) {
    std::vector<Bar> bars = make_downtrend_bars();
    bars.push_back(make_bar(10, 100.0, 100.55, 98.5, 100.5));
    PatternConfig config;
    config.candlestick_scan_bars = 1;

    std::vector<Pattern> patterns = detect_candlestick_patterns(Series::from_bars(bars), config);
    for (const Pattern& pattern : patterns) {
        EXPECT_EQ(pattern.end_index, 10u) << pattern.name;
    }
    EXPECT_NE(find_pattern(patterns, "Hammer", 10, 10), nullptr);
}

TEST(PatternRecognizerTest, OrdersMostRecentFirst) {
    Pattern older_pattern;
    older_pattern.name = "Older";
    older_pattern.start_index = 2;
    older_pattern.end_index = 5;
    Pattern wider_pattern;
    wider_pattern.name = "Wider";
    wider_pattern.start_index = 3;
    wider_pattern.end_index = 9;
    Pattern newer_pattern;
    newer_pattern.name = "Newer";
    newer_pattern.start_index = 9;
    newer_pattern.end_index = 9;

    EXPECT_TRUE(is_more_recent_pattern(newer_pattern, wider_pattern));
    EXPECT_TRUE(is_more_recent_pattern(wider_pattern, older_pattern));
    EXPECT_FALSE(is_more_recent_pattern(older_pattern, newer_pattern));

    Pattern confident_pattern = newer_pattern;
    confident_pattern.name = "Confident";
    confident_pattern.confidence = 0.9;
    newer_pattern.confidence = 0.6;
    EXPECT_TRUE(is_more_recent_pattern(confident_pattern, newer_pattern));
}

TEST(PatternRecognizerTest, RecognizedPatternsAreSorted) {
    std::vector<Bar> bars = make_downtrend_bars();
    bars.push_back(make_bar(10, 100.0, 100.55, 98.5, 100.5));
    std::vector<Pattern> patterns = recognize_patterns(Series::from_bars(bars), PatternConfig());

    ASSERT_FALSE(patterns.empty());
    EXPECT_TRUE(std::is_sorted(patterns.begin(), patterns.end(), is_more_recent_pattern));
    EXPECT_EQ(patterns.front().end_index, 10u);
}
