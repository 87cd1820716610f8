#include "analyzer/data_structures/analysis_errors.hpp"
#include "analyzer/market_data/market_data_validator.hpp"
#include "analyzer/market_data/series.hpp"
#include "test_helpers.hpp"
#include <gtest/gtest.h>
#include <limits>

using namespace StockAdvisor::Core;
using StockAdvisor::Testing::make_bar;

TEST(SeriesTest, ExtractsPriceColumns) {
    std::vector<Bar> bars = {
        make_bar(0, 10.0, 11.0, 9.0, 10.5, 100.0),
        make_bar(1, 10.5, 12.0, 10.0, 11.5, 200.0),
        make_bar(2, 11.5, 11.8, 10.8, 11.0, 150.0),
    };
    Series series = Series::from_bars(bars);

    ASSERT_EQ(series.size(), 3u);
    EXPECT_EQ(series.closes(), (std::vector<double>{10.5, 11.5, 11.0}));
    EXPECT_EQ(series.volumes(), (std::vector<double>{100.0, 200.0, 150.0}));
    EXPECT_DOUBLE_EQ(series.highest_high(), 12.0);
    EXPECT_DOUBLE_EQ(series.lowest_low(), 9.0);
    EXPECT_EQ(series.back().timestamp, bars.back().timestamp);
}

TEST(SeriesTest, EmptyInputIsInsufficientData) {
    EXPECT_THROW(Series::from_bars({}), DataInsufficientError);
}

TEST(SeriesTest, AllNanClosesAreInsufficientData) {
    double not_a_number = std::numeric_limits<double>::quiet_NaN();
    std::vector<Bar> bars = {
        make_bar(0, 10.0, 11.0, 9.0, not_a_number),
        make_bar(1, 10.0, 11.0, 9.0, not_a_number),
    };
    EXPECT_THROW(Series::from_bars(bars), DataInsufficientError);
}

TEST(SeriesTest, SingleNanCloseIsInvalid) {
    std::vector<Bar> bars = {
        make_bar(0, 10.0, 11.0, 9.0, 10.0),
        make_bar(1, 10.0, 11.0, 9.0, std::numeric_limits<double>::quiet_NaN()),
    };
    EXPECT_THROW(Series::from_bars(bars), InvalidSeriesError);
}

TEST(SeriesTest, HighBelowCloseIsInvalid) {
    std::vector<Bar> bars = {make_bar(0, 10.0, 10.2, 9.0, 10.5)};
    try {
        Series::from_bars(bars);
        FAIL() << "expected InvalidSeriesError";
    } catch (const InvalidSeriesError& invalid_series_error) {
        EXPECT_NE(std::string(invalid_series_error.what()).find("index 0"), std::string::npos);
    }
}

TEST(SeriesTest, NegativeVolumeIsInvalid) {
    std::vector<Bar> bars = {make_bar(0, 10.0, 11.0, 9.0, 10.5, -1.0)};
    EXPECT_THROW(Series::from_bars(bars), InvalidSeriesError);
}

TEST(SeriesTest, DuplicateTimestampIsInvalid) {
    std::vector<Bar> bars = {
        make_bar(0, 10.0, 11.0, 9.0, 10.5),
        make_bar(0, 10.5, 11.0, 10.0, 10.8),
    };
    EXPECT_THROW(Series::from_bars(bars), InvalidSeriesError);
}

TEST(MarketDataValidatorTest, ReportsFailureReason) {
    MarketDataValidator market_data_validator;
    std::string failure_reason;

    EXPECT_TRUE(market_data_validator.validate_price_data(make_bar(0, 10.0, 11.0, 9.0, 10.5), failure_reason));
    EXPECT_FALSE(market_data_validator.validate_price_data(make_bar(0, 10.0, 11.0, 10.2, 10.5), failure_reason));
    EXPECT_EQ(failure_reason, "low above open/close");
    EXPECT_FALSE(market_data_validator.validate_price_data(make_bar(0, 0.0, 11.0, 9.0, 10.5), failure_reason));
    EXPECT_EQ(failure_reason, "non-positive price");
}

TEST(MarketDataValidatorTest, ZeroVolumeAndZeroRangeAreValid) {
    MarketDataValidator market_data_validator;
    std::string failure_reason;
    EXPECT_TRUE(market_data_validator.validate_price_data(make_bar(0, 10.0, 10.0, 10.0, 10.0, 0.0), failure_reason));
}
