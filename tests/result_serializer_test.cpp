#include "analyzer/serialization/result_serializer.hpp"
#include "test_helpers.hpp"
#include <gtest/gtest.h>

using namespace StockAdvisor::Core;
using StockAdvisor::Testing::FIRST_BAR_TIMESTAMP;

namespace {

std::vector<std::int64_t> make_daily_timestamps(size_t bar_count) {
    std::vector<std::int64_t> bar_timestamps;
    for (size_t bar_index = 0; bar_index < bar_count; ++bar_index) {
        bar_timestamps.push_back(FIRST_BAR_TIMESTAMP + static_cast<std::int64_t>(bar_index) * 86400);
    }
    return bar_timestamps;
}

IndicatorSet make_indicator_set() {
    IndicatorSet indicators;
    indicators.series["SMA_3"] = IndicatorSeries{std::nullopt, std::nullopt, 2.0, 3.0};
    indicators.series["OBV"] = IndicatorSeries{0.0, 100.0, 50.0, std::nullopt};
    indicators.omitted.emplace_back("SMA_50", 50, 4);
    return indicators;
}

AnalysisResult make_minimal_result() {
    AnalysisResult result;
    result.symbol = "TEST";
    result.period = "1y";
    result.interval = "1d";
    result.bar_timestamps = make_daily_timestamps(4);
    result.price_summary.last_close = 101.5;
    result.price_summary.bar_count = 4;
    result.price_summary.first_timestamp = result.bar_timestamps.front();
    result.price_summary.last_timestamp = result.bar_timestamps.back();
    result.technical.indicators = make_indicator_set();
    result.fundamental.unavailable_reason = "no fundamental record supplied";
    return result;
}

} // anonymous namespace

TEST(ResultSerializerTest, IndicatorHistoryKeepsTrailingBars) {
    json indicator_json = serialize_indicators(make_indicator_set(), make_daily_timestamps(4), 2);

    const json& history_json = indicator_json["history"];
    ASSERT_EQ(history_json["timestamps"].size(), 2u);
    EXPECT_EQ(history_json["timestamps"][0], "2024-01-03T00:00:00Z");
    ASSERT_EQ(history_json["values"]["SMA_3"].size(), 2u);
    EXPECT_DOUBLE_EQ(history_json["values"]["SMA_3"][0].get<double>(), 2.0);
    EXPECT_TRUE(history_json["values"]["OBV"][1].is_null());
}

TEST(ResultSerializerTest, AbsentIndicatorValuesAreNull) {
    json indicator_json = serialize_indicators(make_indicator_set(), make_daily_timestamps(4), 100);

    EXPECT_EQ(indicator_json["history"]["timestamps"].size(), 4u);
    EXPECT_TRUE(indicator_json["history"]["values"]["SMA_3"][0].is_null());
    EXPECT_DOUBLE_EQ(indicator_json["latest"]["SMA_3"].get<double>(), 3.0);
    EXPECT_TRUE(indicator_json["latest"]["OBV"].is_null());
    EXPECT_EQ(indicator_json["omitted"]["SMA_50"]["required_bars"], 50);
    EXPECT_EQ(indicator_json["omitted"]["SMA_50"]["available_bars"], 4);
}

TEST(ResultSerializerTest, ZeroHistoryBarsGivesEmptyHistory) {
    json indicator_json = serialize_indicators(make_indicator_set(), make_daily_timestamps(4), 0);
    EXPECT_TRUE(indicator_json["history"]["timestamps"].empty());
    EXPECT_TRUE(indicator_json["history"]["values"]["SMA_3"].empty());
    EXPECT_DOUBLE_EQ(indicator_json["latest"]["SMA_3"].get<double>(), 3.0);
}

TEST(ResultSerializerTest, DocumentHasTopLevelSections) {
    json document = serialize_analysis(make_minimal_result(), 100);

    for (const char* section_name : {"symbol", "period", "interval", "price", "technical", "fundamental", "recommendation"}) {
        EXPECT_TRUE(document.contains(section_name)) << section_name;
    }
    EXPECT_EQ(document["symbol"], "TEST");
    EXPECT_TRUE(document["price"]["change"].is_null());
    EXPECT_EQ(document["price"]["first_timestamp"], "2024-01-01T00:00:00Z");
    EXPECT_TRUE(document["technical"]["patterns"].is_array());
    EXPECT_TRUE(document["technical"]["levels"].is_array());
    EXPECT_TRUE(document["technical"]["signals"].is_array());
}

TEST(ResultSerializerTest, UnavailableFundamentalsCarryOnlyTheReason) {
    json fundamental_json = serialize_fundamentals(make_minimal_result().fundamental);
    EXPECT_EQ(fundamental_json["available"], false);
    EXPECT_EQ(fundamental_json["unavailable_reason"], "no fundamental record supplied");
    EXPECT_FALSE(fundamental_json.contains("categories"));
}

TEST(ResultSerializerTest, UndefinedCategoriesAndValuationsAreNull) {
    FundamentalAnalysis fundamental;
    fundamental.available = true;
    CategoryScore growth_score;
    growth_score.category = FundamentalCategory::GROWTH;
    growth_score.missing_metrics = {"revenue_growth"};
    fundamental.scores.categories.push_back(growth_score);

    ValuationEstimate ddm_estimate;
    ddm_estimate.model = ValuationModel::DDM;
    ddm_estimate.inapplicable_reason = "no dividend paid";
    fundamental.valuations.push_back(ddm_estimate);

    json fundamental_json = serialize_fundamentals(fundamental);
    EXPECT_TRUE(fundamental_json["composite"].is_null());
    EXPECT_TRUE(fundamental_json["categories"]["growth"]["score"].is_null());
    EXPECT_TRUE(fundamental_json["categories"]["growth"]["grade"].is_null());
    EXPECT_EQ(fundamental_json["categories"]["growth"]["missing_metrics"][0], "revenue_growth");
    EXPECT_TRUE(fundamental_json["valuations"]["ddm"]["fair_value"].is_null());
    EXPECT_EQ(fundamental_json["valuations"]["ddm"]["inapplicable_reason"], "no dividend paid");
    EXPECT_TRUE(fundamental_json["peer_comparison"].is_null());
}

TEST(ResultSerializerTest, RecommendationWithoutBranches) {
    json recommendation_json = serialize_recommendation(Recommendation());
    EXPECT_EQ(recommendation_json["outcome"], "insufficient_data");
    EXPECT_EQ(recommendation_json["basis"], "none");
    EXPECT_TRUE(recommendation_json["technical_contribution"].is_null());
    EXPECT_TRUE(recommendation_json["fundamental_contribution"].is_null());
}

TEST(ResultSerializerTest, DumpIsKeyOrdered) {
    AnalysisResult result = make_minimal_result();
    std::string document_text = serialize_analysis(result, 100).dump();

    EXPECT_EQ(document_text, serialize_analysis(result, 100).dump());
    EXPECT_EQ(document_text.rfind("{\"fundamental\":", 0), 0u);
}
