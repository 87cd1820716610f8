#include "analyzer/coordinators/analysis_engine.hpp"
#include "analyzer/data_structures/analysis_errors.hpp"
#include "analyzer/serialization/result_serializer.hpp"
#include "api/file/csv_market_data_provider.hpp"
#include "logging/logger/async_logger.hpp"
#include "test_helpers.hpp"
#include <gtest/gtest.h>

using namespace StockAdvisor::Core;
using StockAdvisor::API::CsvMarketDataProvider;
using StockAdvisor::Config::SystemConfig;
using StockAdvisor::Testing::TemporaryDirectory;
using StockAdvisor::Testing::format_bars_as_csv;
using StockAdvisor::Testing::make_bars_from_closes;
using StockAdvisor::Testing::make_close_path;
using StockAdvisor::Testing::make_series_from_closes;

namespace {

std::vector<double> make_swinging_closes() {
    return make_close_path({100.0, 120.0, 105.0, 125.0, 110.0, 130.0, 115.0});
}

FundamentalRecord make_value_record() {
    FundamentalRecord record;
    record.symbol = "TEST";
    record.pe_ratio = 12.0;
    record.pb_ratio = 1.5;
    return record;
}

} // anonymous namespace

class AnalysisEngineTest : public ::testing::Test {
protected:
    SystemConfig system_config;
    AnalysisRequest request{"TEST", "max", "1d"};
};

TEST_F(AnalysisEngineTest, TechnicalOnlyWithoutFundamentals) {
    AnalysisEngine engine(system_config);
    Series series = make_series_from_closes(make_swinging_closes());

    AnalysisResult result = engine.analyze(request, series, std::nullopt, std::vector<FundamentalRecord>(), "provider has no fundamentals");

    EXPECT_EQ(result.symbol, "TEST");
    EXPECT_FALSE(result.fundamental.available);
    EXPECT_EQ(result.fundamental.unavailable_reason, "provider has no fundamentals");
    EXPECT_FALSE(result.technical.signals.empty());
    EXPECT_EQ(result.recommendation.basis, RecommendationBasis::TECHNICAL_ONLY);
    EXPECT_FALSE(result.recommendation.fundamental_contribution.has_value());
}

TEST_F(AnalysisEngineTest, IndicatorSeriesAlignWithBars) {
    AnalysisEngine engine(system_config);
    Series series = make_series_from_closes(make_swinging_closes());

    AnalysisResult result = engine.analyze(request, series, std::nullopt, std::vector<FundamentalRecord>());

    ASSERT_EQ(result.bar_timestamps.size(), series.size());
    EXPECT_EQ(result.price_summary.bar_count, series.size());
    for (const auto& indicator_entry : result.technical.indicators.series) {
        EXPECT_EQ(indicator_entry.second.size(), series.size()) << indicator_entry.first;
    }
}

TEST_F(AnalysisEngineTest, CombinesBothBranches) {
    AnalysisEngine engine(system_config);
    Series series = make_series_from_closes(make_swinging_closes());

    AnalysisResult result = engine.analyze(request, series, make_value_record(), std::vector<FundamentalRecord>());

    ASSERT_TRUE(result.fundamental.available);
    ASSERT_TRUE(result.fundamental.scores.composite.has_value());
    EXPECT_DOUBLE_EQ(*result.fundamental.scores.composite, 90.0);
    EXPECT_EQ(result.fundamental.report.rating, "Strong Buy");
    EXPECT_EQ(result.fundamental.valuations.size(), 2u);
    EXPECT_FALSE(result.fundamental.peer_comparison.has_value());
    EXPECT_EQ(result.recommendation.basis, RecommendationBasis::COMBINED);
    EXPECT_NEAR(*result.recommendation.fundamental_contribution, 0.8, 1e-12);
}

TEST_F(AnalysisEngineTest, FundamentalWorkerReleasesItsThreadTag) {
    AnalysisEngine engine(system_config);
    Series series = make_series_from_closes(make_swinging_closes());
    StockAdvisor::Logging::LoggingContext* logging_context = StockAdvisor::Logging::get_logging_context();
    size_t tag_count_before = logging_context->get_thread_tag_count();

    for (int run_index = 0; run_index < 3; ++run_index) {
        engine.analyze(request, series, make_value_record(), std::vector<FundamentalRecord>());
    }
    EXPECT_EQ(logging_context->get_thread_tag_count(), tag_count_before);
}

TEST_F(AnalysisEngineTest, RepeatedRunsProduceIdenticalDocuments) {
    AnalysisEngine engine(system_config);
    Series series = make_series_from_closes(make_swinging_closes());

    std::string first_document = serialize_analysis(engine.analyze(request, series, make_value_record(), std::vector<FundamentalRecord>()),
                                                    system_config.output.chart_history_bars).dump();
    std::string second_document = serialize_analysis(engine.analyze(request, series, make_value_record(), std::vector<FundamentalRecord>()),
                                                     system_config.output.chart_history_bars).dump();
    EXPECT_EQ(first_document, second_document);
}

TEST_F(AnalysisEngineTest, FetchesSeriesFundamentalsAndPeersFromProvider) {
    TemporaryDirectory data_directory("engine");
    data_directory.write_file("TEST_1d.csv", format_bars_as_csv(make_bars_from_closes(make_swinging_closes())));
    data_directory.write_file("TEST_fundamentals.json", "{\"pe_ratio\": 12, \"pb_ratio\": 1.5, \"roe\": 0.18}");
    data_directory.write_file("PEER_fundamentals.json", "{\"pe_ratio\": 24, \"roe\": 0.12}");

    CsvMarketDataProvider provider(data_directory.path());
    AnalysisEngine engine(system_config);
    request.peer_symbols = {"PEER", "MISSING", "TEST"};

    AnalysisResult result = engine.analyze(provider, request);

    ASSERT_TRUE(result.fundamental.available);
    ASSERT_TRUE(result.fundamental.peer_comparison.has_value());
    ASSERT_EQ(result.fundamental.peer_comparison->peer_symbols.size(), 1u);
    EXPECT_EQ(result.fundamental.peer_comparison->peer_symbols[0], "PEER");
    EXPECT_EQ(result.fundamental.peer_comparison->metrics.size(), 2u);
    EXPECT_EQ(result.recommendation.basis, RecommendationBasis::COMBINED);
}

TEST_F(AnalysisEngineTest, MissingFundamentalsDegradeToTechnicalOnly) {
    TemporaryDirectory data_directory("engine");
    data_directory.write_file("TEST_1d.csv", format_bars_as_csv(make_bars_from_closes(make_swinging_closes())));

    CsvMarketDataProvider provider(data_directory.path());
    AnalysisEngine engine(system_config);
    request.peer_symbols = {"PEER"};

    AnalysisResult result = engine.analyze(provider, request);

    EXPECT_FALSE(result.fundamental.available);
    EXPECT_NE(result.fundamental.unavailable_reason.find("No fundamentals for TEST"), std::string::npos);
    EXPECT_EQ(result.recommendation.basis, RecommendationBasis::TECHNICAL_ONLY);
}

TEST_F(AnalysisEngineTest, SeriesFailuresPropagate) {
    TemporaryDirectory data_directory("engine");
    data_directory.write_file("EMPTY_1d.csv", "date,open,high,low,close,volume\n");

    CsvMarketDataProvider provider(data_directory.path());
    AnalysisEngine engine(system_config);

    EXPECT_THROW(engine.analyze(provider, AnalysisRequest("NOPE", "max", "1d")), NotFoundError);
    EXPECT_THROW(engine.analyze(provider, AnalysisRequest("EMPTY", "max", "1d")), DataInsufficientError);
}

TEST(SummarizePricesTest, ChangeAgainstPriorClose) {
    PriceSummary price_summary = summarize_prices(make_series_from_closes({100.0, 110.0}));
    EXPECT_DOUBLE_EQ(price_summary.last_close, 110.0);
    ASSERT_TRUE(price_summary.change.has_value());
    EXPECT_DOUBLE_EQ(*price_summary.change, 10.0);
    EXPECT_DOUBLE_EQ(*price_summary.change_percent, 10.0);
    EXPECT_EQ(price_summary.bar_count, 2u);
    EXPECT_EQ(price_summary.last_timestamp - price_summary.first_timestamp, 86400);
}

TEST(SummarizePricesTest, SingleBarHasNoChange) {
    PriceSummary price_summary = summarize_prices(make_series_from_closes({100.0}));
    EXPECT_FALSE(price_summary.change.has_value());
    EXPECT_FALSE(price_summary.change_percent.has_value());
}
