#include "analyzer/fundamental_analysis/peer_comparison.hpp"
#include <gtest/gtest.h>

using namespace StockAdvisor::Core;

namespace {

FundamentalRecord make_record(const std::string& symbol, const MetricValue& pe_ratio, const MetricValue& roe) {
    FundamentalRecord record;
    record.symbol = symbol;
    record.pe_ratio = pe_ratio;
    record.roe = roe;
    return record;
}

const PeerMetricComparison* find_metric(const PeerComparison& peer_comparison, const std::string& metric_name) {
    for (const PeerMetricComparison& metric_comparison : peer_comparison.metrics) {
        if (metric_comparison.metric == metric_name) {
            return &metric_comparison;
        }
    }
    return nullptr;
}

} // anonymous namespace

class PeerComparisonTest : public ::testing::Test {
protected:
    void SetUp() override {
        stock_record = make_record("SELF", 10.0, 0.2);
        stock_record.beta = 1.1;
        peer_records.push_back(make_record("PEER_A", 20.0, 0.1));
        peer_records.push_back(make_record("PEER_B", 30.0, 0.3));
        peer_records.push_back(make_record("PEER_C", std::nullopt, std::nullopt));
        peer_records.back().market_cap = 2e9;
    }

    FundamentalRecord stock_record;
    std::vector<FundamentalRecord> peer_records;
};

TEST_F(PeerComparisonTest, LowerIsBetterForValuationMultiples) {
    PeerComparison peer_comparison = compare_with_peers(stock_record, peer_records);

    const PeerMetricComparison* pe_comparison = find_metric(peer_comparison, "pe_ratio");
    ASSERT_NE(pe_comparison, nullptr);
    EXPECT_TRUE(pe_comparison->lower_is_better);
    EXPECT_DOUBLE_EQ(pe_comparison->peer_average, 25.0);
    EXPECT_DOUBLE_EQ(pe_comparison->difference, -15.0);
    ASSERT_TRUE(pe_comparison->percent_difference.has_value());
    EXPECT_DOUBLE_EQ(*pe_comparison->percent_difference, -60.0);
    EXPECT_EQ(pe_comparison->compared_count, 3);
    EXPECT_EQ(pe_comparison->rank, 1);
    EXPECT_DOUBLE_EQ(pe_comparison->percentile, 100.0);
}

TEST_F(PeerComparisonTest, HigherIsBetterForReturns) {
    PeerComparison peer_comparison = compare_with_peers(stock_record, peer_records);

    const PeerMetricComparison* roe_comparison = find_metric(peer_comparison, "roe");
    ASSERT_NE(roe_comparison, nullptr);
    EXPECT_FALSE(roe_comparison->lower_is_better);
    EXPECT_EQ(roe_comparison->rank, 2);
    EXPECT_EQ(roe_comparison->compared_count, 3);
    EXPECT_NEAR(roe_comparison->percentile, 200.0 / 3.0, 1e-9);
}

TEST_F(PeerComparisonTest, OnlyMetricsReportedOnBothSidesAreCompared) {
    PeerComparison peer_comparison = compare_with_peers(stock_record, peer_records);

    ASSERT_EQ(peer_comparison.metrics.size(), 2u);
    EXPECT_EQ(peer_comparison.metrics[0].metric, "pe_ratio");
    EXPECT_EQ(peer_comparison.metrics[1].metric, "roe");
    EXPECT_EQ(find_metric(peer_comparison, "beta"), nullptr);
    EXPECT_EQ(find_metric(peer_comparison, "market_cap"), nullptr);

    ASSERT_EQ(peer_comparison.peer_symbols.size(), 3u);
    EXPECT_EQ(peer_comparison.peer_symbols[0], "PEER_A");
    EXPECT_EQ(peer_comparison.peer_symbols[2], "PEER_C");
}

TEST_F(PeerComparisonTest, TiedPeerSharesTheRank) {
    std::vector<FundamentalRecord> tied_peers;
    tied_peers.push_back(make_record("TWIN", 10.0, std::nullopt));

    PeerComparison peer_comparison = compare_with_peers(stock_record, tied_peers);
    const PeerMetricComparison* pe_comparison = find_metric(peer_comparison, "pe_ratio");
    ASSERT_NE(pe_comparison, nullptr);
    EXPECT_EQ(pe_comparison->rank, 1);
    EXPECT_DOUBLE_EQ(pe_comparison->percentile, 100.0);
    EXPECT_DOUBLE_EQ(pe_comparison->difference, 0.0);
}

TEST_F(PeerComparisonTest, ZeroPeerAverageLeavesPercentDifferenceUndefined) {
    std::vector<FundamentalRecord> zero_peers;
    zero_peers.push_back(make_record("ZERO", std::nullopt, 0.0));

    PeerComparison peer_comparison = compare_with_peers(stock_record, zero_peers);
    const PeerMetricComparison* roe_comparison = find_metric(peer_comparison, "roe");
    ASSERT_NE(roe_comparison, nullptr);
    EXPECT_FALSE(roe_comparison->percent_difference.has_value());
    EXPECT_DOUBLE_EQ(roe_comparison->difference, 0.2);
}

TEST_F(PeerComparisonTest, NoPeersGivesNoMetrics) {
    PeerComparison peer_comparison = compare_with_peers(stock_record, std::vector<FundamentalRecord>());
    EXPECT_TRUE(peer_comparison.metrics.empty());
    EXPECT_TRUE(peer_comparison.peer_symbols.empty());
}
