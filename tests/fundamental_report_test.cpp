#include "analyzer/fundamental_analysis/fundamental_report.hpp"
#include "analyzer/fundamental_analysis/fundamental_scorer.hpp"
#include <gtest/gtest.h>
#include <algorithm>

using namespace StockAdvisor::Core;
using StockAdvisor::Config::FundamentalConfig;

namespace {

bool contains_text(const std::vector<std::string>& lines, const std::string& text) {
    return std::find(lines.begin(), lines.end(), text) != lines.end();
}

FundamentalReport build_report(const FundamentalRecord& record) {
    FundamentalConfig config;
    return build_fundamental_report(record, score_fundamentals(record, config), config);
}

} // anonymous namespace

TEST(FundamentalReportTest, GradeAndRatingFollowComposite) {
    FundamentalRecord record;
    record.pe_ratio = 12.0;
    record.pb_ratio = 1.5;

    FundamentalReport report = build_report(record);
    EXPECT_EQ(report.overall_grade, "A+");
    EXPECT_EQ(report.rating, "Strong Buy");
    EXPECT_TRUE(contains_text(report.strengths, "Strong valuation metrics"));
    EXPECT_TRUE(report.weaknesses.empty());
    EXPECT_TRUE(contains_text(report.opportunities, "Undervalued based on P/E ratio"));
    EXPECT_TRUE(contains_text(report.insights, "P/E ratio indicates excellent value"));
}

TEST(FundamentalReportTest, RisksComeFromReportedMetrics) {
    FundamentalRecord record;
    record.debt_to_equity = 1.8;
    record.pe_ratio = 45.0;
    record.beta = 1.9;
    record.market_cap = 5e8;

    FundamentalReport report = build_report(record);
    EXPECT_TRUE(contains_text(report.risks, "High debt levels"));
    EXPECT_TRUE(contains_text(report.risks, "High valuation multiples"));
    EXPECT_TRUE(contains_text(report.risks, "High market volatility"));
    EXPECT_TRUE(contains_text(report.risks, "Small market capitalization"));
    EXPECT_TRUE(contains_text(report.weaknesses, "Poor valuation metrics"));
    EXPECT_TRUE(contains_text(report.weaknesses, "Poor financial health"));
    EXPECT_TRUE(report.opportunities.empty());
}

TEST(FundamentalReportTest, AbsentMetricsTriggerNothing) {
    FundamentalReport report = build_report(FundamentalRecord());
    EXPECT_EQ(report.overall_grade, "N/A");
    EXPECT_EQ(report.rating, "N/A");
    EXPECT_TRUE(report.strengths.empty());
    EXPECT_TRUE(report.weaknesses.empty());
    EXPECT_TRUE(report.risks.empty());
    EXPECT_TRUE(report.opportunities.empty());
    EXPECT_TRUE(report.insights.empty());
}

TEST(FundamentalReportTest, MidCapWithFastRevenueGrowthIsAnOpportunity) {
    FundamentalRecord record;
    record.market_cap = 5e9;
    record.revenue_growth = 0.25;

    FundamentalReport report = build_report(record);
    EXPECT_TRUE(contains_text(report.opportunities, "Strong revenue growth potential"));
    EXPECT_TRUE(contains_text(report.opportunities, "Mid-cap growth potential"));
    EXPECT_TRUE(contains_text(report.strengths, "Strong growth trajectory"));
    EXPECT_TRUE(report.risks.empty());
}

TEST(FundamentalReportTest, RatingBoundaries) {
    EXPECT_EQ(get_fundamental_rating(80.0), "Strong Buy");
    EXPECT_EQ(get_fundamental_rating(70.0), "Buy");
    EXPECT_EQ(get_fundamental_rating(60.0), "Hold");
    EXPECT_EQ(get_fundamental_rating(50.0), "Weak Hold");
    EXPECT_EQ(get_fundamental_rating(49.9), "Sell");
}
