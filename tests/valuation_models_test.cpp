#include "analyzer/data_structures/analysis_errors.hpp"
#include "analyzer/fundamental_analysis/valuation_models.hpp"
#include <gtest/gtest.h>

using namespace StockAdvisor::Core;
using StockAdvisor::Config::ValuationConfig;

namespace {

FundamentalRecord make_cash_flow_record() {
    FundamentalRecord record;
    record.free_cash_flow = 1e9;
    record.shares_outstanding = 1e8;
    record.earnings_growth = 0.05;
    record.beta = 1.0;
    record.current_price = 100.0;
    return record;
}

} // anonymous namespace

TEST(ValuationModelsTest, DiscountRateFollowsCapm) {
    ValuationConfig config;
    FundamentalRecord record;
    record.beta = 1.2;

    DiscountRate discount_rate = compute_discount_rate(record, config);
    EXPECT_NEAR(discount_rate.rate, 0.04 + 1.2 * 0.055, 1e-12);
    EXPECT_FALSE(discount_rate.beta_assumed);

    DiscountRate default_rate = compute_discount_rate(FundamentalRecord(), config);
    EXPECT_DOUBLE_EQ(default_rate.beta, 1.0);
    EXPECT_TRUE(default_rate.beta_assumed);
    EXPECT_NEAR(default_rate.rate, 0.095, 1e-12);
}

TEST(ValuationModelsTest, TwoStageValueOfOneYearHorizon) {
    // 1 / 1.1 + (1 / 0.1) / 1.1
    EXPECT_NEAR(compute_two_stage_value(1.0, 0.0, 0.1, 1, 0.0), 10.0, 1e-9);
}

TEST(ValuationModelsTest, TwoStageValueRejectsGrowthAtOrAboveDiscount) {
    EXPECT_THROW(compute_two_stage_value(1.0, 0.1, 0.1, 5, 0.02), DivergentModelError);
    EXPECT_THROW(compute_two_stage_value(1.0, 0.05, 0.1, 5, 0.12), DivergentModelError);
}

TEST(ValuationModelsTest, DiscountedCashFlowPerShare) {
    ValuationConfig config;
    FundamentalRecord record = make_cash_flow_record();

    ValuationEstimate estimate = estimate_dcf(record, config);
    ASSERT_TRUE(estimate.applicable);
    double expected_value = compute_two_stage_value(10.0, 0.05, 0.04 + 1.0 * 0.055, 5, 0.025);
    ASSERT_TRUE(estimate.fair_value.has_value());
    EXPECT_NEAR(*estimate.fair_value, expected_value, 1e-9);
    ASSERT_TRUE(estimate.upside.has_value());
    EXPECT_NEAR(*estimate.upside, expected_value / 100.0 - 1.0, 1e-12);
    EXPECT_DOUBLE_EQ(estimate.assumptions.at("free_cash_flow_per_share"), 10.0);
    EXPECT_DOUBLE_EQ(estimate.assumptions.at("beta_assumed"), 0.0);
}

TEST(ValuationModelsTest, DiscountedCashFlowFallsBackToRevenueGrowth) {
    FundamentalRecord record = make_cash_flow_record();
    record.earnings_growth.reset();
    record.revenue_growth = 0.03;

    ValuationEstimate estimate = estimate_dcf(record, ValuationConfig());
    ASSERT_TRUE(estimate.applicable);
    EXPECT_DOUBLE_EQ(estimate.assumptions.at("growth_rate"), 0.03);
}

TEST(ValuationModelsTest, DiscountedCashFlowInapplicableWithoutInputs) {
    FundamentalRecord record = make_cash_flow_record();
    record.free_cash_flow.reset();

    ValuationEstimate estimate = estimate_dcf(record, ValuationConfig());
    EXPECT_FALSE(estimate.applicable);
    EXPECT_FALSE(estimate.fair_value.has_value());
    EXPECT_EQ(estimate.inapplicable_reason, "free_cash_flow not reported");
}

TEST(ValuationModelsTest, DiscountedCashFlowInapplicableWhenGrowthOutrunsDiscount) {
    FundamentalRecord record = make_cash_flow_record();
    record.earnings_growth = 0.12;

    ValuationEstimate estimate = estimate_dcf(record, ValuationConfig());
    EXPECT_FALSE(estimate.applicable);
    EXPECT_NE(estimate.inapplicable_reason.find("not below discount rate"), std::string::npos);
}

TEST(ValuationModelsTest, DividendDiscountModel) {
    FundamentalRecord record;
    record.dividend_yield = 0.02;
    record.current_price = 100.0;
    record.dividend_growth = 0.03;

    ValuationEstimate estimate = estimate_ddm(record, ValuationConfig());
    ASSERT_TRUE(estimate.applicable);
    EXPECT_NEAR(*estimate.fair_value, compute_two_stage_value(2.0, 0.03, 0.095, 5, 0.025), 1e-9);
    EXPECT_DOUBLE_EQ(estimate.assumptions.at("beta_assumed"), 1.0);
}

TEST(ValuationModelsTest, DividendDiscountModelNeedsADividend) {
    ValuationEstimate estimate = estimate_ddm(make_cash_flow_record(), ValuationConfig());
    EXPECT_FALSE(estimate.applicable);
    EXPECT_EQ(estimate.inapplicable_reason, "no dividend paid");
}

TEST(ValuationModelsTest, RunsBothModelsInOrder) {
    std::vector<ValuationEstimate> estimates = run_valuation_models(make_cash_flow_record(), ValuationConfig());
    ASSERT_EQ(estimates.size(), 2u);
    EXPECT_EQ(estimates[0].model, ValuationModel::DCF);
    EXPECT_EQ(estimates[1].model, ValuationModel::DDM);
    EXPECT_TRUE(estimates[0].applicable);
    EXPECT_FALSE(estimates[1].applicable);
}
