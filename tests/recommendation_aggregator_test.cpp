#include "analyzer/recommendation/recommendation_aggregator.hpp"
#include <gtest/gtest.h>

using namespace StockAdvisor::Core;
using StockAdvisor::Config::RecommendationConfig;
using StockAdvisor::Config::SignalConfig;

class RecommendationAggregatorTest : public ::testing::Test {
protected:
    SignalConfig signal_config;
    RecommendationConfig recommendation_config;
    std::vector<TechnicalSignal> no_signals;
};

TEST_F(RecommendationAggregatorTest, NoInputsIsInsufficientData) {
    Recommendation recommendation = aggregate_recommendation(no_signals, std::nullopt, signal_config, recommendation_config);
    EXPECT_EQ(recommendation.outcome, RecommendationOutcome::INSUFFICIENT_DATA);
    EXPECT_EQ(recommendation.basis, RecommendationBasis::NONE);
    EXPECT_FALSE(recommendation.technical_contribution.has_value());
    EXPECT_FALSE(recommendation.fundamental_contribution.has_value());
    EXPECT_DOUBLE_EQ(recommendation.strength, 0.0);
}

TEST_F(RecommendationAggregatorTest, QuietSignalsHold) {
    std::vector<TechnicalSignal> signals;
    signals.emplace_back("rsi", SignalDirection::NEUTRAL, 0.0, "RSI neutral");
    signals.emplace_back("macd", SignalDirection::NEUTRAL, 0.0, "No crossover");

    Recommendation recommendation = aggregate_recommendation(signals, std::nullopt, signal_config, recommendation_config);
    EXPECT_EQ(recommendation.outcome, RecommendationOutcome::HOLD);
    EXPECT_EQ(recommendation.basis, RecommendationBasis::TECHNICAL_ONLY);
    ASSERT_TRUE(recommendation.technical_contribution.has_value());
    EXPECT_DOUBLE_EQ(*recommendation.technical_contribution, 0.0);
}

TEST_F(RecommendationAggregatorTest, TechnicalContributionIsWeightedOverFiringSignals) {
    std::vector<TechnicalSignal> signals;
    signals.emplace_back("rsi", SignalDirection::BUY, 1.0, "Oversold");
    signals.emplace_back("macd", SignalDirection::SELL, 0.5, "Bearish crossover");
    signals.emplace_back("volume", SignalDirection::NEUTRAL, 0.0, "Normal volume");

    std::optional<double> technical_score = compute_technical_contribution(signals, signal_config);
    ASSERT_TRUE(technical_score.has_value());
    EXPECT_NEAR(*technical_score, (0.2 * 1.0 - 0.25 * 0.5) / (0.2 + 0.25), 1e-12);
}

TEST_F(RecommendationAggregatorTest, CombinedBranchesBlend) {
    std::vector<TechnicalSignal> signals;
    signals.emplace_back("rsi", SignalDirection::BUY, 1.0, "Oversold");

    Recommendation recommendation = aggregate_recommendation(signals, 90.0, signal_config, recommendation_config);
    EXPECT_EQ(recommendation.basis, RecommendationBasis::COMBINED);
    EXPECT_NEAR(*recommendation.fundamental_contribution, 0.8, 1e-12);
    EXPECT_NEAR(recommendation.final_score, 0.9, 1e-12);
    EXPECT_EQ(recommendation.outcome, RecommendationOutcome::BUY);
    EXPECT_NEAR(recommendation.strength, 0.9, 1e-12);
    EXPECT_NE(recommendation.rationale.find("buy"), std::string::npos);
}

TEST_F(RecommendationAggregatorTest, SingleBranchStrengthIsCapped) {
    std::vector<TechnicalSignal> signals;
    signals.emplace_back("moving_average", SignalDirection::BUY, 1.0, "Golden cross");

    Recommendation technical_only = aggregate_recommendation(signals, std::nullopt, signal_config, recommendation_config);
    EXPECT_EQ(technical_only.outcome, RecommendationOutcome::BUY);
    EXPECT_DOUBLE_EQ(technical_only.final_score, 1.0);
    EXPECT_DOUBLE_EQ(technical_only.strength, 0.6);

    Recommendation fundamental_only = aggregate_recommendation(no_signals, 10.0, signal_config, recommendation_config);
    EXPECT_EQ(fundamental_only.basis, RecommendationBasis::FUNDAMENTAL_ONLY);
    EXPECT_EQ(fundamental_only.outcome, RecommendationOutcome::SELL);
    EXPECT_NEAR(fundamental_only.final_score, -0.8, 1e-12);
    EXPECT_DOUBLE_EQ(fundamental_only.strength, 0.6);
}

TEST_F(RecommendationAggregatorTest, ThresholdIsInclusive) {
    Recommendation recommendation = aggregate_recommendation(no_signals, 65.0, signal_config, recommendation_config);
    EXPECT_EQ(recommendation.outcome, RecommendationOutcome::BUY);

    Recommendation just_below = aggregate_recommendation(no_signals, 64.0, signal_config, recommendation_config);
    EXPECT_EQ(just_below.outcome, RecommendationOutcome::HOLD);
}

TEST_F(RecommendationAggregatorTest, FundamentalContributionIsClamped) {
    EXPECT_DOUBLE_EQ(*compute_fundamental_contribution(100.0), 1.0);
    EXPECT_DOUBLE_EQ(*compute_fundamental_contribution(0.0), -1.0);
    EXPECT_DOUBLE_EQ(*compute_fundamental_contribution(150.0), 1.0);
    EXPECT_FALSE(compute_fundamental_contribution(std::nullopt).has_value());
}
