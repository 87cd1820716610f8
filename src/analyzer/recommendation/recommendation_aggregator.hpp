#ifndef RECOMMENDATION_AGGREGATOR_HPP
#define RECOMMENDATION_AGGREGATOR_HPP

#include <optional>
#include <vector>
#include "configs/recommendation_config.hpp"
#include "configs/signal_config.hpp"
#include "analyzer/data_structures/data_structures.hpp"

using StockAdvisor::Config::RecommendationConfig;
using StockAdvisor::Config::SignalConfig;

namespace StockAdvisor {
namespace Core {

/**
 * Weighted average of the signed strengths of firing signals, in [-1, 1].
 * Undefined without signals; 0 when signals exist but none fires.
 */
std::optional<double> compute_technical_contribution(const std::vector<TechnicalSignal>& signals, const SignalConfig& signal_config);

// (composite - 50) / 50, undefined without a composite.
std::optional<double> compute_fundamental_contribution(const std::optional<double>& fundamental_composite);

/**
 * Blends both branches into buy / sell / hold. With one branch the final score is that
 * branch's score and strength is capped; with neither the outcome is insufficient_data.
 */
Recommendation aggregate_recommendation(const std::vector<TechnicalSignal>& signals,
                                        const std::optional<double>& fundamental_composite,
                                        const SignalConfig& signal_config,
                                        const RecommendationConfig& config);

} // namespace Core
} // namespace StockAdvisor

#endif // RECOMMENDATION_AGGREGATOR_HPP
