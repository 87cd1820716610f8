#include "recommendation_aggregator.hpp"
#include "analyzer/technical_analysis/signal_synthesizer.hpp"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace StockAdvisor {
namespace Core {

std::optional<double> compute_technical_contribution(const std::vector<TechnicalSignal>& signals, const SignalConfig& signal_config) {
    if (signals.empty()) {
        return std::nullopt;
    }

    double weighted_sum = 0.0;
    double weight_total = 0.0;
    for (const TechnicalSignal& technical_signal : signals) {
        if (!technical_signal.is_firing()) continue;
        double family_weight = get_signal_family_weight(technical_signal.name, signal_config);
        double signed_strength = technical_signal.direction == SignalDirection::BUY ? technical_signal.strength : -technical_signal.strength;
        weighted_sum += family_weight * signed_strength;
        weight_total += family_weight;
    }

    if (weight_total <= 0.0) {
        return 0.0;
    }
    return std::clamp(weighted_sum / weight_total, -1.0, 1.0);
}

std::optional<double> compute_fundamental_contribution(const std::optional<double>& fundamental_composite) {
    if (!fundamental_composite || !std::isfinite(*fundamental_composite)) {
        return std::nullopt;
    }
    return std::clamp((*fundamental_composite - 50.0) / 50.0, -1.0, 1.0);
}

Recommendation aggregate_recommendation(const std::vector<TechnicalSignal>& signals,
                                        const std::optional<double>& fundamental_composite,
                                        const SignalConfig& signal_config,
                                        const RecommendationConfig& config) {
    Recommendation recommendation;
    recommendation.technical_contribution = compute_technical_contribution(signals, signal_config);
    recommendation.fundamental_contribution = compute_fundamental_contribution(fundamental_composite);

    const std::optional<double>& technical_score = recommendation.technical_contribution;
    const std::optional<double>& fundamental_score = recommendation.fundamental_contribution;

    if (!technical_score && !fundamental_score) {
        recommendation.outcome = RecommendationOutcome::INSUFFICIENT_DATA;
        recommendation.basis = RecommendationBasis::NONE;
        recommendation.rationale = "Neither technical signals nor fundamental scores are available";
        return recommendation;
    }

    std::ostringstream rationale_stream;
    rationale_stream << std::fixed << std::setprecision(3);
    if (technical_score && fundamental_score) {
        recommendation.basis = RecommendationBasis::COMBINED;
        recommendation.final_score = config.technical_weight * *technical_score + (1.0 - config.technical_weight) * *fundamental_score;
        rationale_stream << "Technical " << *technical_score << " x " << config.technical_weight
                         << " + fundamental " << *fundamental_score << " x " << (1.0 - config.technical_weight);
    } else if (technical_score) {
        recommendation.basis = RecommendationBasis::TECHNICAL_ONLY;
        recommendation.final_score = *technical_score;
        rationale_stream << "Technical " << *technical_score << " only (fundamentals unavailable)";
    } else {
        recommendation.basis = RecommendationBasis::FUNDAMENTAL_ONLY;
        recommendation.final_score = *fundamental_score;
        rationale_stream << "Fundamental " << *fundamental_score << " only (technical signals unavailable)";
    }

    if (recommendation.final_score >= config.decision_threshold) {
        recommendation.outcome = RecommendationOutcome::BUY;
    } else if (recommendation.final_score <= -config.decision_threshold) {
        recommendation.outcome = RecommendationOutcome::SELL;
    } else {
        recommendation.outcome = RecommendationOutcome::HOLD;
    }

    recommendation.strength = std::clamp(std::abs(recommendation.final_score), 0.0, 1.0);
    if (recommendation.basis != RecommendationBasis::COMBINED) {
        recommendation.strength = std::min(recommendation.strength, config.single_branch_strength_cap);
    }

    rationale_stream << " = " << recommendation.final_score << " -> " << to_string(recommendation.outcome)
                     << " (threshold " << config.decision_threshold << ")";
    recommendation.rationale = rationale_stream.str();
    return recommendation;
}

} // namespace Core
} // namespace StockAdvisor
