#include "data_structures.hpp"

namespace StockAdvisor {
namespace Core {

bool IndicatorSet::contains(const std::string& indicator_name) const {
    return series.find(indicator_name) != series.end();
}

const IndicatorSeries* IndicatorSet::find(const std::string& indicator_name) const {
    std::map<std::string, IndicatorSeries>::const_iterator indicator_iterator = series.find(indicator_name);
    if (indicator_iterator == series.end()) {
        return nullptr;
    }
    return &indicator_iterator->second;
}

IndicatorValue IndicatorSet::latest(const std::string& indicator_name) const {
    const IndicatorSeries* indicator_series_ptr = find(indicator_name);
    if (!indicator_series_ptr || indicator_series_ptr->empty()) {
        return std::nullopt;
    }
    return indicator_series_ptr->back();
}

IndicatorValue IndicatorSet::value_at(const std::string& indicator_name, size_t bar_index) const {
    const IndicatorSeries* indicator_series_ptr = find(indicator_name);
    if (!indicator_series_ptr || bar_index >= indicator_series_ptr->size()) {
        return std::nullopt;
    }
    return (*indicator_series_ptr)[bar_index];
}

const CategoryScore* FundamentalScores::find(FundamentalCategory category) const {
    for (const CategoryScore& category_score : categories) {
        if (category_score.category == category) {
            return &category_score;
        }
    }
    return nullptr;
}

std::string to_string(PatternDirection direction) {
    switch (direction) {
        case PatternDirection::BULLISH: return "bullish";
        case PatternDirection::BEARISH: return "bearish";
        case PatternDirection::NEUTRAL: return "neutral";
    }
    return "neutral";
}

std::string to_string(PatternKind kind) {
    switch (kind) {
        case PatternKind::CANDLESTICK: return "candlestick";
        case PatternKind::CHART: return "chart";
    }
    return "candlestick";
}

std::string to_string(PatternCategory category) {
    switch (category) {
        case PatternCategory::REVERSAL: return "reversal";
        case PatternCategory::CONTINUATION: return "continuation";
        case PatternCategory::INDECISION: return "indecision";
    }
    return "indecision";
}

std::string to_string(LevelKind kind) {
    return kind == LevelKind::RESISTANCE ? "resistance" : "support";
}

std::string to_string(SignalDirection direction) {
    switch (direction) {
        case SignalDirection::BUY: return "buy";
        case SignalDirection::SELL: return "sell";
        case SignalDirection::NEUTRAL: return "neutral";
    }
    return "neutral";
}

std::string to_string(FundamentalCategory category) {
    switch (category) {
        case FundamentalCategory::VALUATION: return "valuation";
        case FundamentalCategory::PROFITABILITY: return "profitability";
        case FundamentalCategory::GROWTH: return "growth";
        case FundamentalCategory::FINANCIAL_HEALTH: return "financial_health";
    }
    return "valuation";
}

std::string to_string(ValuationModel model) {
    return model == ValuationModel::DDM ? "ddm" : "dcf";
}

std::string to_string(RecommendationOutcome outcome) {
    switch (outcome) {
        case RecommendationOutcome::BUY: return "buy";
        case RecommendationOutcome::SELL: return "sell";
        case RecommendationOutcome::HOLD: return "hold";
        case RecommendationOutcome::INSUFFICIENT_DATA: return "insufficient_data";
    }
    return "insufficient_data";
}

std::string to_string(RecommendationBasis basis) {
    switch (basis) {
        case RecommendationBasis::COMBINED: return "combined";
        case RecommendationBasis::TECHNICAL_ONLY: return "technical_only";
        case RecommendationBasis::FUNDAMENTAL_ONLY: return "fundamental_only";
        case RecommendationBasis::NONE: return "none";
    }
    return "none";
}

} // namespace Core
} // namespace StockAdvisor
