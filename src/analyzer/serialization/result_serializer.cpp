#include "result_serializer.hpp"
#include "utils/time_utils.hpp"
#include <algorithm>

namespace StockAdvisor {
namespace Core {

namespace {

json optional_to_json(const std::optional<double>& value) {
    if (!value) {
        return nullptr;
    }
    return *value;
}

json strings_to_json(const std::vector<std::string>& values) {
    json string_array = json::array();
    for (const std::string& value : values) {
        string_array.push_back(value);
    }
    return string_array;
}

json serialize_price_summary(const PriceSummary& price_summary) {
    json price_json;
    price_json["last_close"] = price_summary.last_close;
    price_json["change"] = optional_to_json(price_summary.change);
    price_json["change_percent"] = optional_to_json(price_summary.change_percent);
    price_json["last_volume"] = price_summary.last_volume;
    price_json["bar_count"] = price_summary.bar_count;
    price_json["first_timestamp"] = TimeUtils::format_epoch_seconds_as_iso(price_summary.first_timestamp);
    price_json["last_timestamp"] = TimeUtils::format_epoch_seconds_as_iso(price_summary.last_timestamp);
    return price_json;
}

json serialize_patterns(const std::vector<Pattern>& patterns) {
    json pattern_array = json::array();
    for (const Pattern& pattern : patterns) {
        json pattern_json;
        pattern_json["name"] = pattern.name;
        pattern_json["start_index"] = pattern.start_index;
        pattern_json["end_index"] = pattern.end_index;
        pattern_json["direction"] = to_string(pattern.direction);
        pattern_json["confidence"] = pattern.confidence;
        pattern_json["kind"] = to_string(pattern.kind);
        pattern_json["category"] = to_string(pattern.category);
        pattern_array.push_back(pattern_json);
    }
    return pattern_array;
}

json serialize_levels(const std::vector<PriceLevel>& levels) {
    json level_array = json::array();
    for (const PriceLevel& price_level : levels) {
        json level_json;
        level_json["price"] = price_level.price;
        level_json["kind"] = to_string(price_level.kind);
        level_json["strength"] = price_level.strength;
        level_json["first_touch_index"] = price_level.first_touch_index;
        level_json["last_touch_index"] = price_level.last_touch_index;
        level_array.push_back(level_json);
    }
    return level_array;
}

json serialize_signals(const std::vector<TechnicalSignal>& signals) {
    json signal_array = json::array();
    for (const TechnicalSignal& technical_signal : signals) {
        json signal_json;
        signal_json["name"] = technical_signal.name;
        signal_json["direction"] = to_string(technical_signal.direction);
        signal_json["strength"] = technical_signal.strength;
        signal_json["rationale"] = technical_signal.rationale;
        signal_array.push_back(signal_json);
    }
    return signal_array;
}

json serialize_category(const CategoryScore& category_score) {
    json category_json;
    category_json["score"] = optional_to_json(category_score.score);
    category_json["grade"] = category_score.score ? json(category_score.grade) : json(nullptr);
    category_json["available"] = category_score.score.has_value();
    category_json["missing_metrics"] = strings_to_json(category_score.missing_metrics);

    json metric_object = json::object();
    for (const MetricScore& metric_score : category_score.metrics) {
        metric_object[metric_score.name] = {{"value", metric_score.value}, {"sub_score", metric_score.sub_score}};
    }
    category_json["metrics"] = metric_object;
    return category_json;
}

json serialize_valuation(const ValuationEstimate& valuation_estimate) {
    json valuation_json;
    valuation_json["applicable"] = valuation_estimate.applicable;
    valuation_json["fair_value"] = optional_to_json(valuation_estimate.fair_value);
    valuation_json["upside"] = optional_to_json(valuation_estimate.upside);
    valuation_json["inapplicable_reason"] = valuation_estimate.applicable ? json(nullptr) : json(valuation_estimate.inapplicable_reason);

    json assumption_object = json::object();
    for (const auto& assumption_entry : valuation_estimate.assumptions) {
        assumption_object[assumption_entry.first] = assumption_entry.second;
    }
    valuation_json["assumptions"] = assumption_object;
    return valuation_json;
}

json serialize_peer_comparison(const PeerComparison& peer_comparison) {
    json peer_json;
    peer_json["peers"] = strings_to_json(peer_comparison.peer_symbols);
    json metric_object = json::object();
    for (const PeerMetricComparison& metric_comparison : peer_comparison.metrics) {
        json metric_json;
        metric_json["stock_value"] = metric_comparison.stock_value;
        metric_json["peer_average"] = metric_comparison.peer_average;
        metric_json["difference"] = metric_comparison.difference;
        metric_json["percent_difference"] = optional_to_json(metric_comparison.percent_difference);
        metric_json["rank"] = metric_comparison.rank;
        metric_json["compared_count"] = metric_comparison.compared_count;
        metric_json["percentile"] = metric_comparison.percentile;
        metric_json["lower_is_better"] = metric_comparison.lower_is_better;
        metric_object[metric_comparison.metric] = metric_json;
    }
    peer_json["metrics"] = metric_object;
    return peer_json;
}

} // anonymous namespace

json serialize_indicators(const IndicatorSet& indicators, const std::vector<std::int64_t>& bar_timestamps, int chart_history_bars) {
    size_t history_length = std::min(bar_timestamps.size(), static_cast<size_t>(std::max(chart_history_bars, 0)));
    size_t history_start = bar_timestamps.size() - history_length;

    json latest_object = json::object();
    json history_object = json::object();
    for (const auto& indicator_entry : indicators.series) {
        latest_object[indicator_entry.first] = optional_to_json(indicators.latest(indicator_entry.first));

        json value_array = json::array();
        for (size_t bar_index = history_start; bar_index < indicator_entry.second.size(); ++bar_index) {
            value_array.push_back(optional_to_json(indicator_entry.second[bar_index]));
        }
        history_object[indicator_entry.first] = value_array;
    }

    json timestamp_array = json::array();
    for (size_t bar_index = history_start; bar_index < bar_timestamps.size(); ++bar_index) {
        timestamp_array.push_back(TimeUtils::format_epoch_seconds_as_iso(bar_timestamps[bar_index]));
    }

    json omitted_object = json::object();
    for (const OmittedIndicator& omitted_indicator : indicators.omitted) {
        omitted_object[omitted_indicator.name] = {{"required_bars", omitted_indicator.required_bars},
                                                  {"available_bars", omitted_indicator.available_bars}};
    }

    json indicator_json;
    indicator_json["latest"] = latest_object;
    indicator_json["history"] = {{"timestamps", timestamp_array}, {"values", history_object}};
    indicator_json["omitted"] = omitted_object;
    return indicator_json;
}

json serialize_fundamentals(const FundamentalAnalysis& fundamental) {
    json fundamental_json;
    fundamental_json["available"] = fundamental.available;
    if (!fundamental.available) {
        fundamental_json["unavailable_reason"] = fundamental.unavailable_reason;
        return fundamental_json;
    }

    fundamental_json["company_name"] = fundamental.record.company_name;
    fundamental_json["sector"] = fundamental.record.sector;
    fundamental_json["industry"] = fundamental.record.industry;

    json category_object = json::object();
    for (const CategoryScore& category_score : fundamental.scores.categories) {
        category_object[to_string(category_score.category)] = serialize_category(category_score);
    }
    fundamental_json["categories"] = category_object;
    fundamental_json["composite"] = optional_to_json(fundamental.scores.composite);

    json report_json;
    report_json["overall_grade"] = fundamental.report.overall_grade;
    report_json["rating"] = fundamental.report.rating;
    report_json["strengths"] = strings_to_json(fundamental.report.strengths);
    report_json["weaknesses"] = strings_to_json(fundamental.report.weaknesses);
    report_json["risks"] = strings_to_json(fundamental.report.risks);
    report_json["opportunities"] = strings_to_json(fundamental.report.opportunities);
    report_json["insights"] = strings_to_json(fundamental.report.insights);
    fundamental_json["report"] = report_json;

    json valuation_object = json::object();
    for (const ValuationEstimate& valuation_estimate : fundamental.valuations) {
        valuation_object[to_string(valuation_estimate.model)] = serialize_valuation(valuation_estimate);
    }
    fundamental_json["valuations"] = valuation_object;

    fundamental_json["peer_comparison"] = fundamental.peer_comparison ? serialize_peer_comparison(*fundamental.peer_comparison) : json(nullptr);
    return fundamental_json;
}

json serialize_recommendation(const Recommendation& recommendation) {
    json recommendation_json;
    recommendation_json["outcome"] = to_string(recommendation.outcome);
    recommendation_json["strength"] = recommendation.strength;
    recommendation_json["final_score"] = recommendation.final_score;
    recommendation_json["rationale"] = recommendation.rationale;
    recommendation_json["technical_contribution"] = optional_to_json(recommendation.technical_contribution);
    recommendation_json["fundamental_contribution"] = optional_to_json(recommendation.fundamental_contribution);
    recommendation_json["basis"] = to_string(recommendation.basis);
    return recommendation_json;
}

json serialize_analysis(const AnalysisResult& result, int chart_history_bars) {
    json technical_json;
    technical_json["indicators"] = serialize_indicators(result.technical.indicators, result.bar_timestamps, chart_history_bars);
    technical_json["patterns"] = serialize_patterns(result.technical.patterns);
    technical_json["levels"] = serialize_levels(result.technical.levels);
    technical_json["signals"] = serialize_signals(result.technical.signals);

    json document;
    document["symbol"] = result.symbol;
    document["period"] = result.period;
    document["interval"] = result.interval;
    document["price"] = serialize_price_summary(result.price_summary);
    document["technical"] = technical_json;
    document["fundamental"] = serialize_fundamentals(result.fundamental);
    document["recommendation"] = serialize_recommendation(result.recommendation);
    return document;
}

} // namespace Core
} // namespace StockAdvisor
