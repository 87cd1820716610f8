#include "signal_synthesizer.hpp"
#include "indicators.hpp"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace StockAdvisor {
namespace Core {

namespace {

const char* const RSI_FAMILY = "rsi";
const char* const MACD_FAMILY = "macd";
const char* const BOLLINGER_FAMILY = "bollinger";
const char* const MOVING_AVERAGE_FAMILY = "moving_average";
const char* const VOLUME_FAMILY = "volume";
const char* const PATTERN_FAMILY = "pattern";
const char* const LEVEL_FAMILY = "level";

double clamp_strength(double strength) {
    if (!std::isfinite(strength)) {
        return 0.0;
    }
    return std::clamp(strength, 0.0, 1.0);
}

TechnicalSignal make_signal(const char* family_name, SignalDirection direction, double strength, const std::string& rationale) {
    if (direction == SignalDirection::NEUTRAL) {
        return TechnicalSignal(family_name, SignalDirection::NEUTRAL, 0.0, rationale);
    }
    return TechnicalSignal(family_name, direction, clamp_strength(strength), rationale);
}

// ========================================================================
// RULE FAMILIES
// ========================================================================

std::optional<TechnicalSignal> evaluate_rsi_rule(const SignalContext& context) {
    IndicatorValue rsi_value = context.indicators.latest("RSI");
    if (!rsi_value) {
        return std::nullopt;
    }

    std::ostringstream rationale_stream;
    rationale_stream << std::fixed << std::setprecision(2) << "RSI " << *rsi_value;
    if (*rsi_value < context.config.rsi_oversold) {
        rationale_stream << " below " << context.config.rsi_oversold << " (oversold)";
        double strength = (context.config.rsi_oversold - *rsi_value) / context.config.rsi_oversold;
        return make_signal(RSI_FAMILY, SignalDirection::BUY, strength, rationale_stream.str());
    }
    if (*rsi_value > context.config.rsi_overbought) {
        rationale_stream << " above " << context.config.rsi_overbought << " (overbought)";
        double strength = (*rsi_value - context.config.rsi_overbought) / (100.0 - context.config.rsi_overbought);
        return make_signal(RSI_FAMILY, SignalDirection::SELL, strength, rationale_stream.str());
    }
    rationale_stream << " within " << context.config.rsi_oversold << "-" << context.config.rsi_overbought;
    return make_signal(RSI_FAMILY, SignalDirection::NEUTRAL, 0.0, rationale_stream.str());
}

std::optional<TechnicalSignal> evaluate_macd_rule(const SignalContext& context) {
    size_t bar_count = context.series.size();
    if (bar_count < 2) {
        return std::nullopt;
    }
    IndicatorValue current_line = context.indicators.value_at("MACD", bar_count - 1);
    IndicatorValue current_signal = context.indicators.value_at("MACD_SIGNAL", bar_count - 1);
    IndicatorValue previous_line = context.indicators.value_at("MACD", bar_count - 2);
    IndicatorValue previous_signal = context.indicators.value_at("MACD_SIGNAL", bar_count - 2);
    if (!current_line || !current_signal || !previous_line || !previous_signal) {
        return std::nullopt;
    }

    double previous_spread = *previous_line - *previous_signal;
    double current_spread = *current_line - *current_signal;
    IndicatorValue histogram_value = context.indicators.latest("MACD_HISTOGRAM");
    double histogram = histogram_value ? *histogram_value : current_spread;
    double strength = std::abs(histogram) / (context.series.back().close_price * context.config.macd_strength_scale);

    std::ostringstream rationale_stream;
    rationale_stream << std::fixed << std::setprecision(4);
    if (previous_spread <= 0.0 && current_spread > 0.0) {
        rationale_stream << "MACD crossed above signal line (histogram " << histogram << ")";
        return make_signal(MACD_FAMILY, SignalDirection::BUY, strength, rationale_stream.str());
    }
    if (previous_spread >= 0.0 && current_spread < 0.0) {
        rationale_stream << "MACD crossed below signal line (histogram " << histogram << ")";
        return make_signal(MACD_FAMILY, SignalDirection::SELL, strength, rationale_stream.str());
    }
    rationale_stream << "No MACD crossover (histogram " << histogram << ")";
    return make_signal(MACD_FAMILY, SignalDirection::NEUTRAL, 0.0, rationale_stream.str());
}

std::optional<TechnicalSignal> evaluate_bollinger_rule(const SignalContext& context) {
    IndicatorValue upper_band = context.indicators.latest("BB_UPPER");
    IndicatorValue lower_band = context.indicators.latest("BB_LOWER");
    if (!upper_band || !lower_band) {
        return std::nullopt;
    }

    double close_price = context.series.back().close_price;
    double band_width = *upper_band - *lower_band;
    if (band_width <= 0.0) {
        return make_signal(BOLLINGER_FAMILY, SignalDirection::NEUTRAL, 0.0, "Bollinger bands have zero width");
    }

    double half_width = band_width / 2.0;
    std::ostringstream rationale_stream;
    rationale_stream << std::fixed << std::setprecision(2);
    if (close_price <= *lower_band) {
        rationale_stream << "Close " << close_price << " at or below lower band " << *lower_band;
        return make_signal(BOLLINGER_FAMILY, SignalDirection::BUY, 0.5 + (*lower_band - close_price) / half_width, rationale_stream.str());
    }
    if (close_price >= *upper_band) {
        rationale_stream << "Close " << close_price << " at or above upper band " << *upper_band;
        return make_signal(BOLLINGER_FAMILY, SignalDirection::SELL, 0.5 + (close_price - *upper_band) / half_width, rationale_stream.str());
    }
    rationale_stream << "Close " << close_price << " inside bands " << *lower_band << "-" << *upper_band;
    return make_signal(BOLLINGER_FAMILY, SignalDirection::NEUTRAL, 0.0, rationale_stream.str());
}

std::optional<TechnicalSignal> evaluate_moving_average_rule(const SignalContext& context) {
    size_t bar_count = context.series.size();
    if (bar_count < 2) {
        return std::nullopt;
    }
    // Omitted averages skip the rule
    std::string fast_name = get_sma_indicator_name(context.config.ma_fast_period);
    std::string slow_name = get_sma_indicator_name(context.config.ma_slow_period);
    IndicatorValue current_fast = context.indicators.value_at(fast_name, bar_count - 1);
    IndicatorValue current_slow = context.indicators.value_at(slow_name, bar_count - 1);
    IndicatorValue previous_fast = context.indicators.value_at(fast_name, bar_count - 2);
    IndicatorValue previous_slow = context.indicators.value_at(slow_name, bar_count - 2);
    if (!current_fast || !current_slow || !previous_fast || !previous_slow) {
        return std::nullopt;
    }

    std::string trend_context;
    std::string trend_name = get_sma_indicator_name(context.config.ma_trend_period);
    IndicatorValue trend_average = context.indicators.value_at(trend_name, bar_count - 1);
    if (trend_average) {
        trend_context = context.series.back().close_price >= *trend_average
            ? ", price above " + trend_name
            : ", price below " + trend_name;
    }

    double separation = std::abs(*current_fast - *current_slow) / *current_slow;
    double strength = context.config.ma_cross_base_strength + separation;

    if (*previous_fast <= *previous_slow && *current_fast > *current_slow) {
        return make_signal(MOVING_AVERAGE_FAMILY, SignalDirection::BUY, strength,
                           "Golden cross: " + fast_name + " crossed above " + slow_name + trend_context);
    }
    if (*previous_fast >= *previous_slow && *current_fast < *current_slow) {
        return make_signal(MOVING_AVERAGE_FAMILY, SignalDirection::SELL, strength,
                           "Death cross: " + fast_name + " crossed below " + slow_name + trend_context);
    }
    return make_signal(MOVING_AVERAGE_FAMILY, SignalDirection::NEUTRAL, 0.0,
                       "No crossover between " + fast_name + " and " + slow_name + trend_context);
}

std::optional<TechnicalSignal> evaluate_volume_rule(const SignalContext& context) {
    size_t bar_count = context.series.size();
    if (bar_count < 2) {
        return std::nullopt;
    }
    IndicatorValue prior_average = context.indicators.value_at(
        get_volume_sma_indicator_name(context.config.volume_average_period), bar_count - 2);
    if (!prior_average) {
        return std::nullopt;
    }
    if (*prior_average <= 0.0) {
        return make_signal(VOLUME_FAMILY, SignalDirection::NEUTRAL, 0.0, "No prior volume to compare against");
    }

    const Bar& last_bar = context.series.back();
    const Bar& previous_bar = context.series.at(bar_count - 2);
    double volume_ratio = last_bar.volume / *prior_average;
    std::ostringstream rationale_stream;
    rationale_stream << std::fixed << std::setprecision(2) << "Volume " << volume_ratio << "x prior average";

    if (volume_ratio >= context.config.volume_spike_ratio) {
        double strength = volume_ratio / context.config.volume_strength_divisor;
        if (last_bar.close_price > previous_bar.close_price) {
            rationale_stream << " on an up close";
            return make_signal(VOLUME_FAMILY, SignalDirection::BUY, strength, rationale_stream.str());
        }
        if (last_bar.close_price < previous_bar.close_price) {
            rationale_stream << " on a down close";
            return make_signal(VOLUME_FAMILY, SignalDirection::SELL, strength, rationale_stream.str());
        }
        rationale_stream << " on an unchanged close";
    }
    return make_signal(VOLUME_FAMILY, SignalDirection::NEUTRAL, 0.0, rationale_stream.str());
}

std::optional<TechnicalSignal> evaluate_pattern_rule(const SignalContext& context) {
    if (context.patterns.empty()) {
        return std::nullopt;
    }
    size_t bar_count = context.series.size();
    size_t recency_bars = static_cast<size_t>(std::max(1, context.config.pattern_recency_bars));
    size_t recent_start_index = bar_count > recency_bars ? bar_count - recency_bars : 0;

    double net_confidence = 0.0;
    int recent_matches = 0;
    for (const Pattern& pattern : context.patterns) {
        if (pattern.end_index < recent_start_index) continue;
        ++recent_matches;
        if (pattern.direction == PatternDirection::BULLISH) net_confidence += pattern.confidence;
        if (pattern.direction == PatternDirection::BEARISH) net_confidence -= pattern.confidence;
    }

    std::ostringstream rationale_stream;
    rationale_stream << std::fixed << std::setprecision(2) << recent_matches << " pattern(s) in the last "
                     << recency_bars << " bars, net confidence " << net_confidence;
    if (recent_matches == 0 || net_confidence == 0.0) {
        return make_signal(PATTERN_FAMILY, SignalDirection::NEUTRAL, 0.0, rationale_stream.str());
    }
    double strength = std::abs(net_confidence) / static_cast<double>(recent_matches);
    SignalDirection direction = net_confidence > 0.0 ? SignalDirection::BUY : SignalDirection::SELL;
    return make_signal(PATTERN_FAMILY, direction, strength, rationale_stream.str());
}

std::optional<TechnicalSignal> evaluate_level_rule(const SignalContext& context) {
    if (context.levels.empty()) {
        return std::nullopt;
    }
    double close_price = context.series.back().close_price;
    double proximity_distance = context.config.level_proximity_pct * close_price;

    const PriceLevel* nearest_level = nullptr;
    double nearest_distance = 0.0;
    for (const PriceLevel& price_level : context.levels) {
        double distance = std::abs(close_price - price_level.price);
        if (distance > proximity_distance) continue;
        if (!nearest_level || distance < nearest_distance) {
            nearest_level = &price_level;
            nearest_distance = distance;
        }
    }

    if (!nearest_level) {
        return make_signal(LEVEL_FAMILY, SignalDirection::NEUTRAL, 0.0, "No support or resistance within proximity");
    }

    double closeness = proximity_distance > 0.0 ? 1.0 - nearest_distance / proximity_distance : 1.0;
    double touch_weight = std::min(1.0, static_cast<double>(nearest_level->strength) / context.config.level_full_strength_touches);
    std::ostringstream rationale_stream;
    rationale_stream << std::fixed << std::setprecision(2) << "Close " << close_price << " near " << to_string(nearest_level->kind)
                     << " " << nearest_level->price << " (" << nearest_level->strength << " touches)";
    SignalDirection direction = nearest_level->kind == LevelKind::SUPPORT ? SignalDirection::BUY : SignalDirection::SELL;
    return make_signal(LEVEL_FAMILY, direction, closeness * touch_weight, rationale_stream.str());
}

} // anonymous namespace

const std::vector<SignalRuleEntry>& get_signal_rule_table() {
    static const std::vector<SignalRuleEntry> signal_rule_table = {
        {RSI_FAMILY, evaluate_rsi_rule, &SignalConfig::rsi_weight},
        {MACD_FAMILY, evaluate_macd_rule, &SignalConfig::macd_weight},
        {BOLLINGER_FAMILY, evaluate_bollinger_rule, &SignalConfig::bollinger_weight},
        {MOVING_AVERAGE_FAMILY, evaluate_moving_average_rule, &SignalConfig::moving_average_weight},
        {VOLUME_FAMILY, evaluate_volume_rule, &SignalConfig::volume_weight},
        {PATTERN_FAMILY, evaluate_pattern_rule, &SignalConfig::pattern_weight},
        {LEVEL_FAMILY, evaluate_level_rule, &SignalConfig::level_weight},
    };
    return signal_rule_table;
}

double get_signal_family_weight(const std::string& family_name, const SignalConfig& config) {
    for (const SignalRuleEntry& rule_entry : get_signal_rule_table()) {
        if (family_name == rule_entry.family_name) {
            return config.*(rule_entry.weight);
        }
    }
    return 0.0;
}

std::vector<TechnicalSignal> synthesize_signals(const Series& series, const IndicatorSet& indicators,
                                                const std::vector<Pattern>& patterns,
                                                const std::vector<PriceLevel>& levels,
                                                const SignalConfig& config) {
    std::vector<TechnicalSignal> technical_signals;
    if (series.empty()) {
        return technical_signals;
    }

    SignalContext signal_context(series, indicators, patterns, levels, config);
    for (const SignalRuleEntry& rule_entry : get_signal_rule_table()) {
        std::optional<TechnicalSignal> technical_signal = rule_entry.evaluate(signal_context);
        if (technical_signal) {
            technical_signals.push_back(*technical_signal);
        }
    }
    return technical_signals;
}

} // namespace Core
} // namespace StockAdvisor
