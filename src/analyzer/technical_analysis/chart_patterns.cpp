#include "chart_patterns.hpp"
#include <algorithm>
#include <cmath>
#include <optional>

namespace StockAdvisor {
namespace Core {

namespace {

Pattern make_chart_pattern(const std::string& pattern_name, size_t start_index, size_t breakout_index,
                           PatternDirection direction, double confidence, PatternCategory category) {
    Pattern chart_pattern;
    chart_pattern.name = pattern_name;
    chart_pattern.start_index = start_index;
    chart_pattern.end_index = breakout_index;
    chart_pattern.direction = direction;
    chart_pattern.confidence = std::clamp(confidence, 0.0, 1.0);
    chart_pattern.kind = PatternKind::CHART;
    chart_pattern.category = category;
    return chart_pattern;
}

/**
 * First close after after_index that crosses the trigger line in the breakout direction.
 * A close beyond invalidation_price in the opposite direction cancels the formation.
 */
std::optional<size_t> find_breakout(const Series& series, size_t after_index, const TrendLine& trigger_line,
                                    bool breaks_downward, double invalidation_price) {
    for (size_t bar_index = after_index + 1; bar_index < series.size(); ++bar_index) {
        double close_price = series.at(bar_index).close_price;
        if (breaks_downward) {
            if (close_price > invalidation_price) return std::nullopt;
            if (close_price < trigger_line.value_at(bar_index)) return bar_index;
        } else {
            if (close_price < invalidation_price) return std::nullopt;
            if (close_price > trigger_line.value_at(bar_index)) return bar_index;
        }
    }
    return std::nullopt;
}

TrendLine line_through(const PriceExtremum& first_point, const PriceExtremum& second_point) {
    TrendLine trend_line;
    double index_span = static_cast<double>(second_point.index) - static_cast<double>(first_point.index);
    trend_line.slope = index_span != 0.0 ? (second_point.price - first_point.price) / index_span : 0.0;
    trend_line.intercept = first_point.price - trend_line.slope * static_cast<double>(first_point.index);
    return trend_line;
}

TrendLine horizontal_line(double price) {
    TrendLine trend_line;
    trend_line.intercept = price;
    return trend_line;
}

} // anonymous namespace

TrendLine fit_trend_line(const std::vector<PriceExtremum>& points) {
    TrendLine trend_line;
    if (points.empty()) {
        return trend_line;
    }
    double point_count = static_cast<double>(points.size());
    double sum_index = 0.0, sum_price = 0.0;
    for (const PriceExtremum& point : points) {
        sum_index += static_cast<double>(point.index);
        sum_price += point.price;
    }
    double mean_index = sum_index / point_count;
    double mean_price = sum_price / point_count;

    double covariance = 0.0, index_variance = 0.0;
    for (const PriceExtremum& point : points) {
        double index_offset = static_cast<double>(point.index) - mean_index;
        covariance += index_offset * (point.price - mean_price);
        index_variance += index_offset * index_offset;
    }
    trend_line.slope = index_variance > 0.0 ? covariance / index_variance : 0.0;
    trend_line.intercept = mean_price - trend_line.slope * mean_index;
    return trend_line;
}

// ========================================================================
// HEAD AND SHOULDERS
// ========================================================================

std::vector<Pattern> detect_head_and_shoulders(const Series& series, const std::vector<PriceExtremum>& swings, const PatternConfig& config) {
    std::vector<Pattern> formations;
    for (size_t swing_index = 0; swing_index + 4 < swings.size(); ++swing_index) {
        const PriceExtremum& left_shoulder = swings[swing_index];
        const PriceExtremum& left_neck = swings[swing_index + 1];
        const PriceExtremum& head = swings[swing_index + 2];
        const PriceExtremum& right_neck = swings[swing_index + 3];
        const PriceExtremum& right_shoulder = swings[swing_index + 4];
        bool is_top = left_shoulder.kind == ExtremumKind::PEAK;

        double outer_shoulder = is_top ? std::max(left_shoulder.price, right_shoulder.price)
                                       : std::min(left_shoulder.price, right_shoulder.price);
        bool head_stands_out = is_top ? head.price >= outer_shoulder * (1.0 + config.head_min_excess)
                                      : head.price <= outer_shoulder * (1.0 - config.head_min_excess);
        if (!head_stands_out) continue;

        double shoulder_difference = std::abs(left_shoulder.price - right_shoulder.price) /
                                     std::max(left_shoulder.price, right_shoulder.price);
        if (shoulder_difference > config.shoulder_tolerance) continue;

        TrendLine neckline = line_through(left_neck, right_neck);
        double neckline_level = (left_neck.price + right_neck.price) / 2.0;
        if (std::abs(neckline.slope) / neckline_level > config.neckline_max_slope) continue;

        std::optional<size_t> breakout_index = find_breakout(series, right_shoulder.index, neckline, is_top, head.price);
        if (!breakout_index) continue;

        double symmetry = config.shoulder_tolerance > 0.0 ? 1.0 - shoulder_difference / config.shoulder_tolerance : 1.0;
        double head_excess = std::abs(head.price - outer_shoulder) / head.price;
        double head_quality = std::min(1.0, head_excess / std::max(5.0 * config.head_min_excess, 1e-9));
        double confidence = 0.6 + 0.2 * symmetry + 0.2 * head_quality;

        if (is_top) {
            formations.push_back(make_chart_pattern("Head and Shoulders", left_shoulder.index, *breakout_index,
                                                    PatternDirection::BEARISH, confidence, PatternCategory::REVERSAL));
        } else {
            formations.push_back(make_chart_pattern("Inverse Head and Shoulders", left_shoulder.index, *breakout_index,
                                                    PatternDirection::BULLISH, confidence, PatternCategory::REVERSAL));
        }
    }
    return formations;
}

// ========================================================================
// DOUBLE TOP / DOUBLE BOTTOM
// ========================================================================

std::vector<Pattern> detect_double_extremes(const Series& series, const std::vector<PriceExtremum>& swings, const PatternConfig& config) {
    std::vector<Pattern> formations;
    for (size_t swing_index = 0; swing_index + 2 < swings.size(); ++swing_index) {
        const PriceExtremum& first_extreme = swings[swing_index];
        const PriceExtremum& middle_swing = swings[swing_index + 1];
        const PriceExtremum& second_extreme = swings[swing_index + 2];
        bool is_top = first_extreme.kind == ExtremumKind::PEAK;

        double extreme_difference = std::abs(first_extreme.price - second_extreme.price) /
                                    std::max(first_extreme.price, second_extreme.price);
        if (extreme_difference > config.double_extreme_tolerance) continue;

        double inner_extreme = is_top ? std::min(first_extreme.price, second_extreme.price)
                                      : std::max(first_extreme.price, second_extreme.price);
        double retracement = std::abs(inner_extreme - middle_swing.price) / inner_extreme;
        if (retracement < config.min_prominence_pct) continue;

        double outer_extreme = is_top ? std::max(first_extreme.price, second_extreme.price)
                                      : std::min(first_extreme.price, second_extreme.price);
        double invalidation_price = is_top ? outer_extreme * (1.0 + config.double_extreme_tolerance)
                                           : outer_extreme * (1.0 - config.double_extreme_tolerance);
        std::optional<size_t> breakout_index = find_breakout(series, second_extreme.index, horizontal_line(middle_swing.price),
                                                             is_top, invalidation_price);
        if (!breakout_index) continue;

        double similarity = config.double_extreme_tolerance > 0.0 ? 1.0 - extreme_difference / config.double_extreme_tolerance : 1.0;
        double confidence = 0.6 + 0.4 * similarity;

        if (is_top) {
            formations.push_back(make_chart_pattern("Double Top", first_extreme.index, *breakout_index,
                                                    PatternDirection::BEARISH, confidence, PatternCategory::REVERSAL));
        } else {
            formations.push_back(make_chart_pattern("Double Bottom", first_extreme.index, *breakout_index,
                                                    PatternDirection::BULLISH, confidence, PatternCategory::REVERSAL));
        }
    }
    return formations;
}

// ========================================================================
// TRIANGLES AND RECTANGLES
// ========================================================================

std::vector<Pattern> detect_triangles(const Series& series, const std::vector<PriceExtremum>& swings, const PatternConfig& config) {
    std::vector<Pattern> formations;
    size_t window_start_index = 0;
    if (config.triangle_lookback > 0 && series.size() > static_cast<size_t>(config.triangle_lookback)) {
        window_start_index = series.size() - config.triangle_lookback;
    }

    std::vector<PriceExtremum> peaks;
    std::vector<PriceExtremum> troughs;
    for (const PriceExtremum& swing : swings) {
        if (swing.index < window_start_index) continue;
        (swing.kind == ExtremumKind::PEAK ? peaks : troughs).push_back(swing);
    }
    if (peaks.size() < 2 || troughs.size() < 2) {
        return formations;
    }

    TrendLine upper_line = fit_trend_line(peaks);
    TrendLine lower_line = fit_trend_line(troughs);

    double price_sum = 0.0;
    for (const PriceExtremum& peak : peaks) price_sum += peak.price;
    for (const PriceExtremum& trough : troughs) price_sum += trough.price;
    double mean_price = price_sum / static_cast<double>(peaks.size() + troughs.size());

    double upper_relative_slope = upper_line.slope / mean_price;
    double lower_relative_slope = lower_line.slope / mean_price;
    bool upper_flat = std::abs(upper_relative_slope) <= config.triangle_flat_slope;
    bool lower_flat = std::abs(lower_relative_slope) <= config.triangle_flat_slope;
    bool upper_falling = upper_relative_slope < -config.triangle_flat_slope;
    bool lower_rising = lower_relative_slope > config.triangle_flat_slope;

    size_t first_touch_index = std::min(peaks.front().index, troughs.front().index);
    size_t last_touch_index = std::max(peaks.back().index, troughs.back().index);
    double first_width = upper_line.value_at(first_touch_index) - lower_line.value_at(first_touch_index);
    double last_width = upper_line.value_at(last_touch_index) - lower_line.value_at(last_touch_index);
    if (first_width <= 0.0 || last_width <= 0.0) {
        return formations;
    }
    double convergence = (first_width - last_width) / first_width;

    std::string formation_name;
    PatternDirection expected_direction = PatternDirection::NEUTRAL;
    PatternCategory formation_category = PatternCategory::CONTINUATION;
    if (upper_flat && lower_flat) {
        formation_name = "Rectangle";
    } else if (convergence < config.triangle_min_convergence) {
        return formations;
    } else if (upper_flat && lower_rising) {
        formation_name = "Ascending Triangle";
        expected_direction = PatternDirection::BULLISH;
    } else if (upper_falling && lower_flat) {
        formation_name = "Descending Triangle";
        expected_direction = PatternDirection::BEARISH;
    } else if (upper_falling && lower_rising) {
        formation_name = "Symmetrical Triangle";
    } else {
        return formations;
    }

    for (size_t bar_index = last_touch_index + 1; bar_index < series.size(); ++bar_index) {
        double close_price = series.at(bar_index).close_price;
        PatternDirection breakout_direction = PatternDirection::NEUTRAL;
        if (close_price > upper_line.value_at(bar_index)) {
            breakout_direction = PatternDirection::BULLISH;
        } else if (close_price < lower_line.value_at(bar_index)) {
            breakout_direction = PatternDirection::BEARISH;
        } else {
            continue;
        }

        int extra_touches = static_cast<int>(peaks.size() + troughs.size()) - 4;
        double confidence = 0.55 + 0.05 * std::min(4, extra_touches);
        if (expected_direction == PatternDirection::NEUTRAL) {
            confidence += 0.1;
        } else if (expected_direction == breakout_direction) {
            confidence += 0.25;
        }
        formations.push_back(make_chart_pattern(formation_name, first_touch_index, bar_index, breakout_direction,
                                                confidence, formation_category));
        break;
    }
    return formations;
}

std::vector<Pattern> detect_chart_patterns(const Series& series, const PatternConfig& config) {
    std::vector<PriceExtremum> swings = alternate_extrema(
        find_local_extrema(series, 0, config.extrema_window, config.min_prominence_pct));

    std::vector<Pattern> chart_patterns = detect_head_and_shoulders(series, swings, config);
    std::vector<Pattern> double_extremes = detect_double_extremes(series, swings, config);
    std::vector<Pattern> triangles = detect_triangles(series, swings, config);
    chart_patterns.insert(chart_patterns.end(), double_extremes.begin(), double_extremes.end());
    chart_patterns.insert(chart_patterns.end(), triangles.begin(), triangles.end());
    return chart_patterns;
}

} // namespace Core
} // namespace StockAdvisor
