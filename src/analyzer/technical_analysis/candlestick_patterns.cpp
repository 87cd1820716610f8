#include "candlestick_patterns.hpp"
#include <algorithm>
#include <cmath>
#include <map>

namespace StockAdvisor {
namespace Core {

namespace {

// ========================================================================
// CANDLE GEOMETRY
// ========================================================================

constexpr double SHAVEN_SHADOW_RATIO = 0.05;     // Shadow / range treated as no shadow
constexpr double SMALL_SHADOW_RATIO = 0.1;       // Shadow / range treated as a small shadow
constexpr double DOJI_LONG_SHADOW_RATIO = 0.6;   // Shadow / range for dragonfly and gravestone legs
constexpr double LONG_LEG_RATIO = 0.3;           // Shadow / range for each leg of a long-legged doji
constexpr double SMALL_BODY_RANGE_RATIO = 0.3;   // Body / range for spinning tops and high waves

double body_size(const Bar& bar) { return std::abs(bar.close_price - bar.open_price); }
double candle_range(const Bar& bar) { return bar.high_price - bar.low_price; }
double body_top(const Bar& bar) { return std::max(bar.open_price, bar.close_price); }
double body_bottom(const Bar& bar) { return std::min(bar.open_price, bar.close_price); }
double body_midpoint(const Bar& bar) { return (bar.open_price + bar.close_price) / 2.0; }
double upper_shadow(const Bar& bar) { return bar.high_price - body_top(bar); }
double lower_shadow(const Bar& bar) { return body_bottom(bar) - bar.low_price; }
bool is_white(const Bar& bar) { return bar.close_price > bar.open_price; }
bool is_black(const Bar& bar) { return bar.close_price < bar.open_price; }

bool is_doji(const CandleContext& context, const Bar& bar) {
    double range_value = candle_range(bar);
    return range_value > 0.0 && body_size(bar) <= context.config.doji_body_ratio * range_value;
}

bool is_long_body(const CandleContext& context, const Bar& bar) {
    if (body_size(bar) <= 0.0 || is_doji(context, bar)) {
        return false;
    }
    return context.average_body <= 0.0 || body_size(bar) >= context.config.long_body_ratio * context.average_body;
}

bool is_short_body(const CandleContext& context, const Bar& bar) {
    return context.average_body > 0.0 && body_size(bar) <= context.config.short_body_ratio * context.average_body;
}

bool has_shaven_top(const Bar& bar) { return upper_shadow(bar) <= SHAVEN_SHADOW_RATIO * candle_range(bar); }
bool has_shaven_bottom(const Bar& bar) { return lower_shadow(bar) <= SHAVEN_SHADOW_RATIO * candle_range(bar); }

bool is_marubozu(const CandleContext& context, const Bar& bar) {
    return is_long_body(context, bar) && has_shaven_top(bar) && has_shaven_bottom(bar);
}

bool is_near(const CandleContext& context, double first_price, double second_price) {
    return std::abs(first_price - second_price) <= context.config.equal_price_tolerance * std::max(std::abs(first_price), std::abs(second_price));
}

bool body_inside(const Bar& inner_bar, const Bar& outer_bar) {
    return body_top(inner_bar) <= body_top(outer_bar) && body_bottom(inner_bar) >= body_bottom(outer_bar);
}

double body_quality(const CandleContext& context, const Bar& bar) {
    if (context.average_body <= 0.0) {
        return 1.0;
    }
    return std::clamp(body_size(bar) / (2.0 * context.average_body), 0.0, 1.0);
}

std::optional<CandleMatch> make_match(PatternDirection direction, double quality) {
    CandleMatch candle_match;
    candle_match.direction = direction;
    candle_match.confidence = std::clamp(0.5 + 0.5 * std::clamp(quality, 0.0, 1.0), 0.0, 1.0);
    return candle_match;
}

bool in_downtrend(const CandleContext& context) { return context.prior_trend == TrendDirection::DOWN; }
bool in_uptrend(const CandleContext& context) { return context.prior_trend == TrendDirection::UP; }

// ========================================================================
// SINGLE-BAR SHAPES
// ========================================================================

bool is_hammer_shape(const CandleContext& context, const Bar& bar) {
    double body_value = body_size(bar);
    return body_value > 0.0 && body_value <= candle_range(bar) / 3.0 &&
           lower_shadow(bar) >= context.config.long_shadow_ratio * body_value &&
           upper_shadow(bar) <= SMALL_SHADOW_RATIO * candle_range(bar);
}

bool is_inverted_hammer_shape(const CandleContext& context, const Bar& bar) {
    double body_value = body_size(bar);
    return body_value > 0.0 && body_value <= candle_range(bar) / 3.0 &&
           upper_shadow(bar) >= context.config.long_shadow_ratio * body_value &&
           lower_shadow(bar) <= SMALL_SHADOW_RATIO * candle_range(bar);
}

std::optional<CandleMatch> detect_hammer(const CandleContext& context) {
    const Bar& candle = context.bar(0);
    if (!in_downtrend(context) || !is_hammer_shape(context, candle)) return std::nullopt;
    return make_match(PatternDirection::BULLISH, lower_shadow(candle) / candle_range(candle));
}

std::optional<CandleMatch> detect_hanging_man(const CandleContext& context) {
    const Bar& candle = context.bar(0);
    if (!in_uptrend(context) || !is_hammer_shape(context, candle)) return std::nullopt;
    return make_match(PatternDirection::BEARISH, lower_shadow(candle) / candle_range(candle));
}

std::optional<CandleMatch> detect_inverted_hammer(const CandleContext& context) {
    const Bar& candle = context.bar(0);
    if (!in_downtrend(context) || !is_inverted_hammer_shape(context, candle)) return std::nullopt;
    return make_match(PatternDirection::BULLISH, upper_shadow(candle) / candle_range(candle));
}

std::optional<CandleMatch> detect_shooting_star(const CandleContext& context) {
    const Bar& candle = context.bar(0);
    if (!in_uptrend(context) || !is_inverted_hammer_shape(context, candle)) return std::nullopt;
    return make_match(PatternDirection::BEARISH, upper_shadow(candle) / candle_range(candle));
}

std::optional<CandleMatch> detect_takuri(const CandleContext& context) {
    const Bar& candle = context.bar(0);
    if (!in_downtrend(context) || !is_doji(context, candle)) return std::nullopt;
    if (upper_shadow(candle) > SHAVEN_SHADOW_RATIO * candle_range(candle)) return std::nullopt;
    if (lower_shadow(candle) < 3.0 * std::max(body_size(candle), SMALL_SHADOW_RATIO * candle_range(candle))) return std::nullopt;
    return make_match(PatternDirection::BULLISH, lower_shadow(candle) / candle_range(candle));
}

std::optional<CandleMatch> detect_dragonfly_doji(const CandleContext& context) {
    const Bar& candle = context.bar(0);
    if (!is_doji(context, candle)) return std::nullopt;
    if (upper_shadow(candle) > SMALL_SHADOW_RATIO * candle_range(candle)) return std::nullopt;
    if (lower_shadow(candle) < DOJI_LONG_SHADOW_RATIO * candle_range(candle)) return std::nullopt;
    PatternDirection direction = in_downtrend(context) ? PatternDirection::BULLISH : PatternDirection::NEUTRAL;
    return make_match(direction, lower_shadow(candle) / candle_range(candle));
}

std::optional<CandleMatch> detect_gravestone_doji(const CandleContext& context) {
    const Bar& candle = context.bar(0);
    if (!is_doji(context, candle)) return std::nullopt;
    if (lower_shadow(candle) > SMALL_SHADOW_RATIO * candle_range(candle)) return std::nullopt;
    if (upper_shadow(candle) < DOJI_LONG_SHADOW_RATIO * candle_range(candle)) return std::nullopt;
    PatternDirection direction = in_uptrend(context) ? PatternDirection::BEARISH : PatternDirection::NEUTRAL;
    return make_match(direction, upper_shadow(candle) / candle_range(candle));
}

bool is_long_legged_doji(const CandleContext& context, const Bar& candle) {
    if (!is_doji(context, candle)) return false;
    if (upper_shadow(candle) < LONG_LEG_RATIO * candle_range(candle) || lower_shadow(candle) < LONG_LEG_RATIO * candle_range(candle)) return false;
    return context.average_body <= 0.0 || candle_range(candle) >= context.config.long_body_ratio * context.average_body;
}

std::optional<CandleMatch> detect_long_legged_doji(const CandleContext& context) {
    if (!is_long_legged_doji(context, context.bar(0))) return std::nullopt;
    return make_match(PatternDirection::NEUTRAL, 0.5);
}

std::optional<CandleMatch> detect_rickshaw_man(const CandleContext& context) {
    const Bar& candle = context.bar(0);
    if (!is_long_legged_doji(context, candle)) return std::nullopt;
    double range_midpoint = (candle.high_price + candle.low_price) / 2.0;
    double center_offset = std::abs(body_midpoint(candle) - range_midpoint);
    if (center_offset > SMALL_SHADOW_RATIO * candle_range(candle)) return std::nullopt;
    return make_match(PatternDirection::NEUTRAL, 1.0 - center_offset / candle_range(candle));
}

std::optional<CandleMatch> detect_doji(const CandleContext& context) {
    const Bar& candle = context.bar(0);
    if (!is_doji(context, candle)) return std::nullopt;
    return make_match(PatternDirection::NEUTRAL, 1.0 - body_size(candle) / (context.config.doji_body_ratio * candle_range(candle)));
}

std::optional<CandleMatch> detect_marubozu(const CandleContext& context) {
    const Bar& candle = context.bar(0);
    if (!is_marubozu(context, candle)) return std::nullopt;
    return make_match(is_white(candle) ? PatternDirection::BULLISH : PatternDirection::BEARISH, body_quality(context, candle));
}

std::optional<CandleMatch> detect_closing_marubozu(const CandleContext& context) {
    const Bar& candle = context.bar(0);
    if (!is_long_body(context, candle)) return std::nullopt;
    bool shaven_close = is_white(candle) ? (has_shaven_top(candle) && !has_shaven_bottom(candle))
                                         : (has_shaven_bottom(candle) && !has_shaven_top(candle));
    if (!shaven_close) return std::nullopt;
    return make_match(is_white(candle) ? PatternDirection::BULLISH : PatternDirection::BEARISH, body_quality(context, candle));
}

std::optional<CandleMatch> detect_opening_marubozu(const CandleContext& context) {
    const Bar& candle = context.bar(0);
    if (!is_long_body(context, candle)) return std::nullopt;
    bool shaven_open = is_white(candle) ? (has_shaven_bottom(candle) && !has_shaven_top(candle))
                                        : (has_shaven_top(candle) && !has_shaven_bottom(candle));
    if (!shaven_open) return std::nullopt;
    return make_match(is_white(candle) ? PatternDirection::BULLISH : PatternDirection::BEARISH, body_quality(context, candle));
}

std::optional<CandleMatch> detect_belt_hold(const CandleContext& context) {
    const Bar& candle = context.bar(0);
    if (!is_long_body(context, candle)) return std::nullopt;
    if (in_downtrend(context) && is_white(candle) && has_shaven_bottom(candle)) {
        return make_match(PatternDirection::BULLISH, body_quality(context, candle));
    }
    if (in_uptrend(context) && is_black(candle) && has_shaven_top(candle)) {
        return make_match(PatternDirection::BEARISH, body_quality(context, candle));
    }
    return std::nullopt;
}

std::optional<CandleMatch> detect_spinning_top(const CandleContext& context) {
    const Bar& candle = context.bar(0);
    double body_value = body_size(candle);
    if (body_value <= 0.0 || is_doji(context, candle) || body_value > SMALL_BODY_RANGE_RATIO * candle_range(candle)) return std::nullopt;
    if (upper_shadow(candle) <= body_value || lower_shadow(candle) <= body_value) return std::nullopt;
    return make_match(PatternDirection::NEUTRAL, 0.4);
}

std::optional<CandleMatch> detect_high_wave(const CandleContext& context) {
    const Bar& candle = context.bar(0);
    double body_value = body_size(candle);
    if (body_value <= 0.0 || body_value > SMALL_BODY_RANGE_RATIO * candle_range(candle)) return std::nullopt;
    if (upper_shadow(candle) < 3.0 * body_value || lower_shadow(candle) < 3.0 * body_value) return std::nullopt;
    return make_match(PatternDirection::NEUTRAL, 0.6);
}

std::optional<CandleMatch> detect_long_line(const CandleContext& context) {
    const Bar& candle = context.bar(0);
    if (!is_long_body(context, candle)) return std::nullopt;
    if (upper_shadow(candle) >= body_size(candle) / 2.0 || lower_shadow(candle) >= body_size(candle) / 2.0) return std::nullopt;
    return make_match(is_white(candle) ? PatternDirection::BULLISH : PatternDirection::BEARISH, body_quality(context, candle));
}

std::optional<CandleMatch> detect_short_line(const CandleContext& context) {
    const Bar& candle = context.bar(0);
    if (body_size(candle) <= 0.0 || is_doji(context, candle) || !is_short_body(context, candle)) return std::nullopt;
    if (upper_shadow(candle) > body_size(candle) || lower_shadow(candle) > body_size(candle)) return std::nullopt;
    return make_match(PatternDirection::NEUTRAL, 0.3);
}

// ========================================================================
// TWO-BAR SHAPES
// ========================================================================

std::optional<CandleMatch> detect_engulfing(const CandleContext& context) {
    const Bar& first = context.bar(0);
    const Bar& second = context.bar(1);
    if (in_downtrend(context) && is_black(first) && is_white(second) &&
        second.open_price <= first.close_price && second.close_price >= first.open_price &&
        (second.open_price < first.close_price || second.close_price > first.open_price)) {
        return make_match(PatternDirection::BULLISH, body_size(second) / (2.0 * body_size(first)));
    }
    if (in_uptrend(context) && is_white(first) && is_black(second) &&
        second.open_price >= first.close_price && second.close_price <= first.open_price &&
        (second.open_price > first.close_price || second.close_price < first.open_price)) {
        return make_match(PatternDirection::BEARISH, body_size(second) / (2.0 * body_size(first)));
    }
    return std::nullopt;
}

std::optional<CandleMatch> detect_harami(const CandleContext& context) {
    const Bar& first = context.bar(0);
    const Bar& second = context.bar(1);
    if (!is_long_body(context, first) || is_doji(context, second) || body_size(second) <= 0.0) return std::nullopt;
    if (!body_inside(second, first) || body_size(second) >= body_size(first)) return std::nullopt;
    double quality = 1.0 - body_size(second) / body_size(first);
    if (in_downtrend(context) && is_black(first) && is_white(second)) return make_match(PatternDirection::BULLISH, quality);
    if (in_uptrend(context) && is_white(first) && is_black(second)) return make_match(PatternDirection::BEARISH, quality);
    return std::nullopt;
}

std::optional<CandleMatch> detect_harami_cross(const CandleContext& context) {
    const Bar& first = context.bar(0);
    const Bar& second = context.bar(1);
    if (!is_long_body(context, first) || !is_doji(context, second) || !body_inside(second, first)) return std::nullopt;
    if (in_downtrend(context) && is_black(first)) return make_match(PatternDirection::BULLISH, body_quality(context, first));
    if (in_uptrend(context) && is_white(first)) return make_match(PatternDirection::BEARISH, body_quality(context, first));
    return std::nullopt;
}

std::optional<CandleMatch> detect_piercing(const CandleContext& context) {
    const Bar& first = context.bar(0);
    const Bar& second = context.bar(1);
    if (!in_downtrend(context) || !is_black(first) || !is_long_body(context, first) || !is_white(second)) return std::nullopt;
    if (second.open_price >= first.low_price) return std::nullopt;
    if (second.close_price <= body_midpoint(first) || second.close_price >= first.open_price) return std::nullopt;
    return make_match(PatternDirection::BULLISH, (second.close_price - body_midpoint(first)) / (first.open_price - body_midpoint(first)));
}

std::optional<CandleMatch> detect_dark_cloud_cover(const CandleContext& context) {
    const Bar& first = context.bar(0);
    const Bar& second = context.bar(1);
    if (!in_uptrend(context) || !is_white(first) || !is_long_body(context, first) || !is_black(second)) return std::nullopt;
    if (second.open_price <= first.high_price) return std::nullopt;
    if (second.close_price >= body_midpoint(first) || second.close_price <= first.open_price) return std::nullopt;
    return make_match(PatternDirection::BEARISH, (body_midpoint(first) - second.close_price) / (body_midpoint(first) - first.open_price));
}

std::optional<CandleMatch> detect_doji_star(const CandleContext& context) {
    const Bar& first = context.bar(0);
    const Bar& second = context.bar(1);
    if (!is_long_body(context, first) || !is_doji(context, second)) return std::nullopt;
    if (in_downtrend(context) && is_black(first) && body_top(second) < first.close_price) {
        return make_match(PatternDirection::BULLISH, body_quality(context, first));
    }
    if (in_uptrend(context) && is_white(first) && body_bottom(second) > first.close_price) {
        return make_match(PatternDirection::BEARISH, body_quality(context, first));
    }
    return std::nullopt;
}

std::optional<CandleMatch> detect_homing_pigeon(const CandleContext& context) {
    const Bar& first = context.bar(0);
    const Bar& second = context.bar(1);
    if (!in_downtrend(context) || !is_black(first) || !is_long_body(context, first) || !is_black(second)) return std::nullopt;
    if (second.open_price >= first.open_price || second.close_price <= first.close_price) return std::nullopt;
    return make_match(PatternDirection::BULLISH, 1.0 - body_size(second) / body_size(first));
}

std::optional<CandleMatch> detect_matching_low(const CandleContext& context) {
    const Bar& first = context.bar(0);
    const Bar& second = context.bar(1);
    if (!in_downtrend(context) || !is_black(first) || !is_black(second)) return std::nullopt;
    if (!is_near(context, first.close_price, second.close_price)) return std::nullopt;
    return make_match(PatternDirection::BULLISH, body_quality(context, first));
}

// Shared shape of in-neck, on-neck and thrusting: long black, then a white opening below its low
bool is_neck_setup(const CandleContext& context, const Bar& first, const Bar& second) {
    return in_downtrend(context) && is_black(first) && is_long_body(context, first) && is_white(second) &&
           second.open_price < first.low_price;
}

std::optional<CandleMatch> detect_in_neck(const CandleContext& context) {
    const Bar& first = context.bar(0);
    const Bar& second = context.bar(1);
    if (!is_neck_setup(context, first, second)) return std::nullopt;
    if (second.close_price < first.close_price || second.close_price > first.close_price + SMALL_SHADOW_RATIO * body_size(first)) return std::nullopt;
    return make_match(PatternDirection::BEARISH, body_quality(context, first));
}

std::optional<CandleMatch> detect_on_neck(const CandleContext& context) {
    const Bar& first = context.bar(0);
    const Bar& second = context.bar(1);
    if (!is_neck_setup(context, first, second)) return std::nullopt;
    if (std::abs(second.close_price - first.low_price) > SHAVEN_SHADOW_RATIO * candle_range(first)) return std::nullopt;
    return make_match(PatternDirection::BEARISH, body_quality(context, first));
}

std::optional<CandleMatch> detect_thrusting(const CandleContext& context) {
    const Bar& first = context.bar(0);
    const Bar& second = context.bar(1);
    if (!is_neck_setup(context, first, second)) return std::nullopt;
    if (second.close_price <= first.close_price + SMALL_SHADOW_RATIO * body_size(first) || second.close_price >= body_midpoint(first)) return std::nullopt;
    return make_match(PatternDirection::BEARISH, body_quality(context, first));
}

std::optional<CandleMatch> detect_kicking(const CandleContext& context) {
    const Bar& first = context.bar(0);
    const Bar& second = context.bar(1);
    if (!is_marubozu(context, first) || !is_marubozu(context, second)) return std::nullopt;
    if (is_black(first) && is_white(second) && second.low_price > first.high_price) {
        return make_match(PatternDirection::BULLISH, body_quality(context, second));
    }
    if (is_white(first) && is_black(second) && second.high_price < first.low_price) {
        return make_match(PatternDirection::BEARISH, body_quality(context, second));
    }
    return std::nullopt;
}

std::optional<CandleMatch> detect_separating_lines(const CandleContext& context) {
    const Bar& first = context.bar(0);
    const Bar& second = context.bar(1);
    if (!is_long_body(context, second) || !is_near(context, first.open_price, second.open_price)) return std::nullopt;
    if (in_uptrend(context) && is_black(first) && is_white(second) && has_shaven_bottom(second)) {
        return make_match(PatternDirection::BULLISH, body_quality(context, second));
    }
    if (in_downtrend(context) && is_white(first) && is_black(second) && has_shaven_top(second)) {
        return make_match(PatternDirection::BEARISH, body_quality(context, second));
    }
    return std::nullopt;
}

std::optional<CandleMatch> detect_counterattack(const CandleContext& context) {
    const Bar& first = context.bar(0);
    const Bar& second = context.bar(1);
    if (!is_long_body(context, first) || !is_long_body(context, second) || !is_near(context, first.close_price, second.close_price)) return std::nullopt;
    if (in_downtrend(context) && is_black(first) && is_white(second)) return make_match(PatternDirection::BULLISH, body_quality(context, second));
    if (in_uptrend(context) && is_white(first) && is_black(second)) return make_match(PatternDirection::BEARISH, body_quality(context, second));
    return std::nullopt;
}

std::optional<CandleMatch> detect_tweezer_top(const CandleContext& context) {
    const Bar& first = context.bar(0);
    const Bar& second = context.bar(1);
    if (!in_uptrend(context) || !is_white(first) || !is_black(second)) return std::nullopt;
    if (!is_near(context, first.high_price, second.high_price)) return std::nullopt;
    return make_match(PatternDirection::BEARISH, body_quality(context, second));
}

std::optional<CandleMatch> detect_tweezer_bottom(const CandleContext& context) {
    const Bar& first = context.bar(0);
    const Bar& second = context.bar(1);
    if (!in_downtrend(context) || !is_black(first) || !is_white(second)) return std::nullopt;
    if (!is_near(context, first.low_price, second.low_price)) return std::nullopt;
    return make_match(PatternDirection::BULLISH, body_quality(context, second));
}

// ========================================================================
// THREE-BAR SHAPES
// ========================================================================

std::optional<CandleMatch> detect_hikkake(const CandleContext& context) {
    const Bar& mother = context.bar(0);
    const Bar& inside = context.bar(1);
    const Bar& breakout = context.bar(2);
    if (inside.high_price >= mother.high_price || inside.low_price <= mother.low_price) return std::nullopt;
    // A breakout of the inside bar that fails in the opposite direction of the trap
    if (breakout.high_price < inside.high_price && breakout.low_price < inside.low_price) return make_match(PatternDirection::BULLISH, 0.4);
    if (breakout.high_price > inside.high_price && breakout.low_price > inside.low_price) return make_match(PatternDirection::BEARISH, 0.4);
    return std::nullopt;
}

bool is_star_body(const CandleContext& context, const Bar& star, const Bar& first) {
    return is_doji(context, star) || is_short_body(context, star) || body_size(star) <= 0.5 * body_size(first);
}

std::optional<CandleMatch> detect_morning_star(const CandleContext& context) {
    const Bar& first = context.bar(0);
    const Bar& star = context.bar(1);
    const Bar& third = context.bar(2);
    if (!in_downtrend(context) || !is_black(first) || !is_long_body(context, first)) return std::nullopt;
    if (!is_star_body(context, star, first) || body_top(star) >= first.close_price) return std::nullopt;
    if (!is_white(third) || third.close_price <= body_midpoint(first)) return std::nullopt;
    return make_match(PatternDirection::BULLISH, (third.close_price - body_midpoint(first)) / body_size(first) * 2.0);
}

std::optional<CandleMatch> detect_evening_star(const CandleContext& context) {
    const Bar& first = context.bar(0);
    const Bar& star = context.bar(1);
    const Bar& third = context.bar(2);
    if (!in_uptrend(context) || !is_white(first) || !is_long_body(context, first)) return std::nullopt;
    if (!is_star_body(context, star, first) || body_bottom(star) <= first.close_price) return std::nullopt;
    if (!is_black(third) || third.close_price >= body_midpoint(first)) return std::nullopt;
    return make_match(PatternDirection::BEARISH, (body_midpoint(first) - third.close_price) / body_size(first) * 2.0);
}

std::optional<CandleMatch> detect_morning_doji_star(const CandleContext& context) {
    if (!is_doji(context, context.bar(1))) return std::nullopt;
    return detect_morning_star(context);
}

std::optional<CandleMatch> detect_evening_doji_star(const CandleContext& context) {
    if (!is_doji(context, context.bar(1))) return std::nullopt;
    return detect_evening_star(context);
}

std::optional<CandleMatch> detect_abandoned_baby(const CandleContext& context) {
    const Bar& first = context.bar(0);
    const Bar& baby = context.bar(1);
    const Bar& third = context.bar(2);
    if (!is_doji(context, baby)) return std::nullopt;
    if (in_downtrend(context) && is_black(first) && is_white(third) &&
        baby.high_price < first.low_price && third.low_price > baby.high_price) {
        return make_match(PatternDirection::BULLISH, 1.0);
    }
    if (in_uptrend(context) && is_white(first) && is_black(third) &&
        baby.low_price > first.high_price && third.high_price < baby.low_price) {
        return make_match(PatternDirection::BEARISH, 1.0);
    }
    return std::nullopt;
}

bool is_rising_white_sequence(const Bar& first, const Bar& second, const Bar& third) {
    return is_white(first) && is_white(second) && is_white(third) &&
           second.close_price > first.close_price && third.close_price > second.close_price &&
           second.open_price > first.open_price && second.open_price <= first.close_price &&
           third.open_price > second.open_price && third.open_price <= second.close_price;
}

bool is_falling_black_sequence(const Bar& first, const Bar& second, const Bar& third) {
    return is_black(first) && is_black(second) && is_black(third) &&
           second.close_price < first.close_price && third.close_price < second.close_price &&
           second.open_price < first.open_price && second.open_price >= first.close_price &&
           third.open_price < second.open_price && third.open_price >= second.close_price;
}

std::optional<CandleMatch> detect_three_white_soldiers(const CandleContext& context) {
    const Bar& first = context.bar(0);
    const Bar& second = context.bar(1);
    const Bar& third = context.bar(2);
    if (!is_rising_white_sequence(first, second, third)) return std::nullopt;
    for (int offset = 0; offset < 3; ++offset) {
        const Bar& soldier = context.bar(offset);
        if (is_short_body(context, soldier) || upper_shadow(soldier) > 0.3 * body_size(soldier)) return std::nullopt;
    }
    return make_match(PatternDirection::BULLISH, body_quality(context, third));
}

std::optional<CandleMatch> detect_three_black_crows(const CandleContext& context) {
    const Bar& first = context.bar(0);
    const Bar& second = context.bar(1);
    const Bar& third = context.bar(2);
    if (in_downtrend(context) || !is_falling_black_sequence(first, second, third)) return std::nullopt;
    for (int offset = 0; offset < 3; ++offset) {
        const Bar& crow = context.bar(offset);
        if (is_short_body(context, crow) || lower_shadow(crow) > 0.3 * body_size(crow)) return std::nullopt;
    }
    return make_match(PatternDirection::BEARISH, body_quality(context, third));
}

std::optional<CandleMatch> detect_identical_three_crows(const CandleContext& context) {
    const Bar& first = context.bar(0);
    const Bar& second = context.bar(1);
    const Bar& third = context.bar(2);
    if (!is_black(first) || !is_black(second) || !is_black(third)) return std::nullopt;
    if (second.close_price >= first.close_price || third.close_price >= second.close_price) return std::nullopt;
    if (std::abs(second.open_price - first.close_price) > SMALL_SHADOW_RATIO * body_size(first)) return std::nullopt;
    if (std::abs(third.open_price - second.close_price) > SMALL_SHADOW_RATIO * body_size(second)) return std::nullopt;
    return make_match(PatternDirection::BEARISH, body_quality(context, third));
}

std::optional<CandleMatch> detect_three_inside_up(const CandleContext& context) {
    const Bar& first = context.bar(0);
    const Bar& second = context.bar(1);
    const Bar& third = context.bar(2);
    if (!in_downtrend(context) || !is_black(first) || !is_long_body(context, first)) return std::nullopt;
    if (!is_white(second) || !body_inside(second, first) || !is_white(third) || third.close_price <= first.open_price) return std::nullopt;
    return make_match(PatternDirection::BULLISH, body_quality(context, third));
}

std::optional<CandleMatch> detect_three_inside_down(const CandleContext& context) {
    const Bar& first = context.bar(0);
    const Bar& second = context.bar(1);
    const Bar& third = context.bar(2);
    if (!in_uptrend(context) || !is_white(first) || !is_long_body(context, first)) return std::nullopt;
    if (!is_black(second) || !body_inside(second, first) || !is_black(third) || third.close_price >= first.open_price) return std::nullopt;
    return make_match(PatternDirection::BEARISH, body_quality(context, third));
}

std::optional<CandleMatch> detect_three_outside_up(const CandleContext& context) {
    const Bar& first = context.bar(0);
    const Bar& second = context.bar(1);
    const Bar& third = context.bar(2);
    if (!in_downtrend(context) || !is_black(first) || !is_white(second)) return std::nullopt;
    if (second.open_price > first.close_price || second.close_price < first.open_price) return std::nullopt;
    if (!is_white(third) || third.close_price <= second.close_price) return std::nullopt;
    return make_match(PatternDirection::BULLISH, body_quality(context, second));
}

std::optional<CandleMatch> detect_three_outside_down(const CandleContext& context) {
    const Bar& first = context.bar(0);
    const Bar& second = context.bar(1);
    const Bar& third = context.bar(2);
    if (!in_uptrend(context) || !is_white(first) || !is_black(second)) return std::nullopt;
    if (second.open_price < first.close_price || second.close_price > first.open_price) return std::nullopt;
    if (!is_black(third) || third.close_price >= second.close_price) return std::nullopt;
    return make_match(PatternDirection::BEARISH, body_quality(context, second));
}

std::optional<CandleMatch> detect_two_crows(const CandleContext& context) {
    const Bar& first = context.bar(0);
    const Bar& second = context.bar(1);
    const Bar& third = context.bar(2);
    if (!in_uptrend(context) || !is_white(first) || !is_long_body(context, first)) return std::nullopt;
    if (!is_black(second) || body_bottom(second) <= first.close_price) return std::nullopt;
    if (!is_black(third) || third.open_price >= second.open_price || third.open_price <= second.close_price) return std::nullopt;
    if (third.close_price <= first.open_price || third.close_price >= first.close_price) return std::nullopt;
    return make_match(PatternDirection::BEARISH, body_quality(context, third));
}

std::optional<CandleMatch> detect_upside_gap_two_crows(const CandleContext& context) {
    const Bar& first = context.bar(0);
    const Bar& second = context.bar(1);
    const Bar& third = context.bar(2);
    if (!in_uptrend(context) || !is_white(first) || !is_long_body(context, first)) return std::nullopt;
    if (!is_black(second) || second.close_price <= first.close_price) return std::nullopt;
    if (!is_black(third) || third.open_price <= second.open_price || third.close_price >= second.close_price) return std::nullopt;
    if (third.close_price <= first.close_price) return std::nullopt;
    return make_match(PatternDirection::BEARISH, body_quality(context, third));
}

std::optional<CandleMatch> detect_advance_block(const CandleContext& context) {
    const Bar& first = context.bar(0);
    const Bar& second = context.bar(1);
    const Bar& third = context.bar(2);
    if (!in_uptrend(context) || !is_rising_white_sequence(first, second, third)) return std::nullopt;
    if (body_size(second) >= body_size(first) || body_size(third) >= body_size(second)) return std::nullopt;
    if (upper_shadow(third) <= upper_shadow(first) && upper_shadow(second) <= upper_shadow(first)) return std::nullopt;
    return make_match(PatternDirection::BEARISH, 1.0 - body_size(third) / body_size(first));
}

std::optional<CandleMatch> detect_stalled_pattern(const CandleContext& context) {
    const Bar& first = context.bar(0);
    const Bar& second = context.bar(1);
    const Bar& third = context.bar(2);
    if (!in_uptrend(context) || !is_white(first) || !is_white(second) || !is_white(third)) return std::nullopt;
    if (!is_long_body(context, first) || !is_long_body(context, second) || second.close_price <= first.close_price) return std::nullopt;
    if (!is_short_body(context, third) || third.open_price < second.close_price - SMALL_SHADOW_RATIO * body_size(second)) return std::nullopt;
    return make_match(PatternDirection::BEARISH, 1.0 - body_size(third) / body_size(second));
}

std::optional<CandleMatch> detect_stick_sandwich(const CandleContext& context) {
    const Bar& first = context.bar(0);
    const Bar& second = context.bar(1);
    const Bar& third = context.bar(2);
    if (!is_black(first) || !is_white(second) || !is_black(third)) return std::nullopt;
    if (second.low_price <= first.close_price || !is_near(context, first.close_price, third.close_price)) return std::nullopt;
    return make_match(PatternDirection::BULLISH, body_quality(context, third));
}

std::optional<CandleMatch> detect_tristar(const CandleContext& context) {
    const Bar& first = context.bar(0);
    const Bar& second = context.bar(1);
    const Bar& third = context.bar(2);
    if (!is_doji(context, first) || !is_doji(context, second) || !is_doji(context, third)) return std::nullopt;
    if (body_top(second) < body_bottom(first) && body_top(second) < body_bottom(third)) return make_match(PatternDirection::BULLISH, 0.8);
    if (body_bottom(second) > body_top(first) && body_bottom(second) > body_top(third)) return make_match(PatternDirection::BEARISH, 0.8);
    return std::nullopt;
}

std::optional<CandleMatch> detect_unique_three_river(const CandleContext& context) {
    const Bar& first = context.bar(0);
    const Bar& second = context.bar(1);
    const Bar& third = context.bar(2);
    if (!in_downtrend(context) || !is_black(first) || !is_long_body(context, first)) return std::nullopt;
    if (!is_black(second) || !body_inside(second, first) || second.low_price >= first.low_price) return std::nullopt;
    if (!is_white(third) || !is_short_body(context, third) || third.close_price >= second.close_price) return std::nullopt;
    return make_match(PatternDirection::BULLISH, body_quality(context, first));
}

std::optional<CandleMatch> detect_three_stars_in_the_south(const CandleContext& context) {
    const Bar& first = context.bar(0);
    const Bar& second = context.bar(1);
    const Bar& third = context.bar(2);
    if (!in_downtrend(context) || !is_black(first) || !is_black(second) || !is_black(third)) return std::nullopt;
    if (!is_long_body(context, first) || lower_shadow(first) < body_size(first) / 2.0) return std::nullopt;
    if (body_size(second) >= body_size(first) || second.low_price <= first.low_price) return std::nullopt;
    if (!has_shaven_top(third) || !has_shaven_bottom(third)) return std::nullopt;
    if (third.high_price > second.high_price || third.low_price < second.low_price) return std::nullopt;
    return make_match(PatternDirection::BULLISH, 0.7);
}

std::optional<CandleMatch> detect_tasuki_gap(const CandleContext& context) {
    const Bar& first = context.bar(0);
    const Bar& second = context.bar(1);
    const Bar& third = context.bar(2);
    if (in_uptrend(context) && is_white(first) && is_white(second) && is_black(third) &&
        body_bottom(second) > body_top(first) &&
        third.open_price < second.close_price && third.open_price > second.open_price &&
        third.close_price > body_top(first) && third.close_price < body_bottom(second)) {
        return make_match(PatternDirection::BULLISH, body_quality(context, second));
    }
    if (in_downtrend(context) && is_black(first) && is_black(second) && is_white(third) &&
        body_top(second) < body_bottom(first) &&
        third.open_price > second.close_price && third.open_price < second.open_price &&
        third.close_price < body_bottom(first) && third.close_price > body_top(second)) {
        return make_match(PatternDirection::BEARISH, body_quality(context, second));
    }
    return std::nullopt;
}

std::optional<CandleMatch> detect_side_by_side_white_lines(const CandleContext& context) {
    const Bar& first = context.bar(0);
    const Bar& second = context.bar(1);
    const Bar& third = context.bar(2);
    if (!is_white(second) || !is_white(third)) return std::nullopt;
    if (std::abs(third.open_price - second.open_price) > SMALL_SHADOW_RATIO * body_size(second)) return std::nullopt;
    if (std::abs(body_size(third) - body_size(second)) > 0.3 * body_size(second)) return std::nullopt;
    if (is_white(first) && body_bottom(second) > body_top(first) && body_bottom(third) > body_top(first)) {
        return make_match(PatternDirection::BULLISH, body_quality(context, second));
    }
    if (is_black(first) && body_top(second) < body_bottom(first) && body_top(third) < body_bottom(first)) {
        return make_match(PatternDirection::BEARISH, body_quality(context, second));
    }
    return std::nullopt;
}

std::optional<CandleMatch> detect_gap_three_methods(const CandleContext& context) {
    const Bar& first = context.bar(0);
    const Bar& second = context.bar(1);
    const Bar& third = context.bar(2);
    if (is_white(first) && is_white(second) && is_black(third) && body_bottom(second) > body_top(first) &&
        third.open_price < second.close_price && third.open_price > second.open_price &&
        third.close_price < first.close_price && third.close_price > first.open_price) {
        return make_match(PatternDirection::BULLISH, body_quality(context, second));
    }
    if (is_black(first) && is_black(second) && is_white(third) && body_top(second) < body_bottom(first) &&
        third.open_price > second.close_price && third.open_price < second.open_price &&
        third.close_price > first.close_price && third.close_price < first.open_price) {
        return make_match(PatternDirection::BEARISH, body_quality(context, second));
    }
    return std::nullopt;
}

// ========================================================================
// FOUR- AND FIVE-BAR SHAPES
// ========================================================================

std::optional<CandleMatch> detect_three_line_strike(const CandleContext& context) {
    const Bar& first = context.bar(0);
    const Bar& second = context.bar(1);
    const Bar& third = context.bar(2);
    const Bar& strike = context.bar(3);
    if (is_white(first) && is_white(second) && is_white(third) &&
        second.close_price > first.close_price && third.close_price > second.close_price &&
        is_black(strike) && strike.open_price >= third.close_price && strike.close_price < first.open_price) {
        return make_match(PatternDirection::BULLISH, body_quality(context, strike));
    }
    if (is_black(first) && is_black(second) && is_black(third) &&
        second.close_price < first.close_price && third.close_price < second.close_price &&
        is_white(strike) && strike.open_price <= third.close_price && strike.close_price > first.open_price) {
        return make_match(PatternDirection::BEARISH, body_quality(context, strike));
    }
    return std::nullopt;
}

std::optional<CandleMatch> detect_ladder_bottom(const CandleContext& context) {
    if (!in_downtrend(context)) return std::nullopt;
    for (int offset = 0; offset < 4; ++offset) {
        if (!is_black(context.bar(offset))) return std::nullopt;
    }
    for (int offset = 1; offset < 3; ++offset) {
        if (context.bar(offset).open_price >= context.bar(offset - 1).open_price ||
            context.bar(offset).close_price >= context.bar(offset - 1).close_price) return std::nullopt;
    }
    const Bar& fourth = context.bar(3);
    const Bar& fifth = context.bar(4);
    if (upper_shadow(fourth) <= body_size(fourth)) return std::nullopt;
    if (!is_white(fifth) || fifth.open_price <= body_top(fourth)) return std::nullopt;
    return make_match(PatternDirection::BULLISH, body_quality(context, fifth));
}

bool holds_within_first_range(const CandleContext& context, const Bar& first) {
    for (int offset = 1; offset < 4; ++offset) {
        const Bar& inner = context.bar(offset);
        if (!is_short_body(context, inner) && !is_doji(context, inner)) return false;
        if (inner.high_price > first.high_price || inner.low_price < first.low_price) return false;
    }
    return true;
}

std::optional<CandleMatch> detect_rising_three_methods(const CandleContext& context) {
    const Bar& first = context.bar(0);
    const Bar& fifth = context.bar(4);
    if (!is_white(first) || !is_long_body(context, first) || !holds_within_first_range(context, first)) return std::nullopt;
    if (context.bar(2).close_price >= context.bar(1).close_price || context.bar(3).close_price >= context.bar(2).close_price) return std::nullopt;
    if (!is_white(fifth) || !is_long_body(context, fifth) || fifth.close_price <= first.close_price) return std::nullopt;
    return make_match(PatternDirection::BULLISH, body_quality(context, fifth));
}

std::optional<CandleMatch> detect_falling_three_methods(const CandleContext& context) {
    const Bar& first = context.bar(0);
    const Bar& fifth = context.bar(4);
    if (!is_black(first) || !is_long_body(context, first) || !holds_within_first_range(context, first)) return std::nullopt;
    if (context.bar(2).close_price <= context.bar(1).close_price || context.bar(3).close_price <= context.bar(2).close_price) return std::nullopt;
    if (!is_black(fifth) || !is_long_body(context, fifth) || fifth.close_price >= first.close_price) return std::nullopt;
    return make_match(PatternDirection::BEARISH, body_quality(context, fifth));
}

std::optional<CandleMatch> detect_mat_hold(const CandleContext& context) {
    const Bar& first = context.bar(0);
    const Bar& second = context.bar(1);
    const Bar& fifth = context.bar(4);
    if (!in_uptrend(context) || !is_white(first) || !is_long_body(context, first)) return std::nullopt;
    if (!is_short_body(context, second) || body_bottom(second) <= first.close_price) return std::nullopt;
    double reaction_high = first.high_price;
    for (int offset = 1; offset < 4; ++offset) {
        const Bar& reaction = context.bar(offset);
        if (body_bottom(reaction) <= body_midpoint(first)) return std::nullopt;
        reaction_high = std::max(reaction_high, reaction.high_price);
    }
    if (context.bar(3).close_price >= context.bar(2).close_price && context.bar(2).close_price >= second.close_price) return std::nullopt;
    if (!is_white(fifth) || fifth.close_price <= reaction_high) return std::nullopt;
    return make_match(PatternDirection::BULLISH, body_quality(context, fifth));
}

std::optional<CandleMatch> detect_breakaway(const CandleContext& context) {
    const Bar& first = context.bar(0);
    const Bar& second = context.bar(1);
    const Bar& third = context.bar(2);
    const Bar& fourth = context.bar(3);
    const Bar& fifth = context.bar(4);
    if (!is_long_body(context, first)) return std::nullopt;
    if (in_downtrend(context) && is_black(first) && is_black(second) && body_top(second) < body_bottom(first) &&
        third.close_price < second.close_price && fourth.close_price < third.close_price &&
        is_white(fifth) && fifth.close_price > body_top(second) && fifth.close_price < body_bottom(first)) {
        return make_match(PatternDirection::BULLISH, body_quality(context, fifth));
    }
    if (in_uptrend(context) && is_white(first) && is_white(second) && body_bottom(second) > body_top(first) &&
        third.close_price > second.close_price && fourth.close_price > third.close_price &&
        is_black(fifth) && fifth.close_price < body_bottom(second) && fifth.close_price > body_top(first)) {
        return make_match(PatternDirection::BEARISH, body_quality(context, fifth));
    }
    return std::nullopt;
}

int get_category_rank(PatternCategory category) {
    switch (category) {
        case PatternCategory::REVERSAL: return 0;
        case PatternCategory::INDECISION: return 1;
        case PatternCategory::CONTINUATION: return 2;
    }
    return 2;
}

struct WindowCandidate {
    const CandlestickRule* rule;
    CandleMatch match;
};

bool outranks(const CandlestickRule& challenger, const CandlestickRule& incumbent) {
    int challenger_rank = get_category_rank(challenger.category);
    int incumbent_rank = get_category_rank(incumbent.category);
    if (challenger_rank != incumbent_rank) {
        return challenger_rank < incumbent_rank;
    }
    return challenger.priority < incumbent.priority;
}

} // anonymous namespace

// ========================================================================
// CATALOG
// ========================================================================

const std::vector<CandlestickRule>& get_candlestick_catalog() {
    static const std::vector<CandlestickRule> candlestick_catalog = {
        // Single bar
        {"Hammer", 1, PatternCategory::REVERSAL, 20, detect_hammer},
        {"Hanging Man", 1, PatternCategory::REVERSAL, 20, detect_hanging_man},
        {"Inverted Hammer", 1, PatternCategory::REVERSAL, 20, detect_inverted_hammer},
        {"Shooting Star", 1, PatternCategory::REVERSAL, 20, detect_shooting_star},
        {"Takuri", 1, PatternCategory::REVERSAL, 10, detect_takuri},
        {"Dragonfly Doji", 1, PatternCategory::REVERSAL, 15, detect_dragonfly_doji},
        {"Gravestone Doji", 1, PatternCategory::REVERSAL, 15, detect_gravestone_doji},
        {"Belt-hold", 1, PatternCategory::REVERSAL, 25, detect_belt_hold},
        {"Rickshaw Man", 1, PatternCategory::INDECISION, 10, detect_rickshaw_man},
        {"Long-Legged Doji", 1, PatternCategory::INDECISION, 15, detect_long_legged_doji},
        {"Doji", 1, PatternCategory::INDECISION, 30, detect_doji},
        {"High-Wave Candle", 1, PatternCategory::INDECISION, 20, detect_high_wave},
        {"Spinning Top", 1, PatternCategory::INDECISION, 25, detect_spinning_top},
        {"Short Line Candle", 1, PatternCategory::INDECISION, 40, detect_short_line},
        {"Marubozu", 1, PatternCategory::CONTINUATION, 10, detect_marubozu},
        {"Closing Marubozu", 1, PatternCategory::CONTINUATION, 15, detect_closing_marubozu},
        {"Opening Marubozu", 1, PatternCategory::CONTINUATION, 15, detect_opening_marubozu},
        {"Long Line Candle", 1, PatternCategory::CONTINUATION, 30, detect_long_line},

        // Two bars
        {"Engulfing", 2, PatternCategory::REVERSAL, 10, detect_engulfing},
        {"Kicking", 2, PatternCategory::REVERSAL, 5, detect_kicking},
        {"Harami Cross", 2, PatternCategory::REVERSAL, 15, detect_harami_cross},
        {"Harami", 2, PatternCategory::REVERSAL, 20, detect_harami},
        {"Piercing Line", 2, PatternCategory::REVERSAL, 10, detect_piercing},
        {"Dark Cloud Cover", 2, PatternCategory::REVERSAL, 10, detect_dark_cloud_cover},
        {"Doji Star", 2, PatternCategory::REVERSAL, 20, detect_doji_star},
        {"Homing Pigeon", 2, PatternCategory::REVERSAL, 20, detect_homing_pigeon},
        {"Matching Low", 2, PatternCategory::REVERSAL, 25, detect_matching_low},
        {"Counterattack", 2, PatternCategory::REVERSAL, 20, detect_counterattack},
        {"Tweezer Top", 2, PatternCategory::REVERSAL, 30, detect_tweezer_top},
        {"Tweezer Bottom", 2, PatternCategory::REVERSAL, 30, detect_tweezer_bottom},
        {"In-Neck", 2, PatternCategory::CONTINUATION, 10, detect_in_neck},
        {"On-Neck", 2, PatternCategory::CONTINUATION, 10, detect_on_neck},
        {"Thrusting", 2, PatternCategory::CONTINUATION, 15, detect_thrusting},
        {"Separating Lines", 2, PatternCategory::CONTINUATION, 20, detect_separating_lines},

        // Three bars
        {"Abandoned Baby", 3, PatternCategory::REVERSAL, 5, detect_abandoned_baby},
        {"Morning Doji Star", 3, PatternCategory::REVERSAL, 8, detect_morning_doji_star},
        {"Evening Doji Star", 3, PatternCategory::REVERSAL, 8, detect_evening_doji_star},
        {"Morning Star", 3, PatternCategory::REVERSAL, 10, detect_morning_star},
        {"Evening Star", 3, PatternCategory::REVERSAL, 10, detect_evening_star},
        {"Advance Block", 3, PatternCategory::REVERSAL, 12, detect_advance_block},
        {"Identical Three Crows", 3, PatternCategory::REVERSAL, 12, detect_identical_three_crows},
        {"Three White Soldiers", 3, PatternCategory::REVERSAL, 15, detect_three_white_soldiers},
        {"Three Black Crows", 3, PatternCategory::REVERSAL, 15, detect_three_black_crows},
        {"Three Inside Up", 3, PatternCategory::REVERSAL, 15, detect_three_inside_up},
        {"Three Inside Down", 3, PatternCategory::REVERSAL, 15, detect_three_inside_down},
        {"Three Outside Up", 3, PatternCategory::REVERSAL, 15, detect_three_outside_up},
        {"Three Outside Down", 3, PatternCategory::REVERSAL, 15, detect_three_outside_down},
        {"Upside Gap Two Crows", 3, PatternCategory::REVERSAL, 18, detect_upside_gap_two_crows},
        {"Two Crows", 3, PatternCategory::REVERSAL, 20, detect_two_crows},
        {"Stalled Pattern", 3, PatternCategory::REVERSAL, 20, detect_stalled_pattern},
        {"Unique Three River", 3, PatternCategory::REVERSAL, 20, detect_unique_three_river},
        {"Three Stars In The South", 3, PatternCategory::REVERSAL, 20, detect_three_stars_in_the_south},
        {"Tristar", 3, PatternCategory::REVERSAL, 20, detect_tristar},
        {"Stick Sandwich", 3, PatternCategory::REVERSAL, 25, detect_stick_sandwich},
        {"Hikkake", 3, PatternCategory::REVERSAL, 40, detect_hikkake},
        {"Tasuki Gap", 3, PatternCategory::CONTINUATION, 10, detect_tasuki_gap},
        {"Gap Three Methods", 3, PatternCategory::CONTINUATION, 15, detect_gap_three_methods},
        {"Side-by-Side White Lines", 3, PatternCategory::CONTINUATION, 20, detect_side_by_side_white_lines},

        // Four and five bars
        {"Three-Line Strike", 4, PatternCategory::CONTINUATION, 10, detect_three_line_strike},
        {"Ladder Bottom", 5, PatternCategory::REVERSAL, 10, detect_ladder_bottom},
        {"Breakaway", 5, PatternCategory::REVERSAL, 10, detect_breakaway},
        {"Rising Three Methods", 5, PatternCategory::CONTINUATION, 10, detect_rising_three_methods},
        {"Falling Three Methods", 5, PatternCategory::CONTINUATION, 10, detect_falling_three_methods},
        {"Mat Hold", 5, PatternCategory::CONTINUATION, 12, detect_mat_hold},
    };
    return candlestick_catalog;
}

double compute_average_body(const Series& series, size_t start_index, int window_length, int lookback) {
    size_t lookback_start = start_index > static_cast<size_t>(lookback) ? start_index - lookback : 0;
    double body_sum = 0.0;
    int body_count = 0;
    for (size_t bar_index = lookback_start; bar_index < start_index; ++bar_index) {
        body_sum += body_size(series.at(bar_index));
        ++body_count;
    }
    if (body_count == 0) {
        // No history before the window: the window itself is the reference
        for (int offset = 0; offset < window_length; ++offset) {
            body_sum += body_size(series.at(start_index + offset));
            ++body_count;
        }
    }
    return body_count > 0 ? body_sum / body_count : 0.0;
}

TrendDirection compute_prior_trend(const Series& series, size_t start_index, int lookback) {
    if (start_index < static_cast<size_t>(lookback)) {
        return TrendDirection::FLAT;
    }
    double close_sum = 0.0;
    for (size_t bar_index = start_index - lookback; bar_index < start_index; ++bar_index) {
        close_sum += series.at(bar_index).close_price;
    }
    double average_close = close_sum / lookback;
    double reference_close = series.at(start_index - 1).close_price;
    if (reference_close > average_close) return TrendDirection::UP;
    if (reference_close < average_close) return TrendDirection::DOWN;
    return TrendDirection::FLAT;
}

std::vector<Pattern> detect_candlestick_patterns(const Series& series, const PatternConfig& config) {
    std::vector<Pattern> candlestick_patterns;
    const std::vector<CandlestickRule>& candlestick_catalog = get_candlestick_catalog();

    size_t scan_start_index = 0;
    if (config.candlestick_scan_bars > 0 && series.size() > static_cast<size_t>(config.candlestick_scan_bars)) {
        scan_start_index = series.size() - config.candlestick_scan_bars;
    }

    for (size_t end_index = scan_start_index; end_index < series.size(); ++end_index) {
        std::map<size_t, WindowCandidate> best_by_start_index;

        for (const CandlestickRule& candlestick_rule : candlestick_catalog) {
            if (static_cast<size_t>(candlestick_rule.window_length) > end_index + 1) continue;

            size_t start_index = end_index + 1 - candlestick_rule.window_length;
            CandleContext candle_context(series, config, start_index, candlestick_rule.window_length,
                                         compute_average_body(series, start_index, candlestick_rule.window_length, config.average_body_lookback),
                                         compute_prior_trend(series, start_index, config.trend_lookback));
            std::optional<CandleMatch> candle_match = candlestick_rule.predicate(candle_context);
            if (!candle_match) continue;

            std::map<size_t, WindowCandidate>::iterator candidate_iterator = best_by_start_index.find(start_index);
            if (candidate_iterator == best_by_start_index.end()) {
                best_by_start_index.emplace(start_index, WindowCandidate{&candlestick_rule, *candle_match});
            } else if (outranks(candlestick_rule, *candidate_iterator->second.rule)) {
                candidate_iterator->second = WindowCandidate{&candlestick_rule, *candle_match};
            }
        }

        for (const auto& window_entry : best_by_start_index) {
            Pattern candlestick_pattern;
            candlestick_pattern.name = window_entry.second.rule->name;
            candlestick_pattern.start_index = window_entry.first;
            candlestick_pattern.end_index = end_index;
            candlestick_pattern.direction = window_entry.second.match.direction;
            candlestick_pattern.confidence = window_entry.second.match.confidence;
            candlestick_pattern.kind = PatternKind::CANDLESTICK;
            candlestick_pattern.category = window_entry.second.rule->category;
            candlestick_patterns.push_back(candlestick_pattern);
        }
    }

    return candlestick_patterns;
}

} // namespace Core
} // namespace StockAdvisor
