#include "indicators.hpp"
#include "rolling_window.hpp"
#include "analyzer/data_structures/analysis_errors.hpp"
#include "logging/logger/logging_macros.hpp"
#include <algorithm>
#include <cmath>
#include <functional>

namespace StockAdvisor {
namespace Core {

using StockAdvisor::Logging::log_message;

namespace {

void require_minimum_bars(const std::string& indicator_name, size_t available_bars, int required_bars) {
    if (static_cast<int>(available_bars) < required_bars) {
        throw DataInsufficientError(indicator_name + ": insufficient bars - have " + std::to_string(available_bars) +
                                    ", need " + std::to_string(required_bars));
    }
}

double compute_true_range(const Series& series, size_t bar_index) {
    const Bar& current_bar = series.at(bar_index);
    double previous_close = series.at(bar_index - 1).close_price;
    return std::max({current_bar.high_price - current_bar.low_price,
                     std::abs(current_bar.high_price - previous_close),
                     std::abs(current_bar.low_price - previous_close)});
}

double compute_typical_price(const Bar& bar) {
    return (bar.high_price + bar.low_price + bar.close_price) / 3.0;
}

double compute_rsi_from_averages(double average_gain, double average_loss) {
    if (average_loss == 0.0) {
        return 100.0;
    }
    double relative_strength = average_gain / average_loss;
    return std::clamp(100.0 - 100.0 / (1.0 + relative_strength), 0.0, 100.0);
}

/**
 * Computes a group of indicators that share one calculation and stores them under their names.
 * Insufficient history leaves every name of the group out of the set and records the omission.
 */
void add_indicator_group(IndicatorSet& indicator_set, const std::vector<std::string>& indicator_names, int required_bars,
                         int available_bars, const std::function<std::vector<IndicatorSeries>()>& compute_function) {
    try {
        std::vector<IndicatorSeries> computed_series = compute_function();
        for (size_t name_index = 0; name_index < indicator_names.size() && name_index < computed_series.size(); ++name_index) {
            indicator_set.series[indicator_names[name_index]] = std::move(computed_series[name_index]);
        }
    } catch (const DataInsufficientError& insufficient_data_error) {
        for (const std::string& indicator_name : indicator_names) {
            indicator_set.omitted.emplace_back(indicator_name, required_bars, available_bars);
        }
        log_message("INDICATORS: omitted - " + std::string(insufficient_data_error.what()), "");
    }
}

} // anonymous namespace

// ========================================================================
// MOVING AVERAGES
// ========================================================================

IndicatorSeries compute_sma(const std::vector<double>& values, int period) {
    require_minimum_bars(get_sma_indicator_name(period), values.size(), period);

    IndicatorSeries sma_values(values.size());
    RollingSum rolling_sum(period);
    for (size_t bar_index = 0; bar_index < values.size(); ++bar_index) {
        rolling_sum.push(values[bar_index]);
        if (rolling_sum.full()) {
            sma_values[bar_index] = rolling_sum.mean();
        }
    }
    return sma_values;
}

IndicatorSeries compute_ema(const std::vector<double>& values, int period) {
    require_minimum_bars(get_ema_indicator_name(period), values.size(), period);

    IndicatorSeries ema_values(values.size());
    ExponentialAverage exponential_average(period);
    for (size_t bar_index = 0; bar_index < values.size(); ++bar_index) {
        ema_values[bar_index] = exponential_average.push(values[bar_index]);
    }
    return ema_values;
}

IndicatorSeries compute_wma(const std::vector<double>& values, int period) {
    require_minimum_bars(get_wma_indicator_name(period), values.size(), period);

    IndicatorSeries wma_values(values.size());
    double weight_denominator = static_cast<double>(period) * (period + 1) / 2.0;
    double weighted_sum = 0.0;
    double window_sum = 0.0;
    for (int bar_index = 0; bar_index < period; ++bar_index) {
        weighted_sum += (bar_index + 1) * values[bar_index];
        window_sum += values[bar_index];
    }
    wma_values[period - 1] = weighted_sum / weight_denominator;

    // Shifting the window lowers every weight by one and adds the newest value at full weight
    for (size_t bar_index = period; bar_index < values.size(); ++bar_index) {
        weighted_sum = weighted_sum + period * values[bar_index] - window_sum;
        window_sum = window_sum + values[bar_index] - values[bar_index - period];
        wma_values[bar_index] = weighted_sum / weight_denominator;
    }
    return wma_values;
}

// ========================================================================
// MOMENTUM OSCILLATORS
// ========================================================================

IndicatorSeries compute_rsi(const std::vector<double>& closes, int period) {
    require_minimum_bars("RSI", closes.size(), period + 1);

    IndicatorSeries rsi_values(closes.size());
    WilderAverage gain_average(period);
    WilderAverage loss_average(period);
    for (size_t bar_index = 1; bar_index < closes.size(); ++bar_index) {
        double price_change = closes[bar_index] - closes[bar_index - 1];
        std::optional<double> average_gain = gain_average.push(std::max(price_change, 0.0));
        std::optional<double> average_loss = loss_average.push(std::max(-price_change, 0.0));
        if (average_gain && average_loss) {
            rsi_values[bar_index] = compute_rsi_from_averages(*average_gain, *average_loss);
        }
    }
    return rsi_values;
}

int get_macd_minimum_bars(int slow_period, int signal_period) {
    return slow_period + signal_period - 1;
}

MacdSeries compute_macd(const std::vector<double>& closes, int fast_period, int slow_period, int signal_period) {
    require_minimum_bars("MACD", closes.size(), get_macd_minimum_bars(slow_period, signal_period));

    MacdSeries macd_series;
    macd_series.macd_line.resize(closes.size());
    macd_series.signal_line.resize(closes.size());
    macd_series.histogram.resize(closes.size());

    ExponentialAverage fast_average(fast_period);
    ExponentialAverage slow_average(slow_period);
    ExponentialAverage signal_average(signal_period);
    for (size_t bar_index = 0; bar_index < closes.size(); ++bar_index) {
        std::optional<double> fast_value = fast_average.push(closes[bar_index]);
        std::optional<double> slow_value = slow_average.push(closes[bar_index]);
        if (!fast_value || !slow_value) continue;

        double macd_value = *fast_value - *slow_value;
        macd_series.macd_line[bar_index] = macd_value;
        std::optional<double> signal_value = signal_average.push(macd_value);
        if (signal_value) {
            macd_series.signal_line[bar_index] = signal_value;
            macd_series.histogram[bar_index] = macd_value - *signal_value;
        }
    }
    return macd_series;
}

StochasticSeries compute_stochastic(const Series& series, int k_period, int d_period) {
    require_minimum_bars("STOCH_K", series.size(), k_period);

    StochasticSeries stochastic_series;
    stochastic_series.percent_k.resize(series.size());
    stochastic_series.percent_d.resize(series.size());

    RollingExtremum highest_high(k_period, true);
    RollingExtremum lowest_low(k_period, false);
    RollingSum percent_k_sum(d_period);
    for (size_t bar_index = 0; bar_index < series.size(); ++bar_index) {
        const Bar& bar = series.at(bar_index);
        highest_high.push(bar.high_price);
        lowest_low.push(bar.low_price);
        if (!highest_high.full()) continue;

        double price_range = highest_high.value() - lowest_low.value();
        double percent_k = price_range > 0.0 ? 100.0 * (bar.close_price - lowest_low.value()) / price_range : 50.0;
        stochastic_series.percent_k[bar_index] = percent_k;
        percent_k_sum.push(percent_k);
        if (percent_k_sum.full()) {
            stochastic_series.percent_d[bar_index] = percent_k_sum.mean();
        }
    }
    return stochastic_series;
}

IndicatorSeries compute_williams_r(const Series& series, int period) {
    require_minimum_bars("WILLIAMS_R", series.size(), period);

    IndicatorSeries williams_values(series.size());
    RollingExtremum highest_high(period, true);
    RollingExtremum lowest_low(period, false);
    for (size_t bar_index = 0; bar_index < series.size(); ++bar_index) {
        const Bar& bar = series.at(bar_index);
        highest_high.push(bar.high_price);
        lowest_low.push(bar.low_price);
        if (!highest_high.full()) continue;

        double price_range = highest_high.value() - lowest_low.value();
        williams_values[bar_index] = price_range > 0.0 ? -100.0 * (highest_high.value() - bar.close_price) / price_range : -50.0;
    }
    return williams_values;
}

IndicatorSeries compute_roc(const std::vector<double>& closes, int period) {
    require_minimum_bars("ROC", closes.size(), period + 1);

    IndicatorSeries roc_values(closes.size());
    for (size_t bar_index = period; bar_index < closes.size(); ++bar_index) {
        double base_close = closes[bar_index - period];
        if (base_close != 0.0) {
            roc_values[bar_index] = 100.0 * (closes[bar_index] - base_close) / base_close;
        }
    }
    return roc_values;
}

IndicatorSeries compute_momentum(const std::vector<double>& closes, int period) {
    require_minimum_bars("MOMENTUM", closes.size(), period + 1);

    IndicatorSeries momentum_values(closes.size());
    for (size_t bar_index = period; bar_index < closes.size(); ++bar_index) {
        momentum_values[bar_index] = closes[bar_index] - closes[bar_index - period];
    }
    return momentum_values;
}

IndicatorSeries compute_cci(const Series& series, int period, double cci_constant) {
    require_minimum_bars("CCI", series.size(), period);

    IndicatorSeries cci_values(series.size());
    RollingMeanVariance typical_price_window(period);
    for (size_t bar_index = 0; bar_index < series.size(); ++bar_index) {
        double typical_price = compute_typical_price(series.at(bar_index));
        typical_price_window.push(typical_price);
        if (!typical_price_window.full()) continue;

        double typical_price_mean = typical_price_window.mean();
        double absolute_deviation_sum = 0.0;
        for (double window_value : typical_price_window.values()) {
            absolute_deviation_sum += std::abs(window_value - typical_price_mean);
        }
        double mean_deviation = absolute_deviation_sum / period;
        cci_values[bar_index] = mean_deviation > 0.0 ? (typical_price - typical_price_mean) / (cci_constant * mean_deviation) : 0.0;
    }
    return cci_values;
}

// ========================================================================
// VOLATILITY AND TREND
// ========================================================================

BollingerSeries compute_bollinger_bands(const std::vector<double>& closes, int period, double stddev_multiplier) {
    require_minimum_bars("BBANDS", closes.size(), period);

    BollingerSeries bollinger_series;
    bollinger_series.upper_band.resize(closes.size());
    bollinger_series.middle_band.resize(closes.size());
    bollinger_series.lower_band.resize(closes.size());
    bollinger_series.band_width.resize(closes.size());
    bollinger_series.percent_position.resize(closes.size());

    RollingMeanVariance close_window(period);
    for (size_t bar_index = 0; bar_index < closes.size(); ++bar_index) {
        close_window.push(closes[bar_index]);
        if (!close_window.full()) continue;

        double middle_value = close_window.mean();
        double band_offset = stddev_multiplier * close_window.standard_deviation();
        double upper_value = middle_value + band_offset;
        double lower_value = middle_value - band_offset;
        bollinger_series.upper_band[bar_index] = upper_value;
        bollinger_series.middle_band[bar_index] = middle_value;
        bollinger_series.lower_band[bar_index] = lower_value;

        if (middle_value != 0.0) {
            bollinger_series.band_width[bar_index] = (upper_value - lower_value) / middle_value;
        }
        if (upper_value > lower_value) {
            bollinger_series.percent_position[bar_index] = (closes[bar_index] - lower_value) / (upper_value - lower_value);
        }
    }
    return bollinger_series;
}

IndicatorSeries compute_atr(const Series& series, int period) {
    require_minimum_bars("ATR", series.size(), period + 1);

    IndicatorSeries atr_values(series.size());
    WilderAverage true_range_average(period);
    for (size_t bar_index = 1; bar_index < series.size(); ++bar_index) {
        atr_values[bar_index] = true_range_average.push(compute_true_range(series, bar_index));
    }
    return atr_values;
}

int get_adx_minimum_bars(int period) {
    return 2 * period;
}

DirectionalMovementSeries compute_directional_movement(const Series& series, int period) {
    require_minimum_bars("PLUS_DI/MINUS_DI", series.size(), period + 1);

    DirectionalMovementSeries directional_series;
    directional_series.adx.resize(series.size());
    directional_series.plus_di.resize(series.size());
    directional_series.minus_di.resize(series.size());

    WilderAverage true_range_average(period);
    WilderAverage plus_movement_average(period);
    WilderAverage minus_movement_average(period);
    WilderAverage directional_index_average(period);
    for (size_t bar_index = 1; bar_index < series.size(); ++bar_index) {
        const Bar& current_bar = series.at(bar_index);
        const Bar& previous_bar = series.at(bar_index - 1);
        double upward_move = current_bar.high_price - previous_bar.high_price;
        double downward_move = previous_bar.low_price - current_bar.low_price;
        double plus_movement = (upward_move > downward_move && upward_move > 0.0) ? upward_move : 0.0;
        double minus_movement = (downward_move > upward_move && downward_move > 0.0) ? downward_move : 0.0;

        std::optional<double> average_true_range = true_range_average.push(compute_true_range(series, bar_index));
        std::optional<double> average_plus_movement = plus_movement_average.push(plus_movement);
        std::optional<double> average_minus_movement = minus_movement_average.push(minus_movement);
        if (!average_true_range || !average_plus_movement || !average_minus_movement) continue;

        double plus_di = *average_true_range > 0.0 ? 100.0 * *average_plus_movement / *average_true_range : 0.0;
        double minus_di = *average_true_range > 0.0 ? 100.0 * *average_minus_movement / *average_true_range : 0.0;
        directional_series.plus_di[bar_index] = plus_di;
        directional_series.minus_di[bar_index] = minus_di;

        double directional_sum = plus_di + minus_di;
        double directional_index = directional_sum > 0.0 ? 100.0 * std::abs(plus_di - minus_di) / directional_sum : 0.0;
        directional_series.adx[bar_index] = directional_index_average.push(directional_index);
    }
    return directional_series;
}

IndicatorSeries compute_parabolic_sar(const Series& series, double acceleration_step, double acceleration_maximum) {
    require_minimum_bars("PSAR", series.size(), 2);

    IndicatorSeries sar_values(series.size());
    const std::vector<double>& highs = series.highs();
    const std::vector<double>& lows = series.lows();

    bool is_long_trend = series.at(1).close_price >= series.at(0).close_price;
    double acceleration_factor = acceleration_step;
    double extreme_point = is_long_trend ? std::max(highs[0], highs[1]) : std::min(lows[0], lows[1]);
    double stop_and_reverse = is_long_trend ? std::min(lows[0], lows[1]) : std::max(highs[0], highs[1]);
    sar_values[1] = stop_and_reverse;

    for (size_t bar_index = 2; bar_index < series.size(); ++bar_index) {
        double next_sar = stop_and_reverse + acceleration_factor * (extreme_point - stop_and_reverse);
        if (is_long_trend) {
            // SAR may not rise into the prior two lows
            next_sar = std::min({next_sar, lows[bar_index - 1], lows[bar_index - 2]});
            if (lows[bar_index] < next_sar) {
                is_long_trend = false;
                next_sar = extreme_point;
                extreme_point = lows[bar_index];
                acceleration_factor = acceleration_step;
            } else if (highs[bar_index] > extreme_point) {
                extreme_point = highs[bar_index];
                acceleration_factor = std::min(acceleration_factor + acceleration_step, acceleration_maximum);
            }
        } else {
            next_sar = std::max({next_sar, highs[bar_index - 1], highs[bar_index - 2]});
            if (highs[bar_index] > next_sar) {
                is_long_trend = true;
                next_sar = extreme_point;
                extreme_point = highs[bar_index];
                acceleration_factor = acceleration_step;
            } else if (lows[bar_index] < extreme_point) {
                extreme_point = lows[bar_index];
                acceleration_factor = std::min(acceleration_factor + acceleration_step, acceleration_maximum);
            }
        }
        sar_values[bar_index] = next_sar;
        stop_and_reverse = next_sar;
    }
    return sar_values;
}

// ========================================================================
// VOLUME
// ========================================================================

IndicatorSeries compute_obv(const Series& series) {
    require_minimum_bars("OBV", series.size(), 1);

    IndicatorSeries obv_values(series.size());
    double on_balance_volume = 0.0;
    obv_values[0] = on_balance_volume;
    for (size_t bar_index = 1; bar_index < series.size(); ++bar_index) {
        double close_change = series.at(bar_index).close_price - series.at(bar_index - 1).close_price;
        if (close_change > 0.0) {
            on_balance_volume += series.at(bar_index).volume;
        } else if (close_change < 0.0) {
            on_balance_volume -= series.at(bar_index).volume;
        }
        obv_values[bar_index] = on_balance_volume;
    }
    return obv_values;
}

IndicatorSeries compute_vwap(const Series& series) {
    require_minimum_bars("VWAP", series.size(), 1);

    IndicatorSeries vwap_values(series.size());
    double cumulative_price_volume = 0.0;
    double cumulative_volume = 0.0;
    for (size_t bar_index = 0; bar_index < series.size(); ++bar_index) {
        const Bar& bar = series.at(bar_index);
        cumulative_price_volume += compute_typical_price(bar) * bar.volume;
        cumulative_volume += bar.volume;
        if (cumulative_volume > 0.0) {
            vwap_values[bar_index] = cumulative_price_volume / cumulative_volume;
        }
    }
    return vwap_values;
}

IndicatorSeries compute_mfi(const Series& series, int period) {
    require_minimum_bars("MFI", series.size(), period + 1);

    IndicatorSeries mfi_values(series.size());
    RollingSum positive_flow_sum(period);
    RollingSum negative_flow_sum(period);
    for (size_t bar_index = 1; bar_index < series.size(); ++bar_index) {
        double typical_price = compute_typical_price(series.at(bar_index));
        double previous_typical_price = compute_typical_price(series.at(bar_index - 1));
        double raw_money_flow = typical_price * series.at(bar_index).volume;
        positive_flow_sum.push(typical_price > previous_typical_price ? raw_money_flow : 0.0);
        negative_flow_sum.push(typical_price < previous_typical_price ? raw_money_flow : 0.0);
        if (!positive_flow_sum.full()) continue;

        if (negative_flow_sum.sum() == 0.0) {
            mfi_values[bar_index] = positive_flow_sum.sum() == 0.0 ? 50.0 : 100.0;
        } else {
            double money_ratio = positive_flow_sum.sum() / negative_flow_sum.sum();
            mfi_values[bar_index] = 100.0 - 100.0 / (1.0 + money_ratio);
        }
    }
    return mfi_values;
}

// ========================================================================
// INDICATOR SET
// ========================================================================

std::string get_sma_indicator_name(int period) {
    return "SMA_" + std::to_string(period);
}

std::string get_ema_indicator_name(int period) {
    return "EMA_" + std::to_string(period);
}

std::string get_wma_indicator_name(int period) {
    return "WMA_" + std::to_string(period);
}

std::string get_volume_sma_indicator_name(int period) {
    return "VOLUME_SMA_" + std::to_string(period);
}

IndicatorSet compute_indicators(const Series& series, const IndicatorConfig& config) {
    IndicatorSet indicator_set;
    int available_bars = static_cast<int>(series.size());
    const std::vector<double>& closes = series.closes();

    for (int sma_period : config.sma_periods) {
        add_indicator_group(indicator_set, {get_sma_indicator_name(sma_period)}, sma_period, available_bars,
                            [&]() { return std::vector<IndicatorSeries>{compute_sma(closes, sma_period)}; });
    }
    for (int ema_period : config.ema_periods) {
        add_indicator_group(indicator_set, {get_ema_indicator_name(ema_period)}, ema_period, available_bars,
                            [&]() { return std::vector<IndicatorSeries>{compute_ema(closes, ema_period)}; });
    }
    add_indicator_group(indicator_set, {get_wma_indicator_name(config.wma_period)}, config.wma_period, available_bars,
                        [&]() { return std::vector<IndicatorSeries>{compute_wma(closes, config.wma_period)}; });

    add_indicator_group(indicator_set, {"RSI"}, config.rsi_period + 1, available_bars,
                        [&]() { return std::vector<IndicatorSeries>{compute_rsi(closes, config.rsi_period)}; });

    add_indicator_group(indicator_set, {"MACD", "MACD_SIGNAL", "MACD_HISTOGRAM"},
                        get_macd_minimum_bars(config.macd_slow_period, config.macd_signal_period), available_bars, [&]() {
        MacdSeries macd_series = compute_macd(closes, config.macd_fast_period, config.macd_slow_period, config.macd_signal_period);
        return std::vector<IndicatorSeries>{macd_series.macd_line, macd_series.signal_line, macd_series.histogram};
    });

    add_indicator_group(indicator_set, {"BB_UPPER", "BB_MIDDLE", "BB_LOWER", "BB_WIDTH", "BB_POSITION"},
                        config.bollinger_period, available_bars, [&]() {
        BollingerSeries bollinger_series = compute_bollinger_bands(closes, config.bollinger_period, config.bollinger_stddev_multiplier);
        return std::vector<IndicatorSeries>{bollinger_series.upper_band, bollinger_series.middle_band, bollinger_series.lower_band,
                                            bollinger_series.band_width, bollinger_series.percent_position};
    });

    // %D needs d_period values of %K, so it can be missing while %K is present
    int stochastic_d_minimum_bars = config.stochastic_k_period + config.stochastic_d_period - 1;
    add_indicator_group(indicator_set, {"STOCH_K"}, config.stochastic_k_period, available_bars, [&]() {
        return std::vector<IndicatorSeries>{compute_stochastic(series, config.stochastic_k_period, config.stochastic_d_period).percent_k};
    });
    add_indicator_group(indicator_set, {"STOCH_D"}, stochastic_d_minimum_bars, available_bars, [&]() {
        require_minimum_bars("STOCH_D", series.size(), stochastic_d_minimum_bars);
        return std::vector<IndicatorSeries>{compute_stochastic(series, config.stochastic_k_period, config.stochastic_d_period).percent_d};
    });

    add_indicator_group(indicator_set, {"WILLIAMS_R"}, config.williams_r_period, available_bars,
                        [&]() { return std::vector<IndicatorSeries>{compute_williams_r(series, config.williams_r_period)}; });

    add_indicator_group(indicator_set, {"ATR"}, config.atr_period + 1, available_bars,
                        [&]() { return std::vector<IndicatorSeries>{compute_atr(series, config.atr_period)}; });

    add_indicator_group(indicator_set, {"PLUS_DI", "MINUS_DI"}, config.adx_period + 1, available_bars, [&]() {
        DirectionalMovementSeries directional_series = compute_directional_movement(series, config.adx_period);
        return std::vector<IndicatorSeries>{directional_series.plus_di, directional_series.minus_di};
    });
    add_indicator_group(indicator_set, {"ADX"}, get_adx_minimum_bars(config.adx_period), available_bars, [&]() {
        require_minimum_bars("ADX", series.size(), get_adx_minimum_bars(config.adx_period));
        return std::vector<IndicatorSeries>{compute_directional_movement(series, config.adx_period).adx};
    });

    add_indicator_group(indicator_set, {"PSAR"}, 2, available_bars, [&]() {
        return std::vector<IndicatorSeries>{compute_parabolic_sar(series, config.psar_acceleration_step, config.psar_acceleration_maximum)};
    });

    add_indicator_group(indicator_set, {"OBV"}, 1, available_bars,
                        [&]() { return std::vector<IndicatorSeries>{compute_obv(series)}; });
    add_indicator_group(indicator_set, {"VWAP"}, 1, available_bars,
                        [&]() { return std::vector<IndicatorSeries>{compute_vwap(series)}; });
    add_indicator_group(indicator_set, {"MFI"}, config.mfi_period + 1, available_bars,
                        [&]() { return std::vector<IndicatorSeries>{compute_mfi(series, config.mfi_period)}; });
    add_indicator_group(indicator_set, {"ROC"}, config.roc_period + 1, available_bars,
                        [&]() { return std::vector<IndicatorSeries>{compute_roc(closes, config.roc_period)}; });
    add_indicator_group(indicator_set, {"MOMENTUM"}, config.momentum_period + 1, available_bars,
                        [&]() { return std::vector<IndicatorSeries>{compute_momentum(closes, config.momentum_period)}; });
    add_indicator_group(indicator_set, {"CCI"}, config.cci_period, available_bars,
                        [&]() { return std::vector<IndicatorSeries>{compute_cci(series, config.cci_period, config.cci_constant)}; });
    add_indicator_group(indicator_set, {get_volume_sma_indicator_name(config.volume_average_period)}, config.volume_average_period, available_bars,
                        [&]() { return std::vector<IndicatorSeries>{compute_sma(series.volumes(), config.volume_average_period)}; });

    return indicator_set;
}

} // namespace Core
} // namespace StockAdvisor
