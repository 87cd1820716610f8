#ifndef INDICATOR_CONFIG_HPP
#define INDICATOR_CONFIG_HPP

#include <vector>

namespace StockAdvisor {
namespace Config {

struct IndicatorConfig {
    // ========================================================================
    // MOVING AVERAGES
    // ========================================================================

    std::vector<int> sma_periods{5, 10, 20, 50, 100, 200};    // Simple moving average windows
    std::vector<int> ema_periods{12, 26, 50, 200};            // Exponential moving average windows
    int wma_period = 20;                                      // Linearly weighted moving average window

    // ========================================================================
    // MOMENTUM OSCILLATORS
    // ========================================================================

    int rsi_period = 14;                                      // Wilder RSI period
    int macd_fast_period = 12;                                // MACD fast EMA
    int macd_slow_period = 26;                                // MACD slow EMA
    int macd_signal_period = 9;                               // MACD signal line EMA
    int stochastic_k_period = 14;                             // Stochastic %K lookback
    int stochastic_d_period = 3;                              // Stochastic %D smoothing
    int williams_r_period = 14;                               // Williams %R lookback
    int roc_period = 10;                                      // Rate of change lookback
    int momentum_period = 10;                                 // Price momentum lookback
    int cci_period = 20;                                      // Commodity channel index window
    double cci_constant = 0.015;                              // Lambert constant for CCI scaling

    // ========================================================================
    // VOLATILITY AND TREND
    // ========================================================================

    int bollinger_period = 20;                                // Bollinger middle band window
    double bollinger_stddev_multiplier = 2.0;                 // Band distance in standard deviations
    int atr_period = 14;                                      // Average true range period
    int adx_period = 14;                                      // ADX / directional index period
    double psar_acceleration_step = 0.02;                     // Parabolic SAR acceleration increment
    double psar_acceleration_maximum = 0.2;                   // Parabolic SAR acceleration cap

    // ========================================================================
    // VOLUME
    // ========================================================================

    int mfi_period = 14;                                      // Money flow index period
    int volume_average_period = 20;                           // Volume simple moving average window
};

} // namespace Config
} // namespace StockAdvisor

#endif // INDICATOR_CONFIG_HPP
