#ifndef SIGNAL_CONFIG_HPP
#define SIGNAL_CONFIG_HPP

namespace StockAdvisor {
namespace Config {

struct SignalConfig {
    // ========================================================================
    // RULE THRESHOLDS
    // ========================================================================

    double rsi_oversold = 30.0;                      // RSI below this is a buy
    double rsi_overbought = 70.0;                    // RSI above this is a sell
    double macd_strength_scale = 0.01;               // |histogram| as a fraction of price that maps to full strength
    int ma_fast_period = 20;                         // SMA used as the fast line of the cross
    int ma_slow_period = 50;                         // SMA used as the slow line of the cross
    int ma_trend_period = 200;                       // SMA used for long-term trend context
    double ma_cross_base_strength = 0.6;             // Strength of a cross with no separation
    int volume_average_period = 20;                  // Window of the prior-volume average
    double volume_spike_ratio = 2.0;                 // Volume / prior average that counts as a spike
    double volume_strength_divisor = 5.0;            // Volume ratio that maps to full strength
    int pattern_recency_bars = 3;                    // Patterns ending within this many bars of the end are considered
    double level_proximity_pct = 0.01;               // Distance to a level (relative to price) that counts as "at" the level
    int level_full_strength_touches = 6;             // Touches at which a level contributes full strength

    // ========================================================================
    // FAMILY WEIGHTS
    // ========================================================================

    double rsi_weight = 0.2;
    double macd_weight = 0.25;
    double bollinger_weight = 0.2;
    double moving_average_weight = 0.25;
    double volume_weight = 0.1;
    double pattern_weight = 0.15;
    double level_weight = 0.1;
};

} // namespace Config
} // namespace StockAdvisor

#endif // SIGNAL_CONFIG_HPP
