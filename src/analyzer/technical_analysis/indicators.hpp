#ifndef INDICATORS_HPP
#define INDICATORS_HPP

#include <string>
#include <vector>
#include "configs/indicator_config.hpp"
#include "analyzer/data_structures/data_structures.hpp"
#include "analyzer/market_data/series.hpp"

using StockAdvisor::Config::IndicatorConfig;

namespace StockAdvisor {
namespace Core {

// ========================================================================
// MULTI-LINE INDICATOR RESULTS
// ========================================================================

struct MacdSeries {
    IndicatorSeries macd_line;
    IndicatorSeries signal_line;
    IndicatorSeries histogram;
};

struct BollingerSeries {
    IndicatorSeries upper_band;
    IndicatorSeries middle_band;
    IndicatorSeries lower_band;
    IndicatorSeries band_width;
    IndicatorSeries percent_position;
};

struct StochasticSeries {
    IndicatorSeries percent_k;
    IndicatorSeries percent_d;
};

struct DirectionalMovementSeries {
    IndicatorSeries adx;
    IndicatorSeries plus_di;
    IndicatorSeries minus_di;
};

// ========================================================================
// INDIVIDUAL INDICATORS
// Each returns one slot per input bar and throws DataInsufficientError when the
// input is shorter than the indicator's minimum lookback.
// ========================================================================

IndicatorSeries compute_sma(const std::vector<double>& values, int period);
IndicatorSeries compute_ema(const std::vector<double>& values, int period);
IndicatorSeries compute_wma(const std::vector<double>& values, int period);
IndicatorSeries compute_rsi(const std::vector<double>& closes, int period);
MacdSeries compute_macd(const std::vector<double>& closes, int fast_period, int slow_period, int signal_period);
BollingerSeries compute_bollinger_bands(const std::vector<double>& closes, int period, double stddev_multiplier);
StochasticSeries compute_stochastic(const Series& series, int k_period, int d_period);
IndicatorSeries compute_williams_r(const Series& series, int period);
IndicatorSeries compute_atr(const Series& series, int period);
DirectionalMovementSeries compute_directional_movement(const Series& series, int period);
IndicatorSeries compute_parabolic_sar(const Series& series, double acceleration_step, double acceleration_maximum);
IndicatorSeries compute_obv(const Series& series);
IndicatorSeries compute_vwap(const Series& series);
IndicatorSeries compute_mfi(const Series& series, int period);
IndicatorSeries compute_roc(const std::vector<double>& closes, int period);
IndicatorSeries compute_momentum(const std::vector<double>& closes, int period);
IndicatorSeries compute_cci(const Series& series, int period, double cci_constant);

// Minimum bars before each multi-bar indicator has its first value
int get_macd_minimum_bars(int slow_period, int signal_period);
int get_adx_minimum_bars(int period);

// Indicator names used as IndicatorSet keys
std::string get_sma_indicator_name(int period);
std::string get_ema_indicator_name(int period);
std::string get_wma_indicator_name(int period);
std::string get_volume_sma_indicator_name(int period);

/**
 * Computes the full configured indicator set. An indicator whose lookback exceeds the
 * series length is left out of the set and listed in IndicatorSet::omitted.
 */
IndicatorSet compute_indicators(const Series& series, const IndicatorConfig& config);

} // namespace Core
} // namespace StockAdvisor

#endif // INDICATORS_HPP
