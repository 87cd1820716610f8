#ifndef PATTERN_CONFIG_HPP
#define PATTERN_CONFIG_HPP

namespace StockAdvisor {
namespace Config {

struct PatternConfig {
    // Candlestick scanning
    int candlestick_scan_bars = 0;                  // Bars scanned from the end of the series (0 = whole series)
    int average_body_lookback = 10;                 // Bars used for the "typical body" reference
    int trend_lookback = 5;                         // Bars used for the prior trend context
    double doji_body_ratio = 0.1;                   // Body / range at or below which a candle is a doji
    double long_body_ratio = 1.3;                   // Body / average body at or above which a body is long
    double short_body_ratio = 0.5;                  // Body / average body at or below which a body is short
    double long_shadow_ratio = 2.0;                 // Shadow / body at or above which a shadow is long
    double equal_price_tolerance = 0.001;           // Relative tolerance for "equal" prices (matching lows, tweezers)

    // Chart pattern geometry
    int extrema_window = 3;                         // Bars on each side for a local extremum
    double min_prominence_pct = 0.02;               // Minimum extremum prominence relative to price
    double shoulder_tolerance = 0.05;               // Max relative height difference between shoulders
    double head_min_excess = 0.01;                  // Head must exceed both shoulders by this fraction
    double neckline_max_slope = 0.005;              // Max neckline slope per bar relative to price
    double double_extreme_tolerance = 0.03;         // Max relative difference between double top/bottom extremes
    int triangle_lookback = 60;                     // Bars searched for triangle / rectangle formation
    double triangle_flat_slope = 0.001;             // Slope per bar (relative to price) treated as flat
    double triangle_min_convergence = 0.2;          // Required narrowing of the channel from first to last touch
};

} // namespace Config
} // namespace StockAdvisor

#endif // PATTERN_CONFIG_HPP
