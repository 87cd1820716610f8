#ifndef LEVEL_CONFIG_HPP
#define LEVEL_CONFIG_HPP

namespace StockAdvisor {
namespace Config {

struct LevelConfig {
    int lookback_bars = 0;                  // Bars searched for extrema (0 = whole series)
    int extrema_window = 3;                 // Bars on each side for a local extremum
    double atr_radius_multiple = 0.5;       // Cluster radius as a multiple of the latest ATR
    double fallback_radius_pct = 0.01;      // Cluster radius relative to last close when ATR is unavailable
    int min_cluster_points = 3;             // Minimum extrema per level
};

} // namespace Config
} // namespace StockAdvisor

#endif // LEVEL_CONFIG_HPP
