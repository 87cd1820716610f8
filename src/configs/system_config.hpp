#ifndef SYSTEM_CONFIG_HPP
#define SYSTEM_CONFIG_HPP

#include "indicator_config.hpp"
#include "pattern_config.hpp"
#include "level_config.hpp"
#include "signal_config.hpp"
#include "fundamental_config.hpp"
#include "valuation_config.hpp"
#include "recommendation_config.hpp"
#include "output_config.hpp"
#include "logging_config.hpp"

namespace StockAdvisor {
namespace Config {

/**
 * Complete analysis engine configuration.
 * Every value carries a default; CSV files under config/ override any subset.
 */
struct SystemConfig {
    // Default constructor - ensures nested structs are properly constructed
    SystemConfig() {}

    IndicatorConfig indicators;             // Indicator periods and multipliers
    PatternConfig patterns;                 // Candlestick and chart pattern tolerances
    LevelConfig levels;                     // Support / resistance clustering
    SignalConfig signals;                   // Technical rule thresholds and family weights
    FundamentalConfig fundamentals;         // Category weights and report thresholds
    ValuationConfig valuation;              // CAPM and DCF / DDM assumptions
    RecommendationConfig recommendation;    // Blend and decision thresholds
    OutputConfig output;                    // Result document shape
    LoggingConfig logging;                  // Logging configuration
};

} // namespace Config
} // namespace StockAdvisor

#endif // SYSTEM_CONFIG_HPP
