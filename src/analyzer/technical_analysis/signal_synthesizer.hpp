#ifndef SIGNAL_SYNTHESIZER_HPP
#define SIGNAL_SYNTHESIZER_HPP

#include <optional>
#include <string>
#include <vector>
#include "configs/signal_config.hpp"
#include "analyzer/data_structures/data_structures.hpp"
#include "analyzer/market_data/series.hpp"

using StockAdvisor::Config::SignalConfig;

namespace StockAdvisor {
namespace Core {

// Everything a signal rule may read.
struct SignalContext {
    const Series& series;
    const IndicatorSet& indicators;
    const std::vector<Pattern>& patterns;
    const std::vector<PriceLevel>& levels;
    const SignalConfig& config;

    SignalContext(const Series& source_series, const IndicatorSet& indicator_set, const std::vector<Pattern>& pattern_list,
                  const std::vector<PriceLevel>& level_list, const SignalConfig& signal_config)
        : series(source_series), indicators(indicator_set), patterns(pattern_list), levels(level_list), config(signal_config) {}
};

// Returns no signal when the rule's inputs are missing.
using SignalRule = std::optional<TechnicalSignal> (*)(const SignalContext&);

struct SignalRuleEntry {
    const char* family_name;
    SignalRule evaluate;
    double SignalConfig::* weight;
};

// Rule families in evaluation order.
const std::vector<SignalRuleEntry>& get_signal_rule_table();

// Configured weight of a rule family; 0 for an unknown family.
double get_signal_family_weight(const std::string& family_name, const SignalConfig& config);

/**
 * Evaluates every rule family against the latest bar.
 * A rule that evaluates but does not trigger contributes a neutral signal with strength 0.
 */
std::vector<TechnicalSignal> synthesize_signals(const Series& series, const IndicatorSet& indicators,
                                                const std::vector<Pattern>& patterns,
                                                const std::vector<PriceLevel>& levels,
                                                const SignalConfig& config);

} // namespace Core
} // namespace StockAdvisor

#endif // SIGNAL_SYNTHESIZER_HPP
