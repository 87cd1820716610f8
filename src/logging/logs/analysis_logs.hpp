#ifndef ANALYSIS_LOGS_HPP
#define ANALYSIS_LOGS_HPP

#include <optional>
#include <string>
#include <vector>
#include "configs/system_config.hpp"
#include "analyzer/data_structures/data_structures.hpp"
#include "analyzer/market_data/series.hpp"

using StockAdvisor::Config::SystemConfig;

namespace StockAdvisor {
namespace Logging {

/**
 * Console tables for one analysis request.
 * Every method only formats; none of them changes analysis state.
 */
class AnalysisLogs {
public:
    // Request lifecycle
    static void log_analysis_request(const std::string& symbol, const std::string& period, const std::string& interval);
    static void log_series_summary(const std::string& provider_name, const Core::Series& series, const Core::PriceSummary& price_summary);
    static void log_analysis_complete(const std::string& symbol, long elapsed_milliseconds);

    // Technical branch
    static void log_indicator_table(const Core::IndicatorSet& indicators, const SystemConfig& config);
    static void log_omitted_indicators(const Core::IndicatorSet& indicators);
    static void log_pattern_summary(const std::vector<Core::Pattern>& patterns, size_t max_listed_patterns);
    static void log_level_summary(const std::vector<Core::PriceLevel>& levels);
    static void log_signal_table(const std::vector<Core::TechnicalSignal>& signals);

    // Fundamental branch
    static void log_fundamentals_unavailable(const std::string& symbol, const std::string& reason);
    static void log_peer_skipped(const std::string& peer_symbol, const std::string& reason);
    static void log_category_table(const Core::FundamentalScores& scores, const Core::FundamentalReport& report);
    static void log_valuation_table(const std::vector<Core::ValuationEstimate>& valuations);
    static void log_peer_comparison(const Core::PeerComparison& peer_comparison);

    // Outcome
    static void log_recommendation_summary(const std::string& symbol, const Core::Recommendation& recommendation);

private:
    static std::string format_number(double value, int precision);
    static std::string format_optional(const std::optional<double>& value, int precision);
};

} // namespace Logging
} // namespace StockAdvisor

#endif // ANALYSIS_LOGS_HPP
