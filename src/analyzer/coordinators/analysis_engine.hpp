#ifndef ANALYSIS_ENGINE_HPP
#define ANALYSIS_ENGINE_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "configs/system_config.hpp"
#include "analyzer/data_structures/data_structures.hpp"
#include "analyzer/data_structures/fundamental_record.hpp"
#include "analyzer/market_data/series.hpp"
#include "api/general/market_data_provider_interface.hpp"

namespace StockAdvisor {
namespace Core {

using Config::SystemConfig;

struct TechnicalAnalysis {
    IndicatorSet indicators;
    std::vector<Pattern> patterns;
    std::vector<PriceLevel> levels;
    std::vector<TechnicalSignal> signals;
};

struct FundamentalAnalysis {
    bool available;
    std::string unavailable_reason;
    FundamentalRecord record;
    FundamentalScores scores;
    FundamentalReport report;
    std::vector<ValuationEstimate> valuations;
    std::optional<PeerComparison> peer_comparison;

    FundamentalAnalysis() : available(false), unavailable_reason(), record(), scores(), report(), valuations(), peer_comparison() {}
};

struct AnalysisRequest {
    std::string symbol;
    std::string period;
    std::string interval;
    std::vector<std::string> peer_symbols;

    AnalysisRequest() : symbol(), period("1y"), interval("1d"), peer_symbols() {}
    AnalysisRequest(const std::string& symbol_value, const std::string& period_value, const std::string& interval_value)
        : symbol(symbol_value), period(period_value), interval(interval_value), peer_symbols() {}
};

struct AnalysisResult {
    std::string symbol;
    std::string period;
    std::string interval;
    PriceSummary price_summary;
    std::vector<std::int64_t> bar_timestamps;   // Aligned with every indicator series
    TechnicalAnalysis technical;
    FundamentalAnalysis fundamental;
    Recommendation recommendation;
};

// Last close, change against the prior close, last volume and the covered time span.
PriceSummary summarize_prices(const Series& series);

/**
 * Runs one analysis request: technical branch on the calling thread, fundamental
 * branch (scoring, valuation, peers) on a std::async task, then the recommendation.
 * Holds only configuration, so one engine may serve any number of concurrent requests.
 */
class AnalysisEngine {
public:
    explicit AnalysisEngine(const SystemConfig& system_config);

    // Analysis of already loaded inputs. An empty record leaves the fundamental branch
    // unavailable with fundamentals_unavailable_reason.
    AnalysisResult analyze(const AnalysisRequest& request, const Series& series,
                           const std::optional<FundamentalRecord>& record,
                           const std::vector<FundamentalRecord>& peer_records,
                           const std::string& fundamentals_unavailable_reason = "no fundamental record supplied") const;

    // Fetches series, fundamentals and peers from a provider. Series failures propagate;
    // fundamental and peer failures degrade the result.
    AnalysisResult analyze(const API::MarketDataProviderInterface& provider, const AnalysisRequest& request) const;

    TechnicalAnalysis run_technical_analysis(const Series& series) const;
    FundamentalAnalysis run_fundamental_analysis(const std::optional<FundamentalRecord>& record,
                                                 const std::vector<FundamentalRecord>& peer_records,
                                                 const std::string& fundamentals_unavailable_reason) const;

private:
    const SystemConfig& config;

    void log_analysis_tables(const AnalysisResult& result) const;
};

} // namespace Core
} // namespace StockAdvisor

#endif // ANALYSIS_ENGINE_HPP
