#include "analysis_engine.hpp"
#include "analyzer/data_structures/analysis_errors.hpp"
#include "analyzer/technical_analysis/indicators.hpp"
#include "analyzer/technical_analysis/pattern_recognizer.hpp"
#include "analyzer/technical_analysis/level_detector.hpp"
#include "analyzer/technical_analysis/signal_synthesizer.hpp"
#include "analyzer/fundamental_analysis/fundamental_scorer.hpp"
#include "analyzer/fundamental_analysis/fundamental_report.hpp"
#include "analyzer/fundamental_analysis/peer_comparison.hpp"
#include "analyzer/fundamental_analysis/valuation_models.hpp"
#include "analyzer/recommendation/recommendation_aggregator.hpp"
#include "logging/logger/logging_macros.hpp"
#include "logging/logs/analysis_logs.hpp"
#include <chrono>
#include <future>

namespace StockAdvisor {
namespace Core {

using StockAdvisor::Logging::log_message;
using StockAdvisor::Logging::AnalysisLogs;

// Patterns listed individually in the console summary
constexpr size_t MAX_LOGGED_PATTERNS = 12;

PriceSummary summarize_prices(const Series& series) {
    PriceSummary price_summary;
    if (series.empty()) {
        return price_summary;
    }

    const Bar& last_bar = series.back();
    price_summary.last_close = last_bar.close_price;
    price_summary.last_volume = last_bar.volume;
    price_summary.bar_count = series.size();
    price_summary.first_timestamp = series.at(0).timestamp;
    price_summary.last_timestamp = last_bar.timestamp;

    if (series.size() >= 2) {
        double previous_close = series.at(series.size() - 2).close_price;
        price_summary.change = last_bar.close_price - previous_close;
        if (previous_close != 0.0) {
            price_summary.change_percent = *price_summary.change / previous_close * 100.0;
        }
    }
    return price_summary;
}

AnalysisEngine::AnalysisEngine(const SystemConfig& system_config) : config(system_config) {}

// ========================================================================
// BRANCHES
// ========================================================================

TechnicalAnalysis AnalysisEngine::run_technical_analysis(const Series& series) const {
    TechnicalAnalysis technical_analysis;
    technical_analysis.indicators = compute_indicators(series, config.indicators);
    technical_analysis.patterns = recognize_patterns(series, config.patterns);
    technical_analysis.levels = detect_levels(series, technical_analysis.indicators, config.levels);
    technical_analysis.signals = synthesize_signals(series, technical_analysis.indicators, technical_analysis.patterns,
                                                    technical_analysis.levels, config.signals);
    return technical_analysis;
}

FundamentalAnalysis AnalysisEngine::run_fundamental_analysis(const std::optional<FundamentalRecord>& record,
                                                             const std::vector<FundamentalRecord>& peer_records,
                                                             const std::string& fundamentals_unavailable_reason) const {
    FundamentalAnalysis fundamental_analysis;
    if (!record) {
        fundamental_analysis.unavailable_reason = fundamentals_unavailable_reason;
        return fundamental_analysis;
    }

    fundamental_analysis.available = true;
    fundamental_analysis.record = *record;
    fundamental_analysis.scores = score_fundamentals(*record, config.fundamentals);
    fundamental_analysis.report = build_fundamental_report(*record, fundamental_analysis.scores, config.fundamentals);
    fundamental_analysis.valuations = run_valuation_models(*record, config.valuation);
    if (!peer_records.empty()) {
        fundamental_analysis.peer_comparison = compare_with_peers(*record, peer_records);
    }

    log_message("FUNDAMENTALS: " + record->symbol + " scored, " + std::to_string(peer_records.size()) + " peers compared", "");
    return fundamental_analysis;
}

// ========================================================================
// REQUESTS
// ========================================================================

AnalysisResult AnalysisEngine::analyze(const AnalysisRequest& request, const Series& series,
                                       const std::optional<FundamentalRecord>& record,
                                       const std::vector<FundamentalRecord>& peer_records,
                                       const std::string& fundamentals_unavailable_reason) const {
    if (series.empty()) {
        throw DataInsufficientError("No price history for " + request.symbol);
    }

    Logging::LoggingContext* parent_logging_context = Logging::has_logging_context() ? Logging::get_logging_context() : nullptr;
    std::future<FundamentalAnalysis> fundamental_future = std::async(std::launch::async,
        [this, parent_logging_context, &record, &peer_records, &fundamentals_unavailable_reason]() {
            if (!parent_logging_context) {
                return run_fundamental_analysis(record, peer_records, fundamentals_unavailable_reason);
            }
            Logging::ScopedThreadTag fundamental_thread_tag(*parent_logging_context, "FUNDA ");
            return run_fundamental_analysis(record, peer_records, fundamentals_unavailable_reason);
        });

    AnalysisResult analysis_result;
    analysis_result.symbol = request.symbol;
    analysis_result.period = request.period;
    analysis_result.interval = request.interval;
    analysis_result.price_summary = summarize_prices(series);
    analysis_result.bar_timestamps.reserve(series.size());
    for (const Bar& bar : series.bars()) {
        analysis_result.bar_timestamps.push_back(bar.timestamp);
    }

    // A std::async future joins its worker on destruction, so the captured references
    // outlive the task even when the technical branch throws.
    analysis_result.technical = run_technical_analysis(series);
    analysis_result.fundamental = fundamental_future.get();

    std::optional<double> fundamental_composite;
    if (analysis_result.fundamental.available) {
        fundamental_composite = analysis_result.fundamental.scores.composite;
    }
    analysis_result.recommendation = aggregate_recommendation(analysis_result.technical.signals, fundamental_composite,
                                                              config.signals, config.recommendation);

    log_analysis_tables(analysis_result);
    return analysis_result;
}

AnalysisResult AnalysisEngine::analyze(const API::MarketDataProviderInterface& provider, const AnalysisRequest& request) const {
    std::chrono::steady_clock::time_point request_start = std::chrono::steady_clock::now();
    AnalysisLogs::log_analysis_request(request.symbol, request.period, request.interval);

    Series series = provider.fetch_series(request.symbol, request.period, request.interval);
    AnalysisLogs::log_series_summary(provider.get_provider_name(), series, summarize_prices(series));

    std::optional<FundamentalRecord> record;
    std::string fundamentals_unavailable_reason;
    try {
        record = provider.fetch_fundamentals(request.symbol);
    } catch (const AnalysisError& fundamentals_error) {
        fundamentals_unavailable_reason = fundamentals_error.what();
        AnalysisLogs::log_fundamentals_unavailable(request.symbol, fundamentals_unavailable_reason);
    }

    std::vector<FundamentalRecord> peer_records;
    if (record) {
        for (const std::string& peer_symbol : request.peer_symbols) {
            if (peer_symbol == request.symbol) continue;
            try {
                peer_records.push_back(provider.fetch_fundamentals(peer_symbol));
            } catch (const AnalysisError& peer_error) {
                AnalysisLogs::log_peer_skipped(peer_symbol, peer_error.what());
            }
        }
    }

    AnalysisResult analysis_result = analyze(request, series, record, peer_records, fundamentals_unavailable_reason);

    long elapsed_milliseconds = static_cast<long>(std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - request_start).count());
    AnalysisLogs::log_analysis_complete(request.symbol, elapsed_milliseconds);
    return analysis_result;
}

void AnalysisEngine::log_analysis_tables(const AnalysisResult& result) const {
    LOG_THREAD_TECHNICAL_HEADER(result.symbol);
    AnalysisLogs::log_indicator_table(result.technical.indicators, config);
    AnalysisLogs::log_pattern_summary(result.technical.patterns, MAX_LOGGED_PATTERNS);
    AnalysisLogs::log_level_summary(result.technical.levels);
    AnalysisLogs::log_signal_table(result.technical.signals);
    LOG_THREAD_SECTION_FOOTER();

    LOG_THREAD_FUNDAMENTAL_HEADER(result.symbol);
    if (result.fundamental.available) {
        AnalysisLogs::log_category_table(result.fundamental.scores, result.fundamental.report);
        AnalysisLogs::log_valuation_table(result.fundamental.valuations);
        if (result.fundamental.peer_comparison) {
            AnalysisLogs::log_peer_comparison(*result.fundamental.peer_comparison);
        }
    } else {
        LOG_THREAD_CONTENT("Unavailable: " + result.fundamental.unavailable_reason);
    }
    LOG_THREAD_SECTION_FOOTER();

    AnalysisLogs::log_recommendation_summary(result.symbol, result.recommendation);
}

} // namespace Core
} // namespace StockAdvisor
