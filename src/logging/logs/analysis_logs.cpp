#include "analysis_logs.hpp"
#include "logging/logger/logging_macros.hpp"
#include "utils/time_utils.hpp"
#include <iomanip>
#include <sstream>

namespace StockAdvisor {
namespace Logging {

using namespace StockAdvisor::Core;

// Indicators shown in the latest-value table, in display order
static const std::vector<std::string> INDICATOR_TABLE_ORDER = {
    "RSI", "MACD", "MACD_SIGNAL", "MACD_HISTOGRAM", "BB_UPPER", "BB_MIDDLE", "BB_LOWER",
    "STOCH_K", "STOCH_D", "WILLIAMS_R", "ATR", "ADX", "PLUS_DI", "MINUS_DI", "PSAR",
    "OBV", "VWAP", "MFI", "ROC", "MOMENTUM", "CCI"
};

std::string AnalysisLogs::format_number(double value, int precision) {
    std::ostringstream value_stream;
    value_stream << std::fixed << std::setprecision(precision) << value;
    return value_stream.str();
}

std::string AnalysisLogs::format_optional(const std::optional<double>& value, int precision) {
    if (!value) {
        return "N/A";
    }
    return format_number(*value, precision);
}

// ========================================================================
// REQUEST LIFECYCLE
// ========================================================================

void AnalysisLogs::log_analysis_request(const std::string& symbol, const std::string& period, const std::string& interval) {
    LOG_ANALYSIS_REQUEST_HEADER(symbol, period, interval);
}

void AnalysisLogs::log_series_summary(const std::string& provider_name, const Series& series, const PriceSummary& price_summary) {
    TABLE_HEADER_48("PRICE HISTORY", "Source: " + provider_name);
    TABLE_ROW_48("Bars", std::to_string(series.size()));
    TABLE_ROW_48("First Bar", TimeUtils::format_epoch_seconds_as_iso(price_summary.first_timestamp));
    TABLE_ROW_48("Last Bar", TimeUtils::format_epoch_seconds_as_iso(price_summary.last_timestamp));
    TABLE_SEPARATOR_48();
    TABLE_ROW_48("Last Close", "$" + format_number(price_summary.last_close, 2));
    TABLE_ROW_48("Change", price_summary.change ? "$" + format_number(*price_summary.change, 2) : "N/A");
    TABLE_ROW_48("Change %", price_summary.change_percent ? format_number(*price_summary.change_percent, 2) + "%" : "N/A");
    TABLE_ROW_48("Range", "$" + format_number(series.lowest_low(), 2) + " - $" + format_number(series.highest_high(), 2));
    TABLE_ROW_48("Last Volume", format_number(price_summary.last_volume, 0));
    TABLE_FOOTER_48();
}

void AnalysisLogs::log_analysis_complete(const std::string& symbol, long elapsed_milliseconds) {
    LOG_THREAD_SECTION_HEADER("ANALYSIS COMPLETE - " + symbol);
    LOG_THREAD_CONTENT("Elapsed: " + std::to_string(elapsed_milliseconds) + " ms");
    LOG_THREAD_SECTION_FOOTER();
}

// ========================================================================
// TECHNICAL BRANCH
// ========================================================================

void AnalysisLogs::log_indicator_table(const IndicatorSet& indicators, const SystemConfig& config) {
    if (!config.logging.log_indicator_table) {
        return;
    }

    TABLE_HEADER_48("INDICATORS", "Latest values");
    for (const auto& indicator_entry : indicators.series) {
        const std::string& indicator_name = indicator_entry.first;
        if (indicator_name.rfind("SMA_", 0) == 0 || indicator_name.rfind("EMA_", 0) == 0 || indicator_name.rfind("WMA_", 0) == 0) {
            TABLE_ROW_48(indicator_name, format_optional(indicators.latest(indicator_name), 4));
        }
    }
    TABLE_SEPARATOR_48();
    for (const std::string& indicator_name : INDICATOR_TABLE_ORDER) {
        if (!indicators.contains(indicator_name)) continue;
        TABLE_ROW_48(indicator_name, format_optional(indicators.latest(indicator_name), 4));
    }
    TABLE_FOOTER_48();

    log_omitted_indicators(indicators);
}

void AnalysisLogs::log_omitted_indicators(const IndicatorSet& indicators) {
    if (indicators.omitted.empty()) {
        return;
    }
    LOG_THREAD_SECTION_HEADER("OMITTED INDICATORS");
    for (const OmittedIndicator& omitted_indicator : indicators.omitted) {
        LOG_THREAD_CONTENT(omitted_indicator.name + ": needs " + std::to_string(omitted_indicator.required_bars) +
                           " bars, have " + std::to_string(omitted_indicator.available_bars));
    }
    LOG_THREAD_SECTION_FOOTER();
}

void AnalysisLogs::log_pattern_summary(const std::vector<Pattern>& patterns, size_t max_listed_patterns) {
    LOG_THREAD_SECTION_HEADER("PATTERNS (" + std::to_string(patterns.size()) + " detected)");
    if (patterns.empty()) {
        LOG_THREAD_CONTENT("No patterns detected");
    }
    size_t listed_count = 0;
    for (const Pattern& pattern : patterns) {
        if (listed_count++ >= max_listed_patterns) {
            LOG_THREAD_CONTENT("... " + std::to_string(patterns.size() - max_listed_patterns) + " more");
            break;
        }
        LOG_THREAD_CONTENT(pattern.name + " [" + to_string(pattern.kind) + ", " + to_string(pattern.direction) + "] bars " +
                           std::to_string(pattern.start_index) + "-" + std::to_string(pattern.end_index) +
                           " confidence " + format_number(pattern.confidence, 2));
    }
    LOG_THREAD_SECTION_FOOTER();
}

void AnalysisLogs::log_level_summary(const std::vector<PriceLevel>& levels) {
    TABLE_HEADER_48("LEVELS", std::to_string(levels.size()) + " support / resistance zones");
    for (const PriceLevel& price_level : levels) {
        TABLE_ROW_48(to_string(price_level.kind), "$" + format_number(price_level.price, 2) +
                     "  strength " + std::to_string(price_level.strength));
    }
    TABLE_FOOTER_48();
}

void AnalysisLogs::log_signal_table(const std::vector<TechnicalSignal>& signals) {
    TABLE_HEADER_48("SIGNALS", "Direction / strength");
    for (const TechnicalSignal& technical_signal : signals) {
        TABLE_ROW_48(technical_signal.name, to_string(technical_signal.direction) + "  " + format_number(technical_signal.strength, 2));
    }
    TABLE_FOOTER_48();
    for (const TechnicalSignal& technical_signal : signals) {
        if (technical_signal.is_firing()) {
            LOG_THREAD_CONTENT(technical_signal.name + ": " + technical_signal.rationale);
        }
    }
}

// ========================================================================
// FUNDAMENTAL BRANCH
// ========================================================================

void AnalysisLogs::log_fundamentals_unavailable(const std::string& symbol, const std::string& reason) {
    LOG_THREAD_SECTION_HEADER("FUNDAMENTALS UNAVAILABLE - " + symbol);
    LOG_THREAD_CONTENT("Reason: " + reason);
    LOG_THREAD_CONTENT("Recommendation falls back to technical signals");
    LOG_THREAD_SECTION_FOOTER();
}

void AnalysisLogs::log_peer_skipped(const std::string& peer_symbol, const std::string& reason) {
    log_message("WARNING: Peer " + peer_symbol + " skipped: " + reason, "");
}

void AnalysisLogs::log_category_table(const FundamentalScores& scores, const FundamentalReport& report) {
    TABLE_HEADER_48("FUNDAMENTALS", "Grade " + report.overall_grade + " / " + report.rating);
    for (const CategoryScore& category_score : scores.categories) {
        std::string score_text = category_score.score ? format_number(*category_score.score, 1) + " (" + category_score.grade + ")" : "N/A";
        if (!category_score.missing_metrics.empty()) {
            score_text += "  missing " + std::to_string(category_score.missing_metrics.size());
        }
        TABLE_ROW_48(to_string(category_score.category), score_text);
    }
    TABLE_SEPARATOR_48();
    TABLE_ROW_48("Composite", format_optional(scores.composite, 1));
    TABLE_FOOTER_48();

    for (const std::string& strength_text : report.strengths) {
        LOG_THREAD_CONTENT("+ " + strength_text);
    }
    for (const std::string& weakness_text : report.weaknesses) {
        LOG_THREAD_CONTENT("- " + weakness_text);
    }
    for (const std::string& risk_text : report.risks) {
        LOG_THREAD_CONTENT("! " + risk_text);
    }
}

void AnalysisLogs::log_valuation_table(const std::vector<ValuationEstimate>& valuations) {
    TABLE_HEADER_48("VALUATION", "Intrinsic value estimates");
    for (const ValuationEstimate& valuation_estimate : valuations) {
        if (valuation_estimate.applicable && valuation_estimate.fair_value) {
            std::string value_text = "$" + format_number(*valuation_estimate.fair_value, 2);
            if (valuation_estimate.upside) {
                value_text += "  upside " + format_number(*valuation_estimate.upside * 100.0, 1) + "%";
            }
            TABLE_ROW_48(to_string(valuation_estimate.model), value_text);
        } else {
            TABLE_ROW_48(to_string(valuation_estimate.model), "N/A: " + valuation_estimate.inapplicable_reason);
        }
    }
    TABLE_FOOTER_48();
}

void AnalysisLogs::log_peer_comparison(const PeerComparison& peer_comparison) {
    std::string peer_list;
    for (const std::string& peer_symbol : peer_comparison.peer_symbols) {
        peer_list += (peer_list.empty() ? "" : ",") + peer_symbol;
    }
    TABLE_HEADER_48("PEERS", peer_list);
    for (const PeerMetricComparison& metric_comparison : peer_comparison.metrics) {
        TABLE_ROW_48(metric_comparison.metric, format_number(metric_comparison.stock_value, 2) + " vs " +
                     format_number(metric_comparison.peer_average, 2) + "  rank " + std::to_string(metric_comparison.rank) +
                     "/" + std::to_string(metric_comparison.compared_count));
    }
    TABLE_FOOTER_48();
}

// ========================================================================
// OUTCOME
// ========================================================================

void AnalysisLogs::log_recommendation_summary(const std::string& symbol, const Recommendation& recommendation) {
    LOG_THREAD_RECOMMENDATION_HEADER(symbol);
    TABLE_HEADER_48("DECISION", to_string(recommendation.outcome));
    TABLE_ROW_48("Basis", to_string(recommendation.basis));
    TABLE_ROW_48("Technical", format_optional(recommendation.technical_contribution, 3));
    TABLE_ROW_48("Fundamental", format_optional(recommendation.fundamental_contribution, 3));
    TABLE_ROW_48("Final Score", format_number(recommendation.final_score, 3));
    TABLE_ROW_48("Strength", format_number(recommendation.strength, 3));
    TABLE_FOOTER_48();
    LOG_THREAD_CONTENT(recommendation.rationale);
    LOG_THREAD_SECTION_FOOTER();
}

} // namespace Logging
} // namespace StockAdvisor
