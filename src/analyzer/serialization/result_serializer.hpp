#ifndef RESULT_SERIALIZER_HPP
#define RESULT_SERIALIZER_HPP

#include <nlohmann/json.hpp>
#include "analyzer/coordinators/analysis_engine.hpp"

namespace StockAdvisor {
namespace Core {

using json = nlohmann::json;

/**
 * Nested document for one analysis result.
 * Objects keep sorted keys and absent values serialize as null, so identical
 * results always dump to identical bytes. Indicator history is limited to the
 * last chart_history_bars bars.
 */
json serialize_analysis(const AnalysisResult& result, int chart_history_bars);

json serialize_indicators(const IndicatorSet& indicators, const std::vector<std::int64_t>& bar_timestamps, int chart_history_bars);
json serialize_fundamentals(const FundamentalAnalysis& fundamental);
json serialize_recommendation(const Recommendation& recommendation);

} // namespace Core
} // namespace StockAdvisor

#endif // RESULT_SERIALIZER_HPP
