#ifndef FUNDAMENTAL_SCORER_HPP
#define FUNDAMENTAL_SCORER_HPP

#include <string>
#include <vector>
#include "configs/fundamental_config.hpp"
#include "analyzer/data_structures/data_structures.hpp"
#include "analyzer/data_structures/fundamental_record.hpp"

using StockAdvisor::Config::FundamentalConfig;

namespace StockAdvisor {
namespace Core {

// Reads one metric from the record; throws MissingFieldError when it is absent.
using MetricExtractor = double (*)(const FundamentalRecord&);
// Maps a metric value onto [0, 100].
using MetricScorer = double (*)(double, const FundamentalConfig&);

struct MetricRule {
    const char* name;
    FundamentalCategory category;
    MetricExtractor extract;
    MetricScorer score;
};

// Every scored metric, grouped by category in category order.
const std::vector<MetricRule>& get_metric_rules();

// Letter grade for a 0-100 score (A+ ... F).
std::string get_letter_grade(double score);

/**
 * Scores valuation, profitability, growth and financial health.
 * A category averages only the metrics the record carries; with none it stays undefined.
 * The composite is the weighted mean of the defined categories, renormalised over their weights.
 */
FundamentalScores score_fundamentals(const FundamentalRecord& record, const FundamentalConfig& config);

double get_category_weight(FundamentalCategory category, const FundamentalConfig& config);

} // namespace Core
} // namespace StockAdvisor

#endif // FUNDAMENTAL_SCORER_HPP
