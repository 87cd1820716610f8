#ifndef FUNDAMENTAL_REPORT_HPP
#define FUNDAMENTAL_REPORT_HPP

#include <string>
#include "configs/fundamental_config.hpp"
#include "analyzer/data_structures/data_structures.hpp"
#include "analyzer/data_structures/fundamental_record.hpp"

using StockAdvisor::Config::FundamentalConfig;

namespace StockAdvisor {
namespace Core {

// Rating label for a composite score (Strong Buy, Buy, Hold, Weak Hold, Sell).
std::string get_fundamental_rating(double composite_score);

/**
 * Qualitative summary of the scores: grade and rating from the composite,
 * strengths and weaknesses from the defined categories, risks and opportunities
 * from the metrics the record carries. Absent metrics never trigger a finding.
 */
FundamentalReport build_fundamental_report(const FundamentalRecord& record, const FundamentalScores& scores,
                                           const FundamentalConfig& config);

} // namespace Core
} // namespace StockAdvisor

#endif // FUNDAMENTAL_REPORT_HPP
