#ifndef PEER_COMPARISON_HPP
#define PEER_COMPARISON_HPP

#include <vector>
#include "analyzer/data_structures/data_structures.hpp"
#include "analyzer/data_structures/fundamental_record.hpp"

namespace StockAdvisor {
namespace Core {

/**
 * Compares every numeric field the stock and at least one peer report.
 * Rank 1 is the best value among stock and peers; lower is better for the
 * valuation multiples, debt/equity and beta.
 */
PeerComparison compare_with_peers(const FundamentalRecord& stock_record, const std::vector<FundamentalRecord>& peer_records);

} // namespace Core
} // namespace StockAdvisor

#endif // PEER_COMPARISON_HPP
