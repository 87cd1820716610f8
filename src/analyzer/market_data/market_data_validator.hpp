#ifndef MARKET_DATA_VALIDATOR_HPP
#define MARKET_DATA_VALIDATOR_HPP

#include <string>
#include <vector>
#include "analyzer/data_structures/data_structures.hpp"

namespace StockAdvisor {
namespace Core {

/**
 * Bar and bar-sequence checks applied before a Series is built.
 */
class MarketDataValidator {
public:
    MarketDataValidator() = default;

    // Finite positive prices, high/low bracketing open and close, non-negative volume.
    bool validate_price_data(const Bar& bar_data, std::string& failure_reason) const;

    // Throws DataInsufficientError for empty or all-NaN input, InvalidSeriesError naming
    // the first offending bar otherwise.
    void validate_bar_sequence(const std::vector<Bar>& bars) const;
};

} // namespace Core
} // namespace StockAdvisor

#endif // MARKET_DATA_VALIDATOR_HPP
