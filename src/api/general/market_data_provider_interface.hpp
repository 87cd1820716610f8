#ifndef MARKET_DATA_PROVIDER_INTERFACE_HPP
#define MARKET_DATA_PROVIDER_INTERFACE_HPP

#include "analyzer/data_structures/fundamental_record.hpp"
#include "analyzer/market_data/series.hpp"
#include <memory>
#include <string>

namespace StockAdvisor {
namespace API {

/**
 * Source of raw inputs for one symbol.
 * fetch_series throws Core::NotFoundError for an unknown symbol and
 * Core::DataInsufficientError when the requested range holds no bars.
 * fetch_fundamentals may return a partial record; absent fields stay unset.
 */
class MarketDataProviderInterface {
public:
    virtual ~MarketDataProviderInterface() = default;

    virtual Core::Series fetch_series(const std::string& symbol, const std::string& period, const std::string& interval) const = 0;
    virtual Core::FundamentalRecord fetch_fundamentals(const std::string& symbol) const = 0;

    virtual std::string get_provider_name() const = 0;
};

using MarketDataProviderPtr = std::unique_ptr<MarketDataProviderInterface>;

} // namespace API
} // namespace StockAdvisor

#endif // MARKET_DATA_PROVIDER_INTERFACE_HPP
