#ifndef CSV_MARKET_DATA_PROVIDER_HPP
#define CSV_MARKET_DATA_PROVIDER_HPP

#include "api/general/market_data_provider_interface.hpp"
#include <string>
#include <vector>

namespace StockAdvisor {
namespace API {

/**
 * File-backed provider.
 *   <data_directory>/<SYMBOL>_<interval>.csv      timestamp,open,high,low,close,volume
 *   <data_directory>/<SYMBOL>_fundamentals.json   flat object of metric name -> number
 */
class CsvMarketDataProvider : public MarketDataProviderInterface {
public:
    explicit CsvMarketDataProvider(const std::string& data_directory_path);

    Core::Series fetch_series(const std::string& symbol, const std::string& period, const std::string& interval) const override;
    Core::FundamentalRecord fetch_fundamentals(const std::string& symbol) const override;

    std::string get_provider_name() const override { return "csv_files"; }

    // Bars from one CSV file, unfiltered. Throws NotFoundError / InvalidSeriesError.
    std::vector<Core::Bar> read_bars_file(const std::string& bars_file_path) const;

    // Keeps the bars within the calendar span named by period, counted back from the last bar.
    static std::vector<Core::Bar> filter_bars_by_period(const std::vector<Core::Bar>& bars, const std::string& period);

    static bool is_supported_period(const std::string& period);
    static bool is_supported_interval(const std::string& interval);

private:
    std::string data_directory;
};

} // namespace API
} // namespace StockAdvisor

#endif // CSV_MARKET_DATA_PROVIDER_HPP
