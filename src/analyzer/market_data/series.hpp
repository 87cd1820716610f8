#ifndef SERIES_HPP
#define SERIES_HPP

#include <vector>
#include "analyzer/data_structures/data_structures.hpp"

namespace StockAdvisor {
namespace Core {

/**
 * Immutable, validated, time-ordered OHLCV history.
 * Only from_bars() constructs one; price columns are extracted once for the indicator math.
 */
class Series {
public:
    static Series from_bars(std::vector<Bar> bars);

    size_t size() const { return bar_data.size(); }
    bool empty() const { return bar_data.empty(); }
    const Bar& at(size_t bar_index) const { return bar_data.at(bar_index); }
    const Bar& back() const { return bar_data.back(); }
    const std::vector<Bar>& bars() const { return bar_data; }

    const std::vector<double>& opens() const { return open_prices; }
    const std::vector<double>& highs() const { return high_prices; }
    const std::vector<double>& lows() const { return low_prices; }
    const std::vector<double>& closes() const { return close_prices; }
    const std::vector<double>& volumes() const { return volume_values; }

    double lowest_low() const;
    double highest_high() const;

private:
    explicit Series(std::vector<Bar> validated_bars);

    std::vector<Bar> bar_data;
    std::vector<double> open_prices;
    std::vector<double> high_prices;
    std::vector<double> low_prices;
    std::vector<double> close_prices;
    std::vector<double> volume_values;
};

} // namespace Core
} // namespace StockAdvisor

#endif // SERIES_HPP
