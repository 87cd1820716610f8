#include "series.hpp"
#include "market_data_validator.hpp"
#include <algorithm>
#include <utility>

namespace StockAdvisor {
namespace Core {

Series Series::from_bars(std::vector<Bar> bars) {
    MarketDataValidator market_data_validator;
    market_data_validator.validate_bar_sequence(bars);
    return Series(std::move(bars));
}

Series::Series(std::vector<Bar> validated_bars) : bar_data(std::move(validated_bars)) {
    open_prices.reserve(bar_data.size());
    high_prices.reserve(bar_data.size());
    low_prices.reserve(bar_data.size());
    close_prices.reserve(bar_data.size());
    volume_values.reserve(bar_data.size());
    for (const Bar& bar : bar_data) {
        open_prices.push_back(bar.open_price);
        high_prices.push_back(bar.high_price);
        low_prices.push_back(bar.low_price);
        close_prices.push_back(bar.close_price);
        volume_values.push_back(bar.volume);
    }
}

double Series::lowest_low() const {
    return *std::min_element(low_prices.begin(), low_prices.end());
}

double Series::highest_high() const {
    return *std::max_element(high_prices.begin(), high_prices.end());
}

} // namespace Core
} // namespace StockAdvisor
