#include "market_data_validator.hpp"
#include "analyzer/data_structures/analysis_errors.hpp"
#include <algorithm>
#include <cmath>

namespace StockAdvisor {
namespace Core {

bool MarketDataValidator::validate_price_data(const Bar& bar_data, std::string& failure_reason) const {
    if (!std::isfinite(bar_data.close_price) || !std::isfinite(bar_data.open_price) ||
        !std::isfinite(bar_data.high_price) || !std::isfinite(bar_data.low_price) || !std::isfinite(bar_data.volume)) {
        failure_reason = "non-finite value";
        return false;
    }

    if (bar_data.close_price <= 0.0 || bar_data.open_price <= 0.0 || bar_data.high_price <= 0.0 || bar_data.low_price <= 0.0) {
        failure_reason = "non-positive price";
        return false;
    }

    if (bar_data.high_price < std::max(bar_data.open_price, bar_data.close_price)) {
        failure_reason = "high below open/close";
        return false;
    }

    if (bar_data.low_price > std::min(bar_data.open_price, bar_data.close_price)) {
        failure_reason = "low above open/close";
        return false;
    }

    if (bar_data.volume < 0.0) {
        failure_reason = "negative volume";
        return false;
    }

    return true;
}

void MarketDataValidator::validate_bar_sequence(const std::vector<Bar>& bars) const {
    if (bars.empty()) {
        throw DataInsufficientError("Series is empty");
    }

    bool all_closes_missing = std::all_of(bars.begin(), bars.end(), [](const Bar& bar_data) {
        return std::isnan(bar_data.close_price);
    });
    if (all_closes_missing) {
        throw DataInsufficientError("Series has no usable close prices (" + std::to_string(bars.size()) + " bars, all NaN)");
    }

    for (size_t bar_index = 0; bar_index < bars.size(); ++bar_index) {
        std::string failure_reason;
        if (!validate_price_data(bars[bar_index], failure_reason)) {
            throw InvalidSeriesError("Invalid bar at index " + std::to_string(bar_index) + ": " + failure_reason);
        }
        if (bar_index > 0 && bars[bar_index].timestamp <= bars[bar_index - 1].timestamp) {
            throw InvalidSeriesError("Timestamps not strictly increasing at index " + std::to_string(bar_index));
        }
    }
}

} // namespace Core
} // namespace StockAdvisor
