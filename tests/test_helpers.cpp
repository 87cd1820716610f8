#include "test_helpers.hpp"
#include "utils/time_utils.hpp"
#include <algorithm>
#include <atomic>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <unistd.h>

namespace StockAdvisor {
namespace Testing {

Core::Bar make_bar(size_t bar_index, double open_price, double high_price, double low_price, double close_price, double volume) {
    return Core::Bar(FIRST_BAR_TIMESTAMP + static_cast<std::int64_t>(bar_index) * TimeUtils::SECONDS_PER_DAY,
                     open_price, high_price, low_price, close_price, volume);
}

std::vector<Core::Bar> make_bars_from_closes(const std::vector<double>& closes) {
    std::vector<Core::Bar> bars;
    bars.reserve(closes.size());
    for (size_t bar_index = 0; bar_index < closes.size(); ++bar_index) {
        double close_price = closes[bar_index];
        double open_price = bar_index == 0 ? close_price : closes[bar_index - 1];
        bars.push_back(make_bar(bar_index, open_price, std::max(open_price, close_price) + 0.1,
                                std::min(open_price, close_price) - 0.1, close_price));
    }
    return bars;
}

Core::Series make_series_from_closes(const std::vector<double>& closes) {
    return Core::Series::from_bars(make_bars_from_closes(closes));
}

Core::Series make_flat_series(size_t bar_count, double price) {
    std::vector<Core::Bar> bars;
    for (size_t bar_index = 0; bar_index < bar_count; ++bar_index) {
        bars.push_back(make_bar(bar_index, price, price, price, price));
    }
    return Core::Series::from_bars(bars);
}

std::vector<double> make_close_path(const std::vector<double>& anchor_closes) {
    std::vector<double> closes;
    if (anchor_closes.empty()) {
        return closes;
    }
    closes.push_back(anchor_closes.front());
    for (size_t anchor_index = 1; anchor_index < anchor_closes.size(); ++anchor_index) {
        double current_close = anchor_closes[anchor_index - 1];
        double target_close = anchor_closes[anchor_index];
        double step = target_close > current_close ? 1.0 : -1.0;
        while (std::abs(target_close - current_close) > 1e-9) {
            current_close += step;
            closes.push_back(current_close);
        }
    }
    return closes;
}

TemporaryDirectory::TemporaryDirectory(const std::string& name_prefix) {
    static std::atomic<int> directory_counter{0};
    std::ostringstream path_stream;
    path_stream << name_prefix << "_" << ::getpid() << "_" << directory_counter.fetch_add(1);
    std::filesystem::path full_path = std::filesystem::temp_directory_path() / path_stream.str();
    std::filesystem::create_directories(full_path);
    directory_path = full_path.string();
}

TemporaryDirectory::~TemporaryDirectory() {
    std::error_code remove_error;
    std::filesystem::remove_all(directory_path, remove_error);
}

std::string TemporaryDirectory::write_file(const std::string& file_name, const std::string& contents) const {
    std::string file_path = directory_path + "/" + file_name;
    std::ofstream file_stream(file_path);
    if (!file_stream.is_open()) {
        throw std::runtime_error("Cannot write test file " + file_path);
    }
    file_stream << contents;
    return file_path;
}

std::string format_bars_as_csv(const std::vector<Core::Bar>& bars) {
    std::ostringstream csv_stream;
    csv_stream << "timestamp,open,high,low,close,volume\n";
    csv_stream << std::fixed << std::setprecision(4);
    for (const Core::Bar& bar : bars) {
        csv_stream << TimeUtils::format_epoch_seconds_as_iso(bar.timestamp) << "," << bar.open_price << ","
                   << bar.high_price << "," << bar.low_price << "," << bar.close_price << "," << bar.volume << "\n";
    }
    return csv_stream.str();
}

} // namespace Testing
} // namespace StockAdvisor
