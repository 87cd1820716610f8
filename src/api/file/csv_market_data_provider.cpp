#include "csv_market_data_provider.hpp"
#include "analyzer/data_structures/analysis_errors.hpp"
#include "logging/logger/async_logger.hpp"
#include "utils/time_utils.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <limits>
#include <map>
#include <sstream>

using json = nlohmann::json;
using StockAdvisor::Logging::log_message;

namespace StockAdvisor {
namespace API {

namespace {

// Calendar span in days for each supported period
const std::map<std::string, long long>& get_period_spans_in_days() {
    static const std::map<std::string, long long> period_spans_in_days = {
        {"1d", 1}, {"5d", 5}, {"1mo", 31}, {"3mo", 92}, {"6mo", 183},
        {"1y", 366}, {"2y", 731}, {"5y", 1827}, {"10y", 3653}
    };
    return period_spans_in_days;
}

const std::vector<std::string>& get_supported_intervals() {
    static const std::vector<std::string> supported_intervals = {
        "1m", "2m", "5m", "15m", "30m", "60m", "90m", "1h", "1d", "5d", "1wk", "1mo", "3mo"
    };
    return supported_intervals;
}

std::string trim_field(const std::string& input_string) {
    const char* whitespace_chars = " \t\r\n\"";
    auto begin_position = input_string.find_first_not_of(whitespace_chars);
    auto end_position = input_string.find_last_not_of(whitespace_chars);
    if (begin_position == std::string::npos) return "";
    return input_string.substr(begin_position, end_position - begin_position + 1);
}

std::string to_lower_field(const std::string& field_value) {
    std::string lowered_value = field_value;
    std::transform(lowered_value.begin(), lowered_value.end(), lowered_value.begin(),
                   [](unsigned char field_char) { return static_cast<char>(std::tolower(field_char)); });
    return lowered_value;
}

bool is_header_line(const std::string& first_field) {
    std::string normalized_field = to_lower_field(first_field);
    return normalized_field == "timestamp" || normalized_field == "date" || normalized_field == "datetime" || normalized_field == "time";
}

double parse_price_field(const std::string& field_value) {
    std::string normalized_value = to_lower_field(field_value);
    if (normalized_value.empty() || normalized_value == "nan" || normalized_value == "null") {
        return std::numeric_limits<double>::quiet_NaN();
    }
    size_t parsed_length = 0;
    double parsed_value = std::stod(field_value, &parsed_length);
    if (parsed_length != field_value.size()) {
        throw std::invalid_argument("trailing characters in number: " + field_value);
    }
    return parsed_value;
}

} // anonymous namespace

CsvMarketDataProvider::CsvMarketDataProvider(const std::string& data_directory_path)
    : data_directory(data_directory_path) {}

bool CsvMarketDataProvider::is_supported_period(const std::string& period) {
    return period == "ytd" || period == "max" || get_period_spans_in_days().count(period) > 0;
}

bool CsvMarketDataProvider::is_supported_interval(const std::string& interval) {
    const std::vector<std::string>& supported_intervals = get_supported_intervals();
    return std::find(supported_intervals.begin(), supported_intervals.end(), interval) != supported_intervals.end();
}

std::vector<Core::Bar> CsvMarketDataProvider::read_bars_file(const std::string& bars_file_path) const {
    std::ifstream bars_file_stream(bars_file_path);
    if (!bars_file_stream.is_open()) {
        throw Core::NotFoundError("No price history file: " + bars_file_path);
    }

    std::vector<Core::Bar> bars;
    std::string bars_line_string;
    int bars_line_number = 0;
    while (std::getline(bars_file_stream, bars_line_string)) {
        ++bars_line_number;
        std::string trimmed_line = trim_field(bars_line_string);
        if (trimmed_line.empty() || trimmed_line[0] == '#') continue;

        std::vector<std::string> bar_fields;
        std::stringstream bars_line_stream(bars_line_string);
        std::string bar_field_string;
        while (std::getline(bars_line_stream, bar_field_string, ',')) {
            bar_fields.push_back(trim_field(bar_field_string));
        }

        if (!bar_fields.empty() && is_header_line(bar_fields[0])) continue;

        if (bar_fields.size() < 6) {
            throw Core::InvalidSeriesError(bars_file_path + ":" + std::to_string(bars_line_number) +
                                           " expected 6 columns (timestamp,open,high,low,close,volume), got " +
                                           std::to_string(bar_fields.size()));
        }

        try {
            Core::Bar bar(TimeUtils::parse_timestamp_to_epoch_seconds(bar_fields[0]),
                          parse_price_field(bar_fields[1]), parse_price_field(bar_fields[2]),
                          parse_price_field(bar_fields[3]), parse_price_field(bar_fields[4]),
                          parse_price_field(bar_fields[5]));
            bars.push_back(bar);
        } catch (const std::exception& parse_exception_error) {
            throw Core::InvalidSeriesError(bars_file_path + ":" + std::to_string(bars_line_number) + " " + parse_exception_error.what());
        }
    }

    return bars;
}

std::vector<Core::Bar> CsvMarketDataProvider::filter_bars_by_period(const std::vector<Core::Bar>& bars, const std::string& period) {
    if (!is_supported_period(period)) {
        throw Core::AnalysisError("Unsupported period: " + period);
    }
    if (bars.empty() || period == "max") {
        return bars;
    }

    std::int64_t last_timestamp = bars.back().timestamp;
    std::int64_t cutoff_timestamp = 0;
    if (period == "ytd") {
        cutoff_timestamp = TimeUtils::get_start_of_year_epoch_seconds(TimeUtils::get_utc_year(last_timestamp));
    } else {
        cutoff_timestamp = last_timestamp - get_period_spans_in_days().at(period) * TimeUtils::SECONDS_PER_DAY;
    }

    std::vector<Core::Bar> filtered_bars;
    for (const Core::Bar& bar : bars) {
        if (bar.timestamp >= cutoff_timestamp) {
            filtered_bars.push_back(bar);
        }
    }
    return filtered_bars;
}

Core::Series CsvMarketDataProvider::fetch_series(const std::string& symbol, const std::string& period, const std::string& interval) const {
    if (symbol.empty()) {
        throw Core::NotFoundError("Symbol is required for a price history request");
    }
    if (!is_supported_interval(interval)) {
        throw Core::AnalysisError("Unsupported interval: " + interval);
    }

    std::string bars_file_path = data_directory + "/" + symbol + "_" + interval + ".csv";
    if (!std::filesystem::exists(bars_file_path)) {
        throw Core::NotFoundError("Unknown symbol " + symbol + ": no price history at " + bars_file_path);
    }

    std::vector<Core::Bar> period_bars = filter_bars_by_period(read_bars_file(bars_file_path), period);
    if (period_bars.empty()) {
        throw Core::DataInsufficientError("No bars for " + symbol + " in period " + period);
    }

    return Core::Series::from_bars(std::move(period_bars));
}

Core::FundamentalRecord CsvMarketDataProvider::fetch_fundamentals(const std::string& symbol) const {
    std::string fundamentals_file_path = data_directory + "/" + symbol + "_fundamentals.json";
    std::ifstream fundamentals_file_stream(fundamentals_file_path);
    if (!fundamentals_file_stream.is_open()) {
        throw Core::NotFoundError("No fundamentals for " + symbol + " at " + fundamentals_file_path);
    }

    json fundamentals_json;
    try {
        fundamentals_json = json::parse(fundamentals_file_stream);
    } catch (const json::parse_error& parse_exception_error) {
        throw Core::AnalysisError("Malformed fundamentals file " + fundamentals_file_path + ": " + parse_exception_error.what());
    }

    if (!fundamentals_json.is_object()) {
        throw Core::AnalysisError("Fundamentals file must hold a JSON object: " + fundamentals_file_path);
    }

    Core::FundamentalRecord fundamental_record;
    fundamental_record.symbol = symbol;
    if (fundamentals_json.contains("company_name") && fundamentals_json["company_name"].is_string()) {
        fundamental_record.company_name = fundamentals_json["company_name"].get<std::string>();
    }
    if (fundamentals_json.contains("sector") && fundamentals_json["sector"].is_string()) {
        fundamental_record.sector = fundamentals_json["sector"].get<std::string>();
    }
    if (fundamentals_json.contains("industry") && fundamentals_json["industry"].is_string()) {
        fundamental_record.industry = fundamentals_json["industry"].get<std::string>();
    }

    for (const Core::FundamentalField& fundamental_field : Core::get_fundamental_fields()) {
        if (!fundamentals_json.contains(fundamental_field.name)) continue;
        const json& field_json = fundamentals_json[fundamental_field.name];
        if (field_json.is_null()) continue;
        if (!field_json.is_number()) {
            log_message("WARNING: Ignoring non-numeric fundamental field " + std::string(fundamental_field.name) + " for " + symbol, "");
            continue;
        }
        fundamental_record.*(fundamental_field.member) = field_json.get<double>();
    }

    return fundamental_record;
}

} // namespace API
} // namespace StockAdvisor
