#include "time_utils.hpp"
#include <ctime>
#include <stdexcept>

namespace TimeUtils {

std::string get_current_human_readable_time() {
    auto now = std::chrono::system_clock::now();
    auto in_time_t = std::chrono::system_clock::to_time_t(now);
    std::stringstream ss;

    // Use thread-safe localtime_r instead of localtime
    struct tm timeinfo;
    localtime_r(&in_time_t, &timeinfo);
    ss << std::put_time(&timeinfo, HUMAN_READABLE);
    return ss.str();
}

namespace {

bool try_parse_with_format(const std::string& timestamp, const char* format, std::tm& parsed_time) {
    parsed_time = std::tm{};
    std::istringstream timestamp_stream(timestamp);
    timestamp_stream >> std::get_time(&parsed_time, format);
    if (timestamp_stream.fail()) {
        return false;
    }
    // Reject trailing garbage (a lone 'Z' is allowed)
    std::string remainder;
    timestamp_stream >> remainder;
    return remainder.empty() || remainder == "Z";
}

bool is_integer_string(const std::string& value) {
    if (value.empty()) {
        return false;
    }
    size_t start_position = (value[0] == '-') ? 1 : 0;
    if (start_position == value.size()) {
        return false;
    }
    for (size_t char_index = start_position; char_index < value.size(); ++char_index) {
        if (value[char_index] < '0' || value[char_index] > '9') {
            return false;
        }
    }
    return true;
}

} // anonymous namespace

std::int64_t parse_timestamp_to_epoch_seconds(const std::string& timestamp) {
    if (is_integer_string(timestamp)) {
        return static_cast<std::int64_t>(std::stoll(timestamp));
    }

    std::tm parsed_time{};
    if (try_parse_with_format(timestamp, ISO_8601_WITHOUT_Z, parsed_time) ||
        try_parse_with_format(timestamp, HUMAN_READABLE, parsed_time) ||
        try_parse_with_format(timestamp, ISO_DATE, parsed_time)) {
        return static_cast<std::int64_t>(timegm(&parsed_time));
    }

    throw std::runtime_error("Unrecognized timestamp format: " + timestamp);
}

std::string format_epoch_seconds_as_iso(std::int64_t epoch_seconds) {
    std::time_t time_value = static_cast<std::time_t>(epoch_seconds);
    struct tm timeinfo;
    gmtime_r(&time_value, &timeinfo);
    std::stringstream ss;
    ss << std::put_time(&timeinfo, ISO_8601_WITH_Z);
    return ss.str();
}

int get_utc_year(std::int64_t epoch_seconds) {
    std::time_t time_value = static_cast<std::time_t>(epoch_seconds);
    struct tm timeinfo;
    gmtime_r(&time_value, &timeinfo);
    return timeinfo.tm_year + 1900;
}

std::int64_t get_start_of_year_epoch_seconds(int year) {
    std::tm start_of_year{};
    start_of_year.tm_year = year - 1900;
    start_of_year.tm_mon = 0;
    start_of_year.tm_mday = 1;
    return static_cast<std::int64_t>(timegm(&start_of_year));
}

} // namespace TimeUtils
