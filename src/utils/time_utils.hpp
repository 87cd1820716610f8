#ifndef TIME_UTILS_HPP
#define TIME_UTILS_HPP

#include <string>
#include <chrono>
#include <cstdint>
#include <sstream>
#include <iomanip>

namespace TimeUtils {

// Time conversion constants
constexpr long long SECONDS_PER_MINUTE = 60;
constexpr long long MINUTES_PER_HOUR = 60;
constexpr long long HOURS_PER_DAY = 24;
constexpr long long SECONDS_PER_HOUR = SECONDS_PER_MINUTE * MINUTES_PER_HOUR;
constexpr long long SECONDS_PER_DAY = SECONDS_PER_HOUR * HOURS_PER_DAY;

// Time format constants
constexpr const char* ISO_8601_WITH_Z = "%Y-%m-%dT%H:%M:%SZ";
constexpr const char* ISO_8601_WITHOUT_Z = "%Y-%m-%dT%H:%M:%S";
constexpr const char* ISO_DATE = "%Y-%m-%d";
constexpr const char* HUMAN_READABLE = "%Y-%m-%d %H:%M:%S";
constexpr const char* LOG_FILENAME = "%d-%H-%M";

// Wall-clock helpers (logging only)
std::string get_current_human_readable_time();

// Parses "YYYY-MM-DD", "YYYY-MM-DDTHH:MM:SS[Z]", "YYYY-MM-DD HH:MM:SS" (all UTC) or
// integer epoch seconds. Throws std::runtime_error on anything else.
std::int64_t parse_timestamp_to_epoch_seconds(const std::string& timestamp);

// Formats epoch seconds as ISO 8601 UTC with Z suffix
std::string format_epoch_seconds_as_iso(std::int64_t epoch_seconds);

// UTC calendar year of an epoch timestamp
int get_utc_year(std::int64_t epoch_seconds);

// Epoch seconds of January 1st 00:00:00 UTC of a year
std::int64_t get_start_of_year_epoch_seconds(int year);

} // namespace TimeUtils

#endif // TIME_UTILS_HPP
