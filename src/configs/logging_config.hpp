// LoggingConfig.hpp
#ifndef LOGGING_CONFIG_HPP
#define LOGGING_CONFIG_HPP

#include <string>

namespace StockAdvisor {
namespace Config {

struct LoggingConfig {
    std::string log_file = "stock_advisor.log";   // Base file name inside the run folder
    std::string log_directory = "runtime_logs";   // Parent directory for run folders
    bool file_logging_enabled = true;             // Write log lines to the run log file
    bool log_indicator_table = true;              // Emit the latest indicator table per request
    int logging_poll_interval_milliseconds = 50;  // Logging thread wake-up interval
};

} // namespace Config
} // namespace StockAdvisor

#endif // LOGGING_CONFIG_HPP
