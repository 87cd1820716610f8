#ifndef SYSTEM_LOGS_HPP
#define SYSTEM_LOGS_HPP

#include <string>
#include "configs/system_config.hpp"

/**
 * Process-level logging: startup, configuration and fatal errors.
 */
class SystemLogs {
public:
    // Startup
    static void log_startup_banner(const std::string& symbol, const std::string& data_directory, const std::string& config_directory);
    static void log_configuration_summary(const StockAdvisor::Config::SystemConfig& config);
    static void log_configuration_validated(bool valid);
    static void log_unknown_config_key(const std::string& config_key, const std::string& csv_path);

    // Output
    static void log_result_written(const std::string& destination);

    // Errors
    static void log_system_startup_error(const std::string& error_message);
    static void log_symbol_not_found(const std::string& error_message);
    static void log_fatal_error(const std::string& error_message);
};

#endif // SYSTEM_LOGS_HPP
