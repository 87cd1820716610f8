#include "system_logs.hpp"
#include "logging/logger/logging_macros.hpp"
#include <iomanip>
#include <sstream>

using StockAdvisor::Logging::log_message;

void SystemLogs::log_startup_banner(const std::string& symbol, const std::string& data_directory, const std::string& config_directory) {
    LOG_STARTUP_SECTION_HEADER("STOCK ADVISOR");
    LOG_STARTUP_CONTENT("Symbol:        " + symbol);
    LOG_STARTUP_CONTENT("Data dir:      " + data_directory);
    LOG_STARTUP_CONTENT("Config dir:    " + config_directory);
    LOG_STARTUP_SEPARATOR();
}

void SystemLogs::log_configuration_summary(const StockAdvisor::Config::SystemConfig& config) {
    std::ostringstream weight_stream;
    weight_stream << std::fixed << std::setprecision(2) << config.recommendation.technical_weight;
    std::ostringstream threshold_stream;
    threshold_stream << std::fixed << std::setprecision(2) << config.recommendation.decision_threshold;

    LOG_STARTUP_SECTION_HEADER("CONFIGURATION");
    LOG_STARTUP_CONTENT("RSI period:          " + std::to_string(config.indicators.rsi_period));
    LOG_STARTUP_CONTENT("MACD:                " + std::to_string(config.indicators.macd_fast_period) + "/" +
                        std::to_string(config.indicators.macd_slow_period) + "/" + std::to_string(config.indicators.macd_signal_period));
    LOG_STARTUP_CONTENT("Bollinger period:    " + std::to_string(config.indicators.bollinger_period));
    LOG_STARTUP_CONTENT("Technical weight:    " + weight_stream.str());
    LOG_STARTUP_CONTENT("Decision threshold:  " + threshold_stream.str());
    LOG_STARTUP_CONTENT("Chart history bars:  " + std::to_string(config.output.chart_history_bars));
    LOG_STARTUP_SEPARATOR();
}

void SystemLogs::log_configuration_validated(bool valid) {
    if (valid) {
        log_message("CONFIG_VALIDATION: Configuration validated successfully", "");
    } else {
        log_message("CONFIG_VALIDATION: Configuration validation FAILED", "");
    }
}

void SystemLogs::log_unknown_config_key(const std::string& config_key, const std::string& csv_path) {
    log_message("WARNING: Unknown config key '" + config_key + "' in " + csv_path, "");
}

void SystemLogs::log_result_written(const std::string& destination) {
    log_message("OUTPUT: Analysis document written to " + destination, "");
}

void SystemLogs::log_system_startup_error(const std::string& error_message) {
    log_message("ERROR: System startup error: " + error_message, "");
}

void SystemLogs::log_symbol_not_found(const std::string& error_message) {
    log_message("ERROR: Symbol not found: " + error_message, "");
}

void SystemLogs::log_fatal_error(const std::string& error_message) {
    log_message("FATAL: " + error_message, "");
}
