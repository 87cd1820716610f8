#ifndef CONFIG_LOADER_HPP
#define CONFIG_LOADER_HPP

#include <string>
#include "configs/system_config.hpp"

// Applies every key,value line of one CSV file on top of the current values.
// Returns false when the file cannot be opened; throws ConfigError on an unparsable value.
bool load_config_from_csv(StockAdvisor::Config::SystemConfig& cfg, const std::string& csv_path);

// Loads analysis_config.csv and logging_config.csv from a directory, then validates.
// Missing files keep the built-in defaults. Throws ConfigError on any load or validation failure.
void load_system_config(StockAdvisor::Config::SystemConfig& config, const std::string& config_directory);

bool validate_config(const StockAdvisor::Config::SystemConfig& config, std::string& error_message);

#endif // CONFIG_LOADER_HPP
