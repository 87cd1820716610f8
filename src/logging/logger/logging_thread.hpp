#ifndef LOGGING_THREAD_HPP
#define LOGGING_THREAD_HPP

#include <fstream>
#include <memory>
#include <string>
#include <vector>
#include "logging/logger/async_logger.hpp"
#include "configs/logging_config.hpp"

namespace StockAdvisor {
namespace Logging {

/**
 * Body of the logging std::thread. Takes queued lines from the AsyncLogger in batches
 * and writes them to stderr and the run log file until the logger is stopped, then
 * writes whatever was queued after the last batch.
 */
class LoggingThread {
public:
    LoggingThread(std::shared_ptr<AsyncLogger> logger, LoggingContext& parent_logging_context,
                  const StockAdvisor::Config::LoggingConfig& logging_config)
        : async_logger(logger), logging_context(parent_logging_context), config(logging_config) {}

    void operator()();

private:
    std::shared_ptr<AsyncLogger> async_logger;
    LoggingContext& logging_context;
    StockAdvisor::Config::LoggingConfig config;

    void run_drain_loop(std::ofstream& log_file);
    void write_log_lines(std::vector<std::string>& pending_lines, std::ofstream& log_file);
};

} // namespace Logging
} // namespace StockAdvisor

#endif // LOGGING_THREAD_HPP
