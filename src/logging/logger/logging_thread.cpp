#include "logging_thread.hpp"
#include <iostream>

namespace StockAdvisor {
namespace Logging {

void LoggingThread::operator()() {
    set_logging_context(logging_context);
    set_log_thread_tag("LOGGER");

    std::ofstream log_file;
    if (!async_logger->get_file_path().empty()) {
        log_file.open(async_logger->get_file_path(), std::ios::app);
        if (!log_file.is_open()) {
            std::cerr << "ERROR: Failed to open log file: " << async_logger->get_file_path() << std::endl;
        }
    }

    try {
        run_drain_loop(log_file);
    } catch (const std::exception& logging_exception) {
        std::cerr << "Logging thread exception: " << logging_exception.what() << std::endl;
    }
}

void LoggingThread::run_drain_loop(std::ofstream& log_file) {
    std::vector<std::string> pending_lines;
    while (async_logger->is_running()) {
        async_logger->wait_for_lines(pending_lines, config.logging_poll_interval_milliseconds);
        write_log_lines(pending_lines, log_file);
    }

    // Lines enqueued between the last batch and stop()
    async_logger->take_remaining_lines(pending_lines);
    write_log_lines(pending_lines, log_file);
}

void LoggingThread::write_log_lines(std::vector<std::string>& pending_lines, std::ofstream& log_file) {
    if (pending_lines.empty()) {
        return;
    }
    {
        std::lock_guard<std::mutex> console_lock(logging_context.console_mutex);
        for (const std::string& log_line : pending_lines) {
            std::cerr << log_line;
        }
        std::cerr << std::flush;
    }
    if (log_file.is_open()) {
        for (const std::string& log_line : pending_lines) {
            log_file << log_line;
        }
        log_file.flush();
    }
    pending_lines.clear();
}

} // namespace Logging
} // namespace StockAdvisor
