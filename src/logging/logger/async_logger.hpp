#ifndef ASYNC_LOGGER_HPP
#define ASYNC_LOGGER_HPP

#include <atomic>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>
#include "configs/system_config.hpp"

namespace StockAdvisor {
namespace Logging {

// Thread tags are padded or cut to this width so log columns line up
constexpr size_t LOG_TAG_WIDTH = 6;
constexpr const char* DEFAULT_THREAD_TAG = "MAIN  ";

/**
 * Line queue between the analysis threads and the logging thread.
 * Producers enqueue fully formatted lines; the logging thread takes them in batches.
 */
class AsyncLogger {
public:
    explicit AsyncLogger(const std::string& log_file_path) : file_path(log_file_path), running(false) {}

    const std::string& get_file_path() const { return file_path; }
    bool is_running() const { return running.load(); }

    void start();
    void stop();
    void enqueue(const std::string& formatted_line);

    // Waits up to poll_interval_milliseconds for lines, then moves every queued line into pending_lines.
    void wait_for_lines(std::vector<std::string>& pending_lines, int poll_interval_milliseconds);

    // Moves whatever is still queued, without waiting.
    void take_remaining_lines(std::vector<std::string>& pending_lines);

private:
    std::string file_path;
    std::mutex queue_mutex;
    std::condition_variable queue_condition;
    std::deque<std::string> line_queue;
    std::atomic<bool> running;
};

/**
 * Per-run logging state shared by every thread of one analysis run.
 * Each thread points its thread-local slot at the context with set_logging_context().
 */
struct LoggingContext {
    std::shared_ptr<AsyncLogger> async_logger;  // Empty: lines go straight to stderr
    std::mutex console_mutex;
    std::string run_folder;

    std::string get_thread_tag() const;
    void set_thread_tag(const std::string& thread_tag);
    void clear_thread_tag();
    size_t get_thread_tag_count() const;

private:
    mutable std::mutex thread_tag_mutex;
    std::unordered_map<std::thread::id, std::string> thread_tags;
};

// Pads or truncates to LOG_TAG_WIDTH
std::string format_thread_tag(const std::string& thread_tag);

void set_log_thread_tag(const std::string& thread_tag);

// Tags the current thread for the lifetime of the guard; short-lived worker threads use this
// so their entries leave the context when they finish.
class ScopedThreadTag {
public:
    ScopedThreadTag(LoggingContext& logging_context, const std::string& thread_tag);
    ~ScopedThreadTag();

    ScopedThreadTag(const ScopedThreadTag&) = delete;
    ScopedThreadTag& operator=(const ScopedThreadTag&) = delete;

private:
    LoggingContext& context;
};

// Timestamped, tagged line to the async logger, or to stderr (and log_file_path if given) without one.
void log_message(const std::string& message, const std::string& log_file_path);

// <base>_<DD-HH-MM><extension>
std::string generate_timestamped_log_filename(const std::string& base_filename);

// Creates the run folder and log file name, installs a running AsyncLogger in the current context.
std::shared_ptr<AsyncLogger> initialize_analysis_logging(const StockAdvisor::Config::SystemConfig& config);
void shutdown_analysis_logging(AsyncLogger& logger);

// Throws std::runtime_error when the current thread has no context.
LoggingContext* get_logging_context();
bool has_logging_context();
void set_logging_context(LoggingContext& context);

} // namespace Logging
} // namespace StockAdvisor

#endif // ASYNC_LOGGER_HPP
