#include "async_logger.hpp"
#include "utils/time_utils.hpp"
#include <chrono>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace StockAdvisor {
namespace Logging {

namespace {

thread_local LoggingContext* current_logging_context = nullptr;

std::string format_log_line(const std::string& thread_tag, const std::string& message) {
    std::ostringstream line_stream;
    line_stream << TimeUtils::get_current_human_readable_time() << " [" << thread_tag << "]   " << message << '\n';
    return line_stream.str();
}

std::string format_local_run_stamp() {
    std::time_t now = std::time(nullptr);
    std::tm local_time;
    localtime_r(&now, &local_time);
    std::ostringstream stamp_stream;
    stamp_stream << std::put_time(&local_time, TimeUtils::LOG_FILENAME);
    return stamp_stream.str();
}

// <log_directory>/run_<DD-HH-MM>
std::string create_run_folder(const std::string& log_directory) {
    std::string run_folder = log_directory + "/run_" + format_local_run_stamp();
    std::error_code create_error;
    std::filesystem::create_directories(run_folder, create_error);
    if (create_error) {
        throw std::runtime_error("Failed to create run folder " + run_folder + ": " + create_error.message());
    }
    return run_folder;
}

} // anonymous namespace

// ========================================================================
// CONTEXT
// ========================================================================

std::string format_thread_tag(const std::string& thread_tag) {
    std::string padded_tag = thread_tag.substr(0, LOG_TAG_WIDTH);
    padded_tag.resize(LOG_TAG_WIDTH, ' ');
    return padded_tag;
}

std::string LoggingContext::get_thread_tag() const {
    std::lock_guard<std::mutex> thread_tag_lock(thread_tag_mutex);
    auto thread_tag_iterator = thread_tags.find(std::this_thread::get_id());
    return thread_tag_iterator != thread_tags.end() ? thread_tag_iterator->second : DEFAULT_THREAD_TAG;
}

void LoggingContext::set_thread_tag(const std::string& thread_tag) {
    std::lock_guard<std::mutex> thread_tag_lock(thread_tag_mutex);
    thread_tags[std::this_thread::get_id()] = format_thread_tag(thread_tag);
}

void LoggingContext::clear_thread_tag() {
    std::lock_guard<std::mutex> thread_tag_lock(thread_tag_mutex);
    thread_tags.erase(std::this_thread::get_id());
}

size_t LoggingContext::get_thread_tag_count() const {
    std::lock_guard<std::mutex> thread_tag_lock(thread_tag_mutex);
    return thread_tags.size();
}

ScopedThreadTag::ScopedThreadTag(LoggingContext& logging_context, const std::string& thread_tag) : context(logging_context) {
    set_logging_context(context);
    context.set_thread_tag(thread_tag);
}

ScopedThreadTag::~ScopedThreadTag() {
    context.clear_thread_tag();
}

LoggingContext* get_logging_context() {
    if (!current_logging_context) {
        throw std::runtime_error("Logging context not initialized for current thread");
    }
    return current_logging_context;
}

bool has_logging_context() {
    return current_logging_context != nullptr;
}

void set_logging_context(LoggingContext& context) {
    current_logging_context = &context;
}

void set_log_thread_tag(const std::string& thread_tag) {
    get_logging_context()->set_thread_tag(thread_tag);
}

// ========================================================================
// MESSAGES
// ========================================================================

void log_message(const std::string& message, const std::string& log_file_path) {
    if (!current_logging_context) {
        std::cerr << message << std::endl;
        return;
    }

    std::string log_line = format_log_line(current_logging_context->get_thread_tag(), message);
    if (current_logging_context->async_logger && current_logging_context->async_logger->is_running()) {
        current_logging_context->async_logger->enqueue(log_line);
        return;
    }

    {
        std::lock_guard<std::mutex> console_lock(current_logging_context->console_mutex);
        std::cerr << log_line << std::flush;
    }
    if (!log_file_path.empty()) {
        std::ofstream log_file_stream(log_file_path, std::ios::app);
        if (!log_file_stream.is_open()) {
            std::cerr << "ERROR: Failed to open log file: " << log_file_path << std::endl;
            return;
        }
        log_file_stream << log_line;
    }
}

std::string generate_timestamped_log_filename(const std::string& base_filename) {
    size_t slash_position = base_filename.find_last_of('/');
    size_t dot_position = base_filename.find_last_of('.');
    bool has_extension = dot_position != std::string::npos && (slash_position == std::string::npos || dot_position > slash_position);

    std::string base_name = has_extension ? base_filename.substr(0, dot_position) : base_filename;
    std::string extension = has_extension ? base_filename.substr(dot_position) : "";
    return base_name + "_" + format_local_run_stamp() + extension;
}

// ========================================================================
// ASYNC LOGGER
// ========================================================================

void AsyncLogger::start() {
    running.store(true);
}

void AsyncLogger::stop() {
    {
        std::lock_guard<std::mutex> queue_lock(queue_mutex);
        running.store(false);
    }
    queue_condition.notify_all();
}

void AsyncLogger::enqueue(const std::string& formatted_line) {
    {
        std::lock_guard<std::mutex> queue_lock(queue_mutex);
        line_queue.push_back(formatted_line);
    }
    queue_condition.notify_one();
}

void AsyncLogger::wait_for_lines(std::vector<std::string>& pending_lines, int poll_interval_milliseconds) {
    std::unique_lock<std::mutex> queue_lock(queue_mutex);
    // Bounded so a stop() on an empty queue is still noticed
    queue_condition.wait_for(queue_lock, std::chrono::milliseconds(poll_interval_milliseconds),
                             [this]() { return !line_queue.empty() || !running.load(); });
    while (!line_queue.empty()) {
        pending_lines.push_back(std::move(line_queue.front()));
        line_queue.pop_front();
    }
}

void AsyncLogger::take_remaining_lines(std::vector<std::string>& pending_lines) {
    std::lock_guard<std::mutex> queue_lock(queue_mutex);
    while (!line_queue.empty()) {
        pending_lines.push_back(std::move(line_queue.front()));
        line_queue.pop_front();
    }
}

// ========================================================================
// LIFECYCLE
// ========================================================================

std::shared_ptr<AsyncLogger> initialize_analysis_logging(const StockAdvisor::Config::SystemConfig& config) {
    LoggingContext* logging_context = get_logging_context();

    std::string log_file_path;
    if (config.logging.file_logging_enabled) {
        logging_context->run_folder = create_run_folder(config.logging.log_directory);
        std::string log_file_name = std::filesystem::path(config.logging.log_file).filename().string();
        log_file_path = generate_timestamped_log_filename(logging_context->run_folder + "/" + log_file_name);
    }

    std::shared_ptr<AsyncLogger> async_logger = std::make_shared<AsyncLogger>(log_file_path);
    async_logger->start();
    logging_context->async_logger = async_logger;
    set_log_thread_tag(DEFAULT_THREAD_TAG);
    return async_logger;
}

void shutdown_analysis_logging(AsyncLogger& logger) {
    logger.stop();
}

} // namespace Logging
} // namespace StockAdvisor
