#include "logging/logger/async_logger.hpp"
#include <gtest/gtest.h>
#include <future>

using namespace StockAdvisor::Logging;

TEST(AsyncLoggerTest, ThreadTagsArePaddedOrCut) {
    EXPECT_EQ(format_thread_tag("IO"), "IO    ");
    EXPECT_EQ(format_thread_tag("FUNDAMENTAL"), "FUNDAM");
}

TEST(AsyncLoggerTest, ScopedThreadTagIsErasedWhenTheWorkerFinishes) {
    LoggingContext logging_context;
    std::future<std::string> worker_future = std::async(std::launch::async, [&logging_context]() {
        ScopedThreadTag worker_tag(logging_context, "WORKER");
        EXPECT_EQ(logging_context.get_thread_tag_count(), 1u);
        return logging_context.get_thread_tag();
    });

    EXPECT_EQ(worker_future.get(), "WORKER");
    EXPECT_EQ(logging_context.get_thread_tag_count(), 0u);
    EXPECT_EQ(logging_context.get_thread_tag(), DEFAULT_THREAD_TAG);
}

TEST(AsyncLoggerTest, QueuedLinesAreTakenInOrder) {
    AsyncLogger logger("");
    logger.start();
    logger.enqueue("first\n");
    logger.enqueue("second\n");

    std::vector<std::string> pending_lines;
    logger.wait_for_lines(pending_lines, 10);
    ASSERT_EQ(pending_lines.size(), 2u);
    EXPECT_EQ(pending_lines[0], "first\n");
    EXPECT_EQ(pending_lines[1], "second\n");

    logger.stop();
    EXPECT_FALSE(logger.is_running());
    pending_lines.clear();
    logger.take_remaining_lines(pending_lines);
    EXPECT_TRUE(pending_lines.empty());
}

TEST(AsyncLoggerTest, TimestampedFileNameKeepsTheExtension) {
    std::string file_name = generate_timestamped_log_filename("runtime_logs/analysis.log");
    EXPECT_EQ(file_name.rfind("runtime_logs/analysis_", 0), 0u);
    EXPECT_EQ(file_name.substr(file_name.size() - 4), ".log");
}
