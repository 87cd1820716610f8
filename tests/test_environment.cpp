#include "logging/logger/async_logger.hpp"
#include <gtest/gtest.h>

namespace {

// Without an async logger every line goes straight to stderr, keeping test output readable.
class LoggingEnvironment : public ::testing::Environment {
public:
    void SetUp() override {
        StockAdvisor::Logging::set_logging_context(logging_context);
        StockAdvisor::Logging::set_log_thread_tag("TEST  ");
    }

private:
    StockAdvisor::Logging::LoggingContext logging_context;
};

::testing::Environment* const logging_environment = ::testing::AddGlobalTestEnvironment(new LoggingEnvironment);

} // anonymous namespace
