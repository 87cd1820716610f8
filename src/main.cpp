// main.cpp
#include "analyzer/config_loader/config_loader.hpp"
#include "analyzer/coordinators/analysis_engine.hpp"
#include "analyzer/data_structures/analysis_errors.hpp"
#include "analyzer/serialization/result_serializer.hpp"
#include "api/file/csv_market_data_provider.hpp"
#include "logging/logger/async_logger.hpp"
#include "logging/logger/logging_thread.hpp"
#include "logging/logs/system_logs.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <thread>

using namespace StockAdvisor::Logging;

// Process exit codes
constexpr int EXIT_CODE_OK = 0;
constexpr int EXIT_CODE_FATAL = 1;
constexpr int EXIT_CODE_USAGE = 2;
constexpr int EXIT_CODE_NOT_FOUND = 3;

// =============================================================================
// COMMAND LINE
// =============================================================================

struct CommandLineOptions {
    StockAdvisor::Core::AnalysisRequest request;
    std::string data_directory = "data";
    std::string config_directory = "config";
    std::string output_path;        // Empty = stdout
};

class UsageError : public std::runtime_error {
public:
    explicit UsageError(const std::string& error_message) : std::runtime_error(error_message) {}
};

static void print_usage(std::ostream& output_stream) {
    output_stream << "Usage: stock_advisor <SYMBOL> [--data DIR] [--config DIR] [--period P] [--interval I]\n"
                  << "                     [--peers A,B,C] [--output FILE]\n"
                  << "  --period    5d, 1mo, 3mo, 6mo, 1y, 2y, 5y, 10y, ytd, max (default 1y)\n"
                  << "  --interval  1d, 1wk, 1mo, 1h, ... (default 1d)\n";
}

static std::string to_upper_symbol(std::string symbol) {
    std::transform(symbol.begin(), symbol.end(), symbol.begin(), [](unsigned char symbol_char) {
        return static_cast<char>(std::toupper(symbol_char));
    });
    return symbol;
}

static std::vector<std::string> split_peer_list(const std::string& peer_list) {
    std::vector<std::string> peer_symbols;
    std::stringstream peer_stream(peer_list);
    std::string peer_symbol;
    while (std::getline(peer_stream, peer_symbol, ',')) {
        if (!peer_symbol.empty()) {
            peer_symbols.push_back(to_upper_symbol(peer_symbol));
        }
    }
    return peer_symbols;
}

static CommandLineOptions parse_command_line(int argc, char* argv[]) {
    CommandLineOptions options;
    for (int argument_index = 1; argument_index < argc; ++argument_index) {
        std::string argument = argv[argument_index];
        if (argument.rfind("--", 0) != 0) {
            if (!options.request.symbol.empty()) {
                throw UsageError("Unexpected argument: " + argument);
            }
            options.request.symbol = to_upper_symbol(argument);
            continue;
        }
        if (argument_index + 1 >= argc) {
            throw UsageError("Missing value for " + argument);
        }
        std::string option_value = argv[++argument_index];
        if (argument == "--data") options.data_directory = option_value;
        else if (argument == "--config") options.config_directory = option_value;
        else if (argument == "--period") options.request.period = option_value;
        else if (argument == "--interval") options.request.interval = option_value;
        else if (argument == "--peers") options.request.peer_symbols = split_peer_list(option_value);
        else if (argument == "--output") options.output_path = option_value;
        else throw UsageError("Unknown option: " + argument);
    }

    if (options.request.symbol.empty()) {
        throw UsageError("Symbol is required");
    }
    if (!StockAdvisor::API::CsvMarketDataProvider::is_supported_period(options.request.period)) {
        throw UsageError("Unsupported period: " + options.request.period);
    }
    if (!StockAdvisor::API::CsvMarketDataProvider::is_supported_interval(options.request.interval)) {
        throw UsageError("Unsupported interval: " + options.request.interval);
    }
    return options;
}

// =============================================================================
// LOGGING SESSION - owns the logging thread for the lifetime of main
// =============================================================================

class LoggingSession {
public:
    LoggingSession(LoggingContext& logging_context, const StockAdvisor::Config::SystemConfig& config)
        : context(logging_context),
          logger(initialize_analysis_logging(config)),
          logging_thread(LoggingThread(logger, logging_context, config.logging)) {}

    // Drains the queue, then routes later lines straight to the console
    ~LoggingSession() {
        shutdown_analysis_logging(*logger);
        if (logging_thread.joinable()) {
            logging_thread.join();
        }
        context.async_logger.reset();
    }

    LoggingSession(const LoggingSession&) = delete;
    LoggingSession& operator=(const LoggingSession&) = delete;

private:
    LoggingContext& context;
    std::shared_ptr<AsyncLogger> logger;
    std::thread logging_thread;
};

static void write_document(const std::string& document_text, const std::string& output_path) {
    if (output_path.empty()) {
        std::cout << document_text << std::endl;
        return;
    }
    std::ofstream output_file(output_path);
    if (!output_file.is_open()) {
        throw std::runtime_error("Cannot open output file: " + output_path);
    }
    output_file << document_text << '\n';
    if (!output_file) {
        throw std::runtime_error("Failed to write output file: " + output_path);
    }
}

// =============================================================================
// MAIN APPLICATION ENTRY POINT
// =============================================================================

int main(int argc, char* argv[]) {
    CommandLineOptions options;
    try {
        options = parse_command_line(argc, argv);
    } catch (const UsageError& usage_error) {
        std::cerr << "Error: " << usage_error.what() << "\n";
        print_usage(std::cerr);
        return EXIT_CODE_USAGE;
    }

    // Logging context must exist before any log_message call, config loading included
    LoggingContext logging_context;
    set_logging_context(logging_context);

    StockAdvisor::Config::SystemConfig config;
    try {
        load_system_config(config, options.config_directory);
    } catch (const StockAdvisor::Core::ConfigError& config_error) {
        SystemLogs::log_system_startup_error(config_error.what());
        return EXIT_CODE_FATAL;
    }

    try {
        LoggingSession logging_session(logging_context, config);
        SystemLogs::log_startup_banner(options.request.symbol, options.data_directory, options.config_directory);
        SystemLogs::log_configuration_summary(config);

        StockAdvisor::API::CsvMarketDataProvider provider(options.data_directory);
        StockAdvisor::Core::AnalysisEngine engine(config);
        StockAdvisor::Core::AnalysisResult analysis_result = engine.analyze(provider, options.request);

        StockAdvisor::Core::json document = StockAdvisor::Core::serialize_analysis(analysis_result, config.output.chart_history_bars);
        write_document(document.dump(config.output.json_indent), options.output_path);
        SystemLogs::log_result_written(options.output_path.empty() ? "stdout" : options.output_path);
        return EXIT_CODE_OK;
    } catch (const StockAdvisor::Core::NotFoundError& not_found_error) {
        SystemLogs::log_symbol_not_found(not_found_error.what());
        return EXIT_CODE_NOT_FOUND;
    } catch (const std::exception& exception_error) {
        SystemLogs::log_fatal_error(exception_error.what());
        return EXIT_CODE_FATAL;
    }
}
