#ifndef LOGGING_MACROS_HPP
#define LOGGING_MACROS_HPP

#include "async_logger.hpp"
#include <string>

namespace StockAdvisor {
namespace Logging {

// Two-column box tables: label column and value column widths, borders excluded
constexpr size_t TABLE_LABEL_WIDTH = 17;
constexpr size_t TABLE_VALUE_WIDTH = 48;

inline std::string fit_table_cell(const std::string& cell_text, size_t cell_width) {
    std::string fitted_cell = cell_text.substr(0, cell_width);
    fitted_cell.resize(cell_width, ' ');
    return fitted_cell;
}

inline std::string make_table_border(const char* left_corner, const char* middle_joint, const char* right_corner) {
    std::string border_line = left_corner;
    for (size_t column = 0; column < TABLE_LABEL_WIDTH + 2; ++column) border_line += "─";
    border_line += middle_joint;
    for (size_t column = 0; column < TABLE_VALUE_WIDTH + 2; ++column) border_line += "─";
    border_line += right_corner;
    return border_line;
}

inline std::string make_table_row(const std::string& label_text, const std::string& value_text) {
    return "│ " + fit_table_cell(label_text, TABLE_LABEL_WIDTH) + " │ " + fit_table_cell(value_text, TABLE_VALUE_WIDTH) + " │";
}

} // namespace Logging
} // namespace StockAdvisor

// Startup block (no indentation)
#define LOG_STARTUP_SECTION_HEADER(title) log_message("+-- " + std::string(title), "")
#define LOG_STARTUP_CONTENT(msg) log_message("|   " + std::string(msg), "")
#define LOG_STARTUP_SEPARATOR() log_message("|", "")

#define LOG_ANALYSIS_REQUEST_HEADER(symbol, period, interval) do { \
    log_message("", ""); \
    log_message(std::string(80, '='), ""); \
    log_message("                     ANALYSIS - " + std::string(symbol) + " (" + std::string(period) + " / " + std::string(interval) + ")", ""); \
    log_message(std::string(80, '='), ""); \
} while (0)

// Per-request sections
#define LOG_THREAD_SECTION_HEADER(title) log_message("+-- " + std::string(title), "")
#define LOG_THREAD_CONTENT(msg) log_message("|   " + std::string(msg), "")
#define LOG_THREAD_SECTION_FOOTER() log_message("+-- ", "")

#define LOG_THREAD_TECHNICAL_HEADER(symbol) LOG_THREAD_SECTION_HEADER("TECHNICAL ANALYSIS - " + std::string(symbol))
#define LOG_THREAD_FUNDAMENTAL_HEADER(symbol) LOG_THREAD_SECTION_HEADER("FUNDAMENTAL ANALYSIS - " + std::string(symbol))
#define LOG_THREAD_RECOMMENDATION_HEADER(symbol) LOG_THREAD_SECTION_HEADER("RECOMMENDATION - " + std::string(symbol))

// Boxed label / value tables
#define TABLE_HEADER_48(title, subtitle) do { \
    LOG_THREAD_CONTENT(StockAdvisor::Logging::make_table_border("┌", "┬", "┐")); \
    LOG_THREAD_CONTENT(StockAdvisor::Logging::make_table_row(title, subtitle)); \
    LOG_THREAD_CONTENT(StockAdvisor::Logging::make_table_border("├", "┼", "┤")); \
} while (0)

#define TABLE_ROW_48(label, value) LOG_THREAD_CONTENT(StockAdvisor::Logging::make_table_row(label, value))
#define TABLE_SEPARATOR_48() LOG_THREAD_CONTENT(StockAdvisor::Logging::make_table_border("├", "┼", "┤"))
#define TABLE_FOOTER_48() LOG_THREAD_CONTENT(StockAdvisor::Logging::make_table_border("└", "┴", "┘"))

#endif // LOGGING_MACROS_HPP
