#ifndef ANALYSIS_ERRORS_HPP
#define ANALYSIS_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace StockAdvisor {
namespace Core {

/**
 * Root of all analysis failures. Components throw the most specific subclass;
 * callers that only need the message catch std::runtime_error as elsewhere.
 */
class AnalysisError : public std::runtime_error {
public:
    explicit AnalysisError(const std::string& error_message) : std::runtime_error(error_message) {}
};

// Series empty or all-NaN, or an indicator lookback longer than the series.
class DataInsufficientError : public AnalysisError {
public:
    explicit DataInsufficientError(const std::string& error_message) : AnalysisError(error_message) {}
};

// Malformed bar (OHLC inconsistency, negative volume, non-finite value) or bad ordering.
class InvalidSeriesError : public AnalysisError {
public:
    explicit InvalidSeriesError(const std::string& error_message) : AnalysisError(error_message) {}
};

// A metric required by a scoring or valuation step is absent from the record.
class MissingFieldError : public AnalysisError {
public:
    MissingFieldError(const std::string& field, const std::string& error_message)
        : AnalysisError(error_message), field_name(field) {}

    const std::string& get_field_name() const { return field_name; }

private:
    std::string field_name;
};

// Valuation inputs that make a model meaningless (growth >= discount, non-positive value).
class DivergentModelError : public AnalysisError {
public:
    explicit DivergentModelError(const std::string& error_message) : AnalysisError(error_message) {}
};

// Unknown symbol or no data source for it.
class NotFoundError : public AnalysisError {
public:
    explicit NotFoundError(const std::string& error_message) : AnalysisError(error_message) {}
};

// Unreadable or out-of-range configuration.
class ConfigError : public AnalysisError {
public:
    explicit ConfigError(const std::string& error_message) : AnalysisError(error_message) {}
};

} // namespace Core
} // namespace StockAdvisor

#endif // ANALYSIS_ERRORS_HPP
