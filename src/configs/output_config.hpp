#ifndef OUTPUT_CONFIG_HPP
#define OUTPUT_CONFIG_HPP

namespace StockAdvisor {
namespace Config {

struct OutputConfig {
    int chart_history_bars = 100;    // Trailing indicator values included per indicator
    int json_indent = 2;             // Indentation of the written document (-1 = compact)
};

} // namespace Config
} // namespace StockAdvisor

#endif // OUTPUT_CONFIG_HPP
