#include "pattern_recognizer.hpp"
#include "candlestick_patterns.hpp"
#include "chart_patterns.hpp"
#include <algorithm>

namespace StockAdvisor {
namespace Core {

bool is_more_recent_pattern(const Pattern& first_pattern, const Pattern& second_pattern) {
    if (first_pattern.end_index != second_pattern.end_index) {
        return first_pattern.end_index > second_pattern.end_index;
    }
    if (first_pattern.start_index != second_pattern.start_index) {
        return first_pattern.start_index > second_pattern.start_index;
    }
    if (first_pattern.confidence != second_pattern.confidence) {
        return first_pattern.confidence > second_pattern.confidence;
    }
    return first_pattern.name < second_pattern.name;
}

std::vector<Pattern> recognize_patterns(const Series& series, const PatternConfig& config) {
    std::vector<Pattern> recognized_patterns;
    if (series.empty()) {
        return recognized_patterns;
    }

    recognized_patterns = detect_candlestick_patterns(series, config);
    std::vector<Pattern> chart_patterns = detect_chart_patterns(series, config);
    recognized_patterns.insert(recognized_patterns.end(), chart_patterns.begin(), chart_patterns.end());

    std::stable_sort(recognized_patterns.begin(), recognized_patterns.end(), is_more_recent_pattern);
    return recognized_patterns;
}

} // namespace Core
} // namespace StockAdvisor
