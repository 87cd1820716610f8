#include "extrema.hpp"
#include <algorithm>

namespace StockAdvisor {
namespace Core {

namespace {

bool is_window_peak(const std::vector<double>& highs, size_t bar_index, size_t window_size) {
    for (size_t neighbor_index = bar_index - window_size; neighbor_index <= bar_index + window_size; ++neighbor_index) {
        if (neighbor_index == bar_index) continue;
        if (neighbor_index < bar_index && highs[neighbor_index] >= highs[bar_index]) return false;
        if (neighbor_index > bar_index && highs[neighbor_index] > highs[bar_index]) return false;
    }
    return true;
}

bool is_window_trough(const std::vector<double>& lows, size_t bar_index, size_t window_size) {
    for (size_t neighbor_index = bar_index - window_size; neighbor_index <= bar_index + window_size; ++neighbor_index) {
        if (neighbor_index == bar_index) continue;
        if (neighbor_index < bar_index && lows[neighbor_index] <= lows[bar_index]) return false;
        if (neighbor_index > bar_index && lows[neighbor_index] < lows[bar_index]) return false;
    }
    return true;
}

} // anonymous namespace

std::vector<PriceExtremum> find_local_extrema(const Series& series, size_t first_index, int window_size, double min_prominence_pct) {
    std::vector<PriceExtremum> extrema;
    if (window_size < 1) {
        return extrema;
    }

    size_t window_length = static_cast<size_t>(window_size);
    if (series.size() < 2 * window_length + 1) {
        return extrema;
    }

    const std::vector<double>& highs = series.highs();
    const std::vector<double>& lows = series.lows();
    size_t scan_start_index = std::max(first_index, window_length);

    for (size_t bar_index = scan_start_index; bar_index + window_length < series.size(); ++bar_index) {
        std::vector<double>::const_iterator window_begin_low = lows.begin() + (bar_index - window_length);
        std::vector<double>::const_iterator window_end_low = lows.begin() + (bar_index + window_length + 1);
        std::vector<double>::const_iterator window_begin_high = highs.begin() + (bar_index - window_length);
        std::vector<double>::const_iterator window_end_high = highs.begin() + (bar_index + window_length + 1);

        if (is_window_peak(highs, bar_index, window_length)) {
            double window_low = *std::min_element(window_begin_low, window_end_low);
            double prominence = (highs[bar_index] - window_low) / highs[bar_index];
            if (prominence >= min_prominence_pct) {
                extrema.emplace_back(bar_index, highs[bar_index], ExtremumKind::PEAK);
            }
        }
        if (is_window_trough(lows, bar_index, window_length)) {
            double window_high = *std::max_element(window_begin_high, window_end_high);
            double prominence = (window_high - lows[bar_index]) / lows[bar_index];
            if (prominence >= min_prominence_pct) {
                extrema.emplace_back(bar_index, lows[bar_index], ExtremumKind::TROUGH);
            }
        }
    }

    return extrema;
}

std::vector<PriceExtremum> alternate_extrema(const std::vector<PriceExtremum>& extrema) {
    std::vector<PriceExtremum> alternating_extrema;
    for (const PriceExtremum& extremum : extrema) {
        if (alternating_extrema.empty() || alternating_extrema.back().kind != extremum.kind) {
            alternating_extrema.push_back(extremum);
            continue;
        }
        PriceExtremum& previous_extremum = alternating_extrema.back();
        bool replaces_previous = extremum.kind == ExtremumKind::PEAK ? extremum.price > previous_extremum.price
                                                                      : extremum.price < previous_extremum.price;
        if (replaces_previous) {
            previous_extremum = extremum;
        }
    }
    return alternating_extrema;
}

} // namespace Core
} // namespace StockAdvisor
