#ifndef EXTREMA_HPP
#define EXTREMA_HPP

#include <vector>
#include "analyzer/market_data/series.hpp"

namespace StockAdvisor {
namespace Core {

enum class ExtremumKind { PEAK, TROUGH };

struct PriceExtremum {
    size_t index;
    double price;              // High for a peak, low for a trough
    ExtremumKind kind;

    PriceExtremum() : index(0), price(0.0), kind(ExtremumKind::PEAK) {}
    PriceExtremum(size_t bar_index, double extremum_price, ExtremumKind extremum_kind)
        : index(bar_index), price(extremum_price), kind(extremum_kind) {}
};

/**
 * Local peaks (highs) and troughs (lows) with window_size bars on each side, starting at first_index.
 * A bar ties with an earlier bar of equal height only once, so flat tops yield one extremum.
 * Prominence is the swing within the window relative to the extremum price.
 * Result is ordered by bar index.
 */
std::vector<PriceExtremum> find_local_extrema(const Series& series, size_t first_index, int window_size, double min_prominence_pct);

// Collapses runs of same-kind extrema so peaks and troughs alternate (highest peak / lowest trough kept).
std::vector<PriceExtremum> alternate_extrema(const std::vector<PriceExtremum>& extrema);

} // namespace Core
} // namespace StockAdvisor

#endif // EXTREMA_HPP
