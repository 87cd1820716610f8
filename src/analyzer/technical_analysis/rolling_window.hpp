#ifndef ROLLING_WINDOW_HPP
#define ROLLING_WINDOW_HPP

#include <cmath>
#include <deque>
#include <optional>
#include <utility>

namespace StockAdvisor {
namespace Core {

// ========================================================================
// SLIDING-WINDOW ACCUMULATORS
// Each push() is O(1) amortized, so every indicator is O(n) over the series.
// ========================================================================

/**
 * Fixed-size window keeping mean and population variance.
 * Uses the sliding Welford update so large price levels do not cancel out small variances.
 */
class RollingMeanVariance {
public:
    explicit RollingMeanVariance(int window_size) : window_length(window_size), running_mean(0.0), sum_squared_deviation(0.0) {}

    void push(double value) {
        if (static_cast<int>(window_values.size()) < window_length) {
            window_values.push_back(value);
            double previous_mean = running_mean;
            running_mean += (value - previous_mean) / static_cast<double>(window_values.size());
            sum_squared_deviation += (value - previous_mean) * (value - running_mean);
            return;
        }
        double removed_value = window_values.front();
        window_values.pop_front();
        window_values.push_back(value);
        double previous_mean = running_mean;
        running_mean += (value - removed_value) / static_cast<double>(window_length);
        sum_squared_deviation += (value - removed_value) * (value - running_mean + removed_value - previous_mean);
        if (sum_squared_deviation < 0.0) {
            sum_squared_deviation = 0.0;
        }
    }

    bool full() const { return static_cast<int>(window_values.size()) == window_length; }
    double mean() const { return running_mean; }
    double variance() const { return window_values.empty() ? 0.0 : sum_squared_deviation / static_cast<double>(window_values.size()); }
    double standard_deviation() const { return std::sqrt(variance()); }
    const std::deque<double>& values() const { return window_values; }

private:
    int window_length;
    double running_mean;
    double sum_squared_deviation;
    std::deque<double> window_values;
};

// Fixed-size window keeping a running sum.
class RollingSum {
public:
    explicit RollingSum(int window_size) : window_length(window_size), running_sum(0.0) {}

    void push(double value) {
        window_values.push_back(value);
        running_sum += value;
        if (static_cast<int>(window_values.size()) > window_length) {
            running_sum -= window_values.front();
            window_values.pop_front();
        }
    }

    bool full() const { return static_cast<int>(window_values.size()) == window_length; }
    double sum() const { return running_sum; }
    double mean() const { return window_values.empty() ? 0.0 : running_sum / static_cast<double>(window_values.size()); }

private:
    int window_length;
    double running_sum;
    std::deque<double> window_values;
};

/**
 * Sliding maximum (or minimum) over the last window_size pushes, via a monotonic deque.
 */
class RollingExtremum {
public:
    RollingExtremum(int window_size, bool track_maximum)
        : window_length(window_size), is_maximum(track_maximum), push_count(0) {}

    void push(double value) {
        while (!candidates.empty() && dominates(value, candidates.back().second)) {
            candidates.pop_back();
        }
        candidates.emplace_back(push_count, value);
        ++push_count;
        while (candidates.front().first <= push_count - 1 - window_length) {
            candidates.pop_front();
        }
    }

    bool full() const { return push_count >= window_length; }
    double value() const { return candidates.front().second; }

private:
    bool dominates(double incoming_value, double existing_value) const {
        return is_maximum ? incoming_value >= existing_value : incoming_value <= existing_value;
    }

    long long window_length;
    bool is_maximum;
    long long push_count;
    std::deque<std::pair<long long, double>> candidates;
};

/**
 * Exponential average seeded with the simple mean of the first period values.
 * Returns no value until the seed window is complete.
 */
class ExponentialAverage {
public:
    explicit ExponentialAverage(int period)
        : seed_window(period), smoothing_factor(2.0 / (static_cast<double>(period) + 1.0)), seed_sum(0.0), seed_count(0), current_value() {}

    std::optional<double> push(double value) {
        if (current_value) {
            current_value = (value - *current_value) * smoothing_factor + *current_value;
            return current_value;
        }
        seed_sum += value;
        ++seed_count;
        if (seed_count == seed_window) {
            current_value = seed_sum / static_cast<double>(seed_window);
        }
        return current_value;
    }

private:
    int seed_window;
    double smoothing_factor;
    double seed_sum;
    int seed_count;
    std::optional<double> current_value;
};

/**
 * Wilder's smoothing: seeded with the simple mean of the first period values,
 * then average = (previous * (period - 1) + value) / period.
 */
class WilderAverage {
public:
    explicit WilderAverage(int period) : smoothing_period(period), seed_sum(0.0), seed_count(0), current_value() {}

    std::optional<double> push(double value) {
        if (current_value) {
            current_value = (*current_value * (smoothing_period - 1) + value) / static_cast<double>(smoothing_period);
            return current_value;
        }
        seed_sum += value;
        ++seed_count;
        if (seed_count == smoothing_period) {
            current_value = seed_sum / static_cast<double>(smoothing_period);
        }
        return current_value;
    }

private:
    int smoothing_period;
    double seed_sum;
    int seed_count;
    std::optional<double> current_value;
};

} // namespace Core
} // namespace StockAdvisor

#endif // ROLLING_WINDOW_HPP
