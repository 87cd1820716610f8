#include "peer_comparison.hpp"
#include <cmath>

namespace StockAdvisor {
namespace Core {

namespace {

bool is_better_value(double candidate_value, double reference_value, bool lower_is_better) {
    return lower_is_better ? candidate_value < reference_value : candidate_value > reference_value;
}

} // anonymous namespace

PeerComparison compare_with_peers(const FundamentalRecord& stock_record, const std::vector<FundamentalRecord>& peer_records) {
    PeerComparison peer_comparison;
    for (const FundamentalRecord& peer_record : peer_records) {
        peer_comparison.peer_symbols.push_back(peer_record.symbol);
    }

    for (const FundamentalField& fundamental_field : get_fundamental_fields()) {
        const MetricValue& stock_metric = stock_record.*(fundamental_field.member);
        if (!stock_metric || !std::isfinite(*stock_metric)) continue;

        std::vector<double> peer_values;
        for (const FundamentalRecord& peer_record : peer_records) {
            const MetricValue& peer_metric = peer_record.*(fundamental_field.member);
            if (peer_metric && std::isfinite(*peer_metric)) {
                peer_values.push_back(*peer_metric);
            }
        }
        if (peer_values.empty()) continue;

        PeerMetricComparison metric_comparison;
        metric_comparison.metric = fundamental_field.name;
        metric_comparison.stock_value = *stock_metric;
        metric_comparison.lower_is_better = fundamental_field.lower_is_better;

        double peer_sum = 0.0;
        int better_peer_count = 0;
        int at_or_below_count = 1;
        for (double peer_value : peer_values) {
            peer_sum += peer_value;
            if (is_better_value(peer_value, *stock_metric, fundamental_field.lower_is_better)) {
                ++better_peer_count;
            } else {
                ++at_or_below_count;
            }
        }

        metric_comparison.peer_average = peer_sum / static_cast<double>(peer_values.size());
        metric_comparison.difference = *stock_metric - metric_comparison.peer_average;
        if (metric_comparison.peer_average != 0.0) {
            metric_comparison.percent_difference = metric_comparison.difference / metric_comparison.peer_average * 100.0;
        }
        metric_comparison.compared_count = static_cast<int>(peer_values.size()) + 1;
        metric_comparison.rank = better_peer_count + 1;
        metric_comparison.percentile = static_cast<double>(at_or_below_count) / metric_comparison.compared_count * 100.0;

        peer_comparison.metrics.push_back(metric_comparison);
    }

    return peer_comparison;
}

} // namespace Core
} // namespace StockAdvisor
