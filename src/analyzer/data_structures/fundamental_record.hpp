#ifndef FUNDAMENTAL_RECORD_HPP
#define FUNDAMENTAL_RECORD_HPP

#include <optional>
#include <string>
#include <vector>

namespace StockAdvisor {
namespace Core {

// Absent metrics stay empty; nothing downstream may read an absent metric as zero.
using MetricValue = std::optional<double>;

/**
 * Company financial metrics as delivered by a market data provider.
 * Ratios are plain fractions (0.15 = 15%), debt_to_equity included.
 */
struct FundamentalRecord {
    std::string symbol;
    std::string company_name;
    std::string sector;
    std::string industry;

    // Size and price
    MetricValue market_cap;
    MetricValue current_price;
    MetricValue enterprise_value;
    MetricValue shares_outstanding;

    // Valuation multiples
    MetricValue pe_ratio;
    MetricValue forward_pe;
    MetricValue pb_ratio;
    MetricValue price_to_sales;
    MetricValue peg_ratio;
    MetricValue enterprise_to_ebitda;

    // Profitability
    MetricValue roe;
    MetricValue roa;
    MetricValue gross_margin;
    MetricValue operating_margin;
    MetricValue net_margin;

    // Growth
    MetricValue revenue_growth;
    MetricValue earnings_growth;

    // Financial health
    MetricValue debt_to_equity;
    MetricValue current_ratio;
    MetricValue quick_ratio;
    MetricValue interest_coverage;
    MetricValue beta;

    // Per-share and cash flow
    MetricValue earnings_per_share;
    MetricValue book_value_per_share;
    MetricValue cash_per_share;
    MetricValue free_cash_flow;

    // Dividends
    MetricValue dividend_yield;
    MetricValue dividend_per_share;
    MetricValue dividend_growth;
};

// Named access to every numeric field, in a fixed order.
struct FundamentalField {
    const char* name;
    MetricValue FundamentalRecord::* member;
    bool lower_is_better;
};

const std::vector<FundamentalField>& get_fundamental_fields();
const FundamentalField* find_fundamental_field(const std::string& field_name);

} // namespace Core
} // namespace StockAdvisor

#endif // FUNDAMENTAL_RECORD_HPP
