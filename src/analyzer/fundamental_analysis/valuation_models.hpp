#ifndef VALUATION_MODELS_HPP
#define VALUATION_MODELS_HPP

#include <vector>
#include "configs/valuation_config.hpp"
#include "analyzer/data_structures/data_structures.hpp"
#include "analyzer/data_structures/fundamental_record.hpp"

using StockAdvisor::Config::ValuationConfig;

namespace StockAdvisor {
namespace Core {

struct DiscountRate {
    double rate;
    double beta;
    bool beta_assumed;           // Record had no beta, configured default used

    DiscountRate() : rate(0.0), beta(0.0), beta_assumed(false) {}
};

// CAPM: risk_free_rate + beta * equity_risk_premium.
DiscountRate compute_discount_rate(const FundamentalRecord& record, const ValuationConfig& config);

/**
 * Present value of a per-share cash stream growing at growth_rate for horizon_years,
 * plus a Gordon terminal value at terminal_growth_rate.
 * Throws DivergentModelError when either growth rate reaches the discount rate.
 */
double compute_two_stage_value(double base_cash_flow, double growth_rate, double discount_rate,
                               int horizon_years, double terminal_growth_rate);

// Discounted free cash flow per share.
ValuationEstimate estimate_dcf(const FundamentalRecord& record, const ValuationConfig& config);

// Dividend discount model.
ValuationEstimate estimate_ddm(const FundamentalRecord& record, const ValuationConfig& config);

// DCF then DDM. A model whose inputs do not support it is returned inapplicable with its reason.
std::vector<ValuationEstimate> run_valuation_models(const FundamentalRecord& record, const ValuationConfig& config);

} // namespace Core
} // namespace StockAdvisor

#endif // VALUATION_MODELS_HPP
