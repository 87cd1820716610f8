#include "valuation_models.hpp"
#include "analyzer/data_structures/analysis_errors.hpp"
#include <cmath>
#include <iomanip>
#include <sstream>

namespace StockAdvisor {
namespace Core {

namespace {

double require_metric(const MetricValue& metric_value, const std::string& field_name) {
    if (!metric_value || !std::isfinite(*metric_value)) {
        throw MissingFieldError(field_name, field_name + " not reported");
    }
    return *metric_value;
}

std::string format_rate(double rate_value) {
    std::ostringstream rate_stream;
    rate_stream << std::fixed << std::setprecision(2) << rate_value * 100.0 << "%";
    return rate_stream.str();
}

void record_discount_assumptions(const DiscountRate& discount_rate, const ValuationConfig& config, ValuationEstimate& estimate) {
    estimate.assumptions["discount_rate"] = discount_rate.rate;
    estimate.assumptions["beta"] = discount_rate.beta;
    estimate.assumptions["beta_assumed"] = discount_rate.beta_assumed ? 1.0 : 0.0;
    estimate.assumptions["risk_free_rate"] = config.risk_free_rate;
    estimate.assumptions["equity_risk_premium"] = config.equity_risk_premium;
    estimate.assumptions["horizon_years"] = static_cast<double>(config.dcf_horizon_years);
    estimate.assumptions["terminal_growth_rate"] = config.terminal_growth_rate;
}

void finalize_estimate(double fair_value, const FundamentalRecord& record, ValuationEstimate& estimate) {
    if (!std::isfinite(fair_value) || fair_value <= 0.0) {
        throw DivergentModelError("model produced a non-positive value");
    }
    estimate.applicable = true;
    estimate.fair_value = fair_value;
    if (record.current_price && *record.current_price > 0.0) {
        estimate.upside = fair_value / *record.current_price - 1.0;
    }
}

} // anonymous namespace

DiscountRate compute_discount_rate(const FundamentalRecord& record, const ValuationConfig& config) {
    DiscountRate discount_rate;
    if (record.beta && std::isfinite(*record.beta)) {
        discount_rate.beta = *record.beta;
    } else {
        discount_rate.beta = config.default_beta;
        discount_rate.beta_assumed = true;
    }
    discount_rate.rate = config.risk_free_rate + discount_rate.beta * config.equity_risk_premium;
    return discount_rate;
}

double compute_two_stage_value(double base_cash_flow, double growth_rate, double discount_rate,
                               int horizon_years, double terminal_growth_rate) {
    if (growth_rate >= discount_rate) {
        throw DivergentModelError("growth " + format_rate(growth_rate) + " not below discount rate " + format_rate(discount_rate));
    }
    if (terminal_growth_rate >= discount_rate) {
        throw DivergentModelError("terminal growth " + format_rate(terminal_growth_rate) + " not below discount rate " + format_rate(discount_rate));
    }

    double present_value = 0.0;
    double projected_cash_flow = base_cash_flow;
    double discount_factor = 1.0;
    for (int year = 1; year <= horizon_years; ++year) {
        projected_cash_flow *= 1.0 + growth_rate;
        discount_factor *= 1.0 + discount_rate;
        present_value += projected_cash_flow / discount_factor;
    }

    double terminal_value = projected_cash_flow * (1.0 + terminal_growth_rate) / (discount_rate - terminal_growth_rate);
    return present_value + terminal_value / discount_factor;
}

ValuationEstimate estimate_dcf(const FundamentalRecord& record, const ValuationConfig& config) {
    ValuationEstimate estimate;
    estimate.model = ValuationModel::DCF;
    DiscountRate discount_rate = compute_discount_rate(record, config);
    record_discount_assumptions(discount_rate, config, estimate);

    try {
        double free_cash_flow = require_metric(record.free_cash_flow, "free_cash_flow");
        double shares_outstanding = require_metric(record.shares_outstanding, "shares_outstanding");
        if (shares_outstanding <= 0.0) {
            throw DivergentModelError("shares_outstanding must be positive");
        }
        double growth_rate = 0.0;
        if (record.earnings_growth && std::isfinite(*record.earnings_growth)) {
            growth_rate = *record.earnings_growth;
        } else if (record.revenue_growth && std::isfinite(*record.revenue_growth)) {
            growth_rate = *record.revenue_growth;
        } else {
            throw MissingFieldError("earnings_growth", "earnings_growth and revenue_growth not reported");
        }

        double free_cash_flow_per_share = free_cash_flow / shares_outstanding;
        estimate.assumptions["free_cash_flow_per_share"] = free_cash_flow_per_share;
        estimate.assumptions["growth_rate"] = growth_rate;

        double fair_value = compute_two_stage_value(free_cash_flow_per_share, growth_rate, discount_rate.rate,
                                                    config.dcf_horizon_years, config.terminal_growth_rate);
        finalize_estimate(fair_value, record, estimate);
    } catch (const MissingFieldError& missing_field_error) {
        estimate.inapplicable_reason = missing_field_error.what();
    } catch (const DivergentModelError& divergent_model_error) {
        estimate.inapplicable_reason = divergent_model_error.what();
    }
    return estimate;
}

ValuationEstimate estimate_ddm(const FundamentalRecord& record, const ValuationConfig& config) {
    ValuationEstimate estimate;
    estimate.model = ValuationModel::DDM;
    DiscountRate discount_rate = compute_discount_rate(record, config);
    record_discount_assumptions(discount_rate, config, estimate);

    double dividend_per_share = 0.0;
    if (record.dividend_per_share && std::isfinite(*record.dividend_per_share)) {
        dividend_per_share = *record.dividend_per_share;
    } else if (record.dividend_yield && record.current_price && std::isfinite(*record.dividend_yield)) {
        dividend_per_share = *record.dividend_yield * *record.current_price;
    }
    if (dividend_per_share <= 0.0) {
        estimate.inapplicable_reason = "no dividend paid";
        return estimate;
    }

    double growth_rate = config.terminal_growth_rate;
    if (record.dividend_growth && std::isfinite(*record.dividend_growth)) {
        growth_rate = *record.dividend_growth;
    } else if (record.earnings_growth && std::isfinite(*record.earnings_growth)) {
        growth_rate = *record.earnings_growth;
    }
    estimate.assumptions["dividend_per_share"] = dividend_per_share;
    estimate.assumptions["growth_rate"] = growth_rate;

    try {
        double fair_value = compute_two_stage_value(dividend_per_share, growth_rate, discount_rate.rate,
                                                    config.dcf_horizon_years, config.terminal_growth_rate);
        finalize_estimate(fair_value, record, estimate);
    } catch (const DivergentModelError& divergent_model_error) {
        estimate.inapplicable_reason = divergent_model_error.what();
    }
    return estimate;
}

std::vector<ValuationEstimate> run_valuation_models(const FundamentalRecord& record, const ValuationConfig& config) {
    std::vector<ValuationEstimate> valuation_estimates;
    valuation_estimates.push_back(estimate_dcf(record, config));
    valuation_estimates.push_back(estimate_ddm(record, config));
    return valuation_estimates;
}

} // namespace Core
} // namespace StockAdvisor
