#ifndef FUNDAMENTAL_CONFIG_HPP
#define FUNDAMENTAL_CONFIG_HPP

namespace StockAdvisor {
namespace Config {

struct FundamentalConfig {
    // Category weights for the composite score
    double valuation_weight = 0.25;
    double profitability_weight = 0.25;
    double growth_weight = 0.25;
    double financial_health_weight = 0.25;

    // Absolute screening thresholds
    double max_pe_ratio = 100.0;                     // P/E at or above this scores zero
    double min_market_cap = 1e9;                     // Below this the company is flagged as small
    double small_cap_opportunity_limit = 1e10;       // Market cap below this is a growth opportunity

    // Report thresholds
    double strength_score = 70.0;                    // Category at or above this is a strength
    double weakness_score = 50.0;                    // Category below this is a weakness
    double risk_debt_to_equity = 1.0;                // D/E above this is a risk
    double risk_pe_ratio = 30.0;                     // P/E above this is a valuation risk
    double risk_beta = 1.5;                          // Beta above this is a volatility risk
    double opportunity_pe_ratio = 15.0;              // P/E below this is an opportunity
    double opportunity_revenue_growth = 0.15;        // Revenue growth above this is an opportunity
};

} // namespace Config
} // namespace StockAdvisor

#endif // FUNDAMENTAL_CONFIG_HPP
