#ifndef VALUATION_CONFIG_HPP
#define VALUATION_CONFIG_HPP

namespace StockAdvisor {
namespace Config {

struct ValuationConfig {
    double risk_free_rate = 0.04;            // CAPM risk-free rate
    double equity_risk_premium = 0.055;      // CAPM market premium
    double default_beta = 1.0;               // Beta assumed when the record has none
    int dcf_horizon_years = 5;               // Explicit projection years for DCF and DDM
    double terminal_growth_rate = 0.025;     // Perpetual growth after the horizon
};

} // namespace Config
} // namespace StockAdvisor

#endif // VALUATION_CONFIG_HPP
