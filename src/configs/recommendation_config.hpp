#ifndef RECOMMENDATION_CONFIG_HPP
#define RECOMMENDATION_CONFIG_HPP

namespace StockAdvisor {
namespace Config {

struct RecommendationConfig {
    double technical_weight = 0.5;               // Blend weight of the technical branch (fundamental = 1 - this)
    double decision_threshold = 0.3;             // |final score| needed for buy / sell
    double single_branch_strength_cap = 0.6;     // Strength ceiling when only one branch is available
};

} // namespace Config
} // namespace StockAdvisor

#endif // RECOMMENDATION_CONFIG_HPP
