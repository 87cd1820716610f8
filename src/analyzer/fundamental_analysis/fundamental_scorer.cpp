#include "fundamental_scorer.hpp"
#include "analyzer/data_structures/analysis_errors.hpp"
#include <cmath>

namespace StockAdvisor {
namespace Core {

namespace {

double require_metric(const MetricValue& metric_value, const std::string& field_name) {
    if (!metric_value || !std::isfinite(*metric_value)) {
        throw MissingFieldError(field_name, field_name + " not reported");
    }
    return *metric_value;
}

// ========================================================================
// EXTRACTORS
// ========================================================================

double extract_pe_ratio(const FundamentalRecord& record) { return require_metric(record.pe_ratio, "pe_ratio"); }
double extract_pb_ratio(const FundamentalRecord& record) { return require_metric(record.pb_ratio, "pb_ratio"); }
double extract_price_to_sales(const FundamentalRecord& record) { return require_metric(record.price_to_sales, "price_to_sales"); }
double extract_peg_ratio(const FundamentalRecord& record) { return require_metric(record.peg_ratio, "peg_ratio"); }
double extract_enterprise_to_ebitda(const FundamentalRecord& record) { return require_metric(record.enterprise_to_ebitda, "enterprise_to_ebitda"); }
double extract_roe(const FundamentalRecord& record) { return require_metric(record.roe, "roe"); }
double extract_roa(const FundamentalRecord& record) { return require_metric(record.roa, "roa"); }
double extract_gross_margin(const FundamentalRecord& record) { return require_metric(record.gross_margin, "gross_margin"); }
double extract_operating_margin(const FundamentalRecord& record) { return require_metric(record.operating_margin, "operating_margin"); }
double extract_net_margin(const FundamentalRecord& record) { return require_metric(record.net_margin, "net_margin"); }
double extract_revenue_growth(const FundamentalRecord& record) { return require_metric(record.revenue_growth, "revenue_growth"); }
double extract_earnings_growth(const FundamentalRecord& record) { return require_metric(record.earnings_growth, "earnings_growth"); }
double extract_debt_to_equity(const FundamentalRecord& record) { return require_metric(record.debt_to_equity, "debt_to_equity"); }
double extract_current_ratio(const FundamentalRecord& record) { return require_metric(record.current_ratio, "current_ratio"); }
double extract_quick_ratio(const FundamentalRecord& record) { return require_metric(record.quick_ratio, "quick_ratio"); }
double extract_interest_coverage(const FundamentalRecord& record) { return require_metric(record.interest_coverage, "interest_coverage"); }
double extract_beta(const FundamentalRecord& record) { return require_metric(record.beta, "beta"); }

// Growth the market prices in between trailing and forward earnings.
double extract_forward_eps_growth(const FundamentalRecord& record) {
    double trailing_pe = require_metric(record.pe_ratio, "forward_eps_growth");
    double forward_pe = require_metric(record.forward_pe, "forward_eps_growth");
    if (trailing_pe <= 0.0 || forward_pe <= 0.0) {
        throw MissingFieldError("forward_eps_growth", "forward_eps_growth undefined for non-positive earnings");
    }
    return trailing_pe / forward_pe - 1.0;
}

// ========================================================================
// SCORERS
// ========================================================================

double score_pe_ratio(double pe_ratio, const FundamentalConfig& config) {
    // max_pe_ratio caps every band
    if (pe_ratio <= 0.0 || pe_ratio >= config.max_pe_ratio) return 0.0;
    if (pe_ratio < 15.0) return 100.0;
    if (pe_ratio < 25.0) return 67.0;
    if (pe_ratio < 35.0) return 33.0;
    return 10.0;
}

double score_price_multiple(double price_multiple, const FundamentalConfig&) {
    if (price_multiple <= 0.0) return 0.0;
    if (price_multiple < 1.0) return 100.0;
    if (price_multiple < 2.0) return 80.0;
    if (price_multiple < 3.0) return 40.0;
    return 0.0;
}

double score_peg_ratio(double peg_ratio, const FundamentalConfig&) {
    if (peg_ratio <= 0.0) return 0.0;
    if (peg_ratio >= 0.8 && peg_ratio <= 1.2) return 100.0;
    if (peg_ratio >= 0.5 && peg_ratio <= 2.0) return 75.0;
    return 25.0;
}

double score_enterprise_to_ebitda(double ev_to_ebitda, const FundamentalConfig&) {
    if (ev_to_ebitda <= 0.0) return 0.0;
    if (ev_to_ebitda < 10.0) return 100.0;
    if (ev_to_ebitda < 15.0) return 67.0;
    if (ev_to_ebitda < 20.0) return 33.0;
    return 0.0;
}

double score_roe(double roe, const FundamentalConfig&) {
    if (roe > 0.20) return 100.0;
    if (roe > 0.15) return 80.0;
    if (roe > 0.10) return 60.0;
    if (roe > 0.05) return 40.0;
    return 0.0;
}

double score_roa(double roa, const FundamentalConfig&) {
    if (roa > 0.15) return 100.0;
    if (roa > 0.10) return 75.0;
    if (roa > 0.05) return 50.0;
    if (roa > 0.0) return 25.0;
    return 0.0;
}

double score_gross_margin(double gross_margin, const FundamentalConfig&) {
    if (gross_margin > 0.40) return 100.0;
    if (gross_margin > 0.30) return 75.0;
    if (gross_margin > 0.20) return 50.0;
    if (gross_margin > 0.0) return 25.0;
    return 0.0;
}

double score_operating_margin(double operating_margin, const FundamentalConfig&) {
    if (operating_margin > 0.20) return 100.0;
    if (operating_margin > 0.15) return 75.0;
    if (operating_margin > 0.10) return 50.0;
    if (operating_margin > 0.0) return 25.0;
    return 0.0;
}

double score_net_margin(double net_margin, const FundamentalConfig&) {
    if (net_margin > 0.15) return 100.0;
    if (net_margin > 0.10) return 67.0;
    if (net_margin > 0.05) return 33.0;
    return 0.0;
}

double score_revenue_growth(double revenue_growth, const FundamentalConfig&) {
    if (revenue_growth > 0.20) return 100.0;
    if (revenue_growth > 0.15) return 83.0;
    if (revenue_growth > 0.10) return 67.0;
    if (revenue_growth > 0.05) return 50.0;
    if (revenue_growth > 0.0) return 33.0;
    return 0.0;
}

double score_earnings_growth(double earnings_growth, const FundamentalConfig&) {
    if (earnings_growth > 0.25) return 100.0;
    if (earnings_growth > 0.20) return 86.0;
    if (earnings_growth > 0.15) return 71.0;
    if (earnings_growth > 0.10) return 57.0;
    if (earnings_growth > 0.0) return 43.0;
    return 0.0;
}

double score_debt_to_equity(double debt_to_equity, const FundamentalConfig&) {
    // Negative equity
    if (debt_to_equity < 0.0) return 0.0;
    if (debt_to_equity < 0.3) return 100.0;
    if (debt_to_equity < 0.5) return 80.0;
    if (debt_to_equity < 0.7) return 60.0;
    if (debt_to_equity < 1.0) return 40.0;
    return 0.0;
}

double score_current_ratio(double current_ratio, const FundamentalConfig&) {
    if (current_ratio <= 0.0) return 0.0;
    if (current_ratio >= 1.5 && current_ratio <= 3.0) return 100.0;
    if (current_ratio >= 1.2 && current_ratio <= 4.0) return 80.0;
    if (current_ratio >= 1.0 && current_ratio <= 5.0) return 60.0;
    return 20.0;
}

double score_quick_ratio(double quick_ratio, const FundamentalConfig&) {
    if (quick_ratio <= 0.0) return 0.0;
    if (quick_ratio > 1.0) return 100.0;
    if (quick_ratio > 0.8) return 75.0;
    if (quick_ratio > 0.6) return 50.0;
    return 25.0;
}

double score_interest_coverage(double interest_coverage, const FundamentalConfig&) {
    if (interest_coverage > 8.0) return 100.0;
    if (interest_coverage > 4.0) return 75.0;
    if (interest_coverage > 2.0) return 50.0;
    if (interest_coverage > 1.0) return 25.0;
    return 0.0;
}

double score_beta(double beta, const FundamentalConfig&) {
    if (beta < 1.0) return 100.0;
    if (beta < 1.3) return 75.0;
    if (beta < 1.5) return 50.0;
    if (beta < 2.0) return 25.0;
    return 0.0;
}

const FundamentalCategory CATEGORY_ORDER[] = {
    FundamentalCategory::VALUATION,
    FundamentalCategory::PROFITABILITY,
    FundamentalCategory::GROWTH,
    FundamentalCategory::FINANCIAL_HEALTH,
};

} // anonymous namespace

const std::vector<MetricRule>& get_metric_rules() {
    static const std::vector<MetricRule> metric_rules = {
        {"pe_ratio", FundamentalCategory::VALUATION, extract_pe_ratio, score_pe_ratio},
        {"pb_ratio", FundamentalCategory::VALUATION, extract_pb_ratio, score_price_multiple},
        {"price_to_sales", FundamentalCategory::VALUATION, extract_price_to_sales, score_price_multiple},
        {"peg_ratio", FundamentalCategory::VALUATION, extract_peg_ratio, score_peg_ratio},
        {"enterprise_to_ebitda", FundamentalCategory::VALUATION, extract_enterprise_to_ebitda, score_enterprise_to_ebitda},

        {"roe", FundamentalCategory::PROFITABILITY, extract_roe, score_roe},
        {"roa", FundamentalCategory::PROFITABILITY, extract_roa, score_roa},
        {"gross_margin", FundamentalCategory::PROFITABILITY, extract_gross_margin, score_gross_margin},
        {"operating_margin", FundamentalCategory::PROFITABILITY, extract_operating_margin, score_operating_margin},
        {"net_margin", FundamentalCategory::PROFITABILITY, extract_net_margin, score_net_margin},

        {"revenue_growth", FundamentalCategory::GROWTH, extract_revenue_growth, score_revenue_growth},
        {"earnings_growth", FundamentalCategory::GROWTH, extract_earnings_growth, score_earnings_growth},
        {"forward_eps_growth", FundamentalCategory::GROWTH, extract_forward_eps_growth, score_earnings_growth},

        {"debt_to_equity", FundamentalCategory::FINANCIAL_HEALTH, extract_debt_to_equity, score_debt_to_equity},
        {"current_ratio", FundamentalCategory::FINANCIAL_HEALTH, extract_current_ratio, score_current_ratio},
        {"quick_ratio", FundamentalCategory::FINANCIAL_HEALTH, extract_quick_ratio, score_quick_ratio},
        {"interest_coverage", FundamentalCategory::FINANCIAL_HEALTH, extract_interest_coverage, score_interest_coverage},
        {"beta", FundamentalCategory::FINANCIAL_HEALTH, extract_beta, score_beta},
    };
    return metric_rules;
}

std::string get_letter_grade(double score) {
    if (score >= 90.0) return "A+";
    if (score >= 80.0) return "A";
    if (score >= 70.0) return "B+";
    if (score >= 60.0) return "B";
    if (score >= 50.0) return "C+";
    if (score >= 40.0) return "C";
    if (score >= 30.0) return "D";
    return "F";
}

double get_category_weight(FundamentalCategory category, const FundamentalConfig& config) {
    switch (category) {
        case FundamentalCategory::VALUATION: return config.valuation_weight;
        case FundamentalCategory::PROFITABILITY: return config.profitability_weight;
        case FundamentalCategory::GROWTH: return config.growth_weight;
        case FundamentalCategory::FINANCIAL_HEALTH: return config.financial_health_weight;
    }
    return 0.0;
}

FundamentalScores score_fundamentals(const FundamentalRecord& record, const FundamentalConfig& config) {
    FundamentalScores fundamental_scores;

    for (FundamentalCategory category : CATEGORY_ORDER) {
        CategoryScore category_score;
        category_score.category = category;

        double sub_score_sum = 0.0;
        for (const MetricRule& metric_rule : get_metric_rules()) {
            if (metric_rule.category != category) continue;
            try {
                double metric_value = metric_rule.extract(record);
                double sub_score = metric_rule.score(metric_value, config);
                category_score.metrics.emplace_back(metric_rule.name, metric_value, sub_score);
                sub_score_sum += sub_score;
            } catch (const MissingFieldError& missing_field_error) {
                category_score.missing_metrics.push_back(missing_field_error.get_field_name());
            }
        }

        if (!category_score.metrics.empty()) {
            category_score.score = sub_score_sum / static_cast<double>(category_score.metrics.size());
            category_score.grade = get_letter_grade(*category_score.score);
        }
        fundamental_scores.categories.push_back(category_score);
    }

    double weighted_sum = 0.0;
    double weight_total = 0.0;
    for (const CategoryScore& category_score : fundamental_scores.categories) {
        if (!category_score.score) continue;
        double category_weight = get_category_weight(category_score.category, config);
        weighted_sum += category_weight * *category_score.score;
        weight_total += category_weight;
    }
    if (weight_total > 0.0) {
        fundamental_scores.composite = weighted_sum / weight_total;
    }

    return fundamental_scores;
}

} // namespace Core
} // namespace StockAdvisor
