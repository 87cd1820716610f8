#include "fundamental_report.hpp"
#include "fundamental_scorer.hpp"

namespace StockAdvisor {
namespace Core {

namespace {

const char* const NOT_RATED = "N/A";

const char* get_strength_label(FundamentalCategory category) {
    switch (category) {
        case FundamentalCategory::VALUATION: return "Strong valuation metrics";
        case FundamentalCategory::PROFITABILITY: return "High profitability";
        case FundamentalCategory::GROWTH: return "Strong growth trajectory";
        case FundamentalCategory::FINANCIAL_HEALTH: return "Solid financial health";
    }
    return "";
}

const char* get_weakness_label(FundamentalCategory category) {
    switch (category) {
        case FundamentalCategory::VALUATION: return "Poor valuation metrics";
        case FundamentalCategory::PROFITABILITY: return "Low profitability";
        case FundamentalCategory::GROWTH: return "Weak growth";
        case FundamentalCategory::FINANCIAL_HEALTH: return "Poor financial health";
    }
    return "";
}

void add_valuation_insights(const FundamentalRecord& record, std::vector<std::string>& insights) {
    if (record.pe_ratio && *record.pe_ratio > 0.0) {
        if (*record.pe_ratio < 15.0) insights.push_back("P/E ratio indicates excellent value");
        else if (*record.pe_ratio > 30.0) insights.push_back("P/E ratio suggests overvaluation");
    }
    if (record.pb_ratio && *record.pb_ratio > 0.0) {
        if (*record.pb_ratio < 1.0) insights.push_back("P/B ratio indicates strong asset value");
        else if (*record.pb_ratio > 3.0) insights.push_back("P/B ratio suggests premium pricing");
    }
}

void add_profitability_insights(const FundamentalRecord& record, std::vector<std::string>& insights) {
    if (record.roe) {
        if (*record.roe > 0.20) insights.push_back("Excellent return on equity");
        else if (*record.roe < 0.05) insights.push_back("Poor return on equity");
    }
    if (record.gross_margin) {
        if (*record.gross_margin > 0.40) insights.push_back("Strong gross margins");
        else if (*record.gross_margin < 0.20) insights.push_back("Weak gross margins");
    }
}

void add_growth_insights(const FundamentalRecord& record, std::vector<std::string>& insights) {
    if (record.revenue_growth) {
        if (*record.revenue_growth > 0.20) insights.push_back("Strong revenue growth");
        else if (*record.revenue_growth < 0.05) insights.push_back("Weak revenue growth");
    }
    if (record.earnings_growth) {
        if (*record.earnings_growth > 0.25) insights.push_back("Excellent earnings growth");
        else if (*record.earnings_growth < 0.10) insights.push_back("Poor earnings growth");
    }
}

void add_financial_health_insights(const FundamentalRecord& record, std::vector<std::string>& insights) {
    if (record.debt_to_equity) {
        if (*record.debt_to_equity < 0.3) insights.push_back("Low debt levels");
        else if (*record.debt_to_equity > 1.0) insights.push_back("High debt levels");
    }
    if (record.current_ratio) {
        if (*record.current_ratio > 2.0) insights.push_back("Strong liquidity position");
        else if (*record.current_ratio < 1.0) insights.push_back("Weak liquidity position");
    }
}

} // anonymous namespace

std::string get_fundamental_rating(double composite_score) {
    if (composite_score >= 80.0) return "Strong Buy";
    if (composite_score >= 70.0) return "Buy";
    if (composite_score >= 60.0) return "Hold";
    if (composite_score >= 50.0) return "Weak Hold";
    return "Sell";
}

FundamentalReport build_fundamental_report(const FundamentalRecord& record, const FundamentalScores& scores,
                                           const FundamentalConfig& config) {
    FundamentalReport fundamental_report;
    if (scores.composite) {
        fundamental_report.overall_grade = get_letter_grade(*scores.composite);
        fundamental_report.rating = get_fundamental_rating(*scores.composite);
    } else {
        fundamental_report.overall_grade = NOT_RATED;
        fundamental_report.rating = NOT_RATED;
    }

    for (const CategoryScore& category_score : scores.categories) {
        if (!category_score.score) continue;
        if (*category_score.score >= config.strength_score) {
            fundamental_report.strengths.push_back(get_strength_label(category_score.category));
        }
        if (*category_score.score < config.weakness_score) {
            fundamental_report.weaknesses.push_back(get_weakness_label(category_score.category));
        }
    }

    // Risks
    if (record.debt_to_equity && *record.debt_to_equity > config.risk_debt_to_equity) {
        fundamental_report.risks.push_back("High debt levels");
    }
    if (record.pe_ratio && *record.pe_ratio > config.risk_pe_ratio) {
        fundamental_report.risks.push_back("High valuation multiples");
    }
    if (record.beta && *record.beta > config.risk_beta) {
        fundamental_report.risks.push_back("High market volatility");
    }
    if (record.market_cap && *record.market_cap < config.min_market_cap) {
        fundamental_report.risks.push_back("Small market capitalization");
    }

    // Opportunities
    if (record.pe_ratio && *record.pe_ratio > 0.0 && *record.pe_ratio < config.opportunity_pe_ratio) {
        fundamental_report.opportunities.push_back("Undervalued based on P/E ratio");
    }
    if (record.revenue_growth && *record.revenue_growth > config.opportunity_revenue_growth) {
        fundamental_report.opportunities.push_back("Strong revenue growth potential");
    }
    if (record.market_cap && *record.market_cap >= config.min_market_cap && *record.market_cap < config.small_cap_opportunity_limit) {
        fundamental_report.opportunities.push_back("Mid-cap growth potential");
    }

    add_valuation_insights(record, fundamental_report.insights);
    add_profitability_insights(record, fundamental_report.insights);
    add_growth_insights(record, fundamental_report.insights);
    add_financial_health_insights(record, fundamental_report.insights);

    return fundamental_report;
}

} // namespace Core
} // namespace StockAdvisor
