#include "fundamental_record.hpp"

namespace StockAdvisor {
namespace Core {

const std::vector<FundamentalField>& get_fundamental_fields() {
    static const std::vector<FundamentalField> fundamental_fields = {
        {"market_cap", &FundamentalRecord::market_cap, false},
        {"current_price", &FundamentalRecord::current_price, false},
        {"enterprise_value", &FundamentalRecord::enterprise_value, false},
        {"shares_outstanding", &FundamentalRecord::shares_outstanding, false},
        {"pe_ratio", &FundamentalRecord::pe_ratio, true},
        {"forward_pe", &FundamentalRecord::forward_pe, true},
        {"pb_ratio", &FundamentalRecord::pb_ratio, true},
        {"price_to_sales", &FundamentalRecord::price_to_sales, true},
        {"peg_ratio", &FundamentalRecord::peg_ratio, true},
        {"enterprise_to_ebitda", &FundamentalRecord::enterprise_to_ebitda, true},
        {"roe", &FundamentalRecord::roe, false},
        {"roa", &FundamentalRecord::roa, false},
        {"gross_margin", &FundamentalRecord::gross_margin, false},
        {"operating_margin", &FundamentalRecord::operating_margin, false},
        {"net_margin", &FundamentalRecord::net_margin, false},
        {"revenue_growth", &FundamentalRecord::revenue_growth, false},
        {"earnings_growth", &FundamentalRecord::earnings_growth, false},
        {"debt_to_equity", &FundamentalRecord::debt_to_equity, true},
        {"current_ratio", &FundamentalRecord::current_ratio, false},
        {"quick_ratio", &FundamentalRecord::quick_ratio, false},
        {"interest_coverage", &FundamentalRecord::interest_coverage, false},
        {"beta", &FundamentalRecord::beta, true},
        {"earnings_per_share", &FundamentalRecord::earnings_per_share, false},
        {"book_value_per_share", &FundamentalRecord::book_value_per_share, false},
        {"cash_per_share", &FundamentalRecord::cash_per_share, false},
        {"free_cash_flow", &FundamentalRecord::free_cash_flow, false},
        {"dividend_yield", &FundamentalRecord::dividend_yield, false},
        {"dividend_per_share", &FundamentalRecord::dividend_per_share, false},
        {"dividend_growth", &FundamentalRecord::dividend_growth, false},
    };
    return fundamental_fields;
}

const FundamentalField* find_fundamental_field(const std::string& field_name) {
    for (const FundamentalField& fundamental_field : get_fundamental_fields()) {
        if (field_name == fundamental_field.name) {
            return &fundamental_field;
        }
    }
    return nullptr;
}

} // namespace Core
} // namespace StockAdvisor
