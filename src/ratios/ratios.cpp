/// @file src/ratios/ratios.cpp
/// @brief RatioCalculator — profitability, valuation, leverage and liquidity.

#include "fincalc/ratios.hpp"
#include "fincalc/constants.hpp"
#include "fincalc/safety.hpp"

#include <cmath>

namespace fincalc::ratios {

using safety::safe_divide;
using safety::validate_finite;
using safety::validate_non_negative;
using safety::validate_positive;

namespace {

/// numerator / denominator × 100, through the guarded divide.
[[nodiscard]] FinanceResult<double> percent_of(double numerator, double denominator) {
    auto ratio = safe_divide(numerator, denominator);
    if (!ratio) return fail(ratio.error());
    return *ratio * constants::PERCENT;
}

}  // namespace

// ─── Profitability ────────────────────────────────────────────────────────────

FinanceResult<double>
RatioCalculator::roe(double net_income, double shareholders_equity) {
    if (auto ok = validate_positive(shareholders_equity, "Shareholders' equity"); !ok) {
        return fail(ok.error());
    }
    if (auto ok = validate_finite(net_income, "Net income"); !ok) return fail(ok.error());
    return percent_of(net_income, shareholders_equity);
}

FinanceResult<double>
RatioCalculator::roa(double net_income, double total_assets) {
    if (auto ok = validate_positive(total_assets, "Total assets"); !ok) return fail(ok.error());
    if (auto ok = validate_finite(net_income, "Net income");       !ok) return fail(ok.error());
    return percent_of(net_income, total_assets);
}

// ─── Valuation ────────────────────────────────────────────────────────────────

FinanceResult<double>
RatioCalculator::pe_ratio(double stock_price, double earnings_per_share) {
    if (auto ok = validate_positive(stock_price, "Stock price"); !ok) return fail(ok.error());
    if (auto ok = validate_positive(earnings_per_share, "Earnings per share"); !ok) {
        return fail(ok.error());
    }
    return safe_divide(stock_price, earnings_per_share);
}

FinanceResult<double>
RatioCalculator::dividend_yield(double annual_dividend, double stock_price) {
    if (auto ok = validate_positive(stock_price, "Stock price"); !ok) return fail(ok.error());
    if (auto ok = validate_non_negative(annual_dividend, "Annual dividend"); !ok) {
        return fail(ok.error());
    }
    return percent_of(annual_dividend, stock_price);
}

// ─── Leverage & Liquidity ─────────────────────────────────────────────────────

FinanceResult<double>
RatioCalculator::debt_to_equity(double total_debt, double total_equity) {
    if (auto ok = validate_non_negative(total_debt, "Total debt"); !ok) return fail(ok.error());
    if (auto ok = validate_positive(total_equity, "Total equity"); !ok) return fail(ok.error());
    return safe_divide(total_debt, total_equity);
}

FinanceResult<double>
RatioCalculator::current_ratio(double current_assets, double current_liabilities) {
    if (auto ok = validate_non_negative(current_assets, "Current assets"); !ok) {
        return fail(ok.error());
    }
    if (auto ok = validate_positive(current_liabilities, "Current liabilities"); !ok) {
        return fail(ok.error());
    }
    return safe_divide(current_assets, current_liabilities);
}

FinanceResult<double>
RatioCalculator::quick_ratio(double current_assets,
                             double inventory,
                             double current_liabilities) {
    if (auto ok = validate_non_negative(current_assets, "Current assets"); !ok) {
        return fail(ok.error());
    }
    if (auto ok = validate_non_negative(inventory, "Inventory"); !ok) return fail(ok.error());
    if (auto ok = validate_positive(current_liabilities, "Current liabilities"); !ok) {
        return fail(ok.error());
    }
    if (inventory > current_assets) {
        return fail(FinanceError::invalid_input(
            "Inventory", inventory, "cannot exceed current assets"));
    }
    return safe_divide(current_assets - inventory, current_liabilities);
}

// ─── WACC ─────────────────────────────────────────────────────────────────────

FinanceResult<double>
RatioCalculator::wacc(double cost_of_equity,
                      double cost_of_debt,
                      double tax_rate,
                      double market_value_equity,
                      double market_value_debt) {
    if (auto ok = validate_non_negative(cost_of_equity, "Cost of equity"); !ok) {
        return fail(ok.error());
    }
    if (auto ok = validate_non_negative(cost_of_debt, "Cost of debt"); !ok) {
        return fail(ok.error());
    }
    if (auto ok = validate_non_negative(tax_rate, "Tax rate"); !ok) return fail(ok.error());
    if (auto ok = validate_non_negative(market_value_equity, "Market value of equity"); !ok) {
        return fail(ok.error());
    }
    if (auto ok = validate_non_negative(market_value_debt, "Market value of debt"); !ok) {
        return fail(ok.error());
    }
    if (tax_rate > 1.0) {
        return fail(FinanceError::invalid_input(
            "Tax rate", tax_rate, "must be a decimal between 0 and 1"));
    }

    const double total_value = market_value_equity + market_value_debt;
    if (!std::isfinite(total_value)) {
        return fail(FinanceError::overflow("WACC capital weights"));
    }
    if (total_value == 0.0) {
        return fail(FinanceError::division_by_zero("WACC capital weights"));
    }

    const double equity_weight = market_value_equity / total_value;
    const double debt_weight   = market_value_debt / total_value;

    const double result = equity_weight * cost_of_equity
                        + debt_weight * cost_of_debt * (1.0 - tax_rate);
    if (!std::isfinite(result)) return fail(FinanceError::overflow("WACC"));
    return result;
}

} // namespace fincalc::ratios
