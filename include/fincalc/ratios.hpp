#pragma once

/// @file include/fincalc/ratios.hpp
/// @brief Financial ratio functions.
///
/// Each ratio is one formula guarded on its denominator-bearing input
/// (equity, assets, liabilities, price, earnings must be > 0 where they
/// divide). ROE, ROA and dividend yield are returned in percent; the other
/// ratios are plain multiples, and WACC is a decimal rate.

#include "fincalc/error.hpp"

namespace fincalc::ratios {

/// Stateless ratio calculator.
class RatioCalculator {
public:
    RatioCalculator() = delete;

    /// Return on equity (%) = net_income / equity × 100.
    [[nodiscard]] static FinanceResult<double>
    roe(double net_income, double shareholders_equity);

    /// Return on assets (%) = net_income / total_assets × 100.
    [[nodiscard]] static FinanceResult<double>
    roa(double net_income, double total_assets);

    /// Price-to-earnings multiple.
    [[nodiscard]] static FinanceResult<double>
    pe_ratio(double stock_price, double earnings_per_share);

    /// Dividend yield (%) = annual_dividend / stock_price × 100.
    [[nodiscard]] static FinanceResult<double>
    dividend_yield(double annual_dividend, double stock_price);

    [[nodiscard]] static FinanceResult<double>
    debt_to_equity(double total_debt, double total_equity);

    [[nodiscard]] static FinanceResult<double>
    current_ratio(double current_assets, double current_liabilities);

    /// (current_assets − inventory) / current_liabilities.
    /// Inventory may not exceed current assets.
    [[nodiscard]] static FinanceResult<double>
    quick_ratio(double current_assets,
                double inventory,
                double current_liabilities);

    /// Weighted average cost of capital.
    ///
    /// # Formula
    ///   WACC = E/(E+D) · Re + D/(E+D) · Rd · (1 − Tc)
    ///
    /// # Returns
    /// - InvalidInput for any negative/non-finite input or Tc > 1
    /// - DivisionByZero when E + D == 0
    [[nodiscard]] static FinanceResult<double>
    wacc(double cost_of_equity,
         double cost_of_debt,
         double tax_rate,
         double market_value_equity,
         double market_value_debt);
};

} // namespace fincalc::ratios
