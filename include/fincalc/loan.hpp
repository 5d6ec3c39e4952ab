#pragma once

/// @file include/fincalc/loan.hpp
/// @brief Loan / Amortization Engine — payments, schedules, mortgages, break-even.
///
/// # Module: Loan
///
/// ## Monthly Payment
///   r = annual_percentage / 100 / 12,  n = years × 12
///   M = P · r / (1 − (1+r)^(−n))          (r > 0)
///   M = P / n                              (r = 0, straight-line)
///
/// ## Amortization Schedule
/// A forward iteration over n months:
///   interest_i  = balance_{i−1} · r
///   principal_i = M − interest_i
///   balance_i   = balance_{i−1} − principal_i
/// The final month's balance is forced to exactly 0.0, absorbing rounding
/// drift accumulated over the iteration. The schedule is built eagerly so
/// callers get random access (e.g. every 12th month).
///
/// ## Dates
/// The payoff date is derived from a caller-supplied start date. Nothing in
/// this module reads the system clock.
///
/// ## Rate Scale
/// Unlike the rest of fincalc, loan functions take the annual rate as a
/// percentage (5.0 = 5 %).

#include "fincalc/error.hpp"

#include <chrono>
#include <vector>

namespace fincalc::loan {

// ─── Types ────────────────────────────────────────────────────────────────────

/// One row of an amortization schedule.
struct AmortizationPayment {
    int    period;             ///< 1-based month number
    double principal;          ///< Principal repaid this month
    double interest;           ///< Interest charged this month
    double remaining_balance;  ///< Balance after this payment (0 on the last row)
};

/// Summary of a fixed-rate mortgage.
struct MortgageDetails {
    double                        monthly_payment;
    double                        total_paid;      ///< monthly_payment × months
    double                        total_interest;  ///< total_paid − loan amount
    std::chrono::year_month_day   payoff_date;     ///< start + term months
};

/// Break-even point.
struct BreakEvenResult {
    double units;    ///< fixed / (price − variable)
    double revenue;  ///< units × price
};

// ─── LoanCalculator ───────────────────────────────────────────────────────────

/// Stateless loan and break-even calculator.
class LoanCalculator {
public:
    LoanCalculator() = delete;

    /// Level monthly payment for a fully amortizing loan.
    ///
    /// # Arguments
    /// * `principal`                — P > 0
    /// * `annual_interest_percent`  — ≥ 0, as a percentage
    /// * `term_years`               — > 0 and at most `MAX_LOAN_TERM_YEARS`
    ///                                (fractional years allowed)
    [[nodiscard]] static FinanceResult<double>
    monthly_payment(double principal,
                    double annual_interest_percent,
                    double term_years);

    /// Full month-by-month schedule with exactly `term_years × 12` rows.
    ///
    /// # Returns
    /// InvalidInput for P ≤ 0, a negative or non-finite rate, or a
    /// non-positive term.
    [[nodiscard]] static FinanceResult<std::vector<AmortizationPayment>>
    amortization_schedule(double principal,
                          double annual_interest_percent,
                          int    term_years);

    /// Monthly payment, totals and payoff date for a mortgage.
    ///
    /// # Arguments
    /// * `start_date` — date of origination, injected by the caller
    [[nodiscard]] static FinanceResult<MortgageDetails>
    mortgage_details(double loan_amount,
                     double annual_interest_percent,
                     int    term_years,
                     std::chrono::year_month_day start_date);

    /// `start` advanced by `month_count` months, with the day clamped to the
    /// end of the target month (Jan 31 + 1 month → Feb 28/29).
    [[nodiscard]] static std::chrono::year_month_day
    payoff_date(std::chrono::year_month_day start, int month_count) noexcept;

    /// Units to sell to cover fixed costs: fixed / (price − variable).
    ///
    /// All inputs must be positive and the contribution margin
    /// `price − variable` strictly positive.
    [[nodiscard]] static FinanceResult<double>
    break_even_units(double fixed_costs,
                     double variable_cost_per_unit,
                     double price_per_unit);

    /// Break-even units together with the revenue they represent.
    [[nodiscard]] static FinanceResult<BreakEvenResult>
    break_even_analysis(double fixed_costs,
                        double variable_cost_per_unit,
                        double price_per_unit);
};

} // namespace fincalc::loan
