/// @file src/loan/loan.cpp
/// @brief LoanCalculator — payment formula, mortgage summary, break-even.

#include "fincalc/loan.hpp"
#include "fincalc/constants.hpp"
#include "fincalc/safety.hpp"

#include <algorithm>
#include <cmath>
#include <fmt/format.h>

namespace fincalc::loan {

using safety::safe_divide;
using safety::safe_multiply;
using safety::validate_non_negative;
using safety::validate_positive;

// ─── Monthly Payment ──────────────────────────────────────────────────────────

FinanceResult<double>
LoanCalculator::monthly_payment(double principal,
                                double annual_interest_percent,
                                double term_years) {
    if (auto ok = validate_positive(principal, "Principal"); !ok) return fail(ok.error());
    if (auto ok = validate_non_negative(annual_interest_percent, "Annual interest rate"); !ok) {
        return fail(ok.error());
    }
    if (auto ok = validate_positive(term_years, "Loan term"); !ok) return fail(ok.error());
    if (term_years > static_cast<double>(constants::MAX_LOAN_TERM_YEARS)) {
        return fail(FinanceError::invalid_input(
            "Loan term", term_years,
            fmt::format("must not exceed {} years", constants::MAX_LOAN_TERM_YEARS)));
    }

    const double monthly_rate = annual_interest_percent / constants::PERCENT
                              / static_cast<double>(constants::MONTHS_PER_YEAR);
    const double num_payments = term_years * static_cast<double>(constants::MONTHS_PER_YEAR);

    // Zero rate: the annuity formula is 0/0, so repay in equal instalments.
    if (monthly_rate == 0.0) {
        return safe_divide(principal, num_payments);
    }

    // 1 − (1+r)^(−n), evaluated through log1p/expm1 so that rates too small
    // to change 1.0 + r still give a positive denominator. Not subject to
    // the safe_power exponent cutoff.
    const double annuity = -std::expm1(-num_payments * std::log1p(monthly_rate));
    if (!std::isfinite(annuity)) return fail(FinanceError::overflow("loan discount factor"));
    if (annuity == 0.0) {
        return safe_divide(principal, num_payments);
    }

    auto numerator = safe_multiply(principal, monthly_rate);
    if (!numerator) return fail(numerator.error());
    return safe_divide(*numerator, annuity);
}

// ─── Mortgage ─────────────────────────────────────────────────────────────────

std::chrono::year_month_day
LoanCalculator::payoff_date(std::chrono::year_month_day start, int month_count) noexcept {
    using namespace std::chrono;

    const year_month target = year_month{start.year(), start.month()}
                            + months{month_count};
    const year_month_day_last month_end{target.year(), month_day_last{target.month()}};
    const day clamped = std::min(start.day(), month_end.day());
    return year_month_day{target.year(), target.month(), clamped};
}

FinanceResult<MortgageDetails>
LoanCalculator::mortgage_details(double loan_amount,
                                 double annual_interest_percent,
                                 int    term_years,
                                 std::chrono::year_month_day start_date) {
    if (auto ok = validate_positive(loan_amount, "Loan amount"); !ok) return fail(ok.error());
    if (auto ok = validate_non_negative(annual_interest_percent, "Annual interest rate"); !ok) {
        return fail(ok.error());
    }
    if (term_years <= 0 || term_years > constants::MAX_LOAN_TERM_YEARS) {
        return fail(FinanceError::invalid_input(
            "Term", term_years,
            fmt::format("must be between 1 and {} years", constants::MAX_LOAN_TERM_YEARS)));
    }
    if (!start_date.ok()) {
        return fail(FinanceError::invalid_input("Start date is not a valid calendar date"));
    }

    auto payment = monthly_payment(loan_amount, annual_interest_percent,
                                   static_cast<double>(term_years));
    if (!payment) return fail(payment.error());

    const int total_months = term_years * constants::MONTHS_PER_YEAR;
    auto total_paid = safe_multiply(*payment, static_cast<double>(total_months));
    if (!total_paid) return fail(total_paid.error());

    return MortgageDetails{
        .monthly_payment = *payment,
        .total_paid      = *total_paid,
        .total_interest  = *total_paid - loan_amount,
        .payoff_date     = payoff_date(start_date, total_months),
    };
}

// ─── Break-Even ───────────────────────────────────────────────────────────────

FinanceResult<double>
LoanCalculator::break_even_units(double fixed_costs,
                                 double variable_cost_per_unit,
                                 double price_per_unit) {
    if (auto ok = validate_positive(fixed_costs, "Fixed costs"); !ok) return fail(ok.error());
    if (auto ok = validate_positive(variable_cost_per_unit, "Variable cost per unit"); !ok) {
        return fail(ok.error());
    }
    if (auto ok = validate_positive(price_per_unit, "Price per unit"); !ok) return fail(ok.error());

    if (price_per_unit <= variable_cost_per_unit) {
        return fail(FinanceError::invalid_input(
            "Price per unit", price_per_unit,
            "must be greater than variable cost per unit"));
    }

    return safe_divide(fixed_costs, price_per_unit - variable_cost_per_unit);
}

FinanceResult<BreakEvenResult>
LoanCalculator::break_even_analysis(double fixed_costs,
                                    double variable_cost_per_unit,
                                    double price_per_unit) {
    auto units = break_even_units(fixed_costs, variable_cost_per_unit, price_per_unit);
    if (!units) return fail(units.error());

    auto revenue = safe_multiply(*units, price_per_unit);
    if (!revenue) return fail(revenue.error());

    return BreakEvenResult{.units = *units, .revenue = *revenue};
}

} // namespace fincalc::loan
