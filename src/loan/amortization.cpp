/// @file src/loan/amortization.cpp
/// @brief Forward-iteration amortization schedule generator.

#include "fincalc/loan.hpp"
#include "fincalc/constants.hpp"
#include "fincalc/safety.hpp"

#include <cmath>
#include <fmt/format.h>

namespace fincalc::loan {

FinanceResult<std::vector<AmortizationPayment>>
LoanCalculator::amortization_schedule(double principal,
                                      double annual_interest_percent,
                                      int    term_years) {
    if (auto ok = safety::validate_positive(principal, "Loan amount"); !ok) {
        return fail(ok.error());
    }
    if (auto ok = safety::validate_non_negative(annual_interest_percent, "Annual interest rate");
        !ok) {
        return fail(ok.error());
    }
    if (term_years <= 0 || term_years > constants::MAX_LOAN_TERM_YEARS) {
        return fail(FinanceError::invalid_input(
            "Term", term_years,
            fmt::format("must be between 1 and {} years", constants::MAX_LOAN_TERM_YEARS)));
    }

    auto payment = monthly_payment(principal, annual_interest_percent,
                                   static_cast<double>(term_years));
    if (!payment) return fail(payment.error());

    const double monthly_rate = annual_interest_percent / constants::PERCENT
                              / static_cast<double>(constants::MONTHS_PER_YEAR);
    const int total_months = term_years * constants::MONTHS_PER_YEAR;

    std::vector<AmortizationPayment> schedule;
    schedule.reserve(static_cast<std::size_t>(total_months));

    double balance = principal;
    for (int month = 1; month <= total_months; ++month) {
        const double interest        = balance * monthly_rate;
        const double principal_share = *payment - interest;
        balance -= principal_share;

        // Terminal state: absorb the rounding drift of the whole iteration.
        if (month == total_months) {
            balance = 0.0;
        }

        if (!std::isfinite(balance)) {
            return fail(FinanceError::overflow("amortization schedule"));
        }

        schedule.push_back(AmortizationPayment{
            .period            = month,
            .principal         = principal_share,
            .interest          = interest,
            .remaining_balance = balance,
        });
    }

    return schedule;
}

} // namespace fincalc::loan
