/// @file src/interest/interest.cpp
/// @brief InterestCalculator — simple/compound interest, PV and FV.

#include "fincalc/interest.hpp"
#include "fincalc/constants.hpp"

namespace fincalc::interest {

using safety::safe_divide;
using safety::safe_multiply;
using safety::safe_power;
using safety::validate_calculation_range;
using safety::validate_non_negative;
using safety::validate_positive;

// ─── Simple Interest ──────────────────────────────────────────────────────────

FinanceResult<double>
InterestCalculator::simple_interest(double principal,
                                    double rate,
                                    double time) {
    if (auto ok = validate_positive(principal, "Principal");    !ok) return fail(ok.error());
    if (auto ok = validate_non_negative(rate, "Interest rate"); !ok) return fail(ok.error());
    if (auto ok = validate_non_negative(time, "Time");          !ok) return fail(ok.error());
    if (auto ok = validate_calculation_range(principal, "Principal"); !ok) return fail(ok.error());

    // I = (P · r) · t
    auto pr = safe_multiply(principal, rate);
    if (!pr) return fail(pr.error());
    return safe_multiply(*pr, time);
}

// ─── Compound Interest ────────────────────────────────────────────────────────

FinanceResult<double>
InterestCalculator::compound_interest(double principal,
                                      double rate,
                                      int    compound_frequency,
                                      int    years,
                                      const safety::SafetyLimits& limits) {
    if (auto ok = validate_positive(principal, "Principal");    !ok) return fail(ok.error());
    if (auto ok = validate_non_negative(rate, "Interest rate"); !ok) return fail(ok.error());
    if (auto ok = validate_calculation_range(principal, "Principal", limits); !ok) {
        return fail(ok.error());
    }
    if (compound_frequency <= 0) {
        return fail(FinanceError::invalid_input(
            "Compound frequency", compound_frequency, "must be positive"));
    }
    if (years < 0) {
        return fail(FinanceError::invalid_input("Years", years, "must be non-negative"));
    }

    const double rate_per_period = rate / static_cast<double>(compound_frequency);
    const double total_periods   = static_cast<double>(compound_frequency)
                                 * static_cast<double>(years);

    auto growth = safe_power(1.0 + rate_per_period, total_periods, limits);
    if (!growth) return fail(growth.error());
    return safe_multiply(principal, *growth);
}

// ─── Present Value ────────────────────────────────────────────────────────────

FinanceResult<double>
InterestCalculator::present_value(double future_value,
                                  double rate,
                                  double time,
                                  const safety::SafetyLimits& limits) {
    if (auto ok = validate_positive(future_value, "Future value"); !ok) return fail(ok.error());
    if (auto ok = validate_non_negative(rate, "Discount rate");    !ok) return fail(ok.error());
    if (auto ok = validate_non_negative(time, "Time");             !ok) return fail(ok.error());
    if (auto ok = validate_calculation_range(future_value, "Future value", limits); !ok) {
        return fail(ok.error());
    }
    if (rate >= constants::MAX_DISCOUNT_RATE) {
        return fail(FinanceError::invalid_input(
            "Discount rate", rate, "must be less than 100%"));
    }

    auto discount = safe_power(1.0 + rate, time, limits);
    if (!discount) return fail(discount.error());
    return safe_divide(future_value, *discount);
}

// ─── Future Value ─────────────────────────────────────────────────────────────

FinanceResult<double>
InterestCalculator::future_value(double present_value,
                                 double rate,
                                 double time,
                                 const safety::SafetyLimits& limits) {
    if (auto ok = validate_positive(present_value, "Present value"); !ok) return fail(ok.error());
    if (auto ok = validate_non_negative(rate, "Interest rate");      !ok) return fail(ok.error());
    if (auto ok = validate_non_negative(time, "Time");               !ok) return fail(ok.error());
    if (auto ok = validate_calculation_range(present_value, "Present value", limits); !ok) {
        return fail(ok.error());
    }

    auto growth = safe_power(1.0 + rate, time, limits);
    if (!growth) return fail(growth.error());
    return safe_multiply(present_value, *growth);
}

} // namespace fincalc::interest
