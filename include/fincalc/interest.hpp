#pragma once

/// @file include/fincalc/interest.hpp
/// @brief Interest and time-value-of-money functions.
///
/// # Module: Interest
///
/// ## Formulas
///   Simple interest:   I  = P · r · t
///   Compound amount:   A  = P · (1 + r/n)^(n·t)
///   Present value:     PV = FV / (1 + r)^t
///   Future value:      FV = PV · (1 + r)^t
///
/// Rates are decimal fractions (0.05 = 5 %). Percentage conversion is the
/// caller's job; nothing here guesses scale.
///
/// ## Guarantees
/// - Every multiplication and power goes through the Safety Layer
/// - All functions are pure; errors are returned, not thrown

#include "fincalc/error.hpp"
#include "fincalc/safety.hpp"

namespace fincalc::interest {

/// Stateless interest and time-value calculator.
class InterestCalculator {
public:
    InterestCalculator() = delete;

    /// Simple interest I = P·r·t.
    ///
    /// # Arguments
    /// * `principal` — P > 0, within the safe calculation range
    /// * `rate`      — r ≥ 0 per period
    /// * `time`      — t ≥ 0 periods
    [[nodiscard]] static FinanceResult<double>
    simple_interest(double principal, double rate, double time);

    /// Compound amount A = P·(1 + r/n)^(n·t).
    ///
    /// # Arguments
    /// * `principal`          — P > 0, within the safe calculation range
    /// * `rate`               — annual r ≥ 0
    /// * `compound_frequency` — n > 0 compounding periods per year
    /// * `years`              — t ≥ 0 whole years
    /// * `limits`             — n·t is bounded by `limits.max_exponent`
    ///
    /// # Returns
    /// The accumulated amount (principal plus interest).
    [[nodiscard]] static FinanceResult<double>
    compound_interest(double principal,
                      double rate,
                      int    compound_frequency,
                      int    years,
                      const safety::SafetyLimits& limits = safety::SafetyLimits{});

    /// Present value PV = FV / (1+r)^t.
    ///
    /// Rates of 100 % or more are rejected as invalid input.
    [[nodiscard]] static FinanceResult<double>
    present_value(double future_value,
                  double rate,
                  double time,
                  const safety::SafetyLimits& limits = safety::SafetyLimits{});

    /// Future value FV = PV·(1+r)^t. No upper bound on the rate.
    [[nodiscard]] static FinanceResult<double>
    future_value(double present_value,
                 double rate,
                 double time,
                 const safety::SafetyLimits& limits = safety::SafetyLimits{});
};

} // namespace fincalc::interest
