#pragma once

/// @file include/fincalc/safety.hpp
/// @brief Numeric Safety Layer: input validators and guarded arithmetic.
///
/// # Module: Safety
///
/// ## Responsibility
/// Turn the silent failure modes of IEEE-754 arithmetic (±Inf, NaN, division
/// by zero) into typed `FinanceError` values before they can propagate into a
/// financial result. Every other fincalc module builds on these primitives.
///
/// ## Guarantees
/// - Pure functions: no state, no I/O
/// - Failures are returned, never thrown; only allocation of an error
///   message can throw (`std::bad_alloc`)
/// - A successful `safe_*` result is always finite
/// - Operand problems are `InvalidInput`; a zero divisor is `DivisionByZero`;
///   a non-finite result from finite operands is `Overflow`
///
/// ## NOT Responsible For
/// - Domain rules of individual calculations (see interest/, investment/, ...)

#include "fincalc/constants.hpp"
#include "fincalc/error.hpp"

#include <string_view>

namespace fincalc::safety {

/// Overridable safety policy. Defaults come from `constants::`.
struct SafetyLimits {
    double max_magnitude = constants::MAX_SAFE_MAGNITUDE;  ///< |amount| bound
    double max_exponent  = constants::MAX_SAFE_EXPONENT;   ///< |exponent| bound
};

// ─── Validators ───────────────────────────────────────────────────────────────

/// Fails if `value` is non-finite or `value <= 0`.
[[nodiscard]] Status validate_positive(double value, std::string_view name);

/// Fails if `value` is non-finite or `value < 0`.
[[nodiscard]] Status validate_non_negative(double value, std::string_view name);

/// Fails if `value` is NaN or ±Inf.
[[nodiscard]] Status validate_finite(double value, std::string_view name);

/// Fails if `value` is non-finite or `|value| > limits.max_magnitude`.
///
/// Applied to monetary inputs that later feed multiplications, so that the
/// product cannot reach floating-point overflow.
[[nodiscard]] Status
validate_calculation_range(double value,
                           std::string_view name,
                           const SafetyLimits& limits = SafetyLimits{});

// ─── Guarded Arithmetic ───────────────────────────────────────────────────────

/// a × b, with operand and result finiteness checks.
[[nodiscard]] FinanceResult<double> safe_multiply(double a, double b);

/// a ÷ b. Rejects b == 0 with `DivisionByZero`.
[[nodiscard]] FinanceResult<double> safe_divide(double a, double b);

/// base ^ exponent.
///
/// # Returns
/// - `InvalidInput` for non-finite operands or `|exponent| > limits.max_exponent`
///   (a policy cutoff, independent of whether the power would overflow)
/// - `Overflow` if the power is non-finite (including NaN from a negative base
///   with a fractional exponent)
[[nodiscard]] FinanceResult<double>
safe_power(double base,
           double exponent,
           const SafetyLimits& limits = SafetyLimits{});

} // namespace fincalc::safety
