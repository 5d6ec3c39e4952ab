/// @file src/core/safety.cpp
/// @brief Validators and guarded arithmetic for the Numeric Safety Layer.

#include "fincalc/safety.hpp"

#include <cmath>

namespace fincalc::safety {

// ─── Validators ───────────────────────────────────────────────────────────────

Status validate_positive(double value, std::string_view name) {
    if (!std::isfinite(value)) {
        return fail(FinanceError::invalid_input(name, value, "must be a valid number"));
    }
    if (value <= 0.0) {
        return fail(FinanceError::invalid_input(name, value, "must be positive"));
    }
    return {};
}

Status validate_non_negative(double value, std::string_view name) {
    if (!std::isfinite(value)) {
        return fail(FinanceError::invalid_input(name, value, "must be a valid number"));
    }
    if (value < 0.0) {
        return fail(FinanceError::invalid_input(name, value, "must be non-negative"));
    }
    return {};
}

Status validate_finite(double value, std::string_view name) {
    if (!std::isfinite(value)) {
        return fail(FinanceError::invalid_input(name, value, "must be a valid number"));
    }
    return {};
}

Status validate_calculation_range(double value,
                                  std::string_view name,
                                  const SafetyLimits& limits) {
    if (auto ok = validate_finite(value, name); !ok) return ok;
    if (std::abs(value) > limits.max_magnitude) {
        return fail(FinanceError::invalid_input(
            name, value, "exceeds the safe calculation range"));
    }
    return {};
}

// ─── Guarded Arithmetic ───────────────────────────────────────────────────────

FinanceResult<double> safe_multiply(double a, double b) {
    if (auto ok = validate_finite(a, "Multiplicand"); !ok) return fail(ok.error());
    if (auto ok = validate_finite(b, "Multiplier");   !ok) return fail(ok.error());

    const double product = a * b;
    if (!std::isfinite(product)) return fail(FinanceError::overflow("multiplication"));
    return product;
}

FinanceResult<double> safe_divide(double a, double b) {
    if (auto ok = validate_finite(a, "Dividend"); !ok) return fail(ok.error());
    if (auto ok = validate_finite(b, "Divisor");  !ok) return fail(ok.error());
    if (b == 0.0) return fail(FinanceError::division_by_zero("division"));

    const double quotient = a / b;
    if (!std::isfinite(quotient)) return fail(FinanceError::overflow("division"));
    return quotient;
}

FinanceResult<double> safe_power(double base,
                                 double exponent,
                                 const SafetyLimits& limits) {
    if (auto ok = validate_finite(base, "Base");         !ok) return fail(ok.error());
    if (auto ok = validate_finite(exponent, "Exponent"); !ok) return fail(ok.error());
    if (std::abs(exponent) > limits.max_exponent) {
        return fail(FinanceError::invalid_input(
            "Exponent", exponent, "is too large for a financial calculation"));
    }

    const double power = std::pow(base, exponent);
    if (!std::isfinite(power)) return fail(FinanceError::overflow("exponentiation"));
    return power;
}

} // namespace fincalc::safety
