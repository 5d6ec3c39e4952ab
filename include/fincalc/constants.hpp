#pragma once

#include <cstddef>

/// @file include/fincalc/constants.hpp
/// @brief Policy constants and numeric defaults for the fincalc library.
///
/// These are policy choices, not IEEE-754 limits. Callers that need a
/// different policy override them through `safety::SafetyLimits` and
/// `investment::IrrOptions` rather than editing this file.

namespace fincalc::constants {

// ─── Safety Policy ────────────────────────────────────────────────────────────

/// Largest monetary magnitude accepted by `validate_calculation_range`.
/// Keeps chained multiplications well clear of floating-point overflow.
static constexpr double MAX_SAFE_MAGNITUDE = 1e15;

/// Largest |exponent| accepted by `safe_power`.
/// A cutoff for "too large to be a meaningful financial exponent".
static constexpr double MAX_SAFE_EXPONENT = 100.0;

/// Present-value discount rates at or above this are rejected (100 %).
static constexpr double MAX_DISCOUNT_RATE = 1.0;

// ─── Calendar ─────────────────────────────────────────────────────────────────

/// Payment periods per year for loan and mortgage calculations.
static constexpr int MONTHS_PER_YEAR = 12;

/// Longest loan term, in years, accepted by the schedule generators.
static constexpr int MAX_LOAN_TERM_YEARS = 100;

/// Loan functions take annual rates as percentages (5.0 = 5 %).
static constexpr double PERCENT = 100.0;

// ─── Statistics ───────────────────────────────────────────────────────────────

/// Decimal digits used to key values when grouping for the mode.
/// Values equal to this many fixed-point digits are the same bucket.
static constexpr int MODE_KEY_PRECISION = 10;

/// Minimum observations for population and sample variance.
static constexpr std::size_t MIN_VARIANCE_SAMPLES = 2;

// ─── Root Finding (IRR) ───────────────────────────────────────────────────────

/// Newton-Raphson starting guess for the internal rate of return.
static constexpr double DEFAULT_IRR_GUESS = 0.1;

/// Convergence threshold on |Δr| between Newton iterations.
static constexpr double DEFAULT_IRR_TOLERANCE = 1e-10;

/// Iteration bound before IRR reports ConvergenceFailed.
static constexpr int DEFAULT_IRR_MAX_ITERATIONS = 100;

/// |dNPV/dr| below this is treated as a vanishing derivative.
static constexpr double IRR_DERIVATIVE_EPSILON = 1e-14;

} // namespace fincalc::constants
