/**
 * @file  irr.cpp
 * @brief Newton-Raphson internal rate of return.
 *
 * Solves f(r) = Σ CF_t · (1+r)^(−t) = 0 for t = 0..N−1, with
 *   f'(r) = Σ −t · CF_t · (1+r)^(−t−1).
 *
 * The derivative can vanish or the iterate can oscillate for flows with
 * several sign changes, so every failure of the iteration is reported as
 * ConvergenceFailed instead of returning a half-converged rate.
 */

#include "fincalc/investment.hpp"

#include <algorithm>
#include <cmath>
#include <fmt/format.h>

namespace fincalc::investment {

// ── Internal Newton helpers ───────────────────────────────────────────────────

namespace {

struct NpvWithSlope {
    double value;
    double slope;
};

/// f(r) and f'(r) in a single pass. Requires r > −1.
NpvWithSlope npv_with_slope(std::span<const double> flows, double rate) noexcept {
    const double base = 1.0 + rate;
    NpvWithSlope out{0.0, 0.0};
    for (std::size_t t = 0; t < flows.size(); ++t) {
        const double td       = static_cast<double>(t);
        const double discount = std::pow(base, -td);
        out.value += flows[t] * discount;
        out.slope -= td * flows[t] * discount / base;
    }
    return out;
}

} // namespace

// ── InvestmentAnalyzer::irr ───────────────────────────────────────────────────

FinanceResult<double>
InvestmentAnalyzer::irr(std::span<const double> cash_flows,
                        const IrrOptions& options) {
    if (cash_flows.size() < 2) {
        return fail(FinanceError::invalid_input(
            "IRR requires at least two cash flows"));
    }
    for (std::size_t i = 0; i < cash_flows.size(); ++i) {
        if (!std::isfinite(cash_flows[i])) {
            return fail(FinanceError::invalid_input(
                fmt::format("Cash flow period {}", i), cash_flows[i], "is invalid"));
        }
    }

    const bool has_inflow  = std::any_of(cash_flows.begin(), cash_flows.end(),
                                         [](double cf) { return cf > 0.0; });
    const bool has_outflow = std::any_of(cash_flows.begin(), cash_flows.end(),
                                         [](double cf) { return cf < 0.0; });
    if (!has_inflow || !has_outflow) {
        return fail(FinanceError::invalid_input(
            "IRR requires both positive and negative cash flows"));
    }

    if (!std::isfinite(options.guess) || options.guess <= -1.0) {
        return fail(FinanceError::invalid_input(
            "IRR guess", options.guess, "must be greater than -1"));
    }
    if (!std::isfinite(options.tolerance) || options.tolerance <= 0.0) {
        return fail(FinanceError::invalid_input(
            "IRR tolerance", options.tolerance, "must be positive"));
    }
    if (options.max_iterations <= 0) {
        return fail(FinanceError::invalid_input(
            "IRR max iterations", options.max_iterations, "must be positive"));
    }

    double rate = options.guess;
    for (int iter = 0; iter < options.max_iterations; ++iter) {
        const auto f = npv_with_slope(cash_flows, rate);
        if (!std::isfinite(f.value) || !std::isfinite(f.slope)) {
            return fail(FinanceError::convergence_failed(fmt::format(
                "IRR diverged at rate {} after {} iterations", rate, iter)));
        }
        if (std::abs(f.slope) < constants::IRR_DERIVATIVE_EPSILON) {
            return fail(FinanceError::convergence_failed(fmt::format(
                "IRR derivative vanished at rate {}", rate)));
        }

        const double next = rate - f.value / f.slope;
        if (!std::isfinite(next) || next <= -1.0) {
            return fail(FinanceError::convergence_failed(fmt::format(
                "IRR iterate left the domain (rate {}) after {} iterations",
                next, iter + 1)));
        }
        if (std::abs(next - rate) < options.tolerance) {
            return next;
        }
        rate = next;
    }

    return fail(FinanceError::convergence_failed(fmt::format(
        "IRR did not converge within {} iterations", options.max_iterations)));
}

} // namespace fincalc::investment
