#pragma once

/// @file include/fincalc/investment.hpp
/// @brief Investment analysis: NPV, DCF, payback period, ROI, CAPM and IRR.
///
/// # Module: Investment
///
/// ## Cash-Flow Convention
/// For NPV, DCF and payback the series holds one amount per future period:
/// index 0 is the end of period 1 and is discounted by (1+r)^1. For IRR the
/// series starts at time 0, so the (usually negative) initial outlay is
/// element 0 and is not discounted.
///
/// ## Guarantees
/// - Every cash flow is checked for finiteness; the error names the first
///   offending flow (1-based year for NPV/DCF/payback, 0-based period for IRR)
/// - All functions are pure; errors are returned, not thrown
///
/// ## NOT Responsible For
/// - Loan schedules (see loan.hpp)
/// - Formatting of percentages (ROI is returned already scaled by 100)

#include "fincalc/constants.hpp"
#include "fincalc/error.hpp"

#include <optional>
#include <span>

namespace fincalc::investment {

/// Newton-Raphson configuration for `irr`.
struct IrrOptions {
    double guess          = constants::DEFAULT_IRR_GUESS;
    double tolerance      = constants::DEFAULT_IRR_TOLERANCE;
    int    max_iterations = constants::DEFAULT_IRR_MAX_ITERATIONS;
};

/// Stateless investment-appraisal calculator.
class InvestmentAnalyzer {
public:
    InvestmentAnalyzer() = delete;

    /// Net present value: −I + Σ CF_i / (1+r)^i, i = 1..N.
    ///
    /// # Arguments
    /// * `initial_investment` — I > 0
    /// * `cash_flows`         — non-empty, finite
    /// * `discount_rate`      — r ≥ 0
    [[nodiscard]] static FinanceResult<double>
    npv(double initial_investment,
        std::span<const double> cash_flows,
        double discount_rate);

    /// Discounted cash flow value: Σ CF_i / (1+r)^i, i = 1..N.
    ///
    /// `discount_rate` must be finite and greater than −1.
    [[nodiscard]] static FinanceResult<double>
    dcf(std::span<const double> cash_flows, double discount_rate);

    /// Payback period in (fractional) periods.
    ///
    /// Accumulates cash flows until the running total reaches `initial_cost`,
    /// then interpolates linearly inside the crossing period:
    ///   index + (cost − cumulative_before) / CF_index + 1
    ///
    /// # Returns
    /// - `nullopt` if the series never recovers the cost
    /// - InvalidInput for cost ≤ 0, an empty series or a non-finite flow
    [[nodiscard]] static FinanceResult<std::optional<double>>
    payback_period(double initial_cost, std::span<const double> cash_flows);

    /// Return on investment in percent: (net_profit / cost) × 100.
    ///
    /// Net profit may be negative (a loss); cost must be positive.
    [[nodiscard]] static FinanceResult<double>
    roi(double net_profit, double cost_of_investment);

    /// CAPM expected return: r_f + β·(r_m − r_f).
    ///
    /// r_f must be finite and non-negative; β (any sign) and r_m finite.
    [[nodiscard]] static FinanceResult<double>
    capm(double risk_free_rate, double beta, double market_return);

    /// Internal rate of return by Newton-Raphson.
    ///
    /// Solves Σ CF_t / (1+r)^t = 0 for t = 0..N−1.
    ///
    /// # Returns
    /// - InvalidInput if fewer than two flows, any flow non-finite, or the
    ///   flows do not change sign
    /// - ConvergenceFailed if the derivative vanishes, the iterate leaves
    ///   (−1, ∞), or `max_iterations` pass without |Δr| < tolerance
    [[nodiscard]] static FinanceResult<double>
    irr(std::span<const double> cash_flows,
        const IrrOptions& options = IrrOptions{});
};

} // namespace fincalc::investment
