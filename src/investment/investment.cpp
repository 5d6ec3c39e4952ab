/// @file src/investment/investment.cpp
/// @brief InvestmentAnalyzer — NPV, DCF, payback, ROI and CAPM.

#include "fincalc/investment.hpp"
#include "fincalc/safety.hpp"

#include <cmath>
#include <fmt/format.h>

namespace fincalc::investment {

using safety::safe_divide;
using safety::validate_finite;
using safety::validate_non_negative;
using safety::validate_positive;

// ─── Internal helpers (file-local) ────────────────────────────────────────────

namespace {

/// Reject the first non-finite flow, naming its 1-based year.
[[nodiscard]] Status validate_cash_flows(std::span<const double> cash_flows) {
    if (cash_flows.empty()) {
        return fail(FinanceError::invalid_input("Cash flows cannot be empty"));
    }
    for (std::size_t i = 0; i < cash_flows.size(); ++i) {
        if (!std::isfinite(cash_flows[i])) {
            return fail(FinanceError::invalid_input(
                fmt::format("Cash flow year {}", i + 1), cash_flows[i], "is invalid"));
        }
    }
    return {};
}

/// Σ CF_i / (1+r)^(i+1). Caller has validated the flows and the rate.
[[nodiscard]] FinanceResult<double>
discounted_sum(std::span<const double> cash_flows, double rate) {
    const double base = 1.0 + rate;
    double total = 0.0;
    for (std::size_t i = 0; i < cash_flows.size(); ++i) {
        total += cash_flows[i] / std::pow(base, static_cast<double>(i + 1));
    }
    if (!std::isfinite(total)) return fail(FinanceError::overflow("discounting"));
    return total;
}

}  // namespace

// ─── NPV / DCF ────────────────────────────────────────────────────────────────

FinanceResult<double>
InvestmentAnalyzer::npv(double initial_investment,
                        std::span<const double> cash_flows,
                        double discount_rate) {
    if (auto ok = validate_positive(initial_investment, "Initial investment"); !ok) {
        return fail(ok.error());
    }
    if (auto ok = validate_non_negative(discount_rate, "Discount rate"); !ok) {
        return fail(ok.error());
    }
    if (auto ok = validate_cash_flows(cash_flows); !ok) return fail(ok.error());

    auto present = discounted_sum(cash_flows, discount_rate);
    if (!present) return fail(present.error());
    return *present - initial_investment;
}

FinanceResult<double>
InvestmentAnalyzer::dcf(std::span<const double> cash_flows,
                        double discount_rate) {
    if (auto ok = validate_finite(discount_rate, "Discount rate"); !ok) return fail(ok.error());
    if (discount_rate <= -1.0) {
        return fail(FinanceError::invalid_input(
            "Discount rate", discount_rate, "must be greater than -1"));
    }
    if (auto ok = validate_cash_flows(cash_flows); !ok) return fail(ok.error());

    return discounted_sum(cash_flows, discount_rate);
}

// ─── Payback Period ───────────────────────────────────────────────────────────

FinanceResult<std::optional<double>>
InvestmentAnalyzer::payback_period(double initial_cost,
                                   std::span<const double> cash_flows) {
    if (auto ok = validate_positive(initial_cost, "Initial cost"); !ok) return fail(ok.error());
    if (auto ok = validate_cash_flows(cash_flows); !ok) return fail(ok.error());

    double cumulative = 0.0;
    for (std::size_t i = 0; i < cash_flows.size(); ++i) {
        const double flow = cash_flows[i];
        const double before = cumulative;
        cumulative += flow;

        if (cumulative >= initial_cost) {
            // Crossing period: flow > 0 because before < cost <= before + flow.
            const double remaining = initial_cost - before;
            return std::optional<double>{static_cast<double>(i) + remaining / flow + 1.0};
        }
    }
    return std::optional<double>{};
}

// ─── ROI / CAPM ───────────────────────────────────────────────────────────────

FinanceResult<double>
InvestmentAnalyzer::roi(double net_profit, double cost_of_investment) {
    if (auto ok = validate_positive(cost_of_investment, "Cost of investment"); !ok) {
        return fail(ok.error());
    }
    if (auto ok = validate_finite(net_profit, "Net profit"); !ok) return fail(ok.error());

    auto ratio = safe_divide(net_profit, cost_of_investment);
    if (!ratio) return fail(ratio.error());
    return *ratio * 100.0;
}

FinanceResult<double>
InvestmentAnalyzer::capm(double risk_free_rate,
                         double beta,
                         double market_return) {
    if (auto ok = validate_non_negative(risk_free_rate, "Risk-free rate"); !ok) {
        return fail(ok.error());
    }
    if (auto ok = validate_finite(beta, "Beta");                   !ok) return fail(ok.error());
    if (auto ok = validate_finite(market_return, "Market return"); !ok) return fail(ok.error());

    const double expected = risk_free_rate + beta * (market_return - risk_free_rate);
    if (!std::isfinite(expected)) return fail(FinanceError::overflow("CAPM"));
    return expected;
}

} // namespace fincalc::investment
