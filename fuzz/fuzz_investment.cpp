/**
 * @file  fuzz_investment.cpp
 * @brief libFuzzer target for NPV, DCF, payback and IRR.
 *
 * Build:
 *   cmake -DFINCALC_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++ ..
 *   cmake --build . --target fuzz_investment
 *
 * Input is a number list; the first value is the discount rate, the rest
 * are cash flows. Invariants:
 *   1. No crash, no UB.
 *   2. NPV + investment == DCF at the same rate.
 *   3. A payback period, when found, is within (0, N].
 *   4. An IRR, when found, is > −1 and finite.
 */

#include <algorithm>
#include <cassert>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>

#include "cli/arguments.hpp"
#include "fincalc/investment.hpp"

using fincalc::investment::InvestmentAnalyzer;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const std::string_view input{reinterpret_cast<const char*>(data), size};

    const auto values = fincalc::cli::parse_number_list(input);
    if (!values || values->size() < 2) return 0;

    const double rate = values->front();
    const std::span<const double> flows{values->data() + 1, values->size() - 1};

    const auto npv = InvestmentAnalyzer::npv(1000.0, flows, rate);
    const auto dcf = InvestmentAnalyzer::dcf(flows, rate);
    if (npv) {
        assert(dcf.has_value());
        assert(std::isfinite(*npv));
        assert(std::abs((*npv + 1000.0) - *dcf) <= 1e-6 * std::max(1.0, std::abs(*dcf)));
    }

    const auto payback = InvestmentAnalyzer::payback_period(1000.0, flows);
    if (payback && payback->has_value()) {
        assert(**payback > 0.0);
        assert(**payback <= static_cast<double>(flows.size()) + 1.0);
    }

    const auto irr = InvestmentAnalyzer::irr(*values);
    if (irr) {
        assert(std::isfinite(*irr));
        assert(*irr > -1.0);
    }

    return 0;
}
