/**
 * @file  fuzz_amortization.cpp
 * @brief libFuzzer target for the amortization schedule generator.
 *
 * Build:
 *   cmake -DFINCALC_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++ ..
 *   cmake --build . --target fuzz_amortization
 *
 * Input: "<principal> <annual rate %> <years>". Invariants:
 *   1. No crash, no UB.
 *   2. Row count is exactly years × 12.
 *   3. The last remaining balance is exactly 0.
 *   4. Every row is finite.
 */

#include <cassert>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <string_view>

#include "cli/arguments.hpp"
#include "fincalc/loan.hpp"

using fincalc::loan::LoanCalculator;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const std::string_view input{reinterpret_cast<const char*>(data), size};

    const auto values = fincalc::cli::parse_number_list(input);
    if (!values || values->size() != 3) return 0;

    const double years_raw = (*values)[2];
    if (!std::isfinite(years_raw) || years_raw < -1e6 || years_raw > 1e6) return 0;
    const int years = static_cast<int>(years_raw);

    const auto schedule =
        LoanCalculator::amortization_schedule((*values)[0], (*values)[1], years);
    if (!schedule) return 0;

    assert(schedule->size() == static_cast<std::size_t>(years) * 12);
    assert(schedule->back().remaining_balance == 0.0);
    for (const auto& row : *schedule) {
        assert(std::isfinite(row.principal));
        assert(std::isfinite(row.interest));
        assert(std::isfinite(row.remaining_balance));
    }
    return 0;
}
