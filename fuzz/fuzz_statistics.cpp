/**
 * @file  fuzz_statistics.cpp
 * @brief libFuzzer target for the statistics calculators.
 *
 * Build:
 *   cmake -DFINCALC_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++ ..
 *   cmake --build . --target fuzz_statistics
 *
 * Run for 60 seconds:
 *   ./fuzz_statistics -max_total_time=60
 *
 * Input is a comma/space separated number list. Invariants on every input:
 *   1. No crash for any byte sequence (parse failures are simply skipped).
 *   2. Successful results are finite.
 *   3. min ≤ median ≤ max.
 *   4. Variances are non-negative and sample ≥ population.
 *   5. A mode, when present, is bounded by min and max.
 */

#include <algorithm>
#include <cassert>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <string_view>

#include "cli/arguments.hpp"
#include "fincalc/statistics.hpp"

using fincalc::statistics::StatisticsCalculator;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const std::string_view input{reinterpret_cast<const char*>(data), size};

    const auto values = fincalc::cli::parse_number_list(input);
    if (!values) return 0;

    const bool all_finite = std::all_of(values->begin(), values->end(),
                                        [](double v) { return std::isfinite(v); });
    const auto [lo, hi] = std::minmax_element(values->begin(), values->end());

    const auto median = StatisticsCalculator::median(*values);
    assert(median.has_value() == all_finite);
    if (median) {
        assert(*lo <= *median && *median <= *hi);
    }

    const auto mean = StatisticsCalculator::mean(*values);
    if (mean) assert(std::isfinite(*mean));

    const auto pop    = StatisticsCalculator::population_variance(*values);
    const auto sample = StatisticsCalculator::sample_variance(*values);
    if (pop && sample) {
        assert(*pop >= 0.0);
        assert(*sample >= *pop);
    }

    const auto mode = StatisticsCalculator::mode(*values);
    if (mode && mode->has_value()) {
        assert(*lo <= **mode && **mode <= *hi);
    }

    return 0;
}
