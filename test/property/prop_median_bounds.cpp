/**
 * @file  prop_median_bounds.cpp
 * @brief Property: min ≤ median ≤ max and min ≤ mean ≤ max for any finite,
 *        non-empty sample; the median is order-independent.
 *
 *   RC_PARAMS="max_success=10000" ./prop_median_bounds
 */

#include <rapidcheck.h>
#include <algorithm>
#include <vector>

#include "fincalc/statistics.hpp"

using namespace fincalc::statistics;

int main() {
    bool ok = true;

    ok &= rc::check(
        "median/mean: bounded by the sample extremes",
        []() {
            const auto ints = *rc::gen::nonEmpty(
                rc::gen::container<std::vector<int>>(rc::gen::inRange(-1'000'000, 1'000'000)));
            std::vector<double> values(ints.begin(), ints.end());

            const auto [lo, hi] = std::minmax_element(values.begin(), values.end());
            auto median = StatisticsCalculator::median(values);
            auto mean   = StatisticsCalculator::mean(values);
            RC_ASSERT(median.has_value());
            RC_ASSERT(mean.has_value());
            RC_ASSERT(*lo <= *median && *median <= *hi);
            RC_ASSERT(*lo - 1e-9 <= *mean && *mean <= *hi + 1e-9);
        }
    );

    ok &= rc::check(
        "median: independent of input order",
        []() {
            const auto ints = *rc::gen::nonEmpty(
                rc::gen::container<std::vector<int>>(rc::gen::inRange(-1'000, 1'000)));
            std::vector<double> values(ints.begin(), ints.end());
            std::vector<double> reversed(values.rbegin(), values.rend());

            RC_ASSERT(*StatisticsCalculator::median(values)
                      == *StatisticsCalculator::median(reversed));
        }
    );

    return ok ? 0 : 1;
}
