#pragma once

/// @file include/fincalc/statistics.hpp
/// @brief Descriptive statistics over `std::span<const double>`.
///
/// # Module: Statistics
///
/// ## Validation
/// Every element is checked for finiteness before any arithmetic; the error
/// names the 0-based index of the first offending element. Sorting (median)
/// and grouping (mode) therefore never see NaN.
///
/// ## Mode Grouping
/// Values are bucketed by their fixed-point rendering with
/// `constants::MODE_KEY_PRECISION` (10) decimal digits. Two values that agree
/// to 10 decimal places are the same bucket; values that differ beyond that
/// are distinct. Changing the precision changes which near-duplicates count
/// as "the same", so it is part of the contract.
///
/// ## Variance
/// Both population (÷N) and sample (÷N−1) variance require N ≥ 2.

#include "fincalc/error.hpp"

#include <cstdint>
#include <optional>
#include <span>

namespace fincalc::statistics {

/// Stateless descriptive-statistics calculator.
class StatisticsCalculator {
public:
    StatisticsCalculator() = delete;

    /// Arithmetic mean. Fails on empty input or any non-finite element.
    [[nodiscard]] static FinanceResult<double>
    mean(std::span<const double> values);

    /// Middle value of a sorted copy; mean of the two central values for an
    /// even count.
    [[nodiscard]] static FinanceResult<double>
    median(std::span<const double> values);

    /// Most frequent value.
    ///
    /// # Returns
    /// - `nullopt` for empty input or when every value occurs once
    /// - the smallest value among those tied for the highest frequency
    [[nodiscard]] static FinanceResult<std::optional<double>>
    mode(std::span<const double> values);

    /// Σ(x − μ)² / N. Requires N ≥ 2.
    [[nodiscard]] static FinanceResult<double>
    population_variance(std::span<const double> values);

    /// Σ(x − μ)² / (N − 1). Requires N ≥ 2.
    [[nodiscard]] static FinanceResult<double>
    sample_variance(std::span<const double> values);

    /// √population_variance.
    [[nodiscard]] static FinanceResult<double>
    population_std_dev(std::span<const double> values);

    /// √sample_variance.
    [[nodiscard]] static FinanceResult<double>
    sample_std_dev(std::span<const double> values);

    /// Σ(value·weight) / Σweight.
    ///
    /// # Returns
    /// - InvalidInput for empty or mismatched series, non-finite values, or
    ///   negative/non-finite weights
    /// - DivisionByZero when all weights are zero
    [[nodiscard]] static FinanceResult<double>
    weighted_average(std::span<const double> values,
                     std::span<const double> weights);

    /// successes / trials.
    ///
    /// # Returns
    /// DivisionByZero for zero trials; InvalidInput if successes > trials.
    [[nodiscard]] static FinanceResult<double>
    probability(std::uint32_t successes, std::uint32_t trials);
};

} // namespace fincalc::statistics
