/// @file src/statistics/statistics.cpp
/// @brief StatisticsCalculator — mean, median, mode, variance, weighting.

#include "fincalc/statistics.hpp"
#include "fincalc/constants.hpp"

#include <algorithm>
#include <cmath>
#include <fmt/format.h>
#include <string>
#include <unordered_map>
#include <vector>

namespace fincalc::statistics {

// ─── Internal helpers (file-local) ────────────────────────────────────────────

namespace {

/// Reject the first non-finite element, naming its index.
[[nodiscard]] Status validate_elements(std::span<const double> values) {
    for (std::size_t i = 0; i < values.size(); ++i) {
        if (!std::isfinite(values[i])) {
            return fail(FinanceError::invalid_input(
                fmt::format("Value at index {}", i), values[i], "is invalid"));
        }
    }
    return {};
}

/// Fixed-point grouping key with MODE_KEY_PRECISION digits.
/// "-0.0000000000" is folded into "0.0000000000".
[[nodiscard]] std::string mode_key(double value) {
    std::string key = fmt::format("{:.{}f}", value, constants::MODE_KEY_PRECISION);
    if (!key.empty() && key.front() == '-' &&
        key.find_first_not_of("0.", 1) == std::string::npos) {
        key.erase(0, 1);
    }
    return key;
}

/// Σ(x − μ)². Caller has validated N ≥ 2 and finiteness.
[[nodiscard]] FinanceResult<double>
sum_squared_deviations(std::span<const double> values, double mu) {
    double sum = 0.0;
    for (double x : values) {
        const double d = x - mu;
        sum += d * d;
    }
    if (!std::isfinite(sum)) return fail(FinanceError::overflow("variance"));
    return sum;
}

[[nodiscard]] Status require_variance_samples(std::span<const double> values) {
    if (values.size() < constants::MIN_VARIANCE_SAMPLES) {
        return fail(FinanceError::invalid_input(fmt::format(
            "At least {} numbers are required to calculate variance, got {}",
            constants::MIN_VARIANCE_SAMPLES, values.size())));
    }
    return {};
}

}  // namespace

// ─── Central Tendency ─────────────────────────────────────────────────────────

FinanceResult<double>
StatisticsCalculator::mean(std::span<const double> values) {
    if (values.empty()) {
        return fail(FinanceError::invalid_input("Cannot calculate mean of an empty dataset"));
    }
    if (auto ok = validate_elements(values); !ok) return fail(ok.error());

    double sum = 0.0;
    for (double x : values) sum += x;
    if (!std::isfinite(sum)) return fail(FinanceError::overflow("mean"));

    return sum / static_cast<double>(values.size());
}

FinanceResult<double>
StatisticsCalculator::median(std::span<const double> values) {
    if (values.empty()) {
        return fail(FinanceError::invalid_input("Cannot calculate median of an empty dataset"));
    }
    if (auto ok = validate_elements(values); !ok) return fail(ok.error());

    std::vector<double> sorted(values.begin(), values.end());
    std::sort(sorted.begin(), sorted.end());

    const std::size_t n   = sorted.size();
    const std::size_t mid = n / 2;
    if (n % 2 == 0) {
        // Halve before adding so two large values cannot overflow.
        return sorted[mid - 1] / 2.0 + sorted[mid] / 2.0;
    }
    return sorted[mid];
}

FinanceResult<std::optional<double>>
StatisticsCalculator::mode(std::span<const double> values) {
    if (values.empty()) return std::optional<double>{};
    if (auto ok = validate_elements(values); !ok) return fail(ok.error());

    struct Bucket {
        double      representative;  // first value seen with this key
        std::size_t count;
    };
    std::unordered_map<std::string, Bucket> buckets;
    buckets.reserve(values.size());

    for (double x : values) {
        auto it = buckets.try_emplace(mode_key(x), Bucket{x, 0}).first;
        ++it->second.count;
    }

    std::size_t max_count = 0;
    for (const auto& [key, bucket] : buckets) {
        max_count = std::max(max_count, bucket.count);
    }
    if (max_count <= 1) return std::optional<double>{};

    // Ties resolve to the smallest value.
    std::optional<double> best;
    for (const auto& [key, bucket] : buckets) {
        if (bucket.count == max_count &&
            (!best || bucket.representative < *best)) {
            best = bucket.representative;
        }
    }
    return best;
}

// ─── Dispersion ───────────────────────────────────────────────────────────────

FinanceResult<double>
StatisticsCalculator::population_variance(std::span<const double> values) {
    if (auto ok = require_variance_samples(values); !ok) return fail(ok.error());

    auto mu = mean(values);
    if (!mu) return fail(mu.error());

    auto ss = sum_squared_deviations(values, *mu);
    if (!ss) return fail(ss.error());
    return *ss / static_cast<double>(values.size());
}

FinanceResult<double>
StatisticsCalculator::sample_variance(std::span<const double> values) {
    if (auto ok = require_variance_samples(values); !ok) return fail(ok.error());

    auto mu = mean(values);
    if (!mu) return fail(mu.error());

    auto ss = sum_squared_deviations(values, *mu);
    if (!ss) return fail(ss.error());
    return *ss / static_cast<double>(values.size() - 1);
}

FinanceResult<double>
StatisticsCalculator::population_std_dev(std::span<const double> values) {
    auto v = population_variance(values);
    if (!v) return fail(v.error());
    return std::sqrt(*v);
}

FinanceResult<double>
StatisticsCalculator::sample_std_dev(std::span<const double> values) {
    auto v = sample_variance(values);
    if (!v) return fail(v.error());
    return std::sqrt(*v);
}

// ─── Weighting & Probability ──────────────────────────────────────────────────

FinanceResult<double>
StatisticsCalculator::weighted_average(std::span<const double> values,
                                       std::span<const double> weights) {
    if (values.empty() || weights.empty()) {
        return fail(FinanceError::invalid_input("Numbers and weights cannot be empty"));
    }
    if (values.size() != weights.size()) {
        return fail(FinanceError::invalid_input(fmt::format(
            "Numbers and weights must have the same length ({} vs {})",
            values.size(), weights.size())));
    }

    double weighted_sum = 0.0;
    double total_weight = 0.0;
    for (std::size_t i = 0; i < values.size(); ++i) {
        if (!std::isfinite(values[i])) {
            return fail(FinanceError::invalid_input(
                fmt::format("Value at index {}", i), values[i], "is invalid"));
        }
        if (!std::isfinite(weights[i]) || weights[i] < 0.0) {
            return fail(FinanceError::invalid_input(
                fmt::format("Weight at index {}", i), weights[i],
                "must be finite and non-negative"));
        }
        weighted_sum += values[i] * weights[i];
        total_weight += weights[i];
    }

    if (total_weight == 0.0) {
        return fail(FinanceError::division_by_zero("weighted average (total weight is zero)"));
    }
    if (!std::isfinite(weighted_sum) || !std::isfinite(total_weight)) {
        return fail(FinanceError::overflow("weighted average"));
    }
    return weighted_sum / total_weight;
}

FinanceResult<double>
StatisticsCalculator::probability(std::uint32_t successes, std::uint32_t trials) {
    if (trials == 0) {
        return fail(FinanceError::division_by_zero("probability (zero trials)"));
    }
    if (successes > trials) {
        return fail(FinanceError::invalid_input(fmt::format(
            "Successes ({}) cannot exceed trials ({})", successes, trials)));
    }
    return static_cast<double>(successes) / static_cast<double>(trials);
}

} // namespace fincalc::statistics
