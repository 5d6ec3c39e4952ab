/// @file src/loan/depreciation.cpp
/// @brief Straight-line and double-declining-balance depreciation.

#include "fincalc/depreciation.hpp"
#include "fincalc/constants.hpp"
#include "fincalc/safety.hpp"

#include <algorithm>
#include <fmt/format.h>

namespace fincalc::loan {

std::optional<DepreciationMethod>
parse_depreciation_method(std::string_view name) noexcept {
    if (name == "straight-line")    return DepreciationMethod::StraightLine;
    if (name == "double-declining") return DepreciationMethod::DoubleDecliningBalance;
    return std::nullopt;
}

std::string_view to_string(DepreciationMethod method) noexcept {
    switch (method) {
        case DepreciationMethod::StraightLine:           return "straight-line";
        case DepreciationMethod::DoubleDecliningBalance: return "double-declining";
    }
    return "unknown";
}

FinanceResult<std::vector<DepreciationEntry>>
depreciation_schedule(double cost,
                      double salvage,
                      int    useful_life,
                      DepreciationMethod method) {
    if (auto ok = safety::validate_positive(cost, "Asset cost"); !ok) return fail(ok.error());
    if (auto ok = safety::validate_calculation_range(cost, "Asset cost"); !ok) {
        return fail(ok.error());
    }
    if (auto ok = safety::validate_non_negative(salvage, "Salvage value"); !ok) {
        return fail(ok.error());
    }
    if (salvage >= cost) {
        return fail(FinanceError::invalid_input(
            "Salvage value", salvage, "must be less than the asset cost"));
    }
    if (useful_life <= 0 || useful_life > constants::MAX_LOAN_TERM_YEARS) {
        return fail(FinanceError::invalid_input(
            "Useful life", useful_life,
            fmt::format("must be between 1 and {} years", constants::MAX_LOAN_TERM_YEARS)));
    }

    const double depreciable   = cost - salvage;
    const double life          = static_cast<double>(useful_life);
    const double declining_pct = 2.0 / life;

    std::vector<DepreciationEntry> schedule;
    schedule.reserve(static_cast<std::size_t>(useful_life));

    double book = cost;
    for (int year = 1; year <= useful_life; ++year) {
        const double headroom = book - salvage;
        double expense = 0.0;

        if (year == useful_life) {
            expense = headroom;
        } else if (method == DepreciationMethod::StraightLine) {
            expense = depreciable / life;
        } else {
            expense = std::min(book * declining_pct, headroom);
        }

        book -= expense;
        schedule.push_back(DepreciationEntry{
            .year         = year,
            .depreciation = expense,
            .accumulated  = cost - book,
            .book_value   = book,
        });
    }

    // Pin the closing value; the subtraction chain can be off by an ulp.
    schedule.back().book_value  = salvage;
    schedule.back().accumulated = depreciable;
    return schedule;
}

} // namespace fincalc::loan
