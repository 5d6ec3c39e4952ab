#pragma once

/// @file include/fincalc/depreciation.hpp
/// @brief Asset depreciation schedules (straight-line, double-declining).
///
/// # Methods
///   Straight-line:            D_y = (cost − salvage) / life
///   Double-declining balance: D_y = min(book_{y−1} · 2/life, book_{y−1} − salvage)
///
/// For both methods the final year depreciates whatever remains above
/// salvage, so the closing book value equals the salvage value exactly.

#include "fincalc/error.hpp"

#include <string_view>
#include <optional>
#include <vector>

namespace fincalc::loan {

enum class DepreciationMethod {
    StraightLine,
    DoubleDecliningBalance,
};

/// Parse "straight-line" / "double-declining" (as used on the command line).
[[nodiscard]] std::optional<DepreciationMethod>
parse_depreciation_method(std::string_view name) noexcept;

[[nodiscard]] std::string_view to_string(DepreciationMethod method) noexcept;

/// One year of a depreciation schedule.
struct DepreciationEntry {
    int    year;          ///< 1-based
    double depreciation;  ///< Expense recognised this year
    double accumulated;   ///< Running total of depreciation
    double book_value;    ///< cost − accumulated, never below salvage
};

/// Year-by-year depreciation of an asset.
///
/// # Arguments
/// * `cost`         — acquisition cost, > 0
/// * `salvage`      — residual value, 0 ≤ salvage < cost
/// * `useful_life`  — whole years, > 0
///
/// # Returns
/// Exactly `useful_life` entries, or InvalidInput.
[[nodiscard]] FinanceResult<std::vector<DepreciationEntry>>
depreciation_schedule(double cost,
                      double salvage,
                      int    useful_life,
                      DepreciationMethod method);

} // namespace fincalc::loan
