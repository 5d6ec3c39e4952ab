#pragma once

/// @file src/cli/format.hpp
/// @brief Human-readable rendering of calculation results.

#include <chrono>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace fincalc::cli {

/// "$1,234.56" / "-$1,234.56", rounded to cents. Non-finite values render
/// as "n/a".
[[nodiscard]] std::string format_currency(double amount);

/// `percent` is already scaled (25.0 → "25.00%").
[[nodiscard]] std::string format_percent(double percent, int decimals = 2);

/// `rate` is a decimal fraction (0.0783 → "7.83%").
[[nodiscard]] std::string format_rate(double rate, int decimals = 2);

/// Fixed-point with `decimals` digits.
[[nodiscard]] std::string format_number(double value, int decimals = 4);

/// "2024-05-01".
[[nodiscard]] std::string format_date(std::chrono::year_month_day date);

/// Box-drawn table. The first column is left-aligned, the rest right-aligned.
///
/// ```
/// ┌──────────┬────────────┐
/// │ Metric   │      Value │
/// ├──────────┼────────────┤
/// │ Interest │    $100.00 │
/// └──────────┴────────────┘
/// ```
class Table {
public:
    explicit Table(std::vector<std::string> headers);

    /// Short rows are padded with empty cells; extra cells are dropped.
    void add_row(std::vector<std::string> cells);

    [[nodiscard]] std::size_t row_count() const noexcept { return rows_.size(); }

    [[nodiscard]] std::string render() const;

private:
    std::vector<std::string>              headers_;
    std::vector<std::vector<std::string>> rows_;
};

/// Two-column "Metric / Value" table with an optional title line.
[[nodiscard]] std::string
render_summary(std::string_view title,
               const std::vector<std::pair<std::string, std::string>>& rows);

} // namespace fincalc::cli
