/// @file src/cli/format.cpp
/// @brief Currency/percent formatting and box-drawn tables.

#include "format.hpp"

#include <algorithm>
#include <cmath>
#include <fmt/format.h>
#include <string_view>
#include <utility>

namespace fincalc::cli {

namespace {

/// Code points, so box-drawing and "γ" count as one column.
[[nodiscard]] std::size_t display_width(std::string_view text) noexcept {
    std::size_t width = 0;
    for (const char c : text) {
        if ((static_cast<unsigned char>(c) & 0xC0U) != 0x80U) ++width;
    }
    return width;
}

[[nodiscard]] std::string repeat(std::string_view unit, std::size_t count) {
    std::string out;
    out.reserve(unit.size() * count);
    for (std::size_t i = 0; i < count; ++i) out.append(unit);
    return out;
}

/// "1234567" → "1,234,567".
[[nodiscard]] std::string group_thousands(std::string_view digits) {
    std::string out;
    out.reserve(digits.size() + digits.size() / 3);
    const std::size_t lead = digits.size() % 3;
    for (std::size_t i = 0; i < digits.size(); ++i) {
        if (i != 0 && (i + 3 - lead) % 3 == 0) out.push_back(',');
        out.push_back(digits[i]);
    }
    return out;
}

}  // namespace

// ─── Scalars ──────────────────────────────────────────────────────────────────

std::string format_currency(double amount) {
    if (!std::isfinite(amount)) return "n/a";

    const std::string fixed = fmt::format("{:.2f}", std::fabs(amount));
    const std::size_t dot   = fixed.find('.');
    const std::string body  = group_thousands(std::string_view{fixed}.substr(0, dot))
                            + fixed.substr(dot);

    // -0.004 rounds to "0.00"; do not print "-$0.00".
    const bool negative = amount < 0.0 && body != "0.00";
    return fmt::format("{}${}", negative ? "-" : "", body);
}

std::string format_percent(double percent, int decimals) {
    if (!std::isfinite(percent)) return "n/a";
    return fmt::format("{:.{}f}%", percent, decimals);
}

std::string format_rate(double rate, int decimals) {
    return format_percent(rate * 100.0, decimals);
}

std::string format_number(double value, int decimals) {
    if (!std::isfinite(value)) return "n/a";
    return fmt::format("{:.{}f}", value, decimals);
}

std::string format_date(std::chrono::year_month_day date) {
    return fmt::format("{:04d}-{:02d}-{:02d}",
                       static_cast<int>(date.year()),
                       static_cast<unsigned>(date.month()),
                       static_cast<unsigned>(date.day()));
}

// ─── Table ────────────────────────────────────────────────────────────────────

Table::Table(std::vector<std::string> headers) : headers_(std::move(headers)) {}

void Table::add_row(std::vector<std::string> cells) {
    cells.resize(headers_.size());
    rows_.push_back(std::move(cells));
}

std::string Table::render() const {
    const std::size_t columns = headers_.size();
    if (columns == 0) return {};

    std::vector<std::size_t> widths(columns, 0);
    for (std::size_t c = 0; c < columns; ++c) {
        widths[c] = display_width(headers_[c]);
        for (const auto& row : rows_) {
            widths[c] = std::max(widths[c], display_width(row[c]));
        }
    }

    const auto rule = [&](std::string_view left, std::string_view mid, std::string_view right) {
        std::string line{left};
        for (std::size_t c = 0; c < columns; ++c) {
            if (c != 0) line.append(mid);
            line.append(repeat("─", widths[c] + 2));
        }
        line.append(right);
        line.push_back('\n');
        return line;
    };

    const auto row_line = [&](const std::vector<std::string>& cells) {
        std::string line{"│"};
        for (std::size_t c = 0; c < columns; ++c) {
            const std::size_t pad = widths[c] - display_width(cells[c]);
            line.push_back(' ');
            if (c == 0) {
                line.append(cells[c]).append(pad, ' ');
            } else {
                line.append(pad, ' ').append(cells[c]);
            }
            line.append(" │");
        }
        line.push_back('\n');
        return line;
    };

    std::string out = rule("┌", "┬", "┐");
    out += row_line(headers_);
    out += rule("├", "┼", "┤");
    for (const auto& row : rows_) out += row_line(row);
    out += rule("└", "┴", "┘");
    return out;
}

std::string render_summary(std::string_view title,
                           const std::vector<std::pair<std::string, std::string>>& rows) {
    Table table({"Metric", "Value"});
    for (const auto& [label, value] : rows) table.add_row({label, value});

    std::string out;
    if (!title.empty()) out = fmt::format("{}\n", title);
    out += table.render();
    return out;
}

} // namespace fincalc::cli
