#include <gtest/gtest.h>
#include "cli/format.hpp"

#include <chrono>
#include <limits>
#include <string>

using namespace fincalc::cli;
using namespace std::chrono;

// ─── Scalars ──────────────────────────────────────────────────────────────────

TEST(Cli_FormatCurrency, ThousandsSeparators) {
    EXPECT_EQ(format_currency(0.0), "$0.00");
    EXPECT_EQ(format_currency(999.999), "$1,000.00");
    EXPECT_EQ(format_currency(1234.5), "$1,234.50");
    EXPECT_EQ(format_currency(12345.678), "$12,345.68");
    EXPECT_EQ(format_currency(1234567.0), "$1,234,567.00");
}

TEST(Cli_FormatCurrency, NegativeAndNonFinite) {
    EXPECT_EQ(format_currency(-751.31), "-$751.31");
    EXPECT_EQ(format_currency(-0.001), "$0.00");
    EXPECT_EQ(format_currency(std::numeric_limits<double>::infinity()), "n/a");
}

TEST(Cli_FormatPercent, ScaledAndRate) {
    EXPECT_EQ(format_percent(25.0), "25.00%");
    EXPECT_EQ(format_rate(0.078333), "7.83%");
    EXPECT_EQ(format_rate(0.1, 0), "10%");
}

TEST(Cli_FormatDate, ZeroPadded) {
    EXPECT_EQ(format_date(year_month_day{2054y, May, 1d}), "2054-05-01");
}

// ─── Table ────────────────────────────────────────────────────────────────────

TEST(Cli_Table, AlignsColumns) {
    Table table({"Metric", "Value"});
    table.add_row({"NPV", "$723.25"});
    table.add_row({"Discount rate", "5.00%"});
    const std::string out = table.render();

    EXPECT_EQ(out.substr(0, out.find('\n')), "┌───────────────┬─────────┐");
    EXPECT_NE(out.find("│ NPV           │ $723.25 │"), std::string::npos);
    EXPECT_NE(out.find("│ Discount rate │   5.00% │"), std::string::npos);
    EXPECT_NE(out.find("└───────────────┴─────────┘"), std::string::npos);
    EXPECT_EQ(table.row_count(), 2u);
}

TEST(Cli_Table, ShortRowsPadded) {
    Table table({"A", "B", "C"});
    table.add_row({"x"});
    EXPECT_NE(table.render().find("│ x │   │   │"), std::string::npos);
}

TEST(Cli_RenderSummary, TitleAboveTable) {
    const std::string out = render_summary("ROI", {{"ROI", "25.00%"}});
    EXPECT_EQ(out.rfind("ROI\n┌", 0), 0u);
}
