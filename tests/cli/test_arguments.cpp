#include <gtest/gtest.h>
#include "cli/arguments.hpp"

#include <chrono>
#include <string_view>
#include <vector>

using namespace fincalc;
using namespace fincalc::cli;
using namespace std::chrono;

namespace {

FinanceResult<CommandLine> parse(std::vector<std::string_view> tokens) {
    return parse_command_line(tokens);
}

}  // namespace

// ─── Scalars ──────────────────────────────────────────────────────────────────

TEST(Cli_ParseDouble, WholeTokenOnly) {
    EXPECT_EQ(parse_double("1.5"), 1.5);
    EXPECT_EQ(parse_double("-500"), -500.0);
    EXPECT_EQ(parse_double("1e3"), 1000.0);
    EXPECT_FALSE(parse_double("").has_value());
    EXPECT_FALSE(parse_double("12abc").has_value());
    EXPECT_FALSE(parse_double("abc").has_value());
}

TEST(Cli_ParseInteger, RejectsFractions) {
    EXPECT_EQ(parse_integer("30"), 30);
    EXPECT_FALSE(parse_integer("30.5").has_value());
}

TEST(Cli_ParseNumberList, CommaAndSpaceSeparated) {
    auto r = parse_number_list("1,2, 3  4");
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(*r, (std::vector<double>{1.0, 2.0, 3.0, 4.0}));
}

TEST(Cli_ParseNumberList, NegativeAndBadTokens) {
    auto ok = parse_number_list("-1000,300");
    ASSERT_TRUE(ok.has_value());
    EXPECT_EQ(ok->front(), -1000.0);

    auto bad = parse_number_list("1,x,3");
    ASSERT_FALSE(bad.has_value());
    EXPECT_EQ(bad.error().kind, ErrorKind::InvalidInput);

    EXPECT_FALSE(parse_number_list(" , ").has_value());
}

TEST(Cli_ParseDate, StrictIsoFormat) {
    EXPECT_EQ(parse_date("2024-02-29"), (year_month_day{2024y, February, 29d}));
    EXPECT_FALSE(parse_date("2023-02-29").has_value());
    EXPECT_FALSE(parse_date("2024-13-01").has_value());
    EXPECT_FALSE(parse_date("2024/01/01").has_value());
    EXPECT_FALSE(parse_date("24-01-01").has_value());
}

// ─── Command Line ─────────────────────────────────────────────────────────────

TEST(Cli_CommandLine, GlobalsThenCommandThenFlags) {
    auto r = parse({"--verbose", "--start-date", "2024-05-01",
                    "mortgage", "--amount", "200000", "--rate=4.5", "--years", "30"});
    ASSERT_TRUE(r.has_value());
    EXPECT_TRUE(r->verbose);
    ASSERT_TRUE(r->start_date.has_value());
    EXPECT_EQ(*r->start_date, (year_month_day{2024y, May, 1d}));
    EXPECT_EQ(r->command, "mortgage");
    EXPECT_EQ(r->args.get("amount"), "200000");
    EXPECT_EQ(r->args.get("rate"), "4.5");
    EXPECT_EQ(r->args.get("years"), "30");
}

TEST(Cli_CommandLine, NegativeValueIsNotAFlag) {
    auto r = parse({"roi", "--net-profit", "-500", "--cost", "2000"});
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r->args.get("net-profit"), "-500");
}

TEST(Cli_CommandLine, SwitchesAndPositionals) {
    auto r = parse({"variance", "1", "2", "3", "--sample"});
    ASSERT_TRUE(r.has_value());
    EXPECT_TRUE(r->args.has("sample"));
    EXPECT_EQ(r->args.positionals.size(), 3u);
}

TEST(Cli_CommandLine, HelpAfterCommand) {
    auto r = parse({"npv", "--help"});
    ASSERT_TRUE(r.has_value());
    EXPECT_TRUE(r->help);
    EXPECT_EQ(r->command, "npv");
}

TEST(Cli_CommandLine, EmptyHasNoCommand) {
    auto r = parse({});
    ASSERT_TRUE(r.has_value());
    EXPECT_TRUE(r->command.empty());
}

TEST(Cli_CommandLine, BadGlobals) {
    EXPECT_FALSE(parse({"--start-date", "yesterday", "roe"}).has_value());
    EXPECT_FALSE(parse({"--start-date"}).has_value());
    EXPECT_FALSE(parse({"--bogus", "roe"}).has_value());
}

// ─── ArgumentReader ───────────────────────────────────────────────────────────

TEST(Cli_ArgumentReader, ReadsTypedValues) {
    ParsedArgs args;
    args.flags = {{"principal", "1000"}, {"years", "30"}, {"flows", "1,2,3"}};
    ArgumentReader in(args);
    EXPECT_DOUBLE_EQ(in.number("principal"), 1000.0);
    EXPECT_EQ(in.integer("years", 1, 100), 30);
    EXPECT_EQ(in.numbers("flows").size(), 3u);
    EXPECT_DOUBLE_EQ(in.number_or("guess", 0.1), 0.1);
    EXPECT_EQ(in.text_or("method", "straight-line"), "straight-line");
    EXPECT_FALSE(in.error().has_value());
}

TEST(Cli_ArgumentReader, KeepsFirstError) {
    ParsedArgs args;
    args.flags = {{"rate", "five"}};
    ArgumentReader in(args);
    (void)in.number("principal");
    (void)in.number("rate");
    ASSERT_TRUE(in.error().has_value());
    EXPECT_NE(in.error()->message.find("--principal"), std::string::npos);
}

TEST(Cli_ArgumentReader, IntegerRange) {
    ParsedArgs args;
    args.flags = {{"years", "500"}};
    ArgumentReader in(args);
    (void)in.integer("years", 1, 100);
    EXPECT_TRUE(in.error().has_value());
}

TEST(Cli_ArgumentReader, ListFromPositionals) {
    ParsedArgs args;
    args.positionals = {"1,2", "3"};
    ArgumentReader in(args);
    EXPECT_EQ(in.numbers("numbers", true), (std::vector<double>{1.0, 2.0, 3.0}));
    EXPECT_FALSE(in.error().has_value());

    ArgumentReader strict(args);
    (void)strict.numbers("numbers");
    EXPECT_TRUE(strict.error().has_value());
}
