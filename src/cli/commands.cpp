/// @file src/cli/commands.cpp
/// @brief Command handlers: read flags, call a calculator, render a table.

#include "commands.hpp"
#include "format.hpp"

#include "fincalc/constants.hpp"
#include "fincalc/depreciation.hpp"
#include "fincalc/interest.hpp"
#include "fincalc/investment.hpp"
#include "fincalc/loan.hpp"
#include "fincalc/ratios.hpp"
#include "fincalc/statistics.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <fmt/format.h>
#include <limits>
#include <utility>
#include <vector>

namespace fincalc::cli {

using interest::InterestCalculator;
using investment::InvestmentAnalyzer;
using investment::IrrOptions;
using loan::LoanCalculator;
using ratios::RatioCalculator;
using statistics::StatisticsCalculator;

namespace {

using Rows = std::vector<std::pair<std::string, std::string>>;

/// Verbose-mode diagnostic on stderr. Never touches stdout.
template <typename... Args>
void debug(const CliConfig& config, fmt::format_string<Args...> format, Args&&... args) {
    if (!config.verbose) return;
    fmt::print(stderr, "[fincalc] {}\n", fmt::format(format, std::forward<Args>(args)...));
}

using Formatter = std::string (*)(double);

std::string as_currency(double v)   { return format_currency(v); }
std::string as_percent(double v)    { return format_percent(v); }
std::string as_rate(double v)       { return format_rate(v); }
std::string as_ratio(double v)      { return format_number(v, 2); }
std::string as_number(double v)     { return format_number(v, 4); }

/// One-value report: title plus a single "label → value" row.
[[nodiscard]] FinanceResult<std::string>
single(std::string_view title, std::string label,
       const FinanceResult<double>& result, Formatter formatter) {
    if (!result) return fail(result.error());
    return render_summary(title, Rows{{std::move(label), formatter(*result)}});
}

[[nodiscard]] std::string describe_list(const std::vector<double>& values) {
    std::string out;
    for (std::size_t i = 0; i < values.size(); ++i) {
        if (i != 0) out += ", ";
        out += fmt::format("{}", values[i]);
    }
    return out;
}

// ─── Interest & Time Value ────────────────────────────────────────────────────

FinanceResult<std::string> cmd_interest(const ParsedArgs& args, const CliConfig&) {
    ArgumentReader in(args);
    const double principal = in.number("principal");
    const double rate      = in.number("rate");
    const double time      = in.number("time");
    if (auto err = in.error()) return fail(*err);

    auto interest = InterestCalculator::simple_interest(principal, rate, time);
    if (!interest) return fail(interest.error());

    return render_summary("Simple Interest", Rows{
        {"Principal",    format_currency(principal)},
        {"Rate",         format_rate(rate)},
        {"Periods",      format_number(time, 2)},
        {"Interest",     format_currency(*interest)},
        {"Total amount", format_currency(principal + *interest)},
    });
}

FinanceResult<std::string> cmd_compound_interest(const ParsedArgs& args, const CliConfig&) {
    ArgumentReader in(args);
    const double principal = in.number("principal");
    const double rate      = in.number("rate");
    const auto   frequency = in.integer("frequency");
    const auto   years     = in.integer("years");
    if (auto err = in.error()) return fail(*err);

    auto amount = InterestCalculator::compound_interest(
        principal, rate, static_cast<int>(frequency), static_cast<int>(years));
    if (!amount) return fail(amount.error());

    return render_summary("Compound Interest", Rows{
        {"Principal",         format_currency(principal)},
        {"Annual rate",       format_rate(rate)},
        {"Periods per year",  fmt::format("{}", frequency)},
        {"Years",             fmt::format("{}", years)},
        {"Final amount",      format_currency(*amount)},
        {"Interest earned",   format_currency(*amount - principal)},
    });
}

FinanceResult<std::string> cmd_present_value(const ParsedArgs& args, const CliConfig&) {
    ArgumentReader in(args);
    const double future = in.number("future-value");
    const double rate   = in.number("rate");
    const double time   = in.number("time");
    if (auto err = in.error()) return fail(*err);

    return single("Present Value", "Present value",
                  InterestCalculator::present_value(future, rate, time), as_currency);
}

FinanceResult<std::string> cmd_future_value(const ParsedArgs& args, const CliConfig&) {
    ArgumentReader in(args);
    const double present = in.number("present-value");
    const double rate    = in.number("rate");
    const double time    = in.number("time");
    if (auto err = in.error()) return fail(*err);

    return single("Future Value", "Future value",
                  InterestCalculator::future_value(present, rate, time), as_currency);
}

// ─── Investment ───────────────────────────────────────────────────────────────

FinanceResult<std::string> cmd_npv(const ParsedArgs& args, const CliConfig& config) {
    ArgumentReader in(args);
    const double initial = in.number("initial-investment");
    const double rate    = in.number("discount-rate");

    // Either an explicit series, or a level inflow repeated for a lifespan.
    std::vector<double> flows;
    if (args.has("cash-flows") || !args.has("cash-inflow")) {
        flows = in.numbers("cash-flows", true);
    } else {
        const double inflow   = in.number("cash-inflow");
        const auto   lifespan = in.integer("lifespan", 1, constants::MAX_LOAN_TERM_YEARS);
        if (!in.error()) flows.assign(static_cast<std::size_t>(lifespan), inflow);
    }
    if (auto err = in.error()) return fail(*err);
    debug(config, "npv cash flows: [{}]", describe_list(flows));

    auto npv = InvestmentAnalyzer::npv(initial, flows, rate);
    if (!npv) return fail(npv.error());

    return render_summary("Net Present Value", Rows{
        {"Initial investment", format_currency(initial)},
        {"Discount rate",      format_rate(rate)},
        {"Periods",            fmt::format("{}", flows.size())},
        {"NPV",                format_currency(*npv)},
        {"Decision",           *npv > 0.0 ? "Accept" : "Reject"},
    });
}

FinanceResult<std::string> cmd_dcf(const ParsedArgs& args, const CliConfig& config) {
    ArgumentReader in(args);
    const auto   flows = in.numbers("cash-flows", true);
    const double rate  = in.number("discount-rate");
    if (auto err = in.error()) return fail(*err);
    debug(config, "dcf cash flows: [{}]", describe_list(flows));

    return single("Discounted Cash Flow", "Present value of flows",
                  InvestmentAnalyzer::dcf(flows, rate), as_currency);
}

FinanceResult<std::string> cmd_payback_period(const ParsedArgs& args, const CliConfig&) {
    ArgumentReader in(args);
    const double cost  = in.number("initial-cost");
    const auto   flows = in.numbers("cash-flows", true);
    if (auto err = in.error()) return fail(*err);

    auto period = InvestmentAnalyzer::payback_period(cost, flows);
    if (!period) return fail(period.error());

    const std::string shown = period->has_value()
        ? fmt::format("{:.2f} periods", **period)
        : std::string{"Not recovered"};
    return render_summary("Payback Period", Rows{
        {"Initial cost",   format_currency(cost)},
        {"Payback period", shown},
    });
}

FinanceResult<std::string> cmd_roi(const ParsedArgs& args, const CliConfig&) {
    ArgumentReader in(args);
    const double profit = in.number("net-profit");
    const double cost   = in.number("cost");
    if (auto err = in.error()) return fail(*err);

    return single("Return on Investment", "ROI", InvestmentAnalyzer::roi(profit, cost), as_percent);
}

FinanceResult<std::string> cmd_capm(const ParsedArgs& args, const CliConfig&) {
    ArgumentReader in(args);
    const double risk_free = in.number("risk-free-rate");
    const double beta      = in.number("beta");
    const double market    = in.number("market-return");
    if (auto err = in.error()) return fail(*err);

    auto expected = InvestmentAnalyzer::capm(risk_free, beta, market);
    if (!expected) return fail(expected.error());

    return render_summary("Capital Asset Pricing Model", Rows{
        {"Risk-free rate",  format_rate(risk_free)},
        {"Beta",            format_number(beta, 2)},
        {"Market return",   format_rate(market)},
        {"Expected return", format_rate(*expected)},
    });
}

FinanceResult<std::string> cmd_irr(const ParsedArgs& args, const CliConfig& config) {
    ArgumentReader in(args);
    IrrOptions options;
    const auto flows       = in.numbers("cash-flows", true);
    options.guess          = in.number_or("guess", options.guess);
    options.tolerance      = in.number_or("tolerance", options.tolerance);
    if (args.has("max-iterations")) {
        options.max_iterations = static_cast<int>(in.integer("max-iterations", 1));
    }
    if (auto err = in.error()) return fail(*err);
    debug(config, "irr guess={} tolerance={} max_iterations={}",
          options.guess, options.tolerance, options.max_iterations);

    return single("Internal Rate of Return", "IRR",
                  InvestmentAnalyzer::irr(flows, options), as_rate);
}

// ─── Loans ────────────────────────────────────────────────────────────────────

FinanceResult<std::string> cmd_loan_payment(const ParsedArgs& args, const CliConfig& config) {
    ArgumentReader in(args);
    const double principal = in.number("principal");
    const double rate      = in.number("rate");
    const double years     = in.number("years");
    if (auto err = in.error()) return fail(*err);

    auto payment = LoanCalculator::monthly_payment(principal, rate, years);
    if (!payment) return fail(payment.error());

    const double months = std::round(years * constants::MONTHS_PER_YEAR);
    const double total  = *payment * months;
    const auto   payoff = LoanCalculator::payoff_date(config.start_date, static_cast<int>(months));

    return render_summary("Loan Payment", Rows{
        {"Principal",       format_currency(principal)},
        {"Annual rate",     format_percent(rate)},
        {"Term (years)",    format_number(years, 2)},
        {"Monthly payment", format_currency(*payment)},
        {"Total paid",      format_currency(total)},
        {"Total interest",  format_currency(total - principal)},
        {"Payoff date",     format_date(payoff)},
    });
}

FinanceResult<std::string> cmd_mortgage(const ParsedArgs& args, const CliConfig& config) {
    ArgumentReader in(args);
    const double amount = in.number("amount");
    const double rate   = in.number("rate");
    const auto   years  = in.integer("years");
    if (auto err = in.error()) return fail(*err);

    auto details = LoanCalculator::mortgage_details(
        amount, rate, static_cast<int>(years), config.start_date);
    if (!details) return fail(details.error());

    return render_summary("Mortgage", Rows{
        {"Loan amount",     format_currency(amount)},
        {"Annual rate",     format_percent(rate)},
        {"Term (years)",    fmt::format("{}", years)},
        {"Monthly payment", format_currency(details->monthly_payment)},
        {"Total paid",      format_currency(details->total_paid)},
        {"Total interest",  format_currency(details->total_interest)},
        {"Payoff date",     format_date(details->payoff_date)},
    });
}

FinanceResult<std::string> cmd_amortization(const ParsedArgs& args, const CliConfig& config) {
    ArgumentReader in(args);
    const double amount   = in.number("amount");
    const double rate     = in.number("rate");
    const auto   years    = in.integer("years");
    const bool   show_all = in.flag("all");
    if (auto err = in.error()) return fail(*err);

    auto schedule = LoanCalculator::amortization_schedule(amount, rate, static_cast<int>(years));
    if (!schedule) return fail(schedule.error());
    debug(config, "amortization schedule has {} rows", schedule->size());

    Table table({"Month", "Principal", "Interest", "Balance"});
    double total_interest = 0.0;
    for (const auto& row : *schedule) {
        total_interest += row.interest;
        const bool last = row.period == static_cast<int>(schedule->size());
        if (show_all || row.period == 1 || row.period % constants::MONTHS_PER_YEAR == 0 || last) {
            table.add_row({fmt::format("{}", row.period),
                           format_currency(row.principal),
                           format_currency(row.interest),
                           format_currency(row.remaining_balance)});
        }
    }

    std::string out = fmt::format("Amortization Schedule ({} payments)\n", schedule->size());
    out += table.render();
    out += fmt::format("Total interest: {}\n", format_currency(total_interest));
    return out;
}

FinanceResult<std::string> cmd_break_even(const ParsedArgs& args, const CliConfig&) {
    ArgumentReader in(args);
    const double fixed    = in.number("fixed-costs");
    const double variable = in.number("variable-cost");
    const double price    = in.number("price");
    if (auto err = in.error()) return fail(*err);

    auto result = LoanCalculator::break_even_analysis(fixed, variable, price);
    if (!result) return fail(result.error());

    return render_summary("Break-Even Analysis", Rows{
        {"Fixed costs",         format_currency(fixed)},
        {"Variable cost/unit",  format_currency(variable)},
        {"Price/unit",          format_currency(price)},
        {"Contribution margin", format_currency(price - variable)},
        {"Break-even units",    format_number(result->units, 2)},
        {"Break-even revenue",  format_currency(result->revenue)},
    });
}

FinanceResult<std::string> cmd_break_even_units(const ParsedArgs& args, const CliConfig&) {
    ArgumentReader in(args);
    const double fixed    = in.number("fixed-costs");
    const double variable = in.number("variable-cost");
    const double price    = in.number("price");
    if (auto err = in.error()) return fail(*err);

    return single("Break-Even Units", "Units",
                  LoanCalculator::break_even_units(fixed, variable, price),
                  [](double v) { return format_number(v, 2); });
}

FinanceResult<std::string> cmd_depreciation(const ParsedArgs& args, const CliConfig&) {
    ArgumentReader in(args);
    const double cost        = in.number("cost");
    const double salvage     = in.number_or("salvage", 0.0);
    const auto   life        = in.integer("life");
    const auto   method_name = in.text_or("method", "straight-line");
    if (auto err = in.error()) return fail(*err);

    const auto method = loan::parse_depreciation_method(method_name);
    if (!method) {
        return fail(FinanceError::invalid_input(fmt::format(
            "Unknown depreciation method '{}' (use straight-line or double-declining)",
            method_name)));
    }

    auto schedule = loan::depreciation_schedule(cost, salvage, static_cast<int>(life), *method);
    if (!schedule) return fail(schedule.error());

    Table table({"Year", "Depreciation", "Accumulated", "Book value"});
    for (const auto& entry : *schedule) {
        table.add_row({fmt::format("{}", entry.year),
                       format_currency(entry.depreciation),
                       format_currency(entry.accumulated),
                       format_currency(entry.book_value)});
    }
    return fmt::format("Depreciation ({})\n{}", loan::to_string(*method), table.render());
}

// ─── Ratios ───────────────────────────────────────────────────────────────────

FinanceResult<std::string> cmd_roe(const ParsedArgs& args, const CliConfig&) {
    ArgumentReader in(args);
    const double income = in.number("net-income");
    const double equity = in.number("equity");
    if (auto err = in.error()) return fail(*err);
    return single("Return on Equity", "ROE", RatioCalculator::roe(income, equity), as_percent);
}

FinanceResult<std::string> cmd_roa(const ParsedArgs& args, const CliConfig&) {
    ArgumentReader in(args);
    const double income = in.number("net-income");
    const double assets = in.number("assets");
    if (auto err = in.error()) return fail(*err);
    return single("Return on Assets", "ROA", RatioCalculator::roa(income, assets), as_percent);
}

FinanceResult<std::string> cmd_pe_ratio(const ParsedArgs& args, const CliConfig&) {
    ArgumentReader in(args);
    const double price = in.number("price");
    const double eps   = in.number("eps");
    if (auto err = in.error()) return fail(*err);
    return single("Price/Earnings", "P/E ratio", RatioCalculator::pe_ratio(price, eps), as_ratio);
}

FinanceResult<std::string> cmd_dividend_yield(const ParsedArgs& args, const CliConfig&) {
    ArgumentReader in(args);
    const double dividend = in.number("dividend");
    const double price    = in.number("price");
    if (auto err = in.error()) return fail(*err);
    return single("Dividend Yield", "Yield",
                  RatioCalculator::dividend_yield(dividend, price), as_percent);
}

FinanceResult<std::string> cmd_debt_to_equity(const ParsedArgs& args, const CliConfig&) {
    ArgumentReader in(args);
    const double debt   = in.number("debt");
    const double equity = in.number("equity");
    if (auto err = in.error()) return fail(*err);
    return single("Debt to Equity", "D/E ratio",
                  RatioCalculator::debt_to_equity(debt, equity), as_ratio);
}

FinanceResult<std::string> cmd_current_ratio(const ParsedArgs& args, const CliConfig&) {
    ArgumentReader in(args);
    const double assets      = in.number("assets");
    const double liabilities = in.number("liabilities");
    if (auto err = in.error()) return fail(*err);
    return single("Current Ratio", "Current ratio",
                  RatioCalculator::current_ratio(assets, liabilities), as_ratio);
}

FinanceResult<std::string> cmd_quick_ratio(const ParsedArgs& args, const CliConfig&) {
    ArgumentReader in(args);
    const double assets      = in.number("assets");
    const double inventory   = in.number("inventory");
    const double liabilities = in.number("liabilities");
    if (auto err = in.error()) return fail(*err);
    return single("Quick Ratio", "Quick ratio",
                  RatioCalculator::quick_ratio(assets, inventory, liabilities), as_ratio);
}

FinanceResult<std::string> cmd_wacc(const ParsedArgs& args, const CliConfig&) {
    ArgumentReader in(args);
    const double cost_equity = in.number("cost-of-equity");
    const double cost_debt   = in.number("cost-of-debt");
    const double tax         = in.number("tax-rate");
    const double equity      = in.number("equity-value");
    const double debt        = in.number("debt-value");
    if (auto err = in.error()) return fail(*err);
    return single("Weighted Average Cost of Capital", "WACC",
                  RatioCalculator::wacc(cost_equity, cost_debt, tax, equity, debt), as_rate);
}

// ─── Statistics ───────────────────────────────────────────────────────────────

FinanceResult<std::string> cmd_average(const ParsedArgs& args, const CliConfig&) {
    ArgumentReader in(args);
    const auto values = in.numbers("numbers", true);
    if (auto err = in.error()) return fail(*err);
    return single("Average", "Mean", StatisticsCalculator::mean(values), as_number);
}

FinanceResult<std::string> cmd_median(const ParsedArgs& args, const CliConfig&) {
    ArgumentReader in(args);
    const auto values = in.numbers("numbers", true);
    if (auto err = in.error()) return fail(*err);
    return single("Median", "Median", StatisticsCalculator::median(values), as_number);
}

FinanceResult<std::string> cmd_mode(const ParsedArgs& args, const CliConfig&) {
    ArgumentReader in(args);
    const auto values = in.numbers("numbers", true);
    if (auto err = in.error()) return fail(*err);

    auto mode = StatisticsCalculator::mode(values);
    if (!mode) return fail(mode.error());
    const std::string shown = mode->has_value()
        ? format_number(**mode, 4)
        : std::string{"No mode (all values unique)"};
    return render_summary("Mode", Rows{{"Mode", shown}});
}

FinanceResult<std::string> cmd_variance(const ParsedArgs& args, const CliConfig&) {
    ArgumentReader in(args);
    const auto values = in.numbers("numbers", true);
    const bool sample = in.flag("sample");
    if (auto err = in.error()) return fail(*err);

    auto variance = sample ? StatisticsCalculator::sample_variance(values)
                           : StatisticsCalculator::population_variance(values);
    return single(sample ? "Sample Variance" : "Population Variance", "Variance",
                  variance, as_number);
}

FinanceResult<std::string> cmd_standard_deviation(const ParsedArgs& args, const CliConfig&) {
    ArgumentReader in(args);
    const auto values = in.numbers("numbers", true);
    const bool sample = in.flag("sample");
    if (auto err = in.error()) return fail(*err);

    auto deviation = sample ? StatisticsCalculator::sample_std_dev(values)
                            : StatisticsCalculator::population_std_dev(values);
    return single(sample ? "Sample Standard Deviation" : "Population Standard Deviation",
                  "Std. deviation", deviation, as_number);
}

FinanceResult<std::string> cmd_probability(const ParsedArgs& args, const CliConfig&) {
    constexpr std::int64_t max_count = std::numeric_limits<std::uint32_t>::max();
    ArgumentReader in(args);
    const auto successes = in.integer("successes", 0, max_count);
    const auto trials    = in.integer("trials", 0, max_count);
    if (auto err = in.error()) return fail(*err);

    auto p = StatisticsCalculator::probability(static_cast<std::uint32_t>(successes),
                                               static_cast<std::uint32_t>(trials));
    if (!p) return fail(p.error());
    return render_summary("Probability", Rows{
        {"Probability", format_number(*p, 4)},
        {"Percent",     format_rate(*p)},
    });
}

FinanceResult<std::string> cmd_weighted_average(const ParsedArgs& args, const CliConfig&) {
    ArgumentReader in(args);
    const auto values  = in.numbers("numbers");
    const auto weights = in.numbers("weights");
    if (auto err = in.error()) return fail(*err);
    return single("Weighted Average", "Weighted average",
                  StatisticsCalculator::weighted_average(values, weights), as_number);
}

FinanceResult<std::string> cmd_help(const ParsedArgs&, const CliConfig&) {
    return usage_text();
}

// ─── Table ────────────────────────────────────────────────────────────────────

constexpr Command kCommands[] = {
    {"interest",           "--principal P --rate R --time T",
     "Simple interest P*r*t (rate as a decimal)",                    cmd_interest},
    {"compound-interest",  "--principal P --rate R --frequency N --years Y",
     "Compound amount P*(1+r/n)^(n*t)",                              cmd_compound_interest},
    {"present-value",      "--future-value FV --rate R --time T",
     "Discount a future amount",                                     cmd_present_value},
    {"future-value",       "--present-value PV --rate R --time T",
     "Grow a present amount",                                        cmd_future_value},
    {"npv",                "--initial-investment I --discount-rate R (--cash-flows LIST | --cash-inflow C --lifespan N)",
     "Net present value with an accept/reject decision",             cmd_npv},
    {"dcf",                "--cash-flows LIST --discount-rate R",
     "Present value of a cash-flow series",                          cmd_dcf},
    {"payback-period",     "--initial-cost C --cash-flows LIST",
     "Periods until the cost is recovered",                          cmd_payback_period},
    {"roi",                "--net-profit N --cost C",
     "Return on investment (%)",                                     cmd_roi},
    {"capm",               "--risk-free-rate RF --beta B --market-return RM",
     "CAPM expected return",                                         cmd_capm},
    {"irr",                "--cash-flows LIST [--guess G] [--tolerance T] [--max-iterations N]",
     "Internal rate of return (first flow at t=0)",                  cmd_irr},
    {"loan-payment",       "--principal P --rate PCT --years Y",
     "Monthly payment (annual rate in percent)",                     cmd_loan_payment},
    {"mortgage",           "--amount A --rate PCT --years Y",
     "Mortgage payment, totals and payoff date",                     cmd_mortgage},
    {"amortization",       "--amount A --rate PCT --years Y [--all]",
     "Month-by-month amortization schedule",                         cmd_amortization},
    {"break-even",         "--fixed-costs F --variable-cost V --price P",
     "Break-even units and revenue",                                 cmd_break_even},
    {"break-even-units",   "--fixed-costs F --variable-cost V --price P",
     "Break-even units only",                                        cmd_break_even_units},
    {"depreciation",       "--cost C [--salvage S] --life N [--method straight-line|double-declining]",
     "Year-by-year depreciation schedule",                           cmd_depreciation},
    {"roe",                "--net-income N --equity E",
     "Return on equity (%)",                                         cmd_roe},
    {"roa",                "--net-income N --assets A",
     "Return on assets (%)",                                         cmd_roa},
    {"pe-ratio",           "--price P --eps E",
     "Price-to-earnings ratio",                                      cmd_pe_ratio},
    {"wacc",               "--cost-of-equity RE --cost-of-debt RD --tax-rate T --equity-value E --debt-value D",
     "Weighted average cost of capital",                             cmd_wacc},
    {"debt-to-equity",     "--debt D --equity E",
     "Debt-to-equity ratio",                                         cmd_debt_to_equity},
    {"current-ratio",      "--assets A --liabilities L",
     "Current assets / current liabilities",                         cmd_current_ratio},
    {"quick-ratio",        "--assets A --inventory I --liabilities L",
     "(Current assets - inventory) / current liabilities",           cmd_quick_ratio},
    {"dividend-yield",     "--dividend D --price P",
     "Dividend yield (%)",                                           cmd_dividend_yield},
    {"average",            "--numbers LIST | NUMBERS...",
     "Arithmetic mean",                                              cmd_average},
    {"median",             "--numbers LIST | NUMBERS...",
     "Median",                                                       cmd_median},
    {"mode",               "--numbers LIST | NUMBERS...",
     "Most frequent value",                                          cmd_mode},
    {"variance",           "--numbers LIST [--sample]",
     "Population (or sample) variance",                              cmd_variance},
    {"standard-deviation", "--numbers LIST [--sample]",
     "Population (or sample) standard deviation",                    cmd_standard_deviation},
    {"probability",        "--successes S --trials T",
     "Successes / trials",                                           cmd_probability},
    {"weighted-average",   "--numbers LIST --weights LIST",
     "Weighted average",                                             cmd_weighted_average},
    {"help",               "",
     "Show this help",                                               cmd_help},
};

}  // namespace

std::span<const Command> commands() noexcept {
    return kCommands;
}

const Command* find_command(std::string_view name) noexcept {
    const auto it = std::find_if(std::begin(kCommands), std::end(kCommands),
                                 [name](const Command& c) { return c.name == name; });
    return it == std::end(kCommands) ? nullptr : it;
}

FinanceResult<std::string>
run_command(std::string_view name, const ParsedArgs& args, const CliConfig& config) {
    const Command* command = find_command(name);
    if (command == nullptr) {
        return fail(FinanceError::invalid_input(fmt::format("Unknown command '{}'", name)));
    }
    debug(config, "command={} flags={} positionals={} start_date={}",
          command->name, args.flags.size(), args.positionals.size(),
          format_date(config.start_date));
    return command->run(args, config);
}

std::string usage_text() {
    std::string out =
        "Usage:\n"
        "  fincalc [--verbose] [--start-date YYYY-MM-DD] <command> [--flag value ...]\n"
        "\n"
        "Lists accept comma- or space-separated numbers: --cash-flows 100,200,300\n"
        "\n"
        "Commands:\n";
    for (const auto& command : kCommands) {
        out += fmt::format("  {:<19} {}\n", command.name, command.summary);
        if (!command.arguments.empty()) {
            out += fmt::format("  {:<19}   {}\n", "", command.arguments);
        }
    }
    return out;
}

} // namespace fincalc::cli
