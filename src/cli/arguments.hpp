#pragma once

/// @file src/cli/arguments.hpp
/// @brief Command-line tokenisation and typed argument access for `fincalc`.
///
/// # Grammar
/// ```
/// fincalc [--verbose] [--start-date YYYY-MM-DD] <command> [--flag value | --switch | number]...
/// ```
/// A `--flag` consumes the next token as its value unless that token is
/// itself a `--flag` (or there is none), in which case the flag is a switch.
/// `--flag=value` is also accepted. Remaining tokens are positionals.
///
/// Parse failures are reported as `InvalidInput` so the CLI renders them the
/// same way as calculation errors.

#include "fincalc/error.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <limits>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace fincalc::cli {

/// Options that apply to every command.
struct CliConfig {
    bool verbose = false;
    std::chrono::year_month_day start_date{};  ///< Payoff-date origin ("today")
};

/// Flags and positionals following the command name.
struct ParsedArgs {
    std::map<std::string, std::string, std::less<>> flags;  ///< name (no dashes) → value
    std::vector<std::string> positionals;

    [[nodiscard]] bool has(std::string_view flag) const noexcept;
    [[nodiscard]] std::optional<std::string_view> get(std::string_view flag) const noexcept;
};

/// A fully tokenised command line.
struct CommandLine {
    bool                       verbose = false;
    bool                       help    = false;
    std::optional<std::chrono::year_month_day> start_date;
    std::string                command;
    ParsedArgs                 args;
};

/// Split argv (without the program name) into globals, command and arguments.
[[nodiscard]] FinanceResult<CommandLine>
parse_command_line(std::span<const std::string_view> tokens);

// ─── Scalar parsing ───────────────────────────────────────────────────────────

/// Whole-token decimal parse via std::from_chars. "inf"/"nan" parse
/// successfully and are left for the calculation layer to reject.
[[nodiscard]] std::optional<double> parse_double(std::string_view text) noexcept;

[[nodiscard]] std::optional<std::int64_t> parse_integer(std::string_view text) noexcept;

/// Numbers separated by commas and/or whitespace: "1,2, 3 4".
[[nodiscard]] FinanceResult<std::vector<double>> parse_number_list(std::string_view text);

/// Strict "YYYY-MM-DD".
[[nodiscard]] std::optional<std::chrono::year_month_day>
parse_date(std::string_view text) noexcept;

// ─── ArgumentReader ───────────────────────────────────────────────────────────

/// Typed, error-accumulating view over `ParsedArgs`.
///
/// Each accessor returns a placeholder on failure and records the first
/// error, so a command reads all its inputs and checks `error()` once:
/// ```cpp
/// ArgumentReader in(args);
/// const double p = in.number("principal");
/// const double r = in.number("rate");
/// if (auto err = in.error()) return fail(*err);
/// ```
class ArgumentReader {
public:
    explicit ArgumentReader(const ParsedArgs& args) noexcept : args_(args) {}

    /// Required floating-point flag.
    double number(std::string_view flag);

    /// Optional floating-point flag with a default.
    double number_or(std::string_view flag, double fallback);

    /// Required integer flag in [min, max].
    std::int64_t integer(std::string_view flag,
                         std::int64_t min = std::numeric_limits<std::int32_t>::min(),
                         std::int64_t max = std::numeric_limits<std::int32_t>::max());

    /// Number list from `--flag`, or from the positionals when the flag is
    /// absent and `allow_positionals` is set.
    std::vector<double> numbers(std::string_view flag, bool allow_positionals = false);

    /// String flag with a default.
    std::string text_or(std::string_view flag, std::string_view fallback);

    /// Switch presence (`--sample`, `--all`).
    [[nodiscard]] bool flag(std::string_view name) const noexcept { return args_.has(name); }

    [[nodiscard]] const std::optional<FinanceError>& error() const noexcept { return error_; }

private:
    void record(FinanceError err);

    const ParsedArgs&           args_;
    std::optional<FinanceError> error_;
};

} // namespace fincalc::cli
