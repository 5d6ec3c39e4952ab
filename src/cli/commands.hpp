#pragma once

/// @file src/cli/commands.hpp
/// @brief The `fincalc` command table.
///
/// Each command reads its flags through `ArgumentReader`, calls one
/// calculator, and returns the rendered report. Errors from either step are
/// returned unrendered so `main` decides how to print them and which exit
/// code to use.

#include "arguments.hpp"

#include "fincalc/error.hpp"

#include <span>
#include <string>
#include <string_view>

namespace fincalc::cli {

using CommandFn = FinanceResult<std::string> (*)(const ParsedArgs&, const CliConfig&);

struct Command {
    std::string_view name;
    std::string_view arguments;  ///< Usage synopsis, e.g. "--principal P --rate R"
    std::string_view summary;
    CommandFn        run;
};

/// All commands, in help-text order.
[[nodiscard]] std::span<const Command> commands() noexcept;

/// nullptr if `name` is not a command.
[[nodiscard]] const Command* find_command(std::string_view name) noexcept;

/// Look up `name` and run it. Unknown names are InvalidInput.
[[nodiscard]] FinanceResult<std::string>
run_command(std::string_view name, const ParsedArgs& args, const CliConfig& config);

/// Full help text listing every command.
[[nodiscard]] std::string usage_text();

} // namespace fincalc::cli
