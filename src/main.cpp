/// @file src/main.cpp
/// @brief fincalc CLI entry point.
///
/// Usage:
///   fincalc <command> [--flag value ...]    Run one calculation
///   fincalc --start-date 2024-01-15 mortgage --amount 200000 --rate 4.5 --years 30
///   fincalc --help                          Print usage
///
/// Exit codes: 0 success, 1 calculation error, 2 usage error.

#include "cli/arguments.hpp"
#include "cli/commands.hpp"

#include <fmt/core.h>

#include <chrono>
#include <string_view>
#include <vector>

namespace {

constexpr int kExitOk    = 0;
constexpr int kExitError = 1;
constexpr int kExitUsage = 2;

void print_usage() {
    fmt::print("{}", fincalc::cli::usage_text());
}

/// The only place the wall clock is read.
std::chrono::year_month_day today() {
    return std::chrono::year_month_day{
        std::chrono::floor<std::chrono::days>(std::chrono::system_clock::now())};
}

}  // anonymous namespace

int main(int argc, char* argv[]) {
    std::vector<std::string_view> tokens;
    for (int i = 1; i < argc; ++i) tokens.emplace_back(argv[i]);

    auto line = fincalc::cli::parse_command_line(tokens);
    if (!line) {
        fmt::print(stderr, "Error: {}\n", line.error().message);
        return kExitUsage;
    }

    if (line->command.empty()) {
        print_usage();
        return line->help ? kExitOk : kExitUsage;
    }

    const auto* command = fincalc::cli::find_command(line->command);
    if (command == nullptr) {
        fmt::print(stderr, "Unknown command: {}\n", line->command);
        print_usage();
        return kExitUsage;
    }

    if (line->help) {
        fmt::print("Usage: fincalc {} {}\n  {}\n",
                   command->name, command->arguments, command->summary);
        return kExitOk;
    }

    fincalc::cli::CliConfig config;
    config.verbose    = line->verbose;
    config.start_date = line->start_date.value_or(today());

    auto output = fincalc::cli::run_command(command->name, line->args, config);
    if (!output) {
        fmt::print(stderr, "Error: {}\n", output.error().to_string());
        return kExitError;
    }

    fmt::print("{}", *output);
    return kExitOk;
}
