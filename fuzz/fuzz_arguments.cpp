/**
 * @file  fuzz_arguments.cpp
 * @brief libFuzzer target for command-line parsing and dispatch.
 *
 * Build:
 *   cmake -DFINCALC_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++ ..
 *   cmake --build . --target fuzz_arguments
 *
 * Input is split on whitespace into argv-style tokens and run through the
 * full parse → dispatch path with a fixed start date. Invariants:
 *   1. No crash, no UB, no uncaught exception for any byte sequence.
 *   2. A failed run always carries a non-empty message.
 */

#include <cassert>
#include <cctype>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string_view>
#include <vector>

#include "cli/arguments.hpp"
#include "cli/commands.hpp"

using namespace fincalc::cli;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const std::string_view input{reinterpret_cast<const char*>(data), size};

    std::vector<std::string_view> tokens;
    std::size_t pos = 0;
    while (pos < input.size()) {
        while (pos < input.size() && std::isspace(static_cast<unsigned char>(input[pos]))) ++pos;
        std::size_t end = pos;
        while (end < input.size() && !std::isspace(static_cast<unsigned char>(input[end]))) ++end;
        if (end > pos) tokens.push_back(input.substr(pos, end - pos));
        pos = end;
    }

    const auto line = parse_command_line(tokens);
    if (!line) {
        assert(!line.error().message.empty());
        return 0;
    }
    if (line->command.empty() || line->command == "help") return 0;

    CliConfig config;
    config.start_date = std::chrono::year_month_day{
        std::chrono::year{2024}, std::chrono::January, std::chrono::day{1}};

    const auto output = run_command(line->command, line->args, config);
    if (!output) assert(!output.error().message.empty());
    return 0;
}
