/// @file src/cli/arguments.cpp
/// @brief Command-line tokenisation and typed argument access.

#include "arguments.hpp"

#include <cctype>
#include <charconv>
#include <fmt/format.h>
#include <system_error>

namespace fincalc::cli {

namespace {

[[nodiscard]] bool is_flag(std::string_view token) noexcept {
    return token.size() > 2 && token.starts_with("--");
}

[[nodiscard]] bool is_list_separator(char c) noexcept {
    return c == ',' || std::isspace(static_cast<unsigned char>(c)) != 0;
}

[[nodiscard]] FinanceError missing_flag(std::string_view flag) {
    return FinanceError::invalid_input(fmt::format("Missing required argument --{}", flag));
}

}  // namespace

// ─── ParsedArgs ───────────────────────────────────────────────────────────────

bool ParsedArgs::has(std::string_view flag) const noexcept {
    return flags.find(flag) != flags.end();
}

std::optional<std::string_view> ParsedArgs::get(std::string_view flag) const noexcept {
    const auto it = flags.find(flag);
    if (it == flags.end()) return std::nullopt;
    return std::string_view{it->second};
}

// ─── Scalar parsing ───────────────────────────────────────────────────────────

std::optional<double> parse_double(std::string_view text) noexcept {
    if (text.empty()) return std::nullopt;
    double value = 0.0;
    const auto* end = text.data() + text.size();
    const auto [ptr, ec] = std::from_chars(text.data(), end, value);
    if (ec != std::errc{} || ptr != end) return std::nullopt;
    return value;
}

std::optional<std::int64_t> parse_integer(std::string_view text) noexcept {
    if (text.empty()) return std::nullopt;
    std::int64_t value = 0;
    const auto* end = text.data() + text.size();
    const auto [ptr, ec] = std::from_chars(text.data(), end, value);
    if (ec != std::errc{} || ptr != end) return std::nullopt;
    return value;
}

FinanceResult<std::vector<double>> parse_number_list(std::string_view text) {
    std::vector<double> values;
    std::size_t pos = 0;
    while (pos < text.size()) {
        while (pos < text.size() && is_list_separator(text[pos])) ++pos;
        if (pos >= text.size()) break;

        std::size_t end = pos;
        while (end < text.size() && !is_list_separator(text[end])) ++end;

        const std::string_view token = text.substr(pos, end - pos);
        const auto value = parse_double(token);
        if (!value) {
            return fail(FinanceError::invalid_input(
                fmt::format("'{}' is not a valid number", token)));
        }
        values.push_back(*value);
        pos = end;
    }
    if (values.empty()) {
        return fail(FinanceError::invalid_input("Expected at least one number"));
    }
    return values;
}

std::optional<std::chrono::year_month_day> parse_date(std::string_view text) noexcept {
    // YYYY-MM-DD
    if (text.size() != 10 || text[4] != '-' || text[7] != '-') return std::nullopt;

    const auto y = parse_integer(text.substr(0, 4));
    const auto m = parse_integer(text.substr(5, 2));
    const auto d = parse_integer(text.substr(8, 2));
    if (!y || !m || !d || *y < 0 || *m < 0 || *d < 0) return std::nullopt;

    const std::chrono::year_month_day date{
        std::chrono::year{static_cast<int>(*y)},
        std::chrono::month{static_cast<unsigned>(*m)},
        std::chrono::day{static_cast<unsigned>(*d)}};
    if (!date.ok()) return std::nullopt;
    return date;
}

// ─── Command line ─────────────────────────────────────────────────────────────

FinanceResult<CommandLine> parse_command_line(std::span<const std::string_view> tokens) {
    CommandLine line;
    std::size_t i = 0;

    // Global options precede the command name.
    for (; i < tokens.size(); ++i) {
        const std::string_view token = tokens[i];
        if (token == "--verbose" || token == "-v") {
            line.verbose = true;
        } else if (token == "--help" || token == "-h") {
            line.help = true;
        } else if (token == "--start-date" || token.starts_with("--start-date=")) {
            std::string_view value;
            if (token == "--start-date") {
                if (i + 1 >= tokens.size()) {
                    return fail(FinanceError::invalid_input(
                        "--start-date requires a value (YYYY-MM-DD)"));
                }
                value = tokens[++i];
            } else {
                value = token.substr(std::string_view{"--start-date="}.size());
            }
            const auto date = parse_date(value);
            if (!date) {
                return fail(FinanceError::invalid_input(
                    fmt::format("Invalid --start-date '{}', expected YYYY-MM-DD", value)));
            }
            line.start_date = *date;
        } else if (is_flag(token)) {
            return fail(FinanceError::invalid_input(
                fmt::format("Unknown global option '{}'", token)));
        } else {
            break;
        }
    }

    if (i >= tokens.size()) return line;
    line.command = std::string{tokens[i++]};

    for (; i < tokens.size(); ++i) {
        const std::string_view token = tokens[i];
        if (!is_flag(token)) {
            line.args.positionals.emplace_back(token);
            continue;
        }

        std::string_view name = token.substr(2);
        std::string_view value;
        if (const auto eq = name.find('='); eq != std::string_view::npos) {
            value = name.substr(eq + 1);
            name  = name.substr(0, eq);
        } else if (i + 1 < tokens.size() && !is_flag(tokens[i + 1])) {
            value = tokens[++i];
        }

        if (name == "help") {
            line.help = true;
            continue;
        }
        line.args.flags.insert_or_assign(std::string{name}, std::string{value});
    }
    return line;
}

// ─── ArgumentReader ───────────────────────────────────────────────────────────

void ArgumentReader::record(FinanceError err) {
    if (!error_) error_ = std::move(err);
}

double ArgumentReader::number(std::string_view flag) {
    const auto text = args_.get(flag);
    if (!text) {
        record(missing_flag(flag));
        return 0.0;
    }
    const auto value = parse_double(*text);
    if (!value) {
        record(FinanceError::invalid_input(
            fmt::format("--{} expects a number, got '{}'", flag, *text)));
        return 0.0;
    }
    return *value;
}

double ArgumentReader::number_or(std::string_view flag, double fallback) {
    if (!args_.has(flag)) return fallback;
    return number(flag);
}

std::int64_t ArgumentReader::integer(std::string_view flag, std::int64_t min, std::int64_t max) {
    const auto text = args_.get(flag);
    if (!text) {
        record(missing_flag(flag));
        return 0;
    }
    const auto value = parse_integer(*text);
    if (!value) {
        record(FinanceError::invalid_input(
            fmt::format("--{} expects a whole number, got '{}'", flag, *text)));
        return 0;
    }
    if (*value < min || *value > max) {
        record(FinanceError::invalid_input(
            fmt::format("--{} must be between {} and {}, got {}", flag, min, max, *value)));
        return 0;
    }
    return *value;
}

std::vector<double> ArgumentReader::numbers(std::string_view flag, bool allow_positionals) {
    if (const auto text = args_.get(flag)) {
        auto values = parse_number_list(*text);
        if (!values) {
            record(FinanceError::invalid_input(
                fmt::format("--{}: {}", flag, values.error().message)));
            return {};
        }
        return std::move(*values);
    }

    if (allow_positionals && !args_.positionals.empty()) {
        std::vector<double> values;
        for (const auto& token : args_.positionals) {
            auto part = parse_number_list(token);
            if (!part) {
                record(std::move(part.error()));
                return {};
            }
            values.insert(values.end(), part->begin(), part->end());
        }
        return values;
    }

    record(missing_flag(flag));
    return {};
}

std::string ArgumentReader::text_or(std::string_view flag, std::string_view fallback) {
    const auto text = args_.get(flag);
    return std::string{text.value_or(fallback)};
}

} // namespace fincalc::cli
