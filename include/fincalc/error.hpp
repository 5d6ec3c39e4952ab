#pragma once

/// @file include/fincalc/error.hpp
/// @brief Typed error values shared by every fincalc calculation.
///
/// # Error Taxonomy
///   - InvalidInput:      an argument violated a precondition (non-finite,
///                        wrong sign, empty series, mismatched lengths,
///                        out-of-domain rate)
///   - DivisionByZero:    a denominator evaluated to exactly zero
///   - Overflow:          the result is non-finite although the inputs were
///   - ConvergenceFailed: an iterative solver (IRR) did not reach its
///                        tolerance within its iteration bound
///
/// ## Propagation
/// Every fallible function returns `FinanceResult<T>` and hands errors back to
/// its immediate caller unchanged. Nothing in the library logs, prints,
/// retries or recovers; the CLI is the only place errors are rendered.

#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace fincalc {

/// Discriminant of a `FinanceError`.
enum class ErrorKind {
    InvalidInput,
    DivisionByZero,
    Overflow,
    ConvergenceFailed,
};

/// Stable display name ("InvalidInput", "DivisionByZero", ...).
[[nodiscard]] std::string_view to_string(ErrorKind kind) noexcept;

/// A calculation failure with enough context to build a user message.
struct FinanceError {
    ErrorKind             kind;
    std::string           message;  ///< Human-readable, names field and value
    std::string           field;    ///< Offending argument; empty if none
    std::optional<double> value;    ///< Offending value, when there is one

    /// "<Kind>: <message>"
    [[nodiscard]] std::string to_string() const;

    // ── Factories ─────────────────────────────────────────────────────────────

    /// InvalidInput with message "<field> <reason>: <value>".
    [[nodiscard]] static FinanceError
    invalid_input(std::string_view field, double value, std::string_view reason);

    /// InvalidInput that is not tied to a single numeric value.
    [[nodiscard]] static FinanceError invalid_input(std::string message);

    [[nodiscard]] static FinanceError division_by_zero(std::string_view context);

    [[nodiscard]] static FinanceError overflow(std::string_view context);

    [[nodiscard]] static FinanceError convergence_failed(std::string message);
};

/// Success value or typed error.
template <typename T>
using FinanceResult = std::expected<T, FinanceError>;

/// Result of a check that produces no value.
using Status = FinanceResult<void>;

/// Shorthand for `std::unexpected(err)` at return sites.
[[nodiscard]] inline std::unexpected<FinanceError> fail(FinanceError err) {
    return std::unexpected<FinanceError>(std::move(err));
}

} // namespace fincalc
