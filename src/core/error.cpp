/// @file src/core/error.cpp
/// @brief FinanceError construction and rendering.

#include "fincalc/error.hpp"

#include <fmt/format.h>

namespace fincalc {

std::string_view to_string(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::InvalidInput:      return "InvalidInput";
        case ErrorKind::DivisionByZero:    return "DivisionByZero";
        case ErrorKind::Overflow:          return "Overflow";
        case ErrorKind::ConvergenceFailed: return "ConvergenceFailed";
    }
    return "Unknown";
}

std::string FinanceError::to_string() const {
    return fmt::format("{}: {}", fincalc::to_string(kind), message);
}

// ─── Factories ────────────────────────────────────────────────────────────────

FinanceError FinanceError::invalid_input(std::string_view field,
                                         double value,
                                         std::string_view reason) {
    return FinanceError{
        .kind    = ErrorKind::InvalidInput,
        .message = fmt::format("{} {}: {}", field, reason, value),
        .field   = std::string(field),
        .value   = value,
    };
}

FinanceError FinanceError::invalid_input(std::string message) {
    return FinanceError{
        .kind    = ErrorKind::InvalidInput,
        .message = std::move(message),
        .field   = {},
        .value   = std::nullopt,
    };
}

FinanceError FinanceError::division_by_zero(std::string_view context) {
    return FinanceError{
        .kind    = ErrorKind::DivisionByZero,
        .message = fmt::format("division by zero in {}", context),
        .field   = {},
        .value   = std::nullopt,
    };
}

FinanceError FinanceError::overflow(std::string_view context) {
    return FinanceError{
        .kind    = ErrorKind::Overflow,
        .message = fmt::format("{} produced a non-finite result", context),
        .field   = {},
        .value   = std::nullopt,
    };
}

FinanceError FinanceError::convergence_failed(std::string message) {
    return FinanceError{
        .kind    = ErrorKind::ConvergenceFailed,
        .message = std::move(message),
        .field   = {},
        .value   = std::nullopt,
    };
}

} // namespace fincalc
