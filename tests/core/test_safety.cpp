#include <gtest/gtest.h>
#include "fincalc/safety.hpp"
#include "fincalc/constants.hpp"

#include <cmath>
#include <limits>

using namespace fincalc;
using namespace fincalc::safety;

namespace {
constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();
constexpr double kInf = std::numeric_limits<double>::infinity();
}

// ─── Validators ───────────────────────────────────────────────────────────────

TEST(Safety_ValidatePositive, AcceptsPositive) {
    EXPECT_TRUE(validate_positive(0.01, "x").has_value());
}

TEST(Safety_ValidatePositive, RejectsZeroNegativeAndNonFinite) {
    for (double v : {0.0, -1.0, kNaN, kInf, -kInf}) {
        auto r = validate_positive(v, "Amount");
        ASSERT_FALSE(r.has_value()) << v;
        EXPECT_EQ(r.error().kind, ErrorKind::InvalidInput);
        EXPECT_EQ(r.error().field, "Amount");
    }
}

TEST(Safety_ValidatePositive, NonFiniteMessageDiffersFromSign) {
    EXPECT_NE(validate_positive(kNaN, "x").error().message.find("valid number"),
              std::string::npos);
    EXPECT_NE(validate_positive(-1.0, "x").error().message.find("positive"),
              std::string::npos);
}

TEST(Safety_ValidateNonNegative, ZeroAllowed) {
    EXPECT_TRUE(validate_non_negative(0.0, "x").has_value());
    EXPECT_FALSE(validate_non_negative(-1e-12, "x").has_value());
    EXPECT_FALSE(validate_non_negative(kNaN, "x").has_value());
}

TEST(Safety_ValidateFinite, NegativeAllowed) {
    EXPECT_TRUE(validate_finite(-1e300, "x").has_value());
    EXPECT_FALSE(validate_finite(kInf, "x").has_value());
}

TEST(Safety_ValidateRange, BoundaryIsInclusive) {
    EXPECT_TRUE(validate_calculation_range(constants::MAX_SAFE_MAGNITUDE, "x").has_value());
    EXPECT_TRUE(validate_calculation_range(-constants::MAX_SAFE_MAGNITUDE, "x").has_value());
    EXPECT_FALSE(validate_calculation_range(1.1e15, "x").has_value());
    EXPECT_FALSE(validate_calculation_range(kNaN, "x").has_value());
}

TEST(Safety_ValidateRange, CustomLimits) {
    const SafetyLimits tight{.max_magnitude = 100.0, .max_exponent = 10.0};
    EXPECT_TRUE(validate_calculation_range(100.0, "x", tight).has_value());
    EXPECT_FALSE(validate_calculation_range(100.5, "x", tight).has_value());
}

// ─── safe_multiply ────────────────────────────────────────────────────────────

TEST(Safety_Multiply, Product) {
    auto r = safe_multiply(3.0, -4.0);
    ASSERT_TRUE(r.has_value());
    EXPECT_DOUBLE_EQ(*r, -12.0);
}

TEST(Safety_Multiply, OverflowDetected) {
    auto r = safe_multiply(1e200, 1e200);
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().kind, ErrorKind::Overflow);

    EXPECT_FALSE(safe_multiply(1e308, 2.0).has_value());
}

TEST(Safety_Multiply, NonFiniteOperandIsInvalidInput) {
    auto r = safe_multiply(kNaN, 1.0);
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().kind, ErrorKind::InvalidInput);
}

// ─── safe_divide ──────────────────────────────────────────────────────────────

TEST(Safety_Divide, Quotient) {
    auto r = safe_divide(10.0, 4.0);
    ASSERT_TRUE(r.has_value());
    EXPECT_DOUBLE_EQ(*r, 2.5);
}

TEST(Safety_Divide, ZeroDivisor) {
    for (double zero : {0.0, -0.0}) {
        auto r = safe_divide(1.0, zero);
        ASSERT_FALSE(r.has_value());
        EXPECT_EQ(r.error().kind, ErrorKind::DivisionByZero);
    }
}

TEST(Safety_Divide, TinyDivisorOverflows) {
    auto r = safe_divide(1e300, 1e-300);
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().kind, ErrorKind::Overflow);
}

// ─── safe_power ───────────────────────────────────────────────────────────────

TEST(Safety_Power, Basic) {
    auto r = safe_power(1.05, 2.0);
    ASSERT_TRUE(r.has_value());
    EXPECT_NEAR(*r, 1.1025, 1e-12);
}

TEST(Safety_Power, ExponentCutoffIsPolicyNotOverflow) {
    // 1.0^101 is representable, but the exponent exceeds the limit.
    auto r = safe_power(1.0, 101.0);
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().kind, ErrorKind::InvalidInput);

    EXPECT_FALSE(safe_power(2.0, 1000.0).has_value());
    EXPECT_TRUE(safe_power(1.0, 100.0).has_value());
    EXPECT_TRUE(safe_power(1.0, -100.0).has_value());
}

TEST(Safety_Power, ExponentLimitOverridable) {
    const SafetyLimits wide{.max_magnitude = constants::MAX_SAFE_MAGNITUDE,
                            .max_exponent  = 400.0};
    EXPECT_TRUE(safe_power(1.005, 360.0, wide).has_value());
}

TEST(Safety_Power, NegativeBaseFractionalExponentOverflow) {
    auto r = safe_power(-2.0, 0.5);
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().kind, ErrorKind::Overflow);
}

TEST(Safety_Power, HugeResultOverflow) {
    auto r = safe_power(1e10, 50.0);
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().kind, ErrorKind::Overflow);
}

// ─── Exception specification ──────────────────────────────────────────────────

TEST(Safety_ExceptionSpec, FallibleFunctionsMayAllocateErrors) {
    // Building a FinanceError message allocates, so these may throw bad_alloc.
    static_assert(!noexcept(safe_divide(1.0, 0.0)));
    static_assert(!noexcept(validate_positive(1.0, "x")));
    static_assert(noexcept(fincalc::to_string(ErrorKind::Overflow)));

    auto r = safe_divide(1.0, 0.0);
    ASSERT_FALSE(r.has_value());
    EXPECT_FALSE(r.error().message.empty());
}
