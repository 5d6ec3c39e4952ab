#include <gtest/gtest.h>
#include "fincalc/ratios.hpp"

#include <limits>

using namespace fincalc;
using namespace fincalc::ratios;

// ─── Profitability ────────────────────────────────────────────────────────────

TEST(Ratios_Roe, PositiveAndNegativeIncome) {
    EXPECT_DOUBLE_EQ(*RatioCalculator::roe(1000000.0, 5000000.0), 20.0);
    EXPECT_DOUBLE_EQ(*RatioCalculator::roe(-500000.0, 5000000.0), -10.0);
}

TEST(Ratios_Roe, NonPositiveEquityRejected) {
    auto r = RatioCalculator::roe(1000.0, 0.0);
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().kind, ErrorKind::InvalidInput);
    EXPECT_FALSE(RatioCalculator::roe(1000.0, -1.0).has_value());
}

TEST(Ratios_Roa, KnownValue) {
    EXPECT_DOUBLE_EQ(*RatioCalculator::roa(500000.0, 5000000.0), 10.0);
    EXPECT_FALSE(RatioCalculator::roa(
        std::numeric_limits<double>::quiet_NaN(), 100.0).has_value());
}

// ─── Valuation ────────────────────────────────────────────────────────────────

TEST(Ratios_PeRatio, KnownValue) {
    EXPECT_DOUBLE_EQ(*RatioCalculator::pe_ratio(50.0, 5.0), 10.0);
    EXPECT_FALSE(RatioCalculator::pe_ratio(50.0, 0.0).has_value());
    EXPECT_FALSE(RatioCalculator::pe_ratio(50.0, -2.0).has_value());
}

TEST(Ratios_DividendYield, KnownValue) {
    EXPECT_DOUBLE_EQ(*RatioCalculator::dividend_yield(2.5, 50.0), 5.0);
    EXPECT_DOUBLE_EQ(*RatioCalculator::dividend_yield(0.0, 50.0), 0.0);
    EXPECT_FALSE(RatioCalculator::dividend_yield(2.5, 0.0).has_value());
}

// ─── Leverage & Liquidity ─────────────────────────────────────────────────────

TEST(Ratios_DebtToEquity, KnownValue) {
    EXPECT_DOUBLE_EQ(*RatioCalculator::debt_to_equity(500000.0, 1000000.0), 0.5);
    EXPECT_DOUBLE_EQ(*RatioCalculator::debt_to_equity(0.0, 1000000.0), 0.0);
    EXPECT_FALSE(RatioCalculator::debt_to_equity(100.0, 0.0).has_value());
}

TEST(Ratios_CurrentRatio, KnownValue) {
    EXPECT_DOUBLE_EQ(*RatioCalculator::current_ratio(200000.0, 100000.0), 2.0);
    EXPECT_FALSE(RatioCalculator::current_ratio(200000.0, 0.0).has_value());
}

TEST(Ratios_QuickRatio, KnownValue) {
    EXPECT_DOUBLE_EQ(*RatioCalculator::quick_ratio(200000.0, 50000.0, 100000.0), 1.5);
}

TEST(Ratios_QuickRatio, InventoryAboveAssetsRejected) {
    auto r = RatioCalculator::quick_ratio(100.0, 150.0, 50.0);
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().field, "Inventory");
}

// ─── WACC ─────────────────────────────────────────────────────────────────────

TEST(Ratios_Wacc, KnownValue) {
    // 2/3 · 10% + 1/3 · 5% · 0.7
    auto r = RatioCalculator::wacc(0.10, 0.05, 0.30, 1000000.0, 500000.0);
    ASSERT_TRUE(r.has_value());
    EXPECT_NEAR(*r, 0.0783333333, 1e-9);
}

TEST(Ratios_Wacc, AllEquityIsCostOfEquity) {
    auto r = RatioCalculator::wacc(0.12, 0.05, 0.25, 1000.0, 0.0);
    ASSERT_TRUE(r.has_value());
    EXPECT_DOUBLE_EQ(*r, 0.12);
}

TEST(Ratios_Wacc, ZeroCapitalIsDivisionByZero) {
    auto r = RatioCalculator::wacc(0.10, 0.05, 0.30, 0.0, 0.0);
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().kind, ErrorKind::DivisionByZero);
}

TEST(Ratios_Wacc, NonFiniteIntermediateIsOverflow) {
    auto r = RatioCalculator::wacc(0.10, 0.05, 0.30, 1.7e308, 1.7e308);
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().kind, ErrorKind::Overflow);
}

TEST(Ratios_Wacc, TaxRateBounds) {
    EXPECT_TRUE(RatioCalculator::wacc(0.10, 0.05, 1.0, 100.0, 100.0).has_value());
    EXPECT_FALSE(RatioCalculator::wacc(0.10, 0.05, 1.01, 100.0, 100.0).has_value());
    EXPECT_FALSE(RatioCalculator::wacc(0.10, 0.05, -0.1, 100.0, 100.0).has_value());
}
