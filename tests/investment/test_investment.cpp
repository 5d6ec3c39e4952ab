#include <gtest/gtest.h>
#include "fincalc/investment.hpp"

#include <limits>
#include <vector>

using namespace fincalc;
using namespace fincalc::investment;

// ─── NPV ──────────────────────────────────────────────────────────────────────

TEST(Investment_Npv, ProfitableProject) {
    const std::vector<double> flows = {1000.0, 1000.0, 1000.0};
    auto r = InvestmentAnalyzer::npv(2000.0, flows, 0.05);
    ASSERT_TRUE(r.has_value());
    EXPECT_GT(*r, 0.0);
    EXPECT_NEAR(*r, 723.248, 1e-3);
}

TEST(Investment_Npv, UnprofitableProject) {
    const std::vector<double> flows = {100.0, 100.0, 100.0};
    auto r = InvestmentAnalyzer::npv(1000.0, flows, 0.10);
    ASSERT_TRUE(r.has_value());
    EXPECT_LT(*r, 0.0);
}

TEST(Investment_Npv, ZeroRateIsPlainSum) {
    const std::vector<double> flows = {400.0, 300.0, 200.0};
    auto r = InvestmentAnalyzer::npv(1000.0, flows, 0.0);
    ASSERT_TRUE(r.has_value());
    EXPECT_NEAR(*r, -100.0, 1e-9);
}

TEST(Investment_Npv, RejectsBadInputs) {
    const std::vector<double> flows = {100.0};
    EXPECT_FALSE(InvestmentAnalyzer::npv(0.0, flows, 0.1).has_value());
    EXPECT_FALSE(InvestmentAnalyzer::npv(100.0, flows, -0.1).has_value());
    EXPECT_FALSE(InvestmentAnalyzer::npv(100.0, std::vector<double>{}, 0.1).has_value());
}

TEST(Investment_Npv, NonFiniteFlowNamesYear) {
    const std::vector<double> flows = {100.0, std::numeric_limits<double>::quiet_NaN()};
    auto r = InvestmentAnalyzer::npv(100.0, flows, 0.1);
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().kind, ErrorKind::InvalidInput);
    EXPECT_EQ(r.error().field, "Cash flow year 2");
}

// ─── DCF ──────────────────────────────────────────────────────────────────────

TEST(Investment_Dcf, KnownValue) {
    const std::vector<double> flows = {1000.0, 2000.0, 3000.0};
    auto r = InvestmentAnalyzer::dcf(flows, 0.1);
    ASSERT_TRUE(r.has_value());
    EXPECT_GT(*r, 4000.0);
    EXPECT_NEAR(*r, 4815.928, 1e-3);
}

TEST(Investment_Dcf, NegativeRateAboveMinusOneAllowed) {
    const std::vector<double> flows = {100.0};
    auto r = InvestmentAnalyzer::dcf(flows, -0.5);
    ASSERT_TRUE(r.has_value());
    EXPECT_NEAR(*r, 200.0, 1e-9);
    EXPECT_FALSE(InvestmentAnalyzer::dcf(flows, -1.0).has_value());
}

TEST(Investment_Dcf, NpvIsDcfMinusInvestment) {
    const std::vector<double> flows = {250.0, 350.0, 450.0, 550.0};
    auto dcf = InvestmentAnalyzer::dcf(flows, 0.08);
    auto npv = InvestmentAnalyzer::npv(1200.0, flows, 0.08);
    ASSERT_TRUE(dcf.has_value());
    ASSERT_TRUE(npv.has_value());
    EXPECT_NEAR(*npv, *dcf - 1200.0, 1e-9);
}

// ─── Payback Period ───────────────────────────────────────────────────────────

TEST(Investment_Payback, CostMetAtPeriodBoundary) {
    const std::vector<double> flows = {100.0, 200.0, 300.0};
    auto r = InvestmentAnalyzer::payback_period(300.0, flows);
    ASSERT_TRUE(r.has_value());
    ASSERT_TRUE(r->has_value());
    EXPECT_DOUBLE_EQ(**r, 3.0);
}

TEST(Investment_Payback, InterpolatesWithinCrossingPeriod) {
    const std::vector<double> flows = {100.0, 200.0, 300.0};
    auto r = InvestmentAnalyzer::payback_period(250.0, flows);
    ASSERT_TRUE(r.has_value());
    ASSERT_TRUE(r->has_value());
    EXPECT_NEAR(**r, 2.75, 1e-12);
}

TEST(Investment_Payback, NeverRecoveredIsEmpty) {
    const std::vector<double> flows = {100.0, 100.0, 100.0};
    auto r = InvestmentAnalyzer::payback_period(1000.0, flows);
    ASSERT_TRUE(r.has_value());
    EXPECT_FALSE(r->has_value());
}

TEST(Investment_Payback, NegativeFlowDelaysCrossing) {
    // Cumulative 600, 400, 1200: crosses in the third period with 600 still needed.
    const std::vector<double> flows = {600.0, -200.0, 800.0};
    auto r = InvestmentAnalyzer::payback_period(1000.0, flows);
    ASSERT_TRUE(r.has_value());
    ASSERT_TRUE(r->has_value());
    EXPECT_NEAR(**r, 3.75, 1e-12);
}

TEST(Investment_Payback, RejectsBadInputs) {
    const std::vector<double> flows = {100.0};
    EXPECT_FALSE(InvestmentAnalyzer::payback_period(0.0, flows).has_value());
    EXPECT_FALSE(InvestmentAnalyzer::payback_period(100.0, std::vector<double>{}).has_value());
}

// ─── ROI / CAPM ───────────────────────────────────────────────────────────────

TEST(Investment_Roi, GainAndLoss) {
    EXPECT_DOUBLE_EQ(*InvestmentAnalyzer::roi(500.0, 2000.0), 25.0);
    EXPECT_DOUBLE_EQ(*InvestmentAnalyzer::roi(-500.0, 2000.0), -25.0);
}

TEST(Investment_Roi, ZeroCostRejected) {
    auto r = InvestmentAnalyzer::roi(100.0, 0.0);
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().kind, ErrorKind::InvalidInput);
}

TEST(Investment_Capm, KnownValue) {
    auto r = InvestmentAnalyzer::capm(0.05, 1.2, 0.10);
    ASSERT_TRUE(r.has_value());
    EXPECT_NEAR(*r, 0.11, 1e-12);
}

TEST(Investment_Capm, ZeroBetaIsRiskFree) {
    EXPECT_DOUBLE_EQ(*InvestmentAnalyzer::capm(0.05, 0.0, 0.10), 0.05);
}

TEST(Investment_Capm, NegativeBetaAllowedNegativeRiskFreeRejected) {
    EXPECT_TRUE(InvestmentAnalyzer::capm(0.05, -0.5, 0.10).has_value());
    EXPECT_FALSE(InvestmentAnalyzer::capm(-0.01, 1.0, 0.10).has_value());
}
