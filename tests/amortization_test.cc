// SPDX-License-Identifier: MIT
#include <gtest/gtest.h>
#include "payplan/plan/amortization.hpp"
#include "payplan/plan/payment_plan.hpp"
#include <limits>

using namespace payplan;

// ===========================================================================
// Charge models
// ===========================================================================

TEST(PeriodChargeTest, ProportionalScalesWithBalance) {
    InterestMode mode = ProportionalRate{0.0225};
    EXPECT_DOUBLE_EQ(period_charge(mode, 1000.0), 22.5);
    EXPECT_DOUBLE_EQ(period_charge(mode, 0.0), 0.0);
}

TEST(PeriodChargeTest, FixedFeeIgnoresBalance) {
    InterestMode mode = FixedFee{14.28};
    EXPECT_DOUBLE_EQ(period_charge(mode, 1196.0), 14.28);
    EXPECT_DOUBLE_EQ(period_charge(mode, 10.0), 14.28);
}

// ===========================================================================
// Proportional mode
// ===========================================================================

TEST(AmortizationTest, ZeroRateSplitsPrincipalEvenly) {
    auto schedule = simulate(1200.0, ProportionalRate{0.0}, 100.0, 12);

    ASSERT_TRUE(schedule.has_value());
    EXPECT_EQ(schedule->periods_used, 12);
    EXPECT_TRUE(schedule->fully_amortized);
    EXPECT_DOUBLE_EQ(schedule->total_interest_or_fee, 0.0);
    EXPECT_NEAR(schedule->total_principal, 1200.0, 1e-9);
    for (const auto& step : schedule->steps) {
        EXPECT_NEAR(step.principal_component, 100.0, 1e-9);
    }
    EXPECT_DOUBLE_EQ(schedule->final_balance(), 0.0);
}

TEST(AmortizationTest, StepIdentityHoldsEveryPeriod) {
    auto schedule = simulate(1196.0, ProportionalRate{0.0225}, 80.73, 30);

    ASSERT_TRUE(schedule.has_value());
    size_t expected_index = 1;
    for (const auto& step : schedule->steps) {
        EXPECT_EQ(step.period_index, expected_index++);
        EXPECT_NEAR(step.interest_or_fee_component, step.balance_before * 0.0225, 1e-12);
        EXPECT_NEAR(step.principal_component + step.interest_or_fee_component, step.payment, 1e-9);
        EXPECT_NEAR(step.balance_before - step.principal_component, step.balance_after, 1e-9);
    }
}

TEST(AmortizationTest, ReferencePlanAtTwentySevenPercent) {
    // 80.73/month at 27% APR needs 19 payments, the last one short
    auto schedule = simulate(1196.0, ProportionalRate{0.0225}, 80.73, 1000);

    ASSERT_TRUE(schedule.has_value());
    EXPECT_EQ(schedule->periods_used, 19);
    EXPECT_TRUE(schedule->fully_amortized);
    EXPECT_NEAR(schedule->total_interest_or_fee, 275.2705, 1e-3);
    EXPECT_LT(schedule->steps.back().payment, 80.73);
    EXPECT_NEAR(schedule->total_paid, 1196.0 + schedule->total_interest_or_fee, 1e-9);
}

TEST(AmortizationTest, OverpaymentEndsEarly) {
    auto schedule = simulate(250.0, ProportionalRate{0.0}, 100.0, 5);

    ASSERT_TRUE(schedule.has_value());
    EXPECT_EQ(schedule->periods_used, 3);
    EXPECT_TRUE(schedule->fully_amortized);

    const auto& last = schedule->steps.back();
    EXPECT_DOUBLE_EQ(last.balance_before, 50.0);
    EXPECT_DOUBLE_EQ(last.principal_component, 50.0);
    EXPECT_DOUBLE_EQ(last.payment, 50.0);
    EXPECT_DOUBLE_EQ(last.balance_after, 0.0);
}

TEST(AmortizationTest, HorizonShorterThanPayoff) {
    auto schedule = simulate(1000.0, ProportionalRate{0.0}, 100.0, 5);

    ASSERT_TRUE(schedule.has_value());
    EXPECT_EQ(schedule->periods_used, 5);
    EXPECT_FALSE(schedule->fully_amortized);
    EXPECT_DOUBLE_EQ(schedule->final_balance(), 500.0);
}

TEST(AmortizationTest, PaymentBelowInterestNeverAmortizes) {
    auto schedule = simulate(1000.0, ProportionalRate{0.1}, 50.0, 12);

    ASSERT_FALSE(schedule.has_value());
    EXPECT_EQ(schedule.error().code, PlanErrorCode::NonAmortizingPayment);
    EXPECT_EQ(error_category(schedule.error()), PlanErrorCategory::InvalidPlan);
    EXPECT_EQ(schedule.error().iterations, 0);
    EXPECT_DOUBLE_EQ(schedule.error().residual, 1000.0);
}

TEST(AmortizationTest, PaymentEqualToInterestNeverAmortizes) {
    auto schedule = simulate(1000.0, ProportionalRate{0.05}, 50.0, 12);

    ASSERT_FALSE(schedule.has_value());
    EXPECT_EQ(schedule.error().code, PlanErrorCode::NonAmortizingPayment);
}

// ===========================================================================
// Fixed-fee mode
// ===========================================================================

TEST(AmortizationTest, FixedFeeScheduleForPublishedPlan) {
    auto schedule = simulate(1196.0, FixedFee{14.28}, 80.73, 18);

    ASSERT_TRUE(schedule.has_value());
    ASSERT_EQ(schedule->periods_used, 18);
    EXPECT_TRUE(schedule->fully_amortized);

    EXPECT_NEAR(schedule->steps[0].balance_after, 1129.55, 1e-9);
    EXPECT_NEAR(schedule->steps[7].balance_after, 664.40, 1e-9);
    for (const auto& step : schedule->steps) {
        EXPECT_DOUBLE_EQ(step.interest_or_fee_component, 14.28);
    }

    // Final period settles the remaining 66.35 instead of the scheduled 66.45
    const auto& last = schedule->steps.back();
    EXPECT_NEAR(last.balance_before, 66.35, 1e-9);
    EXPECT_NEAR(last.principal_component, 66.35, 1e-9);
    EXPECT_NEAR(last.payment, 80.63, 1e-9);
    EXPECT_DOUBLE_EQ(last.balance_after, 0.0);
    EXPECT_NEAR(schedule->total_principal, 1196.0, 1e-9);
}

TEST(AmortizationTest, FixedFeeAboveLevelPaymentFails) {
    auto schedule = simulate(500.0, FixedFee{60.0}, 50.0, 12);

    ASSERT_FALSE(schedule.has_value());
    EXPECT_EQ(schedule.error().code, PlanErrorCode::NonAmortizingPayment);
}

TEST(AmortizationTest, SubCentResidueIsSettled) {
    // 3 × 33.333 leaves 0.001 after three periods
    auto schedule = simulate(100.0, FixedFee{0.0}, 33.333, 3);

    ASSERT_TRUE(schedule.has_value());
    EXPECT_EQ(schedule->periods_used, 3);
    EXPECT_TRUE(schedule->fully_amortized);
    EXPECT_DOUBLE_EQ(schedule->final_balance(), 0.0);
    EXPECT_NEAR(schedule->total_principal, 100.0, 1e-12);
}

// ===========================================================================
// Input validation
// ===========================================================================

TEST(AmortizationValidationTest, NonPositivePrincipal) {
    auto schedule = simulate(0.0, ProportionalRate{0.01}, 100.0, 12);
    ASSERT_FALSE(schedule.has_value());
    EXPECT_EQ(schedule.error().code, PlanErrorCode::NonPositivePurchaseAmount);
}

TEST(AmortizationValidationTest, ZeroPeriods) {
    auto schedule = simulate(1000.0, ProportionalRate{0.01}, 100.0, 0);
    ASSERT_FALSE(schedule.has_value());
    EXPECT_EQ(schedule.error().code, PlanErrorCode::NonPositivePaymentCount);
}

TEST(AmortizationValidationTest, NonPositivePayment) {
    auto schedule = simulate(1000.0, ProportionalRate{0.01}, 0.0, 12);
    ASSERT_FALSE(schedule.has_value());
    EXPECT_EQ(schedule.error().code, PlanErrorCode::NonPositiveMonthlyPayment);
}

TEST(AmortizationValidationTest, NegativeRate) {
    auto schedule = simulate(1000.0, ProportionalRate{-0.01}, 100.0, 12);
    ASSERT_FALSE(schedule.has_value());
    EXPECT_EQ(schedule.error().code, PlanErrorCode::NegativePeriodicRate);
}

TEST(AmortizationValidationTest, NegativeFee) {
    auto schedule = simulate(1000.0, FixedFee{-1.0}, 100.0, 12);
    ASSERT_FALSE(schedule.has_value());
    EXPECT_EQ(schedule.error().code, PlanErrorCode::NegativeMonthlyFee);
}

TEST(AmortizationValidationTest, NonFiniteInput) {
    auto schedule = simulate(std::numeric_limits<double>::infinity(),
                             ProportionalRate{0.01}, 100.0, 12);
    ASSERT_FALSE(schedule.has_value());
    EXPECT_EQ(schedule.error().code, PlanErrorCode::NonFiniteInput);
}
