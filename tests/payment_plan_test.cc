// SPDX-License-Identifier: MIT
#include <gtest/gtest.h>
#include "payplan/plan/payment_plan.hpp"
#include <limits>

using namespace payplan;

namespace {

PaymentPlan example_plan() {
    return PaymentPlan{
        .purchase_amount = 1196.00,
        .num_payments = 18,
        .monthly_payment = 80.73,
        .monthly_fee = 14.28
    };
}

}  // namespace

TEST(PaymentPlanTest, PrincipalPerPayment) {
    EXPECT_NEAR(example_plan().principal_per_payment(), 66.45, 1e-12);
}

TEST(PaymentPlanTest, ValidPlanPasses) {
    EXPECT_TRUE(validate_payment_plan(example_plan()).has_value());
    EXPECT_TRUE(validate_rate_solvable(example_plan()).has_value());
}

TEST(PaymentPlanTest, ZeroFeeIsValid) {
    PaymentPlan plan{.purchase_amount = 1200.0, .num_payments = 12,
                     .monthly_payment = 100.0, .monthly_fee = 0.0};
    EXPECT_TRUE(validate_payment_plan(plan).has_value());
    EXPECT_TRUE(validate_rate_solvable(plan).has_value());
}

TEST(PaymentPlanTest, NonPositivePurchaseAmount) {
    auto plan = example_plan();
    plan.purchase_amount = 0.0;

    auto result = validate_payment_plan(plan);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, PlanErrorCode::NonPositivePurchaseAmount);
    EXPECT_EQ(error_category(result.error()), PlanErrorCategory::InvalidPlan);
}

TEST(PaymentPlanTest, ZeroPaymentCount) {
    auto plan = example_plan();
    plan.num_payments = 0;

    auto result = validate_payment_plan(plan);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, PlanErrorCode::NonPositivePaymentCount);
}

TEST(PaymentPlanTest, NonPositiveMonthlyPayment) {
    auto plan = example_plan();
    plan.monthly_payment = -80.73;

    auto result = validate_payment_plan(plan);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, PlanErrorCode::NonPositiveMonthlyPayment);
}

TEST(PaymentPlanTest, NegativeMonthlyFee) {
    auto plan = example_plan();
    plan.monthly_fee = -1.0;

    auto result = validate_payment_plan(plan);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, PlanErrorCode::NegativeMonthlyFee);
}

TEST(PaymentPlanTest, FeeEqualToPaymentNeverAmortizes) {
    auto plan = example_plan();
    plan.monthly_fee = plan.monthly_payment;

    auto result = validate_payment_plan(plan);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, PlanErrorCode::FeeNotBelowPayment);
}

TEST(PaymentPlanTest, NonFiniteAmount) {
    auto plan = example_plan();
    plan.monthly_payment = std::numeric_limits<double>::quiet_NaN();

    auto result = validate_payment_plan(plan);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, PlanErrorCode::NonFiniteInput);
}

TEST(PaymentPlanTest, FirstFailingCheckWins) {
    // Both purchase and fee are bad; purchase is checked first
    PaymentPlan plan{.purchase_amount = -5.0, .num_payments = 18,
                     .monthly_payment = 80.73, .monthly_fee = -1.0};

    auto result = validate_payment_plan(plan);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, PlanErrorCode::NonPositivePurchaseAmount);
}

TEST(PaymentPlanTest, PaymentsBelowPrincipalOnlyBlocksRateSolving) {
    PaymentPlan plan{.purchase_amount = 1000.0, .num_payments = 10,
                     .monthly_payment = 90.0, .monthly_fee = 5.0};

    EXPECT_TRUE(validate_payment_plan(plan).has_value());

    auto result = validate_rate_solvable(plan);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, PlanErrorCode::PaymentsBelowPrincipal);
    EXPECT_EQ(error_category(result.error()), PlanErrorCategory::InvalidPlan);
}

TEST(PaymentPlanTest, PaymentsExactlyCoverPrincipal) {
    PaymentPlan plan{.purchase_amount = 1000.0, .num_payments = 8,
                     .monthly_payment = 125.0, .monthly_fee = 0.0};

    EXPECT_TRUE(validate_rate_solvable(plan).has_value());
}

TEST(PaymentPlanTest, Equality) {
    auto a = example_plan();
    auto b = example_plan();
    EXPECT_EQ(a, b);

    b.monthly_fee = 14.29;
    EXPECT_FALSE(a == b);
}
