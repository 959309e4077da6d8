// SPDX-License-Identifier: MIT
#include <gtest/gtest.h>
#include "payplan/config/plan_config.hpp"
#include "payplan/plan/plan_evaluation.hpp"
#include <vector>

using namespace payplan;

class PlanEvaluationTest : public ::testing::Test {
protected:
    std::vector<PaymentPlan> plans_ = default_plan_config().payment_plans;
};

TEST_F(PlanEvaluationTest, SinglePlanHasBothHalves) {
    auto evaluation = evaluate_plan(plans_[0], 27.0);

    EXPECT_TRUE(evaluation.ok());
    EXPECT_EQ(evaluation.plan, plans_[0]);
    ASSERT_TRUE(evaluation.rate.has_value());
    ASSERT_TRUE(evaluation.analysis.has_value());
    EXPECT_NEAR(evaluation.rate->apr_percent, 25.6272, 1e-3);
    EXPECT_EQ(evaluation.analysis->recommendation->month_index, 8);
}

TEST_F(PlanEvaluationTest, HalvesFailIndependently) {
    // Rate outside a narrow bracket, comparison still fine
    EvaluationConfig config;
    config.solver.rate_upper = 0.01;

    auto evaluation = evaluate_plan(plans_[0], 27.0, config);

    EXPECT_FALSE(evaluation.ok());
    ASSERT_FALSE(evaluation.rate.has_value());
    EXPECT_EQ(evaluation.rate.error().code, PlanErrorCode::BracketingFailed);
    EXPECT_TRUE(evaluation.analysis.has_value());
}

TEST_F(PlanEvaluationTest, BatchMatchesPerPlanEvaluation) {
    auto batch = evaluate_plans(plans_, 27.0);

    ASSERT_EQ(batch.results.size(), plans_.size());
    EXPECT_TRUE(batch.all_succeeded());
    EXPECT_EQ(batch.failed_count, 0);

    for (size_t i = 0; i < plans_.size(); ++i) {
        auto single = evaluate_plan(plans_[i], 27.0);
        const auto& batched = batch.results[i];

        EXPECT_EQ(batched.plan, plans_[i]) << "plan " << i;
        ASSERT_TRUE(batched.rate.has_value());
        ASSERT_TRUE(batched.analysis.has_value());
        EXPECT_EQ(batched.rate->periodic_rate, single.rate->periodic_rate);
        EXPECT_EQ(batched.analysis->totals.difference, single.analysis->totals.difference);
        EXPECT_EQ(batched.analysis->schedule.size(), single.analysis->schedule.size());
    }
}

TEST_F(PlanEvaluationTest, BatchCountsFailuresAndKeepsOrder) {
    plans_.insert(plans_.begin() + 1, PaymentPlan{
        .purchase_amount = 1000.0, .num_payments = 12,
        .monthly_payment = 50.0, .monthly_fee = 60.0
    });

    auto batch = evaluate_plans(plans_, 27.0);

    ASSERT_EQ(batch.results.size(), 4);
    EXPECT_EQ(batch.failed_count, 1);
    EXPECT_FALSE(batch.all_succeeded());

    EXPECT_TRUE(batch.results[0].ok());
    EXPECT_FALSE(batch.results[1].ok());
    EXPECT_EQ(batch.results[1].analysis.error().code, PlanErrorCode::FeeNotBelowPayment);
    EXPECT_EQ(batch.results[1].rate.error().code, PlanErrorCode::FeeNotBelowPayment);
    EXPECT_TRUE(batch.results[2].ok());
    EXPECT_TRUE(batch.results[3].ok());
    EXPECT_DOUBLE_EQ(batch.results[3].plan.purchase_amount, 200.0);
}

TEST_F(PlanEvaluationTest, EmptyBatch) {
    auto batch = evaluate_plans({}, 27.0);

    EXPECT_TRUE(batch.results.empty());
    EXPECT_EQ(batch.failed_count, 0);
}

TEST_F(PlanEvaluationTest, LargeBatchIsDeterministic) {
    std::vector<PaymentPlan> many;
    for (int i = 0; i < 64; ++i) {
        many.push_back(plans_[static_cast<size_t>(i) % plans_.size()]);
    }

    auto batch = evaluate_plans(many, 27.0);

    ASSERT_EQ(batch.results.size(), many.size());
    EXPECT_EQ(batch.failed_count, 0);
    for (size_t i = 0; i < many.size(); ++i) {
        const auto& reference = batch.results[i % plans_.size()];
        EXPECT_EQ(batch.results[i].rate->periodic_rate, reference.rate->periodic_rate);
    }
}
