// SPDX-License-Identifier: MIT
#include <gtest/gtest.h>
#include "payplan/config/plan_config.hpp"
#include "payplan/report/report_renderer.hpp"
#include <string>

using namespace payplan;

namespace {

bool contains(const std::string& text, const std::string& needle) {
    return text.find(needle) != std::string::npos;
}

}  // namespace

class ReportRendererTest : public ::testing::Test {
protected:
    PaymentPlan plan_{
        .purchase_amount = 1196.00,
        .num_payments = 18,
        .monthly_payment = 80.73,
        .monthly_fee = 14.28
    };
};

TEST_F(ReportRendererTest, ConsoleReportSections) {
    const std::string text = render_console(evaluate_plan(plan_, 27.0), 1, 27.0);

    EXPECT_TRUE(contains(text, "--- Fixed Payment Plan Analysis ---"));
    EXPECT_TRUE(contains(text, "Purchase Amount: $1196.00"));
    EXPECT_TRUE(contains(text, "Total Cost: $1453.14"));
    EXPECT_TRUE(contains(text, "Total Fees: $257.14"));
    EXPECT_TRUE(contains(text, "Equivalent APR: 25.63%"));
    EXPECT_TRUE(contains(text, "--- Comparison with Regular 27% APR ---"));
    EXPECT_TRUE(contains(text, "Regular Payments Needed: 19"));
    EXPECT_TRUE(contains(text, "The fixed payment plan saves $18.13 compared to regular payments."));
    EXPECT_TRUE(contains(text, "Simple interest rate equivalent: 14.33% APR"));
    EXPECT_TRUE(contains(text, ">>> OPTIMAL PAYOFF POINT: After month 8, pay remaining $664.40"));
    EXPECT_TRUE(contains(text, "Months where fee rate exceeds regular 27% APR (2.25% monthly):"));
    EXPECT_TRUE(contains(text, "Suggested optimal payoff: After month 8, pay remaining $664.40"));
    EXPECT_TRUE(contains(text, "This would avoid 9 months of high-cost fees."));
}

TEST_F(ReportRendererTest, ConsoleHeadingCarriesPlanNumber) {
    const std::string text = render_console(evaluate_plan(plan_, 27.0), 3, 27.0);

    EXPECT_TRUE(contains(text, "ANALYSIS #3"));
    EXPECT_FALSE(contains(text, "ANALYSIS #1"));
}

TEST_F(ReportRendererTest, MarkdownReportSections) {
    const std::string text = render_markdown(evaluate_plan(plan_, 27.0), 2, 27.0);

    EXPECT_TRUE(contains(text, "# Fixed Payment Plan Analysis #2"));
    EXPECT_TRUE(contains(text, "- Equivalent APR: 25.63%"));
    EXPECT_TRUE(contains(text, "## Comparison with Regular 27% APR"));
    EXPECT_TRUE(contains(text, "| Month | Balance |"));
    EXPECT_TRUE(contains(text, "| **OPTIMAL PAYOFF POINT: After month 8, pay remaining $664.40** |"));
    EXPECT_TRUE(contains(text, "### Optimal Payoff Recommendation:"));
    EXPECT_TRUE(contains(text, "- This would avoid 9 months of high-cost fees."));
}

TEST_F(ReportRendererTest, CostlierPlanSentence) {
    PaymentPlan plan{.purchase_amount = 2365.20, .num_payments = 24,
                     .monthly_payment = 129.14, .monthly_fee = 30.59};

    const std::string text = render_console(evaluate_plan(plan, 27.0), 1, 27.0);

    EXPECT_TRUE(contains(text, "The fixed payment plan costs $16.31 more than regular payments."));
}

TEST_F(ReportRendererTest, InvalidPlanRendersOneErrorLine) {
    plan_.monthly_fee = 90.0;

    const std::string text = render_console(evaluate_plan(plan_, 27.0), 1, 27.0);

    EXPECT_TRUE(contains(text, "Purchase Amount: $1196.00"));
    EXPECT_TRUE(contains(text, "Error: InvalidPlanError [FeeNotBelowPayment]"));
    EXPECT_FALSE(contains(text, "Equivalent APR"));
    EXPECT_FALSE(contains(text, "OPTIMAL PAYOFF POINT"));
}

TEST_F(ReportRendererTest, ReferenceFailureStillShowsApr) {
    const std::string text = render_markdown(evaluate_plan(plan_, 100.0), 1, 100.0);

    EXPECT_TRUE(contains(text, "- Equivalent APR: 25.63%"));
    EXPECT_TRUE(contains(text, "ReferencePlanNonConvergentError [ReferencePaymentTooSmall]"));
    EXPECT_FALSE(contains(text, "OPTIMAL PAYOFF POINT"));
}

TEST_F(ReportRendererTest, SolverFailureIsShownInline) {
    EvaluationConfig config;
    config.solver.rate_upper = 0.01;

    const std::string text = render_console(evaluate_plan(plan_, 27.0, config), 1, 27.0);

    EXPECT_TRUE(contains(text, "Equivalent APR: unavailable (RateSolverConvergenceError [BracketingFailed]"));
    EXPECT_TRUE(contains(text, "OPTIMAL PAYOFF POINT"));
}

TEST_F(ReportRendererTest, BatchReportNumbersPlans) {
    const auto config = default_plan_config();
    const auto batch = evaluate_plans(config.payment_plans, config.regular_apr);

    const std::string console = render_report(batch, config.regular_apr, ReportFormat::Console);
    EXPECT_TRUE(contains(console, "ANALYSIS #1"));
    EXPECT_TRUE(contains(console, "ANALYSIS #3"));
    EXPECT_FALSE(contains(console, "ANALYSIS #4"));

    const std::string markdown = render_report(batch, config.regular_apr, ReportFormat::Markdown);
    EXPECT_TRUE(contains(markdown, "# Fixed Payment Plan Analysis #1"));
    EXPECT_TRUE(contains(markdown, "# Fixed Payment Plan Analysis #3"));
    EXPECT_TRUE(contains(markdown, "\n---\n"));
}

TEST(RenderErrorTest, PlanError) {
    PlanError err{.code = PlanErrorCode::ReferenceHorizonExceeded, .message = "too long"};
    EXPECT_EQ(render_error(err), "ReferencePlanNonConvergentError [ReferenceHorizonExceeded]: too long");
}

TEST(RenderErrorTest, ConfigError) {
    ConfigError err{.code = ConfigErrorCode::FileNotFound, .message = "Configuration file x not found."};
    EXPECT_EQ(render_error(err), "ConfigError [FileNotFound]: Configuration file x not found.");
}
