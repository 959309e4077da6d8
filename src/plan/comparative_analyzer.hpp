// SPDX-License-Identifier: MIT
/**
 * @file comparative_analyzer.hpp
 * @brief Fixed-fee plan vs. regular APR comparison and payoff recommendation
 */

#pragma once

#include "payplan/plan/amortization.hpp"
#include "payplan/plan/payment_plan.hpp"
#include "payplan/support/error_types.hpp"
#include <cstddef>
#include <expected>
#include <optional>
#include <vector>

namespace payplan {

/// Analyzer configuration
struct AnalyzerConfig {
    /// Longest reference schedule simulated before giving up
    size_t reference_horizon = kMaxPaymentCount;
};

/// One period of the fixed plan next to the regular-APR cost of carrying
/// the same balance
struct ComparisonRow {
    size_t period_index;             ///< 1-based
    double balance_before;           ///< Balance before this period's payment
    double principal_component;
    double fixed_fee;
    double balance;                  ///< Balance carried after this period's payment
    double regular_interest;         ///< balance × regular monthly rate
    double difference;               ///< fixed_fee - regular_interest
    double effective_monthly_rate;   ///< fixed_fee / balance (0 once paid off), decimal
    double effective_annual_rate;    ///< effective_monthly_rate × 12, decimal

    /// Nothing is carried past this period
    bool settled() const { return balance <= kBalanceEpsilon; }

    /// Fixed fee is no more expensive than regular interest this period
    bool favorable() const { return fixed_fee <= regular_interest; }

    /// Fee exceeds regular interest on a balance that is still carried.
    /// A settled row is neither favorable nor unfavorable for the payoff scan.
    bool unfavorable() const { return !settled() && !favorable(); }
};

/// Where to stop paying the fixed plan and settle the balance
struct PayoffRecommendation {
    size_t month_index;                  ///< Last favorable month (0: before the first payment)
    double remaining_balance;            ///< Balance to pay off after month_index
    size_t unfavorable_months_avoided;   ///< Unfavorable months after month_index

    /// Month in which to pay off the remaining balance
    size_t payoff_month() const { return month_index + 1; }
};

/// Period whose effective fee rate exceeds the regular monthly rate
struct HighCostPeriod {
    size_t period_index;
    double balance;
    double effective_monthly_rate;
};

/// Aggregate cost of both alternatives
struct AnalysisTotals {
    double total_cost;              ///< num_payments × monthly_payment
    double total_fees;              ///< total_cost - purchase_amount
    double scheduled_fees;          ///< num_payments × monthly_fee
    double regular_interest_paid;   ///< Interest paid by the reference plan
    double regular_total_cost;      ///< purchase_amount + regular_interest_paid
    size_t regular_payments;        ///< Periods the reference plan needs
    double difference;              ///< total_cost - regular_total_cost (> 0: fixed plan costs more)
};

/// Secondary annualized metrics (decimals, 0.25 = 25%)
struct DerivedMetrics {
    double simple_interest_apr;     ///< total_fees / purchase / years
    double monthly_fee_percent;     ///< monthly_fee / purchase × 100
    double average_balance;         ///< Mean balance_before over the full schedule
    double average_balance_apr;     ///< total_fees / average_balance / years (approximate)
    double fee_only_apr;            ///< scheduled_fees / average_balance / years (approximate)
};

/// Full comparison result
struct AnalysisResult {
    PaymentPlan plan;
    double regular_apr;                                   ///< Percent
    std::vector<ComparisonRow> schedule;
    std::optional<PayoffRecommendation> recommendation;   ///< Empty when no month is unfavorable
    std::vector<HighCostPeriod> high_cost_periods;
    AnalysisTotals totals;
    DerivedMetrics metrics;
};

/**
 * @brief Compare a fixed-fee plan with a regular APR account
 *
 * Runs the plan's fixed-fee schedule and an independent proportional
 * schedule at regular_apr with the same monthly payment. For every fixed
 * period, compares the fee with the regular interest on the balance being
 * carried; the recommended payoff point is the last period where the fee
 * is no more expensive.
 *
 * @param plan Fixed-fee plan
 * @param regular_apr Reference APR in percent (27.0 for 27%)
 * @param config Reference horizon
 * @return AnalysisResult, or PlanError:
 *         - InvalidPlan category for plan validation failures
 *         - NonPositiveReferenceRate if regular_apr <= 0
 *         - ReferencePaymentTooSmall if the payment never covers the
 *           reference interest
 *         - ReferenceHorizonExceeded if the reference plan needs more than
 *           config.reference_horizon periods
 */
std::expected<AnalysisResult, PlanError>
analyze(const PaymentPlan& plan, double regular_apr, const AnalyzerConfig& config = {});

/// Last-favorable-month scan over a comparison schedule
///
/// Uses the last favorable index, not the first crossing, so a schedule
/// that turns favorable again never yields a premature payoff.
std::optional<PayoffRecommendation>
recommend_payoff(const std::vector<ComparisonRow>& schedule, double purchase_amount);

}  // namespace payplan
