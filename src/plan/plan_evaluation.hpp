// SPDX-License-Identifier: MIT
/**
 * @file plan_evaluation.hpp
 * @brief Rate solving and comparison for one plan or a batch of plans
 */

#pragma once

#include "payplan/plan/comparative_analyzer.hpp"
#include "payplan/plan/payment_plan.hpp"
#include "payplan/plan/rate_solver.hpp"
#include <cstddef>
#include <expected>
#include <span>
#include <vector>

namespace payplan {

/// Solver and analyzer settings for an evaluation run
struct EvaluationConfig {
    RateSolverConfig solver;
    AnalyzerConfig analyzer;
};

/// Everything known about one plan
///
/// The two halves fail independently: a plan whose equivalent rate lies
/// outside the solver bracket still has a valid comparison, and vice versa.
struct PlanEvaluation {
    PaymentPlan plan;
    std::expected<SolvedRate, PlanError> rate;
    std::expected<AnalysisResult, PlanError> analysis;

    bool ok() const { return rate.has_value() && analysis.has_value(); }
};

/// Batch result, one evaluation per input plan in input order
struct BatchEvaluation {
    std::vector<PlanEvaluation> results;
    size_t failed_count = 0;   ///< Plans with at least one failed half

    bool all_succeeded() const { return failed_count == 0; }
};

/// Evaluate a single plan against a regular APR (percent)
PlanEvaluation evaluate_plan(const PaymentPlan& plan, double regular_apr,
                             const EvaluationConfig& config = {});

/// Evaluate plans in parallel (OpenMP when available)
///
/// Plans are independent, so the result is identical to calling
/// evaluate_plan() on each plan in order.
BatchEvaluation evaluate_plans(std::span<const PaymentPlan> plans, double regular_apr,
                               const EvaluationConfig& config = {});

}  // namespace payplan
