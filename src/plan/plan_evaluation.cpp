// SPDX-License-Identifier: MIT
#include "payplan/plan/plan_evaluation.hpp"
#include "payplan/support/parallel.hpp"
#include "payplan/support/payplan_trace.h"
#include <optional>
#include <utility>

namespace payplan {

PlanEvaluation evaluate_plan(const PaymentPlan& plan, double regular_apr,
                             const EvaluationConfig& config) {
    return PlanEvaluation{
        .plan = plan,
        .rate = solve_equivalent_rate(plan, config.solver),
        .analysis = analyze(plan, regular_apr, config.analyzer)
    };
}

BatchEvaluation evaluate_plans(std::span<const PaymentPlan> plans, double regular_apr,
                               const EvaluationConfig& config) {
    PAYPLAN_TRACE_ALGO_START(PAYPLAN_MODULE_BATCH, plans.size(), regular_apr, 0);

    // PlanEvaluation has no default state; each slot is filled exactly once
    std::vector<std::optional<PlanEvaluation>> slots(plans.size());
    size_t failed = 0;

    PAYPLAN_PRAGMA_PARALLEL_FOR_DYNAMIC
    for (size_t i = 0; i < plans.size(); ++i) {
        slots[i].emplace(evaluate_plan(plans[i], regular_apr, config));
        if (!slots[i]->ok()) {
            PAYPLAN_PRAGMA_ATOMIC
            ++failed;
        }
    }

    BatchEvaluation batch;
    batch.results.reserve(plans.size());
    for (auto& slot : slots) {
        batch.results.push_back(std::move(*slot));
    }
    batch.failed_count = failed;

    PAYPLAN_TRACE_ALGO_COMPLETE(PAYPLAN_MODULE_BATCH, plans.size(), failed);
    return batch;
}

}  // namespace payplan
