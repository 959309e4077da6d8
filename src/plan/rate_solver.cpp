// SPDX-License-Identifier: MIT
#include "payplan/plan/rate_solver.hpp"
#include "payplan/math/annuity.hpp"
#include "payplan/support/payplan_trace.h"
#include <cmath>
#include <string>

namespace payplan {

RateSolver::RateSolver(const RateSolverConfig& config)
    : config_(config) {}

double RateSolver::objective(const PaymentPlan& plan, double rate) {
    return annuity_present_value(rate, plan.monthly_payment, plan.num_payments)
        - plan.purchase_amount;
}

std::expected<void, PlanError> RateSolver::validate_bracket() const {
    const double lo = config_.rate_lower;
    const double hi = config_.rate_upper;
    if (!std::isfinite(lo) || !std::isfinite(hi) || lo <= -1.0 || lo >= hi) {
        PAYPLAN_TRACE_VALIDATION_ERROR(PAYPLAN_MODULE_RATE_SOLVER,
                                       static_cast<int>(PlanErrorCode::BracketingFailed), lo, hi);
        return std::unexpected(PlanError{
            .code = PlanErrorCode::BracketingFailed,
            .message = "Invalid rate bracket: need -1 < rate_lower < rate_upper",
            .bracket_low = lo,
            .bracket_high = hi
        });
    }
    return {};
}

std::expected<SolvedRate, PlanError>
RateSolver::solve_bracketed(const PaymentPlan& plan) const {
    auto f = [&plan](double rate) { return objective(plan, rate); };

    const RootFindingResult result = (config_.method == RootMethod::Brent)
        ? brent_find_root(f, config_.rate_lower, config_.rate_upper, config_.root_config)
        : bisection_find_root(f, config_.rate_lower, config_.rate_upper, config_.root_config);

    if (!result.converged) {
        PAYPLAN_TRACE_CONVERGENCE_FAILED(PAYPLAN_MODULE_RATE_SOLVER,
                                         result.iterations, result.final_error);

        PlanErrorCode code = PlanErrorCode::MaxIterationsExceeded;
        const std::string reason = result.failure_reason.value_or("Rate solver failed");
        if (reason.find("not bracketed") != std::string::npos) {
            code = PlanErrorCode::BracketingFailed;
        } else if (reason.find("non-finite") != std::string::npos) {
            code = PlanErrorCode::NumericalInstability;
        }

        return std::unexpected(PlanError{
            .code = code,
            .message = reason,
            .iterations = result.iterations,
            .residual = result.final_error,
            .best_estimate = result.root,
            .bracket_low = result.bracket_low,
            .bracket_high = result.bracket_high
        });
    }

    const double r = result.root.value();
    PAYPLAN_TRACE_ALGO_COMPLETE(PAYPLAN_MODULE_RATE_SOLVER, result.iterations, r);

    return SolvedRate{
        .periodic_rate = r,
        .annual_rate = annualize_monthly(r),
        .apr_percent = annualize_monthly(r) * 100.0,
        .iterations = result.iterations,
        .final_error = result.final_error
    };
}

std::expected<SolvedRate, PlanError> RateSolver::solve(const PaymentPlan& plan) const {
    PAYPLAN_TRACE_ALGO_START(PAYPLAN_MODULE_RATE_SOLVER,
                             config_.root_config.max_iter,
                             config_.root_config.tolerance,
                             plan.num_payments);

    // validate plan → validate bracket → bracketed root find
    return validate_rate_solvable(plan)
        .and_then([this] { return validate_bracket(); })
        .and_then([this, &plan] { return solve_bracketed(plan); });
}

std::expected<SolvedRate, PlanError>
solve_equivalent_rate(const PaymentPlan& plan, const RateSolverConfig& config) {
    return RateSolver(config).solve(plan);
}

}  // namespace payplan
