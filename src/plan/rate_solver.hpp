// SPDX-License-Identifier: MIT
/**
 * @file rate_solver.hpp
 * @brief Equivalent-APR solver for fixed-fee installment plans
 *
 * Finds the periodic rate r at which an ordinary annuity of the plan's
 * monthly payment over num_payments periods has a present value equal to
 * the purchase amount:
 *
 *     purchase_amount = monthly_payment · (1 - (1+r)^-n) / r
 *
 * The present value is strictly decreasing in r, so the root in the search
 * bracket is unique and a bracketed method (bisection by default, Brent
 * optionally) always finds it when it exists.
 *
 * Example:
 * @code
 * PaymentPlan plan{.purchase_amount = 1196.00, .num_payments = 18,
 *                  .monthly_payment = 80.73, .monthly_fee = 14.28};
 * auto rate = solve_equivalent_rate(plan);
 * if (rate) {
 *     std::cout << "Equivalent APR: " << rate->apr_percent << "%\n";   // ~25.63
 * } else {
 *     std::cerr << rate.error() << "\n";
 * }
 * @endcode
 */

#pragma once

#include "payplan/math/root_finding.hpp"
#include "payplan/plan/payment_plan.hpp"
#include "payplan/support/error_types.hpp"
#include <cstddef>
#include <expected>

namespace payplan {

/// Bracketed method used by the rate solver
enum class RootMethod {
    Bisection,
    Brent
};

/// Rate solver configuration
struct RateSolverConfig {
    /// Iteration cap and tolerances (tolerance applies to the PV residual)
    RootFindingConfig root_config;

    RootMethod method = RootMethod::Bisection;

    /// Periodic-rate search bracket; [0, 10] covers up to 1000% per month
    double rate_lower = 0.0;
    double rate_upper = 10.0;
};

/// Solved equivalent rate
struct SolvedRate {
    double periodic_rate;   ///< Monthly rate (decimal)
    double annual_rate;     ///< Nominal annual rate, periodic_rate × 12 (decimal)
    double apr_percent;     ///< annual_rate as a percentage ("Equivalent APR")
    size_t iterations;      ///< Root finder iterations
    double final_error;     ///< |PV(r) - purchase_amount|
};

/// Equivalent-rate solver
///
/// Stateless apart from its configuration; one instance can solve any
/// number of plans, concurrently if desired.
class RateSolver {
public:
    explicit RateSolver(const RateSolverConfig& config = {});

    /// Solve for the equivalent periodic rate
    ///
    /// Error codes:
    /// - InvalidPlan category: any plan validation failure, including
    ///   PaymentsBelowPrincipal (payments total less than the principal)
    /// - BracketingFailed: the rate lies above the search bracket, or the
    ///   bracket itself is invalid
    /// - MaxIterationsExceeded: cap reached; carries best estimate,
    ///   residual and final bracket
    /// - NumericalInstability: the objective produced NaN/Inf
    std::expected<SolvedRate, PlanError> solve(const PaymentPlan& plan) const;

    /// Objective f(r) = PV(r) - purchase_amount
    static double objective(const PaymentPlan& plan, double rate);

    const RateSolverConfig& config() const { return config_; }

private:
    RateSolverConfig config_;

    std::expected<void, PlanError> validate_bracket() const;
    std::expected<SolvedRate, PlanError> solve_bracketed(const PaymentPlan& plan) const;
};

/// Convenience wrapper: RateSolver(config).solve(plan)
std::expected<SolvedRate, PlanError>
solve_equivalent_rate(const PaymentPlan& plan, const RateSolverConfig& config = {});

}  // namespace payplan
