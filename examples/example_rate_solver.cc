// SPDX-License-Identifier: MIT
/**
 * @file example_rate_solver.cc
 * @brief Equivalent APR and payoff analysis for a single fixed-fee plan
 *
 * Demonstrates:
 * - Describing a plan with PaymentPlan
 * - Configuring RateSolver (method, tolerances, bracket)
 * - Error handling with std::expected
 * - Reading the comparison schedule and payoff recommendation
 */

#include "payplan/plan/comparative_analyzer.hpp"
#include "payplan/plan/rate_solver.hpp"
#include <iomanip>
#include <iostream>

int main() {
    std::cout << "=== Fixed-Fee Plan Equivalent APR Example ===\n\n";

    // 1. Plan as quoted by the lender
    payplan::PaymentPlan plan{
        .purchase_amount = 1196.00,
        .num_payments = 18,
        .monthly_payment = 80.73,
        .monthly_fee = 14.28
    };
    const double regular_apr = 27.0;

    std::cout << std::fixed << std::setprecision(2);
    std::cout << "Plan:\n";
    std::cout << "  Purchase:        $" << plan.purchase_amount << "\n";
    std::cout << "  Payments:        " << plan.num_payments << "\n";
    std::cout << "  Monthly payment: $" << plan.monthly_payment << "\n";
    std::cout << "  Monthly fee:     $" << plan.monthly_fee << "\n\n";

    // 2. Configure solver (optional - uses defaults if not specified)
    payplan::RateSolverConfig config{
        .root_config = payplan::RootFindingConfig{
            .max_iter = 100,
            .tolerance = 1e-10
        },
        .method = payplan::RootMethod::Brent
    };

    // 3. Solve
    payplan::RateSolver solver(config);
    auto rate = solver.solve(plan);

    if (!rate.has_value()) {
        std::cout << "FAILED: " << rate.error() << "\n";
        return 1;
    }

    std::cout << "Equivalent rate:\n";
    std::cout << std::setprecision(6);
    std::cout << "  Monthly:    " << rate->periodic_rate * 100.0 << "%\n";
    std::cout << std::setprecision(2);
    std::cout << "  APR:        " << rate->apr_percent << "%\n";
    std::cout << "  Iterations: " << rate->iterations << "\n\n";

    // 4. Compare with a regular account
    auto analysis = payplan::analyze(plan, regular_apr);
    if (!analysis.has_value()) {
        std::cout << "Analysis failed: " << analysis.error() << "\n";
        return 1;
    }

    std::cout << "Month  Balance   Fee    Regular  Cheaper\n";
    for (const auto& row : analysis->schedule) {
        std::cout << std::setw(5) << row.period_index
                  << std::setw(10) << row.balance
                  << std::setw(7) << row.fixed_fee
                  << std::setw(9) << row.regular_interest
                  << "  " << (row.settled() ? "paid off" : row.favorable() ? "fixed" : "regular") << "\n";
    }

    if (analysis->recommendation) {
        const auto& rec = *analysis->recommendation;
        std::cout << "\nPay off after month " << rec.month_index
                  << " ($" << rec.remaining_balance << " remaining), avoiding "
                  << rec.unfavorable_months_avoided << " costlier months.\n";
    } else {
        std::cout << "\nThe fixed plan never costs more than regular interest.\n";
    }

    std::cout << "\nTotal fees: $" << analysis->totals.total_fees
              << " vs regular interest: $" << analysis->totals.regular_interest_paid << "\n";
    return 0;
}
