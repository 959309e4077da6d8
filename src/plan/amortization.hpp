// SPDX-License-Identifier: MIT
/**
 * @file amortization.hpp
 * @brief Period-by-period balance simulation for level-payment schedules
 *
 * One simulation loop serves two charge models:
 * - ProportionalRate: interest = balance × rate (revolving account, annuity)
 * - FixedFee: a constant charge per period, independent of the balance
 *   (fixed-fee installment plans)
 *
 * Both produce the same AmortizationStep rows, so downstream comparison
 * code never branches on the mode.
 */

#pragma once

#include "payplan/support/error_types.hpp"
#include <cstddef>
#include <expected>
#include <type_traits>
#include <variant>
#include <vector>

namespace payplan {

/// Charge proportional to the outstanding balance
struct ProportionalRate {
    double rate = 0.0;   ///< Periodic rate as a decimal (0.0225 for 2.25%/month)
};

/// Constant charge per period
struct FixedFee {
    double amount = 0.0;
};

/// Per-period charge model
using InterestMode = std::variant<ProportionalRate, FixedFee>;

/// Charge for one period given the balance outstanding at its start
inline double period_charge(const InterestMode& mode, double balance_before) {
    return std::visit([balance_before](const auto& m) -> double {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, ProportionalRate>) {
            return balance_before * m.rate;
        } else {
            return m.amount;
        }
    }, mode);
}

/// One row of an amortization schedule
struct AmortizationStep {
    size_t period_index;              ///< 1-based
    double balance_before;
    double payment;                   ///< Amount actually paid (short on a payoff period)
    double principal_component;
    double interest_or_fee_component;
    double balance_after;
};

/// Result of simulate()
struct AmortizationSchedule {
    std::vector<AmortizationStep> steps;
    size_t periods_used = 0;          ///< Number of rows produced
    bool fully_amortized = false;     ///< Balance reached zero within the horizon
    double total_paid = 0.0;
    double total_principal = 0.0;
    double total_interest_or_fee = 0.0;

    /// Balance left after the last simulated period
    double final_balance() const {
        return steps.empty() ? 0.0 : steps.back().balance_after;
    }
};

/**
 * @brief Simulate a level-payment schedule
 *
 * Each period: charge = mode(balance_before), principal = payment - charge,
 * balance_after = balance_before - principal. A period whose principal
 * would exceed the balance pays only what is owed and ends the schedule
 * early. Residual balances below half a cent are floored to zero.
 *
 * @param principal Starting balance (> 0)
 * @param mode Charge model; rate or fee must be non-negative
 * @param payment Scheduled payment per period (> 0)
 * @param num_periods Maximum number of periods (>= 1)
 * @return Schedule, or PlanError (InvalidPlan) when inputs are invalid or
 *         the payment does not cover a period's charge
 */
std::expected<AmortizationSchedule, PlanError>
simulate(double principal, const InterestMode& mode, double payment, size_t num_periods);

}  // namespace payplan
