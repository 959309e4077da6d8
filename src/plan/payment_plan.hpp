// SPDX-License-Identifier: MIT
/**
 * @file payment_plan.hpp
 * @brief Fixed-fee installment plan terms and validation
 */

#pragma once

#include "payplan/support/error_types.hpp"
#include <cstddef>
#include <expected>
#include <variant>

namespace payplan {

/// Balances below half a cent are treated as paid off
inline constexpr double kBalanceEpsilon = 0.005;

/// Longest term accepted from configuration files (months), and the
/// reference plan's default horizon
inline constexpr size_t kMaxPaymentCount = 1000;

/**
 * @brief Fixed-fee installment plan as quoted by the lender
 *
 * Every monthly payment is split into a constant fee and a principal
 * reduction of (monthly_payment - monthly_fee). All amounts are in the
 * same currency unit. Treated as immutable: functions take it by const
 * reference and never modify it.
 */
struct PaymentPlan {
    double purchase_amount = 0.0;   ///< Amount financed (principal)
    size_t num_payments = 0;        ///< Number of monthly payments
    double monthly_payment = 0.0;   ///< Total monthly payment, fee included
    double monthly_fee = 0.0;       ///< Constant monthly fee

    /// Principal reduction per period
    double principal_per_payment() const {
        return monthly_payment - monthly_fee;
    }

    bool operator==(const PaymentPlan&) const = default;
};

/**
 * @brief Validate plan fields
 *
 * Checks, in order:
 * - All amounts finite
 * - purchase_amount > 0
 * - num_payments >= 1
 * - monthly_payment > 0
 * - monthly_fee >= 0
 * - monthly_fee < monthly_payment (the plan amortizes)
 *
 * @return void on success, PlanError (InvalidPlan category) on failure
 */
std::expected<void, PlanError> validate_payment_plan(const PaymentPlan& plan);

/**
 * @brief Validate that a non-negative periodic rate can reproduce the plan
 *
 * Requires validate_payment_plan() plus
 * monthly_payment * num_payments >= purchase_amount. Equality is the
 * zero-rate case.
 */
std::expected<void, PlanError> validate_rate_solvable(const PaymentPlan& plan);

}  // namespace payplan
