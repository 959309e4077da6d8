// SPDX-License-Identifier: MIT
#include "payplan/plan/payment_plan.hpp"
#include "payplan/support/payplan_trace.h"
#include <cmath>
#include <string>
#include <utility>

namespace payplan {

namespace {

using Check = std::expected<std::monostate, PlanError>;

Check fail(PlanErrorCode code, std::string message,
           [[maybe_unused]] double value, [[maybe_unused]] double related = 0.0) {
    PAYPLAN_TRACE_VALIDATION_ERROR(PAYPLAN_MODULE_VALIDATION,
                                   static_cast<int>(code), value, related);
    return std::unexpected(PlanError{
        .code = code,
        .message = std::move(message)
    });
}

Check validate_finite(const PaymentPlan& plan) {
    if (!std::isfinite(plan.purchase_amount) ||
        !std::isfinite(plan.monthly_payment) ||
        !std::isfinite(plan.monthly_fee)) {
        return fail(PlanErrorCode::NonFiniteInput, "Plan amounts must be finite", 0.0);
    }
    return std::monostate{};
}

Check validate_purchase_positive(const PaymentPlan& plan) {
    if (plan.purchase_amount <= 0.0) {
        return fail(PlanErrorCode::NonPositivePurchaseAmount,
                    "Purchase amount must be positive", plan.purchase_amount);
    }
    return std::monostate{};
}

Check validate_payment_count(const PaymentPlan& plan) {
    if (plan.num_payments < 1) {
        return fail(PlanErrorCode::NonPositivePaymentCount,
                    "Number of payments must be at least 1",
                    static_cast<double>(plan.num_payments));
    }
    return std::monostate{};
}

Check validate_payment_positive(const PaymentPlan& plan) {
    if (plan.monthly_payment <= 0.0) {
        return fail(PlanErrorCode::NonPositiveMonthlyPayment,
                    "Monthly payment must be positive", plan.monthly_payment);
    }
    return std::monostate{};
}

Check validate_fee_nonnegative(const PaymentPlan& plan) {
    if (plan.monthly_fee < 0.0) {
        return fail(PlanErrorCode::NegativeMonthlyFee,
                    "Monthly fee must be non-negative", plan.monthly_fee);
    }
    return std::monostate{};
}

Check validate_fee_below_payment(const PaymentPlan& plan) {
    if (plan.principal_per_payment() <= 0.0) {
        return fail(PlanErrorCode::FeeNotBelowPayment,
                    "Monthly fee must be below the monthly payment or the plan never amortizes",
                    plan.monthly_fee, plan.monthly_payment);
    }
    return std::monostate{};
}

Check validate_fields(const PaymentPlan& plan) {
    return validate_finite(plan)
        .and_then([&plan](auto) { return validate_purchase_positive(plan); })
        .and_then([&plan](auto) { return validate_payment_count(plan); })
        .and_then([&plan](auto) { return validate_payment_positive(plan); })
        .and_then([&plan](auto) { return validate_fee_nonnegative(plan); })
        .and_then([&plan](auto) { return validate_fee_below_payment(plan); });
}

Check validate_payments_cover_principal(const PaymentPlan& plan) {
    const double total = plan.monthly_payment * static_cast<double>(plan.num_payments);
    // Relative slack so that exact zero-rate plans survive floating-point rounding
    const double slack = 1e-12 * plan.purchase_amount;
    if (total + slack < plan.purchase_amount) {
        return fail(PlanErrorCode::PaymentsBelowPrincipal,
                    "Total of payments is below the purchase amount; no non-negative rate reproduces the plan",
                    total, plan.purchase_amount);
    }
    return std::monostate{};
}

std::expected<void, PlanError> to_void(const Check& check) {
    if (!check) {
        return std::unexpected(check.error());
    }
    return {};
}

}  // namespace

std::expected<void, PlanError> validate_payment_plan(const PaymentPlan& plan) {
    return to_void(validate_fields(plan));
}

std::expected<void, PlanError> validate_rate_solvable(const PaymentPlan& plan) {
    return to_void(validate_fields(plan)
        .and_then([&plan](auto) { return validate_payments_cover_principal(plan); }));
}

}  // namespace payplan
