// SPDX-License-Identifier: MIT
#include "payplan/plan/amortization.hpp"
#include "payplan/plan/payment_plan.hpp"
#include "payplan/support/payplan_trace.h"
#include <algorithm>
#include <cmath>
#include <string>

namespace payplan {

namespace {

std::expected<void, PlanError> validate_inputs(double principal, const InterestMode& mode,
                                               double payment, size_t num_periods) {
    const double charge_param = std::visit([](const auto& m) -> double {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, ProportionalRate>) {
            return m.rate;
        } else {
            return m.amount;
        }
    }, mode);

    auto fail = [](PlanErrorCode code, const char* message, [[maybe_unused]] double value) {
        PAYPLAN_TRACE_VALIDATION_ERROR(PAYPLAN_MODULE_AMORTIZATION,
                                       static_cast<int>(code), value, 0.0);
        return std::unexpected(PlanError{.code = code, .message = message});
    };

    if (!std::isfinite(principal) || !std::isfinite(payment) || !std::isfinite(charge_param)) {
        return fail(PlanErrorCode::NonFiniteInput, "Simulation inputs must be finite", 0.0);
    }
    if (principal <= 0.0) {
        return fail(PlanErrorCode::NonPositivePurchaseAmount, "Principal must be positive", principal);
    }
    if (num_periods < 1) {
        return fail(PlanErrorCode::NonPositivePaymentCount, "Number of periods must be at least 1", 0.0);
    }
    if (payment <= 0.0) {
        return fail(PlanErrorCode::NonPositiveMonthlyPayment, "Payment must be positive", payment);
    }
    if (charge_param < 0.0) {
        const bool proportional = std::holds_alternative<ProportionalRate>(mode);
        return fail(proportional ? PlanErrorCode::NegativePeriodicRate
                                 : PlanErrorCode::NegativeMonthlyFee,
                    proportional ? "Periodic rate must be non-negative"
                                 : "Fixed fee must be non-negative",
                    charge_param);
    }
    return {};
}

}  // namespace

std::expected<AmortizationSchedule, PlanError>
simulate(double principal, const InterestMode& mode, double payment, size_t num_periods) {
    if (auto valid = validate_inputs(principal, mode, payment, num_periods); !valid) {
        return std::unexpected(valid.error());
    }

    PAYPLAN_TRACE_ALGO_START(PAYPLAN_MODULE_AMORTIZATION, num_periods, principal, payment);

    AmortizationSchedule schedule;
    // num_periods is an upper bound; a schedule usually settles earlier
    schedule.steps.reserve(std::min(num_periods, kMaxPaymentCount));

    double balance = principal;

    for (size_t period = 1; period <= num_periods; ++period) {
        const double charge = period_charge(mode, balance);
        double principal_component = payment - charge;

        if (principal_component <= 0.0) {
            PAYPLAN_TRACE_CONVERGENCE_FAILED(PAYPLAN_MODULE_AMORTIZATION, period, balance);
            return std::unexpected(PlanError{
                .code = PlanErrorCode::NonAmortizingPayment,
                .message = "Payment " + std::to_string(payment) +
                           " does not cover the period charge " + std::to_string(charge) +
                           " in period " + std::to_string(period),
                .iterations = period - 1,
                .residual = balance
            });
        }

        double paid = payment;
        double balance_after = balance - principal_component;

        // Over-payment or sub-cent residue: settle the balance and stop
        if (balance_after < kBalanceEpsilon) {
            principal_component = balance;
            paid = balance + charge;
            balance_after = 0.0;
        }

        schedule.steps.push_back(AmortizationStep{
            .period_index = period,
            .balance_before = balance,
            .payment = paid,
            .principal_component = principal_component,
            .interest_or_fee_component = charge,
            .balance_after = balance_after
        });

        schedule.total_paid += paid;
        schedule.total_principal += principal_component;
        schedule.total_interest_or_fee += charge;

        balance = balance_after;
        if (balance == 0.0) {
            break;
        }
    }

    schedule.periods_used = schedule.steps.size();
    schedule.fully_amortized = (balance == 0.0);

    PAYPLAN_TRACE_ALGO_COMPLETE(PAYPLAN_MODULE_AMORTIZATION, schedule.periods_used, balance);
    return schedule;
}

}  // namespace payplan
