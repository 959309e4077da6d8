// SPDX-License-Identifier: MIT
#include "payplan/plan/comparative_analyzer.hpp"
#include "payplan/math/annuity.hpp"
#include "payplan/support/payplan_trace.h"
#include <cmath>
#include <string>
#include <utility>

namespace payplan {

namespace {

std::expected<void, PlanError> validate_reference_rate(double regular_apr) {
    if (!std::isfinite(regular_apr) || regular_apr <= 0.0) {
        PAYPLAN_TRACE_VALIDATION_ERROR(PAYPLAN_MODULE_ANALYZER,
                                       static_cast<int>(PlanErrorCode::NonPositiveReferenceRate),
                                       regular_apr, 0.0);
        return std::unexpected(PlanError{
            .code = PlanErrorCode::NonPositiveReferenceRate,
            .message = "Regular APR must be positive and finite"
        });
    }
    return {};
}

/// Independent reference schedule at the regular rate
std::expected<AmortizationSchedule, PlanError>
simulate_reference(const PaymentPlan& plan, double monthly_rate, size_t horizon) {
    auto reference = simulate(plan.purchase_amount, ProportionalRate{monthly_rate},
                              plan.monthly_payment, horizon);
    if (!reference) {
        PlanError err = reference.error();
        if (err.code == PlanErrorCode::NonAmortizingPayment) {
            err.code = PlanErrorCode::ReferencePaymentTooSmall;
            err.message = "Reference plan never amortizes: " + err.message;
        }
        return std::unexpected(std::move(err));
    }

    if (!reference->fully_amortized) {
        PAYPLAN_TRACE_CONVERGENCE_FAILED(PAYPLAN_MODULE_ANALYZER, horizon,
                                         reference->final_balance());
        return std::unexpected(PlanError{
            .code = PlanErrorCode::ReferenceHorizonExceeded,
            .message = "Reference plan does not pay off within " +
                       std::to_string(horizon) + " periods",
            .iterations = horizon,
            .residual = reference->final_balance()
        });
    }
    return reference;
}

std::vector<ComparisonRow> build_comparison(const AmortizationSchedule& fixed,
                                            double monthly_rate) {
    std::vector<ComparisonRow> rows;
    rows.reserve(fixed.steps.size());

    for (const auto& step : fixed.steps) {
        const double balance = step.balance_after;
        const double fee = step.interest_or_fee_component;
        const double regular_interest = balance * monthly_rate;
        const double effective = (balance > kBalanceEpsilon) ? fee / balance : 0.0;

        rows.push_back(ComparisonRow{
            .period_index = step.period_index,
            .balance_before = step.balance_before,
            .principal_component = step.principal_component,
            .fixed_fee = fee,
            .balance = balance,
            .regular_interest = regular_interest,
            .difference = fee - regular_interest,
            .effective_monthly_rate = effective,
            .effective_annual_rate = annualize_monthly(effective)
        });
    }
    return rows;
}

DerivedMetrics derive_metrics(const PaymentPlan& plan, const AnalysisTotals& totals,
                              const std::vector<ComparisonRow>& rows) {
    const double n = static_cast<double>(plan.num_payments);
    const double years = n / 12.0;

    // Mean over the full stated term; periods after an early payoff carry zero
    double balance_sum = 0.0;
    for (const auto& row : rows) {
        balance_sum += row.balance_before;
    }
    const double average_balance = balance_sum / n;

    return DerivedMetrics{
        .simple_interest_apr = totals.total_fees / plan.purchase_amount / years,
        .monthly_fee_percent = plan.monthly_fee / plan.purchase_amount * 100.0,
        .average_balance = average_balance,
        .average_balance_apr = totals.total_fees / average_balance / years,
        .fee_only_apr = totals.scheduled_fees / average_balance / years
    };
}

}  // namespace

std::optional<PayoffRecommendation>
recommend_payoff(const std::vector<ComparisonRow>& schedule, double purchase_amount) {
    size_t last_favorable = 0;
    for (const auto& row : schedule) {
        if (!row.settled() && row.favorable()) {
            last_favorable = row.period_index;
        }
    }

    size_t unfavorable_after = 0;
    for (const auto& row : schedule) {
        if (row.period_index > last_favorable && row.unfavorable()) {
            ++unfavorable_after;
        }
    }

    if (unfavorable_after == 0) {
        return std::nullopt;
    }

    const double remaining = (last_favorable == 0)
        ? purchase_amount
        : schedule[last_favorable - 1].balance;

    PAYPLAN_TRACE_CROSSOVER(last_favorable, unfavorable_after, remaining);

    return PayoffRecommendation{
        .month_index = last_favorable,
        .remaining_balance = remaining,
        .unfavorable_months_avoided = unfavorable_after
    };
}

std::expected<AnalysisResult, PlanError>
analyze(const PaymentPlan& plan, double regular_apr, const AnalyzerConfig& config) {
    if (auto valid = validate_payment_plan(plan); !valid) {
        return std::unexpected(valid.error());
    }
    if (auto valid = validate_reference_rate(regular_apr); !valid) {
        return std::unexpected(valid.error());
    }

    PAYPLAN_TRACE_ALGO_START(PAYPLAN_MODULE_ANALYZER, plan.num_payments,
                             plan.purchase_amount, regular_apr);

    const double monthly_rate = monthly_rate_from_apr_percent(regular_apr);

    auto fixed = simulate(plan.purchase_amount, FixedFee{plan.monthly_fee},
                          plan.monthly_payment, plan.num_payments);
    if (!fixed) {
        return std::unexpected(fixed.error());
    }

    auto reference = simulate_reference(plan, monthly_rate, config.reference_horizon);
    if (!reference) {
        return std::unexpected(reference.error());
    }

    AnalysisResult result{
        .plan = plan,
        .regular_apr = regular_apr,
        .schedule = build_comparison(*fixed, monthly_rate),
        .recommendation = std::nullopt,
        .high_cost_periods = {},
        .totals = {},
        .metrics = {}
    };

    result.recommendation = recommend_payoff(result.schedule, plan.purchase_amount);

    for (const auto& row : result.schedule) {
        if (row.effective_monthly_rate > monthly_rate) {
            result.high_cost_periods.push_back(HighCostPeriod{
                .period_index = row.period_index,
                .balance = row.balance,
                .effective_monthly_rate = row.effective_monthly_rate
            });
        }
    }

    const double n = static_cast<double>(plan.num_payments);
    const double total_cost = n * plan.monthly_payment;
    const double regular_total_cost = plan.purchase_amount + reference->total_interest_or_fee;

    result.totals = AnalysisTotals{
        .total_cost = total_cost,
        .total_fees = total_cost - plan.purchase_amount,
        .scheduled_fees = n * plan.monthly_fee,
        .regular_interest_paid = reference->total_interest_or_fee,
        .regular_total_cost = regular_total_cost,
        .regular_payments = reference->periods_used,
        .difference = total_cost - regular_total_cost
    };
    result.metrics = derive_metrics(plan, result.totals, result.schedule);

    PAYPLAN_TRACE_ALGO_COMPLETE(PAYPLAN_MODULE_ANALYZER, result.schedule.size(),
                                result.totals.difference);
    return result;
}

}  // namespace payplan
