// SPDX-License-Identifier: MIT
#include "payplan/report/report_renderer.hpp"
#include <cmath>
#include <format>
#include <iterator>
#include <string_view>
#include <utility>

namespace payplan {

namespace {

/// Append one formatted line
template <typename... Args>
void emit(std::string& out, std::format_string<Args...> fmt, Args&&... args) {
    std::format_to(std::back_inserter(out), fmt, std::forward<Args>(args)...);
    out.push_back('\n');
}

bool plan_rejected(const PlanEvaluation& evaluation) {
    return !evaluation.analysis.has_value()
        && error_category(evaluation.analysis.error()) == PlanErrorCategory::InvalidPlan;
}

const ComparisonRow* row_for(const AnalysisResult& analysis, size_t period_index) {
    if (period_index == 0 || period_index > analysis.schedule.size()) {
        return nullptr;
    }
    return &analysis.schedule[period_index - 1];
}

std::string cost_sentence(double difference) {
    if (difference > 0.0) {
        return std::format("The fixed payment plan costs ${:.2f} more than regular payments.",
                           difference);
    }
    return std::format("The fixed payment plan saves ${:.2f} compared to regular payments.",
                       std::abs(difference));
}

std::string apr_text(const PlanEvaluation& evaluation) {
    if (evaluation.rate) {
        return std::format("{:.2f}%", evaluation.rate->apr_percent);
    }
    return "unavailable (" + render_error(evaluation.rate.error()) + ")";
}

void console_recommendation(std::string& out, const AnalysisResult& analysis) {
    const auto& rec = *analysis.recommendation;
    if (rec.month_index == 0) {
        emit(out, "\nSuggested optimal payoff: Before month 1, pay the full ${:.2f}",
             rec.remaining_balance);
    } else {
        emit(out, "\nSuggested optimal payoff: After month {}, pay remaining ${:.2f}",
             rec.month_index, rec.remaining_balance);
        if (const auto* row = row_for(analysis, rec.month_index)) {
            emit(out, "At this point, fixed fee would be ${:.2f}, regular interest would be ${:.2f}",
                 row->fixed_fee, row->regular_interest);
        }
    }
    emit(out, "This would avoid {} months of high-cost fees.", rec.unfavorable_months_avoided);
}

void markdown_recommendation(std::string& out, const AnalysisResult& analysis) {
    const auto& rec = *analysis.recommendation;
    emit(out, "\n### Optimal Payoff Recommendation:");
    if (rec.month_index == 0) {
        emit(out, "- Suggested optimal payoff: Before month 1, pay the full ${:.2f}",
             rec.remaining_balance);
    } else {
        emit(out, "- Suggested optimal payoff: After month {}, pay remaining ${:.2f}",
             rec.month_index, rec.remaining_balance);
        if (const auto* row = row_for(analysis, rec.month_index)) {
            emit(out, "- At this point, fixed fee would be ${:.2f}, regular interest would be ${:.2f}",
                 row->fixed_fee, row->regular_interest);
        }
    }
    emit(out, "- This would avoid {} months of high-cost fees.", rec.unfavorable_months_avoided);
}

}  // namespace

std::string render_error(const PlanError& error) {
    return std::format("{} [{}]: {}", to_string(error_category(error)),
                       to_string(error.code), error.message);
}

std::string render_error(const ConfigError& error) {
    return std::format("ConfigError [{}]: {}", to_string(error.code), error.message);
}

std::string render_console(const PlanEvaluation& evaluation, size_t plan_number,
                           double regular_apr) {
    const PaymentPlan& plan = evaluation.plan;
    const std::string rule(50, '=');
    std::string out;

    emit(out, "\n{}\nANALYSIS #{}\n{}", rule, plan_number, rule);
    emit(out, "\n--- Fixed Payment Plan Analysis ---");
    emit(out, "Purchase Amount: ${:.2f}", plan.purchase_amount);
    emit(out, "Number of Payments: {}", plan.num_payments);
    emit(out, "Monthly Payment: ${:.2f}", plan.monthly_payment);
    emit(out, "Monthly Fee: ${:.2f}", plan.monthly_fee);

    if (plan_rejected(evaluation)) {
        emit(out, "Error: {}", render_error(evaluation.analysis.error()));
        return out;
    }

    if (evaluation.analysis) {
        emit(out, "Total Cost: ${:.2f}", evaluation.analysis->totals.total_cost);
        emit(out, "Total Fees: ${:.2f}", evaluation.analysis->totals.total_fees);
    }
    emit(out, "Equivalent APR: {}", apr_text(evaluation));

    emit(out, "\n--- Comparison with Regular {}% APR ---", regular_apr);
    if (!evaluation.analysis) {
        emit(out, "Error: {}", render_error(evaluation.analysis.error()));
        return out;
    }

    const AnalysisResult& analysis = *evaluation.analysis;
    const AnalysisTotals& totals = analysis.totals;
    const DerivedMetrics& metrics = analysis.metrics;

    emit(out, "Regular Interest Paid: ${:.2f}", totals.regular_interest_paid);
    emit(out, "Regular Total Cost: ${:.2f}", totals.regular_total_cost);
    emit(out, "Regular Payments Needed: {}", totals.regular_payments);
    emit(out, "Difference (Fixed Plan - Regular): ${:.2f}", totals.difference);
    emit(out, "{}", cost_sentence(totals.difference));

    emit(out, "\n--- Additional Analysis ---");
    emit(out, "Simple interest rate equivalent: {:.2f}% APR", metrics.simple_interest_apr * 100.0);
    emit(out, "Monthly fee as % of purchase: {:.2f}% per month", metrics.monthly_fee_percent);
    emit(out, "Average balance over the term: ${:.2f}", metrics.average_balance);
    emit(out, "Effective rate based on avg. balance: {:.2f}% APR (approximate)",
         metrics.average_balance_apr * 100.0);
    emit(out, "Fee-only equivalent rate (on avg. balance): {:.2f}% APR (approximate)",
         metrics.fee_only_apr * 100.0);

    emit(out, "\n--- Balance Schedule and Optimal Payoff Analysis ---");
    emit(out, "Month | Balance  | Fixed Fee | Regular Interest | Difference | Effective Rate");
    emit(out, "------|----------|-----------|------------------|------------|---------------");
    for (const auto& row : analysis.schedule) {
        emit(out, "{:5} | ${:7.2f} | ${:8.2f} | ${:15.2f} | ${:9.2f} | {:5.2f}% monthly ({:5.2f}% APR)",
             row.period_index, row.balance, row.fixed_fee, row.regular_interest,
             row.difference, row.effective_monthly_rate * 100.0,
             row.effective_annual_rate * 100.0);
        if (analysis.recommendation && analysis.recommendation->month_index == row.period_index) {
            emit(out, "      >>> OPTIMAL PAYOFF POINT: After month {}, pay remaining ${:.2f}",
                 row.period_index, analysis.recommendation->remaining_balance);
        }
    }
    emit(out, "      *Regular interest calculated at {}% APR on remaining balance", regular_apr);

    if (!analysis.high_cost_periods.empty()) {
        emit(out, "\nMonths where fee rate exceeds regular {}% APR ({:.2f}% monthly):",
             regular_apr, regular_apr / 12.0);
        for (const auto& period : analysis.high_cost_periods) {
            emit(out, "  Month {}: {:.2f}% monthly ({:.2f}% APR) on ${:.2f} balance",
                 period.period_index, period.effective_monthly_rate * 100.0,
                 period.effective_monthly_rate * 1200.0, period.balance);
            if (const auto* row = row_for(analysis, period.period_index)) {
                emit(out, "    Fixed fee: ${:.2f}, Regular interest: ${:.2f}, Difference: ${:.2f}",
                     row->fixed_fee, row->regular_interest, row->difference);
            }
        }
    }

    if (analysis.recommendation) {
        console_recommendation(out, analysis);
    }
    return out;
}

std::string render_markdown(const PlanEvaluation& evaluation, size_t plan_number,
                            double regular_apr) {
    const PaymentPlan& plan = evaluation.plan;
    std::string out;

    emit(out, "\n# Fixed Payment Plan Analysis #{}", plan_number);
    emit(out, "- Purchase Amount: ${:.2f}", plan.purchase_amount);
    emit(out, "- Number of Payments: {}", plan.num_payments);
    emit(out, "- Monthly Payment: ${:.2f}", plan.monthly_payment);
    emit(out, "- Monthly Fee: ${:.2f}", plan.monthly_fee);

    if (plan_rejected(evaluation)) {
        emit(out, "- **Error:** {}", render_error(evaluation.analysis.error()));
        return out;
    }

    if (evaluation.analysis) {
        emit(out, "- Total Cost: ${:.2f}", evaluation.analysis->totals.total_cost);
        emit(out, "- Total Fees: ${:.2f}", evaluation.analysis->totals.total_fees);
    }
    emit(out, "- Equivalent APR: {}", apr_text(evaluation));

    emit(out, "\n## Comparison with Regular {}% APR", regular_apr);
    if (!evaluation.analysis) {
        emit(out, "- **Error:** {}", render_error(evaluation.analysis.error()));
        return out;
    }

    const AnalysisResult& analysis = *evaluation.analysis;
    const AnalysisTotals& totals = analysis.totals;
    const DerivedMetrics& metrics = analysis.metrics;

    emit(out, "- Regular Interest Paid: ${:.2f}", totals.regular_interest_paid);
    emit(out, "- Regular Total Cost: ${:.2f}", totals.regular_total_cost);
    emit(out, "- Regular Payments Needed: {}", totals.regular_payments);
    emit(out, "- Difference (Fixed Plan - Regular): ${:.2f}", totals.difference);
    emit(out, "- {}", cost_sentence(totals.difference));

    emit(out, "\n## Additional Analysis");
    emit(out, "- Simple interest rate equivalent: {:.2f}% APR", metrics.simple_interest_apr * 100.0);
    emit(out, "- Monthly fee as % of purchase: {:.2f}% per month", metrics.monthly_fee_percent);
    emit(out, "- Average balance over the term: ${:.2f}", metrics.average_balance);
    emit(out, "- Effective rate based on avg. balance: {:.2f}% APR (approximate)",
         metrics.average_balance_apr * 100.0);
    emit(out, "- Fee-only equivalent rate (on avg. balance): {:.2f}% APR (approximate)",
         metrics.fee_only_apr * 100.0);

    emit(out, "\n## Balance Schedule and Optimal Payoff Analysis");
    emit(out, "| Month | Balance | Fixed Fee | Regular Interest* | Difference | Effective Rate | APR Equivalent |");
    emit(out, "|-------|---------|-----------|-------------------|------------|----------------|----------------|");
    for (const auto& row : analysis.schedule) {
        emit(out, "| {:2} | ${:8.2f} | ${:7.2f} | ${:7.2f} | ${:7.2f} | {:5.2f}% monthly | {:5.2f}% |",
             row.period_index, row.balance, row.fixed_fee, row.regular_interest,
             row.difference, row.effective_monthly_rate * 100.0,
             row.effective_annual_rate * 100.0);
        if (analysis.recommendation && analysis.recommendation->month_index == row.period_index) {
            emit(out, "| **OPTIMAL PAYOFF POINT: After month {}, pay remaining ${:.2f}** |",
                 row.period_index, analysis.recommendation->remaining_balance);
        }
    }
    emit(out, "\n*Regular interest calculated at {}% APR on remaining balance", regular_apr);

    if (!analysis.high_cost_periods.empty()) {
        emit(out, "\n### Months where fee rate exceeds regular {}% APR ({:.2f}% monthly):",
             regular_apr, regular_apr / 12.0);
        emit(out, "| Month | Rate | APR | Balance | Fixed Fee | Regular Interest | Difference |");
        emit(out, "|-------|------|-----|---------|-----------|------------------|------------|");
        for (const auto& period : analysis.high_cost_periods) {
            if (const auto* row = row_for(analysis, period.period_index)) {
                emit(out, "| {} | {:.2f}% monthly | {:.2f}% | ${:.2f} | ${:7.2f} | ${:7.2f} | ${:7.2f} |",
                     period.period_index, period.effective_monthly_rate * 100.0,
                     period.effective_monthly_rate * 1200.0, period.balance,
                     row->fixed_fee, row->regular_interest, row->difference);
            }
        }
    }

    if (analysis.recommendation) {
        markdown_recommendation(out, analysis);
    }
    return out;
}

std::string render_report(const BatchEvaluation& batch, double regular_apr,
                          ReportFormat format) {
    std::string out;

    for (size_t i = 0; i < batch.results.size(); ++i) {
        const size_t number = i + 1;
        if (format == ReportFormat::Markdown) {
            if (i > 0) {
                emit(out, "\n---");
            }
            out += render_markdown(batch.results[i], number, regular_apr);
        } else {
            out += render_console(batch.results[i], number, regular_apr);
        }
    }
    return out;
}

}  // namespace payplan
