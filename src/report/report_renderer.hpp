// SPDX-License-Identifier: MIT
/**
 * @file report_renderer.hpp
 * @brief Human-readable plan reports (console text and Markdown)
 */

#pragma once

#include "payplan/plan/plan_evaluation.hpp"
#include "payplan/support/error_types.hpp"
#include <cstddef>
#include <string>

namespace payplan {

enum class ReportFormat {
    Console,
    Markdown
};

/**
 * @brief Render one evaluated plan as console text
 *
 * Sections: plan summary and totals, equivalent APR, comparison with the
 * regular APR, additional metrics, full schedule with the optimal payoff
 * marker, high-cost months and the payoff recommendation. A plan that
 * fails validation renders its summary and a one-line error.
 *
 * @param evaluation Evaluated plan
 * @param plan_number 1-based number shown in headings
 * @param regular_apr Reference APR in percent
 */
std::string render_console(const PlanEvaluation& evaluation, size_t plan_number,
                           double regular_apr);

/// Same content as render_console() using Markdown headings, lists and tables
std::string render_markdown(const PlanEvaluation& evaluation, size_t plan_number,
                            double regular_apr);

/// All plans of a batch in input order with per-plan separators
std::string render_report(const BatchEvaluation& batch, double regular_apr,
                          ReportFormat format);

/// One-line error: "<Category> [<Code>]: <message>"
std::string render_error(const PlanError& error);

/// One-line error: "ConfigError [<Code>]: <message>"
std::string render_error(const ConfigError& error);

}  // namespace payplan
