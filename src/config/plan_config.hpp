// SPDX-License-Identifier: MIT
/**
 * @file plan_config.hpp
 * @brief JSON plan configuration loading
 *
 * Format:
 * @code
 * {
 *   "regular_apr": 27.0,
 *   "payment_plans": [
 *     {
 *       "purchase_amount": 1196.00,
 *       "num_payments": 18,
 *       "monthly_payment": 80.73,
 *       "monthly_fee": 14.28
 *     }
 *   ]
 * }
 * @endcode
 *
 * Only structure and types are checked here. Plan values (positivity,
 * fee below payment, ...) are validated by the solver and analyzer, so a
 * config with one bad plan still loads and the other plans get evaluated.
 */

#pragma once

#include "payplan/plan/payment_plan.hpp"
#include "payplan/support/error_types.hpp"
#include <expected>
#include <filesystem>
#include <string_view>
#include <vector>

namespace payplan {

/// APR (percent) used when a config omits regular_apr
inline constexpr double kDefaultRegularApr = 27.0;

/// Plans to evaluate and the reference APR they are compared against
struct PlanConfig {
    double regular_apr = kDefaultRegularApr;   ///< Percent
    std::vector<PaymentPlan> payment_plans;
};

/// Parse a JSON document
///
/// @return PlanConfig, or ConfigError:
///         - ParseError for malformed JSON or a non-object root
///         - MissingField if payment_plans or a plan field is absent
///         - InvalidField for non-numeric values, a non-integer or negative
///           num_payments, or an empty payment_plans array
std::expected<PlanConfig, ConfigError> parse_plan_config(std::string_view json_text);

/// Read and parse a JSON file (FileNotFound if it does not exist or cannot be read)
std::expected<PlanConfig, ConfigError> load_plan_config(const std::filesystem::path& path);

/// Built-in example plans at the default APR
PlanConfig default_plan_config();

}  // namespace payplan
