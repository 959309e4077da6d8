// SPDX-License-Identifier: MIT
#include "payplan/config/plan_config.hpp"
#include "payplan/support/payplan_trace.h"
#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/ptree.hpp>
#include <cmath>
#include <fstream>
#include <optional>
#include <sstream>
#include <string>
#include <utility>

namespace payplan {

namespace pt = boost::property_tree;

namespace {

std::unexpected<ConfigError> config_error(ConfigErrorCode code, std::string message,
                                          std::string field = {},
                                          std::optional<size_t> plan_index = std::nullopt) {
    PAYPLAN_TRACE_VALIDATION_ERROR(PAYPLAN_MODULE_CONFIG, static_cast<int>(code),
                                   plan_index.has_value() ? static_cast<double>(*plan_index) : -1.0,
                                   0.0);
    return std::unexpected(ConfigError{
        .code = code,
        .message = std::move(message),
        .field = std::move(field),
        .plan_index = plan_index
    });
}

/// A node with children but no data (arrays come through as empty-keyed children)
bool is_container(const pt::ptree& node) {
    return !node.empty() && node.data().empty();
}

std::expected<double, ConfigError> read_number(const pt::ptree& plan, const std::string& field,
                                               size_t index) {
    auto child = plan.get_child_optional(field);
    if (!child) {
        return config_error(ConfigErrorCode::MissingField,
                            "Plan " + std::to_string(index + 1) + " is missing '" + field + "'",
                            field, index);
    }
    auto value = child->get_value_optional<double>();
    if (!value || is_container(*child)) {
        return config_error(ConfigErrorCode::InvalidField,
                            "Plan " + std::to_string(index + 1) + ": '" + field +
                                "' is not a number: \"" + child->data() + "\"",
                            field, index);
    }
    return *value;
}

std::expected<size_t, ConfigError> read_count(const pt::ptree& plan, const std::string& field,
                                              size_t index) {
    return read_number(plan, field, index)
        .and_then([&](double value) -> std::expected<size_t, ConfigError> {
            if (!std::isfinite(value) || value < 0.0 || value != std::floor(value)) {
                return config_error(ConfigErrorCode::InvalidField,
                                    "Plan " + std::to_string(index + 1) + ": '" + field +
                                        "' must be a non-negative integer",
                                    field, index);
            }
            if (value > static_cast<double>(kMaxPaymentCount)) {
                return config_error(ConfigErrorCode::InvalidField,
                                    "Plan " + std::to_string(index + 1) + ": '" + field +
                                        "' exceeds " + std::to_string(kMaxPaymentCount),
                                    field, index);
            }
            return static_cast<size_t>(value);
        });
}

std::expected<PaymentPlan, ConfigError> read_plan(const pt::ptree& node, size_t index) {
    if (node.empty()) {
        return config_error(ConfigErrorCode::InvalidField,
                            "Plan " + std::to_string(index + 1) + " is not an object",
                            "payment_plans", index);
    }

    auto purchase = read_number(node, "purchase_amount", index);
    if (!purchase) return std::unexpected(purchase.error());

    auto count = read_count(node, "num_payments", index);
    if (!count) return std::unexpected(count.error());

    auto payment = read_number(node, "monthly_payment", index);
    if (!payment) return std::unexpected(payment.error());

    auto fee = read_number(node, "monthly_fee", index);
    if (!fee) return std::unexpected(fee.error());

    return PaymentPlan{
        .purchase_amount = *purchase,
        .num_payments = *count,
        .monthly_payment = *payment,
        .monthly_fee = *fee
    };
}

}  // namespace

std::expected<PlanConfig, ConfigError> parse_plan_config(std::string_view json_text) {
    pt::ptree root;
    std::istringstream iss{std::string(json_text)};
    try {
        pt::read_json(iss, root);
    } catch (const pt::json_parser_error& e) {
        return config_error(ConfigErrorCode::ParseError,
                            "Failed to parse configuration: " + std::string(e.what()));
    }

    if (!root.data().empty()) {
        return config_error(ConfigErrorCode::ParseError,
                            "Configuration root must be a JSON object");
    }

    PlanConfig config;

    if (auto apr = root.get_child_optional("regular_apr")) {
        auto value = apr->get_value_optional<double>();
        if (!value || is_container(*apr)) {
            return config_error(ConfigErrorCode::InvalidField,
                                "'regular_apr' is not a number: \"" + apr->data() + "\"",
                                "regular_apr");
        }
        config.regular_apr = *value;
    }

    auto plans = root.get_child_optional("payment_plans");
    if (!plans) {
        return config_error(ConfigErrorCode::MissingField,
                            "Configuration is missing 'payment_plans'", "payment_plans");
    }
    if (plans->empty()) {
        return config_error(ConfigErrorCode::InvalidField,
                            "'payment_plans' must be a non-empty array", "payment_plans");
    }

    size_t index = 0;
    for (const auto& [key, node] : *plans) {
        if (!key.empty()) {
            return config_error(ConfigErrorCode::InvalidField,
                                "'payment_plans' must be an array", "payment_plans");
        }
        auto plan = read_plan(node, index);
        if (!plan) {
            return std::unexpected(plan.error());
        }
        config.payment_plans.push_back(*plan);
        ++index;
    }

    return config;
}

std::expected<PlanConfig, ConfigError> load_plan_config(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return config_error(ConfigErrorCode::FileNotFound,
                            "Configuration file " + path.string() + " not found.");
    }

    std::ifstream in(path);
    if (!in) {
        return config_error(ConfigErrorCode::FileNotFound,
                            "Cannot open configuration file " + path.string());
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return parse_plan_config(buffer.str());
}

PlanConfig default_plan_config() {
    return PlanConfig{
        .regular_apr = kDefaultRegularApr,
        .payment_plans = {
            {.purchase_amount = 1196.00, .num_payments = 18,
             .monthly_payment = 80.73, .monthly_fee = 14.28},
            {.purchase_amount = 2365.20, .num_payments = 24,
             .monthly_payment = 129.14, .monthly_fee = 30.59},
            {.purchase_amount = 200.00, .num_payments = 18,
             .monthly_payment = 13.51, .monthly_fee = 2.39},
        }
    };
}

}  // namespace payplan
