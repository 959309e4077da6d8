// SPDX-License-Identifier: MIT
#pragma once

#include <cstddef>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

namespace payplan {

/// Plan evaluation error codes
///
/// Grouped by the category reported through error_category().
enum class PlanErrorCode {
    // Invalid plan
    NonPositivePurchaseAmount,
    NonPositivePaymentCount,
    NonPositiveMonthlyPayment,
    NegativeMonthlyFee,
    NegativePeriodicRate,
    FeeNotBelowPayment,
    NonFiniteInput,
    PaymentsBelowPrincipal,
    NonAmortizingPayment,

    // Rate solver convergence
    MaxIterationsExceeded,
    BracketingFailed,
    NumericalInstability,

    // Reference plan
    NonPositiveReferenceRate,
    ReferencePaymentTooSmall,
    ReferenceHorizonExceeded
};

/// Error categories surfaced to callers
enum class PlanErrorCategory {
    InvalidPlan,
    RateSolverConvergence,
    ReferencePlanNonConvergent
};

/// Detailed plan error passed through the expected failure path
struct PlanError {
    PlanErrorCode code;
    std::string message;
    size_t iterations = 0;                 ///< Solver iterations or simulated periods
    double residual = 0.0;                 ///< Residual at failure (PV error or balance left)
    std::optional<double> best_estimate;   ///< Last rate candidate (rate solver only)
    std::optional<double> bracket_low;     ///< Final bracket (rate solver only)
    std::optional<double> bracket_high;
};

/// Map an error code to its category
constexpr PlanErrorCategory error_category(PlanErrorCode code) noexcept {
    switch (code) {
        case PlanErrorCode::MaxIterationsExceeded:
        case PlanErrorCode::BracketingFailed:
        case PlanErrorCode::NumericalInstability:
            return PlanErrorCategory::RateSolverConvergence;
        case PlanErrorCode::NonPositiveReferenceRate:
        case PlanErrorCode::ReferencePaymentTooSmall:
        case PlanErrorCode::ReferenceHorizonExceeded:
            return PlanErrorCategory::ReferencePlanNonConvergent;
        default:
            return PlanErrorCategory::InvalidPlan;
    }
}

inline PlanErrorCategory error_category(const PlanError& err) noexcept {
    return error_category(err.code);
}

/// Stable name for an error code (used by reports and probes)
constexpr std::string_view to_string(PlanErrorCode code) noexcept {
    switch (code) {
        case PlanErrorCode::NonPositivePurchaseAmount: return "NonPositivePurchaseAmount";
        case PlanErrorCode::NonPositivePaymentCount:   return "NonPositivePaymentCount";
        case PlanErrorCode::NonPositiveMonthlyPayment: return "NonPositiveMonthlyPayment";
        case PlanErrorCode::NegativeMonthlyFee:        return "NegativeMonthlyFee";
        case PlanErrorCode::NegativePeriodicRate:      return "NegativePeriodicRate";
        case PlanErrorCode::FeeNotBelowPayment:        return "FeeNotBelowPayment";
        case PlanErrorCode::NonFiniteInput:            return "NonFiniteInput";
        case PlanErrorCode::PaymentsBelowPrincipal:    return "PaymentsBelowPrincipal";
        case PlanErrorCode::NonAmortizingPayment:      return "NonAmortizingPayment";
        case PlanErrorCode::MaxIterationsExceeded:     return "MaxIterationsExceeded";
        case PlanErrorCode::BracketingFailed:          return "BracketingFailed";
        case PlanErrorCode::NumericalInstability:      return "NumericalInstability";
        case PlanErrorCode::NonPositiveReferenceRate:  return "NonPositiveReferenceRate";
        case PlanErrorCode::ReferencePaymentTooSmall:  return "ReferencePaymentTooSmall";
        case PlanErrorCode::ReferenceHorizonExceeded:  return "ReferenceHorizonExceeded";
    }
    return "Unknown";
}

constexpr std::string_view to_string(PlanErrorCategory category) noexcept {
    switch (category) {
        case PlanErrorCategory::InvalidPlan:                return "InvalidPlanError";
        case PlanErrorCategory::RateSolverConvergence:      return "RateSolverConvergenceError";
        case PlanErrorCategory::ReferencePlanNonConvergent: return "ReferencePlanNonConvergentError";
    }
    return "Unknown";
}

/// Error codes for configuration loading failures
enum class ConfigErrorCode {
    FileNotFound,
    ParseError,
    MissingField,
    InvalidField
};

/// Detailed configuration error
struct ConfigError {
    ConfigErrorCode code;
    std::string message;
    std::string field;                  ///< Offending field name (empty if not applicable)
    std::optional<size_t> plan_index;   ///< Zero-based index into payment_plans
};

constexpr std::string_view to_string(ConfigErrorCode code) noexcept {
    switch (code) {
        case ConfigErrorCode::FileNotFound: return "FileNotFound";
        case ConfigErrorCode::ParseError:   return "ParseError";
        case ConfigErrorCode::MissingField: return "MissingField";
        case ConfigErrorCode::InvalidField: return "InvalidField";
    }
    return "Unknown";
}

/// Output stream operator for PlanError
inline std::ostream& operator<<(std::ostream& os, const PlanError& err) {
    os << to_string(error_category(err)) << "{code=" << to_string(err.code)
       << ", message=\"" << err.message << "\""
       << ", iterations=" << err.iterations
       << ", residual=" << err.residual;
    if (err.best_estimate) {
        os << ", best_estimate=" << *err.best_estimate;
    }
    if (err.bracket_low && err.bracket_high) {
        os << ", bracket=[" << *err.bracket_low << ", " << *err.bracket_high << "]";
    }
    os << "}";
    return os;
}

/// Output stream operator for ConfigError
inline std::ostream& operator<<(std::ostream& os, const ConfigError& err) {
    os << "ConfigError{code=" << to_string(err.code)
       << ", message=\"" << err.message << "\"";
    if (!err.field.empty()) {
        os << ", field=" << err.field;
    }
    if (err.plan_index) {
        os << ", plan_index=" << *err.plan_index;
    }
    os << "}";
    return os;
}

}  // namespace payplan
