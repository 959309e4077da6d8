// SPDX-License-Identifier: MIT
#pragma once

#include <cmath>
#include <cstddef>

namespace payplan {

/// Discount factor of an ordinary annuity: 1 - (1+r)^-n
///
/// Computed through log1p/expm1 so small rates keep full precision.
inline double annuity_discount_term(double rate, size_t num_periods) {
    return -std::expm1(-static_cast<double>(num_periods) * std::log1p(rate));
}

/// Present value of an ordinary annuity
/// PV = A · (1 - (1+r)^-n) / r,  with the r = 0 limit PV = A · n
///
/// @param rate Periodic rate (r > -1)
/// @param payment Level payment per period (A)
/// @param num_periods Number of payments (n)
/// @return Present value of the payment stream
inline double annuity_present_value(double rate, double payment, size_t num_periods) {
    if (rate == 0.0) {
        return payment * static_cast<double>(num_periods);
    }
    return payment * annuity_discount_term(rate, num_periods) / rate;
}

/// Level payment that amortizes a principal over n periods
/// A = P · r / (1 - (1+r)^-n),  with the r = 0 limit A = P / n
inline double annuity_payment(double principal, double rate, size_t num_periods) {
    if (num_periods == 0) {
        return 0.0;
    }
    if (rate == 0.0) {
        return principal / static_cast<double>(num_periods);
    }
    return principal * rate / annuity_discount_term(rate, num_periods);
}

/// Nominal annual rate from a monthly rate (no compounding)
constexpr double annualize_monthly(double monthly_rate) noexcept {
    return monthly_rate * 12.0;
}

/// Monthly rate from an APR given in percent (27.0 -> 0.0225)
constexpr double monthly_rate_from_apr_percent(double apr_percent) noexcept {
    return apr_percent / 100.0 / 12.0;
}

}  // namespace payplan
