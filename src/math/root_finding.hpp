// SPDX-License-Identifier: MIT
#pragma once

#include "payplan/support/payplan_trace.h"
#include <algorithm>
#include <cmath>
#include <concepts>
#include <cstddef>
#include <limits>
#include <optional>
#include <string>
#include <utility>

namespace payplan {

/// Configuration shared by the bracketed root finders
struct RootFindingConfig {
    /// Hard iteration cap
    size_t max_iter = 200;

    /// Absolute tolerance on |f(x)|
    double tolerance = 1e-9;

    /// Absolute tolerance on the bracket width
    double bracket_tol = 1e-12;
};

/// Result from a bracketed root finder
///
/// On failure the bracket and root fields still hold the best information
/// available so callers can report it or retry with a wider bracket.
struct RootFindingResult {
    bool converged;
    size_t iterations;
    double final_error;                          ///< |f(root)| (NaN if f misbehaved)
    std::optional<std::string> failure_reason;
    std::optional<double> root;                  ///< Best estimate
    double bracket_low;
    double bracket_high;
};

/// Scalar objective f: R -> R
template<typename F>
concept ObjectiveFunction = requires(F f, double x) {
    { f(x) } -> std::convertible_to<double>;
};

namespace detail {

inline bool same_sign(double x, double y) {
    return (x < 0.0) == (y < 0.0);
}

inline RootFindingResult non_finite_result(size_t iterations, double lo, double hi) {
    return RootFindingResult{
        .converged = false,
        .iterations = iterations,
        .final_error = std::numeric_limits<double>::quiet_NaN(),
        .failure_reason = "Function returned non-finite value (NaN or Inf)",
        .root = std::nullopt,
        .bracket_low = lo,
        .bracket_high = hi
    };
}

}  // namespace detail

/// Find a root by bisection
///
/// Halves [a, b] until |f(mid)| <= tolerance or the half-width drops below
/// bracket_tol. Convergence is linear but guaranteed whenever f is
/// continuous and changes sign on the bracket, which makes this the method
/// of choice for monotone objectives with a known search range.
///
/// **Precondition:** f(a) and f(b) have opposite signs (or one is a root)
///
/// @param f Function to find root of
/// @param a Left bracket
/// @param b Right bracket
/// @param config Iteration cap and tolerances
/// @return Result with root (if converged) and the final bracket
template<ObjectiveFunction F>
RootFindingResult bisection_find_root(F&& f, double a, double b,
                                      const RootFindingConfig& config) {
    if (a > b) {
        std::swap(a, b);
    }

    PAYPLAN_TRACE_ROOT_START(0, a, b, config.max_iter);

    double fa = f(a);
    const double fb = f(b);

    if (!std::isfinite(fa) || !std::isfinite(fb)) {
        return detail::non_finite_result(0, a, b);
    }

    // Endpoint roots
    if (std::abs(fa) <= config.tolerance) {
        PAYPLAN_TRACE_ROOT_COMPLETE(a, 0, 1);
        return RootFindingResult{
            .converged = true, .iterations = 0, .final_error = std::abs(fa),
            .failure_reason = std::nullopt, .root = a,
            .bracket_low = a, .bracket_high = b
        };
    }
    if (std::abs(fb) <= config.tolerance) {
        PAYPLAN_TRACE_ROOT_COMPLETE(b, 0, 1);
        return RootFindingResult{
            .converged = true, .iterations = 0, .final_error = std::abs(fb),
            .failure_reason = std::nullopt, .root = b,
            .bracket_low = a, .bracket_high = b
        };
    }

    if (detail::same_sign(fa, fb)) {
        return RootFindingResult{
            .converged = false,
            .iterations = 0,
            .final_error = std::min(std::abs(fa), std::abs(fb)),
            .failure_reason = "Root not bracketed",
            .root = std::nullopt,
            .bracket_low = a,
            .bracket_high = b
        };
    }

    double mid = a + 0.5 * (b - a);
    double fmid = fa;

    for (size_t iter = 0; iter < config.max_iter; ++iter) {
        mid = a + 0.5 * (b - a);
        fmid = f(mid);

        if (!std::isfinite(fmid)) {
            PAYPLAN_TRACE_ROOT_COMPLETE(mid, iter + 1, 0);
            return detail::non_finite_result(iter + 1, a, b);
        }

        PAYPLAN_TRACE_ROOT_ITER(iter, mid, fmid, b - a);

        if (std::abs(fmid) <= config.tolerance || 0.5 * (b - a) <= config.bracket_tol) {
            PAYPLAN_TRACE_ROOT_COMPLETE(mid, iter + 1, 1);
            return RootFindingResult{
                .converged = true,
                .iterations = iter + 1,
                .final_error = std::abs(fmid),
                .failure_reason = std::nullopt,
                .root = mid,
                .bracket_low = a,
                .bracket_high = b
            };
        }

        if (detail::same_sign(fmid, fa)) {
            a = mid;
            fa = fmid;
        } else {
            b = mid;
        }
    }

    PAYPLAN_TRACE_ROOT_COMPLETE(mid, config.max_iter, 0);
    return RootFindingResult{
        .converged = false,
        .iterations = config.max_iter,
        .final_error = std::abs(fmid),
        .failure_reason = "Max iterations reached",
        .root = mid,
        .bracket_low = a,
        .bracket_high = b
    };
}

/// Find a root using Brent's method
///
/// Inverse quadratic interpolation and secant steps with a bisection
/// fallback. Same bracket contract and result as bisection_find_root, with
/// superlinear convergence on smooth objectives.
///
/// **Precondition:** f(a) and f(b) have opposite signs (or one is a root)
///
/// Reference: Brent, R. (1973). "Algorithms for Minimization without Derivatives"
template<ObjectiveFunction F>
RootFindingResult brent_find_root(F&& f, double a, double b,
                                  const RootFindingConfig& config) {
    if (a > b) {
        std::swap(a, b);
    }

    PAYPLAN_TRACE_ROOT_START(1, a, b, config.max_iter);

    double fa = f(a);
    double fb = f(b);

    if (!std::isfinite(fa) || !std::isfinite(fb)) {
        return detail::non_finite_result(0, a, b);
    }

    if (std::abs(fa) <= config.tolerance) {
        PAYPLAN_TRACE_ROOT_COMPLETE(a, 0, 1);
        return RootFindingResult{
            .converged = true, .iterations = 0, .final_error = std::abs(fa),
            .failure_reason = std::nullopt, .root = a,
            .bracket_low = a, .bracket_high = b
        };
    }
    if (std::abs(fb) <= config.tolerance) {
        PAYPLAN_TRACE_ROOT_COMPLETE(b, 0, 1);
        return RootFindingResult{
            .converged = true, .iterations = 0, .final_error = std::abs(fb),
            .failure_reason = std::nullopt, .root = b,
            .bracket_low = a, .bracket_high = b
        };
    }

    if (detail::same_sign(fa, fb)) {
        return RootFindingResult{
            .converged = false,
            .iterations = 0,
            .final_error = std::min(std::abs(fa), std::abs(fb)),
            .failure_reason = "Root not bracketed",
            .root = std::nullopt,
            .bracket_low = a,
            .bracket_high = b
        };
    }

    constexpr double kEps = std::numeric_limits<double>::epsilon();

    // b is the current best estimate, [b, c] always brackets the root,
    // a is the previous b.
    double c = b;
    double fc = fb;
    double d = b - a;
    double e = d;

    for (size_t iter = 0; iter < config.max_iter; ++iter) {
        if (detail::same_sign(fb, fc)) {
            c = a;
            fc = fa;
            d = b - a;
            e = d;
        }
        if (std::abs(fc) < std::abs(fb)) {
            a = b;
            b = c;
            c = a;
            fa = fb;
            fb = fc;
            fc = fa;
        }

        const double tol1 = 2.0 * kEps * std::abs(b) + 0.5 * config.bracket_tol;
        const double xm = 0.5 * (c - b);

        PAYPLAN_TRACE_ROOT_ITER(iter, b, fb, std::abs(c - b));

        if (std::abs(xm) <= tol1 || std::abs(fb) <= config.tolerance) {
            PAYPLAN_TRACE_ROOT_COMPLETE(b, iter + 1, 1);
            return RootFindingResult{
                .converged = true,
                .iterations = iter + 1,
                .final_error = std::abs(fb),
                .failure_reason = std::nullopt,
                .root = b,
                .bracket_low = std::min(b, c),
                .bracket_high = std::max(b, c)
            };
        }

        if (std::abs(e) >= tol1 && std::abs(fa) > std::abs(fb)) {
            const double s = fb / fa;
            double p;
            double q;
            if (a == c) {
                // Secant
                p = 2.0 * xm * s;
                q = 1.0 - s;
            } else {
                // Inverse quadratic interpolation
                const double qa = fa / fc;
                const double rb = fb / fc;
                p = s * (2.0 * xm * qa * (qa - rb) - (b - a) * (rb - 1.0));
                q = (qa - 1.0) * (rb - 1.0) * (s - 1.0);
            }
            if (p > 0.0) {
                q = -q;
            }
            p = std::abs(p);

            const double min1 = 3.0 * xm * q - std::abs(tol1 * q);
            const double min2 = std::abs(e * q);
            if (2.0 * p < std::min(min1, min2)) {
                e = d;
                d = p / q;
            } else {
                d = xm;
                e = d;
            }
        } else {
            d = xm;
            e = d;
        }

        a = b;
        fa = fb;
        b += (std::abs(d) > tol1) ? d : std::copysign(tol1, xm);
        fb = f(b);

        if (!std::isfinite(fb)) {
            PAYPLAN_TRACE_ROOT_COMPLETE(b, iter + 1, 0);
            return detail::non_finite_result(iter + 1, std::min(a, c), std::max(a, c));
        }
    }

    // The last step may have moved b to the same side as c
    const double other = detail::same_sign(fb, fc) ? a : c;

    PAYPLAN_TRACE_ROOT_COMPLETE(b, config.max_iter, 0);
    return RootFindingResult{
        .converged = false,
        .iterations = config.max_iter,
        .final_error = std::abs(fb),
        .failure_reason = "Max iterations reached",
        .root = b,
        .bracket_low = std::min(b, other),
        .bracket_high = std::max(b, other)
    };
}

}  // namespace payplan
