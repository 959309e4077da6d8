// SPDX-License-Identifier: MIT
/**
 * @file payplan_trace.h
 * @brief USDT (User Statically-Defined Tracing) probes for the payplan library
 *
 * Probes compile to nothing unless HAVE_SYSTEMTAP_SDT is defined. With it,
 * each probe is a single NOP that bpftrace, systemtap or perf can attach to
 * at runtime without rebuilding the binary.
 *
 * Example usage with bpftrace:
 *   # Watch the rate solver converge
 *   sudo bpftrace -e 'usdt:./payplan:payplan:root_iter { printf("%d %f\n", arg0, arg1); }'
 *
 *   # Report every validation failure
 *   sudo bpftrace -e 'usdt:./payplan:payplan:validation_error { ... }'
 */

#ifndef PAYPLAN_TRACE_H
#define PAYPLAN_TRACE_H

#include <stddef.h>

#ifdef HAVE_SYSTEMTAP_SDT
#include <sys/sdt.h>
#else
#define DTRACE_PROBE(provider, probe) do {} while(0)
#define DTRACE_PROBE1(provider, probe, arg1) do {} while(0)
#define DTRACE_PROBE2(provider, probe, arg1, arg2) do {} while(0)
#define DTRACE_PROBE3(provider, probe, arg1, arg2, arg3) do {} while(0)
#define DTRACE_PROBE4(provider, probe, arg1, arg2, arg3, arg4) do {} while(0)
#define DTRACE_PROBE5(provider, probe, arg1, arg2, arg3, arg4, arg5) do {} while(0)
#endif

/**
 * Provider name for all payplan probes
 */
#define PAYPLAN_PROVIDER payplan

/**
 * Module identifiers, passed as the first argument of the generic probes
 */
#define PAYPLAN_MODULE_AMORTIZATION   2
#define PAYPLAN_MODULE_RATE_SOLVER    3
#define PAYPLAN_MODULE_ANALYZER       4
#define PAYPLAN_MODULE_BATCH          5
#define PAYPLAN_MODULE_CONFIG         6
#define PAYPLAN_MODULE_VALIDATION     7

/**
 * ============================================================================
 * Algorithm Lifecycle Probes
 * ============================================================================
 */

/**
 * Fired when an algorithm begins execution
 * @param module_id: Module identifier (PAYPLAN_MODULE_* constant)
 * @param param1: Module-specific parameter (e.g., max_iter, num_periods)
 * @param param2: Module-specific parameter (e.g., tolerance, principal)
 * @param param3: Module-specific parameter
 */
#define PAYPLAN_TRACE_ALGO_START(module_id, param1, param2, param3) \
    DTRACE_PROBE4(PAYPLAN_PROVIDER, algo_start, module_id, param1, param2, param3)

/**
 * Fired when an algorithm completes successfully
 * @param module_id: Module identifier
 * @param iterations: Iterations or periods completed
 * @param final_metric: Final metric (root, residual balance, ...)
 */
#define PAYPLAN_TRACE_ALGO_COMPLETE(module_id, iterations, final_metric) \
    DTRACE_PROBE3(PAYPLAN_PROVIDER, algo_complete, module_id, iterations, final_metric)

/**
 * ============================================================================
 * Convergence Probes
 * ============================================================================
 */

/**
 * Fired when an iterative method gives up
 * @param module_id: Module identifier
 * @param iterations: Iterations attempted
 * @param final_error: Residual at failure
 */
#define PAYPLAN_TRACE_CONVERGENCE_FAILED(module_id, iterations, final_error) \
    DTRACE_PROBE3(PAYPLAN_PROVIDER, convergence_failed, module_id, iterations, final_error)

/**
 * ============================================================================
 * Validation and Error Probes
 * ============================================================================
 */

/**
 * Fired when input validation fails
 * @param module_id: Module identifier
 * @param error_code: PlanErrorCode or ConfigErrorCode as int
 * @param param1: Offending value
 * @param param2: Related value or threshold
 */
#define PAYPLAN_TRACE_VALIDATION_ERROR(module_id, error_code, param1, param2) \
    DTRACE_PROBE4(PAYPLAN_PROVIDER, validation_error, module_id, error_code, param1, param2)

/**
 * ============================================================================
 * Module-Specific Probes: Root Finding
 * ============================================================================
 */

/**
 * Fired when a bracketed root finder starts
 * @param method: 0 = bisection, 1 = Brent
 * @param a, b: Initial bracket
 * @param max_iter: Iteration cap
 */
#define PAYPLAN_TRACE_ROOT_START(method, a, b, max_iter) \
    DTRACE_PROBE4(PAYPLAN_PROVIDER, root_start, method, a, b, max_iter)

/**
 * Fired on each root finder iteration
 * @param iter: Iteration number
 * @param x: Current estimate
 * @param fx: f(x)
 * @param width: Current bracket width
 */
#define PAYPLAN_TRACE_ROOT_ITER(iter, x, fx, width) \
    DTRACE_PROBE4(PAYPLAN_PROVIDER, root_iter, iter, x, fx, width)

/**
 * Fired when a root finder returns
 * @param root: Final estimate
 * @param iterations: Iterations used
 * @param converged: 1 if converged, 0 otherwise
 */
#define PAYPLAN_TRACE_ROOT_COMPLETE(root, iterations, converged) \
    DTRACE_PROBE3(PAYPLAN_PROVIDER, root_complete, root, iterations, converged)

/**
 * ============================================================================
 * Module-Specific Probes: Comparative Analyzer
 * ============================================================================
 */

/**
 * Fired when the crossover scan finishes
 * @param last_favorable: Last period with fee <= regular interest (0 if none)
 * @param unfavorable: Number of periods after it that are unfavorable
 * @param remaining: Balance remaining after the last favorable period
 */
#define PAYPLAN_TRACE_CROSSOVER(last_favorable, unfavorable, remaining) \
    DTRACE_PROBE3(PAYPLAN_PROVIDER, crossover, last_favorable, unfavorable, remaining)

#endif // PAYPLAN_TRACE_H
