// SPDX-License-Identifier: MIT
/**
 * @file spendcalc_trace.h
 * @brief USDT (User Statically-Defined Tracing) probes for spendcalc
 *
 * Zero-overhead tracing points that can be enabled at runtime with
 * bpftrace, systemtap or perf. When no tracer is attached, each probe is a
 * single NOP instruction.
 *
 * Example usage with bpftrace:
 *   # Watch every rejected pricing input
 *   sudo bpftrace -e 'usdt:./lib*.so:spendcalc:validation_error { ... }'
 *
 *   # Flex quotes with their spend and cost
 *   sudo bpftrace -e 'usdt:./lib*.so:spendcalc:flex_price {
 *       printf("spend=%ld cost=%ld\n", arg0, arg1); }'
 */

#ifndef SPENDCALC_TRACE_H
#define SPENDCALC_TRACE_H

#include <stddef.h>

/**
 * USDT Configuration
 *
 * On Linux with systemtap-sdt-dev installed, use sys/sdt.h
 * Otherwise, define no-op macros for compatibility
 */
#ifdef HAVE_SYSTEMTAP_SDT
#include <sys/sdt.h>
#else
#define DTRACE_PROBE(provider, probe) do {} while(0)
#define DTRACE_PROBE1(provider, probe, arg1) do {} while(0)
#define DTRACE_PROBE2(provider, probe, arg1, arg2) do {} while(0)
#define DTRACE_PROBE3(provider, probe, arg1, arg2, arg3) do {} while(0)
#define DTRACE_PROBE4(provider, probe, arg1, arg2, arg3, arg4) do {} while(0)
#endif

/**
 * Provider name for all spendcalc probes
 */
#define SPENDCALC_PROVIDER spendcalc

/**
 * Module identifiers, passed as the first parameter to generic probes
 */
#define MODULE_TIER_TABLE       1
#define MODULE_FLEX_PRICE       2
#define MODULE_COMMIT_PRICE     3
#define MODULE_RECOMMEND        4
#define MODULE_PRICE_QUOTE      5
#define MODULE_PRICING_CONFIG   6

/**
 * ============================================================================
 * Algorithm Lifecycle Probes
 * ============================================================================
 */

/**
 * Fired when an algorithm begins execution
 * @param module_id: Module identifier (MODULE_* constant)
 * @param param1: Module-specific parameter (e.g., tier count, batch size)
 * @param param2: Module-specific parameter
 */
#define SPENDCALC_TRACE_ALGO_START(module_id, param1, param2) \
    DTRACE_PROBE3(SPENDCALC_PROVIDER, algo_start, module_id, param1, param2)

/**
 * Fired when an algorithm completes
 * @param module_id: Module identifier
 * @param count: Items processed (tiers validated, quotes priced)
 * @param failures: Items rejected
 */
#define SPENDCALC_TRACE_ALGO_COMPLETE(module_id, count, failures) \
    DTRACE_PROBE3(SPENDCALC_PROVIDER, algo_complete, module_id, count, failures)

/**
 * ============================================================================
 * Error Probes
 * ============================================================================
 */

/**
 * Fired when a per-call input is rejected
 * @param module_id: Module identifier
 * @param error_code: ArgumentErrorCode value
 * @param value: Rejected input
 */
#define SPENDCALC_TRACE_VALIDATION_ERROR(module_id, error_code, value) \
    DTRACE_PROBE3(SPENDCALC_PROVIDER, validation_error, module_id, error_code, value)

/**
 * Fired when the tier table or pricing config is rejected at startup
 * @param module_id: Module identifier
 * @param error_code: ConfigErrorCode value
 * @param index: Offending tier index (0 if not tier-specific)
 */
#define SPENDCALC_TRACE_CONFIG_ERROR(module_id, error_code, index) \
    DTRACE_PROBE3(SPENDCALC_PROVIDER, config_error, module_id, error_code, index)

/**
 * ============================================================================
 * Pricing Probes
 * ============================================================================
 */

/**
 * Fired when a flex price is computed
 * @param spend: Monthly spend
 * @param cost: Returned cost (after the minimum invoice floor)
 * @param tiers_used: Number of tiers the spend was spread across
 * @param floored: 1 if the minimum invoice floor applied
 */
#define SPENDCALC_TRACE_FLEX_PRICE(spend, cost, tiers_used, floored) \
    DTRACE_PROBE4(SPENDCALC_PROVIDER, flex_price, spend, cost, tiers_used, floored)

/**
 * Fired when spend exceeds the reach of the tier table
 * @param spend: Monthly spend
 * @param unbilled: Spend left after the last tier
 */
#define SPENDCALC_TRACE_UNBILLED_SPEND(spend, unbilled) \
    DTRACE_PROBE2(SPENDCALC_PROVIDER, unbilled_spend, spend, unbilled)

/**
 * Fired when a commit price is computed
 * @param spend: Monthly spend
 * @param commit_amount: Committed spend
 * @param tier_index: Index of the tier whose rate the commitment used
 * @param cost: Committed plus overflow cost
 */
#define SPENDCALC_TRACE_COMMIT_PRICE(spend, commit_amount, tier_index, cost) \
    DTRACE_PROBE4(SPENDCALC_PROVIDER, commit_price, spend, commit_amount, tier_index, cost)

/**
 * Fired when a commit tier is recommended
 * @param spend: Monthly spend
 * @param tier_index: Index of the tier containing spend
 * @param recommended: Recommended commitment (a tier upper bound)
 */
#define SPENDCALC_TRACE_RECOMMEND(spend, tier_index, recommended) \
    DTRACE_PROBE3(SPENDCALC_PROVIDER, recommend, spend, tier_index, recommended)

#endif // SPENDCALC_TRACE_H
