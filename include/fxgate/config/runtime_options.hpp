#pragma once

#include "fxgate/cache/cache_statistics.hpp"
#include "fxgate/fault/circuit_breaker.hpp"
#include "fxgate/scheduling/event_scheduler.hpp"

namespace fxg {

/**
 * @brief Tunables for one engine deployment.
 *
 * Environment overrides (absent or malformed values keep the default):
 *  - FXGATE_BREAKER_THRESHOLD, FXGATE_BREAKER_RESET_WINDOW_MS,
 *    FXGATE_BREAKER_RECOVERY_MS, FXGATE_BREAKER_CALL_TIMEOUT_MS,
 *    FXGATE_BREAKER_PROBE
 *  - FXGATE_CACHE_CAPACITY, FXGATE_CACHE_TTL_MS, FXGATE_CACHE_SWEEP_MS
 *  - FXGATE_SCHEDULER_MIN_DELAY_MS, FXGATE_SCHEDULER_MAX_DELAY_MS,
 *    FXGATE_SCHEDULER_MAX_EVENTS, FXGATE_SCHEDULER_ENABLED
 */
struct RuntimeOptions {
    CircuitBreakerOptions breaker;
    CacheOptions assetCache;
    SchedulerOptions scheduler;

    static RuntimeOptions defaults();
    static RuntimeOptions fromEnvironment();
    /**
     * @brief Apply environment overrides on top of `base`.
     */
    static RuntimeOptions fromEnvironment(RuntimeOptions base);
};

} // namespace fxg
