/**
 * @file runtime_options.cpp
 * @brief fxgate source file.
 */

#include "fxgate/config/runtime_options.hpp"

#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <string>
#include <type_traits>

namespace fxg {
namespace {

bool parseBoolEnv(const char* name, bool defaultValue) {
    const char* value = std::getenv(name);
    if (value == nullptr) {
        return defaultValue;
    }
    const std::string text(value);
    if (text == "1" || text == "true" || text == "TRUE" || text == "on" || text == "ON") {
        return true;
    }
    if (text == "0" || text == "false" || text == "FALSE" || text == "off" || text == "OFF") {
        return false;
    }
    std::cerr << "[fxg-config] ignoring " << name << "=" << text << " (expected a boolean)\n";
    return defaultValue;
}

/// Non-negative integer within T; `minimum` rejects values such as a zero capacity.
template <typename T>
T parseIntegralEnv(const char* name, T defaultValue, T minimum = T{0}) {
    const char* value = std::getenv(name);
    if (value == nullptr) {
        return defaultValue;
    }
    try {
        std::size_t consumed = 0;
        const auto parsed = std::stoll(value, &consumed, 0);
        if (consumed != std::string(value).size() || parsed < static_cast<long long>(minimum)) {
            throw std::out_of_range("below minimum or trailing characters");
        }
        if (static_cast<unsigned long long>(parsed) >
            static_cast<unsigned long long>(std::numeric_limits<T>::max())) {
            throw std::out_of_range("exceeds the range of the setting");
        }
        return static_cast<T>(parsed);
    } catch (const std::exception& ex) {
        std::cerr << "[fxg-config] ignoring " << name << "=" << value << " (" << ex.what() << ")\n";
        return defaultValue;
    }
}

std::chrono::milliseconds parseMsEnv(const char* name, std::chrono::milliseconds defaultValue,
                                     std::int64_t minimum = 0) {
    return std::chrono::milliseconds(parseIntegralEnv<std::int64_t>(name, defaultValue.count(), minimum));
}

} // namespace

RuntimeOptions RuntimeOptions::defaults() {
    RuntimeOptions options;
    options.assetCache.name = "assets";
    return options;
}

RuntimeOptions RuntimeOptions::fromEnvironment() { return fromEnvironment(defaults()); }

RuntimeOptions RuntimeOptions::fromEnvironment(RuntimeOptions base) {
    auto& breaker = base.breaker;
    breaker.failureThreshold =
        parseIntegralEnv<std::uint32_t>("FXGATE_BREAKER_THRESHOLD", breaker.failureThreshold, 1U);
    breaker.errorResetWindow = parseMsEnv("FXGATE_BREAKER_RESET_WINDOW_MS", breaker.errorResetWindow, 1);
    breaker.recoveryDelay = parseMsEnv("FXGATE_BREAKER_RECOVERY_MS", breaker.recoveryDelay, 1);
    breaker.callTimeout = parseMsEnv("FXGATE_BREAKER_CALL_TIMEOUT_MS", breaker.callTimeout, 1);
    breaker.probeAfterRecovery = parseBoolEnv("FXGATE_BREAKER_PROBE", breaker.probeAfterRecovery);

    auto& cache = base.assetCache;
    cache.capacity = parseIntegralEnv<std::size_t>("FXGATE_CACHE_CAPACITY", cache.capacity, 1U);
    cache.ttl = parseMsEnv("FXGATE_CACHE_TTL_MS", cache.ttl, 1);
    cache.sweepInterval = parseMsEnv("FXGATE_CACHE_SWEEP_MS", cache.sweepInterval);

    auto& scheduler = base.scheduler;
    scheduler.minDelay = parseMsEnv("FXGATE_SCHEDULER_MIN_DELAY_MS", scheduler.minDelay);
    scheduler.maxDelay = parseMsEnv("FXGATE_SCHEDULER_MAX_DELAY_MS", scheduler.maxDelay);
    if (scheduler.maxDelay < scheduler.minDelay) {
        std::cerr << "[fxg-config] scheduler max delay below min delay, using min delay for both\n";
        scheduler.maxDelay = scheduler.minDelay;
    }
    scheduler.maxEventsPerSession =
        parseIntegralEnv<std::uint32_t>("FXGATE_SCHEDULER_MAX_EVENTS", scheduler.maxEventsPerSession);
    scheduler.enabled = parseBoolEnv("FXGATE_SCHEDULER_ENABLED", scheduler.enabled);
    return base;
}

} // namespace fxg
