/**
 * @file breaker_recovery_demo.cpp
 * @brief fxgate source file.
 */

#include <chrono>
#include <iostream>
#include <stdexcept>

#include "fxgate/core/clock.hpp"
#include "fxgate/core/timer_service.hpp"
#include "fxgate/fault/circuit_breaker.hpp"

using namespace std::chrono_literals;

int main() {
    // Deterministic time so the whole trip/recover cycle prints instantly.
    fxg::ManualClock clock;
    fxg::ManualTimerService timers(clock);
    fxg::CircuitBreakerOptions options;
    options.probeAfterRecovery = true;
    fxg::CircuitBreaker breaker(timers, options, [](const fxg::DegradationNotice& notice) {
        std::cout << "[notice] " << notice.message << '\n';
    });

    const fxg::CallContext context{"entityPresence", "spawn", 75.0, "demo"};
    bool healthy = false;
    const auto spawn = [&]() {
        if (!healthy) {
            throw std::runtime_error("renderer unavailable");
        }
        return 1;
    };
    const auto report = [&](const char* label) {
        std::cout << label << ": state=" << fxg::toString(breaker.state(context.component));
        if (const auto stats = breaker.statsFor(context.component)) {
            std::cout << " errors=" << stats->errorCount << " consecutive=" << stats->consecutiveErrors
                      << " skipped=" << stats->skippedCalls;
        }
        std::cout << '\n';
    };

    for (int i = 0; i < 4; ++i) {
        (void)breaker.execute(context, spawn, []() { return 0; });
        report("after call");
    }

    timers.advance(5min);
    report("after recovery window");

    // First call after recovery is a probe; a failure re-opens at once.
    (void)breaker.execute(context, spawn);
    report("after failed probe");

    healthy = true;
    timers.advance(5min);
    (void)breaker.execute(context, spawn);
    report("after successful probe");

    std::cout << '\n' << breaker.errorReport();
    return 0;
}
