/**
 * @file circuit_breaker_tests.cpp
 * @brief fxgate source file.
 */

#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "fxgate/core/clock.hpp"
#include "fxgate/core/timer_service.hpp"
#include "fxgate/fault/circuit_breaker.hpp"

using namespace std::chrono_literals;

namespace {

fxg::CallContext ctx(const std::string& component, const std::string& operation = "trigger") {
    return fxg::CallContext{component, operation, std::nullopt, ""};
}

int failingCall() { throw std::runtime_error("handler exploded"); }

void failTimes(fxg::CircuitBreaker& breaker, const std::string& component, int count) {
    for (int i = 0; i < count; ++i) {
        const auto result = breaker.execute(ctx(component), failingCall);
        assert(!result);
    }
}

void checkTripAndRecovery() {
    fxg::ManualClock clock;
    fxg::ManualTimerService timers(clock);
    std::vector<fxg::DegradationNotice> notices;
    fxg::CircuitBreaker breaker(timers, {}, [&](const fxg::DegradationNotice& n) { notices.push_back(n); });

    failTimes(breaker, "x", 2);
    assert(!breaker.isComponentDisabled("x"));
    assert(breaker.statsFor("x")->consecutiveErrors == 2U);

    failTimes(breaker, "x", 1);
    assert(breaker.isComponentDisabled("x"));
    assert(breaker.state("x") == fxg::BreakerState::Open);
    assert(notices.size() == 1U && notices[0].level == fxg::NoticeLevel::Warning);
    assert(notices[0].message.find("5 minutes") != std::string::npos);
    assert(timers.pendingTasks() == 1U);

    int invoked = 0;
    const auto skipped = breaker.execute(ctx("x"), [&]() {
        ++invoked;
        return 1;
    });
    assert(!skipped);
    assert(invoked == 0);
    const auto viaFallback = breaker.execute(
        ctx("x"), [&]() { ++invoked; return 1; }, []() { return 7; });
    assert(viaFallback && *viaFallback == 7);
    assert(invoked == 0);
    assert(breaker.statsFor("x")->skippedCalls == 2U);

    // Other components are unaffected.
    assert(breaker.execute(ctx("y"), []() { return 3; }) == 3);

    timers.advance(5min - 1ms);
    assert(breaker.isComponentDisabled("x"));
    timers.advance(1ms);
    assert(!breaker.isComponentDisabled("x"));
    assert(breaker.state("x") == fxg::BreakerState::Closed);
    assert(notices.back().level == fxg::NoticeLevel::Info);

    const auto after = breaker.execute(ctx("x"), [&]() {
        ++invoked;
        return 11;
    });
    assert(after && *after == 11);
    assert(invoked == 1);
    assert(breaker.statsFor("x")->errorCount == 3U);
    assert(breaker.statsFor("x")->consecutiveErrors == 0U);
}

void checkStreakRules() {
    fxg::ManualClock clock;
    fxg::ManualTimerService timers(clock);
    fxg::CircuitBreaker breaker(timers);

    // Success resets the streak.
    failTimes(breaker, "a", 2);
    assert(breaker.execute(ctx("a"), []() { return true; }));
    assert(breaker.statsFor("a")->consecutiveErrors == 0U);
    failTimes(breaker, "a", 2);
    assert(!breaker.isComponentDisabled("a"));

    // A gap longer than the reset window restarts the streak at one.
    failTimes(breaker, "b", 2);
    clock.advance(61s);
    failTimes(breaker, "b", 1);
    assert(breaker.statsFor("b")->consecutiveErrors == 1U);
    assert(breaker.statsFor("b")->errorCount == 3U);
    assert(!breaker.isComponentDisabled("b"));

    // Within the window failures accumulate.
    clock.advance(59s);
    failTimes(breaker, "b", 1);
    clock.advance(59s);
    failTimes(breaker, "b", 1);
    assert(breaker.isComponentDisabled("b"));
}

void checkStaleTimersAndManualControl() {
    fxg::ManualClock clock;
    fxg::ManualTimerService timers(clock);
    std::vector<fxg::DegradationNotice> notices;
    fxg::CircuitBreaker breaker(timers, {}, [&](const fxg::DegradationNotice& n) { notices.push_back(n); });

    failTimes(breaker, "x", 3);
    assert(timers.pendingTasks() == 1U);
    breaker.enableComponent("x");
    assert(!breaker.isComponentDisabled("x"));
    assert(timers.pendingTasks() == 0U);

    // Re-trip, then a manual enable races the timer: the old timer must not
    // re-enable the new trip early.
    failTimes(breaker, "x", 3);
    timers.advance(2min);
    breaker.enableComponent("x");
    failTimes(breaker, "x", 3);
    timers.advance(3min);
    assert(breaker.isComponentDisabled("x"));
    timers.advance(2min);
    assert(!breaker.isComponentDisabled("x"));

    // Enabling something that is not disabled is a no-op.
    const auto noticeCount = notices.size();
    breaker.enableComponent("never-failed");
    assert(notices.size() == noticeCount);

    // Manual disable has no timer and still vetoes calls.
    breaker.disableComponent("manual");
    assert(timers.pendingTasks() == 0U);
    int invoked = 0;
    assert(!breaker.execute(ctx("manual"), [&]() { return ++invoked; }));
    timers.advance(1h);
    assert(breaker.isComponentDisabled("manual"));
    assert(invoked == 0);
    breaker.enableComponent("manual");
    assert(breaker.execute(ctx("manual"), [&]() { return ++invoked; }) == 1);

    // Critical trips wait for an operator.
    breaker.trip("jumpscare", fxg::ErrorSeverity::Critical);
    assert(notices.back().level == fxg::NoticeLevel::Error);
    assert(notices.back().message.find("Jumpscare popups") == 0U);
    assert(timers.pendingTasks() == 0U);
    timers.advance(1h);
    assert(breaker.isComponentDisabled("jumpscare"));

    breaker.trip("timeDilation", fxg::ErrorSeverity::High);
    assert(timers.pendingTasks() == 1U);
    assert(breaker.disabledComponents() == (std::vector<std::string>{"jumpscare", "timeDilation"}));

    breaker.resetAllStats();
    assert(breaker.disabledComponents().empty());
    assert(breaker.errorStats().empty());
    assert(timers.pendingTasks() == 0U);
    assert(breaker.errorReport().find("No errors recorded.") != std::string::npos);
}

void checkManualOverridesPendingRecovery() {
    fxg::ManualClock clock;
    fxg::ManualTimerService timers(clock);
    fxg::CircuitBreaker breaker(timers);

    // An operator disable after an automatic trip drops the recovery timer.
    failTimes(breaker, "x", 3);
    assert(timers.pendingTasks() == 1U);
    breaker.disableComponent("x");
    assert(timers.pendingTasks() == 0U);
    timers.advance(5min);
    assert(breaker.isComponentDisabled("x"));
    timers.advance(1h);
    assert(breaker.isComponentDisabled("x"));

    // Escalating an automatic trip to Critical keeps it disabled as well.
    failTimes(breaker, "y", 3);
    assert(timers.pendingTasks() == 1U);
    breaker.trip("y", fxg::ErrorSeverity::Critical);
    assert(timers.pendingTasks() == 0U);
    timers.advance(5min);
    assert(breaker.isComponentDisabled("y"));

    // A non-critical trip on a disabled component changes nothing.
    failTimes(breaker, "z", 3);
    breaker.trip("z", fxg::ErrorSeverity::High);
    assert(timers.pendingTasks() == 1U);
    timers.advance(5min);
    assert(!breaker.isComponentDisabled("z"));

    breaker.enableComponent("x");
    breaker.enableComponent("y");
    assert(breaker.disabledComponents().empty());
}

void checkFallbackFailures() {
    fxg::ManualClock clock;
    fxg::ManualTimerService timers(clock);
    fxg::CircuitBreaker breaker(timers);

    const auto result = breaker.execute(ctx("fx"), failingCall, []() -> int { throw std::runtime_error("fallback broke"); });
    assert(!result);
    const auto stats = breaker.statsFor("fx");
    assert(stats->errorCount == 1U);
    assert(stats->consecutiveErrors == 1U);
    assert(stats->fallbackFailures == 1U);

    // Fallback failures while open do not count toward tripping again.
    failTimes(breaker, "fx", 2);
    assert(breaker.isComponentDisabled("fx"));
    for (int i = 0; i < 5; ++i) {
        breaker.execute(ctx("fx"), failingCall, []() -> int { throw std::runtime_error("still broken"); });
    }
    assert(breaker.statsFor("fx")->errorCount == 3U);
    assert(breaker.statsFor("fx")->fallbackFailures == 6U);

    // Non-standard exceptions are failures too.
    breaker.execute(ctx("odd"), []() -> int { throw 42; });
    assert(breaker.statsFor("odd")->errorCount == 1U);

    const auto report = breaker.errorReport();
    assert(report.find("fx [DISABLED]") != std::string::npos);
    assert(report.find("Fallback Failures: 6") != std::string::npos);
}

void checkHalfOpenProbe() {
    fxg::ManualClock clock;
    fxg::ManualTimerService timers(clock);
    fxg::CircuitBreakerOptions options;
    options.probeAfterRecovery = true;
    options.recoveryDelay = 10s;
    fxg::CircuitBreaker breaker(timers, options);

    failTimes(breaker, "p", 3);
    timers.advance(10s);
    assert(breaker.state("p") == fxg::BreakerState::HalfOpen);
    failTimes(breaker, "p", 1);
    assert(breaker.state("p") == fxg::BreakerState::Open);

    timers.advance(10s);
    assert(breaker.state("p") == fxg::BreakerState::HalfOpen);
    assert(breaker.execute(ctx("p"), []() { return 1; }));
    assert(breaker.state("p") == fxg::BreakerState::Closed);
    failTimes(breaker, "p", 1);
    assert(breaker.state("p") == fxg::BreakerState::Closed);
}

void checkAsyncTimeout() {
    fxg::ThreadTimerService timers;
    fxg::CircuitBreakerOptions options;
    options.callTimeout = 50ms;
    fxg::CircuitBreaker breaker(timers, options);

    const auto quick = breaker.executeAsync(ctx("async"), []() { return 5; });
    assert(quick && *quick == 5);

    auto release = std::make_shared<std::atomic<bool>>(false);
    const auto hung = breaker.executeAsync(ctx("async"), [release]() {
        while (!release->load()) {
            std::this_thread::sleep_for(1ms);
        }
        return 6;
    }, []() { return -1; });
    assert(hung && *hung == -1);
    assert(breaker.statsFor("async")->errorCount == 1U);

    const auto thrown = breaker.executeAsync(ctx("async"), []() -> int { throw std::runtime_error("async failure"); });
    assert(!thrown);
    assert(breaker.statsFor("async")->consecutiveErrors == 2U);
    release->store(true);
}

} // namespace

int main() {
    checkTripAndRecovery();
    checkStreakRules();
    checkStaleTimersAndManualControl();
    checkManualOverridesPendingRecovery();
    checkFallbackFailures();
    checkHalfOpenProbe();
    checkAsyncTimeout();

    assert(std::string(fxg::toString(fxg::BreakerState::HalfOpen)) == "HalfOpen");
    assert(fxg::CircuitBreaker::friendlyName("unknownThing") == "unknownThing");

    std::cout << "circuit_breaker_tests passed\n";
    return 0;
}
