/**
 * @file engine_and_dispatch_tests.cpp
 * @brief fxgate source file.
 */

#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "fxgate/core/clock.hpp"
#include "fxgate/core/timer_service.hpp"
#include "fxgate/effects/effect_dispatcher.hpp"
#include "fxgate/effects/mock_effect_manager.hpp"
#include "fxgate/fault/circuit_breaker.hpp"
#include "fxgate/fault/effect_lock.hpp"
#include "fxgate/scheduling/random_event_engine.hpp"
#include "fxgate/scheduling/random_source.hpp"

using namespace std::chrono_literals;

namespace {

void checkEffectLock() {
    fxg::ManualClock clock;
    fxg::EffectLock lock(clock);

    const auto first = lock.tryAcquire(2s);
    assert(first);
    assert(lock.isHeld());
    assert(!lock.tryAcquire());

    // A stale ticket cannot release a newer holder.
    assert(lock.release(*first));
    assert(!lock.release(*first));
    const auto second = lock.tryAcquire();
    assert(second && *second != *first);
    assert(!lock.release(*first));
    assert(lock.isHeld());

    // Holds expire on their own, capped at the maximum.
    lock.forceRelease();
    const auto greedy = lock.tryAcquire(1h);
    assert(greedy);
    clock.advance(fxg::EffectLock::kMaxHold - 1ms);
    assert(lock.isHeld());
    clock.advance(1ms);
    assert(!lock.isHeld());
    assert(lock.tryAcquire());
    lock.forceRelease();

    // Guards release on every exit path.
    {
        fxg::EffectLock::Guard guard(lock);
        assert(guard.owns());
        fxg::EffectLock::Guard contender(lock);
        assert(!contender);
    }
    assert(!lock.isHeld());

    bool threw = false;
    try {
        fxg::EffectLock::Guard guard(lock);
        assert(lock.isHeld());
        throw std::runtime_error("effect blew up");
    } catch (const std::runtime_error&) {
        threw = true;
    }
    assert(threw);
    assert(!lock.isHeld());
    assert(lock.acquisitions() == 6U);
}

void checkDispatcher() {
    fxg::ManualClock clock;
    fxg::ManualTimerService timers(clock);
    std::vector<fxg::DegradationNotice> notices;
    fxg::CircuitBreaker breaker(timers, {}, [&](const fxg::DegradationNotice& n) { notices.push_back(n); });
    fxg::EffectLock lock(clock);
    fxg::EffectDispatcher dispatcher(breaker, lock);
    fxg::MockEffectManager jumpscares("jumpscare");
    fxg::MockEffectManager distortion("screenDistortion");

    assert(!dispatcher.bind(fxg::EventType::Jumpscare, "", jumpscares, jumpscares));
    assert(dispatcher.bind(fxg::EventType::Jumpscare, "jumpscare", jumpscares, jumpscares));
    assert(dispatcher.bind(fxg::EventType::ScreenShake, "screenDistortion", distortion, distortion));
    assert(dispatcher.bind(fxg::EventType::Glitch, "screenDistortion", distortion, distortion));
    assert(dispatcher.componentFor(fxg::EventType::Glitch) == std::string("screenDistortion"));
    assert(!dispatcher.isBound(fxg::EventType::Whisper));

    const fxg::EffectRequest request{fxg::EventType::Jumpscare, 80.0, std::string("face")};
    assert(dispatcher.dispatch(request) == fxg::DispatchOutcome::Fired);
    assert(jumpscares.successfulTriggers() == 1U);
    assert(jumpscares.lastRequest()->variant == std::string("face"));
    assert(!lock.isHeld());

    assert(dispatcher.dispatch({fxg::EventType::Whisper, 10.0, std::nullopt}) == fxg::DispatchOutcome::Unbound);

    // A disabled manager is not called at all.
    jumpscares.disable();
    assert(dispatcher.dispatch(request) == fxg::DispatchOutcome::ManagerDisabled);
    assert(jumpscares.triggerAttempts() == 1U);
    jumpscares.enable();

    // Another effect holding the lock blocks the dispatch.
    {
        fxg::EffectLock::Guard busy(lock);
        assert(dispatcher.dispatch(request) == fxg::DispatchOutcome::LockBusy);
    }

    // Throwing and rejecting triggers both count toward the breaker; the
    // component is shared by every type bound to it.
    distortion.injectFailures(2);
    assert(dispatcher.dispatch({fxg::EventType::ScreenShake, 50.0, std::nullopt}) == fxg::DispatchOutcome::Failed);
    assert(dispatcher.dispatch({fxg::EventType::Glitch, 50.0, std::nullopt}) == fxg::DispatchOutcome::Failed);
    distortion.setRejectRequests(true);
    assert(dispatcher.dispatch({fxg::EventType::Glitch, 50.0, std::nullopt}) == fxg::DispatchOutcome::Failed);
    assert(breaker.isComponentDisabled("screenDistortion"));
    assert(notices.back().message.find("Screen distortion effects") == 0U);

    distortion.setRejectRequests(false);
    const auto attempts = distortion.triggerAttempts();
    assert(dispatcher.dispatch({fxg::EventType::ScreenShake, 50.0, std::nullopt}) == fxg::DispatchOutcome::BreakerOpen);
    assert(distortion.triggerAttempts() == attempts);
    assert(dispatcher.dispatch(request) == fxg::DispatchOutcome::Fired);

    timers.advance(5min);
    assert(dispatcher.dispatch({fxg::EventType::ScreenShake, 50.0, std::nullopt}) == fxg::DispatchOutcome::Fired);

    assert(dispatcher.unbind(fxg::EventType::Glitch));
    assert(dispatcher.dispatch({fxg::EventType::Glitch, 50.0, std::nullopt}) == fxg::DispatchOutcome::Unbound);
    assert(std::string(fxg::toString(fxg::DispatchOutcome::BreakerOpen)) == "BreakerOpen");
}

void checkAsyncDispatch() {
    fxg::ThreadTimerService timers;
    fxg::CircuitBreakerOptions options;
    options.callTimeout = 40ms;
    fxg::CircuitBreaker breaker(timers, options);
    fxg::EffectLock lock(timers.clock());
    fxg::DispatchOptions dispatchOptions;
    dispatchOptions.async = true;
    dispatchOptions.hold = 2s;
    fxg::EffectDispatcher dispatcher(breaker, lock, dispatchOptions);
    fxg::MockEffectManager slow("phantomTyping");
    dispatcher.bind(fxg::EventType::PhantomTyping, "phantomTyping", slow, slow);

    assert(dispatcher.dispatch({fxg::EventType::PhantomTyping, 30.0, std::nullopt}) == fxg::DispatchOutcome::Fired);

    slow.setTriggerDelay(200ms);
    const auto started = std::chrono::steady_clock::now();
    assert(dispatcher.dispatch({fxg::EventType::PhantomTyping, 30.0, std::nullopt}) == fxg::DispatchOutcome::Failed);
    assert(std::chrono::steady_clock::now() - started < 150ms);
    assert(breaker.statsFor("phantomTyping")->errorCount == 1U);
    std::this_thread::sleep_for(250ms);

    // An async call into an already open component is a skip, not a failure.
    slow.setTriggerDelay(0ms);
    breaker.trip("phantomTyping", fxg::ErrorSeverity::High);
    const auto attempts = slow.triggerAttempts();
    assert(dispatcher.dispatch({fxg::EventType::PhantomTyping, 30.0, std::nullopt}) ==
           fxg::DispatchOutcome::BreakerOpen);
    assert(slow.triggerAttempts() == attempts);
    breaker.enableComponent("phantomTyping");

    // Once closed again, an async rejection is reported as a failure.
    slow.setRejectRequests(true);
    assert(dispatcher.dispatch({fxg::EventType::PhantomTyping, 30.0, std::nullopt}) == fxg::DispatchOutcome::Failed);
    slow.setRejectRequests(false);
    assert(dispatcher.dispatch({fxg::EventType::PhantomTyping, 30.0, std::nullopt}) == fxg::DispatchOutcome::Fired);
}

void checkEngineDriverApi() {
    fxg::ManualClock clock;
    fxg::ScriptedRandomSource random({0.0});
    fxg::RandomEventEngine engine(clock, random);

    const auto selected = engine.selectEvent(50.0);
    assert(selected == fxg::EventType::Jumpscare);
    assert(engine.history().empty());

    engine.recordEvent(fxg::EventType::Jumpscare, 50.0, "door");
    clock.advance(1s);
    engine.recordEvent(fxg::EventType::Glitch, 70.0);
    clock.advance(2s);

    const auto stats = engine.sessionStats();
    assert(stats.duration == 3s);
    assert(stats.totalEvents == 2U);
    assert(stats.perTypeCounts.at(fxg::EventType::Jumpscare) == 1U);
    assert(stats.perTypeCounts.at(fxg::EventType::Glitch) == 1U);
    assert(stats.averageIntensity == 60.0);

    assert(engine.isOnCooldown(fxg::EventType::Jumpscare));
    assert(engine.remainingCooldown(fxg::EventType::Jumpscare) == 297s);
    assert(engine.recentEvents(1).front().type == fxg::EventType::Glitch);

    // Jumpscare cooling down: the first draw now lands on the next candidate.
    assert(engine.selectEvent(50.0) == fxg::EventType::ScreenShake);

    engine.resetSession();
    assert(engine.history().empty());
    assert(engine.sessionStats().totalEvents == 0U);
    assert(engine.sessionStats().perTypeCounts.empty());
    assert(!engine.isOnCooldown(fxg::EventType::Jumpscare));
    assert(engine.catalog().size() == fxg::EventCatalog::defaults().size());

    assert(engine.setEventEnabled(fxg::EventType::Jumpscare, false));
    assert(engine.calculateProbability(fxg::EventType::Jumpscare, 100.0) == 0.0);
    assert(!engine.setEventEnabled(fxg::EventType::EasterEgg, true));

    std::string error;
    fxg::EventTypeConfigUpdate update;
    update.baseChance = 0.9;
    assert(engine.updateEventConfig(fxg::EventType::Glitch, update, error));
    assert(engine.catalog().find(fxg::EventType::Glitch)->baseChance == 0.9);
    update.baseChance = -0.1;
    assert(!engine.updateEventConfig(fxg::EventType::Glitch, update, error));
    assert(error.find("Catalog invalid") == 0U);
    assert(engine.catalog().find(fxg::EventType::Glitch)->baseChance == 0.9);
    assert(!engine.updateEventConfig(fxg::EventType::EasterEgg, update, error));

    for (const auto type : engine.catalog().types()) {
        engine.setEventEnabled(type, false);
    }
    for (int i = 0; i < 20; ++i) {
        assert(!engine.selectEvent(100.0));
    }

    bool threw = false;
    try {
        fxg::RandomEventEngine invalid(clock, random, fxg::EventCatalog{});
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);
}

void checkAtomicTrigger() {
    fxg::ManualClock clock;
    fxg::SecureRandomSource random;
    fxg::EventTypeConfig only;
    only.baseChance = 1.0;
    only.cooldownSeconds = 60.0;
    fxg::EventCatalog catalog;
    catalog.upsert(fxg::EventType::Glitch, only);
    fxg::RandomEventEngine engine(clock, random, catalog);

    std::atomic<int> fired{0};
    std::vector<std::thread> callers;
    for (int i = 0; i < 8; ++i) {
        callers.emplace_back([&]() {
            for (int j = 0; j < 50; ++j) {
                engine.tryTrigger(100.0, [&](fxg::EventType, double) {
                    fired.fetch_add(1);
                    return true;
                });
            }
        });
    }
    for (auto& c : callers) {
        c.join();
    }
    // Cooldown admits exactly one winner.
    assert(fired.load() == 1);
    assert(engine.sessionCount(fxg::EventType::Glitch) == 1U);

    // Nothing is recorded when firing fails or throws.
    clock.advance(61s);
    assert(!engine.tryTrigger(100.0, [](fxg::EventType, double) { return false; }));
    assert(!engine.tryTrigger(100.0, [](fxg::EventType, double) -> bool { throw std::runtime_error("no renderer"); }));
    assert(engine.sessionCount(fxg::EventType::Glitch) == 1U);
    assert(engine.tryTrigger(100.0, {}) == fxg::EventType::Glitch);
    assert(engine.sessionCount(fxg::EventType::Glitch) == 2U);
}

void checkResetLeavesBreakerAlone() {
    fxg::ManualClock clock;
    fxg::ManualTimerService timers(clock);
    fxg::CircuitBreaker breaker(timers);
    fxg::ScriptedRandomSource random({0.3});
    fxg::RandomEventEngine engine(clock, random, fxg::EventCatalog::defaults(), &timers);

    breaker.trip("jumpscare", fxg::ErrorSeverity::High);
    engine.recordEvent(fxg::EventType::Glitch, 20.0);
    engine.resetSession();
    assert(breaker.isComponentDisabled("jumpscare"));
    assert(engine.catalog().find(fxg::EventType::Jumpscare)->enabled);
}

} // namespace

int main() {
    checkEffectLock();
    checkDispatcher();
    checkAsyncDispatch();
    checkEngineDriverApi();
    checkAtomicTrigger();
    checkResetLeavesBreakerAlone();

    std::cout << "engine_and_dispatch_tests passed\n";
    return 0;
}
