/**
 * @file session_simulation_demo.cpp
 * @brief fxgate source file.
 */

#include <chrono>
#include <iostream>
#include <string>
#include <thread>

#include "fxgate/config/catalog_loader.hpp"
#include "fxgate/config/runtime_options.hpp"
#include "fxgate/core/timer_service.hpp"
#include "fxgate/effects/effect_dispatcher.hpp"
#include "fxgate/effects/mock_effect_manager.hpp"
#include "fxgate/fault/circuit_breaker.hpp"
#include "fxgate/fault/effect_lock.hpp"
#include "fxgate/scheduling/event_scheduler.hpp"
#include "fxgate/scheduling/random_event_engine.hpp"
#include "fxgate/scheduling/random_source.hpp"

using namespace std::chrono_literals;

int main(int argc, char** argv) {
    const std::string catalogPath = argc > 1 ? argv[1] : "examples/config/event_catalog.json";

    // Short cooldowns from the demo catalog keep the run to a few seconds.
    auto catalog = fxg::EventCatalog::defaults();
    std::string error;
    if (!fxg::CatalogLoader::loadFromJsonFile(catalogPath, catalog, error)) {
        std::cerr << "Catalog load failed: " << error << '\n';
        return 1;
    }

    auto options = fxg::RuntimeOptions::defaults();
    options.breaker.recoveryDelay = 2s;
    options.scheduler.minDelay = 50ms;
    options.scheduler.maxDelay = 200ms;
    options = fxg::RuntimeOptions::fromEnvironment(options);

    fxg::ThreadTimerService timers;
    fxg::SecureRandomSource random;
    fxg::CircuitBreaker breaker(timers, options.breaker, [](const fxg::DegradationNotice& notice) {
        std::cout << "notice: " << notice.message << '\n';
    });
    fxg::EffectLock lock(timers.clock());
    fxg::EffectDispatcher dispatcher(breaker, lock);
    fxg::RandomEventEngine engine(timers.clock(), random, catalog, &timers);

    fxg::MockEffectManager visuals("screenDistortion");
    fxg::MockEffectManager audio("whisperingVariables");
    fxg::MockEffectManager popups("jumpscare");
    dispatcher.bind(fxg::EventType::Glitch, "screenDistortion", visuals, visuals);
    dispatcher.bind(fxg::EventType::ScreenShake, "screenDistortion", visuals, visuals);
    dispatcher.bind(fxg::EventType::Whisper, "whisperingVariables", audio, audio);
    dispatcher.bind(fxg::EventType::Jumpscare, "jumpscare", popups, popups);

    // The audio handler fails often enough to trip its breaker.
    audio.setAlwaysFail(true);

    fxg::EventScheduler scheduler(engine, timers, random, options.scheduler);
    const auto fire = [&](fxg::EventType type, double intensity) {
        const auto outcome = dispatcher.dispatch({type, intensity, std::nullopt});
        std::cout << "event=" << fxg::toString(type) << " intensity=" << intensity
                  << " outcome=" << fxg::toString(outcome) << '\n';
        return outcome == fxg::DispatchOutcome::Fired;
    };
    if (!scheduler.start(40.0, fire)) {
        std::cerr << "Scheduler did not start\n";
        return 1;
    }

    std::this_thread::sleep_for(2s);
    scheduler.updateIntensity(95.0);
    std::this_thread::sleep_for(3s);
    audio.setAlwaysFail(false);
    std::this_thread::sleep_for(2s);
    scheduler.stop();

    const auto stats = engine.sessionStats();
    std::cout << "session duration=" << stats.duration.count() << "ms events=" << stats.totalEvents
              << " avgIntensity=" << stats.averageIntensity << '\n';
    for (const auto& [type, count] : stats.perTypeCounts) {
        std::cout << "  " << fxg::toString(type) << "=" << count << '\n';
    }
    std::cout << breaker.errorReport();

    timers.stop();
    return 0;
}
