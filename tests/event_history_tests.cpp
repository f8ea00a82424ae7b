#include <cassert>
#include <chrono>
#include <iostream>

#include "fxgate/config/event_catalog.hpp"
#include "fxgate/core/clock.hpp"
#include "fxgate/scheduling/event_history.hpp"

using namespace std::chrono_literals;

int main() {
    // History keeps only the ten newest records.
    {
        fxg::ManualClock clock;
        fxg::EventHistory history(clock);
        for (int i = 0; i < 15; ++i) {
            history.record(fxg::EventType::Glitch, static_cast<double>(i));
            clock.advance(1s);
        }
        assert(history.size() == fxg::EventHistory::kCapacity);
        const auto all = history.history();
        assert(all.size() == 10U);
        for (std::size_t i = 0; i < all.size(); ++i) {
            assert(all[i].intensity == static_cast<double>(i + 5U));
        }
        assert(history.sessionCount(fxg::EventType::Glitch) == 15U);
        assert(history.totalSessionEvents() == 15U);
    }

    // Recent events come back oldest first and never exceed what is retained.
    {
        fxg::ManualClock clock;
        fxg::EventHistory history(clock);
        history.record(fxg::EventType::Whisper, 10.0);
        history.record(fxg::EventType::Glitch, 20.0, "scanlines");
        history.record(fxg::EventType::Jumpscare, 90.0);

        const auto lastTwo = history.recentEvents(2);
        assert(lastTwo.size() == 2U);
        assert(lastTwo[0].type == fxg::EventType::Glitch);
        assert(lastTwo[0].variant && *lastTwo[0].variant == "scanlines");
        assert(lastTwo[1].type == fxg::EventType::Jumpscare);
        assert(history.recentEvents(50).size() == 3U);
        assert(history.recentEvents(0).empty());
        assert(history.averageIntensity() == 40.0);
    }

    // Time since last scans newest to oldest.
    {
        fxg::ManualClock clock;
        fxg::EventHistory history(clock);
        assert(!history.timeSinceLast(fxg::EventType::Glitch));

        history.record(fxg::EventType::Glitch, 50.0);
        clock.advance(3s);
        history.record(fxg::EventType::Whisper, 50.0);
        clock.advance(2s);
        history.record(fxg::EventType::Glitch, 50.0);
        clock.advance(1s);

        const auto since = history.timeSinceLast(fxg::EventType::Glitch);
        assert(since && *since == std::chrono::duration_cast<fxg::IClock::duration>(1s));
        assert(history.occurrencesInLast(fxg::EventType::Glitch, 5) == 2U);
        assert(history.occurrencesInLast(fxg::EventType::Glitch, 1) == 1U);
        assert(history.occurrencesInLast(fxg::EventType::Whisper, 1) == 0U);
    }

    // clearHistory keeps counters; resetSession drops both and restarts the session.
    {
        fxg::ManualClock clock;
        fxg::EventHistory history(clock);
        const auto firstStart = history.sessionStart();
        history.record(fxg::EventType::ScreenShake, 30.0);
        history.record(fxg::EventType::ScreenShake, 30.0);

        history.clearHistory();
        assert(history.size() == 0U);
        assert(history.sessionCount(fxg::EventType::ScreenShake) == 2U);

        clock.advance(10s);
        history.record(fxg::EventType::Whisper, 30.0);
        history.resetSession();
        assert(history.size() == 0U);
        assert(history.sessionCount(fxg::EventType::ScreenShake) == 0U);
        assert(history.sessionCount(fxg::EventType::Whisper) == 0U);
        assert(history.sessionCounts().empty());
        assert(history.totalSessionEvents() == 0U);
        assert(history.sessionStart() > firstStart);
        assert(history.averageIntensity() == 0.0);
    }

    // Cooldown derives from history and catalog; unknown types stay on cooldown.
    {
        fxg::ManualClock clock;
        const auto catalog = fxg::EventCatalog::defaults();
        fxg::EventHistory history(clock);
        fxg::CooldownTracker cooldowns(catalog, history);

        assert(!catalog.contains(fxg::EventType::EasterEgg));
        assert(cooldowns.isOnCooldown(fxg::EventType::EasterEgg));
        assert(cooldowns.remainingCooldown(fxg::EventType::EasterEgg) == std::chrono::milliseconds::max());

        assert(!cooldowns.isOnCooldown(fxg::EventType::Glitch));
        assert(cooldowns.remainingCooldown(fxg::EventType::Glitch) == 0ms);

        history.record(fxg::EventType::Glitch, 50.0);
        const auto cooldown = catalog.find(fxg::EventType::Glitch)->cooldown();
        assert(cooldown == 150s);
        assert(cooldowns.isOnCooldown(fxg::EventType::Glitch));
        assert(cooldowns.remainingCooldown(fxg::EventType::Glitch) == cooldown);

        clock.advance(cooldown - 1ms);
        assert(cooldowns.remainingCooldown(fxg::EventType::Glitch) == 1ms);
        clock.advance(1ms);
        assert(!cooldowns.isOnCooldown(fxg::EventType::Glitch));
        assert(!cooldowns.isOnCooldown(fxg::EventType::Whisper));
    }

    std::cout << "event_history_tests passed\n";
    return 0;
}
