/**
 * @file event_scheduler.hpp
 * @brief fxgate source file.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>

#include "fxgate/core/clock.hpp"
#include "fxgate/core/event_type.hpp"
#include "fxgate/core/timer_service.hpp"
#include "fxgate/scheduling/random_event_engine.hpp"
#include "fxgate/scheduling/random_source.hpp"

namespace fxg {

/**
 * @brief Timing policy for automatic event triggering.
 */
struct SchedulerOptions {
    std::chrono::milliseconds minDelay{30 * 1000};
    std::chrono::milliseconds maxDelay{120 * 1000};
    /// Higher intensity shortens the delay; otherwise the delay is uniform in [min, max].
    bool intensityScaling = true;
    bool enabled = true;
    /// Scheduler pauses itself after this many fired events.
    std::uint32_t maxEventsPerSession = 100;
};

struct SchedulerState {
    bool running = false;
    double intensity = 0.0;
    std::uint32_t sessionEventCount = 0;
    std::chrono::milliseconds timeSinceLastEvent{0};
    /// Time until the pending tick, nullopt when nothing is scheduled.
    std::optional<std::chrono::milliseconds> nextEventIn;
};

/**
 * @brief Periodic driver that asks the engine for events on a jittered timer.
 *
 * Each tick runs `RandomEventEngine::tryTrigger` with the current intensity
 * and schedules the next tick. An intensity jump of more than 20 points pulls
 * the next tick forward to the end of the minimum delay.
 */
class EventScheduler {
public:
    static constexpr double kSpikeThreshold = 20.0;

    EventScheduler(RandomEventEngine& engine,
                   ITimerService& timers,
                   IRandomSource& jitter,
                   SchedulerOptions options = {});
    ~EventScheduler();

    EventScheduler(const EventScheduler&) = delete;
    EventScheduler& operator=(const EventScheduler&) = delete;

    /**
     * @brief Start ticking; false if already running or disabled.
     */
    bool start(double intensity, RandomEventEngine::FireCallback callback);
    void stop();
    bool isRunning() const;

    void updateIntensity(double intensity);
    void updateOptions(const SchedulerOptions& options);
    SchedulerOptions options() const;

    /**
     * @brief Fire now, outside the regular timer.
     *
     * With a type, that type is fired and recorded even if it is cooling
     * down. Without one, a normal selection is made.
     * @return fired type, or nullopt if nothing fired.
     */
    std::optional<EventType> forceTrigger(std::optional<EventType> type = std::nullopt);

    SchedulerState state() const;
    /**
     * @brief Reset the scheduler's own event count; the engine session is untouched.
     */
    void resetSession();
    std::chrono::milliseconds timeUntilNextEligibleEvent() const;

    /**
     * @brief Delay before the next tick for a jitter draw `unit` in [0, 1).
     */
    static std::chrono::milliseconds computeDelay(const SchedulerOptions& options, double intensity, double unit);

private:
    void onTick(std::uint64_t generation);
    void scheduleLocked(std::chrono::milliseconds delay);
    void noteFiredLocked();
    static SchedulerOptions normalized(SchedulerOptions options);

    RandomEventEngine& engine_;
    ITimerService& timers_;
    const IClock& clock_;
    IRandomSource& jitter_;
    mutable std::mutex mutex_;
    SchedulerOptions options_;
    RandomEventEngine::FireCallback callback_;
    bool running_ = false;
    double intensity_ = 0.0;
    std::uint32_t sessionEventCount_ = 0;
    IClock::time_point lastEventTime_{};
    TaskId task_ = kInvalidTaskId;
    std::optional<IClock::time_point> nextDue_;
    std::uint64_t generation_ = 0;
};

} // namespace fxg
