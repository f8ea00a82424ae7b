/**
 * @file event_scheduler.cpp
 * @brief fxgate source file.
 */

#include "fxgate/scheduling/event_scheduler.hpp"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <iostream>
#include <utility>

namespace fxg {
namespace {

double clampIntensity(double intensity) {
    if (!std::isfinite(intensity)) {
        return 0.0;
    }
    return std::clamp(intensity, 0.0, 100.0);
}

} // namespace

EventScheduler::EventScheduler(RandomEventEngine& engine,
                               ITimerService& timers,
                               IRandomSource& jitter,
                               SchedulerOptions options)
    : engine_(engine),
      timers_(timers),
      clock_(timers.clock()),
      jitter_(jitter),
      options_(normalized(options)),
      lastEventTime_(timers.clock().now()) {}

EventScheduler::~EventScheduler() { stop(); }

bool EventScheduler::start(double intensity, RandomEventEngine::FireCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (running_) {
        std::cerr << "[fxg-scheduler] already running\n";
        return false;
    }
    if (!options_.enabled) {
        std::cerr << "[fxg-scheduler] scheduler is disabled\n";
        return false;
    }

    running_ = true;
    intensity_ = clampIntensity(intensity);
    callback_ = std::move(callback);
    lastEventTime_ = clock_.now();
    sessionEventCount_ = 0;
    std::cerr << "[fxg-scheduler] started with intensity " << intensity_ << '\n';
    scheduleLocked(computeDelay(options_, intensity_, jitter_.nextUnit()));
    return true;
}

void EventScheduler::stop() {
    TaskId pending = kInvalidTaskId;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_ && task_ == kInvalidTaskId) {
            return;
        }
        if (running_) {
            std::cerr << "[fxg-scheduler] stopped\n";
        }
        running_ = false;
        ++generation_;
        pending = std::exchange(task_, kInvalidTaskId);
        nextDue_.reset();
    }
    // Outside the lock: cancelling waits for a tick that is already running.
    timers_.cancel(pending);
}

bool EventScheduler::isRunning() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return running_;
}

void EventScheduler::updateIntensity(double intensity) {
    TaskId superseded = kInvalidTaskId;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto previous = intensity_;
        intensity_ = clampIntensity(intensity);
        if (intensity_ == previous || !running_ || intensity_ <= previous + kSpikeThreshold) {
            return;
        }

        const auto since = elapsedMs(lastEventTime_, clock_.now());
        std::chrono::milliseconds delay{0};
        if (since < options_.minDelay) {
            delay = options_.minDelay - since;
        }
        std::cerr << "[fxg-scheduler] intensity spike " << previous << " -> " << intensity_
                  << ", next tick in " << delay.count() << " ms\n";
        superseded = task_;
        scheduleLocked(delay);
    }
    timers_.cancel(superseded);
}

void EventScheduler::updateOptions(const SchedulerOptions& options) {
    bool disable = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        options_ = normalized(options);
        disable = !options_.enabled && running_;
    }
    if (disable) {
        stop();
    }
}

SchedulerOptions EventScheduler::options() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return options_;
}

std::optional<EventType> EventScheduler::forceTrigger(std::optional<EventType> type) {
    RandomEventEngine::FireCallback callback;
    double intensity = 0.0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        callback = callback_;
        intensity = intensity_;
    }
    if (!callback) {
        std::cerr << "[fxg-scheduler] no trigger callback set\n";
        return std::nullopt;
    }

    std::optional<EventType> fired;
    if (type) {
        try {
            if (callback(*type, intensity)) {
                engine_.recordEvent(*type, intensity);
                fired = type;
            }
        } catch (const std::exception& ex) {
            std::cerr << "[fxg-scheduler] force trigger of " << toString(*type) << " failed: " << ex.what() << '\n';
        } catch (...) {
            std::cerr << "[fxg-scheduler] force trigger of " << toString(*type) << " failed: unknown exception\n";
        }
    } else {
        fired = engine_.tryTrigger(intensity, callback);
    }

    if (fired) {
        std::lock_guard<std::mutex> lock(mutex_);
        noteFiredLocked();
    }
    return fired;
}

SchedulerState EventScheduler::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto now = clock_.now();
    SchedulerState out;
    out.running = running_;
    out.intensity = intensity_;
    out.sessionEventCount = sessionEventCount_;
    out.timeSinceLastEvent = elapsedMs(lastEventTime_, now);
    if (running_ && nextDue_) {
        out.nextEventIn = *nextDue_ > now ? std::chrono::ceil<std::chrono::milliseconds>(*nextDue_ - now)
                                          : std::chrono::milliseconds(0);
    }
    return out;
}

void EventScheduler::resetSession() {
    std::lock_guard<std::mutex> lock(mutex_);
    sessionEventCount_ = 0;
    lastEventTime_ = clock_.now();
}

std::chrono::milliseconds EventScheduler::timeUntilNextEligibleEvent() const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto since = elapsedMs(lastEventTime_, clock_.now());
    if (since >= options_.minDelay) {
        return std::chrono::milliseconds(0);
    }
    return options_.minDelay - since;
}

std::chrono::milliseconds EventScheduler::computeDelay(const SchedulerOptions& options, double intensity,
                                                       double unit) {
    const auto minMs = static_cast<double>(options.minDelay.count());
    const auto maxMs = static_cast<double>(options.maxDelay.count());
    const auto u = std::clamp(unit, 0.0, 1.0);

    double delay = 0.0;
    if (!options.intensityScaling) {
        delay = minMs + u * (maxMs - minMs);
    } else {
        const auto base = maxMs - (maxMs - minMs) * (clampIntensity(intensity) / 100.0);
        // +-20 % jitter
        delay = base * (0.8 + u * 0.4);
    }
    return std::chrono::milliseconds(static_cast<std::int64_t>(std::llround(std::clamp(delay, minMs, maxMs))));
}

void EventScheduler::onTick(std::uint64_t generation) {
    RandomEventEngine::FireCallback callback;
    double intensity = 0.0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_ || generation != generation_) {
            return;
        }
        callback = callback_;
        intensity = intensity_;
        nextDue_.reset();
    }

    // The engine is called without the scheduler lock held.
    const auto fired = engine_.tryTrigger(intensity, callback);

    std::lock_guard<std::mutex> lock(mutex_);
    if (!running_ || generation != generation_) {
        return;
    }
    if (fired) {
        noteFiredLocked();
        std::cerr << "[fxg-scheduler] fired " << toString(*fired) << " intensity=" << intensity
                  << " sessionCount=" << sessionEventCount_ << '\n';
    } else if (std::getenv("FXGATE_TRACE") != nullptr) {
        std::cerr << "[fxg-scheduler] no eligible event at intensity " << intensity << '\n';
    }

    if (sessionEventCount_ >= options_.maxEventsPerSession) {
        std::cerr << "[fxg-scheduler] session event limit reached, pausing\n";
        running_ = false;
        ++generation_;
        nextDue_.reset();
        return;
    }
    scheduleLocked(computeDelay(options_, intensity_, jitter_.nextUnit()));
}

void EventScheduler::scheduleLocked(std::chrono::milliseconds delay) {
    const auto generation = ++generation_;
    nextDue_ = clock_.now() + delay;
    task_ = timers_.scheduleAfter(delay, [this, generation]() { onTick(generation); });
    if (std::getenv("FXGATE_TRACE") != nullptr) {
        std::cerr << "[fxg-scheduler] next tick in " << delay.count() << " ms\n";
    }
}

void EventScheduler::noteFiredLocked() {
    ++sessionEventCount_;
    lastEventTime_ = clock_.now();
}

SchedulerOptions EventScheduler::normalized(SchedulerOptions options) {
    options.minDelay = std::max(options.minDelay, std::chrono::milliseconds(0));
    options.maxDelay = std::max(options.maxDelay, options.minDelay);
    return options;
}

} // namespace fxg
