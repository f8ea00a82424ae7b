/**
 * @file clock.cpp
 * @brief fxgate source file.
 */

#include "fxgate/core/clock.hpp"

namespace fxg {

IClock::time_point SystemClock::now() const { return std::chrono::steady_clock::now(); }

SystemClock& SystemClock::instance() {
    static SystemClock clock;
    return clock;
}

// Start away from the epoch so "never happened" sentinels cannot collide with real readings.
ManualClock::ManualClock() : now_(time_point{} + std::chrono::hours(24)) {}

ManualClock::ManualClock(time_point start) : now_(start) {}

IClock::time_point ManualClock::now() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return now_;
}

void ManualClock::advance(duration delta) {
    std::lock_guard<std::mutex> lock(mutex_);
    now_ += delta;
}

void ManualClock::set(time_point value) {
    std::lock_guard<std::mutex> lock(mutex_);
    now_ = value;
}

std::chrono::milliseconds elapsedMs(IClock::time_point from, IClock::time_point to) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(to - from);
}

} // namespace fxg
