/**
 * @file clock.hpp
 * @brief fxgate source file.
 */

#pragma once

#include <chrono>
#include <mutex>

namespace fxg {

/**
 * @brief Monotonic time source used by history, breaker and cache bookkeeping.
 */
class IClock {
public:
    using time_point = std::chrono::steady_clock::time_point;
    using duration = std::chrono::steady_clock::duration;

    virtual ~IClock() = default;

    virtual time_point now() const = 0;
};

/**
 * @brief Production clock backed by `std::chrono::steady_clock`.
 */
class SystemClock final : public IClock {
public:
    time_point now() const override;

    static SystemClock& instance();
};

/**
 * @brief Test clock that only moves when advanced explicitly.
 */
class ManualClock final : public IClock {
public:
    ManualClock();
    explicit ManualClock(time_point start);

    time_point now() const override;

    void advance(duration delta);
    void set(time_point value);

private:
    mutable std::mutex mutex_;
    time_point now_;
};

/// Milliseconds elapsed between two clock readings, truncated.
std::chrono::milliseconds elapsedMs(IClock::time_point from, IClock::time_point to);

} // namespace fxg
