/**
 * @file effect_lock.hpp
 * @brief fxgate source file.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>

#include "fxgate/core/clock.hpp"

namespace fxg {

/**
 * @brief Engine-owned "one effect at a time" token.
 *
 * A holder acquires with a hold limit; the lock is considered free again once
 * the limit has passed, so a handler that never releases cannot block effects
 * forever. Each acquisition gets a fresh ticket and only the current ticket
 * can release.
 */
class EffectLock {
public:
    using Ticket = std::uint64_t;

    static constexpr std::chrono::milliseconds kDefaultHold{5000};
    static constexpr std::chrono::milliseconds kMaxHold{10000};

    /**
     * @brief Scoped holder; releases on destruction.
     */
    class Guard {
    public:
        explicit Guard(EffectLock& lock, std::chrono::milliseconds hold = kDefaultHold);
        ~Guard();

        Guard(const Guard&) = delete;
        Guard& operator=(const Guard&) = delete;

        bool owns() const noexcept;
        explicit operator bool() const noexcept { return owns(); }
        void release();

    private:
        EffectLock& lock_;
        std::optional<Ticket> ticket_;
    };

    explicit EffectLock(const IClock& clock);

    /**
     * @brief Acquire if free or expired; `hold` is clamped to (0, kMaxHold].
     */
    std::optional<Ticket> tryAcquire(std::chrono::milliseconds hold = kDefaultHold);
    /**
     * @brief Release the lock if `ticket` still owns it.
     */
    bool release(Ticket ticket);
    void forceRelease();

    bool isHeld() const;
    std::uint64_t acquisitions() const;

private:
    bool heldLocked(IClock::time_point now) const;

    const IClock& clock_;
    mutable std::mutex mutex_;
    std::optional<Ticket> owner_;
    IClock::time_point expiresAt_{};
    Ticket nextTicket_ = 1;
    std::uint64_t acquisitions_ = 0;
};

} // namespace fxg
