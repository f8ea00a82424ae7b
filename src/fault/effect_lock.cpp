/**
 * @file effect_lock.cpp
 * @brief fxgate source file.
 */

#include "fxgate/fault/effect_lock.hpp"

#include <algorithm>
#include <iostream>

namespace fxg {

EffectLock::Guard::Guard(EffectLock& lock, std::chrono::milliseconds hold)
    : lock_(lock), ticket_(lock.tryAcquire(hold)) {}

EffectLock::Guard::~Guard() { release(); }

bool EffectLock::Guard::owns() const noexcept { return ticket_.has_value(); }

void EffectLock::Guard::release() {
    if (ticket_) {
        lock_.release(*ticket_);
        ticket_.reset();
    }
}

EffectLock::EffectLock(const IClock& clock) : clock_(clock) {}

std::optional<EffectLock::Ticket> EffectLock::tryAcquire(std::chrono::milliseconds hold) {
    const auto bounded = std::clamp(hold, std::chrono::milliseconds(1), kMaxHold);
    std::lock_guard<std::mutex> lock(mutex_);
    const auto now = clock_.now();
    if (heldLocked(now)) {
        return std::nullopt;
    }
    if (owner_) {
        std::cerr << "[fxg-engine] effect lock ticket " << *owner_ << " expired without release\n";
    }
    owner_ = nextTicket_++;
    expiresAt_ = now + bounded;
    ++acquisitions_;
    return owner_;
}

bool EffectLock::release(Ticket ticket) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!owner_ || *owner_ != ticket) {
        return false;
    }
    owner_.reset();
    return true;
}

void EffectLock::forceRelease() {
    std::lock_guard<std::mutex> lock(mutex_);
    owner_.reset();
}

bool EffectLock::isHeld() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return heldLocked(clock_.now());
}

std::uint64_t EffectLock::acquisitions() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return acquisitions_;
}

bool EffectLock::heldLocked(IClock::time_point now) const { return owner_.has_value() && now < expiresAt_; }

} // namespace fxg
