#include "fxgate/effects/mock_effect_manager.hpp"

#include <stdexcept>
#include <thread>
#include <utility>

namespace fxg {

MockEffectManager::MockEffectManager(std::string name) : name_(std::move(name)) {}

void MockEffectManager::enable() {
    std::lock_guard<std::mutex> lock(mutex_);
    enabled_ = true;
}

void MockEffectManager::disable() {
    std::lock_guard<std::mutex> lock(mutex_);
    enabled_ = false;
}

bool MockEffectManager::isEnabled() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return enabled_;
}

bool MockEffectManager::trigger(const EffectRequest& request) {
    std::chrono::milliseconds delay{0};
    bool fail = false;
    bool reject = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++attempts_;
        lastRequest_ = request;
        delay = delay_;
        reject = reject_;
        if (alwaysFail_) {
            fail = true;
        } else if (remainingFailures_ > 0U) {
            --remainingFailures_;
            fail = true;
        }
    }

    if (delay.count() > 0) {
        std::this_thread::sleep_for(delay);
    }
    if (fail) {
        throw std::runtime_error(name_ + ": injected trigger failure for " + toString(request.type));
    }
    if (reject) {
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    ++successes_;
    return true;
}

const std::string& MockEffectManager::name() const noexcept { return name_; }

void MockEffectManager::injectFailures(std::size_t count) {
    std::lock_guard<std::mutex> lock(mutex_);
    remainingFailures_ = count;
}

void MockEffectManager::setAlwaysFail(bool fail) {
    std::lock_guard<std::mutex> lock(mutex_);
    alwaysFail_ = fail;
}

void MockEffectManager::setRejectRequests(bool reject) {
    std::lock_guard<std::mutex> lock(mutex_);
    reject_ = reject;
}

void MockEffectManager::setTriggerDelay(std::chrono::milliseconds delay) {
    std::lock_guard<std::mutex> lock(mutex_);
    delay_ = delay;
}

std::uint64_t MockEffectManager::triggerAttempts() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return attempts_;
}

std::uint64_t MockEffectManager::successfulTriggers() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return successes_;
}

std::optional<EffectRequest> MockEffectManager::lastRequest() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lastRequest_;
}

} // namespace fxg
