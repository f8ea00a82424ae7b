#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>

#include "fxgate/effects/effect_manager.hpp"

namespace fxg {

class MockEffectManager final : public IEffectManager, public IEffectTrigger {
public:
    explicit MockEffectManager(std::string name = "mock");

    void enable() override;
    void disable() override;
    bool isEnabled() const override;

    bool trigger(const EffectRequest& request) override;

    const std::string& name() const noexcept;

    /// Next `count` triggers throw.
    void injectFailures(std::size_t count);
    void setAlwaysFail(bool fail);
    /// Triggers return false instead of throwing while set.
    void setRejectRequests(bool reject);
    /// Sleep inside `trigger`, used to simulate a hanging handler.
    void setTriggerDelay(std::chrono::milliseconds delay);

    std::uint64_t triggerAttempts() const;
    std::uint64_t successfulTriggers() const;
    std::optional<EffectRequest> lastRequest() const;

private:
    std::string name_;
    mutable std::mutex mutex_;
    bool enabled_ = true;
    bool alwaysFail_ = false;
    bool reject_ = false;
    std::size_t remainingFailures_ = 0;
    std::chrono::milliseconds delay_{0};
    std::uint64_t attempts_ = 0;
    std::uint64_t successes_ = 0;
    std::optional<EffectRequest> lastRequest_;
};

} // namespace fxg
