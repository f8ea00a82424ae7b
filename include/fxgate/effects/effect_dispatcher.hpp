/**
 * @file effect_dispatcher.hpp
 * @brief fxgate source file.
 */

#pragma once

#include <chrono>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include "fxgate/core/event_type.hpp"
#include "fxgate/effects/effect_manager.hpp"
#include "fxgate/fault/circuit_breaker.hpp"
#include "fxgate/fault/effect_lock.hpp"

namespace fxg {

enum class DispatchOutcome {
    Fired,
    Failed,
    BreakerOpen,
    LockBusy,
    ManagerDisabled,
    Unbound,
};

const char* toString(DispatchOutcome outcome);

struct DispatchOptions {
    /// Run triggers through `CircuitBreaker::executeAsync` with its call timeout.
    bool async = false;
    /// Effect lock hold limit per dispatch.
    std::chrono::milliseconds hold = EffectLock::kDefaultHold;
};

/**
 * @brief Routes event types to effect handlers through the breaker and the effect lock.
 *
 * Bindings are made at wiring time. The referenced managers and triggers must
 * outlive the dispatcher (or be unbound first).
 */
class EffectDispatcher {
public:
    EffectDispatcher(CircuitBreaker& breaker, EffectLock& lock, DispatchOptions options = {});

    /**
     * @brief Bind `type` to a breaker component and its handler, replacing any previous binding.
     *
     * With `DispatchOptions::async` a timed-out call keeps running on a
     * detached thread, so `trigger` must stay alive until that call returns,
     * even after unbinding or destroying the dispatcher.
     * @return false if `component` is empty.
     */
    bool bind(EventType type, const std::string& component, IEffectManager& manager, IEffectTrigger& trigger);
    bool unbind(EventType type);
    bool isBound(EventType type) const;
    std::optional<std::string> componentFor(EventType type) const;

    /**
     * @brief Fire one effect.
     *
     * Disabled managers are skipped without a call. Otherwise the effect lock
     * is taken for the duration of the call and the trigger runs through the
     * breaker; a false return from the trigger counts as a failure.
     */
    DispatchOutcome dispatch(const EffectRequest& request);

private:
    struct Binding {
        std::string component;
        IEffectManager* manager = nullptr;
        IEffectTrigger* trigger = nullptr;
    };

    CircuitBreaker& breaker_;
    EffectLock& lock_;
    DispatchOptions options_;
    mutable std::mutex mutex_;
    std::unordered_map<EventType, Binding> bindings_;
};

} // namespace fxg
