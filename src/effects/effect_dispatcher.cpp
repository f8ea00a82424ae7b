#include "fxgate/effects/effect_dispatcher.hpp"

#include <atomic>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <stdexcept>

namespace fxg {

const char* toString(DispatchOutcome outcome) {
    switch (outcome) {
    case DispatchOutcome::Fired:
        return "Fired";
    case DispatchOutcome::Failed:
        return "Failed";
    case DispatchOutcome::BreakerOpen:
        return "BreakerOpen";
    case DispatchOutcome::LockBusy:
        return "LockBusy";
    case DispatchOutcome::ManagerDisabled:
        return "ManagerDisabled";
    case DispatchOutcome::Unbound:
        return "Unbound";
    }
    return "Unknown";
}

EffectDispatcher::EffectDispatcher(CircuitBreaker& breaker, EffectLock& lock, DispatchOptions options)
    : breaker_(breaker), lock_(lock), options_(options) {}

bool EffectDispatcher::bind(EventType type, const std::string& component, IEffectManager& manager,
                            IEffectTrigger& trigger) {
    if (component.empty()) {
        return false;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    bindings_[type] = Binding{component, &manager, &trigger};
    return true;
}

bool EffectDispatcher::unbind(EventType type) {
    std::lock_guard<std::mutex> lock(mutex_);
    return bindings_.erase(type) > 0U;
}

bool EffectDispatcher::isBound(EventType type) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return bindings_.count(type) > 0U;
}

std::optional<std::string> EffectDispatcher::componentFor(EventType type) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = bindings_.find(type);
    if (it == bindings_.end()) {
        return std::nullopt;
    }
    return it->second.component;
}

DispatchOutcome EffectDispatcher::dispatch(const EffectRequest& request) {
    Binding binding;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto it = bindings_.find(request.type);
        if (it == bindings_.end()) {
            return DispatchOutcome::Unbound;
        }
        binding = it->second;
    }

    if (!binding.manager->isEnabled()) {
        if (std::getenv("FXGATE_TRACE") != nullptr) {
            std::cerr << "[fxg-engine] " << binding.component << " manager disabled, skipping "
                      << toString(request.type) << '\n';
        }
        return DispatchOutcome::ManagerDisabled;
    }

    EffectLock::Guard guard(lock_, options_.hold);
    if (!guard) {
        return DispatchOutcome::LockBusy;
    }

    CallContext context{binding.component, std::string("trigger ") + toString(request.type), request.intensity,
                        request.variant.value_or("")};

    // A component that was already open is a skip; anything else that returns
    // no value is a failure, including an async call that timed out before
    // its thread reached the trigger.
    const bool openBefore = breaker_.isComponentDisabled(binding.component);
    auto invoked = std::make_shared<std::atomic<bool>>(false);
    auto* trigger = binding.trigger;
    auto operation = [trigger, request, invoked]() {
        invoked->store(true);
        if (!trigger->trigger(request)) {
            throw std::runtime_error("trigger reported failure");
        }
        return true;
    };

    const auto result = options_.async ? breaker_.executeAsync(context, operation)
                                       : breaker_.execute(context, operation);
    if (result) {
        return DispatchOutcome::Fired;
    }
    if (openBefore) {
        return DispatchOutcome::BreakerOpen;
    }
    if (options_.async || invoked->load()) {
        return DispatchOutcome::Failed;
    }
    // Opened by another caller between the check and the call.
    return DispatchOutcome::BreakerOpen;
}

} // namespace fxg
