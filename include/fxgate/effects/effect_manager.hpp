#pragma once

#include <optional>
#include <string>

#include "fxgate/core/event_type.hpp"

namespace fxg {

/**
 * @brief What the engine asks an effect handler to perform.
 */
struct EffectRequest {
    EventType type = EventType::Glitch;
    double intensity = 0.0;
    std::optional<std::string> variant;
};

/**
 * @brief Enable flag of an external effect manager.
 *
 * The engine never looks further into a manager than this flag.
 */
class IEffectManager {
public:
    virtual ~IEffectManager() = default;

    virtual void enable() = 0;
    virtual void disable() = 0;
    virtual bool isEnabled() const = 0;
};

/**
 * @brief Capability to fire one effect.
 *
 * Implementations report failure by throwing or by returning false; both are
 * counted by the circuit breaker. The call should return once the effect has
 * started, not when it has finished playing.
 */
class IEffectTrigger {
public:
    virtual ~IEffectTrigger() = default;

    virtual bool trigger(const EffectRequest& request) = 0;
};

} // namespace fxg
