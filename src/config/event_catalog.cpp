/**
 * @file event_catalog.cpp
 * @brief fxgate source file.
 */

#include "fxgate/config/event_catalog.hpp"

#include <cmath>
#include <cstdint>

namespace fxg {
namespace {

EventTypeConfig makeConfig(double baseChance, double intensityMultiplier, double cooldownSeconds,
                           std::uint32_t maxPerSession, double weight) {
    EventTypeConfig config;
    config.baseChance = baseChance;
    config.intensityMultiplier = intensityMultiplier;
    config.cooldownSeconds = cooldownSeconds;
    config.maxPerSession = maxPerSession;
    config.weight = weight;
    return config;
}

} // namespace

std::chrono::milliseconds EventTypeConfig::cooldown() const {
    return std::chrono::milliseconds(static_cast<std::int64_t>(std::llround(cooldownSeconds * 1000.0)));
}

void EventTypeConfigUpdate::applyTo(EventTypeConfig& config) const {
    if (baseChance) {
        config.baseChance = *baseChance;
    }
    if (intensityMultiplier) {
        config.intensityMultiplier = *intensityMultiplier;
    }
    if (cooldownSeconds) {
        config.cooldownSeconds = *cooldownSeconds;
    }
    if (maxPerSession) {
        config.maxPerSession = *maxPerSession;
    }
    if (weight) {
        config.weight = *weight;
    }
    if (enabled) {
        config.enabled = *enabled;
    }
}

EventCatalog EventCatalog::defaults() {
    EventCatalog catalog;
    // Rare but impactful.
    catalog.upsert(EventType::Jumpscare, makeConfig(0.10, 2.0, 300, 5, 1.0));
    catalog.upsert(EventType::ScreenShake, makeConfig(0.20, 1.5, 180, 10, 2.0));
    catalog.upsert(EventType::VhsDistortion, makeConfig(0.20, 1.3, 180, 10, 2.5));
    // High intensity only.
    catalog.upsert(EventType::ChromaticAberration, makeConfig(0.15, 2.5, 240, 8, 1.5));
    catalog.upsert(EventType::Glitch, makeConfig(0.20, 1.2, 150, 12, 3.0));
    catalog.upsert(EventType::PhantomTyping, makeConfig(0.08, 1.8, 300, 5, 1.0));
    catalog.upsert(EventType::EntitySpawn, makeConfig(0.15, 1.6, 210, 8, 1.5));
    catalog.upsert(EventType::Whisper, makeConfig(0.10, 1.7, 240, 6, 1.2));
    catalog.upsert(EventType::TimeDilation, makeConfig(0.05, 2.2, 420, 3, 0.5));
    return catalog;
}

bool EventCatalog::contains(EventType type) const { return configs_.count(type) > 0U; }

std::optional<EventTypeConfig> EventCatalog::find(EventType type) const {
    const auto it = configs_.find(type);
    if (it == configs_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void EventCatalog::upsert(EventType type, const EventTypeConfig& config) { configs_[type] = config; }

bool EventCatalog::update(EventType type, const EventTypeConfigUpdate& update) {
    const auto it = configs_.find(type);
    if (it == configs_.end()) {
        return false;
    }
    update.applyTo(it->second);
    return true;
}

bool EventCatalog::setEnabled(EventType type, bool enabled) {
    const auto it = configs_.find(type);
    if (it == configs_.end()) {
        return false;
    }
    it->second.enabled = enabled;
    return true;
}

bool EventCatalog::remove(EventType type) { return configs_.erase(type) > 0U; }

std::vector<EventType> EventCatalog::types() const {
    std::vector<EventType> out;
    out.reserve(configs_.size());
    for (const auto& kv : configs_) {
        out.push_back(kv.first);
    }
    return out;
}

std::size_t EventCatalog::size() const noexcept { return configs_.size(); }

bool EventCatalog::empty() const noexcept { return configs_.empty(); }

} // namespace fxg
