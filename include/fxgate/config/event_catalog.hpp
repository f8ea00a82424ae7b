/**
 * @file event_catalog.hpp
 * @brief fxgate source file.
 */

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <vector>

#include "fxgate/core/event_type.hpp"

namespace fxg {

/// `maxPerSession` value meaning "no session cap".
inline constexpr std::uint32_t kUnlimitedPerSession = 0;

/**
 * @brief Static trigger configuration for one event type.
 */
struct EventTypeConfig {
    /// Base probability in [0, 1] before intensity/time/repetition factors.
    double baseChance = 0.0;
    /// Scale applied to normalized intensity; >= 0.
    double intensityMultiplier = 1.0;
    /// Minimum time between two occurrences; > 0.
    double cooldownSeconds = 60.0;
    /// Occurrences allowed per session, `kUnlimitedPerSession` for no cap.
    std::uint32_t maxPerSession = kUnlimitedPerSession;
    /// Static selection weight; >= 0.
    double weight = 1.0;
    bool enabled = true;

    bool hasSessionCap() const noexcept { return maxPerSession != kUnlimitedPerSession; }
    std::chrono::milliseconds cooldown() const;
};

/**
 * @brief Partial update applied over an existing `EventTypeConfig`.
 */
struct EventTypeConfigUpdate {
    std::optional<double> baseChance;
    std::optional<double> intensityMultiplier;
    std::optional<double> cooldownSeconds;
    std::optional<std::uint32_t> maxPerSession;
    std::optional<double> weight;
    std::optional<bool> enabled;

    void applyTo(EventTypeConfig& config) const;
};

/**
 * @brief Per-event-type configuration table.
 *
 * The catalog is plain data with no locking; owners serialize mutation.
 * Iteration order follows `EventType` declaration order.
 */
class EventCatalog {
public:
    EventCatalog() = default;

    /**
     * @brief Catalog with the nine built-in event types and their tuning.
     */
    static EventCatalog defaults();

    bool contains(EventType type) const;
    std::optional<EventTypeConfig> find(EventType type) const;
    void upsert(EventType type, const EventTypeConfig& config);
    /**
     * @brief Apply a partial update to a known type.
     * @return false if the type is not in the catalog.
     */
    bool update(EventType type, const EventTypeConfigUpdate& update);
    bool setEnabled(EventType type, bool enabled);
    bool remove(EventType type);

    std::vector<EventType> types() const;
    std::size_t size() const noexcept;
    bool empty() const noexcept;

private:
    std::map<EventType, EventTypeConfig> configs_;
};

} // namespace fxg
