#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "fxgate/config/event_catalog.hpp"
#include "fxgate/core/clock.hpp"
#include "fxgate/core/event_type.hpp"

namespace fxg {

/**
 * @brief Immutable record of one committed event.
 */
struct EventRecord {
    EventType type = EventType::Glitch;
    IClock::time_point timestamp{};
    double intensity = 0.0;
    std::optional<std::string> variant;
};

/**
 * @brief Bounded FIFO of recent events plus per-type session counters.
 *
 * Only the last `kCapacity` records are kept; counters cover the whole session
 * and are not affected by FIFO eviction.
 */
class EventHistory {
public:
    static constexpr std::size_t kCapacity = 10;

    explicit EventHistory(const IClock& clock);

    /**
     * @brief Append a record, evict the oldest beyond capacity, bump the counter.
     */
    EventRecord record(EventType type, double intensity,
                       std::optional<std::string> variant = std::nullopt);

    /**
     * @brief Time since the most recent record of `type`; nullopt if none is retained.
     */
    std::optional<IClock::duration> timeSinceLast(EventType type) const;
    /**
     * @brief Occurrences of `type` among the newest `window` records.
     */
    std::size_t occurrencesInLast(EventType type, std::size_t window) const;

    /**
     * @brief Newest `count` records in chronological order.
     */
    std::vector<EventRecord> recentEvents(std::size_t count) const;
    std::vector<EventRecord> history() const;
    std::size_t size() const noexcept;
    double averageIntensity() const;

    std::uint32_t sessionCount(EventType type) const;
    std::unordered_map<EventType, std::uint32_t> sessionCounts() const;
    std::uint64_t totalSessionEvents() const noexcept;
    IClock::time_point sessionStart() const noexcept;

    /**
     * @brief Drop retained records; session counters are kept.
     */
    void clearHistory();
    /**
     * @brief Drop records and counters and restart the session clock.
     */
    void resetSession();

private:
    const IClock& clock_;
    std::deque<EventRecord> records_;
    std::unordered_map<EventType, std::uint32_t> counters_;
    std::uint64_t totalEvents_ = 0;
    IClock::time_point sessionStart_;
};

/**
 * @brief Cooldown queries derived from history and catalog.
 *
 * Unknown event types are always reported as cooling down.
 */
class CooldownTracker {
public:
    CooldownTracker(const EventCatalog& catalog, const EventHistory& history);

    bool isOnCooldown(EventType type) const;
    /**
     * @brief Remaining cooldown, zero when ready.
     *
     * Unknown types report `std::chrono::milliseconds::max()`.
     */
    std::chrono::milliseconds remainingCooldown(EventType type) const;

private:
    const EventCatalog& catalog_;
    const EventHistory& history_;
};

} // namespace fxg
