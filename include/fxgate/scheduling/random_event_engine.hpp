/**
 * @file random_event_engine.hpp
 * @brief fxgate source file.
 */

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "fxgate/cache/cache_statistics.hpp"
#include "fxgate/config/event_catalog.hpp"
#include "fxgate/core/clock.hpp"
#include "fxgate/core/event_type.hpp"
#include "fxgate/core/timer_service.hpp"
#include "fxgate/scheduling/event_history.hpp"
#include "fxgate/scheduling/probability_calculator.hpp"
#include "fxgate/scheduling/random_source.hpp"
#include "fxgate/scheduling/weighted_selector.hpp"

namespace fxg {

struct SessionStats {
    std::chrono::milliseconds duration{0};
    std::uint64_t totalEvents = 0;
    std::unordered_map<EventType, std::uint32_t> perTypeCounts;
    /// Mean intensity over the retained history.
    double averageIntensity = 0.0;
};

/**
 * @brief Driver-facing facade over catalog, history, probability and selection.
 *
 * All calls are serialized on one recursive mutex, so a fire callback passed
 * to `tryTrigger` may call back into the engine from the same thread.
 * The engine does not own the circuit breaker; resetting a session leaves
 * disabled components disabled.
 */
class RandomEventEngine {
public:
    /// Fires the chosen effect; true commits the event to history.
    using FireCallback = std::function<bool(EventType type, double intensity)>;

    /**
     * @throws std::invalid_argument if `catalog` fails validation.
     */
    RandomEventEngine(const IClock& clock,
                      IRandomSource& random,
                      EventCatalog catalog = EventCatalog::defaults(),
                      ITimerService* sweeper = nullptr);

    RandomEventEngine(const RandomEventEngine&) = delete;
    RandomEventEngine& operator=(const RandomEventEngine&) = delete;

    double calculateProbability(EventType type, double intensity);
    /**
     * @brief Choose an event without committing it.
     */
    std::optional<EventType> selectEvent(double intensity);
    EventRecord recordEvent(EventType type, double intensity,
                            std::optional<std::string> variant = std::nullopt);

    /**
     * @brief Select, fire and record as one step.
     *
     * Concurrent callers cannot both pass the same cooldown gate. The event
     * is recorded only when `fire` returns true; an exception from `fire` is
     * logged and treated as not fired.
     */
    std::optional<EventType> tryTrigger(double intensity, const FireCallback& fire);

    bool isOnCooldown(EventType type) const;
    std::chrono::milliseconds remainingCooldown(EventType type) const;

    SessionStats sessionStats() const;
    /**
     * @brief Clear history and session counters; the catalog is unchanged.
     */
    void resetSession();
    void clearHistory();

    bool setEventEnabled(EventType type, bool enabled);
    bool updateEventConfig(EventType type, const EventTypeConfigUpdate& update, std::string& outError);
    /**
     * @brief Swap the whole catalog after validation.
     */
    bool replaceCatalog(const EventCatalog& catalog, std::string& outError);
    EventCatalog catalog() const;

    std::vector<EventRecord> recentEvents(std::size_t count) const;
    std::vector<EventRecord> history() const;
    std::uint32_t sessionCount(EventType type) const;

    /**
     * @brief Drop memoized probabilities.
     */
    void clearCaches();
    CacheStatistics probabilityCacheStatistics() const;

    const IClock& clock() const noexcept;

private:
    static std::string firstError(const EventCatalog& catalog);

    const IClock& clock_;
    mutable std::recursive_mutex mutex_;
    EventCatalog catalog_;
    EventHistory history_;
    CooldownTracker cooldowns_;
    ProbabilityCalculator calculator_;
    WeightedSelector selector_;
};

} // namespace fxg
