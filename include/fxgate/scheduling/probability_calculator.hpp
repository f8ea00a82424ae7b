/**
 * @file probability_calculator.hpp
 * @brief fxgate source file.
 */

#pragma once

#include <chrono>
#include <cstddef>
#include <functional>

#include "fxgate/cache/resource_cache.hpp"
#include "fxgate/config/event_catalog.hpp"
#include "fxgate/core/clock.hpp"
#include "fxgate/core/event_type.hpp"
#include "fxgate/core/timer_service.hpp"
#include "fxgate/scheduling/event_history.hpp"

namespace fxg {

/**
 * @brief Memo key for one probability evaluation.
 */
struct ProbabilityKey {
    EventType type = EventType::Glitch;
    double intensity = 0.0;

    bool operator==(const ProbabilityKey& other) const noexcept {
        return type == other.type && intensity == other.intensity;
    }
};

struct ProbabilityKeyHash {
    std::size_t operator()(const ProbabilityKey& key) const noexcept {
        const auto h1 = std::hash<int>{}(static_cast<int>(key.type));
        const auto h2 = std::hash<double>{}(key.intensity);
        return h1 ^ (h2 + 0x9e3779b97f4a7c15ULL + (h1 << 6U) + (h1 >> 2U));
    }
};

/**
 * @brief Combines intensity, cooldown, session caps and repetition into a probability.
 *
 * p = clamp(baseChance * (1 + intensity/100 * intensityMultiplier)
 *           * timeFactor * repetitionPenalty, 0, 1)
 *
 * Disabled, unknown, capped and cooling-down types are hard-gated to 0.
 * `timeFactor` ramps with time since the type last fired and saturates at 2
 * once twice the cooldown has elapsed (or the type never fired).
 * Results are memoized per (type, intensity) for `kMemoTtl`.
 */
class ProbabilityCalculator {
public:
    static constexpr std::chrono::milliseconds kMemoTtl{100};
    static constexpr std::size_t kMemoCapacity = 256;
    static constexpr std::size_t kRepetitionWindow = 5;
    static constexpr double kMaxTimeFactor = 2.0;

    ProbabilityCalculator(const EventCatalog& catalog,
                          const EventHistory& history,
                          const IClock& clock,
                          ITimerService* sweeper = nullptr);

    /**
     * @brief Probability in [0, 1]; intensity is clamped to [0, 100].
     */
    double probability(EventType type, double intensity);

    /**
     * @brief Discrete penalty for recent repeats: 1.0, 0.7, 0.4, then 0.1.
     */
    static double repetitionPenalty(std::size_t recentOccurrences) noexcept;

    /**
     * @brief Drop memoized values; call after history or catalog changes.
     */
    void invalidate();
    CacheStatistics memoStatistics() const;

private:
    double compute(EventType type, double intensity) const;

    const EventCatalog& catalog_;
    const EventHistory& history_;
    ResourceCache<ProbabilityKey, double, ProbabilityKeyHash> memo_;
};

} // namespace fxg
