/**
 * @file probability_calculator.cpp
 * @brief fxgate source file.
 */

#include "fxgate/scheduling/probability_calculator.hpp"

#include <algorithm>
#include <cmath>

namespace fxg {
namespace {

CacheOptions memoOptions() {
    CacheOptions options;
    options.name = "probability";
    options.capacity = ProbabilityCalculator::kMemoCapacity;
    options.ttl = ProbabilityCalculator::kMemoTtl;
    options.sweepInterval = std::chrono::milliseconds(60 * 1000);
    return options;
}

double clampIntensity(double intensity) {
    if (!std::isfinite(intensity)) {
        return 0.0;
    }
    return std::clamp(intensity, 0.0, 100.0);
}

} // namespace

ProbabilityCalculator::ProbabilityCalculator(const EventCatalog& catalog,
                                             const EventHistory& history,
                                             const IClock& clock,
                                             ITimerService* sweeper)
    : catalog_(catalog), history_(history), memo_(memoOptions(), clock, sweeper) {}

double ProbabilityCalculator::probability(EventType type, double intensity) {
    const auto normalized = clampIntensity(intensity);
    return memo_.loadOrCompute(ProbabilityKey{type, normalized},
                               [&]() { return compute(type, normalized); });
}

double ProbabilityCalculator::repetitionPenalty(std::size_t recentOccurrences) noexcept {
    switch (recentOccurrences) {
    case 0:
        return 1.0;
    case 1:
        return 0.7;
    case 2:
        return 0.4;
    default:
        return 0.1;
    }
}

void ProbabilityCalculator::invalidate() { memo_.clear(); }

CacheStatistics ProbabilityCalculator::memoStatistics() const { return memo_.statistics(); }

double ProbabilityCalculator::compute(EventType type, double intensity) const {
    const auto config = catalog_.find(type);
    if (!config || !config->enabled) {
        return 0.0;
    }
    if (config->hasSessionCap() && history_.sessionCount(type) >= config->maxPerSession) {
        return 0.0;
    }

    const auto cooldownMs = config->cooldownSeconds * 1000.0;
    double timeFactor = kMaxTimeFactor;
    if (const auto since = history_.timeSinceLast(type)) {
        const auto sinceMs = std::chrono::duration<double, std::milli>(*since).count();
        if (sinceMs < cooldownMs) {
            return 0.0;
        }
        timeFactor = std::min(sinceMs / (cooldownMs * 2.0), kMaxTimeFactor);
    }

    const auto intensityFactor = (intensity / 100.0) * config->intensityMultiplier;
    const auto penalty = repetitionPenalty(history_.occurrencesInLast(type, kRepetitionWindow));
    const auto p = config->baseChance * (1.0 + intensityFactor) * timeFactor * penalty;
    if (!std::isfinite(p)) {
        return 0.0;
    }
    return std::clamp(p, 0.0, 1.0);
}

} // namespace fxg
