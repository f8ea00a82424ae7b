/**
 * @file random_event_engine.cpp
 * @brief fxgate source file.
 */

#include "fxgate/scheduling/random_event_engine.hpp"

#include <iostream>
#include <stdexcept>
#include <utility>

#include "fxgate/config/catalog_validator.hpp"

namespace fxg {

RandomEventEngine::RandomEventEngine(const IClock& clock,
                                     IRandomSource& random,
                                     EventCatalog catalog,
                                     ITimerService* sweeper)
    : clock_(clock),
      catalog_(std::move(catalog)),
      history_(clock),
      cooldowns_(catalog_, history_),
      calculator_(catalog_, history_, clock, sweeper),
      selector_(catalog_, calculator_, random) {
    const auto error = firstError(catalog_);
    if (!error.empty()) {
        throw std::invalid_argument("Invalid event catalog: " + error);
    }
}

double RandomEventEngine::calculateProbability(EventType type, double intensity) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return calculator_.probability(type, intensity);
}

std::optional<EventType> RandomEventEngine::selectEvent(double intensity) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return selector_.select(intensity);
}

EventRecord RandomEventEngine::recordEvent(EventType type, double intensity, std::optional<std::string> variant) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    auto record = history_.record(type, intensity, std::move(variant));
    calculator_.invalidate();
    return record;
}

std::optional<EventType> RandomEventEngine::tryTrigger(double intensity, const FireCallback& fire) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    const auto selected = selector_.select(intensity);
    if (!selected) {
        return std::nullopt;
    }

    bool fired = false;
    try {
        fired = fire ? fire(*selected, intensity) : true;
    } catch (const std::exception& ex) {
        std::cerr << "[fxg-engine] firing " << toString(*selected) << " failed: " << ex.what() << '\n';
    } catch (...) {
        std::cerr << "[fxg-engine] firing " << toString(*selected) << " failed: unknown exception\n";
    }
    if (!fired) {
        return std::nullopt;
    }

    history_.record(*selected, intensity);
    calculator_.invalidate();
    return selected;
}

bool RandomEventEngine::isOnCooldown(EventType type) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return cooldowns_.isOnCooldown(type);
}

std::chrono::milliseconds RandomEventEngine::remainingCooldown(EventType type) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return cooldowns_.remainingCooldown(type);
}

SessionStats RandomEventEngine::sessionStats() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    SessionStats stats;
    stats.duration = elapsedMs(history_.sessionStart(), clock_.now());
    stats.totalEvents = history_.totalSessionEvents();
    stats.perTypeCounts = history_.sessionCounts();
    stats.averageIntensity = history_.averageIntensity();
    return stats;
}

void RandomEventEngine::resetSession() {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    history_.resetSession();
    calculator_.invalidate();
    std::cerr << "[fxg-engine] session reset\n";
}

void RandomEventEngine::clearHistory() {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    history_.clearHistory();
    calculator_.invalidate();
}

bool RandomEventEngine::setEventEnabled(EventType type, bool enabled) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (!catalog_.setEnabled(type, enabled)) {
        return false;
    }
    calculator_.invalidate();
    return true;
}

bool RandomEventEngine::updateEventConfig(EventType type, const EventTypeConfigUpdate& update,
                                          std::string& outError) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    auto candidate = catalog_;
    if (!candidate.update(type, update)) {
        outError = std::string("Unknown event type: ") + toString(type);
        return false;
    }
    return replaceCatalog(candidate, outError);
}

bool RandomEventEngine::replaceCatalog(const EventCatalog& catalog, std::string& outError) {
    const auto error = firstError(catalog);
    if (!error.empty()) {
        outError = "Catalog invalid: " + error;
        return false;
    }
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    // Assign in place; cooldowns, calculator and selector hold references to catalog_.
    catalog_ = catalog;
    calculator_.invalidate();
    return true;
}

EventCatalog RandomEventEngine::catalog() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return catalog_;
}

std::vector<EventRecord> RandomEventEngine::recentEvents(std::size_t count) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return history_.recentEvents(count);
}

std::vector<EventRecord> RandomEventEngine::history() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return history_.history();
}

std::uint32_t RandomEventEngine::sessionCount(EventType type) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return history_.sessionCount(type);
}

void RandomEventEngine::clearCaches() {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    calculator_.invalidate();
}

CacheStatistics RandomEventEngine::probabilityCacheStatistics() const { return calculator_.memoStatistics(); }

const IClock& RandomEventEngine::clock() const noexcept { return clock_; }

std::string RandomEventEngine::firstError(const EventCatalog& catalog) {
    for (const auto& issue : CatalogValidator::validate(catalog)) {
        if (issue.severity == ValidationSeverity::Error) {
            return issue.message;
        }
    }
    return {};
}

} // namespace fxg
