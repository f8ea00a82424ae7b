/**
 * @file event_history.cpp
 * @brief fxgate source file.
 */

#include "fxgate/scheduling/event_history.hpp"

#include <algorithm>
#include <cstdlib>
#include <iostream>

namespace fxg {

EventHistory::EventHistory(const IClock& clock) : clock_(clock), sessionStart_(clock.now()) {}

EventRecord EventHistory::record(EventType type, double intensity, std::optional<std::string> variant) {
    EventRecord entry{type, clock_.now(), intensity, std::move(variant)};
    records_.push_back(entry);
    while (records_.size() > kCapacity) {
        records_.pop_front();
    }

    const auto count = ++counters_[type];
    ++totalEvents_;

    if (std::getenv("FXGATE_TRACE") != nullptr) {
        std::cerr << "[fxg-engine] recorded " << toString(type) << " intensity=" << intensity
                  << " history=" << records_.size() << " sessionCount=" << count << '\n';
    }
    return entry;
}

std::optional<IClock::duration> EventHistory::timeSinceLast(EventType type) const {
    for (auto it = records_.rbegin(); it != records_.rend(); ++it) {
        if (it->type == type) {
            return clock_.now() - it->timestamp;
        }
    }
    return std::nullopt;
}

std::size_t EventHistory::occurrencesInLast(EventType type, std::size_t window) const {
    const auto span = std::min(window, records_.size());
    return static_cast<std::size_t>(
        std::count_if(records_.end() - static_cast<std::ptrdiff_t>(span), records_.end(),
                      [type](const EventRecord& r) { return r.type == type; }));
}

std::vector<EventRecord> EventHistory::recentEvents(std::size_t count) const {
    const auto span = std::min(count, records_.size());
    return {records_.end() - static_cast<std::ptrdiff_t>(span), records_.end()};
}

std::vector<EventRecord> EventHistory::history() const { return {records_.begin(), records_.end()}; }

std::size_t EventHistory::size() const noexcept { return records_.size(); }

double EventHistory::averageIntensity() const {
    if (records_.empty()) {
        return 0.0;
    }
    double sum = 0.0;
    for (const auto& r : records_) {
        sum += r.intensity;
    }
    return sum / static_cast<double>(records_.size());
}

std::uint32_t EventHistory::sessionCount(EventType type) const {
    const auto it = counters_.find(type);
    return it == counters_.end() ? 0U : it->second;
}

std::unordered_map<EventType, std::uint32_t> EventHistory::sessionCounts() const { return counters_; }

std::uint64_t EventHistory::totalSessionEvents() const noexcept { return totalEvents_; }

IClock::time_point EventHistory::sessionStart() const noexcept { return sessionStart_; }

void EventHistory::clearHistory() { records_.clear(); }

void EventHistory::resetSession() {
    records_.clear();
    counters_.clear();
    totalEvents_ = 0;
    sessionStart_ = clock_.now();
}

CooldownTracker::CooldownTracker(const EventCatalog& catalog, const EventHistory& history)
    : catalog_(catalog), history_(history) {}

bool CooldownTracker::isOnCooldown(EventType type) const {
    return remainingCooldown(type).count() > 0;
}

std::chrono::milliseconds CooldownTracker::remainingCooldown(EventType type) const {
    const auto config = catalog_.find(type);
    if (!config) {
        return std::chrono::milliseconds::max();
    }

    const auto since = history_.timeSinceLast(type);
    if (!since) {
        return std::chrono::milliseconds(0);
    }

    const auto cooldown = std::chrono::duration_cast<IClock::duration>(config->cooldown());
    if (*since >= cooldown) {
        return std::chrono::milliseconds(0);
    }
    // Round up so a partially elapsed millisecond still reads as cooling down.
    return std::chrono::ceil<std::chrono::milliseconds>(cooldown - *since);
}

} // namespace fxg
