/**
 * @file resource_cache.hpp
 * @brief fxgate source file.
 */

#pragma once

#include <cstdint>
#include <cstdlib>
#include <functional>
#include <iostream>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <unordered_map>
#include <utility>
#include <vector>

#include "fxgate/cache/cache_statistics.hpp"
#include "fxgate/core/clock.hpp"
#include "fxgate/core/timer_service.hpp"

namespace fxg {

/**
 * @brief Bookkeeping for one cached value.
 */
template <typename Value>
struct CacheEntry {
    Value value;
    IClock::time_point loadedAt{};
    std::uint64_t accessCount = 0;
    IClock::time_point lastAccessedAt{};
    /// Monotonic access stamp; orders entries touched at the same clock reading.
    std::uint64_t accessSequence = 0;
};

/**
 * @brief Capacity-bounded key/value cache with LRU eviction and TTL expiry.
 *
 * An entry is fresh while `now - loadedAt < ttl`. Reads of stale entries
 * delete them and report a miss. When an insert finds the cache full, the
 * entry with the oldest `lastAccessedAt` is evicted first, so the size never
 * exceeds `capacity`. If a timer service is supplied, expired entries are
 * also swept periodically whether or not they are read again.
 *
 * All entry state is guarded by one mutex; reads, inserts, evictions and
 * sweeps never interleave. Loaders run outside the lock.
 */
template <typename Key, typename Value, typename Hash = std::hash<Key>>
class ResourceCache {
public:
    using Entry = CacheEntry<Value>;

    ResourceCache(CacheOptions options, const IClock& clock, ITimerService* sweeper = nullptr)
        : options_(std::move(options)), clock_(clock), sweeper_(sweeper) {
        if (options_.capacity == 0U) {
            throw std::invalid_argument("ResourceCache capacity must be > 0");
        }
        if (sweeper_ != nullptr && options_.sweepInterval.count() > 0) {
            sweepTask_ = sweeper_->scheduleEvery(options_.sweepInterval, [this]() { cleanupExpired(); });
        }
    }

    ~ResourceCache() {
        if (sweeper_ != nullptr && sweepTask_ != kInvalidTaskId) {
            sweeper_->cancel(sweepTask_);
        }
    }

    ResourceCache(const ResourceCache&) = delete;
    ResourceCache& operator=(const ResourceCache&) = delete;

    /**
     * @brief Return a fresh cached value and record the access.
     */
    std::optional<Value> get(const Key& key) {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto now = clock_.now();
        auto* entry = findFreshLocked(key, now);
        if (entry == nullptr) {
            ++stats_.misses;
            return std::nullopt;
        }
        touchLocked(*entry, now);
        ++stats_.hits;
        return entry->value;
    }

    /**
     * @brief Insert or replace a value; the TTL restarts from now.
     */
    void set(const Key& key, Value value) {
        std::lock_guard<std::mutex> lock(mutex_);
        insertLocked(key, std::move(value), clock_.now());
    }

    /**
     * @brief Get-or-populate.
     *
     * On a hit the loader is not invoked. On a miss it is invoked exactly
     * once; if it throws, nothing is inserted and the exception propagates.
     */
    template <typename Loader>
    Value loadOrCompute(const Key& key, Loader&& loader) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            const auto now = clock_.now();
            if (auto* entry = findFreshLocked(key, now)) {
                touchLocked(*entry, now);
                ++stats_.hits;
                trace("hit");
                return entry->value;
            }
            ++stats_.misses;
        }

        trace("miss, loading");
        Value value = std::invoke(std::forward<Loader>(loader));

        std::lock_guard<std::mutex> lock(mutex_);
        insertLocked(key, value, clock_.now());
        return value;
    }

    bool evict(const Key& key) {
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_.erase(key) > 0U;
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        entries_.clear();
    }

    /**
     * @brief Remove every expired entry.
     * @return number of entries removed.
     */
    std::size_t cleanupExpired() {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto now = clock_.now();
        std::size_t removed = 0;
        for (auto it = entries_.begin(); it != entries_.end();) {
            if (isExpired(it->second, now)) {
                it = entries_.erase(it);
                ++removed;
            } else {
                ++it;
            }
        }
        stats_.expirations += removed;
        if (removed > 0U) {
            trace("swept expired entries");
        }
        return removed;
    }

    /**
     * @brief Fresh-entry test without access bookkeeping.
     */
    bool contains(const Key& key) const {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto it = entries_.find(key);
        return it != entries_.end() && !isExpired(it->second, clock_.now());
    }

    /**
     * @brief Copy of an entry's bookkeeping, expired or not.
     */
    std::optional<Entry> peek(const Key& key) const {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto it = entries_.find(key);
        if (it == entries_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    std::size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_.size();
    }

    CacheStatistics statistics() const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto stats = stats_;
        stats.size = entries_.size();
        stats.capacity = options_.capacity;
        return stats;
    }

    const CacheOptions& options() const noexcept { return options_; }

private:
    bool isExpired(const Entry& entry, IClock::time_point now) const {
        return now - entry.loadedAt >= options_.ttl;
    }

    Entry* findFreshLocked(const Key& key, IClock::time_point now) {
        const auto it = entries_.find(key);
        if (it == entries_.end()) {
            return nullptr;
        }
        if (isExpired(it->second, now)) {
            entries_.erase(it);
            ++stats_.expirations;
            return nullptr;
        }
        return &it->second;
    }

    void touchLocked(Entry& entry, IClock::time_point now) {
        ++entry.accessCount;
        entry.lastAccessedAt = now;
        entry.accessSequence = ++accessCounter_;
    }

    void insertLocked(const Key& key, Value value, IClock::time_point now) {
        auto it = entries_.find(key);
        if (it == entries_.end() && entries_.size() >= options_.capacity) {
            evictLeastRecentlyUsedLocked();
        }

        Entry entry{std::move(value), now, 1U, now, ++accessCounter_};
        if (it != entries_.end()) {
            it->second = std::move(entry);
        } else {
            entries_.emplace(key, std::move(entry));
        }
    }

    void evictLeastRecentlyUsedLocked() {
        auto victim = entries_.end();
        for (auto it = entries_.begin(); it != entries_.end(); ++it) {
            if (victim == entries_.end() || isOlderAccess(it->second, victim->second)) {
                victim = it;
            }
        }
        if (victim != entries_.end()) {
            entries_.erase(victim);
            ++stats_.evictions;
            trace("evicted least recently used entry");
        }
    }

    static bool isOlderAccess(const Entry& lhs, const Entry& rhs) {
        if (lhs.lastAccessedAt != rhs.lastAccessedAt) {
            return lhs.lastAccessedAt < rhs.lastAccessedAt;
        }
        return lhs.accessSequence < rhs.accessSequence;
    }

    void trace(const char* message) const {
        if (std::getenv("FXGATE_TRACE") != nullptr) {
            std::cerr << "[fxg-cache] " << options_.name << ": " << message << '\n';
        }
    }

    CacheOptions options_;
    const IClock& clock_;
    ITimerService* sweeper_ = nullptr;
    TaskId sweepTask_ = kInvalidTaskId;
    mutable std::mutex mutex_;
    std::unordered_map<Key, Entry, Hash> entries_;
    std::uint64_t accessCounter_ = 0;
    CacheStatistics stats_{};
};

} // namespace fxg
