/**
 * @file timer_service.cpp
 * @brief fxgate source file.
 */

#include "fxgate/core/timer_service.hpp"

#include <exception>
#include <iostream>
#include <stdexcept>

namespace fxg {
namespace {

void runTask(const TaskTable::Entry& entry) {
    try {
        entry.task();
    } catch (const std::exception& ex) {
        std::cerr << "[fxg-timer] task " << entry.id << " failed: " << ex.what() << '\n';
    } catch (...) {
        std::cerr << "[fxg-timer] task " << entry.id << " failed: unknown exception\n";
    }
}

void requirePositivePeriod(std::chrono::milliseconds period) {
    if (period.count() <= 0) {
        throw std::invalid_argument("periodic task requires a positive period");
    }
}

std::chrono::milliseconds clampDelay(std::chrono::milliseconds delay) {
    return delay.count() < 0 ? std::chrono::milliseconds(0) : delay;
}

} // namespace

TaskId TaskTable::add(IClock::time_point due, std::chrono::milliseconds period, ITimerService::Task task) {
    const TaskId id = nextId_++;
    entries_.emplace(id, Entry{id, due, period, std::move(task)});
    return id;
}

bool TaskTable::remove(TaskId id) { return entries_.erase(id) > 0U; }

std::optional<IClock::time_point> TaskTable::earliestDue() const {
    std::optional<IClock::time_point> earliest;
    for (const auto& [id, entry] : entries_) {
        (void)id;
        if (!earliest || entry.due < *earliest) {
            earliest = entry.due;
        }
    }
    return earliest;
}

std::optional<TaskTable::Entry> TaskTable::popDue(IClock::time_point now) {
    auto selected = entries_.end();
    for (auto it = entries_.begin(); it != entries_.end(); ++it) {
        if (it->second.due > now) {
            continue;
        }
        // Ties resolve to the lower id, i.e. scheduling order.
        if (selected == entries_.end() || it->second.due < selected->second.due) {
            selected = it;
        }
    }
    if (selected == entries_.end()) {
        return std::nullopt;
    }

    if (selected->second.period.count() > 0) {
        Entry copy = selected->second;
        selected->second.due += selected->second.period;
        return copy;
    }

    Entry entry = std::move(selected->second);
    entries_.erase(selected);
    return entry;
}

std::size_t TaskTable::size() const noexcept { return entries_.size(); }

void TaskTable::clear() { entries_.clear(); }

ThreadTimerService::ThreadTimerService() {
    running_.store(true);
    worker_ = std::thread([this]() { workerLoop(); });
}

ThreadTimerService::~ThreadTimerService() { stop(); }

TaskId ThreadTimerService::scheduleAfter(std::chrono::milliseconds delay, Task task) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto id = table_.add(SystemClock::instance().now() + clampDelay(delay),
                               std::chrono::milliseconds(0), std::move(task));
    wake_.notify_all();
    return id;
}

TaskId ThreadTimerService::scheduleEvery(std::chrono::milliseconds period, Task task) {
    requirePositivePeriod(period);
    std::lock_guard<std::mutex> lock(mutex_);
    const auto id = table_.add(SystemClock::instance().now() + period, period, std::move(task));
    wake_.notify_all();
    return id;
}

bool ThreadTimerService::cancel(TaskId id) {
    if (id == kInvalidTaskId) {
        return false;
    }
    std::unique_lock<std::mutex> lock(mutex_);
    const bool removed = table_.remove(id);
    if (std::this_thread::get_id() != worker_.get_id()) {
        idle_.wait(lock, [&]() { return executing_ != id; });
    }
    wake_.notify_all();
    return removed;
}

std::size_t ThreadTimerService::pendingTasks() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return table_.size();
}

const IClock& ThreadTimerService::clock() const { return SystemClock::instance(); }

void ThreadTimerService::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        running_.store(false);
        table_.clear();
    }
    wake_.notify_all();
    if (worker_.joinable() && std::this_thread::get_id() != worker_.get_id()) {
        worker_.join();
    }
}

bool ThreadTimerService::isRunning() const noexcept { return running_.load(); }

void ThreadTimerService::workerLoop() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (running_.load()) {
        const auto due = table_.earliestDue();
        if (!due) {
            wake_.wait(lock);
            continue;
        }
        const auto now = SystemClock::instance().now();
        if (*due > now) {
            wake_.wait_until(lock, *due);
            continue;
        }

        auto entry = table_.popDue(now);
        if (!entry) {
            continue;
        }
        executing_ = entry->id;
        lock.unlock();
        runTask(*entry);
        lock.lock();
        executing_ = kInvalidTaskId;
        idle_.notify_all();
    }
}

ManualTimerService::ManualTimerService(ManualClock& clock) : clock_(clock) {}

TaskId ManualTimerService::scheduleAfter(std::chrono::milliseconds delay, Task task) {
    std::lock_guard<std::mutex> lock(mutex_);
    return table_.add(clock_.now() + clampDelay(delay), std::chrono::milliseconds(0), std::move(task));
}

TaskId ManualTimerService::scheduleEvery(std::chrono::milliseconds period, Task task) {
    requirePositivePeriod(period);
    std::lock_guard<std::mutex> lock(mutex_);
    return table_.add(clock_.now() + period, period, std::move(task));
}

bool ManualTimerService::cancel(TaskId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return table_.remove(id);
}

std::size_t ManualTimerService::pendingTasks() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return table_.size();
}

const IClock& ManualTimerService::clock() const { return clock_; }

std::size_t ManualTimerService::advance(std::chrono::milliseconds delta) {
    const auto target = clock_.now() + clampDelay(delta);
    std::size_t runs = 0;

    while (true) {
        std::optional<TaskTable::Entry> entry;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            const auto due = table_.earliestDue();
            if (!due || *due > target) {
                break;
            }
            if (*due > clock_.now()) {
                clock_.set(*due);
            }
            entry = table_.popDue(clock_.now());
        }
        if (!entry) {
            break;
        }
        // Tasks run unlocked so they can schedule or cancel other tasks.
        runTask(*entry);
        ++runs;
    }

    if (clock_.now() < target) {
        clock_.set(target);
    }
    return runs;
}

std::size_t ManualTimerService::runDue() { return advance(std::chrono::milliseconds(0)); }

} // namespace fxg
