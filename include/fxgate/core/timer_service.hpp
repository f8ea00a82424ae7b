/**
 * @file timer_service.hpp
 * @brief fxgate source file.
 */

#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <thread>

#include "fxgate/core/clock.hpp"

namespace fxg {

/// Cancellation token for a scheduled task. Zero never names a live task.
using TaskId = std::uint64_t;
inline constexpr TaskId kInvalidTaskId = 0;

/**
 * @brief Abstract scheduler for the time-driven parts of the engine.
 *
 * Breaker recovery, cache sweeps and scheduler ticks all run as tasks on an
 * implementation of this interface. A task is cancelled through its `TaskId`;
 * cancelling an already-fired or unknown task is a harmless no-op.
 */
class ITimerService {
public:
    using Task = std::function<void()>;

    virtual ~ITimerService() = default;

    /**
     * @brief Run `task` once after `delay`.
     */
    virtual TaskId scheduleAfter(std::chrono::milliseconds delay, Task task) = 0;
    /**
     * @brief Run `task` every `period`, first run one period from now.
     */
    virtual TaskId scheduleEvery(std::chrono::milliseconds period, Task task) = 0;
    /**
     * @brief Cancel a pending task.
     * @return true if the task was still pending.
     */
    virtual bool cancel(TaskId id) = 0;

    virtual std::size_t pendingTasks() const = 0;
    virtual const IClock& clock() const = 0;
};

/**
 * @brief Bookkeeping shared by timer implementations.
 */
class TaskTable {
public:
    struct Entry {
        TaskId id = kInvalidTaskId;
        IClock::time_point due{};
        std::chrono::milliseconds period{0};
        ITimerService::Task task;
    };

    TaskId add(IClock::time_point due, std::chrono::milliseconds period, ITimerService::Task task);
    bool remove(TaskId id);
    std::optional<IClock::time_point> earliestDue() const;
    /**
     * @brief Take the earliest task due at or before `now`.
     *
     * One-shot tasks are removed; periodic tasks stay in the table with
     * their next due time and a copy of the callable is returned.
     */
    std::optional<Entry> popDue(IClock::time_point now);
    std::size_t size() const noexcept;
    void clear();

private:
    TaskId nextId_ = 1;
    std::map<TaskId, Entry> entries_;
};

/**
 * @brief Runs tasks on one dedicated worker thread against the steady clock.
 */
class ThreadTimerService final : public ITimerService {
public:
    ThreadTimerService();
    ~ThreadTimerService() override;

    ThreadTimerService(const ThreadTimerService&) = delete;
    ThreadTimerService& operator=(const ThreadTimerService&) = delete;

    TaskId scheduleAfter(std::chrono::milliseconds delay, Task task) override;
    TaskId scheduleEvery(std::chrono::milliseconds period, Task task) override;
    /**
     * @brief Cancel a task; waits for it if it is executing on the worker.
     */
    bool cancel(TaskId id) override;
    std::size_t pendingTasks() const override;
    const IClock& clock() const override;

    void stop();
    bool isRunning() const noexcept;

private:
    void workerLoop();

    std::atomic<bool> running_{false};
    mutable std::mutex mutex_;
    std::condition_variable wake_;
    std::condition_variable idle_;
    TaskTable table_;
    TaskId executing_ = kInvalidTaskId;
    std::thread worker_;
};

/**
 * @brief Deterministic timer driven by a `ManualClock`, for tests and replay.
 *
 * Tasks never run on their own: `advance()` moves the clock forward and runs
 * every task that falls due on the way, in due-time order, on the caller's
 * thread.
 */
class ManualTimerService final : public ITimerService {
public:
    explicit ManualTimerService(ManualClock& clock);

    TaskId scheduleAfter(std::chrono::milliseconds delay, Task task) override;
    TaskId scheduleEvery(std::chrono::milliseconds period, Task task) override;
    bool cancel(TaskId id) override;
    std::size_t pendingTasks() const override;
    const IClock& clock() const override;

    /**
     * @brief Advance the clock by `delta`, running tasks that become due.
     * @return number of task executions.
     */
    std::size_t advance(std::chrono::milliseconds delta);
    /**
     * @brief Run tasks already due at the current clock reading.
     */
    std::size_t runDue();

private:
    ManualClock& clock_;
    mutable std::mutex mutex_;
    TaskTable table_;
};

} // namespace fxg
