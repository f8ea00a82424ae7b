/**
 * @file circuit_breaker.hpp
 * @brief fxgate source file.
 */

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <type_traits>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

#include "fxgate/core/clock.hpp"
#include "fxgate/core/timer_service.hpp"

namespace fxg {

enum class ErrorSeverity {
    Low,      ///< Minor issue, effect skipped.
    Medium,   ///< Effect failed, fallback attempted.
    High,     ///< Component disabled until the recovery timer fires.
    Critical, ///< Component disabled until re-enabled by hand.
};

const char* toString(ErrorSeverity severity);

enum class BreakerState {
    Closed,
    Open,
    /// Re-enabled after recovery; the next failure re-opens immediately.
    HalfOpen,
};

const char* toString(BreakerState state);

/**
 * @brief Identifies one guarded call for logging and accounting.
 */
struct CallContext {
    std::string component;
    std::string operation;
    std::optional<double> intensity;
    std::string details;
};

/**
 * @brief Failure accounting for one component, created on its first failure.
 */
struct ComponentErrorStats {
    std::string component;
    std::uint64_t errorCount = 0;
    IClock::time_point lastErrorTime{};
    std::uint32_t consecutiveErrors = 0;
    std::uint64_t fallbackFailures = 0;
    std::uint64_t skippedCalls = 0;
};

enum class NoticeLevel { Info, Warning, Error };

/**
 * @brief User-facing, non-fatal message about a degraded or recovered feature.
 */
struct DegradationNotice {
    NoticeLevel level = NoticeLevel::Warning;
    std::string component;
    std::string message;
};

struct CircuitBreakerOptions {
    /// Consecutive failures that open the breaker.
    std::uint32_t failureThreshold = 3;
    /// A failure later than this after the previous one starts a new streak.
    std::chrono::milliseconds errorResetWindow{60 * 1000};
    /// Open duration before automatic re-close.
    std::chrono::milliseconds recoveryDelay{5 * 60 * 1000};
    /// Upper bound for `executeAsync` before the call counts as failed.
    std::chrono::milliseconds callTimeout{5 * 1000};
    /// Re-close into HalfOpen: one failure re-opens instead of `failureThreshold`.
    bool probeAfterRecovery = false;
};

/**
 * @brief Per-component fault isolator for calls into effect handlers.
 *
 * Every component starts Closed. A thrown exception counts as a failure;
 * `failureThreshold` consecutive failures (within `errorResetWindow` of each
 * other) open the breaker: the component joins the disabled set, a
 * degradation notice is emitted and a recovery task is scheduled. While open,
 * calls skip the operation and resolve to the fallback result or nullopt.
 * Recovery, manual re-enable and `resetAllStats()` all cancel the pending
 * recovery task; a recovery task that fires late is a no-op.
 *
 * The operation and fallback run without the breaker lock held.
 */
class CircuitBreaker {
public:
    using NoticeCallback = std::function<void(const DegradationNotice&)>;

    /// Marker for "no fallback".
    struct NoFallback {};

    CircuitBreaker(ITimerService& timers,
                   CircuitBreakerOptions options = {},
                   NoticeCallback onNotice = {});
    ~CircuitBreaker();

    CircuitBreaker(const CircuitBreaker&) = delete;
    CircuitBreaker& operator=(const CircuitBreaker&) = delete;

    /**
     * @brief Run a synchronous operation through the breaker.
     * @return operation result, fallback result, or nullopt.
     */
    template <typename Operation, typename Fallback = NoFallback>
    auto execute(const CallContext& context, Operation&& operation, Fallback&& fallback = Fallback{})
        -> std::optional<std::invoke_result_t<Operation&>> {
        using Result = std::invoke_result_t<Operation&>;
        static_assert(!std::is_void_v<Result>, "guarded operations must return a value");

        if (!admit(context)) {
            return runFallback<Result>(context, fallback);
        }
        try {
            Result result = std::invoke(operation);
            recordSuccess(context.component);
            return result;
        } catch (const std::exception& ex) {
            recordFailure(context, ex.what());
        } catch (...) {
            recordFailure(context, "unknown exception");
        }
        return runFallback<Result>(context, fallback);
    }

    /**
     * @brief Run an operation on its own thread and wait at most `callTimeout`.
     *
     * A timed-out operation counts as a failure and is left to finish on its
     * own; stopping it is the handler's responsibility.
     */
    template <typename Operation, typename Fallback = NoFallback>
    auto executeAsync(const CallContext& context, Operation operation, Fallback&& fallback = Fallback{})
        -> std::optional<std::invoke_result_t<Operation&>> {
        using Result = std::invoke_result_t<Operation&>;
        static_assert(!std::is_void_v<Result>, "guarded operations must return a value");

        if (!admit(context)) {
            return runFallback<Result>(context, fallback);
        }

        auto task = std::make_shared<std::packaged_task<Result()>>(std::move(operation));
        auto future = task->get_future();
        try {
            std::thread([task]() { (*task)(); }).detach();
        } catch (const std::exception& ex) {
            recordFailure(context, std::string("cannot start operation thread: ") + ex.what());
            return runFallback<Result>(context, fallback);
        }

        if (future.wait_for(options_.callTimeout) != std::future_status::ready) {
            recordFailure(context, "timed out after " + std::to_string(options_.callTimeout.count()) + " ms");
            return runFallback<Result>(context, fallback);
        }

        try {
            Result result = future.get();
            recordSuccess(context.component);
            return result;
        } catch (const std::exception& ex) {
            recordFailure(context, ex.what());
        } catch (...) {
            recordFailure(context, "unknown exception");
        }
        return runFallback<Result>(context, fallback);
    }

    /**
     * @brief Open the breaker for a component as if its threshold was reached.
     *
     * `Critical` disables without a recovery task; other severities schedule
     * the usual recovery. For a component that is already disabled only a
     * `Critical` trip has an effect: it cancels the pending recovery.
     */
    void trip(const std::string& component, ErrorSeverity severity);
    /**
     * @brief Disable a component by hand; no notice.
     *
     * Cancels a pending recovery, so the component stays disabled until
     * `enableComponent` or `resetAllStats`.
     */
    void disableComponent(const std::string& component);
    /**
     * @brief Re-enable a component and cancel its pending recovery task.
     *
     * A no-op for components that are not disabled.
     */
    void enableComponent(const std::string& component);

    bool isComponentDisabled(const std::string& component) const;
    BreakerState state(const std::string& component) const;
    std::vector<std::string> disabledComponents() const;
    std::optional<ComponentErrorStats> statsFor(const std::string& component) const;
    std::unordered_map<std::string, ComponentErrorStats> errorStats() const;
    /**
     * @brief Clear stats and the disabled set, cancelling pending recoveries.
     */
    void resetAllStats();
    std::string errorReport() const;

    const CircuitBreakerOptions& options() const noexcept;

    /**
     * @brief Display name used in notices, e.g. "Jumpscare popups".
     */
    static std::string friendlyName(const std::string& component);

private:
    struct PendingRecovery {
        TaskId task = kInvalidTaskId;
        std::uint64_t token = 0;
    };

    bool admit(const CallContext& context);
    void recordSuccess(const std::string& component);
    void recordFailure(const CallContext& context, const std::string& message);
    void recordFallbackFailure(const CallContext& context, const std::string& message);
    void onRecoveryTimer(const std::string& component, std::uint64_t token);
    void tripLocked(const std::string& component, ErrorSeverity severity,
                    std::vector<DegradationNotice>& notices);
    void emit(const std::vector<DegradationNotice>& notices);

    template <typename Result, typename Fallback>
    std::optional<Result> runFallback(const CallContext& context, Fallback& fallback) {
        if constexpr (std::is_same_v<std::decay_t<Fallback>, NoFallback>) {
            (void)context;
            (void)fallback;
            return std::nullopt;
        } else {
            // Fallback failures are logged and counted, never fed back into the trip logic.
            try {
                return std::optional<Result>(std::invoke(fallback));
            } catch (const std::exception& ex) {
                recordFallbackFailure(context, ex.what());
            } catch (...) {
                recordFallbackFailure(context, "unknown exception");
            }
            return std::nullopt;
        }
    }

    ITimerService& timers_;
    const IClock& clock_;
    CircuitBreakerOptions options_;
    NoticeCallback onNotice_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, ComponentErrorStats> stats_;
    std::unordered_set<std::string> disabled_;
    std::unordered_set<std::string> halfOpen_;
    std::unordered_map<std::string, PendingRecovery> pending_;
    std::uint64_t nextToken_ = 1;
};

} // namespace fxg
