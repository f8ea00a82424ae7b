/**
 * @file circuit_breaker.cpp
 * @brief fxgate source file.
 */

#include "fxgate/fault/circuit_breaker.hpp"

#include <algorithm>
#include <cstdlib>
#include <iostream>
#include <sstream>

namespace fxg {
namespace {

bool traceEnabled() { return std::getenv("FXGATE_TRACE") != nullptr; }

std::string formatDelay(std::chrono::milliseconds delay) {
    const auto minutes = std::chrono::duration_cast<std::chrono::minutes>(delay).count();
    if (minutes >= 1 && delay == std::chrono::minutes(minutes)) {
        return std::to_string(minutes) + (minutes == 1 ? " minute" : " minutes");
    }
    const auto seconds = std::chrono::duration_cast<std::chrono::seconds>(delay).count();
    if (seconds >= 1) {
        return std::to_string(seconds) + (seconds == 1 ? " second" : " seconds");
    }
    return std::to_string(delay.count()) + " ms";
}

} // namespace

const char* toString(ErrorSeverity severity) {
    switch (severity) {
    case ErrorSeverity::Low:
        return "low";
    case ErrorSeverity::Medium:
        return "medium";
    case ErrorSeverity::High:
        return "high";
    case ErrorSeverity::Critical:
        return "critical";
    }
    return "unknown";
}

const char* toString(BreakerState state) {
    switch (state) {
    case BreakerState::Closed:
        return "Closed";
    case BreakerState::Open:
        return "Open";
    case BreakerState::HalfOpen:
        return "HalfOpen";
    }
    return "Unknown";
}

CircuitBreaker::CircuitBreaker(ITimerService& timers, CircuitBreakerOptions options, NoticeCallback onNotice)
    : timers_(timers), clock_(timers.clock()), options_(options), onNotice_(std::move(onNotice)) {
    if (options_.failureThreshold == 0U) {
        options_.failureThreshold = 1U;
    }
}

CircuitBreaker::~CircuitBreaker() {
    std::vector<TaskId> tasks;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& kv : pending_) {
            tasks.push_back(kv.second.task);
        }
        pending_.clear();
    }
    for (const auto task : tasks) {
        timers_.cancel(task);
    }
}

bool CircuitBreaker::admit(const CallContext& context) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (disabled_.count(context.component) == 0U) {
        return true;
    }
    auto& stats = stats_[context.component];
    stats.component = context.component;
    ++stats.skippedCalls;
    if (traceEnabled()) {
        std::cerr << "[fxg-breaker] " << context.component << " is disabled, skipping "
                  << context.operation << '\n';
    }
    return false;
}

void CircuitBreaker::recordSuccess(const std::string& component) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = stats_.find(component);
    if (it != stats_.end()) {
        it->second.consecutiveErrors = 0;
    }
    if (halfOpen_.erase(component) > 0U) {
        std::cerr << "[fxg-breaker] " << component << " probe succeeded, breaker closed\n";
    }
}

void CircuitBreaker::recordFailure(const CallContext& context, const std::string& message) {
    {
        std::ostringstream os;
        os << "[fxg-breaker] " << context.component << "." << context.operation << " failed: " << message;
        if (context.intensity) {
            os << " intensity=" << *context.intensity;
        }
        if (!context.details.empty()) {
            os << " (" << context.details << ")";
        }
        std::cerr << os.str() << '\n';
    }

    std::vector<DegradationNotice> notices;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto now = clock_.now();
        auto [it, created] = stats_.try_emplace(context.component);
        auto& stats = it->second;
        stats.component = context.component;

        // A failure far from the previous one starts a fresh streak.
        if (created || stats.errorCount == 0U || now - stats.lastErrorTime > options_.errorResetWindow) {
            stats.consecutiveErrors = 1;
        } else {
            ++stats.consecutiveErrors;
        }
        ++stats.errorCount;
        stats.lastErrorTime = now;

        if (traceEnabled()) {
            std::cerr << "[fxg-breaker] " << context.component << " errors total=" << stats.errorCount
                      << " consecutive=" << stats.consecutiveErrors << '\n';
        }

        const bool probing = halfOpen_.erase(context.component) > 0U;
        if (disabled_.count(context.component) == 0U &&
            (probing || stats.consecutiveErrors >= options_.failureThreshold)) {
            tripLocked(context.component, ErrorSeverity::High, notices);
        }
    }
    emit(notices);
}

void CircuitBreaker::recordFallbackFailure(const CallContext& context, const std::string& message) {
    std::cerr << "[fxg-breaker] " << context.component << "." << context.operation
              << " (fallback) failed: " << message << '\n';
    std::lock_guard<std::mutex> lock(mutex_);
    auto& stats = stats_[context.component];
    stats.component = context.component;
    ++stats.fallbackFailures;
}

void CircuitBreaker::tripLocked(const std::string& component, ErrorSeverity severity,
                                std::vector<DegradationNotice>& notices) {
    disabled_.insert(component);
    std::cerr << "[fxg-breaker] " << component << " disabled due to repeated failures (severity: "
              << toString(severity) << ")\n";

    const auto name = friendlyName(component);
    if (severity == ErrorSeverity::Critical) {
        notices.push_back({NoticeLevel::Error, component,
                           name + " have been disabled due to critical errors and must be re-enabled manually."});
        return;
    }

    notices.push_back({NoticeLevel::Warning, component,
                       name + " have been temporarily disabled due to errors. They will automatically re-enable in " +
                           formatDelay(options_.recoveryDelay) + "."});

    // A previously scheduled task for this component becomes a no-op through its token.
    const auto token = nextToken_++;
    auto& pending = pending_[component];
    pending.token = token;
    pending.task = timers_.scheduleAfter(options_.recoveryDelay, [this, component, token]() {
        onRecoveryTimer(component, token);
    });
}

void CircuitBreaker::onRecoveryTimer(const std::string& component, std::uint64_t token) {
    std::vector<DegradationNotice> notices;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto it = pending_.find(component);
        if (it == pending_.end() || it->second.token != token) {
            return;
        }
        pending_.erase(it);
        if (disabled_.erase(component) == 0U) {
            return;
        }
        const auto stats = stats_.find(component);
        if (stats != stats_.end()) {
            stats->second.consecutiveErrors = 0;
        }
        if (options_.probeAfterRecovery) {
            halfOpen_.insert(component);
        }
        std::cerr << "[fxg-breaker] " << component << " re-enabled after recovery period\n";
        notices.push_back({NoticeLevel::Info, component, friendlyName(component) + " have been re-enabled."});
    }
    emit(notices);
}

void CircuitBreaker::trip(const std::string& component, ErrorSeverity severity) {
    TaskId stale = kInvalidTaskId;
    std::vector<DegradationNotice> notices;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (disabled_.count(component) > 0U) {
            if (severity != ErrorSeverity::Critical) {
                return;
            }
            // Escalation to Critical drops the pending automatic recovery.
            const auto it = pending_.find(component);
            if (it != pending_.end()) {
                stale = it->second.task;
                pending_.erase(it);
                std::cerr << "[fxg-breaker] " << component << " escalated to critical, recovery cancelled\n";
            }
        } else {
            halfOpen_.erase(component);
            tripLocked(component, severity, notices);
        }
    }
    if (stale != kInvalidTaskId) {
        timers_.cancel(stale);
    }
    emit(notices);
}

void CircuitBreaker::disableComponent(const std::string& component) {
    TaskId task = kInvalidTaskId;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto it = pending_.find(component);
        if (it != pending_.end()) {
            task = it->second.task;
            pending_.erase(it);
        }
        disabled_.insert(component);
        halfOpen_.erase(component);
        std::cerr << "[fxg-breaker] " << component << " manually disabled\n";
    }
    if (task != kInvalidTaskId) {
        timers_.cancel(task);
    }
}

void CircuitBreaker::enableComponent(const std::string& component) {
    TaskId task = kInvalidTaskId;
    std::vector<DegradationNotice> notices;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto it = pending_.find(component);
        if (it != pending_.end()) {
            task = it->second.task;
            pending_.erase(it);
        }
        if (disabled_.erase(component) > 0U) {
            const auto stats = stats_.find(component);
            if (stats != stats_.end()) {
                stats->second.consecutiveErrors = 0;
            }
            std::cerr << "[fxg-breaker] " << component << " re-enabled\n";
            notices.push_back({NoticeLevel::Info, component, friendlyName(component) + " have been re-enabled."});
        }
    }
    // Cancel outside the lock: the recovery task itself takes the lock.
    if (task != kInvalidTaskId) {
        timers_.cancel(task);
    }
    emit(notices);
}

bool CircuitBreaker::isComponentDisabled(const std::string& component) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return disabled_.count(component) > 0U;
}

BreakerState CircuitBreaker::state(const std::string& component) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (disabled_.count(component) > 0U) {
        return BreakerState::Open;
    }
    if (halfOpen_.count(component) > 0U) {
        return BreakerState::HalfOpen;
    }
    return BreakerState::Closed;
}

std::vector<std::string> CircuitBreaker::disabledComponents() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> out(disabled_.begin(), disabled_.end());
    std::sort(out.begin(), out.end());
    return out;
}

std::optional<ComponentErrorStats> CircuitBreaker::statsFor(const std::string& component) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = stats_.find(component);
    if (it == stats_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::unordered_map<std::string, ComponentErrorStats> CircuitBreaker::errorStats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stats_;
}

void CircuitBreaker::resetAllStats() {
    std::vector<TaskId> tasks;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& kv : pending_) {
            tasks.push_back(kv.second.task);
        }
        pending_.clear();
        stats_.clear();
        disabled_.clear();
        halfOpen_.clear();
    }
    for (const auto task : tasks) {
        timers_.cancel(task);
    }
    std::cerr << "[fxg-breaker] all error statistics reset\n";
}

std::string CircuitBreaker::errorReport() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::ostringstream os;
    os << "fxgate Error Report\n" << std::string(50, '=') << "\n\n";

    if (stats_.empty()) {
        os << "No errors recorded.\n";
    } else {
        std::vector<std::string> names;
        for (const auto& kv : stats_) {
            names.push_back(kv.first);
        }
        std::sort(names.begin(), names.end());

        os << "Component Error Statistics:\n\n";
        const auto now = clock_.now();
        for (const auto& name : names) {
            const auto& stats = stats_.at(name);
            os << name << (disabled_.count(name) > 0U ? " [DISABLED]" : "") << ":\n";
            os << "  Total Errors: " << stats.errorCount << "\n";
            os << "  Consecutive Errors: " << stats.consecutiveErrors << "\n";
            os << "  Fallback Failures: " << stats.fallbackFailures << "\n";
            os << "  Skipped Calls: " << stats.skippedCalls << "\n";
            if (stats.errorCount > 0U) {
                os << "  Last Error: " << elapsedMs(stats.lastErrorTime, now).count() << " ms ago\n";
            }
            os << "\n";
        }
    }

    if (!disabled_.empty()) {
        std::vector<std::string> names(disabled_.begin(), disabled_.end());
        std::sort(names.begin(), names.end());
        os << "Disabled Components:\n";
        for (const auto& name : names) {
            os << "  - " << name << "\n";
        }
    }
    return os.str();
}

const CircuitBreakerOptions& CircuitBreaker::options() const noexcept { return options_; }

std::string CircuitBreaker::friendlyName(const std::string& component) {
    static const std::unordered_map<std::string, std::string> names = {
        {"jumpscare", "Jumpscare popups"},
        {"screenDistortion", "Screen distortion effects"},
        {"phantomTyping", "Phantom typing"},
        {"whisperingVariables", "Whispering variables"},
        {"entityPresence", "Entity presence (eyes)"},
        {"contextTrigger", "Context-aware triggers"},
        {"timeDilation", "Time dilation effects"},
        {"easterEgg", "Easter eggs"},
    };
    const auto it = names.find(component);
    return it == names.end() ? component : it->second;
}

void CircuitBreaker::emit(const std::vector<DegradationNotice>& notices) {
    if (!onNotice_) {
        return;
    }
    for (const auto& notice : notices) {
        try {
            onNotice_(notice);
        } catch (const std::exception& ex) {
            std::cerr << "[fxg-breaker] notice handler failed: " << ex.what() << '\n';
        } catch (...) {
            std::cerr << "[fxg-breaker] notice handler failed: unknown exception\n";
        }
    }
}

} // namespace fxg
