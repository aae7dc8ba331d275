#pragma once

#include "clock/time_source.hpp"
#include "model/status.hpp"
#include "model/types.hpp"

#include <mutex>
#include <string>
#include <vector>

constexpr const char* kWorkerClock = "clock";
constexpr const char* kWorkerOrchestrator = "orchestrator";
constexpr const char* kWorkerDispatcher = "dispatcher";

/** @brief The worker set the Director registers. */
std::vector<std::string> defaultWorkerNames();

/**
 * @brief Shared start/stop/error bookkeeping for the long-running workers.
 *
 * Transitions: stopped->starting, errored->starting, starting->active,
 * starting|active->errored (fatal error), any->stopped. Mutators return false
 * for an unknown worker or a transition outside that set. Every call is a
 * short critical section; nothing waits on worker activity.
 */
class LifecycleMonitor {
public:
    LifecycleMonitor(const std::vector<std::string>& names, const TimeSource& time);

    bool reportStarting(const std::string& name);
    bool reportActive(const std::string& name);

    /**
     * @brief Count an error against a worker.
     *
     * Recoverable errors keep the state; Fatal moves the worker to errored.
     */
    bool reportError(const std::string& name, const std::string& error,
                     ErrorSeverity severity = ErrorSeverity::Recoverable);

    bool reportStopped(const std::string& name);

    /**
     * @brief 100 x active/total minus 5 per counted error, clamped to [0, 100].
     */
    int healthScore() const;

    int totalErrors() const;

    /** @brief Copy of every worker record, in registration order. */
    std::vector<WorkerStatus> snapshot() const;

    /** @brief Copy of one record; false for an unknown name. */
    bool status(const std::string& name, WorkerStatus& out) const;

private:
    // Caller holds mutex_.
    WorkerStatus* findLocked(const std::string& name);

    const TimeSource& time_;
    mutable std::mutex mutex_;
    std::vector<WorkerStatus> workers_;
};
