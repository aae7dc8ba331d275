#pragma once

#include <string>

#include "clock/time_source.hpp"
#include "clock/virtual_clock.hpp"
#include "dispatch/dispatch_queue.hpp"
#include "dispatch/event_sender.hpp"
#include "lifecycle/lifecycle_monitor.hpp"
#include "model/config.hpp"
#include "model/status.hpp"
#include "orchestration/cycle_orchestrator.hpp"
#include "scenario/scenario_generator.hpp"

class LogQueue;

/**
 * @brief Control surface over the simulation: owns and wires every component.
 *
 * All operations are safe to call from any foreground thread. Background
 * failures never surface here as exceptions; they show up in getStatus().
 */
class Director {
public:
    /**
     * @param config validated configuration values.
     * @param sender external channel for dispatched events (must outlive the Director).
     * @param time real time source (must outlive the Director).
     * @param log optional log channel; null disables logging.
     */
    Director(const Config& config, EventSender& sender, const TimeSource& time, LogQueue* log = nullptr);
    ~Director();

    Director(const Director&) = delete;
    Director& operator=(const Director&) = delete;

    /**
     * @brief Change the clock speed level.
     * @param level 1..VirtualClock::maxLevel().
     * @param err optional reason on failure.
     * @return false (no state change) for an invalid level.
     */
    bool setSpeedLevel(int level, std::string* err = nullptr);

    /**
     * @brief Start the dispatcher and the continuous cycle loop.
     * @return false if the simulation is already running.
     */
    bool startContinuousSimulation();

    void pauseClock();
    void resumeClock();

    /**
     * @brief Stop everything and return to cycle 1, level 1, empty queue.
     *
     * Delivery counters, error counts and rate window history are kept.
     */
    void resetSimulation();

    /** @brief Stop the cycle loop and the dispatcher; queued events stay queued. */
    void stopContinuousSimulation();

    /** @brief Resolve an active issue of the running cycle. */
    bool resolveIssue(int issueId);

    /** @brief Change the dispatch ceilings at runtime. */
    bool setRateLimits(int perMinute, int perHour, std::string& err);

    SimulationStatus getStatus() const;

    VirtualClock& clock() { return clock_; }
    ScenarioGenerator& generator() { return generator_; }
    DispatchQueue& dispatch() { return dispatch_; }
    LifecycleMonitor& monitor() { return monitor_; }
    CycleOrchestrator& orchestrator() { return orchestrator_; }

private:
    Config config_;
    LogQueue* log_;
    LifecycleMonitor monitor_;
    VirtualClock clock_;
    ScenarioGenerator generator_;
    DispatchQueue dispatch_;
    CycleOrchestrator orchestrator_;
};

/**
 * @brief One machine-readable line: "key=value;" pairs, no newline.
 */
std::string formatStatus(const SimulationStatus& status);

/**
 * @brief Process-level run: logger thread, signal handling, status output, summary file.
 */
class SimulationRunner {
public:
    SimulationRunner() = default;

    /**
     * @brief Run the continuous simulation until SIGINT/SIGTERM.
     * @param config validated configuration values.
     * @param logPathOverride optional log path; if null, a timestamped path is used.
     * @return 0 on clean shutdown, non-zero on failure.
     */
    int run(const Config& config, const std::string* logPathOverride = nullptr);

    /**
     * @brief Path to the most recently written summary file.
     * @return empty if no summary was produced during the last run.
     */
    const std::string& lastSummaryPath() const { return lastSummaryPath_; }
    /**
     * @brief Path to the log file used in the last run.
     */
    const std::string& lastLogPath() const { return lastLogPath_; }

private:
    std::string lastSummaryPath_;
    std::string lastLogPath_;
};

/**
 * @brief Render a duration as "Xd Xh Xm Xs".
 */
std::string formatDuration(long long seconds);
