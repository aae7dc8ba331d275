#pragma once

#include "clock/time_source.hpp"
#include "clock/virtual_clock.hpp"
#include "model/config.hpp"
#include "model/status.hpp"
#include "model/types.hpp"

#include <atomic>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <utility>

class DispatchQueue;
class LifecycleMonitor;
class LogQueue;
class ScenarioGenerator;

/**
 * @brief Runs simulated business weeks back to back until stopped.
 *
 * Each tick turns every simulated hour crossed since the previous tick into
 * generator output and forwards the events to the DispatchQueue. A cycle
 * ends after 7 simulated days or cycleDurationSeconds of running wall time;
 * the clock is then paused for interCyclePauseSeconds and a fresh cycle
 * starts at day 1, startHour, with no issues.
 *
 * With tickIntervalMs > 0 a drive thread calls runTick(); with 0 the caller
 * steps runTick() itself.
 */
class CycleOrchestrator {
public:
    /** @brief Called with the cycle state at the start of every processed hour; may throw. */
    using TickListener = std::function<void(const CycleState&)>;

    CycleOrchestrator(const Config& config, const TimeSource& time, VirtualClock& clock,
                      ScenarioGenerator& generator, DispatchQueue& dispatch, LifecycleMonitor& monitor,
                      LogQueue* log = nullptr);
    ~CycleOrchestrator();

    CycleOrchestrator(const CycleOrchestrator&) = delete;
    CycleOrchestrator& operator=(const CycleOrchestrator&) = delete;

    /**
     * @brief Start cycle 1 at the configured speed level.
     * @return false if not idle.
     */
    bool startContinuous();

    /** @brief Cooperative stop: the tick in flight completes, no new cycle starts. */
    void stop();

    /**
     * @brief One drive iteration on the calling thread.
     * @return false if not running or an hour failed inside the tick.
     */
    bool runTick();

    /**
     * @brief Back to cycle 1, day 1, startHour, no issues.
     * @return false while running.
     */
    bool resetState();

    /** @brief Freeze simulated time; paused time does not count towards the cycle duration. */
    void pauseClock();

    /** @brief Undo pauseClock(); during an inter-cycle pause the next cycle starts the clock. */
    void resumeClock();

    /** @brief Resolve one active issue of the current cycle. */
    bool resolveIssue(int issueId);

    OrchestratorState state() const { return state_.load(); }
    CycleState cycleState() const;
    bool betweenCycles() const;

    int completedCycles() const { return completedCycles_.load(); }
    long long ticksProcessed() const { return ticksProcessed_.load(); }
    long long eventsForwarded() const { return eventsForwarded_.load(); }
    long long tickErrors() const { return tickErrors_.load(); }

    /** @brief Install before startContinuous(); not synchronized with running ticks. */
    void setTickListener(TickListener listener) { listener_ = std::move(listener); }

private:
    void driveLoop();

    // The following run with tickMutex_ held.
    void beginCycle(int cycleNumber);
    void endCycle(const std::string& reason);
    bool processHour(int simDay, int simHour);
    void accumulateRunTime(long long realNow);

    const Config config_;
    const TimeSource& time_;
    VirtualClock& clock_;
    ScenarioGenerator& generator_;
    DispatchQueue& dispatch_;
    LifecycleMonitor& monitor_;
    LogQueue* log_;
    TickListener listener_;

    std::atomic<OrchestratorState> state_;

    // Serializes ticks and clock control; guards the cycle bookkeeping below.
    mutable std::mutex tickMutex_;
    long long cycleStartSimMs_;
    long long lastHourIndex_;
    long long cycleRunMs_;
    long long lastRunSampleMs_;
    bool betweenCycles_;
    long long resumeAtMs_;
    bool userPaused_;

    // Guards cycle_ only; never held while logging or calling other components.
    mutable std::mutex stateMutex_;
    CycleState cycle_;

    std::mutex threadMutex_;
    std::mutex waitMutex_;
    std::condition_variable waitCv_;
    bool stopRequested_;
    std::thread driver_;

    std::atomic<int> completedCycles_;
    std::atomic<long long> ticksProcessed_;
    std::atomic<long long> eventsForwarded_;
    std::atomic<long long> tickErrors_;
};
