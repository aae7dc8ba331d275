#include "orchestration/cycle_orchestrator.hpp"

#include "dispatch/dispatch_queue.hpp"
#include "lifecycle/lifecycle_monitor.hpp"
#include "logging/logger.hpp"
#include "scenario/scenario_generator.hpp"

#include <chrono>
#include <exception>
#include <vector>

CycleOrchestrator::CycleOrchestrator(const Config& config, const TimeSource& time, VirtualClock& clock,
                                     ScenarioGenerator& generator, DispatchQueue& dispatch,
                                     LifecycleMonitor& monitor, LogQueue* log)
    : config_(config),
      time_(time),
      clock_(clock),
      generator_(generator),
      dispatch_(dispatch),
      monitor_(monitor),
      log_(log),
      state_(OrchestratorState::Idle),
      cycleStartSimMs_(0),
      lastHourIndex_(-1),
      cycleRunMs_(0),
      lastRunSampleMs_(0),
      betweenCycles_(false),
      resumeAtMs_(0),
      userPaused_(false),
      stopRequested_(false),
      completedCycles_(0),
      ticksProcessed_(0),
      eventsForwarded_(0),
      tickErrors_(0) {
    cycle_.simHour = config_.startHour;
}

CycleOrchestrator::~CycleOrchestrator() {
    stop();
}

bool CycleOrchestrator::startContinuous() {
    std::lock_guard<std::mutex> threadLock(threadMutex_);
    if (state_.load() != OrchestratorState::Idle) {
        return false;
    }
    monitor_.reportStarting(kWorkerClock);
    monitor_.reportStarting(kWorkerOrchestrator);

    clock_.setLevel(config_.defaultSpeedLevel);
    {
        std::lock_guard<std::mutex> tickLock(tickMutex_);
        userPaused_ = false;
        completedCycles_.store(0);
        state_.store(OrchestratorState::Running);
        beginCycle(1);
    }
    {
        std::lock_guard<std::mutex> lock(waitMutex_);
        stopRequested_ = false;
    }
    if (config_.tickIntervalMs > 0) {
        driver_ = std::thread(&CycleOrchestrator::driveLoop, this);
    }
    monitor_.reportActive(kWorkerClock);
    monitor_.reportActive(kWorkerOrchestrator);
    logEvent(log_, Role::Orchestrator,
             std::string("Continuous simulation started at level ") + std::to_string(clock_.level()) + " ("
             + VirtualClock::speedName(clock_.level()) + ")");
    return true;
}

void CycleOrchestrator::stop() {
    std::lock_guard<std::mutex> threadLock(threadMutex_);
    if (state_.load() == OrchestratorState::Idle) {
        return;
    }
    state_.store(OrchestratorState::Stopping);
    {
        std::lock_guard<std::mutex> lock(waitMutex_);
        stopRequested_ = true;
    }
    waitCv_.notify_all();
    if (driver_.joinable()) {
        driver_.join();
    }
    {
        std::lock_guard<std::mutex> tickLock(tickMutex_);
        accumulateRunTime(time_.nowMs());
        clock_.pause();
        betweenCycles_ = false;
    }
    state_.store(OrchestratorState::Idle);
    monitor_.reportStopped(kWorkerOrchestrator);
    monitor_.reportStopped(kWorkerClock);
    logEvent(log_, Role::Orchestrator,
             "Continuous simulation stopped after " + std::to_string(completedCycles_.load()) + " completed cycles");
}

void CycleOrchestrator::driveLoop() {
    const auto interval = std::chrono::milliseconds(config_.tickIntervalMs);
    while (true) {
        runTick();
        std::unique_lock<std::mutex> lock(waitMutex_);
        if (waitCv_.wait_for(lock, interval, [this] { return stopRequested_; })) {
            break;
        }
    }
}

void CycleOrchestrator::accumulateRunTime(long long realNow) {
    if (clock_.running() && realNow > lastRunSampleMs_) {
        cycleRunMs_ += realNow - lastRunSampleMs_;
    }
    lastRunSampleMs_ = realNow;
}

bool CycleOrchestrator::runTick() {
    std::lock_guard<std::mutex> tickLock(tickMutex_);
    if (state_.load() != OrchestratorState::Running) {
        return false;
    }
    long long realNow = time_.nowMs();
    if (betweenCycles_) {
        if (realNow < resumeAtMs_) {
            return true;
        }
        beginCycle(completedCycles_.load() + 1);
    }
    accumulateRunTime(realNow);

    bool ok = true;
    long long target = (clock_.nowMs() - cycleStartSimMs_) / kMsPerSimHour;
    for (long long idx = lastHourIndex_ + 1; idx <= target; ++idx) {
        long long absHour = config_.startHour + idx;
        int simDay = static_cast<int>(1 + absHour / kHoursPerDay);
        int simHour = static_cast<int>(absHour % kHoursPerDay);
        if (simDay > kDaysPerCycle) {
            endCycle("7 simulated days");
            return ok;
        }
        if (!processHour(simDay, simHour)) {
            ok = false;
        }
        lastHourIndex_ = idx;
    }

    long long budgetMs = static_cast<long long>(config_.cycleDurationSeconds) * 1000LL;
    if (budgetMs > 0 && cycleRunMs_ >= budgetMs) {
        endCycle("duration of " + std::to_string(config_.cycleDurationSeconds) + "s");
    }
    return ok;
}

bool CycleOrchestrator::processHour(int simDay, int simHour) {
    CycleState snapshot;
    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        cycle_.simDay = simDay;
        cycle_.simHour = simHour;
        snapshot = cycle_;
    }
    try {
        if (listener_) {
            listener_(snapshot);
        }
        std::vector<Issue> issues = snapshot.issues;
        ScenarioTick tick = generator_.generate(simDay, simHour, issues, snapshot.cycleNumber);
        {
            std::lock_guard<std::mutex> lock(stateMutex_);
            cycle_.issues = issues;
        }
        ++ticksProcessed_;

        for (const auto& issue : tick.resolved) {
            logEvent(log_, Role::Generator, "Issue resolved id=" + std::to_string(issue.id) + " " + issue.kind);
        }
        for (const auto& issue : tick.raised) {
            logEvent(log_, Role::Generator,
                     "Issue raised id=" + std::to_string(issue.id) + " " + issue.kind + " severity="
                     + severityName(issue.severity) + " (" + issue.title + ")");
        }
        for (auto& ev : tick.events) {
            dispatch_.enqueue(ev);
            ++eventsForwarded_;
        }
        logEvent(log_, Role::Orchestrator,
                 "cycle " + std::to_string(snapshot.cycleNumber) + " day " + std::to_string(simDay) + " hour "
                 + std::to_string(simHour) + " theme=\"" + tick.theme + "\" volume="
                 + std::to_string(tick.totalCount) + " descriptors=" + std::to_string(tick.events.size())
                 + " issues=" + std::to_string(issues.size()));
        return true;
    } catch (const std::exception& e) {
        ++tickErrors_;
        std::string message = "tick day " + std::to_string(simDay) + " hour " + std::to_string(simHour)
                            + " failed: " + e.what();
        monitor_.reportError(kWorkerOrchestrator, message, ErrorSeverity::Recoverable);
        logEvent(log_, Role::Orchestrator, message);
        return false;
    }
}

void CycleOrchestrator::beginCycle(int cycleNumber) {
    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        cycle_ = CycleState{};
        cycle_.cycleNumber = cycleNumber;
        cycle_.simDay = 1;
        cycle_.simHour = config_.startHour;
    }
    betweenCycles_ = false;
    cycleStartSimMs_ = clock_.nowMs();
    lastHourIndex_ = -1;
    cycleRunMs_ = 0;
    lastRunSampleMs_ = time_.nowMs();
    if (!userPaused_) {
        clock_.start();
    }
    logEvent(log_, Role::Orchestrator, "Cycle " + std::to_string(cycleNumber) + " started");
}

void CycleOrchestrator::endCycle(const std::string& reason) {
    accumulateRunTime(time_.nowMs());
    clock_.pause();
    int completed = ++completedCycles_;
    logEvent(log_, Role::Orchestrator,
             "Cycle " + std::to_string(completed) + " complete after " + reason + ", running time "
             + std::to_string(cycleRunMs_ / 1000) + "s");
    if (config_.interCyclePauseSeconds <= 0) {
        beginCycle(completed + 1);
        return;
    }
    betweenCycles_ = true;
    resumeAtMs_ = time_.nowMs() + static_cast<long long>(config_.interCyclePauseSeconds) * 1000LL;
    logEvent(log_, Role::Orchestrator,
             "Pausing " + std::to_string(config_.interCyclePauseSeconds) + "s before the next cycle");
}

bool CycleOrchestrator::resetState() {
    std::lock_guard<std::mutex> tickLock(tickMutex_);
    if (state_.load() != OrchestratorState::Idle) {
        return false;
    }
    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        cycle_ = CycleState{};
        cycle_.simHour = config_.startHour;
    }
    completedCycles_.store(0);
    betweenCycles_ = false;
    lastHourIndex_ = -1;
    cycleRunMs_ = 0;
    userPaused_ = false;
    return true;
}

void CycleOrchestrator::pauseClock() {
    std::lock_guard<std::mutex> tickLock(tickMutex_);
    accumulateRunTime(time_.nowMs());
    userPaused_ = true;
    clock_.pause();
}

void CycleOrchestrator::resumeClock() {
    std::lock_guard<std::mutex> tickLock(tickMutex_);
    userPaused_ = false;
    lastRunSampleMs_ = time_.nowMs();
    if (betweenCycles_ && state_.load() == OrchestratorState::Running) {
        return;
    }
    clock_.start();
}

bool CycleOrchestrator::resolveIssue(int issueId) {
    // Held so a running tick cannot write back its copy of the issue list over this change.
    std::lock_guard<std::mutex> tickLock(tickMutex_);
    bool resolved = false;
    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        resolved = ScenarioGenerator::resolveIssue(cycle_.issues, issueId);
    }
    if (resolved) {
        logEvent(log_, Role::Orchestrator, "Issue resolved on request id=" + std::to_string(issueId));
    }
    return resolved;
}

CycleState CycleOrchestrator::cycleState() const {
    std::lock_guard<std::mutex> lock(stateMutex_);
    return cycle_;
}

bool CycleOrchestrator::betweenCycles() const {
    std::lock_guard<std::mutex> tickLock(tickMutex_);
    return betweenCycles_;
}
