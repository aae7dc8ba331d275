#include "director.hpp"

#include "logging/log_queue.hpp"
#include "logging/logger.hpp"
#include "dispatch/simulated_sender.hpp"
#include "model/config.hpp"
#include "model/types.hpp"
#include "util/error.hpp"
#include "util/signals.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <ctime>
#include <fstream>
#include <iostream>
#include <sstream>
#include <thread>
#include <vector>

Director::Director(const Config& config, EventSender& sender, const TimeSource& time, LogQueue* log)
    : config_(config),
      log_(log),
      monitor_(defaultWorkerNames(), time),
      clock_(time),
      generator_(config.randomSeed),
      dispatch_(config_, time, sender, &monitor_, log),
      orchestrator_(config_, time, clock_, generator_, dispatch_, monitor_, log) {}

Director::~Director() {
    stopContinuousSimulation();
}

bool Director::setSpeedLevel(int level, std::string* err) {
    if (!clock_.setLevel(level)) {
        if (err) {
            *err = "invalid speed level " + std::to_string(level) + " (expected 1.."
                 + std::to_string(VirtualClock::maxLevel()) + ")";
        }
        logEvent(log_, Role::Clock, "Rejected speed level " + std::to_string(level));
        return false;
    }
    logEvent(log_, Role::Clock,
             "Speed level " + std::to_string(level) + " (" + VirtualClock::speedName(level) + ", x"
             + std::to_string(VirtualClock::multiplierFor(level)) + ")");
    return true;
}

bool Director::startContinuousSimulation() {
    if (orchestrator_.state() != OrchestratorState::Idle) {
        return false;
    }
    if (!dispatch_.running()) {
        dispatch_.start();
    }
    return orchestrator_.startContinuous();
}

void Director::pauseClock() {
    orchestrator_.pauseClock();
    logEvent(log_, Role::Clock, "Clock paused");
}

void Director::resumeClock() {
    orchestrator_.resumeClock();
    logEvent(log_, Role::Clock, "Clock resumed");
}

void Director::resetSimulation() {
    orchestrator_.stop();
    dispatch_.stop();
    clock_.reset();
    orchestrator_.resetState();
    size_t cleared = dispatch_.clear();
    logEvent(log_, Role::Director, "Simulation reset, " + std::to_string(cleared) + " queued events discarded");
}

void Director::stopContinuousSimulation() {
    orchestrator_.stop();
    dispatch_.stop();
}

bool Director::resolveIssue(int issueId) {
    return orchestrator_.resolveIssue(issueId);
}

bool Director::setRateLimits(int perMinute, int perHour, std::string& err) {
    return dispatch_.setRateLimits(perMinute, perHour, err);
}

SimulationStatus Director::getStatus() const {
    SimulationStatus status;
    CycleState cycle = orchestrator_.cycleState();
    status.cycleNumber = cycle.cycleNumber;
    status.simDay = cycle.simDay;
    status.simHour = cycle.simHour;
    status.activeIssueCount = ScenarioGenerator::activeIssueCount(cycle.issues);
    status.optimizationOpportunities = ScenarioGenerator::optimizationOpportunities(cycle.issues);
    status.theme = ScenarioGenerator::themeForDay(cycle.simDay).name;
    status.speedLevel = clock_.level();
    status.clockPaused = !clock_.running();
    status.running = orchestrator_.state() == OrchestratorState::Running;
    status.completedCycles = orchestrator_.completedCycles();
    status.queueDepth = dispatch_.depth();
    status.recentRateMinute = dispatch_.recentRateMinute();
    status.recentRateHour = dispatch_.recentRateHour();
    status.delivered = dispatch_.delivered();
    status.deliveryErrors = dispatch_.deliveryErrors();
    status.retries = dispatch_.retries();
    status.dropped = dispatch_.dropped();
    status.healthScore = monitor_.healthScore();
    return status;
}

std::string formatStatus(const SimulationStatus& status) {
    std::ostringstream oss;
    oss << "cycle=" << status.cycleNumber << ";"
        << "day=" << status.simDay << ";"
        << "hour=" << status.simHour << ";"
        << "level=" << status.speedLevel << ";"
        << "running=" << (status.running ? 1 : 0) << ";"
        << "paused=" << (status.clockPaused ? 1 : 0) << ";"
        << "issues=" << status.activeIssueCount << ";"
        << "opportunities=" << status.optimizationOpportunities << ";"
        << "queue=" << status.queueDepth << ";"
        << "rateMin=" << status.recentRateMinute << ";"
        << "rateHour=" << status.recentRateHour << ";"
        << "health=" << status.healthScore << ";"
        << "delivered=" << status.delivered << ";"
        << "errors=" << status.deliveryErrors << ";"
        << "retries=" << status.retries << ";"
        << "dropped=" << status.dropped << ";"
        << "cycles=" << status.completedCycles << ";"
        << "theme=" << status.theme << ";";
    return oss.str();
}

std::string formatDuration(long long seconds) {
    long long days = seconds / 86400;
    seconds %= 86400;
    long long hours = seconds / 3600;
    seconds %= 3600;
    long long minutes = seconds / 60;
    seconds %= 60;
    std::ostringstream oss;
    oss << days << "d " << hours << "h " << minutes << "m " << seconds << "s";
    return oss.str();
}

namespace {
std::atomic<bool> stopRequested(false);

void handleStopSignal(int) {
    stopRequested.store(true);
}

struct SummaryPayload {
    SimulationStatus status;
    std::vector<WorkerStatus> workers;
    long long realSeconds{0};
    long long ticksProcessed{0};
    long long eventsForwarded{0};
    long long tickErrors{0};
    long long senderCalls{0};
    int ratePerMinute{0};
    int ratePerHour{0};
};

bool writeSummaryText(const SummaryPayload& payload, std::ofstream& out) {
    const SimulationStatus& s = payload.status;
    out << "TimeWarp Simulation Summary\n";
    out << "===========================\n";
    out << "Real running time: " << formatDuration(payload.realSeconds) << "\n";
    out << "Speed level: " << s.speedLevel << " (" << VirtualClock::speedName(s.speedLevel) << ", x"
        << VirtualClock::multiplierFor(s.speedLevel) << ")\n";
    out << "Completed cycles: " << s.completedCycles << "\n";
    out << "Last position: cycle " << s.cycleNumber << ", day " << s.simDay << ", hour " << s.simHour
        << " (" << s.theme << ")\n";
    out << "Simulated hours processed: " << payload.ticksProcessed << "\n";
    out << "Tick errors: " << payload.tickErrors << "\n";
    out << "Active issues at shutdown: " << s.activeIssueCount
        << " (optimization opportunities: " << s.optimizationOpportunities << ")\n";
    out << "Dispatch:\n";
    out << "  Events forwarded: " << payload.eventsForwarded << "\n";
    out << "  Delivered:        " << s.delivered << "\n";
    out << "  Delivery errors:  " << s.deliveryErrors << "\n";
    out << "  Retries:          " << s.retries << "\n";
    out << "  Dropped (full):   " << s.dropped << "\n";
    out << "  Still queued:     " << s.queueDepth << "\n";
    out << "  Sender calls:     " << payload.senderCalls << "\n";
    out << "  Limits:           " << payload.ratePerMinute << "/min, " << payload.ratePerHour << "/h\n";
    out << "Health score: " << s.healthScore << "\n";
    out << "Workers:\n";
    for (const auto& w : payload.workers) {
        out << "  " << w.name << ": " << workerStateName(w.state) << ", errors=" << w.errorCount;
        if (!w.lastError.empty()) {
            out << ", last error: " << w.lastError;
        }
        out << "\n";
    }
    return static_cast<bool>(out);
}

bool writeSummary(const SummaryPayload& payload, const std::string& path) {
    std::ofstream out(path, std::ios::out | std::ios::trunc);
    if (!out) {
        logErrno("summary file open failed");
        return false;
    }
    return writeSummaryText(payload, out);
}
} // namespace

// Simulation run loop (see header for details).
int SimulationRunner::run(const Config& config, const std::string* logPathOverride) {
    long long epoch = static_cast<long long>(std::time(nullptr));
    lastLogPath_ = logPathOverride ? *logPathOverride : "timewarp_run_" + std::to_string(epoch) + ".log";
    lastSummaryPath_.clear();
    stopRequested.store(false);

    LogQueue logQueue;
    int loggerRc = 0;
    std::thread loggerThread([&logQueue, &loggerRc, this] { loggerRc = runLogger(logQueue, lastLogPath_); });

    // Status lines go to stdout, which may be a pipe closed early by the reader
    // (e.g. `timewarp_sim | head`); the summary must still be written.
    bool signalsOk = Signals::setHandler(SIGINT, handleStopSignal) &&
                     Signals::setHandler(SIGTERM, handleStopSignal) &&
                     Signals::ignore(SIGPIPE);

    SteadyTimeSource time;
    SimulatedSender sender(config.transientFailurePercent, config.terminalFailurePercent,
                           config.randomSeed + 1, time, &logQueue);
    SummaryPayload payload;
    bool started = false;
    {
        Director director(config, sender, time, &logQueue);
        setLogMetricsContext({&director.orchestrator(), &director.dispatch(), &director.monitor()});
        logEvent(&logQueue, Role::Director,
                 "Director started: seed=" + std::to_string(config.randomSeed) + " limits="
                 + std::to_string(config.ratePerMinute) + "/min " + std::to_string(config.ratePerHour) + "/h");

        long long startMs = time.nowMs();
        started = signalsOk && director.startContinuousSimulation();
        if (!started) {
            std::cerr << "Failed to start the simulation" << std::endl;
        }
        long long statusEveryMs = static_cast<long long>(config.statusIntervalSeconds) * 1000LL;
        long long nextStatusMs = startMs + statusEveryMs;
        while (started && !stopRequested.load()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
            long long now = time.nowMs();
            if (now >= nextStatusMs) {
                std::string line = formatStatus(director.getStatus());
                std::cout << line << std::endl;
                logEvent(&logQueue, Role::Director, "status " + line);
                nextStatusMs += statusEveryMs;
            }
        }

        logEvent(&logQueue, Role::Director, "Shutdown requested");
        director.stopContinuousSimulation();

        payload.status = director.getStatus();
        payload.workers = director.monitor().snapshot();
        payload.realSeconds = (time.nowMs() - startMs) / 1000;
        payload.ticksProcessed = director.orchestrator().ticksProcessed();
        payload.eventsForwarded = director.orchestrator().eventsForwarded();
        payload.tickErrors = director.orchestrator().tickErrors();
        payload.senderCalls = sender.callCount();
        payload.ratePerMinute = config.ratePerMinute;
        payload.ratePerHour = config.ratePerHour;

        clearLogMetricsContext();
    }

    bool summaryOk = false;
    if (started) {
        std::string summaryPath = "timewarp_summary_" + std::to_string(epoch) + ".txt";
        summaryOk = writeSummary(payload, summaryPath);
        if (summaryOk) {
            lastSummaryPath_ = summaryPath;
        }
    }

    logEvent(&logQueue, Role::Director, "Director exiting");
    logQueue.close();
    loggerThread.join();

    Signals::restoreDefault(SIGINT);
    Signals::restoreDefault(SIGTERM);
    Signals::restoreDefault(SIGPIPE);

    if (!started || !summaryOk) {
        return 1;
    }
    return loggerRc == 0 ? 0 : 1;
}
