#include "lifecycle/lifecycle_monitor.hpp"

#include <algorithm>

std::vector<std::string> defaultWorkerNames() {
    return {kWorkerClock, kWorkerOrchestrator, kWorkerDispatcher};
}

LifecycleMonitor::LifecycleMonitor(const std::vector<std::string>& names, const TimeSource& time)
    : time_(time) {
    for (const auto& name : names) {
        WorkerStatus w;
        w.name = name;
        workers_.push_back(w);
    }
}

WorkerStatus* LifecycleMonitor::findLocked(const std::string& name) {
    for (auto& w : workers_) {
        if (w.name == name) return &w;
    }
    return nullptr;
}

bool LifecycleMonitor::reportStarting(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    WorkerStatus* w = findLocked(name);
    if (!w) return false;
    if (w->state != WorkerState::Stopped && w->state != WorkerState::Errored) {
        return false;
    }
    w->state = WorkerState::Starting;
    w->lastActivityMs = time_.nowMs();
    return true;
}

bool LifecycleMonitor::reportActive(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    WorkerStatus* w = findLocked(name);
    if (!w || w->state != WorkerState::Starting) return false;
    w->state = WorkerState::Active;
    w->lastActivityMs = time_.nowMs();
    return true;
}

bool LifecycleMonitor::reportError(const std::string& name, const std::string& error,
                                   ErrorSeverity severity) {
    std::lock_guard<std::mutex> lock(mutex_);
    WorkerStatus* w = findLocked(name);
    if (!w) return false;
    ++w->errorCount;
    w->lastError = error;
    w->lastActivityMs = time_.nowMs();
    if (severity == ErrorSeverity::Fatal &&
        (w->state == WorkerState::Starting || w->state == WorkerState::Active)) {
        w->state = WorkerState::Errored;
    }
    return true;
}

bool LifecycleMonitor::reportStopped(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    WorkerStatus* w = findLocked(name);
    if (!w) return false;
    w->state = WorkerState::Stopped;
    w->lastActivityMs = time_.nowMs();
    return true;
}

int LifecycleMonitor::healthScore() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (workers_.empty()) return 0;
    int active = 0;
    int errors = 0;
    for (const auto& w : workers_) {
        if (w.state == WorkerState::Active) ++active;
        errors += w.errorCount;
    }
    int score = static_cast<int>(100.0 * active / static_cast<double>(workers_.size())) - 5 * errors;
    return std::max(0, std::min(100, score));
}

int LifecycleMonitor::totalErrors() const {
    std::lock_guard<std::mutex> lock(mutex_);
    int errors = 0;
    for (const auto& w : workers_) errors += w.errorCount;
    return errors;
}

std::vector<WorkerStatus> LifecycleMonitor::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return workers_;
}

bool LifecycleMonitor::status(const std::string& name, WorkerStatus& out) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& w : workers_) {
        if (w.name == name) {
            out = w;
            return true;
        }
    }
    return false;
}
