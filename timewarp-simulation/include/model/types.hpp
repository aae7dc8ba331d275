#pragma once

// Dispatch order follows declaration order: Critical is served first.
enum class Priority {
    Critical,
    High,
    Normal,
    Low
};

constexpr int kPriorityCount = 4;

enum class IssueSeverity {
    Medium,
    High,
    Critical
};

enum class IssueStatus {
    Active,
    Resolved
};

enum class WorkerState {
    Stopped,
    Starting,
    Active,
    Errored
};

enum class ErrorSeverity {
    Recoverable,  // counted, worker keeps its state
    Fatal         // counted, worker moves to Errored
};

enum class DeliveryStatus {
    Delivered,
    TransientFailure,
    TerminalFailure
};

enum class OrchestratorState {
    Idle,
    Running,
    Stopping
};

enum class Role {
    Director,
    Clock,
    Orchestrator,
    Generator,
    Dispatcher,
    Sender
};

constexpr int kDaysPerCycle = 7;
constexpr int kHoursPerDay = 24;
constexpr long long kMsPerSimHour = 3600LL * 1000LL;

/** @brief Lowercase label used in logs and status lines. */
const char* priorityName(Priority priority);

/** @brief Raise a priority by one tier (Critical stays Critical). */
Priority promote(Priority priority);

const char* severityName(IssueSeverity severity);

const char* workerStateName(WorkerState state);

const char* deliveryStatusName(DeliveryStatus status);

/** @brief Short role label written in every log line. */
const char* roleLabel(Role role);
