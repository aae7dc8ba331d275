#include "model/types.hpp"

const char* priorityName(Priority priority) {
    switch (priority) {
        case Priority::Critical: return "critical";
        case Priority::High: return "high";
        case Priority::Normal: return "normal";
        case Priority::Low: return "low";
    }
    return "unknown";
}

Priority promote(Priority priority) {
    switch (priority) {
        case Priority::Low: return Priority::Normal;
        case Priority::Normal: return Priority::High;
        case Priority::High:
        case Priority::Critical:
            return Priority::Critical;
    }
    return priority;
}

const char* severityName(IssueSeverity severity) {
    switch (severity) {
        case IssueSeverity::Medium: return "medium";
        case IssueSeverity::High: return "high";
        case IssueSeverity::Critical: return "critical";
    }
    return "unknown";
}

const char* workerStateName(WorkerState state) {
    switch (state) {
        case WorkerState::Stopped: return "stopped";
        case WorkerState::Starting: return "starting";
        case WorkerState::Active: return "active";
        case WorkerState::Errored: return "errored";
    }
    return "unknown";
}

const char* deliveryStatusName(DeliveryStatus status) {
    switch (status) {
        case DeliveryStatus::Delivered: return "delivered";
        case DeliveryStatus::TransientFailure: return "transient";
        case DeliveryStatus::TerminalFailure: return "terminal";
    }
    return "unknown";
}

const char* roleLabel(Role role) {
    switch (role) {
        case Role::Director: return "director";
        case Role::Clock: return "clock";
        case Role::Orchestrator: return "orchestrator";
        case Role::Generator: return "generator";
        case Role::Dispatcher: return "dispatcher";
        case Role::Sender: return "sender";
    }
    return "unknown";
}
