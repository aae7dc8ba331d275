#pragma once

#include "issue.hpp"
#include "types.hpp"

#include <string>
#include <vector>

// Owned by the CycleOrchestrator; copies are handed out as snapshots.
struct CycleState {
    int cycleNumber{1};
    int simDay{1};              // 1..7
    int simHour{0};             // 0..23
    std::vector<Issue> issues;  // active issues only
};

struct WorkerStatus {
    std::string name;
    WorkerState state{WorkerState::Stopped};
    long long   lastActivityMs{0};
    int         errorCount{0};
    std::string lastError;
};

// Record returned by Director::getStatus().
struct SimulationStatus {
    int         cycleNumber{1};
    int         simDay{1};
    int         simHour{0};
    int         speedLevel{1};
    bool        running{false};
    bool        clockPaused{true};
    int         activeIssueCount{0};
    int         queueDepth{0};
    int         recentRateMinute{0};
    int         recentRateHour{0};
    int         healthScore{0};
    long long   delivered{0};
    long long   deliveryErrors{0};
    long long   retries{0};
    long long   dropped{0};
    int         completedCycles{0};
    int         optimizationOpportunities{0};
    std::string theme;
};
