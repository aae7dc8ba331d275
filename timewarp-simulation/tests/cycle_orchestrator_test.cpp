#include <gtest/gtest.h>

#include "clock/virtual_clock.hpp"
#include "dispatch/dispatch_queue.hpp"
#include "lifecycle/lifecycle_monitor.hpp"
#include "orchestration/cycle_orchestrator.hpp"
#include "scenario/scenario_generator.hpp"
#include "support/manual_time_source.hpp"
#include "support/scripted_sender.hpp"

#include <chrono>
#include <memory>
#include <stdexcept>
#include <thread>
#include <vector>

class CycleOrchestratorTest : public ::testing::Test {
protected:
    void SetUp() override {
        cfg = defaultConfig();
        cfg.defaultSpeedLevel = 5;
        cfg.tickIntervalMs = 0;
        cfg.cycleDurationSeconds = 900;
        cfg.interCyclePauseSeconds = 0;
        cfg.startHour = 9;
        cfg.ratePerMinute = 1000;
        cfg.ratePerHour = 100000;
        cfg.retryBackoffMs = 0;
    }

    void build() {
        clock = std::make_unique<VirtualClock>(time);
        generator = std::make_unique<ScenarioGenerator>(cfg.randomSeed);
        dispatch = std::make_unique<DispatchQueue>(cfg, time, sender, &monitor);
        orchestrator = std::make_unique<CycleOrchestrator>(cfg, time, *clock, *generator, *dispatch, monitor);
    }

    // Advance real time one second at a time, ticking after each step.
    int stepSeconds(int seconds) {
        int failures = 0;
        for (int i = 0; i < seconds; ++i) {
            time.advanceMs(1000);
            if (!orchestrator->runTick()) ++failures;
        }
        return failures;
    }

    Config cfg;
    ManualTimeSource time;
    ScriptedSender sender;
    LifecycleMonitor monitor{defaultWorkerNames(), time};
    std::unique_ptr<VirtualClock> clock;
    std::unique_ptr<ScenarioGenerator> generator;
    std::unique_ptr<DispatchQueue> dispatch;
    std::unique_ptr<CycleOrchestrator> orchestrator;
};

// ============================================================================
// Start and stop
// ============================================================================

TEST_F(CycleOrchestratorTest, StartAppliesConfiguredLevelAndReportsWorkers) {
    build();
    ASSERT_TRUE(orchestrator->startContinuous());
    EXPECT_FALSE(orchestrator->startContinuous());
    EXPECT_EQ(orchestrator->state(), OrchestratorState::Running);
    EXPECT_EQ(clock->level(), 5);
    EXPECT_TRUE(clock->running());

    WorkerStatus w;
    ASSERT_TRUE(monitor.status(kWorkerOrchestrator, w));
    EXPECT_EQ(w.state, WorkerState::Active);
    ASSERT_TRUE(monitor.status(kWorkerClock, w));
    EXPECT_EQ(w.state, WorkerState::Active);

    CycleState state = orchestrator->cycleState();
    EXPECT_EQ(state.cycleNumber, 1);
    EXPECT_EQ(state.simDay, 1);
    EXPECT_EQ(state.simHour, 9);
}

TEST_F(CycleOrchestratorTest, StopPausesClockAndResetOnlyWhileIdle) {
    build();
    ASSERT_TRUE(orchestrator->startContinuous());
    stepSeconds(100);
    EXPECT_FALSE(orchestrator->resetState());

    orchestrator->stop();
    EXPECT_EQ(orchestrator->state(), OrchestratorState::Idle);
    EXPECT_FALSE(clock->running());
    EXPECT_FALSE(orchestrator->runTick());

    WorkerStatus w;
    ASSERT_TRUE(monitor.status(kWorkerOrchestrator, w));
    EXPECT_EQ(w.state, WorkerState::Stopped);

    ASSERT_TRUE(orchestrator->resetState());
    CycleState state = orchestrator->cycleState();
    EXPECT_EQ(state.cycleNumber, 1);
    EXPECT_EQ(state.simDay, 1);
    EXPECT_EQ(state.simHour, 9);
    EXPECT_TRUE(state.issues.empty());
}

// ============================================================================
// Cycle boundaries
// ============================================================================

TEST_F(CycleOrchestratorTest, TimeWarpTraversesOneFullWeekInTenMinutes) {
    build();
    struct Seen {
        int cycle;
        int day;
        int hour;
    };
    std::vector<Seen> seen;
    orchestrator->setTickListener([&seen](const CycleState& s) {
        seen.push_back({s.cycleNumber, s.simDay, s.simHour});
    });
    ASSERT_TRUE(orchestrator->startContinuous());

    stepSeconds(600);

    EXPECT_EQ(orchestrator->completedCycles(), 1);
    EXPECT_EQ(orchestrator->cycleState().cycleNumber, 2);

    int firstCycleHours = 0;
    int maxDay = 0;
    for (const auto& s : seen) {
        if (s.cycle != 1) continue;
        ++firstCycleHours;
        if (s.day > maxDay) maxDay = s.day;
    }
    EXPECT_EQ(maxDay, 7);
    // Day 1 09:00 through day 7 23:00.
    EXPECT_EQ(firstCycleHours, 7 * 24 - 9);
    EXPECT_EQ(seen.front().day, 1);
    EXPECT_EQ(seen.front().hour, 9);
}

TEST_F(CycleOrchestratorTest, EveryCycleStartsFromCleanState) {
    cfg.cycleDurationSeconds = 0;
    build();
    int lastCycle = 0;
    int starts = 0;
    orchestrator->setTickListener([&](const CycleState& s) {
        if (s.cycleNumber != lastCycle) {
            EXPECT_EQ(s.cycleNumber, lastCycle + 1);
            EXPECT_EQ(s.simDay, 1);
            EXPECT_EQ(s.simHour, 9);
            EXPECT_TRUE(s.issues.empty());
            lastCycle = s.cycleNumber;
            ++starts;
        }
    });
    ASSERT_TRUE(orchestrator->startContinuous());

    stepSeconds(1800);

    EXPECT_EQ(orchestrator->completedCycles(), 3);
    EXPECT_EQ(starts, 4);
}

TEST_F(CycleOrchestratorTest, CycleEndsOnRunningDuration) {
    cfg.defaultSpeedLevel = 1;
    cfg.cycleDurationSeconds = 10;
    build();
    ASSERT_TRUE(orchestrator->startContinuous());

    stepSeconds(9);
    EXPECT_EQ(orchestrator->completedCycles(), 0);
    stepSeconds(1);
    EXPECT_EQ(orchestrator->completedCycles(), 1);
    EXPECT_EQ(orchestrator->cycleState().cycleNumber, 2);
}

TEST_F(CycleOrchestratorTest, PausedTimeDoesNotCountTowardsDuration) {
    cfg.defaultSpeedLevel = 1;
    cfg.cycleDurationSeconds = 10;
    build();
    ASSERT_TRUE(orchestrator->startContinuous());

    stepSeconds(5);
    orchestrator->pauseClock();
    long long frozen = clock->nowMs();
    stepSeconds(100);
    EXPECT_EQ(clock->nowMs(), frozen);
    EXPECT_EQ(orchestrator->completedCycles(), 0);

    orchestrator->resumeClock();
    stepSeconds(4);
    EXPECT_EQ(orchestrator->completedCycles(), 0);
    stepSeconds(1);
    EXPECT_EQ(orchestrator->completedCycles(), 1);
}

TEST_F(CycleOrchestratorTest, InterCyclePauseDelaysNextCycle) {
    cfg.defaultSpeedLevel = 1;
    cfg.cycleDurationSeconds = 10;
    cfg.interCyclePauseSeconds = 30;
    build();
    ASSERT_TRUE(orchestrator->startContinuous());

    stepSeconds(10);
    EXPECT_EQ(orchestrator->completedCycles(), 1);
    EXPECT_TRUE(orchestrator->betweenCycles());
    EXPECT_FALSE(clock->running());
    EXPECT_EQ(orchestrator->cycleState().cycleNumber, 1);

    stepSeconds(29);
    EXPECT_TRUE(orchestrator->betweenCycles());

    stepSeconds(1);
    EXPECT_FALSE(orchestrator->betweenCycles());
    EXPECT_TRUE(clock->running());
    EXPECT_EQ(orchestrator->cycleState().cycleNumber, 2);
}

// ============================================================================
// Tick processing
// ============================================================================

TEST_F(CycleOrchestratorTest, ForwardsGeneratedEventsToDispatchQueue) {
    build();
    ASSERT_TRUE(orchestrator->startContinuous());
    stepSeconds(60);
    EXPECT_GT(orchestrator->ticksProcessed(), 0);
    EXPECT_GT(orchestrator->eventsForwarded(), 0);
    EXPECT_EQ(dispatch->depth(), orchestrator->eventsForwarded());
}

TEST_F(CycleOrchestratorTest, TickFailureIsCountedAndLoopContinues) {
    build();
    bool thrown = false;
    orchestrator->setTickListener([&thrown](const CycleState& s) {
        if (!thrown && s.simHour == 12) {
            thrown = true;
            throw std::runtime_error("injected failure");
        }
    });
    ASSERT_TRUE(orchestrator->startContinuous());

    // 20 s at x1008 covers 09:00 to 14:00 of day 1.
    int failures = stepSeconds(20);

    EXPECT_TRUE(thrown);
    EXPECT_EQ(failures, 1);
    EXPECT_EQ(orchestrator->tickErrors(), 1);
    EXPECT_GT(orchestrator->cycleState().simHour, 12);

    WorkerStatus w;
    ASSERT_TRUE(monitor.status(kWorkerOrchestrator, w));
    EXPECT_EQ(w.errorCount, 1);
    EXPECT_EQ(w.state, WorkerState::Active);
    EXPECT_NE(w.lastError.find("injected failure"), std::string::npos);
}

TEST_F(CycleOrchestratorTest, ResolveIssueOnRequest) {
    build();
    ASSERT_TRUE(orchestrator->startContinuous());
    int issueId = 0;
    for (int i = 0; i < 600 && issueId == 0; ++i) {
        stepSeconds(1);
        CycleState state = orchestrator->cycleState();
        if (!state.issues.empty()) issueId = state.issues.front().id;
    }
    ASSERT_NE(issueId, 0);
    EXPECT_TRUE(orchestrator->resolveIssue(issueId));
    EXPECT_FALSE(orchestrator->resolveIssue(issueId));
}

TEST(CycleOrchestratorThreadTest, DriveThreadTicksAndStopsPromptly) {
    Config cfg = defaultConfig();
    cfg.tickIntervalMs = 10;
    cfg.defaultSpeedLevel = 5;
    SteadyTimeSource steady;
    ScriptedSender sender;
    LifecycleMonitor monitor(defaultWorkerNames(), steady);
    VirtualClock clock(steady);
    ScenarioGenerator generator(1);
    DispatchQueue dispatch(cfg, steady, sender, &monitor);
    CycleOrchestrator orchestrator(cfg, steady, clock, generator, dispatch, monitor);

    ASSERT_TRUE(orchestrator.startContinuous());
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(3);
    while (orchestrator.ticksProcessed() == 0 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    EXPECT_GT(orchestrator.ticksProcessed(), 0);

    auto before = std::chrono::steady_clock::now();
    orchestrator.stop();
    auto elapsed = std::chrono::steady_clock::now() - before;
    EXPECT_LT(std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count(), 1000);
    EXPECT_EQ(orchestrator.state(), OrchestratorState::Idle);
}
