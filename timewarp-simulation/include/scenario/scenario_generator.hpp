#pragma once

#include "model/events.hpp"
#include "model/issue.hpp"
#include "util/random.hpp"

#include <string>
#include <vector>

/** @brief Weighted share of a theme's hourly volume. */
struct EventPattern {
    const char* category;
    Priority    priority;
    int         weight;
};

/** @brief Business character of one simulated weekday. */
struct DayTheme {
    const char*                name;
    int                        baseRate;     // events per simulated hour before multipliers
    std::vector<EventPattern>  patterns;
    std::vector<const char*>   issueKinds;   // issues this day can raise
};

/** @brief Result of one generator call. */
struct ScenarioTick {
    std::vector<EventDescriptor> events;    // at most one per (category, priority)
    int                          totalCount{0};
    std::vector<Issue>           raised;
    std::vector<Issue>           resolved;
    std::string                  theme;
};

/**
 * @brief Derives hourly business events and issues from the calendar position.
 *
 * Not thread-safe; the CycleOrchestrator calls it from one tick at a time.
 * With the same seed and the same (day, hour, issues) sequence the output
 * is identical.
 */
class ScenarioGenerator {
public:
    static constexpr double kJitterMin = 0.7;
    static constexpr double kJitterMax = 1.3;
    static constexpr double kBusinessHourIssueChance = 0.30;
    static constexpr double kOffHourIssueChance = 0.05;
    static constexpr double kResolveChance = 0.20;
    static constexpr int    kResolveMinAgeHours = 3;

    explicit ScenarioGenerator(unsigned int seed);

    /** @brief Restart the random sequence and the id counters. */
    void reseed(unsigned int seed);

    /**
     * @brief Produce the events for one simulated hour.
     *
     * Resolves aged issues, sizes and splits the hour's volume, applies issue
     * escalation, then may raise new issues (which take effect next hour).
     * @param simDay 1-based day of the cycle.
     * @param simHour 0..23.
     * @param issues active issues; updated in place.
     * @param cycleNumber stamped on every descriptor.
     */
    ScenarioTick generate(int simDay, int simHour, std::vector<Issue>& issues, int cycleNumber = 1);

    /**
     * @brief Resolve one issue explicitly.
     * @return false if no active issue has that id.
     */
    static bool resolveIssue(std::vector<Issue>& issues, int issueId);

    static int activeIssueCount(const std::vector<Issue>& issues);

    /** @brief High issues count 1, critical issues count 2. */
    static int optimizationOpportunities(const std::vector<Issue>& issues);

    /** @brief Combined promotion share of all active issues: 1 - prod(1 - share). */
    static double escalationShare(const std::vector<Issue>& issues);

    /** @brief Theme for a 1-based day; days past 5 wrap to Monday. */
    static const DayTheme& themeForDay(int simDay);

    static double hourMultiplier(int simHour);

    static bool isBusinessHour(int simHour);

    /**
     * @brief Split count across weights by largest remainder.
     * @return one entry per weight, summing to count.
     */
    static std::vector<int> apportion(int count, const std::vector<int>& weights);

private:
    Issue makeIssue(const char* kind, int simDay, int simHour);

    RandomGenerator rng_;
    long long nextEventId_;
    int nextIssueId_;
};
