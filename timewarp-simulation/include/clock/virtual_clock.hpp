#pragma once

#include "clock/time_source.hpp"

#include <mutex>

/** @brief One row of the speed level table. */
struct SpeedLevelInfo {
    int         level;
    int         multiplier;   // simulated seconds per real second
    const char* name;
    const char* description;
};

/**
 * @brief Simulated time that advances at a selectable multiple of real time.
 *
 * simulated = epoch + (realNow - anchor) * multiplier while running,
 * simulated = epoch while paused. Every state change re-anchors first, so
 * simulated time is continuous across setLevel/pause/start.
 * All members are safe to call from any thread.
 */
class VirtualClock {
public:
    explicit VirtualClock(const TimeSource& time);

    /** @brief Number of speed levels (levels are 1..maxLevel()). */
    static int maxLevel();

    static bool isValidLevel(int level);

    /**
     * @brief Table row for a level.
     * @return nullptr for an invalid level.
     */
    static const SpeedLevelInfo* levelInfo(int level);

    /** @brief Multiplier for a level, 0 for an invalid one. */
    static int multiplierFor(int level);

    /** @brief Display name for a level, "Unknown" for an invalid one. */
    static const char* speedName(int level);

    /**
     * @brief Change the speed level without moving the current simulated instant.
     * @return false (and no state change) if level is outside 1..maxLevel().
     */
    bool setLevel(int level);

    /** @brief Start or resume; no-op when already running. */
    void start();

    /** @brief Freeze simulated time at the call instant. */
    void pause();

    /** @brief Back to level 1, paused, simulated time = real now. */
    void reset();

    /** @brief Current simulated time in milliseconds. */
    long long nowMs() const;

    int level() const;
    int multiplier() const;
    bool running() const;

private:
    // Caller holds mutex_.
    long long simulatedAtLocked(long long realNow) const;

    const TimeSource& time_;
    mutable std::mutex mutex_;
    long long simulatedEpochMs_;
    long long realAnchorMs_;
    int level_;
    bool running_;
};
