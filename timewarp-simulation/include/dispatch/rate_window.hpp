#pragma once

#include <deque>
#include <string>

/**
 * @brief Sliding window of admission timestamps with a ceiling.
 *
 * An entry counts while now - t < lengthMs. Timestamps must be recorded in
 * non-decreasing order.
 */
class RateWindow {
public:
    RateWindow(long long lengthMs, int ceiling);

    /** @brief Drop entries whose age is >= the window length. */
    void purge(long long nowMs);

    /** @brief True if one more admission at nowMs stays within the ceiling. */
    bool hasRoom(long long nowMs);

    void record(long long nowMs);

    /**
     * @brief Milliseconds until hasRoom() becomes true; 0 if it already is.
     */
    long long msUntilSlot(long long nowMs);

    /** @brief Entries still inside the window at nowMs (no purge). */
    int countWithin(long long nowMs) const;

    int ceiling() const { return ceiling_; }
    long long lengthMs() const { return lengthMs_; }

    /** @brief New ceiling; recorded timestamps are kept. */
    void setCeiling(int ceiling) { ceiling_ = ceiling; }

private:
    long long lengthMs_;
    int ceiling_;
    std::deque<long long> stamps_;
};

/**
 * @brief Per-minute and per-hour windows checked and recorded together.
 */
class DualRateLimiter {
public:
    static constexpr long long kMinuteMs = 60LL * 1000LL;
    static constexpr long long kHourMs = 3600LL * 1000LL;

    DualRateLimiter(int perMinute, int perHour);

    /**
     * @brief Admit one send at nowMs if both windows have room.
     *
     * On success the timestamp is recorded in both windows.
     * @return false (nothing recorded) if either window is saturated.
     */
    bool tryAdmit(long long nowMs);

    /**
     * @brief Earliest delay after which tryAdmit can succeed.
     *
     * The later of the saturated windows' next free slot; 0 if admission is
     * already possible.
     */
    long long retryDelayMs(long long nowMs);

    int recentMinute(long long nowMs) const;
    int recentHour(long long nowMs) const;

    /**
     * @brief Replace both ceilings; history is kept.
     * @return false (no change) if validate() rejects the values.
     */
    bool reconfigure(int perMinute, int perHour, std::string& err);

    /** @brief Both ceilings must be positive. */
    static bool validate(int perMinute, int perHour, std::string& err);

private:
    RateWindow minute_;
    RateWindow hour_;
};
