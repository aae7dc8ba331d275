#pragma once

/**
 * @brief Source of real elapsed time in milliseconds.
 *
 * All components read real time through this interface so tests can step
 * time by hand. Values must never decrease.
 */
class TimeSource {
public:
    virtual ~TimeSource() = default;

    /** @brief Current real time in milliseconds from an arbitrary origin. */
    virtual long long nowMs() const = 0;
};

/**
 * @brief Production time source backed by CLOCK_MONOTONIC.
 */
class SteadyTimeSource : public TimeSource {
public:
    long long nowMs() const override;
};

/** @brief CLOCK_MONOTONIC in milliseconds; 0 if clock_gettime fails. */
long long monotonicMs();
