#pragma once

#include "clock/time_source.hpp"
#include "dispatch/event_sender.hpp"
#include "dispatch/rate_window.hpp"
#include "model/config.hpp"
#include "model/events.hpp"
#include "model/types.hpp"

#include <array>
#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <string>
#include <thread>

class LifecycleMonitor;
class LogQueue;

/** @brief Outcome of one consumer step. */
enum class DispatchStep {
    Idle,         // nothing queued
    RateLimited,  // head stays queued; see waitMs
    Delivered,
    Failed        // delivery error counted, item dropped
};

/**
 * @brief Priority queue drained by a single rate-limited, retrying consumer.
 *
 * Producers call enqueue() from any thread and never block. The consumer
 * (start()/stop() thread, or a caller stepping dispatchNext()) serves
 * Critical before High before Normal before Low, FIFO within a tier.
 * Each send must pass both sliding windows; the admission timestamp is
 * recorded under the queue lock and the sender runs outside it.
 */
class DispatchQueue {
public:
    static constexpr int kMaxAttempts = 3;

    DispatchQueue(const Config& config, const TimeSource& time, EventSender& sender,
                  LifecycleMonitor* monitor = nullptr, LogQueue* log = nullptr);
    ~DispatchQueue();

    DispatchQueue(const DispatchQueue&) = delete;
    DispatchQueue& operator=(const DispatchQueue&) = delete;

    /**
     * @brief Queue one event.
     *
     * With a capacity set and the queue full, the oldest item of the lowest
     * non-empty tier is dropped; that may be the new event itself.
     * @return false if the new event was the one dropped.
     */
    bool enqueue(EventDescriptor event);

    /**
     * @brief Launch the consumer thread.
     * @return false if it is already running or the thread could not be created
     *         (the dispatcher worker is then reported errored).
     */
    bool start();

    /** @brief Wake and join the consumer; a send in progress completes first. */
    void stop();

    bool running() const;

    /**
     * @brief One consumer step, run synchronously on the calling thread.
     * @param waitMs if non-null, receives the delay until the next admission
     *        is possible when the step is RateLimited (0 otherwise).
     */
    DispatchStep dispatchNext(long long* waitMs = nullptr);

    /** @brief Drop every queued item (not counted as dropped). @return items removed. */
    size_t clear();

    /**
     * @brief Replace both window ceilings; recorded history is kept.
     * @return false (no change) for a non-positive ceiling.
     */
    bool setRateLimits(int perMinute, int perHour, std::string& err);

    int depth() const;
    int depthAt(Priority priority) const;
    int recentRateMinute() const;
    int recentRateHour() const;

    long long delivered() const { return delivered_.load(); }
    long long deliveryErrors() const { return deliveryErrors_.load(); }
    long long retries() const { return retries_.load(); }
    long long dropped() const { return dropped_.load(); }

private:
    void consumerLoop();

    /**
     * @brief Call the sender up to kMaxAttempts times with doubling backoff.
     *
     * An exception from the sender ends the attempts as a TerminalFailure.
     * @param attempts number of sender calls made.
     */
    DeliveryStatus deliverWithRetry(const EventDescriptor& event, DeliveryReceipt& receipt,
                                    std::string& error, int& attempts);

    /** @brief Cancellable sleep; false if stop() was requested. */
    bool sleepUnlessStopped(long long ms);

    const TimeSource& time_;
    EventSender& sender_;
    LifecycleMonitor* monitor_;
    LogQueue* log_;
    const int capacity_;
    const int retryBackoffMs_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::array<std::deque<EventDescriptor>, kPriorityCount> tiers_;
    size_t size_;
    unsigned long long limitsVersion_;   // bumped by setRateLimits() to wake a rate-limited wait
    DualRateLimiter limiter_;
    bool stopRequested_;

    std::mutex threadMutex_;
    std::thread consumer_;
    std::atomic<bool> running_;

    std::atomic<long long> delivered_;
    std::atomic<long long> deliveryErrors_;
    std::atomic<long long> retries_;
    std::atomic<long long> dropped_;
};
