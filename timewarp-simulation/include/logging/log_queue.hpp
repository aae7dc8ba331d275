#pragma once

#include "model/events.hpp"

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>

/**
 * @brief Bounded in-process channel between producers and the logger thread.
 *
 * Producers never block: tryPush() drops the entry when the queue is full.
 * The consumer blocks in pop() until an entry arrives or the queue is closed.
 */
class LogQueue {
public:
    static constexpr size_t kDefaultCapacity = 4096;

    explicit LogQueue(size_t capacity = kDefaultCapacity);

    /**
     * @brief Append an entry without waiting.
     * @return false if the queue is full or closed (entry dropped).
     */
    bool tryPush(LogMessage msg);

    /**
     * @brief Wait for the next entry.
     * @param out destination for the entry.
     * @return false once the queue is closed and fully drained.
     */
    bool pop(LogMessage& out);

    /** @brief Refuse new entries and wake the consumer; queued entries are still delivered. */
    void close();

    size_t size() const;

    /** @brief Entries rejected by tryPush since construction. */
    size_t droppedCount() const;

private:
    const size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<LogMessage> items_;
    bool closed_;
    size_t dropped_;
};
