#include "dispatch/dispatch_queue.hpp"

#include "lifecycle/lifecycle_monitor.hpp"
#include "logging/logger.hpp"

#include <chrono>
#include <exception>
#include <system_error>
#include <utility>

DispatchQueue::DispatchQueue(const Config& config, const TimeSource& time, EventSender& sender,
                             LifecycleMonitor* monitor, LogQueue* log)
    : time_(time),
      sender_(sender),
      monitor_(monitor),
      log_(log),
      capacity_(config.queueCapacity),
      retryBackoffMs_(config.retryBackoffMs),
      size_(0),
      limitsVersion_(0),
      limiter_(config.ratePerMinute, config.ratePerHour),
      stopRequested_(false),
      running_(false),
      delivered_(0),
      deliveryErrors_(0),
      retries_(0),
      dropped_(0) {}

DispatchQueue::~DispatchQueue() {
    stop();
}

bool DispatchQueue::enqueue(EventDescriptor event) {
    long long droppedId = -1;
    Priority droppedPriority = event.priority;
    bool accepted = true;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (capacity_ > 0 && size_ >= static_cast<size_t>(capacity_)) {
            int lowest = kPriorityCount - 1;
            while (lowest > 0 && tiers_[lowest].empty()) --lowest;
            if (static_cast<int>(event.priority) > lowest) {
                droppedId = event.id;
                accepted = false;
            } else {
                droppedId = tiers_[lowest].front().id;
                droppedPriority = tiers_[lowest].front().priority;
                tiers_[lowest].pop_front();
                --size_;
            }
            ++dropped_;
        }
        if (accepted) {
            tiers_[static_cast<int>(event.priority)].push_back(std::move(event));
            ++size_;
        }
    }
    if (accepted) {
        cv_.notify_all();
    }
    if (droppedId != -1) {
        logEvent(log_, Role::Dispatcher,
                 "queue full, dropped id=" + std::to_string(droppedId) + " prio=" + priorityName(droppedPriority));
    }
    return accepted;
}

bool DispatchQueue::start() {
    std::lock_guard<std::mutex> threadLock(threadMutex_);
    if (running_.load()) {
        return false;
    }
    if (monitor_) monitor_->reportStarting(kWorkerDispatcher);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopRequested_ = false;
    }
    try {
        consumer_ = std::thread(&DispatchQueue::consumerLoop, this);
    } catch (const std::system_error& e) {
        std::string message = std::string("dispatcher thread creation failed: ") + e.what();
        if (monitor_) monitor_->reportError(kWorkerDispatcher, message, ErrorSeverity::Fatal);
        logEvent(log_, Role::Dispatcher, message);
        return false;
    }
    running_.store(true);
    if (monitor_) monitor_->reportActive(kWorkerDispatcher);
    logEvent(log_, Role::Dispatcher, "Dispatcher started");
    return true;
}

void DispatchQueue::stop() {
    std::lock_guard<std::mutex> threadLock(threadMutex_);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopRequested_ = true;
    }
    cv_.notify_all();
    if (consumer_.joinable()) {
        consumer_.join();
    }
    if (running_.exchange(false)) {
        if (monitor_) monitor_->reportStopped(kWorkerDispatcher);
        logEvent(log_, Role::Dispatcher, "Dispatcher stopped");
    }
}

bool DispatchQueue::running() const {
    return running_.load();
}

DispatchStep DispatchQueue::dispatchNext(long long* waitMs) {
    if (waitMs) *waitMs = 0;
    EventDescriptor event;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (size_ == 0) {
            return DispatchStep::Idle;
        }
        long long now = time_.nowMs();
        if (!limiter_.tryAdmit(now)) {
            if (waitMs) *waitMs = limiter_.retryDelayMs(now);
            return DispatchStep::RateLimited;
        }
        // Admitted: the slot is committed together with removing the head.
        for (auto& tier : tiers_) {
            if (!tier.empty()) {
                event = std::move(tier.front());
                tier.pop_front();
                break;
            }
        }
        --size_;
    }

    DeliveryReceipt receipt;
    std::string error;
    int attempts = 0;
    DeliveryStatus status = deliverWithRetry(event, receipt, error, attempts);
    if (status == DeliveryStatus::Delivered) {
        ++delivered_;
        logEvent(log_, Role::Dispatcher,
                 "sent id=" + std::to_string(event.id) + " prio=" + priorityName(event.priority)
                 + " attempts=" + std::to_string(attempts) + " ref=" + receipt.reference);
        return DispatchStep::Delivered;
    }

    ++deliveryErrors_;
    std::string message = "delivery of event " + std::to_string(event.id) + " failed ("
                        + deliveryStatusName(status) + ", attempts=" + std::to_string(attempts)
                        + "): " + error;
    if (monitor_) monitor_->reportError(kWorkerDispatcher, message, ErrorSeverity::Recoverable);
    logEvent(log_, Role::Dispatcher, message);
    return DispatchStep::Failed;
}

DeliveryStatus DispatchQueue::deliverWithRetry(const EventDescriptor& event, DeliveryReceipt& receipt,
                                               std::string& error, int& attempts) {
    DeliveryStatus status = DeliveryStatus::TransientFailure;
    long long backoff = retryBackoffMs_;
    for (attempts = 1; attempts <= kMaxAttempts; ++attempts) {
        error.clear();
        try {
            status = sender_.deliver(event, receipt, error);
        } catch (const std::exception& e) {
            // A throwing sender is treated as a terminal failure.
            error = std::string("sender threw: ") + e.what();
            return DeliveryStatus::TerminalFailure;
        }
        if (status == DeliveryStatus::Delivered) {
            receipt.attempts = attempts;
            return status;
        }
        if (status == DeliveryStatus::TerminalFailure || attempts == kMaxAttempts) {
            return status;
        }
        // Retries reuse the slot admitted for the first attempt.
        ++retries_;
        logEvent(log_, Role::Dispatcher,
                 "retry id=" + std::to_string(event.id) + " in " + std::to_string(backoff) + "ms: " + error);
        if (!sleepUnlessStopped(backoff)) {
            error = "stopped before retry: " + error;
            return status;
        }
        backoff *= 2;
    }
    return status;
}

bool DispatchQueue::sleepUnlessStopped(long long ms) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (ms > 0) {
        cv_.wait_for(lock, std::chrono::milliseconds(ms), [this] { return stopRequested_; });
    }
    return !stopRequested_;
}

void DispatchQueue::consumerLoop() {
    while (true) {
        unsigned long long seenVersion = 0;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (stopRequested_) break;
            seenVersion = limitsVersion_;
        }
        long long waitMs = 0;
        DispatchStep step = dispatchNext(&waitMs);
        if (step == DispatchStep::Idle) {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this] { return stopRequested_ || size_ > 0; });
        } else if (step == DispatchStep::RateLimited) {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait_for(lock, std::chrono::milliseconds(waitMs),
                         [this, seenVersion] { return stopRequested_ || limitsVersion_ != seenVersion; });
        }
    }
}

size_t DispatchQueue::clear() {
    size_t removed = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        removed = size_;
        for (auto& tier : tiers_) tier.clear();
        size_ = 0;
    }
    if (removed > 0) {
        logEvent(log_, Role::Dispatcher, "cleared " + std::to_string(removed) + " queued events");
    }
    return removed;
}

bool DispatchQueue::setRateLimits(int perMinute, int perHour, std::string& err) {
    bool ok = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ok = limiter_.reconfigure(perMinute, perHour, err);
        if (ok) ++limitsVersion_;
    }
    if (ok) {
        cv_.notify_all();
        logEvent(log_, Role::Dispatcher,
                 "rate limits set to " + std::to_string(perMinute) + "/min " + std::to_string(perHour) + "/h");
    }
    return ok;
}

int DispatchQueue::depth() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<int>(size_);
}

int DispatchQueue::depthAt(Priority priority) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<int>(tiers_[static_cast<int>(priority)].size());
}

int DispatchQueue::recentRateMinute() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return limiter_.recentMinute(time_.nowMs());
}

int DispatchQueue::recentRateHour() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return limiter_.recentHour(time_.nowMs());
}
