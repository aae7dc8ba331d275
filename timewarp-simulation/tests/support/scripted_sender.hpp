#pragma once

#include "clock/time_source.hpp"
#include "dispatch/event_sender.hpp"

#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

/**
 * @brief EventSender whose per-call outcomes are queued by the test.
 *
 * Calls beyond the script succeed. Every call is recorded, with its time
 * when a time source is given.
 */
class ScriptedSender : public EventSender {
public:
    explicit ScriptedSender(const TimeSource* time = nullptr) : time_(time) {}

    void script(DeliveryStatus status) {
        std::lock_guard<std::mutex> lock(mutex_);
        script_.push_back(status);
    }

    DeliveryStatus deliver(const EventDescriptor& event, DeliveryReceipt& receipt,
                           std::string& error) override {
        std::lock_guard<std::mutex> lock(mutex_);
        calls_.push_back(event);
        if (time_) callTimes_.push_back(time_->nowMs());
        DeliveryStatus status = DeliveryStatus::Delivered;
        if (!script_.empty()) {
            status = script_.front();
            script_.pop_front();
        }
        if (status == DeliveryStatus::Delivered) {
            receipt.eventId = event.id;
            receipt.reference = "ref-" + std::to_string(event.id);
        } else {
            error = std::string("scripted ") + deliveryStatusName(status);
        }
        return status;
    }

    std::vector<EventDescriptor> calls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return calls_;
    }

    std::vector<long long> callTimes() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return callTimes_;
    }

    size_t callCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return calls_.size();
    }

private:
    const TimeSource* time_;
    mutable std::mutex mutex_;
    std::deque<DeliveryStatus> script_;
    std::vector<EventDescriptor> calls_;
    std::vector<long long> callTimes_;
};
