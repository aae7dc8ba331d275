#include "logging/log_queue.hpp"

#include <utility>

LogQueue::LogQueue(size_t capacity)
    : capacity_(capacity == 0 ? kDefaultCapacity : capacity), closed_(false), dropped_(0) {}

bool LogQueue::tryPush(LogMessage msg) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_ || items_.size() >= capacity_) {
            ++dropped_;
            return false;
        }
        items_.push_back(std::move(msg));
    }
    cv_.notify_one();
    return true;
}

bool LogQueue::pop(LogMessage& out) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] { return closed_ || !items_.empty(); });
    if (items_.empty()) {
        return false;
    }
    out = std::move(items_.front());
    items_.pop_front();
    return true;
}

void LogQueue::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    cv_.notify_all();
}

size_t LogQueue::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return items_.size();
}

size_t LogQueue::droppedCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return dropped_;
}
