#include "dispatch/rate_window.hpp"

#include <algorithm>

RateWindow::RateWindow(long long lengthMs, int ceiling) : lengthMs_(lengthMs), ceiling_(ceiling) {}

void RateWindow::purge(long long nowMs) {
    while (!stamps_.empty() && nowMs - stamps_.front() >= lengthMs_) {
        stamps_.pop_front();
    }
}

bool RateWindow::hasRoom(long long nowMs) {
    purge(nowMs);
    return static_cast<int>(stamps_.size()) < ceiling_;
}

void RateWindow::record(long long nowMs) {
    stamps_.push_back(nowMs);
}

long long RateWindow::msUntilSlot(long long nowMs) {
    purge(nowMs);
    int count = static_cast<int>(stamps_.size());
    if (count < ceiling_) {
        return 0;
    }
    // Room appears once the entry at index (count - ceiling) has aged out.
    long long blocker = stamps_[static_cast<size_t>(count - ceiling_)];
    long long wait = lengthMs_ - (nowMs - blocker);
    return wait > 0 ? wait : 0;
}

int RateWindow::countWithin(long long nowMs) const {
    int count = 0;
    for (long long t : stamps_) {
        if (nowMs - t < lengthMs_) ++count;
    }
    return count;
}

DualRateLimiter::DualRateLimiter(int perMinute, int perHour)
    : minute_(kMinuteMs, perMinute), hour_(kHourMs, perHour) {}

bool DualRateLimiter::tryAdmit(long long nowMs) {
    if (!minute_.hasRoom(nowMs) || !hour_.hasRoom(nowMs)) {
        return false;
    }
    minute_.record(nowMs);
    hour_.record(nowMs);
    return true;
}

long long DualRateLimiter::retryDelayMs(long long nowMs) {
    return std::max(minute_.msUntilSlot(nowMs), hour_.msUntilSlot(nowMs));
}

int DualRateLimiter::recentMinute(long long nowMs) const {
    return minute_.countWithin(nowMs);
}

int DualRateLimiter::recentHour(long long nowMs) const {
    return hour_.countWithin(nowMs);
}

bool DualRateLimiter::reconfigure(int perMinute, int perHour, std::string& err) {
    if (!validate(perMinute, perHour, err)) {
        return false;
    }
    minute_.setCeiling(perMinute);
    hour_.setCeiling(perHour);
    return true;
}

bool DualRateLimiter::validate(int perMinute, int perHour, std::string& err) {
    if (perMinute <= 0) {
        err = "ratePerMinute must be > 0";
        return false;
    }
    if (perHour <= 0) {
        err = "ratePerHour must be > 0";
        return false;
    }
    return true;
}
