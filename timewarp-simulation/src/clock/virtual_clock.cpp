#include "clock/virtual_clock.hpp"

namespace {
const SpeedLevelInfo kSpeedLevels[] = {
    {1, 1, "Real Time", "1 second = 1 second"},
    {2, 60, "Fast Forward", "1 second = 1 minute"},
    {3, 168, "Rapid Pace", "1 second = 2.8 minutes (1 week in 1 hour)"},
    {4, 504, "Ultra Speed", "1 second = 8.4 minutes (1 week in 20 minutes)"},
    {5, 1008, "Time Warp", "1 second = 16.8 minutes (1 week in 10 minutes)"},
};

constexpr int kLevelCount = static_cast<int>(sizeof(kSpeedLevels) / sizeof(kSpeedLevels[0]));
} // namespace

VirtualClock::VirtualClock(const TimeSource& time)
    : time_(time),
      simulatedEpochMs_(time.nowMs()),
      realAnchorMs_(simulatedEpochMs_),
      level_(1),
      running_(false) {}

int VirtualClock::maxLevel() {
    return kLevelCount;
}

bool VirtualClock::isValidLevel(int level) {
    return level >= 1 && level <= kLevelCount;
}

const SpeedLevelInfo* VirtualClock::levelInfo(int level) {
    if (!isValidLevel(level)) return nullptr;
    return &kSpeedLevels[level - 1];
}

int VirtualClock::multiplierFor(int level) {
    const SpeedLevelInfo* info = levelInfo(level);
    return info ? info->multiplier : 0;
}

const char* VirtualClock::speedName(int level) {
    const SpeedLevelInfo* info = levelInfo(level);
    return info ? info->name : "Unknown";
}

long long VirtualClock::simulatedAtLocked(long long realNow) const {
    if (!running_) {
        return simulatedEpochMs_;
    }
    long long delta = realNow - realAnchorMs_;
    if (delta < 0) delta = 0;
    return simulatedEpochMs_ + delta * multiplierFor(level_);
}

bool VirtualClock::setLevel(int level) {
    if (!isValidLevel(level)) {
        return false;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    long long realNow = time_.nowMs();
    simulatedEpochMs_ = simulatedAtLocked(realNow);
    realAnchorMs_ = realNow;
    level_ = level;
    return true;
}

void VirtualClock::start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (running_) return;
    realAnchorMs_ = time_.nowMs();
    running_ = true;
}

void VirtualClock::pause() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!running_) return;
    long long realNow = time_.nowMs();
    simulatedEpochMs_ = simulatedAtLocked(realNow);
    realAnchorMs_ = realNow;
    running_ = false;
}

void VirtualClock::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    long long realNow = time_.nowMs();
    simulatedEpochMs_ = realNow;
    realAnchorMs_ = realNow;
    level_ = 1;
    running_ = false;
}

long long VirtualClock::nowMs() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return simulatedAtLocked(time_.nowMs());
}

int VirtualClock::level() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return level_;
}

int VirtualClock::multiplier() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return multiplierFor(level_);
}

bool VirtualClock::running() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return running_;
}
