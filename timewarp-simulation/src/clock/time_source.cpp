#include "clock/time_source.hpp"

#include "util/error.hpp"

#include <ctime>

long long monotonicMs() {
    struct timespec ts {};
    if (clock_gettime(CLOCK_MONOTONIC, &ts) == -1) {
        logErrno("clock_gettime failed");
        return 0;
    }
    return static_cast<long long>(ts.tv_sec) * 1000LL + ts.tv_nsec / 1000000LL;
}

long long SteadyTimeSource::nowMs() const {
    return monotonicMs();
}
