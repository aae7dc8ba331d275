#include "logging/logger.hpp"

#include "clock/time_source.hpp"
#include "dispatch/dispatch_queue.hpp"
#include "lifecycle/lifecycle_monitor.hpp"
#include "logging/log_queue.hpp"
#include "model/events.hpp"
#include "model/status.hpp"
#include "orchestration/cycle_orchestrator.hpp"
#include "util/error.hpp"

#include <fcntl.h>
#include <cerrno>
#include <unistd.h>
#include <mutex>
#include <string>

Logger::Logger() : fd(-1) {}

Logger::Logger(const std::string& path) : fd(-1) {
    openFile(path);
}

Logger::~Logger() {
    closeFile();
}

bool Logger::openFile(const std::string& path) {
    if (fd != -1) {
        closeFile();
    }
    fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_APPEND, 0644);
    if (fd == -1) {
        logErrno("open log file failed");
        return false;
    }
    return true;
}

bool Logger::logLine(const std::string& line) {
    if (fd == -1) {
        return false;
    }
    std::string withNewline = line;
    withNewline.push_back('\n');
    size_t offset = 0;
    while (offset < withNewline.size()) {
        ssize_t written = ::write(fd, withNewline.data() + offset, withNewline.size() - offset);
        if (written == -1) {
            if (errno == EINTR) continue;
            logErrno("write failed");
            return false;
        }
        offset += static_cast<size_t>(written);
    }
    return true;
}

void Logger::closeFile() {
    if (fd != -1) {
        ::close(fd);
        fd = -1;
    }
}

namespace {
std::mutex g_contextMutex;
LogMetricsContext g_logMetricsContext{};
bool g_metricsContextSet = false;
} // namespace

int runLogger(LogQueue& queue, const std::string& path) {
    Logger logger(path);
    bool ok = logger.isOpen();

    // Keep draining even without a file so producers are never stuck on a full queue.
    LogMessage msg;
    while (queue.pop(msg)) {
        if (!ok) continue;
        // Semicolon-separated line for easy parsing/CSV import:
        // wallMs;sim;qD;rM;rH;hs;role;text
        std::string line = std::to_string(msg.wallMs) + ";" + msg.text;
        if (!logger.logLine(line)) {
            ok = false;
        }
    }

    logger.closeFile();
    return ok ? 0 : 1;
}

void setLogMetricsContext(const LogMetricsContext& context) {
    std::lock_guard<std::mutex> lock(g_contextMutex);
    g_logMetricsContext = context;
    g_metricsContextSet = true;
}

void clearLogMetricsContext() {
    std::lock_guard<std::mutex> lock(g_contextMutex);
    g_logMetricsContext = LogMetricsContext{};
    g_metricsContextSet = false;
}

std::string currentMetricsPrefix() {
    LogMetricsContext ctx;
    {
        std::lock_guard<std::mutex> lock(g_contextMutex);
        if (!g_metricsContextSet) {
            return "-";
        }
        ctx = g_logMetricsContext;
    }
    std::string out;
    if (ctx.orchestrator) {
        CycleState state = ctx.orchestrator->cycleState();
        out += "sim=D" + std::to_string(state.simDay) + "H" + std::to_string(state.simHour) + ";";
    }
    if (ctx.dispatch) {
        out += "qD=" + std::to_string(ctx.dispatch->depth()) + ";"
             + "rM=" + std::to_string(ctx.dispatch->recentRateMinute()) + ";"
             + "rH=" + std::to_string(ctx.dispatch->recentRateHour()) + ";";
    }
    if (ctx.monitor) {
        out += "hs=" + std::to_string(ctx.monitor->healthScore()) + ";";
    }
    if (out.empty()) {
        return "-";
    }
    out.pop_back();
    return out;
}

bool logEvent(LogQueue* queue, Role role, const std::string& text) {
    if (!queue) {
        return false;
    }
    LogMessage msg;
    msg.wallMs = monotonicMs();
    msg.role = role;
    msg.text = currentMetricsPrefix() + ";" + roleLabel(role) + ";" + text;
    // Never block the simulation on logging; a full queue drops the entry.
    return queue->tryPush(std::move(msg));
}
