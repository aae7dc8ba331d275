#pragma once

#include <string>

#include "model/types.hpp"

class LogQueue;
class CycleOrchestrator;
class DispatchQueue;
class LifecycleMonitor;

/**
 * @brief Dedicated logger writing text lines to a file descriptor.
 */
class Logger {
public:
    /** @brief Default constructor leaves fd closed. */
    Logger();

    /**
     * @brief Construct and open a log file immediately.
     * @param path file path to open/create.
     */
    explicit Logger(const std::string& path);

    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    /**
     * @brief Open or create the log file (append mode).
     * @param path file path.
     * @return true on success, false on failure.
     */
    bool openFile(const std::string& path);

    /**
     * @brief Write one log line; a newline is appended.
     * @param line text to write.
     * @return false if the file is closed or write fails.
     */
    bool logLine(const std::string& line);

    /**
     * @brief Close the file descriptor if open.
     */
    void closeFile();

    bool isOpen() const { return fd != -1; }

private:
    int fd;
};

/**
 * @brief Blocking logger loop: drain the queue and write each entry to file.
 *
 * Returns when the queue is closed and empty.
 * @param queue channel filled by logEvent.
 * @param path log file path.
 * @return 0 on clean exit, non-zero if the file could not be opened or written.
 */
int runLogger(LogQueue& queue, const std::string& path);

/**
 * @brief Components whose state is prefixed to every log line.
 *
 * Any pointer may be null; its fields are then omitted. The pointees must
 * outlive the context (clear it before destroying them).
 */
struct LogMetricsContext {
    const CycleOrchestrator* orchestrator{nullptr};
    const DispatchQueue*     dispatch{nullptr};
    const LifecycleMonitor*  monitor{nullptr};
};

/**
 * @brief Set the context used by logEvent to prefix simulation metrics.
 */
void setLogMetricsContext(const LogMetricsContext& context);

/** @brief Stop prefixing metrics. */
void clearLogMetricsContext();

/**
 * @brief Current metrics prefix, e.g. "sim=D3H14;qD=2;rM=4;rH=12;hs=95".
 * @return "-" when no context is set.
 */
std::string currentMetricsPrefix();

/**
 * @brief Queue one log entry without blocking.
 * @param queue destination; null disables logging.
 * @param role sender role.
 * @param text text payload.
 * @return true if queued, false if dropped or logging is disabled.
 */
bool logEvent(LogQueue* queue, Role role, const std::string& text);
