#pragma once

#include <signal.h>
#include <functional>

/**
 * @brief Helpers for installing process signal handlers through sigaction.
 *
 * Handlers run in signal context: keep them to lock-free atomic stores.
 */
namespace Signals {
    using Handler = std::function<void(int)>;

    /**
     * @brief Install a handler for a given signal.
     * @param signum signal number (e.g., SIGINT).
     * @param handler function/lambda taking the signal number.
     * @return true on success, false on failure.
     */
    bool setHandler(int signum, Handler handler);

    /**
     * @brief Ignore a given signal (SIG_IGN).
     * @param signum signal number to ignore.
     * @return true on success, false on failure.
     */
    bool ignore(int signum);

    /**
     * @brief Drop a handler installed by setHandler and restore SIG_DFL.
     * @return true on success, false on failure.
     */
    bool restoreDefault(int signum);
}
