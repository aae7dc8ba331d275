#pragma once

#include <string>

/**
 * @brief Print a startup failure to stderr and exit with EXIT_FAILURE.
 */
void die(const std::string& message);

/**
 * @brief Report a failed system call: message followed by strerror(errno).
 */
void logErrno(const std::string& message);
