#pragma once

#include <string>

struct Config {
    int defaultSpeedLevel;        // level applied when a continuous run starts (1..5)
    int tickIntervalMs;           // drive loop period; 0 = caller steps runTick() itself
    int cycleDurationSeconds;     // running wall-clock budget per cycle (0 = only the 7-day bound)
    int interCyclePauseSeconds;
    int startHour;                // simulated hour each cycle starts at
    unsigned int randomSeed;
    int ratePerMinute;            // sliding 60 s ceiling
    int ratePerHour;              // sliding 3600 s ceiling
    int retryBackoffMs;           // first retry delay, doubled per retry
    int queueCapacity;            // 0 = unbounded
    int statusIntervalSeconds;    // console status period of the executable
    int transientFailurePercent;  // SimulatedSender failure injection
    int terminalFailurePercent;
};

/** @brief Configuration used when a key is absent from the config file. */
Config defaultConfig();

/**
 * @brief Check ranges and cross-field constraints.
 * @param cfg values to check.
 * @param err human readable reason on failure.
 * @return true if valid.
 */
bool validateConfig(const Config& cfg, std::string& err);

/**
 * @brief Load key/value pairs from config file with defaults and validation.
 * @param path path to config file.
 * @param cfg destination structure to fill.
 * @param err error message on failure.
 * @return true if parsed and validated, false otherwise.
 */
bool parseConfigFile(const std::string& path, Config& cfg, std::string& err);
