#include "model/config.hpp"

#include "clock/virtual_clock.hpp"
#include "dispatch/rate_window.hpp"

#include <exception>
#include <fstream>
#include <stdexcept>
#include <string>

Config defaultConfig() {
    Config cfg{};
    cfg.defaultSpeedLevel = 5;
    cfg.tickIntervalMs = 100;
    cfg.cycleDurationSeconds = 900;
    cfg.interCyclePauseSeconds = 30;
    cfg.startHour = 9;
    cfg.randomSeed = 12345;
    cfg.ratePerMinute = 5;
    cfg.ratePerHour = 30;
    cfg.retryBackoffMs = 500;
    cfg.queueCapacity = 0;
    cfg.statusIntervalSeconds = 60;
    cfg.transientFailurePercent = 5;
    cfg.terminalFailurePercent = 0;
    return cfg;
}

bool validateConfig(const Config& cfg, std::string& err) {
    if (!VirtualClock::isValidLevel(cfg.defaultSpeedLevel)) {
        err = "defaultSpeedLevel must be between 1 and " + std::to_string(VirtualClock::maxLevel());
        return false;
    }
    if (cfg.tickIntervalMs < 0) {
        err = "tickIntervalMs must be >= 0 (0 = manual stepping)";
        return false;
    }
    if (cfg.cycleDurationSeconds < 0) {
        err = "cycleDurationSeconds must be >= 0";
        return false;
    }
    if (cfg.interCyclePauseSeconds < 0) {
        err = "interCyclePauseSeconds must be >= 0";
        return false;
    }
    if (cfg.startHour < 0 || cfg.startHour > 23) {
        err = "startHour must be in 0..23";
        return false;
    }
    if (!DualRateLimiter::validate(cfg.ratePerMinute, cfg.ratePerHour, err)) {
        return false;
    }
    if (cfg.retryBackoffMs < 0) {
        err = "retryBackoffMs must be >= 0";
        return false;
    }
    if (cfg.queueCapacity < 0) {
        err = "queueCapacity must be >= 0 (0 = unbounded)";
        return false;
    }
    if (cfg.statusIntervalSeconds <= 0) {
        err = "statusIntervalSeconds must be > 0";
        return false;
    }
    if (cfg.transientFailurePercent < 0 || cfg.terminalFailurePercent < 0 ||
        cfg.transientFailurePercent + cfg.terminalFailurePercent > 100) {
        err = "failure percentages must be >= 0 and sum to at most 100";
        return false;
    }
    return true;
}

bool parseConfigFile(const std::string& path, Config& cfg, std::string& err) {
    std::ifstream in(path);
    if (!in) {
        err = "Cannot open config file: " + path;
        return false;
    }
    // Defaults in case some keys are absent.
    cfg = defaultConfig();

    auto trim = [](const std::string& s) {
        size_t b = s.find_first_not_of(" \t\r\n");
        if (b == std::string::npos) return std::string();
        size_t e = s.find_last_not_of(" \t\r\n");
        return s.substr(b, e - b + 1);
    };

    // std::stoi/stoul stop at the first non-digit; require the whole value to be consumed.
    auto toInt = [](const std::string& s) {
        size_t pos = 0;
        int v = std::stoi(s, &pos);
        if (pos != s.size()) throw std::invalid_argument(s);
        return v;
    };
    auto toUnsigned = [](const std::string& s) {
        size_t pos = 0;
        unsigned long v = std::stoul(s, &pos);
        if (pos != s.size() || s[0] == '-') throw std::invalid_argument(s);
        return static_cast<unsigned int>(v);
    };

    std::string line;
    while (std::getline(in, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#') continue;
        auto pos = line.find('=');
        if (pos == std::string::npos) continue;
        std::string key = trim(line.substr(0, pos));
        std::string val = trim(line.substr(pos + 1));
        try {
            if (key == "defaultSpeedLevel") cfg.defaultSpeedLevel = toInt(val);
            else if (key == "tickIntervalMs") cfg.tickIntervalMs = toInt(val);
            else if (key == "cycleDurationSeconds") cfg.cycleDurationSeconds = toInt(val);
            else if (key == "interCyclePauseSeconds") cfg.interCyclePauseSeconds = toInt(val);
            else if (key == "startHour") cfg.startHour = toInt(val);
            else if (key == "randomSeed") cfg.randomSeed = toUnsigned(val);
            else if (key == "ratePerMinute") cfg.ratePerMinute = toInt(val);
            else if (key == "ratePerHour") cfg.ratePerHour = toInt(val);
            else if (key == "retryBackoffMs") cfg.retryBackoffMs = toInt(val);
            else if (key == "queueCapacity") cfg.queueCapacity = toInt(val);
            else if (key == "statusIntervalSeconds") cfg.statusIntervalSeconds = toInt(val);
            else if (key == "transientFailurePercent") cfg.transientFailurePercent = toInt(val);
            else if (key == "terminalFailurePercent") cfg.terminalFailurePercent = toInt(val);
            else {
                err = "Unknown config key: " + key;
                return false;
            }
        } catch (const std::exception&) {
            err = "Invalid value for key: " + key;
            return false;
        }
    }
    return validateConfig(cfg, err);
}
