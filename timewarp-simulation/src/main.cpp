#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <string>

#include "clock/virtual_clock.hpp"
#include "director.hpp"
#include "model/config.hpp"
#include "util/error.hpp"

namespace {
int printLevels() {
    std::cout << "Level  Multiplier  Name           Description\n";
    for (int level = 1; level <= VirtualClock::maxLevel(); ++level) {
        const SpeedLevelInfo* info = VirtualClock::levelInfo(level);
        std::cout << std::left << std::setw(7) << info->level
                  << std::setw(12) << ("x" + std::to_string(info->multiplier))
                  << std::setw(15) << info->name
                  << info->description << "\n";
    }
    return EXIT_SUCCESS;
}

void printUsage(const char* self) {
    std::cerr << "Usage: " << self << " [--config <path>]\n"
              << "       " << self << " levels" << std::endl;
}
} // namespace

// Entry point dispatches run modes: speed level table or the continuous simulation.
int main(int argc, char* argv[]) {
    if (argc >= 2 && std::string(argv[1]) == "levels") {
        return printLevels();
    }

    Config cfg{};
    std::string err;
    bool configOk = false;

    if (argc >= 2 && std::string(argv[1]) == "--config") {
        if (argc < 3) {
            printUsage(argv[0]);
            return EXIT_FAILURE;
        }
        configOk = parseConfigFile(argv[2], cfg, err);
    } else if (argc >= 2) {
        printUsage(argv[0]);
        return EXIT_FAILURE;
    } else {
        // default config file paths: current dir then parent
        std::string errLocal;
        configOk = parseConfigFile("config.cfg", cfg, errLocal);
        if (!configOk) {
            std::string errParent;
            configOk = parseConfigFile("../config.cfg", cfg, errParent);
            if (!configOk) {
                err = "tried config.cfg (" + errLocal + ") and ../config.cfg (" + errParent + ")";
            }
        }
    }

    if (!configOk) {
        die("Config error: " + err);
    }

    SimulationRunner runner;
    int rc = runner.run(cfg);
    if (rc == 0) {
        const std::string& summaryPath = runner.lastSummaryPath();
        std::ifstream in(summaryPath);
        if (in) {
            std::cout << "\n=== " << summaryPath << " ===\n";
            std::cout << in.rdbuf() << std::flush;
        } else {
            std::cerr << "Failed to open summary file: " << summaryPath << std::endl;
        }
        std::cout << "Log written to " << runner.lastLogPath() << std::endl;
    } else {
        std::cerr << "TimeWarp simulation ended with errors (log: " << runner.lastLogPath() << ")" << std::endl;
    }
    return rc;
}
