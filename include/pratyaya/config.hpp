#pragma once
// Runtime configuration with defaults
//
// Root resolution order: explicit --path, PRATYAYA_ROOT, $HOME/workspace-brain.

#include "calibration_map.hpp"
#include "thresholds.hpp"

#include <cstdlib>
#include <string>

namespace pratyaya {

struct Config {
    std::string root;                 // Workspace root holding calibration/
    bool verbose = false;

    SweepOptions sweep;               // Threshold optimizer targets
    int trend_weeks = 12;             // Trend analysis window
    RefreshPolicy refresh;            // Calibration context reload policy

    static std::string default_root() {
        if (const char* root = std::getenv("PRATYAYA_ROOT")) {
            if (*root) return root;
        }
        const char* home = std::getenv("HOME");
        if (!home) home = ".";
        return std::string(home) + "/workspace-brain";
    }

    static Config defaults() {
        Config cfg;
        cfg.root = default_root();
        if (const char* v = std::getenv("PRATYAYA_VERBOSE")) {
            cfg.verbose = std::string(v) == "1";
        }
        return cfg;
    }
};

} // namespace pratyaya
