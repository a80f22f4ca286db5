#pragma once
// Component-tagged diagnostics on stderr
//
//   [PredictionStore] Skipping malformed record: ...
//   [12:04:55.120][ThresholdOptimizer] autonomous sweep: 0.93 accepted
//
// Warnings always print. Debug lines only in verbose mode.

#include <atomic>
#include <chrono>
#include <cstdarg>
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <iostream>

namespace pratyaya::log {

inline std::atomic<bool> verbose_mode{false};

inline void set_verbose(bool on) { verbose_mode = on; }
inline bool verbose() { return verbose_mode; }

inline void debug(const char* component, const char* fmt, ...) {
    if (!verbose_mode) return;

    // Get timestamp with milliseconds
    auto now = std::chrono::system_clock::now();
    auto now_time_t = std::chrono::system_clock::to_time_t(now);
    auto now_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm local{};
    ::localtime_r(&now_time_t, &local);
    char time_buf[32];
    std::strftime(time_buf, sizeof(time_buf), "%H:%M:%S", &local);

    std::cerr << "[" << time_buf << "." << std::setfill('0') << std::setw(3)
              << now_ms.count() << "][" << component << "] " << std::flush;

    va_list args;
    va_start(args, fmt);
    std::vfprintf(stderr, fmt, args);
    va_end(args);
    std::cerr << "\n";
}

inline void warn(const char* component, const char* fmt, ...) {
    std::cerr << "[" << component << "] " << std::flush;

    va_list args;
    va_start(args, fmt);
    std::vfprintf(stderr, fmt, args);
    va_end(args);
    std::cerr << "\n";
}

} // namespace pratyaya::log
