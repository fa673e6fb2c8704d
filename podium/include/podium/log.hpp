#pragma once
// Logging: component-tagged diagnostics on stderr
//
// Errors and admin actions are written unconditionally as "[component] msg".
// log_debug() lines carry an HH:MM:SS.mmm stamp and only appear once
// set_verbose(true) has been called (the CLI's --verbose flag).

#include <atomic>
#include <chrono>
#include <cstdarg>
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <iostream>

namespace podium {

inline std::atomic<bool> verbose_mode{false};

inline void set_verbose(bool on) { verbose_mode = on; }
inline bool verbose() { return verbose_mode; }

inline void log_debug(const char* component, const char* fmt, ...) {
    if (!verbose_mode) return;

    // Get timestamp with milliseconds
    auto now = std::chrono::system_clock::now();
    auto now_time_t = std::chrono::system_clock::to_time_t(now);
    auto now_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    char time_buf[32];
    std::strftime(time_buf, sizeof(time_buf), "%H:%M:%S", std::localtime(&now_time_t));

    std::cerr << "[" << time_buf << "." << std::setfill('0') << std::setw(3)
              << now_ms.count() << "][" << component << "] ";
    std::cerr.flush();

    va_list args;
    va_start(args, fmt);
    vfprintf(stderr, fmt, args);
    va_end(args);
    std::cerr << "\n";
}

} // namespace podium
