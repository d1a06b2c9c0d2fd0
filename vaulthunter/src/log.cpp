/**
 * @file log.cpp
 * @brief Debug mode and log output
 */

#include "log.h"

#include <atomic>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>

namespace vaulthunter {

// ============================================================================
// DEBUG MODE
// ============================================================================

static std::atomic<bool> g_debug_mode{false};
static std::atomic<LogLevel> g_log_level{LogLevel::None};

void set_debug_mode(bool enabled) {
    g_debug_mode = enabled;
    if (enabled && g_log_level == LogLevel::None) {
        g_log_level = LogLevel::Debug;  // Enable all logs by default
    }
}

void set_log_level(LogLevel level) {
    g_log_level = level;
    if (level != LogLevel::None) {
        g_debug_mode = true;
    }
}

bool is_debug_mode() {
    return g_debug_mode;
}

LogLevel get_log_level() {
    return g_log_level;
}

void debug_log(LogLevel level, const std::string& category, const std::string& message) {
    if (!g_debug_mode || level > g_log_level) return;

    const char* level_str = "";
    const char* color_start = "";
    const char* color_end = "\033[0m";

    switch (level) {
        case LogLevel::Error:
            level_str = "ERROR";
            color_start = "\033[31m";  // Red
            break;
        case LogLevel::Warning:
            level_str = "WARN ";
            color_start = "\033[33m";  // Yellow
            break;
        case LogLevel::Info:
            level_str = "INFO ";
            color_start = "\033[36m";  // Cyan
            break;
        case LogLevel::Debug:
            level_str = "DEBUG";
            color_start = "\033[90m";  // Gray
            break;
        default:
            return;
    }

    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm tm_buf;
#ifdef _WIN32
    localtime_s(&tm_buf, &time);
#else
    localtime_r(&time, &tm_buf);
#endif

    std::cerr << color_start
              << "[" << std::setfill('0') << std::setw(2) << tm_buf.tm_hour
              << ":" << std::setw(2) << tm_buf.tm_min
              << ":" << std::setw(2) << tm_buf.tm_sec
              << "." << std::setw(3) << ms.count() << "] "
              << "[" << level_str << "] "
              << "[" << category << "] "
              << color_end
              << message << std::endl;
}

} // namespace vaulthunter
