#include "log.hpp"
#include <cli/theme.hpp>
#include <platform/platform.hpp>
#include <atomic>
#include <chrono>
#include <ctime>
#include <cstdio>
#include <fstream>
#include <iostream>
#include <mutex>

static std::mutex g_log_mutex;
static std::atomic<int> g_console_level{static_cast<int>(LogLevel::kWarn)};

static const char* level_tag(LogLevel level) {
    switch (level) {
    case LogLevel::kDebug: return "DEBUG";
    case LogLevel::kInfo:  return "INFO";
    case LogLevel::kWarn:  return "WARN";
    case LogLevel::kError: return "ERROR";
    }
    return "?";
}

std::string fleetsh_log_path() {
    static std::string path = (platform::temp_dir() / "fleetsh_debug.log").string();
    return path;
}

void set_console_log_level(LogLevel level) {
    g_console_level.store(static_cast<int>(level));
}

LogLevel console_log_level() {
    return static_cast<LogLevel>(g_console_level.load());
}

void fleetsh_log(LogLevel level, const std::string& msg) {
    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;
    struct tm tm_buf;
    localtime_r(&t, &tm_buf);

    char ts[32];
    std::snprintf(ts, sizeof(ts), "%02d:%02d:%02d.%03d",
                  tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec,
                  static_cast<int>(ms.count()));

    std::lock_guard<std::mutex> lock(g_log_mutex);

    std::ofstream out(fleetsh_log_path(), std::ios::app);
    if (out) {
        out << "[" << ts << "] " << level_tag(level) << " " << msg << "\n";
    }

    if (static_cast<int>(level) < g_console_level.load()) return;

    switch (level) {
    case LogLevel::kDebug: std::cerr << theme::log(msg); break;
    case LogLevel::kInfo:  std::cerr << theme::info(msg); break;
    case LogLevel::kWarn:  std::cerr << theme::warn(msg); break;
    case LogLevel::kError: std::cerr << theme::fail(msg); break;
    }
}
