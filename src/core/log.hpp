#pragma once

#include <string>

// Debug log, modeled on a plain append-only file under the temp dir.
// Every message lands in the file; messages at or above the console
// level are also echoed to stderr.

enum class LogLevel {
    kDebug = 0,
    kInfo,
    kWarn,
    kError,
};

// Path of the debug log file ($TMPDIR/fleetsh_debug.log).
std::string fleetsh_log_path();

// Messages below this level stay in the file only. Default: kWarn.
void set_console_log_level(LogLevel level);
LogLevel console_log_level();

void fleetsh_log(LogLevel level, const std::string& msg);

inline void log_debug(const std::string& msg) { fleetsh_log(LogLevel::kDebug, msg); }
inline void log_info(const std::string& msg)  { fleetsh_log(LogLevel::kInfo, msg); }
inline void log_warn(const std::string& msg)  { fleetsh_log(LogLevel::kWarn, msg); }
inline void log_error(const std::string& msg) { fleetsh_log(LogLevel::kError, msg); }
