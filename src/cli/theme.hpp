#pragma once

#include <string>
#include <fmt/format.h>

namespace theme {

// ANSI escape sequences
namespace color {
    const std::string CYAN      = "\033[36m";
    const std::string BLUE      = "\033[34m";
    const std::string WHITE     = "\033[97m";
    const std::string GRAY      = "\033[90m";
    const std::string RED       = "\033[91m";
    const std::string GREEN     = "\033[92m";
    const std::string YELLOW    = "\033[93m";
    const std::string BOLD      = "\033[1m";
    const std::string DIM       = "\033[2m";
    const std::string RESET     = "\033[0m";
}

// Shorthand wrappers
inline std::string cyan(const std::string& s)    { return color::CYAN + s + color::RESET; }
inline std::string bold(const std::string& s)    { return color::BOLD + s + color::RESET; }
inline std::string dim(const std::string& s)     { return color::DIM + s + color::RESET; }
inline std::string green(const std::string& s)   { return color::GREEN + s + color::RESET; }
inline std::string red(const std::string& s)     { return color::RED + s + color::RESET; }
inline std::string yellow(const std::string& s)  { return color::YELLOW + s + color::RESET; }

// Section header: blank line before title, blank line after
inline std::string section(const std::string& title) {
    return "\n" + color::BOLD + title + color::RESET + "\n\n";
}

// ── Status indicators ───────────────────────────────────

inline std::string ok(const std::string& msg) {
    return color::GREEN + "+ " + color::RESET + msg + "\n";
}

inline std::string fail(const std::string& msg) {
    return color::RED + "FATAL: " + color::RESET + msg + "\n";
}

inline std::string warn(const std::string& msg) {
    return color::YELLOW + "WARNING: " + color::RESET + msg + "\n";
}

inline std::string info(const std::string& msg) {
    return color::BLUE + "~ " + color::RESET + msg + "\n";
}

inline std::string step(const std::string& msg) {
    return color::DIM + "  > " + color::RESET + msg + "\n";
}

// Subtle log line for internal status (dimmer than program output)
inline std::string log(const std::string& msg) {
    return "\033[38;2;80;80;80m  \xc2\xb7 " + msg + "\033[0m\n";
}

// Key-value row for usage/help panels
inline std::string kv(const std::string& key, const std::string& value) {
    return color::DIM + fmt::format("    {:<26}", key) + color::RESET + value + "\n";
}

} // namespace theme
