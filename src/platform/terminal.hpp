#pragma once

#include <string>

namespace platform {

// Get terminal dimensions.
int term_width();
int term_height();

// True when stdout is attached to a terminal.
bool stdout_is_tty();

// RAII guard that turns terminal echo off.
// Constructor saves the current mode; destructor restores it.
struct NoEchoGuard {
    NoEchoGuard();
    ~NoEchoGuard();

    NoEchoGuard(const NoEchoGuard&) = delete;
    NoEchoGuard& operator=(const NoEchoGuard&) = delete;

private:
    struct Impl;
    Impl* impl_ = nullptr;
};

// Print prompt to stderr and read one line from stdin with echo disabled.
// Returns an empty string on end-of-input.
std::string read_password(const std::string& prompt);

} // namespace platform
