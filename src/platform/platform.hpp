#pragma once

#include <string>
#include <filesystem>

namespace platform {

// Returns the user's home directory (HOME).
std::filesystem::path home_dir();

// Login name of the current user (USER, then the passwd entry).
std::string user_name();

// Returns the system temporary directory.
std::filesystem::path temp_dir();

// Creates a temporary file with the given prefix. Returns its path.
std::filesystem::path temp_file(const std::string& prefix);

// Sleep for the given number of milliseconds.
void sleep_ms(int ms);

// Install a SIGINT handler that only raises a flag. Polled by the event loop.
void install_interrupt_handler();
void remove_interrupt_handler();
bool interrupted();

} // namespace platform
