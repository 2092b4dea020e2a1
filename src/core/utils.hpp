#pragma once

#include <string>
#include <vector>

// Safe integer parse: returns fallback on failure (no exceptions).
int safe_stoi(const std::string& s, int fallback = 0);

// Trim leading and trailing whitespace in-place.
inline void trim(std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) { s.clear(); return; }
    s.erase(0, start);
    s.erase(s.find_last_not_of(" \t\r\n") + 1);
}

// Split on runs of whitespace. Empty fields are dropped.
std::vector<std::string> split_whitespace(const std::string& s);

// Split on an exact separator string ("a AND b" -> {"a", "b"}).
std::vector<std::string> split_on(const std::string& s, const std::string& sep);

// Expand a leading "~/" to the user's home directory.
std::string expand_user_path(const std::string& path);

// Quote a string for /bin/sh using single quotes.
std::string shell_quote(const std::string& s);
