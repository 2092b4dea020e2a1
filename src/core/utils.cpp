#include "utils.hpp"
#include <platform/platform.hpp>
#include <sstream>

int safe_stoi(const std::string& s, int fallback) {
    try {
        size_t used = 0;
        int v = std::stoi(s, &used);
        return used == s.size() ? v : fallback;
    } catch (const std::exception&) {
        return fallback;
    }
}

std::vector<std::string> split_whitespace(const std::string& s) {
    std::vector<std::string> out;
    std::istringstream iss(s);
    std::string word;
    while (iss >> word) {
        out.push_back(word);
    }
    return out;
}

std::vector<std::string> split_on(const std::string& s, const std::string& sep) {
    std::vector<std::string> out;
    if (sep.empty()) {
        out.push_back(s);
        return out;
    }
    size_t start = 0;
    while (true) {
        size_t pos = s.find(sep, start);
        if (pos == std::string::npos) {
            out.push_back(s.substr(start));
            break;
        }
        out.push_back(s.substr(start, pos - start));
        start = pos + sep.size();
    }
    return out;
}

std::string expand_user_path(const std::string& path) {
    if (path == "~") return platform::home_dir().string();
    if (path.rfind("~/", 0) == 0) {
        return (platform::home_dir() / path.substr(2)).string();
    }
    return path;
}

std::string shell_quote(const std::string& s) {
    std::string out = "'";
    for (char c : s) {
        if (c == '\'') {
            out += "'\\''";
        } else {
            out += c;
        }
    }
    out += "'";
    return out;
}
