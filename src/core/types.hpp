#pragma once

#include <string>
#include <optional>
#include <vector>
#include <functional>

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    std::string error;

    static Result<T> Ok(T val) {
        return {true, std::move(val), ""};
    }

    static Result<T> Err(const std::string& err) {
        return {false, T{}, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// What to do when a single host fails to connect.
enum class ErrorPolicy {
    kSkip,    // warn, drop the host, keep going
    kRaise,   // abort pool setup on the first failure
};

// One connection target. Built per resolved host at configure time.
struct HostSpec {
    std::string host;
    std::string user;
    int port = 22;
    std::optional<std::string> identity_file;
    std::optional<std::string> password;
    bool forward_agent = false;
    bool verify_host_key = true;
    int timeout = 30;

    // "user@host" or just "host"
    std::string display() const {
        return user.empty() ? host : user + "@" + host;
    }
};

// Options shared by every target in one invocation.
struct SessionOptions {
    std::string user;
    std::optional<int> port;
    std::optional<std::string> identity_file;
    std::optional<std::string> password;
    bool forward_agent = false;
    bool verify_host_key = true;
    int concurrency = 0;          // 0 = one worker per target
    ErrorPolicy on_error = ErrorPolicy::kSkip;
};

// Output of host resolution: the connect addresses, plus how many
// inventory records matched (so "nothing found" can be told apart from
// "found, but missing the attribute").
struct ResolvedTargets {
    std::vector<std::string> targets;
    std::size_t matched = 0;
};

struct TmuxConfig {
    std::string pane_layout = "tiled";
    bool use_panes = false;
    bool sync_panes = true;
    std::string sync_panes_key = "s";
};

// Reads a secret from the operator. Must never echo.
using PasswordPrompt = std::function<std::string(const std::string& prompt)>;
