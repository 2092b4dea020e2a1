#include "window_launcher.hpp"
#include <core/errors.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <platform/platform.hpp>
#include <platform/process.hpp>
#include <fmt/format.h>
#include <cstring>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

namespace {

std::string user_at_host(const HostSpec& host) {
    return host.user.empty() ? host.host : host.user + "@" + host.host;
}

// Double-quoted AppleScript string literal.
std::string applescript_quote(const std::string& s) {
    std::string out = "\"";
    for (char c : s) {
        if (c == '\\' || c == '"') out += '\\';
        out += c;
    }
    out += "\"";
    return out;
}

std::string join(const std::vector<std::string>& parts, const std::string& sep) {
    std::string out;
    for (std::size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) out += sep;
        out += parts[i];
    }
    return out;
}

// tmux command separator as typed into /bin/sh
const char* kTmuxSep = " \\; ";

} // namespace

// ── SystemShellRunner ────────────────────────────────────────

int SystemShellRunner::run(const std::string& command) {
    log_debug(fmt::format("shell: {}", command));
    return platform::run_shell(command);
}

int SystemShellRunner::capture(const std::string& command, std::string& output) {
    log_debug(fmt::format("shell (capture): {}", command));
    return platform::capture_shell(command, output);
}

void SystemShellRunner::replace_process(const std::string& command) {
    log_debug(fmt::format("exec: {}", command));
    int err = platform::exec_shell(command);
    throw ExternalToolError(fmt::format("Failed to exec '{}': {}", command, std::strerror(err)));
}

// ── WindowLauncher ───────────────────────────────────────────

WindowLauncher::WindowLauncher(ShellRunner& shell, std::optional<std::string> identity_file,
                               std::string title)
    : shell_(shell), identity_file_(std::move(identity_file)), title_(std::move(title)) {}

std::string WindowLauncher::ssh_command(const HostSpec& host) const {
    std::string cmd = "ssh ";
    if (identity_file_) cmd += "-i " + *identity_file_ + " ";
    return cmd + user_at_host(host);
}

void WindowLauncher::run_checked(const std::string& command) {
    int rc = shell_.run(command);
    if (rc != 0) {
        throw ExternalToolError(fmt::format("'{}' failed with exit code {}", command, rc));
    }
}

// ── screen ───────────────────────────────────────────────────

std::string WindowLauncher::screenrc(const std::vector<HostSpec>& hosts) const {
    std::string rc;
    auto user_rc = platform::home_dir() / ".screenrc";
    if (fs::exists(user_rc)) {
        rc += "source " + user_rc.string() + "\n";
    }
    rc += "caption always '%-Lw%{= BW}%50>%n%f* %t%{-}%+Lw%<'\n";
    rc += "hardstatus alwayslastline 'fleetsh " + title_ + "'\n";

    int window = 0;
    for (const auto& host : hosts) {
        rc += fmt::format("screen -t \"{}\" {} {}\n", host.host, window, ssh_command(host));
        ++window;
    }
    return rc;
}

void WindowLauncher::screen(const std::vector<HostSpec>& hosts) {
    auto path = platform::temp_file("fleetsh-screen");
    {
        std::ofstream out(path);
        if (!out) {
            throw ExternalToolError("Cannot write screen config " + path.string());
        }
        out << screenrc(hosts);
    }
    shell_.replace_process("screen -c " + path.string());
}

// ── tmux ─────────────────────────────────────────────────────

std::string WindowLauncher::tmux_session_name() const {
    std::string name = title_;
    for (auto& c : name) {
        if (c == ':') c = '=';
    }
    return "'fleetsh " + name + "'";
}

void WindowLauncher::tmux(const std::vector<HostSpec>& hosts, bool use_panes,
                          const TmuxConfig& config) {
    if (hosts.empty()) {
        throw ExternalToolError("No hosts to open in tmux");
    }

    const std::string name = tmux_session_name();
    const std::string sync_state = config.sync_panes ? "on" : "off";
    use_panes = use_panes || config.use_panes;

    auto tmux_ssh = [&](const HostSpec& host) { return "'" + ssh_command(host) + "'"; };

    std::string first_window;
    auto rename_window = [&](int start, int end) {
        std::string window = start == end ? fmt::format("'host {}'", start)
                                          : fmt::format("'hosts {}-{}'", start, end);
        if (first_window.empty()) first_window = window;
        run_checked(fmt::format("tmux rename-window -t {} {}", name, window));
    };

    const HostSpec& first = hosts.front();
    if (!use_panes) first_window = "'" + first.host + "'";

    std::vector<std::string> command;
    command.push_back(fmt::format("tmux new-session -d -n '{}' -s {} {}",
                                  first.host, name, tmux_ssh(first)));
    // Window names are set here; keep tmux from changing them
    command.push_back("setw automatic-rename off");
    command.push_back("setw allow-rename off");
    if (use_panes) {
        command.push_back("setw synchronize-panes " + sync_state);
        command.push_back("bind-key " + config.sync_panes_key + " set synchronize-panes");
        command.push_back("set display-time 3000");
    }
    run_checked(join(command, kTmuxSep));

    int pane_start = 1;
    int pane_count = 1;
    for (std::size_t i = 1; i < hosts.size(); ++i) {
        const HostSpec& host = hosts[i];
        if (!use_panes) {
            run_checked(fmt::format("tmux new-window -t {} -n '{}' {}",
                                    name, host.host, tmux_ssh(host)));
            continue;
        }

        int rc = shell_.run(fmt::format("tmux split-window -t {} {}{}select-layout {}",
                                        name, tmux_ssh(host), kTmuxSep, config.pane_layout));
        if (rc != 0) {
            // Window is full: name it after its panes and start another
            rename_window(pane_start, pane_count);
            pane_start = pane_count + 1;
            run_checked(fmt::format("tmux new-window -t {} -n '{}' {}{}setw synchronize-panes {}",
                                    name, host.host, tmux_ssh(host), kTmuxSep, sync_state));
        }
        ++pane_count;
    }
    if (use_panes) rename_window(pane_start, pane_count);

    command.clear();
    command.push_back("tmux attach-session -t " + name);
    command.push_back("select-window -t " + first_window);
    if (use_panes) {
        command.push_back(fmt::format("display-message 'use PREFIX + {} to toggle synchronized panes'",
                                      config.sync_panes_key));
    }
    command.push_back("refresh-client");
    shell_.replace_process(join(command, kTmuxSep));
}

// ── macterm ──────────────────────────────────────────────────

std::string WindowLauncher::macterm_script(const std::vector<HostSpec>& hosts) const {
    std::vector<std::string> lines;
    lines.push_back("tell application \"Terminal\" to activate");
    lines.push_back("tell application \"System Events\" to keystroke \"n\" using command down");
    for (std::size_t i = 1; i < hosts.size(); ++i) {
        lines.push_back("tell application \"System Events\" to keystroke \"t\" using command down");
    }
    for (std::size_t i = 0; i < hosts.size(); ++i) {
        std::string cmd = fmt::format("unset PROMPT_COMMAND; printf '\\033]0;%s\\007' {}; {}",
                                      hosts[i].host, ssh_command(hosts[i]));
        lines.push_back(fmt::format("tell application \"Terminal\" to do script {} in tab {} of front window",
                                    applescript_quote(cmd), i + 1));
    }
    return join(lines, "\n");
}

void WindowLauncher::macterm(const std::vector<HostSpec>& hosts) {
#ifdef __APPLE__
    std::string command = "osascript";
    for (const auto& line : split_on(macterm_script(hosts), "\n")) {
        command += " -e " + shell_quote(line);
    }
    run_checked(command);
#else
    (void)hosts;
    throw ExternalToolError("macterm needs Terminal.app and is only available on macOS");
#endif
}

// ── cssh ─────────────────────────────────────────────────────

void WindowLauncher::cssh(const std::vector<HostSpec>& hosts) {
    std::string cssh_cmd;
    for (const char* candidate : {"csshX", "cssh"}) {
        std::string out;
        if (shell_.capture(std::string("which ") + candidate, out) == 0) {
            trim(out);
            if (!out.empty()) {
                cssh_cmd = out;
                break;
            }
        }
    }
    if (cssh_cmd.empty()) {
        throw ExternalToolError("no command found for cssh. Install csshX (macOS) or clusterssh");
    }

    for (const auto& host : hosts) {
        cssh_cmd += " " + user_at_host(host);
    }
    log_debug("starting cssh session with command: " + cssh_cmd);
    shell_.replace_process(cssh_cmd);
}
