#pragma once

#include <optional>
#include <string>
#include <vector>
#include <core/types.hpp>

// Runs shell command lines for the launchers.
class ShellRunner {
public:
    virtual ~ShellRunner() = default;

    // Run and wait. Returns the exit code.
    virtual int run(const std::string& command) = 0;

    // Run, wait and capture stdout. Returns the exit code.
    virtual int capture(const std::string& command, std::string& output) = 0;

    // Replace this process with command. Throws ExternalToolError if the
    // exec fails; otherwise does not return (test runners do).
    virtual void replace_process(const std::string& command) = 0;
};

// ShellRunner over /bin/sh.
class SystemShellRunner : public ShellRunner {
public:
    int run(const std::string& command) override;
    int capture(const std::string& command, std::string& output) override;
    void replace_process(const std::string& command) override;
};

// WindowLauncher: hands the resolved hosts to a terminal multiplexer or
// windowing tool, one ssh per host. Nothing here opens an SSH session
// itself. Failures throw ExternalToolError.
class WindowLauncher {
public:
    // title is the search query; it names the screen/tmux session.
    WindowLauncher(ShellRunner& shell, std::optional<std::string> identity_file,
                   std::string title);

    // GNU screen with one window per host, via a generated screenrc.
    void screen(const std::vector<HostSpec>& hosts);

    // tmux session with one window per host, or tiled panes when
    // use_panes is set (new windows once a window cannot split further).
    void tmux(const std::vector<HostSpec>& hosts, bool use_panes, const TmuxConfig& config);

    // Terminal.app, one tab per host. macOS only.
    void macterm(const std::vector<HostSpec>& hosts);

    // csshX or cssh, whichever is on PATH first.
    void cssh(const std::vector<HostSpec>& hosts);

    // Contents of the generated screenrc.
    std::string screenrc(const std::vector<HostSpec>& hosts) const;

    // AppleScript driving Terminal.app.
    std::string macterm_script(const std::vector<HostSpec>& hosts) const;

    // "'fleetsh <title>'" with ':' replaced, as tmux rejects it in names.
    std::string tmux_session_name() const;

private:
    ShellRunner& shell_;
    std::optional<std::string> identity_file_;
    std::string title_;

    std::string ssh_command(const HostSpec& host) const;
    void run_checked(const std::string& command);
};
