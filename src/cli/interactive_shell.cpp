#include "interactive_shell.hpp"
#include "line_reader.hpp"
#include "theme.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <platform/platform.hpp>
#include <exec/execution_engine.hpp>
#include <ssh/session_manager.hpp>
#include <fmt/format.h>
#include <regex>
#include <unordered_set>

InteractiveShell::InteractiveShell(SessionManager& sessions, ExecutionEngine& engine,
                                   LineReader& reader, std::ostream& out, bool color)
    : sessions_(sessions), engine_(engine), reader_(reader), out_(out), color_(color) {}

std::optional<InteractiveShell::Targeted>
InteractiveShell::parse_targeted(const std::string& line) {
    static const std::regex on_syntax("^on (.+?); (.+)$");
    std::smatch m;
    if (!std::regex_match(line, m, on_syntax)) return std::nullopt;
    return Targeted{split_whitespace(m[1].str()), m[2].str()};
}

void InteractiveShell::print_banner() {
    std::vector<std::string> names;
    for (const auto* host : sessions_.hosts()) {
        names.push_back(color_ ? theme::cyan(host->host()) : host->host());
    }

    std::string list;
    for (std::size_t i = 0; i < names.size(); ++i) {
        if (i > 0) list += (i + 1 == names.size()) ? " and " : ", ";
        list += names[i];
    }

    out_ << "Connected to " << list << "\n\n";
    out_ << "To run a command on a list of servers, do:\n";
    out_ << "  on SERVER1 SERVER2 SERVER3; COMMAND\n";
    out_ << "  Example: on latte foamy; echo foobar\n\n";
    out_ << "To exit interactive mode, use 'quit!'\n\n";
    out_.flush();
}

// Readline needs \001/\002 around non-printing chars to measure the prompt.
static std::string prompt_string(bool color) {
    if (!color) return INTERACTIVE_PROMPT;
    auto rl_esc = [](const std::string& code) {
        return std::string("\001") + code + std::string("\002");
    };
    return rl_esc(theme::color::BOLD) + INTERACTIVE_PROMPT + rl_esc(theme::color::RESET);
}

// Re-prompts until a non-empty line arrives. End of input reads as "exit".
std::string InteractiveShell::read_command() {
    const std::string prompt = prompt_string(color_);
    for (;;) {
        auto line = reader_.read_line(prompt);
        if (!line) {
            eof_ = true;
            out_ << "exit\n";
            out_.flush();
            return "exit";
        }

        std::string command = *line;
        trim(command);
        if (command.empty()) continue;

        reader_.add_history(command);
        return command;
    }
}

bool InteractiveShell::dispatch(const std::string& line, int& last_status) {
    if (line == "quit!") {
        out_ << "Bye!\n";
        out_.flush();
        return false;
    }

    if (auto targeted = parse_targeted(line)) {
        std::unordered_set<std::string> names(targeted->hosts.begin(), targeted->hosts.end());
        for (const auto& name : names) {
            if (!sessions_.find(name)) {
                log_debug(fmt::format("on: ignoring unknown host '{}'", name));
            }
        }
        // Pool order, each connection at most once
        std::vector<RemoteHost*> subset;
        for (RemoteHost* host : sessions_.hosts()) {
            if (names.count(host->host())) subset.push_back(host);
        }
        if (subset.empty()) {
            out_ << theme::warn("None of the named hosts are connected");
            out_.flush();
            return true;
        }
        last_status = engine_.run(targeted->command, subset);
        return true;
    }

    last_status = engine_.run(line);
    return true;
}

int InteractiveShell::run() {
    print_banner();

    int last_status = 0;
    for (;;) {
        std::string command = read_command();
        if (!dispatch(command, last_status)) break;
        if (eof_ || platform::interrupted()) break;
    }
    return last_status;
}
