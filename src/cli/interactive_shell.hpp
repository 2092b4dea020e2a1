#pragma once

#include <ostream>
#include <optional>
#include <string>
#include <vector>

class SessionManager;
class ExecutionEngine;
class LineReader;

// InteractiveShell: the `interactive` mode REPL.
//
//   quit!                  leave
//   on h1 h2; command      run on h1 and h2 only
//   anything else          run on every connected host
//
// End of input is read as "exit", which is sent to the hosts before the
// shell stops. SIGINT during a command also ends the shell.
class InteractiveShell {
public:
    InteractiveShell(SessionManager& sessions, ExecutionEngine& engine,
                     LineReader& reader, std::ostream& out, bool color = true);

    // Loop until quit! or end of input. Returns the exit status of the
    // last dispatched command (0 if none ran).
    int run();

    // Split "on h1 h2; cmd" into ({h1, h2}, cmd). nullopt for other input.
    struct Targeted {
        std::vector<std::string> hosts;
        std::string command;
    };
    static std::optional<Targeted> parse_targeted(const std::string& line);

private:
    SessionManager& sessions_;
    ExecutionEngine& engine_;
    LineReader& reader_;
    std::ostream& out_;
    bool color_;
    bool eof_ = false;

    void print_banner();
    std::string read_command();

    // Returns false when the shell should stop.
    bool dispatch(const std::string& line, int& last_status);
};
