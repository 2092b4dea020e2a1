#pragma once

#include <string>
#include <vector>
#include <core/types.hpp>
#include "sudo.hpp"

class SessionManager;
class OutputFormatter;
class RemoteHost;

// Outcome of one run(): the highest exit status seen (0 when nothing
// reported one) and the hosts dropped under the skip policy.
struct CommandResult {
    int exit_status = 0;
    std::vector<std::string> errors;
};

// ExecutionEngine: runs one command on every connected host (or a
// subset) and streams their output through the formatter.
//
// Commands start on every host at once; the pool's concurrency limit
// applies to connecting only. All channels are then serviced from one
// poll() loop on the calling thread.
// When a host prints the sudo marker, the cached password (prompted for
// on first use) is written back to that host alone.
class ExecutionEngine {
public:
    ExecutionEngine(SessionManager& sessions, OutputFormatter& formatter,
                    PasswordPrompt prompt);

    // Run on every connected host. Returns the aggregate exit status, or
    // EXIT_INTERRUPTED when SIGINT arrives mid-run.
    // Throws ExecutionError if any host refuses to start the command.
    int run(const std::string& command);
    int run(const std::string& command, const std::vector<RemoteHost*>& subset);

    const CommandResult& last_result() const { return result_; }

private:
    SessionManager& sessions_;
    OutputFormatter& formatter_;
    PasswordCache password_;
    CommandResult result_;
};
