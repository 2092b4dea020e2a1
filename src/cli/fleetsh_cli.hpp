#pragma once

#include <functional>
#include <memory>
#include <ostream>
#include <string>
#include <vector>
#include <core/config.hpp>
#include <core/types.hpp>
#include "options.hpp"

class SessionManager;
class Transport;

// FleetshCLI: one invocation, start to finish.
//
//   resolve targets -> configure pool -> gateway -> connect -> mode
//
// Modes are `interactive`, the window launchers, or a plain remote
// command. Returns the process exit code; errors propagate as FleetError.
class FleetshCLI {
public:
    FleetshCLI(CliOptions options, Config config);

    int run();

    // Pool options from the command line, falling back to config.
    SessionOptions session_options() const;

    // Targets for the query, manual or from the inventory.
    ResolvedTargets resolve() const;

private:
    CliOptions opts_;
    Config config_;

    int run_launcher(const std::string& mode, SessionManager& sessions);
    int run_connected(const std::string& mode, SessionManager& sessions);
};

// Prompt on the terminal without echo.
std::string prompt_password(const std::string& prompt);

// Run `body` and turn what it throws into an exit code, reporting the
// error on `err`: ConfigurationError -> EXIT_NO_TARGETS, anything else
// -> EXIT_FATAL. Otherwise returns what `body` returns.
int run_reporting_errors(const std::function<int()>& body, std::ostream& err);
