#include "fleetsh_cli.hpp"
#include "interactive_shell.hpp"
#include "line_reader.hpp"
#include "output_formatter.hpp"
#include "theme.hpp"
#include <core/constants.hpp>
#include <core/errors.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <exec/execution_engine.hpp>
#include <inventory/host_resolver.hpp>
#include <launchers/window_launcher.hpp>
#include <platform/platform.hpp>
#include <platform/terminal.hpp>
#include <ssh/gateway.hpp>
#include <ssh/session_manager.hpp>
#include <ssh/ssh2_transport.hpp>
#include <fmt/format.h>
#include <iostream>

std::string prompt_password(const std::string& prompt) {
    return platform::read_password(prompt);
}

namespace {

std::optional<std::string> stripped(const std::optional<std::string>& value) {
    if (!value) return std::nullopt;
    std::string out = *value;
    trim(out);
    return out;
}

bool is_launcher(const std::string& mode) {
    return mode == "screen" || mode == "tmux" || mode == "tmux-split" ||
           mode == "macterm" || mode == "cssh" || mode == "csshx";
}

// Closes the pool and restores SIGINT on every exit path.
struct RunGuard {
    SessionManager& sessions;
    ~RunGuard() {
        sessions.close();
        platform::remove_interrupt_handler();
    }
};

} // namespace

FleetshCLI::FleetshCLI(CliOptions options, Config config)
    : opts_(std::move(options)), config_(std::move(config)) {}

SessionOptions FleetshCLI::session_options() const {
    SessionOptions s;
    s.user = stripped(opts_.ssh_user ? opts_.ssh_user : config_.ssh_user()).value_or("");
    s.port = opts_.ssh_port ? opts_.ssh_port : config_.ssh_port();
    s.identity_file = stripped(opts_.identity_file ? opts_.identity_file : config_.identity_file());
    s.password = opts_.ssh_password;
    s.forward_agent = opts_.forward_agent;
    s.verify_host_key = opts_.host_key_verify.value_or(config_.host_key_verify().value_or(true));
    s.concurrency = opts_.concurrency.value_or(config_.concurrency().value_or(0));
    s.on_error = opts_.on_error.value_or(config_.on_error().value_or(ErrorPolicy::kSkip));
    return s;
}

ResolvedTargets FleetshCLI::resolve() const {
    if (opts_.manual) {
        return HostResolver::manual(opts_.query);
    }

    fs::path inventory = get_default_inventory_path();
    if (opts_.inventory) {
        inventory = expand_user_path(*opts_.inventory);
    } else if (config_.inventory()) {
        inventory = expand_user_path(*config_.inventory());
    }

    AttributeSelection attrs = select_attribute(opts_.attribute, config_.ssh_attribute());
    log_debug(fmt::format("Searching {} for '{}' (attribute {}, override {})",
                          inventory.string(), opts_.query, attrs.attribute,
                          attrs.override_attribute.value_or("none")));
    return HostResolver::load(inventory).search(opts_.query, attrs);
}

int FleetshCLI::run() {
    const SessionOptions options = session_options();
    const std::string mode = opts_.command;

    Ssh2Transport transport;
    SessionManager sessions(transport, prompt_password);
    sessions.configure(resolve(), options);

    if (is_launcher(mode)) {
        return run_launcher(mode, sessions);
    }

    platform::install_interrupt_handler();
    RunGuard guard{sessions};

    auto gateway = opts_.ssh_gateway ? opts_.ssh_gateway : config_.ssh_gateway();
    if (gateway) {
        GatewayConfigurator::configure(sessions, *gateway, options);
    }

    sessions.connect();
    if (sessions.hosts().empty()) {
        std::cerr << theme::warn("No hosts could be reached");
        return EXIT_FATAL;
    }
    return run_connected(mode, sessions);
}

int FleetshCLI::run_connected(const std::string& mode, SessionManager& sessions) {
    const bool color = opts_.color && platform::stdout_is_tty();
    OutputFormatter formatter(std::cout, sessions.longest_label(), color);
    ExecutionEngine engine(sessions, formatter, prompt_password);

    if (mode == "interactive") {
        ReadlineReader reader;
        InteractiveShell shell(sessions, engine, reader, std::cout, color);
        return shell.run();
    }

    int status = engine.run(mode);
    for (const auto& err : engine.last_result().errors) {
        log_debug("skipped: " + err);
    }
    return status;
}

int FleetshCLI::run_launcher(const std::string& mode, SessionManager& sessions) {
    SystemShellRunner shell;
    auto identity = sessions.specs().front().identity_file;
    WindowLauncher launcher(shell, identity, opts_.query);
    const auto& hosts = sessions.specs();

    if (mode == "screen") {
        launcher.screen(hosts);
    } else if (mode == "tmux") {
        launcher.tmux(hosts, false, config_.tmux());
    } else if (mode == "tmux-split") {
        launcher.tmux(hosts, true, config_.tmux());
    } else if (mode == "macterm") {
        launcher.macterm(hosts);
    } else {
        if (mode == "csshx") {
            std::cerr << theme::warn("fleetsh csshx is deprecated, use fleetsh cssh");
        }
        launcher.cssh(hosts);
    }
    return 0;
}

int run_reporting_errors(const std::function<int()>& body, std::ostream& err) {
    try {
        return body();
    } catch (const ConfigurationError& e) {
        log_debug(std::string("ConfigurationError: ") + e.what());
        err << theme::fail(e.what());
        return EXIT_NO_TARGETS;
    } catch (const FleetError& e) {
        log_error(std::string(e.kind()) + ": " + e.what());
        err << theme::fail(e.what());
        return EXIT_FATAL;
    } catch (const std::exception& e) {
        err << theme::fail(e.what());
        return EXIT_FATAL;
    }
}
