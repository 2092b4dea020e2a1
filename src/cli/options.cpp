#include "options.hpp"
#include "theme.hpp"
#include <core/config.hpp>
#include <core/utils.hpp>
#include <iostream>
#include <fmt/format.h>

void print_usage() {
    std::cout << theme::section("Usage");
    std::cout << theme::color::BLUE << "    fleetsh " << theme::color::RESET
              << "[options] QUERY COMMAND" << "\n\n";
    std::cout << theme::dim("    QUERY is an inventory search (roles:web AND env:prod, *:*),")
              << "\n" << theme::dim("    or a host list with --manual-list.") << "\n";
    std::cout << theme::dim("    COMMAND is a remote command, or one of: interactive, screen,")
              << "\n" << theme::dim("    tmux, tmux-split, macterm, cssh.") << "\n";

    std::cout << theme::section("Options");
    std::cout << theme::kv("-C, --concurrency NUM", "Max concurrent connections");
    std::cout << theme::kv("-a, --attribute ATTR", "Node attribute to connect to (default fqdn)");
    std::cout << theme::kv("-m, --manual-list", "QUERY is a space-separated host list");
    std::cout << theme::kv("-x, --ssh-user USER", "SSH username");
    std::cout << theme::kv("-P, --ssh-password PASS", "SSH password");
    std::cout << theme::kv("-p, --ssh-port PORT", "SSH port");
    std::cout << theme::kv("-G, --ssh-gateway GW", "Jump host, [user@]host[:port]");
    std::cout << theme::kv("-A, --forward-agent", "Enable SSH agent forwarding");
    std::cout << theme::kv("-i, --identity-file FILE", "Private key to authenticate with");
    std::cout << theme::kv("--[no-]host-key-verify", "Verify host keys (default on)");
    std::cout << theme::kv("--on-error skip|raise", "Per-host connect failure policy");
    std::cout << theme::kv("--inventory FILE", "Inventory file (default ~/.fleetsh/inventory.yaml)");
    std::cout << theme::kv("--no-color", "Plain output");
    std::cout << theme::kv("--verbose", "Print debug log lines to stderr");
    std::cout << theme::kv("--version", "Show version");
    std::cout << theme::kv("--help", "Show this help");
    std::cout << "\n";
}

namespace {

struct OptionSpec {
    const char* short_name;
    const char* long_name;
    bool takes_value;
};

const OptionSpec kOptions[] = {
    {"-C", "--concurrency", true},
    {"-a", "--attribute", true},
    {"-m", "--manual-list", false},
    {"-x", "--ssh-user", true},
    {"-P", "--ssh-password", true},
    {"-p", "--ssh-port", true},
    {"-G", "--ssh-gateway", true},
    {"-A", "--forward-agent", false},
    {"-i", "--identity-file", true},
    {nullptr, "--host-key-verify", false},
    {nullptr, "--no-host-key-verify", false},
    {nullptr, "--on-error", true},
    {nullptr, "--inventory", true},
    {nullptr, "--no-color", false},
    {nullptr, "--verbose", false},
    {"-h", "--help", false},
    {"-v", "--version", false},
};

const OptionSpec* find_option(const std::string& name) {
    for (const auto& opt : kOptions) {
        if ((opt.short_name && name == opt.short_name) || name == opt.long_name) {
            return &opt;
        }
    }
    return nullptr;
}

// Returns an error message, or "" on success.
std::string apply(CliOptions& o, const std::string& name, const std::string& value) {
    auto int_value = [&](std::optional<int>& slot, int lo, int hi) -> std::string {
        int v = safe_stoi(value, lo - 1);
        if (v < lo || v > hi) {
            return fmt::format("{} expects a number between {} and {}, got '{}'", name, lo, hi, value);
        }
        slot = v;
        return "";
    };

    if (name == "--concurrency") return int_value(o.concurrency, 1, 1 << 20);
    if (name == "--ssh-port") return int_value(o.ssh_port, 1, 65535);
    if (name == "--attribute") { o.attribute = value; return ""; }
    if (name == "--ssh-user") { o.ssh_user = value; return ""; }
    if (name == "--ssh-password") { o.ssh_password = value; return ""; }
    if (name == "--ssh-gateway") { o.ssh_gateway = value; return ""; }
    if (name == "--identity-file") { o.identity_file = value; return ""; }
    if (name == "--inventory") { o.inventory = value; return ""; }
    if (name == "--on-error") {
        o.on_error = parse_error_policy(value);
        if (!o.on_error) return "--on-error expects 'skip' or 'raise', got '" + value + "'";
        return "";
    }
    if (name == "--manual-list") { o.manual = true; return ""; }
    if (name == "--forward-agent") { o.forward_agent = true; return ""; }
    if (name == "--host-key-verify") { o.host_key_verify = true; return ""; }
    if (name == "--no-host-key-verify") { o.host_key_verify = false; return ""; }
    if (name == "--no-color") { o.color = false; return ""; }
    if (name == "--verbose") { o.verbose = true; return ""; }
    if (name == "--help") { o.help = true; return ""; }
    if (name == "--version") { o.version = true; return ""; }
    return "Unknown option: " + name;
}

} // namespace

Result<CliOptions> parse_options(const std::vector<std::string>& args) {
    CliOptions opts;
    std::vector<std::string> positional;
    bool options_done = false;

    for (std::size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];

        // Once COMMAND has started, every word is part of it
        if (options_done || positional.size() >= 2 || arg == "-" || arg.empty() || arg[0] != '-') {
            positional.push_back(arg);
            continue;
        }
        if (arg == "--") {
            options_done = true;
            continue;
        }

        std::string name = arg;
        std::optional<std::string> inline_value;
        auto eq = arg.find('=');
        if (arg.rfind("--", 0) == 0 && eq != std::string::npos) {
            name = arg.substr(0, eq);
            inline_value = arg.substr(eq + 1);
        }

        const OptionSpec* spec = find_option(name);
        if (!spec) {
            return Result<CliOptions>::Err("Unknown option: " + arg);
        }

        std::string value;
        if (spec->takes_value) {
            if (inline_value) {
                value = *inline_value;
            } else if (i + 1 < args.size()) {
                value = args[++i];
            } else {
                return Result<CliOptions>::Err(fmt::format("{} requires a value", spec->long_name));
            }
        } else if (inline_value) {
            return Result<CliOptions>::Err(fmt::format("{} does not take a value", spec->long_name));
        }

        std::string err = apply(opts, spec->long_name, value);
        if (!err.empty()) return Result<CliOptions>::Err(err);
    }

    if (opts.help || opts.version) {
        return Result<CliOptions>::Ok(opts);
    }

    if (positional.size() < 2) {
        return Result<CliOptions>::Err("Usage: fleetsh [options] QUERY COMMAND (see --help)");
    }

    opts.query = positional[0];
    for (std::size_t i = 1; i < positional.size(); ++i) {
        if (i > 1) opts.command += " ";
        opts.command += positional[i];
    }
    return Result<CliOptions>::Ok(opts);
}
