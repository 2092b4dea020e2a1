#include "gateway.hpp"
#include "session_manager.hpp"
#include <core/errors.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>

GatewayAddress GatewayConfigurator::parse(const std::string& spec) {
    GatewayAddress out;
    std::string rest = spec;
    trim(rest);

    auto at = rest.rfind('@');
    if (at != std::string::npos) {
        std::string user = rest.substr(0, at);
        if (!user.empty()) out.user = user;
        rest = rest.substr(at + 1);
    }

    auto colon = rest.find(':');
    if (colon != std::string::npos) {
        std::string port = rest.substr(colon + 1);
        int value = safe_stoi(port, -1);
        if (value <= 0 || value > 65535) {
            throw ConfigurationError(fmt::format(
                "Invalid gateway port '{}' in '{}'. Use [user@]host[:port]", port, spec));
        }
        out.port = value;
        rest = rest.substr(0, colon);
    }

    if (rest.empty()) {
        throw ConfigurationError(fmt::format(
            "Invalid gateway '{}'. Use [user@]host[:port]", spec));
    }
    out.host = rest;
    return out;
}

void GatewayConfigurator::configure(SessionManager& sessions, const std::string& spec,
                                    const SessionOptions& options) {
    GatewayAddress gw = parse(spec);

    // Only the port carries over; the gateway authenticates with the agent
    // and default keys, then with a prompted password.
    SessionOptions gw_opts = options;
    gw_opts.port = gw.port;
    gw_opts.identity_file.reset();
    gw_opts.password.reset();
    std::string user = gw.user.value_or(options.user);

    log_debug(fmt::format("Routing connections through {}@{}", user, gw.host));
    sessions.via(gw.host, user, gw_opts);
}
