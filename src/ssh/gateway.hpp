#pragma once

#include <optional>
#include <string>
#include <core/types.hpp>

class SessionManager;

// A parsed "[user@]host[:port]" jump host.
struct GatewayAddress {
    std::string host;
    std::optional<std::string> user;
    std::optional<int> port;
};

// GatewayConfigurator: connects the optional jump host before any target.
class GatewayConfigurator {
public:
    // Throws ConfigurationError on an empty host or a bad port.
    static GatewayAddress parse(const std::string& spec);

    // Route `sessions` through the gateway described by `spec`. The
    // gateway user defaults to options.user; its port comes from `spec`
    // alone. Authentication failures get one password retry.
    static void configure(SessionManager& sessions, const std::string& spec,
                          const SessionOptions& options);
};
