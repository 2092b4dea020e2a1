#pragma once

#include <memory>
#include <string>
#include <unordered_map>
#include <vector>
#include <core/types.hpp>
#include "remote_host.hpp"

// SessionManager: the connection pool for one invocation.
//
// configure()/add() register targets; via() routes later connections
// through a jump host; connect() opens every registered target in
// parallel and applies the error policy. Hosts keep registration order.
class SessionManager {
public:
    SessionManager(Transport& transport, PasswordPrompt prompt);
    ~SessionManager();

    SessionManager(const SessionManager&) = delete;
    SessionManager& operator=(const SessionManager&) = delete;

    // Register every resolved target. Throws ConfigurationError when there
    // are none, with a message depending on whether anything matched.
    void configure(const ResolvedTargets& resolved, const SessionOptions& options);

    // Register one target. Updates the longest-label tracker.
    void add(const std::string& target, const SessionOptions& options);

    // Connect to the jump host. On AuthenticationError, prompt for a
    // password once and retry; a second failure propagates.
    void via(const std::string& host, const std::string& user,
             const SessionOptions& options);

    // Open every registered target. Under kSkip, failed hosts are logged
    // and dropped; under kRaise, the first failure aborts and is rethrown.
    void connect();

    // Release every connection and the gateway. Idempotent.
    void close();

    // Live host by host identifier, or nullptr.
    RemoteHost* find(const std::string& host) const;

    // Live hosts, in registration order.
    std::vector<RemoteHost*> hosts() const;

    const std::vector<HostSpec>& specs() const { return specs_; }
    std::size_t longest_label() const { return longest_; }
    ErrorPolicy policy() const { return policy_; }

private:
    Transport& transport_;
    PasswordPrompt prompt_;
    std::vector<HostSpec> specs_;
    std::vector<std::unique_ptr<RemoteHost>> hosts_;
    std::unordered_map<std::string, RemoteHost*> by_host_;
    std::size_t longest_ = 0;
    ErrorPolicy policy_ = ErrorPolicy::kSkip;
    int concurrency_ = 0;
    bool closed_ = false;
};
