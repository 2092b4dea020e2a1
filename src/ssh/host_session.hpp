#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <core/types.hpp>
#include <platform/socket_util.hpp>
#include "remote_host.hpp"
#include "tunnel.hpp"

// libssh2 forward declarations
typedef struct _LIBSSH2_SESSION LIBSSH2_SESSION;
typedef struct _LIBSSH2_CHANNEL LIBSSH2_CHANNEL;

// HostSession: one authenticated libssh2 session to one host.
//
// Connects either directly (TCP) or through a gateway HostSession, in
// which case the gateway opens a direct-tcpip channel and bridges it to a
// local socketpair that this session handshakes over.
//
// After connect() the session is non-blocking; channels wait on its
// socket through poll().
class HostSession : public RemoteHost {
public:
    explicit HostSession(HostSpec spec);
    ~HostSession() override;

    HostSession(const HostSession&) = delete;
    HostSession& operator=(const HostSession&) = delete;

    // TCP connect (or tunnel), handshake, host key check, authentication.
    // Throws AuthenticationError / ConnectionError.
    void connect(HostSession* gateway = nullptr);

    // RemoteHost
    const HostSpec& spec() const override { return spec_; }
    std::unique_ptr<ExecChannel> exec(const std::string& command) override;
    void close() override;

    // Open a direct-tcpip channel to host:port and return the local end of
    // a socketpair bridged to it. Thread-safe. Throws ConnectionError.
    socket_t open_tunnel(const std::string& host, int port);

private:
    HostSpec spec_;
    LIBSSH2_SESSION* session_;
    socket_t sock_;
    bool active_;
    std::shared_ptr<std::recursive_mutex> session_mutex_;

    std::mutex tunnels_mutex_;
    std::vector<std::unique_ptr<TunnelBridge>> tunnels_;

    void handshake();
    void verify_host_key();
    void teardown(const char* reason);
};
