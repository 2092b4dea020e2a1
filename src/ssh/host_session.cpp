#include "host_session.hpp"
#include "auth.hpp"
#include "pty_channel.hpp"
#include "session_io.hpp"
#include <core/constants.hpp>
#include <core/errors.hpp>
#include <core/log.hpp>
#include <platform/platform.hpp>
#include <libssh2.h>
#include <fmt/format.h>
#include <chrono>
#include <filesystem>

HostSession::HostSession(HostSpec spec)
    : spec_(std::move(spec)), session_(nullptr), sock_(FLEETSH_INVALID_SOCKET),
      active_(false), session_mutex_(std::make_shared<std::recursive_mutex>()) {
    // Like ssh(1), log in as the local user when none was given
    if (spec_.user.empty()) spec_.user = platform::user_name();
}

HostSession::~HostSession() {
    close();
}

void HostSession::connect(HostSession* gateway) {
    int timeout = spec_.timeout > 0 ? spec_.timeout : SSH_CONNECT_TIMEOUT_SECS;

    if (gateway) {
        log_debug(fmt::format("Connecting to {}:{} via {}", spec_.host, spec_.port,
                              gateway->spec().host));
        sock_ = gateway->open_tunnel(spec_.host, spec_.port);
    } else {
        log_debug(fmt::format("Connecting to {}:{}", spec_.host, spec_.port));
        std::string error;
        sock_ = platform::connect_tcp(spec_.host, spec_.port, timeout * 1000, error);
        if (sock_ == FLEETSH_INVALID_SOCKET) {
            throw ConnectionError(spec_.host, error);
        }
        platform::enable_keepalive(sock_);
    }

    try {
        handshake();
        verify_host_key();
        authenticate_session(session_, sock_, spec_);
    } catch (const FleetError&) {
        teardown("Connection setup failed");
        throw;
    }

    // Send SSH keepalive every 30s
    libssh2_keepalive_config(session_, 1, 30);

    active_ = true;
    log_debug(fmt::format("Connected to {}", spec_.display()));
}

void HostSession::handshake() {
    session_ = libssh2_session_init_ex(nullptr, nullptr, nullptr, nullptr);
    if (!session_) {
        throw ConnectionError(spec_.host, "Failed to create SSH session");
    }

    libssh2_session_set_blocking(session_, 0);

    auto deadline = std::chrono::steady_clock::now() +
                    std::chrono::seconds(spec_.timeout > 0 ? spec_.timeout
                                                           : SSH_CONNECT_TIMEOUT_SECS);
    int rc;
    while ((rc = libssh2_session_handshake(session_, sock_)) == LIBSSH2_ERROR_EAGAIN) {
        if (std::chrono::steady_clock::now() >= deadline) {
            throw ConnectionError(spec_.host, "SSH handshake timed out");
        }
        wait_session(session_, sock_, 100);
    }
    if (rc != 0) {
        throw ConnectionError(spec_.host, session_error(session_, "SSH handshake failed"));
    }
}

void HostSession::verify_host_key() {
    if (!spec_.verify_host_key) {
        log_debug(fmt::format("{}: host key verification disabled", spec_.host));
        return;
    }

    size_t key_len = 0;
    int key_type = 0;
    const char* key = libssh2_session_hostkey(session_, &key_len, &key_type);
    if (!key) {
        throw ConnectionError(spec_.host, "Server did not present a host key");
    }

    LIBSSH2_KNOWNHOSTS* known = libssh2_knownhost_init(session_);
    if (!known) {
        throw ConnectionError(spec_.host, "Failed to initialize known-hosts store");
    }

    auto known_hosts = platform::home_dir() / ".ssh" / "known_hosts";
    if (std::filesystem::exists(known_hosts)) {
        int loaded = libssh2_knownhost_readfile(known, known_hosts.string().c_str(),
                                                LIBSSH2_KNOWNHOST_FILE_OPENSSH);
        if (loaded < 0) {
            log_debug(fmt::format("Could not parse {} ({})", known_hosts.string(), loaded));
        }
    }

    struct libssh2_knownhost* entry = nullptr;
    int check = libssh2_knownhost_checkp(known, spec_.host.c_str(), spec_.port,
                                         key, key_len,
                                         LIBSSH2_KNOWNHOST_TYPE_PLAIN |
                                         LIBSSH2_KNOWNHOST_KEYENC_RAW,
                                         &entry);
    libssh2_knownhost_free(known);

    switch (check) {
    case LIBSSH2_KNOWNHOST_CHECK_MATCH:
        return;
    case LIBSSH2_KNOWNHOST_CHECK_NOTFOUND:
        // Unknown hosts are accepted; only a changed key is an error.
        log_debug(fmt::format("{}: host key not in {}, accepting", spec_.host,
                              known_hosts.string()));
        return;
    case LIBSSH2_KNOWNHOST_CHECK_MISMATCH:
        throw ConnectionError(spec_.host,
            fmt::format("Host key for {} does not match {}. Remove the stale entry "
                        "or pass --no-host-key-verify", spec_.host, known_hosts.string()));
    default:
        throw ConnectionError(spec_.host, "Host key check failed");
    }
}

std::unique_ptr<ExecChannel> HostSession::exec(const std::string& command) {
    if (!active_) {
        throw ConnectionError(spec_.host, "Not connected");
    }
    return std::make_unique<PtyChannel>(session_, sock_, spec_, command);
}

socket_t HostSession::open_tunnel(const std::string& host, int port) {
    if (!active_) {
        throw ConnectionError(spec_.host, "Gateway is not connected");
    }

    LIBSSH2_CHANNEL* ch = nullptr;
    auto deadline = std::chrono::steady_clock::now() +
                    std::chrono::seconds(SSH_CHANNEL_TIMEOUT_SECS);
    while (std::chrono::steady_clock::now() < deadline) {
        {
            std::lock_guard<std::recursive_mutex> lock(*session_mutex_);
            ch = libssh2_channel_direct_tcpip(session_, host.c_str(), port);
            if (!ch && libssh2_session_last_errno(session_) != LIBSSH2_ERROR_EAGAIN) {
                throw ConnectionError(host, session_error(session_,
                    fmt::format("Gateway {} refused to forward to {}:{}", spec_.host, host, port)));
            }
        }
        if (ch) break;
        platform::sleep_ms(10);
    }
    if (!ch) {
        throw ConnectionError(host, fmt::format("Timed out opening tunnel through {}", spec_.host));
    }

    socket_t local = FLEETSH_INVALID_SOCKET;
    socket_t remote = FLEETSH_INVALID_SOCKET;
    if (!platform::make_socket_pair(local, remote)) {
        std::lock_guard<std::recursive_mutex> lock(*session_mutex_);
        libssh2_channel_free(ch);
        throw ConnectionError(host, "Failed to create tunnel socket pair");
    }
    platform::set_nonblocking(local);
    platform::set_nonblocking(remote);

    auto bridge = std::make_unique<TunnelBridge>(
        ch, session_mutex_, remote, fmt::format("{} -> {}:{}", spec_.host, host, port));
    bridge->start();

    std::lock_guard<std::mutex> lock(tunnels_mutex_);
    tunnels_.push_back(std::move(bridge));
    return local;
}

void HostSession::teardown(const char* reason) {
    if (session_) {
        libssh2_session_disconnect(session_, reason);
        libssh2_session_free(session_);
        session_ = nullptr;
    }
    if (sock_ >= 0) {
        platform::close_socket(sock_);
        sock_ = FLEETSH_INVALID_SOCKET;
    }
}

void HostSession::close() {
    // Mark inactive first so concurrent operations bail out early
    active_ = false;

    // Bridges use the session; stop them before it goes away
    {
        std::lock_guard<std::mutex> lock(tunnels_mutex_);
        for (auto& t : tunnels_) t->stop();
        tunnels_.clear();
    }

    std::lock_guard<std::recursive_mutex> lock(*session_mutex_);
    teardown("Normal disconnection");
}
