#pragma once

#include <memory>
#include <optional>
#include <string>
#include <core/types.hpp>

// Transport seam. The libssh2 implementation lives in host_session /
// pty_channel / ssh2_transport; tests plug in fakes.

// One running command on one host.
class ExecChannel {
public:
    enum class Status {
        kIdle,     // nothing available right now
        kData,     // `out` holds new output
        kClosed,   // command finished; exit_status() is valid
    };

    virtual ~ExecChannel() = default;

    // Non-blocking. Appends whatever output is available to `out`.
    // Throws ConnectionError on transport failure.
    virtual Status read(std::string& out) = 0;

    // Write to the command's stdin. Throws ConnectionError on failure.
    virtual void write(const std::string& data) = 0;

    virtual std::optional<int> exit_status() const = 0;

    // Descriptor and poll() events to wait on, or -1 when there is
    // nothing to poll (the loop then sleeps briefly instead).
    virtual int wait_fd() const = 0;
    virtual short wait_events() const = 0;
};

// A live, authenticated connection to one target.
class RemoteHost {
public:
    virtual ~RemoteHost() = default;

    virtual const HostSpec& spec() const = 0;
    const std::string& host() const { return spec().host; }

    // Open a PTY session channel and start `command` on it.
    // Throws ExecutionError when the server refuses the exec request,
    // ConnectionError on transport failure.
    virtual std::unique_ptr<ExecChannel> exec(const std::string& command) = 0;

    // Release the connection. Idempotent.
    virtual void close() = 0;
};

// Creates connections, optionally through a jump host.
class Transport {
public:
    virtual ~Transport() = default;

    // Connect and authenticate to the jump host. Every later connect()
    // is routed through it. Throws AuthenticationError when the
    // credentials are rejected, ConnectionError otherwise.
    virtual void set_gateway(const HostSpec& gateway) = 0;

    // Connect and authenticate to one target. Thread-safe.
    virtual std::unique_ptr<RemoteHost> connect(const HostSpec& spec) = 0;

    // Drop the jump host, if any.
    virtual void close() = 0;
};
