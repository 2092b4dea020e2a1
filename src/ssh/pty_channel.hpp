#pragma once

#include <optional>
#include <string>
#include <core/types.hpp>
#include <platform/socket_util.hpp>
#include "remote_host.hpp"

// libssh2 forward declarations
typedef struct _LIBSSH2_SESSION LIBSSH2_SESSION;
typedef struct _LIBSSH2_CHANNEL LIBSSH2_CHANNEL;

// PtyChannel: a session channel with a pseudo-terminal attached, running
// one command. The constructor opens the channel, requests the PTY and
// starts the command; read() then polls it without blocking.
class PtyChannel : public ExecChannel {
public:
    // Throws ExecutionError if the server refuses the exec request,
    // ConnectionError on transport failure.
    PtyChannel(LIBSSH2_SESSION* session, socket_t sock, const HostSpec& spec,
               const std::string& command);
    ~PtyChannel() override;

    PtyChannel(const PtyChannel&) = delete;
    PtyChannel& operator=(const PtyChannel&) = delete;

    Status read(std::string& out) override;
    void write(const std::string& data) override;
    std::optional<int> exit_status() const override { return exit_status_; }
    int wait_fd() const override;
    short wait_events() const override;

private:
    LIBSSH2_SESSION* session_;
    LIBSSH2_CHANNEL* channel_;
    socket_t sock_;
    std::string host_;
    std::optional<int> exit_status_;

    void open(const HostSpec& spec);
    void start(const std::string& command);
    void finish();
    void release();
};
