#include "pty_channel.hpp"
#include "session_io.hpp"
#include <core/constants.hpp>
#include <core/errors.hpp>
#include <core/log.hpp>
#include <platform/terminal.hpp>
#include <libssh2.h>
#include <fmt/format.h>
#include <chrono>
#include <cstring>

namespace {

// Retry a libssh2 call until it stops returning EAGAIN or the channel
// timeout passes.
template <typename Fn>
int until_ready(LIBSSH2_SESSION* session, socket_t sock, Fn fn) {
    auto deadline = std::chrono::steady_clock::now() +
                    std::chrono::seconds(SSH_CHANNEL_TIMEOUT_SECS);
    int rc;
    while ((rc = fn()) == LIBSSH2_ERROR_EAGAIN) {
        if (std::chrono::steady_clock::now() >= deadline) break;
        wait_session(session, sock, 100);
    }
    return rc;
}

} // namespace

PtyChannel::PtyChannel(LIBSSH2_SESSION* session, socket_t sock,
                       const HostSpec& spec, const std::string& command)
    : session_(session), channel_(nullptr), sock_(sock), host_(spec.host) {
    try {
        open(spec);
        start(command);
    } catch (const FleetError&) {
        release();
        throw;
    }
}

PtyChannel::~PtyChannel() {
    release();
}

void PtyChannel::open(const HostSpec& spec) {
    auto deadline = std::chrono::steady_clock::now() +
                    std::chrono::seconds(SSH_CHANNEL_TIMEOUT_SECS);
    while (!channel_) {
        channel_ = libssh2_channel_open_session(session_);
        if (channel_) break;
        if (libssh2_session_last_errno(session_) != LIBSSH2_ERROR_EAGAIN) {
            throw ConnectionError(host_, session_error(session_, "Failed to open session channel"));
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            throw ConnectionError(host_, "Timed out opening session channel");
        }
        wait_session(session_, sock_, 100);
    }

    if (spec.forward_agent) {
        int rc = until_ready(session_, sock_, [&] {
            return libssh2_channel_request_auth_agent(channel_);
        });
        if (rc != 0) {
            // Not fatal: the command still runs, just without the agent.
            log_debug(fmt::format("{}: agent forwarding refused ({})", host_, rc));
        }
    }

    int cols = platform::term_width();
    int rows = platform::term_height();
    int rc = until_ready(session_, sock_, [&] {
        return libssh2_channel_request_pty_ex(channel_, PTY_TERM_TYPE,
                                              std::strlen(PTY_TERM_TYPE),
                                              nullptr, 0, cols, rows, 0, 0);
    });
    if (rc != 0) {
        throw ConnectionError(host_, session_error(session_, "PTY request failed"));
    }
}

void PtyChannel::start(const std::string& command) {
    int rc = until_ready(session_, sock_, [&] {
        return libssh2_channel_exec(channel_, command.c_str());
    });
    if (rc == LIBSSH2_ERROR_EAGAIN) {
        throw ConnectionError(host_, "Timed out starting command");
    }
    if (rc != 0) {
        throw ExecutionError(fmt::format("Cannot execute {} on {}", command, host_));
    }
    // Interleave stderr with stdout, as a terminal would
    libssh2_channel_handle_extended_data2(channel_, LIBSSH2_CHANNEL_EXTENDED_DATA_MERGE);
}

ExecChannel::Status PtyChannel::read(std::string& out) {
    if (!channel_) return Status::kClosed;

    char buf[SSH_READ_BUF_SIZE];
    bool got_data = false;

    for (;;) {
        ssize_t n = libssh2_channel_read(channel_, buf, sizeof(buf));
        if (n > 0) {
            out.append(buf, static_cast<size_t>(n));
            got_data = true;
            continue;
        }
        if (n == LIBSSH2_ERROR_EAGAIN || n == 0) break;
        throw ConnectionError(host_, session_error(session_, "SSH channel read error"));
    }

    if (got_data) return Status::kData;

    if (libssh2_channel_eof(channel_)) {
        finish();
        return Status::kClosed;
    }
    return Status::kIdle;
}

void PtyChannel::write(const std::string& data) {
    if (!channel_) {
        throw ConnectionError(host_, "Channel is closed");
    }
    size_t sent = 0;
    auto deadline = std::chrono::steady_clock::now() +
                    std::chrono::seconds(SSH_CHANNEL_TIMEOUT_SECS);
    while (sent < data.size()) {
        ssize_t w = libssh2_channel_write(channel_, data.data() + sent, data.size() - sent);
        if (w == LIBSSH2_ERROR_EAGAIN) {
            if (std::chrono::steady_clock::now() >= deadline) {
                throw ConnectionError(host_, "Write stalled");
            }
            wait_session(session_, sock_, 100);
            continue;
        }
        if (w < 0) {
            throw ConnectionError(host_, session_error(session_, "SSH channel write error"));
        }
        sent += static_cast<size_t>(w);
    }
}

int PtyChannel::wait_fd() const {
    return channel_ ? sock_ : -1;
}

short PtyChannel::wait_events() const {
    return session_poll_events(session_);
}

void PtyChannel::finish() {
    until_ready(session_, sock_, [&] { return libssh2_channel_close(channel_); });
    until_ready(session_, sock_, [&] { return libssh2_channel_wait_closed(channel_); });
    exit_status_ = libssh2_channel_get_exit_status(channel_);
    release();
}

void PtyChannel::release() {
    if (channel_) {
        libssh2_channel_free(channel_);
        channel_ = nullptr;
    }
}
