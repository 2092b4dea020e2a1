#include "tunnel.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <platform/platform.hpp>
#include <libssh2.h>
#include <fmt/format.h>
#include <unistd.h>
#include <sys/socket.h>
#include <poll.h>
#include <cerrno>

TunnelBridge::TunnelBridge(LIBSSH2_CHANNEL* channel,
                           std::shared_ptr<std::recursive_mutex> session_mutex,
                           socket_t local_fd, std::string label)
    : channel_(channel),
      session_mutex_(std::move(session_mutex)),
      local_fd_(local_fd), label_(std::move(label)) {}

TunnelBridge::~TunnelBridge() {
    stop();
}

void TunnelBridge::start() {
    thread_ = std::thread(&TunnelBridge::forward_loop, this);
}

void TunnelBridge::stop() {
    stop_.store(true);
    if (thread_.joinable()) thread_.join();
    release_channel();
    if (local_fd_ >= 0) {
        platform::close_socket(local_fd_);
        local_fd_ = FLEETSH_INVALID_SOCKET;
    }
}

void TunnelBridge::release_channel() {
    if (!channel_) return;
    std::lock_guard<std::recursive_mutex> lock(*session_mutex_);
    libssh2_channel_close(channel_);
    libssh2_channel_free(channel_);
    channel_ = nullptr;
}

// Forward data between the local socket and the direct-tcpip channel.
// Runs until either side closes or stop() is called.
void TunnelBridge::forward_loop() {
    char buf[TUNNEL_BUF_SIZE];
    std::string to_channel;   // bytes read locally, not yet accepted by libssh2

    while (!stop_.load()) {
        bool progressed = false;

        // local → channel
        if (to_channel.empty()) {
            struct pollfd pfd = {local_fd_, POLLIN, 0};
            int pr = poll(&pfd, 1, TUNNEL_POLL_MS);
            if (pr > 0 && (pfd.revents & (POLLIN | POLLHUP))) {
                ssize_t n = read(local_fd_, buf, sizeof(buf));
                if (n == 0) break;  // target session closed its end
                if (n < 0 && errno != EAGAIN && errno != EINTR) break;
                if (n > 0) to_channel.assign(buf, static_cast<size_t>(n));
            }
        }

        if (!to_channel.empty()) {
            std::lock_guard<std::recursive_mutex> lock(*session_mutex_);
            ssize_t w = libssh2_channel_write(channel_, to_channel.data(), to_channel.size());
            if (w > 0) {
                to_channel.erase(0, static_cast<size_t>(w));
                progressed = true;
            } else if (w != LIBSSH2_ERROR_EAGAIN) {
                log_debug(fmt::format("tunnel {}: channel write failed ({})", label_, w));
                break;
            }
        }

        // channel → local (non-blocking read)
        ssize_t n;
        bool eof = false;
        {
            std::lock_guard<std::recursive_mutex> lock(*session_mutex_);
            n = libssh2_channel_read(channel_, buf, sizeof(buf));
            if (n == 0 || (n == LIBSSH2_ERROR_EAGAIN && libssh2_channel_eof(channel_))) {
                eof = true;
            }
        }
        if (n > 0) {
            ssize_t sent = 0;
            while (sent < n) {
                ssize_t w = write(local_fd_, buf + sent, static_cast<size_t>(n - sent));
                if (w < 0 && (errno == EAGAIN || errno == EINTR)) {
                    platform::sleep_ms(1);
                    continue;
                }
                if (w <= 0) goto done;
                sent += w;
            }
            progressed = true;
        } else if (eof) {
            break;  // remote closed
        } else if (n < 0 && n != LIBSSH2_ERROR_EAGAIN) {
            log_debug(fmt::format("tunnel {}: channel read failed ({})", label_, n));
            break;
        }

        if (!progressed && !to_channel.empty()) {
            platform::sleep_ms(1);
        }
    }

done:
    log_debug(fmt::format("tunnel {}: closed", label_));
    // Closing our end makes the target session see EOF
    shutdown(local_fd_, SHUT_RDWR);
}
