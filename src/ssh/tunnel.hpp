#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <platform/socket_util.hpp>

// libssh2 forward declarations
typedef struct _LIBSSH2_CHANNEL LIBSSH2_CHANNEL;

// TunnelBridge: relays bytes between one end of a local socketpair and a
// direct-tcpip channel on the gateway session. The other end of the pair
// is handed to a second libssh2 session, which then speaks SSH to the
// target as if it had dialed it directly.
//
// All calls into the gateway session happen under its session mutex; the
// gateway session is non-blocking, so every hold is brief.
class TunnelBridge {
public:
    TunnelBridge(LIBSSH2_CHANNEL* channel,
                 std::shared_ptr<std::recursive_mutex> session_mutex,
                 socket_t local_fd, std::string label);
    ~TunnelBridge();

    TunnelBridge(const TunnelBridge&) = delete;
    TunnelBridge& operator=(const TunnelBridge&) = delete;

    // Start the forwarding thread.
    void start();

    // Stop forwarding and release the channel. Idempotent.
    void stop();

private:
    LIBSSH2_CHANNEL* channel_;
    std::shared_ptr<std::recursive_mutex> session_mutex_;
    socket_t local_fd_;
    std::string label_;
    std::atomic<bool> stop_{false};
    std::thread thread_;

    void forward_loop();
    void release_channel();
};
