#include "session_io.hpp"
#include <libssh2.h>
#include <poll.h>

short session_poll_events(LIBSSH2_SESSION* session) {
    short events = 0;
    int dir = libssh2_session_block_directions(session);
    if (dir & LIBSSH2_SESSION_BLOCK_INBOUND) events |= POLLIN;
    if (dir & LIBSSH2_SESSION_BLOCK_OUTBOUND) events |= POLLOUT;
    return events ? events : POLLIN;
}

bool wait_session(LIBSSH2_SESSION* session, socket_t sock, int timeout_ms) {
    return platform::poll_socket(sock, session_poll_events(session), timeout_ms) != 0;
}

std::string session_error(LIBSSH2_SESSION* session, const std::string& fallback) {
    if (!session) return fallback;
    char* msg = nullptr;
    int len = 0;
    libssh2_session_last_error(session, &msg, &len, 0);
    if (!msg || len <= 0) return fallback;
    return fallback + ": " + std::string(msg, len);
}
