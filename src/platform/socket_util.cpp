#include "socket_util.hpp"
#include <sys/socket.h>
#include <sys/types.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <netdb.h>
#include <fcntl.h>
#include <poll.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>

namespace platform {

void set_nonblocking(socket_t sock) {
    int flags = fcntl(sock, F_GETFL, 0);
    fcntl(sock, F_SETFL, flags | O_NONBLOCK);
}

int poll_socket(socket_t sock, short events, int timeout_ms) {
    struct pollfd pfd = {sock, events, 0};
    int rc = poll(&pfd, 1, timeout_ms);
    if (rc <= 0) return 0;
    return pfd.revents;
}

void close_socket(socket_t sock) {
    if (sock >= 0) close(sock);
}

socket_t connect_tcp(const std::string& host, int port, int timeout_ms,
                     std::string& error) {
    struct addrinfo hints;
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    struct addrinfo* res = nullptr;
    std::string service = std::to_string(port);
    int gai = getaddrinfo(host.c_str(), service.c_str(), &hints, &res);
    if (gai != 0 || !res) {
        error = "Failed to resolve host: " + host + " (" + gai_strerror(gai) + ")";
        return FLEETSH_INVALID_SOCKET;
    }

    error.clear();
    socket_t sock = FLEETSH_INVALID_SOCKET;
    for (struct addrinfo* ai = res; ai; ai = ai->ai_next) {
        sock = socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if (sock < 0) {
            error = "Failed to create socket: " + std::string(strerror(errno));
            continue;
        }
        set_nonblocking(sock);

        int ret = connect(sock, ai->ai_addr, ai->ai_addrlen);
        if (ret < 0 && errno != EINPROGRESS) {
            error = "Failed to connect: " + std::string(strerror(errno));
            close_socket(sock);
            sock = FLEETSH_INVALID_SOCKET;
            continue;
        }

        // Wait for non-blocking connect to complete
        if (ret < 0) {
            int revents = poll_socket(sock, POLLOUT, timeout_ms);
            if (revents == 0) {
                error = "Connection timed out: " + host;
                close_socket(sock);
                sock = FLEETSH_INVALID_SOCKET;
                continue;
            }
            int sock_err = 0;
            socklen_t err_len = sizeof(sock_err);
            getsockopt(sock, SOL_SOCKET, SO_ERROR, &sock_err, &err_len);
            if (sock_err != 0) {
                error = "Connection failed: " + std::string(strerror(sock_err));
                close_socket(sock);
                sock = FLEETSH_INVALID_SOCKET;
                continue;
            }
        }
        break;
    }

    freeaddrinfo(res);
    return sock;
}

bool make_socket_pair(socket_t& a, socket_t& b) {
    int fds[2];
    if (socketpair(AF_UNIX, SOCK_STREAM, 0, fds) != 0) {
        return false;
    }
    a = fds[0];
    b = fds[1];
    return true;
}

void enable_keepalive(socket_t sock) {
    int tcp_keepalive = 1;
    setsockopt(sock, SOL_SOCKET, SO_KEEPALIVE, &tcp_keepalive, sizeof(tcp_keepalive));
    int keepidle = 60;
    int keepintvl = 15;
    int keepcnt = 4;
#ifdef TCP_KEEPIDLE
    setsockopt(sock, IPPROTO_TCP, TCP_KEEPIDLE, &keepidle, sizeof(keepidle));
#endif
#ifdef TCP_KEEPINTVL
    setsockopt(sock, IPPROTO_TCP, TCP_KEEPINTVL, &keepintvl, sizeof(keepintvl));
#endif
#ifdef TCP_KEEPCNT
    setsockopt(sock, IPPROTO_TCP, TCP_KEEPCNT, &keepcnt, sizeof(keepcnt));
#endif
}

} // namespace platform
