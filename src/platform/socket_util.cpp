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
#include <chrono>

namespace platform {

void set_nonblocking(socket_t sock) {
    int flags = fcntl(sock, F_GETFL, 0);
    fcntl(sock, F_SETFL, flags | O_NONBLOCK);
}

void enable_keepalive(socket_t sock) {
    int on = 1;
    setsockopt(sock, SOL_SOCKET, SO_KEEPALIVE, &on, sizeof(on));
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

int poll_socket(socket_t sock, short events, int timeout_ms) {
    struct pollfd pfd;
    pfd.fd = sock;
    pfd.events = events;
    pfd.revents = 0;
    int ret;
    do {
        ret = poll(&pfd, 1, timeout_ms);
    } while (ret < 0 && errno == EINTR);
    return (ret > 0) ? pfd.revents : 0;
}

void close_socket(socket_t sock) {
    if (sock != REMOPS_INVALID_SOCKET) close(sock);
}

// ── connect_tcp ─────────────────────────────────────────────

// One non-blocking connect attempt bounded by remaining_ms.
static ConnectOutcome try_connect(const struct addrinfo* ai, int remaining_ms) {
    ConnectOutcome out;
    socket_t sock = socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
    if (sock < 0) {
        out.status = ConnectStatus::Error;
        out.error = std::string("socket: ") + std::strerror(errno);
        return out;
    }
    set_nonblocking(sock);

    int ret = connect(sock, ai->ai_addr, ai->ai_addrlen);
    if (ret < 0 && errno != EINPROGRESS) {
        int err = errno;
        close_socket(sock);
        out.status = (err == ECONNREFUSED) ? ConnectStatus::Refused : ConnectStatus::Error;
        if (err == ENETUNREACH || err == EHOSTUNREACH) out.status = ConnectStatus::Timeout;
        out.error = std::strerror(err);
        return out;
    }

    // Wait for non-blocking connect to complete
    if (ret < 0) {
        int revents = poll_socket(sock, POLLOUT, remaining_ms);
        if (revents == 0) {
            close_socket(sock);
            out.status = ConnectStatus::Timeout;
            out.error = "connection timed out";
            return out;
        }
        int sock_err = 0;
        socklen_t err_len = sizeof(sock_err);
        getsockopt(sock, SOL_SOCKET, SO_ERROR, &sock_err, &err_len);
        if (sock_err != 0) {
            close_socket(sock);
            out.status = (sock_err == ECONNREFUSED) ? ConnectStatus::Refused
                                                    : ConnectStatus::Timeout;
            out.error = std::strerror(sock_err);
            return out;
        }
    }

    out.status = ConnectStatus::Ok;
    out.sock = sock;
    return out;
}

ConnectOutcome connect_tcp(const std::string& host, int port, int timeout_ms) {
    ConnectOutcome out;

    // getaddrinfo is reentrant; scanner workers resolve concurrently.
    struct addrinfo hints;
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    struct addrinfo* res = nullptr;
    std::string port_str = std::to_string(port);
    int gai = getaddrinfo(host.c_str(), port_str.c_str(), &hints, &res);
    if (gai != 0 || !res) {
        out.status = ConnectStatus::Unresolved;
        out.error = std::string("cannot resolve ") + host + ": " + gai_strerror(gai);
        return out;
    }

    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    out.status = ConnectStatus::Timeout;
    out.error = "connection timed out";

    for (auto* ai = res; ai; ai = ai->ai_next) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now()).count();
        if (remaining <= 0) break;
        out = try_connect(ai, static_cast<int>(remaining));
        if (out.status == ConnectStatus::Ok) break;
    }

    freeaddrinfo(res);
    return out;
}

} // namespace platform
