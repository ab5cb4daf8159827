#pragma once

// Socket utilities shared by the connection layer and the scanner.

#include <poll.h>
#include <string>

using socket_t = int;
#define REMOPS_INVALID_SOCKET (-1)

namespace platform {

enum class ConnectStatus {
    Ok,
    Unresolved,   // name lookup failed
    Refused,      // peer actively refused
    Timeout,      // no answer before the deadline
    Error,        // local socket failure
};

struct ConnectOutcome {
    ConnectStatus status = ConnectStatus::Error;
    socket_t sock = REMOPS_INVALID_SOCKET;
    std::string error;
};

// Resolve host (name, IPv4 or IPv6 literal) and connect with a deadline.
// Tries each resolved address in turn. On success the socket is
// non-blocking and owned by the caller.
ConnectOutcome connect_tcp(const std::string& host, int port, int timeout_ms);

// Set a socket to non-blocking mode.
void set_nonblocking(socket_t sock);

// Enable TCP keepalive probes on an established socket.
void enable_keepalive(socket_t sock);

// Poll events on a single socket. Returns revents, or 0 on timeout.
// events: POLLIN, POLLOUT, etc.
int poll_socket(socket_t sock, short events, int timeout_ms);

// Close a socket.
void close_socket(socket_t sock);

} // namespace platform
