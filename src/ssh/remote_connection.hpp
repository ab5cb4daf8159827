#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <core/types.hpp>
#include <core/constants.hpp>
#include <platform/socket_util.hpp>

// libssh2 forward declarations
typedef struct _LIBSSH2_SESSION LIBSSH2_SESSION;
typedef struct _LIBSSH2_CHANNEL LIBSSH2_CHANNEL;

using Clock = std::chrono::steady_clock;

// Everything needed to reach and authenticate against one host.
struct ConnectParams {
    std::string host_id;
    std::string address;
    int port = DEFAULT_SSH_PORT;
    std::string username = DEFAULT_USER;
    std::string password;
    std::string private_key;        // PEM text, not a path
    std::string key_passphrase;
    int timeout_secs = CONNECT_TIMEOUT_SECS;
    AuthPreference auth_prefer = AuthPreference::Key;

    // user@address:port, never includes credentials
    std::string target() const;
};

// One-time libssh2_init for the process. Returns false if it failed.
bool ensure_libssh2_init();

// Block until the socket is ready in the direction libssh2 last asked for,
// or until max_ms elapses.
void wait_session_socket(LIBSSH2_SESSION* session, socket_t sock, int max_ms);

// Milliseconds left until deadline, clamped at zero.
int remaining_ms(Clock::time_point deadline);

// RemoteConnection: an authenticated SSH transport to one host.
//
// Owns the TCP socket and the libssh2 session. The session runs in
// non-blocking mode; every libssh2 call made after open() takes io_mutex
// for the duration of that call only, so a reader thread and a writer can
// share the transport. Destruction disconnects and closes the socket.
class RemoteConnection {
public:
    // Connect, handshake and authenticate within params.timeout_secs.
    // Failures are Connection or Timeout errors and are never retried.
    static Result<std::unique_ptr<RemoteConnection>> open(const ConnectParams& params);

    // TCP connect and key exchange only, for probing. tcp_connected reports
    // whether the failure (if any) happened after the TCP stage.
    static Result<std::unique_ptr<RemoteConnection>> open_unauthenticated(
        const std::string& address, int port, std::chrono::milliseconds timeout,
        const std::string& client_banner, bool* tcp_connected = nullptr);

    ~RemoteConnection();

    RemoteConnection(const RemoteConnection&) = delete;
    RemoteConnection& operator=(const RemoteConnection&) = delete;

    // Disconnect and release the socket. Safe to call multiple times.
    void close();
    bool is_open() const;

    // True if the server accepts the "none" method for username.
    bool try_auth_none(const std::string& username, Clock::time_point deadline);

    // Open a session channel, retrying EAGAIN until deadline.
    Result<LIBSSH2_CHANNEL*> open_channel(Clock::time_point deadline);

    // Wait for socket readiness (see wait_session_socket).
    void wait_io(int max_ms);

    // Call fn under io_mutex until it stops returning EAGAIN. Returns fn's
    // last result, or LIBSSH2_ERROR_TIMEOUT once deadline has passed.
    int retry_io(Clock::time_point deadline, const std::function<int()>& fn);

    // Send an SSH keepalive if one is due. Returns seconds until the next
    // one, or a Connection error if the transport rejected it.
    Result<int> send_keepalive();

    const std::string& host_id() const { return host_id_; }
    const std::string& target() const { return target_; }
    const std::string& server_banner() const { return banner_; }

    LIBSSH2_SESSION* raw_session() { return session_; }
    socket_t raw_socket() const { return sock_; }
    std::shared_ptr<std::mutex> io_mutex() { return io_mutex_; }

private:
    explicit RemoteConnection(const ConnectParams& params);

    Result<void> establish(const ConnectParams& params);
    Result<void> handshake(const std::string& address, int port,
                           Clock::time_point deadline, const std::string& client_banner);
    Result<void> authenticate(const ConnectParams& params, Clock::time_point deadline);
    int try_publickey(const ConnectParams& params, Clock::time_point deadline);
    int try_password(const ConnectParams& params, const std::string& methods,
                     Clock::time_point deadline);

    LIBSSH2_SESSION* session_ = nullptr;
    socket_t sock_ = REMOPS_INVALID_SOCKET;
    std::string host_id_;
    std::string target_;
    std::string banner_;
    bool tcp_connected_ = false;
    std::shared_ptr<std::mutex> io_mutex_;
};
