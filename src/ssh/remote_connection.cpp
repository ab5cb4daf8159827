#include "remote_connection.hpp"
#include <core/log.hpp>
#include <platform/platform.hpp>
#include <libssh2.h>
#include <cstring>
#include <algorithm>
#include <fmt/format.h>

std::string ConnectParams::target() const {
    return fmt::format("{}@{}:{}", username, address, port);
}

bool ensure_libssh2_init() {
    static std::once_flag once;
    static int rc = -1;
    std::call_once(once, [] { rc = libssh2_init(0); });
    return rc == 0;
}

int remaining_ms(Clock::time_point deadline) {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - Clock::now()).count();
    return left > 0 ? static_cast<int>(left) : 0;
}

void wait_session_socket(LIBSSH2_SESSION* session, socket_t sock, int max_ms) {
    short events = 0;
    int dir = libssh2_session_block_directions(session);
    if (dir & LIBSSH2_SESSION_BLOCK_INBOUND) events |= POLLIN;
    if (dir & LIBSSH2_SESSION_BLOCK_OUTBOUND) events |= POLLOUT;
    if (events == 0) {
        platform::sleep_ms(std::min(max_ms, EAGAIN_BACKOFF_MS));
        return;
    }
    platform::poll_socket(sock, events, max_ms);
}

// Data passed to keyboard-interactive callback via session abstract pointer
struct KbdAuthData {
    std::string password;
    int prompt_round;
};

// Answer every prompt with the password; servers that use
// keyboard-interactive for plain password auth ask exactly once.
static void kbd_callback(const char* /*name*/, int /*name_len*/,
                         const char* /*instruction*/, int /*instruction_len*/,
                         int num_prompts,
                         const LIBSSH2_USERAUTH_KBDINT_PROMPT* /*prompts*/,
                         LIBSSH2_USERAUTH_KBDINT_RESPONSE* responses,
                         void** abstract) {
    KbdAuthData* data = static_cast<KbdAuthData*>(*abstract);
    for (int i = 0; i < num_prompts; i++) {
        responses[i].text = strdup(data->password.c_str());
        responses[i].length = static_cast<unsigned int>(data->password.length());
    }
    data->prompt_round++;
}

// ── Construction / Destruction ──────────────────────────────

RemoteConnection::RemoteConnection(const ConnectParams& params)
    : host_id_(params.host_id), target_(params.target()),
      io_mutex_(std::make_shared<std::mutex>()) {}

RemoteConnection::~RemoteConnection() {
    close();
}

Result<std::unique_ptr<RemoteConnection>> RemoteConnection::open(const ConnectParams& params) {
    using R = Result<std::unique_ptr<RemoteConnection>>;
    if (params.address.empty()) {
        return R::Err(ErrorKind::Connection,
                      error_context("connect", params.host_id, "no address given"));
    }

    std::unique_ptr<RemoteConnection> conn(new RemoteConnection(params));
    auto r = conn->establish(params);
    if (r.is_err()) {
        remops_log(fmt::format("connect {} failed: {}", params.target(), r.error));
        return R::Err(r.kind, error_context("connect", params.target(), r.error));
    }
    remops_log(fmt::format("connect {} ok ({})", params.target(), conn->banner_));
    return R::Ok(std::move(conn));
}

Result<void> RemoteConnection::establish(const ConnectParams& params) {
    auto deadline = Clock::now() + std::chrono::seconds(params.timeout_secs);

    auto hs = handshake(params.address, params.port, deadline, "");
    if (hs.is_err()) {
        if (hs.kind == ErrorKind::Timeout) return hs;
        return Result<void>::Err(ErrorKind::Connection, hs.error);
    }

    libssh2_keepalive_config(session_, 1, KEEPALIVE_INTERVAL_SECS);

    auto auth = authenticate(params, deadline);
    if (auth.is_err()) {
        close();
        return auth;
    }
    return Result<void>::Ok();
}

Result<void> RemoteConnection::handshake(const std::string& address, int port,
                                         Clock::time_point deadline,
                                         const std::string& client_banner) {
    if (!ensure_libssh2_init()) {
        return Result<void>::Err(ErrorKind::Connection, "failed to initialize libssh2");
    }

    auto tcp = platform::connect_tcp(address, port, remaining_ms(deadline));
    switch (tcp.status) {
        case platform::ConnectStatus::Ok:
            break;
        case platform::ConnectStatus::Timeout:
            return Result<void>::Err(ErrorKind::Timeout, tcp.error);
        case platform::ConnectStatus::Refused:
            return Result<void>::Err(ErrorKind::Connection, tcp.error);
        default:
            return Result<void>::Err(ErrorKind::Resource, tcp.error);
    }
    sock_ = tcp.sock;
    tcp_connected_ = true;
    platform::enable_keepalive(sock_);

    session_ = libssh2_session_init_ex(nullptr, nullptr, nullptr, nullptr);
    if (!session_) {
        close();
        return Result<void>::Err(ErrorKind::Resource, "failed to create SSH session");
    }
    if (!client_banner.empty()) {
        libssh2_session_banner_set(session_, client_banner.c_str());
    }
    libssh2_session_set_blocking(session_, 0);

    // SSH handshake (key exchange)
    int rc;
    while ((rc = libssh2_session_handshake(session_, sock_)) == LIBSSH2_ERROR_EAGAIN) {
        if (remaining_ms(deadline) == 0) {
            close();
            return Result<void>::Err(ErrorKind::Timeout, "SSH handshake timed out");
        }
        wait_session_socket(session_, sock_, std::min(remaining_ms(deadline), 100));
    }
    if (rc != 0) {
        close();
        return Result<void>::Err(ErrorKind::Connection,
                                 fmt::format("SSH handshake failed ({})", rc));
    }

    const char* banner = libssh2_session_banner_get(session_);
    if (banner) banner_ = banner;
    return Result<void>::Ok();
}

Result<std::unique_ptr<RemoteConnection>> RemoteConnection::open_unauthenticated(
        const std::string& address, int port, std::chrono::milliseconds timeout,
        const std::string& client_banner, bool* tcp_connected) {
    using R = Result<std::unique_ptr<RemoteConnection>>;
    ConnectParams params;
    params.host_id = address;
    params.address = address;
    params.port = port;
    params.username = SCAN_PROBE_USER;

    std::unique_ptr<RemoteConnection> conn(new RemoteConnection(params));
    auto hs = conn->handshake(address, port, Clock::now() + timeout, client_banner);
    if (tcp_connected) *tcp_connected = conn->tcp_connected_;
    if (hs.is_err()) return R::Err(hs.kind, error_context("probe", params.target(), hs.error));
    return R::Ok(std::move(conn));
}

bool RemoteConnection::try_auth_none(const std::string& username, Clock::time_point deadline) {
    if (!session_) return false;
    for (;;) {
        char* list;
        int err;
        {
            std::lock_guard<std::mutex> lock(*io_mutex_);
            list = libssh2_userauth_list(session_, username.c_str(),
                                         static_cast<unsigned int>(username.length()));
            err = list ? 0 : libssh2_session_last_errno(session_);
        }
        if (list) return false;
        if (err != LIBSSH2_ERROR_EAGAIN) {
            std::lock_guard<std::mutex> lock(*io_mutex_);
            return libssh2_userauth_authenticated(session_) != 0;
        }
        if (remaining_ms(deadline) == 0) return false;
        wait_io(std::min(remaining_ms(deadline), 100));
    }
}

// ── Authentication ──────────────────────────────────────────

Result<void> RemoteConnection::authenticate(const ConnectParams& params,
                                            Clock::time_point deadline) {
    const bool have_key = !params.private_key.empty();
    const bool have_password = !params.password.empty();
    if (!have_key && !have_password) {
        return Result<void>::Err(ErrorKind::Connection, "no credentials supplied");
    }

    // Check what auth methods the server supports
    char* auth_list = nullptr;
    while ((auth_list = libssh2_userauth_list(session_, params.username.c_str(),
                static_cast<unsigned int>(params.username.length()))) == nullptr) {
        if (libssh2_session_last_errno(session_) != LIBSSH2_ERROR_EAGAIN) break;
        if (remaining_ms(deadline) == 0) {
            return Result<void>::Err(ErrorKind::Timeout, "authentication timed out");
        }
        wait_session_socket(session_, sock_, std::min(remaining_ms(deadline), 100));
    }
    if (!auth_list && libssh2_userauth_authenticated(session_)) {
        return Result<void>::Ok();
    }
    std::string methods = auth_list ? auth_list : "";

    bool key_first = have_key && (params.auth_prefer == AuthPreference::Key || !have_password);
    int rc = LIBSSH2_ERROR_AUTHENTICATION_FAILED;
    for (int attempt = 0; attempt < 2; ++attempt) {
        bool use_key = (attempt == 0) ? key_first : !key_first;
        if (use_key && have_key) {
            rc = try_publickey(params, deadline);
        } else if (!use_key && have_password) {
            rc = try_password(params, methods, deadline);
        } else {
            continue;
        }
        if (rc == 0) return Result<void>::Ok();
        if (rc == LIBSSH2_ERROR_TIMEOUT) {
            return Result<void>::Err(ErrorKind::Timeout, "authentication timed out");
        }
    }

    return Result<void>::Err(ErrorKind::Connection,
        fmt::format("authentication failed for {} (server offers: {})",
                    params.username, methods.empty() ? "unknown" : methods));
}

int RemoteConnection::try_publickey(const ConnectParams& params, Clock::time_point deadline) {
    int rc;
    const char* passphrase = params.key_passphrase.empty() ? nullptr
                                                           : params.key_passphrase.c_str();
    while ((rc = libssh2_userauth_publickey_frommemory(
                session_, params.username.c_str(), params.username.length(),
                nullptr, 0,
                params.private_key.data(), params.private_key.size(),
                passphrase)) == LIBSSH2_ERROR_EAGAIN) {
        if (remaining_ms(deadline) == 0) return LIBSSH2_ERROR_TIMEOUT;
        wait_session_socket(session_, sock_, std::min(remaining_ms(deadline), 100));
    }
    if (rc != 0) remops_log(fmt::format("auth {}: publickey rejected ({})", target_, rc));
    return rc;
}

int RemoteConnection::try_password(const ConnectParams& params, const std::string& methods,
                                   Clock::time_point deadline) {
    int rc = LIBSSH2_ERROR_AUTHENTICATION_FAILED;

    if (methods.empty() || methods.find("password") != std::string::npos) {
        while ((rc = libssh2_userauth_password(session_, params.username.c_str(),
                    params.password.c_str())) == LIBSSH2_ERROR_EAGAIN) {
            if (remaining_ms(deadline) == 0) return LIBSSH2_ERROR_TIMEOUT;
            wait_session_socket(session_, sock_, std::min(remaining_ms(deadline), 100));
        }
        if (rc == 0) return 0;
        remops_log(fmt::format("auth {}: password rejected ({})", target_, rc));
    }

    // Some servers only expose passwords through keyboard-interactive
    if (methods.find("keyboard-interactive") != std::string::npos) {
        KbdAuthData kbd_data{params.password, 0};
        *libssh2_session_abstract(session_) = &kbd_data;
        while ((rc = libssh2_userauth_keyboard_interactive(session_,
                    params.username.c_str(), kbd_callback)) == LIBSSH2_ERROR_EAGAIN) {
            if (remaining_ms(deadline) == 0) {
                *libssh2_session_abstract(session_) = nullptr;
                return LIBSSH2_ERROR_TIMEOUT;
            }
            wait_session_socket(session_, sock_, std::min(remaining_ms(deadline), 100));
        }
        *libssh2_session_abstract(session_) = nullptr;
        if (rc != 0) {
            remops_log(fmt::format("auth {}: keyboard-interactive rejected ({})", target_, rc));
        }
    }
    return rc;
}

// ── Channels ────────────────────────────────────────────────

Result<LIBSSH2_CHANNEL*> RemoteConnection::open_channel(Clock::time_point deadline) {
    if (!session_) {
        return Result<LIBSSH2_CHANNEL*>::Err(ErrorKind::Connection, "connection is closed");
    }
    for (;;) {
        LIBSSH2_CHANNEL* ch = nullptr;
        int err;
        {
            std::lock_guard<std::mutex> lock(*io_mutex_);
            ch = libssh2_channel_open_session(session_);
            err = ch ? 0 : libssh2_session_last_errno(session_);
        }
        if (ch) return Result<LIBSSH2_CHANNEL*>::Ok(ch);
        if (err != LIBSSH2_ERROR_EAGAIN) {
            return Result<LIBSSH2_CHANNEL*>::Err(ErrorKind::Connection,
                fmt::format("failed to open channel ({})", err));
        }
        if (remaining_ms(deadline) == 0) {
            return Result<LIBSSH2_CHANNEL*>::Err(ErrorKind::Timeout,
                                                 "timed out opening channel");
        }
        wait_io(std::min(remaining_ms(deadline), 100));
    }
}

void RemoteConnection::wait_io(int max_ms) {
    if (!session_) return;
    wait_session_socket(session_, sock_, max_ms);
}

int RemoteConnection::retry_io(Clock::time_point deadline, const std::function<int()>& fn) {
    for (;;) {
        int rc;
        {
            std::lock_guard<std::mutex> lock(*io_mutex_);
            rc = fn();
        }
        if (rc != LIBSSH2_ERROR_EAGAIN) return rc;
        if (remaining_ms(deadline) == 0) return LIBSSH2_ERROR_TIMEOUT;
        wait_io(std::min(remaining_ms(deadline), 100));
    }
}

Result<int> RemoteConnection::send_keepalive() {
    int rc;
    int next = 0;
    {
        std::lock_guard<std::mutex> lock(*io_mutex_);
        if (!session_) return Result<int>::Err(ErrorKind::Connection, "connection is closed");
        rc = libssh2_keepalive_send(session_, &next);
    }
    if (rc == LIBSSH2_ERROR_EAGAIN) return Result<int>::Ok(0);
    if (rc != 0) {
        return Result<int>::Err(ErrorKind::Connection,
            error_context("keepalive", target_, fmt::format("send failed ({})", rc)));
    }
    return Result<int>::Ok(next);
}

// ── Teardown ────────────────────────────────────────────────

void RemoteConnection::close() {
    // Each libssh2 call gets its own brief lock; disconnect does network I/O.
    if (session_) {
        {
            std::lock_guard<std::mutex> lock(*io_mutex_);
            libssh2_session_disconnect(session_, "Normal disconnection");
        }
        {
            std::lock_guard<std::mutex> lock(*io_mutex_);
            libssh2_session_free(session_);
        }
        session_ = nullptr;
    }

    if (sock_ != REMOPS_INVALID_SOCKET) {
        platform::close_socket(sock_);
        sock_ = REMOPS_INVALID_SOCKET;
    }
}

bool RemoteConnection::is_open() const {
    return session_ != nullptr;
}
