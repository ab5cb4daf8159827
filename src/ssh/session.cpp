#include "session.hpp"
#include <core/log.hpp>
#include <core/utils.hpp>
#include <platform/platform.hpp>
#include <libssh2.h>
#include <algorithm>
#include <fmt/format.h>

std::string make_session_id(const std::string& host_id) {
    static std::atomic<int64_t> last{0};
    int64_t now = unix_nanos();
    int64_t prev = last.load();
    int64_t next;
    do {
        next = std::max(now, prev + 1);
    } while (!last.compare_exchange_weak(prev, next));
    return fmt::format("{}-{}", host_id, next);
}

// ── Session ─────────────────────────────────────────────────

Session::Session(std::string id, std::string host_id, int rows, int cols)
    : id_(std::move(id)), host_id_(std::move(host_id)), created_at_(Clock::now()),
      rows_(rows), cols_(cols), last_activity_(created_at_) {}

Clock::time_point Session::last_activity() const {
    std::lock_guard<std::mutex> lock(activity_mutex_);
    return last_activity_;
}

void Session::touch() {
    set_last_activity(Clock::now());
}

void Session::set_last_activity(Clock::time_point t) {
    std::lock_guard<std::mutex> lock(activity_mutex_);
    last_activity_ = t;
}

Result<void> Session::resize(int rows, int cols) {
    if (rows <= 0 || cols <= 0) {
        return Result<void>::Err(ErrorKind::Resource,
            fmt::format("resize {}: invalid size {}x{}", id_, cols, rows));
    }
    rows_ = rows;
    cols_ = cols;
    touch();
    return request_resize(rows, cols);
}

// ── PTY setup ───────────────────────────────────────────────

// RFC 4254 encoded terminal modes: opcode byte + uint32 value, TTY_OP_END.
static std::string pty_modes() {
    std::string m;
    auto put = [&m](unsigned char op, uint32_t v) {
        m.push_back(static_cast<char>(op));
        for (int shift = 24; shift >= 0; shift -= 8)
            m.push_back(static_cast<char>((v >> shift) & 0xFF));
    };
    put(53, 1);           // ECHO
    put(128, PTY_BAUD);   // TTY_OP_ISPEED
    put(129, PTY_BAUD);   // TTY_OP_OSPEED
    m.push_back(0);       // TTY_OP_END
    return m;
}

Result<std::shared_ptr<SshSession>> SshSession::open(std::unique_ptr<RemoteConnection> conn,
                                                    const std::string& host_id,
                                                    int rows, int cols,
                                                    const SessionOptions& opts) {
    using R = Result<std::shared_ptr<SshSession>>;
    if (!conn || !conn->is_open()) {
        return R::Err(ErrorKind::Connection,
                      error_context("open session", host_id, "connection is closed"));
    }

    auto deadline = Clock::now() + std::chrono::seconds(CHANNEL_OPEN_TIMEOUT_SECS);
    auto opened = conn->open_channel(deadline);
    if (opened.is_err()) {
        return R::Err(opened.kind, error_context("open session", host_id, opened.error));
    }
    LIBSSH2_CHANNEL* ch = opened.value;

    auto fail = [&](int rc, const std::string& what) {
        conn->retry_io(Clock::now() + std::chrono::seconds(1),
                       [ch] { return libssh2_channel_free(ch); });
        ErrorKind kind = (rc == LIBSSH2_ERROR_TIMEOUT) ? ErrorKind::Timeout
                                                       : ErrorKind::Connection;
        return R::Err(kind, error_context("open session", host_id,
                                          fmt::format("{} ({})", what, rc)));
    };

    const std::string modes = pty_modes();
    int rc = conn->retry_io(deadline, [&] {
        return libssh2_channel_request_pty_ex(
            ch, opts.term.c_str(), static_cast<unsigned int>(opts.term.size()),
            modes.data(), static_cast<unsigned int>(modes.size()),
            cols, rows, 0, 0);
    });
    if (rc != 0) return fail(rc, "pty request failed");

    rc = conn->retry_io(deadline, [ch] { return libssh2_channel_shell(ch); });
    if (rc != 0) return fail(rc, "shell request failed");

    std::shared_ptr<SshSession> session(
        new SshSession(std::move(conn), ch, host_id, rows, cols, opts));
    session->start_reader();
    remops_log(fmt::format("session {} opened ({}x{}, {})", session->id(), cols, rows, opts.term));
    return R::Ok(std::move(session));
}

SshSession::SshSession(std::unique_ptr<RemoteConnection> conn, LIBSSH2_CHANNEL* channel,
                       const std::string& host_id, int rows, int cols,
                       const SessionOptions& opts)
    : Session(make_session_id(host_id), host_id, rows, cols),
      conn_(std::move(conn)), channel_(channel), io_mutex_(conn_->io_mutex()), opts_(opts) {
    // Registered in acquisition order; cancel() runs them in reverse.
    scope_.defer([this] {
        conn_.reset();
    });
    scope_.defer([this] {
        std::lock_guard<std::mutex> wlock(write_mutex_);
        if (!channel_) return;
        LIBSSH2_CHANNEL* ch = channel_;
        auto until = Clock::now() + std::chrono::seconds(1);
        conn_->retry_io(until, [ch] { return libssh2_channel_close(ch); });
        conn_->retry_io(until, [ch] { return libssh2_channel_free(ch); });
        channel_ = nullptr;
    });
    scope_.defer([this] {
        std::lock_guard<std::mutex> wlock(write_mutex_);
        if (!channel_) return;
        LIBSSH2_CHANNEL* ch = channel_;
        conn_->retry_io(Clock::now() + std::chrono::milliseconds(500),
                        [ch] { return libssh2_channel_send_eof(ch); });
    });
}

SshSession::~SshSession() {
    close();
}

// ── Reader ──────────────────────────────────────────────────

void SshSession::start_reader() {
    running_ = true;
    reader_ = std::thread(&SshSession::reader_loop, this);
    scope_.defer([this] {
        running_ = false;
        if (reader_.joinable()) reader_.join();
    });
}

void SshSession::reader_loop() {
    char buf[SSH_READ_BUF_SIZE];
    bool keepalive_failed = false;

    while (running_) {
        bool out_full, err_full;
        {
            std::lock_guard<std::mutex> lock(buf_mutex_);
            out_full = out_.buf.size() >= SESSION_BUFFER_CAP;
            err_full = err_.buf.size() >= SESSION_BUFFER_CAP;
        }
        if (out_full && err_full) {
            platform::sleep_ms(SESSION_READ_TIMEOUT_MS);
            continue;
        }

        ssize_t n_out = LIBSSH2_ERROR_EAGAIN;
        ssize_t n_err = LIBSSH2_ERROR_EAGAIN;
        bool eof;
        std::string got_out, got_err;
        {
            std::lock_guard<std::mutex> lock(*io_mutex_);
            if (!out_full) {
                n_out = libssh2_channel_read(channel_, buf, sizeof(buf));
                if (n_out > 0) got_out.assign(buf, static_cast<size_t>(n_out));
            }
            if (!err_full) {
                n_err = libssh2_channel_read_stderr(channel_, buf, sizeof(buf));
                if (n_err > 0) got_err.assign(buf, static_cast<size_t>(n_err));
            }
            eof = libssh2_channel_eof(channel_) != 0;
        }

        bool got = !got_out.empty() || !got_err.empty();
        bool failed = (n_out < 0 && n_out != LIBSSH2_ERROR_EAGAIN) ||
                      (n_err < 0 && n_err != LIBSSH2_ERROR_EAGAIN);
        bool done = failed || (eof && !got);

        if (got || done) {
            {
                std::lock_guard<std::mutex> lock(buf_mutex_);
                out_.buf += got_out;
                err_.buf += got_err;
                if (done) {
                    out_.eof = true;
                    err_.eof = true;
                }
            }
            buf_cv_.notify_all();
        }

        if (done) {
            remops_log(fmt::format("session {}: stream {} (out={} err={})", id(),
                                   failed ? "error" : "eof", n_out, n_err));
            break;
        }
        if (!got) {
            auto ka = conn_->send_keepalive();
            if (ka.is_err() && !keepalive_failed) {
                keepalive_failed = true;
                remops_log(fmt::format("session {}: {}", id(), ka.error));
            }
            conn_->wait_io(SESSION_READ_TIMEOUT_MS);
        }
    }
}

ReadResult SshSession::take(Stream& s, std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(buf_mutex_);
    buf_cv_.wait_for(lock, timeout, [&] { return closed_ || !s.buf.empty() || s.eof; });
    if (closed_) return ReadResult::eof();
    if (!s.buf.empty()) {
        std::string data;
        data.swap(s.buf);
        lock.unlock();
        touch();
        return ReadResult::make_data(std::move(data));
    }
    if (s.eof) return ReadResult::eof();
    return ReadResult::no_data();
}

ReadResult SshSession::read(std::chrono::milliseconds timeout) {
    return take(out_, timeout);
}

ReadResult SshSession::read_error(std::chrono::milliseconds timeout) {
    return take(err_, timeout);
}

// ── Write / resize ──────────────────────────────────────────

Result<size_t> SshSession::write(const std::string& data) {
    if (closed_) {
        return Result<size_t>::Err(ErrorKind::Connection,
                                   error_context("write", id(), "session closed"));
    }
    if (data.empty()) return Result<size_t>::Ok(0);

    ssize_t w;
    {
        std::lock_guard<std::mutex> wlock(write_mutex_);
        if (!channel_) {
            return Result<size_t>::Err(ErrorKind::Connection,
                                       error_context("write", id(), "session closed"));
        }
        touch();
        LIBSSH2_CHANNEL* ch = channel_;
        auto deadline = Clock::now() + std::chrono::milliseconds(opts_.write_wait_ms);
        w = conn_->retry_io(deadline, [&] {
            return static_cast<int>(libssh2_channel_write(ch, data.data(), data.size()));
        });
    }

    if (w >= 0) return Result<size_t>::Ok(static_cast<size_t>(w));
    if (w == LIBSSH2_ERROR_TIMEOUT) {
        return Result<size_t>::Err(ErrorKind::Timeout,
            error_context("write", id(), "remote not accepting input"));
    }

    remops_log(fmt::format("session {}: write failed ({}), closing", id(), w));
    close();
    return Result<size_t>::Err(ErrorKind::Connection,
        error_context("write", id(), fmt::format("channel write error ({})", w)));
}

Result<void> SshSession::request_resize(int rows, int cols) {
    std::lock_guard<std::mutex> wlock(write_mutex_);
    if (!channel_) {
        return Result<void>::Err(ErrorKind::Connection,
                                 error_context("resize", id(), "session closed"));
    }
    LIBSSH2_CHANNEL* ch = channel_;
    int rc = conn_->retry_io(Clock::now() + std::chrono::milliseconds(opts_.write_wait_ms),
                             [&] { return libssh2_channel_request_pty_size_ex(ch, cols, rows, 0, 0); });
    if (rc != 0) {
        return Result<void>::Err(rc == LIBSSH2_ERROR_TIMEOUT ? ErrorKind::Timeout
                                                            : ErrorKind::Protocol,
            error_context("resize", id(), fmt::format("pty size request failed ({})", rc)));
    }
    return Result<void>::Ok();
}

// ── Teardown ────────────────────────────────────────────────

void SshSession::close() {
    {
        std::lock_guard<std::mutex> lock(buf_mutex_);
        if (!closed_.exchange(true)) {
            remops_log(fmt::format("session {} closing", id()));
        }
    }
    buf_cv_.notify_all();
    scope_.cancel();
}

bool SshSession::is_closed() const {
    return closed_;
}
