#include "command_client.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <libssh2.h>
#include <algorithm>
#include <fmt/format.h>

void apply_exit_status(CommandOutput& out, int exit_status, const std::string& exit_signal) {
    if (!exit_signal.empty()) {
        out.exit_code = -1;
        out.error = fmt::format("Process killed by signal {}", exit_signal);
        out.error_kind = ErrorKind::Resource;
        return;
    }
    out.exit_code = exit_status;
    if (exit_status != 0) {
        out.error = fmt::format("Process exited with status {}", exit_status);
        out.error_kind = ErrorKind::Resource;
    }
}

// ── Exec channel helpers ────────────────────────────────────

namespace {

// Owns an exec channel for the duration of one command.
class ExecChannel {
public:
    ExecChannel(RemoteConnection& conn, LIBSSH2_CHANNEL* ch)
        : conn_(conn), ch_(ch) {}

    ~ExecChannel() { release(); }

    ExecChannel(const ExecChannel&) = delete;
    ExecChannel& operator=(const ExecChannel&) = delete;

    LIBSSH2_CHANNEL* get() { return ch_; }

    // Close and free. Both calls return EAGAIN until the peer's CLOSE has
    // been read, so they are retried under a short bound; a channel that is
    // still linked into the session would otherwise leak.
    void release() {
        if (!ch_) return;
        LIBSSH2_CHANNEL* ch = ch_;
        ch_ = nullptr;
        auto until = Clock::now() + std::chrono::milliseconds(CHANNEL_CLOSE_WAIT_MS);
        int rc = conn_.retry_io(until, [ch] { return libssh2_channel_close(ch); });
        if (rc != 0) {
            remops_log(fmt::format("exec {}: channel close rc={}", conn_.target(), rc));
        }
        rc = conn_.retry_io(until, [ch] { return libssh2_channel_free(ch); });
        if (rc != 0) {
            remops_log(fmt::format("exec {}: channel free rc={}", conn_.target(), rc));
        }
    }

private:
    RemoteConnection& conn_;
    LIBSSH2_CHANNEL* ch_;
};

enum class Stop { None, Deadline, Cancelled };

struct Limits {
    Clock::time_point deadline;
    bool bounded;
    const CancelToken* cancel;

    Stop check() const {
        if (cancel && cancel->is_cancelled()) return Stop::Cancelled;
        if (bounded && Clock::now() >= deadline) return Stop::Deadline;
        return Stop::None;
    }

    int wait_ms() const {
        return bounded ? std::min(remaining_ms(deadline), 100) : 100;
    }
};

CommandOutput stopped(Stop why, std::chrono::milliseconds timeout, CommandOutput out) {
    out.exit_code.reset();
    if (why == Stop::Cancelled) {
        out.error = "command cancelled";
        out.error_kind = ErrorKind::Cancelled;
    } else {
        out.error = fmt::format("command timed out after {}ms", timeout.count());
        out.error_kind = ErrorKind::Timeout;
    }
    return out;
}

CommandOutput failed(const std::string& msg, ErrorKind kind) {
    CommandOutput out;
    out.exit_code = -1;
    out.error = msg;
    out.error_kind = kind;
    return out;
}

} // namespace

// ── execute_on ──────────────────────────────────────────────

CommandOutput execute_on_with_input(RemoteConnection& conn, const std::string& command,
                                    const std::string& input,
                                    std::chrono::milliseconds timeout,
                                    const CancelToken* cancel) {
    if (!conn.is_open()) {
        return failed(error_context("execute", conn.target(), "connection is closed"),
                      ErrorKind::Connection);
    }

    Limits limits{Clock::now() + timeout, timeout.count() > 0, cancel};
    auto io_mutex = conn.io_mutex();

    auto setup_deadline = limits.bounded
        ? std::min(limits.deadline, Clock::now() + std::chrono::seconds(CHANNEL_OPEN_TIMEOUT_SECS))
        : Clock::now() + std::chrono::seconds(CHANNEL_OPEN_TIMEOUT_SECS);
    auto opened = conn.open_channel(setup_deadline);
    if (opened.is_err()) {
        if (limits.check() != Stop::None) return stopped(limits.check(), timeout, {});
        return failed(error_context("execute", conn.target(), opened.error), opened.kind);
    }
    ExecChannel ch(conn, opened.value);

    // Execute the command
    int rc;
    for (;;) {
        {
            std::lock_guard<std::mutex> lock(*io_mutex);
            rc = libssh2_channel_exec(ch.get(), command.c_str());
        }
        if (rc != LIBSSH2_ERROR_EAGAIN) break;
        Stop why = limits.check();
        if (why != Stop::None) return stopped(why, timeout, {});
        conn.wait_io(limits.wait_ms());
    }
    if (rc != 0) {
        return failed(error_context("execute", conn.target(),
                                    fmt::format("failed to exec command ({})", rc)),
                      ErrorKind::Connection);
    }

    CommandOutput out;

    // Write all input, then close stdin (send EOF) so the command sees end of input
    size_t sent = 0;
    while (sent < input.size()) {
        ssize_t w;
        {
            std::lock_guard<std::mutex> lock(*io_mutex);
            w = libssh2_channel_write(ch.get(), input.data() + sent, input.size() - sent);
        }
        if (w == LIBSSH2_ERROR_EAGAIN) {
            Stop why = limits.check();
            if (why != Stop::None) return stopped(why, timeout, std::move(out));
            conn.wait_io(limits.wait_ms());
            continue;
        }
        if (w < 0) {
            return failed(error_context("execute", conn.target(),
                                        "channel write error sending input"),
                          ErrorKind::Connection);
        }
        sent += static_cast<size_t>(w);
    }
    for (;;) {
        {
            std::lock_guard<std::mutex> lock(*io_mutex);
            rc = libssh2_channel_send_eof(ch.get());
        }
        if (rc != LIBSSH2_ERROR_EAGAIN) break;
        Stop why = limits.check();
        if (why != Stop::None) return stopped(why, timeout, std::move(out));
        conn.wait_io(limits.wait_ms());
    }

    // Read stdout and stderr until EOF. Both are drained each pass so a
    // full stderr window cannot stall stdout.
    char buf[SSH_READ_BUF_SIZE];
    for (;;) {
        ssize_t n_out, n_err;
        bool eof;
        {
            std::lock_guard<std::mutex> lock(*io_mutex);
            n_out = libssh2_channel_read(ch.get(), buf, sizeof(buf));
            if (n_out > 0) out.stdout_data.append(buf, static_cast<size_t>(n_out));
            n_err = libssh2_channel_read_stderr(ch.get(), buf, sizeof(buf));
            if (n_err > 0) out.stderr_data.append(buf, static_cast<size_t>(n_err));
            eof = libssh2_channel_eof(ch.get()) != 0;
        }
        if (n_out < 0 && n_out != LIBSSH2_ERROR_EAGAIN) {
            return failed(error_context("execute", conn.target(),
                                        fmt::format("channel read error ({})", n_out)),
                          ErrorKind::Connection);
        }
        if (eof && n_out <= 0 && n_err <= 0) break;

        Stop why = limits.check();
        if (why != Stop::None) return stopped(why, timeout, std::move(out));
        if (n_out <= 0 && n_err <= 0) conn.wait_io(limits.wait_ms());
    }

    // Exit status arrives with the channel close
    for (;;) {
        {
            std::lock_guard<std::mutex> lock(*io_mutex);
            rc = libssh2_channel_close(ch.get());
        }
        if (rc != LIBSSH2_ERROR_EAGAIN) break;
        Stop why = limits.check();
        if (why != Stop::None) return stopped(why, timeout, std::move(out));
        conn.wait_io(limits.wait_ms());
    }
    for (;;) {
        {
            std::lock_guard<std::mutex> lock(*io_mutex);
            rc = libssh2_channel_wait_closed(ch.get());
        }
        if (rc != LIBSSH2_ERROR_EAGAIN) break;
        Stop why = limits.check();
        if (why != Stop::None) return stopped(why, timeout, std::move(out));
        conn.wait_io(limits.wait_ms());
    }

    int exit_status = 0;
    std::string exit_signal;
    {
        std::lock_guard<std::mutex> lock(*io_mutex);
        exit_status = libssh2_channel_get_exit_status(ch.get());
        char* sig = nullptr;
        size_t sig_len = 0;
        if (libssh2_channel_get_exit_signal(ch.get(), &sig, &sig_len,
                                            nullptr, nullptr, nullptr, nullptr) == 0 && sig) {
            exit_signal.assign(sig, sig_len);
            libssh2_free(conn.raw_session(), sig);
        }
    }

    apply_exit_status(out, exit_status, exit_signal);
    return out;
}

CommandOutput execute_on(RemoteConnection& conn, const std::string& command,
                         std::chrono::milliseconds timeout, const CancelToken* cancel) {
    return execute_on_with_input(conn, command, std::string(), timeout, cancel);
}

// ── CommandClient ───────────────────────────────────────────

Result<std::unique_ptr<CommandClient>> CommandClient::connect(const ConnectParams& params) {
    using R = Result<std::unique_ptr<CommandClient>>;
    auto conn = RemoteConnection::open(params);
    if (conn.is_err()) return R::Err(conn.kind, conn.error);
    return R::Ok(std::make_unique<CommandClient>(std::move(conn.value)));
}

CommandClient::CommandClient(std::unique_ptr<RemoteConnection> conn)
    : conn_(std::move(conn)) {}

CommandOutput CommandClient::execute(const std::string& command,
                                     std::chrono::milliseconds timeout,
                                     const CancelToken* cancel) {
    if (!conn_) return failed("execute: no connection", ErrorKind::Connection);
    auto out = execute_on(*conn_, command, timeout, cancel);
    remops_log_cmd("exec " + conn_->target(), command, out);
    return out;
}

CommandOutput CommandClient::execute_with_input(const std::string& command,
                                                const std::string& input,
                                                std::chrono::milliseconds timeout,
                                                const CancelToken* cancel) {
    if (!conn_) return failed("execute: no connection", ErrorKind::Connection);
    auto out = execute_on_with_input(*conn_, command, input, timeout, cancel);
    remops_log_cmd("exec " + conn_->target(), command, out);
    return out;
}
