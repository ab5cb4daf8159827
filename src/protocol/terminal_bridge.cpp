#include "terminal_bridge.hpp"
#include <core/log.hpp>
#include <fmt/format.h>

TerminalBridge::TerminalBridge(SessionRegistry& registry, FrameSink sink, int read_timeout_ms)
    : registry_(registry), sink_(std::move(sink)),
      read_timeout_(read_timeout_ms > 0 ? read_timeout_ms : SESSION_READ_TIMEOUT_MS) {}

TerminalBridge::~TerminalBridge() {
    stop();
}

void TerminalBridge::send(const TerminalFrame& frame) {
    std::lock_guard<std::mutex> lock(send_mutex_);
    if (sink_) sink_(serialize_frame(frame));
}

// ── Lifecycle ───────────────────────────────────────────────

Result<std::string> TerminalBridge::open(const ConnectRequest& request,
                                         const ConnectDefaults& defaults) {
    if (session_) {
        return Result<std::string>::Err(ErrorKind::Resource, "bridge: session already open");
    }

    auto params = request.to_params(defaults);
    auto created = registry_.create(params, request.rows, request.cols);
    if (created.is_err()) {
        send(TerminalFrame::failure("SSH connection failed", created.error));
        {
            std::lock_guard<std::mutex> lock(done_mutex_);
            done_ = true;
        }
        done_cv_.notify_all();
        return Result<std::string>::Err(created.kind, created.error);
    }

    session_ = created.value;
    session_id_ = session_->id();
    running_ = true;
    remops_log(fmt::format("bridge {}: connected to {} ({}x{})", session_id_, params.target(),
                           request.rows, request.cols));
    send(TerminalFrame::connected(session_id_));

    pump_ = std::thread(&TerminalBridge::pump_loop, this);
    return Result<std::string>::Ok(session_id_);
}

void TerminalBridge::pump_loop() {
    while (!stopping_) {
        auto r = session_->read(read_timeout_);
        if (r.status == ReadResult::Data) {
            send(TerminalFrame::output(std::move(r.data)));
        } else if (r.status == ReadResult::Eof) {
            finish(stopping_ ? "" : "remote shell exited");
            return;
        }
    }
}

void TerminalBridge::finish(const std::string& reason) {
    if (!running_.exchange(false)) return;

    if (!reason.empty()) {
        send(TerminalFrame::failure("session closed", reason));
    }
    auto closed = registry_.close(session_id_);
    if (closed.is_err() && closed.kind != ErrorKind::NotFound) {
        remops_log(fmt::format("bridge {}: close failed: {}", session_id_, closed.error));
    }
    remops_log(fmt::format("bridge {}: finished{}", session_id_,
                           reason.empty() ? "" : " (" + reason + ")"));
    {
        std::lock_guard<std::mutex> lock(done_mutex_);
        done_ = true;
    }
    done_cv_.notify_all();
}

void TerminalBridge::stop() {
    stopping_ = true;
    if (pump_.joinable() && pump_.get_id() != std::this_thread::get_id()) {
        pump_.join();
    }
    finish("");
    {
        std::lock_guard<std::mutex> lock(done_mutex_);
        done_ = true;
    }
    done_cv_.notify_all();
}

void TerminalBridge::wait() {
    std::unique_lock<std::mutex> lock(done_mutex_);
    done_cv_.wait(lock, [this] { return done_; });
}

// ── Inbound frames ──────────────────────────────────────────

Result<void> TerminalBridge::on_frame(const std::string& text) {
    auto parsed = parse_frame(text);
    if (parsed.is_err()) {
        remops_log(fmt::format("bridge {}: {}", session_id_, parsed.error));
        send(TerminalFrame::failure("invalid frame", parsed.error));
        return Result<void>::Err(parsed.kind, parsed.error);
    }
    if (!running_) {
        return Result<void>::Err(ErrorKind::NotFound, "bridge: no open session");
    }

    const TerminalFrame& frame = parsed.value;
    switch (frame.type) {
        case FrameType::Input: {
            size_t off = 0;
            while (off < frame.data.size()) {
                auto w = session_->write(frame.data.substr(off));
                if (w.is_err() && w.kind == ErrorKind::Timeout) {
                    // Backpressure: the session stays open, the caller decides.
                    return Result<void>::Err(ErrorKind::Timeout,
                        fmt::format("bridge {}: input stalled after {} bytes: {}",
                                    session_id_, off + w.value, w.error));
                }
                if (w.is_err()) {
                    remops_log(fmt::format("bridge {}: write failed: {}", session_id_, w.error));
                    finish(w.error);
                    return Result<void>::Err(w.kind, w.error);
                }
                if (w.value == 0) {
                    return Result<void>::Err(ErrorKind::Timeout,
                        fmt::format("bridge {}: input stalled after {} bytes", session_id_, off));
                }
                off += w.value;
            }
            return Result<void>::Ok();
        }
        case FrameType::Resize: {
            auto r = session_->resize(frame.rows, frame.cols);
            if (r.is_err()) {
                remops_log(fmt::format("bridge {}: resize {}x{} failed: {}", session_id_,
                                       frame.rows, frame.cols, r.error));
            }
            return r;
        }
        case FrameType::Ping:
            send(TerminalFrame::pong());
            return Result<void>::Ok();
        case FrameType::Pong:
            return Result<void>::Ok();
        case FrameType::Connected:
        case FrameType::Output:
        case FrameType::Error:
            break;
    }

    std::string msg = fmt::format("frame: \"{}\" is not accepted from a client",
                                  frame_type_name(frame.type));
    send(TerminalFrame::failure("invalid frame", msg));
    return Result<void>::Err(ErrorKind::Protocol, msg);
}
