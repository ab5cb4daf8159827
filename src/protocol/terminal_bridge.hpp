#pragma once

#include <atomic>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <core/types.hpp>
#include <core/config.hpp>
#include <ssh/session_registry.hpp>
#include "terminal_protocol.hpp"

// Receives each outbound frame, already serialized to one JSON line.
using FrameSink = std::function<void(const std::string& frame)>;

// TerminalBridge: binds one registry session to a duplex frame stream.
//
// open() creates the session and reports "connected" or "error". An output
// pump then polls the session and forwards "output" frames until the
// session ends or stop() is called. Inbound frames go through on_frame().
// Calls into the sink are serialized.
class TerminalBridge {
public:
    TerminalBridge(SessionRegistry& registry, FrameSink sink,
                   int read_timeout_ms = SESSION_READ_TIMEOUT_MS);
    ~TerminalBridge();

    TerminalBridge(const TerminalBridge&) = delete;
    TerminalBridge& operator=(const TerminalBridge&) = delete;

    Result<std::string> open(const ConnectRequest& request, const ConnectDefaults& defaults);

    // Apply one inbound frame. Malformed frames are reported and skipped;
    // the bridge keeps running.
    Result<void> on_frame(const std::string& text);

    // Stop the pump and close the session through the registry.
    void stop();

    // Block until the session has ended (remote exit, write failure, stop).
    void wait();

    bool running() const { return running_.load(); }
    const std::string& session_id() const { return session_id_; }

private:
    void send(const TerminalFrame& frame);
    void pump_loop();
    void finish(const std::string& reason);

    SessionRegistry& registry_;
    FrameSink sink_;
    std::chrono::milliseconds read_timeout_;

    std::shared_ptr<Session> session_;
    std::string session_id_;

    std::mutex send_mutex_;
    std::atomic<bool> running_{false};
    std::atomic<bool> stopping_{false};
    std::thread pump_;

    std::mutex done_mutex_;
    std::condition_variable done_cv_;
    bool done_ = false;
};
