#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <core/types.hpp>
#include <core/constants.hpp>
#include "cancel_scope.hpp"
#include "remote_connection.hpp"

// Outcome of a timed read from a session stream.
struct ReadResult {
    enum Status { Data, NoData, Eof };
    Status status = NoData;
    std::string data;

    static ReadResult make_data(std::string d) { return {Data, std::move(d)}; }
    static ReadResult no_data() { return {NoData, {}}; }
    static ReadResult eof() { return {Eof, {}}; }
};

// "<host-id>-<unix-nanoseconds>", strictly increasing within the process.
std::string make_session_id(const std::string& host_id);

// Session: one interactive shell on one host.
//
// The base class tracks identity, terminal dimensions and activity time.
// Subclasses supply the byte streams. Every write, every read that returns
// data, and every resize counts as activity.
class Session {
public:
    Session(std::string id, std::string host_id, int rows, int cols);
    virtual ~Session() = default;

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    const std::string& id() const { return id_; }
    const std::string& host_id() const { return host_id_; }
    Clock::time_point created_at() const { return created_at_; }
    Clock::time_point last_activity() const;

    int rows() const { return rows_.load(); }
    int cols() const { return cols_.load(); }

    // Single bounded write attempt; may return fewer bytes than given.
    virtual Result<size_t> write(const std::string& data) = 0;

    // Wait up to timeout for stdout (resp. stderr) data.
    virtual ReadResult read(std::chrono::milliseconds timeout) = 0;
    virtual ReadResult read_error(std::chrono::milliseconds timeout) = 0;

    // Store the new dimensions, then ask the remote pty to follow. The
    // stored dimensions change even when the request fails.
    Result<void> resize(int rows, int cols);

    // Release everything the session owns. Idempotent.
    virtual void close() = 0;
    virtual bool is_closed() const = 0;

protected:
    virtual Result<void> request_resize(int rows, int cols) = 0;

    void touch();
    void set_last_activity(Clock::time_point t);

private:
    std::string id_;
    std::string host_id_;
    Clock::time_point created_at_;
    std::atomic<int> rows_;
    std::atomic<int> cols_;
    mutable std::mutex activity_mutex_;
    Clock::time_point last_activity_;
};

struct SessionOptions {
    std::string term = DEFAULT_TERM;
    int write_wait_ms = SESSION_WRITE_WAIT_MS;
};

// SshSession: a pty shell channel on an owned RemoteConnection.
//
// A reader thread drains stdout and stderr into buffers and signals a
// condition variable; read() waits on it. Teardown runs through the
// session's CancelScope: reader stop, input EOF, channel close/free,
// then the connection.
class SshSession : public Session {
public:
    static Result<std::shared_ptr<SshSession>> open(std::unique_ptr<RemoteConnection> conn,
                                                   const std::string& host_id,
                                                   int rows, int cols,
                                                   const SessionOptions& opts = {});
    ~SshSession() override;

    Result<size_t> write(const std::string& data) override;
    ReadResult read(std::chrono::milliseconds timeout) override;
    ReadResult read_error(std::chrono::milliseconds timeout) override;
    void close() override;
    bool is_closed() const override;

protected:
    Result<void> request_resize(int rows, int cols) override;

private:
    SshSession(std::unique_ptr<RemoteConnection> conn, LIBSSH2_CHANNEL* channel,
               const std::string& host_id, int rows, int cols, const SessionOptions& opts);

    struct Stream {
        std::string buf;
        bool eof = false;
    };

    void start_reader();
    void reader_loop();
    ReadResult take(Stream& s, std::chrono::milliseconds timeout);

    std::unique_ptr<RemoteConnection> conn_;
    LIBSSH2_CHANNEL* channel_;
    std::shared_ptr<std::mutex> io_mutex_;
    SessionOptions opts_;

    std::mutex buf_mutex_;
    std::condition_variable buf_cv_;
    Stream out_;
    Stream err_;

    std::mutex write_mutex_;   // writes apply in call order
    std::atomic<bool> running_{false};
    std::atomic<bool> closed_{false};
    std::thread reader_;
    CancelScope scope_;
};
