#pragma once

#include <ssh/session.hpp>
#include <ssh/session_registry.hpp>
#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <string>
#include <vector>

// In-memory Session for registry, bridge and reaper tests.
class FakeSession : public Session {
public:
    FakeSession(const std::string& host_id, int rows = DEFAULT_ROWS, int cols = DEFAULT_COLS)
        : Session(make_session_id(host_id), host_id, rows, cols) {}

    FakeSession(const std::string& id, const std::string& host_id)
        : Session(id, host_id, DEFAULT_ROWS, DEFAULT_COLS) {}

    Result<size_t> write(const std::string& data) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) return Result<size_t>::Err(ErrorKind::Connection, "closed");
        if (fail_writes_) return Result<size_t>::Err(ErrorKind::Connection, "broken pipe");
        if (stall_writes_) return Result<size_t>::Err(ErrorKind::Timeout, "write wait elapsed");
        touch();
        size_t n = max_write_ > 0 ? std::min(max_write_, data.size()) : data.size();
        written_ += data.substr(0, n);
        return Result<size_t>::Ok(n);
    }

    ReadResult read(std::chrono::milliseconds timeout) override {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait_for(lock, timeout, [this] { return closed_ || eof_ || !output_.empty(); });
        if (closed_) return ReadResult::eof();
        if (!output_.empty()) {
            std::string d = std::move(output_.front());
            output_.pop_front();
            touch();
            return ReadResult::make_data(std::move(d));
        }
        if (eof_) return ReadResult::eof();
        return ReadResult::no_data();
    }

    ReadResult read_error(std::chrono::milliseconds) override {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_ ? ReadResult::eof() : ReadResult::no_data();
    }

    void close() override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!closed_) ++close_calls_;
            closed_ = true;
        }
        cv_.notify_all();
    }

    bool is_closed() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    // ── Test controls ──

    void push_output(const std::string& data) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            output_.push_back(data);
        }
        cv_.notify_all();
    }

    // Remote shell exits.
    void finish() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            eof_ = true;
        }
        cv_.notify_all();
    }

    void age(std::chrono::milliseconds by) { set_last_activity(Clock::now() - by); }
    void set_activity(Clock::time_point t) { set_last_activity(t); }

    void fail_resize(bool v) { fail_resize_ = v; }
    void fail_writes(bool v) { fail_writes_ = v; }
    void limit_writes(size_t n) { max_write_ = n; }
    void stall_writes(bool v) { stall_writes_ = v; }

    std::string written() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return written_;
    }
    int close_calls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return close_calls_;
    }
    int resize_requests() const { return resize_requests_; }

protected:
    Result<void> request_resize(int, int) override {
        ++resize_requests_;
        if (fail_resize_) return Result<void>::Err(ErrorKind::Connection, "pty request rejected");
        return Result<void>::Ok();
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<std::string> output_;
    std::string written_;
    bool closed_ = false;
    bool eof_ = false;
    int close_calls_ = 0;
    std::atomic<int> resize_requests_{0};
    std::atomic<bool> fail_resize_{false};
    std::atomic<bool> fail_writes_{false};
    std::atomic<bool> stall_writes_{false};
    size_t max_write_ = 0;
};

// Factory that hands out FakeSessions and remembers them.
struct FakeFactory {
    std::mutex mutex;
    std::vector<std::shared_ptr<FakeSession>> made;
    std::vector<ConnectParams> params;
    bool fail = false;

    SessionFactory make() {
        return [this](const ConnectParams& p, int rows, int cols) -> Result<std::shared_ptr<Session>> {
            std::lock_guard<std::mutex> lock(mutex);
            params.push_back(p);
            if (fail) {
                return Result<std::shared_ptr<Session>>::Err(ErrorKind::Connection,
                    "connect " + p.host_id + ": connection refused");
            }
            auto s = std::make_shared<FakeSession>(p.host_id, rows, cols);
            made.push_back(s);
            return Result<std::shared_ptr<Session>>::Ok(s);
        };
    }

    std::shared_ptr<FakeSession> last() {
        std::lock_guard<std::mutex> lock(mutex);
        return made.empty() ? nullptr : made.back();
    }
};

inline ConnectParams fake_params(const std::string& host_id) {
    ConnectParams p;
    p.host_id = host_id;
    p.address = "192.0.2.1";
    p.password = "pw";
    return p;
}
