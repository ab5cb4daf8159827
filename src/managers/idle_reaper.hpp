#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <thread>

class SessionRegistry;

// IdleReaper: background thread that periodically closes idle sessions.
class IdleReaper {
public:
    IdleReaper(SessionRegistry& registry, std::chrono::milliseconds max_idle,
               std::chrono::milliseconds interval);
    ~IdleReaper();

    bool start();
    void stop();
    bool is_running() const { return running_; }

    // Total sessions reaped since start().
    size_t reaped() const { return reaped_; }

private:
    void reaper_loop();

    SessionRegistry& registry_;
    std::chrono::milliseconds max_idle_;
    std::chrono::milliseconds interval_;
    std::atomic<bool> running_{false};
    std::atomic<size_t> reaped_{0};
    std::thread thread_;

    std::mutex wake_mutex_;
    std::condition_variable wake_cv_;
};
