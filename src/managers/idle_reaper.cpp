#include "idle_reaper.hpp"
#include <ssh/session_registry.hpp>
#include <core/log.hpp>
#include <fmt/format.h>

// ── Construction / Destruction ──────────────────────────────

IdleReaper::IdleReaper(SessionRegistry& registry, std::chrono::milliseconds max_idle,
                       std::chrono::milliseconds interval)
    : registry_(registry), max_idle_(max_idle), interval_(interval) {}

IdleReaper::~IdleReaper() {
    stop();
}

// ── Lifecycle ───────────────────────────────────────────────

bool IdleReaper::start() {
    if (running_) return true;
    if (interval_.count() <= 0) {
        remops_log("idle_reaper: non-positive interval, not starting");
        return false;
    }

    reaped_ = 0;
    running_ = true;
    thread_ = std::thread(&IdleReaper::reaper_loop, this);
    remops_log(fmt::format("idle_reaper: started (max idle {}ms, every {}ms)",
                           max_idle_.count(), interval_.count()));
    return true;
}

void IdleReaper::stop() {
    if (!running_) return;

    {
        std::lock_guard<std::mutex> lock(wake_mutex_);
        running_ = false;
    }
    wake_cv_.notify_all();
    if (thread_.joinable()) {
        thread_.join();
    }
    remops_log("idle_reaper: stopped");
}

// ── Reaper loop ─────────────────────────────────────────────

void IdleReaper::reaper_loop() {
    while (running_) {
        {
            std::unique_lock<std::mutex> lock(wake_mutex_);
            wake_cv_.wait_for(lock, interval_, [this] { return !running_; });
        }
        if (!running_) break;

        size_t n = registry_.reap_idle(max_idle_);
        if (n > 0) {
            reaped_ += n;
            remops_log(fmt::format("idle_reaper: reaped {} session(s), {} live",
                                   n, registry_.size()));
        }
    }
}
