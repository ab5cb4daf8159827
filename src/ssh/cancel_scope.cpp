#include "cancel_scope.hpp"

CancelScope::~CancelScope() {
    cancel();
}

void CancelScope::defer(std::function<void()> release) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!fired_) {
            releases_.push_back(std::move(release));
            return;
        }
    }
    release();
}

void CancelScope::cancel() {
    std::vector<std::function<void()>> pending;
    {
        std::unique_lock<std::mutex> lock(mutex_);
        if (fired_) {
            // Re-entry from a release action on the runner thread
            if (runner_ == std::this_thread::get_id()) return;
            done_cv_.wait(lock, [this] { return done_; });
            return;
        }
        fired_ = true;
        runner_ = std::this_thread::get_id();
        pending.swap(releases_);
    }

    // Run outside the lock: releases may block on I/O or join threads.
    for (auto it = pending.rbegin(); it != pending.rend(); ++it) {
        (*it)();
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        done_ = true;
    }
    done_cv_.notify_all();
}

bool CancelScope::cancelled() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return fired_;
}
