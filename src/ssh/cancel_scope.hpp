#pragma once

#include <condition_variable>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

// CancelScope: ordered teardown for everything a Session owns.
//
// Resources register a release action with defer() as they are acquired.
// cancel() runs the actions once, newest first, so teardown mirrors setup.
// A concurrent cancel() blocks until the first one has finished. Deferring
// after cancellation runs the action immediately.
class CancelScope {
public:
    CancelScope() = default;
    ~CancelScope();

    CancelScope(const CancelScope&) = delete;
    CancelScope& operator=(const CancelScope&) = delete;

    void defer(std::function<void()> release);
    void cancel();
    bool cancelled() const;

private:
    mutable std::mutex mutex_;
    std::vector<std::function<void()>> releases_;
    std::condition_variable done_cv_;
    std::thread::id runner_;
    bool fired_ = false;
    bool done_ = false;
};
