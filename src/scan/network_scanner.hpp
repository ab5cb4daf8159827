#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include <core/types.hpp>
#include <core/cancel_token.hpp>
#include "prober.hpp"

struct ScanStats {
    size_t total = 0;           // probes planned
    size_t launched = 0;
    size_t completed = 0;
    size_t forwarded = 0;       // results delivered to the stream
    size_t peak_in_flight = 0;
};

// ScanHandle: the incremental result stream of one scan.
//
// Workers push results as probes finish. The stream closes once every
// worker has exited; next() then drains what is left and returns false.
// Destroying the handle abandons the scan and joins the workers.
class ScanHandle {
public:
    ~ScanHandle();

    ScanHandle(const ScanHandle&) = delete;
    ScanHandle& operator=(const ScanHandle&) = delete;

    // Block until a result is available or the stream is closed and empty.
    bool next(DiscoveredHost& out);

    // Non-blocking variant.
    bool try_next(DiscoveredHost& out);

    // Every worker has finished.
    bool closed() const;

    // Block until closed, then join the workers.
    void wait();

    ScanStats stats() const;

private:
    friend class NetworkScanner;

    ScanHandle(std::shared_ptr<Prober> prober, std::vector<std::string> addresses,
               std::vector<int> ports, std::chrono::milliseconds timeout,
               CancelToken cancel);

    void start(size_t workers);
    void worker_loop();
    bool stopping() const;

    std::shared_ptr<Prober> prober_;
    std::vector<std::string> addresses_;
    std::vector<int> ports_;
    std::chrono::milliseconds timeout_;
    CancelToken cancel_;
    std::atomic<bool> abandoned_{false};

    std::atomic<size_t> cursor_{0};
    std::atomic<size_t> in_flight_{0};
    std::atomic<size_t> peak_in_flight_{0};
    std::atomic<size_t> launched_{0};
    std::atomic<size_t> completed_{0};

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<DiscoveredHost> results_;
    size_t forwarded_ = 0;
    size_t active_workers_ = 0;
    bool closed_ = false;

    std::vector<std::thread> workers_;
};

// NetworkScanner: bounded-concurrency discovery of SSH hosts.
class NetworkScanner {
public:
    explicit NetworkScanner(std::shared_ptr<Prober> prober);

    // Start scanning range x ports with exactly max_concurrency workers
    // (fewer when there are fewer probes). Returns immediately. A malformed
    // range or port list fails here, never per probe. Cancelling the token
    // stops new probes; results of probes still in flight are dropped.
    Result<std::shared_ptr<ScanHandle>> scan(const std::string& range,
                                             std::vector<int> ports,
                                             std::chrono::milliseconds per_probe_timeout,
                                             int max_concurrency,
                                             CancelToken cancel = CancelToken());

private:
    std::shared_ptr<Prober> prober_;
};
