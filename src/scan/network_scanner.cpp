#include "network_scanner.hpp"
#include "address_range.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <algorithm>
#include <fmt/format.h>

// ── NetworkScanner ──────────────────────────────────────────

NetworkScanner::NetworkScanner(std::shared_ptr<Prober> prober)
    : prober_(std::move(prober)) {}

Result<std::shared_ptr<ScanHandle>> NetworkScanner::scan(const std::string& range,
                                                         std::vector<int> ports,
                                                         std::chrono::milliseconds per_probe_timeout,
                                                         int max_concurrency,
                                                         CancelToken cancel) {
    using R = Result<std::shared_ptr<ScanHandle>>;
    if (!prober_) return R::Err(ErrorKind::Resource, "scan: no prober configured");

    auto addresses = expand_address_range(range);
    if (addresses.is_err()) {
        return R::Err(addresses.kind, error_context("scan", range, addresses.error));
    }

    if (ports.empty()) ports.push_back(DEFAULT_SSH_PORT);
    for (int p : ports) {
        if (p <= 0 || p > 65535) {
            return R::Err(ErrorKind::Resource,
                          error_context("scan", range, fmt::format("invalid port {}", p)));
        }
    }
    if (per_probe_timeout.count() <= 0) per_probe_timeout = std::chrono::seconds(SCAN_TIMEOUT_SECS);
    if (max_concurrency <= 0) max_concurrency = SCAN_MAX_CONCURRENCY;

    size_t total = addresses.value.size() * ports.size();
    size_t workers = std::min(static_cast<size_t>(max_concurrency), total);

    remops_log(fmt::format("scan {}: {} address(es) x {} port(s), {} worker(s), timeout {}ms",
                           range, addresses.value.size(), ports.size(), workers,
                           per_probe_timeout.count()));

    std::shared_ptr<ScanHandle> handle(new ScanHandle(prober_, std::move(addresses.value),
                                                      std::move(ports), per_probe_timeout,
                                                      std::move(cancel)));
    handle->start(workers);
    return R::Ok(std::move(handle));
}

// ── ScanHandle ──────────────────────────────────────────────

ScanHandle::ScanHandle(std::shared_ptr<Prober> prober, std::vector<std::string> addresses,
                       std::vector<int> ports, std::chrono::milliseconds timeout,
                       CancelToken cancel)
    : prober_(std::move(prober)), addresses_(std::move(addresses)), ports_(std::move(ports)),
      timeout_(timeout), cancel_(std::move(cancel)) {}

ScanHandle::~ScanHandle() {
    abandoned_ = true;
    for (auto& t : workers_) {
        if (t.joinable()) t.join();
    }
}

void ScanHandle::start(size_t workers) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        active_workers_ = workers;
        if (workers == 0) closed_ = true;
    }
    workers_.reserve(workers);
    for (size_t i = 0; i < workers; ++i) {
        workers_.emplace_back(&ScanHandle::worker_loop, this);
    }
}

bool ScanHandle::stopping() const {
    return abandoned_ || cancel_.is_cancelled();
}

void ScanHandle::worker_loop() {
    const size_t total = addresses_.size() * ports_.size();

    while (!stopping()) {
        size_t i = cursor_++;
        if (i >= total) break;
        const std::string& address = addresses_[i / ports_.size()];
        int port = ports_[i % ports_.size()];

        size_t now_in_flight = ++in_flight_;
        size_t peak = peak_in_flight_.load();
        while (now_in_flight > peak &&
               !peak_in_flight_.compare_exchange_weak(peak, now_in_flight)) {}
        ++launched_;

        DiscoveredHost host = prober_->probe(address, port, timeout_);

        --in_flight_;
        ++completed_;

        if (stopping()) break;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            results_.push_back(std::move(host));
            ++forwarded_;
        }
        cv_.notify_one();
    }

    bool last;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        last = (--active_workers_ == 0);
        if (last) closed_ = true;
    }
    if (last) {
        cv_.notify_all();
        remops_log(fmt::format("scan finished: {}/{} probes, {} result(s), peak {} in flight{}",
                               completed_.load(), total, forwarded_, peak_in_flight_.load(),
                               cancel_.is_cancelled() ? " (cancelled)" : ""));
    }
}

bool ScanHandle::next(DiscoveredHost& out) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] { return !results_.empty() || closed_; });
    if (results_.empty()) return false;
    out = std::move(results_.front());
    results_.pop_front();
    return true;
}

bool ScanHandle::try_next(DiscoveredHost& out) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (results_.empty()) return false;
    out = std::move(results_.front());
    results_.pop_front();
    return true;
}

bool ScanHandle::closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

void ScanHandle::wait() {
    {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return closed_; });
    }
    for (auto& t : workers_) {
        if (t.joinable()) t.join();
    }
}

ScanStats ScanHandle::stats() const {
    ScanStats s;
    s.total = addresses_.size() * ports_.size();
    s.launched = launched_;
    s.completed = completed_;
    s.peak_in_flight = peak_in_flight_;
    std::lock_guard<std::mutex> lock(mutex_);
    s.forwarded = forwarded_;
    return s;
}
