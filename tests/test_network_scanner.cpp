#include <gtest/gtest.h>
#include <scan/network_scanner.hpp>
#include <algorithm>
#include <atomic>
#include <map>
#include <thread>

namespace {

// Answers Success for the listed addresses, Timeout for everything else,
// after sleeping delay. Tracks how many probes run at once.
class FakeProber : public Prober {
public:
    FakeProber(std::vector<std::string> ssh_hosts, std::chrono::milliseconds delay)
        : ssh_hosts_(std::move(ssh_hosts)), delay_(delay) {}

    DiscoveredHost probe(const std::string& address, int port,
                         std::chrono::milliseconds) override {
        int now = ++in_flight_;
        int peak = peak_.load();
        while (now > peak && !peak_.compare_exchange_weak(peak, now)) {}
        ++calls_;

        std::this_thread::sleep_for(delay_);

        DiscoveredHost h;
        h.address = address;
        h.port = port;
        if (std::find(ssh_hosts_.begin(), ssh_hosts_.end(), address) != ssh_hosts_.end()) {
            h.status = HostStatus::Success;
            h.os = "OpenSSH_9.6";
        } else {
            h.status = HostStatus::Timeout;
        }
        --in_flight_;
        return h;
    }

    int peak() const { return peak_; }
    int calls() const { return calls_; }

private:
    std::vector<std::string> ssh_hosts_;
    std::chrono::milliseconds delay_;
    std::atomic<int> in_flight_{0};
    std::atomic<int> peak_{0};
    std::atomic<int> calls_{0};
};

std::vector<DiscoveredHost> drain(ScanHandle& h) {
    std::vector<DiscoveredHost> out;
    DiscoveredHost host;
    while (h.next(host)) out.push_back(host);
    return out;
}

}  // namespace

TEST(NetworkScanner, Slash30WithOneSshHost) {
    auto prober = std::make_shared<FakeProber>(std::vector<std::string>{"10.0.0.2"},
                                               std::chrono::milliseconds(5));
    NetworkScanner scanner(prober);
    auto handle = scanner.scan("10.0.0.0/30", {22}, std::chrono::seconds(1), 2);
    ASSERT_TRUE(handle.is_ok()) << handle.error;

    auto results = drain(*handle.value);
    ASSERT_EQ(results.size(), 4u);

    int success = 0;
    for (const auto& r : results) {
        EXPECT_EQ(r.port, 22);
        if (r.status == HostStatus::Success) {
            ++success;
            EXPECT_EQ(r.address, "10.0.0.2");
            EXPECT_EQ(r.os.value_or(""), "OpenSSH_9.6");
        } else {
            EXPECT_TRUE(r.status == HostStatus::Timeout || r.status == HostStatus::Error);
        }
    }
    EXPECT_EQ(success, 1);
    EXPECT_TRUE(handle.value->closed());
}

TEST(NetworkScanner, NeverExceedsConcurrencyLimit) {
    auto prober = std::make_shared<FakeProber>(std::vector<std::string>{},
                                               std::chrono::milliseconds(10));
    NetworkScanner scanner(prober);
    auto handle = scanner.scan("10.0.0.0/26", {22}, std::chrono::seconds(1), 5);
    ASSERT_TRUE(handle.is_ok());

    auto results = drain(*handle.value);
    EXPECT_EQ(results.size(), 64u);
    EXPECT_LE(prober->peak(), 5);
    EXPECT_LE(handle.value->stats().peak_in_flight, 5u);
    EXPECT_EQ(handle.value->stats().completed, 64u);
}

TEST(NetworkScanner, EveryAddressPortPairProbedOnce) {
    auto prober = std::make_shared<FakeProber>(std::vector<std::string>{},
                                               std::chrono::milliseconds(0));
    NetworkScanner scanner(prober);
    auto handle = scanner.scan("192.168.5.0/29", {22, 2222}, std::chrono::seconds(1), 3);
    ASSERT_TRUE(handle.is_ok());

    std::map<std::pair<std::string, int>, int> seen;
    for (const auto& r : drain(*handle.value)) seen[{r.address, r.port}]++;
    EXPECT_EQ(seen.size(), 16u);
    for (const auto& kv : seen) EXPECT_EQ(kv.second, 1);
}

TEST(NetworkScanner, DefaultsToPort22) {
    auto prober = std::make_shared<FakeProber>(std::vector<std::string>{"10.9.9.9"},
                                               std::chrono::milliseconds(0));
    NetworkScanner scanner(prober);
    auto handle = scanner.scan("10.9.9.9", {}, std::chrono::milliseconds(0), 0);
    ASSERT_TRUE(handle.is_ok());
    auto results = drain(*handle.value);
    ASSERT_EQ(results.size(), 1u);
    EXPECT_EQ(results[0].port, 22);
    EXPECT_EQ(results[0].status, HostStatus::Success);
}

TEST(NetworkScanner, MalformedRangeFailsUpFront) {
    auto prober = std::make_shared<FakeProber>(std::vector<std::string>{},
                                               std::chrono::milliseconds(0));
    NetworkScanner scanner(prober);
    auto handle = scanner.scan("10.0.0.0/40", {22}, std::chrono::seconds(1), 4);
    EXPECT_TRUE(handle.is_err());
    EXPECT_EQ(handle.kind, ErrorKind::Resource);
    EXPECT_EQ(prober->calls(), 0);
}

TEST(NetworkScanner, InvalidPortFailsUpFront) {
    auto prober = std::make_shared<FakeProber>(std::vector<std::string>{},
                                               std::chrono::milliseconds(0));
    NetworkScanner scanner(prober);
    auto handle = scanner.scan("10.0.0.1", {70000}, std::chrono::seconds(1), 4);
    EXPECT_TRUE(handle.is_err());
    EXPECT_EQ(prober->calls(), 0);
}

TEST(NetworkScanner, CancelStopsLaunchingProbes) {
    auto prober = std::make_shared<FakeProber>(std::vector<std::string>{},
                                               std::chrono::milliseconds(20));
    NetworkScanner scanner(prober);
    CancelToken cancel;
    auto handle = scanner.scan("10.0.0.0/22", {22}, std::chrono::seconds(1), 4, cancel);
    ASSERT_TRUE(handle.is_ok());

    DiscoveredHost first;
    ASSERT_TRUE(handle.value->next(first));
    cancel.cancel();

    auto rest = drain(*handle.value);
    handle.value->wait();
    EXPECT_TRUE(handle.value->closed());
    EXPECT_LT(handle.value->stats().launched, 1024u);
    EXPECT_LT(rest.size() + 1, 1024u);
}

TEST(NetworkScanner, DroppingHandleAbandonsScan) {
    auto prober = std::make_shared<FakeProber>(std::vector<std::string>{},
                                               std::chrono::milliseconds(5));
    NetworkScanner scanner(prober);
    {
        auto handle = scanner.scan("10.0.0.0/24", {22}, std::chrono::seconds(1), 2);
        ASSERT_TRUE(handle.is_ok());
    }
    EXPECT_LT(prober->calls(), 256);
}
