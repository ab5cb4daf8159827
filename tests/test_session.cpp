#include <gtest/gtest.h>
#include <ssh/cancel_scope.hpp>
#include <managers/idle_reaper.hpp>
#include "fake_session.hpp"
#include <algorithm>
#include <atomic>
#include <thread>

using namespace std::chrono_literals;

// ── Session ids ─────────────────────────────────────────────

TEST(SessionId, PrefixedWithHost) {
    std::string id = make_session_id("db-7");
    ASSERT_GT(id.size(), 5u);
    EXPECT_EQ(id.substr(0, 5), "db-7-");
    EXPECT_EQ(id.substr(5).find_first_not_of("0123456789"), std::string::npos);
}

TEST(SessionId, StrictlyIncreasingAcrossThreads) {
    std::vector<std::vector<long long>> per_thread(4);
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&per_thread, t] {
            for (int i = 0; i < 500; ++i) {
                std::string id = make_session_id("h");
                per_thread[t].push_back(std::stoll(id.substr(2)));
            }
        });
    }
    for (auto& th : threads) th.join();

    std::vector<long long> all;
    for (const auto& v : per_thread) {
        for (size_t i = 1; i < v.size(); ++i) EXPECT_LT(v[i - 1], v[i]);
        all.insert(all.end(), v.begin(), v.end());
    }
    std::sort(all.begin(), all.end());
    EXPECT_EQ(std::adjacent_find(all.begin(), all.end()), all.end());
}

// ── Resize ──────────────────────────────────────────────────

TEST(SessionResize, StoresDimensions) {
    FakeSession s("term-host");
    ASSERT_TRUE(s.resize(50, 200).is_ok());
    EXPECT_EQ(s.rows(), 50);
    EXPECT_EQ(s.cols(), 200);
    EXPECT_EQ(s.resize_requests(), 1);
}

TEST(SessionResize, DimensionsUpdatedEvenWhenRequestFails) {
    FakeSession s("term-host");
    s.fail_resize(true);
    auto r = s.resize(33, 99);
    EXPECT_TRUE(r.is_err());
    EXPECT_EQ(s.rows(), 33);
    EXPECT_EQ(s.cols(), 99);
}

TEST(SessionResize, RejectsNonPositive) {
    FakeSession s("term-host", 24, 80);
    auto r = s.resize(0, 80);
    EXPECT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::Resource);
    EXPECT_EQ(s.rows(), 24);
    EXPECT_EQ(s.resize_requests(), 0);
}

// ── CancelScope ─────────────────────────────────────────────

TEST(CancelScope, RunsNewestFirst) {
    std::vector<std::string> order;
    CancelScope scope;
    scope.defer([&] { order.push_back("connection"); });
    scope.defer([&] { order.push_back("shell"); });
    scope.defer([&] { order.push_back("input"); });
    scope.cancel();

    std::vector<std::string> want{"input", "shell", "connection"};
    EXPECT_EQ(order, want);
    EXPECT_TRUE(scope.cancelled());
}

TEST(CancelScope, RunsOnlyOnce) {
    int runs = 0;
    CancelScope scope;
    scope.defer([&] { ++runs; });
    scope.cancel();
    scope.cancel();
    EXPECT_EQ(runs, 1);
}

TEST(CancelScope, DeferAfterCancelRunsImmediately) {
    CancelScope scope;
    scope.cancel();
    bool ran = false;
    scope.defer([&] { ran = true; });
    EXPECT_TRUE(ran);
}

TEST(CancelScope, DestructorCancels) {
    bool ran = false;
    {
        CancelScope scope;
        scope.defer([&] { ran = true; });
    }
    EXPECT_TRUE(ran);
}

TEST(CancelScope, ConcurrentCancelWaitsForTeardown) {
    std::atomic<bool> finished{false};
    CancelScope scope;
    scope.defer([&] {
        std::this_thread::sleep_for(50ms);
        finished = true;
    });

    std::thread first([&] { scope.cancel(); });
    std::this_thread::sleep_for(10ms);
    scope.cancel();
    // The second caller must not observe a half-finished teardown.
    EXPECT_TRUE(finished.load());
    first.join();
}

TEST(CancelScope, ReentrantCancelFromReleaseDoesNotDeadlock) {
    CancelScope scope;
    int runs = 0;
    scope.defer([&] { ++runs; });
    scope.defer([&] { scope.cancel(); ++runs; });
    scope.cancel();
    EXPECT_EQ(runs, 2);
}

// ── IdleReaper ──────────────────────────────────────────────

TEST(IdleReaper, ReapsIdleSessionsInBackground) {
    FakeFactory factory;
    SessionRegistry reg(factory.make());
    ASSERT_TRUE(reg.create(fake_params("idle")).is_ok());
    ASSERT_TRUE(reg.create(fake_params("busy")).is_ok());
    factory.made[0]->age(1h);

    IdleReaper reaper(reg, 10min, 10ms);
    ASSERT_TRUE(reaper.start());
    for (int i = 0; i < 200 && reaper.reaped() == 0; ++i) std::this_thread::sleep_for(5ms);
    reaper.stop();

    EXPECT_EQ(reaper.reaped(), 1u);
    EXPECT_TRUE(factory.made[0]->is_closed());
    EXPECT_FALSE(factory.made[1]->is_closed());
    EXPECT_EQ(reg.size(), 1u);
}

TEST(IdleReaper, RefusesNonPositiveInterval) {
    FakeFactory factory;
    SessionRegistry reg(factory.make());
    IdleReaper reaper(reg, 1min, 0ms);
    EXPECT_FALSE(reaper.start());
    EXPECT_FALSE(reaper.is_running());
}

TEST(IdleReaper, StopIsPrompt) {
    FakeFactory factory;
    SessionRegistry reg(factory.make());
    IdleReaper reaper(reg, 1min, 1h);
    ASSERT_TRUE(reaper.start());
    auto t0 = Clock::now();
    reaper.stop();
    EXPECT_LT(Clock::now() - t0, 1s);
    EXPECT_FALSE(reaper.is_running());
}
