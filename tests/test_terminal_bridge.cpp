#include <gtest/gtest.h>
#include <protocol/terminal_bridge.hpp>
#include <nlohmann/json.hpp>
#include "fake_session.hpp"
#include <thread>

using json = nlohmann::json;
using namespace std::chrono_literals;

namespace {

// Collects frames the bridge sends, for inspection from the test thread.
struct FrameLog {
    std::mutex mutex;
    std::condition_variable cv;
    std::vector<json> frames;

    FrameSink sink() {
        return [this](const std::string& text) {
            {
                std::lock_guard<std::mutex> lock(mutex);
                frames.push_back(json::parse(text));
            }
            cv.notify_all();
        };
    }

    // Wait until a frame of the given type shows up.
    bool wait_for(const std::string& type, std::chrono::milliseconds timeout = 2s) {
        std::unique_lock<std::mutex> lock(mutex);
        return cv.wait_for(lock, timeout, [&] {
            for (const auto& f : frames) {
                if (f["type"] == type) return true;
            }
            return false;
        });
    }

    std::vector<json> of_type(const std::string& type) {
        std::lock_guard<std::mutex> lock(mutex);
        std::vector<json> out;
        for (const auto& f : frames) {
            if (f["type"] == type) out.push_back(f);
        }
        return out;
    }
};

ConnectRequest request_for(const std::string& host) {
    ConnectRequest r;
    r.host_id = host;
    r.password = "pw";
    r.rows = 30;
    r.cols = 100;
    return r;
}

}  // namespace

TEST(TerminalBridge, OpenEmitsConnected) {
    FakeFactory factory;
    SessionRegistry reg(factory.make());
    FrameLog log;
    TerminalBridge bridge(reg, log.sink(), 5);

    auto id = bridge.open(request_for("web-1"), ConnectDefaults{});
    ASSERT_TRUE(id.is_ok()) << id.error;
    ASSERT_TRUE(log.wait_for("connected"));
    EXPECT_EQ(log.of_type("connected")[0]["sessionId"], id.value);
    EXPECT_TRUE(bridge.running());
    EXPECT_NE(reg.get(id.value), nullptr);

    auto s = factory.last();
    EXPECT_EQ(s->rows(), 30);
    EXPECT_EQ(s->cols(), 100);
    bridge.stop();
}

TEST(TerminalBridge, OpenFailureEmitsError) {
    FakeFactory factory;
    factory.fail = true;
    SessionRegistry reg(factory.make());
    FrameLog log;
    TerminalBridge bridge(reg, log.sink(), 5);

    auto id = bridge.open(request_for("down-host"), ConnectDefaults{});
    EXPECT_TRUE(id.is_err());
    auto errors = log.of_type("error");
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0]["message"], "SSH connection failed");
    EXPECT_NE(errors[0]["error"].get<std::string>().find("refused"), std::string::npos);
    EXPECT_FALSE(bridge.running());
    bridge.wait();
}

TEST(TerminalBridge, ForwardsOutput) {
    FakeFactory factory;
    SessionRegistry reg(factory.make());
    FrameLog log;
    TerminalBridge bridge(reg, log.sink(), 5);
    ASSERT_TRUE(bridge.open(request_for("web-1"), ConnectDefaults{}).is_ok());

    factory.last()->push_output("Welcome\r\n$ ");
    ASSERT_TRUE(log.wait_for("output"));
    EXPECT_EQ(log.of_type("output")[0]["data"], "Welcome\r\n$ ");
    bridge.stop();
}

TEST(TerminalBridge, InputIsWrittenInOrder) {
    FakeFactory factory;
    SessionRegistry reg(factory.make());
    FrameLog log;
    TerminalBridge bridge(reg, log.sink(), 5);
    ASSERT_TRUE(bridge.open(request_for("web-1"), ConnectDefaults{}).is_ok());
    factory.last()->limit_writes(3);

    ASSERT_TRUE(bridge.on_frame(R"({"type":"input","data":"echo hi\r"})").is_ok());
    ASSERT_TRUE(bridge.on_frame(R"({"type":"input","data":"exit\r"})").is_ok());
    EXPECT_EQ(factory.last()->written(), "echo hi\rexit\r");
    bridge.stop();
}

TEST(TerminalBridge, ResizeUpdatesSession) {
    FakeFactory factory;
    SessionRegistry reg(factory.make());
    FrameLog log;
    TerminalBridge bridge(reg, log.sink(), 5);
    ASSERT_TRUE(bridge.open(request_for("web-1"), ConnectDefaults{}).is_ok());

    ASSERT_TRUE(bridge.on_frame(R"({"type":"resize","rows":60,"cols":200})").is_ok());
    EXPECT_EQ(factory.last()->rows(), 60);
    EXPECT_EQ(factory.last()->cols(), 200);

    // A failed pty request is reported but the bridge keeps going.
    factory.last()->fail_resize(true);
    EXPECT_TRUE(bridge.on_frame(R"({"type":"resize","rows":10,"cols":20})").is_err());
    EXPECT_EQ(factory.last()->rows(), 10);
    EXPECT_TRUE(bridge.running());
    bridge.stop();
}

TEST(TerminalBridge, PingGetsPong) {
    FakeFactory factory;
    SessionRegistry reg(factory.make());
    FrameLog log;
    TerminalBridge bridge(reg, log.sink(), 5);
    ASSERT_TRUE(bridge.open(request_for("web-1"), ConnectDefaults{}).is_ok());

    ASSERT_TRUE(bridge.on_frame(R"({"type":"ping"})").is_ok());
    EXPECT_EQ(log.of_type("pong").size(), 1u);
    ASSERT_TRUE(bridge.on_frame(R"({"type":"pong"})").is_ok());
    EXPECT_EQ(log.of_type("pong").size(), 1u);
    bridge.stop();
}

TEST(TerminalBridge, MalformedFrameIsNotFatal) {
    FakeFactory factory;
    SessionRegistry reg(factory.make());
    FrameLog log;
    TerminalBridge bridge(reg, log.sink(), 5);
    ASSERT_TRUE(bridge.open(request_for("web-1"), ConnectDefaults{}).is_ok());

    auto r = bridge.on_frame("{nope");
    EXPECT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::Protocol);
    EXPECT_TRUE(bridge.running());

    auto wrong_way = bridge.on_frame(R"({"type":"output","data":"x"})");
    EXPECT_EQ(wrong_way.kind, ErrorKind::Protocol);
    EXPECT_TRUE(bridge.running());

    ASSERT_TRUE(bridge.on_frame(R"({"type":"input","data":"ok\r"})").is_ok());
    EXPECT_EQ(factory.last()->written(), "ok\r");
    bridge.stop();
}

TEST(TerminalBridge, RemoteExitEmitsErrorAndUnregisters) {
    FakeFactory factory;
    SessionRegistry reg(factory.make());
    FrameLog log;
    TerminalBridge bridge(reg, log.sink(), 5);
    auto id = bridge.open(request_for("web-1"), ConnectDefaults{});
    ASSERT_TRUE(id.is_ok());

    factory.last()->finish();
    bridge.wait();

    EXPECT_FALSE(bridge.running());
    EXPECT_EQ(log.of_type("error").size(), 1u);
    EXPECT_EQ(reg.get(id.value), nullptr);
    EXPECT_TRUE(factory.last()->is_closed());

    auto late = bridge.on_frame(R"({"type":"input","data":"x"})");
    EXPECT_EQ(late.kind, ErrorKind::NotFound);
}

TEST(TerminalBridge, WriteFailureEndsBridge) {
    FakeFactory factory;
    SessionRegistry reg(factory.make());
    FrameLog log;
    TerminalBridge bridge(reg, log.sink(), 5);
    ASSERT_TRUE(bridge.open(request_for("web-1"), ConnectDefaults{}).is_ok());

    factory.last()->fail_writes(true);
    EXPECT_TRUE(bridge.on_frame(R"({"type":"input","data":"x"})").is_err());
    bridge.wait();
    EXPECT_FALSE(bridge.running());
    EXPECT_EQ(reg.size(), 0u);
}

TEST(TerminalBridge, WriteTimeoutKeepsSessionOpen) {
    FakeFactory factory;
    SessionRegistry reg(factory.make());
    FrameLog log;
    TerminalBridge bridge(reg, log.sink(), 5);
    auto id = bridge.open(request_for("web-1"), ConnectDefaults{});
    ASSERT_TRUE(id.is_ok());

    factory.last()->stall_writes(true);
    auto r = bridge.on_frame(R"({"type":"input","data":"x"})");
    EXPECT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::Timeout);
    EXPECT_TRUE(bridge.running());
    EXPECT_EQ(reg.size(), 1u);
    EXPECT_FALSE(factory.last()->is_closed());
    EXPECT_TRUE(log.of_type("error").empty());

    factory.last()->stall_writes(false);
    ASSERT_TRUE(bridge.on_frame(R"({"type":"input","data":"y"})").is_ok());
    EXPECT_EQ(factory.last()->written(), "y");
    bridge.stop();
}

TEST(TerminalBridge, StopClosesThroughRegistry) {
    FakeFactory factory;
    SessionRegistry reg(factory.make());
    FrameLog log;
    auto bridge = std::make_unique<TerminalBridge>(reg, log.sink(), 5);
    auto id = bridge->open(request_for("web-1"), ConnectDefaults{});
    ASSERT_TRUE(id.is_ok());

    bridge->stop();
    EXPECT_EQ(reg.get(id.value), nullptr);
    EXPECT_TRUE(factory.last()->is_closed());
    // A requested stop is not an error the peer needs to hear about.
    EXPECT_TRUE(log.of_type("error").empty());
    bridge.reset();
}

TEST(TerminalBridge, ReapedSessionEndsBridge) {
    FakeFactory factory;
    SessionRegistry reg(factory.make());
    FrameLog log;
    TerminalBridge bridge(reg, log.sink(), 5);
    ASSERT_TRUE(bridge.open(request_for("web-1"), ConnectDefaults{}).is_ok());

    factory.last()->age(1h);
    EXPECT_EQ(reg.reap_idle(30min), 1u);
    bridge.wait();
    EXPECT_FALSE(bridge.running());
}
