#include <gtest/gtest.h>
#include <ssh/command_client.hpp>
#include <ssh/file_transfer.hpp>
#include <ssh/process_client.hpp>
#include <ssh/session.hpp>
#include <core/utils.hpp>
#include <cstdlib>
#include <sstream>

// Live tests against a real SSH server. Set REMOPS_TEST_HOST (and
// REMOPS_TEST_USER / REMOPS_TEST_PASSWORD / REMOPS_TEST_PORT as needed) to
// run them; otherwise they are skipped.

using namespace std::chrono_literals;

namespace {

bool live_params(ConnectParams& p) {
    const char* host = std::getenv("REMOPS_TEST_HOST");
    if (!host || !*host) return false;
    p.host_id = host;
    p.address = host;
    if (const char* u = std::getenv("REMOPS_TEST_USER")) p.username = u;
    if (const char* pw = std::getenv("REMOPS_TEST_PASSWORD")) p.password = pw;
    if (const char* port = std::getenv("REMOPS_TEST_PORT")) p.port = safe_stoi(port, 22);
    p.timeout_secs = 10;
    return true;
}

}  // namespace

TEST(Integration, ExitCodeIsReported) {
    ConnectParams p;
    if (!live_params(p)) GTEST_SKIP() << "REMOPS_TEST_HOST not set";

    auto client = CommandClient::connect(p);
    ASSERT_TRUE(client.is_ok()) << client.error;

    auto ok = client.value->execute("echo hello", 10s);
    EXPECT_TRUE(ok.success()) << ok.error;
    EXPECT_EQ(ok.stdout_data, "hello\n");

    auto fail = client.value->execute("exit 1", 10s);
    ASSERT_TRUE(fail.exit_code.has_value());
    EXPECT_EQ(*fail.exit_code, 1);
    EXPECT_FALSE(fail.error.empty());
}

TEST(Integration, CommandTimesOut) {
    ConnectParams p;
    if (!live_params(p)) GTEST_SKIP() << "REMOPS_TEST_HOST not set";

    auto client = CommandClient::connect(p);
    ASSERT_TRUE(client.is_ok()) << client.error;

    auto t0 = Clock::now();
    auto out = client.value->execute("sleep 10", 2s);
    EXPECT_TRUE(out.timed_out());
    EXPECT_FALSE(out.exit_code.has_value());
    EXPECT_LT(Clock::now() - t0, 6s);

    // The connection survives a timed-out command.
    auto after = client.value->execute("true", 10s);
    EXPECT_TRUE(after.success()) << after.error;
}

TEST(Integration, TimedOutCommandsReleaseChannels) {
    ConnectParams p;
    if (!live_params(p)) GTEST_SKIP() << "REMOPS_TEST_HOST not set";

    auto client = CommandClient::connect(p);
    ASSERT_TRUE(client.is_ok()) << client.error;

    // More than the server's default MaxSessions (10): leaked channels
    // would make the last opens and the final command fail.
    for (int i = 0; i < 12; ++i) {
        auto out = client.value->execute("sleep 30", 300ms);
        EXPECT_TRUE(out.timed_out()) << "run " << i << ": " << out.error;
    }
    auto after = client.value->execute("echo ok", 10s);
    EXPECT_TRUE(after.success()) << after.error;
    EXPECT_EQ(after.stdout_data, "ok\n");
}

TEST(Integration, KeepaliveIsSent) {
    ConnectParams p;
    if (!live_params(p)) GTEST_SKIP() << "REMOPS_TEST_HOST not set";

    auto client = CommandClient::connect(p);
    ASSERT_TRUE(client.is_ok()) << client.error;

    auto next = client.value->connection().send_keepalive();
    ASSERT_TRUE(next.is_ok()) << next.error;
    EXPECT_GE(next.value, 0);
    EXPECT_LE(next.value, KEEPALIVE_INTERVAL_SECS);
}

TEST(Integration, SessionRoundTrip) {
    ConnectParams p;
    if (!live_params(p)) GTEST_SKIP() << "REMOPS_TEST_HOST not set";

    auto conn = RemoteConnection::open(p);
    ASSERT_TRUE(conn.is_ok()) << conn.error;
    auto opened = SshSession::open(std::move(conn.value), p.host_id, 24, 80);
    ASSERT_TRUE(opened.is_ok()) << opened.error;
    auto session = opened.value;

    // Drain banner and prompt until the shell goes quiet.
    auto deadline = Clock::now() + 5s;
    while (Clock::now() < deadline) {
        auto r = session->read(500ms);
        ASSERT_NE(r.status, ReadResult::Eof);
        if (r.status == ReadResult::NoData) break;
    }
    EXPECT_EQ(session->read(200ms).status, ReadResult::NoData);

    auto w = session->write("echo hi\n");
    ASSERT_TRUE(w.is_ok()) << w.error;
    EXPECT_EQ(w.value, 8u);

    std::string seen;
    deadline = Clock::now() + 5s;
    // The pty echoes the command line; wait for the output line itself.
    while (Clock::now() < deadline && seen.find("\nhi") == std::string::npos) {
        auto r = session->read(200ms);
        ASSERT_NE(r.status, ReadResult::Eof);
        if (r.status == ReadResult::Data) seen += r.data;
    }
    EXPECT_NE(seen.find("\nhi"), std::string::npos) << seen;

    ASSERT_TRUE(session->resize(40, 120).is_ok());
    EXPECT_EQ(session->rows(), 40);
    EXPECT_EQ(session->cols(), 120);

    session->close();
    session->close();
    EXPECT_TRUE(session->is_closed());
    EXPECT_EQ(session->read(10ms).status, ReadResult::Eof);
}

TEST(Integration, ProcessListAndKill) {
    ConnectParams p;
    if (!live_params(p)) GTEST_SKIP() << "REMOPS_TEST_HOST not set";

    auto client = CommandClient::connect(p);
    ASSERT_TRUE(client.is_ok()) << client.error;
    ProcessClient procs(*client.value);

    auto list = procs.list(5);
    ASSERT_TRUE(list.is_ok()) << list.error;
    EXPECT_FALSE(list.value.empty());
    EXPECT_LE(list.value.size(), 5u);

    auto started = client.value->execute("sleep 60 >/dev/null 2>&1 & echo $!", 10s);
    ASSERT_TRUE(started.success()) << started.error;
    int pid = safe_stoi(started.stdout_data, 0);
    ASSERT_GT(pid, 0);

    auto info = procs.get(pid);
    ASSERT_TRUE(info.is_ok()) << info.error;
    EXPECT_EQ(info.value.pid, pid);
    EXPECT_EQ(info.value.name, "sleep");

    ASSERT_TRUE(procs.kill(pid).is_ok());
    auto gone = client.value->execute(fmt::format("sleep 0.5; kill -0 {}", pid), 10s);
    EXPECT_FALSE(gone.success());

    auto run = procs.execute("pwd", 10s, "/tmp");
    EXPECT_TRUE(run.output.success()) << run.output.error;
    EXPECT_EQ(run.output.stdout_data, "/tmp\n");
}

TEST(Integration, UploadDownloadRoundTrip) {
    ConnectParams p;
    if (!live_params(p)) GTEST_SKIP() << "REMOPS_TEST_HOST not set";

    auto files = FileTransferClient::connect(p);
    ASSERT_TRUE(files.is_ok()) << files.error;
    auto& sftp = *files.value;

    std::string dir = "/tmp/remops-it-" + std::to_string(unix_nanos());
    ASSERT_TRUE(sftp.create_directory(dir, "0700").is_ok());

    std::string payload;
    for (int i = 0; i < 100000; ++i) payload.push_back(static_cast<char>(i * 31));
    std::istringstream in(payload);
    std::string remote = dir + "/blob.bin";

    auto up = sftp.upload(in, payload.size(), remote, false);
    ASSERT_TRUE(up.is_ok()) << up.error;
    EXPECT_EQ(up.value, payload.size());

    std::istringstream again(payload);
    auto refused = sftp.upload(again, payload.size(), remote, false);
    EXPECT_TRUE(refused.is_err());
    EXPECT_EQ(refused.kind, ErrorKind::Resource);
    EXPECT_NE(refused.error.find("already exists"), std::string::npos) << refused.error;

    std::ostringstream out;
    auto down = sftp.download(remote, out);
    ASSERT_TRUE(down.is_ok()) << down.error;
    EXPECT_EQ(out.str(), payload);

    auto listing = sftp.list_directory(dir);
    ASSERT_TRUE(listing.is_ok()) << listing.error;
    EXPECT_EQ(listing.value.file_count, 1);
    EXPECT_EQ(listing.value.total_size, payload.size());

    EXPECT_TRUE(sftp.rename(remote, dir + "/moved.bin").is_ok());
    EXPECT_EQ(sftp.stat(remote).kind, ErrorKind::NotFound);
    EXPECT_TRUE(sftp.remove(dir + "/moved.bin").is_ok());
    EXPECT_TRUE(sftp.remove(dir).is_ok());
}
