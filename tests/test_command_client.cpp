#include <gtest/gtest.h>
#include <ssh/command_client.hpp>

TEST(CommandOutput, ZeroExitIsSuccess) {
    CommandOutput out;
    out.stdout_data = "hello\n";
    apply_exit_status(out, 0, "");
    ASSERT_TRUE(out.exit_code.has_value());
    EXPECT_EQ(*out.exit_code, 0);
    EXPECT_TRUE(out.error.empty());
    EXPECT_TRUE(out.success());
}

TEST(CommandOutput, NonZeroExitCarriesError) {
    CommandOutput out;
    apply_exit_status(out, 1, "");
    EXPECT_EQ(*out.exit_code, 1);
    EXPECT_EQ(out.error, "Process exited with status 1");
    EXPECT_EQ(out.error_kind, ErrorKind::Resource);
    EXPECT_FALSE(out.success());
    EXPECT_FALSE(out.timed_out());
}

TEST(CommandOutput, SignalWinsOverStatus) {
    CommandOutput out;
    apply_exit_status(out, 0, "KILL");
    EXPECT_EQ(*out.exit_code, -1);
    EXPECT_NE(out.error.find("KILL"), std::string::npos);
    EXPECT_FALSE(out.success());
}

TEST(CommandOutput, GetOutputPrefersStdout) {
    CommandOutput out;
    out.stderr_data = "warn";
    EXPECT_EQ(out.get_output(), "warn");
    out.stdout_data = "data";
    EXPECT_EQ(out.get_output(), "data");
}

TEST(CommandOutput, TimedOutHasNoExitCode) {
    CommandOutput out;
    out.error = "timed out";
    out.error_kind = ErrorKind::Timeout;
    EXPECT_TRUE(out.timed_out());
    EXPECT_FALSE(out.exit_code.has_value());
    EXPECT_FALSE(out.success());
}
