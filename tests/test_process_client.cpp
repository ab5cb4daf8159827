#include <gtest/gtest.h>
#include <ssh/process_client.hpp>

TEST(ProcessState, FromStatColumn) {
    EXPECT_EQ(parse_process_state("R+"), ProcessState::Running);
    EXPECT_EQ(parse_process_state("Ss"), ProcessState::Sleeping);
    EXPECT_EQ(parse_process_state("T"), ProcessState::Stopped);
    EXPECT_EQ(parse_process_state("Z"), ProcessState::Zombie);
    EXPECT_EQ(parse_process_state("D"), ProcessState::Unknown);
    // Running wins over the session-leader flag.
    EXPECT_EQ(parse_process_state("Rs"), ProcessState::Running);
    EXPECT_STREQ(process_state_name(ProcessState::Zombie), "zombie");
}

TEST(ProcessParse, AuxLine) {
    auto p = parse_process_line(
        "postgres  4211 12.5  3.1 221000 51200 ?        Ss   09:14   1:02 /usr/lib/postgresql/15/bin/postgres -D /var/lib/pg");
    ASSERT_TRUE(p.is_ok()) << p.error;
    EXPECT_EQ(p.value.pid, 4211);
    EXPECT_EQ(p.value.user, "postgres");
    EXPECT_DOUBLE_EQ(p.value.cpu_percent, 12.5);
    EXPECT_EQ(p.value.memory_bytes, 51200u * 1024);
    EXPECT_EQ(p.value.terminal, "?");
    EXPECT_EQ(p.value.state, ProcessState::Sleeping);
    EXPECT_EQ(p.value.started, "09:14");
    EXPECT_EQ(p.value.run_time, "1:02");
    EXPECT_EQ(p.value.name, "postgres");
    EXPECT_EQ(p.value.command, "/usr/lib/postgresql/15/bin/postgres -D /var/lib/pg");
}

TEST(ProcessParse, ShortOrHeaderLineRejected) {
    EXPECT_TRUE(parse_process_line("root 1 0.0").is_err());
    auto header = parse_process_line(
        "USER       PID %CPU %MEM    VSZ   RSS TTY      STAT START   TIME COMMAND");
    EXPECT_TRUE(header.is_err());
    EXPECT_EQ(header.kind, ErrorKind::Protocol);
}

TEST(ProcessParse, ListSkipsHeaderAndJunk) {
    std::string out =
        "USER       PID %CPU %MEM    VSZ   RSS TTY      STAT START   TIME COMMAND\n"
        "root         1  0.0  0.1 168000 11000 ?        Ss   Jan15   0:09 /sbin/init\n"
        "garbage\n"
        "\n"
        "alice     9001 99.0  0.5  10000  2048 pts/0    R+   10:42   5:00 yes\n";
    auto procs = parse_process_list(out);
    ASSERT_EQ(procs.size(), 2u);
    EXPECT_EQ(procs[0].pid, 1);
    EXPECT_EQ(procs[0].name, "init");
    EXPECT_EQ(procs[1].pid, 9001);
    EXPECT_EQ(procs[1].terminal, "pts/0");
    EXPECT_EQ(procs[1].state, ProcessState::Running);
}

TEST(ProcessParse, DetailLineWithLstart) {
    auto p = parse_process_detail("  812 www-data  2.0  40960 S    Wed Jan 15 10:30:00 2025 nginx");
    ASSERT_TRUE(p.is_ok()) << p.error;
    EXPECT_EQ(p.value.pid, 812);
    EXPECT_EQ(p.value.user, "www-data");
    EXPECT_DOUBLE_EQ(p.value.cpu_percent, 2.0);
    EXPECT_EQ(p.value.memory_bytes, 40960u * 1024);
    EXPECT_EQ(p.value.state, ProcessState::Sleeping);
    EXPECT_EQ(p.value.started, "Wed Jan 15 10:30:00 2025");
    EXPECT_EQ(p.value.name, "nginx");
}

TEST(ProcessParse, DetailLineTooShort) {
    auto p = parse_process_detail("812 www-data 2.0 40960 S nginx");
    EXPECT_TRUE(p.is_err());
    EXPECT_EQ(p.kind, ErrorKind::Protocol);
}

TEST(ProcessParse, NonNumericPidRejected) {
    EXPECT_TRUE(parse_process_line(
        "root  abc  0.0  0.1 1 1 ?  S  10:00  0:00 sh").is_err());
}

TEST(ShellQuote, EscapesSingleQuotes) {
    EXPECT_EQ(shell_quote("/srv/app"), "'/srv/app'");
    EXPECT_EQ(shell_quote("it's here"), "'it'\\''s here'");
    EXPECT_EQ(shell_quote(""), "''");
}
