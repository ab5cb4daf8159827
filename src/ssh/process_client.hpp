#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>
#include <core/types.hpp>
#include <core/constants.hpp>
#include "command_client.hpp"

enum class ProcessState { Running, Sleeping, Stopped, Zombie, Unknown };

const char* process_state_name(ProcessState state);

// ps STAT column ("Ss", "R+", "Z") to a state. R wins over S.
ProcessState parse_process_state(const std::string& stat);

struct ProcessInfo {
    int pid = 0;
    std::string name;           // basename of the executable
    std::string command;        // full command line
    std::string user;
    ProcessState state = ProcessState::Unknown;
    double cpu_percent = 0.0;
    uint64_t memory_bytes = 0;  // resident set
    std::string started;        // as ps prints it ("10:42", "Jan15", "Wed Jan 15 10:30:00 2025")
    std::string run_time;       // cumulative CPU time, empty when ps did not report it
    std::string terminal;
};

// One line of `ps aux`:
// USER PID %CPU %MEM VSZ RSS TTY STAT START TIME COMMAND...
Result<ProcessInfo> parse_process_line(const std::string& line);

// `ps aux` output, header included. Lines that do not parse are skipped.
std::vector<ProcessInfo> parse_process_list(const std::string& output);

// One line of `ps -o pid,user,%cpu,rss,stat,lstart,comm --no-headers`.
// lstart spans five fields ("Wed Jan 15 10:30:00 2025").
Result<ProcessInfo> parse_process_detail(const std::string& line);

// Single-quote s for a POSIX shell.
std::string shell_quote(const std::string& s);

// Result of a command run through ProcessClient::execute.
struct ProcessRun {
    CommandOutput output;
    std::chrono::milliseconds duration{0};
};

// ProcessClient: process inspection and control on top of CommandClient.
// Every operation is one bounded command on the client's connection.
class ProcessClient {
public:
    explicit ProcessClient(CommandClient& client) : client_(client) {}

    // Top processes by CPU, at most limit entries.
    Result<std::vector<ProcessInfo>> list(size_t limit = PROCESS_LIST_LIMIT);

    // NotFound when no such pid exists.
    Result<ProcessInfo> get(int pid);

    // signal must be 1..64; pid must be positive.
    Result<void> kill(int pid, int signal = DEFAULT_KILL_SIGNAL);

    // Run command, in working_dir when given, and time it.
    ProcessRun execute(const std::string& command, std::chrono::milliseconds timeout,
                       const std::string& working_dir = "");

private:
    CommandClient& client_;
};
