#include "process_client.hpp"
#include <core/log.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>
#include <sstream>

const char* process_state_name(ProcessState state) {
    switch (state) {
        case ProcessState::Running:  return "running";
        case ProcessState::Sleeping: return "sleeping";
        case ProcessState::Stopped:  return "stopped";
        case ProcessState::Zombie:   return "zombie";
        case ProcessState::Unknown:  break;
    }
    return "unknown";
}

ProcessState parse_process_state(const std::string& stat) {
    if (stat.find('R') != std::string::npos) return ProcessState::Running;
    if (stat.find('S') != std::string::npos) return ProcessState::Sleeping;
    if (stat.find('T') != std::string::npos) return ProcessState::Stopped;
    if (stat.find('Z') != std::string::npos) return ProcessState::Zombie;
    return ProcessState::Unknown;
}

namespace {

std::vector<std::string> fields_of(const std::string& line) {
    std::istringstream in(line);
    std::vector<std::string> out;
    std::string f;
    while (in >> f) out.push_back(f);
    return out;
}

bool parse_pid(const std::string& s, int& pid) {
    if (s.empty() || s.find_first_not_of("0123456789") != std::string::npos) return false;
    pid = safe_stoi(s, 0);
    return pid > 0;
}

double parse_double(const std::string& s) {
    try {
        return std::stod(s);
    } catch (const std::exception&) {
        return 0.0;
    }
}

uint64_t parse_kib(const std::string& s) {
    try {
        return static_cast<uint64_t>(std::stoull(s)) * 1024;
    } catch (const std::exception&) {
        return 0;
    }
}

std::string basename_of(const std::string& path) {
    auto slash = path.rfind('/');
    return slash == std::string::npos ? path : path.substr(slash + 1);
}

std::string join_from(const std::vector<std::string>& f, size_t first, size_t last) {
    std::string out;
    for (size_t i = first; i < last && i < f.size(); ++i) {
        if (!out.empty()) out += ' ';
        out += f[i];
    }
    return out;
}

}  // namespace

// ── Parsers ─────────────────────────────────────────────────

Result<ProcessInfo> parse_process_line(const std::string& line) {
    auto f = fields_of(line);
    if (f.size() < 11) {
        return Result<ProcessInfo>::Err(ErrorKind::Protocol,
            fmt::format("ps: expected 11 columns, got {}", f.size()));
    }
    ProcessInfo p;
    if (!parse_pid(f[1], p.pid)) {
        return Result<ProcessInfo>::Err(ErrorKind::Protocol, "ps: bad pid \"" + f[1] + "\"");
    }
    p.user = f[0];
    p.cpu_percent = parse_double(f[2]);
    p.memory_bytes = parse_kib(f[5]);
    p.terminal = f[6];
    p.state = parse_process_state(f[7]);
    p.started = f[8];
    p.run_time = f[9];
    p.command = join_from(f, 10, f.size());
    p.name = basename_of(f[10]);
    return Result<ProcessInfo>::Ok(std::move(p));
}

std::vector<ProcessInfo> parse_process_list(const std::string& output) {
    std::vector<ProcessInfo> out;
    for (const auto& line : split(output, '\n')) {
        auto p = parse_process_line(line);
        if (p.is_ok()) out.push_back(std::move(p.value));
    }
    return out;
}

Result<ProcessInfo> parse_process_detail(const std::string& line) {
    auto f = fields_of(line);
    if (f.size() < 11) {
        return Result<ProcessInfo>::Err(ErrorKind::Protocol,
            fmt::format("ps: expected 11 columns, got {}", f.size()));
    }
    ProcessInfo p;
    if (!parse_pid(f[0], p.pid)) {
        return Result<ProcessInfo>::Err(ErrorKind::Protocol, "ps: bad pid \"" + f[0] + "\"");
    }
    p.user = f[1];
    p.cpu_percent = parse_double(f[2]);
    p.memory_bytes = parse_kib(f[3]);
    p.state = parse_process_state(f[4]);
    p.started = join_from(f, 5, 10);
    p.command = join_from(f, 10, f.size());
    p.name = basename_of(f[10]);
    return Result<ProcessInfo>::Ok(std::move(p));
}

std::string shell_quote(const std::string& s) {
    std::string out = "'";
    for (char c : s) {
        if (c == '\'') out += "'\\''";
        else out += c;
    }
    out += "'";
    return out;
}

// ── ProcessClient ───────────────────────────────────────────

namespace {

template <typename T>
Result<T> command_failure(const std::string& what, const CommandOutput& out) {
    // No exit status: the command never completed (timeout, connection).
    if (!out.exit_code) {
        return Result<T>::Err(out.error_kind, what + ": " + out.error);
    }
    std::string detail = out.stderr_data;
    trim(detail);
    if (detail.empty()) detail = out.error;
    return Result<T>::Err(ErrorKind::Resource, what + ": " + detail);
}

}  // namespace

Result<std::vector<ProcessInfo>> ProcessClient::list(size_t limit) {
    if (limit == 0) limit = PROCESS_LIST_LIMIT;
    // head counts the header line too.
    auto cmd = fmt::format("ps aux --sort=-%cpu | head -n {}", limit + 1);
    auto out = client_.execute(cmd, std::chrono::seconds(PROCESS_CMD_TIMEOUT_SECS));
    if (!out.success()) {
        return command_failure<std::vector<ProcessInfo>>("list processes", out);
    }
    auto procs = parse_process_list(out.stdout_data);
    if (procs.size() > limit) procs.resize(limit);
    return Result<std::vector<ProcessInfo>>::Ok(std::move(procs));
}

Result<ProcessInfo> ProcessClient::get(int pid) {
    if (pid <= 0) {
        return Result<ProcessInfo>::Err(ErrorKind::Resource, fmt::format("process {}: invalid pid", pid));
    }
    auto cmd = fmt::format("ps -p {} -o pid,user,%cpu,rss,stat,lstart,comm --no-headers", pid);
    auto out = client_.execute(cmd, std::chrono::seconds(PROCESS_CMD_TIMEOUT_SECS));
    // ps exits 1 with empty output for a pid that does not exist.
    std::string text = out.stdout_data;
    trim(text);
    if (out.exit_code && text.empty()) {
        return Result<ProcessInfo>::Err(ErrorKind::NotFound, fmt::format("process {}: not found", pid));
    }
    if (!out.success()) {
        return command_failure<ProcessInfo>(fmt::format("process {}", pid), out);
    }
    return parse_process_detail(text);
}

Result<void> ProcessClient::kill(int pid, int signal) {
    if (pid <= 0) {
        return Result<void>::Err(ErrorKind::Resource, fmt::format("kill {}: invalid pid", pid));
    }
    if (signal < 1 || signal > 64) {
        return Result<void>::Err(ErrorKind::Resource,
            fmt::format("kill {}: invalid signal {}", pid, signal));
    }
    auto out = client_.execute(fmt::format("kill -{} {}", signal, pid),
                               std::chrono::seconds(PROCESS_CMD_TIMEOUT_SECS));
    if (!out.success()) {
        auto err = command_failure<void>(fmt::format("kill {}", pid), out);
        remops_log(err.error);
        return err;
    }
    remops_log(fmt::format("kill {}: sent signal {}", pid, signal));
    return Result<void>::Ok();
}

ProcessRun ProcessClient::execute(const std::string& command, std::chrono::milliseconds timeout,
                                  const std::string& working_dir) {
    std::string cmd = working_dir.empty()
        ? command
        : fmt::format("cd {} && {}", shell_quote(working_dir), command);

    auto started = Clock::now();
    ProcessRun run;
    run.output = client_.execute(cmd, timeout);
    run.duration = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - started);
    return run;
}
