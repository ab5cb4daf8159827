#include "../base_cli.hpp"
#include "../theme.hpp"
#include <core/utils.hpp>
#include <ssh/process_client.hpp>
#include <iostream>
#include <fmt/format.h>

static void print_process(const ProcessInfo& p) {
    std::cout << theme::kv("PID", std::to_string(p.pid));
    std::cout << theme::kv("User", p.user);
    std::cout << theme::kv("State", process_state_name(p.state));
    std::cout << theme::kv("CPU", fmt::format("{:.1f}%", p.cpu_percent));
    std::cout << theme::kv("Memory", format_bytes(p.memory_bytes));
    std::cout << theme::kv("Started", p.started);
    std::cout << theme::kv("Command", p.command);
}

static void do_ps(BaseCLI& cli, const std::string& arg) {
    auto args = split_args(arg);
    auto* client = cli.commands();
    if (!client) return;
    ProcessClient procs(*client);

    // ps <pid> shows one process in detail.
    if (!args.empty()) {
        int pid = safe_stoi(args[0], 0);
        auto p = procs.get(pid);
        if (p.is_err()) {
            cli.report("ps", p.error, p.kind == ErrorKind::NotFound ? 1 : 2);
            return;
        }
        print_process(p.value);
        return;
    }

    auto list = procs.list();
    if (list.is_err()) {
        cli.report("ps", list.error);
        if (list.kind == ErrorKind::Connection) cli.disconnect();
        return;
    }
    std::cout << theme::dim(fmt::format("{:>7}  {:<10} {:>6} {:>8}  {:<8}  {}", "PID", "USER",
                                        "%CPU", "RSS", "STATE", "COMMAND"))
              << "\n";
    for (const auto& p : list.value) {
        std::cout << fmt::format("{:>7}  {:<10} {:>6.1f} {:>8}  {:<8}  ", p.pid, p.user,
                                 p.cpu_percent, format_bytes(p.memory_bytes),
                                 process_state_name(p.state))
                  << theme::teal(p.name) << "\n";
    }
}

static void do_kill(BaseCLI& cli, const std::string& arg) {
    auto args = split_args(arg);
    if (args.empty() || args.size() > 2) {
        cli.report("Usage: kill <pid> [signal]", "", 2);
        return;
    }
    int pid = safe_stoi(args[0], 0);
    int signal = args.size() == 2 ? safe_stoi(args[1], 0) : DEFAULT_KILL_SIGNAL;

    auto* client = cli.commands();
    if (!client) return;
    auto r = ProcessClient(*client).kill(pid, signal);
    if (r.is_err()) {
        cli.report("kill", r.error);
        return;
    }
    std::cout << theme::dim(fmt::format("    Sent signal {} to {}", signal, pid)) << "\n";
}

void register_process_commands(BaseCLI& cli) {
    cli.add_command("ps", do_ps, "List top processes, or show one by pid");
    cli.add_command("kill", do_kill, "Signal a remote process (default SIGTERM)");
}
