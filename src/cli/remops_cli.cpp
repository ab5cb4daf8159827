#include "remops_cli.hpp"
#include "theme.hpp"
#include <core/log.hpp>
#include <managers/idle_reaper.hpp>
#include <platform/terminal.hpp>
#include <protocol/terminal_bridge.hpp>
#include <ssh/session_registry.hpp>
#include <iostream>
#include <sstream>
#include <cerrno>
#include <cstdlib>
#include <unistd.h>
#include <readline/readline.h>
#include <readline/history.h>

RemopsCLI::RemopsCLI() : BaseCLI() {
    register_all_commands();
}

void RemopsCLI::register_all_commands() {
    add_command("help", [this](BaseCLI&, const std::string&) {
        this->print_help();
    }, "Show this help message");

    add_command("quit", [this](BaseCLI&, const std::string&) {
        quit_ = true;
    }, "Disconnect and exit");

    add_command("exit", [this](BaseCLI&, const std::string&) {
        quit_ = true;
    }, "Disconnect and exit");

    register_shell_commands(*this);
    register_file_commands(*this);
    register_scan_commands(*this);
    register_process_commands(*this);
}

void RemopsCLI::run_command(const std::string& command, const std::vector<std::string>& args) {
    std::string args_str;
    for (size_t i = 0; i < args.size(); ++i) {
        if (i > 0) args_str += " ";
        // Re-quote so split_args() in the handler sees the same words.
        if (command != "exec" && args[i].find_first_of(" \t") != std::string::npos) {
            args_str += "\"" + args[i] + "\"";
        } else {
            args_str += args[i];
        }
    }
    execute_command(command, args_str);
}

// ── REPL ────────────────────────────────────────────────

void RemopsCLI::run_repl() {
    std::cout << theme::banner();

    std::cout << theme::section("Connecting");
    if (!commands()) {
        std::cout << "\n";
        return;
    }
    std::cout << theme::ok("Connected to " + target->target());
    if (!client->connection().server_banner().empty()) {
        std::cout << theme::kv("Server", client->connection().server_banner());
    }
    std::cout << theme::divider();
    std::cout << theme::dim("    Type 'help' for commands, 'quit' to exit.") << "\n\n";

    std::string line;
    while (!quit_) {
        std::string prompt = get_prompt_string();
        char* raw = readline(prompt.c_str());
        if (!raw) {
            break;  // EOF / Ctrl-D
        }

        line = raw;
        free(raw);

        if (line.empty()) {
            continue;
        }

        add_history(line.c_str());

        std::istringstream iss(line);
        std::string command;
        iss >> command;

        std::string args;
        std::getline(iss, args);
        if (!args.empty() && args[0] == ' ') {
            args = args.substr(1);
        }

        execute_command(command, args);
    }

    std::cout << theme::dim("    Disconnecting...") << "\n";
    disconnect();
}

// ── Bridge ──────────────────────────────────────────────

namespace {

// Line splitter over raw stdin reads, so the loop can also watch the bridge.
class StdinLines {
public:
    enum Status { Line, Idle, Closed };

    Status next(std::string& line, int timeout_ms) {
        for (;;) {
            auto nl = pending_.find('\n');
            if (nl != std::string::npos) {
                line = pending_.substr(0, nl);
                pending_.erase(0, nl + 1);
                if (!line.empty() && line.back() == '\r') line.pop_back();
                return Line;
            }
            if (eof_) {
                if (pending_.empty()) return Closed;
                line.swap(pending_);
                pending_.clear();
                return Line;
            }
            if (!platform::poll_stdin(timeout_ms)) return Idle;

            char buf[4096];
            ssize_t n = ::read(STDIN_FILENO, buf, sizeof(buf));
            if (n < 0 && errno == EINTR) continue;
            if (n <= 0) eof_ = true;
            else pending_.append(buf, static_cast<size_t>(n));
        }
    }

private:
    std::string pending_;
    bool eof_ = false;
};

}  // namespace

void RemopsCLI::run_bridge() {
    StdinLines in;
    std::string line;

    StdinLines::Status st;
    while ((st = in.next(line, 1000)) == StdinLines::Idle) {}
    if (st == StdinLines::Closed) {
        report("bridge", "stdin closed before the connect request", 2);
        return;
    }

    auto sink = [](const std::string& frame) {
        std::cout << frame << "\n" << std::flush;
    };

    auto request = parse_connect_request(line);
    if (request.is_err()) {
        sink(serialize_frame(TerminalFrame::failure("invalid connect request", request.error)));
        status = 2;
        return;
    }

    const auto& sd = config.session();
    SessionOptions opts;
    opts.term = sd.term;
    opts.write_wait_ms = sd.write_wait_ms;
    SessionRegistry registry(ssh_session_factory(opts));

    IdleReaper reaper(registry, std::chrono::seconds(sd.idle_timeout),
                      std::chrono::seconds(sd.reap_interval));
    reaper.start();

    TerminalBridge bridge(registry, sink, sd.read_timeout_ms);
    auto opened = bridge.open(request.value, config.connect());
    if (opened.is_err()) {
        remops_log("bridge: " + opened.error);
        status = 1;
        reaper.stop();
        return;
    }

    while (bridge.running()) {
        st = in.next(line, 100);
        if (st == StdinLines::Closed) break;
        if (st == StdinLines::Line && !line.empty()) {
            // Errors are already reported to the peer as frames.
            auto r = bridge.on_frame(line);
            if (r.is_err()) remops_log("bridge frame: " + r.error);
        }
    }

    bridge.stop();
    reaper.stop();
}
