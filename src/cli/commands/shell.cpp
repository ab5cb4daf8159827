#include "../base_cli.hpp"
#include "../theme.hpp"
#include <core/log.hpp>
#include <platform/terminal.hpp>
#include <ssh/session_registry.hpp>
#include <iostream>
#include <cerrno>
#include <unistd.h>
#include <fmt/format.h>

// Returns false once the descriptor stops accepting output.
static bool write_fd(int fd, const std::string& data) {
    size_t off = 0;
    while (off < data.size()) {
        ssize_t n = ::write(fd, data.data() + off, data.size() - off);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) return false;
        off += static_cast<size_t>(n);
    }
    return true;
}

static void do_exec(BaseCLI& cli, const std::string& arg) {
    if (arg.empty()) {
        cli.report("Usage: exec <command>", "", 2);
        return;
    }
    auto* client = cli.commands();
    if (!client) return;

    // --timeout bounds the command as well; 0 waits for it to finish.
    auto timeout = std::chrono::seconds(cli.options.timeout);
    auto result = client->execute(arg, timeout);
    std::cout << result.stdout_data << std::flush;
    if (!result.stderr_data.empty()) {
        std::cerr << result.stderr_data;
    }

    if (!result.error.empty()) {
        int code = (result.exit_code && *result.exit_code > 0) ? *result.exit_code : 1;
        cli.report(error_kind_name(result.error_kind), result.error, code);
        if (result.error_kind == ErrorKind::Connection) cli.disconnect();
    }
}

static void do_shell(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_target()) return;

    SessionOptions opts;
    opts.term = cli.config.session().term;
    opts.write_wait_ms = cli.config.session().write_wait_ms;
    SessionRegistry registry(ssh_session_factory(opts));

    int rows = isatty(STDIN_FILENO) ? platform::term_height() : cli.config.session().rows;
    int cols = isatty(STDIN_FILENO) ? platform::term_width() : cli.config.session().cols;
    auto created = registry.create(*cli.target, rows, cols);
    if (created.is_err()) {
        cli.report("Shell failed", created.error);
        return;
    }
    auto session = created.value;

    if (!arg.empty()) {
        auto w = session->write(arg + "\n");
        if (w.is_err()) {
            cli.report("Shell failed", w.error);
            return;
        }
    }

    platform::watch_terminal_resize();
    {
        platform::RawModeGuard raw;
        char buf[4096];
        bool stdin_open = true;

        while (!session->is_closed()) {
            if (platform::take_resize()) {
                auto r = session->resize(platform::term_height(), platform::term_width());
                if (r.is_err()) remops_log("shell resize: " + r.error);
            }

            if (stdin_open && platform::poll_stdin(10)) {
                ssize_t n = ::read(STDIN_FILENO, buf, sizeof(buf));
                if (n <= 0) {
                    // Local EOF (piped input ran out); let the remote side finish.
                    stdin_open = false;
                } else {
                    std::string chunk(buf, static_cast<size_t>(n));
                    size_t off = 0;
                    while (off < chunk.size()) {
                        auto w = session->write(chunk.substr(off));
                        if (w.is_err() || w.value == 0) break;
                        off += w.value;
                    }
                }
            }

            auto out = session->read(std::chrono::milliseconds(10));
            if (out.status == ReadResult::Data) {
                if (!write_fd(STDOUT_FILENO, out.data)) break;
            } else if (out.status == ReadResult::Eof) {
                break;
            }
            auto err = session->read_error(std::chrono::milliseconds(0));
            if (err.status == ReadResult::Data) {
                if (!write_fd(STDERR_FILENO, err.data)) break;
            }
        }
    }
    platform::unwatch_terminal_resize();

    auto closed = registry.close(session->id());
    if (closed.is_err() && closed.kind != ErrorKind::NotFound) {
        remops_log("shell close: " + closed.error);
    }
    std::cout << "\n" << theme::dim("    Shell closed.") << "\n";
}

void register_shell_commands(BaseCLI& cli) {
    cli.add_command("exec", do_exec, "Run a command and print its output");
    cli.add_command("shell", do_shell, "Interactive shell (optional first command)");
}
