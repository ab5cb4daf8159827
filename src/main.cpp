#include <iostream>
#include <vector>
#include <string>
#include "cli/remops_cli.hpp"
#include "cli/theme.hpp"
#include <core/config.hpp>

void print_usage() {
    std::cout << theme::banner();
    std::cout << theme::section("Usage");
    auto row = [](const std::string& cmd, const std::string& args, const std::string& help) {
        std::cout << theme::color::TEAL << "    remops " << cmd << " "
                  << theme::color::RESET << theme::color::SAND << fmt::format("{:<28}", args)
                  << theme::color::RESET << theme::color::DIM << help
                  << theme::color::RESET << "\n";
    };
    row("connect", "<host>", "Interactive prompt on a host");
    row("exec", "<host> <command...>", "Run a command");
    row("shell", "<host> [command]", "Interactive shell");
    row("ps", "<host> [pid]", "Top processes, or one in detail");
    row("kill", "<host> <pid> [signal]", "Signal a process");
    row("bridge", "", "Terminal protocol over stdin/stdout");
    row("scan", "<cidr> [--ports p,q]", "Discover SSH servers");
    row("ls", "<host> [path]", "List a directory");
    row("stat", "<host> <path>", "Show file details");
    row("get", "<host> <remote> [local]", "Download a file");
    row("put", "<host> [-f] <local> <remote>", "Upload a file");
    row("rm", "<host> <path...>", "Remove files");
    row("mv", "<host> <from> <to>", "Rename a path");
    row("mkdir", "<host> <path> [mode]", "Create a directory");
    row("init", "", "Write ~/.remops/config.yaml");
    std::cout << "\n";
    std::cout << theme::color::DIM
              << "    host is [user@]address[:port]\n"
              << "    flags: --user U --password P --key FILE --port N --timeout SECS\n"
              << "    REMOPS_PASSWORD and REMOPS_KEY_PASSPHRASE are read from the environment"
              << theme::color::RESET << "\n\n";
}

int main(int argc, char** argv) {
    if (argc < 2) {
        print_usage();
        return 2;
    }

    std::string cmd = argv[1];
    if (cmd == "--version") {
        std::cout << theme::teal("remops") << theme::dim(" version 0.1.0") << "\n";
        return 0;
    }
    if (cmd == "--help" || cmd == "help") {
        print_usage();
        return 0;
    }
    if (cmd == "init") {
        auto r = create_default_config();
        if (r.is_err()) {
            std::cout << theme::fail(r.error);
            return 1;
        }
        std::cout << theme::ok("Config ready at " + get_config_path().string());
        return 0;
    }

    auto parsed = parse_cli_options(std::vector<std::string>(argv + 2, argv + argc));
    if (parsed.is_err()) {
        std::cout << theme::fail(parsed.error);
        return 2;
    }

    RemopsCLI cli;
    cli.options = parsed.value;
    auto& positional = cli.options.positional;

    if (cmd == "bridge") {
        cli.run_bridge();
        return cli.status;
    }
    if (cmd == "scan") {
        cli.run_command("scan", positional);
        return cli.status;
    }
    if (!cli.has_command(cmd) && cmd != "connect") {
        std::cout << theme::fail("Unknown command: " + cmd);
        print_usage();
        return 2;
    }

    if (positional.empty()) {
        std::cout << theme::fail("Missing host.");
        std::cout << theme::step(fmt::format("Usage: remops {} [user@]host ...", cmd));
        return 2;
    }
    if (!cli.set_target(positional[0])) return cli.status;
    std::vector<std::string> rest(positional.begin() + 1, positional.end());

    if (cmd == "connect") {
        cli.run_repl();
        return cli.status;
    }
    cli.run_command(cmd, rest);
    return cli.status;
}
