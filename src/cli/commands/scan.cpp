#include "../base_cli.hpp"
#include "../theme.hpp"
#include <core/utils.hpp>
#include <scan/address_range.hpp>
#include <scan/network_scanner.hpp>
#include <scan/ssh_prober.hpp>
#include <csignal>
#include <iostream>
#include <fmt/format.h>

static CancelToken* g_scan_cancel = nullptr;

static void on_interrupt(int) {
    if (g_scan_cancel) g_scan_cancel->cancel();
}

static std::string status_label(HostStatus s) {
    switch (s) {
        case HostStatus::Success: return theme::green(fmt::format("{:<8}", "ssh"));
        case HostStatus::Open:    return theme::yellow(fmt::format("{:<8}", "open"));
        case HostStatus::Timeout: return theme::dim(fmt::format("{:<8}", "timeout"));
        case HostStatus::Error:   return theme::red(fmt::format("{:<8}", "error"));
    }
    return "";
}

// scan <range> [--ports 22,2222] [--concurrency N] [--all]
static void do_scan(BaseCLI& cli, const std::string& arg) {
    auto args = split_args(arg);
    std::string range;
    std::vector<int> ports = cli.config.scan().ports;
    int concurrency = cli.config.scan().max_concurrency;
    bool show_all = false;

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& a = args[i];
        if ((a == "--ports" || a == "--concurrency") && i + 1 >= args.size()) {
            cli.report(a + " needs a value", "", 2);
            return;
        }
        if (a == "--ports") {
            ports.clear();
            for (const auto& p : split(args[++i], ',')) ports.push_back(safe_stoi(p, -1));
        } else if (a == "--concurrency") {
            concurrency = safe_stoi(args[++i], -1);
            if (concurrency <= 0) {
                cli.report("invalid --concurrency", args[i], 2);
                return;
            }
        } else if (a == "--all") {
            show_all = true;
        } else if (range.empty()) {
            range = a;
        } else {
            cli.report("Unexpected argument", a, 2);
            return;
        }
    }
    if (range.empty()) {
        cli.report("Usage: scan <cidr|address> [--ports 22,2222] [--concurrency N] [--all]", "", 2);
        return;
    }

    int timeout_secs = cli.options.timeout > 0 ? cli.options.timeout : cli.config.scan().timeout;
    auto probes = estimate_probe_count(range, ports);
    if (probes.is_ok()) {
        std::cout << theme::step(fmt::format("Scanning {} ({} probe(s), {} at a time, {}s timeout)",
                                             range, probes.value, concurrency, timeout_secs));
    }

    CancelToken cancel;
    NetworkScanner scanner(std::make_shared<SshProber>());
    auto handle = scanner.scan(range, ports, std::chrono::seconds(timeout_secs), concurrency, cancel);
    if (handle.is_err()) {
        cli.report("scan", handle.error, 2);
        return;
    }

    g_scan_cancel = &cancel;
    auto previous = std::signal(SIGINT, on_interrupt);

    size_t found = 0;
    DiscoveredHost host;
    while (handle.value->next(host)) {
        if (host.status == HostStatus::Success) ++found;
        if (!show_all && host.status != HostStatus::Success && host.status != HostStatus::Open) {
            continue;
        }
        std::string detail;
        if (host.hostname) detail += *host.hostname + "  ";
        if (host.os) detail += *host.os;
        std::cout << "    " << status_label(host.status)
                  << fmt::format("{:<22}", fmt::format("{}:{}", host.address, host.port))
                  << theme::dim(detail) << "\n" << std::flush;
    }
    handle.value->wait();

    std::signal(SIGINT, previous);
    g_scan_cancel = nullptr;

    auto stats = handle.value->stats();
    std::cout << theme::divider();
    std::cout << theme::kv("Probed", fmt::format("{}/{}", stats.completed, stats.total));
    std::cout << theme::kv("SSH hosts", std::to_string(found));
    if (cancel.is_cancelled()) {
        cli.report("Scan interrupted", "", 130);
    }
}

void register_scan_commands(BaseCLI& cli) {
    cli.add_command("scan", do_scan, "Discover SSH servers in a CIDR range");
}
