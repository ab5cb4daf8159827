#include "ssh_prober.hpp"
#include <ssh/remote_connection.hpp>
#include <ssh/command_client.hpp>
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>

const char* host_status_name(HostStatus status) {
    switch (status) {
        case HostStatus::Success: return "success";
        case HostStatus::Open:    return "open";
        case HostStatus::Timeout: return "timeout";
        case HostStatus::Error:   return "error";
    }
    return "error";
}

std::string fingerprint_from_banner(const std::string& banner) {
    std::string b = banner;
    trim(b);
    if (b.compare(0, 4, "SSH-") != 0) return "";
    // SSH-protoversion-softwareversion [SP comments]
    auto dash = b.find('-', 4);
    if (dash == std::string::npos || dash + 1 >= b.size()) return "";
    return b.substr(dash + 1);
}

DiscoveredHost SshProber::probe(const std::string& address, int port,
                                std::chrono::milliseconds timeout) {
    DiscoveredHost host;
    host.address = address;
    host.port = port;

    auto deadline = Clock::now() + timeout;
    bool tcp_connected = false;
    auto conn = RemoteConnection::open_unauthenticated(address, port, timeout,
                                                       SCAN_CLIENT_BANNER, &tcp_connected);
    if (conn.is_err()) {
        if (tcp_connected) {
            host.status = HostStatus::Open;
        } else {
            host.status = (conn.kind == ErrorKind::Resource) ? HostStatus::Error
                                                             : HostStatus::Timeout;
        }
        return host;
    }

    host.status = HostStatus::Success;
    const std::string& banner = conn.value->server_banner();
    if (!banner.empty()) {
        host.banner = banner;
        std::string fp = fingerprint_from_banner(banner);
        if (!fp.empty()) host.os = fp;
    }

    // Best effort: only servers that accept "none" let us look further.
    if (!conn.value->try_auth_none(SCAN_PROBE_USER, deadline)) return host;

    auto left = std::chrono::milliseconds(remaining_ms(deadline));
    if (left.count() == 0) return host;
    auto name = execute_on(*conn.value, "hostname", left);
    if (name.success()) {
        std::string h = name.stdout_data;
        trim(h);
        if (!h.empty()) host.hostname = h;
    }

    left = std::chrono::milliseconds(remaining_ms(deadline));
    if (left.count() == 0) return host;
    auto uname = execute_on(*conn.value, "uname -sr", left);
    if (uname.success()) {
        std::string os = uname.stdout_data;
        trim(os);
        if (!os.empty()) host.os = os;
    }

    remops_log(fmt::format("probe {}:{} identified {} / {}", address, port,
                           host.hostname.value_or("?"), host.os.value_or("?")));
    return host;
}
