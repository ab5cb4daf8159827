#pragma once

#include <chrono>
#include <optional>
#include <string>

enum class HostStatus {
    Success,   // SSH handshake completed
    Open,      // TCP port open, handshake failed
    Timeout,   // no TCP connection (timed out, refused, unreachable)
    Error,     // local failure before any network exchange
};

const char* host_status_name(HostStatus status);

// One probe result. Immutable once produced.
struct DiscoveredHost {
    std::string address;
    int port = 0;
    std::optional<std::string> hostname;
    std::optional<std::string> os;
    std::optional<std::string> banner;
    HostStatus status = HostStatus::Error;
};

// Probes one (address, port) pair. Implementations must be safe to call
// from several scanner workers at once.
class Prober {
public:
    virtual ~Prober() = default;
    virtual DiscoveredHost probe(const std::string& address, int port,
                                 std::chrono::milliseconds timeout) = 0;
};
