#pragma once

#include <string>
#include "prober.hpp"

// "SSH-2.0-OpenSSH_9.6p1 Ubuntu-3ubuntu13" -> "OpenSSH_9.6p1 Ubuntu-3ubuntu13".
// Empty if the banner is not an SSH identification string.
std::string fingerprint_from_banner(const std::string& banner);

// SshProber: TCP connect + SSH key exchange, then best-effort identification.
//
// The server banner becomes the OS fingerprint. When the server admits the
// "none" auth method, `hostname` and `uname -sr` are run to refine it.
// Identification never changes a Success status.
class SshProber : public Prober {
public:
    DiscoveredHost probe(const std::string& address, int port,
                         std::chrono::milliseconds timeout) override;
};
