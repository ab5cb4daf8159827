#pragma once

#include <string>
#include <vector>
#include <core/types.hpp>
#include <core/config.hpp>
#include <ssh/remote_connection.hpp>

// Flags shared by every command.
struct CliOptions {
    std::string user;
    std::string password;
    std::string key_path;
    int port = 0;               // 0: from host spec or config
    int timeout = 0;            // seconds per operation, 0: default
    std::vector<std::string> positional;
};

// Pull --user/--password/--key/--port/--timeout out of args; everything
// else is positional, in order. "--" ends flag parsing.
Result<CliOptions> parse_cli_options(const std::vector<std::string>& args);

// Whitespace split that keeps "double" or 'single' quoted runs together.
std::vector<std::string> split_args(const std::string& s);

// [user@]host[:port], with [v6]:port for IPv6 literals.
struct HostSpec {
    std::string user;
    std::string host;
    int port = 0;
};
Result<HostSpec> parse_host_spec(const std::string& spec);

// Resolve connection parameters for host from the flags, the environment
// (REMOPS_PASSWORD, REMOPS_KEY_PASSPHRASE) and the config defaults.
// Without --key or a password, ~/.ssh/id_ed25519 then ~/.ssh/id_rsa are
// tried.
Result<ConnectParams> make_connect_params(const std::string& host, const CliOptions& opts,
                                          const Config& config);
