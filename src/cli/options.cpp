#include "options.hpp"
#include <core/utils.hpp>
#include <platform/platform.hpp>
#include <algorithm>
#include <cstdlib>
#include <fmt/format.h>

Result<CliOptions> parse_cli_options(const std::vector<std::string>& args) {
    CliOptions opts;
    bool flags_done = false;

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& a = args[i];
        if (flags_done || a.size() < 3 || a.compare(0, 2, "--") != 0) {
            if (a == "--") {
                flags_done = true;
                continue;
            }
            opts.positional.push_back(a);
            continue;
        }

        std::string name = a.substr(2);
        std::string value;
        auto eq = name.find('=');
        if (eq != std::string::npos) {
            value = name.substr(eq + 1);
            name = name.substr(0, eq);
        } else {
            if (name != "user" && name != "password" && name != "key" &&
                name != "port" && name != "timeout") {
                // Command-specific flag (e.g. scan --ports); leave it for the command.
                opts.positional.push_back(a);
                continue;
            }
            if (i + 1 >= args.size()) {
                return Result<CliOptions>::Err(fmt::format("--{} needs a value", name));
            }
            value = args[++i];
        }

        if (name == "user") {
            opts.user = value;
        } else if (name == "password") {
            opts.password = value;
        } else if (name == "key") {
            opts.key_path = value;
        } else if (name == "port") {
            opts.port = safe_stoi(value, -1);
            if (opts.port <= 0 || opts.port > 65535) {
                return Result<CliOptions>::Err(fmt::format("invalid port '{}'", value));
            }
        } else if (name == "timeout") {
            opts.timeout = safe_stoi(value, -1);
            if (opts.timeout < 0) {
                return Result<CliOptions>::Err(fmt::format("invalid timeout '{}'", value));
            }
        } else {
            opts.positional.push_back(a);
        }
    }
    return Result<CliOptions>::Ok(std::move(opts));
}

std::vector<std::string> split_args(const std::string& s) {
    std::vector<std::string> out;
    std::string cur;
    bool in_word = false;
    char quote = 0;

    for (char c : s) {
        if (quote) {
            if (c == quote) quote = 0;
            else cur += c;
            continue;
        }
        if (c == '"' || c == '\'') {
            quote = c;
            in_word = true;
        } else if (c == ' ' || c == '\t') {
            if (in_word) {
                out.push_back(cur);
                cur.clear();
                in_word = false;
            }
        } else {
            cur += c;
            in_word = true;
        }
    }
    if (in_word) out.push_back(cur);
    return out;
}

Result<HostSpec> parse_host_spec(const std::string& spec) {
    HostSpec hs;
    std::string rest = spec;

    auto at = rest.rfind('@');
    if (at != std::string::npos) {
        hs.user = rest.substr(0, at);
        rest = rest.substr(at + 1);
    }

    std::string port_text;
    if (!rest.empty() && rest[0] == '[') {
        auto close = rest.find(']');
        if (close == std::string::npos) {
            return Result<HostSpec>::Err(fmt::format("unterminated '[' in host '{}'", spec));
        }
        hs.host = rest.substr(1, close - 1);
        if (close + 1 < rest.size()) {
            if (rest[close + 1] != ':') {
                return Result<HostSpec>::Err(fmt::format("bad host '{}'", spec));
            }
            port_text = rest.substr(close + 2);
        }
    } else if (std::count(rest.begin(), rest.end(), ':') == 1) {
        auto colon = rest.find(':');
        hs.host = rest.substr(0, colon);
        port_text = rest.substr(colon + 1);
    } else {
        // Bare host or an unbracketed IPv6 literal.
        hs.host = rest;
    }

    if (hs.host.empty()) {
        return Result<HostSpec>::Err(fmt::format("no host in '{}'", spec));
    }
    if (!port_text.empty()) {
        hs.port = safe_stoi(port_text, -1);
        if (hs.port <= 0 || hs.port > 65535) {
            return Result<HostSpec>::Err(fmt::format("invalid port in '{}'", spec));
        }
    }
    return Result<HostSpec>::Ok(std::move(hs));
}

Result<ConnectParams> make_connect_params(const std::string& host, const CliOptions& opts,
                                          const Config& config) {
    auto hs = parse_host_spec(host);
    if (hs.is_err()) return Result<ConnectParams>::Err(hs.kind, hs.error);

    const auto& d = config.connect();
    ConnectParams p;
    p.host_id = hs.value.host;
    p.address = hs.value.host;
    p.port = opts.port > 0 ? opts.port : (hs.value.port > 0 ? hs.value.port : d.port);
    p.username = !opts.user.empty() ? opts.user : (!hs.value.user.empty() ? hs.value.user : d.user);
    p.timeout_secs = opts.timeout > 0 ? opts.timeout : d.timeout;
    p.auth_prefer = d.auth_prefer;

    p.password = opts.password;
    if (p.password.empty()) {
        if (const char* pw = std::getenv("REMOPS_PASSWORD")) p.password = pw;
    }
    if (const char* pp = std::getenv("REMOPS_KEY_PASSPHRASE")) p.key_passphrase = pp;

    if (!opts.key_path.empty()) {
        if (!platform::read_file(opts.key_path, p.private_key)) {
            return Result<ConnectParams>::Err(fmt::format("cannot read key file {}", opts.key_path));
        }
    } else if (p.password.empty()) {
        auto ssh_dir = platform::home_dir() / ".ssh";
        for (const char* name : {"id_ed25519", "id_rsa"}) {
            if (platform::read_file(ssh_dir / name, p.private_key)) break;
        }
    }
    return Result<ConnectParams>::Ok(std::move(p));
}
