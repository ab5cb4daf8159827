#include "config.hpp"
#include <platform/platform.hpp>
#include <yaml-cpp/yaml.h>
#include <fstream>
#include <cstdlib>
#include <algorithm>
#include <cctype>
#include <fmt/format.h>

namespace fs = std::filesystem;

fs::path get_config_dir() {
    return platform::home_dir() / ".remops";
}

fs::path get_config_path() {
    const char* env = std::getenv("REMOPS_CONFIG");
    if (env && *env) return fs::path(env);
    return get_config_dir() / "config.yaml";
}

bool config_exists() {
    return fs::exists(get_config_path());
}

AuthPreference parse_auth_preference(const std::string& s, AuthPreference fallback) {
    std::string v = s;
    std::transform(v.begin(), v.end(), v.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (v == "key" || v == "publickey") return AuthPreference::Key;
    if (v == "password") return AuthPreference::Password;
    return fallback;
}

Result<void> create_default_config() {
    fs::path config_path = get_config_path();

    // Don't overwrite existing config
    if (fs::exists(config_path)) {
        return Result<void>::Ok();
    }

    std::error_code ec;
    fs::create_directories(config_path.parent_path(), ec);
    if (ec) {
        return Result<void>::Err(ErrorKind::Resource,
            "Failed to create " + config_path.parent_path().string() + ": " + ec.message());
    }

    const char* default_config = R"(# remops engine configuration

connect:
  timeout: 30                      # seconds for TCP + handshake + auth
  port: 22
  user: "root"
  auth_prefer: "key"               # key | password, when both are supplied

session:
  term: "xterm-256color"
  rows: 24
  cols: 80
  read_timeout_ms: 50
  write_wait_ms: 2000
  idle_timeout: 1800               # seconds before an idle session is reaped
  reap_interval: 60

scan:
  ports: [22]
  timeout: 5
  max_concurrency: 64

# log:
#   path: "/tmp/remops_debug.log"
)";

    std::ofstream out(config_path);
    if (!out) {
        return Result<void>::Err(ErrorKind::Resource,
            "Failed to create config file at " + config_path.string());
    }
    out << default_config;
    return Result<void>::Ok();
}

// ── Section parsers ─────────────────────────────────────────

class ConfigBuilder {
public:
    static void parse_connect(const YAML::Node& node, ConnectDefaults& c) {
        if (!node) return;
        c.timeout = node["timeout"].as<int>(c.timeout);
        c.port = node["port"].as<int>(c.port);
        c.user = node["user"].as<std::string>(c.user);
        if (node["auth_prefer"]) {
            c.auth_prefer = parse_auth_preference(
                node["auth_prefer"].as<std::string>(""), c.auth_prefer);
        }
    }

    static void parse_session(const YAML::Node& node, SessionDefaults& s) {
        if (!node) return;
        s.term = node["term"].as<std::string>(s.term);
        s.rows = node["rows"].as<int>(s.rows);
        s.cols = node["cols"].as<int>(s.cols);
        s.read_timeout_ms = node["read_timeout_ms"].as<int>(s.read_timeout_ms);
        s.write_wait_ms = node["write_wait_ms"].as<int>(s.write_wait_ms);
        s.idle_timeout = node["idle_timeout"].as<int>(s.idle_timeout);
        s.reap_interval = node["reap_interval"].as<int>(s.reap_interval);
    }

    // ports accepts a list or a single scalar
    static void parse_scan(const YAML::Node& node, ScanDefaults& s) {
        if (!node) return;
        if (node["ports"]) {
            if (node["ports"].IsSequence()) {
                s.ports.clear();
                for (const auto& p : node["ports"]) s.ports.push_back(p.as<int>());
            } else if (node["ports"].IsScalar()) {
                s.ports = {node["ports"].as<int>()};
            }
        }
        s.timeout = node["timeout"].as<int>(s.timeout);
        s.max_concurrency = node["max_concurrency"].as<int>(s.max_concurrency);
    }

    static Result<Config> build(const YAML::Node& root) {
        Config config;
        parse_connect(root["connect"], config.connect_);
        parse_session(root["session"], config.session_);
        parse_scan(root["scan"], config.scan_);
        if (root["log"]) {
            config.log_path_ = root["log"]["path"].as<std::string>("");
        }

        if (config.connect_.timeout <= 0)
            return Result<Config>::Err(ErrorKind::Resource, "connect.timeout must be positive");
        if (config.session_.rows <= 0 || config.session_.cols <= 0)
            return Result<Config>::Err(ErrorKind::Resource, "session.rows/cols must be positive");
        if (config.scan_.max_concurrency <= 0)
            return Result<Config>::Err(ErrorKind::Resource, "scan.max_concurrency must be positive");
        for (int p : config.scan_.ports) {
            if (p <= 0 || p > 65535)
                return Result<Config>::Err(ErrorKind::Resource,
                    fmt::format("scan.ports: invalid port {}", p));
        }
        return Result<Config>::Ok(std::move(config));
    }
};

// ── Loading ─────────────────────────────────────────────────

Result<Config> Config::parse(const std::string& yaml_text) {
    try {
        YAML::Node root = YAML::Load(yaml_text);
        if (!root || root.IsNull()) return Result<Config>::Ok(Config{});
        if (!root.IsMap())
            return Result<Config>::Err(ErrorKind::Resource, "config root must be a mapping");
        return ConfigBuilder::build(root);
    } catch (const YAML::Exception& e) {
        return Result<Config>::Err(ErrorKind::Resource,
            std::string("Failed to parse config: ") + e.what());
    }
}

Result<Config> Config::load(const fs::path& path) {
    if (!fs::exists(path)) {
        return Result<Config>::Ok(Config{});
    }
    try {
        YAML::Node root = YAML::LoadFile(path.string());
        if (!root || root.IsNull()) return Result<Config>::Ok(Config{});
        if (!root.IsMap())
            return Result<Config>::Err(ErrorKind::Resource,
                path.string() + ": config root must be a mapping");
        return ConfigBuilder::build(root);
    } catch (const YAML::Exception& e) {
        return Result<Config>::Err(ErrorKind::Resource,
            "Failed to parse " + path.string() + ": " + e.what());
    }
}

Result<Config> Config::load() {
    return load(get_config_path());
}
