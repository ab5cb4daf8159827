#pragma once

#include <string>
#include <vector>
#include <filesystem>
#include "types.hpp"
#include "constants.hpp"

namespace fs = std::filesystem;

struct ConnectDefaults {
    int timeout = CONNECT_TIMEOUT_SECS;
    int port = DEFAULT_SSH_PORT;
    std::string user = DEFAULT_USER;
    AuthPreference auth_prefer = AuthPreference::Key;
};

struct SessionDefaults {
    std::string term = DEFAULT_TERM;
    int rows = DEFAULT_ROWS;
    int cols = DEFAULT_COLS;
    int read_timeout_ms = SESSION_READ_TIMEOUT_MS;
    int write_wait_ms = SESSION_WRITE_WAIT_MS;
    int idle_timeout = IDLE_TIMEOUT_SECS;
    int reap_interval = REAP_INTERVAL_SECS;
};

struct ScanDefaults {
    std::vector<int> ports{DEFAULT_SSH_PORT};
    int timeout = SCAN_TIMEOUT_SECS;
    int max_concurrency = SCAN_MAX_CONCURRENCY;
};

class Config {
public:
    // Load from the path named by REMOPS_CONFIG, else ~/.remops/config.yaml.
    // A missing file yields defaults.
    static Result<Config> load();

    // Load from an explicit file. A missing file yields defaults.
    static Result<Config> load(const fs::path& path);

    // Parse YAML text directly.
    static Result<Config> parse(const std::string& yaml_text);

    const ConnectDefaults& connect() const { return connect_; }
    const SessionDefaults& session() const { return session_; }
    const ScanDefaults& scan() const { return scan_; }
    const std::string& log_path() const { return log_path_; }

public:
    Config() = default;

private:
    ConnectDefaults connect_;
    SessionDefaults session_;
    ScanDefaults scan_;
    std::string log_path_;

    friend class ConfigBuilder;
};

fs::path get_config_dir();
fs::path get_config_path();
bool config_exists();

// Write the commented template to the config path (never overwrites).
Result<void> create_default_config();

AuthPreference parse_auth_preference(const std::string& s, AuthPreference fallback);
