#pragma once

#include <string>
#include <fstream>
#include <chrono>
#include <ctime>
#include <cstdio>
#include <mutex>
#include <core/types.hpp>
#include <platform/platform.hpp>
#include <fmt/format.h>

inline std::mutex& remops_log_mutex() {
    static std::mutex m;
    return m;
}

inline std::string& remops_log_path_ref() {
    static std::string path = (platform::temp_dir() / "remops_debug.log").string();
    return path;
}

inline std::string remops_log_path() {
    std::lock_guard<std::mutex> lock(remops_log_mutex());
    return remops_log_path_ref();
}

// Redirect the debug log (from config `log.path`). Empty keeps the default.
inline void set_remops_log_path(const std::string& path) {
    if (path.empty()) return;
    std::lock_guard<std::mutex> lock(remops_log_mutex());
    remops_log_path_ref() = path;
}

inline void remops_log(const std::string& msg) {
    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;
    struct tm tm_buf;
    localtime_r(&t, &tm_buf);

    char ts[32];
    std::snprintf(ts, sizeof(ts), "%02d:%02d:%02d.%03d",
                  tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec,
                  static_cast<int>(ms.count()));

    // Worker threads log concurrently; keep lines whole.
    std::lock_guard<std::mutex> lock(remops_log_mutex());
    std::ofstream out(remops_log_path_ref(), std::ios::app);
    if (!out) return;
    out << "[" << ts << "] " << msg << "\n";
}

inline void remops_log_cmd(const std::string& label, const std::string& cmd,
                           const CommandOutput& r) {
    remops_log(fmt::format("{} CMD: {}", label, cmd));
    remops_log(fmt::format("{} exit={} stdout({})={}", label,
                           r.exit_code ? std::to_string(*r.exit_code) : "none",
                           r.stdout_data.size(), r.stdout_data.substr(0, 500)));
    if (!r.stderr_data.empty())
        remops_log(fmt::format("{} stderr={}", label, r.stderr_data.substr(0, 500)));
    if (!r.error.empty())
        remops_log(fmt::format("{} error={}", label, r.error));
}
