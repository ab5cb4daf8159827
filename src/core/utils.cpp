#include "utils.hpp"
#include "types.hpp"
#include <chrono>
#include <cstdio>
#include <stdexcept>
#include <fmt/format.h>

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:            return "none";
        case ErrorKind::Connection:      return "connection";
        case ErrorKind::Timeout:         return "timeout";
        case ErrorKind::Protocol:        return "protocol";
        case ErrorKind::Resource:        return "resource";
        case ErrorKind::PartialTransfer: return "partial-transfer";
        case ErrorKind::NotFound:        return "not-found";
        case ErrorKind::Cancelled:       return "cancelled";
    }
    return "unknown";
}

std::string now_iso() {
    return format_iso(std::time(nullptr));
}

std::string format_iso(std::time_t t) {
    struct tm tm_buf;
    localtime_r(&t, &tm_buf);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm_buf);
    return std::string(buf);
}

int safe_stoi(const std::string& s, int fallback) {
    try {
        return std::stoi(s);
    } catch (const std::exception&) {
        return fallback;
    }
}

std::vector<std::string> split(const std::string& s, char sep) {
    std::vector<std::string> out;
    size_t start = 0;
    while (start <= s.size()) {
        size_t end = s.find(sep, start);
        if (end == std::string::npos) end = s.size();
        if (end > start) out.push_back(s.substr(start, end - start));
        start = end + 1;
    }
    return out;
}

int64_t unix_nanos() {
    return std::chrono::duration_cast<std::chrono::nanoseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

std::string format_bytes(uint64_t n) {
    if (n < 1024) return fmt::format("{}B", n);
    const char* units[] = {"K", "M", "G", "T"};
    double v = static_cast<double>(n);
    int u = -1;
    while (v >= 1024.0 && u < 3) {
        v /= 1024.0;
        ++u;
    }
    return fmt::format("{:.1f}{}", v, units[u]);
}
