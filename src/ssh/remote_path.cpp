#include "remote_path.hpp"
#include <core/utils.hpp>
#include <vector>
#include <fmt/format.h>

Result<std::string> validate_path(const std::string& path) {
    if (path.empty()) {
        return Result<std::string>::Err(ErrorKind::Resource, "empty path");
    }
    if (path.find('\0') != std::string::npos) {
        return Result<std::string>::Err(ErrorKind::Resource, "path contains NUL byte");
    }

    std::vector<std::string> parts;
    for (const auto& seg : split(path, '/')) {
        if (seg == ".") continue;
        if (seg == "..") {
            return Result<std::string>::Err(ErrorKind::Resource,
                fmt::format("path traversal not allowed: {}", path));
        }
        parts.push_back(seg);
    }

    std::string out;
    for (const auto& p : parts) {
        out += "/";
        out += p;
    }
    if (out.empty()) out = "/";
    return Result<std::string>::Ok(out);
}

std::string parent_path(const std::string& path) {
    auto slash = path.find_last_of('/');
    if (slash == std::string::npos || slash == 0) return "/";
    return path.substr(0, slash);
}

std::string base_name(const std::string& path) {
    if (path == "/") return "/";
    auto slash = path.find_last_of('/');
    return slash == std::string::npos ? path : path.substr(slash + 1);
}

std::string join_path(const std::string& dir, const std::string& name) {
    if (dir.empty()) return name;
    if (dir.back() == '/') return dir + name;
    return dir + "/" + name;
}

Result<unsigned long> parse_mode(const std::string& mode) {
    std::string m = mode;
    trim(m);
    if (m.empty() || m.size() > 4 || m.find_first_not_of("01234567") != std::string::npos) {
        return Result<unsigned long>::Err(ErrorKind::Resource,
            fmt::format("invalid mode '{}' (want octal such as 0755)", mode));
    }
    return Result<unsigned long>::Ok(std::stoul(m, nullptr, 8));
}

std::string mode_string(unsigned long mode) {
    std::string s(10, '-');
    switch (mode & 0170000) {
        case 0040000: s[0] = 'd'; break;
        case 0120000: s[0] = 'l'; break;
        case 0020000: s[0] = 'c'; break;
        case 0060000: s[0] = 'b'; break;
        case 0010000: s[0] = 'p'; break;
        case 0140000: s[0] = 's'; break;
        default: break;
    }
    const char* rwx = "rwxrwxrwx";
    for (int i = 0; i < 9; ++i) {
        if (mode & (0400UL >> i)) s[1 + i] = rwx[i];
    }
    return s;
}

std::string permission_string(unsigned long mode) {
    return fmt::format("{:04o}", mode & 07777);
}

Result<uint64_t> copy_chunks(const ChunkReader& read, const ChunkWriter& write,
                             uint64_t total, const ProgressCallback& progress,
                             size_t chunk_size) {
    std::vector<char> buf(chunk_size);
    uint64_t done = 0;

    for (;;) {
        auto n = read(buf.data(), buf.size());
        if (n.is_err()) {
            return Result<uint64_t>::Err(ErrorKind::PartialTransfer,
                fmt::format("read failed after {} bytes: {}", done, n.error), done);
        }
        if (n.value == 0) break;

        auto w = write(buf.data(), n.value);
        if (w.is_err()) {
            done += w.value;
            return Result<uint64_t>::Err(ErrorKind::PartialTransfer,
                fmt::format("write failed after {} bytes: {}", done, w.error), done);
        }
        done += n.value;
        if (progress) progress(done, total);
    }
    return Result<uint64_t>::Ok(done);
}
