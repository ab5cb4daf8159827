#include "file_transfer.hpp"
#include "remote_path.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <libssh2.h>
#include <libssh2_sftp.h>
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <istream>
#include <ostream>
#include <fmt/format.h>

namespace fs = std::filesystem;

namespace {

const char* sftp_status_name(unsigned long fx) {
    switch (fx) {
        case LIBSSH2_FX_EOF:                 return "end of file";
        case LIBSSH2_FX_NO_SUCH_FILE:        return "no such file";
        case LIBSSH2_FX_PERMISSION_DENIED:   return "permission denied";
        case LIBSSH2_FX_FAILURE:             return "failure";
        case LIBSSH2_FX_BAD_MESSAGE:         return "bad message";
        case LIBSSH2_FX_NO_SUCH_PATH:        return "no such path";
        case LIBSSH2_FX_FILE_ALREADY_EXISTS: return "file already exists";
        case LIBSSH2_FX_WRITE_PROTECT:       return "write protected";
        case LIBSSH2_FX_NO_SPACE_ON_FILESYSTEM: return "no space left";
        case LIBSSH2_FX_QUOTA_EXCEEDED:      return "quota exceeded";
        case LIBSSH2_FX_DIR_NOT_EMPTY:       return "directory not empty";
        case LIBSSH2_FX_NOT_A_DIRECTORY:     return "not a directory";
        case LIBSSH2_FX_INVALID_FILENAME:    return "invalid filename";
        default:                             return "sftp error";
    }
}

}  // namespace

unsigned long upload_open_flags(bool overwrite) {
    unsigned long flags = LIBSSH2_FXF_WRITE | LIBSSH2_FXF_CREAT;
    return flags | (overwrite ? LIBSSH2_FXF_TRUNC : LIBSSH2_FXF_EXCL);
}

bool is_exclusive_collision(unsigned long fx) {
    // SFTP v3 servers (OpenSSH) have no FILE_ALREADY_EXISTS and answer FAILURE.
    return fx == LIBSSH2_FX_FILE_ALREADY_EXISTS || fx == LIBSSH2_FX_FAILURE;
}

namespace {

FileInfo file_info_from_attrs(const std::string& name, const std::string& path,
                              const LIBSSH2_SFTP_ATTRIBUTES& attrs) {
    FileInfo info;
    info.name = name;
    info.path = path;
    if (attrs.flags & LIBSSH2_SFTP_ATTR_SIZE) info.size = attrs.filesize;
    if (attrs.flags & LIBSSH2_SFTP_ATTR_ACMODTIME) info.mtime = static_cast<std::time_t>(attrs.mtime);
    if (attrs.flags & LIBSSH2_SFTP_ATTR_UIDGID) {
        info.uid = attrs.uid;
        info.gid = attrs.gid;
    }
    if (attrs.flags & LIBSSH2_SFTP_ATTR_PERMISSIONS) {
        info.is_dir = (attrs.permissions & LIBSSH2_SFTP_S_IFMT) == LIBSSH2_SFTP_S_IFDIR;
        info.mode = mode_string(attrs.permissions);
        info.permissions = permission_string(attrs.permissions);
    } else {
        info.mode = mode_string(0);
        info.permissions = permission_string(0);
    }
    return info;
}

// Retry a pointer-returning libssh2 call while it reports EAGAIN.
template <typename T>
T* retry_ptr(RemoteConnection& conn, Clock::time_point deadline,
             const std::function<T*()>& fn, int* rc_out) {
    for (;;) {
        T* p;
        int err;
        {
            std::lock_guard<std::mutex> lock(*conn.io_mutex());
            p = fn();
            err = p ? 0 : libssh2_session_last_errno(conn.raw_session());
        }
        if (p || err != LIBSSH2_ERROR_EAGAIN) {
            if (rc_out) *rc_out = err;
            return p;
        }
        if (remaining_ms(deadline) == 0) {
            if (rc_out) *rc_out = LIBSSH2_ERROR_TIMEOUT;
            return nullptr;
        }
        conn.wait_io(std::min(remaining_ms(deadline), 100));
    }
}

}  // namespace

// Closes an open file or directory handle on scope exit.
class FileTransferClient::HandleGuard {
public:
    HandleGuard(FileTransferClient& client, LIBSSH2_SFTP_HANDLE* h) : client_(client), h_(h) {}
    ~HandleGuard() { if (h_) client_.close_handle(h_); }
    HandleGuard(const HandleGuard&) = delete;
    HandleGuard& operator=(const HandleGuard&) = delete;

private:
    FileTransferClient& client_;
    LIBSSH2_SFTP_HANDLE* h_;
};

// ── Construction ────────────────────────────────────────────

Result<std::unique_ptr<FileTransferClient>> FileTransferClient::connect(const ConnectParams& params) {
    auto conn = RemoteConnection::open(params);
    if (conn.is_err()) {
        return Result<std::unique_ptr<FileTransferClient>>::Err(conn.kind, conn.error);
    }
    return open(std::move(conn.value));
}

Result<std::unique_ptr<FileTransferClient>> FileTransferClient::open(std::unique_ptr<RemoteConnection> conn) {
    using R = Result<std::unique_ptr<FileTransferClient>>;
    if (!conn || !conn->is_open()) {
        return R::Err(ErrorKind::Connection, "sftp: connection is not open");
    }

    auto deadline = Clock::now() + std::chrono::seconds(SFTP_OP_TIMEOUT_SECS);
    LIBSSH2_SESSION* session = conn->raw_session();
    int rc = 0;
    LIBSSH2_SFTP* sftp = retry_ptr<LIBSSH2_SFTP>(*conn, deadline,
        [session] { return libssh2_sftp_init(session); }, &rc);
    if (!sftp) {
        auto kind = (rc == LIBSSH2_ERROR_TIMEOUT) ? ErrorKind::Timeout : ErrorKind::Connection;
        return R::Err(kind, error_context("sftp init", conn->host_id(),
                                          fmt::format("subsystem unavailable (rc={})", rc)));
    }

    remops_log(fmt::format("sftp opened on {}", conn->target()));
    return R::Ok(std::unique_ptr<FileTransferClient>(
        new FileTransferClient(std::move(conn), sftp)));
}

FileTransferClient::FileTransferClient(std::unique_ptr<RemoteConnection> conn, LIBSSH2_SFTP* sftp)
    : conn_(std::move(conn)), sftp_(sftp) {}

FileTransferClient::~FileTransferClient() {
    if (sftp_ && conn_ && conn_->is_open()) {
        auto deadline = Clock::now() + std::chrono::seconds(2);
        LIBSSH2_SFTP* sftp = sftp_;
        conn_->retry_io(deadline, [sftp] { return libssh2_sftp_shutdown(sftp); });
    }
    sftp_ = nullptr;
}

// ── Helpers ─────────────────────────────────────────────────

Clock::time_point FileTransferClient::op_deadline() const {
    return Clock::now() + std::chrono::seconds(SFTP_OP_TIMEOUT_SECS);
}

LIBSSH2_SFTP_HANDLE* FileTransferClient::open_handle(Clock::time_point deadline,
                                                     const std::function<LIBSSH2_SFTP_HANDLE*()>& fn,
                                                     int* rc_out) {
    int rc = 0;
    LIBSSH2_SFTP_HANDLE* h = retry_ptr<LIBSSH2_SFTP_HANDLE>(*conn_, deadline, fn, &rc);
    if (rc_out) *rc_out = rc;
    return h;
}

void FileTransferClient::close_handle(LIBSSH2_SFTP_HANDLE* handle) {
    int rc = conn_->retry_io(op_deadline(), [handle] { return libssh2_sftp_close_handle(handle); });
    if (rc != 0) remops_log(fmt::format("sftp close handle on {}: rc={}", conn_->target(), rc));
}

Result<void> FileTransferClient::failure(const std::string& op, const std::string& path, int rc) {
    const std::string& host = conn_->host_id();
    if (rc == LIBSSH2_ERROR_TIMEOUT) {
        return Result<void>::Err(ErrorKind::Timeout,
            error_context(op, host, fmt::format("{}: timed out after {}s", path, SFTP_OP_TIMEOUT_SECS)));
    }
    if (rc == LIBSSH2_ERROR_SFTP_PROTOCOL) {
        unsigned long fx;
        {
            std::lock_guard<std::mutex> lock(*conn_->io_mutex());
            fx = libssh2_sftp_last_error(sftp_);
        }
        auto kind = (fx == LIBSSH2_FX_NO_SUCH_FILE || fx == LIBSSH2_FX_NO_SUCH_PATH)
                        ? ErrorKind::NotFound : ErrorKind::Resource;
        return Result<void>::Err(kind,
            error_context(op, host, fmt::format("{}: {}", path, sftp_status_name(fx))));
    }

    char* msg = nullptr;
    {
        std::lock_guard<std::mutex> lock(*conn_->io_mutex());
        libssh2_session_last_error(conn_->raw_session(), &msg, nullptr, 0);
    }
    return Result<void>::Err(ErrorKind::Connection,
        error_context(op, host, fmt::format("{}: {} (rc={})", path, msg ? msg : "transport error", rc)));
}

// ── Metadata ────────────────────────────────────────────────

Result<FileInfo> FileTransferClient::stat(const std::string& path) {
    auto clean = validate_path(path);
    if (clean.is_err()) return Result<FileInfo>::Err(clean.kind, clean.error);
    return stat_validated(clean.value);
}

Result<FileInfo> FileTransferClient::stat_validated(const std::string& path) {
    LIBSSH2_SFTP_ATTRIBUTES attrs{};
    LIBSSH2_SFTP* sftp = sftp_;
    int rc = conn_->retry_io(op_deadline(), [&] {
        return libssh2_sftp_stat_ex(sftp, path.c_str(), static_cast<unsigned int>(path.size()),
                                    LIBSSH2_SFTP_STAT, &attrs);
    });
    if (rc != 0) {
        auto f = failure("stat", path, rc);
        return Result<FileInfo>::Err(f.kind, f.error);
    }
    return Result<FileInfo>::Ok(file_info_from_attrs(base_name(path), path, attrs));
}

Result<std::vector<FileInfo>> FileTransferClient::list_files(const std::string& path) {
    using R = Result<std::vector<FileInfo>>;
    auto clean = validate_path(path);
    if (clean.is_err()) return R::Err(clean.kind, clean.error);
    const std::string& dir = clean.value;

    int rc = 0;
    LIBSSH2_SFTP* sftp = sftp_;
    LIBSSH2_SFTP_HANDLE* h = open_handle(op_deadline(), [&] {
        return libssh2_sftp_open_ex(sftp, dir.c_str(), static_cast<unsigned int>(dir.size()),
                                    0, 0, LIBSSH2_SFTP_OPENDIR);
    }, &rc);
    if (!h) {
        auto f = failure("list", dir, rc);
        return R::Err(f.kind, f.error);
    }
    HandleGuard guard(*this, h);

    std::vector<FileInfo> entries;
    char name[512];
    for (;;) {
        LIBSSH2_SFTP_ATTRIBUTES attrs{};
        int n = conn_->retry_io(op_deadline(), [&] {
            return libssh2_sftp_readdir_ex(h, name, sizeof(name), nullptr, 0, &attrs);
        });
        if (n == 0) break;
        if (n < 0) {
            auto f = failure("list", dir, n);
            return R::Err(f.kind, f.error);
        }
        std::string entry(name, static_cast<size_t>(n));
        if (entry == "." || entry == "..") continue;
        entries.push_back(file_info_from_attrs(entry, join_path(dir, entry), attrs));
    }

    remops_log(fmt::format("sftp list {}:{} -> {} entries", conn_->host_id(), dir, entries.size()));
    return R::Ok(std::move(entries));
}

Result<DirectoryListing> FileTransferClient::list_directory(const std::string& path) {
    auto clean = validate_path(path);
    if (clean.is_err()) return Result<DirectoryListing>::Err(clean.kind, clean.error);

    auto files = list_files(clean.value);
    if (files.is_err()) return Result<DirectoryListing>::Err(files.kind, files.error);

    DirectoryListing listing;
    listing.path = clean.value;
    if (clean.value != "/") listing.parent = parent_path(clean.value);
    for (const auto& f : files.value) {
        listing.total_size += f.size;
        if (f.is_dir) ++listing.dir_count;
        else ++listing.file_count;
    }
    listing.entries = std::move(files.value);
    return Result<DirectoryListing>::Ok(std::move(listing));
}

// ── Transfers ───────────────────────────────────────────────

Result<uint64_t> FileTransferClient::upload(const std::string& local_path,
                                            const std::string& remote_path,
                                            bool overwrite, const ProgressCallback& progress) {
    std::error_code ec;
    uint64_t size = fs::file_size(local_path, ec);
    if (ec) {
        return Result<uint64_t>::Err(ErrorKind::Resource,
            error_context("upload", conn_->host_id(), fmt::format("{}: {}", local_path, ec.message())));
    }
    std::ifstream in(local_path, std::ios::binary);
    if (!in) {
        return Result<uint64_t>::Err(ErrorKind::Resource,
            error_context("upload", conn_->host_id(), fmt::format("cannot open {}", local_path)));
    }
    return upload(in, size, remote_path, overwrite, progress);
}

Result<uint64_t> FileTransferClient::upload(std::istream& source, uint64_t size,
                                            const std::string& remote_path,
                                            bool overwrite, const ProgressCallback& progress) {
    using R = Result<uint64_t>;
    auto clean = validate_path(remote_path);
    if (clean.is_err()) return R::Err(clean.kind, clean.error);
    const std::string& dest = clean.value;

    int rc = 0;
    LIBSSH2_SFTP* sftp = sftp_;
    const unsigned long flags = upload_open_flags(overwrite);
    LIBSSH2_SFTP_HANDLE* h = open_handle(op_deadline(), [&] {
        return libssh2_sftp_open_ex(sftp, dest.c_str(), static_cast<unsigned int>(dest.size()),
                                    flags, 0644, LIBSSH2_SFTP_OPENFILE);
    }, &rc);
    if (!h) {
        if (!overwrite && rc == LIBSSH2_ERROR_SFTP_PROTOCOL) {
            unsigned long fx;
            {
                std::lock_guard<std::mutex> lock(*conn_->io_mutex());
                fx = libssh2_sftp_last_error(sftp_);
            }
            if (is_exclusive_collision(fx)) {
                return R::Err(ErrorKind::Resource,
                    error_context("upload", conn_->host_id(), fmt::format("{}: already exists", dest)));
            }
        }
        auto f = failure("upload", dest, rc);
        return R::Err(f.kind, f.error);
    }

    remops_log(fmt::format("sftp upload {}:{} ({} bytes)", conn_->host_id(), dest, size));

    auto reader = [&](char* buf, size_t cap) -> Result<size_t> {
        source.read(buf, static_cast<std::streamsize>(cap));
        if (source.bad()) return Result<size_t>::Err("local read error");
        return Result<size_t>::Ok(static_cast<size_t>(source.gcount()));
    };
    auto writer = [&](const char* buf, size_t len) -> Result<size_t> {
        size_t off = 0;
        while (off < len) {
            int n = conn_->retry_io(op_deadline(), [&] {
                return static_cast<int>(libssh2_sftp_write(h, buf + off, len - off));
            });
            if (n < 0) {
                auto f = failure("upload", dest, n);
                return Result<size_t>::Err(f.kind, f.error, off);
            }
            off += static_cast<size_t>(n);
        }
        return Result<size_t>::Ok(off);
    };

    Result<uint64_t> copied = R::Ok(0);
    {
        HandleGuard guard(*this, h);
        copied = copy_chunks(reader, writer, size, progress);
    }

    if (copied.is_err()) {
        remops_log(fmt::format("sftp upload {}:{} failed: {}", conn_->host_id(), dest, copied.error));
        return R::Err(copied.kind, error_context("upload", conn_->host_id(), copied.error), copied.value);
    }
    remops_log(fmt::format("sftp upload {}:{} done, {}", conn_->host_id(), dest,
                           format_bytes(copied.value)));
    return copied;
}

Result<uint64_t> FileTransferClient::download(const std::string& remote_path,
                                              const std::string& local_path,
                                              const ProgressCallback& progress) {
    std::ofstream out(local_path, std::ios::binary | std::ios::trunc);
    if (!out) {
        return Result<uint64_t>::Err(ErrorKind::Resource,
            error_context("download", conn_->host_id(), fmt::format("cannot write {}", local_path)));
    }
    return download(remote_path, out, progress);
}

Result<uint64_t> FileTransferClient::download(const std::string& remote_path, std::ostream& dest,
                                              const ProgressCallback& progress) {
    using R = Result<uint64_t>;
    auto clean = validate_path(remote_path);
    if (clean.is_err()) return R::Err(clean.kind, clean.error);
    const std::string& src = clean.value;

    auto info = stat_validated(src);
    if (info.is_err()) return R::Err(info.kind, info.error);
    if (info.value.is_dir) {
        return R::Err(ErrorKind::Resource,
            error_context("download", conn_->host_id(), fmt::format("{}: is a directory", src)));
    }

    int rc = 0;
    LIBSSH2_SFTP* sftp = sftp_;
    LIBSSH2_SFTP_HANDLE* h = open_handle(op_deadline(), [&] {
        return libssh2_sftp_open_ex(sftp, src.c_str(), static_cast<unsigned int>(src.size()),
                                    LIBSSH2_FXF_READ, 0, LIBSSH2_SFTP_OPENFILE);
    }, &rc);
    if (!h) {
        auto f = failure("download", src, rc);
        return R::Err(f.kind, f.error);
    }

    remops_log(fmt::format("sftp download {}:{} ({} bytes)", conn_->host_id(), src, info.value.size));

    auto reader = [&](char* buf, size_t cap) -> Result<size_t> {
        int n = conn_->retry_io(op_deadline(), [&] {
            return static_cast<int>(libssh2_sftp_read(h, buf, cap));
        });
        if (n < 0) {
            auto f = failure("download", src, n);
            return Result<size_t>::Err(f.kind, f.error);
        }
        return Result<size_t>::Ok(static_cast<size_t>(n));
    };
    auto writer = [&](const char* buf, size_t len) -> Result<size_t> {
        dest.write(buf, static_cast<std::streamsize>(len));
        if (!dest) return Result<size_t>::Err(ErrorKind::Resource, "local write error", 0);
        return Result<size_t>::Ok(len);
    };

    Result<uint64_t> copied = R::Ok(0);
    {
        HandleGuard guard(*this, h);
        copied = copy_chunks(reader, writer, info.value.size, progress);
    }
    dest.flush();

    if (copied.is_err()) {
        remops_log(fmt::format("sftp download {}:{} failed: {}", conn_->host_id(), src, copied.error));
        return R::Err(copied.kind, error_context("download", conn_->host_id(), copied.error), copied.value);
    }
    remops_log(fmt::format("sftp download {}:{} done, {}", conn_->host_id(), src,
                           format_bytes(copied.value)));
    return copied;
}

// ── Mutations ───────────────────────────────────────────────

Result<void> FileTransferClient::remove(const std::string& path) {
    auto clean = validate_path(path);
    if (clean.is_err()) return Result<void>::Err(clean.kind, clean.error);
    const std::string& target = clean.value;
    if (target == "/") {
        return Result<void>::Err(ErrorKind::Resource,
            error_context("remove", conn_->host_id(), "refusing to remove /"));
    }

    LIBSSH2_SFTP* sftp = sftp_;
    int rc = conn_->retry_io(op_deadline(), [&] {
        return libssh2_sftp_unlink_ex(sftp, target.c_str(), static_cast<unsigned int>(target.size()));
    });
    if (rc != 0) {
        // unlink refuses directories; fall back to rmdir for those.
        auto info = stat_validated(target);
        if (info.is_err()) return Result<void>::Err(info.kind, info.error);
        if (!info.value.is_dir) return failure("remove", target, rc);

        rc = conn_->retry_io(op_deadline(), [&] {
            return libssh2_sftp_rmdir_ex(sftp, target.c_str(), static_cast<unsigned int>(target.size()));
        });
        if (rc != 0) return failure("remove", target, rc);
    }

    remops_log(fmt::format("sftp remove {}:{}", conn_->host_id(), target));
    return Result<void>::Ok();
}

Result<void> FileTransferClient::rename(const std::string& from, const std::string& to) {
    auto src = validate_path(from);
    if (src.is_err()) return Result<void>::Err(src.kind, src.error);
    auto dst = validate_path(to);
    if (dst.is_err()) return Result<void>::Err(dst.kind, dst.error);

    LIBSSH2_SFTP* sftp = sftp_;
    int rc = conn_->retry_io(op_deadline(), [&] {
        return libssh2_sftp_rename_ex(sftp,
            src.value.c_str(), static_cast<unsigned int>(src.value.size()),
            dst.value.c_str(), static_cast<unsigned int>(dst.value.size()),
            LIBSSH2_SFTP_RENAME_OVERWRITE | LIBSSH2_SFTP_RENAME_ATOMIC | LIBSSH2_SFTP_RENAME_NATIVE);
    });
    if (rc != 0) return failure("rename", src.value, rc);

    remops_log(fmt::format("sftp rename {}:{} -> {}", conn_->host_id(), src.value, dst.value));
    return Result<void>::Ok();
}

Result<void> FileTransferClient::create_directory(const std::string& path, const std::string& mode) {
    auto clean = validate_path(path);
    if (clean.is_err()) return Result<void>::Err(clean.kind, clean.error);
    const std::string& dir = clean.value;

    unsigned long bits = 0;
    if (!mode.empty()) {
        auto parsed = parse_mode(mode);
        if (parsed.is_err()) return Result<void>::Err(parsed.kind, parsed.error);
        bits = parsed.value;
    }

    LIBSSH2_SFTP* sftp = sftp_;
    int rc = conn_->retry_io(op_deadline(), [&] {
        return libssh2_sftp_mkdir_ex(sftp, dir.c_str(), static_cast<unsigned int>(dir.size()),
                                     mode.empty() ? 0755 : static_cast<long>(bits));
    });
    if (rc != 0) return failure("mkdir", dir, rc);

    // The server applies its umask to mkdir; set the requested bits exactly.
    if (!mode.empty()) {
        LIBSSH2_SFTP_ATTRIBUTES attrs{};
        attrs.flags = LIBSSH2_SFTP_ATTR_PERMISSIONS;
        attrs.permissions = bits;
        rc = conn_->retry_io(op_deadline(), [&] {
            return libssh2_sftp_stat_ex(sftp, dir.c_str(), static_cast<unsigned int>(dir.size()),
                                        LIBSSH2_SFTP_SETSTAT, &attrs);
        });
        if (rc != 0) return failure("chmod", dir, rc);
    }

    remops_log(fmt::format("sftp mkdir {}:{} {}", conn_->host_id(), dir,
                           mode.empty() ? "(default mode)" : permission_string(bits)));
    return Result<void>::Ok();
}
