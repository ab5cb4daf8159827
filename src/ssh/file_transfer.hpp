#pragma once

#include <cstdint>
#include <ctime>
#include <functional>
#include <iosfwd>
#include <memory>
#include <string>
#include <vector>
#include <core/types.hpp>
#include "remote_connection.hpp"

typedef struct _LIBSSH2_SFTP LIBSSH2_SFTP;
typedef struct _LIBSSH2_SFTP_HANDLE LIBSSH2_SFTP_HANDLE;

struct FileInfo {
    std::string name;
    std::string path;           // absolute
    uint64_t size = 0;
    std::string mode;           // "drwxr-xr-x"
    std::time_t mtime = 0;
    bool is_dir = false;
    unsigned long uid = 0;
    unsigned long gid = 0;
    std::string permissions;    // "0755"
};

struct DirectoryListing {
    std::string path;
    std::string parent;         // empty for "/"
    std::vector<FileInfo> entries;
    uint64_t total_size = 0;
    int file_count = 0;
    int dir_count = 0;
};

// Open flags for an upload target: truncate when overwriting, otherwise
// exclusive create so an existing file makes the open itself fail.
unsigned long upload_open_flags(bool overwrite);

// SFTP status an exclusive create reports when the target already exists.
bool is_exclusive_collision(unsigned long fx);

// FileTransferClient: SFTP operations over one authenticated connection.
//
// Owns the connection and the SFTP subsystem handle. Every remote path is
// run through validate_path() before any I/O. Each SFTP request is bounded
// by SFTP_OP_TIMEOUT_SECS; transfers are bounded per chunk, not overall.
class FileTransferClient {
public:
    static Result<std::unique_ptr<FileTransferClient>> connect(const ConnectParams& params);
    static Result<std::unique_ptr<FileTransferClient>> open(std::unique_ptr<RemoteConnection> conn);

    ~FileTransferClient();

    FileTransferClient(const FileTransferClient&) = delete;
    FileTransferClient& operator=(const FileTransferClient&) = delete;

    // Entries of a directory, "." and ".." excluded.
    Result<std::vector<FileInfo>> list_files(const std::string& path);
    Result<DirectoryListing> list_directory(const std::string& path);
    Result<FileInfo> stat(const std::string& path);

    // Returns bytes written. A failure after the first chunk is a
    // PartialTransfer error whose value holds the bytes that landed.
    Result<uint64_t> upload(const std::string& local_path, const std::string& remote_path,
                            bool overwrite, const ProgressCallback& progress = nullptr);
    Result<uint64_t> upload(std::istream& source, uint64_t size, const std::string& remote_path,
                            bool overwrite, const ProgressCallback& progress = nullptr);

    // Returns bytes read.
    Result<uint64_t> download(const std::string& remote_path, const std::string& local_path,
                              const ProgressCallback& progress = nullptr);
    Result<uint64_t> download(const std::string& remote_path, std::ostream& dest,
                              const ProgressCallback& progress = nullptr);

    // File or empty directory.
    Result<void> remove(const std::string& path);
    Result<void> rename(const std::string& from, const std::string& to);

    // mode is octal text ("0750"); empty leaves it to the server.
    Result<void> create_directory(const std::string& path, const std::string& mode = "");

    RemoteConnection& connection() { return *conn_; }

private:
    class HandleGuard;

    FileTransferClient(std::unique_ptr<RemoteConnection> conn, LIBSSH2_SFTP* sftp);

    Clock::time_point op_deadline() const;

    // Retry a handle-returning call (open, opendir) through EAGAIN.
    LIBSSH2_SFTP_HANDLE* open_handle(Clock::time_point deadline,
                                     const std::function<LIBSSH2_SFTP_HANDLE*()>& fn,
                                     int* rc_out);
    void close_handle(LIBSSH2_SFTP_HANDLE* handle);

    // Map a failed libssh2 return code to a Result error.
    Result<void> failure(const std::string& op, const std::string& path, int rc);

    Result<FileInfo> stat_validated(const std::string& path);

    std::unique_ptr<RemoteConnection> conn_;
    LIBSSH2_SFTP* sftp_ = nullptr;
};
