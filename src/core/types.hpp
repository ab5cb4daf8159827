#pragma once

#include <string>
#include <optional>
#include <vector>
#include <functional>
#include <cstdint>
#include <fmt/format.h>

// Failure categories shared by every remote operation.
enum class ErrorKind {
    None,
    Connection,       // unreachable, refused, handshake or auth failure
    Timeout,          // per-operation deadline elapsed
    Protocol,         // malformed frame or unexpected remote reply
    Resource,         // bad path, bad mode, bad range, remote file errors
    PartialTransfer,  // stream broke mid-copy; value holds bytes moved
    NotFound,         // unknown session id or missing remote path
    Cancelled,        // caller's cancel token fired
};

const char* error_kind_name(ErrorKind kind);

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    std::string error;
    ErrorKind kind = ErrorKind::None;

    static Result<T> Ok(T val) {
        return {true, std::move(val), "", ErrorKind::None};
    }

    static Result<T> Err(const std::string& err) {
        return {false, T{}, err, ErrorKind::Resource};
    }

    static Result<T> Err(ErrorKind kind, const std::string& err) {
        return {false, T{}, err, kind};
    }

    // Failure that still carries a meaningful value (e.g. bytes copied).
    static Result<T> Err(ErrorKind kind, const std::string& err, T partial) {
        return {false, std::move(partial), err, kind};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    std::string error;
    ErrorKind kind = ErrorKind::None;

    static Result<void> Ok() {
        return {true, "", ErrorKind::None};
    }

    static Result<void> Err(const std::string& err) {
        return {false, err, ErrorKind::Resource};
    }

    static Result<void> Err(ErrorKind kind, const std::string& err) {
        return {false, err, kind};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// "<op> <host>: <detail>"
inline std::string error_context(const std::string& op, const std::string& host,
                                 const std::string& detail) {
    if (host.empty()) return fmt::format("{}: {}", op, detail);
    return fmt::format("{} {}: {}", op, host, detail);
}

// Output of a single remote command.
struct CommandOutput {
    std::optional<int> exit_code;
    std::string stdout_data;
    std::string stderr_data;
    std::string error;
    ErrorKind error_kind = ErrorKind::None;

    bool success() const { return error.empty() && exit_code && *exit_code == 0; }
    bool timed_out() const { return error_kind == ErrorKind::Timeout; }

    std::string get_output() const {
        return stdout_data.empty() ? stderr_data : stdout_data;
    }
};

// Which credential to try first when both key and password are supplied.
enum class AuthPreference { Key, Password };

// Status callback for operations
using StatusCallback = std::function<void(const std::string&)>;

// Cumulative bytes transferred, total bytes expected (0 if unknown).
using ProgressCallback = std::function<void(uint64_t done, uint64_t total)>;
