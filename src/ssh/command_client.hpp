#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <core/types.hpp>
#include <core/cancel_token.hpp>
#include "remote_connection.hpp"

// Fill exit_code / error from what the remote side reported when the
// channel closed. A signal wins over a status.
void apply_exit_status(CommandOutput& out, int exit_status, const std::string& exit_signal);

// Run one command on its own exec channel of an existing connection.
// timeout == 0 means unbounded; the optional cancel token is then the only
// way to stop it. On expiry the channel is torn down and exit_code is empty.
CommandOutput execute_on(RemoteConnection& conn, const std::string& command,
                         std::chrono::milliseconds timeout,
                         const CancelToken* cancel = nullptr);

// Same, piping input to the command's stdin before EOF.
CommandOutput execute_on_with_input(RemoteConnection& conn, const std::string& command,
                                    const std::string& input,
                                    std::chrono::milliseconds timeout,
                                    const CancelToken* cancel = nullptr);

// CommandClient: one authenticated connection used for bounded,
// non-interactive command execution.
class CommandClient {
public:
    static Result<std::unique_ptr<CommandClient>> connect(const ConnectParams& params);

    explicit CommandClient(std::unique_ptr<RemoteConnection> conn);

    CommandOutput execute(const std::string& command, std::chrono::milliseconds timeout,
                          const CancelToken* cancel = nullptr);
    CommandOutput execute_with_input(const std::string& command, const std::string& input,
                                     std::chrono::milliseconds timeout,
                                     const CancelToken* cancel = nullptr);

    RemoteConnection& connection() { return *conn_; }

    // Hand the connection to another owner (e.g. a Session).
    std::unique_ptr<RemoteConnection> release() { return std::move(conn_); }

private:
    std::unique_ptr<RemoteConnection> conn_;
};
