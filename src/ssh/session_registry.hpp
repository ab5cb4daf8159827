#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>
#include <core/types.hpp>
#include "session.hpp"
#include "remote_connection.hpp"

// Builds a live Session for a host. Injected so tests can supply fakes.
using SessionFactory = std::function<Result<std::shared_ptr<Session>>(
    const ConnectParams& params, int rows, int cols)>;

// Default factory: connect, then open a pty shell on the connection.
SessionFactory ssh_session_factory(const SessionOptions& opts = {});

// SessionRegistry: the process-wide map of live sessions.
//
// Every map mutation happens under one mutex. Sessions removed from the
// map are closed outside the lock but before the removing call returns.
class SessionRegistry {
public:
    explicit SessionRegistry(SessionFactory factory = ssh_session_factory());
    ~SessionRegistry();

    SessionRegistry(const SessionRegistry&) = delete;
    SessionRegistry& operator=(const SessionRegistry&) = delete;

    Result<std::shared_ptr<Session>> create(const ConnectParams& params,
                                            int rows = DEFAULT_ROWS,
                                            int cols = DEFAULT_COLS);

    // Register an already-open session. Rejects (and closes) duplicates.
    Result<std::shared_ptr<Session>> adopt(std::shared_ptr<Session> session);

    std::shared_ptr<Session> get(const std::string& id) const;

    // Any one live session for the host; no ordering guarantee.
    std::shared_ptr<Session> get_by_host(const std::string& host_id) const;

    Result<void> close(const std::string& id);
    size_t close_all_for_host(const std::string& host_id);
    size_t close_all();

    // Close every session whose last activity is strictly older than max_idle.
    size_t reap_idle(std::chrono::milliseconds max_idle);

    size_t size() const;
    std::vector<std::string> ids() const;

private:
    static void close_each(std::vector<std::shared_ptr<Session>>& doomed);

    SessionFactory factory_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<Session>> sessions_;
};
