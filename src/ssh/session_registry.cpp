#include "session_registry.hpp"
#include "command_client.hpp"
#include <core/log.hpp>
#include <fmt/format.h>

SessionFactory ssh_session_factory(const SessionOptions& opts) {
    return [opts](const ConnectParams& params, int rows, int cols)
               -> Result<std::shared_ptr<Session>> {
        using R = Result<std::shared_ptr<Session>>;
        auto client = CommandClient::connect(params);
        if (client.is_err()) return R::Err(client.kind, client.error);
        auto session = SshSession::open(client.value->release(), params.host_id,
                                        rows, cols, opts);
        if (session.is_err()) return R::Err(session.kind, session.error);
        return R::Ok(std::move(session.value));
    };
}

// ── Construction / Destruction ──────────────────────────────

SessionRegistry::SessionRegistry(SessionFactory factory)
    : factory_(std::move(factory)) {}

SessionRegistry::~SessionRegistry() {
    close_all();
}

// ── Creation ────────────────────────────────────────────────

Result<std::shared_ptr<Session>> SessionRegistry::create(const ConnectParams& params,
                                                         int rows, int cols) {
    using R = Result<std::shared_ptr<Session>>;
    if (params.host_id.empty()) {
        return R::Err(ErrorKind::Resource, "create session: host id is required");
    }
    if (rows <= 0) rows = DEFAULT_ROWS;
    if (cols <= 0) cols = DEFAULT_COLS;

    // Connecting can take seconds; the lock is only held to insert.
    auto made = factory_(params, rows, cols);
    if (made.is_err()) {
        remops_log(fmt::format("registry: create for {} failed: {}", params.host_id, made.error));
        return made;
    }
    return adopt(std::move(made.value));
}

Result<std::shared_ptr<Session>> SessionRegistry::adopt(std::shared_ptr<Session> session) {
    using R = Result<std::shared_ptr<Session>>;
    if (!session) return R::Err(ErrorKind::Resource, "adopt: null session");

    bool inserted;
    size_t count;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        inserted = sessions_.emplace(session->id(), session).second;
        count = sessions_.size();
    }
    if (!inserted) {
        session->close();
        return R::Err(ErrorKind::Resource,
                      fmt::format("session id {} already registered", session->id()));
    }
    remops_log(fmt::format("registry: + {} ({} live)", session->id(), count));
    return R::Ok(std::move(session));
}

// ── Lookup ──────────────────────────────────────────────────

std::shared_ptr<Session> SessionRegistry::get(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(id);
    return it == sessions_.end() ? nullptr : it->second;
}

std::shared_ptr<Session> SessionRegistry::get_by_host(const std::string& host_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [id, s] : sessions_) {
        if (s->host_id() == host_id) return s;
    }
    return nullptr;
}

size_t SessionRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.size();
}

std::vector<std::string> SessionRegistry::ids() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> out;
    out.reserve(sessions_.size());
    for (const auto& [id, s] : sessions_) out.push_back(id);
    return out;
}

// ── Teardown ────────────────────────────────────────────────

void SessionRegistry::close_each(std::vector<std::shared_ptr<Session>>& doomed) {
    for (auto& s : doomed) s->close();
}

Result<void> SessionRegistry::close(const std::string& id) {
    std::shared_ptr<Session> doomed;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sessions_.find(id);
        if (it == sessions_.end()) {
            return Result<void>::Err(ErrorKind::NotFound, "session not found: " + id);
        }
        doomed = std::move(it->second);
        sessions_.erase(it);
    }
    doomed->close();
    remops_log(fmt::format("registry: - {}", id));
    return Result<void>::Ok();
}

size_t SessionRegistry::close_all_for_host(const std::string& host_id) {
    std::vector<std::shared_ptr<Session>> doomed;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = sessions_.begin(); it != sessions_.end();) {
            if (it->second->host_id() == host_id) {
                doomed.push_back(std::move(it->second));
                it = sessions_.erase(it);
            } else {
                ++it;
            }
        }
    }
    close_each(doomed);
    if (!doomed.empty()) {
        remops_log(fmt::format("registry: closed {} session(s) for {}", doomed.size(), host_id));
    }
    return doomed.size();
}

size_t SessionRegistry::close_all() {
    std::vector<std::shared_ptr<Session>> doomed;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& [id, s] : sessions_) doomed.push_back(std::move(s));
        sessions_.clear();
    }
    close_each(doomed);
    return doomed.size();
}

size_t SessionRegistry::reap_idle(std::chrono::milliseconds max_idle) {
    std::vector<std::shared_ptr<Session>> doomed;
    auto cutoff = Clock::now() - max_idle;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = sessions_.begin(); it != sessions_.end();) {
            if (it->second->last_activity() < cutoff) {
                doomed.push_back(std::move(it->second));
                it = sessions_.erase(it);
            } else {
                ++it;
            }
        }
    }
    close_each(doomed);
    for (const auto& s : doomed) {
        remops_log(fmt::format("registry: reaped idle session {}", s->id()));
    }
    return doomed.size();
}
