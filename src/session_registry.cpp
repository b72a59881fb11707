#include "session_registry.h"
#include "logger.h"
#include <iomanip>
#include <random>
#include <sstream>

namespace voicegate {

SessionRegistry::SessionRegistry(const Config& config, Pipeline& pipeline, TaskTracker* tasks)
    : config_(config),
      pipeline_(pipeline),
      tasks_(tasks),
      max_sessions_(config.server.max_sessions) {}

SessionRegistry::~SessionRegistry() {
    stop_sweeper();
    close_all("registry shutdown");
}

SessionId SessionRegistry::generate_id() {
    static thread_local std::mt19937_64 rng(std::random_device{}());
    std::ostringstream oss;
    oss << std::hex << std::setfill('0') << std::setw(16) << rng()
        << "-" << std::dec << ++id_counter_;
    return oss.str();
}

Result<std::shared_ptr<Session>> SessionRegistry::open(std::shared_ptr<Connection> connection) {
    std::shared_ptr<Session> session;
    size_t count = 0;
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        if (sessions_.size() >= max_sessions_) {
            LOG_REGISTRY("Refusing connection from " + connection->remote_endpoint() + ": " +
                         std::to_string(sessions_.size()) + "/" + std::to_string(max_sessions_) + " sessions open");
            return make_error(ErrorType::CapacityExceeded,
                              "Server is at capacity (" + std::to_string(max_sessions_) + " sessions)");
        }
        SessionId id = generate_id();
        session = std::make_shared<Session>(id, std::move(connection), config_, pipeline_, tasks_);
        sessions_[id] = session;
        count = sessions_.size();
    }

    LOG_REGISTRY("Opened " + session->id() + " (" + std::to_string(count) + "/" +
                 std::to_string(max_sessions_) + ")");
    return session;
}

bool SessionRegistry::close(const SessionId& id, const std::string& reason) {
    std::shared_ptr<Session> session;
    size_t count = 0;
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto it = sessions_.find(id);
        if (it == sessions_.end()) {
            return false;
        }
        session = it->second;
        sessions_.erase(it);
        count = sessions_.size();
    }

    // Outside the registry lock: closing joins the session's worker
    session->close(reason);
    LOG_REGISTRY("Closed " + id + " (" + reason + "), " + std::to_string(count) + " remaining");
    return true;
}

std::shared_ptr<Session> SessionRegistry::find(const SessionId& id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = sessions_.find(id);
    return it == sessions_.end() ? nullptr : it->second;
}

size_t SessionRegistry::active_count() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return sessions_.size();
}

size_t SessionRegistry::sweep_idle() {
    const int64_t timeout_ms = config_.server.idle_timeout_ms;
    std::vector<std::shared_ptr<Session>> candidates;
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        for (const auto& entry : sessions_) {
            if (entry.second->idle_ms() > timeout_ms) {
                candidates.push_back(entry.second);
            }
        }
    }

    size_t closed = 0;
    for (const auto& session : candidates) {
        // Re-checked under the session's turn lock
        if (!session->close_if_idle(timeout_ms)) {
            continue;
        }
        if (close(session->id(), "idle timeout")) {
            closed++;
        }
    }
    if (closed > 0) {
        LOG_REGISTRY("Idle sweep closed " + std::to_string(closed) + " session(s)");
    }
    return closed;
}

void SessionRegistry::start_sweeper() {
    std::lock_guard<std::mutex> lock(sweeper_mutex_);
    if (sweeper_.joinable()) {
        return;
    }
    sweeper_stop_ = false;
    sweeper_ = std::thread(&SessionRegistry::sweeper_loop, this);
}

void SessionRegistry::stop_sweeper() {
    {
        std::lock_guard<std::mutex> lock(sweeper_mutex_);
        sweeper_stop_ = true;
    }
    sweeper_cv_.notify_all();
    if (sweeper_.joinable()) {
        sweeper_.join();
    }
}

void SessionRegistry::sweeper_loop() {
    const auto interval = std::chrono::milliseconds(config_.server.sweep_interval_ms);
    std::unique_lock<std::mutex> lock(sweeper_mutex_);
    while (!sweeper_stop_) {
        if (sweeper_cv_.wait_for(lock, interval, [this] { return sweeper_stop_; })) {
            break;
        }
        lock.unlock();
        sweep_idle();
        lock.lock();
    }
}

void SessionRegistry::close_all(const std::string& reason) {
    std::vector<SessionId> ids;
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        for (const auto& entry : sessions_) {
            ids.push_back(entry.first);
        }
    }
    for (const auto& id : ids) {
        close(id, reason);
    }
}

} // namespace voicegate
