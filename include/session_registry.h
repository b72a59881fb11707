#pragma once

#include "config.h"
#include "session.h"
#include <atomic>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <thread>
#include <vector>

namespace voicegate {

/**
 * @brief Process-wide table of live sessions
 *
 * Structural changes (open, close) take the lock exclusively; lookups and
 * health reads share it. A background sweeper closes sessions that have been
 * idle longer than server.idle_timeout_ms, skipping any session whose turn
 * lock is held.
 */
class SessionRegistry {
public:
    SessionRegistry(const Config& config, Pipeline& pipeline, TaskTracker* tasks = nullptr);
    ~SessionRegistry();

    SessionRegistry(const SessionRegistry&) = delete;
    SessionRegistry& operator=(const SessionRegistry&) = delete;

    /**
     * @brief Create and register a session for a new connection
     * @return The session, or CapacityExceeded when max_sessions are open
     */
    Result<std::shared_ptr<Session>> open(std::shared_ptr<Connection> connection);

    /// Close and deregister; false if the id is unknown (already closed)
    bool close(const SessionId& id, const std::string& reason);

    std::shared_ptr<Session> find(const SessionId& id) const;

    size_t active_count() const;
    size_t capacity() const { return max_sessions_; }

    /// One idle sweep; returns the number of sessions closed
    size_t sweep_idle();

    void start_sweeper();
    void stop_sweeper();

    /// Close every session (shutdown)
    void close_all(const std::string& reason);

private:
    SessionId generate_id();
    void sweeper_loop();

    Config config_;
    Pipeline& pipeline_;
    TaskTracker* tasks_;
    size_t max_sessions_;

    mutable std::shared_mutex mutex_;
    std::map<SessionId, std::shared_ptr<Session>> sessions_;
    std::atomic<uint64_t> id_counter_{0};

    std::thread sweeper_;
    std::mutex sweeper_mutex_;
    std::condition_variable sweeper_cv_;
    bool sweeper_stop_ = false;
};

} // namespace voicegate
