#pragma once

#include "config.h"
#include "session_orchestrator.h"
#include "transport_session.h"
#include <atomic>
#include <memory>
#include <mutex>

namespace voicegate {

/**
 * @brief One client conversation bound to one connection
 *
 * Owned by the SessionRegistry. The reader loop (run) executes on the
 * connection's own thread; turns execute on the orchestrator's worker.
 */
class Session {
public:
    Session(const SessionId& id,
            std::shared_ptr<Connection> connection,
            const Config& config,
            Pipeline& pipeline,
            TaskTracker* tasks);
    ~Session();

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    /**
     * @brief Reader loop: receive, validate, dispatch until disconnect or transport loss
     *
     * Blocks. Returns when the client disconnects, the connection breaks, or
     * close() is called from another thread.
     */
    void run();

    /// Cancel the in-flight turn, stop the worker and close the connection.
    /// Idempotent; true only for the call that actually closed.
    bool close(const std::string& reason);

    /**
     * @brief Close the session if it has been idle longer than timeout_ms
     *
     * The idle check and the sealing of the orchestrator both happen under the
     * turn lock, so a message arriving after the check can never start a turn
     * that the close then cancels.
     * @return true if this call closed the session
     */
    bool close_if_idle(int64_t timeout_ms);

    bool is_closed() const { return closed_.load(); }

    const SessionId& id() const { return id_; }
    TimePoint created_at() const { return created_at_; }

    /// Milliseconds since the last client message or finished turn
    int64_t idle_ms() const;
    void touch();

    /// Held by the worker for the duration of a turn; the idle sweeper only try-locks it
    std::mutex& turn_mutex() { return turn_mutex_; }

    SessionOrchestrator& orchestrator() { return *orchestrator_; }
    TransportSession& transport() { return transport_; }

private:
    SessionId id_;
    TimePoint created_at_;
    std::atomic<int64_t> last_activity_ms_;
    std::atomic<bool> closed_{false};
    std::mutex turn_mutex_;
    TransportSession transport_;
    std::unique_ptr<SessionOrchestrator> orchestrator_;
};

} // namespace voicegate
