#pragma once

#include "common.h"
#include <deque>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace voicegate {

/// A task handed to the core automation service
struct DelegatedTask {
    std::string id;
    std::string description;
    std::string type = "general";      ///< creation, analysis, writing, design, automation or general
    std::string status = "delegated";
    std::string created_at;            ///< ISO-8601
    SessionId session_id;
    std::string conversation_id;
};

/**
 * @brief In-memory table of delegated tasks (thread-safe)
 *
 * Entries outlive the session that created them; they are listed by the
 * /api/tasks endpoints. Only the newest max_tasks entries are kept.
 */
class TaskTracker {
public:
    explicit TaskTracker(size_t max_tasks = 1000);

    /// Record a task and return its id
    std::string record(const std::string& description,
                       const SessionId& session_id,
                       const std::string& conversation_id);

    std::optional<DelegatedTask> find(const std::string& id) const;

    /// Oldest first
    std::vector<DelegatedTask> list() const;
    size_t size() const;
    size_t capacity() const { return max_tasks_; }

private:
    mutable std::mutex mutex_;
    std::map<std::string, DelegatedTask> tasks_;
    std::deque<std::string> order_;
    size_t max_tasks_;
    uint64_t next_seq_ = 1;
};

/// Keyword classification of a task description, first matching group wins
std::string classify_task(const std::string& description);

} // namespace voicegate
