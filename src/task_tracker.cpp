#include "task_tracker.h"
#include "codec.h"
#include "logger.h"
#include "utils.h"
#include <algorithm>

namespace voicegate {

namespace {

struct TaskKeywords {
    const char* type;
    std::vector<std::string> words;
};

const std::vector<TaskKeywords>& task_keywords() {
    static const std::vector<TaskKeywords> table = {
        {"creation", {"create", "generate", "make", "build"}},
        {"analysis", {"analyze", "research", "study", "investigate"}},
        {"writing", {"write", "draft", "compose"}},
        {"design", {"design", "plan", "architect"}},
        {"automation", {"automate", "script", "code"}},
    };
    return table;
}

} // anonymous namespace

std::string classify_task(const std::string& description) {
    std::string text = utils::normalize_copy(description);
    for (const auto& group : task_keywords()) {
        for (const auto& word : group.words) {
            if (text.find(word) != std::string::npos) {
                return group.type;
            }
        }
    }
    return "general";
}

TaskTracker::TaskTracker(size_t max_tasks)
    : max_tasks_(std::max<size_t>(1, max_tasks)) {}

std::string TaskTracker::record(const std::string& description,
                                const SessionId& session_id,
                                const std::string& conversation_id) {
    DelegatedTask task;
    task.description = description;
    task.type = classify_task(description);
    task.created_at = codec::iso8601_now();
    task.session_id = session_id;
    task.conversation_id = conversation_id;

    size_t evicted = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        task.id = "task_" + std::to_string(wall_clock_ms()) + "_" + std::to_string(next_seq_++);
        tasks_[task.id] = task;
        order_.push_back(task.id);
        while (order_.size() > max_tasks_) {
            tasks_.erase(order_.front());
            order_.pop_front();
            evicted++;
        }
    }

    Logger::info("[Tasks] Recorded " + task.id + " (" + task.type + ") for session " + session_id);
    if (evicted > 0) {
        Logger::debug("[Tasks] Forgot " + std::to_string(evicted) + " oldest task(s)");
    }
    return task.id;
}

std::optional<DelegatedTask> TaskTracker::find(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tasks_.find(id);
    if (it == tasks_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<DelegatedTask> TaskTracker::list() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<DelegatedTask> result;
    result.reserve(order_.size());
    for (const auto& id : order_) {
        result.push_back(tasks_.at(id));
    }
    return result;
}

size_t TaskTracker::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tasks_.size();
}

} // namespace voicegate
