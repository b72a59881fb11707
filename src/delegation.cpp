#include "delegation.h"
#include "logger.h"

namespace voicegate {

Result<DelegationOutcome> delegate_task(AutomationAdapter& automation,
                                        TaskTracker* tasks,
                                        const std::string& task,
                                        const SessionId& correlation_id,
                                        CancelToken* cancel) {
    std::string conversation_id = "voice_task_" + correlation_id + "_" + std::to_string(wall_clock_ms());
    auto result = automation.delegate(task, conversation_id, correlation_id, cancel);
    if (!result) {
        if (result.error().type == ErrorType::Cancelled) {
            return result.error();
        }
        Logger::warn("[Automation] Delegation failed for " + correlation_id + ": " + describe(result.error()));
        DelegationOutcome declined;
        declined.reply = "I couldn't reach your automation team right now. Please try again later.";
        return declined;
    }

    DelegationOutcome accepted;
    accepted.task_id = tasks ? tasks->record(task, correlation_id, conversation_id) : std::string("unrecorded");
    accepted.reply = "I've assigned that to your automation team. Task ID: " + *accepted.task_id;
    LOG_TRACE(correlation_id, "automation", "delegated " + *accepted.task_id);
    return accepted;
}

} // namespace voicegate
