#pragma once

#include "cancel_token.h"
#include "providers/automation_adapter.h"
#include "task_tracker.h"
#include <optional>
#include <string>

namespace voicegate {

/// What the user hears after a DELEGATE: reply
struct DelegationOutcome {
    std::string reply;
    std::optional<std::string> task_id;    ///< Set only when automation accepted the task
};

/**
 * @brief Forward a task to automation, record it and build the confirmation reply
 *
 * A provider failure becomes an apologetic reply; only cancellation is an error.
 */
Result<DelegationOutcome> delegate_task(AutomationAdapter& automation,
                                        TaskTracker* tasks,
                                        const std::string& task,
                                        const SessionId& correlation_id,
                                        CancelToken* cancel);

} // namespace voicegate
