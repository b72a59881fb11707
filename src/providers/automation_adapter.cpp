#include "providers/automation_adapter.h"
#include "logger.h"
#include "utils.h"
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace voicegate {

AutomationAdapter::AutomationAdapter(const AutomationConfig& config,
                                     std::shared_ptr<HttpTransport> transport,
                                     ProviderHealth* health)
    : ProviderAdapter(provider::AUTOMATION, config, std::move(transport), health),
      config_(config) {}

std::optional<std::string> AutomationAdapter::extract_task(const std::string& reply) const {
    std::string trimmed = utils::trim_copy(reply);
    if (config_.delegation_prefix.empty() || !utils::starts_with_ci(trimmed, config_.delegation_prefix)) {
        return std::nullopt;
    }
    std::string task = utils::trim_copy(utils::strip_prefix_ci(trimmed, config_.delegation_prefix));
    if (task.empty()) {
        return std::nullopt;
    }
    return task;
}

Result<void> AutomationAdapter::delegate(const std::string& task_description,
                                         const std::string& conversation_id,
                                         const SessionId& correlation_id,
                                         CancelToken* cancel) {
    Logger::info("[Automation] Delegating: \"" + utils::truncate_for_log(task_description) +
                 "\" conversation=" + conversation_id);

    json body;
    body["message"] = task_description;
    body["conversation_id"] = conversation_id;
    HttpRequest request = make_request(body.dump(), "application/json");

    return invoke(request, correlation_id, cancel, [](const HttpResponse&) -> Result<void> {
        return Result<void>();
    });
}

} // namespace voicegate
