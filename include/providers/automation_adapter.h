#pragma once

#include "providers/provider_adapter.h"

namespace voicegate {

/**
 * @brief Hands delegated tasks to the core automation service
 *
 * POST {message, conversation_id}; any 2xx means the task was accepted.
 */
class AutomationAdapter : public ProviderAdapter {
public:
    AutomationAdapter(const AutomationConfig& config,
                      std::shared_ptr<HttpTransport> transport,
                      ProviderHealth* health);

    Result<void> delegate(const std::string& task_description,
                          const std::string& conversation_id,
                          const SessionId& correlation_id,
                          CancelToken* cancel = nullptr);

    /// Text after the delegation prefix when reply asks for delegation, else nullopt
    std::optional<std::string> extract_task(const std::string& reply) const;

private:
    AutomationConfig config_;
};

} // namespace voicegate
