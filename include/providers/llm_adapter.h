#pragma once

#include "providers/provider_adapter.h"
#include "memory/transcript.h"
#include <vector>

namespace voicegate {

/**
 * @brief Chat completion against an OpenAI-compatible or Ollama endpoint
 *
 * Format is chosen by the endpoint path: "/api/chat" means Ollama, anything
 * else is treated as OpenAI /chat/completions.
 */
class LlmAdapter : public ProviderAdapter {
public:
    LlmAdapter(const LLMConfig& config,
               std::shared_ptr<HttpTransport> transport,
               ProviderHealth* health);

    /**
     * @brief Generate the assistant reply
     * @param user_text Current user input
     * @param context Prior transcript messages (oldest first); trimmed to context_max_turns
     */
    Result<std::string> complete(const std::string& user_text,
                                 const std::vector<memory::ChatMessage>& context,
                                 const SessionId& correlation_id,
                                 CancelToken* cancel = nullptr);

    bool is_ollama() const { return is_ollama_; }

    /// Request body as sent to the provider (exposed for tests)
    std::string build_request_body(const std::string& user_text,
                                   const std::vector<memory::ChatMessage>& context) const;

private:
    LLMConfig config_;
    bool is_ollama_;
};

} // namespace voicegate
