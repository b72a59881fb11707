#include "providers/llm_adapter.h"
#include "logger.h"
#include "utils.h"
#include <nlohmann/json.hpp>
#include <algorithm>

using json = nlohmann::json;

namespace voicegate {

LlmAdapter::LlmAdapter(const LLMConfig& config,
                       std::shared_ptr<HttpTransport> transport,
                       ProviderHealth* health)
    : ProviderAdapter(provider::LLM, config, std::move(transport), health),
      config_(config) {
    is_ollama_ = config.endpoint.find("/api/chat") != std::string::npos;
}

std::string LlmAdapter::build_request_body(const std::string& user_text,
                                           const std::vector<memory::ChatMessage>& context) const {
    json messages = json::array();
    if (!config_.system_prompt.empty()) {
        messages.push_back({{"role", "system"}, {"content", config_.system_prompt}});
    }

    // Only the most recent turns; context is oldest first
    size_t max_messages = static_cast<size_t>(std::max(0, config_.context_max_turns)) * 2;
    size_t skip = context.size() > max_messages ? context.size() - max_messages : 0;
    for (size_t i = skip; i < context.size(); ++i) {
        messages.push_back({{"role", memory::chat_role_to_string(context[i].role)},
                            {"content", context[i].content}});
    }
    messages.push_back({{"role", "user"}, {"content", user_text}});

    json request;
    request["model"] = config_.model;
    request["messages"] = messages;
    request["stream"] = false;
    if (is_ollama_) {
        request["options"]["temperature"] = config_.temperature;
        request["options"]["num_predict"] = config_.max_tokens;
    } else {
        request["temperature"] = config_.temperature;
        request["max_tokens"] = config_.max_tokens;
    }
    return request.dump();
}

Result<std::string> LlmAdapter::complete(const std::string& user_text,
                                         const std::vector<memory::ChatMessage>& context,
                                         const SessionId& correlation_id,
                                         CancelToken* cancel) {
    LOG_LLM("Prompt: \"" + utils::truncate_for_log(user_text) + "\" (" +
            std::to_string(context.size()) + " context messages)");

    HttpRequest request = make_request(build_request_body(user_text, context), "application/json");

    std::string reply;
    auto result = invoke(request, correlation_id, cancel, [&](const HttpResponse& response) -> Result<void> {
        try {
            json j = json::parse(response.body);
            const json* message = nullptr;
            if (is_ollama_) {
                if (j.contains("message")) message = &j["message"];
            } else if (j.contains("choices") && j["choices"].is_array() && !j["choices"].empty() &&
                       j["choices"][0].contains("message")) {
                message = &j["choices"][0]["message"];
            }
            if (!message || !message->contains("content") || !(*message)["content"].is_string()) {
                return make_provider_error(ProviderErrorKind::InvalidResponse,
                                           "LLM response has no message content");
            }
            reply = utils::trim_copy((*message)["content"].get<std::string>());
        } catch (const json::exception& e) {
            return make_provider_error(ProviderErrorKind::InvalidResponse,
                                       std::string("LLM response is not JSON: ") + e.what());
        }
        if (reply.empty()) {
            return make_provider_error(ProviderErrorKind::InvalidResponse, "LLM returned an empty reply");
        }
        return Result<void>();
    });

    if (!result) {
        return result.error();
    }
    LOG_LLM("Reply: \"" + utils::truncate_for_log(reply) + "\"");
    return reply;
}

} // namespace voicegate
