#include "providers/tts_adapter.h"
#include "logger.h"
#include "utils.h"
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace voicegate {

TtsAdapter::TtsAdapter(const TTSConfig& config,
                       std::shared_ptr<HttpTransport> transport,
                       ProviderHealth* health)
    : ProviderAdapter(provider::TTS, config, std::move(transport), health),
      config_(config) {}

Result<Bytes> TtsAdapter::synthesize(const std::string& text,
                                     const SessionId& correlation_id,
                                     CancelToken* cancel) {
    LOG_TTS("Synthesizing: \"" + utils::truncate_for_log(text) + "\"");

    json body;
    body["model"] = config_.model;
    body["voice"] = config_.voice;
    body["input"] = text;
    body["response_format"] = config_.response_format;
    HttpRequest request = make_request(body.dump(), "application/json");

    Bytes audio;
    auto result = invoke(request, correlation_id, cancel, [&](const HttpResponse& response) -> Result<void> {
        // Some providers report errors as a 200 JSON document
        if (response.content_type.find("application/json") != std::string::npos) {
            return make_provider_error(ProviderErrorKind::InvalidResponse,
                                       "TTS returned JSON instead of audio: " +
                                       utils::truncate_for_log(response.body, 120));
        }
        if (response.body.empty()) {
            return make_provider_error(ProviderErrorKind::InvalidResponse, "TTS returned no audio");
        }
        audio.assign(response.body.begin(), response.body.end());
        return Result<void>();
    });

    if (!result) {
        return result.error();
    }
    LOG_TTS("Synthesized " + std::to_string(audio.size()) + " bytes (" + config_.response_format + ")");
    return audio;
}

} // namespace voicegate
