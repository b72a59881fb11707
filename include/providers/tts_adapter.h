#pragma once

#include "providers/provider_adapter.h"

namespace voicegate {

/**
 * @brief Text-to-speech over an OpenAI-compatible /audio/speech endpoint
 *
 * Sends {model, voice, input, response_format}; the response body is the
 * encoded audio, returned unchanged.
 */
class TtsAdapter : public ProviderAdapter {
public:
    TtsAdapter(const TTSConfig& config,
               std::shared_ptr<HttpTransport> transport,
               ProviderHealth* health);

    Result<Bytes> synthesize(const std::string& text,
                             const SessionId& correlation_id,
                             CancelToken* cancel = nullptr);

private:
    TTSConfig config_;
};

} // namespace voicegate
