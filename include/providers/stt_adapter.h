#pragma once

#include "providers/provider_adapter.h"

namespace voicegate {

/**
 * @brief Speech-to-text over an OpenAI-compatible /audio/transcriptions endpoint
 *
 * The utterance is uploaded as a WAV file in a multipart form along with the
 * model and language. The response is {"text": "..."}.
 */
class SttAdapter : public ProviderAdapter {
public:
    SttAdapter(const STTConfig& config,
               int sample_rate,
               std::shared_ptr<HttpTransport> transport,
               ProviderHealth* health);

    /**
     * @brief Transcribe one utterance
     * @return Trimmed transcript (may be empty when nothing intelligible was said)
     */
    Result<std::string> transcribe(const AudioBuffer& samples,
                                   const SessionId& correlation_id,
                                   CancelToken* cancel = nullptr);

private:
    std::string build_form(const Bytes& wav) const;

    STTConfig config_;
    int sample_rate_;
};

} // namespace voicegate
