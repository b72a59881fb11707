#pragma once

#include "config.h"
#include "providers/automation_adapter.h"
#include "providers/llm_adapter.h"
#include "providers/provider_health.h"
#include "providers/stt_adapter.h"
#include "providers/tts_adapter.h"
#include <memory>

namespace voicegate {

/**
 * @brief Process-wide set of stage adapters and their health table
 *
 * Shared by every session. Adapters are stateless per call, so concurrent
 * sessions may invoke them in parallel.
 */
class Pipeline {
public:
    Pipeline(const Config& config, std::shared_ptr<HttpTransport> transport);

    Pipeline(const Pipeline&) = delete;
    Pipeline& operator=(const Pipeline&) = delete;

    SttAdapter& stt() { return *stt_; }
    LlmAdapter& llm() { return *llm_; }
    TtsAdapter& tts() { return *tts_; }

    /// nullptr when automation is disabled
    AutomationAdapter* automation() { return automation_.get(); }

    const ProviderHealthTable& health() const { return health_; }
    ProviderHealthTable& health() { return health_; }

private:
    ProviderHealthTable health_;
    std::unique_ptr<SttAdapter> stt_;
    std::unique_ptr<LlmAdapter> llm_;
    std::unique_ptr<TtsAdapter> tts_;
    std::unique_ptr<AutomationAdapter> automation_;
};

} // namespace voicegate
