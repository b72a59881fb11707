#include "providers/pipeline.h"
#include "logger.h"

namespace voicegate {

namespace {

std::vector<std::string> provider_names(const Config& config) {
    std::vector<std::string> names = {provider::STT, provider::LLM, provider::TTS};
    if (config.automation.enabled) {
        names.push_back(provider::AUTOMATION);
    }
    return names;
}

} // anonymous namespace

Pipeline::Pipeline(const Config& config, std::shared_ptr<HttpTransport> transport)
    : health_(provider_names(config), config.health) {
    stt_ = std::make_unique<SttAdapter>(config.stt, config.audio.sample_rate, transport,
                                        health_.get(provider::STT));
    llm_ = std::make_unique<LlmAdapter>(config.llm, transport, health_.get(provider::LLM));
    tts_ = std::make_unique<TtsAdapter>(config.tts, transport, health_.get(provider::TTS));
    if (config.automation.enabled) {
        automation_ = std::make_unique<AutomationAdapter>(config.automation, transport,
                                                          health_.get(provider::AUTOMATION));
    }

    LOG_INFO("Pipeline ready: stt=" + config.stt.endpoint + " llm=" + config.llm.endpoint +
             (llm_->is_ollama() ? " (ollama)" : "") + " tts=" + config.tts.endpoint +
             (automation_ ? " automation=" + config.automation.endpoint : std::string()));
}

} // namespace voicegate
