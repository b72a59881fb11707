#include "providers/stt_adapter.h"
#include "codec.h"
#include "logger.h"
#include "utils.h"
#include <nlohmann/json.hpp>
#include <sstream>

using json = nlohmann::json;

namespace voicegate {

namespace {

const char* kBoundary = "voicegate-7d1f2c9a4e8b";

void append_field(std::string& body, const std::string& name, const std::string& value) {
    body += "--";
    body += kBoundary;
    body += "\r\nContent-Disposition: form-data; name=\"" + name + "\"\r\n\r\n";
    body += value;
    body += "\r\n";
}

} // anonymous namespace

SttAdapter::SttAdapter(const STTConfig& config,
                       int sample_rate,
                       std::shared_ptr<HttpTransport> transport,
                       ProviderHealth* health)
    : ProviderAdapter(provider::STT, config, std::move(transport), health),
      config_(config),
      sample_rate_(sample_rate) {}

std::string SttAdapter::build_form(const Bytes& wav) const {
    std::string body;
    body.reserve(wav.size() + 512);

    body += "--";
    body += kBoundary;
    body += "\r\nContent-Disposition: form-data; name=\"file\"; filename=\"utterance.wav\"\r\n";
    body += "Content-Type: audio/wav\r\n\r\n";
    body.append(reinterpret_cast<const char*>(wav.data()), wav.size());
    body += "\r\n";

    if (!config_.model.empty()) {
        append_field(body, "model", config_.model);
    }
    if (!config_.language.empty()) {
        append_field(body, "language", config_.language);
    }
    append_field(body, "response_format", "json");

    body += "--";
    body += kBoundary;
    body += "--\r\n";
    return body;
}

Result<std::string> SttAdapter::transcribe(const AudioBuffer& samples,
                                           const SessionId& correlation_id,
                                           CancelToken* cancel) {
    std::ostringstream oss;
    oss << "Transcribing " << samples_to_ms(samples.size(), sample_rate_) << "ms of audio";
    LOG_STT(oss.str());

    Bytes wav = codec::pcm_to_wav(samples, sample_rate_);
    HttpRequest request = make_request(build_form(wav),
                                       std::string("multipart/form-data; boundary=") + kBoundary);

    std::string transcript;
    auto result = invoke(request, correlation_id, cancel, [&](const HttpResponse& response) -> Result<void> {
        try {
            json j = json::parse(response.body);
            if (!j.is_object() || !j.contains("text") || !j["text"].is_string()) {
                return make_provider_error(ProviderErrorKind::InvalidResponse,
                                           "STT response has no text field");
            }
            transcript = utils::trim_copy(j["text"].get<std::string>());
        } catch (const json::exception& e) {
            return make_provider_error(ProviderErrorKind::InvalidResponse,
                                       std::string("STT response is not JSON: ") + e.what());
        }
        return Result<void>();
    });

    if (!result) {
        return result.error();
    }
    LOG_STT("Transcript: \"" + utils::truncate_for_log(transcript) + "\"");
    return transcript;
}

} // namespace voicegate
