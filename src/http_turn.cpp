#include "http_turn.h"
#include "delegation.h"
#include "logger.h"
#include "utils.h"

namespace voicegate {

namespace {

Error at_stage(const std::string& stage, Error error) {
    if (error.type != ErrorType::Cancelled) {
        error.message = stage + ": " + error.message;
    }
    return error;
}

} // anonymous namespace

HttpTurn::HttpTurn(const Config& config, Pipeline& pipeline, TaskTracker* tasks)
    : config_(config), pipeline_(pipeline), tasks_(tasks) {}

Result<ServerMessage> HttpTurn::run(const std::string& body, bool voice) {
    std::string correlation_id = "http-" + std::to_string(++seq_);

    auto parsed = parse_client_message(body, config_.audio.sample_rate);
    if (!parsed) {
        return parsed.error();
    }
    const ClientMessage& message = parsed.value();
    const ClientMessageType expected = voice ? ClientMessageType::Voice : ClientMessageType::Text;
    if (message.type != expected) {
        return make_protocol_error(std::string("Expected a '") + client_message_type_to_string(expected) +
                                   "' message, got '" + client_message_type_to_string(message.type) + "'");
    }

    if (!voice) {
        if (utils::is_empty_or_whitespace(message.text)) {
            return make_protocol_error("Text content is empty");
        }
        return run_text(message.text, correlation_id);
    }

    if (message.audio.empty()) {
        return make_protocol_error("Voice content is empty");
    }
    auto transcript = pipeline_.stt().transcribe(message.audio, correlation_id, &cancel_);
    if (!transcript) {
        return at_stage("Speech recognition failed", transcript.error());
    }
    if (transcript.value().empty()) {
        return make_protocol_error("No speech recognized in the audio");
    }
    LOG_TRACE(correlation_id, "stt", "\"" + utils::truncate_for_log(transcript.value()) + "\"");

    auto reply = run_text(transcript.value(), correlation_id);
    if (!reply) {
        return reply.error();
    }
    auto speech = pipeline_.tts().synthesize(reply.value().content, correlation_id, &cancel_);
    if (!speech) {
        return at_stage("Speech synthesis failed", speech.error());
    }
    ServerMessage out = ServerMessage::voice(reply.value().content, std::move(speech.value()));
    out.needs_delegation = reply.value().needs_delegation;
    return out;
}

Result<ServerMessage> HttpTurn::run_text(const std::string& user_text, const std::string& correlation_id) {
    auto completion = pipeline_.llm().complete(user_text, {}, correlation_id, &cancel_);
    if (!completion) {
        return at_stage("Language model failed", completion.error());
    }
    std::string reply = completion.value();
    LOG_TRACE(correlation_id, "llm", "\"" + utils::truncate_for_log(reply) + "\"");

    bool delegated = false;
    AutomationAdapter* automation = pipeline_.automation();
    if (automation) {
        std::optional<std::string> task = automation->extract_task(reply);
        if (task) {
            auto outcome = delegate_task(*automation, tasks_, *task, correlation_id, &cancel_);
            if (!outcome) {
                return at_stage("Delegation failed", outcome.error());
            }
            reply = outcome.value().reply;
            delegated = true;
        }
    }

    ServerMessage out = ServerMessage::text(reply);
    out.needs_delegation = delegated;
    return out;
}

} // namespace voicegate
