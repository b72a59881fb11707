#include "messages.h"
#include "codec.h"
#include "utils.h"
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace voicegate {

namespace {

Result<ControlCommand> parse_control(const std::string& content) {
    std::string verb = utils::normalize_copy(utils::trim_copy(content));
    if (verb == "end-of-turn") return ControlCommand::EndOfTurn;
    if (verb == "disconnect") return ControlCommand::Disconnect;
    if (verb == "ping") return ControlCommand::Ping;
    return make_protocol_error("Unknown control command: " + utils::truncate_for_log(content, 32));
}

Result<AudioBuffer> decode_audio(const std::string& content, int sample_rate) {
    auto bytes = codec::base64_decode(content);
    if (!bytes) {
        return make_protocol_error("Voice content is not valid base64");
    }
    if (codec::is_wav(*bytes)) {
        return codec::wav_to_pcm(*bytes, sample_rate);
    }
    auto samples = codec::pcm_from_bytes(*bytes);
    if (!samples) {
        return make_protocol_error("Voice content has an odd byte count (expected 16-bit PCM)");
    }
    return *samples;
}

} // anonymous namespace

ClientMessage ClientMessage::text_message(const std::string& content, const std::string& ts) {
    ClientMessage msg;
    msg.type = ClientMessageType::Text;
    msg.text = content;
    msg.timestamp = ts;
    return msg;
}

ClientMessage ClientMessage::voice_message(const AudioBuffer& samples, const std::string& ts) {
    ClientMessage msg;
    msg.type = ClientMessageType::Voice;
    msg.audio = samples;
    msg.timestamp = ts;
    return msg;
}

ClientMessage ClientMessage::control_message(ControlCommand cmd, const std::string& ts) {
    ClientMessage msg;
    msg.type = ClientMessageType::Control;
    msg.command = cmd;
    msg.timestamp = ts;
    return msg;
}

ServerMessage ServerMessage::text(const std::string& content) {
    ServerMessage msg;
    msg.type = ServerMessageType::Text;
    msg.content = content;
    return msg;
}

ServerMessage ServerMessage::voice(const std::string& content, Bytes audio) {
    ServerMessage msg;
    msg.type = ServerMessageType::Voice;
    msg.content = content;
    msg.audio = std::move(audio);
    return msg;
}

ServerMessage ServerMessage::error(const std::string& content) {
    ServerMessage msg;
    msg.type = ServerMessageType::Error;
    msg.content = content;
    return msg;
}

ServerMessage ServerMessage::control(const std::string& content) {
    ServerMessage msg;
    msg.type = ServerMessageType::Control;
    msg.content = content;
    return msg;
}

ServerMessage ServerMessage::pong() {
    ServerMessage msg;
    msg.type = ServerMessageType::Pong;
    return msg;
}

Result<ClientMessage> parse_client_message(const std::string& raw, int sample_rate) {
    json j;
    try {
        j = json::parse(raw);
    } catch (const json::exception& e) {
        return make_protocol_error(std::string("Message is not valid JSON: ") + e.what());
    }

    if (!j.is_object()) {
        return make_protocol_error("Message must be a JSON object");
    }
    if (!j.contains("type") || !j["type"].is_string()) {
        return make_protocol_error("Message is missing string field 'type'");
    }
    if (!j.contains("content") || !j["content"].is_string()) {
        return make_protocol_error("Message is missing string field 'content'");
    }

    std::string type = j["type"].get<std::string>();
    std::string content = j["content"].get<std::string>();
    std::string timestamp;
    if (j.contains("timestamp") && j["timestamp"].is_string()) {
        timestamp = j["timestamp"].get<std::string>();
    }

    if (type == "text") {
        return ClientMessage::text_message(content, timestamp);
    }
    if (type == "voice") {
        auto audio = decode_audio(content, sample_rate);
        if (!audio) {
            return audio.error();
        }
        return ClientMessage::voice_message(audio.value(), timestamp);
    }
    if (type == "control") {
        auto cmd = parse_control(content);
        if (!cmd) {
            return cmd.error();
        }
        return ClientMessage::control_message(cmd.value(), timestamp);
    }
    return make_protocol_error("Unknown message type: " + utils::truncate_for_log(type, 32));
}

std::string serialize_server_message(const ServerMessage& message) {
    json j;
    j["type"] = server_message_type_to_string(message.type);
    j["content"] = message.content;
    j["timestamp"] = message.timestamp.empty() ? codec::iso8601_now() : message.timestamp;
    if (message.type == ServerMessageType::Voice && message.audio) {
        j["audio"] = codec::base64_encode(*message.audio);
    } else {
        j["audio"] = nullptr;
    }
    if (message.needs_delegation) {
        j["needs_delegation"] = true;
    }
    return j.dump();
}

const char* client_message_type_to_string(ClientMessageType type) {
    switch (type) {
        case ClientMessageType::Voice: return "voice";
        case ClientMessageType::Text: return "text";
        case ClientMessageType::Control: return "control";
    }
    return "unknown";
}

const char* server_message_type_to_string(ServerMessageType type) {
    switch (type) {
        case ServerMessageType::Text: return "text";
        case ServerMessageType::Voice: return "voice";
        case ServerMessageType::Error: return "error";
        case ServerMessageType::Control: return "control";
        case ServerMessageType::Pong: return "pong";
    }
    return "unknown";
}

} // namespace voicegate
