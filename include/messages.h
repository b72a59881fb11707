#pragma once

/**
 * @file messages.h
 * @brief WebSocket wire messages, one closed type per direction
 *
 * Client envelopes are validated here; nothing downstream sees raw JSON.
 */

#include "common.h"
#include "errors.h"
#include <string>
#include <optional>

namespace voicegate {

enum class ClientMessageType {
    Voice,
    Text,
    Control
};

enum class ControlCommand {
    None,
    EndOfTurn,
    Disconnect,
    Ping
};

/**
 * @brief Validated client -> server message
 *
 * Voice: audio holds decoded PCM samples (WAV payloads already unwrapped).
 * Text: text holds the user input.
 * Control: command holds the verb.
 */
struct ClientMessage {
    ClientMessageType type = ClientMessageType::Text;
    std::string text;
    AudioBuffer audio;
    ControlCommand command = ControlCommand::None;
    std::string timestamp;

    static ClientMessage text_message(const std::string& content, const std::string& ts = "");
    static ClientMessage voice_message(const AudioBuffer& samples, const std::string& ts = "");
    static ClientMessage control_message(ControlCommand cmd, const std::string& ts = "");
};

enum class ServerMessageType {
    Text,
    Voice,
    Error,
    Control,
    Pong
};

/// Server -> client message
struct ServerMessage {
    ServerMessageType type = ServerMessageType::Text;
    std::string content;
    std::string timestamp;
    std::optional<Bytes> audio;        ///< Encoded audio (Voice only), sent base64
    bool needs_delegation = false;

    static ServerMessage text(const std::string& content);
    static ServerMessage voice(const std::string& content, Bytes audio);
    static ServerMessage error(const std::string& content);
    static ServerMessage control(const std::string& content);
    static ServerMessage pong();
};

/**
 * @brief Parse and validate one client envelope
 * @param raw JSON text received from the client
 * @param sample_rate Expected rate for WAV-wrapped voice payloads
 * @return ClientMessage, or ProtocolError naming the defect
 */
Result<ClientMessage> parse_client_message(const std::string& raw, int sample_rate = DEFAULT_SAMPLE_RATE);

/// Serialize to the JSON wire form (audio emitted as base64 or null)
std::string serialize_server_message(const ServerMessage& message);

const char* client_message_type_to_string(ClientMessageType type);
const char* server_message_type_to_string(ServerMessageType type);

} // namespace voicegate
