#pragma once

/**
 * @file transcript.h
 * @brief Per-session conversation transcript
 *
 * - Append-only, in arrival order
 * - Completed turns alternate user / assistant
 * - Export of the most recent turns as LLM context
 */

#include "common.h"
#include <string>
#include <vector>

namespace voicegate {
namespace memory {

enum class ChatRole {
    User,
    Assistant
};

/**
 * @brief Single entry in a transcript
 */
struct ChatMessage {
    ChatRole role = ChatRole::User;
    std::string content;
    int64_t timestamp_ms = 0;

    static ChatMessage user(const std::string& content);
    static ChatMessage assistant(const std::string& content);
};

/**
 * @brief Ordered conversation history of one session
 *
 * Not thread-safe; the orchestrator serializes access.
 */
class Transcript {
public:
    Transcript() = default;

    void add_user_message(const std::string& content);
    void add_assistant_message(const std::string& content);

    /// Append a completed turn (user input then assistant reply)
    void add_turn(const std::string& user_text, const std::string& reply);

    const std::vector<ChatMessage>& messages() const { return messages_; }

    /**
     * @brief Messages of the last N completed turns (2N entries at most)
     */
    std::vector<ChatMessage> recent_turns(size_t max_turns) const;

    size_t message_count() const { return messages_.size(); }
    size_t turn_count() const { return messages_.size() / 2; }
    bool is_empty() const { return messages_.empty(); }

private:
    std::vector<ChatMessage> messages_;
};

const char* chat_role_to_string(ChatRole role);

} // namespace memory
} // namespace voicegate
