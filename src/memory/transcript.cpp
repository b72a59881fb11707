#include "memory/transcript.h"
#include <algorithm>

namespace voicegate {
namespace memory {

ChatMessage ChatMessage::user(const std::string& content) {
    ChatMessage msg;
    msg.role = ChatRole::User;
    msg.content = content;
    msg.timestamp_ms = wall_clock_ms();
    return msg;
}

ChatMessage ChatMessage::assistant(const std::string& content) {
    ChatMessage msg;
    msg.role = ChatRole::Assistant;
    msg.content = content;
    msg.timestamp_ms = wall_clock_ms();
    return msg;
}

void Transcript::add_user_message(const std::string& content) {
    messages_.push_back(ChatMessage::user(content));
}

void Transcript::add_assistant_message(const std::string& content) {
    messages_.push_back(ChatMessage::assistant(content));
}

void Transcript::add_turn(const std::string& user_text, const std::string& reply) {
    add_user_message(user_text);
    add_assistant_message(reply);
}

std::vector<ChatMessage> Transcript::recent_turns(size_t max_turns) const {
    size_t count = std::min(messages_.size(), max_turns * 2);
    return std::vector<ChatMessage>(messages_.end() - static_cast<std::ptrdiff_t>(count), messages_.end());
}

const char* chat_role_to_string(ChatRole role) {
    switch (role) {
        case ChatRole::User: return "user";
        case ChatRole::Assistant: return "assistant";
    }
    return "unknown";
}

} // namespace memory
} // namespace voicegate
