/**
 * @file ConversationTurn.hpp
 * @brief Chat turns exchanged with the caller and with the inference engine.
 */

#pragma once
#include <optional>
#include <string>

namespace crowdpulse::domain {

/**
 * @struct ChatMessage
 * @brief A single message sent to the inference engine.
 */
struct ChatMessage {
    enum class Role { System, User, Assistant };
    Role role = Role::User;
    std::string content;

    static std::string RoleToString(Role r) {
        switch (r) {
            case Role::System: return "system";
            case Role::User: return "user";
            case Role::Assistant: return "assistant";
        }
        return "user";
    }

    /** @brief Parses "user" / "assistant" / "system"; nullopt otherwise. */
    static std::optional<Role> RoleFromString(const std::string& value) {
        if (value == "user") return Role::User;
        if (value == "assistant") return Role::Assistant;
        if (value == "system") return Role::System;
        return std::nullopt;
    }
};

/**
 * @struct ConversationTurn
 * @brief One caller-owned history entry, oldest first in a history sequence.
 */
struct ConversationTurn {
    ChatMessage::Role role = ChatMessage::Role::User;
    std::string content;
    std::optional<long long> timestampMs; ///< Unix milliseconds, when the caller recorded it.

    ChatMessage toMessage() const { return ChatMessage{role, content}; }
};

} // namespace crowdpulse::domain
