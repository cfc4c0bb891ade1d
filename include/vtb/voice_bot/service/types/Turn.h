#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

#include "nlohmann/json.hpp"

namespace vtb::voice_bot::service::types {

enum class MessageRole {
    System,
    User,
    Assistant
};

inline std::string roleToString(MessageRole r) {
    switch (r) {
        case MessageRole::System: return "system";
        case MessageRole::User: return "user";
        case MessageRole::Assistant: return "assistant";
    }
    return "user";
}

inline std::optional<MessageRole> stringToRole(std::string_view s) {
    auto lowerEq = [](std::string_view a, std::string_view b) {
        if (a.size() != b.size()) return false;
        for (std::size_t i = 0; i < a.size(); ++i) {
            char ca = a[i];
            char cb = b[i];
            if (ca >= 'A' && ca <= 'Z') ca = static_cast<char>(ca - 'A' + 'a');
            if (cb >= 'A' && cb <= 'Z') cb = static_cast<char>(cb - 'A' + 'a');
            if (ca != cb) return false;
        }
        return true;
    };

    if (lowerEq(s, "system")) return MessageRole::System;
    if (lowerEq(s, "user")) return MessageRole::User;
    if (lowerEq(s, "assistant")) return MessageRole::Assistant;
    return std::nullopt;
}

/**
 * @brief 对话中的一条消息；追加到会话历史后不再修改
 */
struct Turn {
    MessageRole role{MessageRole::User};
    std::string content;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};

    static Turn user(std::string text) {
        return Turn{MessageRole::User, std::move(text), std::chrono::system_clock::now()};
    }

    static Turn assistant(std::string text) {
        return Turn{MessageRole::Assistant, std::move(text), std::chrono::system_clock::now()};
    }

    nlohmann::json toJson() const {
        const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(timestamp.time_since_epoch()).count();
        return nlohmann::json{
            {"role", roleToString(role)},
            {"content", content},
            {"timestamp_ms", ms},
        };
    }
};

} // namespace vtb::voice_bot::service::types
