#pragma once

#include "vtb/voice_bot/service/types/Turn.h"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"

namespace vtb::voice_bot::service::types {

/**
 * @brief OpenAI 兼容的单条消息（仅文本）
 */
struct ChatMessage {
    MessageRole role{MessageRole::User};
    std::string content;

    static std::optional<ChatMessage> fromJson(const nlohmann::json& j) {
        if (!j.is_object()) return std::nullopt;
        if (!j.contains("role") || !j["role"].is_string()) return std::nullopt;
        auto role = stringToRole(j["role"].get<std::string>());
        if (!role.has_value()) return std::nullopt;
        if (!j.contains("content") || !j["content"].is_string()) return std::nullopt;
        return ChatMessage{*role, j["content"].get<std::string>()};
    }

    nlohmann::json toJson() const {
        return nlohmann::json{{"role", roleToString(role)}, {"content", content}};
    }
};

struct ChatRequest {
    std::string model;
    std::vector<ChatMessage> messages;
    std::optional<float> temperature;
    std::optional<uint32_t> maxTokens;

    static std::optional<ChatRequest> fromJson(const nlohmann::json& j) {
        if (!j.is_object()) return std::nullopt;
        if (!j.contains("model") || !j["model"].is_string()) return std::nullopt;
        if (!j.contains("messages") || !j["messages"].is_array()) return std::nullopt;

        ChatRequest r;
        r.model = j["model"].get<std::string>();
        for (const auto& mj : j["messages"]) {
            auto m = ChatMessage::fromJson(mj);
            if (!m.has_value()) return std::nullopt;
            r.messages.push_back(*m);
        }
        if (j.contains("temperature") && j["temperature"].is_number())
            r.temperature = j["temperature"].get<float>();
        if (j.contains("max_tokens") && j["max_tokens"].is_number_integer())
            r.maxTokens = static_cast<uint32_t>(j["max_tokens"].get<int64_t>());
        return r;
    }

    nlohmann::json toJson() const {
        nlohmann::json j;
        j["model"] = model;
        nlohmann::json ms = nlohmann::json::array();
        for (const auto& m : messages) ms.push_back(m.toJson());
        j["messages"] = std::move(ms);
        if (temperature.has_value()) j["temperature"] = *temperature;
        if (maxTokens.has_value()) j["max_tokens"] = *maxTokens;
        return j;
    }

    // 序列化后 messages 的字符总量（content 字节数之和），用于 transcript 预算
    std::size_t contentChars() const {
        std::size_t total = 0;
        for (const auto& m : messages) total += m.content.size();
        return total;
    }
};

struct ChatResponse {
    std::string content;
    std::optional<std::string> finishReason;
    uint32_t promptTokens{0};
    uint32_t completionTokens{0};
    uint32_t totalTokens{0};
    std::optional<std::string> model;

    // 仅接受 choices[0].message.content 为字符串的形状；否则视为畸形响应
    static std::optional<ChatResponse> fromJson(const nlohmann::json& j) {
        if (!j.is_object()) return std::nullopt;
        if (!j.contains("choices") || !j["choices"].is_array() || j["choices"].empty()) return std::nullopt;
        const auto& c0 = j["choices"][0];
        if (!c0.is_object() || !c0.contains("message") || !c0["message"].is_object()) return std::nullopt;
        const auto& msg = c0["message"];
        if (!msg.contains("content") || !msg["content"].is_string()) return std::nullopt;

        ChatResponse r;
        r.content = msg["content"].get<std::string>();
        if (c0.contains("finish_reason") && c0["finish_reason"].is_string())
            r.finishReason = c0["finish_reason"].get<std::string>();

        if (j.contains("usage") && j["usage"].is_object()) {
            const auto& u = j["usage"];
            if (u.contains("prompt_tokens") && u["prompt_tokens"].is_number_integer())
                r.promptTokens = static_cast<uint32_t>(u["prompt_tokens"].get<int64_t>());
            if (u.contains("completion_tokens") && u["completion_tokens"].is_number_integer())
                r.completionTokens = static_cast<uint32_t>(u["completion_tokens"].get<int64_t>());
            if (u.contains("total_tokens") && u["total_tokens"].is_number_integer())
                r.totalTokens = static_cast<uint32_t>(u["total_tokens"].get<int64_t>());
        }
        if (j.contains("model") && j["model"].is_string()) r.model = j["model"].get<std::string>();
        return r;
    }
};

} // namespace vtb::voice_bot::service::types
