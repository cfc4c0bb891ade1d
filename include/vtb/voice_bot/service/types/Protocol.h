#pragma once

#include <optional>
#include <string>

#include "nlohmann/json.hpp"

namespace vtb::voice_bot::service::types {

// ========== Client -> Server ==========

enum class ClientEventType {
    TextInput,     // {"type":"text_input","content":"..."}
    EmotionUpdate  // {"type":"emotion_update","emotion":"sad","confidence":0.8}
};

struct ClientEvent {
    ClientEventType type{ClientEventType::TextInput};
    std::string content;               // text_input
    std::string emotion;               // emotion_update
    std::optional<double> confidence;  // emotion_update，可选
};

/**
 * @brief 解析客户端 WebSocket 文本帧
 * @throws InvalidInputError 非 JSON、缺少 type、未知 type 或字段类型不符
 */
ClientEvent parseClientEvent(const std::string& frame);

// ========== Server -> Client ==========

enum class ServerEventType {
    Response,           // {"type":"response","text","audio"}
    EmotionInteraction, // {"type":"emotion_interaction","emotion","text","audio"}
    Error               // {"type":"error","code","message","retryable"}
};

const char* serverEventTypeToString(ServerEventType t);

struct ServerEvent {
    ServerEventType type{ServerEventType::Response};
    std::string text;
    std::string audio;                     // base64；合成失败时为空
    std::optional<std::string> audioError; // 合成失败时的文本回退说明
    std::string emotion;                   // EmotionInteraction

    // Error
    std::string code;
    std::string message;
    bool retryable{false};

    static ServerEvent response(std::string text, std::string audio, std::optional<std::string> audioError = std::nullopt);
    static ServerEvent emotionInteraction(std::string emotion, std::string text, std::string audio,
                                          std::optional<std::string> audioError = std::nullopt);
    static ServerEvent error(std::string code, std::string message, bool retryable);

    nlohmann::json toJson() const;
};

// GET / 的响应体
nlohmann::json makeHealthBody(const std::string& message);

} // namespace vtb::voice_bot::service::types
