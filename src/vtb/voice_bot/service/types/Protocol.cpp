#include "vtb/voice_bot/service/types/Protocol.h"

#include "vtb/voice_bot/service/ServiceErrors.h"

#include <utility>

namespace vtb::voice_bot::service::types {

ClientEvent parseClientEvent(const std::string& frame) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(frame);
    } catch (const nlohmann::json::parse_error& e) {
        throw InvalidInputError(std::string("Malformed JSON message: ") + e.what());
    }

    if (!j.is_object()) {
        throw InvalidInputError("Message must be a JSON object");
    }
    if (!j.contains("type") || !j["type"].is_string()) {
        throw InvalidInputError("Message is missing string field 'type'");
    }

    const auto type = j["type"].get<std::string>();
    ClientEvent ev;
    if (type == "text_input") {
        if (!j.contains("content") || !j["content"].is_string()) {
            throw InvalidInputError("text_input requires string field 'content'");
        }
        ev.type = ClientEventType::TextInput;
        ev.content = j["content"].get<std::string>();
        return ev;
    }
    if (type == "emotion_update") {
        if (!j.contains("emotion") || !j["emotion"].is_string()) {
            throw InvalidInputError("emotion_update requires string field 'emotion'");
        }
        ev.type = ClientEventType::EmotionUpdate;
        ev.emotion = j["emotion"].get<std::string>();
        if (j.contains("confidence") && j["confidence"].is_number()) {
            ev.confidence = j["confidence"].get<double>();
        }
        return ev;
    }
    throw InvalidInputError("Unknown message type: " + type);
}

const char* serverEventTypeToString(ServerEventType t) {
    switch (t) {
        case ServerEventType::Response: return "response";
        case ServerEventType::EmotionInteraction: return "emotion_interaction";
        case ServerEventType::Error: return "error";
    }
    return "error";
}

ServerEvent ServerEvent::response(std::string text, std::string audio, std::optional<std::string> audioError) {
    ServerEvent ev;
    ev.type = ServerEventType::Response;
    ev.text = std::move(text);
    ev.audio = std::move(audio);
    ev.audioError = std::move(audioError);
    return ev;
}

ServerEvent ServerEvent::emotionInteraction(std::string emotion, std::string text, std::string audio,
                                            std::optional<std::string> audioError) {
    ServerEvent ev;
    ev.type = ServerEventType::EmotionInteraction;
    ev.emotion = std::move(emotion);
    ev.text = std::move(text);
    ev.audio = std::move(audio);
    ev.audioError = std::move(audioError);
    return ev;
}

ServerEvent ServerEvent::error(std::string code, std::string message, bool retryable) {
    ServerEvent ev;
    ev.type = ServerEventType::Error;
    ev.code = std::move(code);
    ev.message = std::move(message);
    ev.retryable = retryable;
    return ev;
}

nlohmann::json ServerEvent::toJson() const {
    nlohmann::json j;
    j["type"] = serverEventTypeToString(type);
    switch (type) {
        case ServerEventType::EmotionInteraction:
            j["emotion"] = emotion;
            [[fallthrough]];
        case ServerEventType::Response:
            j["text"] = text;
            j["audio"] = audio;
            if (audioError.has_value()) j["audio_error"] = *audioError;
            break;
        case ServerEventType::Error:
            j["code"] = code;
            j["message"] = message;
            j["retryable"] = retryable;
            break;
    }
    return j;
}

nlohmann::json makeHealthBody(const std::string& message) {
    return nlohmann::json{{"status", "ok"}, {"message", message}};
}

} // namespace vtb::voice_bot::service::types
