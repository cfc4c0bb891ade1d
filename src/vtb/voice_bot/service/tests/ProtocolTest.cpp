#include "vtb/voice_bot/service/ServiceErrors.h"
#include "vtb/voice_bot/service/types/Protocol.h"
#include "vtb/voice_bot/service/types/RequestResponse.h"
#include "vtb/voice_bot/service/types/Turn.h"

#include "MiniTest.h"

#include <string>
#include <vector>

using namespace vtb::voice_bot::service;
using namespace vtb::voice_bot::service::types;

int main() {
    using mini_test::TestCase;

    std::vector<TestCase> tests;

    // ========== Client events ==========
    tests.push_back({"parse_text_input", []() {
        const auto ev = parseClientEvent(R"({"type":"text_input","content":"Hello there"})");
        CHECK_TRUE(ev.type == ClientEventType::TextInput);
        CHECK_EQ(ev.content, "Hello there");
    }});

    tests.push_back({"parse_emotion_update", []() {
        const auto ev = parseClientEvent(R"({"type":"emotion_update","emotion":"sad","confidence":0.75})");
        CHECK_TRUE(ev.type == ClientEventType::EmotionUpdate);
        CHECK_EQ(ev.emotion, "sad");
        CHECK_TRUE(ev.confidence.has_value());
        CHECK_TRUE(*ev.confidence > 0.74 && *ev.confidence < 0.76);

        const auto noConf = parseClientEvent(R"({"type":"emotion_update","emotion":"happy"})");
        CHECK_FALSE(noConf.confidence.has_value());
    }});

    tests.push_back({"parse_rejects_malformed", []() {
        CHECK_THROWS_AS(parseClientEvent("not json"), InvalidInputError);
        CHECK_THROWS_AS(parseClientEvent("[]"), InvalidInputError);
        CHECK_THROWS_AS(parseClientEvent(R"({"content":"x"})"), InvalidInputError);
        CHECK_THROWS_AS(parseClientEvent(R"({"type":42})"), InvalidInputError);
        CHECK_THROWS_AS(parseClientEvent(R"({"type":"shout","content":"x"})"), InvalidInputError);
        CHECK_THROWS_AS(parseClientEvent(R"({"type":"text_input"})"), InvalidInputError);
        CHECK_THROWS_AS(parseClientEvent(R"({"type":"text_input","content":5})"), InvalidInputError);
        CHECK_THROWS_AS(parseClientEvent(R"({"type":"emotion_update"})"), InvalidInputError);
    }});

    tests.push_back({"parse_ignores_unknown_fields", []() {
        const auto ev = parseClientEvent(R"({"type":"text_input","content":"hi","extra":{"a":1}})");
        CHECK_EQ(ev.content, "hi");
    }});

    // ========== Server events ==========
    tests.push_back({"response_json_shape", []() {
        const auto j = ServerEvent::response("Hi!", "QUJD").toJson();
        CHECK_EQ(j["type"].get<std::string>(), "response");
        CHECK_EQ(j["text"].get<std::string>(), "Hi!");
        CHECK_EQ(j["audio"].get<std::string>(), "QUJD");
        CHECK_FALSE(j.contains("audio_error"));
        CHECK_FALSE(j.contains("emotion"));
    }});

    tests.push_back({"response_with_audio_error", []() {
        const auto j = ServerEvent::response("Hi!", "", std::string("tts down")).toJson();
        CHECK_EQ(j["audio"].get<std::string>(), "");
        CHECK_EQ(j["audio_error"].get<std::string>(), "tts down");
    }});

    tests.push_back({"emotion_interaction_json_shape", []() {
        const auto j = ServerEvent::emotionInteraction("sad", "Are you okay?", "QUJD").toJson();
        CHECK_EQ(j["type"].get<std::string>(), "emotion_interaction");
        CHECK_EQ(j["emotion"].get<std::string>(), "sad");
        CHECK_EQ(j["text"].get<std::string>(), "Are you okay?");
        CHECK_EQ(j["audio"].get<std::string>(), "QUJD");
    }});

    tests.push_back({"error_json_shape", []() {
        const auto j = ServerEvent::error("generation_failed", "timed out", true).toJson();
        CHECK_EQ(j["type"].get<std::string>(), "error");
        CHECK_EQ(j["code"].get<std::string>(), "generation_failed");
        CHECK_EQ(j["message"].get<std::string>(), "timed out");
        CHECK_TRUE(j["retryable"].get<bool>());
        CHECK_FALSE(j.contains("audio"));
    }});

    tests.push_back({"health_body", []() {
        const auto j = makeHealthBody("VTuber backend is running");
        CHECK_EQ(j["status"].get<std::string>(), "ok");
        CHECK_EQ(j["message"].get<std::string>(), "VTuber backend is running");
    }});

    // ========== Chat types ==========
    tests.push_back({"chat_request_to_json", []() {
        ChatRequest req;
        req.model = "m";
        req.messages.push_back(ChatMessage{MessageRole::System, "sys"});
        req.messages.push_back(ChatMessage{MessageRole::User, "hello"});
        req.maxTokens = 100;
        const auto j = req.toJson();
        CHECK_EQ(j["model"].get<std::string>(), "m");
        CHECK_EQ(j["messages"].size(), static_cast<size_t>(2));
        CHECK_EQ(j["messages"][0]["role"].get<std::string>(), "system");
        CHECK_EQ(j["max_tokens"].get<int>(), 100);
        CHECK_FALSE(j.contains("temperature"));
        CHECK_EQ(req.contentChars(), static_cast<size_t>(8));
    }});

    tests.push_back({"chat_response_from_json", []() {
        const auto ok = ChatResponse::fromJson(nlohmann::json::parse(
            R"({"choices":[{"message":{"role":"assistant","content":"Hi"},"finish_reason":"stop"}],)"
            R"("usage":{"prompt_tokens":3,"completion_tokens":1,"total_tokens":4}})"));
        CHECK_TRUE(ok.has_value());
        CHECK_EQ(ok->content, "Hi");
        CHECK_EQ(ok->totalTokens, static_cast<uint32_t>(4));

        CHECK_FALSE(ChatResponse::fromJson(nlohmann::json::parse(R"({"choices":[]})")).has_value());
        CHECK_FALSE(ChatResponse::fromJson(nlohmann::json::parse(R"({"choices":[{"message":{"content":null}}]})")).has_value());
    }});

    tests.push_back({"turn_to_json", []() {
        const auto j = Turn::assistant("hey").toJson();
        CHECK_EQ(j["role"].get<std::string>(), "assistant");
        CHECK_EQ(j["content"].get<std::string>(), "hey");
        CHECK_TRUE(j["timestamp_ms"].get<int64_t>() > 0);
        CHECK_TRUE(stringToRole("USER").has_value());
        CHECK_FALSE(stringToRole("tool").has_value());
    }});

    return mini_test::run(tests);
}
