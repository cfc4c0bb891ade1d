#include "vtb/voice_bot/service/LanguageModel.h"
#include "vtb/voice_bot/service/ServiceErrors.h"
#include "vtb/voice_bot/service/SpeechSynthesizer.h"
#include "vtb/voice_bot/service/transport/MockTtsServer.h"
#include "vtb/voice_bot/service/utils/HttpSerialization.h"

#include "MiniTest.h"

#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "httplib.h"

using namespace vtb::voice_bot::service;
using namespace vtb::voice_bot::service::types;

namespace {

struct ServerGuard {
    httplib::Server& server;
    std::thread th;
    explicit ServerGuard(httplib::Server& s) : server(s) {}
    ~ServerGuard() {
        server.stop();
        if (th.joinable()) th.join();
    }
};

// 固定返回 status + body 的 /chat/completions
void routeChat(httplib::Server& server, int status, std::string body, std::string* capturedBody = nullptr,
               std::string* capturedAuth = nullptr) {
    server.Post("/v1/chat/completions", [=](const httplib::Request& req, httplib::Response& res) {
        if (capturedBody) *capturedBody = req.body;
        if (capturedAuth) *capturedAuth = req.get_header_value("Authorization");
        res.status = status;
        res.set_content(body, "application/json");
    });
}

ChatRequest sampleRequest() {
    ChatRequest req;
    req.model = "test-model";
    req.messages.push_back(ChatMessage{MessageRole::System, "persona"});
    req.messages.push_back(ChatMessage{MessageRole::User, "Hello"});
    req.maxTokens = 50;
    req.temperature = 0.7f;
    return req;
}

LlmProviderConfig llmConfigFor(int port) {
    LlmProviderConfig cfg;
    cfg.baseUrl = "http://127.0.0.1:" + std::to_string(port) + "/v1";
    cfg.apiKey = "test-key";
    cfg.timeoutMs = 2000;
    return cfg;
}

// 调用 complete 并返回抛出的 GenerationError；未抛出时返回 nullptr
std::unique_ptr<GenerationError> completeExpectingError(OpenAiCompatibleModel& model) {
    try {
        (void)model.complete(sampleRequest());
    } catch (const GenerationError& e) {
        return std::make_unique<GenerationError>(e);
    }
    return nullptr;
}

} // namespace

int main() {
    using mini_test::TestCase;

    std::vector<TestCase> tests;

    // ========== LLM ==========
    tests.push_back({"llm_success_parses_content", []() {
        httplib::Server server;
        std::string body;
        std::string auth;
        routeChat(server, 200,
                  R"({"choices":[{"message":{"role":"assistant","content":"Hi there!"},"finish_reason":"stop"}]})",
                  &body, &auth);
        const int port = server.bind_to_any_port("127.0.0.1");
        CHECK_TRUE(port > 0);
        ServerGuard guard(server);
        guard.th = std::thread([&]() { server.listen_after_bind(); });
        std::this_thread::sleep_for(std::chrono::milliseconds(20));

        OpenAiCompatibleModel model(llmConfigFor(port));
        const auto resp = model.complete(sampleRequest());
        CHECK_EQ(resp.content, "Hi there!");
        CHECK_EQ(auth, "Bearer test-key");

        const auto sent = nlohmann::json::parse(body);
        CHECK_EQ(sent["model"].get<std::string>(), "test-model");
        CHECK_EQ(sent["messages"].size(), static_cast<size_t>(2));
        CHECK_EQ(sent["max_tokens"].get<int>(), 50);
    }});

    tests.push_back({"llm_rate_limit_is_retryable", []() {
        httplib::Server server;
        routeChat(server, 429, R"({"error":{"message":"Rate limit exceeded","type":"rate_limit"}})");
        const int port = server.bind_to_any_port("127.0.0.1");
        CHECK_TRUE(port > 0);
        ServerGuard guard(server);
        guard.th = std::thread([&]() { server.listen_after_bind(); });
        std::this_thread::sleep_for(std::chrono::milliseconds(20));

        OpenAiCompatibleModel model(llmConfigFor(port));
        auto err = completeExpectingError(model);
        CHECK_TRUE(err != nullptr);
        CHECK_TRUE(err->retryable());
        CHECK_TRUE(err->errorInfo().errorType == ErrorType::RateLimitError);
        CHECK_EQ(std::string(err->what()), "Rate limit exceeded");
        // 错误上下文中不出现密钥
        CHECK_TRUE(err->errorInfo().toString().find("test-key") == std::string::npos);
    }});

    tests.push_back({"llm_auth_failure_not_retryable", []() {
        httplib::Server server;
        routeChat(server, 401, R"({"error":{"message":"No auth credentials found"}})");
        const int port = server.bind_to_any_port("127.0.0.1");
        CHECK_TRUE(port > 0);
        ServerGuard guard(server);
        guard.th = std::thread([&]() { server.listen_after_bind(); });
        std::this_thread::sleep_for(std::chrono::milliseconds(20));

        OpenAiCompatibleModel model(llmConfigFor(port));
        auto err = completeExpectingError(model);
        CHECK_TRUE(err != nullptr);
        CHECK_FALSE(err->retryable());
    }});

    tests.push_back({"llm_malformed_body_not_retryable", []() {
        httplib::Server server;
        routeChat(server, 200, R"({"choices":[]})");
        const int port = server.bind_to_any_port("127.0.0.1");
        CHECK_TRUE(port > 0);
        ServerGuard guard(server);
        guard.th = std::thread([&]() { server.listen_after_bind(); });
        std::this_thread::sleep_for(std::chrono::milliseconds(20));

        OpenAiCompatibleModel model(llmConfigFor(port));
        auto err = completeExpectingError(model);
        CHECK_TRUE(err != nullptr);
        CHECK_FALSE(err->retryable());
    }});

    tests.push_back({"llm_error_inside_200", []() {
        httplib::Server server;
        routeChat(server, 200, R"({"error":{"message":"Provider returned error","code":502}})");
        const int port = server.bind_to_any_port("127.0.0.1");
        CHECK_TRUE(port > 0);
        ServerGuard guard(server);
        guard.th = std::thread([&]() { server.listen_after_bind(); });
        std::this_thread::sleep_for(std::chrono::milliseconds(20));

        OpenAiCompatibleModel model(llmConfigFor(port));
        auto err = completeExpectingError(model);
        CHECK_TRUE(err != nullptr);
        CHECK_EQ(std::string(err->what()), "Provider returned error");
        CHECK_TRUE(err->retryable()); // 上游 502
    }});

    tests.push_back({"llm_empty_content_rejected", []() {
        httplib::Server server;
        routeChat(server, 200, R"({"choices":[{"message":{"role":"assistant","content":"  "}}]})");
        const int port = server.bind_to_any_port("127.0.0.1");
        CHECK_TRUE(port > 0);
        ServerGuard guard(server);
        guard.th = std::thread([&]() { server.listen_after_bind(); });
        std::this_thread::sleep_for(std::chrono::milliseconds(20));

        OpenAiCompatibleModel model(llmConfigFor(port));
        auto err = completeExpectingError(model);
        CHECK_TRUE(err != nullptr);
        CHECK_FALSE(err->retryable());
    }});

    tests.push_back({"llm_unreachable_is_retryable", []() {
        // 127.0.0.1:1 上没有监听者，连接被拒绝
        auto cfg = llmConfigFor(1);
        cfg.timeoutMs = 500;
        OpenAiCompatibleModel model(cfg);
        auto err = completeExpectingError(model);
        CHECK_TRUE(err != nullptr);
        CHECK_TRUE(err->retryable());
        CHECK_TRUE(err->errorInfo().errorType == ErrorType::NetworkError ||
                   err->errorInfo().errorType == ErrorType::TimeoutError);
    }});

    // ========== TTS ==========
    tests.push_back({"tts_factory_selects_provider", []() {
        TtsProviderConfig cfg;
        cfg.baseUrl = "http://127.0.0.1:1";
        cfg.provider = "openai";
        CHECK_EQ(makeSpeechSynthesizer(cfg)->name(), "openai");
        cfg.provider = "mock";
        CHECK_EQ(makeSpeechSynthesizer(cfg)->name(), "mock");
        cfg.provider = "carrier-pigeon";
        CHECK_THROWS_AS(makeSpeechSynthesizer(cfg), UnsupportedVoiceError);
    }});

    tests.push_back({"mock_tts_round_trip", []() {
        transport::MockTtsServer server("127.0.0.1", 0);
        const int port = server.start();
        CHECK_TRUE(port > 0);
        CHECK_TRUE(server.isRunning());

        TtsProviderConfig cfg;
        cfg.provider = "mock";
        cfg.baseUrl = "http://127.0.0.1:" + std::to_string(port);
        cfg.timeoutMs = 2000;
        MockServerSpeechSynthesizer tts(cfg);

        const auto audio = tts.synthesize(SynthesisRequest{"Hello world", "en-US-AriaNeural", "en"});
        CHECK_TRUE(audio == transport::MockTtsServer::makeToneWav("Hello world"));
        CHECK_EQ(std::string(audio.begin(), audio.begin() + 4), "RIFF");

        server.stop();
        CHECK_FALSE(server.isRunning());
    }});

    tests.push_back({"mock_tts_rejects_empty_text", []() {
        transport::MockTtsServer server("127.0.0.1", 0);
        const int port = server.start();

        TtsProviderConfig cfg;
        cfg.provider = "mock";
        cfg.baseUrl = "http://127.0.0.1:" + std::to_string(port);
        MockServerSpeechSynthesizer tts(cfg);

        int status = 0;
        try {
            (void)tts.synthesize(SynthesisRequest{"", "v", "en"});
        } catch (const SynthesisError& e) {
            status = e.errorInfo().errorCode;
        }
        server.stop();
        CHECK_EQ(status, 400);
    }});

    tests.push_back({"tone_wav_is_deterministic", []() {
        const auto a = transport::MockTtsServer::makeToneWav("abc");
        const auto b = transport::MockTtsServer::makeToneWav("abc");
        const auto c = transport::MockTtsServer::makeToneWav("xyz");
        CHECK_TRUE(a == b);
        CHECK_FALSE(a == c);
        CHECK_TRUE(a.size() > 44);
        // 最短 300ms：16000 * 0.3 * 2 字节
        CHECK_EQ(a.size(), static_cast<size_t>(44 + 9600));
    }});

    tests.push_back({"openai_tts_returns_body_bytes", []() {
        httplib::Server server;
        std::string sent;
        server.Post("/v1/audio/speech", [&sent](const httplib::Request& req, httplib::Response& res) {
            sent = req.body;
            res.status = 200;
            res.set_content(std::string("ID3\x01\x02", 5), "audio/mpeg");
        });
        const int port = server.bind_to_any_port("127.0.0.1");
        CHECK_TRUE(port > 0);
        ServerGuard guard(server);
        guard.th = std::thread([&]() { server.listen_after_bind(); });
        std::this_thread::sleep_for(std::chrono::milliseconds(20));

        TtsProviderConfig cfg;
        cfg.provider = "openai";
        cfg.baseUrl = "http://127.0.0.1:" + std::to_string(port) + "/v1";
        OpenAiSpeechSynthesizer tts(cfg);
        const auto audio = tts.synthesize(SynthesisRequest{"Hi", "alloy", "en"});
        CHECK_EQ(audio.size(), static_cast<size_t>(5));
        const auto j = nlohmann::json::parse(sent);
        CHECK_EQ(j["voice"].get<std::string>(), "alloy");
        CHECK_EQ(j["input"].get<std::string>(), "Hi");
    }});

    tests.push_back({"openai_tts_server_error_is_synthesis_error", []() {
        httplib::Server server;
        server.Post("/v1/audio/speech", [](const httplib::Request&, httplib::Response& res) {
            res.status = 503;
            res.set_content(R"({"error":{"message":"busy"}})", "application/json");
        });
        const int port = server.bind_to_any_port("127.0.0.1");
        CHECK_TRUE(port > 0);
        ServerGuard guard(server);
        guard.th = std::thread([&]() { server.listen_after_bind(); });
        std::this_thread::sleep_for(std::chrono::milliseconds(20));

        TtsProviderConfig cfg;
        cfg.provider = "openai";
        cfg.baseUrl = "http://127.0.0.1:" + std::to_string(port) + "/v1";
        OpenAiSpeechSynthesizer tts(cfg);
        CHECK_THROWS_AS(tts.synthesize(SynthesisRequest{"Hi", "alloy", "en"}), SynthesisError);
    }});

    return mini_test::run(tests);
}
