#include "vtb/voice_bot/service/SpeechSynthesizer.h"

#include "vtb/voice_bot/service/ConfigManager.h"
#include "vtb/voice_bot/service/ErrorHandler.h"
#include "vtb/voice_bot/service/ServiceErrors.h"
#include "vtb/voice_bot/service/utils/HttpClient.h"
#include "vtb/voice_bot/service/utils/HttpSerialization.h"

#include <utility>

namespace vtb::voice_bot::service {

TtsProviderConfig TtsProviderConfig::fromConfig(const ConfigManager& cfg) {
    TtsProviderConfig out;
    out.provider = cfg.getOr<std::string>("tts.provider", out.provider);
    out.baseUrl = cfg.getOr<std::string>("tts.base_url", out.baseUrl);
    out.apiKey = cfg.getOr<std::string>("tts.api_key", out.apiKey);
    out.modelId = cfg.getOr<std::string>("tts.model_id", out.modelId);
    out.responseFormat = cfg.getOr<std::string>("tts.response_format", out.responseFormat);
    out.timeoutMs = cfg.getOr<int>("tts.timeout_ms", out.timeoutMs);
    return out;
}

static SynthesisError synthesisErrorFrom(const utils::HttpResponse& resp, const utils::HttpRequest& req,
                                         const std::string& provider) {
    ErrorInfo info = ErrorHandler::fromHttpResponse(resp, req);
    info.addContext("provider", provider);
    return SynthesisError(std::move(info));
}

static SynthesisError malformedResponse(const std::string& message, const utils::HttpRequest& req,
                                        const std::string& provider) {
    ErrorInfo info;
    info.errorType = ErrorType::UnknownError;
    info.message = message;
    info.addContext("url", req.url);
    info.addContext("provider", provider);
    return SynthesisError(std::move(info));
}

// ========== OpenAI 兼容 ==========

OpenAiSpeechSynthesizer::OpenAiSpeechSynthesizer(TtsProviderConfig config)
    : m_config(std::move(config))
{}

AudioBytes OpenAiSpeechSynthesizer::synthesize(const SynthesisRequest& request) {
    utils::HttpClient client(m_config.baseUrl);
    client.setTimeout(m_config.timeoutMs);

    nlohmann::json body;
    body["model"] = m_config.modelId;
    body["input"] = request.text;
    body["voice"] = request.voice;
    if (!m_config.responseFormat.empty() && m_config.responseFormat != "default") {
        body["response_format"] = m_config.responseFormat;
    }

    utils::HttpRequest req;
    req.method = utils::HttpMethod::POST;
    req.url = client.buildFullUrl("/audio/speech");
    req.timeoutMs = m_config.timeoutMs;
    req.body = body.dump();
    req.setHeader("Content-Type", "application/json");
    if (!m_config.apiKey.empty()) {
        req.setHeader("Authorization", "Bearer " + m_config.apiKey);
    }

    const auto resp = client.execute(req);
    if (!resp.isSuccess()) {
        throw synthesisErrorFrom(resp, req, name());
    }
    if (resp.body.empty()) {
        throw malformedResponse("TTS provider returned empty audio", req, name());
    }
    return AudioBytes(resp.body.begin(), resp.body.end());
}

// ========== mock-tts ==========

MockServerSpeechSynthesizer::MockServerSpeechSynthesizer(TtsProviderConfig config)
    : m_config(std::move(config))
{}

AudioBytes MockServerSpeechSynthesizer::synthesize(const SynthesisRequest& request) {
    utils::HttpClient client(m_config.baseUrl);
    client.setTimeout(m_config.timeoutMs);

    nlohmann::json body;
    body["text"] = request.text;
    body["language"] = request.language;
    body["speaker_id"] = request.voice;

    utils::HttpRequest req;
    req.method = utils::HttpMethod::POST;
    req.url = client.buildFullUrl("/tts");
    req.timeoutMs = m_config.timeoutMs;
    req.body = body.dump();
    req.setHeader("Content-Type", "application/json");

    const auto resp = client.execute(req);
    if (!resp.isSuccess()) {
        throw synthesisErrorFrom(resp, req, name());
    }

    std::string parseErr;
    const auto parsed = utils::parseJsonSafe(resp.body, &parseErr);
    if (!parsed.has_value()) {
        throw malformedResponse("TTS response is not JSON: " + parseErr, req, name());
    }
    if (!parsed->is_object() || !parsed->contains("audio") || !(*parsed)["audio"].is_string()) {
        throw malformedResponse("TTS response missing string field 'audio'", req, name());
    }
    auto audio = utils::decodeBase64((*parsed)["audio"].get<std::string>());
    if (!audio.has_value() || audio->empty()) {
        throw malformedResponse("TTS response 'audio' is empty or not valid base64", req, name());
    }
    return std::move(*audio);
}

std::unique_ptr<SpeechSynthesizer> makeSpeechSynthesizer(const TtsProviderConfig& config) {
    if (config.provider == "openai") {
        return std::make_unique<OpenAiSpeechSynthesizer>(config);
    }
    if (config.provider == "mock") {
        return std::make_unique<MockServerSpeechSynthesizer>(config);
    }
    throw UnsupportedVoiceError("Unknown TTS provider: " + config.provider);
}

} // namespace vtb::voice_bot::service
