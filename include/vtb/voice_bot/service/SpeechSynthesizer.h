#pragma once

#include "vtb/voice_bot/service/AudioCache.h"

#include <memory>
#include <string>

namespace vtb::voice_bot::service {

class ConfigManager;

/**
 * @brief 一次合成请求：文本 + 音色 + 语言
 */
struct SynthesisRequest {
    std::string text;
    std::string voice;
    std::string language;
};

/**
 * @brief 外部语音合成能力
 *
 * 成功返回编码后的音频字节（不透明 blob），失败抛出 SynthesisError。
 * 实现可被多个线程并发调用。
 */
class SpeechSynthesizer {
public:
    virtual ~SpeechSynthesizer() = default;

    virtual AudioBytes synthesize(const SynthesisRequest& request) = 0;

    virtual std::string name() const = 0;
};

/**
 * @brief TTS provider 配置（tts.*）
 */
struct TtsProviderConfig {
    std::string provider{"mock"};   // openai | mock
    std::string baseUrl;
    std::string apiKey;
    std::string modelId{"tts-1"};
    std::string responseFormat{"mp3"};
    int timeoutMs{10000};

    static TtsProviderConfig fromConfig(const ConfigManager& cfg);
};

/**
 * @brief OpenAI 兼容 TTS：POST {base}/audio/speech，响应体即音频
 */
class OpenAiSpeechSynthesizer : public SpeechSynthesizer {
public:
    explicit OpenAiSpeechSynthesizer(TtsProviderConfig config);

    AudioBytes synthesize(const SynthesisRequest& request) override;
    std::string name() const override { return "openai"; }

private:
    const TtsProviderConfig m_config;
};

/**
 * @brief mock-tts 服务：POST {base}/tts {text, language, speaker_id} -> {"audio": base64}
 */
class MockServerSpeechSynthesizer : public SpeechSynthesizer {
public:
    explicit MockServerSpeechSynthesizer(TtsProviderConfig config);

    AudioBytes synthesize(const SynthesisRequest& request) override;
    std::string name() const override { return "mock"; }

private:
    const TtsProviderConfig m_config;
};

// 根据 provider 名创建；未知 provider 抛 UnsupportedVoiceError
std::unique_ptr<SpeechSynthesizer> makeSpeechSynthesizer(const TtsProviderConfig& config);

} // namespace vtb::voice_bot::service
