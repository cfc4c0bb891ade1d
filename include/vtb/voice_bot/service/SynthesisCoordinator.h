#pragma once

#include "vtb/voice_bot/service/AudioCache.h"
#include "vtb/voice_bot/service/SpeechSynthesizer.h"

#include <atomic>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace vtb::voice_bot::service {

class ConfigManager;
class ErrorHandler;

/**
 * @brief 语言 -> 音色映射（tts.voices / tts.default_language / tts.auto_language）
 */
struct VoiceConfig {
    std::map<std::string, std::string> voices;
    std::string defaultLanguage{"zh"};
    bool autoLanguage{false}; // true 时按文本内容检测语言

    static VoiceConfig fromConfig(const ConfigManager& cfg);

    // 默认的 10 语言映射
    static VoiceConfig defaults();
};

/**
 * @brief 已解析的音色：合成请求真正使用的 (voice, language)
 */
struct VoiceSelection {
    std::string voice;
    std::string language;
};

/**
 * @brief 合成协调器：缓存 + 单飞去重 + 外部合成调用
 *
 * - 缓存命中直接返回（刷新 LRU 顺序）
 * - 未命中时，同一键同一时刻最多只有一个外部调用；并发请求等待该调用的结果
 * - 成功结果写入缓存后才移除在途标记；失败不缓存，所有等待者收到同一个 SynthesisError
 *
 * 缓存为 nullptr 时仅做单飞去重。
 */
class SynthesisCoordinator {
public:
    struct Statistics {
        uint64_t requests{0};
        uint64_t cacheHits{0};
        uint64_t joinedInFlight{0};
        uint64_t externalCalls{0};
        uint64_t failures{0};
    };

    SynthesisCoordinator(std::shared_ptr<SpeechSynthesizer> synthesizer,
                         std::shared_ptr<AudioCacheStore> cache,
                         VoiceConfig voiceConfig,
                         ErrorHandler* errorHandler = nullptr);

    SynthesisCoordinator(const SynthesisCoordinator&) = delete;
    SynthesisCoordinator& operator=(const SynthesisCoordinator&) = delete;

    /**
     * @brief 为语言选择音色
     * @param language 为空时使用 defaultLanguage；autoLanguage 时由 text 检测
     * @throws UnsupportedVoiceError 语言没有映射
     */
    VoiceSelection resolveVoice(const std::string& language, const std::string& text = "") const;

    /**
     * @brief 合成文本
     * @throws InvalidInputError 文本为空（或清洗后为空），不发起外部调用
     * @throws UnsupportedVoiceError 音色/语言为空
     * @throws SynthesisError 外部调用失败
     */
    std::shared_ptr<const AudioBytes> synthesize(const std::string& text, const VoiceSelection& voice);

    // resolveVoice + synthesize
    std::shared_ptr<const AudioBytes> synthesizeFor(const std::string& text, const std::string& language);

    Statistics getStatistics() const;
    const VoiceConfig& voiceConfig() const { return m_voiceConfig; }
    AudioCacheStore* cache() const { return m_cache.get(); }

    // 当前在途的键数量
    size_t inFlightCount() const;

private:
    using AudioFuture = std::shared_future<std::shared_ptr<const AudioBytes>>;

    std::shared_ptr<const AudioBytes> runExternal(const CacheKey& key, const SynthesisRequest& request,
                                                  const std::shared_ptr<std::promise<std::shared_ptr<const AudioBytes>>>& promise);

    std::shared_ptr<SpeechSynthesizer> m_synthesizer;
    std::shared_ptr<AudioCacheStore> m_cache;
    const VoiceConfig m_voiceConfig;
    ErrorHandler* m_errorHandler;

    // 在途表；“命中缓存 / 加入在途 / 新建在途”的判定在同一把锁内完成
    mutable std::mutex m_inFlightMutex;
    std::unordered_map<CacheKey, AudioFuture, CacheKeyHash> m_inFlight;

    std::atomic<uint64_t> m_requests{0};
    std::atomic<uint64_t> m_cacheHits{0};
    std::atomic<uint64_t> m_joined{0};
    std::atomic<uint64_t> m_externalCalls{0};
    std::atomic<uint64_t> m_failures{0};
};

} // namespace vtb::voice_bot::service
