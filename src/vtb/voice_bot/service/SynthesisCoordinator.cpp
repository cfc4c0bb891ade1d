#include "vtb/voice_bot/service/SynthesisCoordinator.h"

#include "vtb/voice_bot/service/ConfigManager.h"
#include "vtb/voice_bot/service/ErrorHandler.h"
#include "vtb/voice_bot/service/ServiceErrors.h"
#include "vtb/voice_bot/service/utils/TextUtils.h"

#include <utility>

namespace vtb::voice_bot::service {

VoiceConfig VoiceConfig::defaults() {
    VoiceConfig vc;
    vc.voices = {
        {"zh", "zh-CN-XiaoxiaoNeural"},
        {"en", "en-US-AriaNeural"},
        {"ja", "ja-JP-NanamiNeural"},
        {"ko", "ko-KR-SunHiNeural"},
        {"fr", "fr-FR-DeniseNeural"},
        {"de", "de-DE-KatjaNeural"},
        {"es", "es-ES-ElviraNeural"},
        {"it", "it-IT-ElsaNeural"},
        {"ru", "ru-RU-SvetlanaNeural"},
        {"pt", "pt-BR-FranciscaNeural"},
    };
    vc.defaultLanguage = "zh";
    return vc;
}

VoiceConfig VoiceConfig::fromConfig(const ConfigManager& cfg) {
    VoiceConfig vc = defaults();
    if (auto v = cfg.get("tts.voices"); v.has_value() && v->is_object()) {
        vc.voices.clear();
        for (auto it = v->begin(); it != v->end(); ++it) {
            if (it.value().is_string()) {
                vc.voices[it.key()] = it.value().get<std::string>();
            }
        }
    }
    vc.defaultLanguage = cfg.getOr<std::string>("tts.default_language", vc.defaultLanguage);
    vc.autoLanguage = cfg.getOr<bool>("tts.auto_language", vc.autoLanguage);
    return vc;
}

SynthesisCoordinator::SynthesisCoordinator(std::shared_ptr<SpeechSynthesizer> synthesizer,
                                           std::shared_ptr<AudioCacheStore> cache,
                                           VoiceConfig voiceConfig,
                                           ErrorHandler* errorHandler)
    : m_synthesizer(std::move(synthesizer))
    , m_cache(std::move(cache))
    , m_voiceConfig(std::move(voiceConfig))
    , m_errorHandler(errorHandler)
{}

VoiceSelection SynthesisCoordinator::resolveVoice(const std::string& language, const std::string& text) const {
    std::string lang = utils::collapseWhitespace(language);
    if (m_voiceConfig.autoLanguage && !text.empty()) {
        lang = utils::detectLanguage(text);
    }
    if (lang.empty()) {
        lang = m_voiceConfig.defaultLanguage;
    }

    auto it = m_voiceConfig.voices.find(lang);
    if (it == m_voiceConfig.voices.end() || it->second.empty()) {
        throw UnsupportedVoiceError("No voice configured for language: " + lang);
    }
    return VoiceSelection{it->second, lang};
}

std::shared_ptr<const AudioBytes> SynthesisCoordinator::synthesizeFor(const std::string& text, const std::string& language) {
    return synthesize(text, resolveVoice(language, text));
}

std::shared_ptr<const AudioBytes> SynthesisCoordinator::synthesize(const std::string& text, const VoiceSelection& voice) {
    m_requests++;

    if (utils::collapseWhitespace(text).empty()) {
        throw InvalidInputError("Cannot synthesize empty text");
    }
    if (utils::collapseWhitespace(voice.voice).empty() || utils::collapseWhitespace(voice.language).empty()) {
        throw UnsupportedVoiceError("Voice and language must be non-empty");
    }

    const std::string speakable = utils::sanitizeForSpeech(text);
    if (speakable.empty()) {
        throw InvalidInputError("Text has nothing speakable after sanitization");
    }

    const CacheKey key = CacheKey::make(speakable, voice.voice, voice.language);

    std::shared_ptr<std::promise<std::shared_ptr<const AudioBytes>>> promise;
    AudioFuture joined;
    {
        std::lock_guard<std::mutex> lock(m_inFlightMutex);
        if (m_cache) {
            if (auto hit = m_cache->get(key); hit.has_value() && hit->audio) {
                m_cacheHits++;
                return hit->audio;
            }
        }

        auto it = m_inFlight.find(key);
        if (it != m_inFlight.end()) {
            joined = it->second;
            m_joined++;
        } else {
            promise = std::make_shared<std::promise<std::shared_ptr<const AudioBytes>>>();
            m_inFlight.emplace(key, promise->get_future().share());
        }
    }

    if (!promise) {
        // 等待在途调用；失败时重新抛出同一个 SynthesisError
        return joined.get();
    }

    SynthesisRequest request;
    request.text = key.text;
    request.voice = key.voice;
    request.language = key.language;
    return runExternal(key, request, promise);
}

std::shared_ptr<const AudioBytes> SynthesisCoordinator::runExternal(
    const CacheKey& key,
    const SynthesisRequest& request,
    const std::shared_ptr<std::promise<std::shared_ptr<const AudioBytes>>>& promise) {

    m_externalCalls++;

    auto fail = [&](std::exception_ptr ep) {
        {
            std::lock_guard<std::mutex> lock(m_inFlightMutex);
            m_inFlight.erase(key);
        }
        promise->set_exception(ep);
        m_failures++;
    };

    std::shared_ptr<const AudioBytes> audio;
    try {
        audio = std::make_shared<const AudioBytes>(m_synthesizer->synthesize(request));
    } catch (const SynthesisError& e) {
        if (m_errorHandler) {
            m_errorHandler->warning("Synthesis failed for " + key.toString(), e.errorInfo());
        }
        fail(std::current_exception());
        throw;
    } catch (const std::exception& e) {
        ErrorInfo info;
        info.errorType = ErrorType::UnknownError;
        info.message = std::string("Synthesizer error: ") + e.what();
        info.addContext("provider", m_synthesizer->name());
        SynthesisError err(std::move(info));
        if (m_errorHandler) {
            m_errorHandler->warning("Synthesis failed for " + key.toString(), err.errorInfo());
        }
        fail(std::make_exception_ptr(err));
        throw err;
    } catch (...) {
        // 非 std 异常同样要释放在途标记，否则等待者永远阻塞
        fail(std::current_exception());
        throw;
    }

    if (audio->empty()) {
        SynthesisError err("Synthesizer returned no audio");
        fail(std::make_exception_ptr(err));
        throw err;
    }

    std::optional<CacheKey> evicted;
    {
        // 先写缓存再移除在途标记：之后到达的请求一定能命中缓存
        std::lock_guard<std::mutex> lock(m_inFlightMutex);
        if (m_cache) {
            evicted = m_cache->put(key, audio);
        }
        m_inFlight.erase(key);
    }
    promise->set_value(audio);

    if (m_errorHandler) {
        m_errorHandler->debug("Synthesized " + std::to_string(audio->size()) + " bytes for " + key.toString());
        if (evicted.has_value()) {
            m_errorHandler->debug("Audio cache evicted " + evicted->toString());
        }
    }
    return audio;
}

SynthesisCoordinator::Statistics SynthesisCoordinator::getStatistics() const {
    Statistics s;
    s.requests = m_requests.load();
    s.cacheHits = m_cacheHits.load();
    s.joinedInFlight = m_joined.load();
    s.externalCalls = m_externalCalls.load();
    s.failures = m_failures.load();
    return s;
}

size_t SynthesisCoordinator::inFlightCount() const {
    std::lock_guard<std::mutex> lock(m_inFlightMutex);
    return m_inFlight.size();
}

} // namespace vtb::voice_bot::service
