#include "vtb/voice_bot/service/InteractionTrigger.h"

#include "vtb/voice_bot/service/ConfigManager.h"
#include "vtb/voice_bot/service/ErrorHandler.h"
#include "vtb/voice_bot/service/utils/TextUtils.h"

#include <algorithm>
#include <cctype>
#include <utility>

namespace vtb::voice_bot::service {

std::string normalizeEmotion(const std::string& label) {
    std::string out = utils::collapseWhitespace(label);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

// ========== TriggerPolicy ==========

TriggerPolicy TriggerPolicy::fromConfig(const ConfigManager& cfg) {
    TriggerPolicy p;
    if (auto v = cfg.getOr<int64_t>("emotion.cooldown_seconds", -1); v >= 0) {
        p.cooldown = std::chrono::seconds(v);
    }
    if (auto v = cfg.get("emotion.trigger_emotions"); v.has_value() && v->is_array()) {
        p.triggerEmotions.clear();
        for (const auto& e : *v) {
            if (!e.is_string()) continue;
            auto name = normalizeEmotion(e.get<std::string>());
            if (!name.empty()) p.triggerEmotions.insert(std::move(name));
        }
    }
    if (auto v = cfg.get("emotion.prompts"); v.has_value() && v->is_object()) {
        for (auto it = v->begin(); it != v->end(); ++it) {
            if (it.value().is_string()) {
                p.prompts[normalizeEmotion(it.key())] = it.value().get<std::string>();
            }
        }
    }
    return p;
}

bool TriggerPolicy::isTriggerEmotion(const std::string& emotion) const {
    return triggerEmotions.count(normalizeEmotion(emotion)) > 0;
}

std::string TriggerPolicy::promptFor(const std::string& emotion) const {
    const auto key = normalizeEmotion(emotion);
    auto it = prompts.find(key);
    if (it != prompts.end() && !it->second.empty()) {
        return it->second;
    }
    return "Respond to the user naturally, considering they appear " + key + ".";
}

// ========== EmotionCooldownRecord ==========

bool EmotionCooldownRecord::tryAcquire(const std::string& emotion,
                                       TriggerClock::time_point now,
                                       std::chrono::milliseconds cooldown) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_lastTrigger.find(emotion);
    if (it != m_lastTrigger.end() && now - it->second < cooldown) {
        return false;
    }
    m_lastTrigger[emotion] = now;
    return true;
}

std::optional<TriggerClock::time_point> EmotionCooldownRecord::lastTrigger(const std::string& emotion) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_lastTrigger.find(emotion);
    if (it == m_lastTrigger.end()) return std::nullopt;
    return it->second;
}

void EmotionCooldownRecord::restore(const std::string& emotion, std::optional<TriggerClock::time_point> previous) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (previous.has_value()) {
        m_lastTrigger[emotion] = *previous;
    } else {
        m_lastTrigger.erase(emotion);
    }
}

void EmotionCooldownRecord::clear() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_lastTrigger.clear();
}

// ========== 判定 ==========

bool shouldTrigger(const std::string& emotion,
                   EmotionCooldownRecord& record,
                   const TriggerPolicy& policy,
                   TriggerClock::time_point now) {
    const auto kind = normalizeEmotion(emotion);
    if (kind.empty() || policy.triggerEmotions.count(kind) == 0) {
        return false;
    }
    return record.tryAcquire(kind, now, policy.cooldown);
}

InteractionTrigger::InteractionTrigger(TriggerPolicy policy, ErrorHandler* errorHandler)
    : m_policy(std::move(policy))
    , m_errorHandler(errorHandler)
{}

bool InteractionTrigger::evaluate(const std::string& emotion, EmotionCooldownRecord& record,
                                  TriggerClock::time_point now) const {
    const bool fire = shouldTrigger(emotion, record, m_policy, now);
    if (m_errorHandler && m_policy.isTriggerEmotion(emotion)) {
        m_errorHandler->debug("Emotion '" + normalizeEmotion(emotion) + "' " +
                              (fire ? "triggers an interaction" : "suppressed by cooldown"));
    }
    return fire;
}

} // namespace vtb::voice_bot::service
