#pragma once

#include <chrono>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>

namespace vtb::voice_bot::service {

class ConfigManager;
class ErrorHandler;

using TriggerClock = std::chrono::steady_clock;

// 情绪标签规范化：去首尾空白 + 转小写
std::string normalizeEmotion(const std::string& label);

/**
 * @brief 情绪触发策略（emotion.*），构造后不可变
 */
struct TriggerPolicy {
    std::set<std::string> triggerEmotions{"sad", "angry"};
    std::chrono::milliseconds cooldown{std::chrono::seconds(30)};
    std::map<std::string, std::string> prompts; // emotion -> 合成提示词

    static TriggerPolicy fromConfig(const ConfigManager& cfg);

    bool isTriggerEmotion(const std::string& emotion) const;

    /**
     * @brief 触发时作为 user 消息发送给 LLM 的提示词（不写入历史）
     * 未配置的情绪使用通用回退模板
     */
    std::string promptFor(const std::string& emotion) const;
};

/**
 * @brief 每会话、每情绪种类的最近触发时间
 *
 * tryAcquire 在同一把锁内完成“冷却检查 + 写入新时间”，
 * 两个几乎同时到达的相同情绪更新只有一个能通过。
 */
class EmotionCooldownRecord {
public:
    bool tryAcquire(const std::string& emotion, TriggerClock::time_point now, std::chrono::milliseconds cooldown);

    std::optional<TriggerClock::time_point> lastTrigger(const std::string& emotion) const;

    // 撤销一次 tryAcquire：恢复为之前的时间（nullopt 表示从未触发）
    void restore(const std::string& emotion, std::optional<TriggerClock::time_point> previous);

    void clear();

private:
    mutable std::mutex m_mutex;
    std::unordered_map<std::string, TriggerClock::time_point> m_lastTrigger;
};

/**
 * @brief 判定一次情绪更新是否应触发主动互动
 *
 * 仅对 policy.triggerEmotions 中的情绪生效；同一情绪在冷却期内只触发一次。
 * 返回 true 时 record 已更新为 now。
 */
bool shouldTrigger(const std::string& emotion,
                   EmotionCooldownRecord& record,
                   const TriggerPolicy& policy,
                   TriggerClock::time_point now = TriggerClock::now());

class InteractionTrigger {
public:
    explicit InteractionTrigger(TriggerPolicy policy, ErrorHandler* errorHandler = nullptr);

    bool evaluate(const std::string& emotion, EmotionCooldownRecord& record,
                  TriggerClock::time_point now = TriggerClock::now()) const;

    std::string promptFor(const std::string& emotion) const { return m_policy.promptFor(emotion); }
    const TriggerPolicy& policy() const { return m_policy; }

private:
    const TriggerPolicy m_policy;
    ErrorHandler* m_errorHandler;
};

} // namespace vtb::voice_bot::service
