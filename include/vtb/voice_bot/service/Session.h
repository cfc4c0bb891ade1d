#pragma once

#include "vtb/voice_bot/service/InteractionTrigger.h"
#include "vtb/voice_bot/service/types/Protocol.h"
#include "vtb/voice_bot/service/types/Turn.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace vtb::voice_bot::service {

class ConfigManager;
class ErrorHandler;
class GenerationCoordinator;
class PipelineExecutor;
class SynthesisCoordinator;

enum class SessionState {
    Connected,  // 空闲，等待下一个事件
    Processing, // 有流水线任务在执行或排队
    Closed      // 终态
};

const char* sessionStateToString(SessionState state);

/**
 * @brief 会话配置（session.* + character.language），构造后不可变
 */
struct SessionConfig {
    size_t historyMaxTurns{20};     // 存储的历史上限，超出丢弃最旧
    size_t maxQueuePerSession{16};  // 排队（未开始）的流水线任务上限
    std::chrono::seconds idleTimeout{600}; // 0 表示不做空闲清理
    std::chrono::seconds sweepInterval{30};
    size_t pipelineWorkers{4};      // 常驻流水线线程数；忙时按需追加临时线程
    std::string language{"zh"};     // 合成语言

    static SessionConfig fromConfig(const ConfigManager& cfg);
};

/**
 * @brief 会话依赖的共享组件（由进程创建一次，所有会话共享）
 */
struct SessionServices {
    std::shared_ptr<GenerationCoordinator> generation;
    std::shared_ptr<SynthesisCoordinator> synthesis;
    std::shared_ptr<InteractionTrigger> trigger;
    std::shared_ptr<PipelineExecutor> executor;
    ErrorHandler* errorHandler{nullptr};
};

// 向连接推送一条服务端消息；调用发生在工作线程上，实现不得回调 onClose()
using EventSink = std::function<void(const types::ServerEvent&)>;

/**
 * @brief 每连接一个的会话：持有对话历史与情绪状态，驱动 生成 -> 合成 流水线
 *
 * 状态机：Connected -> Processing -> Connected ... -> Closed
 * - 同一会话的流水线严格串行（FIFO）；输出顺序与输入被接受的顺序一致
 * - 情绪更新立即生效，不等待流水线；触发后作为一个普通任务排队
 * - onClose 丢弃排队中的任务；在途的外部调用允许完成，但结果不再下发
 */
class Session : public std::enable_shared_from_this<Session> {
public:
    static std::shared_ptr<Session> create(std::string id,
                                           SessionServices services,
                                           SessionConfig config,
                                           EventSink sink);

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;
    ~Session();

    const std::string& id() const { return m_id; }
    SessionState state() const;
    bool isClosed() const { return m_closed.load(); }

    // ========== 事件入口 ==========

    /**
     * @brief 解析并处理一条客户端文本帧
     * 协议错误与拒绝的输入以 {"type":"error"} 消息回报，会话继续
     */
    void handleMessage(const std::string& frame);

    void handleEvent(const types::ClientEvent& event);

    /**
     * @brief 接受一条文本输入并排队
     * @throws InvalidInputError 文本为空、会话已关闭或排队已满（"session busy"）
     */
    void onTextInput(const std::string& text);

    /**
     * @brief 更新情绪状态；若触发策略通过则排队一次主动互动
     * @return 是否触发了主动互动
     * @throws InvalidInputError 情绪为空、会话已关闭，或本应触发但排队已满（"session busy"，不消耗冷却）
     */
    bool onEmotionUpdate(const std::string& emotion, std::optional<double> confidence = std::nullopt);

    // 幂等
    void onClose();

    /**
     * @brief 会话处于 Connected、队列为空且空闲不少于 idleTimeout 时关闭
     *
     * 判定与关闭在同一临界区内完成，与 onTextInput/onEmotionUpdate 的入队互斥。
     * @return 是否由本次调用关闭
     */
    bool closeIfIdle(std::chrono::steady_clock::duration idleTimeout,
                     std::chrono::steady_clock::time_point now = std::chrono::steady_clock::now());

    // ========== 查询 ==========
    std::vector<types::Turn> history() const;
    std::optional<std::string> emotionState() const;
    std::chrono::steady_clock::time_point lastActivity() const;
    size_t pendingCount() const;
    const EmotionCooldownRecord& cooldownRecord() const { return m_cooldown; }

    // 等待流水线空闲（或会话关闭）；超时返回 false
    bool waitIdle(std::chrono::milliseconds timeout) const;

private:
    struct Job {
        enum class Kind { Text, Emotion };
        Kind kind{Kind::Text};
        std::string payload; // 用户文本或情绪标签
    };

    Session(std::string id, SessionServices services, SessionConfig config, EventSink sink);

    void finishClose(const std::string& reason);
    void enqueue(Job job);
    // 需持有 m_queueMutex；返回 true 表示调用方需要调度 drain
    bool pushLocked(Job job);
    bool scheduleDrain();
    void drain();
    void finishDrainLocked();
    void runJob(const Job& job);

    void appendTurn(types::Turn turn);
    void touch();
    void emit(const types::ServerEvent& event);
    void emitError(const std::string& code, const std::string& message, bool retryable);

    const std::string m_id;
    const SessionServices m_services;
    const SessionConfig m_config;
    const EventSink m_sink;

    std::atomic<bool> m_closed{false};

    // 队列与状态
    mutable std::mutex m_queueMutex;
    mutable std::condition_variable m_idleCondition;
    std::deque<Job> m_queue;
    bool m_draining{false};
    SessionState m_state{SessionState::Connected};

    // 历史与情绪
    mutable std::mutex m_dataMutex;
    std::vector<types::Turn> m_history;
    std::optional<std::string> m_emotion;
    std::chrono::steady_clock::time_point m_lastActivity;

    EmotionCooldownRecord m_cooldown;

    // 下发与关闭互斥：onClose 返回后不会再有消息下发
    std::mutex m_emitMutex;
};

} // namespace vtb::voice_bot::service
