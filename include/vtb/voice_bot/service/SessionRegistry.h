#pragma once

#include "vtb/voice_bot/service/Session.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace vtb::voice_bot::service {

/**
 * @brief 进程级会话表：connectionId -> Session，会话生命周期的拥有者
 *
 * - registerSession 原子地检查并插入，重复 id 抛 DuplicateSessionError
 * - unregisterSession 移除并关闭会话，重复调用无副作用
 * - 可选的空闲清理线程：超过 idleTimeout 没有活动的会话会被关闭并移除
 */
class SessionRegistry {
public:
    // 空闲会话被清理后回调（transport 用它关闭对应连接）
    using IdleCallback = std::function<void(const std::string& connectionId)>;

    SessionRegistry(SessionServices services, SessionConfig config);
    ~SessionRegistry();

    SessionRegistry(const SessionRegistry&) = delete;
    SessionRegistry& operator=(const SessionRegistry&) = delete;

    /**
     * @throws DuplicateSessionError id 已存在
     * @throws InvalidInputError id 为空
     */
    std::shared_ptr<Session> registerSession(const std::string& connectionId, EventSink sink);

    // @throws NotFoundError
    std::shared_ptr<Session> lookup(const std::string& connectionId) const;

    // 移除并关闭；返回本次是否真的移除
    bool unregisterSession(const std::string& connectionId);

    size_t size() const;
    std::vector<std::string> connectionIds() const;

    // 关闭并移除空闲超过 idleTimeout 的会话（见 Session::closeIfIdle）；返回被清理的 id
    std::vector<std::string> sweepIdle(std::chrono::steady_clock::duration idleTimeout,
                                       std::chrono::steady_clock::time_point now = std::chrono::steady_clock::now());

    void startIdleSweep(IdleCallback onIdle);
    void stopIdleSweep();

    // 关闭并移除全部会话（进程退出时）
    void closeAll();

    const SessionConfig& config() const { return m_config; }

    // "conn_<epoch_ms>_<counter>"
    static std::string generateConnectionId();

private:
    void sweepLoop(IdleCallback onIdle);

    const SessionServices m_services;
    const SessionConfig m_config;

    mutable std::mutex m_mutex;
    std::unordered_map<std::string, std::shared_ptr<Session>> m_sessions;

    // 空闲清理线程
    std::thread m_sweepThread;
    std::mutex m_sweepMutex;
    std::condition_variable m_sweepCondition;
    bool m_sweepRunning{false};
};

} // namespace vtb::voice_bot::service
