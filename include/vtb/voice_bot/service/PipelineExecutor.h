#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <unordered_map>
#include <vector>

namespace vtb::voice_bot::service {

class ErrorHandler;

/**
 * @brief 进程级的流水线线程池（弹性）
 *
 * 所有会话共享；会话内部自行保证同一时刻只提交一个 drain 任务，
 * 因此跨会话并行、会话内串行。
 *
 * workerCount 个常驻线程；提交任务时若没有空闲线程，立即追加一个临时线程，
 * 任务从不排在其他会话的阻塞调用（LLM/TTS）之后。
 * 临时线程空闲超过 extraIdleTimeout 后退出。
 * 同时存在的线程数因此不超过 workerCount + 活跃会话数。
 *
 * 任务不应抛出异常；std::exception 会被记录后丢弃，避免杀死工作线程。
 */
class PipelineExecutor {
public:
    using Task = std::function<void()>;

    struct Statistics {
        uint64_t submitted{0};
        uint64_t completed{0};
        uint64_t failed{0};
        uint64_t dropped{0};      // stop() 时尚未开始的任务
        uint64_t extraSpawned{0}; // 追加过的临时线程数
        size_t peakThreads{0};
    };

    explicit PipelineExecutor(size_t workerCount,
                              ErrorHandler* errorHandler = nullptr,
                              std::chrono::milliseconds extraIdleTimeout = std::chrono::seconds(10));
    ~PipelineExecutor();

    PipelineExecutor(const PipelineExecutor&) = delete;
    PipelineExecutor& operator=(const PipelineExecutor&) = delete;

    void start();

    // 停止并等待所有线程退出（包括正在执行的任务）；未开始的任务被丢弃
    void stop();

    // 已停止时返回 false，任务不会执行
    bool submit(Task task);

    bool isRunning() const { return m_running.load(); }
    size_t workerCount() const { return m_workerCount; }
    // 当前存活的线程数（常驻 + 临时）
    size_t threadCount() const;
    size_t pendingCount() const;
    Statistics getStatistics() const;

private:
    void workerLoop(uint64_t extraId, bool resident);
    // 需持有 m_queueMutex
    void spawnLocked(bool resident);
    // 需持有 m_queueMutex；把已退出的临时线程移出，由调用方在锁外 join
    std::vector<std::thread> collectFinishedLocked();

    const size_t m_workerCount;
    ErrorHandler* m_errorHandler;
    const std::chrono::milliseconds m_extraIdleTimeout;

    std::atomic<bool> m_running{false};

    mutable std::mutex m_queueMutex;
    std::condition_variable m_queueCondition;
    std::deque<Task> m_tasks;
    std::vector<std::thread> m_residents;
    std::unordered_map<uint64_t, std::thread> m_extras;
    std::vector<uint64_t> m_finishedExtras;
    uint64_t m_nextExtraId{0};
    size_t m_liveThreads{0};
    size_t m_idleThreads{0};
    Statistics m_statistics;
};

} // namespace vtb::voice_bot::service
