#include "vtb/voice_bot/service/PipelineExecutor.h"

#include "vtb/voice_bot/service/ErrorHandler.h"

#include <algorithm>
#include <utility>

namespace vtb::voice_bot::service {

PipelineExecutor::PipelineExecutor(size_t workerCount,
                                   ErrorHandler* errorHandler,
                                   std::chrono::milliseconds extraIdleTimeout)
    : m_workerCount(std::max<size_t>(1, workerCount))
    , m_errorHandler(errorHandler)
    , m_extraIdleTimeout(extraIdleTimeout)
{}

PipelineExecutor::~PipelineExecutor() {
    stop();
}

void PipelineExecutor::start() {
    {
        std::lock_guard<std::mutex> lock(m_queueMutex);
        if (m_running.load()) {
            return; // 已经在运行
        }
        m_running.store(true);
        m_residents.reserve(m_workerCount);
        for (size_t i = 0; i < m_workerCount; ++i) {
            spawnLocked(true);
        }
    }
    if (m_errorHandler) {
        m_errorHandler->debug("Pipeline executor started with " + std::to_string(m_workerCount) + " resident workers");
    }
}

void PipelineExecutor::stop() {
    std::vector<std::thread> threads;
    {
        // 持锁修改，避免工作线程在检查条件与进入等待之间错过唤醒
        std::lock_guard<std::mutex> lock(m_queueMutex);
        if (!m_running.exchange(false)) {
            return; // 已经停止
        }
        threads.swap(m_residents);
        for (auto& kv : m_extras) {
            threads.push_back(std::move(kv.second));
        }
        m_extras.clear();
        m_finishedExtras.clear();
    }

    m_queueCondition.notify_all(); // 唤醒所有工作线程
    for (auto& t : threads) {
        if (t.joinable()) {
            t.join();
        }
    }

    // 在锁外析构剩余任务（任务可能持有会话的最后一个引用）
    std::deque<Task> leftovers;
    {
        std::lock_guard<std::mutex> lock(m_queueMutex);
        leftovers.swap(m_tasks);
        m_statistics.dropped += leftovers.size();
    }
    if (m_errorHandler && !leftovers.empty()) {
        m_errorHandler->info("Pipeline executor stopped, dropped " + std::to_string(leftovers.size()) + " pending tasks");
    }
}

bool PipelineExecutor::submit(Task task) {
    if (!task) {
        return false;
    }
    std::vector<std::thread> finished;
    {
        std::lock_guard<std::mutex> lock(m_queueMutex);
        if (!m_running.load()) {
            return false;
        }
        m_tasks.push_back(std::move(task));
        m_statistics.submitted++;
        // 每个未认领的任务都要有一个空闲线程，否则追加临时线程
        if (m_idleThreads < m_tasks.size()) {
            spawnLocked(false);
        }
        finished = collectFinishedLocked();
    }
    m_queueCondition.notify_one();

    for (auto& t : finished) {
        t.join(); // 已退出循环，join 立即返回
    }
    return true;
}

size_t PipelineExecutor::threadCount() const {
    std::lock_guard<std::mutex> lock(m_queueMutex);
    return m_liveThreads;
}

size_t PipelineExecutor::pendingCount() const {
    std::lock_guard<std::mutex> lock(m_queueMutex);
    return m_tasks.size();
}

PipelineExecutor::Statistics PipelineExecutor::getStatistics() const {
    std::lock_guard<std::mutex> lock(m_queueMutex);
    return m_statistics;
}

void PipelineExecutor::spawnLocked(bool resident) {
    if (resident) {
        m_residents.emplace_back(&PipelineExecutor::workerLoop, this, uint64_t{0}, true);
    } else {
        const uint64_t id = ++m_nextExtraId;
        // 新线程需要 m_queueMutex 才能运行，因此一定在插入之后才可能退出
        m_extras.emplace(id, std::thread(&PipelineExecutor::workerLoop, this, id, false));
        m_statistics.extraSpawned++;
    }
    m_liveThreads++;
    m_statistics.peakThreads = std::max(m_statistics.peakThreads, m_liveThreads);
}

std::vector<std::thread> PipelineExecutor::collectFinishedLocked() {
    std::vector<std::thread> out;
    for (uint64_t id : m_finishedExtras) {
        auto it = m_extras.find(id);
        if (it != m_extras.end()) {
            out.push_back(std::move(it->second));
            m_extras.erase(it);
        }
    }
    m_finishedExtras.clear();
    return out;
}

void PipelineExecutor::workerLoop(uint64_t extraId, bool resident) {
    std::unique_lock<std::mutex> lock(m_queueMutex);
    while (true) {
        const auto ready = [this] { return !m_tasks.empty() || !m_running.load(); };

        // 等待任务或停止信号；临时线程空闲超时后退出
        m_idleThreads++;
        bool woke = true;
        if (resident) {
            m_queueCondition.wait(lock, ready);
        } else {
            woke = m_queueCondition.wait_for(lock, m_extraIdleTimeout, ready);
        }
        m_idleThreads--;

        if (!m_running.load() || !woke) {
            break;
        }

        Task task = std::move(m_tasks.front());
        m_tasks.pop_front();
        lock.unlock();

        bool ok = true;
        try {
            task();
        } catch (const std::exception& e) {
            ok = false;
            if (m_errorHandler) {
                m_errorHandler->error(std::string("Pipeline task threw: ") + e.what());
            }
        }
        task = nullptr;

        lock.lock();
        if (ok) {
            m_statistics.completed++;
        } else {
            m_statistics.failed++;
        }
    }

    m_liveThreads--;
    if (!resident && m_running.load()) {
        m_finishedExtras.push_back(extraId);
    }
}

} // namespace vtb::voice_bot::service
