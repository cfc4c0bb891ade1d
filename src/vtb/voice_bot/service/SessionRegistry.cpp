#include "vtb/voice_bot/service/SessionRegistry.h"

#include "vtb/voice_bot/service/ErrorHandler.h"
#include "vtb/voice_bot/service/ServiceErrors.h"

#include <sstream>
#include <utility>

namespace vtb::voice_bot::service {

SessionRegistry::SessionRegistry(SessionServices services, SessionConfig config)
    : m_services(std::move(services))
    , m_config(std::move(config))
{}

SessionRegistry::~SessionRegistry() {
    stopIdleSweep();
    closeAll();
}

std::string SessionRegistry::generateConnectionId() {
    static std::atomic<uint64_t> counter{0};
    auto now = std::chrono::system_clock::now();
    auto timestamp = std::chrono::duration_cast<std::chrono::milliseconds>(
                         now.time_since_epoch())
                         .count();
    uint64_t count = counter.fetch_add(1);

    std::ostringstream oss;
    oss << "conn_" << timestamp << "_" << count;
    return oss.str();
}

std::shared_ptr<Session> SessionRegistry::registerSession(const std::string& connectionId, EventSink sink) {
    if (connectionId.empty()) {
        throw InvalidInputError("Connection id must not be empty");
    }

    std::shared_ptr<Session> session;
    size_t total = 0;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_sessions.find(connectionId) != m_sessions.end()) {
            throw DuplicateSessionError("Session already registered: " + connectionId);
        }
        session = Session::create(connectionId, m_services, m_config, std::move(sink));
        m_sessions.emplace(connectionId, session);
        total = m_sessions.size();
    }

    if (m_services.errorHandler) {
        m_services.errorHandler->info("Session " + connectionId + " opened (active=" + std::to_string(total) + ")");
    }
    return session;
}

std::shared_ptr<Session> SessionRegistry::lookup(const std::string& connectionId) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_sessions.find(connectionId);
    if (it == m_sessions.end()) {
        throw NotFoundError("Session not found: " + connectionId);
    }
    return it->second;
}

bool SessionRegistry::unregisterSession(const std::string& connectionId) {
    std::shared_ptr<Session> session;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_sessions.find(connectionId);
        if (it == m_sessions.end()) {
            return false;
        }
        session = std::move(it->second);
        m_sessions.erase(it);
    }
    // 在锁外关闭：onClose 会等待正在进行的下发
    session->onClose();
    return true;
}

size_t SessionRegistry::size() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_sessions.size();
}

std::vector<std::string> SessionRegistry::connectionIds() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<std::string> out;
    out.reserve(m_sessions.size());
    for (const auto& kv : m_sessions) {
        out.push_back(kv.first);
    }
    return out;
}

std::vector<std::string> SessionRegistry::sweepIdle(std::chrono::steady_clock::duration idleTimeout,
                                                    std::chrono::steady_clock::time_point now) {
    std::vector<std::shared_ptr<Session>> candidates;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (const auto& kv : m_sessions) {
            candidates.push_back(kv.second);
        }
    }

    // 空闲判定与关闭由会话在自己的锁内原子完成；判定后到达的输入会被拒绝而不是丢失
    std::vector<std::shared_ptr<Session>> expired;
    for (auto& s : candidates) {
        if (s->closeIfIdle(idleTimeout, now)) {
            expired.push_back(std::move(s));
        }
    }

    std::vector<std::string> ids;
    ids.reserve(expired.size());
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (const auto& s : expired) {
            auto it = m_sessions.find(s->id());
            if (it != m_sessions.end() && it->second == s) {
                m_sessions.erase(it);
            }
        }
    }
    for (const auto& s : expired) {
        ids.push_back(s->id());
        if (m_services.errorHandler) {
            m_services.errorHandler->info("Session " + s->id() + " expired after idle timeout");
        }
    }
    return ids;
}

void SessionRegistry::startIdleSweep(IdleCallback onIdle) {
    if (m_config.idleTimeout.count() <= 0) {
        return; // 未启用
    }
    {
        std::lock_guard<std::mutex> lock(m_sweepMutex);
        if (m_sweepRunning) {
            return;
        }
        m_sweepRunning = true;
    }
    m_sweepThread = std::thread(&SessionRegistry::sweepLoop, this, std::move(onIdle));
}

void SessionRegistry::stopIdleSweep() {
    {
        std::lock_guard<std::mutex> lock(m_sweepMutex);
        if (!m_sweepRunning) {
            return;
        }
        m_sweepRunning = false;
    }
    m_sweepCondition.notify_all();
    if (m_sweepThread.joinable()) {
        m_sweepThread.join();
    }
}

void SessionRegistry::sweepLoop(IdleCallback onIdle) {
    std::unique_lock<std::mutex> lock(m_sweepMutex);
    while (m_sweepRunning) {
        m_sweepCondition.wait_for(lock, m_config.sweepInterval, [this] { return !m_sweepRunning; });
        if (!m_sweepRunning) {
            break;
        }

        lock.unlock();
        auto ids = sweepIdle(m_config.idleTimeout);
        if (onIdle) {
            for (const auto& id : ids) {
                onIdle(id);
            }
        }
        lock.lock();
    }
}

void SessionRegistry::closeAll() {
    std::unordered_map<std::string, std::shared_ptr<Session>> sessions;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        sessions.swap(m_sessions);
    }
    for (auto& kv : sessions) {
        kv.second->onClose();
    }
}

} // namespace vtb::voice_bot::service
