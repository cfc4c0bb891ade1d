#include "vtb/voice_bot/service/Session.h"

#include "vtb/voice_bot/service/ConfigManager.h"
#include "vtb/voice_bot/service/ErrorHandler.h"
#include "vtb/voice_bot/service/GenerationCoordinator.h"
#include "vtb/voice_bot/service/PipelineExecutor.h"
#include "vtb/voice_bot/service/ServiceErrors.h"
#include "vtb/voice_bot/service/SynthesisCoordinator.h"
#include "vtb/voice_bot/service/utils/HttpSerialization.h"
#include "vtb/voice_bot/service/utils/TextUtils.h"

#include <utility>

namespace vtb::voice_bot::service {

const char* sessionStateToString(SessionState state) {
    switch (state) {
        case SessionState::Connected: return "connected";
        case SessionState::Processing: return "processing";
        case SessionState::Closed: return "closed";
    }
    return "closed";
}

SessionConfig SessionConfig::fromConfig(const ConfigManager& cfg) {
    SessionConfig c;
    if (auto v = cfg.getOr<int64_t>("session.history_max_turns", 0); v > 0) {
        c.historyMaxTurns = static_cast<size_t>(v);
    }
    if (auto v = cfg.getOr<int64_t>("session.max_queue_per_session", 0); v > 0) {
        c.maxQueuePerSession = static_cast<size_t>(v);
    }
    if (auto v = cfg.getOr<int64_t>("session.idle_timeout_seconds", -1); v >= 0) {
        c.idleTimeout = std::chrono::seconds(v);
    }
    if (auto v = cfg.getOr<int64_t>("session.sweep_interval_seconds", 0); v > 0) {
        c.sweepInterval = std::chrono::seconds(v);
    }
    if (auto v = cfg.getOr<int64_t>("session.pipeline_workers", 0); v > 0) {
        c.pipelineWorkers = static_cast<size_t>(v);
    }
    c.language = cfg.getOr<std::string>("character.language", c.language);
    return c;
}

// ========== 生命周期 ==========

std::shared_ptr<Session> Session::create(std::string id,
                                         SessionServices services,
                                         SessionConfig config,
                                         EventSink sink) {
    return std::shared_ptr<Session>(new Session(std::move(id), std::move(services), std::move(config), std::move(sink)));
}

Session::Session(std::string id, SessionServices services, SessionConfig config, EventSink sink)
    : m_id(std::move(id))
    , m_services(std::move(services))
    , m_config(std::move(config))
    , m_sink(std::move(sink))
    , m_lastActivity(std::chrono::steady_clock::now())
{}

Session::~Session() = default;

SessionState Session::state() const {
    std::lock_guard<std::mutex> lock(m_queueMutex);
    return m_state;
}

void Session::onClose() {
    size_t dropped = 0;
    {
        std::lock_guard<std::mutex> lock(m_queueMutex);
        if (m_closed.exchange(true)) {
            return;
        }
        dropped = m_queue.size();
        m_queue.clear();
        m_state = SessionState::Closed;
        m_idleCondition.notify_all();
    }
    finishClose("closed (dropped " + std::to_string(dropped) + " queued)");
}

bool Session::closeIfIdle(std::chrono::steady_clock::duration idleTimeout,
                          std::chrono::steady_clock::time_point now) {
    {
        // 与入队互斥：判定为空闲后不会再有输入被接受
        std::lock_guard<std::mutex> lock(m_queueMutex);
        if (m_closed.load() || m_draining || !m_queue.empty()) {
            return false;
        }
        if (now - lastActivity() < idleTimeout) {
            return false;
        }
        m_closed.store(true);
        m_state = SessionState::Closed;
        m_idleCondition.notify_all();
    }
    finishClose("closed after idle timeout");
    return true;
}

void Session::finishClose(const std::string& reason) {
    // 屏障：等待正在进行的下发结束，此后 emit 一律丢弃
    { std::lock_guard<std::mutex> barrier(m_emitMutex); }

    if (m_services.errorHandler) {
        m_services.errorHandler->info("Session " + m_id + " " + reason);
    }
}

// ========== 事件入口 ==========

void Session::handleMessage(const std::string& frame) {
    try {
        handleEvent(types::parseClientEvent(frame));
    } catch (const ServiceError& e) {
        if (m_services.errorHandler) {
            m_services.errorHandler->warning("Session " + m_id + " rejected message", e.errorInfo());
        }
        emitError(e.code(), e.what(), false);
    }
}

void Session::handleEvent(const types::ClientEvent& event) {
    switch (event.type) {
        case types::ClientEventType::TextInput:
            onTextInput(event.content);
            break;
        case types::ClientEventType::EmotionUpdate:
            onEmotionUpdate(event.emotion, event.confidence);
            break;
    }
}

void Session::onTextInput(const std::string& text) {
    const std::string content = utils::collapseWhitespace(text);
    if (content.empty()) {
        throw InvalidInputError("text_input content must not be empty");
    }
    touch();

    Job job;
    job.kind = Job::Kind::Text;
    job.payload = content;
    enqueue(std::move(job));
}

bool Session::onEmotionUpdate(const std::string& emotion, std::optional<double> confidence) {
    if (m_closed.load()) {
        throw InvalidInputError("Session is closed");
    }
    const std::string kind = normalizeEmotion(emotion);
    if (kind.empty()) {
        throw InvalidInputError("emotion_update emotion must not be empty");
    }

    {
        std::lock_guard<std::mutex> lock(m_dataMutex);
        m_emotion = kind;
        m_lastActivity = std::chrono::steady_clock::now();
    }
    if (m_services.errorHandler && confidence.has_value()) {
        m_services.errorHandler->debug("Session " + m_id + " emotion=" + kind + " confidence=" + std::to_string(*confidence));
    }

    if (!m_services.trigger) {
        return false;
    }

    Job job;
    job.kind = Job::Kind::Emotion;
    job.payload = kind;

    std::optional<TriggerClock::time_point> previous;
    bool schedule = false;
    {
        // 容量检查、冷却判定与入队在同一临界区：被拒绝的更新不消耗冷却
        std::lock_guard<std::mutex> lock(m_queueMutex);
        if (m_closed.load()) {
            throw InvalidInputError("Session is closed");
        }
        previous = m_cooldown.lastTrigger(kind);
        if (m_queue.size() >= m_config.maxQueuePerSession) {
            const auto& policy = m_services.trigger->policy();
            const bool coolingDown = previous.has_value() && TriggerClock::now() - *previous < policy.cooldown;
            if (policy.isTriggerEmotion(kind) && !coolingDown) {
                throw InvalidInputError("session busy");
            }
            return false;
        }
        if (!m_services.trigger->evaluate(kind, m_cooldown)) {
            return false;
        }
        schedule = pushLocked(std::move(job));
    }

    if (schedule && !scheduleDrain()) {
        std::lock_guard<std::mutex> lock(m_queueMutex);
        m_cooldown.restore(kind, previous);
        m_queue.clear();
        finishDrainLocked();
        throw InvalidInputError("Pipeline executor is not running");
    }
    return true;
}

// ========== 队列 ==========

void Session::enqueue(Job job) {
    bool schedule = false;
    {
        std::lock_guard<std::mutex> lock(m_queueMutex);
        schedule = pushLocked(std::move(job));
    }

    if (schedule && !scheduleDrain()) {
        std::lock_guard<std::mutex> lock(m_queueMutex);
        m_queue.clear();
        finishDrainLocked();
        throw InvalidInputError("Pipeline executor is not running");
    }
}

bool Session::pushLocked(Job job) {
    if (m_closed.load()) {
        throw InvalidInputError("Session is closed");
    }
    if (m_queue.size() >= m_config.maxQueuePerSession) {
        throw InvalidInputError("session busy");
    }
    m_queue.push_back(std::move(job));
    if (m_draining) {
        return false;
    }
    m_draining = true;
    m_state = SessionState::Processing;
    return true;
}

bool Session::scheduleDrain() {
    auto self = shared_from_this();
    return m_services.executor && m_services.executor->submit([self] { self->drain(); });
}

void Session::finishDrainLocked() {
    m_draining = false;
    if (!m_closed.load()) {
        m_state = SessionState::Connected;
    }
    m_idleCondition.notify_all();
}

void Session::drain() {
    Job job;
    {
        std::lock_guard<std::mutex> lock(m_queueMutex);
        if (m_closed.load() || m_queue.empty()) {
            finishDrainLocked();
            return;
        }
        job = std::move(m_queue.front());
        m_queue.pop_front();
    }

    try {
        runJob(job);
    } catch (const std::exception& e) {
        if (m_services.errorHandler) {
            m_services.errorHandler->error("Session " + m_id + " pipeline error: " + e.what());
        }
        emitError("internal_error", e.what(), false);
    }

    {
        std::lock_guard<std::mutex> lock(m_queueMutex);
        if (m_closed.load() || m_queue.empty()) {
            finishDrainLocked();
            return;
        }
    }

    // 还有排队任务：重新提交，让其他会话的任务也有机会执行
    if (!scheduleDrain()) {
        std::lock_guard<std::mutex> lock(m_queueMutex);
        m_queue.clear();
        finishDrainLocked();
    }
}

void Session::runJob(const Job& job) {
    const bool isEmotion = job.kind == Job::Kind::Emotion;

    std::vector<types::Turn> transcript;
    if (isEmotion) {
        // 合成的提示词只进入本次 transcript，不写入历史
        transcript = history();
        transcript.push_back(types::Turn::user(m_services.trigger->promptFor(job.payload)));
    } else {
        appendTurn(types::Turn::user(job.payload));
        transcript = history();
    }

    std::string reply;
    try {
        // 只有用户输入走检索增强
        const auto mode = isEmotion ? GenerationCoordinator::ContextMode::Plain
                                    : GenerationCoordinator::ContextMode::Retrieval;
        reply = m_services.generation->generate(transcript, mode);
    } catch (const GenerationError& e) {
        emitError(e.code(), e.what(), e.retryable());
        return;
    } catch (const ServiceError& e) {
        emitError(e.code(), e.what(), false);
        return;
    }

    if (m_closed.load()) {
        return; // 连接已关闭，丢弃结果
    }

    std::string audio;
    std::optional<std::string> audioError;
    try {
        auto bytes = m_services.synthesis->synthesizeFor(reply, m_config.language);
        audio = utils::encodeBase64(*bytes);
    } catch (const ServiceError& e) {
        // 文本已生成：仍下发文本，音频为空并附带原因
        audioError = e.what();
        if (m_services.errorHandler) {
            m_services.errorHandler->warning("Session " + m_id + " synthesis fallback to text", e.errorInfo());
        }
    }

    if (m_closed.load()) {
        return;
    }

    appendTurn(types::Turn::assistant(reply));
    touch();

    if (isEmotion) {
        emit(types::ServerEvent::emotionInteraction(job.payload, std::move(reply), std::move(audio), std::move(audioError)));
    } else {
        emit(types::ServerEvent::response(std::move(reply), std::move(audio), std::move(audioError)));
    }
}

// ========== 状态 ==========

void Session::appendTurn(types::Turn turn) {
    std::lock_guard<std::mutex> lock(m_dataMutex);
    m_history.push_back(std::move(turn));
    if (m_history.size() > m_config.historyMaxTurns) {
        m_history.erase(m_history.begin(),
                        m_history.begin() + static_cast<std::ptrdiff_t>(m_history.size() - m_config.historyMaxTurns));
    }
}

void Session::touch() {
    std::lock_guard<std::mutex> lock(m_dataMutex);
    m_lastActivity = std::chrono::steady_clock::now();
}

std::vector<types::Turn> Session::history() const {
    std::lock_guard<std::mutex> lock(m_dataMutex);
    return m_history;
}

std::optional<std::string> Session::emotionState() const {
    std::lock_guard<std::mutex> lock(m_dataMutex);
    return m_emotion;
}

std::chrono::steady_clock::time_point Session::lastActivity() const {
    std::lock_guard<std::mutex> lock(m_dataMutex);
    return m_lastActivity;
}

size_t Session::pendingCount() const {
    std::lock_guard<std::mutex> lock(m_queueMutex);
    return m_queue.size();
}

bool Session::waitIdle(std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(m_queueMutex);
    return m_idleCondition.wait_for(lock, timeout, [this] { return !m_draining; });
}

// ========== 下发 ==========

void Session::emit(const types::ServerEvent& event) {
    std::lock_guard<std::mutex> lock(m_emitMutex);
    if (m_closed.load() || !m_sink) {
        return;
    }
    m_sink(event);
}

void Session::emitError(const std::string& code, const std::string& message, bool retryable) {
    emit(types::ServerEvent::error(code, message, retryable));
}

} // namespace vtb::voice_bot::service
