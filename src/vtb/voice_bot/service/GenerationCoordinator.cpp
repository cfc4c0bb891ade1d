#include "vtb/voice_bot/service/GenerationCoordinator.h"

#include "vtb/voice_bot/service/ConfigManager.h"
#include "vtb/voice_bot/service/ErrorHandler.h"
#include "vtb/voice_bot/service/ServiceErrors.h"
#include "vtb/voice_bot/service/utils/TextUtils.h"

#include <deque>
#include <map>
#include <utility>

namespace vtb::voice_bot::service {

static std::string languageDisplayName(const std::string& code) {
    static const std::map<std::string, std::string> kNames{
        {"zh", "Chinese"}, {"en", "English"}, {"ja", "Japanese"}, {"ko", "Korean"},
        {"fr", "French"},  {"de", "German"},  {"es", "Spanish"},  {"it", "Italian"},
        {"ru", "Russian"}, {"pt", "Portuguese"},
    };
    auto it = kNames.find(code);
    return it != kNames.end() ? it->second : code;
}

// ========== CharacterConfig ==========

CharacterConfig CharacterConfig::fromConfig(const ConfigManager& cfg) {
    CharacterConfig c;
    c.name = cfg.getOr<std::string>("character.name", c.name);
    c.persona = cfg.getOr<std::string>("character.persona", c.persona);
    c.language = cfg.getOr<std::string>("character.language", c.language);
    return c;
}

std::string CharacterConfig::defaultPersona(const std::string& name) {
    return "You are " + name + ", a helpful and friendly AI assistant. "
           "You are cheerful, supportive, and always ready to help. "
           "Keep your responses concise and natural, as if speaking in a conversation. "
           "You can help with information, answer questions, or just chat. "
           "Give short answers.";
}

std::string CharacterConfig::systemPreamble() const {
    std::string out = utils::collapseWhitespace(persona).empty() ? defaultPersona(name) : persona;
    if (!language.empty()) {
        out += " Always reply in " + languageDisplayName(language) + ".";
    }
    return out;
}

// ========== GenerationParams ==========

GenerationParams GenerationParams::fromConfig(const ConfigManager& cfg) {
    GenerationParams p;
    p.model = cfg.getOr<std::string>("llm.model_id", p.model);
    if (auto v = cfg.getOr<int64_t>("llm.max_tokens", 0); v > 0) {
        p.maxTokens = static_cast<uint32_t>(v);
    }
    p.temperature = static_cast<float>(cfg.getOr<double>("llm.temperature", p.temperature));
    if (auto v = cfg.getOr<int64_t>("llm.transcript_budget_chars", 0); v > 0) {
        p.transcriptBudgetChars = static_cast<size_t>(v);
    }
    if (auto v = cfg.getOr<int64_t>("llm.max_history_turns", -1); v >= 0) {
        p.maxHistoryTurns = static_cast<size_t>(v);
    }
    return p;
}

// ========== GenerationCoordinator ==========

GenerationCoordinator::GenerationCoordinator(std::shared_ptr<LanguageModel> model,
                                             CharacterConfig character,
                                             GenerationParams params,
                                             ErrorHandler* errorHandler,
                                             std::shared_ptr<ContextRetriever> retriever,
                                             RetrievalConfig retrieval)
    : m_model(std::move(model))
    , m_character(std::move(character))
    , m_params(std::move(params))
    , m_errorHandler(errorHandler)
    , m_retriever(std::move(retriever))
    , m_retrieval(std::move(retrieval))
{}

std::vector<types::ChatMessage> GenerationCoordinator::buildTranscript(const std::vector<types::Turn>& history,
                                                                       const std::string& preamble,
                                                                       size_t maxHistoryTurns,
                                                                       size_t budgetChars) {
    // 1) 最近 N 条
    size_t begin = 0;
    if (maxHistoryTurns > 0 && history.size() > maxHistoryTurns) {
        begin = history.size() - maxHistoryTurns;
    }

    std::deque<const types::Turn*> window;
    size_t total = preamble.size();
    for (size_t i = begin; i < history.size(); ++i) {
        // transcript 只含 user/assistant；历史中的 system turn 由 preamble 取代
        if (history[i].role == types::MessageRole::System) continue;
        window.push_back(&history[i]);
        total += history[i].content.size();
    }

    // 2) 按预算从最旧开始丢弃，保留最新一条
    while (total > budgetChars && window.size() > 1) {
        total -= window.front()->content.size();
        window.pop_front();
    }

    std::vector<types::ChatMessage> out;
    out.reserve(window.size() + 1);
    out.push_back(types::ChatMessage{types::MessageRole::System, preamble});
    for (const auto* t : window) {
        out.push_back(types::ChatMessage{t->role, t->content});
    }
    return out;
}

types::ChatRequest GenerationCoordinator::buildRequest(const std::vector<types::Turn>& history,
                                                       const CharacterConfig& character,
                                                       ContextMode mode) const {
    types::ChatRequest req;
    req.model = m_params.model;
    req.messages = buildTranscript(history, character.systemPreamble(), m_params.maxHistoryTurns,
                                   m_params.transcriptBudgetChars);
    if (mode == ContextMode::Retrieval && req.messages.size() > 1 &&
        req.messages.back().role == types::MessageRole::User) {
        req.messages.back().content = augmentQuestion(req.messages.back().content);
    }
    req.maxTokens = m_params.maxTokens;
    req.temperature = m_params.temperature;
    return req;
}

std::string GenerationCoordinator::augmentQuestion(const std::string& question) const {
    if (!m_retriever) {
        return question;
    }
    std::vector<std::string> chunks;
    try {
        chunks = m_retriever->retrieve(question, m_retrieval.topK);
    } catch (const std::exception& e) {
        // 检索失败不影响回答，退化为无上下文
        if (m_errorHandler) {
            m_errorHandler->warning(std::string("Context retrieval failed (") + m_retriever->name() + "): " + e.what());
        }
        return question;
    }
    if (m_errorHandler && !chunks.empty()) {
        m_errorHandler->debug("Retrieved " + std::to_string(chunks.size()) + " context chunks");
    }
    return m_retrieval.render(chunks, question);
}

std::string GenerationCoordinator::generate(const std::vector<types::Turn>& history, ContextMode mode) const {
    return generate(history, m_character, mode);
}

std::string GenerationCoordinator::generate(const std::vector<types::Turn>& history,
                                            const CharacterConfig& character,
                                            ContextMode mode) const {
    if (history.empty()) {
        throw InvalidInputError("Cannot generate a reply for an empty conversation");
    }

    const auto req = buildRequest(history, character, mode);
    if (m_errorHandler) {
        m_errorHandler->debug("LLM request: model=" + req.model + " messages=" + std::to_string(req.messages.size()) +
                              " chars=" + std::to_string(req.contentChars()));
    }

    try {
        auto resp = m_model->complete(req);
        if (utils::collapseWhitespace(resp.content).empty()) {
            // 空回复无法朗读，也不应写入历史
            ErrorInfo info;
            info.errorType = ErrorType::ServerError;
            info.message = "Language model returned an empty reply";
            info.addContext("model", req.model);
            info.addContext("provider", m_model->name());
            throw GenerationError(std::move(info), false);
        }
        return std::move(resp.content);
    } catch (const GenerationError& e) {
        if (m_errorHandler) {
            m_errorHandler->warning(std::string("Generation failed (retryable=") + (e.retryable() ? "true" : "false") + ")",
                                    e.errorInfo());
        }
        throw;
    } catch (const ServiceError&) {
        throw;
    } catch (const std::exception& e) {
        ErrorInfo info;
        info.errorType = ErrorType::UnknownError;
        info.message = std::string("Language model error: ") + e.what();
        info.addContext("model", req.model);
        info.addContext("provider", m_model->name());
        if (m_errorHandler) {
            m_errorHandler->warning("Generation failed", info);
        }
        throw GenerationError(std::move(info), false);
    }
}

} // namespace vtb::voice_bot::service
