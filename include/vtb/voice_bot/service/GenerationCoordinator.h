#pragma once

#include "vtb/voice_bot/service/ContextRetriever.h"
#include "vtb/voice_bot/service/LanguageModel.h"
#include "vtb/voice_bot/service/types/RequestResponse.h"
#include "vtb/voice_bot/service/types/Turn.h"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace vtb::voice_bot::service {

class ConfigManager;
class ErrorHandler;

/**
 * @brief 角色配置（character.*），构造后不可变
 */
struct CharacterConfig {
    std::string name{"Nana"};
    std::string persona;        // 为空时使用 defaultPersona(name)
    std::string language{"zh"};

    static CharacterConfig fromConfig(const ConfigManager& cfg);

    static std::string defaultPersona(const std::string& name);

    // system 消息：persona + 回复语言要求
    std::string systemPreamble() const;
};

/**
 * @brief 生成参数（llm.*），构造后不可变
 */
struct GenerationParams {
    std::string model{"deepseek/deepseek-chat-v3-0324:free"};
    uint32_t maxTokens{1000};
    float temperature{0.7f};
    size_t transcriptBudgetChars{4000}; // transcript 内容总字节上限（含 preamble）
    size_t maxHistoryTurns{10};         // 只取最近 N 条；0 表示不限

    static GenerationParams fromConfig(const ConfigManager& cfg);
};

/**
 * @brief 生成协调器：把会话历史格式化为 LLM transcript 并调用外部模型
 *
 * 无状态：不保存任何会话数据，可被所有会话共享。
 *
 * transcript 裁剪规则：
 * 1. system preamble 永远在首位，永不丢弃
 * 2. 先只保留最近 maxHistoryTurns 条
 * 3. 若内容总长仍超过 transcriptBudgetChars，从最旧的 turn 开始丢弃，直到满足预算；
 *    最新一条 turn（当前要回答的输入）总是保留
 *
 * 检索增强（ContextMode::Retrieval 且配置了检索器）：最新一条 user 消息在请求中被替换为
 * RetrievalConfig::render 的结果；会话历史仍保存原始输入。检索内容不计入 transcript 预算。
 */
class GenerationCoordinator {
public:
    enum class ContextMode {
        Retrieval, // 用户输入：先检索再套模板
        Plain      // 系统合成的提示（情绪互动等）
    };

    GenerationCoordinator(std::shared_ptr<LanguageModel> model,
                          CharacterConfig character,
                          GenerationParams params,
                          ErrorHandler* errorHandler = nullptr,
                          std::shared_ptr<ContextRetriever> retriever = nullptr,
                          RetrievalConfig retrieval = RetrievalConfig{});

    GenerationCoordinator(const GenerationCoordinator&) = delete;
    GenerationCoordinator& operator=(const GenerationCoordinator&) = delete;

    /**
     * @brief 使用构造时的角色配置生成回复
     * @throws InvalidInputError history 为空
     * @throws GenerationError 外部调用失败、响应畸形或回复为空（仅空白也算空）
     */
    std::string generate(const std::vector<types::Turn>& history, ContextMode mode = ContextMode::Retrieval) const;

    std::string generate(const std::vector<types::Turn>& history,
                         const CharacterConfig& character,
                         ContextMode mode = ContextMode::Retrieval) const;

    // 构造发送给模型的请求（已裁剪）
    types::ChatRequest buildRequest(const std::vector<types::Turn>& history,
                                    const CharacterConfig& character,
                                    ContextMode mode = ContextMode::Plain) const;

    // 检索并套用模板；检索器缺失、无结果或检索失败时原样返回
    std::string augmentQuestion(const std::string& question) const;

    static std::vector<types::ChatMessage> buildTranscript(const std::vector<types::Turn>& history,
                                                           const std::string& preamble,
                                                           size_t maxHistoryTurns,
                                                           size_t budgetChars);

    const CharacterConfig& character() const { return m_character; }
    const GenerationParams& params() const { return m_params; }

private:
    std::shared_ptr<LanguageModel> m_model;
    const CharacterConfig m_character;
    const GenerationParams m_params;
    ErrorHandler* m_errorHandler;
    std::shared_ptr<ContextRetriever> m_retriever;
    const RetrievalConfig m_retrieval;
};

} // namespace vtb::voice_bot::service
