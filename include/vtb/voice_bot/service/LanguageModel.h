#pragma once

#include "vtb/voice_bot/service/types/RequestResponse.h"

#include <string>

namespace vtb::voice_bot::service {

class ConfigManager;

/**
 * @brief 外部 LLM 能力：给定 transcript 与生成参数，返回生成文本
 *
 * 失败抛出 GenerationError（带 retryable 标记）。实现可被多个线程并发调用。
 */
class LanguageModel {
public:
    virtual ~LanguageModel() = default;

    virtual types::ChatResponse complete(const types::ChatRequest& request) = 0;

    virtual std::string name() const = 0;
};

/**
 * @brief LLM provider 连接配置（llm.base_url / llm.api_key / llm.timeout_ms）
 */
struct LlmProviderConfig {
    std::string baseUrl{"https://openrouter.ai/api/v1"};
    std::string apiKey;
    int timeoutMs{30000};

    static LlmProviderConfig fromConfig(const ConfigManager& cfg);
};

/**
 * @brief OpenAI 兼容的 /chat/completions 客户端（OpenRouter 等）
 */
class OpenAiCompatibleModel : public LanguageModel {
public:
    explicit OpenAiCompatibleModel(LlmProviderConfig config);

    types::ChatResponse complete(const types::ChatRequest& request) override;
    std::string name() const override { return "openai-compatible"; }

private:
    const LlmProviderConfig m_config;
};

} // namespace vtb::voice_bot::service
