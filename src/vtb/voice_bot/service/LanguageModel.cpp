#include "vtb/voice_bot/service/LanguageModel.h"

#include "vtb/voice_bot/service/ConfigManager.h"
#include "vtb/voice_bot/service/ErrorHandler.h"
#include "vtb/voice_bot/service/ServiceErrors.h"
#include "vtb/voice_bot/service/utils/HttpClient.h"
#include "vtb/voice_bot/service/utils/TextUtils.h"

#include <utility>

namespace vtb::voice_bot::service {

static void enrichErrorInfoContext(ErrorInfo& info, const std::string& model, const std::string& endpoint,
                                   const utils::HttpRequest& req) {
    // 不写入任何敏感信息（api_key、Authorization header）
    info.addContext("model", model);
    info.addContext("endpoint", endpoint);
    info.addContext("url", req.url);
}

LlmProviderConfig LlmProviderConfig::fromConfig(const ConfigManager& cfg) {
    LlmProviderConfig out;
    out.baseUrl = cfg.getOr<std::string>("llm.base_url", out.baseUrl);
    out.apiKey = cfg.getOr<std::string>("llm.api_key", out.apiKey);
    out.timeoutMs = cfg.getOr<int>("llm.timeout_ms", out.timeoutMs);
    return out;
}

OpenAiCompatibleModel::OpenAiCompatibleModel(LlmProviderConfig config)
    : m_config(std::move(config))
{}

types::ChatResponse OpenAiCompatibleModel::complete(const types::ChatRequest& request) {
    utils::HttpClient client(m_config.baseUrl);
    client.setTimeout(m_config.timeoutMs);

    const std::string endpoint = "/chat/completions";

    utils::HttpRequest hreq;
    hreq.method = utils::HttpMethod::POST;
    hreq.url = client.buildFullUrl(endpoint);
    hreq.body = request.toJson().dump();
    hreq.timeoutMs = m_config.timeoutMs;
    if (!m_config.apiKey.empty()) hreq.setHeader("Authorization", "Bearer " + m_config.apiKey);
    hreq.setHeader("Content-Type", "application/json");
    hreq.setHeader("Accept", "application/json");

    const auto resp = client.execute(hreq);
    if (!resp.isSuccess()) {
        auto info = ErrorHandler::fromHttpResponse(resp, hreq);
        enrichErrorInfoContext(info, request.model, endpoint, hreq);
        const bool retryable = ErrorHandler::isRetryable(info.errorType);
        throw GenerationError(std::move(info), retryable);
    }

    auto parsed = resp.asJson();
    if (!parsed.has_value()) {
        ErrorInfo info;
        info.errorType = ErrorType::UnknownError;
        info.errorCode = resp.statusCode;
        info.message = "Invalid JSON response";
        info.details = nlohmann::json{{"body_snippet", resp.body.substr(0, 1024)}};
        enrichErrorInfoContext(info, request.model, endpoint, hreq);
        throw GenerationError(std::move(info), false);
    }

    // 部分网关在 200 中返回 {"error": {...}}
    if (auto apiErr = ErrorHandler::parseApiErrorJson(*parsed, 0); apiErr.has_value()) {
        enrichErrorInfoContext(*apiErr, request.model, endpoint, hreq);
        const bool retryable = ErrorHandler::isRetryable(apiErr->errorType);
        throw GenerationError(std::move(*apiErr), retryable);
    }

    auto r = types::ChatResponse::fromJson(*parsed);
    if (!r.has_value()) {
        ErrorInfo info;
        info.errorType = ErrorType::UnknownError;
        info.errorCode = resp.statusCode;
        info.message = "Unexpected response format (missing choices[0].message.content)";
        info.details = *parsed;
        enrichErrorInfoContext(info, request.model, endpoint, hreq);
        throw GenerationError(std::move(info), false);
    }
    if (utils::collapseWhitespace(r->content).empty()) {
        ErrorInfo info;
        info.errorType = ErrorType::UnknownError;
        info.errorCode = resp.statusCode;
        info.message = "Model returned empty content";
        if (r->finishReason.has_value()) info.addContext("finish_reason", *r->finishReason);
        enrichErrorInfoContext(info, request.model, endpoint, hreq);
        throw GenerationError(std::move(info), false);
    }
    return *r;
}

} // namespace vtb::voice_bot::service
