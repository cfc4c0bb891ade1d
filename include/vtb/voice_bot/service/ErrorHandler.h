#pragma once

#include "vtb/voice_bot/service/ErrorTypes.h"
#include "vtb/voice_bot/service/utils/HttpTypes.h"

#include <optional>
#include <string>
#include <unordered_map>

namespace vtb::voice_bot::service {

class ConfigManager;

class ErrorHandler {
public:
    enum class LogLevel {
        Error,
        Warning,
        Info,
        Debug
    };

    struct LoggerConfig {
        LogLevel minLevel{LogLevel::Info};
        bool enabled{true};
    };

    ErrorHandler();
    explicit ErrorHandler(LoggerConfig cfg);

    void setLoggerConfig(LoggerConfig cfg);
    const LoggerConfig& getLoggerConfig() const;

    // 从配置 logging.level / logging.enabled 构造
    static LoggerConfig loggerConfigFrom(const ConfigManager& cfg);
    static std::optional<LogLevel> parseLogLevel(const std::string& name);

    // ========== 识别/解析 ==========
    static ErrorType mapHttpStatusToErrorType(int statusCode, const std::string& transportError = "");

    // 从 HttpResponse 生成 ErrorInfo（会尝试解析 body 的 API 错误 JSON）
    static ErrorInfo fromHttpResponse(
        const utils::HttpResponse& resp,
        const std::optional<utils::HttpRequest>& req = std::nullopt);

    // 解析 OpenAI 兼容 error JSON：{"error": {"message": "...", "type": "...", "code": ...}}
    // 非该形状返回 nullopt
    static std::optional<ErrorInfo> parseApiErrorJson(const nlohmann::json& root, int httpStatusCode = 0);

    // 仅用于给 GenerationError 打 retryable 标记，服务端本身不重试
    static bool isRetryable(ErrorType type);

    // ========== 日志 ==========
    void log(LogLevel level, const std::string& message, const std::optional<ErrorInfo>& err = std::nullopt) const;

    void error(const std::string& message, const std::optional<ErrorInfo>& err = std::nullopt) const {
        log(LogLevel::Error, message, err);
    }
    void warning(const std::string& message, const std::optional<ErrorInfo>& err = std::nullopt) const {
        log(LogLevel::Warning, message, err);
    }
    void info(const std::string& message) const { log(LogLevel::Info, message); }
    void debug(const std::string& message) const { log(LogLevel::Debug, message); }

    static const char* logLevelToString(LogLevel level);

private:
    LoggerConfig m_loggerCfg;
};

} // namespace vtb::voice_bot::service
