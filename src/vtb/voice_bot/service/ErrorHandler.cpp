#include "vtb/voice_bot/service/ErrorHandler.h"

#include "vtb/voice_bot/service/ConfigManager.h"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <sstream>
#include <string>

namespace vtb::voice_bot::service {

static uint64_t nowEpochMs() {
    using namespace std::chrono;
    return static_cast<uint64_t>(duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count());
}

static bool containsCaseInsensitive(const std::string& haystack, const std::string& needle) {
    return utils::toLowerCopy(haystack).find(needle) != std::string::npos;
}

ErrorHandler::ErrorHandler()
    : m_loggerCfg(LoggerConfig{})
{}

ErrorHandler::ErrorHandler(LoggerConfig cfg)
    : m_loggerCfg(cfg)
{}

void ErrorHandler::setLoggerConfig(LoggerConfig cfg) {
    m_loggerCfg = cfg;
}

const ErrorHandler::LoggerConfig& ErrorHandler::getLoggerConfig() const {
    return m_loggerCfg;
}

std::optional<ErrorHandler::LogLevel> ErrorHandler::parseLogLevel(const std::string& name) {
    const auto low = utils::toLowerCopy(name);
    if (low == "error") return LogLevel::Error;
    if (low == "warning" || low == "warn") return LogLevel::Warning;
    if (low == "info") return LogLevel::Info;
    if (low == "debug") return LogLevel::Debug;
    return std::nullopt;
}

ErrorHandler::LoggerConfig ErrorHandler::loggerConfigFrom(const ConfigManager& cfg) {
    LoggerConfig out;
    if (auto v = cfg.get("logging.enabled"); v.has_value() && v->is_boolean()) {
        out.enabled = v->get<bool>();
    }
    if (auto v = cfg.get("logging.level"); v.has_value() && v->is_string()) {
        if (auto lv = parseLogLevel(v->get<std::string>()); lv.has_value()) {
            out.minLevel = *lv;
        }
    }
    return out;
}

const char* ErrorHandler::logLevelToString(LogLevel level) {
    switch (level) {
        case LogLevel::Error: return "ERROR";
        case LogLevel::Warning: return "WARNING";
        case LogLevel::Info: return "INFO";
        default: return "DEBUG";
    }
}

ErrorType ErrorHandler::mapHttpStatusToErrorType(int statusCode, const std::string& transportError) {
    if (statusCode == 0) {
        // statusCode==0 表示传输层失败；文案含 timeout 则归为 Timeout
        if (containsCaseInsensitive(transportError, "timeout")) return ErrorType::TimeoutError;
        return ErrorType::NetworkError;
    }
    if (statusCode == 408) return ErrorType::TimeoutError;
    if (statusCode == 429) return ErrorType::RateLimitError;
    if (statusCode >= 500 && statusCode < 600) return ErrorType::ServerError;
    if (statusCode >= 400 && statusCode < 500) return ErrorType::InvalidRequest;
    return ErrorType::UnknownError;
}

std::optional<ErrorInfo> ErrorHandler::parseApiErrorJson(const nlohmann::json& root, int httpStatusCode) {
    if (!root.is_object()) return std::nullopt;
    if (!root.contains("error")) return std::nullopt;
    const auto& e = root.at("error");

    ErrorInfo info;
    info.errorCode = httpStatusCode;
    info.timestamp = std::chrono::system_clock::now();
    info.errorType = mapHttpStatusToErrorType(httpStatusCode);

    // OpenRouter 偶尔返回 {"error": "text"}
    if (e.is_string()) {
        info.message = e.get<std::string>();
        info.details = e;
        return info;
    }
    if (!e.is_object()) return std::nullopt;

    std::string msg;
    if (e.contains("message") && e.at("message").is_string()) {
        msg = e.at("message").get<std::string>();
    }
    if (msg.empty()) msg = "API error";
    info.message = msg;
    info.details = e;

    const auto typeStr = e.contains("type") && e.at("type").is_string() ? e.at("type").get<std::string>() : "";
    const auto codeStr = e.contains("code") && e.at("code").is_string() ? e.at("code").get<std::string>() : "";
    if (containsCaseInsensitive(typeStr, "rate") || containsCaseInsensitive(codeStr, "rate")) {
        info.errorType = ErrorType::RateLimitError;
    }
    if (containsCaseInsensitive(typeStr, "timeout")) {
        info.errorType = ErrorType::TimeoutError;
    }
    // 部分网关把上游错误码放在 error.code（数值）里
    if (httpStatusCode == 0 && e.contains("code") && e.at("code").is_number_integer()) {
        info.errorCode = e.at("code").get<int>();
        info.errorType = mapHttpStatusToErrorType(info.errorCode);
    }

    return info;
}

ErrorInfo ErrorHandler::fromHttpResponse(
    const utils::HttpResponse& resp,
    const std::optional<utils::HttpRequest>& req) {

    ErrorInfo info;
    info.timestamp = std::chrono::system_clock::now();
    info.errorCode = resp.statusCode;
    info.errorType = mapHttpStatusToErrorType(resp.statusCode, resp.error);

    // message：优先 API error.message -> resp.error -> resp.body(截断) -> fallback
    std::optional<nlohmann::json> parsed;
    if (!resp.body.empty()) {
        parsed = resp.asJson();
        if (parsed.has_value()) {
            auto apiInfo = parseApiErrorJson(*parsed, resp.statusCode);
            if (apiInfo.has_value()) {
                info = *apiInfo;
            }
        }
    }

    if (info.message.empty()) {
        if (!resp.error.empty()) {
            info.message = resp.error;
        } else if (!resp.body.empty()) {
            info.message = resp.body.substr(0, 256);
        } else {
            info.message = "HTTP request failed";
        }
    }

    if (!info.details.has_value()) {
        nlohmann::json d;
        d["http_status"] = resp.statusCode;
        if (!resp.error.empty()) d["transport_error"] = resp.error;
        if (parsed.has_value()) {
            d["body_json"] = *parsed;
        } else if (!resp.body.empty()) {
            d["body_snippet"] = resp.body.substr(0, 1024);
        }
        info.details = d;
    }

    // 仅记录 method/url，不记录 Authorization
    if (req.has_value()) {
        info.addContext("url", req->url);
        info.addContext("method", req->method == utils::HttpMethod::GET ? "GET" : "POST");
    }

    return info;
}

bool ErrorHandler::isRetryable(ErrorType type) {
    switch (type) {
        case ErrorType::NetworkError:
        case ErrorType::TimeoutError:
        case ErrorType::RateLimitError:
        case ErrorType::ServerError:
            return true;
        default:
            return false;
    }
}

void ErrorHandler::log(LogLevel level, const std::string& message, const std::optional<ErrorInfo>& err) const {
    if (!m_loggerCfg.enabled) return;
    if (static_cast<int>(level) > static_cast<int>(m_loggerCfg.minLevel)) return;

    // 结构化输出到 stderr：timestamp + level + message + optional error json
    std::ostringstream oss;
    oss << "[" << nowEpochMs() << "] "
        << logLevelToString(level) << " "
        << message;
    if (err.has_value()) {
        oss << " " << err->toString();
    }
    oss << "\n";
    const auto line = oss.str();
    std::fwrite(line.c_str(), 1, line.size(), stderr);
    std::fflush(stderr);
}

} // namespace vtb::voice_bot::service
