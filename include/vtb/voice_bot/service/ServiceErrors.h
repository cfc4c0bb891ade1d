#pragma once

#include "vtb/voice_bot/service/ErrorTypes.h"

#include <stdexcept>
#include <string>

namespace vtb::voice_bot::service {

/**
 * @brief 服务层异常基类：携带 ErrorInfo 与稳定的错误码（下发给客户端的 code 字段）
 *
 * 协调器边界把所有外部调用失败转换为下面的具体类型，Session 只与这些类型打交道。
 */
class ServiceError : public std::runtime_error {
public:
    ServiceError(const char* code, ErrorInfo info)
        : std::runtime_error(info.message)
        , m_code(code)
        , m_info(std::move(info))
    {}

    const char* code() const noexcept { return m_code; }
    const ErrorInfo& errorInfo() const { return m_info; }

private:
    const char* m_code;
    ErrorInfo m_info;
};

namespace detail {
inline ErrorInfo makeInfo(ErrorType type, const std::string& message) {
    ErrorInfo info;
    info.errorType = type;
    info.message = message;
    return info;
}
} // namespace detail

// 客户端载荷非法/为空：上报客户端，会话继续
class InvalidInputError : public ServiceError {
public:
    explicit InvalidInputError(const std::string& message)
        : ServiceError("invalid_input", detail::makeInfo(ErrorType::InvalidRequest, message)) {}
};

// LLM 调用失败；retryable 仅作提示，服务端不做自动重试
class GenerationError : public ServiceError {
public:
    GenerationError(ErrorInfo info, bool retryable)
        : ServiceError("generation_failed", std::move(info))
        , m_retryable(retryable) {}

    bool retryable() const noexcept { return m_retryable; }

private:
    bool m_retryable;
};

class SynthesisError : public ServiceError {
public:
    explicit SynthesisError(ErrorInfo info)
        : ServiceError("synthesis_failed", std::move(info)) {}
    explicit SynthesisError(const std::string& message)
        : ServiceError("synthesis_failed", detail::makeInfo(ErrorType::UnknownError, message)) {}
};

// 配置错误：只影响当前请求
class UnsupportedVoiceError : public ServiceError {
public:
    explicit UnsupportedVoiceError(const std::string& message)
        : ServiceError("unsupported_voice", detail::makeInfo(ErrorType::InvalidRequest, message)) {}
};

class NotFoundError : public ServiceError {
public:
    explicit NotFoundError(const std::string& message)
        : ServiceError("not_found", detail::makeInfo(ErrorType::InvalidRequest, message)) {}
};

class DuplicateSessionError : public ServiceError {
public:
    explicit DuplicateSessionError(const std::string& message)
        : ServiceError("duplicate_session", detail::makeInfo(ErrorType::InvalidRequest, message)) {}
};

} // namespace vtb::voice_bot::service
