#pragma once

#include "HttpTypes.h"

#include <map>
#include <memory>
#include <mutex>
#include <string>

// 前向声明，避免包含整个httplib.h头文件
namespace httplib {
    class Client;
}

namespace vtb::voice_bot::service::utils {

/**
 * @brief HTTP客户端封装类（同步，基于cpp-httplib）
 *
 * 供 LLM / TTS provider 调用外部服务。不做自动重试：失败通过 HttpResponse.statusCode/error 返回，
 * 由上层转换为 ErrorInfo。超时由 HttpRequest.timeoutMs 控制（连接 + 读写）。
 *
 * httplib::Client 内部对同一实例的请求加锁串行，为了让不同会话的调用真正并行，
 * 每次请求使用独立的 httplib::Client 实例。
 */
class HttpClient {
public:
    /**
     * @param baseUrl 基础URL，例如 https://openrouter.ai/api/v1
     */
    explicit HttpClient(const std::string& baseUrl = "");
    ~HttpClient();

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    void setDefaultHeader(const std::string& key, const std::string& value);

    /**
     * @brief 设置超时时间（毫秒），作用于之后构造的请求
     */
    void setTimeout(int timeoutMs);
    int getTimeout() const;

    const std::string& getBaseUrl() const { return m_baseUrl; }

    // ========== 同步请求方法 ==========

    HttpResponse get(const std::string& path,
                     const std::map<std::string, std::string>& headers = {});

    HttpResponse post(const std::string& path,
                      const std::string& body = "",
                      const std::string& contentType = "application/json",
                      const std::map<std::string, std::string>& headers = {});

    HttpResponse postJson(const std::string& path,
                          const std::string& jsonBody,
                          const std::map<std::string, std::string>& headers = {});

    /**
     * @brief 通用请求方法（request.url 为完整URL）
     */
    HttpResponse execute(const HttpRequest& request);

    /**
     * @brief 拼接 baseUrl 与 path，处理多余/缺失的 '/'
     */
    std::string buildFullUrl(const std::string& path) const;

    /**
     * @brief 拆分完整URL为 scheme://host[:port] 与 path 两部分
     */
    static std::pair<std::string, std::string> splitUrl(const std::string& url);

private:
    std::map<std::string, std::string> mergeHeaders(
        const std::map<std::string, std::string>& requestHeaders) const;

    std::string m_baseUrl;
    mutable std::mutex m_mutex;
    std::map<std::string, std::string> m_defaultHeaders;
    int m_timeoutMs;
};

} // namespace vtb::voice_bot::service::utils
