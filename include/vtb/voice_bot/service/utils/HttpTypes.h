#pragma once

#include <algorithm>
#include <cctype>
#include <map>
#include <optional>
#include <string>

#include "nlohmann/json.hpp"

namespace vtb::voice_bot::service::utils {

/**
 * @brief HTTP请求方法枚举（provider 调用只用到 GET/POST）
 */
enum class HttpMethod {
    GET,
    POST
};

/**
 * @brief HTTP请求结构
 */
struct HttpRequest {
    HttpMethod method = HttpMethod::GET;
    std::string url;
    std::map<std::string, std::string> headers;
    std::string body;
    int timeoutMs = 30000;  // 默认30秒超时

    void setHeader(const std::string& key, const std::string& value) {
        headers[key] = value;
    }

    std::optional<std::string> getHeader(const std::string& key) const {
        auto it = headers.find(key);
        if (it != headers.end()) {
            return it->second;
        }
        return std::nullopt;
    }
};

inline std::string toLowerCopy(const std::string& s) {
    std::string out = s;
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

/**
 * @brief HTTP响应结构
 */
struct HttpResponse {
    int statusCode = 0;                         // 0 表示传输层失败
    std::map<std::string, std::string> headers; // 小写键
    std::string body;
    std::string error;  // 错误信息（如果有）

    bool isSuccess() const {
        return statusCode >= 200 && statusCode < 300;
    }

    bool isClientError() const {
        return statusCode >= 400 && statusCode < 500;
    }

    bool isServerError() const {
        return statusCode >= 500 && statusCode < 600;
    }

    /**
     * @brief 获取响应头（不区分大小写）
     */
    std::optional<std::string> getHeader(const std::string& key) const {
        auto it = headers.find(toLowerCopy(key));
        if (it != headers.end()) {
            return it->second;
        }
        return std::nullopt;
    }

    bool isJson() const {
        auto contentType = getHeader("Content-Type");
        if (!contentType.has_value()) {
            return false;
        }
        return contentType->find("application/json") != std::string::npos;
    }

    /**
     * @brief 按 JSON 解析 body（不检查 Content-Type）；失败返回 nullopt
     */
    std::optional<nlohmann::json> asJson(std::string* errorMsg = nullptr) const {
        try {
            return nlohmann::json::parse(body);
        } catch (const std::exception& e) {
            if (errorMsg) *errorMsg = e.what();
            return std::nullopt;
        }
    }
};

} // namespace vtb::voice_bot::service::utils
