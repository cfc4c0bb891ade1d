#include "vtb/voice_bot/service/utils/HttpClient.h"

// HTTPS 支持由构建系统在找到 OpenSSL 时定义 CPPHTTPLIB_OPENSSL_SUPPORT
#include "httplib.h"

#include <utility>

namespace vtb::voice_bot::service::utils {

HttpClient::HttpClient(const std::string& baseUrl)
    : m_baseUrl(baseUrl)
    , m_timeoutMs(30000)
{
    m_defaultHeaders["User-Agent"] = "VTB-VoiceBot/1.0";
}

HttpClient::~HttpClient() = default;

void HttpClient::setDefaultHeader(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_defaultHeaders[key] = value;
}

void HttpClient::setTimeout(int timeoutMs) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_timeoutMs = timeoutMs;
}

int HttpClient::getTimeout() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_timeoutMs;
}

// ========== 同步请求方法 ==========

HttpResponse HttpClient::get(const std::string& path,
                             const std::map<std::string, std::string>& headers) {
    HttpRequest request;
    request.method = HttpMethod::GET;
    request.url = buildFullUrl(path);
    request.headers = mergeHeaders(headers);
    request.timeoutMs = getTimeout();
    return execute(request);
}

HttpResponse HttpClient::post(const std::string& path,
                              const std::string& body,
                              const std::string& contentType,
                              const std::map<std::string, std::string>& headers) {
    HttpRequest request;
    request.method = HttpMethod::POST;
    request.url = buildFullUrl(path);
    request.body = body;
    request.timeoutMs = getTimeout();

    auto mergedHeaders = mergeHeaders(headers);
    mergedHeaders["Content-Type"] = contentType;
    request.headers = std::move(mergedHeaders);

    return execute(request);
}

HttpResponse HttpClient::postJson(const std::string& path,
                                  const std::string& jsonBody,
                                  const std::map<std::string, std::string>& headers) {
    return post(path, jsonBody, "application/json", headers);
}

HttpResponse HttpClient::execute(const HttpRequest& request) {
    HttpResponse response;

    try {
        const auto [hostPart, path] = splitUrl(request.url);
        if (hostPart.empty()) {
            response.error = "Invalid URL: " + request.url;
            return response;
        }

        httplib::Client client(hostPart);
        if (!client.is_valid()) {
            response.error = "Failed to create HTTP client for " + hostPart;
            return response;
        }

        const int timeoutMs = request.timeoutMs > 0 ? request.timeoutMs : 30000;
        client.set_connection_timeout(timeoutMs / 1000, (timeoutMs % 1000) * 1000);
        client.set_read_timeout(timeoutMs / 1000, (timeoutMs % 1000) * 1000);
        client.set_write_timeout(timeoutMs / 1000, (timeoutMs % 1000) * 1000);
        client.set_follow_location(true);

        httplib::Headers headers;
        std::string contentType = "application/json";
        for (const auto& [key, value] : request.headers) {
            if (toLowerCopy(key) == "content-type") {
                contentType = value;
                continue;
            }
            headers.emplace(key, value);
        }

        httplib::Result result;
        switch (request.method) {
            case HttpMethod::GET:
                result = client.Get(path.c_str(), headers);
                break;
            case HttpMethod::POST:
                result = client.Post(path.c_str(), headers, request.body, contentType.c_str());
                break;
        }

        if (result) {
            response.statusCode = result->status;
            response.body = result->body;
            for (const auto& [key, value] : result->headers) {
                response.headers[toLowerCopy(key)] = value;
            }
        } else {
            const auto err = result.error();
            response.statusCode = 0;
            response.error = "Request failed: error_code=" + std::to_string(static_cast<int>(err));
            // httplib 读超时表现为 Read 错误
            if (err == httplib::Error::Read) {
                response.error += " (read timeout)";
            }
        }
    } catch (const std::exception& e) {
        response.statusCode = 0;
        response.error = "Exception: " + std::string(e.what());
    }

    return response;
}

std::string HttpClient::buildFullUrl(const std::string& path) const {
    if (path.find("://") != std::string::npos) {
        return path;
    }
    if (m_baseUrl.empty()) {
        return path;
    }
    std::string base = m_baseUrl;
    while (!base.empty() && base.back() == '/') {
        base.pop_back();
    }
    if (path.empty()) {
        return base;
    }
    return path.front() == '/' ? base + path : base + "/" + path;
}

std::pair<std::string, std::string> HttpClient::splitUrl(const std::string& url) {
    const auto schemePos = url.find("://");
    if (schemePos == std::string::npos) {
        return {"", url};
    }
    const auto pathStart = url.find('/', schemePos + 3);
    if (pathStart == std::string::npos) {
        return {url, "/"};
    }
    return {url.substr(0, pathStart), url.substr(pathStart)};
}

std::map<std::string, std::string> HttpClient::mergeHeaders(
    const std::map<std::string, std::string>& requestHeaders) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto merged = m_defaultHeaders;
    for (const auto& [key, value] : requestHeaders) {
        merged[key] = value;
    }
    return merged;
}

} // namespace vtb::voice_bot::service::utils
