#pragma once

#include <cstdint>
#include <memory>
#include <string>

namespace vtb::voice_bot::service {
class ConfigManager;
class ErrorHandler;
class SessionRegistry;
} // namespace vtb::voice_bot::service

namespace vtb::voice_bot::service::transport {

/**
 * @brief 服务端监听配置（server.*）
 */
struct ServerConfig {
    std::string host{"0.0.0.0"};
    uint16_t port{8000};            // 0 表示由系统分配
    int threads{2};                 // io 线程数
    std::string healthMessage{"VTuber backend is running"};

    static ServerConfig fromConfig(const ConfigManager& cfg);
};

/**
 * @brief WebSocket + HTTP 前端（Boost.Beast）
 *
 * - GET /        -> {"status":"ok","message":...}
 * - WS  /ws      -> 每个连接在 SessionRegistry 注册一个 Session；
 *                   文本帧交给 Session::handleMessage，Session 的事件序列化为 JSON 文本帧回写
 * - 其他路径     -> 404
 *
 * 每个连接的读写都在自己的 strand 上；写入排队，保证同一连接上的消息不交错。
 */
class VoiceBotServer {
public:
    VoiceBotServer(ServerConfig config, SessionRegistry& registry, ErrorHandler* errorHandler = nullptr);
    ~VoiceBotServer();

    VoiceBotServer(const VoiceBotServer&) = delete;
    VoiceBotServer& operator=(const VoiceBotServer&) = delete;

    /**
     * @brief 绑定并开始监听，启动 io 线程
     * @throws std::runtime_error 地址非法或端口占用
     */
    void start();

    // 停止监听并关闭所有连接，等待 io 线程退出；幂等
    void stop();

    bool isRunning() const;

    // 实际监听的端口（port=0 时由系统分配）
    uint16_t boundPort() const;

    // 以 normal 关闭码关闭指定连接（空闲清理时调用）；连接不存在时忽略
    void closeConnection(const std::string& connectionId);

    size_t connectionCount() const;

private:
    struct Impl;
    std::unique_ptr<Impl> m_impl;
};

} // namespace vtb::voice_bot::service::transport
