#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace httplib {
class Server;
}

namespace vtb::voice_bot::service {
class ErrorHandler;
}

namespace vtb::voice_bot::service::transport {

/**
 * @brief 本地开发用的 TTS 模拟服务（cpp-httplib）
 *
 * - GET  /health -> {"status":"ok"}
 * - POST /tts    {text, language, speaker_id} -> {"audio": base64 WAV}
 *
 * 音频是由文本确定的短正弦音（同一文本总是得到同样的字节），
 * 使整条 生成 -> 合成 流水线可以离线运行。
 */
class MockTtsServer {
public:
    MockTtsServer(std::string host, int port, ErrorHandler* errorHandler = nullptr);
    ~MockTtsServer();

    MockTtsServer(const MockTtsServer&) = delete;
    MockTtsServer& operator=(const MockTtsServer&) = delete;

    /**
     * @brief 绑定端口并在后台线程开始服务
     * @return 实际端口（port=0 时由系统分配）
     * @throws std::runtime_error 绑定失败
     */
    int start();

    // 前台阻塞服务，直到 stop()；返回是否正常退出
    bool listenBlocking();

    void stop();

    bool isRunning() const;
    int port() const { return m_boundPort; }

    // 16kHz 单声道 16-bit PCM WAV；频率与时长由文本决定
    static std::vector<uint8_t> makeToneWav(const std::string& text);

private:
    void registerRoutes();
    int bind();

    std::string m_host;
    int m_port;
    int m_boundPort{0};
    ErrorHandler* m_errorHandler;

    std::unique_ptr<httplib::Server> m_server;
    std::thread m_thread;
};

} // namespace vtb::voice_bot::service::transport
