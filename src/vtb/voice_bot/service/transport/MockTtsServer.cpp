#include "vtb/voice_bot/service/transport/MockTtsServer.h"

#include "vtb/voice_bot/service/ErrorHandler.h"
#include "vtb/voice_bot/service/utils/HttpSerialization.h"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <stdexcept>

#include "httplib.h"
#include "nlohmann/json.hpp"

namespace vtb::voice_bot::service::transport {

namespace {

constexpr uint32_t kSampleRate = 16000;
constexpr double kPi = 3.14159265358979323846;

void putLe16(std::vector<uint8_t>& out, uint16_t v) {
    out.push_back(static_cast<uint8_t>(v & 0xFF));
    out.push_back(static_cast<uint8_t>((v >> 8) & 0xFF));
}

void putLe32(std::vector<uint8_t>& out, uint32_t v) {
    for (int i = 0; i < 4; ++i) {
        out.push_back(static_cast<uint8_t>((v >> (8 * i)) & 0xFF));
    }
}

void putTag(std::vector<uint8_t>& out, const char* tag) {
    out.insert(out.end(), tag, tag + 4);
}

// FNV-1a
uint32_t hashText(const std::string& text) {
    uint32_t h = 2166136261u;
    for (unsigned char c : text) {
        h ^= c;
        h *= 16777619u;
    }
    return h;
}

size_t countCodepoints(const std::string& text) {
    size_t n = 0;
    for (unsigned char c : text) {
        if ((c & 0xC0) != 0x80) ++n;
    }
    return n;
}

void writeJson(httplib::Response& res, int status, const nlohmann::json& body) {
    res.status = status;
    res.set_content(utils::toJsonBody(body), "application/json");
}

} // namespace

MockTtsServer::MockTtsServer(std::string host, int port, ErrorHandler* errorHandler)
    : m_host(std::move(host))
    , m_port(port)
    , m_errorHandler(errorHandler)
    , m_server(std::make_unique<httplib::Server>())
{
    registerRoutes();
}

MockTtsServer::~MockTtsServer() {
    stop();
}

std::vector<uint8_t> MockTtsServer::makeToneWav(const std::string& text) {
    const uint32_t h = hashText(text);
    const double freq = 220.0 + static_cast<double>(h % 440u);
    const size_t durationMs = std::clamp<size_t>(countCodepoints(text) * 80, 300, 3000);
    const uint32_t samples = static_cast<uint32_t>(kSampleRate * durationMs / 1000);
    const uint32_t dataBytes = samples * 2;

    std::vector<uint8_t> wav;
    wav.reserve(44 + dataBytes);

    // RIFF header
    putTag(wav, "RIFF");
    putLe32(wav, 36 + dataBytes);
    putTag(wav, "WAVE");

    // fmt chunk：PCM，单声道，16-bit
    putTag(wav, "fmt ");
    putLe32(wav, 16);
    putLe16(wav, 1);
    putLe16(wav, 1);
    putLe32(wav, kSampleRate);
    putLe32(wav, kSampleRate * 2);
    putLe16(wav, 2);
    putLe16(wav, 16);

    putTag(wav, "data");
    putLe32(wav, dataBytes);

    // 首尾 10ms 线性淡入淡出，避免爆音
    const uint32_t fade = kSampleRate / 100;
    for (uint32_t i = 0; i < samples; ++i) {
        double amp = 0.3;
        if (i < fade) amp *= static_cast<double>(i) / fade;
        if (samples - i < fade) amp *= static_cast<double>(samples - i) / fade;
        const double v = amp * std::sin(2.0 * kPi * freq * i / kSampleRate);
        const auto s = static_cast<int16_t>(std::lround(v * 32767.0));
        putLe16(wav, static_cast<uint16_t>(s));
    }
    return wav;
}

void MockTtsServer::registerRoutes() {
    m_server->Get("/health", [](const httplib::Request&, httplib::Response& res) {
        writeJson(res, 200, {{"status", "ok"}});
    });

    m_server->Post("/tts", [this](const httplib::Request& req, httplib::Response& res) {
        std::string parseError;
        auto body = utils::parseJsonSafe(req.body, &parseError);
        if (!body.has_value() || !body->is_object()) {
            writeJson(res, 400, {{"error", {{"message", "Invalid JSON body: " + parseError}, {"type", "invalid_request_error"}}}});
            return;
        }

        const std::string text = body->value("text", std::string());
        const std::string language = body->value("language", std::string("zh"));
        const std::string speaker = body->value("speaker_id", std::string("default"));
        if (text.empty()) {
            writeJson(res, 400, {{"error", {{"message", "'text' must not be empty"}, {"type", "invalid_request_error"}}}});
            return;
        }

        const auto wav = makeToneWav(text);
        if (m_errorHandler) {
            m_errorHandler->debug("Mock TTS: " + std::to_string(wav.size()) + " bytes for language=" + language +
                                  " speaker=" + speaker);
        }
        writeJson(res, 200, {{"audio", utils::encodeBase64(wav)}});
    });
}

int MockTtsServer::bind() {
    int port = m_port;
    if (port == 0) {
        port = m_server->bind_to_any_port(m_host);
    } else if (!m_server->bind_to_port(m_host, port)) {
        port = -1;
    }
    if (port <= 0) {
        throw std::runtime_error("Mock TTS server failed to bind " + m_host + ":" + std::to_string(m_port));
    }
    m_boundPort = port;
    if (m_errorHandler) {
        m_errorHandler->info("Mock TTS server listening on http://" + m_host + ":" + std::to_string(port));
    }
    return port;
}

int MockTtsServer::start() {
    if (m_thread.joinable()) {
        return m_boundPort;
    }
    const int port = bind();
    m_thread = std::thread([this] { m_server->listen_after_bind(); });
    // 等待监听线程就绪
    for (int i = 0; i < 200 && !m_server->is_running(); ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return port;
}

bool MockTtsServer::listenBlocking() {
    bind();
    return m_server->listen_after_bind();
}

void MockTtsServer::stop() {
    if (m_server) {
        m_server->stop();
    }
    if (m_thread.joinable()) {
        m_thread.join();
    }
}

bool MockTtsServer::isRunning() const {
    return m_server && m_server->is_running();
}

} // namespace vtb::voice_bot::service::transport
