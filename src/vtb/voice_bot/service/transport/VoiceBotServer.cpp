#include "vtb/voice_bot/service/transport/VoiceBotServer.h"

#include "vtb/voice_bot/service/ConfigManager.h"
#include "vtb/voice_bot/service/ErrorHandler.h"
#include "vtb/voice_bot/service/ServiceErrors.h"
#include "vtb/voice_bot/service/SessionRegistry.h"
#include "vtb/voice_bot/service/types/Protocol.h"

#include <boost/asio/dispatch.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>

#include <algorithm>
#include <atomic>
#include <deque>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <thread>
#include <unordered_map>
#include <vector>

#include "nlohmann/json.hpp"

namespace vtb::voice_bot::service::transport {

namespace beast = boost::beast;
namespace http = beast::http;
namespace websocket = beast::websocket;
namespace net = boost::asio;
using tcp = net::ip::tcp;

namespace {

constexpr const char* kServerName = "vtb-voice-bot";
constexpr const char* kWebSocketPath = "/ws";

class WsConnection;

// 所有连接共享的上下文
struct ServerContext {
    SessionRegistry& registry;
    ErrorHandler* errorHandler;
    std::string healthMessage;

    std::mutex connMutex;
    std::unordered_map<std::string, std::weak_ptr<WsConnection>> connections;

    ServerContext(SessionRegistry& reg, ErrorHandler* eh, std::string health)
        : registry(reg), errorHandler(eh), healthMessage(std::move(health)) {}

    void debug(const std::string& msg) const {
        if (errorHandler) errorHandler->debug(msg);
    }
    void info(const std::string& msg) const {
        if (errorHandler) errorHandler->info(msg);
    }
    void warning(const std::string& msg) const {
        if (errorHandler) errorHandler->warning(msg);
    }
};

// 模型回复可能含非法 UTF-8，序列化时替换而不是抛异常
std::string dumpEvent(const types::ServerEvent& ev) {
    return ev.toJson().dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

std::string stripQuery(beast::string_view target) {
    std::string path(target.data(), target.size());
    const auto q = path.find('?');
    if (q != std::string::npos) path.erase(q);
    return path;
}

// ========== WebSocket 连接 ==========

class WsConnection : public std::enable_shared_from_this<WsConnection> {
public:
    WsConnection(tcp::socket&& socket, ServerContext& ctx)
        : m_ws(std::move(socket))
        , m_ctx(ctx)
    {}

    void run(http::request<http::string_body> req) {
        m_ws.set_option(websocket::stream_base::timeout::suggested(beast::role_type::server));
        m_ws.set_option(websocket::stream_base::decorator([](websocket::response_type& res) {
            res.set(http::field::server, kServerName);
        }));
        m_ws.async_accept(req, beast::bind_front_handler(&WsConnection::onAccept, shared_from_this()));
    }

    // 可从任意线程调用
    void send(std::string text) {
        auto msg = std::make_shared<std::string>(std::move(text));
        net::post(m_ws.get_executor(), [self = shared_from_this(), msg] { self->queueWrite(msg); });
    }

    // 可从任意线程调用；等待已排队的消息写完再发送 close 帧
    void close() {
        net::post(m_ws.get_executor(), [self = shared_from_this()] {
            if (self->m_closing || self->m_cleaned) return;
            self->m_closing = true;
            if (self->m_writeQueue.empty()) {
                self->startClose();
            } else {
                self->m_closePending = true;
            }
        });
    }

private:
    void onAccept(beast::error_code ec) {
        if (ec) {
            m_ctx.warning("WebSocket handshake failed: " + ec.message());
            return;
        }

        m_id = SessionRegistry::generateConnectionId();
        std::weak_ptr<WsConnection> weak = shared_from_this();
        try {
            m_session = m_ctx.registry.registerSession(m_id, [weak](const types::ServerEvent& ev) {
                if (auto self = weak.lock()) {
                    self->send(dumpEvent(ev));
                }
            });
        } catch (const ServiceError& e) {
            m_ctx.warning(std::string("Rejecting connection: ") + e.what());
            m_id.clear();
            m_closing = true;
            m_ws.async_close(websocket::close_code::internal_error, [self = shared_from_this()](beast::error_code) {});
            return;
        }

        {
            std::lock_guard<std::mutex> lock(m_ctx.connMutex);
            m_ctx.connections[m_id] = weak;
        }
        doRead();
    }

    void doRead() {
        m_ws.async_read(m_buffer, beast::bind_front_handler(&WsConnection::onRead, shared_from_this()));
    }

    void onRead(beast::error_code ec, std::size_t) {
        if (ec) {
            if (ec != websocket::error::closed) {
                m_ctx.debug("Connection " + m_id + " read ended: " + ec.message());
            }
            cleanup();
            return;
        }

        if (!m_ws.got_text()) {
            m_buffer.consume(m_buffer.size());
            queueWrite(std::make_shared<std::string>(
                dumpEvent(types::ServerEvent::error("invalid_input", "Binary frames are not supported", false))));
        } else {
            const std::string frame = beast::buffers_to_string(m_buffer.data());
            m_buffer.consume(m_buffer.size());
            m_session->handleMessage(frame);
        }
        doRead();
    }

    void queueWrite(std::shared_ptr<std::string> msg) {
        if (m_closing || m_cleaned) return;
        m_writeQueue.push_back(std::move(msg));
        if (m_writeQueue.size() > 1) return; // 已有写入在进行
        doWrite();
    }

    void doWrite() {
        m_ws.text(true);
        m_ws.async_write(net::buffer(*m_writeQueue.front()),
                         beast::bind_front_handler(&WsConnection::onWrite, shared_from_this()));
    }

    void onWrite(beast::error_code ec, std::size_t) {
        if (ec) {
            m_ctx.debug("Connection " + m_id + " write failed: " + ec.message());
            m_writeQueue.clear();
            cleanup();
            return;
        }
        m_writeQueue.pop_front();
        if (!m_writeQueue.empty()) {
            doWrite();
            return;
        }
        if (m_closePending) {
            m_closePending = false;
            startClose();
        }
    }

    void startClose() {
        m_ws.async_close(websocket::close_code::normal, [self = shared_from_this()](beast::error_code ec) {
            if (ec) self->m_ctx.debug("Close handshake failed: " + ec.message());
        });
    }

    // 在 strand 上调用；移除会话并丢弃其后续消息
    void cleanup() {
        if (m_cleaned) return;
        m_cleaned = true;
        if (m_id.empty()) return;
        {
            std::lock_guard<std::mutex> lock(m_ctx.connMutex);
            m_ctx.connections.erase(m_id);
        }
        m_ctx.registry.unregisterSession(m_id);
    }

    websocket::stream<beast::tcp_stream> m_ws;
    ServerContext& m_ctx;
    beast::flat_buffer m_buffer;
    std::deque<std::shared_ptr<std::string>> m_writeQueue;

    std::string m_id;
    std::shared_ptr<Session> m_session;
    bool m_closing{false};
    bool m_closePending{false};
    bool m_cleaned{false};
};

// ========== HTTP 连接 ==========

class HttpConnection : public std::enable_shared_from_this<HttpConnection> {
public:
    HttpConnection(tcp::socket&& socket, ServerContext& ctx)
        : m_stream(std::move(socket))
        , m_ctx(ctx)
    {}

    void run() {
        net::dispatch(m_stream.get_executor(),
                      beast::bind_front_handler(&HttpConnection::doRead, shared_from_this()));
    }

private:
    using Request = http::request<http::string_body>;
    using Response = http::response<http::string_body>;

    void doRead() {
        m_parser.emplace();
        m_parser->body_limit(64 * 1024);
        m_stream.expires_after(std::chrono::seconds(30));
        http::async_read(m_stream, m_buffer, *m_parser,
                         beast::bind_front_handler(&HttpConnection::onRead, shared_from_this()));
    }

    void onRead(beast::error_code ec, std::size_t) {
        if (ec == http::error::end_of_stream) {
            doClose();
            return;
        }
        if (ec) {
            m_ctx.debug("HTTP read failed: " + ec.message());
            return;
        }

        Request req = m_parser->release();
        const std::string path = stripQuery(req.target());

        if (websocket::is_upgrade(req)) {
            if (path == kWebSocketPath) {
                beast::get_lowest_layer(m_stream).expires_never();
                std::make_shared<WsConnection>(m_stream.release_socket(), m_ctx)->run(std::move(req));
                return;
            }
            sendResponse(makeJsonResponse(http::status::not_found, {{"detail", "Not Found"}}, req));
            return;
        }

        sendResponse(handleRequest(req, path));
    }

    Response handleRequest(const Request& req, const std::string& path) const {
        if (path == "/") {
            if (req.method() != http::verb::get && req.method() != http::verb::head) {
                return makeJsonResponse(http::status::method_not_allowed, {{"detail", "Method Not Allowed"}}, req);
            }
            return makeJsonResponse(http::status::ok, types::makeHealthBody(m_ctx.healthMessage), req);
        }
        return makeJsonResponse(http::status::not_found, {{"detail", "Not Found"}}, req);
    }

    static Response makeJsonResponse(http::status status, const nlohmann::json& body, const Request& req) {
        Response res{status, req.version()};
        res.set(http::field::server, kServerName);
        res.set(http::field::content_type, "application/json");
        res.keep_alive(req.keep_alive());
        if (req.method() != http::verb::head) {
            res.body() = body.dump();
        }
        res.prepare_payload();
        return res;
    }

    void sendResponse(Response&& res) {
        auto sp = std::make_shared<Response>(std::move(res));
        const bool close = sp->need_eof();
        http::async_write(m_stream, *sp,
                          [self = shared_from_this(), sp, close](beast::error_code ec, std::size_t) {
                              self->onWrite(close, ec);
                          });
    }

    void onWrite(bool close, beast::error_code ec) {
        if (ec) {
            m_ctx.debug("HTTP write failed: " + ec.message());
            return;
        }
        if (close) {
            doClose();
            return;
        }
        doRead();
    }

    void doClose() {
        beast::error_code ec;
        m_stream.socket().shutdown(tcp::socket::shutdown_send, ec);
    }

    beast::tcp_stream m_stream;
    ServerContext& m_ctx;
    beast::flat_buffer m_buffer;
    std::optional<http::request_parser<http::string_body>> m_parser;
};

// ========== 监听 ==========

class Listener : public std::enable_shared_from_this<Listener> {
public:
    Listener(net::io_context& ioc, const tcp::endpoint& endpoint, ServerContext& ctx)
        : m_ioc(ioc)
        , m_acceptor(net::make_strand(ioc))
        , m_ctx(ctx)
    {
        beast::error_code ec;
        m_acceptor.open(endpoint.protocol(), ec);
        if (ec) throw std::runtime_error("Failed to open acceptor: " + ec.message());

        m_acceptor.set_option(net::socket_base::reuse_address(true), ec);
        if (ec) throw std::runtime_error("Failed to set reuse_address: " + ec.message());

        m_acceptor.bind(endpoint, ec);
        if (ec) throw std::runtime_error("Failed to bind " + endpoint.address().to_string() + ":" +
                                         std::to_string(endpoint.port()) + ": " + ec.message());

        m_acceptor.listen(net::socket_base::max_listen_connections, ec);
        if (ec) throw std::runtime_error("Failed to listen: " + ec.message());
    }

    uint16_t port() const {
        beast::error_code ec;
        auto ep = m_acceptor.local_endpoint(ec);
        return ec ? 0 : ep.port();
    }

    void run() { doAccept(); }

    void stop() {
        net::post(m_acceptor.get_executor(), [self = shared_from_this()] {
            beast::error_code ec;
            self->m_acceptor.close(ec);
        });
    }

private:
    void doAccept() {
        m_acceptor.async_accept(net::make_strand(m_ioc),
                                beast::bind_front_handler(&Listener::onAccept, shared_from_this()));
    }

    void onAccept(beast::error_code ec, tcp::socket socket) {
        if (ec) {
            if (ec == net::error::operation_aborted) return;
            m_ctx.warning("Accept failed: " + ec.message());
        } else {
            std::make_shared<HttpConnection>(std::move(socket), m_ctx)->run();
        }
        if (m_acceptor.is_open()) {
            doAccept();
        }
    }

    net::io_context& m_ioc;
    tcp::acceptor m_acceptor;
    ServerContext& m_ctx;
};

} // namespace

// ========== ServerConfig ==========

ServerConfig ServerConfig::fromConfig(const ConfigManager& cfg) {
    ServerConfig c;
    c.host = cfg.getOr<std::string>("server.host", c.host);
    if (auto v = cfg.getOr<int64_t>("server.port", -1); v >= 0 && v <= 65535) {
        c.port = static_cast<uint16_t>(v);
    }
    if (auto v = cfg.getOr<int64_t>("server.threads", 0); v > 0) {
        c.threads = static_cast<int>(v);
    }
    c.healthMessage = cfg.getOr<std::string>("server.health_message", c.healthMessage);
    return c;
}

// ========== VoiceBotServer ==========

struct VoiceBotServer::Impl {
    Impl(ServerConfig cfg, SessionRegistry& registry, ErrorHandler* eh)
        : config(std::move(cfg))
        , errorHandler(eh)
        , ctx(registry, eh, config.healthMessage)
        , ioc(std::max(1, config.threads))
    {}

    void runLoop() {
        for (;;) {
            try {
                ioc.run();
                break;
            } catch (const std::exception& e) {
                if (errorHandler) errorHandler->error(std::string("Server io loop error: ") + e.what());
            }
        }
    }

    ServerConfig config;
    ErrorHandler* errorHandler;
    ServerContext ctx; // 必须先于 ioc 构造、晚于 ioc 析构
    net::io_context ioc;
    std::shared_ptr<Listener> listener;
    std::vector<std::thread> threads;
    std::atomic<bool> running{false};
    std::atomic<uint16_t> boundPort{0};
    std::mutex lifecycleMutex;
};

VoiceBotServer::VoiceBotServer(ServerConfig config, SessionRegistry& registry, ErrorHandler* errorHandler)
    : m_impl(std::make_unique<Impl>(std::move(config), registry, errorHandler))
{}

VoiceBotServer::~VoiceBotServer() {
    stop();
}

void VoiceBotServer::start() {
    std::lock_guard<std::mutex> lock(m_impl->lifecycleMutex);
    if (m_impl->running.load()) {
        return;
    }

    beast::error_code ec;
    const auto address = net::ip::make_address(m_impl->config.host, ec);
    if (ec) {
        throw std::runtime_error("Invalid listen address '" + m_impl->config.host + "': " + ec.message());
    }

    m_impl->ioc.restart();
    m_impl->listener = std::make_shared<Listener>(m_impl->ioc, tcp::endpoint{address, m_impl->config.port}, m_impl->ctx);
    m_impl->boundPort = m_impl->listener->port();
    m_impl->listener->run();
    m_impl->running = true;

    const int n = std::max(1, m_impl->config.threads);
    m_impl->threads.reserve(static_cast<size_t>(n));
    for (int i = 0; i < n; ++i) {
        m_impl->threads.emplace_back([impl = m_impl.get()] { impl->runLoop(); });
    }

    if (m_impl->errorHandler) {
        m_impl->errorHandler->info("Voice bot server listening on " + m_impl->config.host + ":" +
                                   std::to_string(m_impl->boundPort.load()) + " (ws path " + kWebSocketPath + ")");
    }
}

void VoiceBotServer::stop() {
    std::lock_guard<std::mutex> lock(m_impl->lifecycleMutex);
    if (!m_impl->running.exchange(false)) {
        return;
    }

    if (m_impl->listener) {
        m_impl->listener->stop();
    }
    m_impl->ioc.stop();
    for (auto& t : m_impl->threads) {
        if (t.joinable()) t.join();
    }
    m_impl->threads.clear();
    m_impl->listener.reset();

    // io 线程已退出：关闭仍登记的会话
    std::vector<std::string> ids;
    {
        std::lock_guard<std::mutex> connLock(m_impl->ctx.connMutex);
        for (const auto& kv : m_impl->ctx.connections) ids.push_back(kv.first);
        m_impl->ctx.connections.clear();
    }
    for (const auto& id : ids) {
        m_impl->ctx.registry.unregisterSession(id);
    }

    if (m_impl->errorHandler) {
        m_impl->errorHandler->info("Voice bot server stopped");
    }
}

bool VoiceBotServer::isRunning() const {
    return m_impl->running.load();
}

uint16_t VoiceBotServer::boundPort() const {
    return m_impl->boundPort.load();
}

void VoiceBotServer::closeConnection(const std::string& connectionId) {
    std::shared_ptr<WsConnection> conn;
    {
        std::lock_guard<std::mutex> lock(m_impl->ctx.connMutex);
        auto it = m_impl->ctx.connections.find(connectionId);
        if (it == m_impl->ctx.connections.end()) return;
        conn = it->second.lock();
    }
    if (conn) {
        conn->close();
    }
}

size_t VoiceBotServer::connectionCount() const {
    std::lock_guard<std::mutex> lock(m_impl->ctx.connMutex);
    return m_impl->ctx.connections.size();
}

} // namespace vtb::voice_bot::service::transport
