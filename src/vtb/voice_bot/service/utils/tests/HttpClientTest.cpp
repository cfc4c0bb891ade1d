#include "vtb/voice_bot/service/utils/HttpClient.h"
#include "vtb/voice_bot/service/utils/HttpTypes.h"

#include <gtest/gtest.h>

#include <chrono>
#include <thread>

#include "httplib.h"

using namespace vtb::voice_bot::service::utils;

namespace {

struct ServerGuard {
    httplib::Server& server;
    std::thread th;
    explicit ServerGuard(httplib::Server& s) : server(s) {}
    ~ServerGuard() {
        server.stop();
        if (th.joinable()) th.join();
    }
};

} // namespace

TEST(HttpClientTests, BuildFullUrlHandlesSlashes) {
    HttpClient client("https://example.com/v1/");
    EXPECT_EQ(client.buildFullUrl("/chat"), "https://example.com/v1/chat");
    EXPECT_EQ(client.buildFullUrl("chat"), "https://example.com/v1/chat");
    EXPECT_EQ(client.buildFullUrl(""), "https://example.com/v1");
    EXPECT_EQ(client.buildFullUrl("http://other/x"), "http://other/x");
}

TEST(HttpClientTests, SplitUrl) {
    auto [host, path] = HttpClient::splitUrl("http://127.0.0.1:8080/tts");
    EXPECT_EQ(host, "http://127.0.0.1:8080");
    EXPECT_EQ(path, "/tts");

    auto [host2, path2] = HttpClient::splitUrl("https://example.com");
    EXPECT_EQ(host2, "https://example.com");
    EXPECT_EQ(path2, "/");

    auto [host3, path3] = HttpClient::splitUrl("/relative");
    EXPECT_TRUE(host3.empty());
    EXPECT_EQ(path3, "/relative");
}

TEST(HttpClientTests, ResponseHeadersAreCaseInsensitive) {
    HttpResponse resp;
    resp.statusCode = 200;
    resp.headers["content-type"] = "application/json; charset=utf-8";
    resp.body = R"({"x":1})";
    EXPECT_TRUE(resp.isSuccess());
    EXPECT_TRUE(resp.isJson());
    ASSERT_TRUE(resp.getHeader("Content-Type").has_value());
    auto parsed = resp.asJson();
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ((*parsed)["x"].get<int>(), 1);
}

TEST(HttpClientTests, InvalidUrlReportsError) {
    HttpClient client;
    HttpRequest req;
    req.method = HttpMethod::GET;
    req.url = "not-a-url";
    auto resp = client.execute(req);
    EXPECT_EQ(resp.statusCode, 0);
    EXPECT_FALSE(resp.error.empty());
}

TEST(HttpClientTests, PostJsonAgainstLocalServer) {
    httplib::Server server;
    server.Post("/echo", [](const httplib::Request& req, httplib::Response& res) {
        res.status = 200;
        res.set_header("X-Auth", req.get_header_value("Authorization"));
        res.set_content(req.body, "application/json");
    });

    const int port = server.bind_to_any_port("127.0.0.1");
    ASSERT_GT(port, 0);
    ServerGuard guard(server);
    guard.th = std::thread([&]() { server.listen_after_bind(); });
    std::this_thread::sleep_for(std::chrono::milliseconds(20));

    HttpClient client("http://127.0.0.1:" + std::to_string(port));
    client.setDefaultHeader("Authorization", "Bearer k");
    auto resp = client.postJson("/echo", R"({"hello":"world"})");
    EXPECT_EQ(resp.statusCode, 200);
    EXPECT_EQ(resp.body, R"({"hello":"world"})");
    ASSERT_TRUE(resp.getHeader("x-auth").has_value());
    EXPECT_EQ(*resp.getHeader("x-auth"), "Bearer k");
}

TEST(HttpClientTests, ConnectionRefusedIsNetworkFailure) {
    // 绑定后立即停止，得到一个大概率空闲的端口
    int port = 0;
    {
        httplib::Server portFinder;
        port = portFinder.bind_to_any_port("127.0.0.1");
    }
    ASSERT_GT(port, 0);

    HttpClient client("http://127.0.0.1:" + std::to_string(port));
    client.setTimeout(500);
    auto resp = client.get("/health");
    EXPECT_EQ(resp.statusCode, 0);
    EXPECT_FALSE(resp.error.empty());
}
