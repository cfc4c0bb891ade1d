#include "vtb/voice_bot/service/utils/HttpSerialization.h"

#include <gtest/gtest.h>

using namespace vtb::voice_bot::service::utils;

TEST(HttpSerializationTests, Base64KnownVectors) {
    EXPECT_EQ(encodeBase64(std::string("")), "");
    EXPECT_EQ(encodeBase64(std::string("f")), "Zg==");
    EXPECT_EQ(encodeBase64(std::string("fo")), "Zm8=");
    EXPECT_EQ(encodeBase64(std::string("foo")), "Zm9v");
    EXPECT_EQ(encodeBase64(std::string("foobar")), "Zm9vYmFy");
}

TEST(HttpSerializationTests, Base64DecodesBinary) {
    const std::vector<uint8_t> bytes{0x00, 0xFF, 0x10, 0x80, 0x7F};
    const auto decoded = decodeBase64(encodeBase64(bytes));
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(*decoded, bytes);
}

TEST(HttpSerializationTests, Base64RejectsMalformedInput) {
    EXPECT_FALSE(decodeBase64("abc").has_value());      // 长度不是 4 的倍数
    EXPECT_FALSE(decodeBase64("ab$d").has_value());     // 非法字符
    EXPECT_FALSE(decodeBase64("Zg==Zm9v").has_value()); // '=' 出现在中间
    EXPECT_FALSE(decodeBase64("Z===").has_value());
    EXPECT_TRUE(decodeBase64("").has_value());
}

TEST(HttpSerializationTests, ParseJsonSafe) {
    std::string err;
    auto ok = parseJsonSafe(R"({"a":1})", &err);
    ASSERT_TRUE(ok.has_value());
    EXPECT_EQ((*ok)["a"].get<int>(), 1);

    auto bad = parseJsonSafe("{not json", &err);
    EXPECT_FALSE(bad.has_value());
    EXPECT_FALSE(err.empty());
}

TEST(HttpSerializationTests, ToJsonBody) {
    nlohmann::json j{{"k", "v"}};
    EXPECT_EQ(toJsonBody(j), R"({"k":"v"})");
    EXPECT_NE(toJsonBody(j, true).find('\n'), std::string::npos);
}
