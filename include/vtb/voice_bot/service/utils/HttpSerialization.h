#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"

namespace vtb::voice_bot::service::utils {

// JSON 序列化为字符串（可选缩进）
std::string toJsonBody(const nlohmann::json& j, bool pretty = false);

// 安全解析 JSON，失败返回 std::nullopt，并可写入错误信息
std::optional<nlohmann::json> parseJsonSafe(const std::string& text, std::string* error = nullptr);

// Base64 编码/解码（标准字符表，无换行）
std::string encodeBase64(const std::vector<uint8_t>& data);
std::string encodeBase64(const std::string& data);

// 非法字符、长度不是 4 的倍数或 '=' 出现在中间时返回 nullopt
std::optional<std::vector<uint8_t>> decodeBase64(const std::string& text);

} // namespace vtb::voice_bot::service::utils
