#include "vtb/voice_bot/service/utils/HttpSerialization.h"

namespace vtb::voice_bot::service::utils {

namespace {

constexpr char kTable[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

int decodeChar(char c) {
    if (c >= 'A' && c <= 'Z') return c - 'A';
    if (c >= 'a' && c <= 'z') return c - 'a' + 26;
    if (c >= '0' && c <= '9') return c - '0' + 52;
    if (c == '+') return 62;
    if (c == '/') return 63;
    return -1;
}

} // namespace

std::string toJsonBody(const nlohmann::json& j, bool pretty) {
    return pretty ? j.dump(2) : j.dump();
}

std::optional<nlohmann::json> parseJsonSafe(const std::string& text, std::string* error) {
    try {
        return nlohmann::json::parse(text);
    } catch (const std::exception& e) {
        if (error) {
            *error = e.what();
        }
        return std::nullopt;
    }
}

std::string encodeBase64(const std::vector<uint8_t>& data) {
    std::string out;
    out.reserve(((data.size() + 2) / 3) * 4);

    size_t i = 0;
    for (; i + 2 < data.size(); i += 3) {
        const uint32_t triple = (static_cast<uint32_t>(data[i]) << 16) |
                                (static_cast<uint32_t>(data[i + 1]) << 8) |
                                static_cast<uint32_t>(data[i + 2]);
        out.push_back(kTable[(triple >> 18) & 0x3F]);
        out.push_back(kTable[(triple >> 12) & 0x3F]);
        out.push_back(kTable[(triple >> 6) & 0x3F]);
        out.push_back(kTable[triple & 0x3F]);
    }

    const size_t rest = data.size() - i;
    if (rest > 0) {
        uint32_t triple = static_cast<uint32_t>(data[i]) << 16;
        if (rest == 2) {
            triple |= static_cast<uint32_t>(data[i + 1]) << 8;
        }
        out.push_back(kTable[(triple >> 18) & 0x3F]);
        out.push_back(kTable[(triple >> 12) & 0x3F]);
        out.push_back(rest == 2 ? kTable[(triple >> 6) & 0x3F] : '=');
        out.push_back('=');
    }
    return out;
}

std::string encodeBase64(const std::string& data) {
    return encodeBase64(std::vector<uint8_t>(data.begin(), data.end()));
}

std::optional<std::vector<uint8_t>> decodeBase64(const std::string& text) {
    if (text.size() % 4 != 0) {
        return std::nullopt;
    }

    std::vector<uint8_t> output;
    output.reserve((text.size() / 4) * 3);

    for (size_t i = 0; i < text.size(); i += 4) {
        const bool lastGroup = (i + 4 == text.size());
        int vals[4];
        int padding = 0;
        for (int k = 0; k < 4; ++k) {
            const char c = text[i + k];
            if (c == '=') {
                // 只允许出现在最后一组的末尾 1~2 位
                if (!lastGroup || k < 2) return std::nullopt;
                vals[k] = 0;
                ++padding;
                continue;
            }
            if (padding > 0) return std::nullopt;
            vals[k] = decodeChar(c);
            if (vals[k] < 0) return std::nullopt;
        }

        const uint32_t triple = (static_cast<uint32_t>(vals[0]) << 18) |
                                (static_cast<uint32_t>(vals[1]) << 12) |
                                (static_cast<uint32_t>(vals[2]) << 6) |
                                static_cast<uint32_t>(vals[3]);
        output.push_back(static_cast<uint8_t>((triple >> 16) & 0xFF));
        if (padding < 2) output.push_back(static_cast<uint8_t>((triple >> 8) & 0xFF));
        if (padding < 1) output.push_back(static_cast<uint8_t>(triple & 0xFF));
    }
    return output;
}

} // namespace vtb::voice_bot::service::utils
