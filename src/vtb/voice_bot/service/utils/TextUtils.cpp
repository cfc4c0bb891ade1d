#include "vtb/voice_bot/service/utils/TextUtils.h"

#include <cstdint>
#include <optional>

namespace vtb::voice_bot::service::utils {

namespace {

bool isAsciiSpace(unsigned char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\v' || c == '\f';
}

// 从 pos 处解码一个 UTF-8 码点；成功时 len 为字节数，非法序列返回 nullopt 且 len=1
std::optional<uint32_t> decodeUtf8At(std::string_view s, size_t pos, size_t& len) {
    const unsigned char c = static_cast<unsigned char>(s[pos]);
    len = 1;
    if (c < 0x80) {
        return c;
    }

    size_t need = 0;
    uint32_t cp = 0;
    if ((c & 0xE0) == 0xC0) {
        need = 2;
        cp = c & 0x1F;
    } else if ((c & 0xF0) == 0xE0) {
        need = 3;
        cp = c & 0x0F;
    } else if ((c & 0xF8) == 0xF0) {
        need = 4;
        cp = c & 0x07;
    } else {
        return std::nullopt;
    }

    if (pos + need > s.size()) return std::nullopt;
    for (size_t k = 1; k < need; ++k) {
        const unsigned char cc = static_cast<unsigned char>(s[pos + k]);
        if ((cc & 0xC0) != 0x80) return std::nullopt;
        cp = (cp << 6) | (cc & 0x3F);
    }
    len = need;
    return cp;
}

// Unicode 类别 C*（控制、格式、私用区）中常见的码点
bool isControlOrFormat(uint32_t cp) {
    if (cp < 0x20 || cp == 0x7F) return true;
    if (cp >= 0x80 && cp <= 0x9F) return true;
    if (cp == 0xAD) return true;
    if (cp >= 0x200B && cp <= 0x200F) return true;
    if (cp >= 0x2028 && cp <= 0x202E) return true;
    if (cp >= 0x2060 && cp <= 0x2064) return true;
    if (cp == 0xFEFF) return true;
    if (cp >= 0xE000 && cp <= 0xF8FF) return true;
    return false;
}

bool isEmoji(uint32_t cp) {
    return cp >= 0x1F000 && cp <= 0x1FAFF;
}

void replaceAll(std::string& s, std::string_view from, std::string_view to) {
    if (from.empty()) return;
    std::string out;
    out.reserve(s.size());
    size_t pos = 0;
    for (;;) {
        const auto hit = s.find(from.data(), pos, from.size());
        if (hit == std::string::npos) break;
        out.append(s, pos, hit - pos);
        out.append(to.data(), to.size());
        pos = hit + from.size();
    }
    out.append(s, pos, std::string::npos);
    s.swap(out);
}

} // namespace

std::string trim(std::string_view text) {
    size_t begin = 0;
    size_t end = text.size();
    while (begin < end && isAsciiSpace(static_cast<unsigned char>(text[begin]))) ++begin;
    while (end > begin && isAsciiSpace(static_cast<unsigned char>(text[end - 1]))) --end;
    return std::string(text.substr(begin, end - begin));
}

std::string collapseWhitespace(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    bool pendingSpace = false;
    for (char ch : text) {
        if (isAsciiSpace(static_cast<unsigned char>(ch))) {
            pendingSpace = !out.empty();
            continue;
        }
        if (pendingSpace) {
            out.push_back(' ');
            pendingSpace = false;
        }
        out.push_back(ch);
    }
    return out;
}

std::string normalizeForCache(std::string_view text) {
    return collapseWhitespace(text);
}

std::string sanitizeForSpeech(std::string_view text) {
    const std::string collapsed = collapseWhitespace(text);

    std::string kept;
    kept.reserve(collapsed.size());
    for (size_t i = 0; i < collapsed.size();) {
        size_t len = 1;
        const auto cp = decodeUtf8At(collapsed, i, len);
        if (cp.has_value() && !isControlOrFormat(*cp) && !isEmoji(*cp)) {
            kept.append(collapsed, i, len);
        }
        i += len;
    }

    replaceAll(kept, "&", " and ");
    replaceAll(kept, "<", " less than ");
    replaceAll(kept, ">", " greater than ");
    replaceAll(kept, "...", ".");
    replaceAll(kept, "--", "-");

    // 替换会引入多余空格，且删除 emoji 可能留下首尾空格
    return collapseWhitespace(kept);
}

std::string detectLanguage(std::string_view text) {
    for (size_t i = 0; i < text.size();) {
        size_t len = 1;
        const auto cp = decodeUtf8At(text, i, len);
        if (cp.has_value() && *cp >= 0x4E00 && *cp <= 0x9FFF) {
            return "zh";
        }
        i += len;
    }
    return "en";
}

std::string truncateUtf8(std::string_view text, size_t maxBytes) {
    if (text.size() <= maxBytes) return std::string(text);
    size_t end = 0;
    while (end < text.size()) {
        size_t len = 1;
        (void)decodeUtf8At(text, end, len);
        if (end + len > maxBytes) break;
        end += len;
    }
    return std::string(text.substr(0, end));
}

} // namespace vtb::voice_bot::service::utils
