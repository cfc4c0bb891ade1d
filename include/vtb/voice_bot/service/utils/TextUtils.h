#pragma once

#include <string>
#include <string_view>

namespace vtb::voice_bot::service::utils {

// 仅去除首尾 ASCII 空白，内部保持原样
std::string trim(std::string_view text);

/**
 * @brief 去除首尾空白，并把内部连续空白折叠为单个空格（ASCII 空白）
 */
std::string collapseWhitespace(std::string_view text);

/**
 * @brief 缓存键的文本归一化：等同 collapseWhitespace，大小写敏感
 */
std::string normalizeForCache(std::string_view text);

/**
 * @brief 合成前清洗文本
 *
 * - 折叠空白
 * - 删除控制/格式字符与 emoji（U+1F000..U+1FAFF），以及非法 UTF-8 字节
 * - 替换 & < > ... -- 为可朗读形式
 */
std::string sanitizeForSpeech(std::string_view text);

/**
 * @brief 粗略语言检测：含 CJK 统一表意文字（U+4E00..U+9FFF）返回 "zh"，否则 "en"
 */
std::string detectLanguage(std::string_view text);

/**
 * @brief 按 UTF-8 码点截断到至多 maxBytes 字节（不切断多字节字符），用于日志预览
 */
std::string truncateUtf8(std::string_view text, size_t maxBytes);

} // namespace vtb::voice_bot::service::utils
