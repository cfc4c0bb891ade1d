#pragma once

#include "vtb/voice_bot/service/ErrorTypes.h"

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

namespace vtb::voice_bot::service {

class ConfigManager;
class ErrorHandler;

/**
 * @brief 检索增强配置（retrieval.*），构造后不可变
 *
 * promptTemplate 中的 {retrieved_chunks} 与 {question} 会被替换；
 * 没有检索到内容时不套模板，直接使用原始输入。
 */
struct RetrievalConfig {
    bool enabled{false};
    size_t topK{4};
    std::string promptTemplate{defaultPromptTemplate()};
    std::vector<std::string> documents; // 内联文档片段
    std::string documentsFile;          // 文本文件，空行分隔片段

    static RetrievalConfig fromConfig(const ConfigManager& cfg);

    static std::string defaultPromptTemplate();

    std::string render(const std::vector<std::string>& chunks, const std::string& question) const;
};

/**
 * @brief 外部检索能力：给定问题返回最多 topK 个相关文本片段（按相关度降序）
 *
 * 实现可被多个线程并发调用。
 */
class ContextRetriever {
public:
    virtual ~ContextRetriever() = default;

    virtual std::vector<std::string> retrieve(const std::string& query, size_t topK) const = 0;

    virtual std::string name() const = 0;
};

// 未启用检索时使用
class NullContextRetriever : public ContextRetriever {
public:
    std::vector<std::string> retrieve(const std::string&, size_t) const override { return {}; }
    std::string name() const override { return "none"; }
};

/**
 * @brief 基于词项重合的本地检索
 *
 * 词项：ASCII 字母数字串（转小写），以及单个 CJK 统一表意文字。
 * 得分为问题与片段共有的不同词项数；得分为 0 的片段不返回，同分按原始顺序。
 */
class KeywordContextRetriever : public ContextRetriever {
public:
    explicit KeywordContextRetriever(std::vector<std::string> chunks);

    std::vector<std::string> retrieve(const std::string& query, size_t topK) const override;
    std::string name() const override { return "keyword"; }

    size_t size() const { return m_chunks.size(); }

    // 读取文本文件并按空行切分；打开失败返回 nullopt
    static std::optional<std::vector<std::string>> loadChunksFromFile(const std::string& path, ErrorInfo* err = nullptr);

    static std::unordered_set<std::string> extractTerms(std::string_view text);

private:
    struct Chunk {
        std::string text;
        std::unordered_set<std::string> terms;
    };

    std::vector<Chunk> m_chunks;
};

/**
 * @brief 按配置创建检索器
 *
 * 未启用、或启用但没有任何文档时返回 NullContextRetriever；
 * 文档文件读取失败只记录警告，继续使用内联文档。
 */
std::shared_ptr<ContextRetriever> makeContextRetriever(const RetrievalConfig& config, ErrorHandler* errorHandler = nullptr);

} // namespace vtb::voice_bot::service
