#include "vtb/voice_bot/service/ContextRetriever.h"

#include "vtb/voice_bot/service/ConfigManager.h"
#include "vtb/voice_bot/service/ErrorHandler.h"
#include "vtb/voice_bot/service/utils/TextUtils.h"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <fstream>
#include <sstream>
#include <utility>

namespace vtb::voice_bot::service {

// ========== RetrievalConfig ==========

RetrievalConfig RetrievalConfig::fromConfig(const ConfigManager& cfg) {
    RetrievalConfig c;
    c.enabled = cfg.getOr<bool>("retrieval.enabled", c.enabled);
    if (auto v = cfg.getOr<int64_t>("retrieval.top_k", 0); v > 0) {
        c.topK = static_cast<size_t>(v);
    }
    const auto tmpl = cfg.getOr<std::string>("retrieval.prompt_template", "");
    if (!utils::collapseWhitespace(tmpl).empty()) {
        c.promptTemplate = tmpl;
    }
    if (auto v = cfg.get("retrieval.documents"); v.has_value() && v->is_array()) {
        for (const auto& d : *v) {
            if (d.is_string() && !utils::collapseWhitespace(d.get<std::string>()).empty()) {
                c.documents.push_back(d.get<std::string>());
            }
        }
    }
    c.documentsFile = cfg.getOr<std::string>("retrieval.documents_file", c.documentsFile);
    return c;
}

std::string RetrievalConfig::defaultPromptTemplate() {
    return "根據下列資料回答問題：\n{retrieved_chunks}\n\n"
           "使用者的問題是：{question}\n\n"
           "請根據資料內容回覆，若資料不足請如實說明。";
}

static void replaceAll(std::string& s, const std::string& from, const std::string& to) {
    size_t pos = 0;
    while ((pos = s.find(from, pos)) != std::string::npos) {
        s.replace(pos, from.size(), to);
        pos += to.size();
    }
}

std::string RetrievalConfig::render(const std::vector<std::string>& chunks, const std::string& question) const {
    if (chunks.empty()) {
        return question;
    }
    std::string joined;
    for (size_t i = 0; i < chunks.size(); ++i) {
        if (i > 0) joined += "\n\n";
        joined += chunks[i];
    }
    // 先替换 {question}，避免片段里恰好出现 "{question}" 被二次替换
    std::string out = promptTemplate;
    const std::string marker = "\x01chunks\x01";
    replaceAll(out, "{retrieved_chunks}", marker);
    replaceAll(out, "{question}", question);
    replaceAll(out, marker, joined);
    return out;
}

// ========== KeywordContextRetriever ==========

std::unordered_set<std::string> KeywordContextRetriever::extractTerms(std::string_view text) {
    std::unordered_set<std::string> terms;
    std::string word;
    const auto flush = [&]() {
        if (!word.empty()) {
            terms.insert(word);
            word.clear();
        }
    };

    size_t i = 0;
    while (i < text.size()) {
        const unsigned char c = static_cast<unsigned char>(text[i]);
        if (c < 0x80) {
            if (std::isalnum(c)) {
                word.push_back(static_cast<char>(std::tolower(c)));
            } else {
                flush();
            }
            ++i;
            continue;
        }
        flush();

        size_t len = 1;
        if ((c & 0xE0) == 0xC0) len = 2;
        else if ((c & 0xF0) == 0xE0) len = 3;
        else if ((c & 0xF8) == 0xF0) len = 4;
        if (i + len > text.size()) break;

        // 只收 CJK 统一表意文字（U+4E00..U+9FFF，三字节序列）
        if (len == 3) {
            const unsigned char c1 = static_cast<unsigned char>(text[i + 1]);
            const unsigned char c2 = static_cast<unsigned char>(text[i + 2]);
            if ((c1 & 0xC0) == 0x80 && (c2 & 0xC0) == 0x80) {
                const uint32_t cp = ((c & 0x0Fu) << 12) | ((c1 & 0x3Fu) << 6) | (c2 & 0x3Fu);
                if (cp >= 0x4E00 && cp <= 0x9FFF) {
                    terms.insert(std::string(text.substr(i, 3)));
                }
            }
        }
        i += len;
    }
    flush();
    return terms;
}

KeywordContextRetriever::KeywordContextRetriever(std::vector<std::string> chunks) {
    m_chunks.reserve(chunks.size());
    for (auto& text : chunks) {
        auto trimmed = utils::trim(text);
        if (trimmed.empty()) continue;
        Chunk chunk;
        chunk.terms = extractTerms(trimmed);
        chunk.text = std::move(trimmed);
        m_chunks.push_back(std::move(chunk));
    }
}

std::vector<std::string> KeywordContextRetriever::retrieve(const std::string& query, size_t topK) const {
    if (topK == 0 || m_chunks.empty()) {
        return {};
    }
    const auto queryTerms = extractTerms(query);
    if (queryTerms.empty()) {
        return {};
    }

    std::vector<std::pair<size_t, size_t>> scored; // (score, index)
    for (size_t i = 0; i < m_chunks.size(); ++i) {
        size_t score = 0;
        for (const auto& t : queryTerms) {
            if (m_chunks[i].terms.count(t)) ++score;
        }
        if (score > 0) {
            scored.emplace_back(score, i);
        }
    }
    std::stable_sort(scored.begin(), scored.end(),
                     [](const auto& a, const auto& b) { return a.first > b.first; });

    std::vector<std::string> out;
    for (size_t i = 0; i < scored.size() && out.size() < topK; ++i) {
        out.push_back(m_chunks[scored[i].second].text);
    }
    return out;
}

std::optional<std::vector<std::string>> KeywordContextRetriever::loadChunksFromFile(const std::string& path,
                                                                                   ErrorInfo* err) {
    std::ifstream ifs(path, std::ios::in | std::ios::binary);
    if (!ifs.is_open()) {
        if (err) {
            err->errorType = ErrorType::InvalidRequest;
            err->message = "Cannot open retrieval documents file: " + path;
            err->addContext("path", path);
        }
        return std::nullopt;
    }

    std::vector<std::string> chunks;
    std::string current;
    std::string line;
    while (std::getline(ifs, line)) {
        if (utils::trim(line).empty()) {
            if (!utils::trim(current).empty()) chunks.push_back(utils::trim(current));
            current.clear();
            continue;
        }
        if (!current.empty()) current += "\n";
        current += line;
    }
    if (!utils::trim(current).empty()) chunks.push_back(utils::trim(current));
    return chunks;
}

// ========== 工厂 ==========

std::shared_ptr<ContextRetriever> makeContextRetriever(const RetrievalConfig& config, ErrorHandler* errorHandler) {
    if (!config.enabled) {
        return std::make_shared<NullContextRetriever>();
    }

    std::vector<std::string> chunks = config.documents;
    if (!config.documentsFile.empty()) {
        ErrorInfo err;
        if (auto loaded = KeywordContextRetriever::loadChunksFromFile(config.documentsFile, &err)) {
            chunks.insert(chunks.end(), loaded->begin(), loaded->end());
        } else if (errorHandler) {
            errorHandler->warning("Retrieval documents not loaded", err);
        }
    }

    auto retriever = std::make_shared<KeywordContextRetriever>(std::move(chunks));
    if (retriever->size() == 0) {
        if (errorHandler) {
            errorHandler->warning("Retrieval is enabled but no documents are available; answering without context");
        }
        return std::make_shared<NullContextRetriever>();
    }
    if (errorHandler) {
        errorHandler->info("Retrieval enabled with " + std::to_string(retriever->size()) + " document chunks");
    }
    return retriever;
}

} // namespace vtb::voice_bot::service
