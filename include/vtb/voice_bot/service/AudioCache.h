#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <list>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace vtb::voice_bot::service {

class ConfigManager;

using AudioBytes = std::vector<uint8_t>;

/**
 * @brief 音频缓存键：(归一化文本, 音色, 语言)
 *
 * 文本经 utils::normalizeForCache 归一化（去首尾空白、折叠内部空白，大小写敏感），
 * voice/language 仅去首尾空白。
 */
struct CacheKey {
    std::string text;
    std::string voice;
    std::string language;

    static CacheKey make(const std::string& text, const std::string& voice, const std::string& language);

    bool operator==(const CacheKey& other) const {
        return text == other.text && voice == other.voice && language == other.language;
    }
    bool operator!=(const CacheKey& other) const { return !(*this == other); }

    // 日志用的简短描述（文本截断）
    std::string toString() const;
};

struct CacheKeyHash {
    std::size_t operator()(const CacheKey& key) const {
        std::size_t h = std::hash<std::string>{}(key.text);
        h ^= std::hash<std::string>{}(key.voice) + 0x9e3779b9 + (h << 6) + (h >> 2);
        h ^= std::hash<std::string>{}(key.language) + 0x9e3779b9 + (h << 6) + (h >> 2);
        return h;
    }
};

/**
 * @brief 缓存条目：音频字节 + 元数据。插入后不可变，读取方共享同一份数据。
 */
struct CacheEntry {
    std::shared_ptr<const AudioBytes> audio;
    std::chrono::system_clock::time_point createdAt{std::chrono::system_clock::now()};

    size_t size() const { return audio ? audio->size() : 0; }
};

struct CacheStatistics {
    uint64_t totalHits{0};
    uint64_t totalMisses{0};
    uint64_t evictedEntries{0};
    size_t totalEntries{0};
    size_t totalBytes{0};

    double getHitRate() const {
        const uint64_t total = totalHits + totalMisses;
        if (total == 0) return 0.0;
        return static_cast<double>(totalHits) / static_cast<double>(total);
    }
};

struct CacheConfig {
    bool enabled{true};
    size_t capacity{100};

    // 读取 cache.enabled / cache.capacity
    static CacheConfig fromConfig(const ConfigManager& cfg);
};

/**
 * @brief 音频缓存能力接口（get/put/evict）
 *
 * 进程内实现为 LruAudioCache；会话逻辑只依赖该接口，可替换为网络缓存。
 * 实现必须线程安全。
 */
class AudioCacheStore {
public:
    virtual ~AudioCacheStore() = default;

    // 命中时刷新最近使用顺序
    virtual std::optional<CacheEntry> get(const CacheKey& key) = 0;

    // 插入新键；超过容量时淘汰一个条目并返回被淘汰的键。键已存在时保留原值，仅刷新顺序。
    virtual std::optional<CacheKey> put(const CacheKey& key, std::shared_ptr<const AudioBytes> audio) = 0;

    // 主动移除；不存在返回 false
    virtual bool evict(const CacheKey& key) = 0;

    virtual size_t size() const = 0;
    virtual size_t capacity() const = 0;
    virtual void clear() = 0;
    virtual CacheStatistics getStatistics() const = 0;
};

/**
 * @brief 固定容量的 LRU 缓存
 *
 * 最近使用顺序由链表维护（表头最新，表尾最旧），不依赖时间戳，淘汰对象总是表尾，无并列情况。
 */
class LruAudioCache : public AudioCacheStore {
public:
    explicit LruAudioCache(size_t capacity);

    LruAudioCache(const LruAudioCache&) = delete;
    LruAudioCache& operator=(const LruAudioCache&) = delete;

    std::optional<CacheEntry> get(const CacheKey& key) override;
    std::optional<CacheKey> put(const CacheKey& key, std::shared_ptr<const AudioBytes> audio) override;
    bool evict(const CacheKey& key) override;

    size_t size() const override;
    size_t capacity() const override { return m_capacity; }
    void clear() override;
    CacheStatistics getStatistics() const override;

    // 不刷新顺序、不计入统计的查询
    bool contains(const CacheKey& key) const;

    // 按最近使用顺序列出键（最新在前）
    std::vector<CacheKey> keysByRecency() const;

private:
    using RecencyList = std::list<CacheKey>;

    struct Slot {
        CacheEntry entry;
        RecencyList::iterator pos;
    };

    const size_t m_capacity;

    mutable std::mutex m_mutex;
    RecencyList m_order;
    std::unordered_map<CacheKey, Slot, CacheKeyHash> m_slots;
    CacheStatistics m_statistics;
};

} // namespace vtb::voice_bot::service
