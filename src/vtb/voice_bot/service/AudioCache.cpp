#include "vtb/voice_bot/service/AudioCache.h"

#include "vtb/voice_bot/service/ConfigManager.h"
#include "vtb/voice_bot/service/utils/TextUtils.h"

#include <algorithm>
#include <sstream>

namespace vtb::voice_bot::service {

CacheKey CacheKey::make(const std::string& text, const std::string& voice, const std::string& language) {
    CacheKey key;
    key.text = utils::normalizeForCache(text);
    key.voice = utils::trim(voice);
    key.language = utils::trim(language);
    return key;
}

std::string CacheKey::toString() const {
    std::ostringstream oss;
    oss << "[" << language << "/" << voice << "] " << utils::truncateUtf8(text, 48);
    if (text.size() > 48) oss << "...";
    return oss.str();
}

CacheConfig CacheConfig::fromConfig(const ConfigManager& cfg) {
    CacheConfig out;
    if (auto v = cfg.get("cache.enabled"); v.has_value() && v->is_boolean()) {
        out.enabled = v->get<bool>();
    }
    if (auto v = cfg.get("cache.capacity"); v.has_value() && v->is_number_integer()) {
        const auto val = v->get<int64_t>();
        if (val > 0) {
            out.capacity = static_cast<size_t>(val);
        }
    }
    return out;
}

LruAudioCache::LruAudioCache(size_t capacity)
    : m_capacity(std::max<size_t>(1, capacity))
{}

std::optional<CacheEntry> LruAudioCache::get(const CacheKey& key) {
    std::lock_guard<std::mutex> lock(m_mutex);

    auto it = m_slots.find(key);
    if (it == m_slots.end()) {
        m_statistics.totalMisses++;
        return std::nullopt;
    }

    // 命中：移到表头
    m_order.splice(m_order.begin(), m_order, it->second.pos);
    m_statistics.totalHits++;
    return it->second.entry;
}

std::optional<CacheKey> LruAudioCache::put(const CacheKey& key, std::shared_ptr<const AudioBytes> audio) {
    std::lock_guard<std::mutex> lock(m_mutex);

    auto it = m_slots.find(key);
    if (it != m_slots.end()) {
        // 同键同值：不覆盖，仅刷新顺序
        m_order.splice(m_order.begin(), m_order, it->second.pos);
        return std::nullopt;
    }

    m_order.push_front(key);
    Slot slot;
    slot.entry.audio = std::move(audio);
    slot.entry.createdAt = std::chrono::system_clock::now();
    slot.pos = m_order.begin();
    m_statistics.totalBytes += slot.entry.size();
    m_slots.emplace(key, std::move(slot));

    std::optional<CacheKey> victim;
    if (m_slots.size() > m_capacity) {
        // 淘汰表尾（最久未使用）
        const CacheKey oldest = m_order.back();
        auto vit = m_slots.find(oldest);
        if (vit != m_slots.end()) {
            m_statistics.totalBytes -= vit->second.entry.size();
            m_slots.erase(vit);
        }
        m_order.pop_back();
        m_statistics.evictedEntries++;
        victim = oldest;
    }

    m_statistics.totalEntries = m_slots.size();
    return victim;
}

bool LruAudioCache::evict(const CacheKey& key) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_slots.find(key);
    if (it == m_slots.end()) {
        return false;
    }
    m_statistics.totalBytes -= it->second.entry.size();
    m_order.erase(it->second.pos);
    m_slots.erase(it);
    m_statistics.evictedEntries++;
    m_statistics.totalEntries = m_slots.size();
    return true;
}

size_t LruAudioCache::size() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_slots.size();
}

void LruAudioCache::clear() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_slots.clear();
    m_order.clear();
    m_statistics.totalEntries = 0;
    m_statistics.totalBytes = 0;
}

CacheStatistics LruAudioCache::getStatistics() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_statistics;
}

bool LruAudioCache::contains(const CacheKey& key) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_slots.find(key) != m_slots.end();
}

std::vector<CacheKey> LruAudioCache::keysByRecency() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return std::vector<CacheKey>(m_order.begin(), m_order.end());
}

} // namespace vtb::voice_bot::service
