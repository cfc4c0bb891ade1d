#include "vtb/voice_bot/service/AudioCache.h"
#include "vtb/voice_bot/service/ConfigManager.h"

#include "MiniTest.h"

#include <memory>
#include <string>
#include <thread>
#include <vector>

using namespace vtb::voice_bot::service;

static std::shared_ptr<const AudioBytes> makeAudio(const std::string& s) {
    return std::make_shared<const AudioBytes>(s.begin(), s.end());
}

static CacheKey keyOf(const std::string& text) {
    return CacheKey::make(text, "en-US-AriaNeural", "en");
}

int main() {
    using namespace mini_test;

    std::vector<TestCase> tests;

    // ========== CacheKey ==========
    tests.push_back({"CacheKey_NormalizesWhitespace", []() {
        CHECK_TRUE(CacheKey::make("  Hello   world ", " v ", "en ") == CacheKey::make("Hello world", "v", "en"));
    }});

    tests.push_back({"CacheKey_VoiceInnerWhitespaceIsSignificant", []() {
        const auto spaced = CacheKey::make("Hello", "voice  a", "en");
        CHECK_EQ(spaced.voice, std::string("voice  a"));
        CHECK_FALSE(spaced == CacheKey::make("Hello", "voice a", "en"));
        CHECK_FALSE(CacheKey::make("Hello", "v", "en  us") == CacheKey::make("Hello", "v", "en us"));
        CHECK_EQ(CacheKey::make("Hello", "\tvoice  a ", "en").voice, std::string("voice  a"));
    }});

    tests.push_back({"CacheKey_CaseAndVoiceMatter", []() {
        CHECK_FALSE(CacheKey::make("Hello", "v", "en") == CacheKey::make("hello", "v", "en"));
        CHECK_FALSE(CacheKey::make("Hello", "v1", "en") == CacheKey::make("Hello", "v2", "en"));
        CHECK_FALSE(CacheKey::make("Hello", "v", "en") == CacheKey::make("Hello", "v", "zh"));
    }});

    // ========== LRU ==========
    tests.push_back({"Lru_PutAndGet", []() {
        LruAudioCache cache(2);
        CHECK_FALSE(cache.put(keyOf("a"), makeAudio("A")).has_value());
        auto hit = cache.get(keyOf("a"));
        CHECK_TRUE(hit.has_value());
        CHECK_EQ(hit->size(), static_cast<size_t>(1));
        CHECK_FALSE(cache.get(keyOf("missing")).has_value());
    }});

    tests.push_back({"Lru_EvictsLeastRecentlyUsed", []() {
        LruAudioCache cache(2);
        cache.put(keyOf("a"), makeAudio("A"));
        cache.put(keyOf("b"), makeAudio("B"));
        auto evicted = cache.put(keyOf("c"), makeAudio("C"));
        CHECK_TRUE(evicted.has_value());
        CHECK_TRUE(*evicted == keyOf("a"));
        CHECK_EQ(cache.size(), static_cast<size_t>(2));
        CHECK_FALSE(cache.contains(keyOf("a")));
        CHECK_TRUE(cache.contains(keyOf("b")));
        CHECK_TRUE(cache.contains(keyOf("c")));
    }});

    tests.push_back({"Lru_GetRefreshesRecency", []() {
        LruAudioCache cache(2);
        cache.put(keyOf("a"), makeAudio("A"));
        cache.put(keyOf("b"), makeAudio("B"));
        CHECK_TRUE(cache.get(keyOf("a")).has_value()); // a 变为最新
        auto evicted = cache.put(keyOf("c"), makeAudio("C"));
        CHECK_TRUE(evicted.has_value());
        CHECK_TRUE(*evicted == keyOf("b"));
        CHECK_TRUE(cache.contains(keyOf("a")));
    }});

    tests.push_back({"Lru_SizeNeverExceedsCapacity", []() {
        LruAudioCache cache(3);
        for (int i = 0; i < 20; ++i) {
            cache.put(keyOf("t" + std::to_string(i)), makeAudio("x"));
            CHECK_TRUE(cache.size() <= cache.capacity());
        }
        CHECK_EQ(cache.size(), static_cast<size_t>(3));
        const auto keys = cache.keysByRecency();
        CHECK_EQ(keys.size(), static_cast<size_t>(3));
        CHECK_TRUE(keys[0] == keyOf("t19"));
        CHECK_TRUE(keys[2] == keyOf("t17"));
        CHECK_EQ(cache.getStatistics().evictedEntries, static_cast<uint64_t>(17));
    }});

    tests.push_back({"Lru_EvictedKeyMissesAfterwards", []() {
        LruAudioCache cache(1);
        cache.put(keyOf("a"), makeAudio("A"));
        cache.put(keyOf("b"), makeAudio("B"));
        CHECK_FALSE(cache.get(keyOf("a")).has_value());
        const auto stats = cache.getStatistics();
        CHECK_EQ(stats.totalMisses, static_cast<uint64_t>(1));
    }});

    tests.push_back({"Lru_PutExistingKeyKeepsValue", []() {
        LruAudioCache cache(2);
        cache.put(keyOf("a"), makeAudio("first"));
        cache.put(keyOf("b"), makeAudio("B"));
        auto evicted = cache.put(keyOf("a"), makeAudio("second"));
        CHECK_FALSE(evicted.has_value());
        CHECK_EQ(cache.size(), static_cast<size_t>(2));
        auto hit = cache.get(keyOf("a"));
        CHECK_TRUE(hit.has_value());
        CHECK_EQ(std::string(hit->audio->begin(), hit->audio->end()), std::string("first"));
        // put 刷新了 a 的顺序，下一次淘汰 b
        auto next = cache.put(keyOf("c"), makeAudio("C"));
        CHECK_TRUE(next.has_value());
        CHECK_TRUE(*next == keyOf("b"));
    }});

    tests.push_back({"Lru_EvictAndClear", []() {
        LruAudioCache cache(4);
        cache.put(keyOf("a"), makeAudio("A"));
        cache.put(keyOf("b"), makeAudio("BB"));
        CHECK_EQ(cache.getStatistics().totalBytes, static_cast<size_t>(3));
        CHECK_TRUE(cache.evict(keyOf("a")));
        CHECK_FALSE(cache.evict(keyOf("a")));
        CHECK_EQ(cache.size(), static_cast<size_t>(1));
        cache.clear();
        CHECK_EQ(cache.size(), static_cast<size_t>(0));
        CHECK_EQ(cache.getStatistics().totalBytes, static_cast<size_t>(0));
    }});

    tests.push_back({"Lru_HitRate", []() {
        LruAudioCache cache(2);
        cache.put(keyOf("a"), makeAudio("A"));
        (void)cache.get(keyOf("a"));
        (void)cache.get(keyOf("a"));
        (void)cache.get(keyOf("z"));
        const auto stats = cache.getStatistics();
        CHECK_EQ(stats.totalHits, static_cast<uint64_t>(2));
        CHECK_EQ(stats.totalMisses, static_cast<uint64_t>(1));
        CHECK_TRUE(stats.getHitRate() > 0.66 && stats.getHitRate() < 0.67);
    }});

    tests.push_back({"Lru_ConcurrentAccessKeepsBound", []() {
        LruAudioCache cache(8);
        std::vector<std::thread> threads;
        for (int t = 0; t < 4; ++t) {
            threads.emplace_back([&cache, t]() {
                for (int i = 0; i < 200; ++i) {
                    const auto k = keyOf(std::to_string(t) + "-" + std::to_string(i % 16));
                    if (!cache.get(k).has_value()) {
                        cache.put(k, makeAudio("x"));
                    }
                }
            });
        }
        for (auto& th : threads) th.join();
        CHECK_TRUE(cache.size() <= 8);
    }});

    // ========== Config ==========
    tests.push_back({"CacheConfig_FromConfig", []() {
        ConfigManager config;
        config.loadFromString(R"({"cache":{"enabled":false,"capacity":7}})");
        const auto cc = CacheConfig::fromConfig(config);
        CHECK_FALSE(cc.enabled);
        CHECK_EQ(cc.capacity, static_cast<size_t>(7));
    }});

    tests.push_back({"CacheConfig_Defaults", []() {
        ConfigManager config;
        const auto cc = CacheConfig::fromConfig(config);
        CHECK_TRUE(cc.enabled);
        CHECK_EQ(cc.capacity, static_cast<size_t>(100));
    }});

    return run(tests);
}
