#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include "core/cache/CacheKey.hpp"
#include "core/cache/remote/MemoryRemoteStore.hpp"
#include "core/cache/tiered/TieredCache.hpp"

using namespace qsynth::core::cache;
using namespace std::chrono_literals;

namespace {

TieredCacheConfig quietConfig() {
    TieredCacheConfig config;
    config.enableMaintenance = false;
    return config;
}

} // namespace

void testTtlExpiry() {
    TieredCache cache(quietConfig());
    cache.set("x", "v1", CacheTier::Hot, 100ms);
    auto value = cache.get("x");
    assert(value && value->get<std::string>() == "v1");

    std::this_thread::sleep_for(150ms);
    assert(!cache.get("x"));
    auto stats = cache.getStats();
    assert(stats.hotHits == 1);
    assert(stats.misses == 1);
    assert(stats.expiredCount == 1);
    std::cout << "[OK] TieredCache TTL expiry\n";
}

void testPromotionOnHit() {
    TieredCache cache(quietConfig());
    cache.set("k", 42, CacheTier::Cold);
    assert(cache.tierOf("k") == CacheTier::Cold);

    assert(cache.get("k")->get<int>() == 42);
    assert(cache.tierOf("k") == CacheTier::Warm);
    assert(cache.get("k")->get<int>() == 42);
    assert(cache.tierOf("k") == CacheTier::Hot);

    auto entry = cache.inspect("k");
    assert(entry && entry->accessCount == 2);
    auto stats = cache.getStats();
    assert(stats.coldHits == 1 && stats.warmHits == 1);
    assert(stats.promotions == 2);
    assert(stats.hotEntries == 1 && stats.warmEntries == 0 && stats.coldEntries == 0);
    std::cout << "[OK] TieredCache promotion on hit\n";
}

void testSingleTierPerKey() {
    TieredCache cache(quietConfig());
    cache.set("dup", "hot", CacheTier::Hot);
    cache.set("dup", "cold", CacheTier::Cold);
    assert(cache.tierOf("dup") == CacheTier::Cold);
    auto stats = cache.getStats();
    assert(stats.hotEntries + stats.warmEntries + stats.coldEntries == 1);
    assert(cache.remove("dup"));
    assert(!cache.remove("dup"));
    assert(!cache.tierOf("dup"));
    std::cout << "[OK] TieredCache single tier per key\n";
}

void testLruEviction() {
    auto config = quietConfig();
    config.hotCapacity = 2;
    TieredCache cache(config);
    cache.set("a", 1);
    cache.set("b", 2);
    assert(cache.get("a"));       // a свежее b
    cache.set("c", 3);

    assert(cache.tierOf("a") == CacheTier::Hot);
    assert(!cache.tierOf("b"));
    assert(cache.tierOf("c") == CacheTier::Hot);
    assert(cache.getStats().evictionCount == 1);
    std::cout << "[OK] TieredCache LRU eviction\n";
}

void testCategoryTtlAndValidation() {
    TieredCache cache(quietConfig());
    cache.set("energy:1", {{"energy", "500"}}, CacheCategory::Energy);
    auto entry = cache.inspect("energy:1");
    assert(entry && entry->ttl == cache.getConfiguration().energyTtl);

    bool thrown = false;
    try {
        cache.set("bad", 1, CacheTier::Hot, 0ms);
    } catch (const std::invalid_argument&) {
        thrown = true;
    }
    assert(thrown);

    thrown = false;
    try {
        cache.set("remote-only", 1, CacheTier::Remote);
    } catch (const std::invalid_argument&) {
        thrown = true;
    }
    assert(thrown);
    std::cout << "[OK] TieredCache category TTL and validation\n";
}

void testRemoteTierWithCompression() {
    auto remote = std::make_shared<MemoryRemoteStore>();
    TieredCache cache(quietConfig(), remote);

    std::string large(4096, 'z');
    cache.set("big", large);
    cache.set("small", "tiny");
    assert(remote->size() == 2);
    // Повторяющиеся данные сжимаются zlib
    assert(remote->storedBytes() < large.size());

    auto stats = cache.getStats();
    assert(stats.remoteWrites == 2);
    assert(stats.compressedWrites == 1);

    // Локальные уровни пусты: значение приходит из удалённого хранилища и ложится в L2
    cache.clear(CacheTier::Hot);
    auto value = cache.get("big");
    assert(value && value->get<std::string>() == large);
    assert(cache.tierOf("big") == CacheTier::Warm);
    assert(cache.getStats().remoteHits == 1);

    // Запись только в удалённый уровень
    cache.set("far", "away", CacheTier::Remote);
    assert(!cache.tierOf("far"));
    assert(cache.get("far")->get<std::string>() == "away");
    std::cout << "[OK] TieredCache remote tier with compression\n";
}

void testRemoteTierHonoursTtl() {
    auto remote = std::make_shared<MemoryRemoteStore>();
    auto config = quietConfig();
    config.hotCapacity = 1;
    TieredCache cache(config, remote);

    // x вытесняется из L1 до истечения TTL и остаётся только в удалённом хранилище
    cache.set("x", "v1", CacheTier::Hot, 100ms);
    cache.set("y", "v2", CacheTier::Hot, 60000ms);
    assert(!cache.tierOf("x"));
    assert(remote->size() == 2);

    std::this_thread::sleep_for(150ms);
    assert(!cache.get("x"));
    assert(!cache.tierOf("x"));
    assert(remote->size() == 1);
    auto stats = cache.getStats();
    assert(stats.remoteHits == 0);
    assert(stats.expiredCount == 1);

    // Живая удалённая запись возвращается в L2 с остатком TTL
    cache.set("z", "v3", CacheTier::Hot, 5000ms);
    cache.set("y", "v2", CacheTier::Hot, 60000ms);
    auto value = cache.get("z");
    assert(value && value->get<std::string>() == "v3");
    auto entry = cache.inspect("z");
    assert(entry && entry->tier == CacheTier::Warm);
    assert(entry->ttl > 0ms && entry->ttl <= 5000ms);
    std::cout << "[OK] TieredCache remote tier honours TTL\n";
}

void testRemoteUnavailable() {
    auto remote = std::make_shared<MemoryRemoteStore>();
    TieredCache cache(quietConfig(), remote);
    remote->setAvailable(false);

    cache.set("k", 1);
    assert(cache.get("k")->get<int>() == 1);
    assert(!cache.get("missing"));
    auto stats = cache.getStats();
    assert(stats.remoteErrors == 2);
    assert(stats.remoteWrites == 0);
    assert(!cache.ping());

    remote->setAvailable(true);
    assert(cache.ping());
    std::cout << "[OK] TieredCache remote unavailable\n";
}

void testSweepExpired() {
    auto remote = std::make_shared<MemoryRemoteStore>();
    TieredCache cache(quietConfig(), remote);
    cache.set("short", 1, CacheTier::Warm, 20ms);
    cache.set("long", 2, CacheTier::Cold, 60000ms);
    std::this_thread::sleep_for(40ms);

    assert(cache.sweepExpired() == 1);
    assert(!cache.tierOf("short"));
    assert(cache.tierOf("long") == CacheTier::Cold);
    // Просроченная запись удаляется и из удалённого хранилища
    assert(remote->size() == 1);
    std::cout << "[OK] TieredCache sweep expired\n";
}

void testRebalanceDemotesInactive() {
    auto config = quietConfig();
    config.inactivityWindow = 20ms;
    TieredCache cache(config);
    cache.set("idle", 1);
    cache.set("busy", 2);
    for (int i = 0; i < 3; ++i) cache.get("busy");

    std::this_thread::sleep_for(40ms);
    cache.rebalance();
    assert(cache.tierOf("idle") == CacheTier::Warm);
    assert(cache.tierOf("busy") == CacheTier::Hot);
    assert(cache.getStats().demotions == 1);
    std::cout << "[OK] TieredCache rebalance demotes inactive\n";
}

void testPrefetch() {
    TieredCache cache(quietConfig());
    cache.set("p2", "already");
    size_t loaded = cache.prefetch({"p1", "p2", "p3"}, [](const std::string& key) -> std::optional<nlohmann::json> {
        if (key == "p3") return std::nullopt;
        return nlohmann::json("generated-" + key);
    });
    assert(loaded == 1);
    assert(cache.tierOf("p1") == CacheTier::Cold);
    assert(cache.tierOf("p2") == CacheTier::Hot);
    assert(!cache.tierOf("p3"));
    std::cout << "[OK] TieredCache prefetch\n";
}

void testBackgroundMaintenance() {
    TieredCacheConfig config;
    config.sweepInterval = 20ms;
    TieredCache cache(config);
    assert(cache.ping());

    cache.set("temp", 1, CacheTier::Hot, 10ms);
    std::this_thread::sleep_for(150ms);
    assert(!cache.tierOf("temp"));
    assert(cache.getStats().expiredCount == 1);

    cache.restartMaintenance();
    assert(cache.ping());
    cache.stop();
    assert(!cache.ping());
    std::cout << "[OK] TieredCache background maintenance\n";
}

void testStatsAndEfficiency() {
    TieredCache cache(quietConfig());
    cache.set("h", 1, CacheTier::Hot);
    cache.get("h");
    cache.get("nope");
    auto stats = cache.getStats();
    assert(stats.requestCount == 2);
    assert(stats.hitRate == 0.5);
    assert(stats.efficiency == 0.5);  // 1 попадание в L1 с весом 1.0 на 2 запроса
    assert(stats.memoryUsage > 0);
    assert(stats.toJson()["hits"]["l1"] == 1);
    std::cout << "[OK] TieredCache stats\n";
}

void testCacheKeys() {
    auto first = deriveCacheKey("sign", {{"resourceId", "r1"}, {"data", "00ff"}});
    auto second = deriveCacheKey("sign", {{"data", "00ff"}, {"resourceId", "r1"}});
    assert(first == second);
    assert(first.rfind("sign:", 0) == 0);
    assert(first.size() == 5 + 64);
    assert(deriveCacheKey("verify", {{"resourceId", "r1"}, {"data", "00ff"}}) != first);

    assert(toHex({0x00, 0xab, 0x10}) == "00ab10");
    assert(sha256Hex(std::string("abc")) ==
           "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    std::cout << "[OK] Cache key derivation\n";
}

void testConfigJson() {
    TieredCacheConfig config;
    config.hotCapacity = 7;
    config.signatureTtl = 1234ms;
    auto restored = TieredCacheConfig::fromJson(config.toJson());
    assert(restored.hotCapacity == 7);
    assert(restored.signatureTtl == 1234ms);

    TieredCacheConfig invalid;
    invalid.hotCapacity = 0;
    bool thrown = false;
    try {
        TieredCache cache(invalid);
    } catch (const std::invalid_argument&) {
        thrown = true;
    }
    assert(thrown);
    std::cout << "[OK] TieredCache config\n";
}

int main() {
    testTtlExpiry();
    testPromotionOnHit();
    testSingleTierPerKey();
    testLruEviction();
    testCategoryTtlAndValidation();
    testRemoteTierWithCompression();
    testRemoteTierHonoursTtl();
    testRemoteUnavailable();
    testSweepExpired();
    testRebalanceDemotesInactive();
    testPrefetch();
    testBackgroundMaintenance();
    testStatsAndEfficiency();
    testCacheKeys();
    testConfigJson();
    std::cout << "All tiered cache tests passed!\n";
    return 0;
}
