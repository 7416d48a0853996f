#pragma once
#include <cstddef>
#include <chrono>
#include <nlohmann/json.hpp>

namespace qsynth {
namespace core {
namespace cache {

// Веса попаданий по уровням для оценки эффективности
struct TierWeights {
    static constexpr double hot = 1.0;
    static constexpr double warm = 0.8;
    static constexpr double cold = 0.6;
    static constexpr double remote = 0.3;
};

struct TieredCacheStats {
    size_t hotEntries = 0;          // Записей в L1
    size_t warmEntries = 0;         // Записей в L2
    size_t coldEntries = 0;         // Записей в L3
    size_t hotHits = 0;
    size_t warmHits = 0;
    size_t coldHits = 0;
    size_t remoteHits = 0;
    size_t misses = 0;
    size_t requestCount = 0;        // Количество запросов get
    size_t sets = 0;
    size_t evictionCount = 0;       // Вытеснения по LRU
    size_t expiredCount = 0;        // Удалены по TTL
    size_t promotions = 0;
    size_t demotions = 0;
    size_t remoteWrites = 0;
    size_t remoteErrors = 0;
    size_t compressedWrites = 0;
    size_t memoryUsage = 0;         // Оценка объёма (байт)
    double hitRate = 0.0;           // Частота попаданий
    double efficiency = 0.0;        // Взвешенная частота попаданий
    std::chrono::steady_clock::time_point lastUpdate; // Время последнего обновления

    nlohmann::json toJson() const {
        return {
            {"hotEntries", hotEntries},
            {"warmEntries", warmEntries},
            {"coldEntries", coldEntries},
            {"hits", {{"l1", hotHits}, {"l2", warmHits}, {"l3", coldHits}, {"remote", remoteHits}}},
            {"misses", misses},
            {"requestCount", requestCount},
            {"sets", sets},
            {"evictionCount", evictionCount},
            {"expiredCount", expiredCount},
            {"promotions", promotions},
            {"demotions", demotions},
            {"remoteWrites", remoteWrites},
            {"remoteErrors", remoteErrors},
            {"compressedWrites", compressedWrites},
            {"memoryUsage", memoryUsage},
            {"hitRate", hitRate},
            {"efficiency", efficiency},
            {"lastUpdate", std::chrono::duration_cast<std::chrono::milliseconds>(lastUpdate.time_since_epoch()).count()}
        };
    }
};

} // namespace cache
} // namespace core
} // namespace qsynth
