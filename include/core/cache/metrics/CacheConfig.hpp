#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <nlohmann/json.hpp>

namespace qsynth {
namespace core {
namespace cache {

// Уровни кэша
enum class CacheTier {
    Hot,     // L1
    Warm,    // L2
    Cold,    // L3
    Remote
};

std::string toString(CacheTier tier);

// Категории данных с собственным TTL
enum class CacheCategory {
    KeyMaterial,
    Energy,
    Signature,
    Verification
};

std::string toString(CacheCategory category);

// Конфигурация многоуровневого кэша
struct TieredCacheConfig {
    // ёмкость уровней (записей)
    size_t hotCapacity = 1000;
    size_t warmCapacity = 4000;
    size_t coldCapacity = 16000;

    std::chrono::milliseconds defaultTtl{std::chrono::minutes(15)};
    std::chrono::milliseconds keyMaterialTtl{std::chrono::minutes(5)};
    std::chrono::milliseconds energyTtl{std::chrono::minutes(10)};
    std::chrono::milliseconds signatureTtl{std::chrono::minutes(15)};
    std::chrono::milliseconds verificationTtl{std::chrono::minutes(30)};

    std::chrono::milliseconds sweepInterval{std::chrono::seconds(30)};
    std::chrono::milliseconds rebalanceInterval{std::chrono::seconds(300)};
    std::chrono::milliseconds inactivityWindow{std::chrono::seconds(300)};

    // пороги перемещения между уровнями
    size_t promoteToWarmAccesses = 5;
    size_t promoteToHotAccesses = 10;
    size_t demoteBelowAccesses = 3;

    size_t compressionThreshold = 1024; // байт; более крупные записи удалённого уровня сжимаются zlib
    bool enableMaintenance = true;      // фоновый поток очистки и ребалансировки

    std::chrono::milliseconds ttlFor(CacheCategory category) const {
        switch (category) {
            case CacheCategory::KeyMaterial: return keyMaterialTtl;
            case CacheCategory::Energy: return energyTtl;
            case CacheCategory::Signature: return signatureTtl;
            case CacheCategory::Verification: return verificationTtl;
        }
        return defaultTtl;
    }

    bool validate() const {
        if (hotCapacity == 0 || warmCapacity == 0 || coldCapacity == 0) return false;
        if (defaultTtl.count() <= 0) return false;
        if (keyMaterialTtl.count() <= 0 || energyTtl.count() <= 0) return false;
        if (signatureTtl.count() <= 0 || verificationTtl.count() <= 0) return false;
        if (sweepInterval.count() <= 0 || rebalanceInterval.count() <= 0) return false;
        if (promoteToWarmAccesses == 0 || promoteToHotAccesses == 0) return false;
        return true;
    }

    nlohmann::json toJson() const;
    static TieredCacheConfig fromJson(const nlohmann::json& j);
};

} // namespace cache
} // namespace core
} // namespace qsynth
