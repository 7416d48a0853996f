#include "core/cache/metrics/CacheConfig.hpp"

namespace qsynth {
namespace core {
namespace cache {

std::string toString(CacheTier tier) {
    switch (tier) {
        case CacheTier::Hot: return "l1";
        case CacheTier::Warm: return "l2";
        case CacheTier::Cold: return "l3";
        case CacheTier::Remote: return "remote";
    }
    return "unknown";
}

std::string toString(CacheCategory category) {
    switch (category) {
        case CacheCategory::KeyMaterial: return "key-material";
        case CacheCategory::Energy: return "energy";
        case CacheCategory::Signature: return "signature";
        case CacheCategory::Verification: return "verification";
    }
    return "unknown";
}

nlohmann::json TieredCacheConfig::toJson() const {
    return {
        {"hotCapacity", hotCapacity},
        {"warmCapacity", warmCapacity},
        {"coldCapacity", coldCapacity},
        {"defaultTtlMs", defaultTtl.count()},
        {"keyMaterialTtlMs", keyMaterialTtl.count()},
        {"energyTtlMs", energyTtl.count()},
        {"signatureTtlMs", signatureTtl.count()},
        {"verificationTtlMs", verificationTtl.count()},
        {"sweepIntervalMs", sweepInterval.count()},
        {"rebalanceIntervalMs", rebalanceInterval.count()},
        {"inactivityWindowMs", inactivityWindow.count()},
        {"promoteToWarmAccesses", promoteToWarmAccesses},
        {"promoteToHotAccesses", promoteToHotAccesses},
        {"demoteBelowAccesses", demoteBelowAccesses},
        {"compressionThreshold", compressionThreshold},
        {"enableMaintenance", enableMaintenance}
    };
}

TieredCacheConfig TieredCacheConfig::fromJson(const nlohmann::json& j) {
    using std::chrono::milliseconds;
    TieredCacheConfig config;
    config.hotCapacity = j.value("hotCapacity", config.hotCapacity);
    config.warmCapacity = j.value("warmCapacity", config.warmCapacity);
    config.coldCapacity = j.value("coldCapacity", config.coldCapacity);
    config.defaultTtl = milliseconds(j.value("defaultTtlMs", config.defaultTtl.count()));
    config.keyMaterialTtl = milliseconds(j.value("keyMaterialTtlMs", config.keyMaterialTtl.count()));
    config.energyTtl = milliseconds(j.value("energyTtlMs", config.energyTtl.count()));
    config.signatureTtl = milliseconds(j.value("signatureTtlMs", config.signatureTtl.count()));
    config.verificationTtl = milliseconds(j.value("verificationTtlMs", config.verificationTtl.count()));
    config.sweepInterval = milliseconds(j.value("sweepIntervalMs", config.sweepInterval.count()));
    config.rebalanceInterval = milliseconds(j.value("rebalanceIntervalMs", config.rebalanceInterval.count()));
    config.inactivityWindow = milliseconds(j.value("inactivityWindowMs", config.inactivityWindow.count()));
    config.promoteToWarmAccesses = j.value("promoteToWarmAccesses", config.promoteToWarmAccesses);
    config.promoteToHotAccesses = j.value("promoteToHotAccesses", config.promoteToHotAccesses);
    config.demoteBelowAccesses = j.value("demoteBelowAccesses", config.demoteBelowAccesses);
    config.compressionThreshold = j.value("compressionThreshold", config.compressionThreshold);
    config.enableMaintenance = j.value("enableMaintenance", config.enableMaintenance);
    return config;
}

} // namespace cache
} // namespace core
} // namespace qsynth
