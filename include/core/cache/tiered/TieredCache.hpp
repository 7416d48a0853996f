#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/cache/base/BaseCache.hpp"
#include "core/cache/metrics/CacheConfig.hpp"
#include "core/cache/metrics/CacheMetrics.hpp"
#include "core/common/Errors.hpp"

namespace qsynth {
namespace core {
namespace cache {

// Запись кэша
struct CacheEntry {
    std::string key;
    nlohmann::json value;
    CacheTier tier = CacheTier::Hot;
    std::chrono::steady_clock::time_point timestamp;   // Время записи, от него считается TTL
    std::chrono::steady_clock::time_point lastAccess;  // Для LRU и неактивности
    size_t accessCount = 0;
    size_t sizeEstimate = 0;
    std::chrono::milliseconds ttl{0};
};

using PrefetchGenerator = std::function<std::optional<nlohmann::json>(const std::string& key)>;

/**
 * @brief Многоуровневый кэш L1/L2/L3 с необязательным удалённым уровнем.
 * @details Ключ живёт не более чем на одном локальном уровне. Попадание ниже L1
 * поднимает запись на уровень выше. Фоновый поток удаляет просроченные записи
 * и периодически перераспределяет их по уровням.
 */
class TieredCache {
public:
    explicit TieredCache(const TieredCacheConfig& config,
                         std::shared_ptr<RemoteStore> remote = nullptr);
    ~TieredCache();

    TieredCache(const TieredCache&) = delete;
    TieredCache& operator=(const TieredCache&) = delete;

    std::optional<nlohmann::json> get(const std::string& key);
    void set(const std::string& key, const nlohmann::json& value,
             CacheTier tier = CacheTier::Hot,
             std::optional<std::chrono::milliseconds> ttl = std::nullopt);
    // TTL берётся по категории данных
    void set(const std::string& key, const nlohmann::json& value,
             CacheCategory category, CacheTier tier = CacheTier::Hot);

    bool remove(const std::string& key);
    // Без аргумента очищаются все уровни
    void clear(std::optional<CacheTier> tier = std::nullopt);

    // Прогрев холодного уровня; возвращает число загруженных ключей
    size_t prefetch(const std::vector<std::string>& keys, const PrefetchGenerator& generator);

    // Удалить просроченные записи; возвращает число удалённых
    size_t sweepExpired();
    // Перераспределить записи по уровням
    void rebalance();

    std::optional<CacheTier> tierOf(const std::string& key) const;
    std::optional<CacheEntry> inspect(const std::string& key) const;

    TieredCacheStats getStats() const;
    TieredCacheConfig getConfiguration() const;

    // Работает ли фоновое обслуживание (для health-check)
    bool ping() const;
    void restartMaintenance();
    void stop();

    void setErrorListener(common::ComponentErrorListener listener);

private:
    struct Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace cache
} // namespace core
} // namespace qsynth
