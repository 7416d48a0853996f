#pragma once

#include <chrono>
#include <string>
#include <nlohmann/json.hpp>
#include "core/batch/BatchService.hpp"
#include "core/cache/metrics/CacheConfig.hpp"
#include "core/consensus/ResourceManager.hpp"
#include "core/network/PeerTransport.hpp"
#include "core/thread/WorkerPool.hpp"

namespace qsynth {
namespace core {
namespace coordinator {

// Конфигурация координатора и всех его компонентов
struct CoordinatorConfig {
    thread::WorkerPoolConfig workerPool;
    cache::TieredCacheConfig cache;
    batch::BatchServiceConfig batch;
    consensus::ResourceManagerConfig resourceManager;

    network::RetryPolicy retry;
    bool enableRetries = true;                          // Оборачивать транспорт в RetryingPeerTransport

    bool enableMonitoring = true;                       // Фоновый цикл health-check и балансировки
    bool enableFailover = true;
    std::chrono::milliseconds healthCheckInterval{30000};
    size_t poolQueueThreshold = 100;                    // Перегрузка пула по длине очереди
    size_t batchQueueThreshold = 50;                    // Перегрузка пакетного сервиса
    bool autoScale = false;
    size_t maxPoolSize = 16;

    bool validate() const {
        if (!workerPool.validate()) return false;
        if (!cache.validate()) return false;
        if (!batch.validate()) return false;
        if (!resourceManager.validate()) return false;
        if (!retry.validate()) return false;
        if (healthCheckInterval.count() <= 0) return false;
        if (autoScale && maxPoolSize < workerPool.poolSize) return false;
        return true;
    }

    nlohmann::json toJson() const;
    static CoordinatorConfig fromJson(const nlohmann::json& j);
    // Чтение JSON-файла конфигурации
    static CoordinatorConfig loadFromFile(const std::string& path);
};

} // namespace coordinator
} // namespace core
} // namespace qsynth
