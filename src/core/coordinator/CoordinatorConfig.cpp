#include "core/coordinator/CoordinatorConfig.hpp"
#include <fstream>
#include <stdexcept>

namespace qsynth {
namespace core {
namespace coordinator {

nlohmann::json CoordinatorConfig::toJson() const {
    return {
        {"workerPool", workerPool.toJson()},
        {"cache", cache.toJson()},
        {"batch", batch.toJson()},
        {"resourceManager", resourceManager.toJson()},
        {"retry", {
            {"enabled", enableRetries},
            {"maxAttempts", retry.maxAttempts},
            {"initialBackoffMs", retry.initialBackoff.count()},
            {"backoffMultiplier", retry.backoffMultiplier},
            {"maxBackoffMs", retry.maxBackoff.count()}
        }},
        {"enableMonitoring", enableMonitoring},
        {"enableFailover", enableFailover},
        {"healthCheckIntervalMs", healthCheckInterval.count()},
        {"poolQueueThreshold", poolQueueThreshold},
        {"batchQueueThreshold", batchQueueThreshold},
        {"autoScale", autoScale},
        {"maxPoolSize", maxPoolSize}
    };
}

CoordinatorConfig CoordinatorConfig::fromJson(const nlohmann::json& j) {
    using std::chrono::milliseconds;
    CoordinatorConfig config;
    if (j.contains("workerPool")) config.workerPool = thread::WorkerPoolConfig::fromJson(j.at("workerPool"));
    if (j.contains("cache")) config.cache = cache::TieredCacheConfig::fromJson(j.at("cache"));
    if (j.contains("batch")) config.batch = batch::BatchServiceConfig::fromJson(j.at("batch"));
    if (j.contains("resourceManager")) {
        config.resourceManager = consensus::ResourceManagerConfig::fromJson(j.at("resourceManager"));
    }
    if (j.contains("retry")) {
        const auto& r = j.at("retry");
        config.enableRetries = r.value("enabled", config.enableRetries);
        config.retry.maxAttempts = r.value("maxAttempts", config.retry.maxAttempts);
        config.retry.initialBackoff = milliseconds(r.value("initialBackoffMs", config.retry.initialBackoff.count()));
        config.retry.backoffMultiplier = r.value("backoffMultiplier", config.retry.backoffMultiplier);
        config.retry.maxBackoff = milliseconds(r.value("maxBackoffMs", config.retry.maxBackoff.count()));
    }
    config.enableMonitoring = j.value("enableMonitoring", config.enableMonitoring);
    config.enableFailover = j.value("enableFailover", config.enableFailover);
    config.healthCheckInterval = milliseconds(j.value("healthCheckIntervalMs", config.healthCheckInterval.count()));
    config.poolQueueThreshold = j.value("poolQueueThreshold", config.poolQueueThreshold);
    config.batchQueueThreshold = j.value("batchQueueThreshold", config.batchQueueThreshold);
    config.autoScale = j.value("autoScale", config.autoScale);
    config.maxPoolSize = j.value("maxPoolSize", config.maxPoolSize);
    return config;
}

CoordinatorConfig CoordinatorConfig::loadFromFile(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("Не удалось открыть файл конфигурации: " + path);
    }
    nlohmann::json j;
    in >> j;
    auto config = fromJson(j);
    if (!config.validate()) {
        throw std::invalid_argument("Некорректная конфигурация в файле " + path);
    }
    return config;
}

} // namespace coordinator
} // namespace core
} // namespace qsynth
