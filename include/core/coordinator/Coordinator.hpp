#pragma once

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>
#include <gmpxx.h>
#include <nlohmann/json.hpp>
#include "core/batch/BatchService.hpp"
#include "core/cache/base/BaseCache.hpp"
#include "core/cache/tiered/TieredCache.hpp"
#include "core/consensus/ResourceManager.hpp"
#include "core/coordinator/CoordinatorConfig.hpp"
#include "core/coordinator/Operations.hpp"
#include "core/crypto/CryptoBackend.hpp"
#include "core/network/PeerTransport.hpp"
#include "core/thread/WorkerPool.hpp"

namespace qsynth {
namespace core {
namespace coordinator {

enum class ComponentHealth {
    Healthy,
    Unhealthy
};

enum class GlobalHealth {
    Healthy,
    Degraded,
    Critical
};

std::string toString(ComponentHealth health);
std::string toString(GlobalHealth health);

struct HealthReport {
    std::map<std::string, ComponentHealth> components;
    GlobalHealth global = GlobalHealth::Healthy;

    nlohmann::json toJson() const;
};

enum class CoordinatorEventType {
    ResourceCreated,
    ResourceAdapted,
    OperationFailed,
    ComponentError,
    FailoverTriggered,
    ComponentRestarted,
    LoadBalancing,
    HealthUpdate,
    BatchStarted,
    BatchCompleted
};

std::string toString(CoordinatorEventType type);

struct CoordinatorEvent {
    CoordinatorEventType type;
    std::string component;
    std::string resourceId;
    std::string detail;
};

using CoordinatorEventListener = std::function<void(const CoordinatorEvent&)>;

struct CoordinatorMetrics {
    size_t totalOperations = 0;
    size_t failedOperations = 0;
    size_t resourcesCreated = 0;
    size_t signaturesDerived = 0;
    size_t signaturesVerified = 0;
    size_t adaptationsProposed = 0;
    size_t batchesProcessed = 0;
    size_t failoverEvents = 0;
    size_t loadBalancingEvents = 0;
    int64_t uptimeMs = 0;

    nlohmann::json toJson() const {
        return {
            {"totalOperations", totalOperations},
            {"failedOperations", failedOperations},
            {"resourcesCreated", resourcesCreated},
            {"signaturesDerived", signaturesDerived},
            {"signaturesVerified", signaturesVerified},
            {"adaptationsProposed", adaptationsProposed},
            {"batchesProcessed", batchesProcessed},
            {"failoverEvents", failoverEvents},
            {"loadBalancingEvents", loadBalancingEvents},
            {"uptimeMs", uptimeMs}
        };
    }
};

// Сводная статистика системы
struct CoordinatorStats {
    thread::WorkerPoolMetrics pool;
    cache::TieredCacheStats cache;
    batch::BatchServiceStats batch;
    consensus::ResourceManagerStats resources;
    CoordinatorMetrics coordinator;
    HealthReport health;

    nlohmann::json toJson() const {
        return {
            {"pool", pool.toJson()},
            {"cache", cache.toJson()},
            {"batch", batch.toJson()},
            {"resources", resources.toJson()},
            {"coordinator", coordinator.toJson()},
            {"health", health.toJson()}
        };
    }
};

/**
 * @brief Координатор: пул воркеров, кэш, пакетный сервис и менеджер ресурсов.
 * @details Владеет всеми компонентами, следит за их здоровьем, выполняет
 * failover и балансировку нагрузки. Глобального состояния нет: всё создаётся
 * в конструкторе и освобождается в shutdown().
 */
class Coordinator {
public:
    Coordinator(const CoordinatorConfig& config,
                std::shared_ptr<crypto::ICryptoBackend> backend,
                std::shared_ptr<network::IPeerTransport> transport = nullptr,
                std::shared_ptr<cache::RemoteStore> remoteStore = nullptr);
    ~Coordinator();

    Coordinator(const Coordinator&) = delete;
    Coordinator& operator=(const Coordinator&) = delete;

    consensus::ResourceHandle createResource(const mpz_class& value, const mpz_class& frequency);
    crypto::Signature deriveSignature(const std::string& resourceId, const std::vector<uint8_t>& data);
    bool verifySignature(const std::string& resourceId, const crypto::Signature& signature,
                         const std::vector<uint8_t>& data);
    consensus::AdaptationOutcome proposeAdaptation(const std::string& resourceId,
                                                   const mpz_class& newValue,
                                                   const mpz_class& newFrequency);
    // Все операции запускаются одновременно, результаты в порядке входа
    std::vector<OperationResult> processBatch(const std::vector<Operation>& operations);

    bool vote(const std::string& proposalId, const std::string& peerId, bool approve);

    void addPeer(const std::string& peerId);
    void removePeer(const std::string& peerId);
    void migrateResource(const std::string& resourceId, const std::string& targetPeer);
    consensus::ResourceHandle receiveMigratedResource(const consensus::MigrationPackage& package);

    HealthReport checkComponentHealth();
    // Возвращает перегруженные компоненты
    std::vector<std::string> balanceLoad();
    static GlobalHealth evaluateGlobalHealth(const std::map<std::string, ComponentHealth>& components);

    CoordinatorStats getStats() const;
    CoordinatorConfig getConfiguration() const;

    // Корректное завершение; true, если всё успело завершиться до deadline
    bool shutdown(std::chrono::milliseconds deadline);

    void addListener(CoordinatorEventListener listener);

    thread::WorkerPool& workerPool();
    cache::TieredCache& tieredCache();
    batch::BatchService& batchService();
    consensus::ResourceManager& resourceManager();

private:
    struct Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace coordinator
} // namespace core
} // namespace qsynth
