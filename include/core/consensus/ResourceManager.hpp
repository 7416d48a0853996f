#pragma once

#include <chrono>
#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/common/Errors.hpp"
#include "core/consensus/ResourceTypes.hpp"
#include "core/crypto/CryptoBackend.hpp"
#include "core/network/PeerTransport.hpp"
#include "core/thread/WorkerPool.hpp"

namespace qsynth {
namespace core {
namespace consensus {

struct ResourceManagerConfig {
    std::string nodeId = "node-local";
    double energyChangeThreshold = 0.25;                  // Порог относительного изменения энергии
    std::chrono::seconds minAdaptationInterval{300};      // 0: без ограничения
    double quorumRatio = 0.67;
    std::chrono::milliseconds proposalTimeout{30000};
    std::chrono::milliseconds peerSendTimeout{5000};
    std::chrono::milliseconds keyGenerationTimeout{30000};

    bool validate() const {
        if (nodeId.empty()) return false;
        if (energyChangeThreshold < 0.0) return false;
        if (minAdaptationInterval.count() < 0) return false;
        if (quorumRatio <= 0.0 || quorumRatio > 1.0) return false;
        if (proposalTimeout.count() <= 0) return false;
        if (peerSendTimeout.count() <= 0) return false;
        if (keyGenerationTimeout.count() <= 0) return false;
        return true;
    }

    nlohmann::json toJson() const;
    static ResourceManagerConfig fromJson(const nlohmann::json& j);
};

enum class ResourceEventType {
    ResourceRegistered,
    ReplicationFailed,
    AdaptationProposed,
    AdaptationVote,
    ResourceAdapted,
    AdaptationRejected,
    AdaptationTimedOut,
    MigrationStarted,
    MigrationCompleted,
    MigrationFailed,
    MigrationReceived
};

std::string toString(ResourceEventType type);

struct ResourceEvent {
    ResourceEventType type;
    std::string resourceId;
    std::string proposalId;
    std::string peerId;
    std::string detail;
};

using ResourceEventListener = std::function<void(const ResourceEvent&)>;

struct ResourceManagerStats {
    size_t resourcesManaged = 0;
    size_t proposalsCreated = 0;
    size_t openProposals = 0;
    size_t consensusReached = 0;
    size_t adaptationsPerformed = 0;
    size_t adaptationsRejected = 0;
    size_t adaptationsTimedOut = 0;
    size_t adaptationsFailed = 0;
    size_t keyRotations = 0;
    size_t migrations = 0;
    size_t migrationsFailed = 0;
    size_t replicationFailures = 0;
    size_t propagationFailures = 0;

    nlohmann::json toJson() const {
        return {
            {"resourcesManaged", resourcesManaged},
            {"proposalsCreated", proposalsCreated},
            {"openProposals", openProposals},
            {"consensusReached", consensusReached},
            {"adaptationsPerformed", adaptationsPerformed},
            {"adaptationsRejected", adaptationsRejected},
            {"adaptationsTimedOut", adaptationsTimedOut},
            {"adaptationsFailed", adaptationsFailed},
            {"keyRotations", keyRotations},
            {"migrations", migrations},
            {"migrationsFailed", migrationsFailed},
            {"replicationFailures", replicationFailures},
            {"propagationFailures", propagationFailures}
        };
    }
};

/**
 * @brief Менеджер адаптивных ресурсов.
 * @details Владеет версионируемыми ресурсами и проводит раунды кворумного
 * голосования по репликам. Состояние ресурса: Unlocked -> Voting -> Unlocked[v+1]
 * при фиксации или Unlocked[v] при отклонении и таймауте. Фиксация выполняется
 * в потоке голоса, набравшего кворум.
 */
class ResourceManager {
public:
    ResourceManager(const ResourceManagerConfig& config,
                    thread::WorkerPool& pool,
                    std::shared_ptr<crypto::ICryptoBackend> backend,
                    std::shared_ptr<network::IPeerTransport> transport);
    ~ResourceManager();

    ResourceManager(const ResourceManager&) = delete;
    ResourceManager& operator=(const ResourceManager&) = delete;

    // Реестр пиров; без транспорта добавить пира нельзя
    void addPeer(const std::string& peerId);
    void removePeer(const std::string& peerId);
    std::vector<std::string> getPeers() const;

    ResourceHandle registerResource(const std::string& id, const mpz_class& value,
                                    const mpz_class& frequency, crypto::ComplexityTier tier,
                                    const crypto::KeyRef& keyRef);

    std::shared_future<AdaptationOutcome> evaluateAdaptation(const std::string& id,
                                                             const mpz_class& newValue,
                                                             const mpz_class& newFrequency);

    // Голос реплики; false, если голос не принят
    bool vote(const std::string& proposalId, const std::string& peerId, bool approve);

    void migrate(const std::string& id, const std::string& targetPeer);
    ResourceHandle receiveMigratedResource(const MigrationPackage& package);

    // Ссылка на ключ; бросает ResourceNotFoundError / ResourceLockedError
    crypto::KeyRef keyMaterialFor(const std::string& id) const;

    std::optional<ResourceHandle> getResource(const std::string& id) const;
    std::optional<ResourceStats> getResourceStats(const std::string& id) const;
    std::vector<std::string> listResources() const;
    std::optional<Proposal> getOpenProposal(const std::string& resourceId) const;

    // Закрыть просроченные предложения; возвращает их число
    size_t expireStaleProposals();

    ResourceManagerStats getStats() const;
    ResourceManagerConfig getConfiguration() const;

    bool ping() const;
    void shutdown();

    void addListener(ResourceEventListener listener);
    void setErrorListener(common::ComponentErrorListener listener);

private:
    struct Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace consensus
} // namespace core
} // namespace qsynth
