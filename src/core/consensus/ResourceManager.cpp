#include "core/consensus/ResourceManager.hpp"
#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <map>
#include <mutex>
#include <set>
#include <thread>
#include <unordered_map>
#include <spdlog/spdlog.h>
#include "core/common/Logging.hpp"

namespace qsynth {
namespace core {
namespace consensus {

using Clock = std::chrono::steady_clock;

std::string toString(ResourceEventType type) {
    switch (type) {
        case ResourceEventType::ResourceRegistered: return "resource-registered";
        case ResourceEventType::ReplicationFailed: return "replication-failed";
        case ResourceEventType::AdaptationProposed: return "adaptation-proposed";
        case ResourceEventType::AdaptationVote: return "adaptation-vote";
        case ResourceEventType::ResourceAdapted: return "resource-adapted";
        case ResourceEventType::AdaptationRejected: return "adaptation-rejected";
        case ResourceEventType::AdaptationTimedOut: return "adaptation-timed-out";
        case ResourceEventType::MigrationStarted: return "migration-started";
        case ResourceEventType::MigrationCompleted: return "migration-completed";
        case ResourceEventType::MigrationFailed: return "migration-failed";
        case ResourceEventType::MigrationReceived: return "migration-received";
    }
    return "unknown";
}

nlohmann::json ResourceManagerConfig::toJson() const {
    return {
        {"nodeId", nodeId},
        {"energyChangeThreshold", energyChangeThreshold},
        {"minAdaptationIntervalSec", minAdaptationInterval.count()},
        {"quorumRatio", quorumRatio},
        {"proposalTimeoutMs", proposalTimeout.count()},
        {"peerSendTimeoutMs", peerSendTimeout.count()},
        {"keyGenerationTimeoutMs", keyGenerationTimeout.count()}
    };
}

ResourceManagerConfig ResourceManagerConfig::fromJson(const nlohmann::json& j) {
    using std::chrono::milliseconds;
    ResourceManagerConfig config;
    config.nodeId = j.value("nodeId", config.nodeId);
    config.energyChangeThreshold = j.value("energyChangeThreshold", config.energyChangeThreshold);
    config.minAdaptationInterval = std::chrono::seconds(
        j.value("minAdaptationIntervalSec", config.minAdaptationInterval.count()));
    config.quorumRatio = j.value("quorumRatio", config.quorumRatio);
    config.proposalTimeout = milliseconds(j.value("proposalTimeoutMs", config.proposalTimeout.count()));
    config.peerSendTimeout = milliseconds(j.value("peerSendTimeoutMs", config.peerSendTimeout.count()));
    config.keyGenerationTimeout = milliseconds(
        j.value("keyGenerationTimeoutMs", config.keyGenerationTimeout.count()));
    return config;
}

// Реализация PIMPL
struct ResourceManager::Impl {
    struct OpenProposal {
        Proposal proposal;
        std::shared_ptr<std::promise<AdaptationOutcome>> promise;
        bool closing = false;       // Кворум собран или истёк срок, голоса не принимаются
    };

    ResourceManagerConfig config;
    thread::WorkerPool& pool;
    std::shared_ptr<crypto::ICryptoBackend> backend;
    std::shared_ptr<network::IPeerTransport> transport;
    std::shared_ptr<spdlog::logger> logger;

    mutable std::mutex mutex;
    std::map<std::string, ResourceHandle> resources;
    std::set<std::string> peers;
    std::unordered_map<std::string, OpenProposal> proposals;
    ResourceManagerStats stats;
    uint64_t nextProposalId = 1;
    uint64_t nextMigrationId = 1;

    std::condition_variable monitorCv;
    std::thread monitor;
    bool stopping = false;
    std::atomic<bool> stopped{false};
    std::atomic<bool> monitorRunning{false};

    std::mutex listenersMutex;
    std::vector<ResourceEventListener> listeners;
    common::ComponentErrorListener errorListener;

    Impl(const ResourceManagerConfig& cfg, thread::WorkerPool& p,
         std::shared_ptr<crypto::ICryptoBackend> b, std::shared_ptr<network::IPeerTransport> t)
        : config(cfg), pool(p), backend(std::move(b)), transport(std::move(t)) {
        logger = common::componentLogger("resourcemanager");
    }

    void emit(const std::vector<ResourceEvent>& events) {
        if (events.empty()) return;
        std::vector<ResourceEventListener> snapshot;
        {
            std::lock_guard<std::mutex> lock(listenersMutex);
            snapshot = listeners;
        }
        for (const auto& event : events) {
            for (const auto& listener : snapshot) {
                try {
                    listener(event);
                } catch (const std::exception& e) {
                    logger->error("Ошибка обработчика события {}: {}", toString(event.type), e.what());
                }
            }
        }
    }

    void reportError(const std::string& message) {
        common::ComponentErrorListener listener;
        {
            std::lock_guard<std::mutex> lock(listenersMutex);
            listener = errorListener;
        }
        if (listener) {
            listener("manager", message);
        }
    }

    static std::shared_future<AdaptationOutcome> ready(AdaptationOutcome outcome) {
        std::promise<AdaptationOutcome> promise;
        promise.set_value(std::move(outcome));
        return promise.get_future().share();
    }

    ResourceHandle& resourceLocked(const std::string& id) {
        auto it = resources.find(id);
        if (it == resources.end()) {
            throw common::ResourceNotFoundError(id);
        }
        return it->second;
    }

    network::PeerMessage message(network::PeerMessageType type, const std::string& resourceId,
                                 const std::string& correlationId, nlohmann::json payload) const {
        network::PeerMessage msg;
        msg.type = type;
        msg.senderId = config.nodeId;
        msg.resourceId = resourceId;
        msg.correlationId = correlationId;
        msg.payload = std::move(payload);
        return msg;
    }

    // Рассылка без гарантии доставки; возвращает пиров, не подтвердивших приём
    std::vector<std::string> broadcast(const std::vector<std::string>& targets,
                                       const network::PeerMessage& msg) {
        std::vector<std::string> failed;
        if (!transport) return failed;
        for (const auto& peer : targets) {
            try {
                transport->send(peer, msg, config.peerSendTimeout);
            } catch (const common::PeerSendError& e) {
                logger->warn("{} для {} не доставлено пиру {}: {}",
                             network::toString(msg.type), msg.resourceId, peer, e.what());
                failed.push_back(peer);
            }
        }
        return failed;
    }

    std::vector<std::string> remoteReplicas(const ResourceHandle& handle) const {
        std::vector<std::string> result;
        for (const auto& replica : handle.replicaSet) {
            if (replica != config.nodeId) result.push_back(replica);
        }
        return result;
    }

    // Завершение раунда, если голосов достаточно
    void maybeFinalize(const std::string& proposalId);
    void commit(const Proposal& proposal, std::shared_ptr<std::promise<AdaptationOutcome>> promise);
    size_t expireStale();
    void monitorLoop();
};

void ResourceManager::Impl::maybeFinalize(const std::string& proposalId) {
    std::vector<ResourceEvent> events;
    std::shared_ptr<std::promise<AdaptationOutcome>> promise;
    Proposal proposal;
    bool approved = false;
    {
        std::lock_guard<std::mutex> lock(mutex);
        auto it = proposals.find(proposalId);
        if (it == proposals.end() || it->second.closing) return;
        auto& open = it->second;
        if (open.proposal.votes.size() < open.proposal.requiredVotes) return;

        open.closing = true;
        ++stats.consensusReached;
        approved = open.proposal.approvals() >= open.proposal.requiredVotes;
        proposal = open.proposal;
        promise = open.promise;

        if (!approved) {
            proposals.erase(it);
            auto res = resources.find(proposal.resourceId);
            if (res != resources.end()) res->second.locked = false;
            ++stats.adaptationsRejected;
            events.push_back({ResourceEventType::AdaptationRejected, proposal.resourceId, proposal.id, "",
                              "недостаточно одобрений"});
        }
    }

    if (approved) {
        commit(proposal, promise);
        return;
    }

    std::string reason = "Предложение " + proposal.id + " отклонено: одобрений " +
                         std::to_string(proposal.approvals()) + " из " +
                         std::to_string(proposal.requiredVotes) + " требуемых";
    logger->info(reason);
    emit(events);

    AdaptationOutcome outcome;
    outcome.adapted = false;
    outcome.status = AdaptationStatus::Rejected;
    outcome.reason = reason;
    outcome.proposalId = proposal.id;
    outcome.error = std::make_exception_ptr(common::ConsensusRejectedError(reason));
    promise->set_value(std::move(outcome));
}

// Фиксация одобренного предложения
void ResourceManager::Impl::commit(const Proposal& proposal,
                                   std::shared_ptr<std::promise<AdaptationOutcome>> promise) {
    crypto::ComplexityTier oldTier;
    crypto::KeyRef keyRef;
    {
        std::lock_guard<std::mutex> lock(mutex);
        const auto& handle = resourceLocked(proposal.resourceId);
        oldTier = handle.complexityTier;
        keyRef = handle.keyMaterialRef;
    }

    auto newTier = crypto::tierForEnergy(proposal.metrics.energyAfter);
    bool keyRotated = newTier != oldTier;

    // Ключ перегенерируется только при смене уровня сложности
    if (keyRotated) {
        try {
            auto cryptoBackend = backend;
            thread::TaskDescriptor task;
            task.kind = thread::TaskKind::GenerateKeyMaterial;
            task.payload = {{"resourceId", proposal.resourceId}, {"tier", crypto::toString(newTier)}};
            task.priority = crypto::priorityForValue(proposal.newValue);
            task.timeout = config.keyGenerationTimeout;
            task.work = [cryptoBackend, newTier]() -> thread::TaskResult {
                return {{"keyRef", cryptoBackend->generateKeyMaterial(newTier)}};
            };
            auto result = pool.submit(std::move(task)).get();
            keyRef = result.at("keyRef").get<std::string>();
        } catch (const std::exception& e) {
            logger->error("Перегенерация ключа для {} не удалась: {}", proposal.resourceId, e.what());
            {
                std::lock_guard<std::mutex> lock(mutex);
                proposals.erase(proposal.id);
                auto res = resources.find(proposal.resourceId);
                if (res != resources.end()) res->second.locked = false;
                ++stats.adaptationsFailed;
            }
            AdaptationOutcome outcome;
            outcome.status = AdaptationStatus::Failed;
            outcome.reason = std::string("ошибка генерации ключа: ") + e.what();
            outcome.proposalId = proposal.id;
            outcome.error = std::current_exception();
            promise->set_value(std::move(outcome));
            return;
        }
    }

    ResourceHandle updated;
    AdaptationRecord record;
    {
        std::lock_guard<std::mutex> lock(mutex);
        auto& handle = resourceLocked(proposal.resourceId);

        record.proposalId = proposal.id;
        record.timestamp = WallClock::now();
        record.oldValue = handle.value;
        record.newValue = proposal.newValue;
        record.oldTier = handle.complexityTier;
        record.newTier = newTier;
        record.energyChange = proposal.metrics.relativeChange;
        record.keyRotated = keyRotated;
        record.version = handle.consensusVersion + 1;

        handle.value = proposal.newValue;
        handle.frequency = proposal.newFrequency;
        handle.complexityTier = newTier;
        handle.keyMaterialRef = keyRef;
        handle.consensusVersion = record.version;
        handle.adaptationHistory.push_back(record);
        handle.lastAdaptation = record.timestamp;
        handle.locked = false;

        proposals.erase(proposal.id);
        ++stats.adaptationsPerformed;
        if (keyRotated) ++stats.keyRotations;
        updated = handle;
    }

    logger->info("Ресурс {} адаптирован: версия {}, уровень {} -> {}{}",
                 proposal.resourceId, record.version, crypto::toString(record.oldTier),
                 crypto::toString(newTier), keyRotated ? ", ключ обновлён" : "");
    emit({{ResourceEventType::ResourceAdapted, proposal.resourceId, proposal.id, "",
           "version " + std::to_string(record.version)}});

    // Распространение обновления по репликам
    auto failed = broadcast(remoteReplicas(updated),
                            message(network::PeerMessageType::ResourceUpdate, updated.id, proposal.id,
                                    updated.toJson()));
    if (!failed.empty()) {
        std::lock_guard<std::mutex> lock(mutex);
        stats.propagationFailures += failed.size();
    }

    AdaptationOutcome outcome;
    outcome.adapted = true;
    outcome.status = AdaptationStatus::Committed;
    outcome.reason = "адаптация зафиксирована";
    outcome.newTier = newTier;
    outcome.newVersion = record.version;
    outcome.proposalId = proposal.id;
    promise->set_value(std::move(outcome));
}

size_t ResourceManager::Impl::expireStale() {
    std::vector<std::pair<Proposal, std::shared_ptr<std::promise<AdaptationOutcome>>>> expired;
    std::vector<ResourceEvent> events;
    {
        std::lock_guard<std::mutex> lock(mutex);
        auto now = Clock::now();
        for (auto it = proposals.begin(); it != proposals.end();) {
            auto& open = it->second;
            if (open.closing || now <= open.proposal.expiry) {
                ++it;
                continue;
            }
            auto res = resources.find(open.proposal.resourceId);
            if (res != resources.end()) res->second.locked = false;
            ++stats.adaptationsTimedOut;
            events.push_back({ResourceEventType::AdaptationTimedOut, open.proposal.resourceId,
                              open.proposal.id, "", ""});
            expired.emplace_back(open.proposal, open.promise);
            it = proposals.erase(it);
        }
    }

    emit(events);
    for (auto& [proposal, promise] : expired) {
        std::string reason = "Предложение " + proposal.id + " истекло: голосов " +
                             std::to_string(proposal.votes.size()) + " из " +
                             std::to_string(proposal.requiredVotes);
        logger->warn(reason);
        AdaptationOutcome outcome;
        outcome.status = AdaptationStatus::TimedOut;
        outcome.reason = reason;
        outcome.proposalId = proposal.id;
        outcome.error = std::make_exception_ptr(common::ConsensusTimeoutError(reason));
        promise->set_value(std::move(outcome));
    }
    return expired.size();
}

void ResourceManager::Impl::monitorLoop() {
    std::unique_lock<std::mutex> lock(mutex);
    while (!stopping) {
        auto wakeUp = Clock::now() + std::chrono::seconds(1);
        for (const auto& [id, open] : proposals) {
            if (!open.closing && open.proposal.expiry < wakeUp) {
                wakeUp = open.proposal.expiry;
            }
        }
        monitorCv.wait_until(lock, wakeUp + std::chrono::milliseconds(1));
        if (stopping) break;

        lock.unlock();
        try {
            expireStale();
        } catch (const std::exception& e) {
            logger->error("Ошибка монитора предложений: {}", e.what());
            reportError(e.what());
        }
        lock.lock();
    }
    monitorRunning = false;
}

// Конструктор
ResourceManager::ResourceManager(const ResourceManagerConfig& config,
                                 thread::WorkerPool& pool,
                                 std::shared_ptr<crypto::ICryptoBackend> backend,
                                 std::shared_ptr<network::IPeerTransport> transport)
    : pImpl(std::make_unique<Impl>(config, pool, std::move(backend), std::move(transport))) {
    if (!config.validate()) {
        throw std::invalid_argument("Некорректная конфигурация менеджера ресурсов");
    }
    if (!pImpl->backend) {
        throw std::invalid_argument("ResourceManager: не задан криптографический бэкенд");
    }
    pImpl->monitorRunning = true;
    pImpl->monitor = std::thread([this] { pImpl->monitorLoop(); });
    pImpl->logger->debug("ResourceManager: узел {}, кворум {}", config.nodeId, config.quorumRatio);
}

// Деструктор
ResourceManager::~ResourceManager() {
    try {
        shutdown();
    } catch (const std::exception& e) {
        pImpl->logger->error("Ошибка остановки менеджера ресурсов: {}", e.what());
    }
}

void ResourceManager::addPeer(const std::string& peerId) {
    if (!pImpl->transport) {
        throw std::logic_error("Нельзя добавить пира без транспорта");
    }
    if (peerId.empty() || peerId == pImpl->config.nodeId) {
        throw std::invalid_argument("Некорректный идентификатор пира: " + peerId);
    }
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    pImpl->peers.insert(peerId);
    pImpl->logger->debug("Добавлен пир {}", peerId);
}

void ResourceManager::removePeer(const std::string& peerId) {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    pImpl->peers.erase(peerId);
    for (auto& [id, handle] : pImpl->resources) {
        handle.replicaSet.erase(peerId);
    }
    pImpl->logger->debug("Удалён пир {}", peerId);
}

std::vector<std::string> ResourceManager::getPeers() const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    return std::vector<std::string>(pImpl->peers.begin(), pImpl->peers.end());
}

ResourceHandle ResourceManager::registerResource(const std::string& id, const mpz_class& value,
                                                 const mpz_class& frequency, crypto::ComplexityTier tier,
                                                 const crypto::KeyRef& keyRef) {
    if (id.empty() || keyRef.empty()) {
        throw std::invalid_argument("Пустой идентификатор ресурса или ключа");
    }
    if (value < 0 || frequency < 0) {
        throw std::invalid_argument("value и frequency должны быть неотрицательными");
    }

    ResourceHandle handle;
    std::vector<std::string> targets;
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        if (pImpl->stopped) {
            throw common::SynthesisError("Менеджер ресурсов остановлен");
        }
        if (pImpl->resources.count(id)) {
            throw std::invalid_argument("Ресурс уже зарегистрирован: " + id);
        }
        handle.id = id;
        handle.value = value;
        handle.frequency = frequency;
        handle.complexityTier = tier;
        handle.keyMaterialRef = keyRef;
        handle.replicaSet.insert(pImpl->config.nodeId);
        handle.consensusVersion = 1;
        handle.lastAdaptation = WallClock::now();
        pImpl->resources[id] = handle;
        ++pImpl->stats.resourcesManaged;
        targets.assign(pImpl->peers.begin(), pImpl->peers.end());
    }
    pImpl->emit({{ResourceEventType::ResourceRegistered, id, "", pImpl->config.nodeId, ""}});

    // Репликация: ошибки не фатальны, подтвердившие пиры становятся репликами
    auto failed = pImpl->broadcast(targets, pImpl->message(network::PeerMessageType::ReplicateResource,
                                                           id, "", handle.toJson()));
    std::vector<ResourceEvent> events;
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        pImpl->stats.replicationFailures += failed.size();
        auto it = pImpl->resources.find(id);
        if (it != pImpl->resources.end()) {
            for (const auto& peer : targets) {
                if (std::find(failed.begin(), failed.end(), peer) == failed.end()) {
                    it->second.replicaSet.insert(peer);
                }
            }
            handle = it->second;
        }
        for (const auto& peer : failed) {
            events.push_back({ResourceEventType::ReplicationFailed, id, "", peer, ""});
        }
    }
    pImpl->emit(events);

    pImpl->logger->info("Ресурс {} зарегистрирован: уровень {}, реплик {}",
                        id, crypto::toString(tier), handle.replicaSet.size());
    return handle;
}

std::shared_future<AdaptationOutcome> ResourceManager::evaluateAdaptation(const std::string& id,
                                                                          const mpz_class& newValue,
                                                                          const mpz_class& newFrequency) {
    if (newValue < 0 || newFrequency < 0) {
        throw std::invalid_argument("value и frequency должны быть неотрицательными");
    }

    std::shared_future<AdaptationOutcome> future;
    Proposal proposal;
    std::vector<std::string> targets;
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        if (pImpl->stopped) {
            throw common::SynthesisError("Менеджер ресурсов остановлен");
        }
        auto& handle = pImpl->resourceLocked(id);

        if (handle.locked) {
            AdaptationOutcome outcome;
            outcome.status = AdaptationStatus::Locked;
            outcome.reason = "ресурс заблокирован";
            return Impl::ready(std::move(outcome));
        }

        auto energyBefore = crypto::computeEnergy(handle.value, handle.frequency);
        auto energyAfter = crypto::computeEnergy(newValue, newFrequency);
        bool changeExceeds = crypto::energyChangeExceeds(energyBefore, energyAfter,
                                                         pImpl->config.energyChangeThreshold);
        auto interval = pImpl->config.minAdaptationInterval;
        bool intervalElapsed = interval.count() == 0 ||
                               WallClock::now() - handle.lastAdaptation > interval;

        if (!changeExceeds || !intervalElapsed) {
            AdaptationOutcome outcome;
            outcome.status = AdaptationStatus::NotRequired;
            outcome.reason = !changeExceeds ? "изменение энергии ниже порога"
                                            : "не истёк минимальный интервал адаптации";
            return Impl::ready(std::move(outcome));
        }

        auto now = Clock::now();
        proposal.id = "prop-" + pImpl->config.nodeId + "-" + std::to_string(pImpl->nextProposalId++);
        proposal.resourceId = id;
        proposal.proposerId = pImpl->config.nodeId;
        proposal.newValue = newValue;
        proposal.newFrequency = newFrequency;
        proposal.metrics.energyBefore = energyBefore;
        proposal.metrics.energyAfter = energyAfter;
        proposal.metrics.relativeChange = crypto::relativeEnergyChange(energyBefore, energyAfter);
        proposal.votes[pImpl->config.nodeId] = true;
        proposal.requiredVotes = requiredVotesFor(handle.replicaSet.size(), pImpl->config.quorumRatio);
        proposal.createdAt = now;
        proposal.expiry = now + pImpl->config.proposalTimeout;

        handle.locked = true;
        ++pImpl->stats.proposalsCreated;

        Impl::OpenProposal open;
        open.proposal = proposal;
        open.promise = std::make_shared<std::promise<AdaptationOutcome>>();
        future = open.promise->get_future().share();
        pImpl->proposals.emplace(proposal.id, std::move(open));
        targets = pImpl->remoteReplicas(handle);
        pImpl->monitorCv.notify_one();
    }

    pImpl->logger->info("Предложение {} для {}: изменение энергии {:.4f}, требуется голосов {}",
                        proposal.id, id, proposal.metrics.relativeChange, proposal.requiredVotes);
    pImpl->emit({{ResourceEventType::AdaptationProposed, id, proposal.id, pImpl->config.nodeId, ""}});

    auto failed = pImpl->broadcast(targets, pImpl->message(network::PeerMessageType::AdaptationProposal,
                                                           id, proposal.id, proposal.toJson()));
    if (!failed.empty()) {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        pImpl->stats.propagationFailures += failed.size();
    }

    // Один узел: собственного голоса достаточно
    pImpl->maybeFinalize(proposal.id);
    return future;
}

bool ResourceManager::vote(const std::string& proposalId, const std::string& peerId, bool approve) {
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        auto it = pImpl->proposals.find(proposalId);
        if (it == pImpl->proposals.end() || it->second.closing) {
            pImpl->logger->warn("Голос {} по закрытому или неизвестному предложению {}", peerId, proposalId);
            return false;
        }
        auto& proposal = it->second.proposal;
        if (Clock::now() > proposal.expiry) {
            pImpl->logger->warn("Голос {} по истёкшему предложению {}", peerId, proposalId);
            return false;
        }
        auto res = pImpl->resources.find(proposal.resourceId);
        if (res == pImpl->resources.end() || !res->second.replicaSet.count(peerId)) {
            pImpl->logger->warn("Пир {} не является репликой {}", peerId, proposal.resourceId);
            return false;
        }
        if (proposal.votes.count(peerId)) {
            pImpl->logger->warn("Повторный голос {} по предложению {}", peerId, proposalId);
            return false;
        }
        proposal.votes[peerId] = approve;
    }

    pImpl->emit({{ResourceEventType::AdaptationVote, "", proposalId, peerId, approve ? "approve" : "reject"}});
    pImpl->maybeFinalize(proposalId);
    return true;
}

void ResourceManager::migrate(const std::string& id, const std::string& targetPeer) {
    MigrationPackage package;
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        auto& handle = pImpl->resourceLocked(id);
        if (handle.locked) {
            throw common::ResourceLockedError(id);
        }
        if (!pImpl->transport || !pImpl->peers.count(targetPeer)) {
            throw std::invalid_argument("Неизвестный целевой пир: " + targetPeer);
        }
        package.resource = handle;
        package.sourceNodeId = pImpl->config.nodeId;
        package.targetNodeId = targetPeer;
        package.migrationId = "mig-" + pImpl->config.nodeId + "-" + std::to_string(pImpl->nextMigrationId++);
        package.timestamp = WallClock::now();
        // На время миграции ресурс заблокирован
        handle.locked = true;
    }
    pImpl->emit({{ResourceEventType::MigrationStarted, id, package.migrationId, targetPeer, ""}});

    try {
        pImpl->transport->send(targetPeer,
                               pImpl->message(network::PeerMessageType::MigrateResource, id,
                                              package.migrationId, package.toJson()),
                               pImpl->config.peerSendTimeout);
    } catch (const common::PeerSendError& e) {
        {
            std::lock_guard<std::mutex> lock(pImpl->mutex);
            auto it = pImpl->resources.find(id);
            if (it != pImpl->resources.end()) it->second.locked = false;
            ++pImpl->stats.migrationsFailed;
        }
        pImpl->logger->error("Миграция {} на {} не удалась: {}", id, targetPeer, e.what());
        pImpl->emit({{ResourceEventType::MigrationFailed, id, package.migrationId, targetPeer, e.what()}});
        throw;
    }

    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        pImpl->resources.erase(id);
        ++pImpl->stats.migrations;
    }
    pImpl->logger->info("Ресурс {} мигрирован на {}", id, targetPeer);
    pImpl->emit({{ResourceEventType::MigrationCompleted, id, package.migrationId, targetPeer, ""}});
}

ResourceHandle ResourceManager::receiveMigratedResource(const MigrationPackage& package) {
    ResourceHandle installed = package.resource;
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        auto it = pImpl->resources.find(installed.id);
        if (it != pImpl->resources.end()) {
            if (it->second.locked) {
                throw common::ResourceLockedError(installed.id);
            }
            if (it->second.consensusVersion > installed.consensusVersion) {
                throw std::invalid_argument("Мигрированная версия " + installed.id + " устарела");
            }
        } else {
            ++pImpl->stats.resourcesManaged;
        }
        installed.locked = false;
        installed.replicaSet.insert(pImpl->config.nodeId);
        pImpl->resources[installed.id] = installed;
    }
    pImpl->logger->info("Принят мигрированный ресурс {} от {} (версия {})",
                        installed.id, package.sourceNodeId, installed.consensusVersion);
    pImpl->emit({{ResourceEventType::MigrationReceived, installed.id, package.migrationId,
                  package.sourceNodeId, ""}});
    return installed;
}

crypto::KeyRef ResourceManager::keyMaterialFor(const std::string& id) const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    const auto& handle = pImpl->resourceLocked(id);
    if (handle.locked) {
        throw common::ResourceLockedError(id);
    }
    return handle.keyMaterialRef;
}

std::optional<ResourceHandle> ResourceManager::getResource(const std::string& id) const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    auto it = pImpl->resources.find(id);
    if (it == pImpl->resources.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<ResourceStats> ResourceManager::getResourceStats(const std::string& id) const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    auto it = pImpl->resources.find(id);
    if (it == pImpl->resources.end()) {
        return std::nullopt;
    }
    const auto& handle = it->second;
    ResourceStats stats;
    stats.id = handle.id;
    stats.currentValue = handle.value.get_str();
    stats.adaptationCount = handle.adaptationHistory.size();
    stats.lastAdaptationMs = std::chrono::duration_cast<std::chrono::milliseconds>(
        handle.lastAdaptation.time_since_epoch()).count();
    stats.currentTier = handle.complexityTier;
    stats.replicas.assign(handle.replicaSet.begin(), handle.replicaSet.end());
    stats.consensusVersion = handle.consensusVersion;
    stats.locked = handle.locked;
    return stats;
}

std::vector<std::string> ResourceManager::listResources() const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    std::vector<std::string> ids;
    ids.reserve(pImpl->resources.size());
    for (const auto& [id, handle] : pImpl->resources) {
        ids.push_back(id);
    }
    return ids;
}

std::optional<Proposal> ResourceManager::getOpenProposal(const std::string& resourceId) const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    for (const auto& [id, open] : pImpl->proposals) {
        if (open.proposal.resourceId == resourceId && !open.closing) {
            return open.proposal;
        }
    }
    return std::nullopt;
}

size_t ResourceManager::expireStaleProposals() {
    return pImpl->expireStale();
}

// Получение метрик
ResourceManagerStats ResourceManager::getStats() const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    ResourceManagerStats stats = pImpl->stats;
    stats.openProposals = pImpl->proposals.size();
    return stats;
}

ResourceManagerConfig ResourceManager::getConfiguration() const {
    return pImpl->config;
}

bool ResourceManager::ping() const {
    return !pImpl->stopped && pImpl->monitorRunning;
}

// Остановка: монитор завершается, открытые предложения закрываются с ошибкой
void ResourceManager::shutdown() {
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        if (pImpl->stopped) return;
        pImpl->stopped = true;
        pImpl->stopping = true;
    }
    pImpl->monitorCv.notify_all();
    if (pImpl->monitor.joinable()) {
        pImpl->monitor.join();
    }

    std::vector<Impl::OpenProposal> open;
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        for (auto it = pImpl->proposals.begin(); it != pImpl->proposals.end();) {
            if (it->second.closing) {
                ++it;
                continue;
            }
            auto res = pImpl->resources.find(it->second.proposal.resourceId);
            if (res != pImpl->resources.end()) res->second.locked = false;
            open.push_back(std::move(it->second));
            it = pImpl->proposals.erase(it);
        }
    }
    for (auto& item : open) {
        AdaptationOutcome outcome;
        outcome.status = AdaptationStatus::Failed;
        outcome.reason = "менеджер ресурсов остановлен";
        outcome.proposalId = item.proposal.id;
        outcome.error = std::make_exception_ptr(common::SynthesisError(outcome.reason));
        item.promise->set_value(std::move(outcome));
    }
    pImpl->logger->info("ResourceManager остановлен, закрыто предложений: {}", open.size());
}

void ResourceManager::addListener(ResourceEventListener listener) {
    std::lock_guard<std::mutex> lock(pImpl->listenersMutex);
    pImpl->listeners.push_back(std::move(listener));
}

void ResourceManager::setErrorListener(common::ComponentErrorListener listener) {
    std::lock_guard<std::mutex> lock(pImpl->listenersMutex);
    pImpl->errorListener = std::move(listener);
}

} // namespace consensus
} // namespace core
} // namespace qsynth
