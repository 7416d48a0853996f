#include "core/coordinator/Coordinator.hpp"
#include <atomic>
#include <condition_variable>
#include <future>
#include <mutex>
#include <set>
#include <thread>
#include <spdlog/spdlog.h>
#include "core/cache/CacheKey.hpp"
#include "core/common/Errors.hpp"
#include "core/common/Logging.hpp"
#include "core/crypto/Complexity.hpp"

namespace qsynth {
namespace core {
namespace coordinator {

using Clock = std::chrono::steady_clock;

namespace {

template<class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template<class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

const char* const kPool = "pool";
const char* const kCache = "cache";
const char* const kBatch = "batch";
const char* const kManager = "manager";

} // namespace

std::string toString(ComponentHealth health) {
    return health == ComponentHealth::Healthy ? "healthy" : "unhealthy";
}

std::string toString(GlobalHealth health) {
    switch (health) {
        case GlobalHealth::Healthy: return "healthy";
        case GlobalHealth::Degraded: return "degraded";
        case GlobalHealth::Critical: return "critical";
    }
    return "unknown";
}

std::string toString(CoordinatorEventType type) {
    switch (type) {
        case CoordinatorEventType::ResourceCreated: return "resource-created";
        case CoordinatorEventType::ResourceAdapted: return "resource-adapted";
        case CoordinatorEventType::OperationFailed: return "operation-failed";
        case CoordinatorEventType::ComponentError: return "component-error";
        case CoordinatorEventType::FailoverTriggered: return "failover-triggered";
        case CoordinatorEventType::ComponentRestarted: return "component-restarted";
        case CoordinatorEventType::LoadBalancing: return "load-balancing";
        case CoordinatorEventType::HealthUpdate: return "health-update";
        case CoordinatorEventType::BatchStarted: return "batch-started";
        case CoordinatorEventType::BatchCompleted: return "batch-completed";
    }
    return "unknown";
}

std::string operationName(const Operation& op) {
    return std::visit(overloaded{
        [](const CreateOp&) { return std::string("create"); },
        [](const SignOp&) { return std::string("sign"); },
        [](const VerifyOp&) { return std::string("verify"); },
        [](const AdaptOp&) { return std::string("adapt"); }
    }, op);
}

nlohmann::json HealthReport::toJson() const {
    nlohmann::json j;
    for (const auto& [name, health] : components) {
        j[name] = toString(health);
    }
    j["globalHealth"] = toString(global);
    return j;
}

// Реализация PIMPL
struct Coordinator::Impl {
    CoordinatorConfig config;
    std::shared_ptr<crypto::ICryptoBackend> backend;
    std::shared_ptr<network::IPeerTransport> transport;
    std::shared_ptr<spdlog::logger> logger;

    mutable std::mutex mutex;
    CoordinatorMetrics metrics;
    HealthReport health;
    std::set<std::string> reportedFailures;     // Ошибки фоновых потоков до следующей проверки
    uint64_t nextResourceId = 1;
    Clock::time_point startedAt = Clock::now();

    std::mutex loopMutex;
    std::condition_variable loopCv;
    std::thread healthLoop;
    bool stopLoop = false;
    bool shutDown = false;

    std::mutex listenersMutex;
    std::vector<CoordinatorEventListener> listeners;

    // Порядок объявления задаёт порядок разрушения: менеджер и сервис раньше пула и кэша
    std::unique_ptr<thread::WorkerPool> pool;
    std::unique_ptr<cache::TieredCache> tieredCache;
    std::unique_ptr<batch::BatchService> batchService;
    std::unique_ptr<consensus::ResourceManager> manager;

    void emit(const CoordinatorEvent& event) {
        std::vector<CoordinatorEventListener> snapshot;
        {
            std::lock_guard<std::mutex> lock(listenersMutex);
            snapshot = listeners;
        }
        for (const auto& listener : snapshot) {
            try {
                listener(event);
            } catch (const std::exception& e) {
                logger->error("Ошибка обработчика события {}: {}", toString(event.type), e.what());
            }
        }
    }

    void onComponentError(const std::string& component, const std::string& message) {
        logger->error("Ошибка компонента {}: {}", component, message);
        {
            std::lock_guard<std::mutex> lock(mutex);
            reportedFailures.insert(component);
        }
        emit({CoordinatorEventType::ComponentError, component, "", message});
    }

    void countFailure(const std::string& operation, const std::string& resourceId, const std::exception& e) {
        {
            std::lock_guard<std::mutex> lock(mutex);
            ++metrics.failedOperations;
        }
        logger->warn("Операция {} не выполнена: {}", operation, e.what());
        emit({CoordinatorEventType::OperationFailed, operation, resourceId, e.what()});
    }

    bool pingComponent(const std::string& component) {
        try {
            if (component == kPool) return pool->ping();
            if (component == kCache) return tieredCache->ping();
            if (component == kBatch) return batchService->ping();
            if (component == kManager) return manager->ping();
        } catch (const std::exception& e) {
            logger->warn("Ping {} завершился ошибкой: {}", component, e.what());
        }
        return false;
    }

    // Процедура перезапуска компонента
    void triggerFailover(const std::string& component) {
        {
            std::lock_guard<std::mutex> lock(mutex);
            ++metrics.failoverEvents;
        }
        logger->warn("Failover компонента {}", component);
        emit({CoordinatorEventType::FailoverTriggered, component, "", ""});
        try {
            if (component == kPool) {
                pool->scale(config.workerPool.poolSize);
            } else if (component == kCache) {
                tieredCache->restartMaintenance();
            } else if (component == kBatch) {
                batchService->restart();
            } else if (component == kManager) {
                manager->expireStaleProposals();
            }
            emit({CoordinatorEventType::ComponentRestarted, component, "", ""});
        } catch (const std::exception& e) {
            logger->error("Перезапуск {} не удался: {}", component, e.what());
        }
    }

    // Энергия и уровень сложности: из кэша, при промахе через задачу пула
    std::pair<mpz_class, crypto::ComplexityTier> energyFor(const mpz_class& value, const mpz_class& frequency) {
        std::string key = cache::deriveCacheKey("energy", {
            {"value", value.get_str()},
            {"frequency", frequency.get_str()}
        });
        auto cached = tieredCache->get(key);
        if (cached) {
            return {mpz_class(cached->at("energy").get<std::string>()),
                    crypto::tierFromString(cached->at("tier").get<std::string>())};
        }

        thread::TaskDescriptor task;
        task.kind = thread::TaskKind::ComputeEnergy;
        task.payload = {{"value", value.get_str()}, {"frequency", frequency.get_str()}};
        task.priority = crypto::priorityForValue(value);
        task.work = [value, frequency]() -> thread::TaskResult {
            auto energy = crypto::computeEnergy(value, frequency);
            return {{"energy", energy.get_str()}, {"tier", crypto::toString(crypto::tierForEnergy(energy))}};
        };
        auto result = pool->submit(std::move(task)).get();
        tieredCache->set(key, result, cache::CacheCategory::Energy);
        return {mpz_class(result.at("energy").get<std::string>()),
                crypto::tierFromString(result.at("tier").get<std::string>())};
    }

    batch::BatchHandle signRequest(const std::string& resourceId, const std::vector<uint8_t>& data) {
        batch::SignRequest request;
        request.resourceId = resourceId;
        request.key = manager->keyMaterialFor(resourceId);
        request.data = data;
        request.priority = priorityFor(resourceId);
        return batchService->request(request);
    }

    batch::BatchHandle verifyRequest(const std::string& resourceId, const crypto::Signature& signature,
                                     const std::vector<uint8_t>& data) {
        batch::VerifyRequest request;
        request.resourceId = resourceId;
        request.key = manager->keyMaterialFor(resourceId);
        request.signature = signature;
        request.data = data;
        request.priority = priorityFor(resourceId);
        return batchService->request(request);
    }

    int priorityFor(const std::string& resourceId) const {
        auto handle = manager->getResource(resourceId);
        if (!handle) {
            throw common::ResourceNotFoundError(resourceId);
        }
        return crypto::priorityForValue(handle->value);
    }

    void monitoringLoop() {
        std::unique_lock<std::mutex> lock(loopMutex);
        while (!stopLoop) {
            loopCv.wait_for(lock, config.healthCheckInterval, [this] { return stopLoop; });
            if (stopLoop) break;
            lock.unlock();
            try {
                runHealthCheck();
                runLoadBalance();
            } catch (const std::exception& e) {
                logger->error("Ошибка цикла мониторинга: {}", e.what());
            }
            lock.lock();
        }
    }

    HealthReport runHealthCheck();
    std::vector<std::string> runLoadBalance();
};

HealthReport Coordinator::Impl::runHealthCheck() {
    std::set<std::string> reported;
    {
        std::lock_guard<std::mutex> lock(mutex);
        reported.swap(reportedFailures);
    }

    HealthReport report;
    std::vector<std::string> unhealthy;
    for (const char* component : {kPool, kCache, kBatch, kManager}) {
        bool healthy = pingComponent(component) && !reported.count(component);
        report.components[component] = healthy ? ComponentHealth::Healthy : ComponentHealth::Unhealthy;
        if (!healthy) unhealthy.push_back(component);
    }
    report.global = Coordinator::evaluateGlobalHealth(report.components);

    for (const auto& component : unhealthy) {
        if (!reported.count(component)) {
            emit({CoordinatorEventType::ComponentError, component, "", "ping не прошёл"});
        }
        if (config.enableFailover) {
            triggerFailover(component);
        }
    }

    {
        std::lock_guard<std::mutex> lock(mutex);
        health = report;
    }
    if (report.global != GlobalHealth::Healthy) {
        logger->warn("Состояние системы: {}", toString(report.global));
    }
    emit({CoordinatorEventType::HealthUpdate, "", "", report.toJson().dump()});
    return report;
}

std::vector<std::string> Coordinator::Impl::runLoadBalance() {
    auto poolMetrics = pool->getMetrics();
    auto batchStats = batchService->getStats();

    std::vector<std::string> overloaded;
    if (poolMetrics.queuedTasks > config.poolQueueThreshold) {
        overloaded.push_back(kPool);
    }
    if (batchStats.pending > config.batchQueueThreshold) {
        overloaded.push_back(kBatch);
    }
    if (overloaded.empty()) {
        return overloaded;
    }

    {
        std::lock_guard<std::mutex> lock(mutex);
        ++metrics.loadBalancingEvents;
    }
    nlohmann::json detail = {
        {"overloaded", overloaded},
        {"queuedTasks", poolMetrics.queuedTasks},
        {"pendingBatch", batchStats.pending}
    };
    logger->info("Балансировка нагрузки: {}", detail.dump());
    emit({CoordinatorEventType::LoadBalancing, "", "", detail.dump()});

    if (config.autoScale && poolMetrics.poolSize < config.maxPoolSize) {
        try {
            pool->scale(poolMetrics.poolSize + 1);
        } catch (const std::exception& e) {
            logger->warn("Автомасштабирование пула не удалось: {}", e.what());
        }
    }
    return overloaded;
}

// Конструктор
Coordinator::Coordinator(const CoordinatorConfig& config,
                         std::shared_ptr<crypto::ICryptoBackend> backend,
                         std::shared_ptr<network::IPeerTransport> transport,
                         std::shared_ptr<cache::RemoteStore> remoteStore)
    : pImpl(std::make_unique<Impl>()) {
    pImpl->logger = common::componentLogger("coordinator");
    if (!config.validate()) {
        throw std::invalid_argument("Некорректная конфигурация координатора");
    }
    if (!backend) {
        throw std::invalid_argument("Coordinator: не задан криптографический бэкенд");
    }

    try {
        pImpl->config = config;
        pImpl->backend = std::move(backend);
        if (transport && config.enableRetries) {
            pImpl->transport = std::make_shared<network::RetryingPeerTransport>(std::move(transport), config.retry);
        } else {
            pImpl->transport = std::move(transport);
        }

        pImpl->pool = std::make_unique<thread::WorkerPool>(config.workerPool);
        pImpl->tieredCache = std::make_unique<cache::TieredCache>(config.cache, std::move(remoteStore));
        pImpl->batchService = std::make_unique<batch::BatchService>(
            config.batch, *pImpl->pool, *pImpl->tieredCache, pImpl->backend);
        pImpl->manager = std::make_unique<consensus::ResourceManager>(
            config.resourceManager, *pImpl->pool, pImpl->backend, pImpl->transport);

        // Ошибки фоновых потоков компонентов
        auto onError = [impl = pImpl.get()](const std::string& component, const std::string& message) {
            impl->onComponentError(component, message);
        };
        pImpl->tieredCache->setErrorListener(onError);
        pImpl->batchService->setErrorListener(onError);
        pImpl->manager->setErrorListener(onError);
        pImpl->pool->addListener([impl = pImpl.get()](const thread::PoolEvent& event) {
            if (event.type == thread::PoolEventType::WorkerReplaced) {
                impl->emit({CoordinatorEventType::ComponentError, kPool, "",
                            "воркер " + event.detail + " заменён на " + event.workerId});
            }
        });

        for (const auto& name : {kPool, kCache, kBatch, kManager}) {
            pImpl->health.components[name] = ComponentHealth::Healthy;
        }

        if (config.enableMonitoring) {
            pImpl->healthLoop = std::thread([impl = pImpl.get()] { impl->monitoringLoop(); });
        }
    } catch (const std::exception& e) {
        pImpl->logger->error("Ошибка инициализации координатора: {}", e.what());
        throw;
    }

    pImpl->logger->info("Координатор запущен: узел {}, воркеров {}",
                        config.resourceManager.nodeId, config.workerPool.poolSize);
}

// Деструктор
Coordinator::~Coordinator() {
    try {
        shutdown(std::chrono::milliseconds(0));
    } catch (const std::exception& e) {
        pImpl->logger->error("Ошибка остановки координатора: {}", e.what());
    }
}

consensus::ResourceHandle Coordinator::createResource(const mpz_class& value, const mpz_class& frequency) {
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        ++pImpl->metrics.totalOperations;
    }
    try {
        if (value < 0 || frequency < 0) {
            throw std::invalid_argument("value и frequency должны быть неотрицательными");
        }
        auto [energy, tier] = pImpl->energyFor(value, frequency);

        // Ключевой материал генерируется для каждого ресурса заново и не кэшируется
        auto cryptoBackend = pImpl->backend;
        thread::TaskDescriptor task;
        task.kind = thread::TaskKind::GenerateKeyMaterial;
        task.payload = {{"tier", crypto::toString(tier)}, {"energy", energy.get_str()}};
        task.priority = crypto::priorityForValue(value);
        task.work = [cryptoBackend, tier = tier]() -> thread::TaskResult {
            return {{"keyRef", cryptoBackend->generateKeyMaterial(tier)}};
        };
        auto result = pImpl->pool->submit(std::move(task)).get();

        std::string id;
        {
            std::lock_guard<std::mutex> lock(pImpl->mutex);
            id = "res-" + pImpl->config.resourceManager.nodeId + "-" + std::to_string(pImpl->nextResourceId++);
        }
        auto handle = pImpl->manager->registerResource(id, value, frequency, tier,
                                                       result.at("keyRef").get<std::string>());
        {
            std::lock_guard<std::mutex> lock(pImpl->mutex);
            ++pImpl->metrics.resourcesCreated;
        }
        pImpl->emit({CoordinatorEventType::ResourceCreated, "", id, crypto::toString(tier)});
        return handle;
    } catch (const std::exception& e) {
        pImpl->countFailure("create", "", e);
        throw;
    }
}

crypto::Signature Coordinator::deriveSignature(const std::string& resourceId, const std::vector<uint8_t>& data) {
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        ++pImpl->metrics.totalOperations;
    }
    try {
        auto result = pImpl->signRequest(resourceId, data).get();
        auto signature = result.at("signature").get<crypto::Signature>();
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        ++pImpl->metrics.signaturesDerived;
        return signature;
    } catch (const std::exception& e) {
        pImpl->countFailure("sign", resourceId, e);
        throw;
    }
}

bool Coordinator::verifySignature(const std::string& resourceId, const crypto::Signature& signature,
                                  const std::vector<uint8_t>& data) {
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        ++pImpl->metrics.totalOperations;
    }
    try {
        auto result = pImpl->verifyRequest(resourceId, signature, data).get();
        bool valid = result.at("valid").get<bool>();
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        ++pImpl->metrics.signaturesVerified;
        return valid;
    } catch (const std::exception& e) {
        pImpl->countFailure("verify", resourceId, e);
        throw;
    }
}

consensus::AdaptationOutcome Coordinator::proposeAdaptation(const std::string& resourceId,
                                                            const mpz_class& newValue,
                                                            const mpz_class& newFrequency) {
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        ++pImpl->metrics.totalOperations;
        ++pImpl->metrics.adaptationsProposed;
    }
    try {
        auto outcome = pImpl->manager->evaluateAdaptation(resourceId, newValue, newFrequency).get();
        if (outcome.adapted) {
            pImpl->emit({CoordinatorEventType::ResourceAdapted, "", resourceId,
                         outcome.newTier ? crypto::toString(*outcome.newTier) : ""});
        }
        return outcome;
    } catch (const std::exception& e) {
        pImpl->countFailure("adapt", resourceId, e);
        throw;
    }
}

std::vector<OperationResult> Coordinator::processBatch(const std::vector<Operation>& operations) {
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        ++pImpl->metrics.batchesProcessed;
    }
    pImpl->emit({CoordinatorEventType::BatchStarted, "", "", std::to_string(operations.size())});

    // Подпись и проверка идут через пакетный сервис без ожидания, остальное в отдельных потоках
    std::vector<std::future<nlohmann::json>> pending;
    pending.reserve(operations.size());
    for (const auto& op : operations) {
        try {
            pending.push_back(std::visit(overloaded{
                [this](const CreateOp& o) {
                    return std::async(std::launch::async, [this, o] {
                        return createResource(o.value, o.frequency).toJson();
                    });
                },
                [this](const SignOp& o) {
                    {
                        std::lock_guard<std::mutex> lock(pImpl->mutex);
                        ++pImpl->metrics.totalOperations;
                    }
                    auto handle = pImpl->signRequest(o.resourceId, o.data);
                    return std::async(std::launch::deferred, [this, handle, resourceId = o.resourceId] {
                        nlohmann::json signature;
                        try {
                            signature = handle.get().at("signature");
                        } catch (const std::exception& e) {
                            pImpl->countFailure("sign", resourceId, e);
                            throw;
                        }
                        std::lock_guard<std::mutex> lock(pImpl->mutex);
                        ++pImpl->metrics.signaturesDerived;
                        return nlohmann::json{{"signature", signature}};
                    });
                },
                [this](const VerifyOp& o) {
                    {
                        std::lock_guard<std::mutex> lock(pImpl->mutex);
                        ++pImpl->metrics.totalOperations;
                    }
                    auto handle = pImpl->verifyRequest(o.resourceId, o.signature, o.data);
                    return std::async(std::launch::deferred, [this, handle, resourceId = o.resourceId] {
                        nlohmann::json valid;
                        try {
                            valid = handle.get().at("valid");
                        } catch (const std::exception& e) {
                            pImpl->countFailure("verify", resourceId, e);
                            throw;
                        }
                        std::lock_guard<std::mutex> lock(pImpl->mutex);
                        ++pImpl->metrics.signaturesVerified;
                        return nlohmann::json{{"valid", valid}};
                    });
                },
                [this](const AdaptOp& o) {
                    return std::async(std::launch::async, [this, o] {
                        return proposeAdaptation(o.resourceId, o.newValue, o.newFrequency).toJson();
                    });
                }
            }, op));
        } catch (const std::exception& e) {
            // Ошибка постановки (например, ресурс не найден) относится только к этой операции
            pImpl->countFailure(operationName(op), "", e);
            std::promise<nlohmann::json> failed;
            failed.set_exception(std::current_exception());
            pending.push_back(failed.get_future());
        }
    }

    std::vector<OperationResult> results;
    results.reserve(operations.size());
    size_t failures = 0;
    for (size_t i = 0; i < pending.size(); ++i) {
        OperationResult result;
        try {
            result.value = pending[i].get();
            result.ok = true;
        } catch (const std::exception& e) {
            result.error = e.what();
            ++failures;
        }
        results.push_back(std::move(result));
    }

    pImpl->logger->debug("Пакет из {} операций обработан, ошибок {}", operations.size(), failures);
    pImpl->emit({CoordinatorEventType::BatchCompleted, "", "",
                 std::to_string(results.size() - failures) + "/" + std::to_string(results.size())});
    return results;
}

bool Coordinator::vote(const std::string& proposalId, const std::string& peerId, bool approve) {
    return pImpl->manager->vote(proposalId, peerId, approve);
}

void Coordinator::addPeer(const std::string& peerId) {
    pImpl->manager->addPeer(peerId);
}

void Coordinator::removePeer(const std::string& peerId) {
    pImpl->manager->removePeer(peerId);
}

void Coordinator::migrateResource(const std::string& resourceId, const std::string& targetPeer) {
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        ++pImpl->metrics.totalOperations;
    }
    try {
        pImpl->manager->migrate(resourceId, targetPeer);
    } catch (const std::exception& e) {
        pImpl->countFailure("migrate", resourceId, e);
        throw;
    }
}

consensus::ResourceHandle Coordinator::receiveMigratedResource(const consensus::MigrationPackage& package) {
    return pImpl->manager->receiveMigratedResource(package);
}

HealthReport Coordinator::checkComponentHealth() {
    return pImpl->runHealthCheck();
}

std::vector<std::string> Coordinator::balanceLoad() {
    return pImpl->runLoadBalance();
}

GlobalHealth Coordinator::evaluateGlobalHealth(const std::map<std::string, ComponentHealth>& components) {
    size_t total = components.size();
    size_t healthy = 0;
    for (const auto& [name, health] : components) {
        if (health == ComponentHealth::Healthy) ++healthy;
    }
    if (healthy == total) return GlobalHealth::Healthy;
    if (healthy * 2 > total) return GlobalHealth::Degraded;
    return GlobalHealth::Critical;
}

// Получение метрик
CoordinatorStats Coordinator::getStats() const {
    CoordinatorStats stats;
    stats.pool = pImpl->pool->getMetrics();
    stats.cache = pImpl->tieredCache->getStats();
    stats.batch = pImpl->batchService->getStats();
    stats.resources = pImpl->manager->getStats();
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    stats.coordinator = pImpl->metrics;
    stats.coordinator.uptimeMs = std::chrono::duration_cast<std::chrono::milliseconds>(
        Clock::now() - pImpl->startedAt).count();
    stats.health = pImpl->health;
    return stats;
}

CoordinatorConfig Coordinator::getConfiguration() const {
    return pImpl->config;
}

// Корректное завершение работы
bool Coordinator::shutdown(std::chrono::milliseconds deadline) {
    {
        std::lock_guard<std::mutex> lock(pImpl->loopMutex);
        if (pImpl->shutDown) return true;
        pImpl->shutDown = true;
        pImpl->stopLoop = true;
    }
    pImpl->loopCv.notify_all();
    if (pImpl->healthLoop.joinable()) {
        pImpl->healthLoop.join();
    }

    auto until = Clock::now() + deadline;
    auto remaining = [until] {
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(until - Clock::now());
        return left.count() > 0 ? left : std::chrono::milliseconds(0);
    };

    bool batchDrained = pImpl->batchService->drain(remaining());
    pImpl->manager->shutdown();
    // Пул отменяет незавершённые задачи, и элементы пакетов завершаются до остановки сервиса
    bool poolDrained = pImpl->pool->shutdown(remaining());
    pImpl->batchService->stop();

    // Локальные уровни очищаются, общее удалённое хранилище остаётся
    for (auto tier : {cache::CacheTier::Hot, cache::CacheTier::Warm, cache::CacheTier::Cold}) {
        pImpl->tieredCache->clear(tier);
    }
    pImpl->tieredCache->stop();

    pImpl->logger->info("Координатор остановлен (batch={}, pool={})", batchDrained, poolDrained);
    return batchDrained && poolDrained;
}

void Coordinator::addListener(CoordinatorEventListener listener) {
    std::lock_guard<std::mutex> lock(pImpl->listenersMutex);
    pImpl->listeners.push_back(std::move(listener));
}

thread::WorkerPool& Coordinator::workerPool() {
    return *pImpl->pool;
}

cache::TieredCache& Coordinator::tieredCache() {
    return *pImpl->tieredCache;
}

batch::BatchService& Coordinator::batchService() {
    return *pImpl->batchService;
}

consensus::ResourceManager& Coordinator::resourceManager() {
    return *pImpl->manager;
}

} // namespace coordinator
} // namespace core
} // namespace qsynth
