#include <atomic>
#include <cassert>
#include <chrono>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <future>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>
#include "core/cache/remote/MemoryRemoteStore.hpp"
#include "core/common/Errors.hpp"
#include "core/common/Logging.hpp"
#include "core/coordinator/Coordinator.hpp"
#include "core/support/TestDoubles.hpp"

using namespace qsynth::core;
using namespace std::chrono_literals;
using qsynth::test::FakeCryptoBackend;
using qsynth::test::FakePeerTransport;

namespace {

coordinator::CoordinatorConfig testConfig() {
    coordinator::CoordinatorConfig config;
    config.workerPool.poolSize = 2;
    config.batch.batchTimeout = 20ms;
    config.resourceManager.minAdaptationInterval = std::chrono::seconds(0);
    config.resourceManager.proposalTimeout = 2000ms;
    config.retry.initialBackoff = 1ms;
    config.enableMonitoring = false;
    return config;
}

// Сбор событий координатора
struct EventLog {
    std::mutex mutex;
    std::vector<coordinator::CoordinatorEvent> events;

    void attach(coordinator::Coordinator& c) {
        c.addListener([this](const coordinator::CoordinatorEvent& event) {
            std::lock_guard<std::mutex> lock(mutex);
            events.push_back(event);
        });
    }

    size_t count(coordinator::CoordinatorEventType type) {
        std::lock_guard<std::mutex> lock(mutex);
        size_t n = 0;
        for (const auto& event : events) {
            if (event.type == type) ++n;
        }
        return n;
    }
};

} // namespace

void testGlobalHealthEvaluation() {
    using coordinator::ComponentHealth;
    using coordinator::GlobalHealth;
    std::map<std::string, ComponentHealth> components{
        {"a", ComponentHealth::Healthy}, {"b", ComponentHealth::Healthy}, {"c", ComponentHealth::Healthy}};
    assert(coordinator::Coordinator::evaluateGlobalHealth(components) == GlobalHealth::Healthy);

    components["c"] = ComponentHealth::Unhealthy;
    assert(coordinator::Coordinator::evaluateGlobalHealth(components) == GlobalHealth::Degraded);

    components["b"] = ComponentHealth::Unhealthy;
    assert(coordinator::Coordinator::evaluateGlobalHealth(components) == GlobalHealth::Critical);

    // Ровно половина здоровых: критично
    components["d"] = ComponentHealth::Healthy;
    assert(coordinator::Coordinator::evaluateGlobalHealth(components) == GlobalHealth::Critical);
    std::cout << "[OK] Coordinator global health evaluation\n";
}

void testCreateSignVerify() {
    auto backend = std::make_shared<FakeCryptoBackend>();
    coordinator::Coordinator c(testConfig(), backend);
    EventLog log;
    log.attach(c);

    auto resource = c.createResource(500000, 1);
    assert(resource.id == "res-node-local-1");
    assert(resource.complexityTier == crypto::ComplexityTier::Medium);
    assert(resource.consensusVersion == 1);
    assert(log.count(coordinator::CoordinatorEventType::ResourceCreated) == 1);

    // Энергия для тех же входов берётся из кэша, ключ генерируется заново
    auto second = c.createResource(500000, 1);
    assert(second.id != resource.id);
    assert(second.keyMaterialRef != resource.keyMaterialRef);
    assert(c.tieredCache().getStats().hotHits >= 1);

    std::vector<uint8_t> data{'h', 'e', 'l', 'l', 'o'};
    auto signature = c.deriveSignature(resource.id, data);
    assert(!signature.empty());
    assert(c.verifySignature(resource.id, signature, data));
    auto tampered = signature;
    tampered[0] ^= 0x01;
    assert(!c.verifySignature(resource.id, tampered, data));

    // Повторная подпись отдаётся из кэша
    int signsBefore = backend->signs.load();
    assert(c.deriveSignature(resource.id, data) == signature);
    assert(backend->signs.load() == signsBefore);

    bool notFound = false;
    try {
        c.deriveSignature("res-missing", data);
    } catch (const common::ResourceNotFoundError&) {
        notFound = true;
    }
    assert(notFound);

    bool invalid = false;
    try {
        c.createResource(-1, 1);
    } catch (const std::invalid_argument&) {
        invalid = true;
    }
    assert(invalid);

    auto metrics = c.getStats().coordinator;
    assert(metrics.resourcesCreated == 2);
    assert(metrics.signaturesDerived == 2);
    assert(metrics.signaturesVerified == 2);
    assert(metrics.failedOperations == 2);
    assert(log.count(coordinator::CoordinatorEventType::OperationFailed) == 2);
    assert(c.shutdown(2000ms));
    std::cout << "[OK] Coordinator create/sign/verify\n";
}

void testAdaptationRotatesSignatures() {
    auto backend = std::make_shared<FakeCryptoBackend>();
    coordinator::Coordinator c(testConfig(), backend);
    auto resource = c.createResource(500000, 1);
    std::vector<uint8_t> data{1, 2, 3};
    auto before = c.deriveSignature(resource.id, data);

    auto outcome = c.proposeAdaptation(resource.id, 50000000, 1);
    assert(outcome.adapted);
    assert(*outcome.newTier == crypto::ComplexityTier::Maximum);

    // Новый ключ даёт новую запись кэша и новая подпись
    auto after = c.deriveSignature(resource.id, data);
    assert(after != before);
    assert(!c.verifySignature(resource.id, before, data));
    assert(c.verifySignature(resource.id, after, data));

    auto notRequired = c.proposeAdaptation(resource.id, 50000001, 1);
    assert(!notRequired.adapted);
    assert(notRequired.status == consensus::AdaptationStatus::NotRequired);
    assert(c.getStats().coordinator.adaptationsProposed == 2);
    std::cout << "[OK] Coordinator adaptation rotates signatures\n";
}

void testProcessBatch() {
    auto backend = std::make_shared<FakeCryptoBackend>();
    coordinator::Coordinator c(testConfig(), backend);
    EventLog log;
    log.attach(c);
    auto signing = c.createResource(500000, 1);
    auto adapting = c.createResource(200000, 1);
    std::vector<uint8_t> data{9, 8, 7};
    auto signature = c.deriveSignature(signing.id, data);
    c.tieredCache().clear();

    std::vector<coordinator::Operation> operations{
        coordinator::CreateOp{2000000, 1},
        coordinator::SignOp{signing.id, data},
        coordinator::SignOp{signing.id, data},
        coordinator::VerifyOp{signing.id, signature, data},
        coordinator::SignOp{"res-missing", data},
        coordinator::AdaptOp{adapting.id, 90000000, 1}
    };
    int signsBefore = backend->signs.load();
    auto results = c.processBatch(operations);
    assert(results.size() == operations.size());

    assert(results[0].ok);
    assert(results[0].value.at("complexityTier") == "high");
    assert(results[1].ok && results[2].ok);
    assert(results[1].value == results[2].value);
    // Одинаковые подписи в пакете выполняются один раз
    assert(backend->signs.load() == signsBefore + 1);
    assert(results[3].ok && results[3].value.at("valid").get<bool>());
    assert(!results[4].ok);
    assert(!results[4].error.empty());
    assert(results[5].ok);
    assert(results[5].value.at("status") == "committed");

    assert(coordinator::operationName(operations[3]) == "verify");
    assert(results[4].toJson().contains("error"));
    assert(log.count(coordinator::CoordinatorEventType::BatchStarted) == 1);
    assert(log.count(coordinator::CoordinatorEventType::BatchCompleted) == 1);
    assert(c.getStats().coordinator.batchesProcessed == 1);
    std::cout << "[OK] Coordinator processBatch\n";
}

void testProcessBatchCountsBackendFailures() {
    auto backend = std::make_shared<FakeCryptoBackend>();
    coordinator::Coordinator c(testConfig(), backend);
    EventLog log;
    log.attach(c);
    auto resource = c.createResource(500000, 1);
    std::vector<uint8_t> good{1, 2};
    auto signature = c.deriveSignature(resource.id, good);

    // Ресурс существует, ошибка возникает уже в бэкенде при выполнении пакета
    std::vector<uint8_t> poisoned{0xBA, 0xD0};
    backend->poison = poisoned;
    std::vector<coordinator::Operation> operations{
        coordinator::SignOp{resource.id, poisoned},
        coordinator::VerifyOp{resource.id, signature, poisoned},
        coordinator::SignOp{resource.id, good}
    };
    auto results = c.processBatch(operations);
    assert(!results[0].ok && !results[1].ok);
    assert(results[2].ok);

    auto metrics = c.getStats().coordinator;
    assert(metrics.failedOperations == 2);
    assert(log.count(coordinator::CoordinatorEventType::OperationFailed) == 2);
    std::cout << "[OK] Coordinator processBatch counts backend failures\n";
}

void testHealthCheckAndFailover() {
    auto backend = std::make_shared<FakeCryptoBackend>();
    auto remote = std::make_shared<cache::MemoryRemoteStore>();
    coordinator::Coordinator c(testConfig(), backend, nullptr, remote);
    EventLog log;
    log.attach(c);

    auto report = c.checkComponentHealth();
    assert(report.components.size() == 4);
    assert(report.global == coordinator::GlobalHealth::Healthy);

    // Недоступное удалённое хранилище делает кэш нездоровым
    remote->setAvailable(false);
    report = c.checkComponentHealth();
    assert(report.components.at("cache") == coordinator::ComponentHealth::Unhealthy);
    assert(report.global == coordinator::GlobalHealth::Degraded);
    assert(log.count(coordinator::CoordinatorEventType::ComponentError) == 1);
    assert(log.count(coordinator::CoordinatorEventType::FailoverTriggered) == 1);
    assert(log.count(coordinator::CoordinatorEventType::ComponentRestarted) == 1);
    assert(c.getStats().coordinator.failoverEvents == 1);

    remote->setAvailable(true);
    report = c.checkComponentHealth();
    assert(report.global == coordinator::GlobalHealth::Healthy);
    assert(c.getStats().health.global == coordinator::GlobalHealth::Healthy);
    assert(log.count(coordinator::CoordinatorEventType::HealthUpdate) == 3);
    std::cout << "[OK] Coordinator health check and failover\n";
}

void testLoadBalancingAutoScale() {
    auto config = testConfig();
    config.workerPool.poolSize = 1;
    config.poolQueueThreshold = 1;
    config.autoScale = true;
    config.maxPoolSize = 4;
    coordinator::Coordinator c(config, std::make_shared<FakeCryptoBackend>());

    assert(c.balanceLoad().empty());

    std::promise<void> gate;
    auto shared = gate.get_future().share();
    std::vector<thread::TaskHandle> handles;
    for (int i = 0; i < 3; ++i) {
        thread::TaskDescriptor task;
        task.work = [shared]() -> thread::TaskResult {
            shared.wait();
            return {};
        };
        handles.push_back(c.workerPool().submit(std::move(task)));
    }
    for (int i = 0; i < 200 && c.workerPool().getQueueSize() != 2; ++i) {
        std::this_thread::sleep_for(5ms);
    }
    assert(c.workerPool().getQueueSize() == 2);

    auto overloaded = c.balanceLoad();
    assert(overloaded.size() == 1 && overloaded[0] == "pool");
    assert(c.workerPool().getWorkerCount() == 2);
    assert(c.getStats().coordinator.loadBalancingEvents == 1);

    gate.set_value();
    for (auto& handle : handles) handle.get();
    std::cout << "[OK] Coordinator load balancing\n";
}

void testPeersThroughTransport() {
    auto backend = std::make_shared<FakeCryptoBackend>();
    auto transport = std::make_shared<FakePeerTransport>();
    auto config = testConfig();
    config.resourceManager.nodeId = "node-a";
    coordinator::Coordinator c(config, backend, transport);
    c.addPeer("node-b");

    // Пир одобряет каждое предложение при доставке
    transport->onDeliver([&c](const std::string& peerId, const network::PeerMessage& message) {
        if (message.type == network::PeerMessageType::AdaptationProposal) {
            c.vote(message.correlationId, peerId, true);
        }
    });
    // Первая отправка пиру теряется и повторяется транспортом координатора
    transport->failNext("node-b", 1);

    auto resource = c.createResource(500000, 1);
    assert(resource.replicaSet.size() == 2);
    assert(transport->attempts("node-b") == 2);

    auto outcome = c.proposeAdaptation(resource.id, 50000000, 1);
    assert(outcome.status == consensus::AdaptationStatus::Committed);
    assert(c.resourceManager().getResource(resource.id)->consensusVersion == 2);

    c.migrateResource(resource.id, "node-b");
    assert(!c.resourceManager().getResource(resource.id));
    assert(transport->deliveredCount(network::PeerMessageType::MigrateResource) == 1);

    c.removePeer("node-b");
    assert(c.resourceManager().getPeers().empty());
    std::cout << "[OK] Coordinator peers through transport\n";
}

void testMonitoringLoop() {
    auto config = testConfig();
    config.enableMonitoring = true;
    config.healthCheckInterval = 30ms;
    coordinator::Coordinator c(config, std::make_shared<FakeCryptoBackend>());
    std::atomic<int> updates{0};
    c.addListener([&updates](const coordinator::CoordinatorEvent& event) {
        if (event.type == coordinator::CoordinatorEventType::HealthUpdate) ++updates;
    });
    for (int i = 0; i < 100 && updates.load() < 2; ++i) {
        std::this_thread::sleep_for(10ms);
    }
    assert(updates.load() >= 2);
    assert(c.shutdown(1000ms));
    std::cout << "[OK] Coordinator monitoring loop\n";
}

void testShutdown() {
    auto remote = std::make_shared<cache::MemoryRemoteStore>();
    coordinator::Coordinator c(testConfig(), std::make_shared<FakeCryptoBackend>(), nullptr, remote);
    auto resource = c.createResource(500000, 1);
    c.deriveSignature(resource.id, {1});
    auto before = c.getStats().cache;
    assert(before.hotEntries + before.warmEntries + before.coldEntries > 0);
    size_t remoteEntries = remote->size();
    assert(remoteEntries > 0);

    assert(c.shutdown(2000ms));
    assert(c.shutdown(0ms));

    // Локальные уровни очищены, общее удалённое хранилище не тронуто
    auto after = c.getStats().cache;
    assert(after.hotEntries == 0 && after.warmEntries == 0 && after.coldEntries == 0);
    assert(remote->size() == remoteEntries);

    bool rejected = false;
    try {
        c.deriveSignature(resource.id, {1});
    } catch (const common::SynthesisError&) {
        rejected = true;
    }
    assert(rejected);

    auto json = c.getStats().toJson();
    assert(json.contains("pool") && json.contains("cache") && json.contains("batch"));
    assert(json.contains("resources") && json.contains("coordinator") && json.contains("health"));
    std::cout << "[OK] Coordinator shutdown\n";
}

void testLoggingCreatesDirectory() {
    const std::filesystem::path root = "coordinator_test_logs";
    std::filesystem::remove_all(root);
    auto directory = root / "nested";
    common::initializeLogging(directory.string(), spdlog::level::warn);
    assert(std::filesystem::is_directory(directory));
    assert(std::filesystem::exists(directory / "qsynth.log"));
    std::filesystem::remove_all(root);
    std::cout << "[OK] Logging creates log directory\n";
}

void testConfigFile() {
    const std::string path = "coordinator_test_config.json";
    {
        std::ofstream out(path);
        out << R"({
            "workerPool": {"poolSize": 3},
            "cache": {"hotCapacity": 10},
            "batch": {"batchSize": 5, "batchTimeoutMs": 50},
            "resourceManager": {"nodeId": "node-z", "quorumRatio": 0.5},
            "retry": {"enabled": false, "maxAttempts": 5},
            "enableMonitoring": false,
            "healthCheckIntervalMs": 1000
        })";
    }
    auto config = coordinator::CoordinatorConfig::loadFromFile(path);
    std::remove(path.c_str());
    assert(config.workerPool.poolSize == 3);
    assert(config.cache.hotCapacity == 10);
    assert(config.batch.batchSize == 5);
    assert(config.resourceManager.nodeId == "node-z");
    assert(config.resourceManager.quorumRatio == 0.5);
    assert(!config.enableRetries);
    assert(config.retry.maxAttempts == 5);
    assert(config.healthCheckInterval == 1000ms);

    auto roundTrip = coordinator::CoordinatorConfig::fromJson(config.toJson());
    assert(roundTrip.batch.batchTimeout == 50ms);

    bool missing = false;
    try {
        coordinator::CoordinatorConfig::loadFromFile("does_not_exist.json");
    } catch (const std::runtime_error&) {
        missing = true;
    }
    assert(missing);

    auto invalid = testConfig();
    invalid.workerPool.poolSize = 0;
    bool thrown = false;
    try {
        coordinator::Coordinator c(invalid, std::make_shared<FakeCryptoBackend>());
    } catch (const std::invalid_argument&) {
        thrown = true;
    }
    assert(thrown);
    std::cout << "[OK] Coordinator configuration file\n";
}

int main() {
    testGlobalHealthEvaluation();
    testCreateSignVerify();
    testAdaptationRotatesSignatures();
    testProcessBatch();
    testProcessBatchCountsBackendFailures();
    testHealthCheckAndFailover();
    testLoadBalancingAutoScale();
    testPeersThroughTransport();
    testMonitoringLoop();
    testShutdown();
    testConfigFile();
    testLoggingCreatesDirectory();
    std::cout << "All coordinator tests passed!\n";
    return 0;
}
