#include <cassert>
#include <chrono>
#include <future>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <vector>
#include "core/batch/BatchService.hpp"
#include "core/cache/tiered/TieredCache.hpp"
#include "core/common/Errors.hpp"
#include "core/support/TestDoubles.hpp"
#include "core/thread/WorkerPool.hpp"

using namespace qsynth::core;
using namespace std::chrono_literals;
using qsynth::test::FakeCryptoBackend;

namespace {

// Пул, кэш и сервис для одного теста
struct Fixture {
    explicit Fixture(batch::BatchServiceConfig config,
                     std::shared_ptr<FakeCryptoBackend> fake = std::make_shared<FakeCryptoBackend>())
        : backend(std::move(fake)),
          pool(poolConfig()),
          cache(cacheConfig()),
          service(config, pool, cache, backend) {}

    static thread::WorkerPoolConfig poolConfig() {
        thread::WorkerPoolConfig config;
        config.poolSize = 4;
        return config;
    }

    static cache::TieredCacheConfig cacheConfig() {
        cache::TieredCacheConfig config;
        config.enableMaintenance = false;
        return config;
    }

    std::shared_ptr<FakeCryptoBackend> backend;
    thread::WorkerPool pool;
    cache::TieredCache cache;
    batch::BatchService service;
};

batch::SignRequest signRequest(const std::string& resourceId, std::vector<uint8_t> data,
                               const std::string& key = "key-1") {
    batch::SignRequest request;
    request.resourceId = resourceId;
    request.key = key;
    request.data = std::move(data);
    return request;
}

batch::BatchServiceConfig timerConfig(std::chrono::milliseconds timeout, size_t size = 100) {
    batch::BatchServiceConfig config;
    config.batchTimeout = timeout;
    config.batchSize = size;
    return config;
}

bool ready(const batch::BatchHandle& handle, std::chrono::milliseconds wait) {
    return handle.wait_for(wait) == std::future_status::ready;
}

} // namespace

void testDeduplicationAndCache() {
    auto backend = std::make_shared<FakeCryptoBackend>();
    backend->operationDelay = 50ms;
    Fixture f(timerConfig(30ms), backend);

    auto first = f.service.request(signRequest("res-1", {1, 2, 3}));
    auto second = f.service.request(signRequest("res-1", {1, 2, 3}));
    auto signature = first.get().at("signature").get<crypto::Signature>();
    assert(second.get().at("signature").get<crypto::Signature>() == signature);
    assert(backend->signs.load() == 1);

    // Повтор после завершения отдаётся из кэша
    auto third = f.service.request(signRequest("res-1", {1, 2, 3}));
    assert(ready(third, 0ms));
    assert(third.get().at("signature").get<crypto::Signature>() == signature);
    assert(backend->signs.load() == 1);

    auto stats = f.service.getStats();
    assert(stats.requests == 3);
    assert(stats.dedupHits == 1);
    assert(stats.cacheHits == 1);
    assert(stats.signaturesCreated == 1);
    assert(stats.inFlight == 0);
    std::cout << "[OK] BatchService deduplication and cache\n";
}

void testKeyIsPartOfCacheKey() {
    auto a = batch::BatchService::cacheKeyFor(signRequest("res-1", {7}, "key-a"));
    auto b = batch::BatchService::cacheKeyFor(signRequest("res-1", {7}, "key-b"));
    auto c = batch::BatchService::cacheKeyFor(signRequest("res-1", {7}, "key-a"));
    assert(a != b);
    assert(a == c);
    assert(a.rfind("sign:", 0) == 0);

    batch::VerifyRequest verify;
    verify.resourceId = "res-1";
    verify.key = "key-a";
    verify.data = {7};
    assert(batch::BatchService::cacheKeyFor(verify).rfind("verify:", 0) == 0);
    std::cout << "[OK] BatchService cache key includes key reference\n";
}

void testFlushBySize() {
    Fixture f(timerConfig(10000ms, 3));
    std::vector<batch::BatchHandle> handles;
    for (uint8_t i = 0; i < 3; ++i) {
        handles.push_back(f.service.request(signRequest("res-size", {i})));
    }
    for (auto& handle : handles) {
        assert(ready(handle, 2000ms));
    }
    auto stats = f.service.getStats();
    assert(stats.batchesProcessed == 1);
    assert(stats.itemsProcessed == 3);
    assert(stats.averageBatchSize == 3.0);
    std::cout << "[OK] BatchService flush by size\n";
}

void testFlushByTimer() {
    Fixture f(timerConfig(50ms));
    auto handle = f.service.request(signRequest("res-timer", {1}));
    assert(ready(handle, 2000ms));
    assert(f.service.getStats().batchesProcessed == 1);
    std::cout << "[OK] BatchService flush by timer\n";
}

void testFullBatchesRunConcurrently() {
    auto backend = std::make_shared<FakeCryptoBackend>();
    backend->operationDelay = 300ms;
    Fixture f(timerConfig(10000ms, 1), backend);

    auto start = std::chrono::steady_clock::now();
    auto first = f.service.request(signRequest("res-c", {1}));
    auto second = f.service.request(signRequest("res-c", {2}));
    assert(ready(first, 2000ms));
    assert(ready(second, 2000ms));
    // Второй полный пакет не ждёт первого: обе подписи за одну задержку
    assert(std::chrono::steady_clock::now() - start < 500ms);

    auto stats = f.service.getStats();
    assert(stats.batchesProcessed == 2);
    assert(stats.signaturesCreated == 2);
    assert(stats.inFlight == 0);
    std::cout << "[OK] BatchService full batches run concurrently\n";
}

void testVerifyRequests() {
    Fixture f(timerConfig(20ms));
    auto signature = f.service.request(signRequest("res-v", {5, 6})).get().at("signature").get<crypto::Signature>();

    batch::VerifyRequest good;
    good.resourceId = "res-v";
    good.key = "key-1";
    good.signature = signature;
    good.data = {5, 6};

    auto bad = good;
    bad.signature.back() ^= 0x01;

    auto goodHandle = f.service.request(good);
    auto badHandle = f.service.request(bad);
    assert(goodHandle.get().at("valid").get<bool>());
    assert(!badHandle.get().at("valid").get<bool>());
    assert(f.service.getStats().signaturesVerified == 2);
    std::cout << "[OK] BatchService verify requests\n";
}

void testFailureIsolation() {
    auto backend = std::make_shared<FakeCryptoBackend>();
    backend->poison = {0xBA, 0xD0};
    Fixture f(timerConfig(10000ms, 3), backend);

    auto ok1 = f.service.request(signRequest("res-f", {1}));
    auto broken = f.service.request(signRequest("res-f", {0xBA, 0xD0}));
    auto ok2 = f.service.request(signRequest("res-f", {2}));

    assert(ok1.get().contains("signature"));
    assert(ok2.get().contains("signature"));
    bool thrown = false;
    try {
        broken.get();
    } catch (const std::runtime_error&) {
        thrown = true;
    }
    assert(thrown);
    assert(f.service.getStats().failures == 1);

    // Ошибка не кэшируется: повторный запрос снова уходит в бэкенд
    auto retry = f.service.request(signRequest("res-f", {0xBA, 0xD0}));
    assert(f.service.drain(2000ms));
    thrown = false;
    try {
        retry.get();
    } catch (const std::runtime_error&) {
        thrown = true;
    }
    assert(thrown);
    assert(backend->signs.load() == 4);
    assert(f.service.getStats().failures == 2);
    std::cout << "[OK] BatchService failure isolation\n";
}

void testDrainAndStop() {
    Fixture f(timerConfig(10000ms));
    auto a = f.service.request(signRequest("res-d", {1}));
    auto b = f.service.request(signRequest("res-d", {2}));
    assert(f.service.getStats().pending == 2);

    assert(f.service.drain(2000ms));
    assert(ready(a, 0ms) && ready(b, 0ms));

    auto leftover = f.service.request(signRequest("res-d", {3}));
    f.service.stop();
    bool rejected = false;
    try {
        leftover.get();
    } catch (const common::SynthesisError&) {
        rejected = true;
    }
    assert(rejected);
    assert(!f.service.ping());

    rejected = false;
    try {
        f.service.request(signRequest("res-d", {4}));
    } catch (const common::SynthesisError&) {
        rejected = true;
    }
    assert(rejected);
    std::cout << "[OK] BatchService drain and stop\n";
}

void testRestartFlusher() {
    Fixture f(timerConfig(20ms));
    assert(f.service.ping());
    f.service.restart();
    assert(f.service.ping());
    auto handle = f.service.request(signRequest("res-r", {1}));
    assert(ready(handle, 2000ms));
    std::cout << "[OK] BatchService restart\n";
}

int main() {
    testDeduplicationAndCache();
    testKeyIsPartOfCacheKey();
    testFlushBySize();
    testFlushByTimer();
    testFullBatchesRunConcurrently();
    testVerifyRequests();
    testFailureIsolation();
    testDrainAndStop();
    testRestartFlusher();
    std::cout << "All batch service tests passed!\n";
    return 0;
}
