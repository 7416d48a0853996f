#include "core/batch/BatchService.hpp"
#include <atomic>
#include <condition_variable>
#include <mutex>
#include <thread>
#include <unordered_map>
#include <spdlog/spdlog.h>
#include "core/cache/CacheKey.hpp"
#include "core/common/Logging.hpp"

namespace qsynth {
namespace core {
namespace batch {

using Clock = std::chrono::steady_clock;

namespace {

template<class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template<class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

} // namespace

nlohmann::json BatchServiceConfig::toJson() const {
    return {
        {"batchSize", batchSize},
        {"batchTimeoutMs", batchTimeout.count()},
        {"taskTimeoutMs", taskTimeout.count()}
    };
}

BatchServiceConfig BatchServiceConfig::fromJson(const nlohmann::json& j) {
    BatchServiceConfig config;
    config.batchSize = j.value("batchSize", config.batchSize);
    config.batchTimeout = std::chrono::milliseconds(j.value("batchTimeoutMs", config.batchTimeout.count()));
    config.taskTimeout = std::chrono::milliseconds(j.value("taskTimeoutMs", config.taskTimeout.count()));
    return config;
}

std::string BatchService::cacheKeyFor(const BatchRequest& request) {
    return std::visit(overloaded{
        [](const SignRequest& r) {
            return cache::deriveCacheKey("sign", {
                {"resourceId", r.resourceId},
                {"key", r.key},
                {"data", cache::toHex(r.data)}
            });
        },
        [](const VerifyRequest& r) {
            return cache::deriveCacheKey("verify", {
                {"resourceId", r.resourceId},
                {"key", r.key},
                {"signature", cache::toHex(r.signature)},
                {"data", cache::toHex(r.data)}
            });
        }
    }, request);
}

// Реализация PIMPL
struct BatchService::Impl {
    struct PendingItem {
        std::string key;
        BatchRequest request;
        std::shared_ptr<std::promise<BatchResult>> promise;
    };

    BatchServiceConfig config;
    thread::WorkerPool& pool;
    cache::TieredCache& tieredCache;
    std::shared_ptr<crypto::ICryptoBackend> backend;
    std::shared_ptr<spdlog::logger> logger;

    mutable std::mutex mutex;
    std::condition_variable flushCv;
    std::condition_variable drainCv;
    std::vector<PendingItem> pendingBatch;
    std::unordered_map<std::string, BatchHandle> inFlight; // ожидающие и выполняемые ключи
    Clock::time_point firstPendingAt;
    bool flushRequested = false;
    bool stopping = false;
    bool stopped = false;
    size_t outstandingItems = 0; // отправлены в пул, промис ещё не выполнен
    BatchServiceStats stats;

    std::thread flusher;
    std::atomic<bool> flusherRunning{false};

    std::mutex listenerMutex;
    common::ComponentErrorListener errorListener;

    Impl(const BatchServiceConfig& cfg, thread::WorkerPool& p, cache::TieredCache& c,
         std::shared_ptr<crypto::ICryptoBackend> b)
        : config(cfg), pool(p), tieredCache(c), backend(std::move(b)) {
        logger = common::componentLogger("batchservice");
    }

    void startFlusher() {
        {
            std::lock_guard<std::mutex> lock(mutex);
            stopping = false;
        }
        flusherRunning = true;
        flusher = std::thread([this] { flusherLoop(); });
    }

    void stopFlusher() {
        {
            std::lock_guard<std::mutex> lock(mutex);
            stopping = true;
        }
        flushCv.notify_all();
        if (flusher.joinable()) {
            flusher.join();
        }
    }

    void reportError(const std::string& message) {
        common::ComponentErrorListener listener;
        {
            std::lock_guard<std::mutex> lock(listenerMutex);
            listener = errorListener;
        }
        if (listener) {
            listener("batch", message);
        }
    }

    thread::TaskDescriptor makeTask(const BatchRequest& request) {
        auto cryptoBackend = backend;
        thread::TaskDescriptor task;
        task.timeout = config.taskTimeout;
        std::visit(overloaded{
            [&](const SignRequest& r) {
                task.kind = thread::TaskKind::Sign;
                task.priority = r.priority;
                task.payload = {{"resourceId", r.resourceId}, {"bytes", r.data.size()}};
                task.work = [cryptoBackend, r]() -> thread::TaskResult {
                    return {{"signature", cryptoBackend->sign(r.key, r.data)}};
                };
            },
            [&](const VerifyRequest& r) {
                task.kind = thread::TaskKind::Verify;
                task.priority = r.priority;
                task.payload = {{"resourceId", r.resourceId}, {"bytes", r.data.size()}};
                task.work = [cryptoBackend, r]() -> thread::TaskResult {
                    return {{"valid", cryptoBackend->verify(r.key, r.signature, r.data)}};
                };
            }
        }, request);
        return task;
    }

    // Завершение элемента: кэширование результата, снятие ключа из inFlight, промис вызывающего
    void completeItem(const PendingItem& item, const BatchResult& result, std::exception_ptr error) {
        bool isSign = std::holds_alternative<SignRequest>(item.request);
        if (!error) {
            try {
                tieredCache.set(item.key, result,
                                isSign ? cache::CacheCategory::Signature : cache::CacheCategory::Verification);
            } catch (const std::exception& e) {
                logger->warn("Результат {} не закэширован: {}", item.key, e.what());
                error = std::current_exception();
            }
        } else {
            logger->warn("Элемент пакета {} завершился ошибкой", item.key);
        }

        {
            std::lock_guard<std::mutex> lock(mutex);
            inFlight.erase(item.key);
            ++stats.itemsProcessed;
            if (error) {
                ++stats.failures;
            } else if (isSign) {
                ++stats.signaturesCreated;
            } else {
                ++stats.signaturesVerified;
            }
            --outstandingItems;
        }
        drainCv.notify_all();
        if (error) {
            item.promise->set_exception(error);
        } else {
            item.promise->set_value(result);
        }
    }

    // Сброс одного пакета: разбиение по видам и отправка в пул без ожидания результатов
    void processBatch(std::vector<PendingItem> items) {
        std::vector<PendingItem> signs;
        std::vector<PendingItem> verifies;
        for (auto& item : items) {
            bool isSign = std::visit(overloaded{
                [](const SignRequest&) { return true; },
                [](const VerifyRequest&) { return false; }
            }, item.request);
            (isSign ? signs : verifies).push_back(std::move(item));
        }
        logger->debug("Сброс пакета: подписей {}, проверок {}", signs.size(), verifies.size());

        for (auto* group : {&signs, &verifies}) {
            for (auto& item : *group) {
                auto task = makeTask(item.request);
                task.onSettled = [this, item](const thread::TaskResult& result, std::exception_ptr error) {
                    completeItem(item, result, error);
                };
                {
                    std::lock_guard<std::mutex> lock(mutex);
                    ++outstandingItems;
                }
                try {
                    // Хэндл не нужен: элемент завершается через onSettled
                    pool.submit(std::move(task));
                } catch (const std::exception& e) {
                    logger->warn("Элемент {} не поставлен в пул: {}", item.key, e.what());
                    completeItem(item, BatchResult(), std::current_exception());
                }
            }
        }
    }

    void flusherLoop() {
        std::unique_lock<std::mutex> lock(mutex);
        while (true) {
            if (pendingBatch.empty()) {
                flushCv.wait(lock, [this] { return stopping || !pendingBatch.empty(); });
            } else {
                flushCv.wait_until(lock, firstPendingAt + config.batchTimeout, [this] {
                    return stopping || flushRequested || pendingBatch.size() >= config.batchSize;
                });
            }
            if (stopping) break;
            if (pendingBatch.empty()) {
                flushRequested = false;
                continue;
            }
            bool due = flushRequested || pendingBatch.size() >= config.batchSize ||
                       Clock::now() >= firstPendingAt + config.batchTimeout;
            if (!due) continue;

            std::vector<PendingItem> items;
            items.swap(pendingBatch);
            flushRequested = false;
            ++stats.batchesProcessed;
            stats.averageBatchSize += (static_cast<double>(items.size()) - stats.averageBatchSize) /
                                      static_cast<double>(stats.batchesProcessed);
            lock.unlock();

            try {
                processBatch(std::move(items));
            } catch (const std::exception& e) {
                logger->error("Ошибка обработки пакета: {}", e.what());
                reportError(e.what());
            }

            lock.lock();
            drainCv.notify_all();
        }
        flusherRunning = false;
        drainCv.notify_all();
    }
};

// Конструктор
BatchService::BatchService(const BatchServiceConfig& config,
                           thread::WorkerPool& pool,
                           cache::TieredCache& cache,
                           std::shared_ptr<crypto::ICryptoBackend> backend)
    : pImpl(std::make_unique<Impl>(config, pool, cache, std::move(backend))) {
    if (!config.validate()) {
        throw std::invalid_argument("Некорректная конфигурация пакетного сервиса");
    }
    if (!pImpl->backend) {
        throw std::invalid_argument("BatchService: не задан криптографический бэкенд");
    }
    pImpl->startFlusher();
    pImpl->logger->debug("BatchService: batchSize={}, batchTimeout={} мс",
                         config.batchSize, config.batchTimeout.count());
}

// Деструктор
BatchService::~BatchService() {
    try {
        stop();
    } catch (const std::exception& e) {
        pImpl->logger->error("Ошибка остановки пакетного сервиса: {}", e.what());
    }
}

BatchHandle BatchService::request(const BatchRequest& request) {
    std::string key = cacheKeyFor(request);

    std::lock_guard<std::mutex> lock(pImpl->mutex);
    if (pImpl->stopped) {
        throw common::SynthesisError("Пакетный сервис остановлен");
    }
    ++pImpl->stats.requests;

    // Кэш проверяется под мьютексом сервиса: результат кэшируется до снятия ключа из inFlight
    auto cached = pImpl->tieredCache.get(key);
    if (cached) {
        ++pImpl->stats.cacheHits;
        std::promise<BatchResult> ready;
        ready.set_value(*cached);
        return ready.get_future().share();
    }

    auto existing = pImpl->inFlight.find(key);
    if (existing != pImpl->inFlight.end()) {
        ++pImpl->stats.dedupHits;
        pImpl->logger->debug("Запрос {} присоединён к выполняемому", key);
        return existing->second;
    }

    auto promise = std::make_shared<std::promise<BatchResult>>();
    BatchHandle handle = promise->get_future().share();
    if (pImpl->pendingBatch.empty()) {
        pImpl->firstPendingAt = Clock::now();
    }
    pImpl->pendingBatch.push_back(Impl::PendingItem{key, request, promise});
    pImpl->inFlight.emplace(key, handle);
    pImpl->flushCv.notify_one();
    return handle;
}

bool BatchService::drain(std::chrono::milliseconds deadline) {
    std::unique_lock<std::mutex> lock(pImpl->mutex);
    if (!pImpl->pendingBatch.empty()) {
        pImpl->flushRequested = true;
        pImpl->flushCv.notify_one();
    }
    bool drained = pImpl->drainCv.wait_for(lock, deadline, [this] {
        return (pImpl->pendingBatch.empty() && pImpl->outstandingItems == 0) || !pImpl->flusherRunning;
    });
    drained = drained && pImpl->pendingBatch.empty() && pImpl->outstandingItems == 0;
    pImpl->logger->debug("Дренаж пакетного сервиса: {}", drained ? "завершён" : "не успел");
    return drained;
}

bool BatchService::ping() const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    return !pImpl->stopped && pImpl->flusherRunning;
}

void BatchService::restart() {
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        if (pImpl->stopped) {
            throw common::SynthesisError("Пакетный сервис остановлен");
        }
    }
    pImpl->stopFlusher();
    pImpl->startFlusher();
    pImpl->logger->info("Поток сброса пакетов перезапущен");
}

void BatchService::stop() {
    std::vector<Impl::PendingItem> leftovers;
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        if (pImpl->stopped) return;
        pImpl->stopped = true;
    }
    pImpl->stopFlusher();
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        leftovers.swap(pImpl->pendingBatch);
        for (const auto& item : leftovers) {
            pImpl->inFlight.erase(item.key);
        }
    }
    for (auto& item : leftovers) {
        item.promise->set_exception(std::make_exception_ptr(
            common::SynthesisError("Пакетный сервис остановлен до обработки запроса")));
    }
    if (!leftovers.empty()) {
        pImpl->logger->warn("Отклонено необработанных запросов: {}", leftovers.size());
    }

    // onSettled ссылается на сервис; пул выполняет каждый промис не позже таймаута задачи
    std::unique_lock<std::mutex> lock(pImpl->mutex);
    pImpl->drainCv.wait(lock, [this] { return pImpl->outstandingItems == 0; });
}

// Получение метрик
BatchServiceStats BatchService::getStats() const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    BatchServiceStats stats = pImpl->stats;
    stats.pending = pImpl->pendingBatch.size();
    stats.inFlight = pImpl->inFlight.size();
    return stats;
}

BatchServiceConfig BatchService::getConfiguration() const {
    return pImpl->config;
}

void BatchService::setErrorListener(common::ComponentErrorListener listener) {
    std::lock_guard<std::mutex> lock(pImpl->listenerMutex);
    pImpl->errorListener = std::move(listener);
}

} // namespace batch
} // namespace core
} // namespace qsynth
