#pragma once

#include <chrono>
#include <future>
#include <memory>
#include <string>
#include <variant>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/cache/tiered/TieredCache.hpp"
#include "core/common/Errors.hpp"
#include "core/crypto/CryptoBackend.hpp"
#include "core/thread/WorkerPool.hpp"

namespace qsynth {
namespace core {
namespace batch {

// Запрос подписи
struct SignRequest {
    std::string resourceId;
    crypto::KeyRef key;
    std::vector<uint8_t> data;
    int priority = 5;
};

// Запрос проверки подписи
struct VerifyRequest {
    std::string resourceId;
    crypto::KeyRef key;
    crypto::Signature signature;
    std::vector<uint8_t> data;
    int priority = 5;
};

using BatchRequest = std::variant<SignRequest, VerifyRequest>;
// sign -> {"signature": [...]}, verify -> {"valid": bool}
using BatchResult = nlohmann::json;
using BatchHandle = std::shared_future<BatchResult>;

struct BatchServiceConfig {
    size_t batchSize = 100;                         // Сброс по размеру
    std::chrono::milliseconds batchTimeout{1000};   // Сброс по таймеру от первого элемента
    std::chrono::milliseconds taskTimeout{30000};   // Таймаут задачи пула для элемента

    bool validate() const {
        if (batchSize == 0) return false;
        if (batchTimeout.count() <= 0) return false;
        if (taskTimeout.count() <= 0) return false;
        return true;
    }

    nlohmann::json toJson() const;
    static BatchServiceConfig fromJson(const nlohmann::json& j);
};

struct BatchServiceStats {
    size_t requests = 0;
    size_t signaturesCreated = 0;
    size_t signaturesVerified = 0;
    size_t cacheHits = 0;
    size_t dedupHits = 0;
    size_t batchesProcessed = 0;
    size_t itemsProcessed = 0;
    size_t failures = 0;
    size_t pending = 0;             // Ожидают сброса
    size_t inFlight = 0;            // Ключей в работе, включая ожидающие
    double averageBatchSize = 0.0;

    nlohmann::json toJson() const {
        return {
            {"requests", requests},
            {"signaturesCreated", signaturesCreated},
            {"signaturesVerified", signaturesVerified},
            {"cacheHits", cacheHits},
            {"dedupHits", dedupHits},
            {"batchesProcessed", batchesProcessed},
            {"itemsProcessed", itemsProcessed},
            {"failures", failures},
            {"pending", pending},
            {"inFlight", inFlight},
            {"averageBatchSize", averageBatchSize}
        };
    }
};

/**
 * @brief Пакетная обработка запросов подписи и проверки.
 * @details Одинаковые запросы (по ключу кэша) в пределах окна выполняются
 * один раз: повторный вызов получает тот же shared_future. Каждый элемент
 * пакета выполняется отдельной задачей пула, ошибки изолированы.
 */
class BatchService {
public:
    BatchService(const BatchServiceConfig& config,
                 thread::WorkerPool& pool,
                 cache::TieredCache& cache,
                 std::shared_ptr<crypto::ICryptoBackend> backend);
    ~BatchService();

    BatchService(const BatchService&) = delete;
    BatchService& operator=(const BatchService&) = delete;

    BatchHandle request(const BatchRequest& request);

    // Ключ кэша запроса
    static std::string cacheKeyFor(const BatchRequest& request);

    // Немедленно сбросить накопленное и дождаться пакетов в работе
    bool drain(std::chrono::milliseconds deadline);

    bool ping() const;
    // Перезапуск потока сброса
    void restart();
    // Остановка; ожидающие запросы отклоняются
    void stop();

    BatchServiceStats getStats() const;
    BatchServiceConfig getConfiguration() const;

    void setErrorListener(common::ComponentErrorListener listener);

private:
    struct Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace batch
} // namespace core
} // namespace qsynth
