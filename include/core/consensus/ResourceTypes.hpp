#pragma once

#include <chrono>
#include <cstdint>
#include <exception>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include <gmpxx.h>
#include <nlohmann/json.hpp>
#include "core/crypto/Complexity.hpp"
#include "core/crypto/CryptoBackend.hpp"

namespace qsynth {
namespace core {
namespace consensus {

using WallClock = std::chrono::system_clock;

// Запись журнала адаптаций
struct AdaptationRecord {
    std::string proposalId;
    WallClock::time_point timestamp;
    mpz_class oldValue;
    mpz_class newValue;
    crypto::ComplexityTier oldTier = crypto::ComplexityTier::Low;
    crypto::ComplexityTier newTier = crypto::ComplexityTier::Low;
    double energyChange = 0.0;
    bool keyRotated = false;
    uint64_t version = 0;           // Версия после фиксации

    nlohmann::json toJson() const;
    static AdaptationRecord fromJson(const nlohmann::json& j);
};

/**
 * @brief Версионируемый ресурс.
 * @details consensusVersion начинается с 1 и растёт ровно на 1 при каждой
 * зафиксированной адаптации. Пока locked == true, новые предложения и
 * чтение keyMaterialRef запрещены.
 */
struct ResourceHandle {
    std::string id;
    mpz_class value;
    mpz_class frequency;
    crypto::ComplexityTier complexityTier = crypto::ComplexityTier::Low;
    crypto::KeyRef keyMaterialRef;
    std::vector<AdaptationRecord> adaptationHistory;
    std::set<std::string> replicaSet;   // Включает локальный узел
    uint64_t consensusVersion = 1;
    bool locked = false;
    WallClock::time_point lastAdaptation;

    nlohmann::json toJson() const;
    static ResourceHandle fromJson(const nlohmann::json& j);
};

struct ProposalMetrics {
    mpz_class energyBefore;
    mpz_class energyAfter;
    double relativeChange = 0.0;
};

// Предложение адаптации ресурса
struct Proposal {
    std::string id;
    std::string resourceId;
    std::string proposerId;
    mpz_class newValue;
    mpz_class newFrequency;
    ProposalMetrics metrics;
    std::map<std::string, bool> votes;  // peerId -> одобрение
    size_t requiredVotes = 1;
    std::chrono::steady_clock::time_point createdAt;
    std::chrono::steady_clock::time_point expiry;

    size_t approvals() const;
    nlohmann::json toJson() const;
};

// Требуемое число голосов: ceil(n * (ratio - 0.005)), в пределах [1, n]
size_t requiredVotesFor(size_t replicaCount, double quorumRatio);

enum class AdaptationStatus {
    Committed,
    NotRequired,
    Locked,
    Rejected,
    TimedOut,
    Failed
};

std::string toString(AdaptationStatus status);

struct AdaptationOutcome {
    bool adapted = false;
    AdaptationStatus status = AdaptationStatus::NotRequired;
    std::string reason;
    std::optional<crypto::ComplexityTier> newTier;
    std::optional<uint64_t> newVersion;
    std::string proposalId;
    std::exception_ptr error;       // ConsensusRejectedError / ConsensusTimeoutError / ошибка генерации ключа

    nlohmann::json toJson() const;
};

// Пакет миграции ресурса на другой узел
struct MigrationPackage {
    ResourceHandle resource;
    std::string sourceNodeId;
    std::string targetNodeId;
    std::string migrationId;
    WallClock::time_point timestamp;

    nlohmann::json toJson() const;
    static MigrationPackage fromJson(const nlohmann::json& j);
};

// Сводка по ресурсу
struct ResourceStats {
    std::string id;
    std::string currentValue;
    size_t adaptationCount = 0;
    int64_t lastAdaptationMs = 0;
    crypto::ComplexityTier currentTier = crypto::ComplexityTier::Low;
    std::vector<std::string> replicas;
    uint64_t consensusVersion = 1;
    bool locked = false;

    nlohmann::json toJson() const;
};

} // namespace consensus
} // namespace core
} // namespace qsynth
