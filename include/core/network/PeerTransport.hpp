#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <nlohmann/json.hpp>

namespace qsynth {
namespace core {
namespace network {

// Типы сообщений между репликами
enum class PeerMessageType {
    ReplicateResource,
    AdaptationProposal,
    ResourceUpdate,
    MigrateResource
};

std::string toString(PeerMessageType type);

struct PeerMessage {
    PeerMessageType type;
    std::string senderId;       // Узел-отправитель
    std::string resourceId;
    std::string correlationId;  // id предложения или миграции
    nlohmann::json payload;

    nlohmann::json toJson() const {
        return {
            {"type", toString(type)},
            {"senderId", senderId},
            {"resourceId", resourceId},
            {"correlationId", correlationId},
            {"payload", payload}
        };
    }
};

// Подтверждение получения сообщения пиром
struct PeerAck {
    std::string peerId;
    std::string correlationId;
};

/**
 * @brief Транспорт до пиров.
 * @details send() блокирует не дольше timeout. Ошибка доставки или отсутствие
 * подтверждения сообщается исключением PeerSendError.
 */
class IPeerTransport {
public:
    virtual ~IPeerTransport() = default;
    virtual PeerAck send(const std::string& peerId, const PeerMessage& message,
                         std::chrono::milliseconds timeout) = 0;
};

struct RetryPolicy {
    size_t maxAttempts = 3;
    std::chrono::milliseconds initialBackoff{50};
    double backoffMultiplier = 2.0;
    std::chrono::milliseconds maxBackoff{1000};

    bool validate() const {
        if (maxAttempts == 0) return false;
        if (initialBackoff.count() < 0) return false;
        if (backoffMultiplier < 1.0) return false;
        return true;
    }
};

// Декоратор транспорта: повторные попытки с экспоненциальной задержкой
class RetryingPeerTransport : public IPeerTransport {
public:
    RetryingPeerTransport(std::shared_ptr<IPeerTransport> inner, const RetryPolicy& policy);

    PeerAck send(const std::string& peerId, const PeerMessage& message,
                 std::chrono::milliseconds timeout) override;

    uint64_t getRetryCount() const { return retries_; }

private:
    std::shared_ptr<IPeerTransport> inner_;
    RetryPolicy policy_;
    std::atomic<uint64_t> retries_{0};
};

} // namespace network
} // namespace core
} // namespace qsynth
