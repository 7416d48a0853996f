#include "core/network/PeerTransport.hpp"
#include <algorithm>
#include <stdexcept>
#include <thread>
#include "core/common/Errors.hpp"
#include "core/common/Logging.hpp"

namespace qsynth {
namespace core {
namespace network {

std::string toString(PeerMessageType type) {
    switch (type) {
        case PeerMessageType::ReplicateResource: return "replicate-resource";
        case PeerMessageType::AdaptationProposal: return "adaptation-proposal";
        case PeerMessageType::ResourceUpdate: return "resource-update";
        case PeerMessageType::MigrateResource: return "migrate-resource";
    }
    return "unknown";
}

RetryingPeerTransport::RetryingPeerTransport(std::shared_ptr<IPeerTransport> inner,
                                             const RetryPolicy& policy)
    : inner_(std::move(inner)), policy_(policy) {
    if (!inner_) {
        throw std::invalid_argument("RetryingPeerTransport: не задан внутренний транспорт");
    }
    if (!policy_.validate()) {
        throw std::invalid_argument("Некорректная политика повторов");
    }
}

PeerAck RetryingPeerTransport::send(const std::string& peerId, const PeerMessage& message,
                                    std::chrono::milliseconds timeout) {
    auto logger = common::componentLogger("transport");
    auto backoff = policy_.initialBackoff;

    for (size_t attempt = 1;; ++attempt) {
        try {
            return inner_->send(peerId, message, timeout);
        } catch (const common::PeerSendError& e) {
            if (attempt >= policy_.maxAttempts) {
                logger->error("Отправка {} пиру {} не удалась после {} попыток: {}",
                              toString(message.type), peerId, attempt, e.what());
                throw;
            }
            logger->warn("Попытка {} отправки {} пиру {} не удалась: {}, повтор через {} мс",
                         attempt, toString(message.type), peerId, e.what(), backoff.count());
        }

        ++retries_;
        std::this_thread::sleep_for(backoff);
        auto next = std::chrono::milliseconds(
            static_cast<long long>(backoff.count() * policy_.backoffMultiplier));
        backoff = std::min(next, policy_.maxBackoff);
    }
}

} // namespace network
} // namespace core
} // namespace qsynth
