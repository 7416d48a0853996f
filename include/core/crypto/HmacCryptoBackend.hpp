#pragma once

#include <atomic>
#include <mutex>
#include <unordered_map>
#include "core/crypto/CryptoBackend.hpp"

namespace qsynth {
namespace core {
namespace crypto {

// HmacCryptoBackend: эталонный бэкенд на OpenSSL HMAC для демо и интеграционных тестов.
// Ключи хранятся в памяти процесса, KeyRef служит идентификатором ключа в хранилище.
class HmacCryptoBackend : public ICryptoBackend {
public:
    HmacCryptoBackend();
    ~HmacCryptoBackend() override;

    KeyRef generateKeyMaterial(ComplexityTier tier) override;
    Signature sign(const KeyRef& key, const std::vector<uint8_t>& data) override;
    bool verify(const KeyRef& key, const Signature& signature,
                const std::vector<uint8_t>& data) override;

    size_t keyCount() const;

private:
    struct KeyMaterial {
        ComplexityTier tier;
        std::vector<uint8_t> secret;
    };

    KeyMaterial lookup(const KeyRef& key) const;

    std::unordered_map<KeyRef, KeyMaterial> keys_;
    std::atomic<uint64_t> nextKeyId_{1};
    mutable std::mutex mutex_;
};

} // namespace crypto
} // namespace core
} // namespace qsynth
