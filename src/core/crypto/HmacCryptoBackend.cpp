#include "core/crypto/HmacCryptoBackend.hpp"
#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/rand.h>
#include "core/common/Errors.hpp"
#include "core/common/Logging.hpp"

namespace qsynth {
namespace core {
namespace crypto {

namespace {

// Дайджест HMAC по уровню сложности
const EVP_MD* digestFor(ComplexityTier tier) {
    switch (tier) {
        case ComplexityTier::Low: return EVP_sha256();
        case ComplexityTier::Medium: return EVP_sha384();
        case ComplexityTier::High:
        case ComplexityTier::Maximum: return EVP_sha512();
    }
    return EVP_sha256();
}

} // namespace

HmacCryptoBackend::HmacCryptoBackend() {
    common::componentLogger("crypto")->debug("HmacCryptoBackend: создан");
}

HmacCryptoBackend::~HmacCryptoBackend() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& [ref, material] : keys_) {
        OPENSSL_cleanse(material.secret.data(), material.secret.size());
    }
}

KeyRef HmacCryptoBackend::generateKeyMaterial(ComplexityTier tier) {
    // Секрет HMAC: длина ключа / 32, т.е. 64..256 байт
    std::vector<uint8_t> secret(keyLengthBits(tier) / 32);
    if (RAND_bytes(secret.data(), static_cast<int>(secret.size())) != 1) {
        throw common::SynthesisError("RAND_bytes не смог сгенерировать ключевой материал");
    }

    KeyRef ref = "hmac-" + toString(tier) + "-" + std::to_string(nextKeyId_++);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        keys_[ref] = KeyMaterial{tier, std::move(secret)};
    }
    common::componentLogger("crypto")->debug("Сгенерирован ключ {} ({} бит)", ref, keyLengthBits(tier));
    return ref;
}

Signature HmacCryptoBackend::sign(const KeyRef& key, const std::vector<uint8_t>& data) {
    KeyMaterial material = lookup(key);

    Signature out(EVP_MAX_MD_SIZE);
    unsigned int outLength = 0;
    const unsigned char* result = HMAC(digestFor(material.tier),
                                       material.secret.data(), static_cast<int>(material.secret.size()),
                                       data.data(), data.size(),
                                       out.data(), &outLength);
    OPENSSL_cleanse(material.secret.data(), material.secret.size());
    if (result == nullptr) {
        throw common::SynthesisError("HMAC завершился ошибкой для ключа " + key);
    }
    out.resize(outLength);
    return out;
}

bool HmacCryptoBackend::verify(const KeyRef& key, const Signature& signature,
                               const std::vector<uint8_t>& data) {
    Signature expected = sign(key, data);
    if (expected.size() != signature.size()) {
        return false;
    }
    return CRYPTO_memcmp(expected.data(), signature.data(), expected.size()) == 0;
}

size_t HmacCryptoBackend::keyCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return keys_.size();
}

HmacCryptoBackend::KeyMaterial HmacCryptoBackend::lookup(const KeyRef& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = keys_.find(key);
    if (it == keys_.end()) {
        throw std::invalid_argument("Неизвестный ключ: " + key);
    }
    return it->second;
}

} // namespace crypto
} // namespace core
} // namespace qsynth
