#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include "core/crypto/Complexity.hpp"

namespace qsynth {
namespace core {
namespace crypto {

// Непрозрачный дескриптор ключевого материала бэкенда
using KeyRef = std::string;
using Signature = std::vector<uint8_t>;

/**
 * @brief Подключаемый криптографический бэкенд.
 * @details Вызывается только из потоков пула воркеров, поэтому реализации обязаны быть потокобезопасными.
 * Ошибки сообщаются исключениями.
 */
class ICryptoBackend {
public:
    virtual ~ICryptoBackend() = default;

    // Сгенерировать ключевой материал размером по уровню сложности
    virtual KeyRef generateKeyMaterial(ComplexityTier tier) = 0;

    virtual Signature sign(const KeyRef& key, const std::vector<uint8_t>& data) = 0;

    virtual bool verify(const KeyRef& key, const Signature& signature,
                        const std::vector<uint8_t>& data) = 0;
};

} // namespace crypto
} // namespace core
} // namespace qsynth
