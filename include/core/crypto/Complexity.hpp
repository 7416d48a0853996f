#pragma once

#include <cstddef>
#include <string>
#include <gmpxx.h>

namespace qsynth {
namespace core {
namespace crypto {

// Уровень криптографической сложности ресурса
enum class ComplexityTier {
    Low,
    Medium,
    High,
    Maximum
};

// Пороги энергии для выбора уровня сложности (в единицах energy / scale)
struct ComplexityThresholds {
    static constexpr unsigned long scale = 1000;
    static constexpr unsigned long low = 100;
    static constexpr unsigned long medium = 1000;
    static constexpr unsigned long high = 10000;
};

// Энергия ресурса: точное произведение value * frequency
mpz_class computeEnergy(const mpz_class& value, const mpz_class& frequency);

// Уровень сложности по энергии: пороги сравниваются с energy / 1000 без округления
ComplexityTier tierForEnergy(const mpz_class& energy);

// Длина ключа в битах для уровня сложности
size_t keyLengthBits(ComplexityTier tier);

// Приоритет задачи по экономическому весу ресурса
int priorityForValue(const mpz_class& value);

/**
 * @brief Относительное изменение энергии больше порога?
 * @details Сравнение выполняется точно, в базисных пунктах: |after - before| * 10000 > before * bp.
 * Нулевая энергия "до" считается бесконечным изменением, если энергия "после" ненулевая.
 */
bool energyChangeExceeds(const mpz_class& before, const mpz_class& after, double threshold);

// Относительное изменение энергии (для метрик и логов, приближённо)
double relativeEnergyChange(const mpz_class& before, const mpz_class& after);

std::string toString(ComplexityTier tier);
ComplexityTier tierFromString(const std::string& name);

} // namespace crypto
} // namespace core
} // namespace qsynth
