#include "core/crypto/Complexity.hpp"
#include <cmath>
#include <limits>
#include <stdexcept>

namespace qsynth {
namespace core {
namespace crypto {

mpz_class computeEnergy(const mpz_class& value, const mpz_class& frequency) {
    return value * frequency;
}

ComplexityTier tierForEnergy(const mpz_class& energy) {
    // energy / scale < t  <=>  energy < t * scale
    const mpz_class scale(ComplexityThresholds::scale);
    if (energy < scale * ComplexityThresholds::low) return ComplexityTier::Low;
    if (energy < scale * ComplexityThresholds::medium) return ComplexityTier::Medium;
    if (energy < scale * ComplexityThresholds::high) return ComplexityTier::High;
    return ComplexityTier::Maximum;
}

size_t keyLengthBits(ComplexityTier tier) {
    switch (tier) {
        case ComplexityTier::Low: return 2048;
        case ComplexityTier::Medium: return 3072;
        case ComplexityTier::High: return 4096;
        case ComplexityTier::Maximum: return 8192;
    }
    return 2048;
}

int priorityForValue(const mpz_class& value) {
    if (value > 10000) return 10;
    if (value > 1000) return 7;
    if (value > 100) return 5;
    return 3;
}

bool energyChangeExceeds(const mpz_class& before, const mpz_class& after, double threshold) {
    if (threshold < 0.0) {
        throw std::invalid_argument("Порог изменения энергии не может быть отрицательным");
    }
    mpz_class delta = after - before;
    delta = abs(delta);
    if (before == 0) {
        return delta != 0;
    }
    mpz_class basisPoints = static_cast<unsigned long>(std::llround(threshold * 10000.0));
    return delta * 10000 > abs(before) * basisPoints;
}

double relativeEnergyChange(const mpz_class& before, const mpz_class& after) {
    if (before == 0) {
        return after == 0 ? 0.0 : std::numeric_limits<double>::infinity();
    }
    mpz_class diff = after - before;
    mpf_class delta(diff, 128);
    mpf_class base(before, 128);
    mpf_class ratio = abs(delta) / abs(base);
    return ratio.get_d();
}

std::string toString(ComplexityTier tier) {
    switch (tier) {
        case ComplexityTier::Low: return "low";
        case ComplexityTier::Medium: return "medium";
        case ComplexityTier::High: return "high";
        case ComplexityTier::Maximum: return "maximum";
    }
    return "low";
}

ComplexityTier tierFromString(const std::string& name) {
    if (name == "low") return ComplexityTier::Low;
    if (name == "medium") return ComplexityTier::Medium;
    if (name == "high") return ComplexityTier::High;
    if (name == "maximum") return ComplexityTier::Maximum;
    throw std::invalid_argument("Неизвестный уровень сложности: " + name);
}

} // namespace crypto
} // namespace core
} // namespace qsynth
