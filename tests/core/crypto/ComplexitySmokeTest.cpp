#include <cassert>
#include <cmath>
#include <iostream>
#include <stdexcept>
#include "core/consensus/ResourceTypes.hpp"
#include "core/crypto/Complexity.hpp"

using namespace qsynth::core;

void testTierBoundaries() {
    // Пороги 100/1000/10000 относятся к energy / 1000
    assert(crypto::tierForEnergy(mpz_class(0)) == crypto::ComplexityTier::Low);
    assert(crypto::tierForEnergy(mpz_class(99999)) == crypto::ComplexityTier::Low);
    assert(crypto::tierForEnergy(mpz_class(100000)) == crypto::ComplexityTier::Medium);
    assert(crypto::tierForEnergy(mpz_class(999999)) == crypto::ComplexityTier::Medium);
    assert(crypto::tierForEnergy(mpz_class(1000000)) == crypto::ComplexityTier::High);
    assert(crypto::tierForEnergy(mpz_class(9999999)) == crypto::ComplexityTier::High);
    assert(crypto::tierForEnergy(mpz_class(10000000)) == crypto::ComplexityTier::Maximum);
    assert(crypto::tierForEnergy(mpz_class("123456789012345678901234567890")) == crypto::ComplexityTier::Maximum);

    assert(crypto::keyLengthBits(crypto::ComplexityTier::Low) == 2048);
    assert(crypto::keyLengthBits(crypto::ComplexityTier::Medium) == 3072);
    assert(crypto::keyLengthBits(crypto::ComplexityTier::High) == 4096);
    assert(crypto::keyLengthBits(crypto::ComplexityTier::Maximum) == 8192);
    std::cout << "[OK] Complexity tier boundaries\n";
}

void testTierFromValueAndFrequency() {
    auto tierOf = [](long value, long frequency) {
        return crypto::tierForEnergy(crypto::computeEnergy(value, frequency));
    };
    assert(tierOf(500, 1) == crypto::ComplexityTier::Low);
    assert(tierOf(50000, 1) == crypto::ComplexityTier::Low);
    assert(tierOf(100, 1000) == crypto::ComplexityTier::Medium);
    assert(tierOf(500000, 1) == crypto::ComplexityTier::Medium);
    assert(tierOf(2000000, 1) == crypto::ComplexityTier::High);
    assert(tierOf(50000, 1000) == crypto::ComplexityTier::Maximum);
    std::cout << "[OK] Complexity tier from value and frequency\n";
}

void testEnergyIsExact() {
    mpz_class value("98765432109876543210");
    mpz_class frequency("1000000000000");
    auto energy = crypto::computeEnergy(value, frequency);
    assert(energy.get_str() == "98765432109876543210000000000000");
    std::cout << "[OK] Exact big-integer energy\n";
}

void testPriorityByValue() {
    assert(crypto::priorityForValue(mpz_class(50)) == 3);
    assert(crypto::priorityForValue(mpz_class(100)) == 3);
    assert(crypto::priorityForValue(mpz_class(101)) == 5);
    assert(crypto::priorityForValue(mpz_class(1001)) == 7);
    assert(crypto::priorityForValue(mpz_class(10001)) == 10);
    std::cout << "[OK] Priority by value\n";
}

void testEnergyChangeThreshold() {
    // Ровно 25% не превышает порог
    assert(!crypto::energyChangeExceeds(mpz_class(1000), mpz_class(1250), 0.25));
    assert(crypto::energyChangeExceeds(mpz_class(1000), mpz_class(1251), 0.25));
    assert(crypto::energyChangeExceeds(mpz_class(1000), mpz_class(749), 0.25));
    assert(!crypto::energyChangeExceeds(mpz_class(0), mpz_class(0), 0.25));
    assert(crypto::energyChangeExceeds(mpz_class(0), mpz_class(1), 0.25));

    assert(std::isinf(crypto::relativeEnergyChange(mpz_class(0), mpz_class(5))));
    assert(std::fabs(crypto::relativeEnergyChange(mpz_class(500), mpz_class(50000)) - 99.0) < 1e-9);

    bool thrown = false;
    try {
        crypto::energyChangeExceeds(mpz_class(1), mpz_class(2), -0.1);
    } catch (const std::invalid_argument&) {
        thrown = true;
    }
    assert(thrown);
    std::cout << "[OK] Energy change threshold\n";
}

void testQuorumMath() {
    assert(consensus::requiredVotesFor(1, 0.67) == 1);
    assert(consensus::requiredVotesFor(3, 0.67) == 2);
    assert(consensus::requiredVotesFor(4, 0.67) == 3);
    assert(consensus::requiredVotesFor(5, 0.67) == 4);
    assert(consensus::requiredVotesFor(3, 1.0) == 3);
    assert(consensus::requiredVotesFor(3, 0.1) == 1);
    std::cout << "[OK] Quorum math\n";
}

void testTierNames() {
    for (auto tier : {crypto::ComplexityTier::Low, crypto::ComplexityTier::Medium,
                      crypto::ComplexityTier::High, crypto::ComplexityTier::Maximum}) {
        assert(crypto::tierFromString(crypto::toString(tier)) == tier);
    }
    bool thrown = false;
    try {
        crypto::tierFromString("extreme");
    } catch (const std::invalid_argument&) {
        thrown = true;
    }
    assert(thrown);
    std::cout << "[OK] Tier names\n";
}

int main() {
    testTierBoundaries();
    testTierFromValueAndFrequency();
    testEnergyIsExact();
    testPriorityByValue();
    testEnergyChangeThreshold();
    testQuorumMath();
    testTierNames();
    std::cout << "All complexity tests passed!\n";
    return 0;
}
