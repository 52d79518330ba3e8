/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef RANDOM_SOURCE_HPP
#define RANDOM_SOURCE_HPP

#include <cstddef>
#include <cstdint>
#include <random>

namespace Formicary {

/**
 * @brief Random number source shared by every simulation system
 *
 * Systems never own a generator; they draw from the source handed to them
 * through the simulation context so tests can substitute scripted values.
 */
class IRandomSource {
public:
    virtual ~IRandomSource() = default;

    /// Uniform integer in [minValue, maxValue], both inclusive
    virtual int32_t uniformInt(int32_t minValue, int32_t maxValue) = 0;

    /// Uniform float in [0, 1)
    virtual float uniformFloat() = 0;

    /// Byte roll in [0, 255], used for all "n out of 256" chances
    uint8_t nextByte() { return static_cast<uint8_t>(uniformInt(0, 255)); }

    /// Index into a container of the given size (size must be non-zero)
    size_t pickIndex(size_t size) {
        return static_cast<size_t>(uniformInt(0, static_cast<int32_t>(size) - 1));
    }

    bool coinFlip() { return uniformInt(0, 1) == 1; }
};

/**
 * @brief Mersenne Twister backed source
 */
class MersenneRandomSource final : public IRandomSource {
public:
    /// Seeds from std::random_device
    MersenneRandomSource();
    explicit MersenneRandomSource(uint32_t seed);

    int32_t uniformInt(int32_t minValue, int32_t maxValue) override;
    float uniformFloat() override;

    void reseed(uint32_t seed) { m_engine.seed(seed); }

private:
    std::mt19937 m_engine;
};

} // namespace Formicary

#endif // RANDOM_SOURCE_HPP
