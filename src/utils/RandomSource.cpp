/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "utils/RandomSource.hpp"

namespace Formicary {

MersenneRandomSource::MersenneRandomSource()
    : m_engine(std::random_device{}()) {}

MersenneRandomSource::MersenneRandomSource(uint32_t seed)
    : m_engine(seed) {}

int32_t MersenneRandomSource::uniformInt(int32_t minValue, int32_t maxValue) {
    if (maxValue <= minValue) {
        return minValue;
    }
    std::uniform_int_distribution<int32_t> dist(minValue, maxValue);
    return dist(m_engine);
}

float MersenneRandomSource::uniformFloat() {
    std::uniform_real_distribution<float> dist(0.0f, 1.0f);
    float value = dist(m_engine);
    // uniform_real_distribution<float> can round up to 1.0f
    return value < 1.0f ? value : 0.0f;
}

} // namespace Formicary
