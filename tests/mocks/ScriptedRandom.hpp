/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef SCRIPTED_RANDOM_HPP
#define SCRIPTED_RANDOM_HPP

#include "utils/RandomSource.hpp"
#include <algorithm>
#include <deque>
#include <initializer_list>
#include <limits>

/**
 * @brief Random source that replays queued values
 *
 * Queued integers are clamped into the requested range. Once the queue is
 * empty the fallback is used, which defaults to the top of the range: every
 * "roll < chance" check fails, so nothing happens by chance unless a test
 * asks for it.
 */
class ScriptedRandom : public Formicary::IRandomSource {
public:
    int32_t uniformInt(int32_t minValue, int32_t maxValue) override {
        ++m_intDraws;
        int32_t value = m_fallbackInt;
        if (!m_ints.empty()) {
            value = m_ints.front();
            m_ints.pop_front();
        }
        return std::clamp(value, minValue, maxValue);
    }

    float uniformFloat() override {
        if (m_floats.empty()) {
            return m_fallbackFloat;
        }
        float value = m_floats.front();
        m_floats.pop_front();
        return value;
    }

    void queueInt(int32_t value) { m_ints.push_back(value); }
    void queueInts(std::initializer_list<int32_t> values) {
        m_ints.insert(m_ints.end(), values.begin(), values.end());
    }
    void queueFloat(float value) { m_floats.push_back(value); }

    void setFallbackInt(int32_t value) { m_fallbackInt = value; }
    void setFallbackFloat(float value) { m_fallbackFloat = value; }

    size_t pendingInts() const { return m_ints.size(); }
    size_t intDraws() const { return m_intDraws; }

    void reset() {
        m_ints.clear();
        m_floats.clear();
        m_fallbackInt = std::numeric_limits<int32_t>::max();
        m_fallbackFloat = 0.999f;
        m_intDraws = 0;
    }

private:
    std::deque<int32_t> m_ints;
    std::deque<float> m_floats;
    int32_t m_fallbackInt{std::numeric_limits<int32_t>::max()};
    float m_fallbackFloat{0.999f};
    size_t m_intDraws{0};
};

#endif // SCRIPTED_RANDOM_HPP
