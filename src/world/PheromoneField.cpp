/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "world/PheromoneField.hpp"
#include "core/Logger.hpp"
#include "utils/RandomSource.hpp"
#include "world/TerrainSurface.hpp"
#include <algorithm>
#include <boost/container/small_vector.hpp>

namespace Formicary {

namespace {

constexpr float CARDINAL_WEIGHT = 1.0f;
constexpr float DIAGONAL_WEIGHT = 0.707f;

float directionWeight(const TileOffset& offset) {
    return (offset.x != 0 && offset.y != 0) ? DIAGONAL_WEIGHT : CARDINAL_WEIGHT;
}

} // anonymous namespace

PheromoneField::PheromoneField(int32_t width, int32_t height, uint8_t colonyCapacity,
                               const PheromoneSettings& settings)
    : m_width(std::max(width, 0))
    , m_height(std::max(height, 0))
    , m_colonies(colonyCapacity)
    , m_settings(settings) {
    size_t cells = static_cast<size_t>(m_width) * static_cast<size_t>(m_height);
    m_data.assign(cells * stride(), 0.0f);
    m_buffer.assign(m_data.size(), 0.0f);
    PHEROMONE_DEBUG("Field " + std::to_string(m_width) + "x" + std::to_string(m_height) +
                    " for " + std::to_string(m_colonies) + " colonies");
}

bool PheromoneField::index(int32_t x, int32_t y, uint8_t colony, PheromoneType type,
                           size_t& out) const {
    if (x < 0 || y < 0 || x >= m_width || y >= m_height || colony >= m_colonies) {
        return false;
    }
    size_t cell = static_cast<size_t>(y) * static_cast<size_t>(m_width) + static_cast<size_t>(x);
    out = cell * stride() + static_cast<size_t>(colony) * PHEROMONE_CHANNELS +
          static_cast<size_t>(type);
    return true;
}

float PheromoneField::get(int32_t x, int32_t y, uint8_t colony, PheromoneType type) const {
    size_t i;
    return index(x, y, colony, type, i) ? m_data[i] : 0.0f;
}

void PheromoneField::deposit(int32_t x, int32_t y, uint8_t colony, PheromoneType type, float amount) {
    size_t i;
    if (!index(x, y, colony, type, i) || !(amount > 0.0f)) {
        return;
    }
    m_data[i] = std::min(m_data[i] + amount, m_settings.maxStrength);
}

void PheromoneField::depositAdaptive(int32_t x, int32_t y, uint8_t colony, PheromoneType type, float amount) {
    size_t i;
    if (!index(x, y, colony, type, i) || !(amount > 0.0f)) {
        return;
    }
    float current = m_data[i];
    float headroom = std::max(0.0f, 1.0f - current / m_settings.maxStrength);
    m_data[i] = std::min(current + amount * headroom, m_settings.maxStrength);
}

void PheromoneField::decay() {
    const std::array<float, PHEROMONE_CHANNELS> keep{
        1.0f - m_settings.decayFood,
        1.0f - m_settings.decayHome,
        1.0f - m_settings.decayDanger
    };
    const float snap = m_settings.snapThreshold;

    for (size_t i = 0; i < m_data.size(); ++i) {
        float value = m_data[i];
        if (value == 0.0f) {
            continue;
        }
        value *= keep[i % PHEROMONE_CHANNELS];
        m_data[i] = value < snap ? 0.0f : value;
    }
}

void PheromoneField::diffuse() {
    std::fill(m_buffer.begin(), m_buffer.end(), 0.0f);

    const float rate = m_settings.diffusionRate;
    const float snap = m_settings.snapThreshold;
    const size_t slots = stride();

    for (int32_t y = 0; y < m_height; ++y) {
        for (int32_t x = 0; x < m_width; ++x) {
            size_t base = (static_cast<size_t>(y) * static_cast<size_t>(m_width) + static_cast<size_t>(x)) * slots;

            boost::container::small_vector<std::pair<size_t, float>, 8> neighbours;
            float totalWeight = 0.0f;
            for (const TileOffset& dir : PHEROMONE_DIRECTIONS) {
                int32_t nx = x + dir.x;
                int32_t ny = y + dir.y;
                if (nx < 0 || ny < 0 || nx >= m_width || ny >= m_height) {
                    continue;
                }
                float weight = directionWeight(dir);
                size_t nbase = (static_cast<size_t>(ny) * static_cast<size_t>(m_width) + static_cast<size_t>(nx)) * slots;
                neighbours.emplace_back(nbase, weight);
                totalWeight += weight;
            }

            for (size_t slot = 0; slot < slots; ++slot) {
                float value = m_data[base + slot];
                if (value < snap || neighbours.empty()) {
                    m_buffer[base + slot] += value;
                    continue;
                }

                float spread = value * rate;
                m_buffer[base + slot] += value - spread;
                for (const auto& [nbase, weight] : neighbours) {
                    m_buffer[nbase + slot] += spread * weight / totalWeight;
                }
            }
        }
    }

    const float maxStrength = m_settings.maxStrength;
    for (float& value : m_buffer) {
        if (value > maxStrength) {
            value = maxStrength;
        }
    }
    m_data.swap(m_buffer);
}

std::optional<TileOffset> PheromoneField::strongestNeighbour(int32_t x, int32_t y, uint8_t colony,
                                                             PheromoneType type) const {
    float best = get(x, y, colony, type);
    std::optional<TileOffset> bestDir;
    for (const TileOffset& dir : PHEROMONE_DIRECTIONS) {
        float strength = get(x + dir.x, y + dir.y, colony, type);
        if (strength > best) {
            best = strength;
            bestDir = dir;
        }
    }
    return bestDir;
}

std::optional<TileOffset> PheromoneField::sampleWeightedNeighbour(int32_t x, int32_t y, uint8_t colony,
                                                                  PheromoneType type,
                                                                  IRandomSource& rng) const {
    boost::container::small_vector<std::pair<TileOffset, float>, 8> candidates;
    float totalWeight = 0.0f;
    for (const TileOffset& dir : PHEROMONE_DIRECTIONS) {
        float strength = get(x + dir.x, y + dir.y, colony, type);
        if (strength > m_settings.gradientThreshold) {
            float weight = strength * strength;
            candidates.emplace_back(dir, weight);
            totalWeight += weight;
        }
    }
    if (candidates.empty()) {
        return std::nullopt;
    }

    float roll = rng.uniformFloat() * totalWeight;
    for (const auto& [dir, weight] : candidates) {
        roll -= weight;
        if (roll <= 0.0f) {
            return dir;
        }
    }
    return candidates.back().first;
}

std::optional<TileOffset> PheromoneField::followTrail(int32_t x, int32_t y, uint8_t colony,
                                                      PheromoneType type, IRandomSource& rng,
                                                      const ITerrainSurface& terrain) const {
    auto dir = sampleWeightedNeighbour(x, y, colony, type, rng);
    if (dir && terrain.isPassable(x + dir->x, y + dir->y)) {
        return dir;
    }
    return std::nullopt;
}

double PheromoneField::total(PheromoneType type) const {
    double sum = 0.0;
    for (size_t i = static_cast<size_t>(type); i < m_data.size(); i += PHEROMONE_CHANNELS) {
        sum += m_data[i];
    }
    return sum;
}

void PheromoneField::clear() {
    std::fill(m_data.begin(), m_data.end(), 0.0f);
}

} // namespace Formicary
