/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef PHEROMONE_FIELD_HPP
#define PHEROMONE_FIELD_HPP

#include "core/SimConfig.hpp"
#include "utils/TileCoord.hpp"
#include <array>
#include <cstdint>
#include <optional>
#include <vector>

namespace Formicary {

class IRandomSource;
class ITerrainSurface;

enum class PheromoneType : uint8_t {
    Food = 0,
    Home = 1,
    Danger = 2
};

inline constexpr size_t PHEROMONE_CHANNELS = 3;

/// Neighbour scan order shared by every gradient query
inline constexpr std::array<TileOffset, 8> PHEROMONE_DIRECTIONS{{
    {0, -1}, {0, 1}, {-1, 0}, {1, 0},
    {-1, -1}, {1, -1}, {-1, 1}, {1, 1}
}};

/**
 * @brief Per-tile, per-colony, per-channel scent intensities
 *
 * Layout is ((y * width + x) * colonies + colony) * 3 + channel. Reads
 * outside the grid, or for a colony beyond capacity, return 0; writes there
 * are ignored. Every stored value stays within [0, maxStrength].
 *
 * Per tick the orchestrator runs decay(), diffuse() and then deposits.
 */
class PheromoneField {
public:
    PheromoneField(int32_t width, int32_t height, uint8_t colonyCapacity,
                   const PheromoneSettings& settings);

    [[nodiscard]] float get(int32_t x, int32_t y, uint8_t colony, PheromoneType type) const;

    /// Clamped add
    void deposit(int32_t x, int32_t y, uint8_t colony, PheromoneType type, float amount);

    /// Adds amount * (1 - current / max), so a hot cell only creeps towards max
    void depositAdaptive(int32_t x, int32_t y, uint8_t colony, PheromoneType type, float amount);

    /// Multiplies each channel by (1 - its decay rate), zeroing values below the snap threshold
    void decay();

    /**
     * @brief Spreads a fraction of every cell to its 8 neighbours
     *
     * Reads only the pre-pass state and writes into the back buffer, then
     * swaps. Cardinal neighbours weigh 1, diagonals 0.707, normalised over the
     * neighbours inside the grid so edge cells do not leak.
     */
    void diffuse();

    /**
     * @brief Strongest neighbour if it beats the current cell
     * @return Offset to step, or nullopt when no neighbour is strictly stronger
     */
    [[nodiscard]] std::optional<TileOffset> strongestNeighbour(int32_t x, int32_t y, uint8_t colony,
                                                               PheromoneType type) const;

    /**
     * @brief Neighbour picked with probability proportional to strength squared
     *
     * Only neighbours above the gradient threshold are candidates. If float
     * rounding leaves weight unconsumed the last candidate is taken.
     */
    [[nodiscard]] std::optional<TileOffset> sampleWeightedNeighbour(int32_t x, int32_t y, uint8_t colony,
                                                                    PheromoneType type,
                                                                    IRandomSource& rng) const;

    /// Weighted sample restricted to passable destinations
    [[nodiscard]] std::optional<TileOffset> followTrail(int32_t x, int32_t y, uint8_t colony,
                                                        PheromoneType type, IRandomSource& rng,
                                                        const ITerrainSurface& terrain) const;

    /// Sum over every cell, colony and channel of one type
    [[nodiscard]] double total(PheromoneType type) const;

    void clear();

    [[nodiscard]] int32_t width() const noexcept { return m_width; }
    [[nodiscard]] int32_t height() const noexcept { return m_height; }
    [[nodiscard]] uint8_t colonyCapacity() const noexcept { return m_colonies; }
    [[nodiscard]] float maxStrength() const noexcept { return m_settings.maxStrength; }

private:
    [[nodiscard]] bool index(int32_t x, int32_t y, uint8_t colony, PheromoneType type,
                             size_t& out) const;
    [[nodiscard]] size_t stride() const noexcept { return static_cast<size_t>(m_colonies) * PHEROMONE_CHANNELS; }

    int32_t m_width;
    int32_t m_height;
    uint8_t m_colonies;
    PheromoneSettings m_settings;
    std::vector<float> m_data;
    std::vector<float> m_buffer;
};

} // namespace Formicary

#endif // PHEROMONE_FIELD_HPP
