/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef WATER_GRID_HPP
#define WATER_GRID_HPP

#include "core/SimConfig.hpp"
#include <cstdint>
#include <optional>
#include <ostream>
#include <vector>

namespace Formicary {

class IRandomSource;
class ITerrainSurface;

enum class FlowDirection : uint8_t {
    None = 0,
    Down,
    DownLeft,
    DownRight,
    Left,
    Right,
    Up
};

inline std::ostream& operator<<(std::ostream& os, FlowDirection dir) {
    switch (dir) {
    case FlowDirection::None: return os << "None";
    case FlowDirection::Down: return os << "Down";
    case FlowDirection::DownLeft: return os << "DownLeft";
    case FlowDirection::DownRight: return os << "DownRight";
    case FlowDirection::Left: return os << "Left";
    case FlowDirection::Right: return os << "Right";
    case FlowDirection::Up: return os << "Up";
    }
    return os << "Unknown";
}

struct WaterCell {
    uint8_t depth{0};
    uint8_t pressure{0};
    FlowDirection flowDirection{FlowDirection::None};
    uint32_t stagnantTicks{0};
};

struct RainEvent {
    uint8_t intensity{1};
    uint32_t remainingTicks{0};
    float coverage{0.0f};
};

/**
 * @brief Cellular water simulation, depth in whole units [0, maxDepth]
 *
 * Each stage is invoked by the orchestrator on its own cadence:
 * calculatePressure() then flow(), evaporate(), updateRain(). Flow only ever
 * moves single units between cells, so total depth changes only through
 * addWater(), evaporation and rain.
 */
class WaterGrid {
public:
    WaterGrid(int32_t width, int32_t height, const WaterSettings& settings);

    /// Dry cell for coordinates outside the grid
    [[nodiscard]] const WaterCell& cell(int32_t x, int32_t y) const;
    [[nodiscard]] uint8_t depth(int32_t x, int32_t y) const { return cell(x, y).depth; }

    /// Saturates at maxDepth and resets the stagnation counter
    void addWater(int32_t x, int32_t y, uint8_t amount);

    /**
     * @brief Moves depth between two cells
     * @return false (and no change) if the source lacks the amount or the
     *         destination would overflow
     */
    bool transfer(int32_t fromX, int32_t fromY, int32_t toX, int32_t toY, uint8_t amount,
                  FlowDirection direction);

    /// Rebuilds every cell's pressure from its own depth plus the wet column above it
    void calculatePressure(const ITerrainSurface& terrain);

    /// Two checkerboard passes, at most one unit leaves each wet cell per pass
    void flow(const ITerrainSurface& terrain);

    void evaporate(const ITerrainSurface& terrain);

    /**
     * @brief Starts, advances and ends rain events
     * @return true while an event is active after this call
     */
    bool updateRain(const ITerrainSurface& terrain, IRandomSource& rng);

    /// Forces a rain event, replacing any active one
    void startRain(const RainEvent& event) { m_rain = event; }

    [[nodiscard]] const std::optional<RainEvent>& activeRain() const noexcept { return m_rain; }

    /// Below the depth at which agents can no longer wade through
    [[nodiscard]] bool isWadeable(int32_t x, int32_t y) const {
        return depth(x, y) < m_settings.passableThreshold;
    }

    [[nodiscard]] uint64_t totalDepth() const;

    void clear();

    [[nodiscard]] int32_t width() const noexcept { return m_width; }
    [[nodiscard]] int32_t height() const noexcept { return m_height; }
    [[nodiscard]] uint8_t maxDepth() const noexcept { return m_settings.maxDepth; }

private:
    [[nodiscard]] bool inBounds(int32_t x, int32_t y) const {
        return x >= 0 && y >= 0 && x < m_width && y < m_height;
    }
    [[nodiscard]] WaterCell& at(int32_t x, int32_t y) {
        return m_cells[static_cast<size_t>(y) * static_cast<size_t>(m_width) + static_cast<size_t>(x)];
    }

    int32_t m_width;
    int32_t m_height;
    WaterSettings m_settings;
    std::vector<WaterCell> m_cells;
    std::optional<RainEvent> m_rain;
};

} // namespace Formicary

#endif // WATER_GRID_HPP
