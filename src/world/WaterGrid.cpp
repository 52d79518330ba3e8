/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "world/WaterGrid.hpp"
#include "core/Logger.hpp"
#include "utils/RandomSource.hpp"
#include "world/TerrainSurface.hpp"
#include <algorithm>
#include <array>

namespace Formicary {

namespace {

enum class FlowRule : uint8_t { Downward, Sideways, Upward };

struct FlowCandidate {
    int32_t dx;
    int32_t dy;
    FlowRule rule;
    FlowDirection direction;
};

// Evaluated in order, first eligible neighbour takes the unit
constexpr std::array<FlowCandidate, 6> FLOW_CANDIDATES{{
    {0, 1, FlowRule::Downward, FlowDirection::Down},
    {-1, 1, FlowRule::Downward, FlowDirection::DownLeft},
    {1, 1, FlowRule::Downward, FlowDirection::DownRight},
    {-1, 0, FlowRule::Sideways, FlowDirection::Left},
    {1, 0, FlowRule::Sideways, FlowDirection::Right},
    {0, -1, FlowRule::Upward, FlowDirection::Up},
}};

} // anonymous namespace

WaterGrid::WaterGrid(int32_t width, int32_t height, const WaterSettings& settings)
    : m_width(std::max(width, 0))
    , m_height(std::max(height, 0))
    , m_settings(settings)
    , m_cells(static_cast<size_t>(m_width) * static_cast<size_t>(m_height)) {}

const WaterCell& WaterGrid::cell(int32_t x, int32_t y) const {
    static const WaterCell dry{};
    if (!inBounds(x, y)) {
        return dry;
    }
    return m_cells[static_cast<size_t>(y) * static_cast<size_t>(m_width) + static_cast<size_t>(x)];
}

void WaterGrid::addWater(int32_t x, int32_t y, uint8_t amount) {
    if (!inBounds(x, y)) {
        return;
    }
    WaterCell& c = at(x, y);
    uint32_t raised = static_cast<uint32_t>(c.depth) + amount;
    c.depth = static_cast<uint8_t>(std::min<uint32_t>(raised, m_settings.maxDepth));
    c.stagnantTicks = 0;
}

bool WaterGrid::transfer(int32_t fromX, int32_t fromY, int32_t toX, int32_t toY, uint8_t amount,
                         FlowDirection direction) {
    if (!inBounds(fromX, fromY) || !inBounds(toX, toY) || amount == 0) {
        return false;
    }
    WaterCell& from = at(fromX, fromY);
    WaterCell& to = at(toX, toY);
    if (from.depth < amount || static_cast<uint32_t>(to.depth) + amount > m_settings.maxDepth) {
        return false;
    }
    from.depth = static_cast<uint8_t>(from.depth - amount);
    to.depth = static_cast<uint8_t>(to.depth + amount);
    from.flowDirection = direction;
    from.stagnantTicks = 0;
    return true;
}

void WaterGrid::calculatePressure(const ITerrainSurface& terrain) {
    for (int32_t x = 0; x < m_width; ++x) {
        // Depth of the contiguous wet, passable run directly above y
        uint32_t columnAbove = 0;
        for (int32_t y = 0; y < m_height; ++y) {
            WaterCell& c = at(x, y);
            if (c.depth == 0) {
                c.pressure = 0;
                columnAbove = 0;
                continue;
            }
            c.pressure = static_cast<uint8_t>(std::min<uint32_t>(c.depth + columnAbove, m_settings.maxDepth));
            columnAbove = terrain.isPassable(x, y) ? columnAbove + c.depth : 0;
        }
    }
}

void WaterGrid::flow(const ITerrainSurface& terrain) {
    for (int32_t pass = 0; pass < 2; ++pass) {
        for (int32_t y = 0; y < m_height; ++y) {
            for (int32_t x = 0; x < m_width; ++x) {
                if ((x + y) % 2 != pass) {
                    continue;
                }
                const WaterCell source = at(x, y);
                if (source.depth == 0) {
                    continue;
                }

                for (const FlowCandidate& candidate : FLOW_CANDIDATES) {
                    int32_t nx = x + candidate.dx;
                    int32_t ny = y + candidate.dy;
                    if (!inBounds(nx, ny) || !terrain.isPassable(nx, ny)) {
                        continue;
                    }
                    const WaterCell& target = at(nx, ny);

                    bool eligible = false;
                    switch (candidate.rule) {
                    case FlowRule::Downward:
                        eligible = target.depth < m_settings.maxDepth;
                        break;
                    case FlowRule::Sideways:
                        eligible = target.pressure < source.pressure && target.depth < source.depth;
                        break;
                    case FlowRule::Upward:
                        eligible = static_cast<uint32_t>(source.pressure) > static_cast<uint32_t>(target.pressure) + m_settings.upwardPressureMargin &&
                                   target.depth < m_settings.maxDepth;
                        break;
                    }

                    if (eligible && transfer(x, y, nx, ny, 1, candidate.direction)) {
                        break;
                    }
                }
            }
        }
    }
}

void WaterGrid::evaporate(const ITerrainSurface& terrain) {
    for (int32_t y = 0; y < m_height; ++y) {
        for (int32_t x = 0; x < m_width; ++x) {
            WaterCell& c = at(x, y);
            if (c.depth == 0 || c.depth > m_settings.evaporationMaxDepth) {
                continue;
            }
            bool exposed = y == 0 || (terrain.isPassable(x, y - 1) && at(x, y - 1).depth == 0);
            if (!exposed) {
                continue;
            }
            ++c.stagnantTicks;
            if (c.stagnantTicks > m_settings.stagnantEvaporationTicks) {
                --c.depth;
                c.stagnantTicks = 0;
            }
        }
    }
}

bool WaterGrid::updateRain(const ITerrainSurface& terrain, IRandomSource& rng) {
    if (!m_rain.has_value()) {
        if (rng.uniformInt(0, static_cast<int32_t>(m_settings.rainChance) - 1) != 0) {
            return false;
        }

        RainEvent event;
        event.intensity = static_cast<uint8_t>(rng.uniformInt(m_settings.rainIntensityMin, m_settings.rainIntensityMax));
        event.remainingTicks = m_settings.rainDurationMax > m_settings.rainDurationMin
            ? static_cast<uint32_t>(rng.uniformInt(static_cast<int32_t>(m_settings.rainDurationMin),
                                                   static_cast<int32_t>(m_settings.rainDurationMax) - 1))
            : m_settings.rainDurationMin;
        event.coverage = rng.uniformFloat() * (m_settings.rainCoverageMax - m_settings.rainCoverageMin) +
                         m_settings.rainCoverageMin;
        m_rain = event;

        WATER_INFO("Rain started: intensity " + std::to_string(event.intensity) + ", " +
                   std::to_string(event.remainingTicks) + " ticks, coverage " +
                   std::to_string(event.coverage));
    }

    RainEvent& rain = *m_rain;
    for (int32_t x = 0; x < m_width; ++x) {
        if (rng.uniformFloat() >= rain.coverage) {
            continue;
        }
        for (int32_t y = 0; y < m_height; ++y) {
            if (!terrain.isPassable(x, y)) {
                if (y > 0) {
                    addWater(x, y - 1, rain.intensity);
                }
                break;
            }
        }
    }

    if (rain.remainingTicks > 0) {
        --rain.remainingTicks;
    }
    if (rain.remainingTicks == 0) {
        m_rain.reset();
        WATER_INFO("Rain stopped");
        return false;
    }
    return true;
}

uint64_t WaterGrid::totalDepth() const {
    uint64_t total = 0;
    for (const WaterCell& c : m_cells) {
        total += c.depth;
    }
    return total;
}

void WaterGrid::clear() {
    std::fill(m_cells.begin(), m_cells.end(), WaterCell{});
    m_rain.reset();
}

} // namespace Formicary
