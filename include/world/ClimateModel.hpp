/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef CLIMATE_MODEL_HPP
#define CLIMATE_MODEL_HPP

#include "core/SimulationClock.hpp"
#include "world/RegionTypes.hpp"
#include <cstdint>
#include <unordered_map>

namespace Strata {

/**
 * @brief Climate queries the decay engine needs about a world tile.
 *
 * Temperatures are in degrees Celsius, rainfall in mm per year.
 */
class IClimateSampler {
public:
    virtual ~IClimateSampler() = default;

    virtual float seasonalTemperature(int64_t tick, TileId tile) const = 0;
    // Offset from the seasonal value caused by the day/night cycle
    virtual float diurnalOffset(int64_t tick, TileId tile) const = 0;
    virtual float rainfall(TileId tile) const = 0;

    /**
     * @brief Fraction of full rot speed at a temperature: 0 at or below
     * freezing, 1 from 10 C upward, linear in between.
     */
    virtual float rotRateAtTemperature(float celsius) const;
};

/**
 * @brief Per-tile parameters of the seasonal model
 */
struct TileClimate
{
    float meanTemperature{12.0f};
    float seasonalAmplitude{14.0f};
    float diurnalAmplitude{5.0f};
    float rainfall{1200.0f};
};

/**
 * @brief Sinusoidal seasonal climate. Warmest in mid summer, coldest in mid
 * winter; the day cycle bottoms out at 4 AM and peaks at 4 PM.
 */
class SeasonalClimateModel : public IClimateSampler {
public:
    SeasonalClimateModel() = default;
    explicit SeasonalClimateModel(const TileClimate& defaultClimate)
        : m_defaultClimate(defaultClimate) {}

    void setTileClimate(TileId tile, const TileClimate& climate);
    const TileClimate& getTileClimate(TileId tile) const;

    float seasonalTemperature(int64_t tick, TileId tile) const override;
    float diurnalOffset(int64_t tick, TileId tile) const override;
    float rainfall(TileId tile) const override;

private:
    TileClimate m_defaultClimate{};
    std::unordered_map<TileId, TileClimate> m_tiles;
};

} // namespace Strata

#endif // CLIMATE_MODEL_HPP
