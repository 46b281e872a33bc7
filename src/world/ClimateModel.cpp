/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "world/ClimateModel.hpp"
#include <algorithm>
#include <cmath>

namespace Strata {

namespace {
constexpr double TWO_PI = 6.283185307179586;
// Mid summer: day 22.5 of the 60 day year
constexpr double WARMEST_YEAR_FRACTION = 0.375;
constexpr float COLDEST_HOUR = 4.0f;
}

float IClimateSampler::rotRateAtTemperature(float celsius) const
{
    if (celsius <= 0.0f)
    {
        return 0.0f;
    }
    if (celsius >= 10.0f)
    {
        return 1.0f;
    }
    return celsius / 10.0f;
}

void SeasonalClimateModel::setTileClimate(TileId tile, const TileClimate& climate)
{
    m_tiles[tile] = climate;
}

const TileClimate& SeasonalClimateModel::getTileClimate(TileId tile) const
{
    auto it = m_tiles.find(tile);
    return it != m_tiles.end() ? it->second : m_defaultClimate;
}

float SeasonalClimateModel::seasonalTemperature(int64_t tick, TileId tile) const
{
    const TileClimate& climate = getTileClimate(tile);

    int64_t inYear = tick % TICKS_PER_YEAR;
    if (inYear < 0)
    {
        inYear += TICKS_PER_YEAR;
    }
    const double yearFraction = static_cast<double>(inYear) / static_cast<double>(TICKS_PER_YEAR);
    const double phase = (yearFraction - WARMEST_YEAR_FRACTION) * TWO_PI;

    return climate.meanTemperature +
           climate.seasonalAmplitude * static_cast<float>(std::cos(phase));
}

float SeasonalClimateModel::diurnalOffset(int64_t tick, TileId tile) const
{
    const TileClimate& climate = getTileClimate(tile);

    float hoursSinceColdest = SimulationClock::getHourOfDay(tick) - COLDEST_HOUR;
    if (hoursSinceColdest < 0.0f)
    {
        hoursSinceColdest += 24.0f;
    }

    const double phase = (hoursSinceColdest / 24.0) * TWO_PI;
    return -climate.diurnalAmplitude * static_cast<float>(std::cos(phase));
}

float SeasonalClimateModel::rainfall(TileId tile) const
{
    return std::max(0.0f, getTileClimate(tile).rainfall);
}

} // namespace Strata
