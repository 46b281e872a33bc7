/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "decay/DecayContext.hpp"
#include "world/Region.hpp"
#include <algorithm>
#include <limits>

namespace Strata {

namespace {
constexpr int FREEZE_THAW_SAMPLES = 12;
}

DecayContext DecayContext::build(Region& region,
                                 int64_t abandonedAtTick,
                                 int64_t nowTick,
                                 const IClimateSampler& climate,
                                 float rainfallReference)
{
    DecayContext context;
    context.region = &region;
    context.startTick = abandonedAtTick;
    context.elapsedTicks = std::max<int64_t>(0, nowTick - abandonedAtTick);
    context.tileId = region.getTileId();
    context.rainfall = climate.rainfall(context.tileId);
    context.normalizedRain =
        rainfallReference > 0.0f ? std::clamp(context.rainfall / rainfallReference, 0.0f, 1.0f) : 0.0f;
    context.freezeThaw = computeFreezeThaw(climate, context.tileId, abandonedAtTick);
    return context;
}

bool computeFreezeThaw(const IClimateSampler& climate, TileId tile, int64_t startTick)
{
    float minTemp = std::numeric_limits<float>::max();
    float maxTemp = std::numeric_limits<float>::lowest();
    for (int i = 0; i < FREEZE_THAW_SAMPLES; ++i) {
        const int64_t tick = startTick + (TICKS_PER_YEAR * i) / FREEZE_THAW_SAMPLES;
        const float temp = climate.seasonalTemperature(tick, tile);
        minTemp = std::min(minTemp, temp);
        maxTemp = std::max(maxTemp, temp);
    }
    return minTemp < 0.0f && maxTemp > 0.0f;
}

} // namespace Strata
