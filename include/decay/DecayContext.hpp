/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef DECAY_CONTEXT_HPP
#define DECAY_CONTEXT_HPP

#include "core/SimulationClock.hpp"
#include "world/ClimateModel.hpp"
#include "world/RegionTypes.hpp"
#include <cstdint>

namespace Strata {

class Region;

// Hard ceiling on structural failure events per restore, whatever the tuning says
constexpr int FAILURE_EVENT_CAP = 8;

// Knobs of the offline decay model; defaults match the shipped settings file
struct DecayTuning {
    bool enabled{true};
    float rainfallReference{4000.0f};
    int maxFailureEvents{FAILURE_EVENT_CAP};
    float failureMtbDays{300.0f};
};

/**
 * @brief Read-only inputs shared by every decay rule for one restore.
 *
 * Built once per load from the archive's abandon tick and the current clock.
 */
struct DecayContext {
    Region* region{nullptr};
    int64_t startTick{0};
    int64_t elapsedTicks{0};
    TileId tileId{INVALID_TILE_ID};
    float rainfall{0.0f};
    float normalizedRain{0.0f};
    bool freezeThaw{false};

    double years() const { return SimulationClock::toYears(elapsedTicks); }
    double days() const { return SimulationClock::toDays(elapsedTicks); }

    static DecayContext build(Region& region,
                              int64_t abandonedAtTick,
                              int64_t nowTick,
                              const IClimateSampler& climate,
                              float rainfallReference);
};

/**
 * @brief True if the tile's seasonal temperature crosses zero within one
 * year starting at @p startTick (12 evenly spaced samples).
 */
bool computeFreezeThaw(const IClimateSampler& climate, TileId tile, int64_t startTick);

} // namespace Strata

#endif // DECAY_CONTEXT_HPP
