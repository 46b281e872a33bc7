/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "core/SimulationClock.hpp"
#include <cmath>

namespace Strata {

const char* getSeasonName(Season season)
{
    switch (season)
    {
        case Season::Spring: return "Spring";
        case Season::Summer: return "Summer";
        case Season::Fall:   return "Fall";
        case Season::Winter: return "Winter";
        default:             return "Unknown";
    }
}

void SimulationClock::advance(int64_t ticks)
{
    if (ticks > 0)
    {
        m_ticks += ticks;
    }
}

void SimulationClock::advanceDays(double days)
{
    advance(static_cast<int64_t>(std::llround(days * static_cast<double>(TICKS_PER_DAY))));
}

int SimulationClock::getDayOfYear(int64_t tick)
{
    int64_t inYear = tick % TICKS_PER_YEAR;
    if (inYear < 0)
    {
        inYear += TICKS_PER_YEAR;
    }
    return static_cast<int>(inYear / TICKS_PER_DAY);
}

float SimulationClock::getHourOfDay(int64_t tick)
{
    int64_t inDay = tick % TICKS_PER_DAY;
    if (inDay < 0)
    {
        inDay += TICKS_PER_DAY;
    }
    return static_cast<float>(inDay) / static_cast<float>(TICKS_PER_HOUR);
}

Season SimulationClock::getSeason(int64_t tick)
{
    return static_cast<Season>(getDayOfYear(tick) / DAYS_PER_SEASON);
}

} // namespace Strata
