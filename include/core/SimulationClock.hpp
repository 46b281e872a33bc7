/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef SIMULATION_CLOCK_HPP
#define SIMULATION_CLOCK_HPP

/**
 * @file SimulationClock.hpp
 * @brief Tick-based simulation calendar
 *
 * One in-game hour is 2500 ticks, a day 24 hours, a season 15 days and a
 * year four seasons (60 days). All offline decay math is expressed against
 * these constants.
 */

#include <cstdint>

namespace Strata {

inline constexpr int64_t TICKS_PER_HOUR = 2500;
inline constexpr int64_t TICKS_PER_DAY = TICKS_PER_HOUR * 24;
inline constexpr int64_t DAYS_PER_SEASON = 15;
inline constexpr int64_t DAYS_PER_YEAR = DAYS_PER_SEASON * 4;
inline constexpr int64_t TICKS_PER_YEAR = TICKS_PER_DAY * DAYS_PER_YEAR;

enum class Season : uint8_t
{
    Spring = 0,
    Summer = 1,
    Fall = 2,
    Winter = 3
};

const char* getSeasonName(Season season);

/**
 * @brief Read-only view of the simulation clock
 */
class ITickClock {
public:
    virtual ~ITickClock() = default;
    virtual int64_t getTicksGame() const = 0;
};

class SimulationClock : public ITickClock {
public:
    SimulationClock() = default;
    explicit SimulationClock(int64_t startTick) : m_ticks(startTick) {}

    int64_t getTicksGame() const override { return m_ticks; }

    void setTicks(int64_t ticks) { m_ticks = ticks; }
    void advance(int64_t ticks);
    void advanceDays(double days);

    // Calendar helpers over an arbitrary absolute tick
    static int getDayOfYear(int64_t tick);
    static float getHourOfDay(int64_t tick);
    static Season getSeason(int64_t tick);
    static double toYears(int64_t ticks) {
        return static_cast<double>(ticks) / static_cast<double>(TICKS_PER_YEAR);
    }
    static double toDays(int64_t ticks) {
        return static_cast<double>(ticks) / static_cast<double>(TICKS_PER_DAY);
    }

private:
    int64_t m_ticks{0};
};

} // namespace Strata

#endif // SIMULATION_CLOCK_HPP
