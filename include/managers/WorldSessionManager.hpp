/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef WORLD_SESSION_MANAGER_HPP
#define WORLD_SESSION_MANAGER_HPP

#include <string>

namespace Strata {

class ArchiveStorage;
class World;

/**
 * @brief Saves and loads the long-lived world state: clock, factions, the
 * world registry and the region side table.
 *
 * Uses the same container format as region archives with the records
 * "Clock", "Factions", "WorldRegistry" and "SideTable". Loading replaces the
 * world's state wholesale and must happen while no region is active.
 */
class WorldSessionManager {
public:
    static constexpr const char* SESSION_KIND = "WorldSession";

    explicit WorldSessionManager(World& world) : m_world(world) {}

    bool save(const ArchiveStorage& storage);
    bool load(const ArchiveStorage& storage);

    bool saveToFile(const std::string& path);
    bool loadFromFile(const std::string& path);

private:
    World& m_world;
};

} // namespace Strata

#endif // WORLD_SESSION_MANAGER_HPP
