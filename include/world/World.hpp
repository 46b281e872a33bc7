/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef WORLD_HPP
#define WORLD_HPP

#include "core/SimulationClock.hpp"
#include "entities/Entity.hpp"
#include "entities/Faction.hpp"
#include "managers/IdentityRegistry.hpp"
#include "managers/RegionSideTable.hpp"
#include "managers/WorldRegistry.hpp"
#include <string>
#include <vector>

namespace Strata {

class Region;

/**
 * @brief Long-lived simulation state that outlives any single region.
 *
 * Owns the identity registry, the world-level entity holding, the factions,
 * the per-region side table and the clock. Regions reference the world they
 * belong to.
 */
class World {
public:
    World();

    World(const World&) = delete;
    World& operator=(const World&) = delete;

    IdentityRegistry& getIdentities() { return m_identities; }
    const IdentityRegistry& getIdentities() const { return m_identities; }
    WorldRegistry& getRegistry() { return m_registry; }
    const WorldRegistry& getRegistry() const { return m_registry; }
    FactionRegistry& getFactions() { return m_factions; }
    const FactionRegistry& getFactions() const { return m_factions; }
    RegionSideTable& getSideTable() { return m_sideTable; }
    const RegionSideTable& getSideTable() const { return m_sideTable; }
    SimulationClock& getClock() { return m_clock; }
    const SimulationClock& getClock() const { return m_clock; }

    // Save-game scoped id that separates archives of different playthroughs
    const std::string& getPersistentId() const { return m_persistentId; }
    void setPersistentId(std::string persistentId) { m_persistentId = std::move(persistentId); }

    FactionPtr createFaction(const std::string& name, bool isPlayer = false);
    void adoptFaction(const FactionPtr& faction);

    /**
     * @brief Registers an entity and everything it holds in the identity
     * registry.
     * @throws IdentityCollisionError if any load id is held by another object
     */
    void adopt(const EntityPtr& entity);

    // Unregisters an entity and everything it holds
    void forget(const Entity& entity);

    /**
     * @brief Runs world registry garbage collection. Creatures referenced by
     * corpses in the given active regions or by the side table are kept.
     */
    size_t collectGarbage(const std::vector<const Region*>& activeRegions);

    // Drops every world-level object (before a world session load)
    void reset();

private:
    IdentityRegistry m_identities;
    WorldRegistry m_registry;
    FactionRegistry m_factions;
    RegionSideTable m_sideTable;
    SimulationClock m_clock;
    std::string m_persistentId;
};

} // namespace Strata

#endif // WORLD_HPP
