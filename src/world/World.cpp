/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "world/World.hpp"
#include "core/Logger.hpp"
#include "core/PersistenceError.hpp"
#include "entities/Corpse.hpp"
#include "entities/Structure.hpp"
#include "world/Region.hpp"
#include <unordered_set>

namespace Strata {

namespace {

void collectCorpseReferences(const EntityPtr& entity, std::unordered_set<EntityID>& out)
{
    if (auto corpse = std::dynamic_pointer_cast<Corpse>(entity)) {
        if (corpse->getInnerCreature()) {
            out.insert(corpse->getInnerCreature()->getID());
        }
    }
    if (auto structure = std::dynamic_pointer_cast<Structure>(entity)) {
        for (const auto& held : structure->getContents()) {
            collectCorpseReferences(held, out);
        }
    }
}

} // namespace

World::World()
    : m_registry(m_identities)
{
}

FactionPtr World::createFaction(const std::string& name, bool isPlayer)
{
    FactionPtr faction = m_factions.add(name, isPlayer);
    if (!m_identities.registerObject(faction)) {
        throw IdentityCollisionError(faction->getUniqueLoadId(), 0, m_identities.size());
    }
    return faction;
}

void World::adoptFaction(const FactionPtr& faction)
{
    m_factions.adopt(faction);
    if (!m_identities.registerObject(faction)) {
        throw IdentityCollisionError(faction->getUniqueLoadId(), 0, m_identities.size());
    }
}

void World::adopt(const EntityPtr& entity)
{
    if (!entity) {
        return;
    }
    if (!m_identities.registerObject(entity)) {
        throw IdentityCollisionError(entity->getUniqueLoadId(), 0, m_identities.size());
    }
    if (auto structure = std::dynamic_pointer_cast<Structure>(entity)) {
        for (const auto& held : structure->getContents()) {
            adopt(held);
        }
    }
}

void World::forget(const Entity& entity)
{
    m_identities.remove(entity);
    if (const auto* structure = dynamic_cast<const Structure*>(&entity)) {
        for (const auto& held : structure->getContents()) {
            forget(*held);
        }
    }
}

size_t World::collectGarbage(const std::vector<const Region*>& activeRegions)
{
    std::unordered_set<EntityID> referenced;
    for (const Region* region : activeRegions) {
        for (const auto& entity : region->getEntities()) {
            collectCorpseReferences(entity, referenced);
        }
    }
    m_sideTable.collectReferencedIds(referenced);
    return m_registry.collectGarbage(referenced);
}

void World::reset()
{
    m_registry.clear();
    m_sideTable.clear();
    for (const auto& faction : m_factions.getAll()) {
        m_identities.remove(*faction);
    }
    m_factions.clear();
    m_identities.clear();
    m_clock.setTicks(0);
}

} // namespace Strata
