/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "managers/OwnershipTransferManager.hpp"
#include "core/Logger.hpp"
#include "entities/Corpse.hpp"
#include "entities/Structure.hpp"
#include "world/Region.hpp"
#include "world/World.hpp"
#include <algorithm>
#include <unordered_set>

namespace Strata {

namespace {

bool isArchivableCreature(const Creature& creature)
{
    return !creature.isHumanlike() && !creature.isPlayerAffiliated();
}

} // namespace

OwnershipTransferManager::OwnershipTransferManager(World& world, int searchRadius)
    : m_world(world), m_searchRadius(std::max(0, searchRadius))
{
}

// ----------------------------------------------------------------------------
// Save side
// ----------------------------------------------------------------------------

OwnershipTransferManager::ExtractionSummary OwnershipTransferManager::extractForArchive(Region& region)
{
    SideRegistryEntry& entry = m_world.getSideTable().getOrCreate(region.getId());
    if (!entry.empty()) {
        OWNERSHIP_WARN("Region " + std::to_string(region.getId()) + " still had " + std::to_string(entry.size()) +
                       " side registry records; clearing before archive");
    }
    entry.clear();
    m_extractedRetention.clear();

    ExtractionSummary summary;
    const size_t before = entry.sleepingOccupants.size();
    const size_t occupants = extractContainerOccupants(region, entry);
    summary.sleepingOccupants = entry.sleepingOccupants.size() - before;
    summary.containerOccupants = occupants - summary.sleepingOccupants;
    summary.ownedAnimals = extractPlayerAnimals(region, entry);
    summary.trackedCreatures = extractTrackedCreatures(region, entry);

    if (summary.total() > 0) {
        OWNERSHIP_INFO("Region " + std::to_string(region.getId()) + " extraction: sleeping=" +
                       std::to_string(summary.sleepingOccupants) + " container=" +
                       std::to_string(summary.containerOccupants) + " animals=" +
                       std::to_string(summary.ownedAnimals) + " tracked=" + std::to_string(summary.trackedCreatures));
    }
    return summary;
}

size_t OwnershipTransferManager::extractContainerOccupants(Region& region, SideRegistryEntry& entry)
{
    WorldRegistry& registry = m_world.getRegistry();
    size_t extracted = 0;

    for (const auto& container : region.getContainers()) {
        // Copy: removeContent() mutates the list
        const Structure::Contents held = container->getContents();
        for (const auto& content : held) {
            auto creature = std::dynamic_pointer_cast<Creature>(content);
            if (!creature) {
                continue;
            }
            container->removeContent(*creature);
            if (registry.getSituation(*creature) == WorldSituation::None) {
                registry.passToWorld(creature, RetentionPolicy::KeepForever);
            }

            ParkedCreature parked{creature, container->getPosition(), {}};
            if (creature->isPlayerAffiliated()) {
                entry.sleepingOccupants.push_back(std::move(parked));
            } else {
                entry.containerOccupants.push_back(std::move(parked));
            }
            ++extracted;
        }
    }
    return extracted;
}

size_t OwnershipTransferManager::extractPlayerAnimals(Region& region, SideRegistryEntry& entry)
{
    size_t extracted = 0;
    for (const auto& creature : region.getCreatures()) {
        if (creature->isHumanlike() || !creature->isPlayerAffiliated() || creature->isDestroyed()) {
            continue;
        }
        const CellPos cell = creature->getPosition();
        region.despawn(creature);
        m_world.getRegistry().passToWorld(creature, RetentionPolicy::KeepForever);
        entry.ownedAnimals.push_back(ParkedCreature{creature, cell, {}});
        ++extracted;
    }
    return extracted;
}

size_t OwnershipTransferManager::extractTrackedCreatures(Region& region, SideRegistryEntry& entry)
{
    WorldRegistry& registry = m_world.getRegistry();
    size_t extracted = 0;
    for (const auto& creature : region.getCreatures()) {
        if (!isArchivableCreature(*creature) || creature->isDestroyed()) {
            continue;
        }
        if (registry.getSituation(*creature) == WorldSituation::None) {
            continue;
        }
        const CellPos cell = creature->getPosition();
        m_extractedRetention[creature->getID()] = registry.getRetention(creature->getID());
        region.despawn(creature);
        registry.remove(*creature);
        entry.trackedCreatures.push_back(ParkedCreature{creature, cell, {}});
        ++extracted;
    }
    return extracted;
}

std::vector<GroupControllerPtr> OwnershipTransferManager::collectGroupControllers(const Region& region) const
{
    std::vector<GroupControllerPtr> collected;
    for (const auto& group : region.getGroupManager().getGroups()) {
        const auto& owned = group->getOwnedCreatures();
        const bool qualifies = std::any_of(owned.begin(), owned.end(), [&region](const CreaturePtr& creature) {
            return creature && creature->getRegion() == &region && !creature->isDestroyed() &&
                   isArchivableCreature(*creature);
        });
        if (qualifies) {
            collected.push_back(group);
        }
    }
    return collected;
}

std::vector<CreaturePtr> OwnershipTransferManager::corpseInnerCreatures(const std::vector<EntityPtr>& entities)
{
    std::vector<CreaturePtr> inner;
    auto visit = [&inner](const EntityPtr& entity) {
        auto corpse = std::dynamic_pointer_cast<Corpse>(entity);
        if (corpse && corpse->getInnerCreature()) {
            inner.push_back(corpse->getInnerCreature());
        }
    };

    for (const auto& entity : entities) {
        visit(entity);
        if (auto structure = std::dynamic_pointer_cast<Structure>(entity)) {
            for (const auto& held : structure->getContents()) {
                visit(held);
            }
        }
    }
    return inner;
}

size_t OwnershipTransferManager::protectCorpseInnerCreatures(const std::vector<EntityPtr>& entities)
{
    const auto inner = corpseInnerCreatures(entities);
    for (const auto& creature : inner) {
        m_world.getRegistry().addForcedRetention(creature->getID());
    }
    return inner.size();
}

size_t OwnershipTransferManager::releaseCorpseInnerCreatures(const std::vector<EntityPtr>& entities)
{
    size_t released = 0;
    for (const auto& creature : corpseInnerCreatures(entities)) {
        if (m_world.getRegistry().removeForcedRetention(creature->getID())) {
            ++released;
        }
    }
    return released;
}

size_t OwnershipTransferManager::detachArchivedCreatures(Region& region,
                                                         const std::vector<EntityPtr>& archived,
                                                         const std::vector<GroupControllerPtr>& savedGroups)
{
    size_t detached = 0;

    for (const auto& entity : archived) {
        auto creature = std::dynamic_pointer_cast<Creature>(entity);
        if (!creature || creature->isHumanlike()) {
            continue;
        }
        const bool groupOwned = std::any_of(savedGroups.begin(), savedGroups.end(),
                                            [&creature](const GroupControllerPtr& group) {
                                                return group->owns(*creature);
                                            });
        region.despawn(creature);
        if (!groupOwned) {
            creature->setFaction(nullptr);
        }
        m_world.forget(*creature);
        ++detached;
    }

    for (const auto& group : savedGroups) {
        for (const auto& creature : group->getOwnedCreatures()) {
            if (creature && creature->getRegion() == &region && !creature->isHumanlike()) {
                region.despawn(creature);
                m_world.forget(*creature);
                ++detached;
            }
        }
        region.getGroupManager().remove(group);
    }

    OWNERSHIP_DEBUG("Detached " + std::to_string(detached) + " archived creatures from region " +
                    std::to_string(region.getId()));
    return detached;
}

// ----------------------------------------------------------------------------
// Load side
// ----------------------------------------------------------------------------

void OwnershipTransferManager::placeNear(Region& region, const CreaturePtr& creature, const CellPos& preferred,
                                         std::mt19937& rng)
{
    std::optional<CellPos> cell;
    if (region.inBounds(preferred)) {
        cell = region.findStandableNear(preferred, m_searchRadius);
    }
    if (!cell) {
        cell = region.findRandomStandable(rng);
        OWNERSHIP_DEBUG(creature->getUniqueLoadId() + " has no standable cell near (" + std::to_string(preferred.x) +
                        ", " + std::to_string(preferred.z) + "); using a random cell");
    }
    if (!cell) {
        // Nothing standable anywhere: clamp the saved cell into the grid
        cell = CellPos{std::clamp(preferred.x, 0, region.getWidth() - 1),
                       std::clamp(preferred.z, 0, region.getHeight() - 1)};
        OWNERSHIP_WARN("Region " + std::to_string(region.getId()) + " has no standable cell for " +
                       creature->getUniqueLoadId());
    }
    region.spawn(creature, *cell, creature->getRotation());
}

bool OwnershipTransferManager::reinsertOccupant(Region& region, const CreaturePtr& creature,
                                                const CellPos& containerCell)
{
    if (!region.inBounds(containerCell)) {
        return false;
    }
    StructurePtr container = region.getContainerAt(containerCell);
    if (!container || !container->tryAccept(creature)) {
        return false;
    }
    m_world.adopt(creature);
    return true;
}

OwnershipTransferManager::RestoreSummary OwnershipTransferManager::restoreSideRegistry(Region& region,
                                                                                       std::mt19937& rng)
{
    RestoreSummary summary;
    SideRegistryEntry* found = m_world.getSideTable().tryGet(region.getId());
    if (!found) {
        return summary;
    }
    // Copy: the entry is released below
    const SideRegistryEntry entry = *found;

    WorldRegistry& registry = m_world.getRegistry();
    const FactionPtr playerFaction = m_world.getFactions().getPlayerFaction();

    std::unordered_set<EntityID> newerIds;
    for (const ParkedList* list : {&entry.sleepingOccupants, &entry.containerOccupants, &entry.ownedAnimals,
                                   &entry.trackedCreatures}) {
        for (const auto& parked : *list) {
            if (parked.creature) {
                newerIds.insert(parked.creature->getID());
            }
        }
    }

    for (const auto& parked : entry.legacyParked) {
        const CreaturePtr& creature = parked.creature;
        if (!creature || creature->isDestroyed() || creature->isSpawned()) {
            ++summary.skipped;
            continue;
        }
        if (newerIds.count(creature->getID()) != 0) {
            OWNERSHIP_WARN("Legacy record for " + creature->getUniqueLoadId() + " shadowed by a newer record");
            ++summary.skipped;
            continue;
        }
        registry.remove(*creature);
        placeNear(region, creature, parked.cell, rng);
        ++summary.legacyParked;
    }

    auto restoreOccupants = [&](const ParkedList& list, bool restorePlayerFaction) {
        for (const auto& parked : list) {
            const CreaturePtr& creature = parked.creature;
            if (!creature || creature->isDestroyed() || creature->isSpawned()) {
                ++summary.skipped;
                continue;
            }
            registry.remove(*creature);
            if (restorePlayerFaction && playerFaction && !creature->isPlayerAffiliated()) {
                creature->setFaction(playerFaction);
            }
            if (reinsertOccupant(region, creature, parked.cell)) {
                ++summary.reinsertedOccupants;
            } else {
                OWNERSHIP_WARN("No container at (" + std::to_string(parked.cell.x) + ", " +
                               std::to_string(parked.cell.z) + ") for " + creature->getUniqueLoadId() +
                               "; placing free");
                placeNear(region, creature, parked.cell, rng);
                ++summary.freePlaced;
            }
        }
    };
    restoreOccupants(entry.sleepingOccupants, true);
    restoreOccupants(entry.containerOccupants, false);

    for (const auto& parked : entry.ownedAnimals) {
        const CreaturePtr& creature = parked.creature;
        if (!creature || creature->isDestroyed() || creature->isSpawned()) {
            ++summary.skipped;
            continue;
        }
        registry.remove(*creature);
        if (playerFaction && !creature->isPlayerAffiliated()) {
            creature->setFaction(playerFaction);
        }
        placeNear(region, creature, parked.cell, rng);
        ++summary.ownedAnimals;
    }

    for (const auto& parked : entry.trackedCreatures) {
        const CreaturePtr& creature = parked.creature;
        if (!creature || creature->isDestroyed() || creature->isSpawned()) {
            ++summary.skipped;
            continue;
        }
        placeNear(region, creature, parked.cell, rng);
        // Their old task and duty point at targets that no longer exist
        creature->clearBehaviorState();
        ++summary.trackedCreatures;
    }

    m_world.getSideTable().release(region.getId());

    OWNERSHIP_INFO("Region " + std::to_string(region.getId()) + " side registry restored: legacy=" +
                   std::to_string(summary.legacyParked) + " reinserted=" +
                   std::to_string(summary.reinsertedOccupants) + " free=" + std::to_string(summary.freePlaced) +
                   " animals=" + std::to_string(summary.ownedAnimals) + " tracked=" +
                   std::to_string(summary.trackedCreatures) + " skipped=" + std::to_string(summary.skipped));
    return summary;
}

OwnershipTransferManager::RestoreSummary OwnershipTransferManager::rollbackExtraction(Region& region,
                                                                                      std::mt19937& rng)
{
    std::vector<CreaturePtr> tracked;
    if (const SideRegistryEntry* entry = m_world.getSideTable().tryGet(region.getId())) {
        for (const auto& parked : entry->trackedCreatures) {
            if (parked.creature) {
                tracked.push_back(parked.creature);
            }
        }
    }

    const RestoreSummary summary = restoreSideRegistry(region, rng);

    WorldRegistry& registry = m_world.getRegistry();
    for (const auto& creature : tracked) {
        if (creature->isDestroyed() || creature->getRegion() != &region) {
            continue;
        }
        const auto it = m_extractedRetention.find(creature->getID());
        registry.passToWorld(creature, it != m_extractedRetention.end() ? it->second : RetentionPolicy::Discard);
    }
    m_extractedRetention.clear();

    OWNERSHIP_INFO("Region " + std::to_string(region.getId()) + " extraction rolled back; " +
                   std::to_string(tracked.size()) + " tracked creatures re-registered");
    return summary;
}

} // namespace Strata
