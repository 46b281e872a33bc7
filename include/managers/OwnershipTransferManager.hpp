/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef OWNERSHIP_TRANSFER_MANAGER_HPP
#define OWNERSHIP_TRANSFER_MANAGER_HPP

#include "entities/Creature.hpp"
#include "entities/Entity.hpp"
#include "managers/RegionSideTable.hpp"
#include "managers/WorldRegistry.hpp"
#include "world/GroupController.hpp"
#include <cstddef>
#include <random>
#include <unordered_map>
#include <vector>

namespace Strata {

class Region;
class World;

/**
 * @brief Moves creatures that must not be archived in place out of a region
 * before it is saved, and puts them back when it is restored.
 *
 * Extraction runs strictly before the archived entity list is captured. The
 * four save passes always run in the same order:
 *   1. drain every container of its creature occupants
 *   2. extract player-affiliated non-human creatures
 *   3. take over non-human, non-player creatures the world already tracks
 *   4. collect group controllers that own surviving archivable creatures
 */
class OwnershipTransferManager {
public:
    struct ExtractionSummary {
        size_t sleepingOccupants{0};
        size_t containerOccupants{0};
        size_t ownedAnimals{0};
        size_t trackedCreatures{0};

        size_t total() const { return sleepingOccupants + containerOccupants + ownedAnimals + trackedCreatures; }
    };

    struct RestoreSummary {
        size_t legacyParked{0};
        size_t reinsertedOccupants{0};
        size_t freePlaced{0};
        size_t ownedAnimals{0};
        size_t trackedCreatures{0};
        size_t skipped{0};
    };

    OwnershipTransferManager(World& world, int searchRadius);

    /**
     * @brief Clears the region's side registry lists and runs passes 1 to 3.
     */
    ExtractionSummary extractForArchive(Region& region);

    size_t extractContainerOccupants(Region& region, SideRegistryEntry& entry);
    size_t extractPlayerAnimals(Region& region, SideRegistryEntry& entry);
    size_t extractTrackedCreatures(Region& region, SideRegistryEntry& entry);

    // Pass 4
    std::vector<GroupControllerPtr> collectGroupControllers(const Region& region) const;

    // Inner creatures of every corpse in the list, including corpses held in containers
    static std::vector<CreaturePtr> corpseInnerCreatures(const std::vector<EntityPtr>& entities);
    size_t protectCorpseInnerCreatures(const std::vector<EntityPtr>& entities);
    size_t releaseCorpseInnerCreatures(const std::vector<EntityPtr>& entities);

    /**
     * @brief Post-save cleanup. The archive is now the only copy of the
     * archived non-human creatures: they leave the region and the identity
     * registry. Creatures owned by a saved group keep their affiliation;
     * the saved groups leave the region's group manager.
     */
    size_t detachArchivedCreatures(Region& region,
                                   const std::vector<EntityPtr>& archived,
                                   const std::vector<GroupControllerPtr>& savedGroups);

    /**
     * @brief Drains the region's side registry back into the region and
     * releases the entry.
     */
    RestoreSummary restoreSideRegistry(Region& region, std::mt19937& rng);

    /**
     * @brief Undoes extractForArchive() after a save that never reached the
     * disk. Creatures go back into the region and tracked creatures rejoin
     * the world registry with the retention they had before extraction.
     */
    RestoreSummary rollbackExtraction(Region& region, std::mt19937& rng);

    int getSearchRadius() const { return m_searchRadius; }

private:
    void placeNear(Region& region, const CreaturePtr& creature, const CellPos& preferred, std::mt19937& rng);
    bool reinsertOccupant(Region& region, const CreaturePtr& creature, const CellPos& containerCell);

    World& m_world;
    int m_searchRadius;
    // Retention of the tracked creatures taken by the last extraction
    std::unordered_map<EntityID, RetentionPolicy> m_extractedRetention;
};

} // namespace Strata

#endif // OWNERSHIP_TRANSFER_MANAGER_HPP
