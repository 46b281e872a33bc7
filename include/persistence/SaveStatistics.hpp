/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef SAVE_STATISTICS_HPP
#define SAVE_STATISTICS_HPP

#include "entities/Creature.hpp"
#include "managers/RegionSideTable.hpp"
#include "persistence/ArchiveRecord.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace Strata {

/**
 * @brief Disk and memory footprint of one region save.
 *
 * Disk covers the archive file itself. Memory covers what the world keeps
 * while the region is absent: references to creatures held by the world
 * registry, creatures owned outright by the side registry, and corpse
 * creatures pinned in the forced-retention set.
 */
struct SaveStatistics {
    uint64_t archiveBytes{0};
    uint64_t gridBytes{0};
    size_t entityCount{0};
    size_t groupCount{0};

    size_t worldReferenceCount{0};
    uint64_t worldReferenceBytes{0};
    size_t ownedCreatureCount{0};
    uint64_t ownedCreatureBytes{0};
    size_t protectedCorpseCount{0};
    uint64_t protectedCorpseBytes{0};

    size_t sleepingOccupants{0};
    size_t containerOccupants{0};
    size_t ownedAnimals{0};
    size_t legacyParked{0};

    static SaveStatistics collect(const std::string& archivePath,
                                  const ArchiveRecord& record,
                                  const SideRegistryEntry& entry,
                                  const std::vector<CreaturePtr>& protectedCorpseCreatures);

    // Serialized size of the creatures, measured by deep-saving them to memory
    static uint64_t estimateSerializedBytes(const std::vector<CreaturePtr>& creatures);

    static std::string formatBytes(uint64_t bytes);

    uint64_t memoryBytes() const { return worldReferenceBytes + ownedCreatureBytes + protectedCorpseBytes; }

    std::string describe() const;
};

} // namespace Strata

#endif // SAVE_STATISTICS_HPP
