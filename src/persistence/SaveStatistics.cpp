/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "persistence/SaveStatistics.hpp"
#include "core/Logger.hpp"
#include "persistence/ArchiveSession.hpp"
#include <cstdio>
#include <filesystem>
#include <sstream>
#include <system_error>

namespace Strata {

namespace {

uint64_t gridSize(const std::optional<std::vector<uint8_t>>& grid)
{
    return grid ? grid->size() : 0;
}

void appendCreatures(const ParkedList& list, std::vector<CreaturePtr>& out)
{
    for (const auto& parked : list) {
        if (parked.creature) {
            out.push_back(parked.creature);
        }
    }
}

} // namespace

SaveStatistics SaveStatistics::collect(const std::string& archivePath,
                                       const ArchiveRecord& record,
                                       const SideRegistryEntry& entry,
                                       const std::vector<CreaturePtr>& protectedCorpseCreatures)
{
    SaveStatistics stats;

    std::error_code ec;
    const auto fileSize = std::filesystem::file_size(archivePath, ec);
    stats.archiveBytes = ec ? 0 : static_cast<uint64_t>(fileSize);
    stats.gridBytes = gridSize(record.terrain) + gridSize(record.underTerrain) + gridSize(record.roof) +
                      gridSize(record.snow) + gridSize(record.pollution) + gridSize(record.fog);
    stats.entityCount = record.entities.size();
    stats.groupCount = record.groupLeaders.size();

    std::vector<CreaturePtr> referenced;
    appendCreatures(entry.sleepingOccupants, referenced);
    appendCreatures(entry.containerOccupants, referenced);
    appendCreatures(entry.ownedAnimals, referenced);
    appendCreatures(entry.legacyParked, referenced);
    stats.worldReferenceCount = referenced.size();
    stats.worldReferenceBytes = estimateSerializedBytes(referenced);

    std::vector<CreaturePtr> owned;
    appendCreatures(entry.trackedCreatures, owned);
    stats.ownedCreatureCount = owned.size();
    stats.ownedCreatureBytes = estimateSerializedBytes(owned);

    stats.protectedCorpseCount = protectedCorpseCreatures.size();
    stats.protectedCorpseBytes = estimateSerializedBytes(protectedCorpseCreatures);

    stats.sleepingOccupants = entry.sleepingOccupants.size();
    stats.containerOccupants = entry.containerOccupants.size();
    stats.ownedAnimals = entry.ownedAnimals.size();
    stats.legacyParked = entry.legacyParked.size();
    return stats;
}

uint64_t SaveStatistics::estimateSerializedBytes(const std::vector<CreaturePtr>& creatures)
{
    if (creatures.empty()) {
        return 0;
    }
    try {
        auto buffer = std::make_shared<std::ostringstream>(std::ios::binary);
        {
            BinarySerial::Writer out(buffer);
            ArchiveWriter writer(out);
            writer.writeDeepList("estimate", creatures);
        }
        return static_cast<uint64_t>(buffer->str().size());
    } catch (const PersistenceError& e) {
        ARCHIVE_WARN("Size estimate failed: " + std::string(e.what()));
        return 0;
    }
}

std::string SaveStatistics::formatBytes(uint64_t bytes)
{
    char text[32];
    if (bytes >= 1024ull * 1024ull) {
        std::snprintf(text, sizeof(text), "%.2f MB", static_cast<double>(bytes) / (1024.0 * 1024.0));
    } else if (bytes >= 1024ull) {
        std::snprintf(text, sizeof(text), "%.1f KB", static_cast<double>(bytes) / 1024.0);
    } else {
        std::snprintf(text, sizeof(text), "%llu B", static_cast<unsigned long long>(bytes));
    }
    return text;
}

std::string SaveStatistics::describe() const
{
    std::string detail = "sleeping=" + std::to_string(sleepingOccupants) +
                         " container=" + std::to_string(containerOccupants) +
                         " animals=" + std::to_string(ownedAnimals);
    if (legacyParked > 0) {
        detail += " legacy=" + std::to_string(legacyParked);
    }

    return "Disk: " + formatBytes(archiveBytes) + " (grids raw=" + formatBytes(gridBytes) +
           ", entities=" + std::to_string(entityCount) + ", groups=" + std::to_string(groupCount) + ")" +
           " | Memory: " + formatBytes(memoryBytes()) + " (world refs=" + std::to_string(worldReferenceCount) +
           " [" + detail + "] ~" + formatBytes(worldReferenceBytes) +
           ", owned creatures=" + std::to_string(ownedCreatureCount) + " ~" + formatBytes(ownedCreatureBytes) +
           ", protected corpse creatures=" + std::to_string(protectedCorpseCount) + " ~" +
           formatBytes(protectedCorpseBytes) + ")";
}

} // namespace Strata
