/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "persistence/ArchiveRecord.hpp"
#include "entities/EntityFactory.hpp"
#include "persistence/ArchiveSession.hpp"

namespace Strata {

void ArchiveRecord::save(ArchiveWriter& writer) const
{
    writer.writeValue("abandonedAtTick", abandonedAtTick);
    writer.writeGrid("terrainGrid", terrain);
    writer.writeGrid("underTerrainGrid", underTerrain);
    writer.writeGrid("roofGrid", roof);
    writer.writeGrid("snowGrid", snow);
    writer.writeGrid("pollutionGrid", pollution);
    writer.writeGrid("fogGrid", fog);
    writer.writeDeepList("entities", entities);
    writer.writeDeepList("groupLeaders", groupLeaders);
}

void ArchiveRecord::load(ArchiveReader& reader)
{
    reader.readValue("abandonedAtTick", abandonedAtTick);
    reader.readGrid("terrainGrid", terrain);
    reader.readGrid("underTerrainGrid", underTerrain);
    reader.readGrid("roofGrid", roof);
    reader.readGrid("snowGrid", snow);
    reader.readGrid("pollutionGrid", pollution);
    reader.readGrid("fogGrid", fog);

    entities.clear();
    groupLeaders.clear();
    reader.readDeepList<Entity>("entities", entities, EntityFactory::deepFactory());
    reader.readDeepList<GroupController>("groupLeaders", groupLeaders, GroupController::deepFactory());
}

} // namespace Strata
