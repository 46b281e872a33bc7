/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "world/TerrainCatalog.hpp"

namespace Strata {

TerrainCatalog::TerrainCatalog()
{
    registerTerrain({TerrainIds::SOIL, "soil", false, false});
    registerTerrain({TerrainIds::GRAVEL, "gravel", false, false});
    registerTerrain({TerrainIds::MARSH, "marsh", false, false});
    registerTerrain({TerrainIds::DEEP_WATER, "deep_water", false, true});
    registerTerrain({TerrainIds::WOOD_FLOOR, "wood_floor", true, false});
    registerTerrain({TerrainIds::STONE_TILE, "stone_tile", true, false});
    registerTerrain({TerrainIds::CONCRETE, "concrete", true, false});
}

const TerrainDef* TerrainCatalog::find(uint16_t id) const
{
    auto it = m_terrains.find(id);
    return it != m_terrains.end() ? &it->second : nullptr;
}

bool TerrainCatalog::isConstructedFloor(uint16_t id) const
{
    const TerrainDef* def = find(id);
    return def && def->constructedFloor;
}

bool TerrainCatalog::isImpassable(uint16_t id) const
{
    const TerrainDef* def = find(id);
    return def && def->impassable;
}

} // namespace Strata
