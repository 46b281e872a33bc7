/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef TERRAIN_CATALOG_HPP
#define TERRAIN_CATALOG_HPP

#include <boost/container/flat_map.hpp>
#include <cstdint>
#include <string>

namespace Strata {

namespace TerrainIds {
    constexpr uint16_t NONE = 0;
    constexpr uint16_t SOIL = 1;
    constexpr uint16_t GRAVEL = 2;
    constexpr uint16_t MARSH = 3;
    constexpr uint16_t DEEP_WATER = 4;
    constexpr uint16_t WOOD_FLOOR = 10;
    constexpr uint16_t STONE_TILE = 11;
    constexpr uint16_t CONCRETE = 12;
}

namespace RoofIds {
    constexpr uint16_t NONE = 0;
    constexpr uint16_t CONSTRUCTED = 1;
    constexpr uint16_t THIN_ROCK = 2;
    constexpr uint16_t THICK_ROCK = 3;
}

struct TerrainDef
{
    uint16_t id{0};
    std::string name;
    bool constructedFloor{false};
    bool impassable{false};
};

/**
 * @brief Terrain and roof definitions by numeric id.
 *
 * Constructed floors sit on top of an under-terrain which is restored when
 * the floor is removed. Thick rock roofs hold themselves up; every other
 * roof needs a structure nearby.
 */
class TerrainCatalog {
public:
    static TerrainCatalog& Instance() {
        static TerrainCatalog instance;
        return instance;
    }

    void registerTerrain(const TerrainDef& def) { m_terrains[def.id] = def; }
    const TerrainDef* find(uint16_t id) const;

    bool isConstructedFloor(uint16_t id) const;
    bool isImpassable(uint16_t id) const;
    bool isSelfSupportingRoof(uint16_t roofId) const { return roofId == RoofIds::THICK_ROCK; }

    size_t size() const { return m_terrains.size(); }

private:
    TerrainCatalog();

    TerrainCatalog(const TerrainCatalog&) = delete;
    TerrainCatalog& operator=(const TerrainCatalog&) = delete;

    boost::container::flat_map<uint16_t, TerrainDef> m_terrains;
};

} // namespace Strata

#endif // TERRAIN_CATALOG_HPP
