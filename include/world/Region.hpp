/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef REGION_HPP
#define REGION_HPP

#include "entities/Creature.hpp"
#include "entities/Entity.hpp"
#include "entities/Structure.hpp"
#include "world/GroupController.hpp"
#include "world/RegionComponent.hpp"
#include "world/RegionTypes.hpp"
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <random>
#include <vector>

namespace Strata {

class World;

/**
 * @brief How an entity leaves the region when destroyed.
 */
enum class DestroyMode : uint8_t {
    Vanish,      // entity and contents disappear without a trace
    Kill,        // creatures (including held occupants) go to the dead store
    Deteriorate  // entity crumbles; held creatures are put out alive, other contents vanish
};

/**
 * @brief One active map: cell grids plus the entities placed on them.
 *
 * Grid layers are stored row-major (index = z * width + x):
 * terrain and under-terrain (u16), roof (u16), snow depth (u8), optional
 * pollution (u8 flag) and fog (u8 flag, 1 = fogged).
 *
 * While restoration is in progress, proactive roof collapse checks and
 * "newly revealed area" notifications are suppressed.
 */
class Region {
public:
    static constexpr int ROOF_SUPPORT_RANGE = 6;

    Region(RegionId id, TileId tileId, int width, int height, World& world);
    ~Region();

    Region(const Region&) = delete;
    Region& operator=(const Region&) = delete;

    RegionId getId() const { return m_id; }
    TileId getTileId() const { return m_tileId; }
    int getWidth() const { return m_width; }
    int getHeight() const { return m_height; }
    size_t getCellCount() const { return static_cast<size_t>(m_width) * static_cast<size_t>(m_height); }
    bool inBounds(const CellPos& cell) const;
    size_t cellIndex(const CellPos& cell) const;
    CellPos cellAt(size_t index) const;

    World& getWorld() const { return m_world; }

    // ------------------------------------------------------------------
    // Entities
    // ------------------------------------------------------------------

    /**
     * @brief Places an entity and registers its identity.
     * @throws std::out_of_range if the cell is outside the grid
     * @throws std::logic_error if the entity is already placed
     * @throws IdentityCollisionError if another live object holds its load id
     */
    void spawn(const EntityPtr& entity, const CellPos& cell, Rotation rotation = Rotation::North);

    // Removes from the grid; identity and world registrations are untouched
    bool despawn(const EntityPtr& entity);

    void destroy(const EntityPtr& entity, DestroyMode mode);
    void vanish(const EntityPtr& entity) { destroy(entity, DestroyMode::Vanish); }

    /**
     * @brief Host-side deactivation: humanlike creatures leave for the world
     * registry, everything else vanishes, groups are dropped.
     */
    void discardAll();

    const std::vector<EntityPtr>& getEntities() const { return m_entities; }
    std::vector<CreaturePtr> getCreatures() const;
    std::vector<StructurePtr> getContainers() const;
    StructurePtr getContainerAt(const CellPos& cell) const;
    size_t getEntityCount() const { return m_entities.size(); }

    bool isStandable(const CellPos& cell) const;
    std::optional<CellPos> findStandableNear(const CellPos& origin, int radius) const;
    std::optional<CellPos> findRandomStandable(std::mt19937& rng) const;

    // ------------------------------------------------------------------
    // Terrain
    // ------------------------------------------------------------------

    uint16_t getTerrain(const CellPos& cell) const { return m_terrain[cellIndex(cell)]; }
    uint16_t getUnderTerrain(const CellPos& cell) const { return m_underTerrain[cellIndex(cell)]; }
    // Laying a constructed floor remembers the terrain beneath it
    void setTerrain(const CellPos& cell, uint16_t terrainId);
    bool hasConstructedFloor(const CellPos& cell) const;
    bool removeFloor(const CellPos& cell);

    // ------------------------------------------------------------------
    // Roofs and structural support
    // ------------------------------------------------------------------

    uint16_t getRoof(const CellPos& cell) const { return m_roof[cellIndex(cell)]; }
    void setRoof(const CellPos& cell, uint16_t roofId);
    bool isRoofed(const CellPos& cell) const { return getRoof(cell) != 0; }
    // Fraction of cells with any roof, in [0, 1]
    float getRoofCoverage() const;

    void recomputeStructuralSupport();
    bool isRoofSupported(const CellPos& cell) const;
    const std::vector<CellPos>& getPendingCollapses() const { return m_pendingCollapses; }
    void clearPendingCollapses() { m_pendingCollapses.clear(); }

    // ------------------------------------------------------------------
    // Snow, pollution, fog
    // ------------------------------------------------------------------

    uint8_t getSnowDepth(const CellPos& cell) const { return m_snow[cellIndex(cell)]; }
    void setSnowDepth(const CellPos& cell, uint8_t depth) { m_snow[cellIndex(cell)] = depth; }

    bool hasPollutionFeature() const { return m_pollution.has_value(); }
    void enablePollutionFeature(bool enabled);
    bool isPolluted(const CellPos& cell) const;
    void setPolluted(const CellPos& cell, bool polluted);

    bool isFogged(const CellPos& cell) const { return m_fog[cellIndex(cell)] != 0; }
    void refogAll();
    // Revealing a cell raises a notification unless restoration is in progress
    void setFogged(const CellPos& cell, bool fogged);
    void unfog(const CellPos& cell) { setFogged(cell, false); }
    size_t getRevealNotificationCount() const { return m_revealNotifications; }

    // ------------------------------------------------------------------
    // Restoration gate, groups, components
    // ------------------------------------------------------------------

    bool isRestorationInProgress() const { return m_restorationInProgress; }
    void setRestorationInProgress(bool inProgress) { m_restorationInProgress = inProgress; }

    GroupManager& getGroupManager() { return m_groupManager; }
    const GroupManager& getGroupManager() const { return m_groupManager; }

    void addComponent(std::shared_ptr<RegionComponent> component);
    const std::vector<std::shared_ptr<RegionComponent>>& getComponents() const { return m_components; }

    template <typename T>
    std::shared_ptr<T> findComponent() const {
        for (const auto& component : m_components) {
            if (auto typed = std::dynamic_pointer_cast<T>(component)) {
                return typed;
            }
        }
        return nullptr;
    }

private:
    void releaseContents(Structure& structure, DestroyMode mode);
    void onStructureRemoved(const CellPos& cell);
    void checkRoofSupport(const CellPos& cell);
    void queueCollapse(const CellPos& cell);
    void removeFromGroups(const Creature& creature);

    RegionId m_id;
    TileId m_tileId;
    int m_width;
    int m_height;
    World& m_world;

    std::vector<EntityPtr> m_entities;

    std::vector<uint16_t> m_terrain;
    std::vector<uint16_t> m_underTerrain;
    std::vector<uint16_t> m_roof;
    std::vector<uint8_t> m_snow;
    std::optional<std::vector<uint8_t>> m_pollution;
    std::vector<uint8_t> m_fog;

    std::vector<uint8_t> m_roofSupport;
    bool m_supportDirty{true};
    std::vector<CellPos> m_pendingCollapses;

    bool m_restorationInProgress{false};
    size_t m_revealNotifications{0};

    GroupManager m_groupManager;
    std::vector<std::shared_ptr<RegionComponent>> m_components;
};

} // namespace Strata

#endif // REGION_HPP
