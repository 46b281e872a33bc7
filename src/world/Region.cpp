/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "world/Region.hpp"
#include "core/Logger.hpp"
#include "world/TerrainCatalog.hpp"
#include "world/World.hpp"
#include <algorithm>
#include <cstdlib>
#include <stdexcept>

namespace Strata {

namespace {

bool providesRoofSupport(const EntityPtr& entity)
{
    const auto* structure = dynamic_cast<const Structure*>(entity.get());
    return structure && !structure->isUnderConstruction() && !structure->isDestroyed();
}

} // namespace

Region::Region(RegionId id, TileId tileId, int width, int height, World& world)
    : m_id(id),
      m_tileId(tileId),
      m_width(std::max(1, width)),
      m_height(std::max(1, height)),
      m_world(world),
      m_groupManager(*this)
{
    const size_t cells = getCellCount();
    m_terrain.assign(cells, TerrainIds::SOIL);
    m_underTerrain.assign(cells, TerrainIds::SOIL);
    m_roof.assign(cells, RoofIds::NONE);
    m_snow.assign(cells, 0);
    m_fog.assign(cells, 1);
    m_roofSupport.assign(cells, 0);
}

Region::~Region()
{
    // Entities can outlive the region through the world registry
    for (const auto& entity : m_entities) {
        entity->setRegion(nullptr);
    }
}

bool Region::inBounds(const CellPos& cell) const
{
    return cell.x >= 0 && cell.z >= 0 && cell.x < m_width && cell.z < m_height;
}

size_t Region::cellIndex(const CellPos& cell) const
{
    if (!inBounds(cell)) {
        throw std::out_of_range("Cell (" + std::to_string(cell.x) + ", " + std::to_string(cell.z) +
                                ") outside region " + std::to_string(m_id));
    }
    return static_cast<size_t>(cell.z) * static_cast<size_t>(m_width) + static_cast<size_t>(cell.x);
}

CellPos Region::cellAt(size_t index) const
{
    return CellPos{static_cast<int32_t>(index % static_cast<size_t>(m_width)),
                   static_cast<int32_t>(index / static_cast<size_t>(m_width))};
}

// ----------------------------------------------------------------------------
// Entities
// ----------------------------------------------------------------------------

void Region::spawn(const EntityPtr& entity, const CellPos& cell, Rotation rotation)
{
    if (!entity) {
        throw std::invalid_argument("Cannot spawn a null entity");
    }
    if (!inBounds(cell)) {
        throw std::out_of_range("Spawn cell (" + std::to_string(cell.x) + ", " + std::to_string(cell.z) +
                                ") outside region " + std::to_string(m_id));
    }
    if (entity->isSpawned()) {
        throw std::logic_error("Entity " + entity->getUniqueLoadId() + " is already placed");
    }

    if (Structure* holder = entity->getHolder()) {
        holder->removeContent(*entity);
    }

    m_world.adopt(entity);

    entity->setPosition(cell);
    entity->setRotation(rotation);
    entity->setRegion(this);
    m_entities.push_back(entity);

    if (entity->getCategory() == EntityCategory::Structure) {
        m_supportDirty = true;
    }
}

bool Region::despawn(const EntityPtr& entity)
{
    if (!entity) {
        return false;
    }
    auto it = std::find(m_entities.begin(), m_entities.end(), entity);
    if (it == m_entities.end()) {
        return false;
    }
    m_entities.erase(it);
    entity->setRegion(nullptr);

    if (entity->getCategory() == EntityCategory::Structure) {
        onStructureRemoved(entity->getPosition());
    }
    return true;
}

void Region::destroy(const EntityPtr& entity, DestroyMode mode)
{
    if (!entity) {
        return;
    }

    if (auto structure = std::dynamic_pointer_cast<Structure>(entity)) {
        releaseContents(*structure, mode);
    }

    despawn(entity);

    auto creature = std::dynamic_pointer_cast<Creature>(entity);
    if (creature) {
        removeFromGroups(*creature);
    }

    if (mode == DestroyMode::Kill && creature) {
        m_world.getRegistry().passToDead(creature);
        return;
    }

    entity->markDestroyed();
    m_world.getRegistry().remove(*entity);
    m_world.forget(*entity);
}

void Region::releaseContents(Structure& structure, DestroyMode mode)
{
    const CellPos cell = structure.getPosition();
    for (const auto& held : structure.drainContents()) {
        auto creature = std::dynamic_pointer_cast<Creature>(held);
        if (creature && mode == DestroyMode::Kill) {
            m_world.getRegistry().passToDead(creature);
            continue;
        }
        if (creature && mode == DestroyMode::Deteriorate && !creature->isDestroyed()) {
            auto freeCell = findStandableNear(cell, 8);
            spawn(creature, freeCell ? *freeCell : cell, creature->getRotation());
            REGION_DEBUG("Ejected " + creature->getUniqueLoadId() + " from crumbling " +
                         structure.getDefName());
            continue;
        }
        held->markDestroyed();
        m_world.getRegistry().remove(*held);
        m_world.forget(*held);
    }
}

void Region::removeFromGroups(const Creature& creature)
{
    if (creature.getGroupId() == 0) {
        return;
    }
    for (const auto& group : m_groupManager.getGroups()) {
        if (group->removeOwned(creature)) {
            return;
        }
    }
}

void Region::discardAll()
{
    const std::vector<EntityPtr> snapshot = m_entities;
    size_t passedToWorld = 0;

    for (const auto& entity : snapshot) {
        auto creature = std::dynamic_pointer_cast<Creature>(entity);
        if (creature && creature->isHumanlike() && !creature->isDestroyed()) {
            despawn(entity);
            m_world.getRegistry().passToWorld(creature, RetentionPolicy::Discard);
            ++passedToWorld;
            continue;
        }

        if (auto structure = std::dynamic_pointer_cast<Structure>(entity)) {
            for (const auto& held : structure->drainContents()) {
                auto occupant = std::dynamic_pointer_cast<Creature>(held);
                if (occupant && occupant->isHumanlike() && !occupant->isDestroyed()) {
                    m_world.getRegistry().passToWorld(occupant, RetentionPolicy::Discard);
                    ++passedToWorld;
                } else {
                    m_world.forget(*held);
                }
            }
        }

        despawn(entity);
        m_world.forget(*entity);
    }

    m_groupManager.clear();
    m_pendingCollapses.clear();
    REGION_INFO("Region " + std::to_string(m_id) + " discarded; " + std::to_string(passedToWorld) +
                " humanlike creatures passed to world");
}

std::vector<CreaturePtr> Region::getCreatures() const
{
    std::vector<CreaturePtr> result;
    for (const auto& entity : m_entities) {
        if (auto creature = std::dynamic_pointer_cast<Creature>(entity)) {
            result.push_back(std::move(creature));
        }
    }
    return result;
}

std::vector<StructurePtr> Region::getContainers() const
{
    std::vector<StructurePtr> result;
    for (const auto& entity : m_entities) {
        auto structure = std::dynamic_pointer_cast<Structure>(entity);
        if (structure && structure->isContainer()) {
            result.push_back(std::move(structure));
        }
    }
    return result;
}

StructurePtr Region::getContainerAt(const CellPos& cell) const
{
    for (const auto& entity : m_entities) {
        if (entity->getPosition() != cell) {
            continue;
        }
        auto structure = std::dynamic_pointer_cast<Structure>(entity);
        if (structure && structure->isContainer() && !structure->isDestroyed()) {
            return structure;
        }
    }
    return nullptr;
}

bool Region::isStandable(const CellPos& cell) const
{
    if (!inBounds(cell) || TerrainCatalog::Instance().isImpassable(getTerrain(cell))) {
        return false;
    }
    for (const auto& entity : m_entities) {
        if (entity->getPosition() != cell) {
            continue;
        }
        const auto* structure = dynamic_cast<const Structure*>(entity.get());
        if (structure && structure->blocksMovement()) {
            return false;
        }
    }
    return true;
}

std::optional<CellPos> Region::findStandableNear(const CellPos& origin, int radius) const
{
    // Expanding Chebyshev rings so the closest ring wins
    for (int ring = 0; ring <= radius; ++ring) {
        for (int dz = -ring; dz <= ring; ++dz) {
            for (int dx = -ring; dx <= ring; ++dx) {
                if (std::max(std::abs(dx), std::abs(dz)) != ring) {
                    continue;
                }
                const CellPos candidate{origin.x + dx, origin.z + dz};
                if (isStandable(candidate)) {
                    return candidate;
                }
            }
        }
    }
    return std::nullopt;
}

std::optional<CellPos> Region::findRandomStandable(std::mt19937& rng) const
{
    const size_t cells = getCellCount();
    std::uniform_int_distribution<size_t> pick(0, cells - 1);
    for (int attempt = 0; attempt < 64; ++attempt) {
        const CellPos candidate = cellAt(pick(rng));
        if (isStandable(candidate)) {
            return candidate;
        }
    }
    // Crowded map: sweep from a random start
    const size_t start = pick(rng);
    for (size_t i = 0; i < cells; ++i) {
        const CellPos candidate = cellAt((start + i) % cells);
        if (isStandable(candidate)) {
            return candidate;
        }
    }
    return std::nullopt;
}

// ----------------------------------------------------------------------------
// Terrain
// ----------------------------------------------------------------------------

void Region::setTerrain(const CellPos& cell, uint16_t terrainId)
{
    const size_t index = cellIndex(cell);
    const auto& catalog = TerrainCatalog::Instance();
    if (catalog.isConstructedFloor(terrainId)) {
        if (!catalog.isConstructedFloor(m_terrain[index])) {
            m_underTerrain[index] = m_terrain[index];
        }
    } else {
        m_underTerrain[index] = terrainId;
    }
    m_terrain[index] = terrainId;
}

bool Region::hasConstructedFloor(const CellPos& cell) const
{
    return TerrainCatalog::Instance().isConstructedFloor(getTerrain(cell));
}

bool Region::removeFloor(const CellPos& cell)
{
    if (!hasConstructedFloor(cell)) {
        return false;
    }
    const size_t index = cellIndex(cell);
    uint16_t under = m_underTerrain[index];
    if (under == TerrainIds::NONE || TerrainCatalog::Instance().isConstructedFloor(under)) {
        under = TerrainIds::SOIL;
    }
    m_terrain[index] = under;
    m_underTerrain[index] = under;
    return true;
}

// ----------------------------------------------------------------------------
// Roofs and structural support
// ----------------------------------------------------------------------------

void Region::setRoof(const CellPos& cell, uint16_t roofId)
{
    m_roof[cellIndex(cell)] = roofId;
    if (roofId != RoofIds::NONE && !m_restorationInProgress) {
        checkRoofSupport(cell);
    }
}

float Region::getRoofCoverage() const
{
    const auto roofed = std::count_if(m_roof.begin(), m_roof.end(),
                                      [](uint16_t roof) { return roof != RoofIds::NONE; });
    return static_cast<float>(roofed) / static_cast<float>(m_roof.size());
}

void Region::recomputeStructuralSupport()
{
    std::fill(m_roofSupport.begin(), m_roofSupport.end(), 0);

    for (const auto& entity : m_entities) {
        if (!providesRoofSupport(entity)) {
            continue;
        }
        const CellPos origin = entity->getPosition();
        const int minX = std::max(0, origin.x - ROOF_SUPPORT_RANGE);
        const int maxX = std::min(m_width - 1, origin.x + ROOF_SUPPORT_RANGE);
        const int minZ = std::max(0, origin.z - ROOF_SUPPORT_RANGE);
        const int maxZ = std::min(m_height - 1, origin.z + ROOF_SUPPORT_RANGE);
        for (int z = minZ; z <= maxZ; ++z) {
            for (int x = minX; x <= maxX; ++x) {
                m_roofSupport[static_cast<size_t>(z) * static_cast<size_t>(m_width) + static_cast<size_t>(x)] = 1;
            }
        }
    }

    const auto& catalog = TerrainCatalog::Instance();
    for (size_t i = 0; i < m_roof.size(); ++i) {
        if (catalog.isSelfSupportingRoof(m_roof[i])) {
            m_roofSupport[i] = 1;
        }
    }
    m_supportDirty = false;
}

bool Region::isRoofSupported(const CellPos& cell) const
{
    const size_t index = cellIndex(cell);
    if (!m_supportDirty) {
        return m_roofSupport[index] != 0;
    }

    if (TerrainCatalog::Instance().isSelfSupportingRoof(m_roof[index])) {
        return true;
    }
    return std::any_of(m_entities.begin(), m_entities.end(), [&cell](const EntityPtr& entity) {
        return providesRoofSupport(entity) &&
               entity->getPosition().chebyshevDistance(cell) <= ROOF_SUPPORT_RANGE;
    });
}

void Region::checkRoofSupport(const CellPos& cell)
{
    if (m_supportDirty) {
        recomputeStructuralSupport();
    }
    if (isRoofed(cell) && !isRoofSupported(cell)) {
        queueCollapse(cell);
    }
}

void Region::queueCollapse(const CellPos& cell)
{
    if (std::find(m_pendingCollapses.begin(), m_pendingCollapses.end(), cell) == m_pendingCollapses.end()) {
        m_pendingCollapses.push_back(cell);
    }
}

void Region::onStructureRemoved(const CellPos& cell)
{
    m_supportDirty = true;
    if (m_restorationInProgress) {
        return;
    }

    recomputeStructuralSupport();
    const int minX = std::max(0, cell.x - ROOF_SUPPORT_RANGE);
    const int maxX = std::min(m_width - 1, cell.x + ROOF_SUPPORT_RANGE);
    const int minZ = std::max(0, cell.z - ROOF_SUPPORT_RANGE);
    const int maxZ = std::min(m_height - 1, cell.z + ROOF_SUPPORT_RANGE);
    for (int z = minZ; z <= maxZ; ++z) {
        for (int x = minX; x <= maxX; ++x) {
            const CellPos nearby{x, z};
            if (isRoofed(nearby) && !isRoofSupported(nearby)) {
                queueCollapse(nearby);
            }
        }
    }
}

// ----------------------------------------------------------------------------
// Snow, pollution, fog
// ----------------------------------------------------------------------------

void Region::enablePollutionFeature(bool enabled)
{
    if (enabled && !m_pollution) {
        m_pollution.emplace(getCellCount(), 0);
    } else if (!enabled) {
        m_pollution.reset();
    }
}

bool Region::isPolluted(const CellPos& cell) const
{
    return m_pollution && (*m_pollution)[cellIndex(cell)] != 0;
}

void Region::setPolluted(const CellPos& cell, bool polluted)
{
    if (!m_pollution) {
        REGION_WARN("Region " + std::to_string(m_id) + " has no pollution layer; ignoring update");
        return;
    }
    (*m_pollution)[cellIndex(cell)] = polluted ? 1 : 0;
}

void Region::refogAll()
{
    std::fill(m_fog.begin(), m_fog.end(), 1);
}

void Region::setFogged(const CellPos& cell, bool fogged)
{
    uint8_t& value = m_fog[cellIndex(cell)];
    if (!fogged && value != 0 && !m_restorationInProgress) {
        ++m_revealNotifications;
    }
    value = fogged ? 1 : 0;
}

// ----------------------------------------------------------------------------
// Components
// ----------------------------------------------------------------------------

void Region::addComponent(std::shared_ptr<RegionComponent> component)
{
    if (!component) {
        return;
    }
    if (&component->getRegion() != this) {
        REGION_ERROR("Component belongs to another region; not added to region " + std::to_string(m_id));
        return;
    }
    m_components.push_back(std::move(component));
}

} // namespace Strata
