/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef ENTITY_HPP
#define ENTITY_HPP

#include "entities/Faction.hpp"
#include "persistence/Archivable.hpp"
#include "world/RegionTypes.hpp"
#include <cstdint>
#include <memory>
#include <ostream>
#include <string>

namespace Strata {

class Entity;
class Region;
class Structure;

// Smart pointer type aliases
using EntityPtr = std::shared_ptr<Entity>;
using EntityWeakPtr = std::weak_ptr<Entity>;

/**
 * @brief Transient category of an entity. Drives archive eligibility and
 * which decay rules apply.
 */
enum class EntityCategory : uint8_t {
    Structure = 0,
    Item = 1,
    Plant = 2,
    Creature = 3,
    Corpse = 4,
    Blueprint = 5,
    Effect = 6,
    Projectile = 7,
    FallingObject = 8
};

const char* getCategoryName(EntityCategory category);

inline std::ostream& operator<<(std::ostream& os, EntityCategory category) {
    return os << getCategoryName(category);
}

/**
 * @brief Base class for every object placed in a region.
 *
 * Plants, blueprints and short-lived effects use Entity directly; creatures,
 * items, corpses and structures carry extra state in subclasses. An entity
 * is identified by a process-unique id which survives archiving; its load
 * id is "Entity_<id>".
 */
class Entity : public ILoadReferenceable,
               public IArchivable,
               public std::enable_shared_from_this<Entity> {
 public:
  Entity() : Entity(EntityCategory::Item, "") {}
  Entity(EntityCategory category, std::string defName);

  /**
   * @brief Virtual destructor
   *
   * Do NOT call shared_from_this() here: by the time the destructor runs the
   * owning shared_ptr is gone.
   */
  ~Entity() override = default;

  /**
   * @brief Helper to get a shared_ptr to this object
   * @throws std::bad_weak_ptr if the object is not owned by a shared_ptr
   */
  EntityPtr shared_this() { return shared_from_this(); }

  EntityID getID() const { return m_id; }
  const std::string& getDefName() const { return m_defName; }
  EntityCategory getCategory() const { return m_category; }

  CellPos getPosition() const { return m_position; }
  void setPosition(const CellPos& position) { m_position = position; }
  Rotation getRotation() const { return m_rotation; }
  void setRotation(Rotation rotation) { m_rotation = rotation; }

  int getHitPoints() const { return m_hitPoints; }
  int getMaxHitPoints() const { return m_maxHitPoints; }
  void setHitPoints(int hitPoints);
  void setMaxHitPoints(int maxHitPoints);

  bool isDestroyed() const { return m_destroyed; }
  void markDestroyed() { m_destroyed = true; }

  // Region the entity is placed in, nullptr when unplaced or inside a container
  Region* getRegion() const { return m_region; }
  bool isSpawned() const { return m_region != nullptr; }

  // Container currently holding this entity, if any
  Structure* getHolder() const { return m_holder; }
  void setHolder(Structure* holder) { m_holder = holder; }

  const FactionPtr& getFaction() const { return m_faction; }
  void setFaction(FactionPtr faction) { m_faction = std::move(faction); }
  bool isPlayerAffiliated() const { return m_faction && m_faction->isPlayer(); }

  std::string getUniqueLoadId() const override { return "Entity_" + std::to_string(m_id); }

  std::string getArchiveTag() const override { return "Entity"; }
  void save(ArchiveWriter& writer) const override;
  void load(ArchiveReader& reader) override;
  void resolveReferences(CrossReferenceResolver& resolver) override;

 protected:
  friend class Region;
  void setRegion(Region* region) { m_region = region; }

 private:
  EntityID m_id;
  std::string m_defName;
  EntityCategory m_category;
  CellPos m_position{};
  Rotation m_rotation{Rotation::North};
  int m_hitPoints{100};
  int m_maxHitPoints{100};
  bool m_destroyed{false};
  Region* m_region{nullptr};
  Structure* m_holder{nullptr};
  FactionPtr m_faction;
  std::string m_pendingFactionRef;
};

}  // namespace Strata

#endif  // ENTITY_HPP
