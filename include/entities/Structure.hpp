/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef STRUCTURE_HPP
#define STRUCTURE_HPP

#include "entities/Creature.hpp"
#include "entities/Entity.hpp"
#include <boost/container/small_vector.hpp>
#include <cstdint>
#include <ostream>
#include <vector>

namespace Strata {

enum class StructureMaterial : uint8_t {
  Wood = 0,
  Metal = 1,
  Stone = 2,
  Abstract = 3,
  Unknown = 4
};

const char* getMaterialName(StructureMaterial material);

inline std::ostream& operator<<(std::ostream& os, StructureMaterial material) {
  return os << getMaterialName(material);
}

/**
 * @brief Built or natural solid object occupying one cell.
 *
 * Containers (beds, caskets, graves, shelves) hold other entities; held
 * entities are not placed in the region themselves and are deep-saved with
 * the container.
 */
class Structure : public Entity {
 public:
  using Contents = boost::container::small_vector<EntityPtr, 4>;

  Structure() : Structure("", StructureMaterial::Unknown) {}
  Structure(std::string defName, StructureMaterial material)
      : Entity(EntityCategory::Structure, std::move(defName)), m_material(material) {}

  StructureMaterial getMaterial() const { return m_material; }
  void setMaterial(StructureMaterial material) { m_material = material; }

  bool isNaturalRock() const { return m_naturalRock; }
  void setNaturalRock(bool naturalRock) { m_naturalRock = naturalRock; }

  bool isUnderConstruction() const { return m_underConstruction; }
  void setUnderConstruction(bool underConstruction) { m_underConstruction = underConstruction; }

  // Non-container structures block movement through their cell
  bool blocksMovement() const { return !m_isContainer; }

  bool isContainer() const { return m_isContainer; }
  void makeContainer(size_t capacity);
  size_t getCapacity() const { return m_capacity; }

  const Contents& getContents() const { return m_contents; }
  bool tryAccept(const EntityPtr& entity);
  bool removeContent(const Entity& entity);
  std::vector<EntityPtr> drainContents();
  CreaturePtr findCreatureOccupant() const;

  std::string getArchiveTag() const override { return "Structure"; }
  void save(ArchiveWriter& writer) const override;
  void load(ArchiveReader& reader) override;
  void postLoadInit() override;

 private:
  StructureMaterial m_material;
  bool m_naturalRock{false};
  bool m_underConstruction{false};
  bool m_isContainer{false};
  size_t m_capacity{0};
  Contents m_contents;
};

using StructurePtr = std::shared_ptr<Structure>;

}  // namespace Strata

#endif  // STRUCTURE_HPP
