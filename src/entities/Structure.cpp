/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "entities/Structure.hpp"
#include "entities/EntityFactory.hpp"
#include "persistence/ArchiveSession.hpp"
#include <algorithm>

namespace Strata {

const char* getMaterialName(StructureMaterial material) {
  switch (material) {
    case StructureMaterial::Wood: return "Wood";
    case StructureMaterial::Metal: return "Metal";
    case StructureMaterial::Stone: return "Stone";
    case StructureMaterial::Abstract: return "Abstract";
    case StructureMaterial::Unknown: return "Unknown";
    default: return "Unknown";
  }
}

void Structure::makeContainer(size_t capacity) {
  m_isContainer = capacity > 0;
  m_capacity = capacity;
}

bool Structure::tryAccept(const EntityPtr& entity) {
  if (!entity || !m_isContainer || m_contents.size() >= m_capacity ||
      entity->isSpawned() || entity->getHolder() != nullptr) {
    return false;
  }
  entity->setHolder(this);
  entity->setPosition(getPosition());
  m_contents.push_back(entity);
  return true;
}

bool Structure::removeContent(const Entity& entity) {
  auto it = std::find_if(m_contents.begin(), m_contents.end(),
                         [&entity](const EntityPtr& held) { return held.get() == &entity; });
  if (it == m_contents.end()) {
    return false;
  }
  (*it)->setHolder(nullptr);
  m_contents.erase(it);
  return true;
}

std::vector<EntityPtr> Structure::drainContents() {
  std::vector<EntityPtr> drained(m_contents.begin(), m_contents.end());
  for (const auto& held : drained) {
    held->setHolder(nullptr);
  }
  m_contents.clear();
  return drained;
}

CreaturePtr Structure::findCreatureOccupant() const {
  for (const auto& held : m_contents) {
    if (auto creature = std::dynamic_pointer_cast<Creature>(held)) {
      return creature;
    }
  }
  return nullptr;
}

void Structure::save(ArchiveWriter& writer) const {
  Entity::save(writer);
  writer.writeValue("material", static_cast<uint8_t>(m_material));
  writer.writeBool("naturalRock", m_naturalRock);
  writer.writeBool("underConstruction", m_underConstruction);
  writer.writeValue("capacity", static_cast<uint32_t>(m_capacity));
  writer.writeDeepList("contents", m_contents);
}

void Structure::load(ArchiveReader& reader) {
  Entity::load(reader);
  uint8_t material = 0;
  uint32_t capacity = 0;
  reader.readValue("material", material);
  m_naturalRock = reader.readBool("naturalRock");
  m_underConstruction = reader.readBool("underConstruction");
  reader.readValue("capacity", capacity);

  m_material = material <= static_cast<uint8_t>(StructureMaterial::Unknown)
                   ? static_cast<StructureMaterial>(material)
                   : StructureMaterial::Unknown;
  makeContainer(capacity);

  m_contents.clear();
  reader.readDeepList<Entity>("contents", m_contents, EntityFactory::deepFactory());
}

void Structure::postLoadInit() {
  for (const auto& held : m_contents) {
    held->setHolder(this);
    held->setPosition(getPosition());
  }
}

}  // namespace Strata
