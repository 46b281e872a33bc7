/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "entities/Entity.hpp"
#include "persistence/ArchiveSession.hpp"
#include <algorithm>

namespace Strata {

const char* getCategoryName(EntityCategory category) {
  switch (category) {
    case EntityCategory::Structure: return "Structure";
    case EntityCategory::Item: return "Item";
    case EntityCategory::Plant: return "Plant";
    case EntityCategory::Creature: return "Creature";
    case EntityCategory::Corpse: return "Corpse";
    case EntityCategory::Blueprint: return "Blueprint";
    case EntityCategory::Effect: return "Effect";
    case EntityCategory::Projectile: return "Projectile";
    case EntityCategory::FallingObject: return "FallingObject";
    default: return "Unknown";
  }
}

Entity::Entity(EntityCategory category, std::string defName)
    : m_id(UniqueID::generate()),
      m_defName(std::move(defName)),
      m_category(category) {}

void Entity::setHitPoints(int hitPoints) {
  m_hitPoints = std::clamp(hitPoints, 0, m_maxHitPoints);
}

void Entity::setMaxHitPoints(int maxHitPoints) {
  m_maxHitPoints = std::max(1, maxHitPoints);
  m_hitPoints = std::min(m_hitPoints, m_maxHitPoints);
}

void Entity::save(ArchiveWriter& writer) const {
  writer.writeValue("id", m_id);
  writer.writeString("def", m_defName);
  writer.writeValue("category", static_cast<uint8_t>(m_category));
  writer.writeValue("position", m_position);
  writer.writeValue("rotation", static_cast<uint8_t>(m_rotation));
  writer.writeValue("hitPoints", static_cast<int32_t>(m_hitPoints));
  writer.writeValue("maxHitPoints", static_cast<int32_t>(m_maxHitPoints));
  writer.writeBool("destroyed", m_destroyed);
  writer.writeReference("faction", m_faction.get());
}

void Entity::load(ArchiveReader& reader) {
  uint8_t category = 0;
  uint8_t rotation = 0;
  int32_t hitPoints = 0;
  int32_t maxHitPoints = 0;

  reader.readValue("id", m_id);
  reader.readString("def", m_defName);
  reader.readValue("category", category);
  reader.readValue("position", m_position);
  reader.readValue("rotation", rotation);
  reader.readValue("hitPoints", hitPoints);
  reader.readValue("maxHitPoints", maxHitPoints);
  m_destroyed = reader.readBool("destroyed");
  m_pendingFactionRef = reader.readReference("faction");

  if (category > static_cast<uint8_t>(EntityCategory::FallingObject)) {
    throw ArchiveFormatError("invalid entity category " + std::to_string(category));
  }
  m_category = static_cast<EntityCategory>(category);
  m_rotation = static_cast<Rotation>(rotation & 3);
  m_maxHitPoints = std::max(1, static_cast<int>(maxHitPoints));
  m_hitPoints = std::clamp(static_cast<int>(hitPoints), 0, m_maxHitPoints);
  m_faction.reset();

  UniqueID::reserve(m_id);
}

void Entity::resolveReferences(CrossReferenceResolver& resolver) {
  m_faction = resolver.resolve<Faction>(m_pendingFactionRef);
  m_pendingFactionRef.clear();
}

}  // namespace Strata
