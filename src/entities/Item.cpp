/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "entities/Item.hpp"
#include "entities/Corpse.hpp"
#include "core/Logger.hpp"
#include "persistence/ArchiveSession.hpp"

namespace Strata {

void Item::save(ArchiveWriter& writer) const {
  Entity::save(writer);
  writer.writeValue("stackCount", static_cast<int32_t>(m_stackCount));
  writer.writeValue("rotProgress", m_rotProgress);
  writer.writeValue("rotThreshold", m_rotThreshold);
}

void Item::load(ArchiveReader& reader) {
  Entity::load(reader);
  int32_t stackCount = 1;
  reader.readValue("stackCount", stackCount);
  reader.readValue("rotProgress", m_rotProgress);
  reader.readValue("rotThreshold", m_rotThreshold);
  m_stackCount = stackCount;
}

void Corpse::save(ArchiveWriter& writer) const {
  Item::save(writer);
  writer.writeReference("innerCreature", m_innerCreature.get());
}

void Corpse::load(ArchiveReader& reader) {
  Item::load(reader);
  m_pendingInnerRef = reader.readReference("innerCreature");
}

void Corpse::resolveReferences(CrossReferenceResolver& resolver) {
  Item::resolveReferences(resolver);
  m_innerCreature = resolver.resolve<Creature>(m_pendingInnerRef);
}

void Corpse::postLoadInit() {
  if (!m_innerCreature && !m_pendingInnerRef.empty()) {
    WORLD_WARN("Corpse " + getUniqueLoadId() + " lost its inner creature " + m_pendingInnerRef);
  }
  m_pendingInnerRef.clear();
}

}  // namespace Strata
