/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "entities/Creature.hpp"
#include "persistence/ArchiveSession.hpp"

namespace Strata {

void Creature::save(ArchiveWriter& writer) const {
  Entity::save(writer);
  writer.writeBool("humanlike", m_humanlike);
  writer.writeString("task", m_currentTask);
  writer.writeString("duty", m_duty);
  writer.writeValue("groupId", m_groupId);
}

void Creature::load(ArchiveReader& reader) {
  Entity::load(reader);
  m_humanlike = reader.readBool("humanlike");
  reader.readString("task", m_currentTask);
  reader.readString("duty", m_duty);
  reader.readValue("groupId", m_groupId);
}

}  // namespace Strata
