/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef CREATURE_HPP
#define CREATURE_HPP

#include "entities/Entity.hpp"
#include <string>

namespace Strata {

class Creature : public Entity {
 public:
  Creature() : Creature("", false) {}
  Creature(std::string defName, bool humanlike)
      : Entity(EntityCategory::Creature, std::move(defName)), m_humanlike(humanlike) {}

  bool isHumanlike() const { return m_humanlike; }

  const std::string& getCurrentTask() const { return m_currentTask; }
  void setCurrentTask(std::string task) { m_currentTask = std::move(task); }
  const std::string& getDuty() const { return m_duty; }
  void setDuty(std::string duty) { m_duty = std::move(duty); }

  // Drops whatever the creature was doing; used when it is placed back
  // into a region it did not walk into
  void clearBehaviorState() {
    m_currentTask.clear();
    m_duty.clear();
  }

  uint64_t getGroupId() const { return m_groupId; }
  void setGroupId(uint64_t groupId) { m_groupId = groupId; }

  std::string getArchiveTag() const override { return "Creature"; }
  void save(ArchiveWriter& writer) const override;
  void load(ArchiveReader& reader) override;

 private:
  bool m_humanlike{false};
  std::string m_currentTask;
  std::string m_duty;
  uint64_t m_groupId{0};
};

using CreaturePtr = std::shared_ptr<Creature>;

}  // namespace Strata

#endif  // CREATURE_HPP
