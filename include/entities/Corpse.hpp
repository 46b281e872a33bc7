/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef CORPSE_HPP
#define CORPSE_HPP

#include "entities/Creature.hpp"
#include "entities/Item.hpp"

namespace Strata {

/**
 * @brief Remains of a creature. The creature itself lives on in the world
 * registry's remembered-dead store; the corpse only references it.
 */
class Corpse : public Item {
 public:
  Corpse() : Item(EntityCategory::Corpse, "") {}
  explicit Corpse(CreaturePtr innerCreature)
      : Item(EntityCategory::Corpse,
             innerCreature ? "corpse_" + innerCreature->getDefName() : "corpse"),
        m_innerCreature(std::move(innerCreature)) {}

  const CreaturePtr& getInnerCreature() const { return m_innerCreature; }

  std::string getArchiveTag() const override { return "Corpse"; }
  void save(ArchiveWriter& writer) const override;
  void load(ArchiveReader& reader) override;
  void resolveReferences(CrossReferenceResolver& resolver) override;
  void postLoadInit() override;

 private:
  CreaturePtr m_innerCreature;
  std::string m_pendingInnerRef;
};

using CorpsePtr = std::shared_ptr<Corpse>;

}  // namespace Strata

#endif  // CORPSE_HPP
