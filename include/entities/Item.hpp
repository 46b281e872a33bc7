/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef ITEM_HPP
#define ITEM_HPP

#include "entities/Entity.hpp"

namespace Strata {

/**
 * @brief Haulable stack. A positive rot threshold makes it perishable: once
 * the accumulated rot progress reaches the threshold the stack is gone.
 */
class Item : public Entity {
 public:
  Item() : Item("") {}
  explicit Item(std::string defName, int stackCount = 1)
      : Entity(EntityCategory::Item, std::move(defName)), m_stackCount(stackCount) {}

  int getStackCount() const { return m_stackCount; }
  void setStackCount(int count) { m_stackCount = count; }

  bool isPerishable() const { return m_rotThreshold > 0.0f; }
  float getRotProgress() const { return m_rotProgress; }
  void setRotProgress(float progress) { m_rotProgress = progress; }
  float getRotThreshold() const { return m_rotThreshold; }
  void setRotThreshold(float threshold) { m_rotThreshold = threshold; }

  std::string getArchiveTag() const override { return "Item"; }
  void save(ArchiveWriter& writer) const override;
  void load(ArchiveReader& reader) override;

 protected:
  Item(EntityCategory category, std::string defName)
      : Entity(category, std::move(defName)) {}

 private:
  int m_stackCount{1};
  float m_rotProgress{0.0f};
  float m_rotThreshold{0.0f};
};

using ItemPtr = std::shared_ptr<Item>;

}  // namespace Strata

#endif  // ITEM_HPP
