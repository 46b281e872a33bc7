/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "entities/EntityFactory.hpp"
#include "entities/Corpse.hpp"
#include "entities/Creature.hpp"
#include "entities/Item.hpp"
#include "entities/Structure.hpp"

namespace Strata {

EntityPtr EntityFactory::create(const std::string& archiveTag) {
  if (archiveTag == "Creature") {
    return std::make_shared<Creature>();
  }
  if (archiveTag == "Item") {
    return std::make_shared<Item>();
  }
  if (archiveTag == "Corpse") {
    return std::make_shared<Corpse>();
  }
  if (archiveTag == "Structure") {
    return std::make_shared<Structure>();
  }
  if (archiveTag == "Entity") {
    return std::make_shared<Entity>();
  }
  return nullptr;
}

const DeepFactory<Entity>& EntityFactory::deepFactory() {
  static const DeepFactory<Entity> factory = [](const std::string& tag) { return create(tag); };
  return factory;
}

}  // namespace Strata
