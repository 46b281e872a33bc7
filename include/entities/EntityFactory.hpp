/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef ENTITY_FACTORY_HPP
#define ENTITY_FACTORY_HPP

#include "entities/Entity.hpp"
#include "persistence/ArchiveSession.hpp"
#include <string>

namespace Strata {

/**
 * @brief Creates an empty entity of the concrete type named by an archive
 * tag, ready for load(). Unknown tags yield nullptr.
 */
class EntityFactory {
 public:
  static EntityPtr create(const std::string& archiveTag);
  static const DeepFactory<Entity>& deepFactory();
};

}  // namespace Strata

#endif  // ENTITY_FACTORY_HPP
