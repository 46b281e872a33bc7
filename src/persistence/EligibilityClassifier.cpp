/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "persistence/EligibilityClassifier.hpp"
#include "entities/Creature.hpp"
#include "entities/Structure.hpp"
#include "managers/WorldRegistry.hpp"

namespace Strata {

bool EligibilityClassifier::shouldPersist(const Entity& entity) const
{
    if (entity.isDestroyed() || !entity.isSpawned()) {
        return false;
    }

    switch (entity.getCategory()) {
        case EntityCategory::Blueprint:
        case EntityCategory::Effect:
        case EntityCategory::Projectile:
        case EntityCategory::FallingObject:
            return false;
        default:
            break;
    }

    if (m_excludedDefs.count(entity.getDefName()) != 0) {
        return false;
    }

    if (const auto* creature = dynamic_cast<const Creature*>(&entity)) {
        if (creature->isHumanlike()) {
            return false;
        }
        return m_registry.getSituation(*creature) == WorldSituation::None;
    }

    if (const auto* structure = dynamic_cast<const Structure*>(&entity)) {
        if (structure->isUnderConstruction()) {
            return false;
        }
        // Occupant extraction should already have emptied these
        for (const auto& held : structure->getContents()) {
            const auto* occupant = dynamic_cast<const Creature*>(held.get());
            if (occupant && m_registry.getSituation(*occupant) != WorldSituation::None) {
                return false;
            }
        }
    }

    return true;
}

} // namespace Strata
