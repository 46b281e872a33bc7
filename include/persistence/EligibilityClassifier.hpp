/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef ELIGIBILITY_CLASSIFIER_HPP
#define ELIGIBILITY_CLASSIFIER_HPP

#include "entities/Entity.hpp"
#include <string>
#include <unordered_set>

namespace Strata {

class WorldRegistry;

/**
 * @brief Decides which placed entities belong in a region archive.
 *
 * Pure predicate: the same answer before, during and after archiving, and
 * the same rules at save time and when wiping on reload.
 */
class EligibilityClassifier {
public:
    EligibilityClassifier(const WorldRegistry& registry, std::unordered_set<std::string> excludedDefs)
        : m_registry(registry), m_excludedDefs(std::move(excludedDefs)) {}

    bool shouldPersist(const Entity& entity) const;

    const std::unordered_set<std::string>& getExcludedDefs() const { return m_excludedDefs; }

private:
    const WorldRegistry& m_registry;
    std::unordered_set<std::string> m_excludedDefs;
};

} // namespace Strata

#endif // ELIGIBILITY_CLASSIFIER_HPP
