/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef IDENTITY_REGISTRY_HPP
#define IDENTITY_REGISTRY_HPP

#include "persistence/Archivable.hpp"
#include <cstddef>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace Strata {

/**
 * @brief Directory of every live load-referenceable object, keyed by load id.
 *
 * The registry does not own anything: entries are weak and expired entries
 * count as absent. Owners (regions, the world registry, the side table,
 * containers) keep objects alive; whoever discards an object removes it here.
 */
class IdentityRegistry {
public:
    /**
     * @brief Registers an object under its load id
     * @return false if a different live object already holds the id
     */
    bool registerObject(const ReferenceablePtr& object);

    ReferenceablePtr tryFind(const std::string& loadId) const;

    bool contains(const std::string& loadId) const { return tryFind(loadId) != nullptr; }

    /**
     * @brief Removes an entry. Only removes it if it belongs to @p object.
     */
    bool remove(const ILoadReferenceable& object);
    bool remove(const std::string& loadId);

    // Strong references to every live entry, for pre-registration in a load
    std::vector<ReferenceablePtr> snapshot() const;

    size_t size() const;
    void clear() { m_objects.clear(); }

private:
    std::unordered_map<std::string, std::weak_ptr<ILoadReferenceable>> m_objects;
};

} // namespace Strata

#endif // IDENTITY_REGISTRY_HPP
