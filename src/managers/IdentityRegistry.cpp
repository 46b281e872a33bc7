/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "managers/IdentityRegistry.hpp"
#include "core/Logger.hpp"

namespace Strata {

bool IdentityRegistry::registerObject(const ReferenceablePtr& object)
{
    if (!object) {
        return false;
    }

    const std::string loadId = object->getUniqueLoadId();
    auto it = m_objects.find(loadId);
    if (it != m_objects.end()) {
        ReferenceablePtr existing = it->second.lock();
        if (existing && existing != object) {
            IDENTITY_ERROR("Load id already registered by another object: " + loadId);
            return false;
        }
        it->second = object;
        return true;
    }

    m_objects.emplace(loadId, object);
    return true;
}

ReferenceablePtr IdentityRegistry::tryFind(const std::string& loadId) const
{
    auto it = m_objects.find(loadId);
    if (it == m_objects.end()) {
        return nullptr;
    }
    return it->second.lock();
}

bool IdentityRegistry::remove(const ILoadReferenceable& object)
{
    auto it = m_objects.find(object.getUniqueLoadId());
    if (it == m_objects.end()) {
        return false;
    }

    ReferenceablePtr existing = it->second.lock();
    if (existing && existing.get() != &object) {
        IDENTITY_WARN("Refusing to remove " + it->first + ": held by a different object");
        return false;
    }

    m_objects.erase(it);
    return true;
}

bool IdentityRegistry::remove(const std::string& loadId)
{
    return m_objects.erase(loadId) > 0;
}

std::vector<ReferenceablePtr> IdentityRegistry::snapshot() const
{
    std::vector<ReferenceablePtr> live;
    live.reserve(m_objects.size());
    for (const auto& [loadId, weak] : m_objects) {
        if (auto object = weak.lock()) {
            live.push_back(std::move(object));
        }
    }
    return live;
}

size_t IdentityRegistry::size() const
{
    size_t count = 0;
    for (const auto& [loadId, weak] : m_objects) {
        if (!weak.expired()) {
            ++count;
        }
    }
    return count;
}

} // namespace Strata
