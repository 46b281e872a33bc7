/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "world/GroupController.hpp"
#include "core/Logger.hpp"
#include "core/PersistenceError.hpp"
#include "managers/IdentityRegistry.hpp"
#include "world/Region.hpp"
#include "world/World.hpp"
#include <algorithm>

namespace Strata {

GroupController::GroupController()
    : m_id(UniqueID::generate())
{
}

GroupController::GroupController(std::string label, FactionPtr faction)
    : m_id(UniqueID::generate()), m_label(std::move(label)), m_faction(std::move(faction))
{
}

void GroupController::addOwned(const CreaturePtr& creature)
{
    if (!creature || owns(*creature)) {
        return;
    }
    creature->setGroupId(m_id);
    m_owned.push_back(creature);
}

bool GroupController::removeOwned(const Creature& creature)
{
    auto it = std::find_if(m_owned.begin(), m_owned.end(),
                           [&creature](const CreaturePtr& owned) { return owned.get() == &creature; });
    if (it == m_owned.end()) {
        return false;
    }
    (*it)->setGroupId(0);
    m_owned.erase(it);
    return true;
}

bool GroupController::owns(const Creature& creature) const
{
    return std::any_of(m_owned.begin(), m_owned.end(),
                       [&creature](const CreaturePtr& owned) { return owned.get() == &creature; });
}

void GroupController::save(ArchiveWriter& writer) const
{
    writer.writeValue("id", m_id);
    writer.writeString("label", m_label);
    writer.writeReference("faction", m_faction.get());
    writer.writeReferenceList("owned", m_owned);
}

void GroupController::load(ArchiveReader& reader)
{
    reader.readValue("id", m_id);
    reader.readString("label", m_label);
    m_pendingFactionRef = reader.readReference("faction");
    m_pendingOwnedRefs = reader.readReferenceList("owned");
    m_owned.clear();
    m_faction.reset();
    UniqueID::reserve(m_id);
}

void GroupController::resolveReferences(CrossReferenceResolver& resolver)
{
    m_faction = resolver.resolve<Faction>(m_pendingFactionRef);
    for (const auto& loadId : m_pendingOwnedRefs) {
        if (auto creature = resolver.resolve<Creature>(loadId)) {
            m_owned.push_back(std::move(creature));
        }
    }
    m_pendingFactionRef.clear();
    m_pendingOwnedRefs.clear();
}

void GroupController::postLoadInit()
{
    if (!m_manager) {
        throw PersistenceError("Group " + getUniqueLoadId() +
                               " finished loading without a group manager");
    }
    for (const auto& creature : m_owned) {
        creature->setGroupId(m_id);
    }
}

const DeepFactory<GroupController>& GroupController::deepFactory()
{
    static const DeepFactory<GroupController> factory = [](const std::string& tag) -> GroupControllerPtr {
        if (tag == "GroupController") {
            return std::make_shared<GroupController>();
        }
        return nullptr;
    };
    return factory;
}

void GroupManager::add(const GroupControllerPtr& group)
{
    if (!group || contains(*group)) {
        return;
    }
    if (!m_region.getWorld().getIdentities().registerObject(group)) {
        throw IdentityCollisionError(group->getUniqueLoadId(), 0,
                                     m_region.getWorld().getIdentities().size());
    }
    group->setManager(this);
    m_groups.push_back(group);
}

bool GroupManager::remove(const GroupControllerPtr& group)
{
    auto it = std::find(m_groups.begin(), m_groups.end(), group);
    if (it == m_groups.end()) {
        return false;
    }
    m_region.getWorld().getIdentities().remove(*group);
    group->setManager(nullptr);
    m_groups.erase(it);
    return true;
}

void GroupManager::clear()
{
    for (const auto& group : m_groups) {
        m_region.getWorld().getIdentities().remove(*group);
        group->setManager(nullptr);
    }
    m_groups.clear();
}

bool GroupManager::contains(const GroupController& group) const
{
    return std::any_of(m_groups.begin(), m_groups.end(),
                       [&group](const GroupControllerPtr& g) { return g.get() == &group; });
}

} // namespace Strata
