/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "managers/WorldRegistry.hpp"
#include "core/Logger.hpp"
#include "entities/EntityFactory.hpp"
#include "managers/IdentityRegistry.hpp"
#include "persistence/ArchiveSession.hpp"
#include <algorithm>

namespace Strata {

WorldSituation WorldRegistry::getSituation(const Entity& entity) const
{
    if (m_alive.count(entity.getID()) != 0) {
        return WorldSituation::Alive;
    }
    if (m_dead.count(entity.getID()) != 0) {
        return WorldSituation::Dead;
    }
    return WorldSituation::None;
}

EntityPtr WorldRegistry::findById(EntityID id) const
{
    auto alive = m_alive.find(id);
    if (alive != m_alive.end()) {
        return alive->second.entity;
    }
    auto dead = m_dead.find(id);
    return dead != m_dead.end() ? dead->second : nullptr;
}

RetentionPolicy WorldRegistry::getRetention(EntityID id) const
{
    auto it = m_alive.find(id);
    return it != m_alive.end() ? it->second.policy : RetentionPolicy::Discard;
}

void WorldRegistry::passToWorld(const EntityPtr& entity, RetentionPolicy policy)
{
    if (!entity) {
        return;
    }
    if (entity->isDestroyed()) {
        passToDead(entity);
        return;
    }

    m_dead.erase(entity->getID());
    auto& entry = m_alive[entity->getID()];
    entry.entity = entity;
    // Never downgrade a KeepForever entry
    if (policy == RetentionPolicy::KeepForever || entry.policy != RetentionPolicy::KeepForever) {
        entry.policy = policy;
    }
    if (!m_identities.registerObject(entity)) {
        WORLD_ERROR("Entity passed to world collides with a live identity: " + entity->getUniqueLoadId());
    }
}

void WorldRegistry::passToDead(const EntityPtr& entity)
{
    if (!entity) {
        return;
    }
    entity->markDestroyed();
    m_alive.erase(entity->getID());
    m_dead[entity->getID()] = entity;
    if (!m_identities.registerObject(entity)) {
        WORLD_ERROR("Dead entity collides with a live identity: " + entity->getUniqueLoadId());
    }
}

bool WorldRegistry::remove(const Entity& entity)
{
    auto alive = m_alive.find(entity.getID());
    if (alive != m_alive.end() && alive->second.entity.get() == &entity) {
        m_alive.erase(alive);
        return true;
    }
    auto dead = m_dead.find(entity.getID());
    if (dead != m_dead.end() && dead->second.get() == &entity) {
        m_dead.erase(dead);
        return true;
    }
    return false;
}

size_t WorldRegistry::collectGarbage(const std::unordered_set<EntityID>& referenced)
{
    auto keep = [&](EntityID id) {
        return m_forcedRetention.count(id) != 0 || referenced.count(id) != 0;
    };

    size_t discarded = 0;
    for (auto it = m_dead.begin(); it != m_dead.end();) {
        if (keep(it->first)) {
            ++it;
            continue;
        }
        m_identities.remove(*it->second);
        it = m_dead.erase(it);
        ++discarded;
    }

    for (auto it = m_alive.begin(); it != m_alive.end();) {
        if (it->second.policy == RetentionPolicy::KeepForever || keep(it->first)) {
            ++it;
            continue;
        }
        m_identities.remove(*it->second.entity);
        it = m_alive.erase(it);
        ++discarded;
    }

    if (discarded > 0) {
        WORLD_DEBUG("World registry garbage collection discarded " + std::to_string(discarded) + " entries");
    }
    return discarded;
}

std::vector<EntityPtr> WorldRegistry::getAllEntities() const
{
    std::vector<EntityPtr> all;
    all.reserve(m_alive.size() + m_dead.size());
    for (const auto& [id, entry] : m_alive) {
        all.push_back(entry.entity);
    }
    for (const auto& [id, entity] : m_dead) {
        all.push_back(entity);
    }
    return all;
}

void WorldRegistry::registerAllIdentities()
{
    for (const auto& entity : getAllEntities()) {
        if (!m_identities.registerObject(entity)) {
            WORLD_ERROR("World registry entity collides with a live identity: " + entity->getUniqueLoadId());
        }
    }
}

void WorldRegistry::clear()
{
    for (const auto& entity : getAllEntities()) {
        m_identities.remove(*entity);
    }
    m_alive.clear();
    m_dead.clear();
    m_forcedRetention.clear();
}

void WorldRegistry::save(ArchiveWriter& writer) const
{
    std::vector<EntityPtr> alive;
    std::vector<uint8_t> policies;
    for (const auto& [id, entry] : m_alive) {
        alive.push_back(entry.entity);
        policies.push_back(static_cast<uint8_t>(entry.policy));
    }
    std::vector<EntityPtr> dead;
    for (const auto& [id, entity] : m_dead) {
        dead.push_back(entity);
    }
    std::vector<EntityID> forced(m_forcedRetention.begin(), m_forcedRetention.end());
    std::sort(forced.begin(), forced.end());

    writer.writeDeepList("alive", alive);
    writer.writeVector("alivePolicies", policies);
    writer.writeDeepList("dead", dead);
    writer.writeVector("forcedRetention", forced);
}

void WorldRegistry::load(ArchiveReader& reader)
{
    std::vector<EntityPtr> alive;
    std::vector<uint8_t> policies;
    std::vector<EntityPtr> dead;
    std::vector<EntityID> forced;

    reader.readDeepList<Entity>("alive", alive, EntityFactory::deepFactory());
    reader.readVector("alivePolicies", policies);
    reader.readDeepList<Entity>("dead", dead, EntityFactory::deepFactory());
    reader.readVector("forcedRetention", forced);

    if (policies.size() != alive.size()) {
        throw ArchiveFormatError("world registry policy count does not match alive entries");
    }

    m_alive.clear();
    m_dead.clear();
    for (size_t i = 0; i < alive.size(); ++i) {
        const auto policy = policies[i] == static_cast<uint8_t>(RetentionPolicy::KeepForever)
                                ? RetentionPolicy::KeepForever
                                : RetentionPolicy::Discard;
        m_alive[alive[i]->getID()] = AliveEntry{alive[i], policy};
    }
    for (const auto& entity : dead) {
        m_dead[entity->getID()] = entity;
    }
    m_forcedRetention = std::unordered_set<EntityID>(forced.begin(), forced.end());
}

} // namespace Strata
