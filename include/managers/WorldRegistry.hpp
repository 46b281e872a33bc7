/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef WORLD_REGISTRY_HPP
#define WORLD_REGISTRY_HPP

#include "entities/Entity.hpp"
#include "persistence/Archivable.hpp"
#include <cstddef>
#include <cstdint>
#include <map>
#include <ostream>
#include <unordered_set>
#include <vector>

namespace Strata {

class IdentityRegistry;

enum class WorldSituation : uint8_t { None, Alive, Dead };
enum class RetentionPolicy : uint8_t { Discard = 0, KeepForever = 1 };

inline std::ostream& operator<<(std::ostream& os, WorldSituation situation) {
    switch (situation) {
        case WorldSituation::None: return os << "None";
        case WorldSituation::Alive: return os << "Alive";
        case WorldSituation::Dead: return os << "Dead";
    }
    return os << "Unknown";
}

/**
 * @brief World-level holding for creatures that are not placed in any
 * active region: travellers, parked occupants of archived regions, and the
 * remembered dead that corpses point at.
 *
 * Entries in the alive store carry a retention policy; Discard entries and
 * dead entries are dropped by collectGarbage() unless something still
 * references them or they are in the forced-retention set.
 */
class WorldRegistry : public IArchivable {
public:
    explicit WorldRegistry(IdentityRegistry& identities) : m_identities(identities) {}

    [[nodiscard]] WorldSituation getSituation(const Entity& entity) const;
    [[nodiscard]] EntityPtr findById(EntityID id) const;
    [[nodiscard]] RetentionPolicy getRetention(EntityID id) const;

    /**
     * @brief Moves an entity into the alive store (the dead store if it is
     * destroyed) and registers its identity.
     */
    void passToWorld(const EntityPtr& entity, RetentionPolicy policy);
    void passToDead(const EntityPtr& entity);

    // Removes from either store; the identity registration is left alone
    bool remove(const Entity& entity);

    void addForcedRetention(EntityID id) { m_forcedRetention.insert(id); }
    bool removeForcedRetention(EntityID id) { return m_forcedRetention.erase(id) > 0; }
    [[nodiscard]] bool isForcefullyKept(EntityID id) const { return m_forcedRetention.count(id) != 0; }
    [[nodiscard]] size_t getForcedRetentionCount() const { return m_forcedRetention.size(); }

    /**
     * @brief Drops dead entries and Discard-policy alive entries that are
     * neither force-retained nor in @p referenced.
     * @return number of entries discarded
     */
    size_t collectGarbage(const std::unordered_set<EntityID>& referenced);

    [[nodiscard]] size_t getAliveCount() const { return m_alive.size(); }
    [[nodiscard]] size_t getDeadCount() const { return m_dead.size(); }
    [[nodiscard]] std::vector<EntityPtr> getAllEntities() const;

    // Re-registers every held entity after a world session load
    void registerAllIdentities();
    void clear();

    std::string getArchiveTag() const override { return "WorldRegistry"; }
    void save(ArchiveWriter& writer) const override;
    void load(ArchiveReader& reader) override;

private:
    struct AliveEntry {
        EntityPtr entity;
        RetentionPolicy policy{RetentionPolicy::Discard};
    };

    IdentityRegistry& m_identities;
    std::map<EntityID, AliveEntry> m_alive;
    std::map<EntityID, EntityPtr> m_dead;
    std::unordered_set<EntityID> m_forcedRetention;
};

} // namespace Strata

#endif // WORLD_REGISTRY_HPP
