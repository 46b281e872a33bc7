/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef FACTION_HPP
#define FACTION_HPP

#include "persistence/Archivable.hpp"
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace Strata {

class Faction : public ILoadReferenceable, public IArchivable {
public:
    Faction() = default;
    Faction(uint32_t id, std::string name, bool isPlayer)
        : m_id(id), m_name(std::move(name)), m_isPlayer(isPlayer) {}

    uint32_t getId() const { return m_id; }
    const std::string& getName() const { return m_name; }
    bool isPlayer() const { return m_isPlayer; }

    std::string getUniqueLoadId() const override { return "Faction_" + std::to_string(m_id); }

    std::string getArchiveTag() const override { return "Faction"; }
    void save(ArchiveWriter& writer) const override;
    void load(ArchiveReader& reader) override;

private:
    uint32_t m_id{0};
    std::string m_name;
    bool m_isPlayer{false};
};

using FactionPtr = std::shared_ptr<Faction>;

/**
 * @brief World-level list of factions. Exactly one may be the player faction.
 */
class FactionRegistry {
public:
    FactionPtr add(const std::string& name, bool isPlayer = false);
    void adopt(const FactionPtr& faction);

    FactionPtr getPlayerFaction() const;
    FactionPtr findById(uint32_t id) const;
    const std::vector<FactionPtr>& getAll() const { return m_factions; }

    void clear() { m_factions.clear(); m_nextId = 1; }

private:
    std::vector<FactionPtr> m_factions;
    uint32_t m_nextId{1};
};

} // namespace Strata

#endif // FACTION_HPP
