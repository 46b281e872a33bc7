/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "entities/Faction.hpp"
#include "core/Logger.hpp"
#include "persistence/ArchiveSession.hpp"
#include <algorithm>

namespace Strata {

void Faction::save(ArchiveWriter& writer) const
{
    writer.writeValue("id", m_id);
    writer.writeString("name", m_name);
    writer.writeBool("isPlayer", m_isPlayer);
}

void Faction::load(ArchiveReader& reader)
{
    reader.readValue("id", m_id);
    reader.readString("name", m_name);
    m_isPlayer = reader.readBool("isPlayer");
}

FactionPtr FactionRegistry::add(const std::string& name, bool isPlayer)
{
    if (isPlayer && getPlayerFaction()) {
        WORLD_WARN("A player faction already exists; '" + name + "' added as non-player");
        isPlayer = false;
    }
    auto faction = std::make_shared<Faction>(m_nextId++, name, isPlayer);
    m_factions.push_back(faction);
    return faction;
}

void FactionRegistry::adopt(const FactionPtr& faction)
{
    if (!faction || findById(faction->getId())) {
        return;
    }
    m_nextId = std::max(m_nextId, faction->getId() + 1);
    m_factions.push_back(faction);
}

FactionPtr FactionRegistry::getPlayerFaction() const
{
    auto it = std::find_if(m_factions.begin(), m_factions.end(),
                           [](const FactionPtr& f) { return f->isPlayer(); });
    return it != m_factions.end() ? *it : nullptr;
}

FactionPtr FactionRegistry::findById(uint32_t id) const
{
    auto it = std::find_if(m_factions.begin(), m_factions.end(),
                           [id](const FactionPtr& f) { return f->getId() == id; });
    return it != m_factions.end() ? *it : nullptr;
}

} // namespace Strata
