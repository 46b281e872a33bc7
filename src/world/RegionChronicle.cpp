/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "world/RegionChronicle.hpp"
#include "persistence/ArchiveSession.hpp"

namespace Strata {

void RegionChronicle::recordAbandoned(int64_t tick)
{
    ++m_abandonCount;
    m_lastAbandonedTick = tick;
}

void RegionChronicle::recordRestored(int64_t tick)
{
    m_lastRestoredTick = tick;
}

void RegionChronicle::save(ArchiveWriter& writer) const
{
    writer.writeValue("abandonCount", m_abandonCount);
    writer.writeValue("lastAbandonedTick", m_lastAbandonedTick);
    writer.writeValue("lastRestoredTick", m_lastRestoredTick);
    writer.writeReference("foundingFaction", m_foundingFaction.get());
}

void RegionChronicle::load(ArchiveReader& reader)
{
    reader.readValue("abandonCount", m_abandonCount);
    reader.readValue("lastAbandonedTick", m_lastAbandonedTick);
    reader.readValue("lastRestoredTick", m_lastRestoredTick);
    m_pendingFactionRef = reader.readReference("foundingFaction");
}

void RegionChronicle::resolveReferences(CrossReferenceResolver& resolver)
{
    if (!m_pendingFactionRef.empty()) {
        m_foundingFaction = resolver.resolve<Faction>(m_pendingFactionRef);
    }
    m_pendingFactionRef.clear();
}

} // namespace Strata
