/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef REGION_CHRONICLE_HPP
#define REGION_CHRONICLE_HPP

#include "entities/Faction.hpp"
#include "world/RegionComponent.hpp"
#include <cstdint>

namespace Strata {

/**
 * @brief Keeps the history of one region across abandon/restore cycles:
 * how often it was abandoned, when it was last abandoned and restored, and
 * which faction founded it.
 */
class RegionChronicle : public RegionComponent, public IPersistableRegionComponent {
public:
    explicit RegionChronicle(Region& region) : RegionComponent(region) {}

    void recordAbandoned(int64_t tick);
    void recordRestored(int64_t tick);

    uint32_t getAbandonCount() const { return m_abandonCount; }
    int64_t getLastAbandonedTick() const { return m_lastAbandonedTick; }
    int64_t getLastRestoredTick() const { return m_lastRestoredTick; }

    const FactionPtr& getFoundingFaction() const { return m_foundingFaction; }
    void setFoundingFaction(FactionPtr faction) { m_foundingFaction = std::move(faction); }

    std::string getArchiveTag() const override { return "Strata::RegionChronicle"; }
    void save(ArchiveWriter& writer) const override;
    void load(ArchiveReader& reader) override;
    void resolveReferences(CrossReferenceResolver& resolver) override;

private:
    uint32_t m_abandonCount{0};
    int64_t m_lastAbandonedTick{-1};
    int64_t m_lastRestoredTick{-1};
    FactionPtr m_foundingFaction;
    std::string m_pendingFactionRef;
};

} // namespace Strata

#endif // REGION_CHRONICLE_HPP
