/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef REGION_SIDE_TABLE_HPP
#define REGION_SIDE_TABLE_HPP

#include "entities/Creature.hpp"
#include "persistence/Archivable.hpp"
#include "world/RegionTypes.hpp"
#include <boost/container/flat_map.hpp>
#include <boost/container/small_vector.hpp>
#include <cstddef>
#include <string>
#include <unordered_set>
#include <vector>

namespace Strata {

/**
 * @brief A creature parked outside its region together with the cell it
 * should return to (the container cell for occupants).
 */
struct ParkedCreature {
    CreaturePtr creature;
    CellPos cell{};
    std::string pendingRef; // load id while a world session is being read
};

using ParkedList = boost::container::small_vector<ParkedCreature, 4>;

/**
 * @brief Everything taken out of one region before it was archived.
 *
 * All lists except trackedCreatures reference creatures that live in the
 * world registry; trackedCreatures owns its creatures outright.
 */
struct SideRegistryEntry {
    RegionId regionId{INVALID_REGION_ID};
    ParkedList legacyParked;
    ParkedList sleepingOccupants;
    ParkedList containerOccupants;
    ParkedList ownedAnimals;
    ParkedList trackedCreatures;

    bool empty() const;
    size_t size() const;
    void clear();
};

/**
 * @brief World-scoped table of side registries keyed by region id.
 *
 * References returned by getOrCreate()/tryGet() are invalidated when an entry
 * for another region is created or released.
 */
class RegionSideTable : public IArchivable {
public:
    SideRegistryEntry& getOrCreate(RegionId regionId);
    SideRegistryEntry* tryGet(RegionId regionId);
    const SideRegistryEntry* tryGet(RegionId regionId) const;
    bool release(RegionId regionId);

    size_t size() const { return m_entries.size(); }
    const boost::container::flat_map<RegionId, SideRegistryEntry>& getEntries() const { return m_entries; }

    // Ids of every creature any entry points at or owns
    void collectReferencedIds(std::unordered_set<EntityID>& out) const;
    // Creatures owned by the table itself (trackedCreatures of every entry)
    std::vector<CreaturePtr> getOwnedCreatures() const;

    void clear() { m_entries.clear(); }

    std::string getArchiveTag() const override { return "RegionSideTable"; }
    void save(ArchiveWriter& writer) const override;
    void load(ArchiveReader& reader) override;
    void resolveReferences(CrossReferenceResolver& resolver) override;

private:
    boost::container::flat_map<RegionId, SideRegistryEntry> m_entries;
};

} // namespace Strata

#endif // REGION_SIDE_TABLE_HPP
