/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "managers/RegionSideTable.hpp"
#include "core/Logger.hpp"
#include "entities/EntityFactory.hpp"
#include "persistence/ArchiveSession.hpp"

namespace Strata {

namespace {

void writeReferencedList(ArchiveWriter& writer, const std::string& name, const ParkedList& list)
{
    std::vector<CreaturePtr> creatures;
    std::vector<CellPos> cells;
    for (const auto& parked : list) {
        creatures.push_back(parked.creature);
        cells.push_back(parked.cell);
    }
    writer.writeReferenceList(name, creatures);
    writer.writeVector(name + "Cells", cells);
}

void readReferencedList(ArchiveReader& reader, const std::string& name, ParkedList& list)
{
    std::vector<std::string> refs = reader.readReferenceList(name);
    std::vector<CellPos> cells;
    reader.readVector(name + "Cells", cells);
    if (cells.size() != refs.size()) {
        throw ArchiveFormatError("side registry list '" + name + "' has mismatched cells");
    }
    list.clear();
    for (size_t i = 0; i < refs.size(); ++i) {
        list.push_back(ParkedCreature{nullptr, cells[i], refs[i]});
    }
}

void resolveList(CrossReferenceResolver& resolver, ParkedList& list, RegionId regionId)
{
    ParkedList resolved;
    for (auto& parked : list) {
        if (!parked.pendingRef.empty()) {
            parked.creature = resolver.resolve<Creature>(parked.pendingRef);
        }
        if (!parked.creature) {
            SIDETABLE_WARN("Dropping unresolvable side registry record " + parked.pendingRef +
                           " for region " + std::to_string(regionId));
            continue;
        }
        parked.pendingRef.clear();
        resolved.push_back(std::move(parked));
    }
    list = std::move(resolved);
}

} // namespace

bool SideRegistryEntry::empty() const
{
    return size() == 0;
}

size_t SideRegistryEntry::size() const
{
    return legacyParked.size() + sleepingOccupants.size() + containerOccupants.size() +
           ownedAnimals.size() + trackedCreatures.size();
}

void SideRegistryEntry::clear()
{
    legacyParked.clear();
    sleepingOccupants.clear();
    containerOccupants.clear();
    ownedAnimals.clear();
    trackedCreatures.clear();
}

SideRegistryEntry& RegionSideTable::getOrCreate(RegionId regionId)
{
    auto it = m_entries.find(regionId);
    if (it == m_entries.end()) {
        SideRegistryEntry entry;
        entry.regionId = regionId;
        it = m_entries.emplace(regionId, std::move(entry)).first;
        SIDETABLE_DEBUG("Created side registry for region " + std::to_string(regionId));
    }
    return it->second;
}

SideRegistryEntry* RegionSideTable::tryGet(RegionId regionId)
{
    auto it = m_entries.find(regionId);
    return it != m_entries.end() ? &it->second : nullptr;
}

const SideRegistryEntry* RegionSideTable::tryGet(RegionId regionId) const
{
    auto it = m_entries.find(regionId);
    return it != m_entries.end() ? &it->second : nullptr;
}

bool RegionSideTable::release(RegionId regionId)
{
    return m_entries.erase(regionId) > 0;
}

void RegionSideTable::collectReferencedIds(std::unordered_set<EntityID>& out) const
{
    for (const auto& [regionId, entry] : m_entries) {
        for (const ParkedList* list : {&entry.legacyParked, &entry.sleepingOccupants, &entry.containerOccupants,
                                       &entry.ownedAnimals, &entry.trackedCreatures}) {
            for (const auto& parked : *list) {
                if (parked.creature) {
                    out.insert(parked.creature->getID());
                }
            }
        }
    }
}

std::vector<CreaturePtr> RegionSideTable::getOwnedCreatures() const
{
    std::vector<CreaturePtr> owned;
    for (const auto& [regionId, entry] : m_entries) {
        for (const auto& parked : entry.trackedCreatures) {
            if (parked.creature) {
                owned.push_back(parked.creature);
            }
        }
    }
    return owned;
}

void RegionSideTable::save(ArchiveWriter& writer) const
{
    writer.writeValue("entryCount", static_cast<uint32_t>(m_entries.size()));
    for (const auto& [regionId, entry] : m_entries) {
        writer.writeValue("regionId", regionId);
        writeReferencedList(writer, "legacyParked", entry.legacyParked);
        writeReferencedList(writer, "sleepingOccupants", entry.sleepingOccupants);
        writeReferencedList(writer, "containerOccupants", entry.containerOccupants);
        writeReferencedList(writer, "ownedAnimals", entry.ownedAnimals);

        std::vector<CreaturePtr> tracked;
        std::vector<CellPos> trackedCells;
        for (const auto& parked : entry.trackedCreatures) {
            tracked.push_back(parked.creature);
            trackedCells.push_back(parked.cell);
        }
        writer.writeDeepList("trackedCreatures", tracked);
        writer.writeVector("trackedCreaturesCells", trackedCells);
    }
}

void RegionSideTable::load(ArchiveReader& reader)
{
    static const DeepFactory<Creature> creatureFactory = [](const std::string& tag) {
        return std::dynamic_pointer_cast<Creature>(EntityFactory::create(tag));
    };

    m_entries.clear();
    uint32_t entryCount = 0;
    reader.readValue("entryCount", entryCount);
    for (uint32_t i = 0; i < entryCount; ++i) {
        RegionId regionId = INVALID_REGION_ID;
        reader.readValue("regionId", regionId);
        SideRegistryEntry& entry = getOrCreate(regionId);
        readReferencedList(reader, "legacyParked", entry.legacyParked);
        readReferencedList(reader, "sleepingOccupants", entry.sleepingOccupants);
        readReferencedList(reader, "containerOccupants", entry.containerOccupants);
        readReferencedList(reader, "ownedAnimals", entry.ownedAnimals);

        std::vector<CreaturePtr> tracked;
        std::vector<CellPos> trackedCells;
        reader.readDeepList<Creature>("trackedCreatures", tracked, creatureFactory);
        reader.readVector("trackedCreaturesCells", trackedCells);
        if (tracked.size() != trackedCells.size()) {
            throw ArchiveFormatError("tracked creature cells do not match creatures for region " +
                                     std::to_string(regionId));
        }
        entry.trackedCreatures.clear();
        for (size_t j = 0; j < tracked.size(); ++j) {
            entry.trackedCreatures.push_back(ParkedCreature{tracked[j], trackedCells[j], {}});
        }
    }
}

void RegionSideTable::resolveReferences(CrossReferenceResolver& resolver)
{
    for (auto& [regionId, entry] : m_entries) {
        resolveList(resolver, entry.legacyParked, regionId);
        resolveList(resolver, entry.sleepingOccupants, regionId);
        resolveList(resolver, entry.containerOccupants, regionId);
        resolveList(resolver, entry.ownedAnimals, regionId);
    }
}

} // namespace Strata
