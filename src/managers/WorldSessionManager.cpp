/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "managers/WorldSessionManager.hpp"
#include "core/Logger.hpp"
#include "core/PersistenceError.hpp"
#include "persistence/ArchiveSession.hpp"
#include "persistence/ArchiveStorage.hpp"
#include "world/World.hpp"
#include <filesystem>
#include <vector>

namespace Strata {

namespace {

const char* CLOCK_RECORD = "Clock";
const char* FACTIONS_RECORD = "Factions";
const char* REGISTRY_RECORD = "WorldRegistry";
const char* SIDE_TABLE_RECORD = "SideTable";

const DeepFactory<Faction>& factionFactory()
{
    static const DeepFactory<Faction> factory = [](const std::string& tag) -> FactionPtr {
        if (tag == "Faction") {
            return std::make_shared<Faction>();
        }
        return nullptr;
    };
    return factory;
}

void requireRecord(bool found, const std::string& path, const char* record)
{
    if (!found) {
        throw ArchiveFormatError(path + " has no " + record + " record");
    }
}

} // namespace

bool WorldSessionManager::save(const ArchiveStorage& storage)
{
    if (!storage.ensureFolder()) {
        return false;
    }
    return saveToFile(storage.getWorldSessionPath());
}

bool WorldSessionManager::load(const ArchiveStorage& storage)
{
    if (!storage.isConfigured()) {
        WORLD_ERROR("Cannot load world session: storage is not configured");
        return false;
    }
    return loadFromFile(storage.getWorldSessionPath());
}

bool WorldSessionManager::saveToFile(const std::string& path)
{
    try {
        ArchiveSaveSession session(path, SESSION_KIND);

        const int64_t ticks = m_world.getClock().getTicksGame();
        const std::string persistentId = m_world.getPersistentId();
        session.writeRecord(CLOCK_RECORD, [ticks, &persistentId](ArchiveWriter& writer) {
            writer.writeValue("ticks", ticks);
            writer.writeString("persistentId", persistentId);
        });

        const auto& factions = m_world.getFactions().getAll();
        session.writeRecord(FACTIONS_RECORD, [&factions](ArchiveWriter& writer) {
            writer.writeDeepList("factions", factions);
        });

        const WorldRegistry& registry = m_world.getRegistry();
        session.writeRecord(REGISTRY_RECORD, [&registry](ArchiveWriter& writer) { registry.save(writer); });

        const RegionSideTable& sideTable = m_world.getSideTable();
        session.writeRecord(SIDE_TABLE_RECORD, [&sideTable](ArchiveWriter& writer) { sideTable.save(writer); });

        session.finalize();

        WORLD_INFO("World session saved to " + path + " (" + std::to_string(factions.size()) + " factions, " +
                   std::to_string(registry.getAliveCount()) + " alive, " + std::to_string(registry.getDeadCount()) +
                   " dead, " + std::to_string(sideTable.size()) + " side registries)");
        return true;
    } catch (const PersistenceError& e) {
        WORLD_ERROR("World session save failed: " + std::string(e.what()));
    } catch (const std::exception& e) {
        WORLD_ERROR("Unexpected error saving world session: " + std::string(e.what()));
    }
    return false;
}

bool WorldSessionManager::loadFromFile(const std::string& path)
{
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        WORLD_WARN("No world session at " + path);
        return false;
    }

    try {
        ArchiveLoadSession session(path, SESSION_KIND);

        m_world.reset();

        int64_t ticks = 0;
        std::string persistentId;
        requireRecord(session.readRecord(CLOCK_RECORD,
                                         [&ticks, &persistentId](ArchiveReader& reader) {
                                             reader.readValue("ticks", ticks);
                                             reader.readString("persistentId", persistentId);
                                         }),
                      path, CLOCK_RECORD);

        std::vector<FactionPtr> factions;
        requireRecord(session.readRecord(FACTIONS_RECORD,
                                         [&factions](ArchiveReader& reader) {
                                             reader.readDeepList<Faction>("factions", factions, factionFactory());
                                         }),
                      path, FACTIONS_RECORD);

        WorldRegistry& registry = m_world.getRegistry();
        requireRecord(session.readRecord(REGISTRY_RECORD, [&registry](ArchiveReader& reader) { registry.load(reader); }),
                      path, REGISTRY_RECORD);

        RegionSideTable& sideTable = m_world.getSideTable();
        requireRecord(session.readRecord(SIDE_TABLE_RECORD,
                                         [&sideTable](ArchiveReader& reader) { sideTable.load(reader); }),
                      path, SIDE_TABLE_RECORD);

        session.preRegisterLiveTargets(m_world.getIdentities().snapshot());
        session.closeReadingCursor();
        session.resolveAllCrossReferences();
        // Side table references point into the registry just read
        sideTable.resolveReferences(session.getResolver());
        session.doAllPostLoadInits();

        m_world.getClock().setTicks(ticks);
        m_world.setPersistentId(persistentId);
        for (const auto& faction : factions) {
            m_world.adoptFaction(faction);
        }
        registry.registerAllIdentities();

        WORLD_INFO("World session loaded from " + path + " at tick " + std::to_string(ticks) + " (" +
                   std::to_string(factions.size()) + " factions, " + std::to_string(registry.getAliveCount()) +
                   " alive, " + std::to_string(registry.getDeadCount()) + " dead, " +
                   std::to_string(sideTable.size()) + " side registries)");
        return true;
    } catch (const PersistenceError& e) {
        WORLD_ERROR("World session load failed: " + std::string(e.what()));
    } catch (const std::exception& e) {
        WORLD_ERROR("Unexpected error loading world session: " + std::string(e.what()));
    }
    return false;
}

} // namespace Strata
