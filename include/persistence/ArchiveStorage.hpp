/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef ARCHIVE_STORAGE_HPP
#define ARCHIVE_STORAGE_HPP

#include "world/RegionTypes.hpp"
#include <string>

namespace Strata {

/**
 * @brief Where region archives and world session files live on disk.
 *
 * Layout: <root>/<persistentId>/Region_<regionId>.sra and
 * <root>/<persistentId>/World.sws. The persistent id separates the archives
 * of different playthroughs.
 */
class ArchiveStorage {
public:
    static constexpr const char* REGION_EXTENSION = ".sra";
    static constexpr const char* WORLD_SESSION_FILE = "World.sws";

    ArchiveStorage(std::string root, std::string persistentId);

    /**
     * @brief Writable per-user directory from SDL, or empty if SDL cannot
     * provide one.
     */
    static std::string defaultRoot();

    const std::string& getRoot() const { return m_root; }
    const std::string& getPersistentId() const { return m_persistentId; }

    // False when the root or the persistent id is missing
    bool isConfigured() const { return !m_root.empty() && !m_persistentId.empty(); }

    std::string getFolder() const;
    std::string getRegionArchivePath(RegionId regionId) const;
    std::string getWorldSessionPath() const;

    bool regionArchiveExists(RegionId regionId) const;

    /**
     * @brief Creates <root>/<persistentId> if needed.
     * @return false if the folder cannot be created; the reason is logged
     */
    bool ensureFolder() const;

    bool removeRegionArchive(RegionId regionId) const;

private:
    std::string m_root;
    std::string m_persistentId;
};

} // namespace Strata

#endif // ARCHIVE_STORAGE_HPP
