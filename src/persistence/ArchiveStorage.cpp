/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "persistence/ArchiveStorage.hpp"
#include "core/Logger.hpp"
#include <SDL3/SDL_filesystem.h>
#include <SDL3/SDL_stdinc.h>
#include <filesystem>
#include <system_error>

namespace Strata {

ArchiveStorage::ArchiveStorage(std::string root, std::string persistentId)
    : m_root(std::move(root)), m_persistentId(std::move(persistentId))
{
    if (m_root.empty()) {
        m_root = defaultRoot();
    }
}

std::string ArchiveStorage::defaultRoot()
{
    char* prefPath = SDL_GetPrefPath("Strata", "RegionArchives");
    if (prefPath == nullptr) {
        STORAGE_WARN("No preference path available; region archives disabled until storage.root is set");
        return {};
    }
    std::string root(prefPath);
    SDL_free(prefPath);
    return root;
}

std::string ArchiveStorage::getFolder() const
{
    if (!isConfigured()) {
        return {};
    }
    return (std::filesystem::path(m_root) / m_persistentId).string();
}

std::string ArchiveStorage::getRegionArchivePath(RegionId regionId) const
{
    if (!isConfigured()) {
        return {};
    }
    return (std::filesystem::path(getFolder()) /
            ("Region_" + std::to_string(regionId) + REGION_EXTENSION)).string();
}

std::string ArchiveStorage::getWorldSessionPath() const
{
    if (!isConfigured()) {
        return {};
    }
    return (std::filesystem::path(getFolder()) / WORLD_SESSION_FILE).string();
}

bool ArchiveStorage::regionArchiveExists(RegionId regionId) const
{
    if (!isConfigured()) {
        return false;
    }
    std::error_code ec;
    return std::filesystem::is_regular_file(getRegionArchivePath(regionId), ec);
}

bool ArchiveStorage::ensureFolder() const
{
    if (!isConfigured()) {
        STORAGE_ERROR("Storage root or persistent id missing");
        return false;
    }

    const std::filesystem::path folder(getFolder());
    std::error_code ec;
    if (std::filesystem::is_directory(folder, ec)) {
        return true;
    }
    std::filesystem::create_directories(folder, ec);
    if (ec) {
        STORAGE_ERROR("Failed to create archive folder " + folder.string() + ": " + ec.message());
        return false;
    }
    STORAGE_INFO("Created archive folder: " + folder.string());
    return true;
}

bool ArchiveStorage::removeRegionArchive(RegionId regionId) const
{
    if (!isConfigured()) {
        return false;
    }
    std::error_code ec;
    const bool removed = std::filesystem::remove(getRegionArchivePath(regionId), ec);
    if (ec) {
        STORAGE_ERROR("Failed to remove archive for region " + std::to_string(regionId) + ": " + ec.message());
        return false;
    }
    return removed;
}

} // namespace Strata
