/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef ARCHIVE_RECORD_HPP
#define ARCHIVE_RECORD_HPP

#include "entities/Entity.hpp"
#include "persistence/Archivable.hpp"
#include "world/GroupController.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace Strata {

/**
 * @brief Everything one region archive holds: grid layers, the persisted
 * entities, the group controllers owning some of them, and the tick the
 * region was abandoned at.
 *
 * Created fresh for each save and consumed by the matching load. An absent
 * grid means the layer was inactive when the region was saved.
 */
struct ArchiveRecord : public IArchivable {
    static constexpr const char* RECORD_NAME = "RegionArchive";

    std::optional<std::vector<uint8_t>> terrain;
    std::optional<std::vector<uint8_t>> underTerrain;
    std::optional<std::vector<uint8_t>> roof;
    std::optional<std::vector<uint8_t>> snow;
    std::optional<std::vector<uint8_t>> pollution;
    std::optional<std::vector<uint8_t>> fog;

    std::vector<EntityPtr> entities;
    std::vector<GroupControllerPtr> groupLeaders;
    int64_t abandonedAtTick{0};

    std::string getArchiveTag() const override { return RECORD_NAME; }
    void save(ArchiveWriter& writer) const override;
    void load(ArchiveReader& reader) override;
};

} // namespace Strata

#endif // ARCHIVE_RECORD_HPP
