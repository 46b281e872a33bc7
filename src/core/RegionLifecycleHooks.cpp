/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "core/RegionLifecycleHooks.hpp"
#include "core/DeferredTaskQueue.hpp"
#include "core/Logger.hpp"
#include "world/Region.hpp"
#include "world/RegionChronicle.hpp"
#include "world/World.hpp"

namespace Strata {

bool RegionLifecycleHooks::matchesLocation(const Region& region, RegionId locationId) const
{
    if (locationId == INVALID_REGION_ID) {
        LIFECYCLE_ERROR("Region event without a location id ignored");
        return false;
    }
    if (locationId != region.getId()) {
        LIFECYCLE_ERROR("Location " + std::to_string(locationId) + " does not match region " +
                        std::to_string(region.getId()));
        return false;
    }
    return true;
}

ArchiveResult RegionLifecycleHooks::onRegionDeactivated(Region& region, RegionId locationId)
{
    if (!matchesLocation(region, locationId)) {
        return ArchiveResult::Skipped;
    }

    // A region whose restore never ran must not be saved over its archive
    if (onRegionDiscarded(region)) {
        LIFECYCLE_WARN("Region " + std::to_string(locationId) + " deactivated before its restore ran; archive kept");
        region.discardAll();
        return ArchiveResult::Skipped;
    }

    const int64_t now = region.getWorld().getClock().getTicksGame();
    if (auto chronicle = region.findComponent<RegionChronicle>()) {
        chronicle->recordAbandoned(now);
    }

    const ArchiveResult result = m_archives.save(region);
    LIFECYCLE_INFO("Region " + std::to_string(locationId) + " deactivated: " + getArchiveResultName(result));

    region.discardAll();
    return result;
}

std::optional<ArchiveResult> RegionLifecycleHooks::onRegionActivated(Region& region, RegionId locationId)
{
    if (!matchesLocation(region, locationId)) {
        return ArchiveResult::Skipped;
    }
    if (!m_archives.archiveExists(locationId)) {
        return ArchiveResult::NothingToDo;
    }

    if (m_deferred.isBatchActive()) {
        if (!m_pendingRestores.insert(&region).second) {
            LIFECYCLE_DEBUG("Restore of region " + std::to_string(locationId) + " already deferred");
            return std::nullopt;
        }
        ++m_deferredRestores;
        m_deferred.enqueue("restore region " + std::to_string(locationId), [this, &region, locationId]() {
            if (m_pendingRestores.erase(&region) == 0) {
                LIFECYCLE_INFO("Deferred restore of region " + std::to_string(locationId) +
                               " dropped; region was discarded");
                return;
            }
            m_lastDeferredResult = restore(region);
        });
        LIFECYCLE_DEBUG("Restore of region " + std::to_string(locationId) + " deferred");
        return std::nullopt;
    }
    return restore(region);
}

bool RegionLifecycleHooks::onRegionDiscarded(const Region& region)
{
    if (m_pendingRestores.erase(&region) == 0) {
        return false;
    }
    LIFECYCLE_DEBUG("Pending restore of region " + std::to_string(region.getId()) + " cancelled");
    return true;
}

ArchiveResult RegionLifecycleHooks::restore(Region& region)
{
    const ArchiveResult result = m_archives.load(region);
    if (result == ArchiveResult::Restored) {
        if (auto chronicle = region.findComponent<RegionChronicle>()) {
            chronicle->recordRestored(region.getWorld().getClock().getTicksGame());
        }
    }
    LIFECYCLE_INFO("Region " + std::to_string(region.getId()) + " activated: " + getArchiveResultName(result));
    return result;
}

} // namespace Strata
