/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef REGION_LIFECYCLE_HOOKS_HPP
#define REGION_LIFECYCLE_HOOKS_HPP

#include "managers/RegionArchiveManager.hpp"
#include "world/RegionTypes.hpp"
#include <cstddef>
#include <optional>
#include <unordered_set>

namespace Strata {

class DeferredTaskQueue;
class Region;

/**
 * @brief Connects the host's region activation events to the archive
 * manager.
 *
 * Deactivation saves the region, then discards it from the live world.
 * Activation restores it if an archive exists; while the host is inside a
 * startup batch the restore is postponed to the deferred task queue. A host
 * that drops a region before the queue drains must call onRegionDiscarded()
 * first; the queued restore then does nothing. The hooks themselves must
 * outlive the queue.
 */
class RegionLifecycleHooks {
public:
    RegionLifecycleHooks(RegionArchiveManager& archives, DeferredTaskQueue& deferred)
        : m_archives(archives), m_deferred(deferred) {}

    ArchiveResult onRegionDeactivated(Region& region, RegionId locationId);

    // std::nullopt when the restore was deferred
    std::optional<ArchiveResult> onRegionActivated(Region& region, RegionId locationId);

    /**
     * @brief Cancels a deferred restore still queued for @p region.
     * @return true if one was pending
     */
    bool onRegionDiscarded(const Region& region);

    bool hasPendingRestore(const Region& region) const { return m_pendingRestores.count(&region) != 0; }

    size_t getDeferredRestoreCount() const { return m_deferredRestores; }
    std::optional<ArchiveResult> getLastDeferredResult() const { return m_lastDeferredResult; }

private:
    bool matchesLocation(const Region& region, RegionId locationId) const;
    ArchiveResult restore(Region& region);

    RegionArchiveManager& m_archives;
    DeferredTaskQueue& m_deferred;
    size_t m_deferredRestores{0};
    std::optional<ArchiveResult> m_lastDeferredResult;
    std::unordered_set<const Region*> m_pendingRestores;
};

} // namespace Strata

#endif // REGION_LIFECYCLE_HOOKS_HPP
