/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE DeferredTaskQueueTests
#include <boost/test/unit_test.hpp>

#include "core/DeferredTaskQueue.hpp"
#include "core/RegionLifecycleHooks.hpp"
#include "mocks/RegionTestFixture.hpp"
#include "world/RegionChronicle.hpp"
#include <stdexcept>
#include <vector>

using namespace Strata;

BOOST_AUTO_TEST_SUITE(DeferredTaskQueueTestSuite)

BOOST_AUTO_TEST_CASE(TestDrainRunsInOrder) {
    DeferredTaskQueue queue;
    std::vector<int> order;
    queue.enqueue("first", [&order]() { order.push_back(1); });
    queue.enqueue("second", [&order]() { order.push_back(2); });
    queue.enqueue("empty", nullptr);

    BOOST_CHECK_EQUAL(queue.getPendingCount(), 2u);
    BOOST_CHECK_EQUAL(queue.drain(), 2u);
    BOOST_REQUIRE_EQUAL(order.size(), 2u);
    BOOST_CHECK_EQUAL(order[0], 1);
    BOOST_CHECK_EQUAL(order[1], 2);
    BOOST_CHECK_EQUAL(queue.getPendingCount(), 0u);
}

BOOST_AUTO_TEST_CASE(TestNestedBatchesDrainOnOutermostEnd) {
    DeferredTaskQueue queue;
    int runs = 0;

    queue.beginBatch();
    queue.beginBatch();
    queue.enqueue("count", [&runs]() { ++runs; });

    BOOST_CHECK_EQUAL(queue.endBatch(), 0u);
    BOOST_CHECK(queue.isBatchActive());
    BOOST_CHECK_EQUAL(runs, 0);

    BOOST_CHECK_EQUAL(queue.endBatch(), 1u);
    BOOST_CHECK(!queue.isBatchActive());
    BOOST_CHECK_EQUAL(runs, 1);

    // Unbalanced end is ignored
    BOOST_CHECK_EQUAL(queue.endBatch(), 0u);
}

BOOST_AUTO_TEST_CASE(TestThrowingTaskDoesNotStopTheRest) {
    DeferredTaskQueue queue;
    bool lastRan = false;
    queue.enqueue("broken", []() { throw std::runtime_error("boom"); });
    queue.enqueue("last", [&lastRan]() { lastRan = true; });

    BOOST_CHECK_EQUAL(queue.drain(), 2u);
    BOOST_CHECK(lastRan);
}

BOOST_AUTO_TEST_CASE(TestTaskEnqueuedDuringDrainWaits) {
    DeferredTaskQueue queue;
    int runs = 0;
    queue.enqueue("outer", [&queue, &runs]() {
        ++runs;
        queue.enqueue("inner", [&runs]() { ++runs; });
    });

    BOOST_CHECK_EQUAL(queue.drain(), 1u);
    BOOST_CHECK_EQUAL(runs, 1);
    BOOST_CHECK_EQUAL(queue.getPendingCount(), 1u);
    BOOST_CHECK_EQUAL(queue.drain(), 1u);
    BOOST_CHECK_EQUAL(runs, 2);
}

BOOST_AUTO_TEST_SUITE_END()

namespace {

struct LifecycleFixture : RegionTestFixture {
    DeferredTaskQueue deferred;
    std::unique_ptr<RegionArchiveManager> archives;
    std::unique_ptr<RegionLifecycleHooks> hooks;
    std::unique_ptr<Region> region;
    std::shared_ptr<RegionChronicle> chronicle;

    LifecycleFixture() {
        archives = std::make_unique<RegionArchiveManager>(world, climate, config);
        hooks = std::make_unique<RegionLifecycleHooks>(*archives, deferred);
        region = makeRegion(4, 16);
        chronicle = std::make_shared<RegionChronicle>(*region);
        region->addComponent(chronicle);
    }

    // The host builds an empty region again when the location is revisited
    void rebuildRegion() {
        region = makeRegion(4, 16);
        chronicle = std::make_shared<RegionChronicle>(*region);
        region->addComponent(chronicle);
    }
};

} // namespace

BOOST_FIXTURE_TEST_SUITE(RegionLifecycleHooksTestSuite, LifecycleFixture)

BOOST_AUTO_TEST_CASE(TestDeactivationSavesAndDiscards) {
    placeWall(*region, CellPos{3, 3});
    placeItem(*region, CellPos{5, 5});
    world.getClock().setTicks(500);

    BOOST_CHECK_EQUAL(hooks->onRegionDeactivated(*region, 4), ArchiveResult::Saved);
    BOOST_CHECK_EQUAL(region->getEntityCount(), 0u);
    BOOST_CHECK(archives->archiveExists(4));
    BOOST_CHECK_EQUAL(chronicle->getAbandonCount(), 1u);
    BOOST_CHECK_EQUAL(chronicle->getLastAbandonedTick(), 500);
}

BOOST_AUTO_TEST_CASE(TestActivationRestores) {
    placeWall(*region, CellPos{3, 3});
    world.getClock().setTicks(500);
    BOOST_REQUIRE_EQUAL(hooks->onRegionDeactivated(*region, 4), ArchiveResult::Saved);

    rebuildRegion();
    world.getClock().setTicks(900);
    const auto result = hooks->onRegionActivated(*region, 4);
    BOOST_REQUIRE(result.has_value());
    BOOST_CHECK_EQUAL(*result, ArchiveResult::Restored);
    BOOST_CHECK_EQUAL(region->getEntityCount(), 1u);
    BOOST_CHECK_EQUAL(chronicle->getAbandonCount(), 1u);
    BOOST_CHECK_EQUAL(chronicle->getLastRestoredTick(), 900);
    BOOST_CHECK(!archives->archiveExists(4));
}

BOOST_AUTO_TEST_CASE(TestActivationWithoutArchive) {
    deferred.beginBatch();
    const auto result = hooks->onRegionActivated(*region, 4);
    deferred.endBatch();

    BOOST_REQUIRE(result.has_value());
    BOOST_CHECK_EQUAL(*result, ArchiveResult::NothingToDo);
    BOOST_CHECK_EQUAL(hooks->getDeferredRestoreCount(), 0u);
}

BOOST_AUTO_TEST_CASE(TestActivationInsideBatchIsDeferred) {
    placeItem(*region, CellPos{2, 6});
    BOOST_REQUIRE_EQUAL(hooks->onRegionDeactivated(*region, 4), ArchiveResult::Saved);
    rebuildRegion();

    deferred.beginBatch();
    const auto result = hooks->onRegionActivated(*region, 4);
    BOOST_CHECK(!result.has_value());
    BOOST_CHECK_EQUAL(hooks->getDeferredRestoreCount(), 1u);
    BOOST_CHECK_EQUAL(region->getEntityCount(), 0u);
    BOOST_CHECK(!hooks->getLastDeferredResult().has_value());

    BOOST_CHECK_EQUAL(deferred.endBatch(), 1u);
    BOOST_REQUIRE(hooks->getLastDeferredResult().has_value());
    BOOST_CHECK_EQUAL(*hooks->getLastDeferredResult(), ArchiveResult::Restored);
    BOOST_CHECK_EQUAL(region->getEntityCount(), 1u);
}

BOOST_AUTO_TEST_CASE(TestDiscardedRegionDropsDeferredRestore) {
    placeItem(*region, CellPos{2, 6});
    BOOST_REQUIRE_EQUAL(hooks->onRegionDeactivated(*region, 4), ArchiveResult::Saved);
    rebuildRegion();

    deferred.beginBatch();
    BOOST_CHECK(!hooks->onRegionActivated(*region, 4).has_value());
    BOOST_CHECK(hooks->hasPendingRestore(*region));

    BOOST_CHECK(hooks->onRegionDiscarded(*region));
    BOOST_CHECK(!hooks->onRegionDiscarded(*region));
    region.reset();

    // The queued task still runs, but touches nothing
    BOOST_CHECK_EQUAL(deferred.endBatch(), 1u);
    BOOST_CHECK(!hooks->getLastDeferredResult().has_value());
    BOOST_CHECK(archives->archiveExists(4));
}

BOOST_AUTO_TEST_CASE(TestDeactivationBeforeDeferredRestoreKeepsArchive) {
    placeWall(*region, CellPos{3, 3});
    BOOST_REQUIRE_EQUAL(hooks->onRegionDeactivated(*region, 4), ArchiveResult::Saved);
    rebuildRegion();

    deferred.beginBatch();
    BOOST_CHECK(!hooks->onRegionActivated(*region, 4).has_value());
    BOOST_CHECK(!hooks->onRegionActivated(*region, 4).has_value());
    BOOST_CHECK_EQUAL(hooks->getDeferredRestoreCount(), 1u);

    BOOST_CHECK_EQUAL(hooks->onRegionDeactivated(*region, 4), ArchiveResult::Skipped);
    BOOST_CHECK(!hooks->hasPendingRestore(*region));
    BOOST_CHECK(archives->archiveExists(4));
    BOOST_CHECK_EQUAL(chronicle->getAbandonCount(), 0u);

    deferred.endBatch();
    BOOST_CHECK(!hooks->getLastDeferredResult().has_value());

    rebuildRegion();
    const auto result = hooks->onRegionActivated(*region, 4);
    BOOST_REQUIRE(result.has_value());
    BOOST_CHECK_EQUAL(*result, ArchiveResult::Restored);
    BOOST_CHECK_EQUAL(region->getEntityCount(), 1u);
}

BOOST_AUTO_TEST_CASE(TestLocationMismatchIsSkipped) {
    placeWall(*region, CellPos{3, 3});

    BOOST_CHECK_EQUAL(hooks->onRegionDeactivated(*region, 5), ArchiveResult::Skipped);
    BOOST_CHECK_EQUAL(hooks->onRegionDeactivated(*region, INVALID_REGION_ID), ArchiveResult::Skipped);
    BOOST_CHECK_EQUAL(region->getEntityCount(), 1u);
    BOOST_CHECK(!archives->archiveExists(4));
    BOOST_CHECK_EQUAL(chronicle->getAbandonCount(), 0u);

    const auto result = hooks->onRegionActivated(*region, 5);
    BOOST_REQUIRE(result.has_value());
    BOOST_CHECK_EQUAL(*result, ArchiveResult::Skipped);
}

BOOST_AUTO_TEST_SUITE_END()
