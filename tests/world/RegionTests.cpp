/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE RegionTests
#include <boost/test/unit_test.hpp>

#include "mocks/RegionTestFixture.hpp"
#include "world/TerrainCatalog.hpp"
#include <algorithm>

using namespace Strata;

BOOST_FIXTURE_TEST_SUITE(RegionTerrainTests, RegionTestFixture)

BOOST_AUTO_TEST_CASE(TestConstructedFloorRemembersUnderTerrain) {
    auto region = makeRegion();
    const CellPos cell{3, 4};

    region->setTerrain(cell, TerrainIds::GRAVEL);
    BOOST_CHECK_EQUAL(region->getUnderTerrain(cell), TerrainIds::GRAVEL);

    region->setTerrain(cell, TerrainIds::WOOD_FLOOR);
    BOOST_CHECK(region->hasConstructedFloor(cell));
    BOOST_CHECK_EQUAL(region->getUnderTerrain(cell), TerrainIds::GRAVEL);

    // Replacing one floor with another keeps the natural ground underneath
    region->setTerrain(cell, TerrainIds::STONE_TILE);
    BOOST_CHECK_EQUAL(region->getUnderTerrain(cell), TerrainIds::GRAVEL);

    BOOST_CHECK(region->removeFloor(cell));
    BOOST_CHECK_EQUAL(region->getTerrain(cell), TerrainIds::GRAVEL);
    BOOST_CHECK(!region->removeFloor(cell));
}

BOOST_AUTO_TEST_CASE(TestCellIndexIsRowMajor) {
    auto region = makeRegion(1, 10);
    BOOST_CHECK_EQUAL(region->cellIndex(CellPos{3, 2}), 23u);
    BOOST_CHECK(region->cellAt(23) == (CellPos{3, 2}));
    BOOST_CHECK_THROW(region->cellIndex(CellPos{10, 0}), std::out_of_range);
}

BOOST_AUTO_TEST_CASE(TestStandableCells) {
    auto region = makeRegion();
    placeWall(*region, CellPos{5, 5});
    region->setTerrain(CellPos{6, 5}, TerrainIds::DEEP_WATER);

    BOOST_CHECK(!region->isStandable(CellPos{5, 5}));
    BOOST_CHECK(!region->isStandable(CellPos{6, 5}));
    BOOST_CHECK(region->isStandable(CellPos{4, 5}));

    auto near = region->findStandableNear(CellPos{5, 5}, 2);
    BOOST_REQUIRE(near.has_value());
    BOOST_CHECK_EQUAL(near->chebyshevDistance(CellPos{5, 5}), 1);

    // Containers do not block
    placeContainer(*region, CellPos{8, 8});
    BOOST_CHECK(region->isStandable(CellPos{8, 8}));
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(RegionRoofTests, RegionTestFixture)

BOOST_AUTO_TEST_CASE(TestUnsupportedRoofQueuesCollapse) {
    auto region = makeRegion(1, 20);
    placeWall(*region, CellPos{2, 2});

    region->setRoof(CellPos{4, 4}, RoofIds::CONSTRUCTED);
    BOOST_CHECK(region->isRoofSupported(CellPos{4, 4}));
    BOOST_CHECK(region->getPendingCollapses().empty());

    region->setRoof(CellPos{15, 15}, RoofIds::CONSTRUCTED);
    BOOST_REQUIRE_EQUAL(region->getPendingCollapses().size(), 1u);
    BOOST_CHECK(region->getPendingCollapses().front() == (CellPos{15, 15}));

    // Thick rock holds itself up
    region->setRoof(CellPos{18, 18}, RoofIds::THICK_ROCK);
    BOOST_CHECK_EQUAL(region->getPendingCollapses().size(), 1u);
}

BOOST_AUTO_TEST_CASE(TestRemovingSupportQueuesCollapse) {
    auto region = makeRegion(1, 20);
    auto wall = placeWall(*region, CellPos{2, 2});
    region->setRoof(CellPos{4, 4}, RoofIds::CONSTRUCTED);
    BOOST_CHECK(region->getPendingCollapses().empty());

    region->vanish(wall);
    BOOST_CHECK(wall->isDestroyed());
    BOOST_CHECK(std::find(region->getPendingCollapses().begin(), region->getPendingCollapses().end(),
                          CellPos{4, 4}) != region->getPendingCollapses().end());
}

BOOST_AUTO_TEST_CASE(TestRestorationSuppressesCollapseChecks) {
    auto region = makeRegion(1, 20);
    auto wall = placeWall(*region, CellPos{2, 2});

    region->setRestorationInProgress(true);
    region->setRoof(CellPos{15, 15}, RoofIds::CONSTRUCTED);
    region->setRoof(CellPos{4, 4}, RoofIds::CONSTRUCTED);
    region->vanish(wall);
    BOOST_CHECK(region->getPendingCollapses().empty());
    region->setRestorationInProgress(false);

    region->recomputeStructuralSupport();
    BOOST_CHECK(!region->isRoofSupported(CellPos{15, 15}));
    BOOST_CHECK_CLOSE(region->getRoofCoverage(), 2.0f / 400.0f, 0.001f);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(RegionLayerTests, RegionTestFixture)

BOOST_AUTO_TEST_CASE(TestRevealNotifications) {
    auto region = makeRegion();
    BOOST_CHECK(region->isFogged(CellPos{0, 0}));

    region->unfog(CellPos{0, 0});
    BOOST_CHECK(!region->isFogged(CellPos{0, 0}));
    BOOST_CHECK_EQUAL(region->getRevealNotificationCount(), 1u);

    // Revealing an already visible cell is not news
    region->unfog(CellPos{0, 0});
    BOOST_CHECK_EQUAL(region->getRevealNotificationCount(), 1u);

    region->setRestorationInProgress(true);
    region->unfog(CellPos{1, 0});
    region->setRestorationInProgress(false);
    BOOST_CHECK(!region->isFogged(CellPos{1, 0}));
    BOOST_CHECK_EQUAL(region->getRevealNotificationCount(), 1u);
}

BOOST_AUTO_TEST_CASE(TestPollutionFeatureToggle) {
    auto region = makeRegion();
    BOOST_CHECK(!region->hasPollutionFeature());
    region->setPolluted(CellPos{1, 1}, true);
    BOOST_CHECK(!region->isPolluted(CellPos{1, 1}));

    region->enablePollutionFeature(true);
    region->setPolluted(CellPos{1, 1}, true);
    BOOST_CHECK(region->isPolluted(CellPos{1, 1}));

    region->enablePollutionFeature(false);
    BOOST_CHECK(!region->isPolluted(CellPos{1, 1}));
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(RegionEntityTests, RegionTestFixture)

BOOST_AUTO_TEST_CASE(TestSpawnRegistersIdentity) {
    auto region = makeRegion();
    auto item = placeItem(*region, CellPos{2, 2});

    BOOST_CHECK(item->isSpawned());
    BOOST_CHECK(world.getIdentities().tryFind(item->getUniqueLoadId()) == item);
    BOOST_CHECK_THROW(region->spawn(item, CellPos{3, 3}), std::logic_error);
    BOOST_CHECK_THROW(region->spawn(std::make_shared<Item>("steel"), CellPos{-1, 0}), std::out_of_range);

    BOOST_CHECK(region->despawn(item));
    BOOST_CHECK(!item->isSpawned());
    // Despawning leaves the identity alone
    BOOST_CHECK(world.getIdentities().contains(item->getUniqueLoadId()));
}

BOOST_AUTO_TEST_CASE(TestDeterioratingContainerEjectsOccupant) {
    auto region = makeRegion();
    auto bed = placeContainer(*region, CellPos{4, 4});
    auto colonist = putColonistInBed(bed);
    BOOST_REQUIRE(colonist->getHolder() == bed.get());

    region->destroy(bed, DestroyMode::Deteriorate);

    BOOST_CHECK(bed->isDestroyed());
    BOOST_CHECK(colonist->getRegion() == region.get());
    BOOST_CHECK(colonist->getHolder() == nullptr);
    BOOST_CHECK(!colonist->isDestroyed());
}

BOOST_AUTO_TEST_CASE(TestKillSendsCreatureToDeadStore) {
    auto region = makeRegion();
    auto boar = placeCreature(*region, CellPos{6, 6}, "boar");

    region->destroy(boar, DestroyMode::Kill);

    BOOST_CHECK(!boar->isSpawned());
    BOOST_CHECK(boar->isDestroyed());
    BOOST_CHECK_EQUAL(world.getRegistry().getSituation(*boar), WorldSituation::Dead);
}

BOOST_AUTO_TEST_CASE(TestDestroyRemovesCreatureFromGroup) {
    auto region = makeRegion();
    auto raider = placeCreature(*region, CellPos{6, 6}, "mech_scyther");
    auto group = std::make_shared<GroupController>("raid", nullptr);
    group->addOwned(raider);
    region->getGroupManager().add(group);

    region->destroy(raider, DestroyMode::Kill);
    BOOST_CHECK(group->getOwnedCreatures().empty());
    BOOST_CHECK_EQUAL(raider->getGroupId(), 0u);
}

BOOST_AUTO_TEST_CASE(TestDiscardAllPassesHumanlikesToWorld) {
    auto region = makeRegion();
    auto wall = placeWall(*region, CellPos{1, 1});
    auto bed = placeContainer(*region, CellPos{4, 4});
    auto sleeper = putColonistInBed(bed);
    auto visitor = std::make_shared<Creature>("trader", true);
    region->spawn(visitor, CellPos{8, 8});

    region->discardAll();

    BOOST_CHECK_EQUAL(region->getEntityCount(), 0u);
    BOOST_CHECK(!world.getIdentities().contains(wall->getUniqueLoadId()));
    BOOST_CHECK_EQUAL(world.getRegistry().getSituation(*sleeper), WorldSituation::Alive);
    BOOST_CHECK_EQUAL(world.getRegistry().getSituation(*visitor), WorldSituation::Alive);
    BOOST_CHECK(world.getRegistry().getRetention(visitor->getID()) == RetentionPolicy::Discard);
}

BOOST_AUTO_TEST_CASE(TestComponentMustBelongToRegion) {
    auto region = makeRegion(1);
    auto other = makeRegion(2);
    region->addComponent(std::make_shared<RegionComponent>(*other));
    BOOST_CHECK(region->getComponents().empty());

    region->addComponent(std::make_shared<RegionComponent>(*region));
    BOOST_CHECK_EQUAL(region->getComponents().size(), 1u);
}

BOOST_AUTO_TEST_SUITE_END()
