/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE RegionArchiveManagerTests
#include <boost/test/unit_test.hpp>

#include "managers/RegionArchiveManager.hpp"
#include "mocks/RegionTestFixture.hpp"
#include "world/RegionChronicle.hpp"
#include "world/TerrainCatalog.hpp"
#include <filesystem>
#include <fstream>
#include <iterator>

using namespace Strata;

namespace {

struct ArchiveManagerFixture : RegionTestFixture {
    std::unique_ptr<Region> region;

    ArchiveManagerFixture() { region = makeRegion(1, 20); }

    // What the lifecycle hooks do after a successful save: the region is
    // emptied and a fresh one takes its place on reactivation
    void replaceRegion() {
        region->discardAll();
        region.reset();
        region = makeRegion(1, 20);
    }

    template <typename T>
    std::shared_ptr<T> findByDef(const std::string& defName) const {
        for (const auto& entity : region->getEntities()) {
            if (entity->getDefName() == defName) {
                return std::dynamic_pointer_cast<T>(entity);
            }
        }
        return nullptr;
    }

    std::string archivePath(const RegionArchiveManager& manager) const {
        return manager.getStorage().getRegionArchivePath(region->getId());
    }
};

} // namespace

BOOST_FIXTURE_TEST_SUITE(RegionArchivePrerequisiteTests, ArchiveManagerFixture)

BOOST_AUTO_TEST_CASE(TestMissingArchiveIsNothingToDo) {
    RegionArchiveManager manager(world, climate, config);
    BOOST_CHECK(!manager.archiveExists(region->getId()));
    BOOST_CHECK_EQUAL(manager.load(*region), ArchiveResult::NothingToDo);
    BOOST_CHECK(manager.getMode() == PersistenceMode::Inactive);
}

BOOST_AUTO_TEST_CASE(TestMissingPersistentIdSkips) {
    config.persistentId.clear();
    world.setPersistentId("");
    RegionArchiveManager manager(world, climate, config);

    placeWall(*region, CellPos{2, 2});
    BOOST_CHECK_EQUAL(manager.save(*region), ArchiveResult::Skipped);
    BOOST_CHECK_EQUAL(manager.load(*region), ArchiveResult::Skipped);
    BOOST_CHECK_EQUAL(region->getEntityCount(), 1u);
}

BOOST_AUTO_TEST_CASE(TestMissingStorageRootSkips) {
    config.storageRoot.clear();
    RegionArchiveManager manager(world, climate, config);

    auto boar = placeCreature(*region, CellPos{3, 3}, "boar");
    BOOST_CHECK_EQUAL(manager.save(*region), ArchiveResult::Skipped);
    BOOST_CHECK_EQUAL(manager.load(*region), ArchiveResult::Skipped);
    BOOST_CHECK(boar->getRegion() == region.get());
    BOOST_CHECK(world.getSideTable().tryGet(region->getId()) == nullptr);
    BOOST_CHECK(manager.getMode() == PersistenceMode::Inactive);
}

BOOST_AUTO_TEST_CASE(TestPersistentIdFallsBackToWorld) {
    config.persistentId.clear();
    world.setPersistentId("from_world");
    RegionArchiveManager manager(world, climate, config);

    BOOST_CHECK_EQUAL(manager.getStorage().getPersistentId(), "from_world");
    BOOST_CHECK_EQUAL(manager.save(*region), ArchiveResult::Saved);
    BOOST_CHECK(std::filesystem::exists(storageRoot / "from_world" / "Region_1.sra"));
}

BOOST_AUTO_TEST_CASE(TestRegionWithoutIdSkips) {
    RegionArchiveManager manager(world, climate, config);
    Region unnamed(INVALID_REGION_ID, 7, 8, 8, world);
    BOOST_CHECK_EQUAL(manager.save(unnamed), ArchiveResult::Skipped);
    BOOST_CHECK(!manager.archiveExists(INVALID_REGION_ID));
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(RegionArchiveRoundTripTests, ArchiveManagerFixture)

BOOST_AUTO_TEST_CASE(TestRoundTripRestoresRegion) {
    RegionArchiveManager manager(world, climate, config);
    auto pirates = world.createFaction("Pirates");

    region->setTerrain(CellPos{3, 3}, TerrainIds::GRAVEL);
    region->setTerrain(CellPos{3, 3}, TerrainIds::WOOD_FLOOR);
    region->setTerrain(CellPos{5, 5}, TerrainIds::CONCRETE);
    auto wallA = placeWall(*region, CellPos{2, 2});
    auto wallB = placeWall(*region, CellPos{2, 3}, StructureMaterial::Stone, 450);
    region->setRoof(CellPos{3, 3}, RoofIds::CONSTRUCTED);
    region->setSnowDepth(CellPos{7, 7}, 4);
    region->enablePollutionFeature(true);
    region->setPolluted(CellPos{8, 8}, true);
    region->unfog(CellPos{1, 1});

    auto steel = placeItem(*region, CellPos{9, 9});
    auto shelf = placeContainer(*region, CellPos{10, 10}, "shelf", 2);
    auto meal = std::make_shared<Item>("packaged_meal", 4);
    BOOST_REQUIRE(shelf->tryAccept(meal));
    world.adopt(meal);

    auto boar = placeCreature(*region, CellPos{12, 12}, "boar");
    auto raider = placeCreature(*region, CellPos{14, 14}, "mech_scyther", pirates);
    auto raid = std::make_shared<GroupController>("raid", pirates);
    raid->addOwned(raider);
    region->getGroupManager().add(raid);

    const std::string steelId = steel->getUniqueLoadId();
    const std::string mealId = meal->getUniqueLoadId();
    const std::string raiderId = raider->getUniqueLoadId();
    const std::string raidId = raid->getUniqueLoadId();
    raid.reset();

    BOOST_REQUIRE_EQUAL(manager.save(*region), ArchiveResult::Saved);
    BOOST_CHECK(manager.archiveExists(region->getId()));
    BOOST_CHECK_EQUAL(manager.getLastSaveStatistics().entityCount, 6u);
    BOOST_CHECK_EQUAL(manager.getLastSaveStatistics().groupCount, 1u);
    BOOST_CHECK_EQUAL(manager.getLastSaveStatistics().archiveBytes,
                      std::filesystem::file_size(archivePath(manager)));

    // Archived creatures left with the archive
    BOOST_CHECK(!boar->isSpawned());
    BOOST_CHECK(!world.getIdentities().contains(raiderId));
    BOOST_CHECK(region->getGroupManager().getGroups().empty());

    replaceRegion();
    region->enablePollutionFeature(true);
    BOOST_REQUIRE_EQUAL(manager.load(*region), ArchiveResult::Restored);
    BOOST_CHECK(!manager.archiveExists(region->getId()));

    const auto& report = manager.getLastLoadReport();
    BOOST_CHECK_EQUAL(report.restoredEntities, 6u);
    BOOST_CHECK_EQUAL(report.restoredGroups, 1u);
    BOOST_CHECK_EQUAL(report.ghostsRemoved, 0u);
    BOOST_CHECK_EQUAL(region->getEntityCount(), 6u);

    BOOST_CHECK_EQUAL(region->getTerrain(CellPos{3, 3}), TerrainIds::WOOD_FLOOR);
    BOOST_CHECK_EQUAL(region->getUnderTerrain(CellPos{3, 3}), TerrainIds::GRAVEL);
    BOOST_CHECK_EQUAL(region->getTerrain(CellPos{5, 5}), TerrainIds::CONCRETE);
    BOOST_CHECK_EQUAL(region->getUnderTerrain(CellPos{5, 5}), TerrainIds::SOIL);
    BOOST_CHECK_EQUAL(region->getRoof(CellPos{3, 3}), RoofIds::CONSTRUCTED);
    BOOST_CHECK(region->getPendingCollapses().empty());
    BOOST_CHECK_EQUAL(region->getSnowDepth(CellPos{7, 7}), 4);
    BOOST_CHECK(region->isPolluted(CellPos{8, 8}));
    BOOST_CHECK(!region->isPolluted(CellPos{8, 9}));
    BOOST_CHECK(!region->isFogged(CellPos{1, 1}));
    BOOST_CHECK(region->isFogged(CellPos{0, 0}));
    BOOST_CHECK_EQUAL(region->getRevealNotificationCount(), 0u);
    BOOST_CHECK(!region->isRestorationInProgress());

    auto restoredSteel = findByDef<Item>("steel");
    BOOST_REQUIRE(restoredSteel != nullptr);
    BOOST_CHECK_EQUAL(restoredSteel->getUniqueLoadId(), steelId);
    BOOST_CHECK(restoredSteel->getPosition() == (CellPos{9, 9}));
    BOOST_CHECK_EQUAL(restoredSteel->getStackCount(), 10);

    auto restoredShelf = region->getContainerAt(CellPos{10, 10});
    BOOST_REQUIRE(restoredShelf != nullptr);
    BOOST_REQUIRE_EQUAL(restoredShelf->getContents().size(), 1u);
    BOOST_CHECK_EQUAL(restoredShelf->getContents().front()->getUniqueLoadId(), mealId);

    auto restoredRaider = findByDef<Creature>("mech_scyther");
    BOOST_REQUIRE(restoredRaider != nullptr);
    BOOST_CHECK_EQUAL(restoredRaider->getUniqueLoadId(), raiderId);
    BOOST_CHECK(restoredRaider->getFaction() == pirates);

    const auto& groups = region->getGroupManager().getGroups();
    BOOST_REQUIRE_EQUAL(groups.size(), 1u);
    BOOST_CHECK_EQUAL(groups.front()->getUniqueLoadId(), raidId);
    BOOST_REQUIRE_EQUAL(groups.front()->getOwnedCreatures().size(), 1u);
    BOOST_CHECK(groups.front()->getOwnedCreatures().front() == restoredRaider);
    BOOST_CHECK(groups.front()->getFaction() == pirates);
}

BOOST_AUTO_TEST_CASE(TestRestoredIdentitiesAreUnique) {
    RegionArchiveManager manager(world, climate, config);
    for (int x = 1; x < 10; ++x) {
        placeItem(*region, CellPos{x, 1});
        placeWall(*region, CellPos{x, 5});
    }
    placeCreature(*region, CellPos{3, 8});

    BOOST_REQUIRE_EQUAL(manager.save(*region), ArchiveResult::Saved);
    replaceRegion();
    BOOST_REQUIRE_EQUAL(manager.load(*region), ArchiveResult::Restored);

    for (const auto& entity : region->getEntities()) {
        BOOST_CHECK(world.getIdentities().tryFind(entity->getUniqueLoadId()) == entity);
    }
    BOOST_CHECK_EQUAL(region->getEntityCount(), 19u);
}

BOOST_AUTO_TEST_CASE(TestLoadIntoTheSameRegionWipesLeftovers) {
    RegionArchiveManager manager(world, climate, config);
    auto wall = placeWall(*region, CellPos{2, 2});
    placeItem(*region, CellPos{4, 4});

    BOOST_REQUIRE_EQUAL(manager.save(*region), ArchiveResult::Saved);
    // Without a discard the old objects are still placed and registered
    BOOST_REQUIRE_EQUAL(manager.load(*region), ArchiveResult::Restored);

    BOOST_CHECK_EQUAL(manager.getLastLoadReport().wiped, 2u);
    BOOST_CHECK_EQUAL(region->getEntityCount(), 2u);
    BOOST_CHECK(wall->isDestroyed());
    BOOST_CHECK(findByDef<Structure>("wood_wall") != wall);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(RegionArchiveOwnershipTests, ArchiveManagerFixture)

BOOST_AUTO_TEST_CASE(TestSleepingColonistReturnsToBed) {
    RegionArchiveManager manager(world, climate, config);
    auto bed = placeContainer(*region, CellPos{4, 4});
    auto sleeper = putColonistInBed(bed);

    BOOST_REQUIRE_EQUAL(manager.save(*region), ArchiveResult::Saved);
    BOOST_CHECK_EQUAL(manager.getLastSaveStatistics().sleepingOccupants, 1u);
    BOOST_CHECK_EQUAL(world.getRegistry().getSituation(*sleeper), WorldSituation::Alive);

    replaceRegion();
    BOOST_REQUIRE_EQUAL(manager.load(*region), ArchiveResult::Restored);

    auto restoredBed = region->getContainerAt(CellPos{4, 4});
    BOOST_REQUIRE(restoredBed != nullptr);
    BOOST_CHECK(sleeper->getHolder() == restoredBed.get());
    BOOST_CHECK_EQUAL(manager.getLastLoadReport().sideRegistry.reinsertedOccupants, 1u);
    BOOST_CHECK_EQUAL(world.getRegistry().getSituation(*sleeper), WorldSituation::None);
    BOOST_CHECK(world.getSideTable().tryGet(region->getId()) == nullptr);
}

BOOST_AUTO_TEST_CASE(TestExcludedBedFallsBackToFreePlacement) {
    config.excludedDefs = {"bed"};
    RegionArchiveManager manager(world, climate, config);
    auto bed = placeContainer(*region, CellPos{4, 4});
    auto sleeper = putColonistInBed(bed);

    BOOST_REQUIRE_EQUAL(manager.save(*region), ArchiveResult::Saved);
    replaceRegion();
    BOOST_REQUIRE_EQUAL(manager.load(*region), ArchiveResult::Restored);

    BOOST_CHECK_EQUAL(manager.getLastLoadReport().sideRegistry.freePlaced, 1u);
    BOOST_CHECK(sleeper->getRegion() == region.get());
    BOOST_CHECK(sleeper->getHolder() == nullptr);
    BOOST_CHECK_LE(sleeper->getPosition().chebyshevDistance(CellPos{4, 4}), config.restoreSearchRadius);
}

BOOST_AUTO_TEST_CASE(TestOwnedAnimalComesBack) {
    RegionArchiveManager manager(world, climate, config);
    auto dog = placeCreature(*region, CellPos{6, 6}, "husky", colony);

    BOOST_REQUIRE_EQUAL(manager.save(*region), ArchiveResult::Saved);
    BOOST_CHECK_EQUAL(manager.getLastSaveStatistics().ownedAnimals, 1u);
    replaceRegion();
    BOOST_REQUIRE_EQUAL(manager.load(*region), ArchiveResult::Restored);

    BOOST_CHECK(dog->getRegion() == region.get());
    BOOST_CHECK(dog->isPlayerAffiliated());
    BOOST_CHECK_EQUAL(region->getEntityCount(), 1u);
}

BOOST_AUTO_TEST_CASE(TestWorldGhostIsRemoved) {
    RegionArchiveManager manager(world, climate, config);
    auto boar = placeCreature(*region, CellPos{5, 5}, "boar");
    const std::string boarId = boar->getUniqueLoadId();

    BOOST_REQUIRE_EQUAL(manager.save(*region), ArchiveResult::Saved);
    // Something picked up the archived boar while the region was away
    world.getRegistry().passToWorld(boar, RetentionPolicy::Discard);
    BOOST_REQUIRE(world.getIdentities().contains(boarId));

    replaceRegion();
    BOOST_REQUIRE_EQUAL(manager.load(*region), ArchiveResult::Restored);

    BOOST_CHECK_EQUAL(manager.getLastLoadReport().ghostsRemoved, 1u);
    BOOST_CHECK_EQUAL(world.getRegistry().getSituation(*boar), WorldSituation::None);
    auto restored = findByDef<Creature>("boar");
    BOOST_REQUIRE(restored != nullptr);
    BOOST_CHECK(restored != boar);
    BOOST_CHECK(world.getIdentities().tryFind(boarId) == restored);
}

BOOST_AUTO_TEST_CASE(TestCorpseCreatureSurvivesGarbageCollection) {
    RegionArchiveManager manager(world, climate, config);
    auto corpse = placeCorpse(*region, CellPos{3, 3});
    const CreaturePtr inner = corpse->getInnerCreature();

    BOOST_REQUIRE_EQUAL(manager.save(*region), ArchiveResult::Saved);
    BOOST_CHECK_EQUAL(manager.getLastSaveStatistics().protectedCorpseCount, 1u);
    BOOST_CHECK(world.getRegistry().isForcefullyKept(inner->getID()));

    replaceRegion();
    world.collectGarbage({});
    BOOST_CHECK_EQUAL(world.getRegistry().getSituation(*inner), WorldSituation::Dead);

    BOOST_REQUIRE_EQUAL(manager.load(*region), ArchiveResult::Restored);
    auto restored = findByDef<Corpse>(corpse->getDefName());
    BOOST_REQUIRE(restored != nullptr);
    BOOST_CHECK(restored->getInnerCreature() == inner);
    BOOST_CHECK_EQUAL(world.getRegistry().getForcedRetentionCount(), 0u);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(RegionArchiveFailureTests, ArchiveManagerFixture)

BOOST_AUTO_TEST_CASE(TestCorruptArchiveLeavesRegionUntouched) {
    RegionArchiveManager manager(world, climate, config);
    placeWall(*region, CellPos{2, 2});
    placeItem(*region, CellPos{4, 4});
    BOOST_REQUIRE_EQUAL(manager.save(*region), ArchiveResult::Saved);

    const std::string path = archivePath(manager);
    std::string bytes;
    {
        std::ifstream in(path, std::ios::binary);
        bytes.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    }
    BOOST_REQUIRE(!bytes.empty());
    bytes.back() = static_cast<char>(bytes.back() ^ 0x77);
    {
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    }

    const size_t before = region->getEntityCount();
    BOOST_CHECK_EQUAL(manager.load(*region), ArchiveResult::Failed);
    BOOST_CHECK_EQUAL(region->getEntityCount(), before);
    BOOST_CHECK_EQUAL(manager.getLastLoadReport().wiped, 0u);
    BOOST_CHECK(!region->isRestorationInProgress());
    BOOST_CHECK(manager.getMode() == PersistenceMode::Inactive);
    // A failed load keeps the archive for another attempt
    BOOST_CHECK(manager.archiveExists(region->getId()));
}

BOOST_AUTO_TEST_CASE(TestUnwritableStorageFailsSave) {
    // A plain file where the archive folder should be
    {
        std::ofstream blocker(storageRoot / "test_colony");
        blocker << "not a folder";
    }
    RegionArchiveManager manager(world, climate, config);
    auto boar = placeCreature(*region, CellPos{5, 5}, "boar");

    BOOST_CHECK_EQUAL(manager.save(*region), ArchiveResult::Failed);
    BOOST_CHECK(boar->getRegion() == region.get());
    BOOST_CHECK(manager.getMode() == PersistenceMode::Inactive);
}

BOOST_AUTO_TEST_CASE(TestFailedWriteReturnsTrackedCreaturesToWorld) {
    RegionArchiveManager manager(world, climate, config);
    auto wanderer = placeCreature(*region, CellPos{6, 6}, "boar");
    auto visitor = placeCreature(*region, CellPos{9, 9}, "muffalo");
    world.getRegistry().passToWorld(wanderer, RetentionPolicy::Discard);
    world.getRegistry().passToWorld(visitor, RetentionPolicy::KeepForever);

    // A non-empty folder where the archive file should land makes the final move fail
    const std::filesystem::path target(archivePath(manager));
    std::filesystem::create_directories(target);
    {
        std::ofstream blocker(target / "occupied");
        blocker << "x";
    }

    BOOST_CHECK_EQUAL(manager.save(*region), ArchiveResult::Failed);
    BOOST_CHECK(manager.getMode() == PersistenceMode::Inactive);

    BOOST_CHECK(wanderer->getRegion() == region.get());
    BOOST_CHECK(visitor->getRegion() == region.get());
    BOOST_CHECK_EQUAL(world.getRegistry().getSituation(*wanderer), WorldSituation::Alive);
    BOOST_CHECK_EQUAL(world.getRegistry().getSituation(*visitor), WorldSituation::Alive);
    BOOST_CHECK(world.getRegistry().getRetention(wanderer->getID()) == RetentionPolicy::Discard);
    BOOST_CHECK(world.getRegistry().getRetention(visitor->getID()) == RetentionPolicy::KeepForever);
    BOOST_CHECK(world.getSideTable().tryGet(region->getId()) == nullptr);

    // Garbage collection treats them as it did before the failed save
    world.collectGarbage({});
    BOOST_CHECK_EQUAL(world.getRegistry().getSituation(*visitor), WorldSituation::Alive);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(RegionArchiveComponentTests, ArchiveManagerFixture)

BOOST_AUTO_TEST_CASE(TestChronicleRoundTrip) {
    RegionArchiveManager manager(world, climate, config);
    auto chronicle = std::make_shared<RegionChronicle>(*region);
    chronicle->setFoundingFaction(colony);
    chronicle->recordAbandoned(100);
    region->addComponent(chronicle);

    BOOST_REQUIRE_EQUAL(manager.save(*region), ArchiveResult::Saved);
    replaceRegion();
    auto fresh = std::make_shared<RegionChronicle>(*region);
    region->addComponent(fresh);
    BOOST_REQUIRE_EQUAL(manager.load(*region), ArchiveResult::Restored);

    BOOST_CHECK_EQUAL(manager.getLastLoadReport().componentsLoaded, 1u);
    BOOST_CHECK_EQUAL(fresh->getAbandonCount(), 1u);
    BOOST_CHECK_EQUAL(fresh->getLastAbandonedTick(), 100);
    BOOST_CHECK(fresh->getFoundingFaction() == colony);
    BOOST_CHECK_EQUAL(sanitizeComponentRecordName(fresh->getArchiveTag()), "Strata__RegionChronicle");
}

BOOST_AUTO_TEST_CASE(TestAbsentComponentRecordKeepsDefaults) {
    RegionArchiveManager manager(world, climate, config);
    placeWall(*region, CellPos{2, 2});

    BOOST_REQUIRE_EQUAL(manager.save(*region), ArchiveResult::Saved);
    replaceRegion();
    auto fresh = std::make_shared<RegionChronicle>(*region);
    region->addComponent(fresh);
    BOOST_REQUIRE_EQUAL(manager.load(*region), ArchiveResult::Restored);

    BOOST_CHECK_EQUAL(manager.getLastLoadReport().componentsLoaded, 0u);
    BOOST_CHECK_EQUAL(fresh->getAbandonCount(), 0u);
    BOOST_CHECK_EQUAL(fresh->getLastAbandonedTick(), -1);
    BOOST_CHECK(fresh->getFoundingFaction() == nullptr);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(RegionArchiveDecayTests, ArchiveManagerFixture)

BOOST_AUTO_TEST_CASE(TestDecayRunsForTheTimeAway) {
    RegionArchiveManager manager(world, climate, config);
    world.getClock().setTicks(5000);
    placeItem(*region, CellPos{3, 3}, "meat", 3000.0f);
    placeWall(*region, CellPos{8, 8});

    BOOST_REQUIRE_EQUAL(manager.save(*region), ArchiveResult::Saved);
    world.getClock().advance(TICKS_PER_YEAR);
    replaceRegion();
    BOOST_REQUIRE_EQUAL(manager.load(*region), ArchiveResult::Restored);

    const auto& report = manager.getLastLoadReport();
    BOOST_CHECK_EQUAL(report.elapsedTicks, TICKS_PER_YEAR);
    BOOST_CHECK_EQUAL(report.decay.rotted, 1u);
    BOOST_CHECK_EQUAL(report.decay.structuresDamaged, 1u);
    BOOST_CHECK(findByDef<Item>("meat") == nullptr);
}

BOOST_AUTO_TEST_CASE(TestDisabledDecayRestoresAsSaved) {
    config.decay.enabled = false;
    RegionArchiveManager manager(world, climate, config);
    placeItem(*region, CellPos{3, 3}, "meat", 3000.0f);
    placeWall(*region, CellPos{8, 8});

    BOOST_REQUIRE_EQUAL(manager.save(*region), ArchiveResult::Saved);
    world.getClock().advance(TICKS_PER_YEAR);
    replaceRegion();
    BOOST_REQUIRE_EQUAL(manager.load(*region), ArchiveResult::Restored);

    BOOST_CHECK_EQUAL(manager.getLastLoadReport().elapsedTicks, TICKS_PER_YEAR);
    BOOST_CHECK(findByDef<Item>("meat") != nullptr);
    auto wall = findByDef<Structure>("wood_wall");
    BOOST_REQUIRE(wall != nullptr);
    BOOST_CHECK_EQUAL(wall->getHitPoints(), 300);
}

BOOST_AUTO_TEST_CASE(TestImmediateReloadChangesNothing) {
    RegionArchiveManager manager(world, climate, config);
    placeItem(*region, CellPos{3, 3}, "meat", 3000.0f);

    BOOST_REQUIRE_EQUAL(manager.save(*region), ArchiveResult::Saved);
    replaceRegion();
    BOOST_REQUIRE_EQUAL(manager.load(*region), ArchiveResult::Restored);

    BOOST_CHECK_EQUAL(manager.getLastLoadReport().elapsedTicks, 0);
    auto meat = findByDef<Item>("meat");
    BOOST_REQUIRE(meat != nullptr);
    BOOST_CHECK_EQUAL(meat->getRotProgress(), 0.0f);
}

BOOST_AUTO_TEST_SUITE_END()
