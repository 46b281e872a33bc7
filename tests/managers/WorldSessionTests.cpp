/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE WorldSessionTests
#include <boost/test/unit_test.hpp>

#include "managers/WorldSessionManager.hpp"
#include "mocks/RegionTestFixture.hpp"
#include "persistence/ArchiveStorage.hpp"
#include <filesystem>
#include <fstream>
#include <iterator>

using namespace Strata;

namespace {

struct WorldSessionFixture : RegionTestFixture {
    CreaturePtr traveller;
    CreaturePtr colonist;
    CreaturePtr dog;
    CreaturePtr departed;
    CreaturePtr wanderer;

    WorldSessionFixture() {
        world.getClock().setTicks(12345);
        auto pirates = world.createFaction("Pirates");

        traveller = std::make_shared<Creature>("trader", true);
        traveller->setFaction(pirates);
        world.getRegistry().passToWorld(traveller, RetentionPolicy::Discard);

        colonist = std::make_shared<Creature>("colonist", true);
        colonist->setFaction(colony);
        world.getRegistry().passToWorld(colonist, RetentionPolicy::KeepForever);

        dog = std::make_shared<Creature>("husky", false);
        dog->setFaction(colony);
        world.getRegistry().passToWorld(dog, RetentionPolicy::KeepForever);

        departed = std::make_shared<Creature>("boar", false);
        world.getRegistry().passToDead(departed);

        wanderer = std::make_shared<Creature>("muffalo", false);
        wanderer->setCurrentTask("graze");

        SideRegistryEntry& entry = world.getSideTable().getOrCreate(3);
        entry.ownedAnimals.push_back(ParkedCreature{dog, CellPos{4, 5}, {}});
        entry.sleepingOccupants.push_back(ParkedCreature{colonist, CellPos{7, 7}, {}});
        entry.trackedCreatures.push_back(ParkedCreature{wanderer, CellPos{6, 7}, {}});
    }

    ArchiveStorage storage() const { return ArchiveStorage(storageRoot.string(), "test_colony"); }
};

} // namespace

BOOST_FIXTURE_TEST_SUITE(WorldSessionTestSuite, WorldSessionFixture)

BOOST_AUTO_TEST_CASE(TestWorldStateRoundTrip) {
    WorldSessionManager saver(world);
    BOOST_REQUIRE(saver.save(storage()));
    BOOST_CHECK(std::filesystem::exists(storage().getWorldSessionPath()));

    World restored;
    WorldSessionManager loader(restored);
    BOOST_REQUIRE(loader.load(storage()));

    BOOST_CHECK_EQUAL(restored.getClock().getTicksGame(), 12345);
    BOOST_CHECK_EQUAL(restored.getPersistentId(), "test_colony");

    BOOST_REQUIRE_EQUAL(restored.getFactions().getAll().size(), 2u);
    FactionPtr player = restored.getFactions().getPlayerFaction();
    BOOST_REQUIRE(player != nullptr);
    BOOST_CHECK_EQUAL(player->getName(), "Colony");
    BOOST_CHECK(restored.getIdentities().contains(player->getUniqueLoadId()));

    WorldRegistry& registry = restored.getRegistry();
    BOOST_CHECK_EQUAL(registry.getAliveCount(), 3u);
    BOOST_CHECK_EQUAL(registry.getDeadCount(), 1u);
    BOOST_CHECK(registry.getRetention(colonist->getID()) == RetentionPolicy::KeepForever);
    BOOST_CHECK(registry.getRetention(traveller->getID()) == RetentionPolicy::Discard);

    EntityPtr restoredColonist = registry.findById(colonist->getID());
    BOOST_REQUIRE(restoredColonist != nullptr);
    BOOST_CHECK(restoredColonist != colonist);
    BOOST_CHECK(restoredColonist->getFaction() == player);
    BOOST_CHECK(restored.getIdentities().tryFind(colonist->getUniqueLoadId()) == restoredColonist);

    EntityPtr restoredDeparted = registry.findById(departed->getID());
    BOOST_REQUIRE(restoredDeparted != nullptr);
    BOOST_CHECK(restoredDeparted->isDestroyed());

    const SideRegistryEntry* entry = restored.getSideTable().tryGet(3);
    BOOST_REQUIRE(entry != nullptr);
    BOOST_REQUIRE_EQUAL(entry->ownedAnimals.size(), 1u);
    // Parked references point at the registry's copy
    BOOST_CHECK(entry->ownedAnimals.front().creature == registry.findById(dog->getID()));
    BOOST_CHECK(entry->ownedAnimals.front().cell == (CellPos{4, 5}));
    BOOST_REQUIRE_EQUAL(entry->sleepingOccupants.size(), 1u);
    BOOST_CHECK(entry->sleepingOccupants.front().creature == restoredColonist);

    BOOST_REQUIRE_EQUAL(entry->trackedCreatures.size(), 1u);
    const ParkedCreature& tracked = entry->trackedCreatures.front();
    BOOST_REQUIRE(tracked.creature != nullptr);
    BOOST_CHECK_EQUAL(tracked.creature->getUniqueLoadId(), wanderer->getUniqueLoadId());
    BOOST_CHECK_EQUAL(tracked.creature->getCurrentTask(), "graze");
    BOOST_CHECK(tracked.cell == (CellPos{6, 7}));
}

BOOST_AUTO_TEST_CASE(TestLoadReplacesExistingState) {
    WorldSessionManager manager(world);
    BOOST_REQUIRE(manager.saveToFile((storageRoot / "snapshot.sws").string()));

    world.getClock().advance(TICKS_PER_DAY);
    world.createFaction("Latecomers");
    world.getSideTable().getOrCreate(9);

    BOOST_REQUIRE(manager.loadFromFile((storageRoot / "snapshot.sws").string()));
    BOOST_CHECK_EQUAL(world.getClock().getTicksGame(), 12345);
    BOOST_CHECK_EQUAL(world.getFactions().getAll().size(), 2u);
    BOOST_CHECK(world.getSideTable().tryGet(9) == nullptr);
    BOOST_CHECK_EQUAL(world.getSideTable().size(), 1u);
}

BOOST_AUTO_TEST_CASE(TestMissingSessionFile) {
    World restored;
    WorldSessionManager loader(restored);
    BOOST_CHECK(!loader.load(ArchiveStorage(storageRoot.string(), "never_saved")));
    BOOST_CHECK(!loader.load(ArchiveStorage(storageRoot.string(), "")));
}

BOOST_AUTO_TEST_CASE(TestCorruptSessionKeepsCurrentWorld) {
    WorldSessionManager saver(world);
    BOOST_REQUIRE(saver.save(storage()));

    const std::string path = storage().getWorldSessionPath();
    std::string bytes;
    {
        std::ifstream in(path, std::ios::binary);
        bytes.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    }
    BOOST_REQUIRE(!bytes.empty());
    bytes.back() = static_cast<char>(bytes.back() ^ 0x33);
    {
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    }

    World other;
    other.getClock().setTicks(777);
    WorldSessionManager loader(other);
    BOOST_CHECK(!loader.load(storage()));
    BOOST_CHECK_EQUAL(other.getClock().getTicksGame(), 777);
}

BOOST_AUTO_TEST_CASE(TestGarbageCollectionKeepsParkedCreatures) {
    // The traveller is Discard-policy and nothing points at it
    const size_t dropped = world.collectGarbage({});
    BOOST_CHECK_EQUAL(dropped, 2u);
    BOOST_CHECK_EQUAL(world.getRegistry().getSituation(*traveller), WorldSituation::None);
    BOOST_CHECK_EQUAL(world.getRegistry().getSituation(*departed), WorldSituation::None);
    BOOST_CHECK_EQUAL(world.getRegistry().getSituation(*colonist), WorldSituation::Alive);
    BOOST_CHECK_EQUAL(world.getRegistry().getSituation(*dog), WorldSituation::Alive);
}

BOOST_AUTO_TEST_SUITE_END()
