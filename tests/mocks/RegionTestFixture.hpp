/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef REGION_TEST_FIXTURE_HPP
#define REGION_TEST_FIXTURE_HPP

#include "entities/Corpse.hpp"
#include "entities/Creature.hpp"
#include "entities/Item.hpp"
#include "entities/Structure.hpp"
#include "mocks/FakeClimateSampler.hpp"
#include "persistence/PersistenceConfig.hpp"
#include "world/Region.hpp"
#include "world/World.hpp"
#include <filesystem>
#include <memory>
#include <random>
#include <string>

/**
 * Shared setup for tests that build regions: a world with a player faction,
 * a mild wet climate and a private storage folder under the temp directory
 * that is removed again on teardown.
 */
struct RegionTestFixture {
    Strata::World world;
    FakeClimateSampler climate;
    Strata::PersistenceConfig config;
    Strata::FactionPtr colony;
    std::filesystem::path storageRoot;

    RegionTestFixture() {
        std::random_device device;
        storageRoot = std::filesystem::temp_directory_path() /
                      ("strata_test_" + std::to_string(device()) + "_" + std::to_string(device()));
        std::filesystem::create_directories(storageRoot);

        world.setPersistentId("test_colony");
        colony = world.createFaction("Colony", true);

        config.storageRoot = storageRoot.string();
        config.persistentId = "test_colony";
        config.decaySeed = 12345;
    }

    ~RegionTestFixture() {
        std::error_code ec;
        std::filesystem::remove_all(storageRoot, ec);
    }

    std::unique_ptr<Strata::Region> makeRegion(Strata::RegionId id = 1, int size = 16) {
        return std::make_unique<Strata::Region>(id, 7, size, size, world);
    }

    Strata::StructurePtr placeWall(Strata::Region& region, const Strata::CellPos& cell,
                                   Strata::StructureMaterial material = Strata::StructureMaterial::Wood,
                                   int hitPoints = 300) {
        auto wall = std::make_shared<Strata::Structure>("wood_wall", material);
        wall->setMaxHitPoints(hitPoints);
        wall->setHitPoints(hitPoints);
        region.spawn(wall, cell);
        return wall;
    }

    Strata::StructurePtr placeContainer(Strata::Region& region, const Strata::CellPos& cell,
                                        const std::string& defName = "bed", size_t capacity = 1) {
        auto container = std::make_shared<Strata::Structure>(defName, Strata::StructureMaterial::Wood);
        container->makeContainer(capacity);
        region.spawn(container, cell);
        return container;
    }

    Strata::ItemPtr placeItem(Strata::Region& region, const Strata::CellPos& cell,
                              const std::string& defName = "steel", float rotThreshold = 0.0f) {
        auto item = std::make_shared<Strata::Item>(defName, 10);
        item->setRotThreshold(rotThreshold);
        region.spawn(item, cell);
        return item;
    }

    Strata::CreaturePtr placeCreature(Strata::Region& region, const Strata::CellPos& cell,
                                      const std::string& defName = "muffalo",
                                      Strata::FactionPtr faction = nullptr) {
        auto creature = std::make_shared<Strata::Creature>(defName, false);
        creature->setFaction(std::move(faction));
        region.spawn(creature, cell);
        return creature;
    }

    // Colonist asleep in a bed; registers it as a held entity
    Strata::CreaturePtr putColonistInBed(const Strata::StructurePtr& bed) {
        auto colonist = std::make_shared<Strata::Creature>("colonist", true);
        colonist->setFaction(colony);
        if (bed->tryAccept(colonist)) {
            world.adopt(colonist);
        }
        return colonist;
    }

    // Corpse of a creature that died in the region; the creature goes to the dead store
    Strata::CorpsePtr placeCorpse(Strata::Region& region, const Strata::CellPos& cell,
                                  const std::string& defName = "boar") {
        auto creature = std::make_shared<Strata::Creature>(defName, false);
        world.getRegistry().passToDead(creature);
        auto corpse = std::make_shared<Strata::Corpse>(creature);
        region.spawn(corpse, cell);
        return corpse;
    }
};

#endif // REGION_TEST_FIXTURE_HPP
