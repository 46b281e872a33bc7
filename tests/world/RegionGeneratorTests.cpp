/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE RegionGeneratorTests
#include <boost/test/unit_test.hpp>

#include "world/Region.hpp"
#include "world/RegionGenerator.hpp"
#include "world/TerrainCatalog.hpp"
#include "world/World.hpp"
#include <algorithm>
#include <memory>
#include <string>
#include <tuple>
#include <vector>

using namespace Strata;

namespace {

using PlacedSignature = std::tuple<std::string, int, int>;

std::vector<PlacedSignature> signatureOf(const Region& region) {
    std::vector<PlacedSignature> placed;
    for (const auto& entity : region.getEntities()) {
        placed.emplace_back(entity->getDefName(), entity->getPosition().x, entity->getPosition().z);
    }
    std::sort(placed.begin(), placed.end());
    return placed;
}

} // namespace

BOOST_AUTO_TEST_SUITE(RegionGeneratorTestSuite)

BOOST_AUTO_TEST_CASE(TestBasicRegionGeneration) {
    World world;
    RegionGenerationConfig config;
    config.width = 40;
    config.height = 30;
    config.seed = 12345;

    auto region = RegionGenerator::generateRegion(3, 9, world, config);

    BOOST_REQUIRE(region != nullptr);
    BOOST_CHECK_EQUAL(region->getId(), 3);
    BOOST_CHECK_EQUAL(region->getTileId(), 9);
    BOOST_CHECK_EQUAL(region->getWidth(), 40);
    BOOST_CHECK_EQUAL(region->getHeight(), 30);
    BOOST_CHECK_GT(region->getEntityCount(), 0u);
    BOOST_CHECK(!region->hasPollutionFeature());
}

BOOST_AUTO_TEST_CASE(TestDeterministicGeneration) {
    World world;
    RegionGenerationConfig config;
    config.width = 32;
    config.height = 32;
    config.seed = 54321;

    auto first = RegionGenerator::generateRegion(1, 1, world, config);
    auto second = RegionGenerator::generateRegion(2, 1, world, config);

    // Same seed, same map; only the entity ids differ
    for (int z = 0; z < config.height; ++z) {
        for (int x = 0; x < config.width; ++x) {
            const CellPos cell{x, z};
            BOOST_CHECK_EQUAL(first->getTerrain(cell), second->getTerrain(cell));
            BOOST_CHECK_EQUAL(first->getRoof(cell), second->getRoof(cell));
            BOOST_CHECK_EQUAL(first->isFogged(cell), second->isFogged(cell));
        }
    }
    BOOST_CHECK(signatureOf(*first) == signatureOf(*second));
}

BOOST_AUTO_TEST_CASE(TestEveryEntityIsRegistered) {
    World world;
    RegionGenerationConfig config;
    config.seed = 777;

    auto region = RegionGenerator::generateRegion(1, 1, world, config);
    for (const auto& entity : region->getEntities()) {
        BOOST_CHECK(world.getIdentities().contains(entity->getUniqueLoadId()));
        BOOST_CHECK(region->inBounds(entity->getPosition()));
        if (auto structure = std::dynamic_pointer_cast<Structure>(entity)) {
            for (const auto& held : structure->getContents()) {
                BOOST_CHECK(world.getIdentities().contains(held->getUniqueLoadId()));
            }
        }
    }
}

BOOST_AUTO_TEST_CASE(TestRevealedCenter) {
    World world;
    RegionGenerationConfig config;
    config.width = 48;
    config.height = 48;
    config.revealRadius = 5;

    auto region = RegionGenerator::generateRegion(1, 1, world, config);
    BOOST_CHECK(!region->isFogged(CellPos{24, 24}));
    BOOST_CHECK(!region->isFogged(CellPos{29, 19}));
    BOOST_CHECK(region->isFogged(CellPos{0, 0}));
    BOOST_CHECK(region->isFogged(CellPos{47, 47}));
}

BOOST_AUTO_TEST_CASE(TestPollutionFeatureFollowsConfig) {
    World world;
    RegionGenerationConfig config;
    config.width = 16;
    config.height = 16;
    config.pollutionFeature = true;

    auto region = RegionGenerator::generateRegion(1, 1, world, config);
    BOOST_CHECK(region->hasPollutionFeature());
}

BOOST_AUTO_TEST_CASE(TestProgressCallback) {
    World world;
    RegionGenerationConfig config;
    config.width = 16;
    config.height = 16;

    std::vector<float> reported;
    auto region = RegionGenerator::generateRegion(
        1, 1, world, config, [&reported](float percent, const std::string&) { reported.push_back(percent); });

    BOOST_REQUIRE(!reported.empty());
    BOOST_CHECK_EQUAL(reported.front(), 0.0f);
    BOOST_CHECK_EQUAL(reported.back(), 100.0f);
    BOOST_CHECK(std::is_sorted(reported.begin(), reported.end()));
}

BOOST_AUTO_TEST_SUITE_END()
